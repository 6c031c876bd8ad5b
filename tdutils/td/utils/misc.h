/*
    This file is part of TON Blockchain Library.

    TON Blockchain Library is free software: you can redistribute it and/or modify
    it under the terms of the GNU Lesser General Public License as published by
    the Free Software Foundation, either version 2 of the License, or
    (at your option) any later version.

    TON Blockchain Library is distributed in the hope that it will be useful,
    but WITHOUT ANY WARRANTY; without even the implied warranty of
    MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
    GNU Lesser General Public License for more details.

    You should have received a copy of the GNU Lesser General Public License
    along with TON Blockchain Library.  If not, see <http://www.gnu.org/licenses/>.

    Copyright 2017-2020 Telegram Systems LLP
*/
#pragma once

#include "td/utils/common.h"
#include "td/utils/Slice.h"
#include "td/utils/Status.h"

#include <limits>

namespace td {

template <class T>
Result<T> to_integer_safe(Slice str) {
  static_assert(std::is_integral<T>::value, "expected an integral type");
  if (str.empty()) {
    return Status::Error("Can't parse an empty string as an integer");
  }
  bool is_negative = false;
  std::size_t pos = 0;
  if (str[0] == '-') {
    if (!std::is_signed<T>::value) {
      return Status::Error(PSLICE() << "Can't parse \"" << str << "\" as an unsigned integer");
    }
    is_negative = true;
    pos = 1;
  }
  if (pos == str.size()) {
    return Status::Error(PSLICE() << "Can't parse \"" << str << "\" as an integer");
  }
  using U = std::make_unsigned_t<T>;
  U limit = is_negative ? static_cast<U>(static_cast<U>(std::numeric_limits<T>::max()) + 1)
                        : static_cast<U>(std::numeric_limits<T>::max());
  U value = 0;
  for (; pos < str.size(); pos++) {
    char c = str[pos];
    if (c < '0' || c > '9') {
      return Status::Error(PSLICE() << "Can't parse \"" << str << "\" as an integer");
    }
    U digit = static_cast<U>(c - '0');
    if (value > (limit - digit) / 10) {
      return Status::Error(PSLICE() << "Integer \"" << str << "\" is out of range");
    }
    value = static_cast<U>(value * 10 + digit);
  }
  if (is_negative) {
    return static_cast<T>(static_cast<U>(0) - value);
  }
  return static_cast<T>(value);
}

string hex_encode(Slice data);

Result<string> hex_decode(Slice hex);

}  // namespace td
