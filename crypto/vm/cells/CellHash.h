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

#include "common/bitstring.h"

#include "td/utils/logging.h"
#include "td/utils/Slice.h"

#include <array>

namespace vm {

struct CellHash {
 public:
  td::Slice as_slice() const {
    return td::Slice(hash_.data(), hash_.size());
  }
  td::MutableSlice as_slice() {
    return td::MutableSlice(hash_.data(), hash_.size());
  }
  td::ConstBitPtr bits() const {
    return td::ConstBitPtr{hash_.data()};
  }
  td::Bits256 as_bitarray() const {
    return td::Bits256{bits()};
  }
  std::string to_hex() const {
    return bits().to_hex(256);
  }

  bool operator==(const CellHash& other) const {
    return hash_ == other.hash_;
  }
  bool operator!=(const CellHash& other) const {
    return hash_ != other.hash_;
  }
  bool operator<(const CellHash& other) const {
    return hash_ < other.hash_;
  }

  static CellHash from_slice(td::Slice slice) {
    CellHash res;
    CHECK(slice.size() == res.hash_.size());
    td::MutableSlice(res.hash_.data(), res.hash_.size()).copy_from(slice);
    return res;
  }

  template <typename H>
  friend H AbslHashValue(H h, const CellHash& value) {
    return H::combine_contiguous(std::move(h), value.hash_.data(), value.hash_.size());
  }

 private:
  std::array<unsigned char, 32> hash_{};
};

inline td::StringBuilder& operator<<(td::StringBuilder& sb, const CellHash& hash) {
  return sb << hash.to_hex();
}

}  // namespace vm
