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
#include "accstate/tlb-util.h"

#include <algorithm>

namespace accstate {
namespace tlb {

bool store_var_uint(vm::CellBuilder& cb, int n, td::uint128 value) {
  int len_bits = static_cast<int>(td::bit_width32(static_cast<td::uint32>(n - 1)));
  int len = 0;
  for (td::uint128 x = value; x; x >>= 8) {
    len++;
  }
  if (len >= n || !cb.store_long_bool(len, len_bits)) {
    return false;
  }
  for (int i = len - 1; i >= 0; i--) {
    if (!cb.store_long_bool(static_cast<long long>((value >> (8 * i)) & 0xff), 8)) {
      return false;
    }
  }
  return true;
}

bool fetch_var_uint(vm::CellSlice& cs, int n, td::uint128& value) {
  int len_bits = static_cast<int>(td::bit_width32(static_cast<td::uint32>(n - 1)));
  int len;
  if (!cs.fetch_uint_to(len_bits, len) || len >= n || !cs.have(len * 8)) {
    return false;
  }
  td::uint128 res = 0;
  for (int i = 0; i < len; i++) {
    if (res >> 120) {
      // does not fit into 128 bits
      return false;
    }
    res = (res << 8) | static_cast<td::uint128>(cs.fetch_ulong(8));
  }
  value = res;
  return true;
}

bool fetch_var_uint(vm::CellSlice& cs, int n, td::uint64& value) {
  td::uint128 x;
  if (!fetch_var_uint(cs, n, x) || (x >> 64)) {
    return false;
  }
  value = static_cast<td::uint64>(x);
  return true;
}

bool skip_var_uint(vm::CellSlice& cs, int n) {
  int len_bits = static_cast<int>(td::bit_width32(static_cast<td::uint32>(n - 1)));
  int len;
  return cs.fetch_uint_to(len_bits, len) && len < n && cs.advance(len * 8);
}

bool store_maybe_grams(vm::CellBuilder& cb, const std::optional<td::uint128>& value) {
  if (!value) {
    return cb.store_long_bool(0, 1);
  }
  return cb.store_long_bool(1, 1) && store_grams(cb, *value);
}

bool fetch_maybe_grams(vm::CellSlice& cs, std::optional<td::uint128>& value) {
  bool present;
  if (!cs.fetch_bool_to(present)) {
    return false;
  }
  if (!present) {
    value.reset();
    return true;
  }
  td::uint128 x;
  if (!fetch_grams(cs, x)) {
    return false;
  }
  value = x;
  return true;
}

bool store_maybe_bits256(vm::CellBuilder& cb, const std::optional<td::Bits256>& value) {
  if (!value) {
    return cb.store_long_bool(0, 1);
  }
  return cb.store_long_bool(1, 1) && cb.store_bits_bool(*value);
}

bool fetch_maybe_bits256(vm::CellSlice& cs, std::optional<td::Bits256>& value) {
  bool present;
  if (!cs.fetch_bool_to(present)) {
    return false;
  }
  if (!present) {
    value.reset();
    return true;
  }
  td::Bits256 x;
  if (!cs.fetch_bits_to(x)) {
    return false;
  }
  value = x;
  return true;
}

std::string uint128_to_str(td::uint128 value) {
  if (!value) {
    return "0";
  }
  std::string res;
  while (value) {
    res.push_back(static_cast<char>('0' + static_cast<int>(value % 10)));
    value /= 10;
  }
  std::reverse(res.begin(), res.end());
  return res;
}

}  // namespace tlb
}  // namespace accstate
