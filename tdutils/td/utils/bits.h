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

#include <bit>

namespace td {

inline int32 count_leading_zeroes32(uint32 x) {
  return x == 0 ? 32 : std::countl_zero(x);
}

inline int32 count_leading_zeroes64(uint64 x) {
  return x == 0 ? 64 : std::countl_zero(x);
}

inline int32 count_trailing_zeroes64(uint64 x) {
  return x == 0 ? 64 : std::countr_zero(x);
}

inline int32 count_bits32(uint32 x) {
  return std::popcount(x);
}

// number of bits needed to represent any value in [0; upper_bound]
inline int32 bit_width32(uint32 upper_bound) {
  return 32 - count_leading_zeroes32(upper_bound);
}

}  // namespace td
