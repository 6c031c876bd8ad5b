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

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

#define TD_CONCAT_IMPL(x, y) x##y
#define TD_CONCAT(x, y) TD_CONCAT_IMPL(x, y)

#define TD_DEFINE_STR_IMPL(x) #x
#define TD_DEFINE_STR(x) TD_DEFINE_STR_IMPL(x)

#define TD_WARN_UNUSED_RESULT [[nodiscard]]

#define TD_UNUSED(x) static_cast<void>(x)

#if defined(__GNUC__)
#define likely(x) __builtin_expect(static_cast<bool>(x), 1)
#define unlikely(x) __builtin_expect(static_cast<bool>(x), 0)
#else
#define likely(x) static_cast<bool>(x)
#define unlikely(x) static_cast<bool>(x)
#endif

namespace td {

using int8 = std::int8_t;
using int16 = std::int16_t;
using uint16 = std::uint16_t;
using int32 = std::int32_t;
using uint32 = std::uint32_t;
using int64 = std::int64_t;
using uint64 = std::uint64_t;
using uint8 = std::uint8_t;

__extension__ typedef unsigned __int128 uint128;

static_assert(sizeof(uint128) == 16, "uint128 must be 16 bytes");

using string = std::string;

template <class ValueT>
using vector = std::vector<ValueT>;

template <class ValueT>
using unique_ptr = std::unique_ptr<ValueT>;

using std::make_unique;

struct Unit {};

template <class ToT, class FromT>
ToT narrow_cast(const FromT &from) {
  auto r = static_cast<ToT>(from);
  static_cast<void>(r);
  return r;
}

}  // namespace td
