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

#include "accstate/accstate-types.h"

#include <optional>

namespace accstate {
namespace tlb {

constexpr td::uint128 grams_limit = static_cast<td::uint128>(1) << 120;

// var_uint$_ {n:#} len:(#< n) value:(uint (len * 8)) = VarUInteger n;
bool store_var_uint(vm::CellBuilder& cb, int n, td::uint128 value);
bool fetch_var_uint(vm::CellSlice& cs, int n, td::uint128& value);
bool fetch_var_uint(vm::CellSlice& cs, int n, td::uint64& value);
bool skip_var_uint(vm::CellSlice& cs, int n);

// nanograms$_ amount:(VarUInteger 16) = Grams;
inline bool store_grams(vm::CellBuilder& cb, td::uint128 value) {
  return value < grams_limit && store_var_uint(cb, 16, value);
}
inline bool fetch_grams(vm::CellSlice& cs, td::uint128& value) {
  return fetch_var_uint(cs, 16, value);
}

bool store_maybe_grams(vm::CellBuilder& cb, const std::optional<td::uint128>& value);
bool fetch_maybe_grams(vm::CellSlice& cs, std::optional<td::uint128>& value);

bool store_maybe_bits256(vm::CellBuilder& cb, const std::optional<td::Bits256>& value);
bool fetch_maybe_bits256(vm::CellSlice& cs, std::optional<td::Bits256>& value);

// serializes a value with a store(CellBuilder&) method into a fresh cell
template <class T>
td::Result<Ref<vm::Cell>> pack_cell(const T& value, td::Slice name) {
  vm::CellBuilder cb;
  if (!value.store(cb)) {
    return make_error(ErrorCode::malformed, PSLICE() << "cannot serialize " << name);
  }
  TRY_RESULT_PREFIX(cell, cb.finalize_novm_nothrow(), PSLICE() << "cannot serialize " << name << ": ");
  return Ref<vm::Cell>{std::move(cell)};
}

std::string uint128_to_str(td::uint128 value);

}  // namespace tlb
}  // namespace accstate
