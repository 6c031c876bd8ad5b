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

#include "accstate/tlb-util.h"

#include <algorithm>
#include <map>

namespace accstate {

// currencies$_ grams:Grams other:ExtraCurrencyCollection = CurrencyCollection;
// extra_currencies$_ dict:(HashmapE 32 (VarUInteger 32)) = ExtraCurrencyCollection;
struct CurrencyCollection {
  using ExtraMap = std::map<td::uint32, td::uint128>;
  static constexpr td::uint128 max_grams = tlb::grams_limit - 1;
  static constexpr td::uint128 max_extra = ~static_cast<td::uint128>(0);

  td::uint128 grams{0};
  ExtraMap extra;

  CurrencyCollection() = default;
  // grams above max_grams are clamped
  explicit CurrencyCollection(td::uint128 grams) : grams(std::min(grams, max_grams)) {
  }
  CurrencyCollection(td::uint128 grams, ExtraMap extra);

  bool is_zero() const {
    return !grams && extra.empty();
  }
  td::uint128 get_other(td::uint32 id) const;
  // a zero amount removes the currency
  void set_other(td::uint32 id, td::uint128 amount);

  // saturates every component at its maximum
  void add(const CurrencyCollection& other);
  // leaves the collection unchanged and returns false if any component is insufficient
  bool sub(const CurrencyCollection& other);
  bool has_at_least(const CurrencyCollection& other) const;

  bool store(vm::CellBuilder& cb) const;
  bool fetch(vm::CellSlice& cs);
  static bool skip(vm::CellSlice& cs);

  bool operator==(const CurrencyCollection& other) const {
    return grams == other.grams && extra == other.extra;
  }
  bool operator!=(const CurrencyCollection& other) const {
    return !operator==(other);
  }
  std::string to_str() const;
};

td::StringBuilder& operator<<(td::StringBuilder& sb, const CurrencyCollection& cc);

}  // namespace accstate
