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
#include "accstate/currency.h"

#include "vm/dict.h"

#include "td/utils/logging.h"

namespace accstate {

CurrencyCollection::CurrencyCollection(td::uint128 grams, ExtraMap extra_map) : grams(std::min(grams, max_grams)) {
  for (auto& p : extra_map) {
    set_other(p.first, p.second);
  }
}

td::uint128 CurrencyCollection::get_other(td::uint32 id) const {
  auto it = extra.find(id);
  return it == extra.end() ? 0 : it->second;
}

void CurrencyCollection::set_other(td::uint32 id, td::uint128 amount) {
  if (amount) {
    extra[id] = amount;
  } else {
    extra.erase(id);
  }
}

void CurrencyCollection::add(const CurrencyCollection& other) {
  if (grams >= max_grams || max_grams - grams <= other.grams) {
    grams = max_grams;
  } else {
    grams += other.grams;
  }
  for (auto& p : other.extra) {
    auto& x = extra[p.first];
    x = (max_extra - x < p.second) ? max_extra : x + p.second;
  }
}

bool CurrencyCollection::has_at_least(const CurrencyCollection& other) const {
  if (grams < other.grams) {
    return false;
  }
  for (auto& p : other.extra) {
    if (get_other(p.first) < p.second) {
      return false;
    }
  }
  return true;
}

bool CurrencyCollection::sub(const CurrencyCollection& other) {
  if (!has_at_least(other)) {
    return false;
  }
  grams -= other.grams;
  for (auto& p : other.extra) {
    set_other(p.first, get_other(p.first) - p.second);
  }
  return true;
}

bool CurrencyCollection::store(vm::CellBuilder& cb) const {
  vm::Dictionary dict{32};
  for (auto& p : extra) {
    td::BitArray<32> key;
    key.bits().store_uint(p.first, 32);
    vm::CellBuilder value;
    if (!tlb::store_var_uint(value, 32, p.second) || !dict.set_builder(key.cbits(), 32, value)) {
      return false;
    }
  }
  return tlb::store_grams(cb, grams) && dict.append_dict_to_bool(cb);
}

bool CurrencyCollection::fetch(vm::CellSlice& cs) {
  td::uint128 new_grams;
  vm::Dictionary dict{32};
  if (!tlb::fetch_grams(cs, new_grams) || !dict.fetch_from(cs)) {
    return false;
  }
  ExtraMap new_extra;
  bool ok = dict.check_for_each([&new_extra](Ref<vm::CellSlice> value, td::ConstBitPtr key, int n) {
    td::uint128 amount;
    if (!tlb::fetch_var_uint(value.write(), 32, amount) || !value->empty_ext()) {
      return false;
    }
    if (amount) {
      new_extra[static_cast<td::uint32>(key.get_uint(n))] = amount;
    }
    return true;
  });
  if (!ok) {
    LOG(DEBUG) << "invalid extra currency collection";
    return false;
  }
  grams = new_grams;
  extra = std::move(new_extra);
  return true;
}

bool CurrencyCollection::skip(vm::CellSlice& cs) {
  bool present;
  return tlb::skip_var_uint(cs, 16) && cs.fetch_bool_to(present) && (!present || cs.advance_refs(1));
}

std::string CurrencyCollection::to_str() const {
  td::StringBuilder sb;
  sb << tlb::uint128_to_str(grams) << "ng";
  for (auto& p : extra) {
    sb << "+" << tlb::uint128_to_str(p.second) << ".$" << p.first;
  }
  return sb.as_string();
}

td::StringBuilder& operator<<(td::StringBuilder& sb, const CurrencyCollection& cc) {
  return sb << cc.to_str();
}

}  // namespace accstate
