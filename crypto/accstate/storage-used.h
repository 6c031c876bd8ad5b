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

#include "vm/cells/CellStorageStat.h"

#include <optional>

namespace accstate {

// storage_used$_ cells:(VarUInteger 7) bits:(VarUInteger 7) extra:StorageExtraInfo = StorageUsed;
// storage_extra_none$000 = StorageExtraInfo;
// storage_extra_info$001 dict_hash:uint256 = StorageExtraInfo;
struct StorageUsed {
  // largest value representable as VarUInteger 7
  static constexpr td::uint64 max_value = (1ULL << 48) - 1;

  td::uint64 cells{0};
  td::uint64 bits{0};
  std::optional<td::Bits256> dict_hash;

  static td::Result<StorageUsed> with_values_checked(td::uint64 cells, td::uint64 bits,
                                                     std::optional<td::Bits256> dict_hash = {});
  // distinct cells and their bits reachable from root
  static td::Result<StorageUsed> calculate_for_cell(const Ref<vm::Cell>& root);

  bool store(vm::CellBuilder& cb) const;
  bool fetch(vm::CellSlice& cs);
  bool operator==(const StorageUsed& other) const {
    return cells == other.cells && bits == other.bits && dict_hash == other.dict_hash;
  }
  std::string to_str() const;
};

// storage_used_short$_ cells:(VarUInteger 7) bits:(VarUInteger 7) = StorageUsedShort;
class StorageUsedShort {
 public:
  StorageUsedShort();
  static td::Result<StorageUsedShort> with_values_checked(td::uint64 cells, td::uint64 bits);
  static td::Result<StorageUsedShort> calculate_for_cell(const Ref<vm::Cell>& root);

  td::uint64 cells() const {
    return stat_.cells;
  }
  td::uint64 bits() const {
    return stat_.bits;
  }
  // adds the cells of root not yet counted by any previous append
  td::Status append(const Ref<vm::Cell>& root);

  bool store(vm::CellBuilder& cb) const;
  bool fetch(vm::CellSlice& cs);
  bool operator==(const StorageUsedShort& other) const {
    return cells() == other.cells() && bits() == other.bits();
  }
  std::string to_str() const;

 private:
  vm::CellStorageStat stat_;
};

// storage_info$_ used:StorageUsed last_paid:uint32 due_payment:(Maybe Grams) = StorageInfo;
struct StorageInfo {
  StorageUsed used;
  UnixTime last_paid{0};
  std::optional<td::uint128> due_payment;

  StorageInfo() = default;
  StorageInfo(UnixTime last_paid, std::optional<td::uint128> due_payment)
      : last_paid(last_paid), due_payment(due_payment) {
  }
  bool store(vm::CellBuilder& cb) const;
  bool fetch(vm::CellSlice& cs);
  bool operator==(const StorageInfo& other) const {
    return used == other.used && last_paid == other.last_paid && due_payment == other.due_payment;
  }
  std::string to_str() const;
};

td::StringBuilder& operator<<(td::StringBuilder& sb, const StorageUsed& used);
td::StringBuilder& operator<<(td::StringBuilder& sb, const StorageUsedShort& used);
td::StringBuilder& operator<<(td::StringBuilder& sb, const StorageInfo& info);

}  // namespace accstate
