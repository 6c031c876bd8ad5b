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

#include "accstate/account.h"

#include "vm/dict.h"

#include "td/utils/logging.h"

#include <optional>
#include <vector>

namespace accstate {

// depth_balance$_ split_depth:(#<= 30) balance:CurrencyCollection = DepthBalanceInfo;
struct DepthBalanceInfo {
  int split_depth{0};
  CurrencyCollection balance;

  static DepthBalanceInfo from_account(const Account& account);
  bool store(vm::CellBuilder& cb) const;
  bool fetch(vm::CellSlice& cs);
  static bool skip(vm::CellSlice& cs);
};

// account_descr$_ account:^Account last_trans_hash:bits256 last_trans_lt:uint64 = ShardAccount;
// The account itself stays serialized until read_account() is called.
class ShardAccount {
 public:
  ShardAccount();
  ShardAccount(Ref<vm::Cell> account_root, const td::Bits256& last_trans_hash, LogicalTime last_trans_lt);
  static td::Result<ShardAccount> with_params(const Account& account, const td::Bits256& last_trans_hash,
                                              LogicalTime last_trans_lt);

  td::Result<Account> read_account() const;
  td::Status write_account(const Account& account);

  Ref<vm::Cell> account_cell() const {
    return account_root_;
  }
  void set_account_cell(Ref<vm::Cell> cell) {
    CHECK(cell.not_null());
    account_root_ = std::move(cell);
  }
  const td::Bits256& last_trans_hash() const {
    return last_trans_hash_;
  }
  void set_last_trans_hash(const td::Bits256& hash) {
    last_trans_hash_ = hash;
  }
  LogicalTime last_trans_lt() const {
    return last_trans_lt_;
  }
  void set_last_trans_lt(LogicalTime lt) {
    last_trans_lt_ = lt;
  }

  bool store(vm::CellBuilder& cb) const;
  bool fetch(vm::CellSlice& cs);

  bool operator==(const ShardAccount& other) const {
    return account_root_->get_hash() == other.account_root_->get_hash() &&
           last_trans_hash_ == other.last_trans_hash_ && last_trans_lt_ == other.last_trans_lt_;
  }
  bool operator!=(const ShardAccount& other) const {
    return !operator==(other);
  }
  template <typename H>
  friend H AbslHashValue(H h, const ShardAccount& value) {
    return H::combine(std::move(h), value.account_root_->get_hash(), value.last_trans_hash_, value.last_trans_lt_);
  }

 private:
  Ref<vm::Cell> account_root_;
  td::Bits256 last_trans_hash_ = td::Bits256::zero();
  LogicalTime last_trans_lt_{0};
};

// _ (HashmapAugE 256 ShardAccount DepthBalanceInfo) = ShardAccounts;
class ShardAccounts {
 public:
  ShardAccounts();
  explicit ShardAccounts(Ref<vm::Cell> dict_root);

  bool is_empty() const {
    return dict_.is_empty();
  }
  Ref<vm::Cell> get_root_cell() const {
    return dict_.get_root_cell();
  }

  td::Status set(const StdSmcAddress& key, const ShardAccount& shard_account);
  // keyed by the anycast-rewritten address of the account
  td::Status insert(const Account& account, const td::Bits256& last_trans_hash, LogicalTime last_trans_lt);
  td::Result<std::optional<ShardAccount>> lookup(const StdSmcAddress& key) const;
  td::Status remove(const StdSmcAddress& key);
  td::Result<DepthBalanceInfo> get_total() const;
  td::Result<std::vector<std::pair<StdSmcAddress, ShardAccount>>> list() const;

  bool store(vm::CellBuilder& cb) const;
  bool fetch(vm::CellSlice& cs);

 private:
  vm::AugmentedDictionary dict_;
};

// shard_state#9023afe2 global_id:int32 shard_id:ShardIdent seq_no:uint32 gen_utime:uint32 gen_lt:uint64
//   accounts:^ShardAccounts = ShardState;
struct ShardState {
  static constexpr unsigned cons_tag = 0x9023afe2;

  td::int32 global_id{0};
  ShardIdFull shard_id{basechainId};
  td::uint32 seq_no{0};
  UnixTime gen_utime{0};
  LogicalTime gen_lt{0};
  ShardAccounts accounts;

  bool store(vm::CellBuilder& cb) const;
  bool fetch(vm::CellSlice& cs);
  td::Result<Ref<vm::Cell>> serialize() const;
  static td::Result<ShardState> unpack_cell(Ref<vm::Cell> root);
};

}  // namespace accstate
