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

#include "accstate/address.h"
#include "accstate/currency.h"
#include "accstate/message.h"
#include "accstate/state-init.h"
#include "accstate/storage-used.h"

#include <optional>
#include <variant>
#include <vector>

namespace accstate {

// acc_state_uninit$00 acc_state_frozen$01 acc_state_active$10 acc_state_nonexist$11 = AccountStatus;
enum class AccountStatus : int { uninit = 0, frozen = 1, active = 2, nonexist = 3 };

bool store_account_status(vm::CellBuilder& cb, AccountStatus status);
bool fetch_account_status(vm::CellSlice& cs, AccountStatus& status);
const char* account_status_str(AccountStatus status);
td::StringBuilder& operator<<(td::StringBuilder& sb, AccountStatus status);

// account_uninit$00 = AccountState;
// account_active$1 _:StateInit = AccountState;
// account_frozen$01 state_hash:bits256 = AccountState;
struct AccountState {
  struct Uninit {
    bool operator==(const Uninit&) const {
      return true;
    }
  };
  struct Active {
    StateInit state_init;
    bool operator==(const Active& other) const {
      return state_init == other.state_init;
    }
  };
  struct Frozen {
    td::Bits256 state_init_hash;
    bool operator==(const Frozen& other) const {
      return state_init_hash == other.state_init_hash;
    }
  };
  std::variant<Uninit, Active, Frozen> value;

  AccountState() = default;
  AccountState(Uninit x) : value(x) {
  }
  AccountState(Active x) : value(std::move(x)) {
  }
  AccountState(Frozen x) : value(x) {
  }

  bool is_uninit() const {
    return std::holds_alternative<Uninit>(value);
  }
  bool is_active() const {
    return std::holds_alternative<Active>(value);
  }
  bool is_frozen() const {
    return std::holds_alternative<Frozen>(value);
  }
  const StateInit* state_init() const {
    auto active = std::get_if<Active>(&value);
    return active ? &active->state_init : nullptr;
  }
  StateInit* state_init() {
    auto active = std::get_if<Active>(&value);
    return active ? &active->state_init : nullptr;
  }
  const td::Bits256* frozen_hash() const {
    auto frozen = std::get_if<Frozen>(&value);
    return frozen ? &frozen->state_init_hash : nullptr;
  }
  AccountStatus status() const;

  bool store(vm::CellBuilder& cb) const;
  bool fetch(vm::CellSlice& cs);
  bool operator==(const AccountState& other) const {
    return value == other.value;
  }
  bool operator!=(const AccountState& other) const {
    return !operator==(other);
  }
  std::string to_str() const;
};

// account_storage$_ last_trans_lt:uint64 balance:CurrencyCollection state:AccountState = AccountStorage;
// followed by init_code_hash:(Maybe bits256) in the extended account layout
struct AccountStorage {
  LogicalTime last_trans_lt{0};
  CurrencyCollection balance;
  AccountState state;
  // hash of the code the account was activated with, kept through later code changes
  std::optional<td::Bits256> init_code_hash;

  static AccountStorage uninit(CurrencyCollection balance);
  static AccountStorage active(LogicalTime last_trans_lt, CurrencyCollection balance, StateInit state_init,
                               bool derive_init_code_hash);
  static AccountStorage frozen(LogicalTime last_trans_lt, CurrencyCollection balance, const td::Bits256& hash);

  // init_code_hash is written only when present
  bool store(vm::CellBuilder& cb) const;
  td::Result<Ref<vm::Cell>> serialize() const;
  bool operator==(const AccountStorage& other) const {
    return last_trans_lt == other.last_trans_lt && balance == other.balance && state == other.state &&
           init_code_hash == other.init_code_hash;
  }
  std::string to_str() const;
};

struct AccountStuff {
  MsgAddressInt addr;
  StorageInfo storage_stat;
  AccountStorage storage;

  td::Status update_storage_stat(StorageStatMode mode);
  bool operator==(const AccountStuff& other) const {
    return addr == other.addr && storage_stat == other.storage_stat && storage == other.storage;
  }
};

// account_none$0 = Account;
// account$1 addr:MsgAddressInt storage_stat:StorageInfo storage:AccountStorage = Account;
// account_ext$0001 addr:MsgAddressInt storage_stat:StorageInfo storage:AccountStorage init_code_hash:(Maybe bits256) = Account;
class Account {
 public:
  Account() = default;
  explicit Account(AccountStuff stuff) : stuff_(std::move(stuff)) {
  }

  static Account with_address(MsgAddressInt addr);
  static Account with_address_and_balance(MsgAddressInt addr, CurrencyCollection balance);
  static Account with_storage(MsgAddressInt addr, StorageInfo storage_stat, AccountStorage storage);
  static td::Result<Account> active(MsgAddressInt addr, CurrencyCollection balance, UnixTime last_paid,
                                    StateInit state_init, bool derive_init_code_hash);
  static td::Result<Account> frozen(MsgAddressInt addr, LogicalTime last_trans_lt, UnixTime last_paid,
                                    const td::Bits256& state_hash, std::optional<td::uint128> due_payment,
                                    CurrencyCollection balance);
  static td::Result<Account> uninit(MsgAddressInt addr, LogicalTime last_trans_lt, UnixTime last_paid,
                                    CurrencyCollection balance);
  // account created by the first internal message carrying value; None when no account should be created
  static td::Result<Account> from_message(const InboundMessage& msg, bool derive_init_code_hash);

  bool is_none() const {
    return !stuff_.has_value();
  }
  const AccountStuff* stuff() const {
    return stuff_ ? &*stuff_ : nullptr;
  }
  AccountStatus status() const;

  // lifecycle
  td::Status try_activate(const StateInit& state_init, bool derive_init_code_hash);
  td::Status try_freeze();
  void uninit_account();

  // balance
  void add_funds(const CurrencyCollection& funds);
  bool sub_funds(const CurrencyCollection& funds);
  void set_balance(CurrencyCollection balance);
  const CurrencyCollection* balance() const;
  CurrencyCollection balance_checked() const;

  // footprint
  td::Status update_storage_stat(StorageStatMode mode = StorageStatMode::exact);
  td::Status update_storage_stat_fast() {
    return update_storage_stat(StorageStatMode::fast);
  }

  const MsgAddressInt* get_addr() const;
  std::optional<StdSmcAddress> get_id() const;
  td::Result<bool> belongs_to_shard(const ShardIdFull& shard) const;
  const StorageInfo* storage_info() const;
  UnixTime last_paid() const;
  void set_last_paid(UnixTime last_paid);
  std::optional<td::uint128> due_payment() const;
  void set_due_payment(std::optional<td::uint128> due_payment);
  std::optional<LogicalTime> last_tr_time() const;
  void set_last_tr_time(LogicalTime lt);

  const AccountState* state() const;
  const StateInit* state_init() const;
  const td::Bits256* frozen_hash() const;
  const td::Bits256* init_code_hash() const;
  std::optional<TickTock> get_tick_tock() const;
  std::optional<int> split_depth() const;
  Ref<vm::Cell> get_code() const;
  std::optional<td::Bits256> get_code_hash() const;
  Ref<vm::Cell> get_data() const;
  std::optional<td::Bits256> get_data_hash() const;
  bool set_code(Ref<vm::Cell> code);
  bool set_data(Ref<vm::Cell> data);
  td::Result<std::vector<std::pair<td::Bits256, SimpleLib>>> libraries() const;
  bool set_library(Ref<vm::Cell> code, bool is_public);
  bool set_library_flag(const td::Bits256& hash, bool is_public);
  bool delete_library(const td::Bits256& hash);

  // test helpers
  void set_addr(MsgAddressInt addr);
  void set_init_code_hash(const td::Bits256& hash);

  // Merkle proof of this account against a ShardState root
  td::Result<Ref<vm::Cell>> prepare_proof(Ref<vm::Cell> state_root) const;

  bool store(vm::CellBuilder& cb) const;
  bool store_original_format(vm::CellBuilder& cb) const;
  td::Result<Ref<vm::Cell>> serialize() const;
  static td::Result<Account> unpack(vm::CellSlice& cs);
  static td::Result<Account> unpack_cell(Ref<vm::Cell> cell);

  bool operator==(const Account& other) const {
    return stuff_ == other.stuff_;
  }
  bool operator!=(const Account& other) const {
    return !operator==(other);
  }
  std::string to_str() const;

 private:
  std::optional<AccountStuff> stuff_;

  StateInit* state_init_mut();
  static td::Result<Account> unpack_stuff(vm::CellSlice& cs, bool extended);
};

td::StringBuilder& operator<<(td::StringBuilder& sb, const AccountState& state);
td::StringBuilder& operator<<(td::StringBuilder& sb, const Account& account);

// Checks a proof made by Account::prepare_proof against the expected state hash and extracts the account.
td::Result<Account> check_account_proof(Ref<vm::Cell> proof, const td::Bits256& expected_state_hash,
                                        const MsgAddressInt& addr);

}  // namespace accstate
