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
#include "accstate/account.h"

#include "td/utils/logging.h"
#include "td/utils/overloaded.h"

namespace accstate {

bool store_account_status(vm::CellBuilder& cb, AccountStatus status) {
  return cb.store_long_bool(static_cast<int>(status), 2);
}

bool fetch_account_status(vm::CellSlice& cs, AccountStatus& status) {
  int x;
  if (!cs.fetch_uint_to(2, x)) {
    return false;
  }
  status = static_cast<AccountStatus>(x);
  return true;
}

const char* account_status_str(AccountStatus status) {
  switch (status) {
    case AccountStatus::uninit:
      return "uninit";
    case AccountStatus::frozen:
      return "frozen";
    case AccountStatus::active:
      return "active";
    case AccountStatus::nonexist:
      return "nonexist";
  }
  return "unknown";
}

td::StringBuilder& operator<<(td::StringBuilder& sb, AccountStatus status) {
  return sb << account_status_str(status);
}

/*
 *
 *   ACCOUNT STATE
 *
 */

AccountStatus AccountState::status() const {
  return std::visit(td::overloaded([](const Uninit&) { return AccountStatus::uninit; },
                                   [](const Active&) { return AccountStatus::active; },
                                   [](const Frozen&) { return AccountStatus::frozen; }),
                    value);
}

bool AccountState::store(vm::CellBuilder& cb) const {
  return std::visit(td::overloaded([&](const Uninit&) { return cb.store_long_bool(0, 2); },
                                   [&](const Active& x) { return cb.store_long_bool(1, 1) && x.state_init.store(cb); },
                                   [&](const Frozen& x) {
                                     return cb.store_long_bool(1, 2) && cb.store_bits_bool(x.state_init_hash);
                                   }),
                    value);
}

bool AccountState::fetch(vm::CellSlice& cs) {
  bool bit;
  if (!cs.fetch_bool_to(bit)) {
    return false;
  }
  if (bit) {
    StateInit state_init;
    if (!state_init.fetch(cs)) {
      return false;
    }
    value = Active{std::move(state_init)};
    return true;
  }
  if (!cs.fetch_bool_to(bit)) {
    return false;
  }
  if (bit) {
    td::Bits256 hash;
    if (!cs.fetch_bits_to(hash)) {
      return false;
    }
    value = Frozen{hash};
  } else {
    value = Uninit{};
  }
  return true;
}

std::string AccountState::to_str() const {
  td::StringBuilder sb;
  std::visit(td::overloaded([&](const Uninit&) { sb << "AccountUninit"; },
                            [&](const Active& x) { sb << "AccountActive{" << x.state_init << "}"; },
                            [&](const Frozen& x) { sb << "AccountFrozen{" << x.state_init_hash.to_hex() << "}"; }),
             value);
  return sb.as_string();
}

td::StringBuilder& operator<<(td::StringBuilder& sb, const AccountState& state) {
  return sb << state.to_str();
}

/*
 *
 *   ACCOUNT STORAGE
 *
 */

AccountStorage AccountStorage::uninit(CurrencyCollection balance) {
  AccountStorage res;
  res.balance = std::move(balance);
  return res;
}

AccountStorage AccountStorage::active(LogicalTime last_trans_lt, CurrencyCollection balance, StateInit state_init,
                                      bool derive_init_code_hash) {
  AccountStorage res;
  res.last_trans_lt = last_trans_lt;
  res.balance = std::move(balance);
  if (derive_init_code_hash && state_init.code.not_null()) {
    res.init_code_hash = state_init.code->get_hash().as_bitarray();
  }
  res.state = AccountState::Active{std::move(state_init)};
  return res;
}

AccountStorage AccountStorage::frozen(LogicalTime last_trans_lt, CurrencyCollection balance,
                                      const td::Bits256& hash) {
  AccountStorage res;
  res.last_trans_lt = last_trans_lt;
  res.balance = std::move(balance);
  res.state = AccountState::Frozen{hash};
  return res;
}

bool AccountStorage::store(vm::CellBuilder& cb) const {
  if (!(cb.store_long_bool(static_cast<long long>(last_trans_lt), 64) && balance.store(cb) && state.store(cb))) {
    return false;
  }
  return !init_code_hash || tlb::store_maybe_bits256(cb, init_code_hash);
}

td::Result<Ref<vm::Cell>> AccountStorage::serialize() const {
  return tlb::pack_cell(*this, "AccountStorage");
}

std::string AccountStorage::to_str() const {
  return PSTRING() << "AccountStorage[last_trans_lt " << last_trans_lt << ", balance " << balance
                   << ", account state " << state << "]";
}

td::Status AccountStuff::update_storage_stat(StorageStatMode mode) {
  TRY_RESULT(root, storage.serialize());
  if (mode == StorageStatMode::exact) {
    TRY_RESULT_ASSIGN(storage_stat.used, StorageUsed::calculate_for_cell(root));
  } else {
    TRY_RESULT_ASSIGN(storage_stat.used,
                      StorageUsed::with_values_checked(root->get_tree_cell_count(), root->get_tree_bits_count()));
  }
  return td::Status::OK();
}

/*
 *
 *   ACCOUNT
 *
 */

Account Account::with_address(MsgAddressInt addr) {
  return Account{AccountStuff{std::move(addr), StorageInfo{}, AccountStorage{}}};
}

Account Account::with_address_and_balance(MsgAddressInt addr, CurrencyCollection balance) {
  return Account{AccountStuff{std::move(addr), StorageInfo{}, AccountStorage::uninit(std::move(balance))}};
}

Account Account::with_storage(MsgAddressInt addr, StorageInfo storage_stat, AccountStorage storage) {
  return Account{AccountStuff{std::move(addr), std::move(storage_stat), std::move(storage)}};
}

td::Result<Account> Account::active(MsgAddressInt addr, CurrencyCollection balance, UnixTime last_paid,
                                    StateInit state_init, bool derive_init_code_hash) {
  Account account{AccountStuff{
      std::move(addr), StorageInfo{last_paid, {}},
      AccountStorage::active(0, std::move(balance), std::move(state_init), derive_init_code_hash)}};
  TRY_STATUS(account.update_storage_stat());
  return std::move(account);
}

td::Result<Account> Account::frozen(MsgAddressInt addr, LogicalTime last_trans_lt, UnixTime last_paid,
                                    const td::Bits256& state_hash, std::optional<td::uint128> due_payment,
                                    CurrencyCollection balance) {
  Account account{AccountStuff{std::move(addr), StorageInfo{last_paid, due_payment},
                               AccountStorage::frozen(last_trans_lt, std::move(balance), state_hash)}};
  TRY_STATUS(account.update_storage_stat());
  return std::move(account);
}

td::Result<Account> Account::uninit(MsgAddressInt addr, LogicalTime last_trans_lt, UnixTime last_paid,
                                    CurrencyCollection balance) {
  AccountStorage storage = AccountStorage::uninit(std::move(balance));
  storage.last_trans_lt = last_trans_lt;
  Account account{AccountStuff{std::move(addr), StorageInfo{last_paid, {}}, std::move(storage)}};
  TRY_STATUS(account.update_storage_stat());
  return std::move(account);
}

td::Result<Account> Account::from_message(const InboundMessage& msg, bool derive_init_code_hash) {
  const auto& info = msg.info;
  if (!info.value.grams) {
    return Account{};
  }
  AccountStorage storage = AccountStorage::uninit(info.value);
  if (msg.init) {
    if (msg.init->code.is_null()) {
      return Account{};
    }
    TRY_RESULT(hash, msg.init->hash());
    if (hash != info.dest.address) {
      LOG(WARNING) << "constructor message for " << info.dest << " carries StateInit with hash " << hash.to_hex();
      return make_error(ErrorCode::policy_violation, "StateInit doesn't correspond to destination address");
    }
    storage = AccountStorage::active(0, info.value, *msg.init, derive_init_code_hash);
  } else if (info.bounce) {
    return Account{};
  }
  Account account{AccountStuff{info.dest, StorageInfo{}, std::move(storage)}};
  TRY_STATUS(account.update_storage_stat());
  return std::move(account);
}

AccountStatus Account::status() const {
  return stuff_ ? stuff_->storage.state.status() : AccountStatus::nonexist;
}

td::Status Account::try_activate(const StateInit& state_init, bool derive_init_code_hash) {
  if (!stuff_) {
    return make_error(ErrorCode::precondition, "Cannot activate not existing account");
  }
  auto& storage = stuff_->storage;
  if (storage.state.is_active()) {
    return td::Status::OK();
  }
  TRY_RESULT(hash, state_init.hash());
  if (storage.state.is_uninit()) {
    if (hash != stuff_->addr.address) {
      LOG(WARNING) << "rejected activation of " << stuff_->addr << ": StateInit hash is " << hash.to_hex();
      return make_error(ErrorCode::policy_violation, "StateInit doesn't correspond to uninit account address");
    }
  } else if (hash != *storage.state.frozen_hash()) {
    LOG(WARNING) << "rejected activation of frozen " << stuff_->addr << ": StateInit hash is " << hash.to_hex();
    return make_error(ErrorCode::policy_violation, "StateInit doesn't correspond to frozen hash");
  }
  storage.state = AccountState::Active{state_init};
  storage.init_code_hash.reset();
  if (derive_init_code_hash && state_init.code.not_null()) {
    storage.init_code_hash = state_init.code->get_hash().as_bitarray();
  }
  return td::Status::OK();
}

td::Status Account::try_freeze() {
  auto state_init = state_init_mut();
  if (!state_init) {
    return td::Status::OK();
  }
  TRY_RESULT(hash, state_init->hash());
  stuff_->storage.state = AccountState::Frozen{hash};
  return td::Status::OK();
}

void Account::uninit_account() {
  if (stuff_ && stuff_->storage.state.is_active()) {
    stuff_->storage.state = AccountState::Uninit{};
  }
}

void Account::add_funds(const CurrencyCollection& funds) {
  if (stuff_) {
    stuff_->storage.balance.add(funds);
  }
}

bool Account::sub_funds(const CurrencyCollection& funds) {
  return stuff_ && stuff_->storage.balance.sub(funds);
}

void Account::set_balance(CurrencyCollection balance) {
  if (stuff_) {
    stuff_->storage.balance = std::move(balance);
  }
}

const CurrencyCollection* Account::balance() const {
  return stuff_ ? &stuff_->storage.balance : nullptr;
}

CurrencyCollection Account::balance_checked() const {
  return stuff_ ? stuff_->storage.balance : CurrencyCollection{};
}

td::Status Account::update_storage_stat(StorageStatMode mode) {
  if (!stuff_) {
    return td::Status::OK();
  }
  return stuff_->update_storage_stat(mode);
}

const MsgAddressInt* Account::get_addr() const {
  return stuff_ ? &stuff_->addr : nullptr;
}

std::optional<StdSmcAddress> Account::get_id() const {
  if (!stuff_) {
    return {};
  }
  return stuff_->addr.address;
}

td::Result<bool> Account::belongs_to_shard(const ShardIdFull& shard) const {
  if (!stuff_) {
    return make_error(ErrorCode::precondition, "Account is None");
  }
  return shard.contains(stuff_->addr.workchain, stuff_->addr.rewritten().cbits());
}

const StorageInfo* Account::storage_info() const {
  return stuff_ ? &stuff_->storage_stat : nullptr;
}

UnixTime Account::last_paid() const {
  return stuff_ ? stuff_->storage_stat.last_paid : 0;
}

void Account::set_last_paid(UnixTime last_paid) {
  if (stuff_) {
    stuff_->storage_stat.last_paid = last_paid;
  }
}

std::optional<td::uint128> Account::due_payment() const {
  return stuff_ ? stuff_->storage_stat.due_payment : std::nullopt;
}

void Account::set_due_payment(std::optional<td::uint128> due_payment) {
  if (stuff_) {
    stuff_->storage_stat.due_payment = due_payment;
  }
}

std::optional<LogicalTime> Account::last_tr_time() const {
  if (!stuff_) {
    return {};
  }
  return stuff_->storage.last_trans_lt;
}

void Account::set_last_tr_time(LogicalTime lt) {
  if (stuff_) {
    stuff_->storage.last_trans_lt = lt;
  }
}

const AccountState* Account::state() const {
  return stuff_ ? &stuff_->storage.state : nullptr;
}

const StateInit* Account::state_init() const {
  return stuff_ ? stuff_->storage.state.state_init() : nullptr;
}

StateInit* Account::state_init_mut() {
  return stuff_ ? stuff_->storage.state.state_init() : nullptr;
}

const td::Bits256* Account::frozen_hash() const {
  return stuff_ ? stuff_->storage.state.frozen_hash() : nullptr;
}

const td::Bits256* Account::init_code_hash() const {
  return stuff_ && stuff_->storage.init_code_hash ? &*stuff_->storage.init_code_hash : nullptr;
}

std::optional<TickTock> Account::get_tick_tock() const {
  auto si = state_init();
  return si ? si->special : std::nullopt;
}

std::optional<int> Account::split_depth() const {
  auto si = state_init();
  return si ? si->split_depth : std::nullopt;
}

Ref<vm::Cell> Account::get_code() const {
  auto si = state_init();
  return si ? si->code : Ref<vm::Cell>{};
}

std::optional<td::Bits256> Account::get_code_hash() const {
  auto code = get_code();
  if (code.is_null()) {
    return {};
  }
  return code->get_hash().as_bitarray();
}

Ref<vm::Cell> Account::get_data() const {
  auto si = state_init();
  return si ? si->data : Ref<vm::Cell>{};
}

std::optional<td::Bits256> Account::get_data_hash() const {
  auto data = get_data();
  if (data.is_null()) {
    return {};
  }
  return data->get_hash().as_bitarray();
}

bool Account::set_code(Ref<vm::Cell> code) {
  auto si = state_init_mut();
  if (!si) {
    return false;
  }
  si->code = std::move(code);
  return true;
}

bool Account::set_data(Ref<vm::Cell> data) {
  auto si = state_init_mut();
  if (!si) {
    return false;
  }
  si->data = std::move(data);
  return true;
}

td::Result<std::vector<std::pair<td::Bits256, SimpleLib>>> Account::libraries() const {
  auto si = state_init();
  if (!si) {
    return std::vector<std::pair<td::Bits256, SimpleLib>>{};
  }
  try {
    return si->libraries();
  } catch (vm::VmError& err) {
    return make_error(ErrorCode::malformed, PSLICE() << "invalid library collection: " << err.get_msg());
  } catch (vm::VmVirtError&) {
    return make_error(ErrorCode::malformed, "library collection is pruned");
  }
}

bool Account::set_library(Ref<vm::Cell> code, bool is_public) {
  auto si = state_init_mut();
  try {
    return si && si->set_library(std::move(code), is_public);
  } catch (vm::VmError& err) {
    LOG(WARNING) << "cannot add library to " << stuff_->addr << ": " << err.get_msg();
    return false;
  }
}

bool Account::set_library_flag(const td::Bits256& hash, bool is_public) {
  auto si = state_init_mut();
  try {
    return si && si->set_library_flag(hash, is_public);
  } catch (vm::VmError& err) {
    LOG(WARNING) << "cannot change library flag of " << stuff_->addr << ": " << err.get_msg();
    return false;
  }
}

bool Account::delete_library(const td::Bits256& hash) {
  auto si = state_init_mut();
  try {
    return si && si->delete_library(hash);
  } catch (vm::VmError& err) {
    LOG(WARNING) << "cannot delete library of " << stuff_->addr << ": " << err.get_msg();
    return false;
  }
}

void Account::set_addr(MsgAddressInt addr) {
  if (stuff_) {
    stuff_->addr = std::move(addr);
  }
}

void Account::set_init_code_hash(const td::Bits256& hash) {
  if (stuff_) {
    stuff_->storage.init_code_hash = hash;
  }
}

bool Account::store(vm::CellBuilder& cb) const {
  if (stuff_ && stuff_->storage.init_code_hash) {
    return cb.store_long_bool(1, 4) && stuff_->addr.store(cb) && stuff_->storage_stat.store(cb) &&
           stuff_->storage.store(cb);
  }
  return store_original_format(cb);
}

bool Account::store_original_format(vm::CellBuilder& cb) const {
  if (!stuff_) {
    return cb.store_long_bool(0, 1);
  }
  const auto& storage = stuff_->storage;
  return cb.store_long_bool(1, 1) && stuff_->addr.store(cb) && stuff_->storage_stat.store(cb) &&
         cb.store_long_bool(static_cast<long long>(storage.last_trans_lt), 64) && storage.balance.store(cb) &&
         storage.state.store(cb);
}

td::Result<Ref<vm::Cell>> Account::serialize() const {
  return tlb::pack_cell(*this, "Account");
}

td::Result<Account> Account::unpack_stuff(vm::CellSlice& cs, bool extended) {
  AccountStuff stuff;
  auto& storage = stuff.storage;
  if (!stuff.addr.fetch(cs)) {
    return make_error(ErrorCode::malformed, "cannot unpack account address");
  }
  if (!stuff.storage_stat.fetch(cs)) {
    return make_error(ErrorCode::malformed, PSLICE() << "cannot unpack storage info of account " << stuff.addr);
  }
  if (!(cs.fetch_uint_to(64, storage.last_trans_lt) && storage.balance.fetch(cs) && storage.state.fetch(cs))) {
    return make_error(ErrorCode::malformed, PSLICE() << "cannot unpack storage of account " << stuff.addr);
  }
  if (extended && !tlb::fetch_maybe_bits256(cs, storage.init_code_hash)) {
    return make_error(ErrorCode::malformed, PSLICE() << "cannot unpack init code hash of account " << stuff.addr);
  }
  LOG(DEBUG) << "unpacked account " << stuff.addr << " status " << storage.state.status() << " last_trans_lt "
             << storage.last_trans_lt;
  return Account{std::move(stuff)};
}

td::Result<Account> Account::unpack(vm::CellSlice& cs) {
  try {
    bool original;
    if (!cs.fetch_bool_to(original)) {
      return make_error(ErrorCode::malformed, "cannot unpack account: no data");
    }
    if (original) {
      return unpack_stuff(cs, false);
    }
    if (cs.empty()) {
      return Account{};
    }
    int tag;
    if (!cs.fetch_uint_to(3, tag)) {
      return make_error(ErrorCode::malformed, "cannot unpack account tag");
    }
    switch (tag) {
      case 0:
        return Account{};
      case 1: {
        TRY_RESULT_PREFIX(account, unpack_stuff(cs, true), PSLICE() << "cannot deserialize account with tag " << tag
                                                                    << ": ");
        return std::move(account);
      }
      default:
        return make_error(ErrorCode::malformed, PSLICE() << "wrong tag " << tag << " deserializing account");
    }
  } catch (vm::VmError& err) {
    return make_error(ErrorCode::malformed, PSLICE() << "error unpacking account: " << err.get_msg());
  } catch (vm::VmVirtError& err) {
    return make_error(ErrorCode::malformed, PSLICE() << "virtualization error unpacking account: " << err.get_msg());
  }
}

td::Result<Account> Account::unpack_cell(Ref<vm::Cell> cell) {
  if (cell.is_null()) {
    return make_error(ErrorCode::malformed, "account cell is null");
  }
  try {
    auto cs = vm::load_cell_slice(std::move(cell));
    TRY_RESULT(account, unpack(cs));
    if (!cs.empty_ext()) {
      return make_error(ErrorCode::malformed, "extra data after account");
    }
    return std::move(account);
  } catch (vm::VmError& err) {
    return make_error(ErrorCode::malformed, PSLICE() << "error loading account cell: " << err.get_msg());
  } catch (vm::VmVirtError& err) {
    return make_error(ErrorCode::malformed, PSLICE() << "virtualization error loading account: " << err.get_msg());
  }
}

std::string Account::to_str() const {
  if (!stuff_) {
    return "Account[None]";
  }
  return PSTRING() << "Account[addr " << stuff_->addr << ", " << stuff_->storage_stat << ", "
                   << stuff_->storage.to_str() << "]";
}

td::StringBuilder& operator<<(td::StringBuilder& sb, const Account& account) {
  return sb << account.to_str();
}

}  // namespace accstate
