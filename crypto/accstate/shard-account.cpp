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
#include "accstate/shard-account.h"

#include "td/utils/logging.h"

namespace accstate {

namespace {

class ShardAccountsAug final : public vm::dict::AugmentationData {
 public:
  bool skip_extra(vm::CellSlice& cs) const override {
    return DepthBalanceInfo::skip(cs);
  }
  bool eval_leaf(vm::CellBuilder& cb, vm::CellSlice& val) const override {
    ShardAccount shard_account;
    if (!shard_account.fetch(val)) {
      return false;
    }
    auto r_account = shard_account.read_account();
    if (r_account.is_error()) {
      LOG(DEBUG) << "cannot compute DepthBalanceInfo: " << r_account.error();
      return false;
    }
    return DepthBalanceInfo::from_account(r_account.ok()).store(cb);
  }
  bool eval_fork(vm::CellBuilder& cb, vm::CellSlice& left_extra, vm::CellSlice& right_extra) const override {
    DepthBalanceInfo left, right;
    if (!(left.fetch(left_extra) && right.fetch(right_extra))) {
      return false;
    }
    left.split_depth = 0;
    left.balance.add(right.balance);
    return left.store(cb);
  }
  bool eval_empty(vm::CellBuilder& cb) const override {
    return DepthBalanceInfo{}.store(cb);
  }
};

const ShardAccountsAug aug_ShardAccounts;

Ref<vm::Cell> none_account_cell() {
  vm::CellBuilder cb;
  cb.store_long(0, 1);
  return cb.finalize_novm();
}

}  // namespace

DepthBalanceInfo DepthBalanceInfo::from_account(const Account& account) {
  DepthBalanceInfo res;
  res.balance = account.balance_checked();
  res.split_depth = account.split_depth().value_or(0);
  return res;
}

bool DepthBalanceInfo::store(vm::CellBuilder& cb) const {
  return cb.store_uint_leq(30, split_depth) && balance.store(cb);
}

bool DepthBalanceInfo::fetch(vm::CellSlice& cs) {
  return cs.fetch_uint_leq(30, split_depth) && balance.fetch(cs);
}

bool DepthBalanceInfo::skip(vm::CellSlice& cs) {
  int depth;
  return cs.fetch_uint_leq(30, depth) && CurrencyCollection::skip(cs);
}

/*
 *
 *   SHARD ACCOUNT
 *
 */

ShardAccount::ShardAccount() : account_root_(none_account_cell()) {
}

ShardAccount::ShardAccount(Ref<vm::Cell> account_root, const td::Bits256& last_trans_hash,
                           LogicalTime last_trans_lt)
    : account_root_(std::move(account_root)), last_trans_hash_(last_trans_hash), last_trans_lt_(last_trans_lt) {
  CHECK(account_root_.not_null());
}

td::Result<ShardAccount> ShardAccount::with_params(const Account& account, const td::Bits256& last_trans_hash,
                                                   LogicalTime last_trans_lt) {
  TRY_RESULT(root, account.serialize());
  return ShardAccount{std::move(root), last_trans_hash, last_trans_lt};
}

td::Result<Account> ShardAccount::read_account() const {
  return Account::unpack_cell(account_root_);
}

td::Status ShardAccount::write_account(const Account& account) {
  TRY_RESULT(root, account.serialize());
  account_root_ = std::move(root);
  return td::Status::OK();
}

bool ShardAccount::store(vm::CellBuilder& cb) const {
  return cb.store_ref_bool(account_root_) && cb.store_bits_bool(last_trans_hash_) &&
         cb.store_long_bool(static_cast<long long>(last_trans_lt_), 64);
}

bool ShardAccount::fetch(vm::CellSlice& cs) {
  Ref<vm::Cell> root;
  if (!(cs.fetch_ref_to(root) && root.not_null() && cs.fetch_bits_to(last_trans_hash_) &&
        cs.fetch_uint_to(64, last_trans_lt_))) {
    return false;
  }
  account_root_ = std::move(root);
  return true;
}

/*
 *
 *   SHARD ACCOUNTS
 *
 */

ShardAccounts::ShardAccounts() : dict_(256, aug_ShardAccounts) {
}

ShardAccounts::ShardAccounts(Ref<vm::Cell> dict_root) : dict_(std::move(dict_root), 256, aug_ShardAccounts) {
}

td::Status ShardAccounts::set(const StdSmcAddress& key, const ShardAccount& shard_account) {
  vm::CellBuilder cb;
  if (!shard_account.store(cb)) {
    return make_error(ErrorCode::malformed, "cannot serialize ShardAccount");
  }
  try {
    if (!dict_.set_builder(key.cbits(), 256, cb)) {
      return make_error(ErrorCode::malformed, PSLICE() << "cannot store account " << key.to_hex() << " into ShardAccounts");
    }
  } catch (vm::VmError& err) {
    return make_error(ErrorCode::malformed, PSLICE() << "invalid ShardAccounts dictionary: " << err.get_msg());
  } catch (vm::VmVirtError&) {
    return make_error(ErrorCode::malformed, "cannot modify a pruned ShardAccounts dictionary");
  }
  return td::Status::OK();
}

td::Status ShardAccounts::insert(const Account& account, const td::Bits256& last_trans_hash,
                                 LogicalTime last_trans_lt) {
  auto addr = account.get_addr();
  if (!addr) {
    return make_error(ErrorCode::precondition, "cannot insert a nonexistent account into ShardAccounts");
  }
  TRY_RESULT(shard_account, ShardAccount::with_params(account, last_trans_hash, last_trans_lt));
  return set(addr->rewritten(), shard_account);
}

td::Result<std::optional<ShardAccount>> ShardAccounts::lookup(const StdSmcAddress& key) const {
  try {
    auto cs = dict_.lookup(key.cbits(), 256);
    if (cs.is_null()) {
      return std::optional<ShardAccount>{};
    }
    ShardAccount res;
    if (!res.fetch(cs.write()) || !cs->empty_ext()) {
      return make_error(ErrorCode::malformed, PSLICE() << "cannot unpack ShardAccount for " << key.to_hex());
    }
    return std::optional<ShardAccount>{std::move(res)};
  } catch (vm::VmError& err) {
    return make_error(ErrorCode::malformed, PSLICE() << "error looking up account " << key.to_hex() << ": "
                                                     << err.get_msg());
  } catch (vm::VmVirtError&) {
    return make_error(ErrorCode::not_found, PSLICE() << "account " << key.to_hex() << " is pruned from the state");
  }
}

td::Status ShardAccounts::remove(const StdSmcAddress& key) {
  try {
    if (dict_.lookup_delete(key.cbits(), 256).is_null()) {
      return make_error(ErrorCode::not_found, PSLICE() << "account " << key.to_hex() << " not found");
    }
  } catch (vm::VmError& err) {
    return make_error(ErrorCode::malformed, PSLICE() << "invalid ShardAccounts dictionary: " << err.get_msg());
  } catch (vm::VmVirtError&) {
    return make_error(ErrorCode::malformed, "cannot modify a pruned ShardAccounts dictionary");
  }
  return td::Status::OK();
}

td::Result<DepthBalanceInfo> ShardAccounts::get_total() const {
  try {
    auto extra = dict_.get_root_extra();
    DepthBalanceInfo res;
    if (extra.is_null() || !res.fetch(extra.write())) {
      return make_error(ErrorCode::malformed, "cannot unpack total balance of ShardAccounts");
    }
    return std::move(res);
  } catch (vm::VmError& err) {
    return make_error(ErrorCode::malformed, PSLICE() << "invalid ShardAccounts dictionary: " << err.get_msg());
  } catch (vm::VmVirtError&) {
    return make_error(ErrorCode::malformed, "ShardAccounts dictionary root is pruned");
  }
}

td::Result<std::vector<std::pair<StdSmcAddress, ShardAccount>>> ShardAccounts::list() const {
  std::vector<std::pair<StdSmcAddress, ShardAccount>> res;
  try {
    bool ok = dict_.check_for_each([&res](Ref<vm::CellSlice> cs, td::ConstBitPtr key, int n) {
      ShardAccount shard_account;
      if (!shard_account.fetch(cs.write()) || !cs->empty_ext()) {
        return false;
      }
      res.emplace_back(StdSmcAddress{key}, std::move(shard_account));
      return true;
    });
    if (!ok) {
      return make_error(ErrorCode::malformed, "cannot unpack ShardAccounts");
    }
  } catch (vm::VmError& err) {
    return make_error(ErrorCode::malformed, PSLICE() << "invalid ShardAccounts dictionary: " << err.get_msg());
  } catch (vm::VmVirtError&) {
    return make_error(ErrorCode::malformed, "ShardAccounts dictionary is pruned");
  }
  return std::move(res);
}

bool ShardAccounts::store(vm::CellBuilder& cb) const {
  return dict_.append_dict_to_bool(cb);
}

bool ShardAccounts::fetch(vm::CellSlice& cs) {
  return dict_.fetch_from(cs);
}

/*
 *
 *   SHARD STATE
 *
 */

bool ShardState::store(vm::CellBuilder& cb) const {
  vm::CellBuilder cb2;
  Ref<vm::Cell> accounts_cell;
  return accounts.store(cb2) && cb2.finalize_to(accounts_cell) && cb.store_long_bool(cons_tag, 32) &&
         cb.store_long_bool(global_id, 32) && shard_id.store(cb) && cb.store_long_bool(seq_no, 32) &&
         cb.store_long_bool(gen_utime, 32) && cb.store_long_bool(static_cast<long long>(gen_lt), 64) &&
         cb.store_ref_bool(std::move(accounts_cell));
}

bool ShardState::fetch(vm::CellSlice& cs) {
  Ref<vm::Cell> accounts_cell;
  if (!(cs.fetch_ulong(32) == cons_tag && cs.fetch_int_to(32, global_id) && shard_id.fetch(cs) &&
        cs.fetch_uint_to(32, seq_no) && cs.fetch_uint_to(32, gen_utime) && cs.fetch_uint_to(64, gen_lt) &&
        cs.fetch_ref_to(accounts_cell) && accounts_cell.not_null())) {
    return false;
  }
  auto accounts_cs = vm::load_cell_slice(std::move(accounts_cell));
  return accounts.fetch(accounts_cs) && accounts_cs.empty_ext();
}

td::Result<Ref<vm::Cell>> ShardState::serialize() const {
  try {
    return tlb::pack_cell(*this, "ShardState");
  } catch (vm::VmError& err) {
    return make_error(ErrorCode::malformed, PSLICE() << "cannot serialize ShardState: " << err.get_msg());
  }
}

td::Result<ShardState> ShardState::unpack_cell(Ref<vm::Cell> root) {
  if (root.is_null()) {
    return make_error(ErrorCode::malformed, "shard state root is null");
  }
  try {
    auto cs = vm::load_cell_slice(std::move(root));
    ShardState res;
    if (!res.fetch(cs) || !cs.empty_ext()) {
      return make_error(ErrorCode::malformed, "cannot unpack ShardState");
    }
    return std::move(res);
  } catch (vm::VmError& err) {
    return make_error(ErrorCode::malformed, PSLICE() << "error unpacking ShardState: " << err.get_msg());
  } catch (vm::VmVirtError& err) {
    return make_error(ErrorCode::malformed, PSLICE() << "virtualization error unpacking ShardState: " << err.get_msg());
  }
}

}  // namespace accstate
