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
#include "accstate/shard-account.h"

#include "vm/cells/CellUsageTree.h"
#include "vm/cells/MerkleProof.h"
#include "vm/cells/UsageCell.h"

#include "td/utils/logging.h"

namespace accstate {

namespace {

// resolves addr inside a (possibly virtualized or usage-tracked) ShardState
td::Result<Account> find_account(Ref<vm::Cell> state_root, const MsgAddressInt& addr) {
  TRY_RESULT(state, ShardState::unpack_cell(std::move(state_root)));
  auto key = addr.rewritten();
  if (!state.shard_id.contains(addr.workchain, key.cbits())) {
    LOG(INFO) << "account " << addr << " does not belong to shard " << state.shard_id;
    return make_error(ErrorCode::not_found, "Account doesn't belong to given shard state");
  }
  TRY_RESULT(shard_account, state.accounts.lookup(key));
  if (!shard_account) {
    LOG(INFO) << "account " << addr << " not found in shard " << state.shard_id;
    return make_error(ErrorCode::not_found, "Account doesn't belong to given shard state");
  }
  TRY_RESULT(account, shard_account->read_account());
  if (account.is_none()) {
    return make_error(ErrorCode::not_found, PSLICE() << "account " << addr << " is empty in the given shard state");
  }
  return std::move(account);
}

}  // namespace

td::Result<Ref<vm::Cell>> Account::prepare_proof(Ref<vm::Cell> state_root) const {
  if (!stuff_) {
    return make_error(ErrorCode::precondition, "Account cannot be None");
  }
  if (state_root.is_null()) {
    return make_error(ErrorCode::malformed, "shard state root is null");
  }
  try {
    auto usage_tree = std::make_shared<vm::CellUsageTree>();
    auto usage_root = vm::UsageCell::create(state_root, usage_tree->root_ptr());
    TRY_STATUS(find_account(std::move(usage_root), stuff_->addr));
    auto proof = vm::MerkleProof::generate(std::move(state_root), usage_tree.get());
    if (proof.is_null()) {
      return make_error(ErrorCode::malformed, "cannot create Merkle proof of account");
    }
    LOG(DEBUG) << "proof of " << stuff_->addr << " keeps " << usage_tree->loaded_count() << " cells";
    return std::move(proof);
  } catch (vm::VmError& err) {
    return make_error(ErrorCode::malformed, PSLICE() << "error creating proof of account: " << err.get_msg());
  } catch (vm::VmVirtError& err) {
    return make_error(ErrorCode::malformed, PSLICE() << "virtualization error creating proof of account: "
                                                     << err.get_msg());
  }
}

td::Result<Account> check_account_proof(Ref<vm::Cell> proof, const td::Bits256& expected_state_hash,
                                        const MsgAddressInt& addr) {
  try {
    auto virt_root = vm::MerkleProof::virtualize(std::move(proof));
    if (virt_root.is_null()) {
      return make_error(ErrorCode::malformed, "account state proof is invalid");
    }
    if (virt_root->get_hash().as_bitarray() != expected_state_hash) {
      return make_error(ErrorCode::malformed, PSLICE() << "root hash mismatch in the shard state proof: expected "
                                                       << expected_state_hash.to_hex() << ", found "
                                                       << virt_root->get_hash().to_hex());
    }
    TRY_RESULT(account, find_account(std::move(virt_root), addr));
    if (*account.get_addr() != addr) {
      return make_error(ErrorCode::malformed, PSLICE() << "proof contains account " << *account.get_addr()
                                                       << " instead of " << addr);
    }
    return std::move(account);
  } catch (vm::VmError& err) {
    return make_error(ErrorCode::malformed, PSLICE() << "error scanning account state proof: " << err.get_msg());
  } catch (vm::VmVirtError& err) {
    return make_error(ErrorCode::malformed, PSLICE() << "virtualization error scanning account state proof: "
                                                     << err.get_msg());
  }
}

}  // namespace accstate
