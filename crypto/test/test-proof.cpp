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

#include "vm/cells/CellBuilder.h"
#include "vm/cells/MerkleProof.h"
#include "vm/excno.hpp"

#include "td/utils/tests.h"

using namespace accstate;

namespace {

StdSmcAddress make_key(unsigned char first) {
  StdSmcAddress id;
  id.set_zero();
  id.data()[0] = first;
  id.data()[31] = 0x5a;
  return id;
}

Account make_account(unsigned char first, td::uint128 grams) {
  vm::CellBuilder cb;
  cb.store_long(first, 32);
  StateInit state_init{cb.finalize(), Ref<vm::Cell>{}};
  auto account = Account::active(MsgAddressInt{basechainId, make_key(first)}, CurrencyCollection{grams}, 1000,
                                 std::move(state_init), true)
                     .move_as_ok();
  account.set_last_tr_time(first);
  return account;
}

struct TestState {
  Account first = make_account(0x10, 100);
  Account second = make_account(0x90, 200);
  Ref<vm::Cell> root;

  explicit TestState(ShardIdFull shard = ShardIdFull{basechainId}) {
    ShardState state;
    state.global_id = -239;
    state.shard_id = shard;
    state.seq_no = 1;
    state.gen_lt = 0x90;
    state.accounts.insert(first, td::Bits256::zero(), 0x10).ensure();
    state.accounts.insert(second, td::Bits256::zero(), 0x90).ensure();
    root = state.serialize().move_as_ok();
  }
  td::Bits256 hash() const {
    return root->get_hash().as_bitarray();
  }
};

bool is_error_code(const td::Status &status, ErrorCode code) {
  return status.is_error() && get_error_code(status) == code;
}

bool throws_virt_error(const Ref<vm::Cell> &cell) {
  try {
    vm::load_cell_slice(cell);
  } catch (vm::VmVirtError &) {
    return true;
  }
  return false;
}

}  // namespace

TEST(AccountProof, Roundtrip) {
  TestState state;
  auto proof = state.first.prepare_proof(state.root).move_as_ok();
  auto virt_root = vm::MerkleProof::virtualize(proof);
  ASSERT_TRUE(virt_root.not_null());
  ASSERT_EQ(state.root->get_hash(), virt_root->get_hash());

  auto account = check_account_proof(proof, state.hash(), *state.first.get_addr()).move_as_ok();
  ASSERT_EQ(state.first, account);

  // the proof keeps only the path to the first account
  auto full = StorageUsed::calculate_for_cell(state.root).move_as_ok();
  auto kept = StorageUsed::calculate_for_cell(proof).move_as_ok();
  ASSERT_TRUE(kept.cells < full.cells);
  auto r_second = check_account_proof(proof, state.hash(), *state.second.get_addr());
  ASSERT_TRUE(is_error_code(r_second.error(), ErrorCode::not_found));

  auto second_proof = state.second.prepare_proof(state.root).move_as_ok();
  ASSERT_EQ(state.second, check_account_proof(second_proof, state.hash(), *state.second.get_addr()).move_as_ok());
}

TEST(AccountProof, UnloadedCodeIsPruned) {
  TestState state;
  auto proof = state.first.prepare_proof(state.root).move_as_ok();
  auto account = check_account_proof(proof, state.hash(), *state.first.get_addr()).move_as_ok();
  auto original = state.first.get_code();
  auto code = account.get_code();
  ASSERT_TRUE(code.not_null());
  ASSERT_EQ(original->get_hash(), code->get_hash());
  // reading the account never loads its code, so the proof only carries its hash
  ASSERT_TRUE(throws_virt_error(code));
  ASSERT_TRUE(!throws_virt_error(original));
}

TEST(AccountProof, PrunedStateLookup) {
  TestState state;
  auto proof = state.first.prepare_proof(state.root).move_as_ok();
  auto virt_state = ShardState::unpack_cell(vm::MerkleProof::virtualize(proof)).move_as_ok();
  ASSERT_EQ(-239, virt_state.global_id);

  auto found = virt_state.accounts.lookup(make_key(0x10)).move_as_ok();
  ASSERT_TRUE(found.has_value());
  ASSERT_EQ(0x10u, found->last_trans_lt());

  auto r_pruned = virt_state.accounts.lookup(make_key(0x90));
  ASSERT_TRUE(is_error_code(r_pruned.error(), ErrorCode::not_found));

  // a key absent from the state is reported as missing, not as pruned
  ASSERT_TRUE(!virt_state.accounts.lookup(make_key(0x11)).move_as_ok());
}

TEST(AccountProof, Errors) {
  TestState state;
  auto proof = state.first.prepare_proof(state.root).move_as_ok();
  const auto &addr = *state.first.get_addr();

  auto wrong_hash = state.hash();
  wrong_hash.bits().set_bit(0, !wrong_hash[0]);
  ASSERT_TRUE(is_error_code(check_account_proof(proof, wrong_hash, addr).move_as_error(), ErrorCode::malformed));

  // the proof must be a Merkle proof cell
  ASSERT_TRUE(
      is_error_code(check_account_proof(state.root, state.hash(), addr).move_as_error(), ErrorCode::malformed));
  ASSERT_TRUE(is_error_code(check_account_proof(Ref<vm::Cell>{}, state.hash(), addr).move_as_error(),
                            ErrorCode::malformed));

  MsgAddressInt missing{basechainId, make_key(0x11)};
  ASSERT_TRUE(
      is_error_code(check_account_proof(proof, state.hash(), missing).move_as_error(), ErrorCode::not_found));

  MsgAddressInt other_workchain{masterchainId, make_key(0x10)};
  ASSERT_TRUE(is_error_code(check_account_proof(proof, state.hash(), other_workchain).move_as_error(),
                            ErrorCode::not_found));

  ASSERT_TRUE(is_error_code(Account{}.prepare_proof(state.root).move_as_error(), ErrorCode::precondition));
  ASSERT_TRUE(is_error_code(state.first.prepare_proof({}).move_as_error(), ErrorCode::malformed));

  // an account outside of the state cannot be proven
  auto stranger = make_account(0x20, 1);
  ASSERT_TRUE(is_error_code(stranger.prepare_proof(state.root).move_as_error(), ErrorCode::not_found));
}

TEST(AccountProof, ShardMismatch) {
  TestState state{ShardIdFull{basechainId, 0x4000000000000000ULL}};
  auto proof = state.first.prepare_proof(state.root).move_as_ok();
  ASSERT_EQ(state.first, check_account_proof(proof, state.hash(), *state.first.get_addr()).move_as_ok());

  // the second account is stored in the dictionary but lies outside of the left shard
  auto r_proof = state.second.prepare_proof(state.root);
  ASSERT_TRUE(is_error_code(r_proof.error(), ErrorCode::not_found));
  ASSERT_TRUE(is_error_code(check_account_proof(proof, state.hash(), *state.second.get_addr()).move_as_error(),
                            ErrorCode::not_found));
}
