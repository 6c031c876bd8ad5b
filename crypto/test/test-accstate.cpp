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
#include "vm/cells/CellSlice.h"

#include "td/utils/tests.h"

#include <absl/hash/hash.h>

using namespace accstate;

namespace {

const unsigned char code_bytes[8] = {0x3f, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xf4};

Ref<vm::Cell> make_cell(const unsigned char *bytes, std::vector<Ref<vm::Cell>> refs = {}) {
  vm::CellBuilder cb;
  cb.store_bits(bytes, 61);
  for (auto &ref : refs) {
    cb.store_ref(ref);
  }
  return cb.finalize();
}

Ref<vm::Cell> make_int_cell(long long x, std::vector<Ref<vm::Cell>> refs = {}) {
  vm::CellBuilder cb;
  cb.store_long(x, 64);
  for (auto &ref : refs) {
    cb.store_ref(ref);
  }
  return cb.finalize();
}

StdSmcAddress make_id(unsigned char first) {
  StdSmcAddress id;
  for (int i = 0; i < 32; i++) {
    id.data()[i] = static_cast<unsigned char>(first + i);
  }
  return id;
}

StateInit make_state_init(long long seed) {
  return StateInit{make_int_cell(seed, {make_int_cell(seed + 1)}), make_int_cell(seed + 2)};
}

td::Bits256 hash_of(const StateInit &state_init) {
  return state_init.hash().move_as_ok();
}

Account generate_test_account(bool with_init_code_hash) {
  const unsigned char sub2_bytes[8] = {0x3f, 0x3f, 0xff, 0xff, 0xff, 0xff, 0xff, 0xf4};
  const unsigned char sub3_bytes[8] = {0x0f, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xf4};
  const unsigned char sub4_bytes[8] = {0x3f, 0xff, 0x3f, 0xff, 0xff, 0xff, 0xff, 0xf4};
  const unsigned char data_bytes[8] = {0x3f, 0xff, 0x1f, 0xff, 0xff, 0xff, 0xff, 0xf4};

  auto anycast = Anycast::from_prefix(td::Slice("\x98\x32\x17", 3), 24).move_as_ok();
  auto addr = MsgAddressInt::with_standard(anycast, basechainId, make_id(0)).move_as_ok();

  StateInit state_init;
  state_init.split_depth = 23;
  state_init.special = TickTock{false, true};
  auto sub4 = make_cell(sub4_bytes);
  auto sub3 = make_cell(sub3_bytes, {sub4});
  auto sub2 = make_cell(sub2_bytes, {sub3});
  auto sub1 = make_cell(code_bytes, {sub2});
  state_init.code = make_cell(code_bytes, {sub1});
  state_init.data = make_cell(data_bytes);
  CHECK(state_init.set_library(make_cell(code_bytes), true));

  CurrencyCollection balance{100000000000};
  for (td::uint32 i = 1; i <= 6; i++) {
    balance.set_other(i, i * 100);
  }
  balance.set_other(7, 10000100);

  auto storage = AccountStorage::active(0, std::move(balance), std::move(state_init), with_init_code_hash);
  auto account = Account::with_storage(std::move(addr), StorageInfo{123456789, 111}, std::move(storage));
  account.update_storage_stat().ensure();
  return account;
}

void check_round_trip(const Account &account) {
  auto cell = account.serialize().move_as_ok();
  auto restored = Account::unpack_cell(cell).move_as_ok();
  ASSERT_EQ(account, restored);
  ASSERT_EQ(cell->get_hash(), restored.serialize().move_as_ok()->get_hash());
}

bool is_error_code(const td::Status &status, ErrorCode code) {
  return status.is_error() && get_error_code(status) == code;
}

}  // namespace

TEST(Accstate, VarUInteger) {
  vm::CellBuilder cb;
  ASSERT_TRUE(tlb::store_var_uint(cb, 16, 0));
  ASSERT_EQ(4u, cb.size());
  ASSERT_TRUE(tlb::store_var_uint(cb, 16, 0x1234));
  ASSERT_EQ(4u + 4u + 16u, cb.size());
  ASSERT_TRUE(!tlb::store_grams(cb, tlb::grams_limit));
  ASSERT_TRUE(tlb::store_grams(cb, tlb::grams_limit - 1));

  auto cs = cb.as_cellslice();
  td::uint128 x;
  ASSERT_TRUE(tlb::fetch_var_uint(cs, 16, x));
  ASSERT_TRUE(x == 0);
  td::uint64 y;
  ASSERT_TRUE(tlb::fetch_var_uint(cs, 16, y));
  ASSERT_EQ(0x1234u, y);
  // fifteen bytes do not fit into 64 bits
  auto cs2 = cs;
  ASSERT_TRUE(!tlb::fetch_var_uint(cs2, 16, y));
  ASSERT_TRUE(tlb::fetch_grams(cs, x));
  ASSERT_TRUE(x == tlb::grams_limit - 1);
  ASSERT_TRUE(cs.empty());

  // a truncated value
  vm::CellBuilder cb2;
  cb2.store_long(3, 4).store_long(0xff, 8);
  auto cs3 = cb2.as_cellslice();
  ASSERT_TRUE(!tlb::fetch_var_uint(cs3, 16, x));
  ASSERT_EQ("340282366920938463463374607431768211455", tlb::uint128_to_str(~static_cast<td::uint128>(0)));
  ASSERT_EQ("0", tlb::uint128_to_str(0));
}

TEST(Accstate, Currency) {
  CurrencyCollection a{100};
  ASSERT_TRUE(!a.sub(CurrencyCollection{150}));
  ASSERT_TRUE(a == CurrencyCollection{100});
  ASSERT_TRUE(a.sub(CurrencyCollection{60}));
  ASSERT_TRUE(a == CurrencyCollection{40});

  a.set_other(5, 10);
  CurrencyCollection b{0, {{5, 11}}};
  ASSERT_TRUE(!a.has_at_least(b));
  ASSERT_TRUE(!a.sub(b));
  ASSERT_TRUE(a.get_other(5) == 10);
  b.set_other(5, 10);
  ASSERT_TRUE(a.sub(b));
  ASSERT_TRUE(a.extra.empty());
  ASSERT_TRUE(a.get_other(5) == 0);

  CurrencyCollection big{CurrencyCollection::max_grams, {{1, CurrencyCollection::max_extra}}};
  big.add(CurrencyCollection{1, {{1, 1}, {2, 2}}});
  ASSERT_TRUE(big.grams == CurrencyCollection::max_grams);
  ASSERT_TRUE(big.get_other(1) == CurrencyCollection::max_extra);
  ASSERT_TRUE(big.get_other(2) == 2);

  CurrencyCollection over{tlb::grams_limit + 5};
  ASSERT_TRUE(over.grams == CurrencyCollection::max_grams);
  ASSERT_TRUE((CurrencyCollection{tlb::grams_limit, {{3, 1}}}.grams == CurrencyCollection::max_grams));
  over.grams = tlb::grams_limit + 5;
  over.add(CurrencyCollection{1});
  ASSERT_TRUE(over.grams == CurrencyCollection::max_grams);
  vm::CellBuilder over_cb;
  ASSERT_TRUE(over.store(over_cb));

  CurrencyCollection c{12345, {{1, 100}, {7, 10000100}}};
  ASSERT_EQ("12345ng+100.$1+10000100.$7", c.to_str());
  vm::CellBuilder cb;
  ASSERT_TRUE(c.store(cb));
  ASSERT_EQ(1u, cb.size_refs());
  auto cs = cb.as_cellslice();
  auto cs_copy = cs;
  CurrencyCollection d;
  ASSERT_TRUE(d.fetch(cs));
  ASSERT_TRUE(cs.empty_ext());
  ASSERT_EQ(c, d);
  ASSERT_TRUE(CurrencyCollection::skip(cs_copy));
  ASSERT_TRUE(cs_copy.empty_ext());

  cb.reset();
  ASSERT_TRUE(CurrencyCollection{}.store(cb));
  ASSERT_EQ(5u, cb.size());
  ASSERT_EQ(0u, cb.size_refs());
}

TEST(Accstate, Address) {
  MsgAddressInt addr{basechainId, make_id(1)};
  ASSERT_TRUE(!addr.var_form);
  vm::CellBuilder cb;
  ASSERT_TRUE(addr.store(cb));
  ASSERT_EQ(2u + 1u + 8u + 256u, cb.size());
  auto cs = cb.as_cellslice();
  MsgAddressInt restored;
  ASSERT_TRUE(restored.fetch(cs));
  ASSERT_EQ(addr, restored);

  MsgAddressInt far{1000, make_id(2)};
  ASSERT_TRUE(far.var_form);
  cb.reset();
  ASSERT_TRUE(far.store(cb));
  ASSERT_EQ(2u + 1u + 9u + 32u + 256u, cb.size());
  cs = cb.as_cellslice();
  ASSERT_TRUE(restored.fetch(cs));
  ASSERT_EQ(far, restored);
  ASSERT_TRUE(MsgAddressInt::with_standard({}, 1000, make_id(2)).is_error());

  // only 256-bit addr_var addresses are accepted
  cb.reset();
  cb.store_long(3, 2).store_long(0, 1).store_long(255, 9).store_long(0, 32).store_long(0, 64);
  cs = cb.as_cellslice();
  ASSERT_TRUE(!restored.fetch(cs));

  auto anycast = Anycast::from_prefix(td::Slice("\x98\x32\x17", 3), 24).move_as_ok();
  ASSERT_TRUE(Anycast::from_prefix(td::Slice("\x98", 1), 9).is_error());
  ASSERT_TRUE(Anycast::from_prefix(td::Slice("\x98\x32\x17\x00\x00", 5), 31).is_error());
  ASSERT_TRUE(Anycast::from_prefix(td::Slice("\x98", 1), 0).is_error());

  auto with_anycast = MsgAddressInt::with_standard(anycast, masterchainId, make_id(0)).move_as_ok();
  auto key = with_anycast.rewritten();
  ASSERT_EQ(0x983217u, key.cbits().get_uint(24));
  auto id = make_id(0);
  ASSERT_TRUE((key.cbits() + 24).equals(id.cbits() + 24, 232));
  cb.reset();
  ASSERT_TRUE(with_anycast.store(cb));
  ASSERT_EQ(2u + 1u + 5u + 24u + 8u + 256u, cb.size());
  cs = cb.as_cellslice();
  ASSERT_TRUE(restored.fetch(cs));
  ASSERT_EQ(with_anycast, restored);
  ASSERT_EQ(masterchainId, restored.workchain);
}

TEST(Accstate, ShardIdent) {
  ShardIdFull all{basechainId};
  ASSERT_TRUE(all.is_valid());
  ASSERT_EQ(0, all.pfx_len());
  ASSERT_TRUE(all.contains(basechainId, make_id(0xf0).cbits()));
  ASSERT_TRUE(!all.contains(masterchainId, make_id(0xf0).cbits()));

  ShardIdFull left{basechainId, 0x4000000000000000ULL};
  ASSERT_EQ(1, left.pfx_len());
  ASSERT_TRUE(left.contains(basechainId, make_id(0x10).cbits()));
  ASSERT_TRUE(!left.contains(basechainId, make_id(0x90).cbits()));
  ASSERT_EQ("(0,4000000000000000)", left.to_str());

  vm::CellBuilder cb;
  ASSERT_TRUE(left.store(cb));
  ASSERT_EQ(2u + 6u + 32u + 64u, cb.size());
  auto cs = cb.as_cellslice();
  ShardIdFull restored;
  ASSERT_TRUE(restored.fetch(cs));
  ASSERT_EQ(left, restored);
  ASSERT_TRUE(!ShardIdFull{}.is_valid());
}

TEST(Accstate, StorageUsed) {
  ASSERT_TRUE(StorageUsed::with_values_checked(StorageUsed::max_value + 1, 0).is_error());
  ASSERT_TRUE(StorageUsedShort::with_values_checked(0, StorageUsed::max_value + 1).is_error());

  auto used = StorageUsed::with_values_checked(3, 500, make_id(7)).move_as_ok();
  vm::CellBuilder cb;
  ASSERT_TRUE(used.store(cb));
  auto cs = cb.as_cellslice();
  StorageUsed restored;
  ASSERT_TRUE(restored.fetch(cs));
  ASSERT_TRUE(cs.empty());
  ASSERT_EQ(used, restored);

  // extra tag 111 is not a known extension
  cb.reset();
  ASSERT_TRUE(tlb::store_var_uint(cb, 7, 3) && tlb::store_var_uint(cb, 7, 500));
  cb.store_long(7, 3).store_bits(make_id(7).cbits(), 256);
  cs = cb.as_cellslice();
  ASSERT_TRUE(!restored.fetch(cs));
  ASSERT_EQ(used, restored);

  auto shared = make_int_cell(42, {make_int_cell(43)});
  auto used2 = StorageUsed::calculate_for_cell(make_int_cell(1, {shared, shared})).move_as_ok();
  ASSERT_EQ(3u, used2.cells);
  ASSERT_EQ(3u * 64u, used2.bits);
  ASSERT_TRUE(!used2.dict_hash);
  ASSERT_TRUE(StorageUsed::calculate_for_cell(Ref<vm::Cell>{}).is_error());
}

TEST(Accstate, StorageUsedShortAppend) {
  auto shared = make_int_cell(100, {make_int_cell(101)});
  auto first = make_int_cell(1, {shared});
  auto second = make_int_cell(2, {shared});

  StorageUsedShort combined;
  combined.append(first).ensure();
  combined.append(second).ensure();
  ASSERT_EQ(4u, combined.cells());
  ASSERT_EQ(4u * 64u, combined.bits());

  auto a = StorageUsedShort::calculate_for_cell(first).move_as_ok();
  auto b = StorageUsedShort::calculate_for_cell(second).move_as_ok();
  ASSERT_EQ(3u, a.cells());
  ASSERT_TRUE(a.cells() + b.cells() > combined.cells());
  ASSERT_TRUE(a.bits() + b.bits() > combined.bits());

  // a root counted before adds nothing
  combined.append(shared).ensure();
  ASSERT_EQ(4u, combined.cells());

  vm::CellBuilder cb;
  ASSERT_TRUE(combined.store(cb));
  auto cs = cb.as_cellslice();
  StorageUsedShort restored;
  ASSERT_TRUE(restored.fetch(cs));
  ASSERT_EQ(combined, restored);
}

TEST(Accstate, StorageInfo) {
  StorageInfo info{123456789, 111};
  info.used = StorageUsed::with_values_checked(10, 1000).move_as_ok();
  vm::CellBuilder cb;
  ASSERT_TRUE(info.store(cb));
  auto cs = cb.as_cellslice();
  StorageInfo restored;
  ASSERT_TRUE(restored.fetch(cs));
  ASSERT_EQ(info, restored);

  info.due_payment.reset();
  cb.reset();
  ASSERT_TRUE(info.store(cb));
  cs = cb.as_cellslice();
  ASSERT_TRUE(restored.fetch(cs));
  ASSERT_TRUE(!restored.due_payment);
  ASSERT_EQ(info, restored);
}

TEST(Accstate, StateInitLibraries) {
  auto state_init = make_state_init(10);
  auto hash = hash_of(state_init);
  auto lib = make_int_cell(77);
  auto lib_hash = lib->get_hash().as_bitarray();
  ASSERT_TRUE(state_init.set_library(lib, false));
  ASSERT_TRUE(hash != hash_of(state_init));
  ASSERT_TRUE(state_init.get_library(lib_hash).has_value());
  ASSERT_TRUE(!state_init.get_library(lib_hash)->is_public);
  ASSERT_TRUE(state_init.set_library_flag(lib_hash, true));
  ASSERT_TRUE(state_init.get_library(lib_hash)->is_public);
  ASSERT_TRUE(!state_init.set_library_flag(make_id(3), true));

  auto libs = state_init.libraries().move_as_ok();
  ASSERT_EQ(1u, libs.size());
  ASSERT_EQ(lib_hash, libs[0].first);
  ASSERT_EQ(lib->get_hash(), libs[0].second.root->get_hash());

  auto restored = StateInit::unpack_cell(state_init.serialize().move_as_ok()).move_as_ok();
  ASSERT_TRUE(restored == state_init);

  ASSERT_TRUE(state_init.delete_library(lib_hash));
  ASSERT_TRUE(!state_init.delete_library(lib_hash));
  ASSERT_TRUE(state_init.library.is_null());
  ASSERT_EQ(hash, hash_of(state_init));
}

TEST(Accstate, AccountStatusCodes) {
  AccountStatus all[] = {AccountStatus::uninit, AccountStatus::frozen, AccountStatus::active, AccountStatus::nonexist};
  for (int i = 0; i < 4; i++) {
    vm::CellBuilder cb;
    ASSERT_TRUE(store_account_status(cb, all[i]));
    ASSERT_EQ(2u, cb.size());
    auto cs = cb.as_cellslice();
    ASSERT_EQ(static_cast<unsigned long long>(i), cs.prefetch_ulong(2));
    AccountStatus status;
    ASSERT_TRUE(fetch_account_status(cs, status));
    ASSERT_TRUE(status == all[i]);
  }
  ASSERT_STREQ("nonexist", account_status_str(AccountStatus::nonexist));
}

TEST(Accstate, StatusMatchesState) {
  Account none;
  ASSERT_TRUE(none.is_none());
  ASSERT_TRUE(none.status() == AccountStatus::nonexist);
  ASSERT_TRUE(none.state() == nullptr);

  auto state_init = make_state_init(20);
  MsgAddressInt addr{basechainId, hash_of(state_init)};
  auto uninit = Account::uninit(addr, 5, 1000, CurrencyCollection{50}).move_as_ok();
  ASSERT_TRUE(uninit.status() == AccountStatus::uninit);
  ASSERT_TRUE(uninit.state()->is_uninit());

  auto active = Account::active(addr, CurrencyCollection{50}, 1000, state_init, false).move_as_ok();
  ASSERT_TRUE(active.status() == AccountStatus::active);
  ASSERT_TRUE(active.state()->is_active());

  auto frozen = Account::frozen(addr, 5, 1000, hash_of(state_init), 30, CurrencyCollection{50}).move_as_ok();
  ASSERT_TRUE(frozen.status() == AccountStatus::frozen);
  ASSERT_TRUE(frozen.state()->is_frozen());

  ASSERT_TRUE(none.status() != uninit.status() && uninit.status() != active.status() &&
              active.status() != frozen.status() && frozen.status() != none.status());
}

TEST(Accstate, RoundTrip) {
  check_round_trip(Account{});

  auto state_init = make_state_init(30);
  MsgAddressInt addr{basechainId, hash_of(state_init)};
  check_round_trip(Account::with_address(addr));
  check_round_trip(Account::uninit(addr, 5, 1000, CurrencyCollection{50, {{3, 4}}}).move_as_ok());

  auto active = Account::active(addr, CurrencyCollection{50}, 1000, state_init, false).move_as_ok();
  ASSERT_TRUE(active.set_library(make_int_cell(99), true));
  active.update_storage_stat().ensure();
  check_round_trip(active);
  check_round_trip(Account::frozen(addr, 5, 1000, hash_of(state_init), 30, CurrencyCollection{50}).move_as_ok());

  check_round_trip(generate_test_account(false));
  check_round_trip(generate_test_account(true));
}

TEST(Accstate, Layouts) {
  auto original = generate_test_account(false);
  auto cell = original.serialize().move_as_ok();
  ASSERT_EQ(1u, vm::load_cell_slice(cell).prefetch_ulong(1));

  auto extended = generate_test_account(true);
  ASSERT_TRUE(extended.init_code_hash() != nullptr);
  ASSERT_EQ(extended.get_code_hash().value(), *extended.init_code_hash());
  auto ext_cell = extended.serialize().move_as_ok();
  ASSERT_EQ(1u, vm::load_cell_slice(ext_cell).prefetch_ulong(4));

  vm::CellBuilder cb;
  ASSERT_TRUE(extended.store_original_format(cb));
  auto dropped = Account::unpack_cell(cb.finalize()).move_as_ok();
  ASSERT_TRUE(dropped.init_code_hash() == nullptr);
  auto expected = *extended.stuff();
  expected.storage.init_code_hash.reset();
  ASSERT_EQ(Account{expected}, dropped);

  // the extended layout with an absent init code hash decodes to the same account
  const auto *stuff = original.stuff();
  cb.reset();
  ASSERT_TRUE(cb.store_long_bool(1, 4) && stuff->addr.store(cb) && stuff->storage_stat.store(cb) &&
              stuff->storage.store(cb) && cb.store_long_bool(0, 1));
  auto decoded = Account::unpack_cell(cb.finalize()).move_as_ok();
  ASSERT_EQ(original, decoded);
  ASSERT_EQ(cell->get_hash(), decoded.serialize().move_as_ok()->get_hash());

  // explicit none in the extended layout
  cb.reset();
  cb.store_long(0, 4);
  ASSERT_TRUE(Account::unpack_cell(cb.finalize()).move_as_ok().is_none());
}

TEST(Accstate, UnknownTags) {
  vm::CellBuilder cb;
  cb.store_long(0b0010, 4);
  auto r_account = Account::unpack_cell(cb.finalize());
  ASSERT_TRUE(is_error_code(r_account.error(), ErrorCode::malformed));

  cb.reset();
  cb.store_long(0b0111, 4);
  ASSERT_TRUE(Account::unpack_cell(cb.finalize()).is_error());

  // StorageUsed with extra tag 111 inside an account
  auto account = Account::uninit(MsgAddressInt{basechainId, make_id(4)}, 1, 2, CurrencyCollection{3}).move_as_ok();
  const auto *stuff = account.stuff();
  cb.reset();
  ASSERT_TRUE(cb.store_long_bool(1, 1) && stuff->addr.store(cb) &&
              tlb::store_var_uint(cb, 7, stuff->storage_stat.used.cells) &&
              tlb::store_var_uint(cb, 7, stuff->storage_stat.used.bits) && cb.store_long_bool(7, 3) &&
              cb.store_long_bool(stuff->storage_stat.last_paid, 32) && cb.store_long_bool(0, 1) &&
              stuff->storage.store(cb));
  r_account = Account::unpack_cell(cb.finalize());
  ASSERT_TRUE(is_error_code(r_account.error(), ErrorCode::malformed));

  // trailing data after the account
  cb.reset();
  ASSERT_TRUE(account.store(cb) && cb.store_long_bool(1, 1));
  ASSERT_TRUE(Account::unpack_cell(cb.finalize()).is_error());

  // truncated account
  auto cell = account.serialize().move_as_ok();
  auto cs = vm::load_cell_slice(cell);
  cs.only_first(cs.size() - 8);
  ASSERT_TRUE(Account::unpack(cs).is_error());
  ASSERT_TRUE(Account::unpack_cell(Ref<vm::Cell>{}).is_error());
}

TEST(Accstate, ActivationHashGate) {
  auto state_init = make_state_init(40);
  auto other = make_state_init(50);
  MsgAddressInt addr{basechainId, hash_of(state_init)};
  auto account = Account::uninit(addr, 5, 1000, CurrencyCollection{50}).move_as_ok();
  auto before = account;

  auto status = account.try_activate(other, false);
  ASSERT_TRUE(is_error_code(status, ErrorCode::policy_violation));
  ASSERT_EQ(before, account);

  account.try_activate(state_init, true).ensure();
  ASSERT_TRUE(account.status() == AccountStatus::active);
  ASSERT_TRUE(*account.state_init() == state_init);
  ASSERT_EQ(state_init.code->get_hash().as_bitarray(), *account.init_code_hash());

  // activating an active account changes nothing
  auto active = account;
  account.try_activate(other, false).ensure();
  ASSERT_EQ(active, account);

  Account none;
  ASSERT_TRUE(is_error_code(none.try_activate(state_init, false), ErrorCode::precondition));
  ASSERT_TRUE(none.try_freeze().is_ok());
  ASSERT_TRUE(none.is_none());
}

TEST(Accstate, FreezeAndReactivate) {
  auto state_init = make_state_init(60);
  MsgAddressInt addr{basechainId, hash_of(state_init)};
  auto account = Account::active(addr, CurrencyCollection{500}, 1000, state_init, true).move_as_ok();

  account.try_freeze().ensure();
  ASSERT_TRUE(account.status() == AccountStatus::frozen);
  ASSERT_EQ(hash_of(state_init), *account.frozen_hash());
  ASSERT_TRUE(account.get_code().is_null());
  // freezing twice is a no-op
  auto frozen = account;
  account.try_freeze().ensure();
  ASSERT_EQ(frozen, account);
  // only an active account becomes uninit
  account.uninit_account();
  ASSERT_EQ(frozen, account);

  auto status = account.try_activate(make_state_init(61), false);
  ASSERT_TRUE(is_error_code(status, ErrorCode::policy_violation));
  ASSERT_EQ(frozen, account);

  account.try_activate(state_init, false).ensure();
  ASSERT_TRUE(account.status() == AccountStatus::active);
  ASSERT_TRUE(*account.state_init() == state_init);
  ASSERT_TRUE(account.init_code_hash() == nullptr);

  account.uninit_account();
  ASSERT_TRUE(account.status() == AccountStatus::uninit);
  ASSERT_TRUE(account.balance_checked() == CurrencyCollection{500});
  check_round_trip(account);
}

TEST(Accstate, ReactivateDerivesInitCodeHash) {
  auto state_init = make_state_init(70);
  auto code_hash = state_init.code->get_hash().as_bitarray();
  MsgAddressInt addr{basechainId, hash_of(state_init)};

  auto account = Account::active(addr, CurrencyCollection{500}, 1000, state_init, false).move_as_ok();
  account.try_freeze().ensure();
  ASSERT_TRUE(account.init_code_hash() == nullptr);
  auto frozen = account;
  auto status = account.try_activate(make_state_init(71), true);
  ASSERT_TRUE(is_error_code(status, ErrorCode::policy_violation));
  ASSERT_EQ(frozen, account);
  ASSERT_TRUE(account.init_code_hash() == nullptr);

  account.try_activate(state_init, true).ensure();
  ASSERT_TRUE(account.status() == AccountStatus::active);
  ASSERT_TRUE(account.init_code_hash() != nullptr);
  ASSERT_EQ(code_hash, *account.init_code_hash());
  check_round_trip(account);

  // a rejected activation keeps the hash derived earlier
  account.try_freeze().ensure();
  ASSERT_EQ(code_hash, *account.init_code_hash());
  status = account.try_activate(make_state_init(72), true);
  ASSERT_TRUE(is_error_code(status, ErrorCode::policy_violation));
  ASSERT_TRUE(account.status() == AccountStatus::frozen);
  ASSERT_EQ(code_hash, *account.init_code_hash());

  account.try_activate(state_init, true).ensure();
  ASSERT_EQ(code_hash, *account.init_code_hash());
}

TEST(Accstate, Balance) {
  auto account = Account::with_address_and_balance(MsgAddressInt{basechainId, make_id(5)}, CurrencyCollection{100});
  ASSERT_TRUE(!account.sub_funds(CurrencyCollection{150}));
  ASSERT_TRUE(*account.balance() == CurrencyCollection{100});
  ASSERT_TRUE(account.sub_funds(CurrencyCollection{60}));
  ASSERT_TRUE(*account.balance() == CurrencyCollection{40});
  account.add_funds(CurrencyCollection{10, {{2, 5}}});
  ASSERT_EQ("50ng+5.$2", account.balance_checked().to_str());
  account.set_balance(CurrencyCollection{7});
  ASSERT_TRUE(account.balance_checked() == CurrencyCollection{7});

  Account none;
  ASSERT_TRUE(!none.sub_funds(CurrencyCollection{}));
  none.add_funds(CurrencyCollection{10});
  ASSERT_TRUE(none.balance() == nullptr);
  ASSERT_TRUE(none.balance_checked().is_zero());
}

TEST(Accstate, Accessors) {
  auto account = generate_test_account(false);
  ASSERT_EQ(123456789u, account.last_paid());
  ASSERT_TRUE(account.due_payment() == td::uint128{111});
  ASSERT_TRUE(account.get_tick_tock() == (TickTock{false, true}));
  ASSERT_EQ(23, account.split_depth().value());
  ASSERT_EQ(make_id(0), account.get_id().value());
  ASSERT_TRUE(account.balance_checked().get_other(7) == 10000100);
  ASSERT_EQ(0u, account.last_tr_time().value());
  ASSERT_TRUE(account.belongs_to_shard(ShardIdFull{basechainId}).move_as_ok());
  // the anycast prefix 0x98... puts the account into the right half
  ASSERT_TRUE(!account.belongs_to_shard(ShardIdFull{basechainId, 0x4000000000000000ULL}).move_as_ok());
  ASSERT_TRUE(account.belongs_to_shard(ShardIdFull{basechainId, 0xc000000000000000ULL}).move_as_ok());
  ASSERT_TRUE(is_error_code(Account{}.belongs_to_shard(ShardIdFull{basechainId}).move_as_error(),
                            ErrorCode::precondition));

  auto libs = account.libraries().move_as_ok();
  ASSERT_EQ(1u, libs.size());
  ASSERT_TRUE(libs[0].second.is_public);
  ASSERT_TRUE(account.set_library_flag(libs[0].first, false));
  ASSERT_TRUE(!account.libraries().move_as_ok()[0].second.is_public);
  ASSERT_TRUE(account.delete_library(libs[0].first));
  ASSERT_TRUE(account.libraries().move_as_ok().empty());

  auto data = make_int_cell(1234);
  ASSERT_TRUE(account.set_data(data));
  ASSERT_EQ(data->get_hash().as_bitarray(), account.get_data_hash().value());
  auto code = make_int_cell(4321);
  ASSERT_TRUE(account.set_code(code));
  ASSERT_EQ(code->get_hash().as_bitarray(), account.get_code_hash().value());

  account.set_last_paid(5);
  account.set_due_payment({});
  account.set_last_tr_time(77);
  ASSERT_EQ(5u, account.last_paid());
  ASSERT_TRUE(!account.due_payment());
  ASSERT_EQ(77u, account.last_tr_time().value());
  account.update_storage_stat().ensure();
  check_round_trip(account);

  account.try_freeze().ensure();
  ASSERT_TRUE(!account.set_code(code));
  ASSERT_TRUE(!account.set_library(code, true));
  ASSERT_TRUE(!account.get_tick_tock());
}

TEST(Accstate, StorageStatModes) {
  auto chain = make_int_cell(1, {make_int_cell(2, {make_int_cell(3)})});
  StateInit state_init{chain, chain};
  MsgAddressInt addr{basechainId, hash_of(state_init)};
  auto account = Account::active(addr, CurrencyCollection{10}, 0, state_init, false).move_as_ok();

  account.update_storage_stat(StorageStatMode::exact).ensure();
  auto exact = account.storage_info()->used;
  ASSERT_EQ(4u, exact.cells);
  auto storage_bits = account.stuff()->storage.serialize().move_as_ok()->get_tree_bits_count() - 2 * 3 * 64;
  ASSERT_EQ(storage_bits + 3 * 64, exact.bits);

  account.update_storage_stat_fast().ensure();
  auto fast = account.storage_info()->used;
  ASSERT_EQ(7u, fast.cells);
  ASSERT_EQ(storage_bits + 2 * 3 * 64, fast.bits);

  // without shared cells both modes agree
  auto simple = Account::active(MsgAddressInt{basechainId, make_id(9)}, CurrencyCollection{10}, 0,
                                make_state_init(70), false)
                    .move_as_ok();
  auto simple_exact = simple.storage_info()->used;
  simple.update_storage_stat(StorageStatMode::fast).ensure();
  ASSERT_EQ(simple_exact, simple.storage_info()->used);

  Account none;
  none.update_storage_stat().ensure();
}

TEST(Accstate, FromMessage) {
  auto state_init = make_state_init(80);
  IntMsgInfo info;
  info.src = MsgAddressInt{basechainId, make_id(1)};
  info.dest = MsgAddressInt{basechainId, hash_of(state_init)};
  info.created_lt = 100;

  // no value, no account
  ASSERT_TRUE(Account::from_message(InboundMessage{info, state_init}, false).move_as_ok().is_none());

  info.value = CurrencyCollection{1000};
  auto account = Account::from_message(InboundMessage{info, state_init}, true).move_as_ok();
  ASSERT_TRUE(account.status() == AccountStatus::active);
  ASSERT_TRUE(*account.state_init() == state_init);
  ASSERT_EQ(state_init.code->get_hash().as_bitarray(), *account.init_code_hash());
  ASSERT_TRUE(account.balance_checked() == CurrencyCollection{1000});
  ASSERT_EQ(info.dest, *account.get_addr());
  ASSERT_EQ(StorageUsed::calculate_for_cell(account.stuff()->storage.serialize().move_as_ok()).move_as_ok(),
            account.storage_info()->used);

  // the message survives serialization
  auto msg_cell = InboundMessage{info, state_init, make_int_cell(5)}.serialize().move_as_ok();
  auto msg = InboundMessage::unpack_cell(msg_cell).move_as_ok();
  ASSERT_EQ(make_int_cell(5)->get_hash(), msg.body->get_hash());
  ASSERT_EQ(account, Account::from_message(msg, true).move_as_ok());

  // StateInit of another account
  auto wrong = make_state_init(81);
  auto r_account = Account::from_message(InboundMessage{info, wrong}, false);
  ASSERT_TRUE(is_error_code(r_account.error(), ErrorCode::policy_violation));

  // StateInit without code
  StateInit no_code{Ref<vm::Cell>{}, make_int_cell(1)};
  info.dest.address = hash_of(no_code);
  ASSERT_TRUE(Account::from_message(InboundMessage{info, no_code}, false).move_as_ok().is_none());

  // bounceable message without StateInit
  info.dest.address = make_id(3);
  info.bounce = true;
  ASSERT_TRUE(Account::from_message(InboundMessage{info}, false).move_as_ok().is_none());

  info.bounce = false;
  account = Account::from_message(InboundMessage{info}, false).move_as_ok();
  ASSERT_TRUE(account.status() == AccountStatus::uninit);
  ASSERT_TRUE(account.balance_checked() == CurrencyCollection{1000});
  ASSERT_EQ(make_id(3), account.get_id().value());
}

TEST(Accstate, ShardAccount) {
  auto account = generate_test_account(true);
  auto hash = make_id(0x40);
  auto a = ShardAccount::with_params(account, hash, 1000).move_as_ok();
  auto b = ShardAccount::with_params(account, hash, 1000).move_as_ok();
  ASSERT_TRUE(a == b);
  ASSERT_EQ(absl::Hash<ShardAccount>{}(a), absl::Hash<ShardAccount>{}(b));

  b.set_last_trans_lt(1001);
  ASSERT_TRUE(a != b);
  b.set_last_trans_lt(1000);
  b.set_last_trans_hash(make_id(0x41));
  ASSERT_TRUE(a != b);

  ASSERT_EQ(account, a.read_account().move_as_ok());
  account.set_last_tr_time(1000);
  a.write_account(account).ensure();
  ASSERT_EQ(1000u, a.read_account().move_as_ok().last_tr_time().value());

  // replacing the account cell changes equality without reading it
  auto c = ShardAccount::with_params(account, hash, 1000).move_as_ok();
  ASSERT_TRUE(a == c);
  c.set_account_cell(generate_test_account(false).serialize().move_as_ok());
  ASSERT_TRUE(a != c);
  ASSERT_TRUE(absl::Hash<ShardAccount>{}(a) != absl::Hash<ShardAccount>{}(c));
  c.set_account_cell(a.account_cell());
  ASSERT_TRUE(a == c);

  vm::CellBuilder cb;
  ASSERT_TRUE(a.store(cb));
  ASSERT_EQ(256u + 64u, cb.size());
  ASSERT_EQ(1u, cb.size_refs());
  auto cs = cb.as_cellslice();
  ShardAccount restored;
  ASSERT_TRUE(restored.fetch(cs));
  ASSERT_TRUE(restored == a);

  // default ShardAccount holds an empty account
  ShardAccount empty;
  ASSERT_TRUE(empty.read_account().move_as_ok().is_none());
}

TEST(Accstate, ShardAccounts) {
  ShardAccounts accounts;
  ASSERT_TRUE(accounts.is_empty());
  ASSERT_TRUE(accounts.get_total().move_as_ok().balance.is_zero());

  auto first = generate_test_account(false);
  auto second = Account::uninit(MsgAddressInt{basechainId, make_id(0x20)}, 1, 2, CurrencyCollection{5, {{1, 1}}})
                    .move_as_ok();
  accounts.insert(first, make_id(1), 10).ensure();
  accounts.insert(second, make_id(2), 20).ensure();
  ASSERT_TRUE(is_error_code(accounts.insert(Account{}, make_id(3), 30), ErrorCode::precondition));

  auto total = accounts.get_total().move_as_ok();
  ASSERT_EQ(0, total.split_depth);
  ASSERT_TRUE(total.balance.grams == 100000000005);
  ASSERT_TRUE(total.balance.get_other(1) == 101);

  // the first account is keyed by its anycast-rewritten address
  ASSERT_TRUE(!accounts.lookup(make_id(0)).move_as_ok());
  auto found = accounts.lookup(first.get_addr()->rewritten()).move_as_ok();
  ASSERT_TRUE(found.has_value());
  ASSERT_EQ(10u, found->last_trans_lt());
  ASSERT_EQ(first, found->read_account().move_as_ok());

  auto list = accounts.list().move_as_ok();
  ASSERT_EQ(2u, list.size());
  ASSERT_EQ(make_id(0x20), list[0].first);

  ShardState state;
  state.global_id = -239;
  state.shard_id = ShardIdFull{basechainId};
  state.seq_no = 3;
  state.gen_lt = 21;
  state.accounts = accounts;
  auto root = state.serialize().move_as_ok();
  auto restored = ShardState::unpack_cell(root).move_as_ok();
  ASSERT_EQ(-239, restored.global_id);
  ASSERT_EQ(3u, restored.seq_no);
  ASSERT_EQ(accounts.get_root_cell()->get_hash(), restored.accounts.get_root_cell()->get_hash());

  accounts.remove(make_id(0x20)).ensure();
  ASSERT_TRUE(is_error_code(accounts.remove(make_id(0x20)), ErrorCode::not_found));
  ASSERT_TRUE(accounts.get_total().move_as_ok().balance == first.balance_checked());
  ASSERT_TRUE(ShardState::unpack_cell(make_int_cell(0)).is_error());
}
