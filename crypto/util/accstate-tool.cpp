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
#include "vm/cells/CellBuilder.h"
#include "vm/excno.hpp"

#include "td/utils/OptionParser.h"
#include "td/utils/Random.h"
#include "td/utils/logging.h"
#include "td/utils/misc.h"

#include <algorithm>
#include <cstdlib>
#include <iostream>
#include <vector>

namespace {

struct ToolOptions {
  int accounts{16};
  td::uint64 seed{1};
  bool derive_init_code_hash{false};
  accstate::StorageStatMode mode{accstate::StorageStatMode::exact};
  int prove_index{0};
};

struct GeneratedAccount {
  accstate::Account account;
  td::Bits256 last_trans_hash;
  accstate::LogicalTime last_trans_lt{0};
};

// code cells shared between all generated accounts, data cells unique to each of them
td::Ref<vm::Cell> make_shared_code(int depth) {
  td::Ref<vm::Cell> code;
  for (int i = 0; i < depth; i++) {
    vm::CellBuilder cb;
    cb.store_long(0xff00 + i, 32);
    if (code.not_null()) {
      cb.store_ref(code);
    }
    code = cb.finalize();
  }
  return code;
}

td::Ref<vm::Cell> make_data(td::Random::Xorshift128plus &rnd, const td::Ref<vm::Cell> &code) {
  vm::CellBuilder cb;
  cb.store_long(static_cast<long long>(rnd()), 64).store_long(rnd.fast(0, 1 << 20), 32);
  if (rnd.fast(0, 1)) {
    // some accounts also keep a reference to the shared code in their data
    cb.store_ref(code);
  }
  return cb.finalize();
}

td::Result<GeneratedAccount> generate_account(td::Random::Xorshift128plus &rnd, const ToolOptions &options,
                                              const td::Ref<vm::Cell> &code, int index) {
  accstate::StateInit state_init{code, make_data(rnd, code)};
  TRY_RESULT(hash, state_init.hash());
  accstate::MsgAddressInt addr{accstate::basechainId, hash};
  accstate::CurrencyCollection balance{static_cast<td::uint128>(rnd.fast64(1, 1000000000000LL))};
  if (rnd.fast(0, 3) == 0) {
    balance.set_other(static_cast<td::uint32>(rnd.fast(1, 7)), static_cast<td::uint128>(rnd.fast(1, 1000)));
  }
  auto last_paid = static_cast<accstate::UnixTime>(1700000000 + rnd.fast(0, 1000000));
  GeneratedAccount res;
  TRY_RESULT_ASSIGN(res.account, accstate::Account::active(addr, std::move(balance), last_paid, state_init,
                                                           options.derive_init_code_hash));
  res.last_trans_lt = 1000 + static_cast<accstate::LogicalTime>(index) * 10;
  res.account.set_last_tr_time(res.last_trans_lt);
  rnd.bytes(res.last_trans_hash.as_slice());
  switch (index % 4) {
    case 1:
      TRY_STATUS(res.account.try_freeze());
      break;
    case 2:
      res.account.uninit_account();
      break;
    default:
      break;
  }
  TRY_STATUS(res.account.update_storage_stat(options.mode));
  return std::move(res);
}

td::Status run(const ToolOptions &options) {
  td::Random::Xorshift128plus rnd{options.seed};
  auto code = make_shared_code(4);
  std::vector<GeneratedAccount> generated;
  accstate::ShardState state;
  state.global_id = -239;
  state.shard_id = accstate::ShardIdFull{accstate::basechainId};
  state.seq_no = 1;
  state.gen_utime = 1700000000;
  for (int i = 0; i < options.accounts; i++) {
    TRY_RESULT(acc, generate_account(rnd, options, code, i));
    TRY_STATUS(state.accounts.insert(acc.account, acc.last_trans_hash, acc.last_trans_lt));
    state.gen_lt = std::max(state.gen_lt, acc.last_trans_lt + 1);
    generated.push_back(std::move(acc));
  }
  LOG(INFO) << "Generated " << generated.size() << " accounts";

  for (const auto &acc : generated) {
    const auto *info = acc.account.storage_info();
    std::cout << acc.account.get_addr()->to_str() << " " << accstate::account_status_str(acc.account.status())
              << " balance=" << acc.account.balance_checked().to_str() << " used=" << info->used.to_str() << "\n";
  }
  TRY_RESULT(total, state.accounts.get_total());
  std::cout << "total balance=" << total.balance.to_str() << "\n";

  TRY_RESULT(state_root, state.serialize());
  LOG(INFO) << "Shard state hash " << state_root->get_hash().to_hex();

  if (options.prove_index < 0 || options.prove_index >= static_cast<int>(generated.size())) {
    return td::Status::Error(PSLICE() << "Account index " << options.prove_index << " is out of range");
  }
  const auto &target = generated[options.prove_index].account;
  TRY_RESULT(proof, target.prepare_proof(state_root));
  TRY_RESULT(proof_stat, accstate::StorageUsed::calculate_for_cell(proof));
  std::cout << "proof for " << target.get_addr()->to_str() << ": " << proof_stat.to_str() << "\n";

  TRY_RESULT(checked, accstate::check_account_proof(proof, state_root->get_hash().as_bitarray(), *target.get_addr()));
  if (checked != target) {
    return td::Status::Error("Account extracted from the proof differs from the original one");
  }
  std::cout << "proof verified against " << state_root->get_hash().to_hex() << "\n";
  return td::Status::OK();
}

}  // namespace

int main(int argc, char *argv[]) {
  SET_VERBOSITY_LEVEL(verbosity_INFO);
  ToolOptions options;

  td::OptionParser p;
  p.set_description(
      "accstate-tool - builds a shard state of generated accounts, prints their storage footprints and checks the "
      "Merkle proof of one of them");
  p.add_checked_option('n', "accounts", "number of generated accounts (default: 16)", [&](td::Slice arg) {
    TRY_RESULT(value, td::to_integer_safe<int>(arg));
    if (value < 1 || value > 100000) {
      return td::Status::Error("<accounts> should be in [1..100000]");
    }
    options.accounts = value;
    return td::Status::OK();
  });
  p.add_checked_option('s', "seed", "random seed (default: 1)", [&](td::Slice arg) {
    TRY_RESULT_ASSIGN(options.seed, td::to_integer_safe<td::uint64>(arg));
    return td::Status::OK();
  });
  p.add_option('c', "init-code-hash", "pin the init code hash of activated accounts",
               [&]() { options.derive_init_code_hash = true; });
  p.add_checked_option('m', "mode", "footprint mode: exact or fast (default: exact)", [&](td::Slice arg) {
    if (arg == "exact") {
      options.mode = accstate::StorageStatMode::exact;
    } else if (arg == "fast") {
      options.mode = accstate::StorageStatMode::fast;
    } else {
      return td::Status::Error(PSLICE() << "Unknown footprint mode '" << arg << "'");
    }
    return td::Status::OK();
  });
  p.add_checked_option('p', "prove", "index of the account to prove (default: 0)", [&](td::Slice arg) {
    TRY_RESULT_ASSIGN(options.prove_index, td::to_integer_safe<int>(arg));
    return td::Status::OK();
  });
  p.add_checked_option('v', "verbosity", "set verbosity level", [&](td::Slice arg) {
    TRY_RESULT(value, td::to_integer_safe<int>(arg));
    SET_VERBOSITY_LEVEL(VERBOSITY_NAME(FATAL) + value);
    return td::Status::OK();
  });
  p.add_option('h', "help", "print help", [&]() {
    std::cerr << (PSTRING() << p);
    std::exit(2);
  });

  auto r_args = p.run(argc, argv, 0);
  if (r_args.is_error()) {
    std::cerr << r_args.error().message().str() << "\n";
    std::cerr << (PSTRING() << p);
    return 2;
  }

  td::Status status;
  try {
    status = run(options);
  } catch (vm::VmError &e) {
    LOG(FATAL) << "VM error: " << e.get_msg();
  } catch (vm::VmVirtError &e) {
    LOG(FATAL) << "VM error: " << e.get_msg();
  }
  if (status.is_error()) {
    LOG(ERROR) << status;
    return 1;
  }
  return 0;
}
