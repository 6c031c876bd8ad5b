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

#include "common/bitstring.h"
#include "common/refcnt.hpp"
#include "vm/cells/CellBuilder.h"
#include "vm/cells/CellSlice.h"

#include "td/utils/Status.h"
#include "td/utils/StringBuilder.h"
#include "td/utils/bits.h"
#include "td/utils/common.h"

namespace accstate {
using td::Ref;

using WorkchainId = td::int32;
using LogicalTime = td::uint64;
using UnixTime = td::uint32;
using StdSmcAddress = td::Bits256;
using ShardId = td::uint64;

constexpr WorkchainId workchainInvalid = static_cast<WorkchainId>(0x80000000);
constexpr WorkchainId basechainId = 0;
constexpr WorkchainId masterchainId = -1;
constexpr ShardId shardIdAll = (1ULL << 63);
constexpr int max_shard_pfx_len = 60;

enum class ErrorCode : int { malformed = 1, policy_violation = 2, not_found = 3, precondition = 4 };

inline td::Status make_error(ErrorCode code, td::Slice message) {
  return td::Status::Error(static_cast<int>(code), message);
}

inline ErrorCode get_error_code(const td::Status& status) {
  switch (status.code()) {
    case static_cast<int>(ErrorCode::policy_violation):
      return ErrorCode::policy_violation;
    case static_cast<int>(ErrorCode::not_found):
      return ErrorCode::not_found;
    case static_cast<int>(ErrorCode::precondition):
      return ErrorCode::precondition;
    default:
      return ErrorCode::malformed;
  }
}

const char* error_code_str(ErrorCode code);

// exact recomputes the deduplicated footprint; fast uses the precomputed tree totals of the root cell
enum class StorageStatMode { exact, fast };

inline td::uint64 lower_bit64(td::uint64 x) {
  return x & (~x + 1);
}

struct ShardIdFull {
  WorkchainId workchain{workchainInvalid};
  ShardId shard{0};
  ShardIdFull() = default;
  explicit ShardIdFull(WorkchainId workchain, ShardId shard = shardIdAll) : workchain(workchain), shard(shard) {
  }
  bool is_valid() const {
    return workchain != workchainInvalid && shard != 0;
  }
  int pfx_len() const {
    return shard ? 63 - td::count_trailing_zeroes64(shard) : 0;
  }
  bool contains(WorkchainId wc, td::ConstBitPtr addr) const {
    return wc == workchain && !((addr.get_uint(64) ^ shard) & ((~lower_bit64(shard) + 1) << 1));
  }
  bool operator==(const ShardIdFull& other) const {
    return workchain == other.workchain && shard == other.shard;
  }
  bool operator!=(const ShardIdFull& other) const {
    return !operator==(other);
  }
  std::string to_str() const;

  // shard_ident$00 shard_pfx_bits:(#<= 60) workchain_id:int32 shard_prefix:uint64 = ShardIdent;
  bool store(vm::CellBuilder& cb) const;
  bool fetch(vm::CellSlice& cs);
};

td::StringBuilder& operator<<(td::StringBuilder& sb, const ShardIdFull& shard);

}  // namespace accstate
