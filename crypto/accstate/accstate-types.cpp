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
#include "accstate/accstate-types.h"

#include <cstdio>

namespace accstate {

const char* error_code_str(ErrorCode code) {
  switch (code) {
    case ErrorCode::malformed:
      return "malformed";
    case ErrorCode::policy_violation:
      return "policy violation";
    case ErrorCode::not_found:
      return "not found";
    case ErrorCode::precondition:
      return "precondition violation";
  }
  return "unknown";
}

std::string ShardIdFull::to_str() const {
  char buffer[64];
  return std::string{buffer, static_cast<std::size_t>(snprintf(buffer, 63, "(%d,%016llx)", workchain,
                                                               static_cast<unsigned long long>(shard)))};
}

bool ShardIdFull::store(vm::CellBuilder& cb) const {
  int len = pfx_len();
  return is_valid() && len <= max_shard_pfx_len && cb.store_long_bool(0, 2) &&
         cb.store_uint_leq(max_shard_pfx_len, len) && cb.store_long_bool(workchain, 32) &&
         cb.store_long_bool(static_cast<long long>(shard & (shard - 1)), 64);
}

bool ShardIdFull::fetch(vm::CellSlice& cs) {
  int len;
  unsigned long long prefix;
  if (!(cs.fetch_ulong(2) == 0 && cs.fetch_uint_leq(max_shard_pfx_len, len) && cs.fetch_int_to(32, workchain) &&
        cs.fetch_ulong_bool(64, prefix))) {
    return false;
  }
  td::uint64 bit = 1ULL << (63 - len);
  if (prefix & ((bit << 1) - 1)) {
    return false;
  }
  shard = prefix | bit;
  return true;
}

td::StringBuilder& operator<<(td::StringBuilder& sb, const ShardIdFull& shard) {
  return sb << shard.to_str();
}

}  // namespace accstate
