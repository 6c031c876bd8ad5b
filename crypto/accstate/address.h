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

#include "accstate/accstate-types.h"

#include <optional>

namespace accstate {

// anycast_info$_ depth:(#<= 30) { depth >= 1 } rewrite_pfx:(bits depth) = Anycast;
struct Anycast {
  static constexpr int max_depth = 30;
  int depth{0};
  td::BitArray<32> rewrite_pfx;

  Anycast() = default;
  Anycast(int depth, td::ConstBitPtr pfx);
  static td::Result<Anycast> from_prefix(td::Slice bytes, int depth);

  bool is_valid() const {
    return depth >= 1 && depth <= max_depth;
  }
  bool store(vm::CellBuilder& cb) const;
  bool fetch(vm::CellSlice& cs);
  bool operator==(const Anycast& other) const {
    return depth == other.depth && rewrite_pfx.cbits().equals(other.rewrite_pfx.cbits(), depth);
  }
};

// addr_std$10 anycast:(Maybe Anycast) workchain_id:int8 address:bits256 = MsgAddressInt;
// addr_var$11 anycast:(Maybe Anycast) addr_len:(## 9) workchain_id:int32 address:(bits addr_len) = MsgAddressInt;
struct MsgAddressInt {
  std::optional<Anycast> anycast;
  WorkchainId workchain{basechainId};
  StdSmcAddress address = StdSmcAddress::zero();
  bool var_form{false};

  MsgAddressInt() = default;
  MsgAddressInt(WorkchainId workchain, const StdSmcAddress& address, std::optional<Anycast> anycast = {})
      : anycast(std::move(anycast)), workchain(workchain), address(address), var_form(workchain < -128 || workchain > 127) {
  }
  static td::Result<MsgAddressInt> with_standard(std::optional<Anycast> anycast, WorkchainId workchain,
                                                 const StdSmcAddress& address);

  // the address with its first bits replaced by the anycast rewrite prefix; the key in ShardAccounts
  StdSmcAddress rewritten() const;

  bool store(vm::CellBuilder& cb) const;
  bool fetch(vm::CellSlice& cs);
  bool operator==(const MsgAddressInt& other) const {
    return workchain == other.workchain && address == other.address && anycast == other.anycast &&
           var_form == other.var_form;
  }
  bool operator!=(const MsgAddressInt& other) const {
    return !operator==(other);
  }
  std::string to_str() const;
};

td::StringBuilder& operator<<(td::StringBuilder& sb, const MsgAddressInt& addr);

}  // namespace accstate
