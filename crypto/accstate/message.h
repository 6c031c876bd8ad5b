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
#include "accstate/state-init.h"

#include <optional>

namespace accstate {

// int_msg_info$0 ihr_disabled:Bool bounce:Bool bounced:Bool src:MsgAddressInt dest:MsgAddressInt
//   value:CurrencyCollection ihr_fee:Grams fwd_fee:Grams created_lt:uint64 created_at:uint32 = CommonMsgInfo;
struct IntMsgInfo {
  bool ihr_disabled{true};
  bool bounce{false};
  bool bounced{false};
  MsgAddressInt src;
  MsgAddressInt dest;
  CurrencyCollection value;
  td::uint128 ihr_fee{0};
  td::uint128 fwd_fee{0};
  LogicalTime created_lt{0};
  UnixTime created_at{0};

  bool store(vm::CellBuilder& cb) const;
  bool fetch(vm::CellSlice& cs);
};

// message$_ info:CommonMsgInfo init:(Maybe (Either StateInit ^StateInit)) body:(Either X ^X) = Message X;
// only internal messages are represented
struct InboundMessage {
  IntMsgInfo info;
  std::optional<StateInit> init;
  Ref<vm::Cell> body;

  InboundMessage() = default;
  InboundMessage(IntMsgInfo info, std::optional<StateInit> init = {}, Ref<vm::Cell> body = {})
      : info(std::move(info)), init(std::move(init)), body(std::move(body)) {
  }

  bool store(vm::CellBuilder& cb) const;
  bool fetch(vm::CellSlice& cs);
  td::Result<Ref<vm::Cell>> serialize() const;
  static td::Result<InboundMessage> unpack_cell(Ref<vm::Cell> cell);
};

}  // namespace accstate
