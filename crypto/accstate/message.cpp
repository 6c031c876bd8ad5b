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
#include "accstate/message.h"

#include "td/utils/logging.h"

namespace accstate {

bool IntMsgInfo::store(vm::CellBuilder& cb) const {
  return cb.store_long_bool(0, 1) && cb.store_bool_bool(ihr_disabled) && cb.store_bool_bool(bounce) &&
         cb.store_bool_bool(bounced) && src.store(cb) && dest.store(cb) && value.store(cb) &&
         tlb::store_grams(cb, ihr_fee) && tlb::store_grams(cb, fwd_fee) &&
         cb.store_long_bool(static_cast<long long>(created_lt), 64) && cb.store_long_bool(created_at, 32);
}

bool IntMsgInfo::fetch(vm::CellSlice& cs) {
  return cs.fetch_ulong(1) == 0 && cs.fetch_bool_to(ihr_disabled) && cs.fetch_bool_to(bounce) &&
         cs.fetch_bool_to(bounced) && src.fetch(cs) && dest.fetch(cs) && value.fetch(cs) &&
         tlb::fetch_grams(cs, ihr_fee) && tlb::fetch_grams(cs, fwd_fee) && cs.fetch_uint_to(64, created_lt) &&
         cs.fetch_uint_to(32, created_at);
}

bool InboundMessage::store(vm::CellBuilder& cb) const {
  if (!info.store(cb)) {
    return false;
  }
  if (init) {
    // the StateInit always goes into a separate cell
    vm::CellBuilder cb2;
    Ref<vm::Cell> init_cell;
    if (!(init->store(cb2) && cb2.finalize_to(init_cell) && cb.store_long_bool(3, 2) &&
          cb.store_ref_bool(std::move(init_cell)))) {
      return false;
    }
  } else if (!cb.store_long_bool(0, 1)) {
    return false;
  }
  if (body.is_null()) {
    return cb.store_long_bool(0, 1);
  }
  return cb.store_long_bool(1, 1) && cb.store_ref_bool(body);
}

bool InboundMessage::fetch(vm::CellSlice& cs) {
  bool have_init;
  if (!info.fetch(cs) || !cs.fetch_bool_to(have_init)) {
    return false;
  }
  init.reset();
  if (have_init) {
    bool in_ref;
    StateInit state_init;
    if (!cs.fetch_bool_to(in_ref)) {
      return false;
    }
    if (in_ref) {
      auto init_cell = cs.fetch_ref();
      if (init_cell.is_null()) {
        return false;
      }
      auto init_cs = vm::load_cell_slice(std::move(init_cell));
      if (!state_init.fetch(init_cs) || !init_cs.empty_ext()) {
        return false;
      }
    } else if (!state_init.fetch(cs)) {
      return false;
    }
    init = std::move(state_init);
  }
  bool body_in_ref;
  if (!cs.fetch_bool_to(body_in_ref)) {
    return false;
  }
  if (body_in_ref) {
    return cs.fetch_ref_to(body);
  }
  vm::CellBuilder cb;
  if (!cb.append_cellslice_bool(cs)) {
    return false;
  }
  auto r_body = cb.finalize_novm_nothrow();
  if (r_body.is_error()) {
    LOG(DEBUG) << "cannot rebuild inline message body: " << r_body.error();
    return false;
  }
  body = r_body.move_as_ok();
  return cs.advance_ext(cs.size_ext());
}

td::Result<Ref<vm::Cell>> InboundMessage::serialize() const {
  return tlb::pack_cell(*this, "Message");
}

td::Result<InboundMessage> InboundMessage::unpack_cell(Ref<vm::Cell> cell) {
  try {
    auto cs = vm::load_cell_slice(std::move(cell));
    InboundMessage msg;
    if (!msg.fetch(cs) || !cs.empty_ext()) {
      return make_error(ErrorCode::malformed, "cannot unpack internal message");
    }
    return std::move(msg);
  } catch (vm::VmError& err) {
    return make_error(ErrorCode::malformed, PSLICE() << "cannot unpack internal message: " << err.get_msg());
  } catch (vm::VmVirtError&) {
    return make_error(ErrorCode::malformed, "cannot unpack internal message: pruned branch");
  }
}

}  // namespace accstate
