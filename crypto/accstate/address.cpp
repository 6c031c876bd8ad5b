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
#include "accstate/address.h"

#include "td/utils/logging.h"

namespace accstate {

Anycast::Anycast(int depth, td::ConstBitPtr pfx) : depth(depth) {
  rewrite_pfx.set_zero();
  rewrite_pfx.bits().copy_from(pfx, depth);
}

td::Result<Anycast> Anycast::from_prefix(td::Slice bytes, int depth) {
  if (depth < 1 || depth > max_depth || static_cast<std::size_t>(depth) > bytes.size() * 8) {
    return make_error(ErrorCode::malformed, PSLICE() << "invalid anycast depth " << depth);
  }
  return Anycast{depth, td::ConstBitPtr{bytes.ubegin()}};
}

bool Anycast::store(vm::CellBuilder& cb) const {
  return is_valid() && cb.store_uint_leq(max_depth, depth) && cb.store_bits_bool(rewrite_pfx.cbits(), depth);
}

bool Anycast::fetch(vm::CellSlice& cs) {
  rewrite_pfx.set_zero();
  return cs.fetch_uint_leq(max_depth, depth) && depth >= 1 && cs.fetch_bits_to(rewrite_pfx.bits(), depth);
}

td::Result<MsgAddressInt> MsgAddressInt::with_standard(std::optional<Anycast> anycast, WorkchainId workchain,
                                                       const StdSmcAddress& address) {
  if (workchain < -128 || workchain > 127) {
    return make_error(ErrorCode::malformed, PSLICE() << "workchain " << workchain << " does not fit into addr_std");
  }
  if (anycast && !anycast->is_valid()) {
    return make_error(ErrorCode::malformed, "invalid anycast info");
  }
  return MsgAddressInt{workchain, address, std::move(anycast)};
}

StdSmcAddress MsgAddressInt::rewritten() const {
  StdSmcAddress res = address;
  if (anycast) {
    res.bits().copy_from(anycast->rewrite_pfx.cbits(), anycast->depth);
  }
  return res;
}

bool MsgAddressInt::store(vm::CellBuilder& cb) const {
  if (!cb.store_long_bool(var_form ? 3 : 2, 2)) {
    return false;
  }
  if (anycast) {
    if (!(cb.store_long_bool(1, 1) && anycast->store(cb))) {
      return false;
    }
  } else if (!cb.store_long_bool(0, 1)) {
    return false;
  }
  if (var_form) {
    return cb.store_long_bool(256, 9) && cb.store_long_bool(workchain, 32) && cb.store_bits_bool(address);
  }
  return workchain >= -128 && workchain <= 127 && cb.store_long_bool(workchain, 8) && cb.store_bits_bool(address);
}

bool MsgAddressInt::fetch(vm::CellSlice& cs) {
  int tag;
  bool have_anycast;
  if (!cs.fetch_uint_to(2, tag) || tag < 2 || !cs.fetch_bool_to(have_anycast)) {
    return false;
  }
  std::optional<Anycast> new_anycast;
  if (have_anycast) {
    Anycast info;
    if (!info.fetch(cs)) {
      return false;
    }
    new_anycast = info;
  }
  WorkchainId wc;
  if (tag == 3) {
    int len;
    if (!cs.fetch_uint_to(9, len) || !cs.fetch_int_to(32, wc)) {
      return false;
    }
    if (len != 256) {
      LOG(DEBUG) << "addr_var with address length " << len << " is not supported";
      return false;
    }
  } else if (!cs.fetch_int_to(8, wc)) {
    return false;
  }
  if (!cs.fetch_bits_to(address)) {
    return false;
  }
  anycast = std::move(new_anycast);
  workchain = wc;
  var_form = (tag == 3);
  return true;
}

std::string MsgAddressInt::to_str() const {
  td::StringBuilder sb;
  sb << workchain << ":" << address.to_hex();
  if (anycast) {
    sb << " (anycast " << anycast->depth << ":" << anycast->rewrite_pfx.cbits().to_hex(anycast->depth) << ")";
  }
  return sb.as_string();
}

td::StringBuilder& operator<<(td::StringBuilder& sb, const MsgAddressInt& addr) {
  return sb << addr.to_str();
}

}  // namespace accstate
