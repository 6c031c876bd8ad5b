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
#include "accstate/state-init.h"
#include "accstate/tlb-util.h"

#include "vm/dict.h"

#include "td/utils/logging.h"

namespace accstate {

namespace {

bool same_cell(const Ref<vm::Cell>& a, const Ref<vm::Cell>& b) {
  if (a.is_null() || b.is_null()) {
    return a.is_null() == b.is_null();
  }
  return a->get_hash() == b->get_hash();
}

}  // namespace

bool StateInit::store(vm::CellBuilder& cb) const {
  if (split_depth) {
    if (!(cb.store_long_bool(1, 1) && cb.store_ulong_rchk_bool(*split_depth, 5))) {
      return false;
    }
  } else if (!cb.store_long_bool(0, 1)) {
    return false;
  }
  if (special) {
    if (!(cb.store_long_bool(1, 1) && cb.store_bool_bool(special->tick) && cb.store_bool_bool(special->tock))) {
      return false;
    }
  } else if (!cb.store_long_bool(0, 1)) {
    return false;
  }
  return cb.store_maybe_ref(code) && cb.store_maybe_ref(data) && cb.store_maybe_ref(library);
}

bool StateInit::fetch(vm::CellSlice& cs) {
  bool have;
  std::optional<int> new_split_depth;
  std::optional<TickTock> new_special;
  if (!cs.fetch_bool_to(have)) {
    return false;
  }
  if (have) {
    int depth;
    if (!cs.fetch_uint_to(5, depth)) {
      return false;
    }
    new_split_depth = depth;
  }
  if (!cs.fetch_bool_to(have)) {
    return false;
  }
  if (have) {
    TickTock tt;
    if (!(cs.fetch_bool_to(tt.tick) && cs.fetch_bool_to(tt.tock))) {
      return false;
    }
    new_special = tt;
  }
  Ref<vm::Cell> new_code, new_data, new_library;
  if (!(cs.fetch_maybe_ref(new_code) && cs.fetch_maybe_ref(new_data) && cs.fetch_maybe_ref(new_library))) {
    return false;
  }
  split_depth = new_split_depth;
  special = new_special;
  code = std::move(new_code);
  data = std::move(new_data);
  library = std::move(new_library);
  return true;
}

td::Result<Ref<vm::Cell>> StateInit::serialize() const {
  return tlb::pack_cell(*this, "StateInit");
}

td::Result<StateInit> StateInit::unpack_cell(Ref<vm::Cell> cell) {
  try {
    auto cs = vm::load_cell_slice(std::move(cell));
    StateInit res;
    if (!res.fetch(cs) || !cs.empty_ext()) {
      return make_error(ErrorCode::malformed, "cannot unpack StateInit");
    }
    return std::move(res);
  } catch (vm::VmError& err) {
    return make_error(ErrorCode::malformed, PSLICE() << "cannot unpack StateInit: " << err.get_msg());
  } catch (vm::VmVirtError&) {
    return make_error(ErrorCode::malformed, "cannot unpack StateInit: pruned branch");
  }
}

td::Result<td::Bits256> StateInit::hash() const {
  TRY_RESULT(cell, serialize());
  return cell->get_hash().as_bitarray();
}

bool StateInit::set_library(Ref<vm::Cell> lib_root, bool is_public) {
  if (lib_root.is_null()) {
    return false;
  }
  auto key = lib_root->get_hash().as_bitarray();
  vm::CellBuilder cb;
  SimpleLib lib{is_public, std::move(lib_root)};
  vm::Dictionary dict{library, 256};
  if (!lib.store(cb) || !dict.set_builder(key.cbits(), 256, cb)) {
    return false;
  }
  library = dict.get_root_cell();
  return true;
}

bool StateInit::set_library_flag(const td::Bits256& hash, bool is_public) {
  auto lib = get_library(hash);
  if (!lib) {
    return false;
  }
  if (lib->is_public == is_public) {
    return true;
  }
  lib->is_public = is_public;
  vm::CellBuilder cb;
  vm::Dictionary dict{library, 256};
  if (!lib->store(cb) || !dict.set_builder(hash.cbits(), 256, cb, vm::Dictionary::SetMode::Replace)) {
    return false;
  }
  library = dict.get_root_cell();
  return true;
}

bool StateInit::delete_library(const td::Bits256& hash) {
  vm::Dictionary dict{library, 256};
  if (dict.lookup_delete(hash.cbits(), 256).is_null()) {
    return false;
  }
  library = dict.get_root_cell();
  return true;
}

std::optional<SimpleLib> StateInit::get_library(const td::Bits256& hash) const {
  vm::Dictionary dict{library, 256};
  auto cs = dict.lookup(hash);
  SimpleLib lib;
  if (cs.is_null() || !lib.fetch(cs.write()) || !cs->empty_ext()) {
    return {};
  }
  return lib;
}

td::Result<std::vector<std::pair<td::Bits256, SimpleLib>>> StateInit::libraries() const {
  std::vector<std::pair<td::Bits256, SimpleLib>> res;
  vm::Dictionary dict{library, 256};
  bool ok = dict.check_for_each([&res](Ref<vm::CellSlice> cs, td::ConstBitPtr key, int n) {
    SimpleLib lib;
    if (!lib.fetch(cs.write()) || !cs->empty_ext()) {
      return false;
    }
    res.emplace_back(td::Bits256{key}, std::move(lib));
    return true;
  });
  if (!ok) {
    return make_error(ErrorCode::malformed, "invalid library collection in StateInit");
  }
  return std::move(res);
}

bool StateInit::operator==(const StateInit& other) const {
  return split_depth == other.split_depth && special == other.special && same_cell(code, other.code) &&
         same_cell(data, other.data) && same_cell(library, other.library);
}

td::StringBuilder& operator<<(td::StringBuilder& sb, const StateInit& state_init) {
  sb << "StateInit{";
  if (state_init.split_depth) {
    sb << "split_depth=" << *state_init.split_depth << " ";
  }
  if (state_init.special) {
    sb << "tick=" << state_init.special->tick << " tock=" << state_init.special->tock << " ";
  }
  sb << "code=" << (state_init.code.not_null() ? state_init.code->get_hash().to_hex() : std::string{"none"});
  sb << " data=" << (state_init.data.not_null() ? state_init.data->get_hash().to_hex() : std::string{"none"});
  return sb << " libs=" << (state_init.library.not_null() ? "yes" : "no") << "}";
}

}  // namespace accstate
