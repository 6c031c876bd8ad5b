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
#include <vector>

namespace accstate {

// tick_tock$_ tick:Bool tock:Bool = TickTock;
struct TickTock {
  bool tick{false};
  bool tock{false};
  bool operator==(const TickTock& other) const {
    return tick == other.tick && tock == other.tock;
  }
};

// simple_lib$_ public:Bool root:^Cell = SimpleLib;
struct SimpleLib {
  bool is_public{false};
  Ref<vm::Cell> root;

  bool store(vm::CellBuilder& cb) const {
    return cb.store_bool_bool(is_public) && cb.store_ref_bool(root);
  }
  bool fetch(vm::CellSlice& cs) {
    return cs.fetch_bool_to(is_public) && cs.fetch_ref_to(root);
  }
};

// _ split_depth:(Maybe (## 5)) special:(Maybe TickTock) code:(Maybe ^Cell) data:(Maybe ^Cell)
//   library:(HashmapE 256 SimpleLib) = StateInit;
class StateInit {
 public:
  std::optional<int> split_depth;
  std::optional<TickTock> special;
  Ref<vm::Cell> code;
  Ref<vm::Cell> data;
  Ref<vm::Cell> library;

  StateInit() = default;
  StateInit(Ref<vm::Cell> code, Ref<vm::Cell> data) : code(std::move(code)), data(std::move(data)) {
  }

  bool store(vm::CellBuilder& cb) const;
  bool fetch(vm::CellSlice& cs);
  td::Result<Ref<vm::Cell>> serialize() const;
  static td::Result<StateInit> unpack_cell(Ref<vm::Cell> cell);
  // representation hash of the serialized StateInit
  td::Result<td::Bits256> hash() const;

  // libraries are keyed by the hash of their root cell
  bool set_library(Ref<vm::Cell> lib_root, bool is_public);
  bool set_library_flag(const td::Bits256& hash, bool is_public);
  bool delete_library(const td::Bits256& hash);
  std::optional<SimpleLib> get_library(const td::Bits256& hash) const;
  td::Result<std::vector<std::pair<td::Bits256, SimpleLib>>> libraries() const;

  bool operator==(const StateInit& other) const;
  bool operator!=(const StateInit& other) const {
    return !operator==(other);
  }
};

td::StringBuilder& operator<<(td::StringBuilder& sb, const StateInit& state_init);

}  // namespace accstate
