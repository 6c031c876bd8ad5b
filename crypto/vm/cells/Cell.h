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

#include "common/refcnt.hpp"
#include "common/bitstring.h"

#include "td/utils/Status.h"

#include "vm/cells/CellHash.h"
#include "vm/cells/CellTraits.h"
#include "vm/cells/CellUsageTree.h"
#include "vm/cells/LevelMask.h"

namespace vm {
using td::Ref;
class DataCell;

class Cell : public CellTraits, public td::CntObject {
 public:
  using LevelMask = vm::LevelMask;
  using Hash = CellHash;

  // A cell seen at effective_level reports the hashes and depths it would have had before pruning
  // above that level.
  struct LoadedCell {
    Ref<DataCell> data_cell;
    td::uint32 effective_level{max_level};
    CellUsageTree::NodePtr tree_node;
  };

  virtual td::Result<LoadedCell> load_cell() const = 0;
  virtual Ref<Cell> virtualize(td::uint32 effective_level) const;
  virtual bool is_virtualized() const {
    return false;
  }
  virtual CellUsageTree::NodePtr get_tree_node() const = 0;
  virtual bool is_loaded() const = 0;

  virtual LevelMask get_level_mask() const = 0;

  // Node and bit totals over every path of the subtree; shared subtrees are counted once per reference.
  virtual td::uint64 get_tree_cell_count() const = 0;
  virtual td::uint64 get_tree_bits_count() const = 0;

  td::uint32 get_level() const {
    return get_level_mask().get_level();
  }

  Hash get_hash(int level = max_level) const {
    return do_get_hash(static_cast<td::uint32>(level));
  }

  int get_depth(int level = max_level) const {
    return do_get_depth(static_cast<td::uint32>(level));
  }

 protected:
  virtual td::uint16 do_get_depth(td::uint32 level) const = 0;
  virtual Hash do_get_hash(td::uint32 level) const = 0;
};

td::StringBuilder& operator<<(td::StringBuilder& sb, const Cell& cell);

}  // namespace vm
