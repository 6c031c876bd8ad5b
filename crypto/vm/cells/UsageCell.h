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
#include "vm/cells/Cell.h"

namespace vm {

// Marks its node in a CellUsageTree as used whenever the wrapped cell is loaded.
class UsageCell : public Cell {
 private:
  struct PrivateTag {};

 public:
  UsageCell(Ref<Cell> cell, CellUsageTree::NodePtr tree_node, PrivateTag)
      : cell_(std::move(cell)), tree_node_(std::move(tree_node)) {
  }
  static Ref<Cell> create(Ref<Cell> cell, CellUsageTree::NodePtr tree_node) {
    if (tree_node.empty()) {
      return cell;
    }
    return Ref<UsageCell>{true, std::move(cell), std::move(tree_node), PrivateTag{}};
  }

  td::Result<LoadedCell> load_cell() const override {
    TRY_RESULT(loaded_cell, cell_->load_cell());
    tree_node_.on_load();
    CHECK(loaded_cell.tree_node.empty());
    loaded_cell.tree_node = tree_node_;
    return std::move(loaded_cell);
  }

  Ref<Cell> virtualize(td::uint32 effective_level) const override {
    auto virtualized_cell = cell_->virtualize(effective_level);
    if (virtualized_cell.get() == cell_.get()) {
      return Ref<Cell>(this);
    }
    return create(std::move(virtualized_cell), tree_node_);
  }

  bool is_virtualized() const override {
    return cell_->is_virtualized();
  }

  CellUsageTree::NodePtr get_tree_node() const override {
    return tree_node_;
  }

  bool is_loaded() const override {
    return cell_->is_loaded();
  }

  td::uint64 get_tree_cell_count() const override {
    return cell_->get_tree_cell_count();
  }
  td::uint64 get_tree_bits_count() const override {
    return cell_->get_tree_bits_count();
  }

  LevelMask get_level_mask() const override {
    return cell_->get_level_mask();
  }

 protected:
  Hash do_get_hash(td::uint32 level) const override {
    return cell_->get_hash(static_cast<int>(level));
  }
  td::uint16 do_get_depth(td::uint32 level) const override {
    return static_cast<td::uint16>(cell_->get_depth(static_cast<int>(level)));
  }

 private:
  Ref<Cell> cell_;
  CellUsageTree::NodePtr tree_node_;
};

}  // namespace vm
