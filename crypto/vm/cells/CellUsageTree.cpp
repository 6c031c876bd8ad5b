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
#include "vm/cells/CellUsageTree.h"

#include "td/utils/logging.h"

namespace vm {

bool CellUsageTree::NodePtr::on_load() const {
  auto tree = tree_weak_.lock();
  if (!tree) {
    return false;
  }
  return tree->on_load(node_id_);
}

CellUsageTree::NodePtr CellUsageTree::NodePtr::create_child(unsigned ref_id) const {
  auto tree = tree_weak_.lock();
  if (!tree) {
    return {};
  }
  return {tree_weak_, tree->create_child(node_id_, ref_id)};
}

bool CellUsageTree::NodePtr::is_from_tree(const CellUsageTree* master_tree) const {
  DCHECK(master_tree);
  auto tree = tree_weak_.lock();
  return tree.get() == master_tree;
}

CellUsageTree::NodePtr CellUsageTree::root_ptr() {
  return {shared_from_this(), 1};
}

CellUsageTree::NodeId CellUsageTree::root_id() const {
  return 1;
}

bool CellUsageTree::is_loaded(NodeId node_id) const {
  return node_id != 0 && node_id < nodes_.size() && nodes_[node_id].is_loaded;
}

CellUsageTree::NodeId CellUsageTree::get_child(NodeId node_id, unsigned ref_id) const {
  DCHECK(ref_id < CellTraits::max_refs);
  if (node_id == 0 || node_id >= nodes_.size()) {
    return 0;
  }
  return nodes_[node_id].children[ref_id];
}

std::size_t CellUsageTree::loaded_count() const {
  std::size_t res = 0;
  for (auto& node : nodes_) {
    res += node.is_loaded;
  }
  return res;
}

bool CellUsageTree::on_load(NodeId node_id) {
  CHECK(node_id != 0 && node_id < nodes_.size());
  if (nodes_[node_id].is_loaded) {
    return false;
  }
  nodes_[node_id].is_loaded = true;
  return true;
}

CellUsageTree::NodeId CellUsageTree::create_child(NodeId node_id, unsigned ref_id) {
  CHECK(ref_id < CellTraits::max_refs);
  CHECK(node_id != 0 && node_id < nodes_.size());
  auto res = nodes_[node_id].children[ref_id];
  if (res) {
    return res;
  }
  res = create_node(node_id);
  nodes_[node_id].children[ref_id] = res;
  return res;
}

CellUsageTree::NodeId CellUsageTree::create_node(NodeId parent) {
  auto res = static_cast<NodeId>(nodes_.size());
  nodes_.emplace_back();
  nodes_.back().parent = parent;
  return res;
}

}  // namespace vm
