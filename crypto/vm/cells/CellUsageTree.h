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

#include "vm/cells/CellTraits.h"

#include <array>
#include <memory>
#include <vector>

namespace vm {

// Records which nodes of a tree were loaded while walking it through UsageCell wrappers.
class CellUsageTree : public std::enable_shared_from_this<CellUsageTree> {
 public:
  using NodeId = td::uint32;

  struct NodePtr {
   public:
    NodePtr() = default;
    NodePtr(std::weak_ptr<CellUsageTree> tree_weak, NodeId node_id)
        : tree_weak_(std::move(tree_weak)), node_id_(node_id) {
    }
    bool empty() const {
      return node_id_ == 0 || tree_weak_.expired();
    }

    NodeId node_id() const {
      return node_id_;
    }

    // returns true if the node was loaded for the first time
    bool on_load() const;
    NodePtr create_child(unsigned ref_id) const;
    bool is_from_tree(const CellUsageTree* master_tree) const;

   private:
    std::weak_ptr<CellUsageTree> tree_weak_;
    NodeId node_id_{0};
  };

  NodePtr root_ptr();
  NodeId root_id() const;
  bool is_loaded(NodeId node_id) const;
  NodeId get_child(NodeId node_id, unsigned ref_id) const;
  std::size_t loaded_count() const;

 private:
  struct Node {
    bool is_loaded{false};
    std::array<NodeId, CellTraits::max_refs> children{};
    NodeId parent{0};
  };
  // node 0 is a sentinel, node 1 is the root
  std::vector<Node> nodes_{2};

  bool on_load(NodeId node_id);
  NodeId create_child(NodeId node_id, unsigned ref_id);
  NodeId create_node(NodeId parent);
};

}  // namespace vm
