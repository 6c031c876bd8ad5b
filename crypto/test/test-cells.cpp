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
#include "vm/cells/CellBuilder.h"
#include "vm/cells/CellSlice.h"
#include "vm/cells/CellStorageStat.h"
#include "vm/cells/CellUsageTree.h"
#include "vm/cells/MerkleProof.h"
#include "vm/cells/UsageCell.h"
#include "vm/excno.hpp"

#include "td/utils/Random.h"
#include "td/utils/tests.h"

#include <memory>
#include <vector>

using td::Ref;
using namespace vm;

namespace {

Ref<Cell> make_cell(long long value, unsigned bits, std::vector<Ref<Cell>> refs = {}) {
  CellBuilder cb;
  cb.store_long(value, bits);
  for (auto &ref : refs) {
    cb.store_ref(ref);
  }
  return cb.finalize();
}

Ref<Cell> gen_random_tree(td::Random::Xorshift128plus &rnd, int size) {
  std::vector<Ref<Cell>> cells;
  for (int i = 0; i < size; i++) {
    CellBuilder cb;
    int refs = cells.empty() ? 0 : rnd.fast(0, Cell::max_refs);
    for (int j = 0; j < refs; j++) {
      cb.store_ref(cells[rnd.fast(0, static_cast<int>(cells.size()) - 1)]);
    }
    cb.store_long(rnd.fast(0, 1 << 20), rnd.fast(1, 32));
    cells.push_back(cb.finalize());
  }
  return cells.back();
}

bool throws_virt_error(const Ref<Cell> &cell) {
  try {
    load_cell_slice(cell);
  } catch (VmVirtError &) {
    return true;
  }
  return false;
}

}  // namespace

TEST(Cell, HashDependsOnContent) {
  auto a = make_cell(0x1234, 16);
  auto b = make_cell(0x1234, 16);
  auto c = make_cell(0x1234, 17);
  ASSERT_EQ(a->get_hash(), b->get_hash());
  ASSERT_TRUE(a->get_hash() != c->get_hash());

  auto d = make_cell(1, 1, {a});
  auto e = make_cell(1, 1, {c});
  ASSERT_TRUE(d->get_hash() != e->get_hash());
  ASSERT_EQ(0u, d->get_level());
  ASSERT_EQ(1, d->get_depth());
}

TEST(Cell, TreeCounts) {
  auto leaf = make_cell(7, 8);
  auto mid = make_cell(1, 4, {leaf, leaf});
  auto root = make_cell(3, 2, {mid, leaf});

  // precomputed totals count every path
  ASSERT_EQ(5u, root->get_tree_cell_count());
  ASSERT_EQ(2u + 4u + 3 * 8u, root->get_tree_bits_count());

  CellStorageStat stat;
  stat.add_used_storage(root).ensure();
  ASSERT_EQ(3u, stat.cells);
  ASSERT_EQ(2u + 4u + 8u, stat.bits);

  // a second root sharing cells adds only the new ones
  auto other = make_cell(5, 16, {mid});
  stat.add_used_storage(other).ensure();
  ASSERT_EQ(4u, stat.cells);
  ASSERT_EQ(2u + 4u + 8u + 16u, stat.bits);

  stat.clear();
  stat.add_used_storage(other).ensure();
  ASSERT_EQ(3u, stat.cells);
}

TEST(Cell, StorageStatLimits) {
  auto root = make_cell(1, 8, {make_cell(2, 8), make_cell(3, 8)});
  CellStorageStat by_cells{2, 1000};
  ASSERT_TRUE(by_cells.add_used_storage(root).is_error());

  CellStorageStat by_bits{10, 16};
  ASSERT_TRUE(by_bits.add_used_storage(root).is_error());

  CellStorageStat enough{3, 24};
  enough.add_used_storage(root).ensure();
  ASSERT_EQ(3u, enough.cells);

  CellStorageStat null_root;
  ASSERT_TRUE(null_root.add_used_storage(Ref<Cell>{}).is_error());
}

TEST(Cell, UsageTreeAndProof) {
  auto left_leaf = make_cell(11, 8);
  auto left = make_cell(1, 8, {left_leaf});
  auto right = make_cell(2, 8, {make_cell(22, 8, {make_cell(33, 8)})});
  auto root = make_cell(0xabcd, 16, {left, right});

  auto usage_tree = std::make_shared<CellUsageTree>();
  auto usage_root = UsageCell::create(root, usage_tree->root_ptr());
  auto cs = load_cell_slice(usage_root);
  auto cs_left = load_cell_slice(cs.prefetch_ref(0));
  ASSERT_EQ(1u, cs_left.fetch_ulong(8));
  ASSERT_EQ(2u, usage_tree->loaded_count());

  auto proof = MerkleProof::generate(root, usage_tree.get());
  ASSERT_TRUE(proof.not_null());
  ASSERT_EQ(0u, proof->get_level());
  bool is_special = false;
  auto proof_cs = load_cell_slice_special(proof, is_special);
  ASSERT_TRUE(is_special);
  ASSERT_TRUE(proof_cs.special_type() == Cell::SpecialType::MerkleProof);

  auto virt = MerkleProof::virtualize(proof);
  ASSERT_TRUE(virt.not_null());
  ASSERT_EQ(root->get_hash(), virt->get_hash());

  auto vcs = load_cell_slice(virt);
  ASSERT_EQ(0xabcdu, vcs.prefetch_ulong(16));
  auto vleft = load_cell_slice(vcs.prefetch_ref(0));
  ASSERT_EQ(left->get_hash(), vcs.prefetch_ref(0)->get_hash());
  // the leaf below left was never loaded
  ASSERT_EQ(left_leaf->get_hash(), vleft.prefetch_ref()->get_hash());
  ASSERT_TRUE(throws_virt_error(vleft.prefetch_ref()));
  ASSERT_EQ(right->get_hash(), vcs.prefetch_ref(1)->get_hash());
  ASSERT_TRUE(throws_virt_error(vcs.prefetch_ref(1)));

  // proof cell, root, left and the pruned branches in place of its leaf and of right
  CellStorageStat proof_stat;
  proof_stat.add_used_storage(proof).ensure();
  ASSERT_EQ(5u, proof_stat.cells);
  CellStorageStat tree_stat;
  tree_stat.add_used_storage(root).ensure();
  ASSERT_EQ(6u, tree_stat.cells);
}

TEST(Cell, ProofPrunesLeaf) {
  auto leaf = make_cell(7, 8);
  auto kept = make_cell(8, 8, {make_cell(9, 8)});
  auto root = make_cell(1, 8, {leaf, kept});
  auto proof = MerkleProof::generate(root, [&](const Ref<Cell> &cell) { return cell->get_hash() == leaf->get_hash(); });
  ASSERT_TRUE(proof.not_null());
  auto virt = MerkleProof::virtualize(proof);
  ASSERT_TRUE(virt.not_null());
  ASSERT_EQ(root->get_hash(), virt->get_hash());

  auto vcs = load_cell_slice(virt);
  ASSERT_EQ(leaf->get_hash(), vcs.prefetch_ref(0)->get_hash());
  ASSERT_TRUE(throws_virt_error(vcs.prefetch_ref(0)));
  ASSERT_EQ(8u, load_cell_slice(vcs.prefetch_ref(1)).fetch_ulong(8));
}

TEST(Cell, ProofOfWholeTree) {
  td::Random::Xorshift128plus rnd{123};
  for (int t = 0; t < 50; t++) {
    auto root = gen_random_tree(rnd, rnd.fast(1, 100));
    auto proof = MerkleProof::generate(root, [](const Ref<Cell> &) { return false; });
    ASSERT_TRUE(proof.not_null());
    auto virt = MerkleProof::virtualize(proof);
    ASSERT_EQ(root->get_hash(), virt->get_hash());

    CellStorageStat a;
    a.add_used_storage(root).ensure();
    CellStorageStat b;
    b.add_used_storage(virt).ensure();
    ASSERT_EQ(a.cells, b.cells);
    ASSERT_EQ(a.bits, b.bits);
  }
}

TEST(Cell, ProofRejectsGarbage) {
  ASSERT_TRUE(MerkleProof::virtualize(Ref<Cell>{}).is_null());
  ASSERT_TRUE(MerkleProof::virtualize(make_cell(1, 8)).is_null());
  ASSERT_TRUE(MerkleProof::unpack_proof(make_cell(1, 8)).is_error());
}

TEST(Cell, PrunedBranchKeepsHash) {
  auto inner = make_cell(5, 8, {make_cell(6, 8)});
  auto pruned = CellBuilder::create_pruned_branch(inner, 1);
  ASSERT_TRUE(pruned.not_null());
  ASSERT_EQ(1u, pruned->get_level());
  ASSERT_EQ(inner->get_hash(), pruned->get_hash(0));
  ASSERT_TRUE(pruned->get_hash() != inner->get_hash());
}
