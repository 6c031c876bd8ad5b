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
#include "vm/dict.h"
#include "vm/excno.hpp"

#include "td/utils/Random.h"
#include "td/utils/tests.h"

#include <map>

using td::Ref;
using namespace vm;

namespace {

// extra of every subtree is the sum of its 32-bit values
struct SumAug final : dict::AugmentationData {
  bool skip_extra(CellSlice &cs) const override {
    return cs.advance(32);
  }
  bool eval_leaf(CellBuilder &cb, CellSlice &val) const override {
    unsigned long long x;
    return val.prefetch_ulong_bool(32, x) && cb.store_long_bool(x, 32);
  }
  bool eval_fork(CellBuilder &cb, CellSlice &left, CellSlice &right) const override {
    unsigned long long x, y;
    return left.fetch_ulong_bool(32, x) && right.fetch_ulong_bool(32, y) && cb.store_long_bool((x + y) & 0xffffffff, 32);
  }
  bool eval_empty(CellBuilder &cb) const override {
    return cb.store_long_bool(0, 32);
  }
};

const SumAug sum_aug{};

td::BitArray<32> key32(td::uint32 x) {
  td::BitArray<32> key;
  key.bits().store_uint(x, 32);
  return key;
}

CellBuilder value32(td::uint32 x) {
  CellBuilder cb;
  cb.store_long(x, 32);
  return cb;
}

unsigned long long extra_value(const Ref<CellSlice> &cs) {
  CHECK(cs.not_null());
  return cs->prefetch_ulong(32);
}

}  // namespace

TEST(Dict, Labels) {
  td::BitArray<256> label;
  CellBuilder cb;

  // four ones: hml_short is the shortest encoding
  label.bits().fill(true, 4);
  ASSERT_TRUE(dict::store_label(cb, label.cbits(), 4, 256));
  ASSERT_EQ(10u, cb.size());

  // 32 equal bits: hml_same
  cb.reset();
  label.bits().fill(true, 32);
  ASSERT_TRUE(dict::store_label(cb, label.cbits(), 32, 256));
  ASSERT_EQ(12u, cb.size());

  // 20 mixed bits: hml_long
  cb.reset();
  for (int i = 0; i < 20; i++) {
    label.bits().set_bit(i, i % 3 == 0);
  }
  ASSERT_TRUE(dict::store_label(cb, label.cbits(), 20, 256));
  ASSERT_EQ(31u, cb.size());

  auto cs = cb.as_cellslice();
  td::BitArray<256> parsed;
  ASSERT_EQ(20, dict::parse_label(cs, parsed.bits(), 256));
  ASSERT_TRUE(parsed.cbits().equals(label.cbits(), 20));
  ASSERT_TRUE(cs.empty());

  ASSERT_TRUE(!dict::store_label(cb, label.cbits(), 257, 256));

  // a label longer than the remaining key is rejected
  cb.reset();
  cb.store_long(0b0111110, 7);
  auto cs2 = cb.as_cellslice();
  ASSERT_EQ(-1, dict::parse_label(cs2, parsed.bits(), 4));
}

TEST(Dict, SetLookupDelete) {
  Dictionary dict{32};
  ASSERT_TRUE(dict.is_empty());
  ASSERT_TRUE(dict.lookup(key32(1)).is_null());

  td::Random::Xorshift128plus rnd{123};
  std::map<td::uint32, td::uint32> expected;
  for (int i = 0; i < 300; i++) {
    auto k = static_cast<td::uint32>(rnd.fast(0, 1000));
    auto v = static_cast<td::uint32>(rnd());
    ASSERT_TRUE(dict.set_builder(key32(k).cbits(), 32, value32(v)));
    expected[k] = v;
  }
  for (td::uint32 k = 0; k <= 1000; k++) {
    auto cs = dict.lookup(key32(k));
    auto it = expected.find(k);
    if (it == expected.end()) {
      ASSERT_TRUE(cs.is_null());
    } else {
      ASSERT_TRUE(cs.not_null());
      ASSERT_EQ(it->second, cs->prefetch_ulong(32));
    }
  }

  // the same contents built in another order give the same root
  Dictionary dict2{32};
  for (auto it = expected.rbegin(); it != expected.rend(); ++it) {
    ASSERT_TRUE(dict2.set_builder(key32(it->first).cbits(), 32, value32(it->second)));
  }
  ASSERT_EQ(dict.get_root_cell()->get_hash(), dict2.get_root_cell()->get_hash());

  td::uint32 prev = 0;
  std::size_t visited = 0;
  ASSERT_TRUE(dict.check_for_each([&](Ref<CellSlice> value, td::ConstBitPtr key, int n) {
    CHECK(n == 32);
    auto k = static_cast<td::uint32>(key.get_uint(32));
    CHECK(visited == 0 || k > prev);
    CHECK(expected.at(k) == value->prefetch_ulong(32));
    prev = k;
    visited++;
    return true;
  }));
  ASSERT_EQ(expected.size(), visited);

  for (auto it = expected.begin(); it != expected.end();) {
    auto removed = dict.lookup_delete(key32(it->first).cbits(), 32);
    ASSERT_TRUE(removed.not_null());
    ASSERT_EQ(it->second, removed->prefetch_ulong(32));
    ASSERT_TRUE(dict.lookup(key32(it->first)).is_null());
    it = expected.erase(it);
    if (it != expected.end()) {
      ++it;
    }
  }
  ASSERT_TRUE(dict.lookup_delete(key32(5000).cbits(), 32).is_null());

  // deleting keys leaves the canonical tree of the remaining ones
  Dictionary dict3{32};
  for (auto &kv : expected) {
    ASSERT_TRUE(dict3.set_builder(key32(kv.first).cbits(), 32, value32(kv.second)));
  }
  ASSERT_EQ(dict.get_root_cell()->get_hash(), dict3.get_root_cell()->get_hash());

  for (auto &kv : expected) {
    ASSERT_TRUE(dict.lookup_delete(key32(kv.first).cbits(), 32).not_null());
  }
  ASSERT_TRUE(dict.is_empty());
}

TEST(Dict, SetModes) {
  Dictionary dict{32};
  ASSERT_TRUE(!dict.set_builder(key32(7).cbits(), 32, value32(1), Dictionary::SetMode::Replace));
  ASSERT_TRUE(dict.set_builder(key32(7).cbits(), 32, value32(1), Dictionary::SetMode::Add));
  ASSERT_TRUE(!dict.set_builder(key32(7).cbits(), 32, value32(2), Dictionary::SetMode::Add));
  ASSERT_EQ(1u, dict.lookup(key32(7))->prefetch_ulong(32));
  ASSERT_TRUE(dict.set_builder(key32(7).cbits(), 32, value32(2), Dictionary::SetMode::Replace));
  ASSERT_EQ(2u, dict.lookup(key32(7))->prefetch_ulong(32));
  ASSERT_TRUE(!dict.set_builder(key32(8).cbits(), 32, value32(3), Dictionary::SetMode::Replace));
  ASSERT_TRUE(dict.lookup(key32(8)).is_null());

  // wrong key length
  ASSERT_TRUE(!dict.set_builder(key32(9).cbits(), 31, value32(3)));
  ASSERT_TRUE(dict.lookup(key32(7).cbits(), 31).is_null());

  auto code = value32(0xdead).finalize();
  ASSERT_TRUE(dict.set_ref(key32(9).cbits(), 32, code));
  ASSERT_EQ(code->get_hash(), dict.lookup_ref(key32(9).cbits(), 32)->get_hash());
  ASSERT_TRUE(dict.lookup_ref(key32(7).cbits(), 32).is_null());
}

TEST(Dict, Serialization) {
  Dictionary dict{32};
  CellBuilder cb;
  ASSERT_TRUE(dict.append_dict_to_bool(cb));
  ASSERT_EQ(1u, cb.size());
  ASSERT_EQ(0u, cb.size_refs());

  ASSERT_TRUE(dict.set_builder(key32(1).cbits(), 32, value32(10)));
  cb.reset();
  ASSERT_TRUE(dict.append_dict_to_bool(cb));
  auto cs = cb.as_cellslice();
  Dictionary restored{32};
  ASSERT_TRUE(restored.fetch_from(cs));
  ASSERT_TRUE(cs.empty_ext());
  ASSERT_EQ(10u, restored.lookup(key32(1))->prefetch_ulong(32));
}

TEST(Dict, Augmented) {
  AugmentedDictionary dict{32, sum_aug};
  ASSERT_EQ(0u, extra_value(dict.get_root_extra()));

  td::Random::Xorshift128plus rnd{321};
  std::map<td::uint32, td::uint32> expected;
  for (int i = 0; i < 100; i++) {
    auto k = static_cast<td::uint32>(rnd());
    auto v = static_cast<td::uint32>(rnd.fast(0, 1000));
    ASSERT_TRUE(dict.set_builder(key32(k).cbits(), 32, value32(v)));
    expected[k] = v;
  }
  auto total = [&] {
    unsigned long long sum = 0;
    for (auto &kv : expected) {
      sum += kv.second;
    }
    return sum;
  };
  ASSERT_EQ(total(), extra_value(dict.get_root_extra()));

  for (auto &kv : expected) {
    auto value = dict.lookup(key32(kv.first).cbits(), 32);
    ASSERT_TRUE(value.not_null());
    ASSERT_EQ(32u, value->size());
    ASSERT_EQ(kv.second, value->prefetch_ulong(32));
    auto with_extra = dict.lookup_with_extra(key32(kv.first).cbits(), 32);
    ASSERT_EQ(64u, with_extra->size());
  }

  std::size_t visited = 0;
  ASSERT_TRUE(dict.check_for_each_extra([&](Ref<CellSlice> value, Ref<CellSlice> extra, td::ConstBitPtr key, int) {
    CHECK(value->prefetch_ulong(32) == extra->prefetch_ulong(32));
    CHECK(expected.count(static_cast<td::uint32>(key.get_uint(32))) == 1);
    visited++;
    return true;
  }));
  ASSERT_EQ(expected.size(), visited);

  int removed = 0;
  for (auto it = expected.begin(); it != expected.end() && removed < 40; removed++) {
    auto value = dict.lookup_delete(key32(it->first).cbits(), 32);
    ASSERT_TRUE(value.not_null());
    ASSERT_EQ(it->second, value->prefetch_ulong(32));
    it = expected.erase(it);
  }
  ASSERT_EQ(total(), extra_value(dict.get_root_extra()));

  CellBuilder cb;
  ASSERT_TRUE(dict.append_dict_to_bool(cb));
  ASSERT_EQ(33u, cb.size());
  auto cs = cb.as_cellslice();
  AugmentedDictionary restored{32, sum_aug};
  ASSERT_TRUE(restored.fetch_from(cs));
  ASSERT_TRUE(cs.empty_ext());
  ASSERT_EQ(total(), extra_value(restored.get_root_extra()));
}

TEST(Dict, MalformedEdge) {
  // a fork edge without children
  CellBuilder cb;
  cb.store_long(0, 2);
  Dictionary dict{cb.finalize(), 32};
  bool thrown = false;
  try {
    dict.lookup(key32(0));
  } catch (VmError &) {
    thrown = true;
  }
  ASSERT_TRUE(thrown);
}
