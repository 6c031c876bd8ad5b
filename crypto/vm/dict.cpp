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
#include "td/utils/bits.h"

namespace vm {

namespace dict {

bool store_label(CellBuilder& cb, td::ConstBitPtr label, int len, int max_len) {
  if (len < 0 || len > max_len) {
    return false;
  }
  unsigned k = td::bit_width32(static_cast<td::uint32>(max_len));
  if (len > 1 && k < 2 * static_cast<unsigned>(len) - 1) {
    bool b = label[0];
    if (label.scan(b, len) == static_cast<std::size_t>(len)) {
      // hml_same$11 v:Bit n:(#<= m)
      return cb.store_long_bool(3, 2) && cb.store_long_bool(b, 1) && cb.store_long_bool(len, k);
    }
  }
  if (k < static_cast<unsigned>(len)) {
    // hml_long$10 n:(#<= m) s:(n * Bit)
    return cb.store_long_bool(2, 2) && cb.store_long_bool(len, k) && cb.store_bits_bool(label, len);
  }
  // hml_short$0 len:(Unary ~n) s:(n * Bit)
  return cb.store_long_bool(0, 1) && cb.store_ones_bool(len) && cb.store_long_bool(0, 1) &&
         cb.store_bits_bool(label, len);
}

int parse_label(CellSlice& cs, td::BitPtr to, int max_len) {
  unsigned k = td::bit_width32(static_cast<td::uint32>(max_len));
  unsigned long long tag;
  if (!cs.fetch_ulong_bool(1, tag)) {
    return -1;
  }
  if (!tag) {
    int len = 0;
    while (true) {
      unsigned long long b;
      if (!cs.fetch_ulong_bool(1, b)) {
        return -1;
      }
      if (!b) {
        break;
      }
      if (++len > max_len) {
        return -1;
      }
    }
    return cs.fetch_bits_to(to, len) ? len : -1;
  }
  unsigned long long len;
  if (!cs.fetch_ulong_bool(1, tag)) {
    return -1;
  }
  if (!tag) {
    if (!cs.fetch_ulong_bool(k, len) || len > static_cast<unsigned long long>(max_len)) {
      return -1;
    }
    return cs.fetch_bits_to(to, static_cast<unsigned>(len)) ? static_cast<int>(len) : -1;
  }
  unsigned long long v;
  if (!cs.fetch_ulong_bool(1, v) || !cs.fetch_ulong_bool(k, len) || len > static_cast<unsigned long long>(max_len)) {
    return -1;
  }
  to.fill(v != 0, static_cast<std::size_t>(len));
  return static_cast<int>(len);
}

}  // namespace dict

namespace {

using LabelBuffer = td::BitArray<1024>;

int parse_edge(CellSlice& cs, td::BitPtr label, int n) {
  int l = dict::parse_label(cs, label, n);
  if (l < 0) {
    throw VmError{Excno::dict_err, "invalid dictionary edge label"};
  }
  return l;
}

Ref<Cell> get_fork_child(const CellSlice& cs, bool bit) {
  if (cs.size_refs() < 2) {
    throw VmError{Excno::dict_err, "dictionary fork has less than two children"};
  }
  return cs.prefetch_ref(bit ? 1 : 0);
}

// extra of a subtree with n-bit keys
Ref<CellSlice> get_edge_extra(Ref<Cell> edge, int n, const dict::AugmentationData& aug) {
  CellSlice cs = load_cell_slice(std::move(edge));
  LabelBuffer label;
  int l = parse_edge(cs, label.bits(), n);
  if (l < n) {
    if (!cs.advance_refs(2)) {
      throw VmError{Excno::dict_err, "dictionary fork has less than two children"};
    }
    return Ref<CellSlice>{true, std::move(cs)};
  }
  CellSlice extra = cs;
  if (!aug.skip_extra(cs)) {
    throw VmError{Excno::dict_err, "cannot skip extra value of dictionary leaf"};
  }
  extra.only_first(extra.size() - cs.size(), extra.size_refs() - cs.size_refs());
  return Ref<CellSlice>{true, std::move(extra)};
}

Ref<Cell> make_edge(td::ConstBitPtr label, int l, int n, const CellSlice& payload) {
  CellBuilder cb;
  Ref<Cell> res;
  if (!dict::store_label(cb, label, l, n) || !cb.append_cellslice_bool(payload) || !cb.finalize_to(res)) {
    return {};
  }
  return res;
}

Ref<Cell> make_leaf(td::ConstBitPtr key, int n, const CellSlice& value, const dict::AugmentationData* aug) {
  CellBuilder cb;
  if (!dict::store_label(cb, key, n, n)) {
    return {};
  }
  if (aug) {
    CellSlice val{value};
    if (!aug->eval_leaf(cb, val)) {
      return {};
    }
  }
  Ref<Cell> res;
  if (!cb.append_cellslice_bool(value) || !cb.finalize_to(res)) {
    return {};
  }
  return res;
}

Ref<Cell> make_fork(td::ConstBitPtr label, int l, int n, Ref<Cell> left, Ref<Cell> right,
                    const dict::AugmentationData* aug) {
  if (left.is_null() || right.is_null()) {
    return {};
  }
  CellBuilder cb;
  if (!dict::store_label(cb, label, l, n)) {
    return {};
  }
  if (aug) {
    auto left_extra = get_edge_extra(left, n - l - 1, *aug);
    auto right_extra = get_edge_extra(right, n - l - 1, *aug);
    if (!cb.store_ref_bool(std::move(left)) || !cb.store_ref_bool(std::move(right)) ||
        !aug->eval_fork(cb, left_extra.write(), right_extra.write())) {
      return {};
    }
  } else if (!cb.store_ref_bool(std::move(left)) || !cb.store_ref_bool(std::move(right))) {
    return {};
  }
  Ref<Cell> res;
  return cb.finalize_to(res) ? res : Ref<Cell>{};
}

// returns the new edge (the same edge if nothing changed), or a null Ref on failure
Ref<Cell> dict_set(Ref<Cell> edge, td::ConstBitPtr key, int n, const CellSlice& value, DictionaryFixed::SetMode mode,
                   const dict::AugmentationData* aug, bool& changed) {
  CellSlice cs = load_cell_slice(edge);
  LabelBuffer label;
  int l = parse_edge(cs, label.bits(), n);
  std::size_t same = 0;
  label.cbits().compare(key, l, &same);
  int pfx_len = static_cast<int>(same);
  if (pfx_len < l) {
    if (mode == DictionaryFixed::SetMode::Replace) {
      changed = false;
      return edge;
    }
    bool bit = key[pfx_len];
    auto old_child = make_edge(label.cbits() + pfx_len + 1, l - pfx_len - 1, n - pfx_len - 1, cs);
    auto new_child = make_leaf(key + pfx_len + 1, n - pfx_len - 1, value, aug);
    changed = true;
    return bit ? make_fork(key, pfx_len, n, std::move(old_child), std::move(new_child), aug)
               : make_fork(key, pfx_len, n, std::move(new_child), std::move(old_child), aug);
  }
  if (l == n) {
    if (mode == DictionaryFixed::SetMode::Add) {
      changed = false;
      return edge;
    }
    changed = true;
    return make_leaf(key, n, value, aug);
  }
  bool bit = key[l];
  auto child = get_fork_child(cs, bit);
  auto new_child = dict_set(child, key + l + 1, n - l - 1, value, mode, aug, changed);
  if (new_child.is_null()) {
    return {};
  }
  if (!changed) {
    return edge;
  }
  auto other = cs.prefetch_ref(bit ? 0 : 1);
  return bit ? make_fork(key, l, n, std::move(other), std::move(new_child), aug)
             : make_fork(key, l, n, std::move(new_child), std::move(other), aug);
}

// returns {new edge, deleted value}; a null new edge with non-null value means the subtree became empty
std::pair<Ref<Cell>, Ref<CellSlice>> dict_lookup_delete(Ref<Cell> edge, td::ConstBitPtr key, int n,
                                                        const dict::AugmentationData* aug) {
  CellSlice cs = load_cell_slice(edge);
  LabelBuffer label;
  int l = parse_edge(cs, label.bits(), n);
  if (!label.cbits().equals(key, l)) {
    return {edge, {}};
  }
  if (l == n) {
    if (aug && !aug->skip_extra(cs)) {
      throw VmError{Excno::dict_err, "cannot skip extra value of dictionary leaf"};
    }
    return {{}, Ref<CellSlice>{true, std::move(cs)}};
  }
  bool bit = key[l];
  auto res = dict_lookup_delete(get_fork_child(cs, bit), key + l + 1, n - l - 1, aug);
  if (res.second.is_null()) {
    return {edge, {}};
  }
  auto other = cs.prefetch_ref(bit ? 0 : 1);
  if (res.first.not_null()) {
    auto fork = bit ? make_fork(key, l, n, std::move(other), std::move(res.first), aug)
                    : make_fork(key, l, n, std::move(res.first), std::move(other), aug);
    if (fork.is_null()) {
      throw VmError{Excno::cell_ov, "cannot rebuild dictionary fork"};
    }
    return {std::move(fork), std::move(res.second)};
  }
  // the remaining child absorbs this fork's label and branch bit
  CellSlice other_cs = load_cell_slice(std::move(other));
  int m = n - l - 1;
  label.bits().set_bit(l, !bit);
  int ol = parse_edge(other_cs, label.bits() + l + 1, m);
  auto merged = make_edge(label.cbits(), l + 1 + ol, n, other_cs);
  if (merged.is_null()) {
    throw VmError{Excno::cell_ov, "cannot merge dictionary edges"};
  }
  return {std::move(merged), std::move(res.second)};
}

bool dict_for_each(Ref<Cell> edge, td::BitPtr key_buffer, int pos, int n, int total_bits,
                   const dict::AugmentationData* aug, bool with_extra, const DictionaryFixed::foreach_func_t& func) {
  CellSlice cs = load_cell_slice(std::move(edge));
  int l = parse_edge(cs, key_buffer + pos, n);
  if (l == n) {
    if (aug && !with_extra && !aug->skip_extra(cs)) {
      throw VmError{Excno::dict_err, "cannot skip extra value of dictionary leaf"};
    }
    return func(Ref<CellSlice>{true, std::move(cs)}, key_buffer, total_bits);
  }
  for (int bit = 0; bit < 2; bit++) {
    key_buffer.set_bit(pos + l, bit != 0);
    if (!dict_for_each(get_fork_child(cs, bit != 0), key_buffer, pos + l + 1, n - l - 1, total_bits, aug, with_extra,
                       func)) {
      return false;
    }
  }
  return true;
}

}  // namespace

Ref<CellSlice> DictionaryFixed::lookup_impl(td::ConstBitPtr key, int key_len, bool with_extra) const {
  if (key_len != key_bits) {
    return {};
  }
  Ref<Cell> cell = root_cell;
  int n = key_bits;
  LabelBuffer label;
  while (cell.not_null()) {
    auto cs = load_cell_slice_ref(std::move(cell));
    int l = parse_edge(cs.write(), label.bits(), n);
    if (!label.cbits().equals(key, l)) {
      return {};
    }
    if (l == n) {
      if (aug && !with_extra && !aug->skip_extra(cs.write())) {
        throw VmError{Excno::dict_err, "cannot skip extra value of dictionary leaf"};
      }
      return cs;
    }
    bool bit = key[l];
    cell = get_fork_child(*cs, bit);
    key += l + 1;
    n -= l + 1;
  }
  return {};
}

bool DictionaryFixed::set_impl(td::ConstBitPtr key, int key_len, const CellSlice& value, SetMode mode) {
  if (key_len != key_bits) {
    return false;
  }
  if (root_cell.is_null()) {
    if (mode == SetMode::Replace) {
      return false;
    }
    auto leaf = make_leaf(key, key_bits, value, aug);
    if (leaf.is_null()) {
      return false;
    }
    root_cell = std::move(leaf);
    return true;
  }
  bool changed = false;
  auto new_root = dict_set(root_cell, key, key_bits, value, mode, aug, changed);
  if (new_root.is_null() || !changed) {
    return false;
  }
  root_cell = std::move(new_root);
  return true;
}

Ref<CellSlice> DictionaryFixed::lookup_delete_impl(td::ConstBitPtr key, int key_len) {
  if (key_len != key_bits || root_cell.is_null()) {
    return {};
  }
  auto res = dict_lookup_delete(root_cell, key, key_bits, aug);
  if (res.second.not_null()) {
    root_cell = std::move(res.first);
  }
  return std::move(res.second);
}

bool DictionaryFixed::for_each_impl(const foreach_func_t& func, bool with_extra) const {
  if (root_cell.is_null()) {
    return true;
  }
  LabelBuffer key_buffer;
  return dict_for_each(root_cell, key_buffer.bits(), 0, key_bits, key_bits, aug, with_extra, func);
}

Ref<CellSlice> DictionaryFixed::extract_root_extra() const {
  if (root_cell.is_null() || !aug) {
    return {};
  }
  return get_edge_extra(root_cell, key_bits, *aug);
}

Ref<Cell> Dictionary::lookup_ref(td::ConstBitPtr key, int key_len) const {
  auto cs = lookup(key, key_len);
  if (cs.is_null() || cs->size() || cs->size_refs() != 1) {
    return {};
  }
  return cs->prefetch_ref();
}

bool Dictionary::set_ref(td::ConstBitPtr key, int key_len, Ref<Cell> val_ref, SetMode mode) {
  CellBuilder cb;
  return val_ref.not_null() && cb.store_ref_bool(std::move(val_ref)) && set_builder(key, key_len, cb, mode);
}

bool AugmentedDictionary::fetch_from(CellSlice& cs) {
  Ref<Cell> root;
  if (!cs.fetch_maybe_ref(root) || !aug->skip_extra(cs)) {
    return false;
  }
  root_cell = std::move(root);
  return true;
}

Ref<CellSlice> AugmentedDictionary::get_root_extra() const {
  if (root_cell.not_null()) {
    return extract_root_extra();
  }
  CellBuilder cb;
  if (!aug->eval_empty(cb)) {
    return {};
  }
  return cb.as_cellslice_ref();
}

bool AugmentedDictionary::append_dict_to_bool(CellBuilder& cb) const {
  auto extra = get_root_extra();
  return extra.not_null() && cb.store_maybe_ref(root_cell) && cb.append_cellslice_bool(*extra);
}

Ref<CellSlice> AugmentedDictionary::lookup_delete(td::ConstBitPtr key, int key_len) {
  return lookup_delete_impl(key, key_len);
}

bool AugmentedDictionary::check_for_each_extra(const foreach_extra_func_t& foreach_func) const {
  return for_each_impl(
      [&](Ref<CellSlice> cs, td::ConstBitPtr key, int n) {
        CellSlice value = *cs;
        if (!aug->skip_extra(value)) {
          throw VmError{Excno::dict_err, "cannot skip extra value of dictionary leaf"};
        }
        auto& extra = cs.write();
        extra.only_first(extra.size() - value.size(), extra.size_refs() - value.size_refs());
        return foreach_func(Ref<CellSlice>{true, std::move(value)}, std::move(cs), key, n);
      },
      true);
}

}  // namespace vm
