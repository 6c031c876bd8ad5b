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

#include "vm/cells/CellBuilder.h"
#include "vm/cells/CellSlice.h"

#include <functional>

namespace vm {
using td::Ref;

namespace dict {

// hml_short$0 / hml_long$10 / hml_same$11 labels of HashmapE keys
bool store_label(CellBuilder& cb, td::ConstBitPtr label, int len, int max_len);
// returns label length, or -1 if the label is malformed
int parse_label(CellSlice& cs, td::BitPtr to, int max_len);

struct AugmentationData {
  virtual ~AugmentationData() = default;
  virtual bool skip_extra(CellSlice& cs) const = 0;
  virtual bool eval_leaf(CellBuilder& cb, CellSlice& val) const = 0;
  virtual bool eval_fork(CellBuilder& cb, CellSlice& left_extra, CellSlice& right_extra) const = 0;
  virtual bool eval_empty(CellBuilder& cb) const = 0;
};

}  // namespace dict

class DictionaryFixed {
 public:
  enum class SetMode : int { Set = 3, Replace = 1, Add = 2 };
  using foreach_func_t = std::function<bool(Ref<CellSlice>, td::ConstBitPtr, int)>;

  DictionaryFixed(Ref<Cell> root, int key_bits, const dict::AugmentationData* aug = nullptr)
      : root_cell(std::move(root)), key_bits(key_bits), aug(aug) {
  }
  virtual ~DictionaryFixed() = default;

  int get_key_bits() const {
    return key_bits;
  }
  bool is_empty() const {
    return root_cell.is_null();
  }
  Ref<Cell> get_root_cell() const {
    return root_cell;
  }
  void reset() {
    root_cell.clear();
  }

 protected:
  Ref<Cell> root_cell;
  int key_bits;
  const dict::AugmentationData* aug;

  Ref<CellSlice> lookup_impl(td::ConstBitPtr key, int key_len, bool with_extra) const;
  bool set_impl(td::ConstBitPtr key, int key_len, const CellSlice& value, SetMode mode);
  Ref<CellSlice> lookup_delete_impl(td::ConstBitPtr key, int key_len);
  bool for_each_impl(const foreach_func_t& func, bool with_extra) const;
  Ref<CellSlice> extract_root_extra() const;
};

class Dictionary : public DictionaryFixed {
 public:
  explicit Dictionary(int n) : DictionaryFixed({}, n) {
  }
  Dictionary(Ref<Cell> root, int n) : DictionaryFixed(std::move(root), n) {
  }

  // HashmapE n X: hme_empty$0 or hme_root$1 root:^(Hashmap n X)
  bool fetch_from(CellSlice& cs) {
    return cs.fetch_maybe_ref(root_cell);
  }
  bool append_dict_to_bool(CellBuilder& cb) const {
    return cb.store_maybe_ref(root_cell);
  }

  Ref<CellSlice> lookup(td::ConstBitPtr key, int key_len) const {
    return lookup_impl(key, key_len, false);
  }
  template <unsigned n>
  Ref<CellSlice> lookup(const td::BitArray<n>& key) const {
    return lookup(key.cbits(), n);
  }
  Ref<Cell> lookup_ref(td::ConstBitPtr key, int key_len) const;

  bool set(td::ConstBitPtr key, int key_len, const CellSlice& value, SetMode mode = SetMode::Set) {
    return set_impl(key, key_len, value, mode);
  }
  template <unsigned n>
  bool set(const td::BitArray<n>& key, Ref<CellSlice> value, SetMode mode = SetMode::Set) {
    return value.not_null() && set(key.cbits(), n, *value, mode);
  }
  bool set_builder(td::ConstBitPtr key, int key_len, const CellBuilder& value, SetMode mode = SetMode::Set) {
    return set(key, key_len, value.as_cellslice(), mode);
  }
  bool set_ref(td::ConstBitPtr key, int key_len, Ref<Cell> val_ref, SetMode mode = SetMode::Set);

  Ref<CellSlice> lookup_delete(td::ConstBitPtr key, int key_len) {
    return lookup_delete_impl(key, key_len);
  }
  bool check_for_each(const foreach_func_t& foreach_func) const {
    return for_each_impl(foreach_func, false);
  }
};

class AugmentedDictionary : public DictionaryFixed {
 public:
  using foreach_extra_func_t = std::function<bool(Ref<CellSlice>, Ref<CellSlice>, td::ConstBitPtr, int)>;

  AugmentedDictionary(int n, const dict::AugmentationData& aug) : DictionaryFixed({}, n, &aug) {
  }
  AugmentedDictionary(Ref<Cell> root, int n, const dict::AugmentationData& aug)
      : DictionaryFixed(std::move(root), n, &aug) {
  }

  // HashmapAugE n X Y: ahme_empty$0 extra:Y or ahme_root$1 root:^(HashmapAug n X Y) extra:Y
  bool fetch_from(CellSlice& cs);
  bool append_dict_to_bool(CellBuilder& cb) const;

  // aggregate over all leaves, or the empty value for an empty dictionary
  Ref<CellSlice> get_root_extra() const;

  Ref<CellSlice> lookup(td::ConstBitPtr key, int key_len) const {
    return lookup_impl(key, key_len, false);
  }
  Ref<CellSlice> lookup_with_extra(td::ConstBitPtr key, int key_len) const {
    return lookup_impl(key, key_len, true);
  }
  bool set(td::ConstBitPtr key, int key_len, const CellSlice& value, SetMode mode = SetMode::Set) {
    return set_impl(key, key_len, value, mode);
  }
  bool set_builder(td::ConstBitPtr key, int key_len, const CellBuilder& value, SetMode mode = SetMode::Set) {
    return set(key, key_len, value.as_cellslice(), mode);
  }
  Ref<CellSlice> lookup_delete(td::ConstBitPtr key, int key_len);
  bool check_for_each(const foreach_func_t& foreach_func) const {
    return for_each_impl(foreach_func, false);
  }
  bool check_for_each_extra(const foreach_extra_func_t& foreach_func) const;
};

}  // namespace vm
