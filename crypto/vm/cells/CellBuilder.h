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

#include "vm/cells/DataCell.h"
#include "vm/excno.hpp"

namespace vm {

class CellSlice;

class CellBuilder : public td::CntObject {
 public:
  struct CellWriteError {};
  struct CellCreateError {};

 private:
  unsigned bits;
  unsigned refs_cnt;
  std::array<Ref<Cell>, Cell::max_refs> refs;
  mutable unsigned char data[Cell::max_bytes];

 public:
  CellBuilder();
  ~CellBuilder() override;
  CellBuilder(const CellBuilder& other);
  CellBuilder& operator=(const CellBuilder& other);

  static Ref<DataCell> create_pruned_branch(Ref<Cell> cell, td::uint32 new_level,
                                            td::uint32 virt_level = Cell::max_level);
  static Ref<DataCell> create_merkle_proof(Ref<Cell> cell_proof);

  unsigned get_refs_cnt() const {
    return refs_cnt;
  }
  unsigned get_bits() const {
    return bits;
  }
  unsigned size_refs() const {
    return refs_cnt;
  }
  unsigned size() const {
    return bits;
  }
  unsigned size_ext() const {
    return (refs_cnt << 16) + bits;
  }
  unsigned remaining_bits() const {
    return Cell::max_bits - bits;
  }
  unsigned remaining_refs() const {
    return Cell::max_refs - refs_cnt;
  }
  const unsigned char* get_data() const {
    return data;
  }
  td::ConstBitPtr data_bits() const {
    return data;
  }
  Ref<Cell> get_ref(unsigned idx) const {
    return idx < refs_cnt ? refs[idx] : Ref<Cell>{};
  }
  void reset();
  bool reset_bool() {
    reset();
    return true;
  }
  CellBuilder& operator=(CellBuilder&&);
  bool can_extend_by(std::size_t bits) const;
  bool can_extend_by(std::size_t bits, unsigned refs) const;

  CellBuilder& store_bytes(const char* str, std::size_t len);
  CellBuilder& store_bytes(const char* str, const char* end);
  CellBuilder& store_bytes(const unsigned char* str, std::size_t len);
  CellBuilder& store_bytes(td::Slice s);
  bool store_bytes_bool(const unsigned char* str, std::size_t len);
  bool store_bytes_bool(td::Slice s);

  CellBuilder& store_bits(const unsigned char* str, std::size_t bit_count, int bit_offset = 0);
  CellBuilder& store_bits(td::ConstBitPtr bs, std::size_t bit_count);
  template <unsigned n>
  CellBuilder& store_bits(const td::BitArray<n>& ba) {
    return store_bits(ba.cbits(), n);
  }
  bool store_bits_bool(const unsigned char* str, std::size_t bit_count, int bit_offset = 0);
  bool store_bits_bool(td::ConstBitPtr bs, std::size_t bit_count);
  template <unsigned n>
  bool store_bits_bool(const td::BitArray<n>& ba) {
    return store_bits_bool(ba.cbits(), n);
  }
  bool store_bits_same_bool(std::size_t bit_count, bool val);
  bool store_zeroes_bool(std::size_t bit_count) {
    return store_bits_same_bool(bit_count, false);
  }
  bool store_ones_bool(std::size_t bit_count) {
    return store_bits_same_bool(bit_count, true);
  }

  CellBuilder& store_long(long long val, unsigned val_bits = 64);
  bool store_long_bool(long long val, unsigned val_bits = 64);
  bool store_long_rchk_bool(long long val, unsigned val_bits = 64);
  bool store_ulong_rchk_bool(unsigned long long val, unsigned val_bits = 64);
  bool store_uint_less(unsigned upper_bound, unsigned long long val);
  bool store_uint_leq(unsigned upper_bound, unsigned long long val);
  bool store_bool_bool(bool val) {
    return store_long_bool(val, 1);
  }

  bool store_ref_bool(Ref<Cell> ref);
  CellBuilder& store_ref(Ref<Cell> ref);
  bool store_maybe_ref(Ref<Cell> ref);

  bool append_data_cell_bool(const DataCell& cell);
  bool append_builder_bool(const CellBuilder& cb);
  CellBuilder& append_builder(const CellBuilder& cb);
  bool append_cellslice_bool(const CellSlice& cs);
  CellBuilder& append_cellslice(const CellSlice& cs);

  Ref<DataCell> finalize_copy(bool special = false) const;
  Ref<DataCell> finalize(bool special = false);
  Ref<DataCell> finalize_novm(bool special = false);
  td::Result<Ref<DataCell>> finalize_novm_nothrow(bool special = false);
  bool finalize_to(Ref<Cell>& res, bool special = false) {
    return (res = finalize(special)).not_null();
  }

  CellSlice as_cellslice() const;
  Ref<CellSlice> as_cellslice_ref() const;

  bool contents_equal(const CellSlice& cs) const;
  CellBuilder* make_copy() const override;

  std::string to_hex() const;

 private:
  void ensure_throw(bool cond) const {
    if (!cond) {
      throw CellWriteError{};
    }
  }
  unsigned char* prepare_reserve(std::size_t bit_count);
  Ref<DataCell> finalize_copy_impl(bool special) const;
};

}  // namespace vm
