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

#include "td/utils/bits.h"
#include "vm/cells/CellBuilder.h"
#include "vm/cells/DataCell.h"
#include "vm/excno.hpp"

#include <iosfwd>

namespace vm {

struct NoVm {};
struct NoVmOrd {};

class CellSlice : public td::CntObject {
  Cell::LoadedCell cell;
  unsigned bits_st, refs_st, bits_en, refs_en;

 public:
  static constexpr long long fetch_long_eof = (static_cast<unsigned long long>(-1LL) << 63);
  static constexpr unsigned long long fetch_ulong_eof = static_cast<unsigned long long>(-1LL);

  CellSlice();
  CellSlice(NoVm, Ref<Cell> cell_ref);
  CellSlice(NoVmOrd, Ref<Cell> cell_ref);
  explicit CellSlice(Cell::LoadedCell loaded_cell);
  explicit CellSlice(Ref<DataCell> dc_ref);
  CellSlice(const CellSlice& cs) = default;
  CellSlice& operator=(const CellSlice& cs) = default;

  void clear();
  bool is_valid() const {
    return cell.data_cell.not_null();
  }
  bool is_special() const {
    return cell.data_cell->is_special();
  }
  Cell::SpecialType special_type() const {
    return cell.data_cell->special_type();
  }
  int level() const {
    return static_cast<int>(cell.data_cell->get_level());
  }
  td::uint32 effective_level() const {
    return cell.effective_level;
  }
  unsigned size() const {
    return bits_en - bits_st;
  }
  bool empty() const {
    return size() == 0;
  }
  bool empty_ext() const {
    return bits_en == bits_st && refs_en == refs_st;
  }
  unsigned size_refs() const {
    return refs_en - refs_st;
  }
  unsigned size_ext() const {
    return size() + (size_refs() << 16);
  }
  bool have(unsigned bits) const {
    return bits <= size();
  }
  bool have(unsigned bits, unsigned refs) const {
    return bits <= size() && refs <= size_refs();
  }
  bool have_ext(unsigned ext_size) const {
    return have(ext_size & 0xffff, ext_size >> 16);
  }
  bool have_refs(unsigned refs = 1) const {
    return refs <= size_refs();
  }
  bool advance(unsigned bits);
  bool advance_refs(unsigned refs);
  bool advance_ext(unsigned bits, unsigned refs);
  bool advance_ext(unsigned bits_refs);
  bool only_first(unsigned bits, unsigned refs = 0);
  bool skip_first(unsigned bits, unsigned refs = 0) {
    return advance_ext(bits, refs);
  }

  td::ConstBitPtr data_bits() const {
    return td::ConstBitPtr{cell.data_cell->get_data(), static_cast<int>(bits_st)};
  }
  Ref<Cell> get_base_cell() const;
  const Cell::LoadedCell& get_loaded_cell() const {
    return cell;
  }
  CellUsageTree::NodePtr get_tree_node() const {
    return cell.tree_node;
  }

  int bit_at(unsigned i) const {
    return have(i + 1) ? data_bits()[static_cast<int>(i)] : -1;
  }
  unsigned long long fetch_ulong(unsigned bits);
  unsigned long long prefetch_ulong(unsigned bits) const;
  long long fetch_long(unsigned bits);
  long long prefetch_long(unsigned bits) const;
  bool fetch_long_bool(unsigned bits, long long& res);
  bool prefetch_long_bool(unsigned bits, long long& res) const;
  bool fetch_ulong_bool(unsigned bits, unsigned long long& res);
  bool prefetch_ulong_bool(unsigned bits, unsigned long long& res) const;
  bool fetch_bool_to(bool& res);
  bool fetch_bool_to(int& res);
  template <typename T>
  bool fetch_uint_to(unsigned bits, T& res) {
    unsigned long long t;
    return fetch_ulong_bool(bits, t) && ((res = static_cast<T>(t)), true);
  }
  template <typename T>
  bool fetch_int_to(unsigned bits, T& res) {
    long long t;
    return fetch_long_bool(bits, t) && ((res = static_cast<T>(t)), true);
  }
  template <typename T>
  bool fetch_uint_less(unsigned upper_bound, T& res) {
    unsigned long long t;
    return upper_bound > 0 && fetch_ulong_bool(static_cast<unsigned>(td::bit_width32(upper_bound - 1)), t) &&
           t < upper_bound && ((res = static_cast<T>(t)), true);
  }
  template <typename T>
  bool fetch_uint_leq(unsigned upper_bound, T& res) {
    unsigned long long t;
    return fetch_ulong_bool(static_cast<unsigned>(td::bit_width32(upper_bound)), t) && t <= upper_bound &&
           ((res = static_cast<T>(t)), true);
  }
  bool fetch_bits_to(td::BitPtr buffer, unsigned bits);
  bool prefetch_bits_to(td::BitPtr buffer, unsigned bits) const;
  template <unsigned n>
  bool fetch_bits_to(td::BitArray<n>& buffer) {
    return fetch_bits_to(buffer.bits(), n);
  }
  template <unsigned n>
  bool prefetch_bits_to(td::BitArray<n>& buffer) const {
    return prefetch_bits_to(buffer.bits(), n);
  }
  bool fetch_bytes(unsigned char* buffer, unsigned bytes);

  Ref<Cell> prefetch_ref(unsigned offset = 0) const;
  Ref<Cell> fetch_ref();
  bool fetch_ref_to(Ref<Cell>& ref) {
    return (ref = fetch_ref()).not_null();
  }
  bool fetch_maybe_ref(Ref<Cell>& ref);
  bool prefetch_maybe_ref(Ref<Cell>& ref) const;

  bool fetch_subslice_to(unsigned bits, unsigned refs, CellSlice& res);
  Ref<CellSlice> fetch_subslice(unsigned bits, unsigned refs = 0);
  Ref<CellSlice> prefetch_subslice(unsigned bits, unsigned refs = 0) const;

  bool contents_equal(const CellSlice& cs2) const;
  int compare_bits(td::ConstBitPtr other, unsigned bits) const;

  std::string data_to_hex() const;
  void dump(std::ostream& os, int level = 0, bool endl = true) const;
  void print_rec(std::ostream& os, int indent = 0) const;

  CellSlice* make_copy() const override {
    return new CellSlice{*this};
  }

 private:
  void init_bits_refs();
};

td::StringBuilder& operator<<(td::StringBuilder& sb, const CellSlice& cs);

// throws VmError for special cells and VmVirtError for pruned branches reached through a proof
CellSlice load_cell_slice(Ref<Cell> cell);
Ref<CellSlice> load_cell_slice_ref(Ref<Cell> cell);
CellSlice load_cell_slice_special(Ref<Cell> cell, bool& is_special);

}  // namespace vm
