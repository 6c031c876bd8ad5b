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
#include "vm/cells/CellSlice.h"
#include "vm/cells/UsageCell.h"

#include <ostream>

namespace vm {

CellSlice::CellSlice() : bits_st(0), refs_st(0), bits_en(0), refs_en(0) {
}

CellSlice::CellSlice(NoVm, Ref<Cell> cell_ref) : CellSlice() {
  if (cell_ref.is_null()) {
    return;
  }
  auto r_loaded = cell_ref->load_cell();
  if (r_loaded.is_error()) {
    LOG(DEBUG) << "cannot load cell: " << r_loaded.error();
    return;
  }
  cell = r_loaded.move_as_ok();
  init_bits_refs();
}

CellSlice::CellSlice(NoVmOrd, Ref<Cell> cell_ref) : CellSlice(NoVm(), std::move(cell_ref)) {
  if (is_valid() && is_special()) {
    clear();
  }
}

CellSlice::CellSlice(Cell::LoadedCell loaded_cell) : CellSlice() {
  cell = std::move(loaded_cell);
  if (is_valid()) {
    init_bits_refs();
  }
}

CellSlice::CellSlice(Ref<DataCell> dc_ref) : CellSlice() {
  cell.data_cell = std::move(dc_ref);
  if (is_valid()) {
    init_bits_refs();
  }
}

void CellSlice::init_bits_refs() {
  bits_st = 0;
  refs_st = 0;
  bits_en = cell.data_cell->size();
  refs_en = cell.data_cell->size_refs();
}

void CellSlice::clear() {
  cell = {};
  bits_st = refs_st = bits_en = refs_en = 0;
}

Ref<Cell> CellSlice::get_base_cell() const {
  if (!is_valid()) {
    return {};
  }
  Ref<Cell> res = cell.data_cell;
  res = res->virtualize(cell.effective_level);
  if (!cell.tree_node.empty()) {
    res = UsageCell::create(std::move(res), cell.tree_node);
  }
  return res;
}

bool CellSlice::advance(unsigned bits) {
  if (have(bits)) {
    bits_st += bits;
    return true;
  }
  return false;
}

bool CellSlice::advance_refs(unsigned refs) {
  if (have_refs(refs)) {
    refs_st += refs;
    return true;
  }
  return false;
}

bool CellSlice::advance_ext(unsigned bits, unsigned refs) {
  if (have(bits, refs)) {
    bits_st += bits;
    refs_st += refs;
    return true;
  }
  return false;
}

bool CellSlice::advance_ext(unsigned bits_refs) {
  return advance_ext(bits_refs & 0xffff, bits_refs >> 16);
}

bool CellSlice::only_first(unsigned bits, unsigned refs) {
  if (!have(bits, refs)) {
    return false;
  }
  bits_en = bits_st + bits;
  refs_en = refs_st + refs;
  return true;
}

unsigned long long CellSlice::prefetch_ulong(unsigned bits) const {
  if (bits > 64 || !have(bits)) {
    return fetch_ulong_eof;
  }
  return data_bits().get_uint(bits);
}

unsigned long long CellSlice::fetch_ulong(unsigned bits) {
  auto res = prefetch_ulong(bits);
  if (bits <= 64 && have(bits)) {
    bits_st += bits;
  }
  return res;
}

long long CellSlice::prefetch_long(unsigned bits) const {
  if (bits > 64 || !have(bits)) {
    return fetch_long_eof;
  }
  return data_bits().get_int(bits);
}

long long CellSlice::fetch_long(unsigned bits) {
  auto res = prefetch_long(bits);
  if (bits <= 64 && have(bits)) {
    bits_st += bits;
  }
  return res;
}

bool CellSlice::prefetch_ulong_bool(unsigned bits, unsigned long long& res) const {
  if (bits > 64 || !have(bits)) {
    return false;
  }
  res = data_bits().get_uint(bits);
  return true;
}

bool CellSlice::fetch_ulong_bool(unsigned bits, unsigned long long& res) {
  return prefetch_ulong_bool(bits, res) && advance(bits);
}

bool CellSlice::prefetch_long_bool(unsigned bits, long long& res) const {
  if (bits > 64 || !have(bits)) {
    return false;
  }
  res = data_bits().get_int(bits);
  return true;
}

bool CellSlice::fetch_long_bool(unsigned bits, long long& res) {
  return prefetch_long_bool(bits, res) && advance(bits);
}

bool CellSlice::fetch_bool_to(bool& res) {
  unsigned long long t;
  return fetch_ulong_bool(1, t) && ((res = (t != 0)), true);
}

bool CellSlice::fetch_bool_to(int& res) {
  unsigned long long t;
  return fetch_ulong_bool(1, t) && ((res = static_cast<int>(t)), true);
}

bool CellSlice::prefetch_bits_to(td::BitPtr buffer, unsigned bits) const {
  if (!have(bits)) {
    return false;
  }
  buffer.copy_from(data_bits(), bits);
  return true;
}

bool CellSlice::fetch_bits_to(td::BitPtr buffer, unsigned bits) {
  return prefetch_bits_to(buffer, bits) && advance(bits);
}

bool CellSlice::fetch_bytes(unsigned char* buffer, unsigned bytes) {
  return fetch_bits_to(td::BitPtr{buffer}, bytes * 8);
}

Ref<Cell> CellSlice::prefetch_ref(unsigned offset) const {
  if (offset >= size_refs()) {
    return {};
  }
  auto ref_id = refs_st + offset;
  auto res = cell.data_cell->get_ref(ref_id)->virtualize(cell.effective_level);
  if (!cell.tree_node.empty()) {
    return UsageCell::create(std::move(res), cell.tree_node.create_child(ref_id));
  }
  return res;
}

Ref<Cell> CellSlice::fetch_ref() {
  if (!have_refs()) {
    return {};
  }
  auto res = prefetch_ref();
  refs_st++;
  return res;
}

bool CellSlice::fetch_maybe_ref(Ref<Cell>& res) {
  auto z = prefetch_ulong(1);
  if (!z) {
    res.clear();
    return advance(1);
  }
  return z == 1 && prefetch_ref().not_null() && advance(1) && fetch_ref_to(res);
}

bool CellSlice::prefetch_maybe_ref(Ref<Cell>& res) const {
  auto z = prefetch_ulong(1);
  if (!z) {
    res.clear();
    return true;
  }
  return z == 1 && (res = prefetch_ref()).not_null();
}

bool CellSlice::fetch_subslice_to(unsigned bits, unsigned refs, CellSlice& res) {
  if (!have(bits, refs)) {
    return false;
  }
  res = *this;
  res.only_first(bits, refs);
  return advance_ext(bits, refs);
}

Ref<CellSlice> CellSlice::fetch_subslice(unsigned bits, unsigned refs) {
  if (!have(bits, refs)) {
    return {};
  }
  Ref<CellSlice> res{true, *this};
  res.unique_write().only_first(bits, refs);
  advance_ext(bits, refs);
  return res;
}

Ref<CellSlice> CellSlice::prefetch_subslice(unsigned bits, unsigned refs) const {
  if (!have(bits, refs)) {
    return {};
  }
  Ref<CellSlice> res{true, *this};
  res.unique_write().only_first(bits, refs);
  return res;
}

bool CellSlice::contents_equal(const CellSlice& cs2) const {
  if (size() != cs2.size() || size_refs() != cs2.size_refs()) {
    return false;
  }
  if (!data_bits().equals(cs2.data_bits(), size())) {
    return false;
  }
  for (unsigned i = 0; i < size_refs(); i++) {
    if (prefetch_ref(i)->get_hash() != cs2.prefetch_ref(i)->get_hash()) {
      return false;
    }
  }
  return true;
}

int CellSlice::compare_bits(td::ConstBitPtr other, unsigned bits) const {
  return data_bits().compare(other, bits);
}

std::string CellSlice::data_to_hex() const {
  return data_bits().to_hex(size());
}

void CellSlice::dump(std::ostream& os, int level, bool endl) const {
  os << "Cell";
  if (level > 0) {
    os << "{" << cell.data_cell->to_hex() << "}";
  }
  os << " bits: " << bits_st << ".." << bits_en;
  os << "; refs: " << refs_st << ".." << refs_en;
  if (endl) {
    os << std::endl;
  }
}

void CellSlice::print_rec(std::ostream& os, int indent) const {
  for (int i = 0; i < indent; i++) {
    os << ' ';
  }
  if (!is_valid()) {
    os << "<invalid>" << std::endl;
    return;
  }
  if (is_special()) {
    os << "SPECIAL ";
  }
  os << "x{" << data_to_hex() << '}' << std::endl;
  for (unsigned i = 0; i < size_refs(); i++) {
    bool is_special_ref = false;
    try {
      auto cs = load_cell_slice_special(prefetch_ref(i), is_special_ref);
      cs.print_rec(os, indent + 1);
    } catch (VmVirtError&) {
      for (int j = 0; j <= indent; j++) {
        os << ' ';
      }
      os << "<pruned " << prefetch_ref(i)->get_hash().to_hex() << ">" << std::endl;
    }
  }
}

td::StringBuilder& operator<<(td::StringBuilder& sb, const CellSlice& cs) {
  if (!cs.is_valid()) {
    return sb << "<invalid cell slice>";
  }
  return sb << "x{" << cs.data_to_hex() << "} refs:" << cs.size_refs();
}

namespace {
CellSlice load_cell_slice_impl(Ref<Cell> cell, bool* is_special) {
  if (cell.is_null()) {
    throw VmError{Excno::cell_und, "cannot load a null cell"};
  }
  auto r_loaded = cell->load_cell();
  if (r_loaded.is_error()) {
    throw VmError{Excno::cell_und, "failed to load cell"};
  }
  auto loaded = r_loaded.move_as_ok();
  auto& data_cell = loaded.data_cell;
  if (data_cell->special_type() == Cell::SpecialType::PrunnedBranch &&
      data_cell->get_level() > loaded.effective_level) {
    throw VmVirtError{static_cast<int>(data_cell->get_level())};
  }
  if (data_cell->is_special()) {
    if (is_special == nullptr) {
      throw VmError{Excno::cell_und, "unexpected special cell"};
    }
    *is_special = true;
  } else if (is_special != nullptr) {
    *is_special = false;
  }
  return CellSlice{std::move(loaded)};
}
}  // namespace

CellSlice load_cell_slice(Ref<Cell> cell) {
  return load_cell_slice_impl(std::move(cell), nullptr);
}

Ref<CellSlice> load_cell_slice_ref(Ref<Cell> cell) {
  return Ref<CellSlice>{true, load_cell_slice_impl(std::move(cell), nullptr)};
}

CellSlice load_cell_slice_special(Ref<Cell> cell, bool& is_special) {
  return load_cell_slice_impl(std::move(cell), &is_special);
}

}  // namespace vm
