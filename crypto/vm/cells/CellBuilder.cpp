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

#include "td/utils/bits.h"

#include <cstring>

namespace vm {

using td::Ref;

CellBuilder::CellBuilder() : bits(0), refs_cnt(0) {
  std::memset(data, 0, sizeof(data));
}

CellBuilder::~CellBuilder() = default;

CellBuilder::CellBuilder(const CellBuilder& other) : td::CntObject(), bits(other.bits), refs_cnt(other.refs_cnt), refs(other.refs) {
  std::memcpy(data, other.data, sizeof(data));
}

CellBuilder& CellBuilder::operator=(const CellBuilder& other) {
  bits = other.bits;
  refs_cnt = other.refs_cnt;
  refs = other.refs;
  std::memcpy(data, other.data, sizeof(data));
  return *this;
}

CellBuilder& CellBuilder::operator=(CellBuilder&& other) {
  bits = other.bits;
  refs_cnt = other.refs_cnt;
  refs = std::move(other.refs);
  std::memcpy(data, other.data, sizeof(data));
  other.reset();
  return *this;
}

void CellBuilder::reset() {
  for (auto& ref : refs) {
    ref.clear();
  }
  refs_cnt = bits = 0;
  std::memset(data, 0, sizeof(data));
}

CellBuilder* CellBuilder::make_copy() const {
  return new CellBuilder(*this);
}

Ref<DataCell> CellBuilder::finalize_copy_impl(bool special) const {
  auto res = DataCell::create(td::Slice(data, (bits + 7) >> 3), static_cast<int>(bits),
                              td::Span<Ref<Cell>>(refs.data(), refs_cnt), special);
  if (res.is_error()) {
    LOG(DEBUG) << "cannot create cell: " << res.error();
    return {};
  }
  return res.move_as_ok();
}

Ref<DataCell> CellBuilder::finalize_copy(bool special) const {
  auto res = finalize_copy_impl(special);
  if (res.is_null()) {
    throw VmError{Excno::cell_ov, "cannot create cell"};
  }
  return res;
}

td::Result<Ref<DataCell>> CellBuilder::finalize_novm_nothrow(bool special) {
  auto res = DataCell::create(td::Slice(data, (bits + 7) >> 3), static_cast<int>(bits),
                              td::Span<Ref<Cell>>(refs.data(), refs_cnt), special);
  if (res.is_ok()) {
    reset();
  }
  return res;
}

Ref<DataCell> CellBuilder::finalize_novm(bool special) {
  auto res = finalize_novm_nothrow(special);
  if (res.is_error()) {
    LOG(ERROR) << res.error();
    throw CellCreateError{};
  }
  return res.move_as_ok();
}

Ref<DataCell> CellBuilder::finalize(bool special) {
  auto res = finalize_novm_nothrow(special);
  if (res.is_error()) {
    LOG(DEBUG) << "cannot create cell: " << res.error();
    throw VmError{Excno::cell_ov, "cannot create cell"};
  }
  return res.move_as_ok();
}

Ref<DataCell> CellBuilder::create_pruned_branch(Ref<Cell> cell, td::uint32 new_level, td::uint32 virt_level) {
  auto level_mask = cell->get_level_mask().apply(virt_level);
  auto level = level_mask.get_level();
  if (new_level < level + 1) {
    throw CellWriteError();
  }
  CellBuilder cb;
  cb.store_long(static_cast<td::uint8>(Cell::SpecialType::PrunnedBranch), 8);
  cb.store_long(level_mask.apply_or(Cell::LevelMask::one_level(new_level)).get_mask(), 8);
  for (td::uint32 i = 0; i <= level; i++) {
    if (level_mask.is_significant(i)) {
      cb.store_bytes(cell->get_hash(static_cast<int>(i)).as_slice());
    }
  }
  for (td::uint32 i = 0; i <= level; i++) {
    if (level_mask.is_significant(i)) {
      cb.store_long(cell->get_depth(static_cast<int>(i)), 16);
    }
  }
  return cb.finalize(true);
}

Ref<DataCell> CellBuilder::create_merkle_proof(Ref<Cell> cell_proof) {
  CellBuilder cb;
  cb.store_long(static_cast<td::uint8>(Cell::SpecialType::MerkleProof), 8);
  cb.store_bytes(cell_proof->get_hash(0).as_slice());
  cb.store_long(cell_proof->get_depth(0), Cell::depth_bytes * 8);
  cb.store_ref(cell_proof);
  return cb.finalize(true);
}

bool CellBuilder::can_extend_by(std::size_t new_bits) const {
  return new_bits <= Cell::max_bits - bits;
}

bool CellBuilder::can_extend_by(std::size_t new_bits, unsigned new_refs) const {
  return new_bits <= Cell::max_bits - bits && new_refs <= Cell::max_refs - refs_cnt;
}

unsigned char* CellBuilder::prepare_reserve(std::size_t bit_count) {
  if (!can_extend_by(bit_count)) {
    return nullptr;
  }
  bits += static_cast<unsigned>(bit_count);
  return data;
}

CellBuilder& CellBuilder::store_bytes(const char* str, std::size_t len) {
  ensure_throw(store_bytes_bool(reinterpret_cast<const unsigned char*>(str), len));
  return *this;
}

CellBuilder& CellBuilder::store_bytes(const char* str, const char* end) {
  return store_bytes(str, static_cast<std::size_t>(end - str));
}

CellBuilder& CellBuilder::store_bytes(const unsigned char* str, std::size_t len) {
  ensure_throw(store_bytes_bool(str, len));
  return *this;
}

CellBuilder& CellBuilder::store_bytes(td::Slice s) {
  return store_bytes(s.ubegin(), s.size());
}

bool CellBuilder::store_bytes_bool(const unsigned char* str, std::size_t len) {
  return store_bits_bool(str, len * 8);
}

bool CellBuilder::store_bytes_bool(td::Slice s) {
  return store_bytes_bool(s.ubegin(), s.size());
}

CellBuilder& CellBuilder::store_bits(const unsigned char* str, std::size_t bit_count, int bit_offset) {
  ensure_throw(store_bits_bool(str, bit_count, bit_offset));
  return *this;
}

CellBuilder& CellBuilder::store_bits(td::ConstBitPtr bs, std::size_t bit_count) {
  ensure_throw(store_bits_bool(bs, bit_count));
  return *this;
}

bool CellBuilder::store_bits_bool(const unsigned char* str, std::size_t bit_count, int bit_offset) {
  return store_bits_bool(td::ConstBitPtr{str, bit_offset}, bit_count);
}

bool CellBuilder::store_bits_bool(td::ConstBitPtr bs, std::size_t bit_count) {
  unsigned pos = bits;
  if (!prepare_reserve(bit_count)) {
    return false;
  }
  td::bitstring::bits_memcpy(data, static_cast<int>(pos), bs.ptr, bs.offs, bit_count);
  return true;
}

bool CellBuilder::store_bits_same_bool(std::size_t bit_count, bool val) {
  unsigned pos = bits;
  if (!prepare_reserve(bit_count)) {
    return false;
  }
  td::bitstring::bits_memset(data, static_cast<int>(pos), val, bit_count);
  return true;
}

CellBuilder& CellBuilder::store_long(long long val, unsigned val_bits) {
  ensure_throw(store_long_bool(val, val_bits));
  return *this;
}

bool CellBuilder::store_long_bool(long long val, unsigned val_bits) {
  if (val_bits > 64) {
    return false;
  }
  unsigned pos = bits;
  if (!prepare_reserve(val_bits)) {
    return false;
  }
  td::bitstring::bits_store_long(td::BitPtr{data, static_cast<int>(pos)}, static_cast<unsigned long long>(val),
                                 val_bits);
  return true;
}

bool CellBuilder::store_long_rchk_bool(long long val, unsigned val_bits) {
  if (val_bits > 64) {
    return false;
  }
  if (val_bits < 64) {
    long long bound = 1LL << (val_bits == 0 ? 0 : val_bits - 1);
    if (val_bits == 0 ? val != 0 : (val < -bound || val >= bound)) {
      return false;
    }
  }
  return store_long_bool(val, val_bits);
}

bool CellBuilder::store_ulong_rchk_bool(unsigned long long val, unsigned val_bits) {
  if (val_bits > 64 || (val_bits < 64 && (val >> val_bits) != 0)) {
    return false;
  }
  return store_long_bool(static_cast<long long>(val), val_bits);
}

bool CellBuilder::store_uint_less(unsigned upper_bound, unsigned long long val) {
  return val < upper_bound && store_long_bool(static_cast<long long>(val), td::bit_width32(upper_bound - 1));
}

bool CellBuilder::store_uint_leq(unsigned upper_bound, unsigned long long val) {
  return val <= upper_bound && store_long_bool(static_cast<long long>(val), td::bit_width32(upper_bound));
}

bool CellBuilder::store_ref_bool(Ref<Cell> ref) {
  if (refs_cnt < Cell::max_refs && ref.not_null()) {
    refs[refs_cnt++] = std::move(ref);
    return true;
  }
  return false;
}

CellBuilder& CellBuilder::store_ref(Ref<Cell> ref) {
  ensure_throw(store_ref_bool(std::move(ref)));
  return *this;
}

bool CellBuilder::store_maybe_ref(Ref<Cell> ref) {
  if (ref.is_null()) {
    return store_long_bool(0, 1);
  }
  return can_extend_by(1, 1) && store_long_bool(1, 1) && store_ref_bool(std::move(ref));
}

bool CellBuilder::append_data_cell_bool(const DataCell& cell) {
  unsigned len = cell.size();
  if (!can_extend_by(len, cell.size_refs())) {
    return false;
  }
  store_bits_bool(cell.get_data(), len);
  for (unsigned i = 0; i < cell.size_refs(); i++) {
    refs[refs_cnt++] = cell.get_ref(i);
  }
  return true;
}

bool CellBuilder::append_builder_bool(const CellBuilder& cb) {
  if (!can_extend_by(cb.size(), cb.size_refs())) {
    return false;
  }
  store_bits_bool(cb.data_bits(), cb.size());
  for (unsigned i = 0; i < cb.size_refs(); i++) {
    refs[refs_cnt++] = cb.refs[i];
  }
  return true;
}

CellBuilder& CellBuilder::append_builder(const CellBuilder& cb) {
  ensure_throw(append_builder_bool(cb));
  return *this;
}

bool CellBuilder::append_cellslice_bool(const CellSlice& cs) {
  if (!cs.is_valid() || !can_extend_by(cs.size(), cs.size_refs())) {
    return false;
  }
  store_bits_bool(cs.data_bits(), cs.size());
  for (unsigned i = 0; i < cs.size_refs(); i++) {
    refs[refs_cnt++] = cs.prefetch_ref(i);
  }
  return true;
}

CellBuilder& CellBuilder::append_cellslice(const CellSlice& cs) {
  ensure_throw(append_cellslice_bool(cs));
  return *this;
}

CellSlice CellBuilder::as_cellslice() const {
  return CellSlice{finalize_copy()};
}

Ref<CellSlice> CellBuilder::as_cellslice_ref() const {
  return Ref<CellSlice>{true, finalize_copy()};
}

bool CellBuilder::contents_equal(const CellSlice& cs) const {
  if (size() != cs.size() || size_refs() != cs.size_refs()) {
    return false;
  }
  if (!data_bits().equals(cs.data_bits(), size())) {
    return false;
  }
  for (unsigned i = 0; i < size_refs(); i++) {
    if (refs[i]->get_hash() != cs.prefetch_ref(i)->get_hash()) {
      return false;
    }
  }
  return true;
}

std::string CellBuilder::to_hex() const {
  return data_bits().to_hex(bits);
}

}  // namespace vm
