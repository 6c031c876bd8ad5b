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
#include "accstate/storage-used.h"

#include "td/utils/logging.h"

namespace accstate {

td::Result<StorageUsed> StorageUsed::with_values_checked(td::uint64 cells, td::uint64 bits,
                                                         std::optional<td::Bits256> dict_hash) {
  if (cells > max_value || bits > max_value) {
    return make_error(ErrorCode::malformed, PSLICE() << "storage statistics out of range: cells=" << cells
                                                     << " bits=" << bits);
  }
  StorageUsed res;
  res.cells = cells;
  res.bits = bits;
  res.dict_hash = dict_hash;
  return res;
}

td::Result<StorageUsed> StorageUsed::calculate_for_cell(const Ref<vm::Cell>& root) {
  vm::CellStorageStat stat{max_value, max_value};
  auto status = stat.add_used_storage(root);
  if (status.is_error()) {
    return make_error(ErrorCode::malformed, status.message());
  }
  return with_values_checked(stat.cells, stat.bits);
}

bool StorageUsed::store(vm::CellBuilder& cb) const {
  if (!(tlb::store_var_uint(cb, 7, cells) && tlb::store_var_uint(cb, 7, bits))) {
    return false;
  }
  if (!dict_hash) {
    return cb.store_long_bool(0, 3);
  }
  return cb.store_long_bool(1, 3) && cb.store_bits_bool(*dict_hash);
}

bool StorageUsed::fetch(vm::CellSlice& cs) {
  td::uint64 new_cells, new_bits;
  int tag;
  if (!(tlb::fetch_var_uint(cs, 7, new_cells) && tlb::fetch_var_uint(cs, 7, new_bits) && cs.fetch_uint_to(3, tag))) {
    return false;
  }
  switch (tag) {
    case 0:
      dict_hash.reset();
      break;
    case 1: {
      td::Bits256 hash;
      if (!cs.fetch_bits_to(hash)) {
        return false;
      }
      dict_hash = hash;
      break;
    }
    default:
      LOG(DEBUG) << "wrong tag " << tag << " deserializing StorageUsed";
      return false;
  }
  cells = new_cells;
  bits = new_bits;
  return true;
}

std::string StorageUsed::to_str() const {
  td::StringBuilder sb;
  sb << "StorageUsed[cells = " << cells << ", bits = " << bits << ", extra = ";
  if (dict_hash) {
    sb << "StorageExtra[ dict_hash = " << dict_hash->to_hex() << " ]]";
  } else {
    sb << "StorageExtra[empty]]";
  }
  return sb.as_string();
}

StorageUsedShort::StorageUsedShort() : stat_(StorageUsed::max_value, StorageUsed::max_value) {
}

td::Result<StorageUsedShort> StorageUsedShort::with_values_checked(td::uint64 cells, td::uint64 bits) {
  if (cells > StorageUsed::max_value || bits > StorageUsed::max_value) {
    return make_error(ErrorCode::malformed, PSLICE() << "storage statistics out of range: cells=" << cells
                                                     << " bits=" << bits);
  }
  StorageUsedShort res;
  res.stat_.cells = cells;
  res.stat_.bits = bits;
  return std::move(res);
}

td::Result<StorageUsedShort> StorageUsedShort::calculate_for_cell(const Ref<vm::Cell>& root) {
  StorageUsedShort res;
  TRY_STATUS(res.append(root));
  return std::move(res);
}

td::Status StorageUsedShort::append(const Ref<vm::Cell>& root) {
  auto status = stat_.add_used_storage(root);
  if (status.is_error()) {
    return make_error(ErrorCode::malformed, status.message());
  }
  return td::Status::OK();
}

bool StorageUsedShort::store(vm::CellBuilder& cb) const {
  return tlb::store_var_uint(cb, 7, stat_.cells) && tlb::store_var_uint(cb, 7, stat_.bits);
}

bool StorageUsedShort::fetch(vm::CellSlice& cs) {
  td::uint64 new_cells, new_bits;
  if (!(tlb::fetch_var_uint(cs, 7, new_cells) && tlb::fetch_var_uint(cs, 7, new_bits))) {
    return false;
  }
  stat_.clear();
  stat_.cells = new_cells;
  stat_.bits = new_bits;
  return true;
}

std::string StorageUsedShort::to_str() const {
  return PSTRING() << "StorageUsed[cells = " << cells() << ", bits = " << bits() << "]";
}

bool StorageInfo::store(vm::CellBuilder& cb) const {
  return used.store(cb) && cb.store_long_bool(last_paid, 32) && tlb::store_maybe_grams(cb, due_payment);
}

bool StorageInfo::fetch(vm::CellSlice& cs) {
  return used.fetch(cs) && cs.fetch_uint_to(32, last_paid) && tlb::fetch_maybe_grams(cs, due_payment);
}

std::string StorageInfo::to_str() const {
  td::StringBuilder sb;
  sb << "StorageInfo[last_paid = " << last_paid << ", due_payment = ";
  if (due_payment) {
    sb << tlb::uint128_to_str(*due_payment);
  } else {
    sb << "none";
  }
  sb << ", used = " << used.to_str() << "]";
  return sb.as_string();
}

td::StringBuilder& operator<<(td::StringBuilder& sb, const StorageUsed& used) {
  return sb << used.to_str();
}

td::StringBuilder& operator<<(td::StringBuilder& sb, const StorageUsedShort& used) {
  return sb << used.to_str();
}

td::StringBuilder& operator<<(td::StringBuilder& sb, const StorageInfo& info) {
  return sb << info.to_str();
}

}  // namespace accstate
