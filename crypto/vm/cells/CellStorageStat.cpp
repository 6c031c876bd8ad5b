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
#include "vm/cells/CellStorageStat.h"
#include "vm/cells/CellSlice.h"

namespace vm {

td::Status CellStorageStat::add_used_storage(const Ref<Cell>& cell) {
  if (cell.is_null()) {
    return td::Status::Error("cannot compute storage of a null cell");
  }
  try {
    return add_cell(cell);
  } catch (VmError& err) {
    return td::Status::Error(PSLICE() << "error while computing storage statistics: " << err.get_msg());
  } catch (VmVirtError&) {
    return td::Status::Error("cannot compute storage statistics of a pruned branch");
  }
}

td::Status CellStorageStat::add_cell(const Ref<Cell>& cell) {
  if (!seen.insert(cell->get_hash()).second) {
    return td::Status::OK();
  }
  bool spec;
  CellSlice cs = load_cell_slice_special(cell, spec);
  if (cells >= limit_cells) {
    return td::Status::Error(PSLICE() << "too many cells: more than " << limit_cells);
  }
  ++cells;
  bits += cs.size();
  if (bits > limit_bits) {
    return td::Status::Error(PSLICE() << "too many bits: more than " << limit_bits);
  }
  for (unsigned i = 0; i < cs.size_refs(); ++i) {
    TRY_STATUS(add_cell(cs.prefetch_ref(i)));
  }
  return td::Status::OK();
}

}  // namespace vm
