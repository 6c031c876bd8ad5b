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

#include "vm/cells/Cell.h"

#include "td/utils/HashSet.h"
#include "td/utils/Status.h"

#include <limits>

namespace vm {

// Counts distinct cells and their data bits reachable from one or more roots.
struct CellStorageStat {
  td::uint64 cells{0};
  td::uint64 bits{0};
  td::uint64 limit_cells{std::numeric_limits<td::uint64>::max()};
  td::uint64 limit_bits{std::numeric_limits<td::uint64>::max()};
  td::HashSet<CellHash> seen;

  CellStorageStat() = default;
  CellStorageStat(td::uint64 limit_cells, td::uint64 limit_bits) : limit_cells(limit_cells), limit_bits(limit_bits) {
  }

  void clear_seen() {
    seen.clear();
  }
  void clear() {
    cells = bits = 0;
    clear_seen();
  }

  // cells already seen by this object (in this or a previous call) are not counted again
  td::Status add_used_storage(const Ref<Cell>& cell);

 private:
  td::Status add_cell(const Ref<Cell>& cell);
};

}  // namespace vm
