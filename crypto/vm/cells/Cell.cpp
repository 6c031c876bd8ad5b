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
#include "vm/cells/Cell.h"
#include "vm/cells/DataCell.h"
#include "vm/cells/VirtualCell.h"

namespace vm {

td::Slice CellTraits::special_type_str(SpecialType type) {
  switch (type) {
    case SpecialType::Ordinary:
      return "Ordinary";
    case SpecialType::PrunnedBranch:
      return "PrunnedBranch";
    case SpecialType::Library:
      return "Library";
    case SpecialType::MerkleProof:
      return "MerkleProof";
    case SpecialType::MerkleUpdate:
      return "MerkleUpdate";
  }
  return "Unknown";
}

td::StringBuilder& operator<<(td::StringBuilder& sb, CellTraits::SpecialType special_type) {
  return sb << CellTraits::special_type_str(special_type);
}

Ref<Cell> Cell::virtualize(td::uint32 effective_level) const {
  return VirtualCell::create(effective_level, Ref<Cell>(this));
}

td::StringBuilder& operator<<(td::StringBuilder& sb, const Cell& cell) {
  return sb << cell.get_hash().to_hex();
}

}  // namespace vm
