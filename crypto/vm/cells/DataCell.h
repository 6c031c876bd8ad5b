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

#include "td/utils/Span.h"
#include "vm/cells/Cell.h"

#include <algorithm>
#include <array>
#include <iosfwd>

namespace vm {

namespace detail {

struct LevelInfo {
  CellHash hash;
  td::uint16 depth{0};
};

}  // namespace detail

class DataCell final : public Cell {
 private:
  struct PrivateTag {};

 public:
  static td::Result<Ref<DataCell>> create(td::Slice data, int bit_length, td::Span<Ref<Cell>> refs, bool is_special);

  static void store_depth(td::uint8* dest, td::uint16 depth) {
    td::bitstring::bits_store_long(dest, depth, depth_bits);
  }

  static td::uint16 load_depth(const td::uint8* src) {
    return td::bitstring::bits_load_ulong(src, depth_bits) & 0xffff;
  }

  DataCell(int bit_length, std::size_t refs_cnt, Cell::SpecialType type, LevelMask level_mask, PrivateTag);
  DataCell(DataCell const&) = delete;
  DataCell(DataCell&&) = delete;

  td::Result<LoadedCell> load_cell() const override {
    return LoadedCell{Ref<DataCell>{this}, max_level, {}};
  }

  CellUsageTree::NodePtr get_tree_node() const override {
    return {};
  }

  bool is_loaded() const override {
    return true;
  }

  LevelMask get_level_mask() const override {
    return level_mask_;
  }

  unsigned get_refs_cnt() const {
    return refs_cnt_;
  }

  unsigned get_bits() const {
    return bit_length_;
  }

  unsigned size_refs() const {
    return refs_cnt_;
  }

  unsigned size() const {
    return bit_length_;
  }

  const unsigned char* get_data() const {
    return data_.data();
  }

  Ref<Cell> get_ref(unsigned idx) const {
    if (idx >= refs_cnt_) {
      return {};
    }
    return refs_[idx];
  }

  bool is_special() const {
    return type_ != SpecialType::Ordinary;
  }

  SpecialType special_type() const {
    return type_;
  }

  td::uint64 get_tree_cell_count() const override {
    return tree_cell_count_;
  }
  td::uint64 get_tree_bits_count() const override {
    return tree_bits_count_;
  }

  int get_serialized_size(bool with_hashes = false) const {
    return ((get_bits() + 23) >> 3) +
           (with_hashes ? static_cast<int>(get_level_mask().get_hashes_count()) * (hash_bytes + depth_bytes) : 0);
  }

  int serialize(unsigned char* buff, int buff_size, bool with_hashes = false) const;

  std::string serialize() const;

  std::string to_hex() const;

 private:
  td::uint16 do_get_depth(td::uint32 level) const override {
    return level_info_[std::min<td::uint32>(level_mask_.get_level(), level)].depth;
  }

  Hash do_get_hash(td::uint32 level) const override {
    return level_info_[std::min<td::uint32>(level_mask_.get_level(), level)].hash;
  }

  td::uint8 construct_d1(td::uint32 level) const {
    return static_cast<td::uint8>(refs_cnt_ + (is_special() << 3) + (get_level_mask().apply(level).get_mask() << 5));
  }

  td::uint8 construct_d2() const {
    return static_cast<td::uint8>(bit_length_ / 8 + (bit_length_ + 7) / 8);
  }

  unsigned bit_length_;
  unsigned refs_cnt_;
  SpecialType type_;
  LevelMask level_mask_;
  td::uint64 tree_cell_count_{1};
  td::uint64 tree_bits_count_{0};
  std::array<detail::LevelInfo, max_level + 1> level_info_{};
  std::array<unsigned char, max_bytes> data_{};
  std::array<Ref<Cell>, max_refs> refs_;
};

std::ostream& operator<<(std::ostream& os, const DataCell& c);

}  // namespace vm
