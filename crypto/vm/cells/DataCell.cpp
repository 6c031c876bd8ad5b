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
#include "openssl/digest.hpp"
#include "vm/cells/DataCell.h"

#include <algorithm>
#include <cstring>
#include <limits>
#include <ostream>

namespace vm {

namespace {

td::uint64 saturating_add(td::uint64 a, td::uint64 b) {
  return a > std::numeric_limits<td::uint64>::max() - b ? std::numeric_limits<td::uint64>::max() : a + b;
}

class CellChecker {
 public:
  CellChecker(bool is_special, td::Slice data, int bit_length, td::Span<Ref<Cell>> refs)
      : is_special_(is_special)
      , refs_(refs)
      , refs_cnt_(static_cast<int>(refs.size()))
      , data_(data)
      , bit_length_(bit_length) {
  }

  td::Status check_and_compute_level_info() {
    type_ = Cell::SpecialType::Ordinary;

    if (is_special_) {
      if (bit_length_ < 8) {
        return td::Status::Error("Not enough data for a special cell");
      }

      type_ = static_cast<Cell::SpecialType>(read_byte(0));
      if (type_ == Cell::SpecialType::Ordinary) {
        return td::Status::Error("Invalid special cell type");
      }
    }

    switch (type_) {
      case Cell::SpecialType::Ordinary:
        TRY_STATUS(check_ordinary_cell());
        break;
      case Cell::SpecialType::PrunnedBranch:
        TRY_STATUS(check_pruned_branch());
        break;
      case Cell::SpecialType::MerkleProof:
        TRY_STATUS(check_merkle_proof());
        break;
      default:
        return td::Status::Error(PSLICE() << "Unsupported special cell type " << static_cast<int>(type_));
    }

    if (*std::max_element(depth_.begin(), depth_.end()) > CellTraits::max_depth) {
      return td::Status::Error("Depth is too big");
    }

    for (int i = 0; i < refs_cnt_; ++i) {
      tree_cell_count_ = saturating_add(tree_cell_count_, refs_[i]->get_tree_cell_count());
      tree_bits_count_ = saturating_add(tree_bits_count_, refs_[i]->get_tree_bits_count());
    }

    // Hashes of the levels that are not significant coincide with the next significant one.
    int last_computed_hash = -1;

    for (int i = 0; i <= max_level; ++i) {
      if (!level_mask_.is_significant(i + 1) && i != max_level) {
        continue;
      }

      compute_hash(i, last_computed_hash);
      for (int j = last_computed_hash + 1; j < i; ++j) {
        hash_[j] = hash_[i];
      }
      last_computed_hash = i;
    }

    return {};
  }

  Cell::SpecialType type() const {
    return type_;
  }

  Cell::LevelMask level_mask() const {
    return level_mask_;
  }

  std::array<td::uint16, 4> const& depths() const {
    return depth_;
  }

  std::array<CellHash, 4> const& hashes() const {
    return hash_;
  }

  td::uint64 tree_cell_count() const {
    return tree_cell_count_;
  }

  td::uint64 tree_bits_count() const {
    return tree_bits_count_;
  }

 private:
  static constexpr int max_level = CellTraits::max_level;
  static constexpr int hash_bytes = CellTraits::hash_bytes;
  static constexpr int depth_bytes = CellTraits::depth_bytes;

  td::uint8 read_byte(std::size_t i) {
    return static_cast<td::uint8>(data_[i]);
  }

  td::Status check_ordinary_cell() {
    for (int i = 0; i < refs_cnt_; ++i) {
      level_mask_ = level_mask_.apply_or(refs_[i]->get_level_mask());

      for (int j = 0; j <= max_level; ++j) {
        depth_[j] = std::max<td::uint16>(depth_[j], static_cast<td::uint16>(refs_[i]->get_depth(j)));
      }
    }

    if (refs_cnt_ != 0) {
      for (auto& depth : depth_) {
        ++depth;
      }
    }

    return {};
  }

  td::Status check_pruned_branch() {
    if (refs_cnt_ != 0) {
      return td::Status::Error("Pruned branch cannot have references");
    }
    if (bit_length_ < 16) {
      return td::Status::Error("Length mismatch in a pruned branch");
    }

    level_mask_ = Cell::LevelMask{read_byte(1)};
    if (level_mask_.get_level() == 0 || level_mask_.get_level() > max_level) {
      return td::Status::Error("Invalid level mask in a pruned branch");
    }

    int hashes_count = static_cast<int>(level_mask_.get_hash_i());
    auto expected_byte_size = 2 + hashes_count * (hash_bytes + depth_bytes);

    if (bit_length_ != expected_byte_size * 8) {
      return td::Status::Error("Length mismatch in a pruned branch");
    }

    for (int i = max_level; i--;) {
      if (level_mask_.is_significant(i + 1)) {
        int hashes_before = static_cast<int>(level_mask_.apply(i).get_hash_i());
        auto offset = 2 + hashes_count * hash_bytes + hashes_before * depth_bytes;
        depth_[i] = DataCell::load_depth(data_.ubegin() + offset);
      } else {
        depth_[i] = depth_[i + 1];
      }
    }

    return {};
  }

  td::Status check_merkle_proof() {
    if (refs_cnt_ != 1) {
      return td::Status::Error("Merkle proof must have exactly one reference");
    }
    if (bit_length_ != 8 * (1 + hash_bytes + depth_bytes)) {
      return td::Status::Error("Length mismatch in a Merkle proof");
    }

    auto stored_hash = CellHash::from_slice(data_.substr(1, hash_bytes));
    if (stored_hash != refs_[0]->get_hash(0)) {
      return td::Status::Error("Invalid hash in a Merkle proof");
    }

    td::uint16 stored_depth = DataCell::load_depth(data_.ubegin() + 1 + hash_bytes);
    if (stored_depth != refs_[0]->get_depth(0)) {
      return td::Status::Error("Invalid depth in a Merkle proof");
    }

    for (int i = 0; i <= max_level; ++i) {
      depth_[i] = std::max<td::uint16>(depth_[i], static_cast<td::uint16>(refs_[0]->get_depth(i + 1) + 1));
    }

    level_mask_ = refs_[0]->get_level_mask().shift_right();

    return {};
  }

  void compute_hash(int level, int last_computed_hash) {
    if (level != max_level && type_ == Cell::SpecialType::PrunnedBranch) {
      int hashes_before = static_cast<int>(level_mask_.apply(level).get_hash_i());
      auto offset = 2 + hashes_before * hash_bytes;
      hash_[level] = CellHash::from_slice(data_.substr(offset, hash_bytes));
      return;
    }

    static_assert(2 + CellTraits::max_bytes + CellTraits::max_refs * (hash_bytes + depth_bytes) <= 512);
    char data_to_hash[512];
    std::size_t pointer = 0;

    auto add_byte_to_hash = [&](td::uint8 byte) { data_to_hash[pointer++] = static_cast<char>(byte); };

    auto add_slice_to_hash = [&](td::Slice slice) {
      std::memcpy(data_to_hash + pointer, slice.data(), slice.size());
      pointer += slice.size();
    };

    auto d1 = refs_cnt_ + (is_special_ << 3) + (level_mask_.apply(level).get_mask() << 5);
    add_byte_to_hash(static_cast<td::uint8>(d1));
    auto d2 = (bit_length_ >> 3 << 1) + ((bit_length_ & 7) != 0);
    add_byte_to_hash(static_cast<td::uint8>(d2));

    if (last_computed_hash != -1 && type_ != Cell::SpecialType::PrunnedBranch) {
      add_slice_to_hash(hash_[last_computed_hash].as_slice());
    } else {
      add_slice_to_hash(data_.substr(0, bit_length_ / 8));
      // the last incomplete byte is completed with a single 1 bit followed by zeroes
      if (bit_length_ % 8 != 0) {
        td::uint8 last_byte = static_cast<td::uint8>(data_[bit_length_ / 8]);
        last_byte = static_cast<td::uint8>(last_byte >> (7 - bit_length_ % 8));
        last_byte |= 1;
        last_byte = static_cast<td::uint8>(last_byte << (7 - bit_length_ % 8));
        add_byte_to_hash(last_byte);
      }
    }

    bool is_merkle_node = type_ == Cell::SpecialType::MerkleProof;
    auto child_level = (is_merkle_node ? std::min(max_level, level + 1) : level);

    for (int i = 0; i < refs_cnt_; ++i) {
      auto depth = refs_[i]->get_depth(child_level);
      add_byte_to_hash(static_cast<td::uint8>((depth >> 8) & 255));
      add_byte_to_hash(static_cast<td::uint8>(depth & 255));
    }

    for (int i = 0; i < refs_cnt_; ++i) {
      add_slice_to_hash(refs_[i]->get_hash(child_level).as_slice());
    }

    digest::SHA256 hasher;
    hasher.feed(data_to_hash, pointer);
    hasher.extract(hash_[level].as_slice());
  }

  bool is_special_;
  Cell::SpecialType type_{Cell::SpecialType::Ordinary};
  td::Span<Ref<Cell>> refs_;
  int refs_cnt_;
  td::Slice data_;
  int bit_length_;

  Cell::LevelMask level_mask_;
  std::array<td::uint16, max_level + 1> depth_{};
  std::array<CellHash, max_level + 1> hash_{};
  td::uint64 tree_cell_count_{1};
  td::uint64 tree_bits_count_{static_cast<td::uint64>(bit_length_)};
};

}  // namespace

td::Result<Ref<DataCell>> DataCell::create(td::Slice data, int bit_length, td::Span<Ref<Cell>> refs, bool is_special) {
  CHECK(bit_length >= 0 && data.size() * 8 >= static_cast<std::size_t>(bit_length));
  if (refs.size() > CellTraits::max_refs) {
    return td::Status::Error("Too many references");
  }
  if (bit_length > CellTraits::max_bits) {
    return td::Status::Error("Too many data bits");
  }
  for (auto& ref : refs) {
    if (ref.is_null()) {
      return td::Status::Error("Null reference");
    }
  }

  CellChecker checker{is_special, data, bit_length, refs};
  TRY_STATUS(checker.check_and_compute_level_info());

  auto cell = Ref<DataCell>{true, bit_length, refs.size(), checker.type(), checker.level_mask(), PrivateTag{}};
  auto& mutable_cell = cell.unique_write();

  auto mutable_data = mutable_cell.data_.data();
  std::memcpy(mutable_data, data.data(), (bit_length + 7) / 8);
  if (bit_length % 8 != 0) {
    auto& last_byte = mutable_data[bit_length / 8];
    // same padding as used for hashing
    last_byte = static_cast<unsigned char>(last_byte >> (7 - bit_length % 8));
    last_byte |= 1;
    last_byte = static_cast<unsigned char>(last_byte << (7 - bit_length % 8));
  }

  for (int i = 0; i <= max_level; ++i) {
    mutable_cell.level_info_[i].hash = checker.hashes()[i];
    mutable_cell.level_info_[i].depth = checker.depths()[i];
  }
  mutable_cell.tree_cell_count_ = checker.tree_cell_count();
  mutable_cell.tree_bits_count_ = checker.tree_bits_count();

  for (std::size_t i = 0; i < refs.size(); ++i) {
    mutable_cell.refs_[i] = refs[i];
  }

  return std::move(cell);
}

DataCell::DataCell(int bit_length, std::size_t refs_cnt, Cell::SpecialType type, LevelMask level_mask, PrivateTag)
    : bit_length_(static_cast<unsigned>(bit_length))
    , refs_cnt_(static_cast<unsigned>(refs_cnt))
    , type_(type)
    , level_mask_(level_mask) {
}

int DataCell::serialize(unsigned char* buff, int buff_size, bool with_hashes) const {
  int len = get_serialized_size(with_hashes);
  if (len > buff_size) {
    return 0;
  }
  buff[0] = static_cast<unsigned char>(construct_d1(max_level) | (with_hashes * 16));
  buff[1] = construct_d2();
  int hs = 0;
  if (with_hashes) {
    hs = static_cast<int>(get_level_mask().get_hashes_count()) * (hash_bytes + depth_bytes);
    std::memset(buff + 2, 0, hs);
    auto dest = td::MutableSlice(buff + 2, hs);
    auto level = get_level();
    for (unsigned i = 0; i <= level; i++) {
      if (!get_level_mask().is_significant(i)) {
        continue;
      }
      dest.copy_from(get_hash(i).as_slice());
      dest = td::MutableSlice(dest.ubegin() + hash_bytes, dest.size() - hash_bytes);
    }
    for (unsigned i = 0; i <= level; i++) {
      if (!get_level_mask().is_significant(i)) {
        continue;
      }
      store_depth(dest.ubegin(), static_cast<td::uint16>(get_depth(i)));
      dest = td::MutableSlice(dest.ubegin() + depth_bytes, dest.size() - depth_bytes);
    }
    buff += hs;
    len -= hs;
  }
  std::memcpy(buff + 2, get_data(), len - 2);
  return len + hs;
}

std::string DataCell::serialize() const {
  unsigned char buff[max_serialized_bytes];
  int len = serialize(buff, sizeof(buff));
  return std::string(buff, buff + len);
}

std::string DataCell::to_hex() const {
  unsigned char buff[max_serialized_bytes];
  int len = serialize(buff, sizeof(buff));
  static const char hex_digits[] = "0123456789abcdef";
  std::string res;
  res.reserve(2 * len);
  for (int i = 0; i < len; i++) {
    res += hex_digits[buff[i] >> 4];
    res += hex_digits[buff[i] & 15];
  }
  return res;
}

std::ostream& operator<<(std::ostream& os, const DataCell& c) {
  return os << c.to_hex();
}

}  // namespace vm
