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

#include "td/utils/common.h"
#include "td/utils/Slice.h"
#include "td/utils/StringBuilder.h"

#include <absl/hash/hash.h>

#include <array>
#include <cstring>

namespace td {

template <class Pt>
struct BitPtrGen;

using BitPtr = BitPtrGen<unsigned char>;
using ConstBitPtr = BitPtrGen<const unsigned char>;

namespace bitstring {

inline bool get_bit(const unsigned char *ptr, std::size_t offs) {
  return (ptr[offs >> 3] >> (7 - (offs & 7))) & 1;
}

inline void set_bit(unsigned char *ptr, std::size_t offs, bool val) {
  unsigned char mask = static_cast<unsigned char>(0x80 >> (offs & 7));
  if (val) {
    ptr[offs >> 3] |= mask;
  } else {
    ptr[offs >> 3] &= static_cast<unsigned char>(~mask);
  }
}

void bits_memcpy(unsigned char *to, int to_offs, const unsigned char *from, int from_offs, std::size_t bit_count);
void bits_memcpy(BitPtr to, ConstBitPtr from, std::size_t bit_count);
void bits_memset(unsigned char *to, int to_offs, bool val, std::size_t bit_count);
void bits_memset(BitPtr to, bool val, std::size_t bit_count);
int bits_memcmp(const unsigned char *bs1, int bs1_offs, const unsigned char *bs2, int bs2_offs, std::size_t bit_count,
                std::size_t *same_upto = nullptr);
int bits_memcmp(ConstBitPtr bs1, ConstBitPtr bs2, std::size_t bit_count, std::size_t *same_upto = nullptr);
std::size_t bits_memscan(ConstBitPtr ptr, std::size_t bit_count, bool cmp_to);

void bits_store_long(BitPtr to, unsigned long long val, unsigned top_bits);
unsigned long long bits_load_ulong(ConstBitPtr from, unsigned top_bits);
long long bits_load_long(ConstBitPtr from, unsigned top_bits);

std::string bits_to_binary(ConstBitPtr bits, std::size_t len);
std::string bits_to_hex(ConstBitPtr bits, std::size_t len);
long parse_bitstring_hex_literal(unsigned char *buff, std::size_t buff_size, const char *str, const char *str_end);

}  // namespace bitstring

template <class Pt>
struct BitPtrGen {
  Pt *ptr;
  int offs;
  BitPtrGen(Pt *_ptr, int _offs = 0) : ptr(_ptr), offs(_offs) {
  }
  template <class Pt2, std::enable_if_t<std::is_convertible<Pt2 *, Pt *>::value, int> = 0>
  BitPtrGen(BitPtrGen<Pt2> val) : ptr(val.ptr), offs(val.offs) {
  }
  BitPtrGen operator+(int diff) const {
    return BitPtrGen{ptr, offs + diff};
  }
  BitPtrGen operator-(int diff) const {
    return BitPtrGen{ptr, offs - diff};
  }
  BitPtrGen &operator+=(int diff) {
    offs += diff;
    return *this;
  }
  BitPtrGen &advance(int diff) {
    offs += diff;
    return *this;
  }
  bool operator[](int i) const {
    return bitstring::get_bit(ptr, static_cast<std::size_t>(offs + i));
  }
  unsigned long long get_uint(unsigned bits) const {
    return bitstring::bits_load_ulong(*this, bits);
  }
  long long get_int(unsigned bits) const {
    return bitstring::bits_load_long(*this, bits);
  }
  void store_uint(unsigned long long val, unsigned bits) const {
    bitstring::bits_store_long(*this, val, bits);
  }
  void set_bit(int i, bool val) const {
    bitstring::set_bit(ptr, static_cast<std::size_t>(offs + i), val);
  }
  void copy_from(ConstBitPtr from, std::size_t bit_count) const {
    bitstring::bits_memcpy(*this, from, bit_count);
  }
  void fill(bool val, std::size_t bit_count) const {
    bitstring::bits_memset(*this, val, bit_count);
  }
  int compare(ConstBitPtr other, std::size_t bit_count, std::size_t *same_upto = nullptr) const {
    return bitstring::bits_memcmp(*this, other, bit_count, same_upto);
  }
  bool equals(ConstBitPtr other, std::size_t bit_count) const {
    return !compare(other, bit_count);
  }
  std::size_t scan(bool value, std::size_t bit_count) const {
    return bitstring::bits_memscan(*this, bit_count, value);
  }
  std::string to_hex(std::size_t bit_count) const {
    return bitstring::bits_to_hex(*this, bit_count);
  }
  std::string to_binary(std::size_t bit_count) const {
    return bitstring::bits_to_binary(*this, bit_count);
  }
};

template <unsigned n>
class BitArray {
  static constexpr unsigned m = (n + 7) >> 3;
  std::array<unsigned char, m> bytes{};

 public:
  BitArray() = default;
  explicit BitArray(ConstBitPtr from) {
    bits().copy_from(from, n);
  }
  explicit BitArray(long long val) {
    bits().store_uint(static_cast<unsigned long long>(val), n);
  }
  BitArray &operator=(ConstBitPtr from) {
    bits().copy_from(from, n);
    return *this;
  }
  static constexpr unsigned size() {
    return n;
  }
  static constexpr unsigned size_bytes() {
    return m;
  }
  unsigned char *data() {
    return bytes.data();
  }
  const unsigned char *data() const {
    return bytes.data();
  }
  BitPtr bits() {
    return BitPtr{bytes.data()};
  }
  ConstBitPtr bits() const {
    return ConstBitPtr{bytes.data()};
  }
  ConstBitPtr cbits() const {
    return ConstBitPtr{bytes.data()};
  }
  Slice as_slice() const {
    return Slice(bytes.data(), m);
  }
  MutableSlice as_slice() {
    return MutableSlice(bytes.data(), m);
  }
  bool operator[](int i) const {
    return bits()[i];
  }
  void set_zero() {
    bytes.fill(0);
  }
  void set_ones() {
    bits().fill(true, n);
  }
  bool is_zero() const {
    return cbits().scan(false, n) == n;
  }
  static BitArray zero() {
    return BitArray{};
  }
  int compare(const BitArray &other) const {
    return cbits().compare(other.cbits(), n);
  }
  bool operator==(const BitArray &other) const {
    return bytes == other.bytes;
  }
  bool operator!=(const BitArray &other) const {
    return bytes != other.bytes;
  }
  bool operator<(const BitArray &other) const {
    return compare(other) < 0;
  }
  std::string to_hex() const {
    return cbits().to_hex(n);
  }
  std::string to_binary() const {
    return cbits().to_binary(n);
  }
  bool from_hex(Slice hex_str) {
    if (hex_str.size() * 4 != n) {
      return false;
    }
    return bitstring::parse_bitstring_hex_literal(data(), m, hex_str.begin(), hex_str.end()) == static_cast<long>(n);
  }

  template <typename H>
  friend H AbslHashValue(H h, const BitArray &value) {
    return H::combine_contiguous(std::move(h), value.bytes.data(), m);
  }
};

using Bits256 = BitArray<256>;

template <unsigned n>
StringBuilder &operator<<(StringBuilder &sb, const BitArray<n> &value) {
  return sb << value.to_hex();
}

}  // namespace td
