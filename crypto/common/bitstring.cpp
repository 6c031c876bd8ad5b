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
#include "common/bitstring.h"

#include "td/utils/logging.h"

#include <cstdint>

namespace td {
namespace bitstring {

void bits_memcpy(unsigned char *to, int to_offs, const unsigned char *from, int from_offs, std::size_t bit_count) {
  if (bit_count == 0) {
    return;
  }
  from += from_offs >> 3;
  to += to_offs >> 3;
  from_offs &= 7;
  to_offs &= 7;
  auto src = reinterpret_cast<std::uintptr_t>(from) * 8 + static_cast<std::uintptr_t>(from_offs);
  auto dst = reinterpret_cast<std::uintptr_t>(to) * 8 + static_cast<std::uintptr_t>(to_offs);
  if (dst == src) {
    return;
  }
  if (dst > src && dst < src + bit_count) {
    // overlapping ranges with the destination after the source
    for (std::size_t i = bit_count; i > 0; i--) {
      set_bit(to, to_offs + i - 1, get_bit(from, from_offs + i - 1));
    }
    return;
  }
  if (from_offs == 0 && to_offs == 0 && (dst + bit_count <= src || src + bit_count <= dst)) {
    std::size_t bytes = bit_count >> 3;
    std::memcpy(to, from, bytes);
    for (std::size_t i = bytes * 8; i < bit_count; i++) {
      set_bit(to, i, get_bit(from, i));
    }
    return;
  }
  for (std::size_t i = 0; i < bit_count; i++) {
    set_bit(to, to_offs + i, get_bit(from, from_offs + i));
  }
}

void bits_memcpy(BitPtr to, ConstBitPtr from, std::size_t bit_count) {
  bits_memcpy(to.ptr, to.offs, from.ptr, from.offs, bit_count);
}

void bits_memset(unsigned char *to, int to_offs, bool val, std::size_t bit_count) {
  for (std::size_t i = 0; i < bit_count; i++) {
    set_bit(to, to_offs + i, val);
  }
}

void bits_memset(BitPtr to, bool val, std::size_t bit_count) {
  bits_memset(to.ptr, to.offs, val, bit_count);
}

int bits_memcmp(const unsigned char *bs1, int bs1_offs, const unsigned char *bs2, int bs2_offs, std::size_t bit_count,
                std::size_t *same_upto) {
  for (std::size_t i = 0; i < bit_count; i++) {
    bool b1 = get_bit(bs1, bs1_offs + i);
    bool b2 = get_bit(bs2, bs2_offs + i);
    if (b1 != b2) {
      if (same_upto) {
        *same_upto = i;
      }
      return b1 ? 1 : -1;
    }
  }
  if (same_upto) {
    *same_upto = bit_count;
  }
  return 0;
}

int bits_memcmp(ConstBitPtr bs1, ConstBitPtr bs2, std::size_t bit_count, std::size_t *same_upto) {
  return bits_memcmp(bs1.ptr, bs1.offs, bs2.ptr, bs2.offs, bit_count, same_upto);
}

std::size_t bits_memscan(ConstBitPtr ptr, std::size_t bit_count, bool cmp_to) {
  std::size_t i = 0;
  while (i < bit_count && ptr[static_cast<int>(i)] == cmp_to) {
    i++;
  }
  return i;
}

void bits_store_long(BitPtr to, unsigned long long val, unsigned top_bits) {
  CHECK(top_bits <= 64);
  for (unsigned i = 0; i < top_bits; i++) {
    to.set_bit(static_cast<int>(i), (val >> (top_bits - 1 - i)) & 1);
  }
}

unsigned long long bits_load_ulong(ConstBitPtr from, unsigned top_bits) {
  CHECK(top_bits <= 64);
  unsigned long long res = 0;
  for (unsigned i = 0; i < top_bits; i++) {
    res = (res << 1) | static_cast<unsigned long long>(from[static_cast<int>(i)]);
  }
  return res;
}

long long bits_load_long(ConstBitPtr from, unsigned top_bits) {
  if (top_bits == 0) {
    return 0;
  }
  auto value = bits_load_ulong(from, top_bits);
  if (top_bits < 64 && ((value >> (top_bits - 1)) & 1)) {
    value |= ~0ULL << top_bits;
  }
  return static_cast<long long>(value);
}

std::string bits_to_binary(ConstBitPtr bits, std::size_t len) {
  std::string res(len, '0');
  for (std::size_t i = 0; i < len; i++) {
    if (bits[static_cast<int>(i)]) {
      res[i] = '1';
    }
  }
  return res;
}

// incomplete trailing nibbles are completed with a 1 bit and zeroes and marked with '_'
std::string bits_to_hex(ConstBitPtr bits, std::size_t len) {
  static const char hex_digits[] = "0123456789ABCDEF";
  std::string res;
  res.reserve((len + 3) / 4 + 1);
  std::size_t i = 0;
  for (; i + 4 <= len; i += 4) {
    res += hex_digits[bits_load_ulong(bits + static_cast<int>(i), 4)];
  }
  if (i < len) {
    unsigned rest = static_cast<unsigned>(len - i);
    auto nibble = (bits_load_ulong(bits + static_cast<int>(i), rest) << (4 - rest)) | (1u << (3 - rest));
    res += hex_digits[nibble];
    res += '_';
  }
  return res;
}

long parse_bitstring_hex_literal(unsigned char *buff, std::size_t buff_size, const char *str, const char *str_end) {
  std::size_t bits = 0;
  BitPtr to{buff};
  for (const char *ptr = str; ptr < str_end; ptr++) {
    int c = *ptr, val;
    if (c >= '0' && c <= '9') {
      val = c - '0';
    } else if (c >= 'A' && c <= 'F') {
      val = c - 'A' + 10;
    } else if (c >= 'a' && c <= 'f') {
      val = c - 'a' + 10;
    } else {
      return -1 - static_cast<long>(ptr - str);
    }
    if (bits + 4 > buff_size * 8) {
      return -1 - static_cast<long>(ptr - str);
    }
    (to + static_cast<int>(bits)).store_uint(static_cast<unsigned long long>(val), 4);
    bits += 4;
  }
  return static_cast<long>(bits);
}

}  // namespace bitstring
}  // namespace td
