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
#include "td/utils/Random.h"

#include <random>

namespace td {

uint32 Random::fast_uint32() {
  static thread_local std::mt19937 gen{std::random_device{}()};
  return static_cast<uint32>(gen());
}

uint64 Random::fast_uint64() {
  static thread_local std::mt19937_64 gen{std::random_device{}()};
  return static_cast<uint64>(gen());
}

int Random::fast(int min, int max) {
  if (min == max) {
    return min;
  }
  return static_cast<int>(min + fast_uint32() % (static_cast<uint32>(max) - static_cast<uint32>(min) + 1));
}

Random::Xorshift128plus::Xorshift128plus(uint64 seed) {
  auto next = [&]() {
    // splitmix64
    seed += static_cast<uint64>(0x9E3779B97F4A7C15ull);
    uint64 z = seed;
    z = (z ^ (z >> 30)) * static_cast<uint64>(0xBF58476D1CE4E5B9ull);
    z = (z ^ (z >> 27)) * static_cast<uint64>(0x94D049BB133111EBull);
    return z ^ (z >> 31);
  };
  seed_[0] = next();
  seed_[1] = next();
}

Random::Xorshift128plus::Xorshift128plus(uint64 seed_a, uint64 seed_b) {
  seed_[0] = seed_a;
  seed_[1] = seed_b;
}

uint64 Random::Xorshift128plus::operator()() {
  uint64 x = seed_[0];
  const uint64 y = seed_[1];
  seed_[0] = y;
  x ^= x << 23;
  seed_[1] = x ^ y ^ (x >> 17) ^ (y >> 26);
  return seed_[1] + y;
}

int Random::Xorshift128plus::fast(int min, int max) {
  return static_cast<int>((*this)() % (static_cast<uint64>(max) - static_cast<uint64>(min) + 1) + min);
}

int64 Random::Xorshift128plus::fast64(int64 min, int64 max) {
  return static_cast<int64>((*this)() % (static_cast<uint64>(max) - static_cast<uint64>(min) + 1) + min);
}

void Random::Xorshift128plus::bytes(MutableSlice dest) {
  int cnt = 0;
  uint64 buf = 0;
  for (std::size_t i = 0; i < dest.size(); i++) {
    if (cnt == 0) {
      buf = operator()();
      cnt = 8;
    }
    cnt--;
    dest.ubegin()[i] = static_cast<unsigned char>(buf & 255);
    buf >>= 8;
  }
}

}  // namespace td
