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

#include <cstring>
#include <string_view>

namespace td {

class Slice {
 public:
  Slice() = default;
  Slice(const char *s, std::size_t len) : s_(s), len_(len) {
  }
  Slice(const unsigned char *s, std::size_t len) : s_(reinterpret_cast<const char *>(s)), len_(len) {
  }
  Slice(const char *s, const char *t) : s_(s), len_(static_cast<std::size_t>(t - s)) {
  }
  Slice(const string &s) : s_(s.data()), len_(s.size()) {
  }
  Slice(std::string_view s) : s_(s.data()), len_(s.size()) {
  }
  Slice(const char *s) : s_(s), len_(std::strlen(s)) {
  }

  bool empty() const {
    return len_ == 0;
  }
  std::size_t size() const {
    return len_;
  }
  const char *data() const {
    return s_;
  }
  const unsigned char *ubegin() const {
    return reinterpret_cast<const unsigned char *>(s_);
  }
  const char *begin() const {
    return s_;
  }
  const char *end() const {
    return s_ + len_;
  }
  char operator[](std::size_t i) const {
    return s_[i];
  }

  Slice substr(std::size_t from) const {
    return from >= len_ ? Slice(s_ + len_, std::size_t{0}) : Slice(s_ + from, len_ - from);
  }
  Slice substr(std::size_t from, std::size_t size) const {
    auto rest = substr(from);
    return Slice(rest.s_, size < rest.len_ ? size : rest.len_);
  }
  Slice truncate(std::size_t size) const {
    return substr(0, size);
  }
  void remove_prefix(std::size_t prefix_len) {
    if (prefix_len > len_) {
      prefix_len = len_;
    }
    s_ += prefix_len;
    len_ -= prefix_len;
  }

  string str() const {
    return string(s_, len_);
  }
  std::string_view sv() const {
    return std::string_view(s_, len_);
  }

 private:
  const char *s_{""};
  std::size_t len_{0};
};

class MutableSlice {
 public:
  MutableSlice() = default;
  MutableSlice(char *s, std::size_t len) : s_(s), len_(len) {
  }
  MutableSlice(unsigned char *s, std::size_t len) : s_(reinterpret_cast<char *>(s)), len_(len) {
  }
  MutableSlice(string &s) : s_(&s[0]), len_(s.size()) {
  }

  operator Slice() const {
    return Slice(s_, len_);
  }
  bool empty() const {
    return len_ == 0;
  }
  std::size_t size() const {
    return len_;
  }
  char *data() const {
    return s_;
  }
  unsigned char *ubegin() const {
    return reinterpret_cast<unsigned char *>(s_);
  }
  void copy_from(Slice from) const {
    std::memcpy(s_, from.data(), from.size() < len_ ? from.size() : len_);
  }

 private:
  char *s_{nullptr};
  std::size_t len_{0};
};

inline bool operator==(Slice a, Slice b) {
  return a.size() == b.size() && std::memcmp(a.data(), b.data(), a.size()) == 0;
}

inline bool operator!=(Slice a, Slice b) {
  return !(a == b);
}

inline bool begins_with(Slice str, Slice prefix) {
  return str.size() >= prefix.size() && str.substr(0, prefix.size()) == prefix;
}

}  // namespace td
