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

#include <cstdio>

namespace td {

class StringBuilder {
 public:
  StringBuilder() = default;

  StringBuilder &ref() {
    return *this;
  }

  void clear() {
    buf_.clear();
  }
  bool empty() const {
    return buf_.empty();
  }
  Slice as_cslice() const {
    return Slice(buf_);
  }
  const string &as_string() const {
    return buf_;
  }
  string move_as_string() {
    return std::move(buf_);
  }

  StringBuilder &operator<<(const char *str) {
    buf_ += str;
    return *this;
  }
  StringBuilder &operator<<(Slice slice) {
    buf_.append(slice.data(), slice.size());
    return *this;
  }
  StringBuilder &operator<<(const string &str) {
    buf_ += str;
    return *this;
  }
  StringBuilder &operator<<(char c) {
    buf_ += c;
    return *this;
  }
  StringBuilder &operator<<(bool b) {
    buf_ += b ? "true" : "false";
    return *this;
  }
  StringBuilder &operator<<(unsigned char x) {
    return *this << static_cast<unsigned>(x);
  }
  StringBuilder &operator<<(int x) {
    return append_format("%d", x);
  }
  StringBuilder &operator<<(unsigned x) {
    return append_format("%u", x);
  }
  StringBuilder &operator<<(long x) {
    return append_format("%ld", x);
  }
  StringBuilder &operator<<(unsigned long x) {
    return append_format("%lu", x);
  }
  StringBuilder &operator<<(long long x) {
    return append_format("%lld", x);
  }
  StringBuilder &operator<<(unsigned long long x) {
    return append_format("%llu", x);
  }
  StringBuilder &operator<<(double x) {
    return append_format("%.6f", x);
  }
  StringBuilder &operator<<(const void *ptr) {
    return append_format("%p", ptr);
  }

 private:
  string buf_;

  template <class T>
  StringBuilder &append_format(const char *fmt, T x) {
    char tmp[64];
    int len = std::snprintf(tmp, sizeof(tmp), fmt, x);
    if (len > 0) {
      buf_.append(tmp, static_cast<std::size_t>(len));
    }
    return *this;
  }
};

namespace detail {
struct Stringify {
  string operator&(StringBuilder &sb) const {
    return sb.move_as_string();
  }
};
}  // namespace detail

}  // namespace td

#define PSTRING() ::td::detail::Stringify() & ::td::StringBuilder().ref()
#define PSLICE() PSTRING()
