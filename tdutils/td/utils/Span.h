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

#include <array>
#include <initializer_list>

namespace td {

namespace detail {
template <class T, class InnerT>
class SpanImpl {
  InnerT *data_{nullptr};
  std::size_t size_{0};

 public:
  SpanImpl() = default;
  SpanImpl(InnerT *data, std::size_t size) : data_(data), size_(size) {
  }
  SpanImpl(InnerT &data) : data_(&data), size_(1) {
  }
  template <std::size_t N>
  SpanImpl(std::array<T, N> &arr) : data_(arr.data()), size_(N) {
  }
  template <std::size_t N>
  SpanImpl(const std::array<T, N> &arr) : data_(arr.data()), size_(N) {
  }
  SpanImpl(const vector<T> &v) : data_(v.data()), size_(v.size()) {
  }
  SpanImpl(vector<T> &v) : data_(v.data()), size_(v.size()) {
  }
  SpanImpl(std::initializer_list<T> list) : data_(list.begin()), size_(list.size()) {
  }
  template <class OtherInnerT>
  SpanImpl(const SpanImpl<T, OtherInnerT> &other) : data_(other.data()), size_(other.size()) {
  }

  InnerT &operator[](std::size_t i) const {
    return data_[i];
  }
  InnerT *data() const {
    return data_;
  }
  InnerT *begin() const {
    return data_;
  }
  InnerT *end() const {
    return data_ + size_;
  }
  std::size_t size() const {
    return size_;
  }
  bool empty() const {
    return size_ == 0;
  }
  SpanImpl substr(std::size_t offset) const {
    return SpanImpl(data_ + offset, size_ - offset);
  }
};
}  // namespace detail

template <class T>
using Span = detail::SpanImpl<T, const T>;

template <class T>
using MutableSpan = detail::SpanImpl<T, T>;

template <class T>
Span<T> as_span(const vector<T> &v) {
  return Span<T>(v);
}

template <class T>
MutableSpan<T> as_mutable_span(vector<T> &v) {
  return MutableSpan<T>(v);
}

}  // namespace td
