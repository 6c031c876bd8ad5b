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
#include "td/utils/logging.h"
#include "td/utils/Slice.h"
#include "td/utils/StringBuilder.h"

#include <new>
#include <type_traits>
#include <utility>

#define TRY_STATUS(status)                 \
  {                                        \
    auto try_status = (status);            \
    if (try_status.is_error()) {           \
      return try_status.move_as_error();   \
    }                                      \
  }

#define TRY_STATUS_PREFIX(status, prefix)                    \
  {                                                          \
    auto try_status = (status);                              \
    if (try_status.is_error()) {                             \
      return try_status.move_as_error_prefix(prefix);        \
    }                                                        \
  }

#define TRY_RESULT(name, result) TRY_RESULT_IMPL(TD_CONCAT(TD_CONCAT(r_, name), __LINE__), auto name, result)

#define TRY_RESULT_ASSIGN(name, result) TRY_RESULT_IMPL(TD_CONCAT(r_response, __LINE__), name, result)

#define TRY_RESULT_PREFIX(name, result, prefix) \
  TRY_RESULT_PREFIX_IMPL(TD_CONCAT(TD_CONCAT(r_, name), __LINE__), auto name, result, prefix)

#define TRY_RESULT_PREFIX_ASSIGN(name, result, prefix) \
  TRY_RESULT_PREFIX_IMPL(TD_CONCAT(r_response, __LINE__), name, result, prefix)

#define TRY_RESULT_IMPL(r_name, name, result) \
  auto r_name = (result);                     \
  if (r_name.is_error()) {                    \
    return r_name.move_as_error();            \
  }                                           \
  name = r_name.move_as_ok();

#define TRY_RESULT_PREFIX_IMPL(r_name, name, result, prefix) \
  auto r_name = (result);                                    \
  if (r_name.is_error()) {                                   \
    return r_name.move_as_error_prefix(prefix);              \
  }                                                          \
  name = r_name.move_as_ok();

namespace td {

class Status {
 public:
  Status() = default;

  Status(const Status &other) : info_(other.info_ ? make_unique<Info>(*other.info_) : nullptr) {
  }
  Status &operator=(const Status &other) {
    info_ = other.info_ ? make_unique<Info>(*other.info_) : nullptr;
    return *this;
  }
  Status(Status &&) noexcept = default;
  Status &operator=(Status &&) noexcept = default;

  static Status OK() {
    return Status();
  }

  static Status Error(int code, Slice message = Slice()) {
    Status res;
    res.info_ = make_unique<Info>(Info{code, message.str()});
    return res;
  }

  static Status Error(Slice message) {
    return Error(0, message);
  }

  static Status Error() {
    return Error(0, Slice());
  }

  bool is_ok() const {
    return !is_error();
  }
  bool is_error() const {
    return info_ != nullptr;
  }

  int code() const {
    return info_ ? info_->code : 0;
  }
  Slice message() const {
    return info_ ? Slice(info_->message) : Slice();
  }
  string to_string() const;

  Status clone() const {
    return *this;
  }
  Status move_as_error() {
    CHECK(is_error());
    return std::move(*this);
  }
  Status move_as_error_prefix(Slice prefix) const {
    CHECK(is_error());
    return Error(code(), PSLICE() << prefix << message());
  }
  Status move_as_error_suffix(Slice suffix) const {
    CHECK(is_error());
    return Error(code(), PSLICE() << message() << suffix);
  }

  void ensure() const {
    if (!is_ok()) {
      LOG(FATAL) << "Unexpected Status " << to_string();
    }
  }
  void ensure_error() const {
    if (is_ok()) {
      LOG(FATAL) << "Unexpected Status::OK";
    }
  }
  void ignore() const {
  }

 private:
  struct Info {
    int code;
    string message;
  };
  unique_ptr<Info> info_;
};

template <class T = Unit>
class Result {
 public:
  using ValueT = T;

  Result() : status_(Status::Error(-1, "Uninitialized Result")) {
  }
  template <class S, std::enable_if_t<!std::is_same<std::decay_t<S>, Result>::value &&
                                          !std::is_same<std::decay_t<S>, Status>::value &&
                                          std::is_constructible<T, S &&>::value,
                                      int> = 0>
  Result(S &&x) : value_(std::forward<S>(x)), has_value_(true) {
  }
  Result(Status &&status) : status_(std::move(status)) {
    CHECK(status_.is_error());
  }
  Result(const Result &) = delete;
  Result &operator=(const Result &) = delete;
  Result(Result &&other) noexcept : status_(std::move(other.status_)), has_value_(other.has_value_) {
    if (has_value_) {
      new (&value_) T(std::move(other.value_));
    }
  }
  Result &operator=(Result &&other) noexcept {
    if (this == &other) {
      return *this;
    }
    reset();
    status_ = std::move(other.status_);
    has_value_ = other.has_value_;
    if (has_value_) {
      new (&value_) T(std::move(other.value_));
    }
    return *this;
  }
  ~Result() {
    reset();
  }

  bool is_ok() const {
    return has_value_;
  }
  bool is_error() const {
    return !has_value_;
  }
  void ensure() const {
    status_.ensure();
  }
  void ensure_error() const {
    status_.ensure_error();
  }

  const Status &error() const {
    CHECK(is_error());
    return status_;
  }
  Status move_as_error() {
    CHECK(is_error());
    return std::move(status_);
  }
  Status move_as_error_prefix(Slice prefix) const {
    CHECK(is_error());
    return status_.move_as_error_prefix(prefix);
  }

  const T &ok() const {
    LOG_CHECK(has_value_) << status_.to_string();
    return value_;
  }
  T &ok_ref() {
    LOG_CHECK(has_value_) << status_.to_string();
    return value_;
  }
  T move_as_ok() {
    LOG_CHECK(has_value_) << status_.to_string();
    return std::move(value_);
  }

 private:
  Status status_;
  union {
    T value_;
  };
  bool has_value_{false};

  void reset() {
    if (has_value_) {
      value_.~T();
      has_value_ = false;
    }
  }
};

inline StringBuilder &operator<<(StringBuilder &sb, const Status &status) {
  return sb << status.to_string();
}

}  // namespace td
