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

#include <atomic>
#include <type_traits>

namespace td {

template <class T>
class Ref;

class CntObject {
 private:
  mutable std::atomic<int> cnt_{1};

 public:
  struct WriteError {};
  CntObject() = default;
  CntObject(const CntObject &) : CntObject() {
  }
  CntObject &operator=(const CntObject &) {
    return *this;
  }
  virtual ~CntObject() = default;

  virtual CntObject *make_copy() const {
    throw WriteError();
  }
  Ref<CntObject> clone() const;

  void inc() const {
    cnt_.fetch_add(1, std::memory_order_relaxed);
  }
  bool dec() const {
    return cnt_.fetch_sub(1, std::memory_order_acq_rel) == 1;
  }
  int get_refcnt() const {
    return cnt_.load(std::memory_order_acquire);
  }
  bool is_unique() const {
    return get_refcnt() == 1;
  }
};

namespace detail {
void safe_delete(const CntObject *ptr);
}  // namespace detail

int64 ref_get_delete_count();

template <class T>
class Ref {
  T *ptr;
  template <class S>
  friend class Ref;

  static void release_shared(T *obj) {
    if (obj != nullptr && obj->dec()) {
      detail::safe_delete(obj);
    }
  }

 public:
  struct acquire_t {};

  Ref() : ptr(nullptr) {
  }
  Ref(std::nullptr_t) : ptr(nullptr) {
  }
  explicit Ref(T *pobj) : ptr(pobj) {
    if (ptr) {
      ptr->inc();
    }
  }
  explicit Ref(const T *pobj) : ptr(const_cast<T *>(pobj)) {
    if (ptr) {
      ptr->inc();
    }
  }
  Ref(T *pobj, acquire_t) : ptr(pobj) {
  }
  template <typename... Args>
  Ref(bool, Args &&...args) : ptr(new T(std::forward<Args>(args)...)) {
  }
  Ref(const Ref &r) : ptr(r.ptr) {
    if (ptr) {
      ptr->inc();
    }
  }
  Ref(Ref &&r) noexcept : ptr(r.ptr) {
    r.ptr = nullptr;
  }
  template <class S, std::enable_if_t<std::is_base_of<T, S>::value, int> = 0>
  Ref(const Ref<S> &r) : ptr(static_cast<T *>(r.ptr)) {
    if (ptr) {
      ptr->inc();
    }
  }
  template <class S, std::enable_if_t<std::is_base_of<T, S>::value, int> = 0>
  Ref(Ref<S> &&r) noexcept : ptr(static_cast<T *>(r.ptr)) {
    r.ptr = nullptr;
  }
  ~Ref() {
    clear();
  }

  Ref &operator=(const Ref &r) {
    if (r.ptr) {
      r.ptr->inc();
    }
    release_shared(ptr);
    ptr = r.ptr;
    return *this;
  }
  Ref &operator=(Ref &&r) noexcept {
    if (this != &r) {
      release_shared(ptr);
      ptr = r.ptr;
      r.ptr = nullptr;
    }
    return *this;
  }
  template <class S, std::enable_if_t<std::is_base_of<T, S>::value, int> = 0>
  Ref &operator=(Ref<S> r) {
    release_shared(ptr);
    ptr = static_cast<T *>(r.ptr);
    r.ptr = nullptr;
    return *this;
  }

  void clear() {
    release_shared(ptr);
    ptr = nullptr;
  }
  bool is_null() const {
    return ptr == nullptr;
  }
  bool not_null() const {
    return ptr != nullptr;
  }
  bool is_unique() const {
    CHECK(ptr != nullptr);
    return ptr->is_unique();
  }

  const T *get() const {
    return ptr;
  }
  const T *operator->() const {
    CHECK(ptr != nullptr);
    return ptr;
  }
  const T &operator*() const {
    CHECK(ptr != nullptr);
    return *ptr;
  }

  // copy-on-write access
  T &write() {
    CHECK(ptr != nullptr);
    if (!ptr->is_unique()) {
      T *copy = dynamic_cast<T *>(ptr->make_copy());
      if (copy == nullptr) {
        throw CntObject::WriteError();
      }
      release_shared(ptr);
      ptr = copy;
    }
    return *ptr;
  }
  T &unique_write() const {
    CHECK(ptr != nullptr && ptr->is_unique());
    return *ptr;
  }

  T *release() {
    auto res = ptr;
    ptr = nullptr;
    return res;
  }

  template <class S>
  Ref<S> cast() const {
    return Ref<S>{dynamic_cast<const S *>(ptr)};
  }

  bool operator==(const Ref &r) const {
    return ptr == r.ptr;
  }
  bool operator!=(const Ref &r) const {
    return ptr != r.ptr;
  }
};

template <class T, class... Args>
Ref<T> make_ref(Args &&...args) {
  return Ref<T>{true, std::forward<Args>(args)...};
}

}  // namespace td
