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

#include <openssl/evp.h>

namespace digest {

struct OpensslEVP_SHA256 {
  enum { digest_bytes = 32 };
  static const EVP_MD *get_evp() {
    return EVP_sha256();
  }
};

template <typename H>
class HashCtx {
  EVP_MD_CTX *ctx{nullptr};
  void init();
  void clear();

 public:
  enum { digest_bytes = H::digest_bytes };
  HashCtx() {
    init();
  }
  HashCtx(const void *data, std::size_t len) {
    init();
    feed(data, len);
  }
  HashCtx(const HashCtx &) = delete;
  HashCtx &operator=(const HashCtx &) = delete;
  ~HashCtx() {
    clear();
  }
  void reset();
  void feed(const void *data, std::size_t len);
  void feed(td::Slice slice) {
    feed(slice.data(), slice.size());
  }
  std::size_t extract(unsigned char buffer[digest_bytes]);
  std::size_t extract(td::MutableSlice slice);
  std::string extract();
};

template <typename H>
void HashCtx<H>::init() {
  ctx = EVP_MD_CTX_create();
  CHECK(ctx != nullptr);
  reset();
}

template <typename H>
void HashCtx<H>::reset() {
  CHECK(EVP_DigestInit_ex(ctx, H::get_evp(), nullptr) == 1);
}

template <typename H>
void HashCtx<H>::clear() {
  EVP_MD_CTX_destroy(ctx);
  ctx = nullptr;
}

template <typename H>
void HashCtx<H>::feed(const void *data, std::size_t len) {
  CHECK(EVP_DigestUpdate(ctx, data, len) == 1);
}

template <typename H>
std::size_t HashCtx<H>::extract(unsigned char buffer[digest_bytes]) {
  unsigned olen = 0;
  CHECK(EVP_DigestFinal_ex(ctx, buffer, &olen) == 1);
  CHECK(olen == digest_bytes);
  return olen;
}

template <typename H>
std::size_t HashCtx<H>::extract(td::MutableSlice slice) {
  CHECK(slice.size() >= digest_bytes);
  return extract(slice.ubegin());
}

template <typename H>
std::string HashCtx<H>::extract() {
  unsigned char buffer[digest_bytes];
  unsigned olen = 0;
  CHECK(EVP_DigestFinal_ex(ctx, buffer, &olen) == 1);
  return std::string(reinterpret_cast<char *>(buffer), olen);
}

using SHA256 = HashCtx<OpensslEVP_SHA256>;

}  // namespace digest
