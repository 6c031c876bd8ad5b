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
#include "td/utils/StringBuilder.h"

namespace vm {

enum class Excno : int {
  none = 0,
  range_chk = 5,
  type_chk = 7,
  cell_ov = 8,
  cell_und = 9,
  dict_err = 10,
  unknown = 11,
  fatal = 12,
  virt_err = 14
};

const char* get_exception_msg(Excno exc_no);

struct VmError {
  Excno exc_no;
  const char* msg;
  long long arg;
  VmError(Excno _excno, const char* _msg) : exc_no(_excno), msg(_msg), arg(0) {
  }
  VmError(Excno _excno) : exc_no(_excno), msg(nullptr), arg(0) {
  }
  VmError(Excno _excno, const char* _msg, long long _arg) : exc_no(_excno), msg(_msg), arg(_arg) {
  }
  int get_errno() const {
    return static_cast<int>(exc_no);
  }
  const char* get_msg() const {
    return msg ? msg : get_exception_msg(exc_no);
  }
  long long get_arg() const {
    return arg;
  }
  std::string as_string() const;
};

// raised when a pruned branch is reached through a virtualized (Merkle proof) view
struct VmVirtError {
  int virtualization;
  VmVirtError() : virtualization(0) {
  }
  explicit VmVirtError(int virtualization) : virtualization(virtualization) {
  }
  int get_virtualization() const {
    return virtualization;
  }
  const char* get_msg() const {
    return "prunned branch accessed";
  }
};

td::StringBuilder& operator<<(td::StringBuilder& sb, const VmError& err);

}  // namespace vm
