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
#include "vm/excno.hpp"

namespace vm {

const char* get_exception_msg(Excno exc_no) {
  switch (exc_no) {
    case Excno::none:
      return "normal termination";
    case Excno::range_chk:
      return "integer out of range";
    case Excno::type_chk:
      return "invalid value type";
    case Excno::cell_ov:
      return "cell overflow";
    case Excno::cell_und:
      return "cell underflow";
    case Excno::dict_err:
      return "dictionary error";
    case Excno::unknown:
      return "unknown error";
    case Excno::fatal:
      return "fatal error";
    case Excno::virt_err:
      return "virtualization error";
    default:
      return "unknown vm exception";
  }
}

std::string VmError::as_string() const {
  return PSTRING() << "VM error: " << get_msg() << " (" << get_errno() << ")";
}

td::StringBuilder& operator<<(td::StringBuilder& sb, const VmError& err) {
  return sb << err.as_string();
}

}  // namespace vm
