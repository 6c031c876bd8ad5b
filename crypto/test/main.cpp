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
#include "td/utils/OptionParser.h"
#include "td/utils/logging.h"
#include "td/utils/misc.h"
#include "td/utils/tests.h"

int main(int argc, char* argv[]) {
  SET_VERBOSITY_LEVEL(verbosity_ERROR);

  td::OptionParser p;
  p.set_description("account state and proof tests");
  p.add_option('f', "filter", "run only tests matching filter",
               [](td::Slice arg) { td::TestsRunner::get_default().add_substr_filter(arg.str()); });
  p.add_checked_option('v', "verbosity", "set verbosity level", [](td::Slice arg) {
    TRY_RESULT(v, td::to_integer_safe<int>(arg));
    SET_VERBOSITY_LEVEL(VERBOSITY_NAME(FATAL) + v);
    return td::Status::OK();
  });
  p.run(argc, argv).ensure();

  td::TestsRunner::get_default().run_all();
  return 0;
}
