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
#include "td/utils/tests.h"

#include <chrono>

namespace td {

TestsRunner &TestsRunner::get_default() {
  static TestsRunner default_runner;
  return default_runner;
}

void TestsRunner::add_test(string name, unique_ptr<Test> test) {
  for (auto &it : tests_) {
    if (it.first == name) {
      LOG(FATAL) << "Test name collision " << name;
    }
  }
  tests_.emplace_back(name, std::move(test));
}

void TestsRunner::add_substr_filter(string str) {
  if (str[0] != '+' && str[0] != '-') {
    str = "+" + str;
  }
  substr_filters_.push_back(std::move(str));
}

bool TestsRunner::is_selected(Slice name) const {
  bool ok = true;
  for (const auto &filter : substr_filters_) {
    bool is_match = name.sv().find(Slice(filter).substr(1).sv()) != std::string_view::npos;
    if (is_match != (filter[0] == '+')) {
      ok = false;
      break;
    }
  }
  return ok;
}

void TestsRunner::run_all() {
  std::size_t run_count = 0;
  auto total_start = std::chrono::steady_clock::now();
  for (auto &it : tests_) {
    if (!is_selected(it.first)) {
      continue;
    }
    LOG(ERROR) << "Run [name:" << it.first << "]";
    auto start = std::chrono::steady_clock::now();
    it.second->run();
    auto elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
    if (elapsed > 1.0) {
      LOG(ERROR) << "Test [name:" << it.first << "] took " << elapsed << "s";
    }
    run_count++;
  }
  auto total = std::chrono::duration<double>(std::chrono::steady_clock::now() - total_start).count();
  LOG(ERROR) << "Run " << run_count << " tests in " << total << "s";
}

}  // namespace td
