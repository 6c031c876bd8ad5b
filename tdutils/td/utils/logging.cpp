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
#include "td/utils/logging.h"

#include <atomic>
#include <chrono>
#include <cstdlib>
#include <cstring>
#include <iostream>

namespace td {

namespace {
std::atomic<int> verbosity_level{VERBOSITY_NAME(DEBUG) + 1};

Slice strip_path(const char *file_name) {
  const char *last_slash = std::strrchr(file_name, '/');
  return last_slash == nullptr ? Slice(file_name) : Slice(last_slash + 1);
}

double wall_time() {
  auto now = std::chrono::system_clock::now().time_since_epoch();
  return std::chrono::duration_cast<std::chrono::duration<double>>(now).count();
}
}  // namespace

int get_verbosity_level() {
  return verbosity_level.load(std::memory_order_relaxed);
}

void set_verbosity_level(int new_verbosity_level) {
  verbosity_level.store(new_verbosity_level, std::memory_order_relaxed);
}

void StderrLog::append(Slice slice, int log_level) {
  std::cerr.write(slice.data(), static_cast<std::streamsize>(slice.size()));
  if (log_level <= VERBOSITY_NAME(ERROR)) {
    std::cerr.flush();
  }
}

static StderrLog default_log;
LogInterface *const default_log_interface = &default_log;
LogInterface *log_interface = &default_log;

Logger::Logger(LogInterface &log, int log_level, const char *file_name, int line_num)
    : log_(log), log_level_(log_level) {
  if (log_level_ == VERBOSITY_NAME(PLAIN)) {
    return;
  }
  sb_ << '[';
  if (log_level_ < 10) {
    sb_ << ' ';
  }
  sb_ << log_level_ << "][t 0][" << wall_time() << "][" << strip_path(file_name) << ':' << line_num << "]\t";
}

Logger::~Logger() {
  sb_ << '\n';
  log_.append(sb_.as_cslice(), log_level_);
  if (log_level_ == VERBOSITY_NAME(FATAL)) {
    process_fatal_error(sb_.as_cslice());
  }
}

void process_fatal_error(Slice message) {
  TD_UNUSED(message);
  std::abort();
}

namespace detail {

void process_check_error(const char *message, const char *file, int line) {
  {
    Logger logger(*log_interface, VERBOSITY_NAME(ERROR), file, line);
    logger << "Check `" << message << "` failed";
  }
  process_fatal_error(Slice(message));
}

}  // namespace detail

}  // namespace td
