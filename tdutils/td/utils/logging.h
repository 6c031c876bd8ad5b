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

/*
 * Simple logging.
 *
 * Predefined log levels: FATAL, ERROR, WARNING, INFO, DEBUG
 *
 * LOG(WARNING) << "Hello world!";
 * LOG(INFO) << "Hello " << 1234 << " world!";
 * LOG_IF(INFO, condition) << "Hello world if condition!";
 *
 * Custom log levels may be defined and used using VLOG:
 * int VERBOSITY_NAME(custom) = VERBOSITY_NAME(WARNING);
 * VLOG(custom) << "Hello custom world!"
 *
 * LOG(FATAL) << "Power is off";
 * CHECK(condition) <===> LOG_IF(FATAL, !(condition))
 */

#include "td/utils/common.h"
#include "td/utils/Slice.h"
#include "td/utils/StringBuilder.h"

#define VERBOSITY_NAME(x) verbosity_##x

#define GET_VERBOSITY_LEVEL() (::td::get_verbosity_level())
#define SET_VERBOSITY_LEVEL(new_level) (::td::set_verbosity_level(new_level))

#define LOG_IS_ON(level) (VERBOSITY_NAME(level) <= GET_VERBOSITY_LEVEL())

#define LOGGER(level) ::td::Logger(*::td::log_interface, VERBOSITY_NAME(level), __FILE__, __LINE__)

#define LOG_IMPL(level, condition) \
  !(LOG_IS_ON(level) && (condition)) ? (void)0 : ::td::detail::Voidify() & LOGGER(level).ref()

#define LOG(level) LOG_IMPL(level, true)
#define LOG_IF(level, condition) LOG_IMPL(level, condition)

#define VLOG(level) LOG_IMPL(level, true)
#define VLOG_IF(level, condition) LOG_IMPL(level, condition)

#define LOG_CHECK(condition) LOG_IF(FATAL, !(condition)) << "Check `" #condition "` failed: "

#define CHECK(condition)                                               \
  if (unlikely(!(condition))) {                                        \
    ::td::detail::process_check_error(#condition, __FILE__, __LINE__); \
  }

#ifdef NDEBUG
#define DCHECK(condition) static_cast<void>(0)
#else
#define DCHECK(condition) CHECK(condition)
#endif

#define UNREACHABLE() ::td::detail::process_check_error("Unreachable", __FILE__, __LINE__)

constexpr int VERBOSITY_NAME(PLAIN) = -1;
constexpr int VERBOSITY_NAME(FATAL) = 0;
constexpr int VERBOSITY_NAME(ERROR) = 1;
constexpr int VERBOSITY_NAME(WARNING) = 2;
constexpr int VERBOSITY_NAME(INFO) = 3;
constexpr int VERBOSITY_NAME(DEBUG) = 4;
constexpr int VERBOSITY_NAME(NEVER) = 1024;

namespace td {

int get_verbosity_level();
void set_verbosity_level(int new_verbosity_level);

class LogInterface {
 public:
  LogInterface() = default;
  LogInterface(const LogInterface &) = delete;
  LogInterface &operator=(const LogInterface &) = delete;
  virtual ~LogInterface() = default;

  virtual void append(Slice slice, int log_level) = 0;
};

class StderrLog final : public LogInterface {
 public:
  void append(Slice slice, int log_level) final;
};

extern LogInterface *const default_log_interface;
extern LogInterface *log_interface;

class Logger {
 public:
  Logger(LogInterface &log, int log_level, const char *file_name, int line_num);
  Logger(const Logger &) = delete;
  Logger &operator=(const Logger &) = delete;
  ~Logger();

  Logger &ref() {
    return *this;
  }

  template <class T>
  Logger &operator<<(const T &other) {
    sb_ << other;
    return *this;
  }

 private:
  LogInterface &log_;
  StringBuilder sb_;
  int log_level_;
};

namespace detail {

class Voidify {
 public:
  template <class T>
  void operator&(const T &) {
  }
};

[[noreturn]] void process_check_error(const char *message, const char *file, int line);

}  // namespace detail

[[noreturn]] void process_fatal_error(Slice message);

}  // namespace td
