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

#include <cstring>

namespace td {

void OptionParser::set_description(string description) {
  description_ = std::move(description);
}

void OptionParser::add_option(Option::Type type, char short_key, Slice long_key, Slice description,
                              std::function<Status(Slice)> callback) {
  for (auto &option : options_) {
    if ((short_key != '\0' && option.short_key == short_key) ||
        (!long_key.empty() && Slice(option.long_key) == long_key)) {
      LOG(ERROR) << "Ignore duplicated option '" << (short_key == '\0' ? '-' : short_key) << "' '" << long_key << "'";
    }
  }
  options_.push_back(Option{type, short_key, long_key.str(), description.str(), std::move(callback)});
}

void OptionParser::add_checked_option(char short_key, Slice long_key, Slice description,
                                      std::function<Status(Slice)> callback) {
  add_option(Option::Type::Arg, short_key, long_key, description, std::move(callback));
}

void OptionParser::add_checked_option(char short_key, Slice long_key, Slice description,
                                      std::function<Status(void)> callback) {
  add_option(Option::Type::NoArg, short_key, long_key, description,
             [callback = std::move(callback)](Slice) { return callback(); });
}

void OptionParser::add_option(char short_key, Slice long_key, Slice description,
                              std::function<void(Slice)> callback) {
  add_option(Option::Type::Arg, short_key, long_key, description, [callback = std::move(callback)](Slice parameter) {
    callback(parameter);
    return Status::OK();
  });
}

void OptionParser::add_option(char short_key, Slice long_key, Slice description, std::function<void(void)> callback) {
  add_option(Option::Type::NoArg, short_key, long_key, description, [callback = std::move(callback)](Slice) {
    callback();
    return Status::OK();
  });
}

void OptionParser::add_check(std::function<Status()> check) {
  checks_.push_back(std::move(check));
}

const OptionParser::Option *OptionParser::find_long(Slice long_key) const {
  for (auto &option : options_) {
    if (!option.long_key.empty() && Slice(option.long_key) == long_key) {
      return &option;
    }
  }
  return nullptr;
}

const OptionParser::Option *OptionParser::find_short(char short_key) const {
  for (auto &option : options_) {
    if (option.short_key != '\0' && option.short_key == short_key) {
      return &option;
    }
  }
  return nullptr;
}

Result<vector<char *>> OptionParser::run(int argc, char *argv[], int expected_non_option_count) {
  vector<char *> non_options;
  for (int arg_pos = 1; arg_pos < argc; arg_pos++) {
    const char *arg = argv[arg_pos];
    if (arg[0] != '-' || arg[1] == '\0') {
      non_options.push_back(argv[arg_pos]);
      continue;
    }
    if (std::strcmp(arg, "--") == 0) {
      for (arg_pos++; arg_pos < argc; arg_pos++) {
        non_options.push_back(argv[arg_pos]);
      }
      break;
    }

    if (arg[1] == '-') {
      // long option
      Slice long_arg(arg + 2);
      Slice parameter;
      bool has_equal = false;
      for (std::size_t i = 0; i < long_arg.size(); i++) {
        if (long_arg[i] == '=') {
          parameter = long_arg.substr(i + 1);
          long_arg = long_arg.substr(0, i);
          has_equal = true;
          break;
        }
      }
      auto option = find_long(long_arg);
      if (option == nullptr) {
        return Status::Error(PSLICE() << "Option \"" << long_arg << "\" is unrecognized");
      }
      if (option->type == Option::Type::NoArg) {
        if (has_equal) {
          return Status::Error(PSLICE() << "Option \"" << long_arg << "\" must not have an argument");
        }
        TRY_STATUS(option->arg_callback(Slice()));
        continue;
      }
      if (!has_equal) {
        if (arg_pos + 1 >= argc) {
          return Status::Error(PSLICE() << "Option \"" << long_arg << "\" requires an argument");
        }
        parameter = Slice(argv[++arg_pos]);
      }
      TRY_STATUS(option->arg_callback(parameter));
      continue;
    }

    // one or several short options
    for (std::size_t i = 1; arg[i] != '\0'; i++) {
      auto option = find_short(arg[i]);
      if (option == nullptr) {
        return Status::Error(PSLICE() << "Option \"" << arg[i] << "\" is unrecognized");
      }
      if (option->type == Option::Type::NoArg) {
        TRY_STATUS(option->arg_callback(Slice()));
        continue;
      }
      Slice parameter;
      if (arg[i + 1] != '\0') {
        parameter = Slice(arg + i + 1);
      } else if (arg_pos + 1 < argc) {
        parameter = Slice(argv[++arg_pos]);
      } else {
        return Status::Error(PSLICE() << "Option \"" << arg[i] << "\" requires an argument");
      }
      TRY_STATUS(option->arg_callback(parameter));
      break;
    }
  }

  if (expected_non_option_count >= 0 && non_options.size() != static_cast<std::size_t>(expected_non_option_count)) {
    if (expected_non_option_count == 0) {
      return Status::Error("Unexpected non-option parameters specified");
    }
    if (non_options.size() > static_cast<std::size_t>(expected_non_option_count)) {
      return Status::Error("Too much non-option parameters specified");
    }
    return Status::Error("Too few non-option parameters specified");
  }
  for (auto &check : checks_) {
    TRY_STATUS(check());
  }
  return std::move(non_options);
}

StringBuilder &operator<<(StringBuilder &sb, const OptionParser &o) {
  if (!o.description_.empty()) {
    sb << o.description_ << ". ";
  }
  sb << "Options:\n";
  for (auto &opt : o.options_) {
    sb << "  ";
    if (opt.short_key != '\0') {
      sb << '-' << opt.short_key;
      if (!opt.long_key.empty()) {
        sb << ", ";
      }
    } else {
      sb << "    ";
    }
    if (!opt.long_key.empty()) {
      sb << "--" << opt.long_key;
    }
    if (opt.type == OptionParser::Option::Type::Arg) {
      sb << "<arg>";
    }
    sb << "\t" << opt.description << '\n';
  }
  return sb;
}

}  // namespace td
