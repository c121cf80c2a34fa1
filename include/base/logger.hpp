//  psremote - Remote control for PlayStation consoles
//  Copyright (C) 2022  Tim Hughey
//
//  This program is free software: you can redistribute it and/or modify
//  it under the terms of the GNU General Public License as published by
//  the Free Software Foundation, either version 3 of the License, or
//  (at your option) any later version.
//
//  This program is distributed in the hope that it will be useful,
//  but WITHOUT ANY WARRANTY; without even the implied warranty of
//  MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
//  GNU General Public License for more details.
//
//  You should have received a copy of the GNU General Public License
//  along with this program.  If not, see <http://www.gnu.org/licenses/>.
//
//  https://www.wisslanding.com

#pragma once

#include "base/conf/token.hpp"
#include "base/elapsed.hpp"
#include "base/types.hpp"

#include <algorithm>
#include <array>
#include <fmt/format.h>
#include <fmt/os.h>
#include <memory>
#include <mutex>

namespace psremote {

class Logger;

/// @brief The process logger, null until Logger::create() (logging disabled)
extern std::unique_ptr<Logger> _logger;

/// @brief Line oriented log written to --log-file or stdout
///
///        Each line carries the milliseconds since start, module id and
///        category. The [logger] table switches output per category or
///        module:
///
///          [logger]
///          frame = false          # category 'frame' everywhere
///          session = false        # every category of module 'session'
///          session.io = true      # ...except 'io'
class Logger {
public:
  /// @brief Open the log (throws std::system_error when the log file can not be opened)
  Logger();
  Logger(const Logger &) = delete;
  Logger(Logger &&) = delete;

  ~Logger() noexcept;

  static Logger *create() {
    _logger = std::make_unique<Logger>();

    return _logger.get();
  }

  static void shutdown() noexcept { _logger.reset(); }

  template <typename S, typename... Args>
  void info(csv mod_id, csv cat, const S &format, Args &&...args) {
    if (!should_log(mod_id, cat)) return;

    auto msg = fmt::vformat(format, fmt::make_format_args(args...));
    if (msg.empty() || (msg.back() != '\n')) msg.push_back('\n');

    std::scoped_lock lck(mtx);
    out.print("{:>12.1f} {:<14} {:<14} {}", e.millis().count(), mod_id, cat, msg);
    out.flush();
  }

  bool should_log(csv mod, csv cat) const noexcept {
    if ((cat == csv{"info"}) || !tokc.is_table()) return true;

    // every switch that is present must be true
    const std::array paths{toml::path(cat), toml::path(mod), toml::path(mod).append(cat)};

    return std::all_of(paths.begin(), paths.end(), [&t = tokc.table()](const auto &p) {
      return t.at_path(p).value_or(true);
    });
  }

private:
  // order dependent
  conf::token tokc;
  fmt::ostream out;

  std::mutex mtx;
  static Elapsed e;

public:
  MOD_ID("logger");
};

/// @brief Name the category for INFO_AUTO in the enclosing scope
#define INFO_AUTO_CAT(cat)                                                                         \
  static constexpr std::string_view fn_id { cat }

#define INFO_AUTO(format, ...)                                                                     \
  if (psremote::_logger)                                                                           \
    psremote::_logger->info(module_id, fn_id, FMT_STRING(format), ##__VA_ARGS__);

} // namespace psremote
