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

#include "base/types.hpp"

#include <boost/system/error_code.hpp>
#include <fmt/format.h>
#include <type_traits>

namespace psremote {

/// @brief Coarse classification used by callers to decide retry, re-pair or abort
enum class ErrorKind : uint8_t {
  None = 0,
  Network,
  Timeout,
  Malformed,
  Integrity,
  Auth,
  Permission,
  State,
  Cancelled
};

namespace error {

/// @brief Protocol level failures (transport failures keep their system / asio codes)
enum proto_errors : int {
  timeout = 1,
  malformed_frame,
  frame_too_large,
  malformed_status,
  unexpected_opcode,
  bad_argument,
  unknown_key,
  malformed_document,
  integrity,
  crypto_failure,
  login_rejected,
  handshake_rejected,
  not_ready,
  session_closed,
  busy,
  invalid_state,
  unsupported,
  cancelled
};

const boost::system::error_category &category() noexcept;

inline boost::system::error_code make_error_code(proto_errors e) noexcept {
  return boost::system::error_code(static_cast<int>(e), category());
}

/// @brief Classify any error code (psremote, asio or system) into the error taxonomy
/// @param ec error code to classify
/// @return ErrorKind
ErrorKind kind(const boost::system::error_code &ec) noexcept;

csv kind_name(ErrorKind kind) noexcept;

/// @brief Errors after which a session can not continue
bool is_fatal(const boost::system::error_code &ec) noexcept;

} // namespace error
} // namespace psremote

namespace boost {
namespace system {
template <> struct is_error_code_enum<psremote::error::proto_errors> : std::true_type {};
} // namespace system
} // namespace boost

template <> struct fmt::formatter<psremote::ErrorKind> : formatter<std::string_view> {
  template <typename FormatContext>
  auto format(psremote::ErrorKind kind, FormatContext &ctx) const {
    return formatter<std::string_view>::format(psremote::error::kind_name(kind), ctx);
  }
};
