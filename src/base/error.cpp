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

#include "base/error.hpp"

#include <array>
#include <boost/asio/error.hpp>
#include <boost/system/error_code.hpp>
#include <string>

namespace psremote {

namespace {

class category_impl : public boost::system::error_category {
public:
  const char *name() const noexcept override { return "psremote"; }

  std::string message(int ev) const override {
    switch (static_cast<error::proto_errors>(ev)) {
    case error::timeout:
      return "timed out";
    case error::malformed_frame:
      return "malformed frame";
    case error::frame_too_large:
      return "frame exceeds maximum length";
    case error::malformed_status:
      return "malformed status response";
    case error::unexpected_opcode:
      return "unexpected opcode";
    case error::bad_argument:
      return "argument does not fit the frame layout";
    case error::unknown_key:
      return "unknown remote key";
    case error::malformed_document:
      return "malformed json document";
    case error::integrity:
      return "integrity tag mismatch";
    case error::crypto_failure:
      return "cipher library failure";
    case error::login_rejected:
      return "login rejected";
    case error::handshake_rejected:
      return "handshake rejected";
    case error::not_ready:
      return "session not ready";
    case error::session_closed:
      return "session closed";
    case error::busy:
      return "operation already in progress";
    case error::invalid_state:
      return "invalid state for operation";
    case error::unsupported:
      return "device lacks capability";
    case error::cancelled:
      return "cancelled";
    }

    return "unknown psremote error";
  }
};

} // namespace

const boost::system::error_category &error::category() noexcept {
  static const category_impl instance;

  return instance;
}

ErrorKind error::kind(const boost::system::error_code &ec) noexcept {
  namespace sys_errc = boost::system::errc;

  if (!ec) return ErrorKind::None;

  if (ec.category() == category()) {
    switch (static_cast<error::proto_errors>(ec.value())) {
    case error::timeout:
      return ErrorKind::Timeout;

    case error::malformed_frame:
    case error::frame_too_large:
    case error::malformed_status:
    case error::unexpected_opcode:
    case error::bad_argument:
    case error::unknown_key:
    case error::malformed_document:
      return ErrorKind::Malformed;

    case error::integrity:
    case error::crypto_failure:
      return ErrorKind::Integrity;

    case error::login_rejected:
      return ErrorKind::Auth;

    case error::handshake_rejected:
      return ErrorKind::Network;

    case error::not_ready:
    case error::session_closed:
    case error::busy:
    case error::invalid_state:
    case error::unsupported:
      return ErrorKind::State;

    case error::cancelled:
      return ErrorKind::Cancelled;
    }
  }

  if (ec == boost::asio::error::operation_aborted) return ErrorKind::Cancelled;
  if (ec == sys_errc::timed_out) return ErrorKind::Timeout;

  if ((ec == sys_errc::permission_denied) || (ec == sys_errc::operation_not_permitted)) {
    return ErrorKind::Permission;
  }

  // everything else is a transport failure
  return ErrorKind::Network;
}

csv error::kind_name(ErrorKind kind) noexcept {
  static constexpr std::array names{"none"sv,  "network"sv,    "timeout"sv,
                                    "malformed"sv, "integrity"sv, "auth"sv,
                                    "permission"sv, "state"sv,    "cancelled"sv};

  return names[static_cast<size_t>(kind)];
}

bool error::is_fatal(const boost::system::error_code &ec) noexcept {
  switch (kind(ec)) {
  case ErrorKind::Network:
  case ErrorKind::Integrity:
  case ErrorKind::Auth:
  case ErrorKind::Cancelled:
    return true;

  default:
    return false;
  }
}

} // namespace psremote
