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

#include "wire/ddp_msg.hpp"
#include "base/error.hpp"
#include "base/logger.hpp"

#include <array>
#include <charconv>
#include <fmt/format.h>
#include <iterator>
#include <regex>
#include <sstream>

namespace psremote {
namespace wire {

namespace {
MOD_ID("wire.ddp");

static constexpr std::array type_names{"SRCH"sv, "WAKEUP"sv, "LAUNCH"sv};
static constexpr csv request_tail{" * HTTP/1.1\n"};

ddp_fields_t credential_fields(csv credential) {
  return ddp_fields_t{{string(ddp::credential_key), string(credential)},
                      {"client-type", "a"},
                      {"auth-type", "C"}};
}
} // namespace

csv type_name(DdpType type) noexcept { return type_names[static_cast<size_t>(type)]; }

string make_msg(DdpType type, const ddp_fields_t &fields) noexcept {
  string msg = fmt::format("{}{}", type_name(type), request_tail);

  for (const auto &[key, val] : fields) {
    fmt::format_to(std::back_inserter(msg), "{}:{}\n", key, val);
  }

  fmt::format_to(std::back_inserter(msg), "{}:{}\n", ddp::version_key, ddp::version);

  return msg;
}

string make_wakeup(csv credential) noexcept {
  return make_msg(DdpType::Wakeup, credential_fields(credential));
}

string make_launch(csv credential) noexcept {
  return make_msg(DdpType::Launch, credential_fields(credential));
}

size_t credential_offset(DdpType type) noexcept {
  return type_name(type).size() + request_tail.size() + ddp::credential_key.size() + 1;
}

std::optional<DdpType> request_type(csv datagram) noexcept {
  for (size_t idx = 0; idx < type_names.size(); idx++) {
    const auto prefix = fmt::format("{}{}", type_names[idx], request_tail);

    if (datagram.starts_with(prefix)) return static_cast<DdpType>(idx);
  }

  return std::nullopt;
}

string extract_credential(csv datagram, error_code &ec) noexcept {
  INFO_AUTO_CAT("credential");

  ec.clear();

  const auto type = request_type(datagram);

  if (!type.has_value() || (*type == DdpType::Search)) {
    ec = error::malformed_status;
    return string();
  }

  const auto offset = credential_offset(*type);
  const auto key_pos = offset - ddp::credential_key.size() - 1;

  // the credential field must be the first field
  if ((datagram.size() <= offset) || (datagram.substr(key_pos, offset - key_pos) !=
                                      fmt::format("{}:", ddp::credential_key))) {
    INFO_AUTO("credential field not at offset={}", offset);
    ec = error::malformed_status;
    return string();
  }

  auto cred = datagram.substr(offset, ddp::max_credential);

  if (auto eol = cred.find('\n'); eol != cred.npos) cred = cred.substr(0, eol);

  if (cred.empty()) ec = error::malformed_status;

  return string(cred);
}

string make_status(int code, csv text, const ddp_fields_t &fields) noexcept {
  string msg = fmt::format("HTTP/1.1 {} {}\n", code, text);

  for (const auto &[key, val] : fields) {
    fmt::format_to(std::back_inserter(msg), "{}:{}\n", key, val);
  }

  fmt::format_to(std::back_inserter(msg), "{}:{}\n", ddp::version_key, ddp::version);

  return msg;
}

std::optional<StatusMsg> parse_status(csv datagram, error_code &ec) noexcept {
  INFO_AUTO_CAT("parse");

  // NOTE: index 0 is entire string
  constexpr auto code_idx = 1;
  constexpr auto text_idx = 2;

  static const auto re_status = std::regex("HTTP/1.1 ([0-9]+) (.*)", std::regex::ECMAScript);

  ec.clear();

  if (datagram.find(type_name(DdpType::Search)) != datagram.npos) {
    INFO_AUTO("ignoring {} datagram", type_name(DdpType::Search));
    return std::nullopt;
  }

  StatusMsg status;
  bool have_status{false};

  auto sstream = std::istringstream(string(datagram));
  string line;

  while (std::getline(sstream, line)) {
    auto view = csv(line);

    // tolerate \r\n line endings
    if (!view.empty() && (view.back() == '\r')) view.remove_suffix(1);
    if (view.empty()) continue;

    std::smatch sm;
    const string l(view);

    if (!have_status && std::regex_match(l, sm, re_status)) {
      const auto code_str = sm[code_idx].str();

      const auto fc =
          std::from_chars(code_str.data(), code_str.data() + code_str.size(), status.code);

      if (fc.ec != std::errc()) {
        INFO_AUTO("bad status code={}", code_str);
        ec = error::malformed_status;
        return std::nullopt;
      }

      status.text = sm[text_idx].str();
      have_status = true;

    } else if (auto colon_pos = view.find(':'); colon_pos != view.npos) {
      // value runs from the first colon to the end of line
      status.fields.insert_or_assign(string(view.substr(0, colon_pos)),
                                     string(view.substr(colon_pos + 1)));
    } else {
      INFO_AUTO("ignored={}", view);
    }
  }

  if (!have_status) {
    ec = error::malformed_status;
    return std::nullopt;
  }

  return status;
}

} // namespace wire
} // namespace psremote
