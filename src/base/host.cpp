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

#include "base/host.hpp"
#include "base/logger.hpp"

#include <arpa/inet.h>
#include <array>
#include <cerrno>
#include <cstring>
#include <fmt/format.h>
#include <fmt/ranges.h>
#include <ifaddrs.h>
#include <linux/if_packet.h>
#include <net/if.h>
#include <sys/socket.h>
#include <unistd.h>

namespace psremote {

namespace {

string ipv4_string(const struct sockaddr *sa) noexcept {
  std::array<char, INET_ADDRSTRLEN> buf{0};
  const auto *sin = reinterpret_cast<const struct sockaddr_in *>(sa);

  if (inet_ntop(AF_INET, &sin->sin_addr, buf.data(), buf.size()) == nullptr) return string();

  return string(buf.data());
}

} // namespace

Host::Host() noexcept {
  scan_interfaces();

  std::array<char, 256> buf{0};

  // fall back to the hardware address when there is no hostname
  name = (gethostname(buf.data(), buf.size() - 1) == 0) ? string(buf.data()) : id;
}

void Host::scan_interfaces() noexcept {
  INFO_AUTO_CAT("interfaces");

  struct ifaddrs *addrs{nullptr};

  if (getifaddrs(&addrs) < 0) {
    INFO_AUTO("getifaddrs() failed: {}", std::strerror(errno));
    return;
  }

  for (auto *iap = addrs; iap != nullptr; iap = iap->ifa_next) {
    if ((iap->ifa_addr == nullptr) || (iap->ifa_flags & IFF_LOOPBACK)) continue;

    const auto family = iap->ifa_addr->sa_family;

    if ((family == AF_INET) && (iap->ifa_flags & IFF_UP) && (iap->ifa_flags & IFF_BROADCAST) &&
        (iap->ifa_broadaddr != nullptr)) {

      if (auto bcast = ipv4_string(iap->ifa_broadaddr); !bcast.empty()) {
        bcast_addrs.emplace_back(std::move(bcast));
      }

    } else if ((family == AF_PACKET) && id.empty()) {
      const auto *ll = reinterpret_cast<const struct sockaddr_ll *>(iap->ifa_addr);

      if (ll->sll_halen == 6) {
        id = fmt::format("{:02X}", fmt::join(ll->sll_addr, ll->sll_addr + 6, ""));
      }
    }
  }

  freeifaddrs(addrs);

  INFO_AUTO("id={} broadcast={}", id, fmt::join(bcast_addrs, ","));
}

} // namespace psremote
