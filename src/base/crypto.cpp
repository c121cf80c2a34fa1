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

#include "base/crypto.hpp"

#include <fmt/format.h>
#include <gcrypt.h>
#include <mutex>
#include <sodium.h>
#include <stdexcept>

namespace psremote {
namespace crypto {

void init() {
  static std::once_flag once;

  std::call_once(once, []() {
    // initialize crypo libs
    if (sodium_init() < 0) {
      throw(std::runtime_error{"sodium_init() failed"});
    }

    if (gcry_check_version(gcrypt_vsn) == nullptr) {
      throw(std::runtime_error(fmt::format("outdated libgcrypt, need {}", gcrypt_vsn)));
    }

    gcry_control(GCRYCTL_DISABLE_SECMEM, 0);
    gcry_control(GCRYCTL_INITIALIZATION_FINISHED, 0);
  });
}

} // namespace crypto
} // namespace psremote
