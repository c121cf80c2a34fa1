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

namespace psremote {
namespace crypto {

/// @brief Minimum libgcrypt version required
static constexpr auto gcrypt_vsn{"1.5.4"};

/// @brief Initialize libsodium and libgcrypt, safe to call more than once.
///        Throws std::runtime_error when either library can not be initialized.
void init();

} // namespace crypto
} // namespace psremote
