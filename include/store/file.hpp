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

#include "base/asio.hpp"
#include "base/types.hpp"

#include <filesystem>

namespace psremote {
namespace store {

namespace fs = std::filesystem;

/// @brief Read an entire file
/// @param path file to read
/// @param ec no_such_file_or_directory when missing, other io errors
/// @return file contents
string read_file(const fs::path &path, error_code &ec) noexcept;

/// @brief Replace a file (written beside it then renamed), creating the
///        parent directory when needed
void write_file(const fs::path &path, csv contents, error_code &ec) noexcept;

} // namespace store
} // namespace psremote
