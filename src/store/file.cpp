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

#include "store/file.hpp"

#include <boost/system/error_code.hpp>
#include <fstream>
#include <iterator>

namespace psremote {
namespace store {

string read_file(const fs::path &path, error_code &ec) noexcept {
  ec.clear();

  std::error_code fs_ec;
  if (!fs::exists(path, fs_ec)) {
    ec = fs_ec ? error_code(fs_ec.value(), sys::system_category())
               : errc::make_error_code(errc::no_such_file_or_directory);
    return string();
  }

  std::ifstream is(path, std::ios::binary);
  if (!is) {
    ec = errc::make_error_code(errc::io_error);
    return string();
  }

  string contents((std::istreambuf_iterator<char>(is)), std::istreambuf_iterator<char>());
  if (is.bad()) ec = errc::make_error_code(errc::io_error);

  return contents;
}

void write_file(const fs::path &path, csv contents, error_code &ec) noexcept {
  ec.clear();

  std::error_code fs_ec;

  if (path.has_parent_path()) {
    fs::create_directories(path.parent_path(), fs_ec);

    if (fs_ec) {
      ec = error_code(fs_ec.value(), sys::system_category());
      return;
    }
  }

  auto tmp = path;
  tmp += ".tmp";

  {
    std::ofstream os(tmp, std::ios::binary | std::ios::trunc);
    os.write(contents.data(), static_cast<std::streamsize>(contents.size()));
    os.flush();

    if (!os) {
      ec = errc::make_error_code(errc::io_error);
      return;
    }
  }

  fs::rename(tmp, path, fs_ec);
  if (fs_ec) ec = error_code(fs_ec.value(), sys::system_category());
}

} // namespace store
} // namespace psremote
