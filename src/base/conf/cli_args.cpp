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

#include "base/conf/cli_args.hpp"
#include "base/conf/fixed.hpp"
#include "base/conf/keys.hpp"
#include "base/conf/toml.hpp"
#include "base/types.hpp"
#include "build_inject.hpp"

#include <boost/program_options.hpp>
#include <filesystem>
#include <fmt/format.h>
#include <sstream>
#include <system_error>
#include <vector>

namespace psremote {
namespace conf {

namespace po = boost::program_options;
namespace fs = std::filesystem;

using fs_path = fs::path;

static constexpr auto opt_cfg_file{"config,c"};
static constexpr auto opt_credential{"credential,C"};
static constexpr auto opt_debug{"debug,v"};
static constexpr auto opt_help{"help,h"};
static constexpr auto opt_ip{"ip,i"};
static constexpr auto opt_log_file{"log-file"};
static constexpr auto opt_port{"port,p"};
static constexpr auto opt_region{"region,r"};
static constexpr auto opt_timeout{"timeout,t"};
static constexpr auto opt_positional{"positional"};

constexpr auto desc_cfg_file{"toml configuration file"};
constexpr auto desc_credential{"credential harvested by 'pair'"};
constexpr auto desc_debug{"enable logging"};
constexpr auto desc_help{"command line help"};
constexpr auto desc_ip{"console ip address (default: search)"};
constexpr auto desc_log_file{"full path to log file (default: stdout)"};
constexpr auto desc_port{"console ddp port"};
constexpr auto desc_region{"title metadata region"};
constexpr auto desc_timeout{"operation timeout in seconds"};

constexpr auto usage{"usage: psremote [options] <command> [arg]\n\n"
                     "commands:\n"
                     "  search               list consoles on the local network\n"
                     "  status               show status of a console\n"
                     "  poll                 show status via the control channel\n"
                     "  watch                poll a console until interrupted\n"
                     "  pair                 harvest a credential from the companion app\n"
                     "  link [pin]           register with a console using its PIN\n"
                     "  wakeup               wake a console from standby\n"
                     "  standby              put a console into standby\n"
                     "  remote <key>         press a remote control key\n"
                     "  start <title id>     launch a title\n\n"};

// class static data
toml::table cli_args::ttable;
string cli_args::error_str;
bool cli_args::help_requested{false};
std::ostringstream cli_args::help_ss;

cli_args::cli_args(int argc, char **argv) noexcept {
  po::options_description desc(string(build::info.project));
  po::positional_options_description pos_desc;
  po::variables_map args;

  fs_path fs_arg0{argv[0]};

  // filename first, remove_filename() modifies fs_arg0
  ttable.insert_or_assign(key::app_name, fs_arg0.filename().string());
  ttable.insert_or_assign(key::exec_dir, fs_arg0.remove_filename().string());

  auto cfg_file_v = po::value<string>()->notifier([](const string p) {
    fs_path p_fs(p);

    if (!p_fs.is_absolute()) {
      std::error_code ec;
      p_fs = fs::absolute(p_fs, ec);
    }

    ttable.insert_or_assign(key::cfg_file, p_fs.string());
  });

  auto str_v = [](const char *k) {
    return po::value<string>()->notifier(
        [k](const string v) { ttable.insert_or_assign(k, v); });
  };

  auto int_v = [](const char *k) {
    return po::value<int64_t>()->notifier(
        [k](int64_t v) { ttable.insert_or_assign(k, v); });
  };

  auto debug_v = po::bool_switch()
                     ->notifier([](bool e) { ttable.insert_or_assign(key::debug, e); })
                     ->default_value(false);

  auto help_v = po::bool_switch()
                    ->notifier([](bool e) { ttable.insert_or_assign(key::help, e); })
                    ->default_value(false);

  auto positional_v = po::value<std::vector<string>>()->notifier(
      [](const std::vector<string> &v) {
        if (v.size() > 0) ttable.insert_or_assign(key::command, v[0]);
        if (v.size() > 1) ttable.insert_or_assign(key::arg, v[1]);
      });

  desc.add_options()                                         //
      (opt_cfg_file, cfg_file_v, desc_cfg_file)              //
      (opt_credential, str_v(key::credential), desc_credential) //
      (opt_debug, debug_v, desc_debug)                       //
      (opt_ip, str_v(key::ip), desc_ip)                      //
      (opt_log_file, str_v(key::log_file), desc_log_file)    //
      (opt_port, int_v(key::port), desc_port)                //
      (opt_region, str_v(key::region), desc_region)          //
      (opt_timeout, int_v(key::timeout), desc_timeout)       //
      (opt_help, help_v, desc_help);                         //

  po::options_description hidden;
  hidden.add_options()(opt_positional, positional_v, "");

  po::options_description all;
  all.add(desc).add(hidden);

  pos_desc.add(opt_positional, 2);

  try {
    // this will throw if parsing fails
    auto parsed_opts =
        po::command_line_parser(argc, argv).options(all).positional(pos_desc).run();

    // good, we parsed command line args, store them
    po::store(parsed_opts, args);

    // notify all args (populate toml table)
    po::notify(args);

  } catch (const po::error &ex) {
    error_str = fmt::format("bad args: {}", ex.what());
  }

  if (ttable[key::help].value_or(false)) {
    help_requested = true;

    help_ss << usage << desc;
  } else if (error_str.empty() && !ttable.contains(key::command)) {
    error_str = "missing command, see --help";
  }

  std::error_code fs_ec;
  if (ttable.contains(key::cfg_file) && !fs::exists(conf::fixed::cfg_file(), fs_ec)) {
    error_str = fmt::format("{}: not found", conf::fixed::cfg_file());
  }
}

} // namespace conf
} // namespace psremote
