#pragma once

#include <boost/program_options.hpp>

#include <algorithm>
#include <array>
#include <cstddef>
#include <filesystem>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "common_macros.hpp"
#include "my_error_codes.hpp"
#include "result_monad.hpp"
#include "util/string_util.hpp"

namespace fs = std::filesystem;
namespace po = boost::program_options;

namespace fitbridge {

inline constexpr std::string_view kExportCommand = "export";
inline constexpr std::string_view kAuthorizeCommand = "authorize";

struct CliParams {
  std::string subcmd;
  std::string activity_date; // YYYY-MM-DD
  fs::path credentials_file{"credentials.json"};
  fs::path output_dir{"."};
  fs::path log_dir;
  std::string verbose; // trace|debug|info|warning|error or vvvv
  bool silent = false;
  std::size_t auth_timeout_seconds = 0; // 0 waits forever
};

struct CliCtx {
  po::variables_map vm;
  std::vector<std::string> positionals;
  fitbridge::CliParams params;
  CliCtx(po::variables_map &&vm,                 //
         std::vector<std::string> &&positionals, //
         fitbridge::CliParams &&params_)
      : vm(std::move(vm)), positionals(std::move(positionals)),
        params(std::move(params_)) {}

  // True iff the option was given explicitly rather than taken from its
  // default_value.
  bool is_specified_by_user(const std::string &opt_name) const {
    auto it = vm.find(opt_name);
    if (it == vm.end()) {
      return false;
    }
    return !it->second.defaulted();
  }

  size_t verbosity_level() const {
    if (params.silent) {
      return 0;
    }
    if (params.verbose.empty()) {
      return 3;
    }
    if (params.verbose == "trace") {
      return 5;
    } else if (params.verbose == "debug") {
      return 4;
    } else if (params.verbose == "info") {
      return 3;
    } else if (params.verbose == "warning") {
      return 2;
    } else if (params.verbose == "error") {
      return 1;
    }
    return std::count(params.verbose.begin(), params.verbose.end(), 'v');
  }

  // Maps the verbosity onto a Boost.Log level name for the file sink.
  std::string log_level() const {
    switch (verbosity_level()) {
    case 0:
    case 1:
      return "error";
    case 2:
      return "warning";
    case 3:
      return "info";
    case 4:
      return "debug";
    default:
      return "trace";
    }
  }
};

inline bool is_known_subcommand(std::string_view candidate) {
  static constexpr std::array<std::string_view, 2> kKnown{kExportCommand,
                                                          kAuthorizeCommand};
  return std::find(kKnown.begin(), kKnown.end(), candidate) != kKnown.end();
}

/**
 * Resolves the subcommand and activity date from the positionals.
 *
 *   fit-bridge 2024-05-01            -> export, 2024-05-01
 *   fit-bridge export 2024-05-01     -> export, 2024-05-01
 *   fit-bridge authorize             -> authorize
 *
 * export needs exactly one date; authorize takes none.
 */
inline monad::MyVoidResult
resolve_subcommand(const std::vector<std::string> &positionals,
                   CliParams &params) {
  std::vector<std::string> rest = positionals;
  if (!rest.empty() && is_known_subcommand(rest.front())) {
    params.subcmd = rest.front();
    rest.erase(rest.begin());
  } else {
    params.subcmd = std::string(kExportCommand);
  }

  if (params.subcmd == kAuthorizeCommand) {
    if (!rest.empty()) {
      return monad::MyVoidResult::Err(monad::make_error(
          my_errors::GENERAL::SHOW_OPT_DESC,
          "authorize does not take positional arguments."));
    }
    return monad::MyVoidResult::Ok();
  }

  if (rest.size() != 1) {
    return monad::MyVoidResult::Err(monad::make_error(
        my_errors::GENERAL::SHOW_OPT_DESC,
        "Exactly one activity date (YYYY-MM-DD) is required."));
  }
  if (!stringutil::is_calendar_date(rest.front())) {
    return monad::MyVoidResult::Err(monad::make_error(
        my_errors::GENERAL::INVALID_ARGUMENT,
        "Invalid date '" + rest.front() + "', expected YYYY-MM-DD."));
  }
  params.activity_date = rest.front();
  return monad::MyVoidResult::Ok();
}

} // namespace fitbridge
