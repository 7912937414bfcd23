#include <boost/program_options.hpp>

#include <cstdlib>
#include <iostream>
#include <string>
#include <vector>

#include "conf/logging_config.hpp"
#include "fit_bridge_entry.hpp"
#include "fitbridge_common.hpp"
#include "util/my_logging.hpp"
#include "version.h"

namespace po = boost::program_options;

namespace {

fs::path get_env_path(const char *name) {
  if (const char *value = std::getenv(name); value && *value) {
    return fs::path(value);
  }
  return {};
}

// Log directory precedence:
// 1. --log-dir
// 2. FITBRIDGE_LOG_DIR
// 3. $XDG_STATE_HOME/fit-bridge/logs
// 4. $HOME/.local/state/fit-bridge/logs (Linux) or
//    $HOME/Library/Logs/fit-bridge (macOS)
fs::path resolve_default_log_dir() {
  if (auto dir = get_env_path("FITBRIDGE_LOG_DIR"); !dir.empty()) {
    return dir;
  }
#if defined(__APPLE__)
  if (auto home = get_env_path("HOME"); !home.empty()) {
    return home / "Library" / "Logs" / "fit-bridge";
  }
#else
  if (auto state = get_env_path("XDG_STATE_HOME"); !state.empty()) {
    return state / "fit-bridge" / "logs";
  }
  if (auto home = get_env_path("HOME"); !home.empty()) {
    return home / ".local" / "state" / "fit-bridge" / "logs";
  }
#endif
  return fs::temp_directory_path() / "fit-bridge" / "logs";
}

bool ensure_directory_exists(const fs::path &dir) {
  std::error_code ec;
  fs::create_directories(dir, ec);
  if (ec && !fs::exists(dir)) {
    std::cerr << "Warning: unable to create log directory '" << dir.string()
              << "': " << ec.message() << std::endl;
    return false;
  }
  return true;
}

} // namespace

int RunFitBridgeApplication(int argc, char *argv[]) {
  for (int i = 1; i < argc; ++i) {
    std::string arg(argv[i]);
    if (arg == "-v" || arg == "--version" || arg == "version") {
      std::cout << FITBRIDGE_VERSION << std::endl;
      return EXIT_SUCCESS;
    }
  }

  try {
    po::variables_map vm;
    po::options_description generic_desc(
        "fit-bridge: export Fitbit activities as TCX files Strava accepts");

    fitbridge::CliParams cli_params;
    std::string credentials_arg;
    std::string output_dir_arg;
    std::string log_dir_arg;

    generic_desc.add_options() //
        ("credentials",
         po::value<std::string>(&credentials_arg)
             ->default_value("credentials.json"),
         "path of the credentials file (clientID, clientSecret, "
         "redirectUrl).") //
        ("output-dir,o",
         po::value<std::string>(&output_dir_arg)->default_value("."),
         "directory the TCX file is written to.") //
        ("log-dir", po::value<std::string>(&log_dir_arg),
         "directory for the rotating log files.") //
        ("verbose",
         po::value<std::string>(&cli_params.verbose)->default_value("info"),
         "verbosity level, like info, trace, vvvv.") //
        ("silent", po::bool_switch(&cli_params.silent)->default_value(false),
         "suppress all output except prompts.") //
        ("auth-timeout",
         po::value<std::size_t>(&cli_params.auth_timeout_seconds)
             ->default_value(0),
         "seconds to wait for the authorization redirect, 0 waits "
         "forever.") //
        ("help,h", "Print help");

    po::options_description hidden_desc("Hidden options");
    hidden_desc.add_options() //
        ("positionals",
         po::value<std::vector<std::string>>()->default_value({}, ""),
         "all positional arguments");

    po::options_description cmdline_options("Allowed options");
    cmdline_options.add(generic_desc).add(hidden_desc);

    po::positional_options_description p;
    p.add("positionals", -1);

    po::parsed_options parsed = po::command_line_parser(argc, argv)
                                    .options(cmdline_options)
                                    .positional(p)
                                    .run();
    po::store(parsed, vm);
    po::notify(vm);

    auto showUsage = [&]() {
      std::cerr << "Usage: fit-bridge [export] <YYYY-MM-DD> [options]"
                << std::endl
                << "       fit-bridge authorize [options]" << std::endl
                << std::endl
                << generic_desc << std::endl;
      std::cerr << "Subcommands:" << std::endl
                << "  export     Authorize, choose an activity of the day and "
                   "write its TCX (default)."
                << std::endl
                << "  authorize  Run the authorization handshake only."
                << std::endl
                << std::endl;
    };

    if (vm.count("help")) {
      showUsage();
      return EXIT_SUCCESS;
    }

    std::vector<std::string> positionals =
        vm["positionals"].as<std::vector<std::string>>();
    if (auto r = fitbridge::resolve_subcommand(positionals, cli_params);
        r.is_err()) {
      std::cerr << r.error().what << std::endl << std::endl;
      showUsage();
      return EXIT_FAILURE;
    }

    cli_params.credentials_file = credentials_arg;
    cli_params.output_dir = output_dir_arg;
    cli_params.log_dir =
        log_dir_arg.empty() ? resolve_default_log_dir() : fs::path(log_dir_arg);

    static fitbridge::CliCtx cli_ctx(std::move(vm), std::move(positionals),
                                     std::move(cli_params));

    if (ensure_directory_exists(cli_ctx.params.log_dir)) {
      fitbridge::LoggingConfig logging_config{};
      logging_config.level = cli_ctx.log_level();
      logging_config.log_dir = cli_ctx.params.log_dir.string();
      init_my_log(logging_config);
    } else {
      // Keep Boost.Log's default console sink quiet apart from failures.
      logging::core::get()->set_filter(logging::trivial::severity >=
                                       logging::trivial::error);
    }

    return fitbridge::launch(cli_ctx);
  } catch (const po::error &e) {
    std::cerr << e.what() << std::endl;
    return EXIT_FAILURE;
  } catch (const std::exception &e) {
    std::cerr << "error catched on main: " << e.what() << std::endl;
    return EXIT_FAILURE;
  }
}

int main(int argc, char *argv[]) { return RunFitBridgeApplication(argc, argv); }
