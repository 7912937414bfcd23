#pragma once

#include <chrono>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>

#include "boost/di.hpp"
#include "conf/credentials_config.hpp"
#include "customio/console_output.hpp"
#include "fitbit/activity_client.hpp"
#include "fitbridge_common.hpp"
#include "handlers/activity_selector.hpp"
#include "handlers/export_handler.hpp"
#include "handlers/i_handler.hpp"
#include "handlers/session_controller.hpp"
#include "my_error_codes.hpp"
#include "util/browser_launcher.hpp"
#include "util/document_writer.hpp"
#include "util/my_logging.hpp"

#ifdef to
#error "macro to defined"
#endif

namespace di = boost::di;
namespace fitbridge {

class App {
  fitbridge::CliCtx &cli_ctx_;
  customio::ConsoleOutput output_;
  src::severity_logger<trivial::severity_level> lg_;

public:
  explicit App(fitbridge::CliCtx &cli_ctx)
      : cli_ctx_(cli_ctx), output_(cli_ctx.verbosity_level()) {}

  void print_error(const monad::Error &err) {
    if (err.code == my_errors::GENERAL::SHOW_OPT_DESC) {
      std::cerr << err.what << std::endl;
    } else {
      output_.error() << "Error " << err.code << ": " << err.what
                      << std::endl;
    }
    BOOST_LOG_SEV(lg_, trivial::error)
        << "fit-bridge failed with " << err.code << ": " << err.what;
  }

  // Returns the process exit code.
  int start() {
    // Collaborators that need constructor arguments DI cannot supply are
    // built here and handed over as shared instances.
    std::shared_ptr<fitbit::IActivityFetcher> fetcher =
        std::make_shared<fitbit::FitbitActivityClient>(fitbit::kFitbitApiBase);
    std::shared_ptr<IActivitySelector> selector =
        std::make_shared<ConsoleActivitySelector>(output_, std::cin);
    std::shared_ptr<IDocumentWriter> writer =
        std::make_shared<FileDocumentWriter>(cli_ctx_.params.output_dir);

    auto injector = di::make_injector(
        di::bind<fitbridge::CliCtx>().to(cli_ctx_),
        di::bind<customio::ConsoleOutput>().to(output_),
        di::bind<fitbridge::ICredentialsProvider>()
            .to<fitbridge::CredentialsProviderFile>()
            .in(di::singleton),
        di::bind<fitbridge::IBrowserLauncher>()
            .to<fitbridge::SystemBrowserLauncher>()
            .in(di::singleton),
        di::bind<fitbit::IActivityFetcher>().to(fetcher),
        di::bind<fitbridge::IActivitySelector>().to(selector),
        di::bind<fitbridge::IDocumentWriter>().to(writer),
        di::bind<fitbridge::SessionController>().in(di::singleton),
        di::bind<fitbridge::ExportHandler>().in(di::unique),
        di::bind<fitbridge::AuthorizeHandler>().in(di::unique));

    auto &controller = injector.create<fitbridge::SessionController &>();
    SessionOptions options{};
    if (cli_ctx_.params.auth_timeout_seconds > 0) {
      options.wait_timeout = std::chrono::duration_cast<std::chrono::milliseconds>(
          std::chrono::seconds(cli_ctx_.params.auth_timeout_seconds));
    }
    controller.set_options(options);

    HandlerFactoryImpl factory(
        [&injector](const std::string &subcmd) -> std::shared_ptr<IHandler> {
          if (subcmd == kExportCommand) {
            return injector.create<std::shared_ptr<fitbridge::ExportHandler>>();
          } else if (subcmd == kAuthorizeCommand) {
            return injector
                .create<std::shared_ptr<fitbridge::AuthorizeHandler>>();
          }
          return nullptr;
        });

    auto handler = factory.create(cli_ctx_.params.subcmd);
    if (!handler) {
      print_error(monad::make_error(my_errors::GENERAL::SHOW_OPT_DESC,
                                    "Unsupported subcommand: " +
                                        cli_ctx_.params.subcmd));
      return EXIT_FAILURE;
    }

    BOOST_LOG_SEV(lg_, trivial::info)
        << "Running subcommand " << handler->command();
    auto r = handler->start();
    if (r.is_err()) {
      print_error(r.error());
      return EXIT_FAILURE;
    }
    output_.debug() << "Handler completed successfully." << std::endl;
    return EXIT_SUCCESS;
  }
};

inline int launch(fitbridge::CliCtx &ctx) {
  App app(ctx);
  return app.start();
}

} // namespace fitbridge
