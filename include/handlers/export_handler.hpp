#pragma once

#include <string>

#include "customio/console_output.hpp"
#include "fitbit/activity_client.hpp"
#include "fitbridge_common.hpp"
#include "handlers/activity_selector.hpp"
#include "handlers/i_handler.hpp"
#include "handlers/session_controller.hpp"
#include "util/document_writer.hpp"
#include "util/my_logging.hpp"

namespace fitbridge {

// fit-bridge [export] <YYYY-MM-DD>
//
// Authorizes, lists the day's activities, lets the user pick one, and writes
// its TCX export, patched for its category, to <category>-<logId>.tcx.
class ExportHandler : public IHandler {
public:
  ExportHandler(fitbridge::CliCtx &cli_ctx, customio::ConsoleOutput &output,
                SessionController &controller,
                fitbit::IActivityFetcher &fetcher, IActivitySelector &selector,
                IDocumentWriter &writer)
      : cli_ctx_(cli_ctx), output_(output), controller_(controller),
        fetcher_(fetcher), selector_(selector), writer_(writer) {}

  std::string command() const override { return "export"; }

  monad::MyVoidResult start() override;

  // Everything after the handshake, for one access token.
  monad::MyVoidResult export_activity(const std::string &access_token,
                                      const std::string &date);

private:
  fitbridge::CliCtx &cli_ctx_;
  customio::ConsoleOutput &output_;
  SessionController &controller_;
  fitbit::IActivityFetcher &fetcher_;
  IActivitySelector &selector_;
  IDocumentWriter &writer_;
  src::severity_logger<trivial::severity_level> lg_;
};

// fit-bridge authorize: runs the handshake only, to check the credentials.
class AuthorizeHandler : public IHandler {
public:
  AuthorizeHandler(customio::ConsoleOutput &output,
                   SessionController &controller)
      : output_(output), controller_(controller) {}

  std::string command() const override { return "authorize"; }

  monad::MyVoidResult start() override;

private:
  customio::ConsoleOutput &output_;
  SessionController &controller_;
};

} // namespace fitbridge
