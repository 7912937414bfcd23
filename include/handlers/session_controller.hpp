#pragma once

#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <string>

#include "conf/credentials_config.hpp"
#include "customio/console_output.hpp"
#include "oauth/auth_session.hpp"
#include "oauth/pkce.hpp"
#include "oauth/redirect_listener.hpp"
#include "result_monad.hpp"
#include "util/browser_launcher.hpp"
#include "util/my_logging.hpp"

namespace fitbridge {

struct SessionOptions {
  oauth::RedirectListener::ListenConfig listen{};
  std::size_t verifier_length{oauth::kMinVerifierLength};
  // Unset waits for the redirect indefinitely.
  std::optional<std::chrono::milliseconds> wait_timeout;
};

/**
 * Drives one implicit-grant handshake:
 *
 *   validate credentials -> PKCE pair -> authorization URL (state recorded)
 *   -> redirect listener -> browser -> wait for the accepted redirect
 *   -> post_handshake(token) -> listener shutdown
 *
 * The listener is stopped exactly once, on the calling thread, after the
 * post-handshake action returns. A correlation mismatch never ends the wait;
 * only an accepted redirect does. Every other failure is returned before
 * or instead of the wait and tears the listener down.
 */
class SessionController {
public:
  using PostHandshake =
      std::function<monad::MyVoidResult(const std::string &access_token)>;

  SessionController(ICredentialsProvider &credentials,
                    IBrowserLauncher &browser,
                    customio::ConsoleOutput &output)
      : credentials_(credentials), browser_(browser), output_(output) {}

  void set_options(SessionOptions options) { options_ = std::move(options); }
  const SessionOptions &options() const { return options_; }

  monad::MyVoidResult run(const PostHandshake &post_handshake);

  // Session of the most recent run(); null before the first one.
  std::shared_ptr<const oauth::AuthSession> session() const {
    return session_;
  }

  // Port of the running listener, 0 when none is running.
  std::uint16_t listener_port() const;

private:
  monad::MyResult<std::string>
  wait_for_token(const std::shared_ptr<oauth::RedirectListener> &listener);

  ICredentialsProvider &credentials_;
  IBrowserLauncher &browser_;
  customio::ConsoleOutput &output_;
  SessionOptions options_{};
  std::shared_ptr<oauth::AuthSession> session_;
  std::shared_ptr<oauth::RedirectListener> listener_;
  src::severity_logger<trivial::severity_level> lg_;
};

} // namespace fitbridge
