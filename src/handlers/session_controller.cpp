#include "handlers/session_controller.hpp"

#include <fmt/format.h>

#include "my_error_codes.hpp"
#include "oauth/authorization_url.hpp"
#include "util/string_util.hpp"

namespace fitbridge {

std::uint16_t SessionController::listener_port() const {
  if (!listener_ || listener_->is_stopped()) {
    return 0;
  }
  return listener_->port();
}

monad::MyVoidResult SessionController::run(const PostHandshake &post_handshake) {
  auto credentials = credentials_.load();
  if (credentials.is_err()) {
    return monad::MyVoidResult::Err(std::move(credentials).error());
  }
  const Credentials &creds = credentials.value();
  if (auto valid = creds.validate(); valid.is_err()) {
    return valid;
  }

  auto pkce = oauth::make_pkce_pair(options_.verifier_length);
  if (pkce.is_err()) {
    return monad::MyVoidResult::Err(std::move(pkce).error());
  }

  session_ = std::make_shared<oauth::AuthSession>();
  auto url = oauth::build_authorization_url(pkce.value().challenge, creds,
                                            *session_);
  if (url.is_err()) {
    return monad::MyVoidResult::Err(std::move(url).error());
  }

  auto started = oauth::RedirectListener::start(options_.listen, session_);
  if (started.is_err()) {
    return monad::MyVoidResult::Err(std::move(started).error());
  }
  listener_ = started.value();

  output_.info() << "Opening the browser for Fitbit authorization..."
                 << std::endl;
  output_.debug() << "Authorization URL: " << url.value() << std::endl;
  BOOST_LOG_SEV(lg_, trivial::info)
      << "Authorization requested for client " << creds.client_id
      << ", redirect listener on port " << listener_->port();

  auto opened = browser_.open(url.value());
  if (opened.is_err()) {
    listener_->stop();
    listener_.reset();
    return opened;
  }

  auto token = wait_for_token(listener_);
  if (token.is_err()) {
    listener_->stop();
    listener_.reset();
    return monad::MyVoidResult::Err(std::move(token).error());
  }
  output_.success() << "Access token received ("
                    << stringutil::redact(token.value()) << ")" << std::endl;

  auto result = post_handshake(token.value());

  listener_->stop();
  listener_.reset();
  BOOST_LOG_SEV(lg_, trivial::info) << "Authorization session finished";
  return result;
}

monad::MyResult<std::string> SessionController::wait_for_token(
    const std::shared_ptr<oauth::RedirectListener> &listener) {
  if (!options_.wait_timeout) {
    return monad::MyResult<std::string>::Ok(session_->wait_for_token());
  }
  auto token = session_->wait_for_token(*options_.wait_timeout);
  if (!token) {
    BOOST_LOG_SEV(lg_, trivial::warning)
        << "No authorization redirect on port " << listener->port()
        << " within " << options_.wait_timeout->count() << " ms";
    return monad::MyResult<std::string>::Err(monad::make_error(
        my_errors::OAUTH::WAIT_TIMEOUT,
        fmt::format("No authorization redirect received within {} seconds",
                    options_.wait_timeout->count() / 1000)));
  }
  return monad::MyResult<std::string>::Ok(std::move(*token));
}

} // namespace fitbridge
