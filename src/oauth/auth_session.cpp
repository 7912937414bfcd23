#include "oauth/auth_session.hpp"

namespace fitbridge::oauth {

const char *to_string(RedirectOutcome outcome) {
  switch (outcome) {
  case RedirectOutcome::Accepted:
    return "accepted";
  case RedirectOutcome::MissingToken:
    return "missing-token";
  case RedirectOutcome::StateMismatch:
    return "state-mismatch";
  case RedirectOutcome::AlreadyCompleted:
    return "already-completed";
  }
  return "unknown";
}

void AuthSession::set_expected_state(std::string state) {
  std::lock_guard<std::mutex> lock(mu_);
  expected_state_ = std::move(state);
}

std::string AuthSession::expected_state() const {
  std::lock_guard<std::mutex> lock(mu_);
  return expected_state_;
}

RedirectOutcome AuthSession::complete(std::string_view token,
                                      std::string_view state) {
  if (token.empty()) {
    return RedirectOutcome::MissingToken;
  }
  std::lock_guard<std::mutex> lock(mu_);
  // An unset expected state never matches, not even an empty one.
  if (expected_state_.empty() || state != expected_state_) {
    return RedirectOutcome::StateMismatch;
  }
  if (token_) {
    return RedirectOutcome::AlreadyCompleted;
  }
  token_ = std::string(token);
  promise_.set_value(*token_);
  return RedirectOutcome::Accepted;
}

bool AuthSession::completed() const {
  std::lock_guard<std::mutex> lock(mu_);
  return token_.has_value();
}

std::optional<std::string> AuthSession::access_token() const {
  std::lock_guard<std::mutex> lock(mu_);
  return token_;
}

std::optional<std::string>
AuthSession::wait_for_token(std::chrono::milliseconds timeout) const {
  if (future_.wait_for(timeout) != std::future_status::ready) {
    return std::nullopt;
  }
  return future_.get();
}

} // namespace fitbridge::oauth
