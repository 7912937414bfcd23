#pragma once

#include <chrono>
#include <future>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace fitbridge::oauth {

enum class RedirectOutcome {
  Accepted,
  MissingToken,
  StateMismatch,
  AlreadyCompleted,
};

const char *to_string(RedirectOutcome outcome);

// State shared by the session controller and the redirect listener for one
// authorization attempt. The controller writes the expected state before the
// browser is opened; the listener thread calls complete(); the controller
// reads the token only through wait_for_token().
//
// The completion signal fires at most once. After that, complete() never
// changes the stored token again.
class AuthSession {
public:
  AuthSession() : future_(promise_.get_future().share()) {}

  AuthSession(const AuthSession &) = delete;
  AuthSession &operator=(const AuthSession &) = delete;

  void set_expected_state(std::string state);
  std::string expected_state() const;

  // Correlates a redirect with this session. Only a non-empty token carrying
  // the exact expected state is stored, and only the first one.
  RedirectOutcome complete(std::string_view token, std::string_view state);

  bool completed() const;
  std::optional<std::string> access_token() const;

  std::string wait_for_token() const { return future_.get(); }

  std::optional<std::string>
  wait_for_token(std::chrono::milliseconds timeout) const;

private:
  mutable std::mutex mu_;
  std::string expected_state_;
  std::optional<std::string> token_;
  std::promise<std::string> promise_;
  std::shared_future<std::string> future_;
};

} // namespace fitbridge::oauth
