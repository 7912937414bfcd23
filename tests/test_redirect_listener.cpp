#include <gtest/gtest.h>

#include <memory>
#include <string>

#include "http_test_helper.hpp"
#include "my_error_codes.hpp"
#include "oauth/auth_session.hpp"
#include "oauth/redirect_listener.hpp"

namespace {

using fitbridge::oauth::AuthSession;
using fitbridge::oauth::RedirectListener;
namespace http = testinfra::http;
using testinfra::http_get;

struct StartedListener {
  std::shared_ptr<AuthSession> session;
  std::shared_ptr<RedirectListener> listener;
};

StartedListener start_listener(const std::string &expected_state) {
  auto session = std::make_shared<AuthSession>();
  session->set_expected_state(expected_state);
  auto started = RedirectListener::start({"127.0.0.1", 0}, session);
  EXPECT_TRUE(started.is_ok()) << started.error().what;
  return {session, started.is_ok() ? started.value() : nullptr};
}

TEST(RedirectListener, CallbackServesBridgePage) {
  auto s = start_listener("st");
  ASSERT_TRUE(s.listener);
  ASSERT_NE(s.listener->port(), 0);

  auto res = http_get("127.0.0.1", s.listener->port(), "/callback");
  EXPECT_EQ(res.result(), http::status::ok);
  EXPECT_EQ(res[http::field::content_type], "text/html; charset=utf-8");
  EXPECT_NE(res.body().find("window.location.hash"), std::string::npos);
  EXPECT_NE(res.body().find("/token-received?token="), std::string::npos);
  EXPECT_FALSE(s.session->completed());

  s.listener->stop();
}

// window.status only stores strings, so a global `status` variable would
// silently swallow every message the page tries to show.
TEST(RedirectListener, BridgePageKeepsStatusElementOutOfGlobalScope) {
  auto s = start_listener("st");
  ASSERT_TRUE(s.listener);

  auto reply = s.listener->handle(http::verb::get, "/callback");
  ASSERT_EQ(reply.status, http::status::ok);
  const std::string &page = reply.body;

  EXPECT_EQ(page.find("var status "), std::string::npos);
  EXPECT_EQ(page.find("var status="), std::string::npos);
  EXPECT_EQ(page.find(" status.textContent"), std::string::npos);

  const auto script = page.find("<script>");
  ASSERT_NE(script, std::string::npos);
  EXPECT_EQ(page.find("(function () {", script), script + 9);
  EXPECT_NE(page.find("})();\n</script>"), std::string::npos);

  EXPECT_NE(page.find("statusEl.textContent = 'Error: Access token or state "
                      "not found in the URL fragment.';"),
            std::string::npos);
  EXPECT_NE(page.find("statusEl.textContent = text;"), std::string::npos);

  s.listener->stop();
}

TEST(RedirectListener, TokenWithMatchingStateCompletesSession) {
  auto s = start_listener("abc123");
  ASSERT_TRUE(s.listener);

  auto res = http_get("127.0.0.1", s.listener->port(),
                      "/token-received?token=tok-1&state=abc123");
  EXPECT_EQ(res.result(), http::status::ok);
  EXPECT_EQ(res.body(), fitbridge::oauth::kStateMatchesMessage);
  ASSERT_TRUE(s.session->access_token().has_value());
  EXPECT_EQ(*s.session->access_token(), "tok-1");

  s.listener->stop();
}

TEST(RedirectListener, TokenIsPercentDecoded) {
  auto s = start_listener("abc");
  ASSERT_TRUE(s.listener);

  auto res = http_get("127.0.0.1", s.listener->port(),
                      "/token-received?token=a%2Bb%3Dc&state=abc");
  EXPECT_EQ(res.body(), fitbridge::oauth::kStateMatchesMessage);
  EXPECT_EQ(*s.session->access_token(), "a+b=c");

  s.listener->stop();
}

TEST(RedirectListener, MissingTokenIsReported) {
  auto s = start_listener("abc");
  ASSERT_TRUE(s.listener);

  auto res =
      http_get("127.0.0.1", s.listener->port(), "/token-received?state=abc");
  EXPECT_EQ(res.result(), http::status::ok);
  EXPECT_EQ(res.body(), fitbridge::oauth::kNoTokenMessage);
  EXPECT_FALSE(s.session->completed());

  s.listener->stop();
}

TEST(RedirectListener, StateMismatchLeavesSessionWaiting) {
  auto s = start_listener("abc");
  ASSERT_TRUE(s.listener);

  auto res = http_get("127.0.0.1", s.listener->port(),
                      "/token-received?token=forged&state=other");
  EXPECT_EQ(res.body(), fitbridge::oauth::kStateMismatchMessage);
  EXPECT_FALSE(s.session->completed());

  // The real redirect can still arrive afterwards.
  auto ok = http_get("127.0.0.1", s.listener->port(),
                     "/token-received?token=real&state=abc");
  EXPECT_EQ(ok.body(), fitbridge::oauth::kStateMatchesMessage);
  EXPECT_EQ(*s.session->access_token(), "real");

  s.listener->stop();
}

TEST(RedirectListener, DuplicateRedirectKeepsFirstToken) {
  auto s = start_listener("abc");
  ASSERT_TRUE(s.listener);

  http_get("127.0.0.1", s.listener->port(),
           "/token-received?token=first&state=abc");
  auto dup = http_get("127.0.0.1", s.listener->port(),
                      "/token-received?token=second&state=abc");
  EXPECT_EQ(dup.body(), fitbridge::oauth::kAlreadyCompletedMessage);
  EXPECT_EQ(*s.session->access_token(), "first");

  s.listener->stop();
}

TEST(RedirectListener, UnknownPathIsNotFound) {
  auto s = start_listener("abc");
  ASSERT_TRUE(s.listener);

  auto res = http_get("127.0.0.1", s.listener->port(), "/nope");
  EXPECT_EQ(res.result(), http::status::not_found);

  s.listener->stop();
}

TEST(RedirectListener, HandleRejectsPost) {
  auto s = start_listener("abc");
  ASSERT_TRUE(s.listener);

  auto reply = s.listener->handle(http::verb::post,
                                  "/token-received?token=t&state=abc");
  EXPECT_EQ(reply.status, http::status::not_found);
  EXPECT_FALSE(s.session->completed());

  s.listener->stop();
}

TEST(RedirectListener, StopIsIdempotent) {
  auto s = start_listener("abc");
  ASSERT_TRUE(s.listener);

  s.listener->stop();
  EXPECT_TRUE(s.listener->is_stopped());
  s.listener->stop();
  EXPECT_TRUE(s.listener->is_stopped());
}

TEST(RedirectListener, PortInUseFailsToStart) {
  auto first = start_listener("abc");
  ASSERT_TRUE(first.listener);

  auto session = std::make_shared<AuthSession>();
  auto second =
      RedirectListener::start({"127.0.0.1", first.listener->port()}, session);
  ASSERT_TRUE(second.is_err());
  EXPECT_EQ(second.error().code, my_errors::NETWORK::LISTEN_FAILED);

  first.listener->stop();
}

TEST(RedirectListener, NullSessionIsRejected) {
  auto started = RedirectListener::start({"127.0.0.1", 0}, nullptr);
  ASSERT_TRUE(started.is_err());
  EXPECT_EQ(started.error().code, my_errors::GENERAL::MISSING_FIELD);
}

} // namespace
