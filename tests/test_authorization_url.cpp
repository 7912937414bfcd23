#include <gtest/gtest.h>

#include <string>

#include "conf/credentials_config.hpp"
#include "oauth/auth_session.hpp"
#include "oauth/authorization_url.hpp"

namespace {

using namespace fitbridge;

Credentials test_credentials() {
  Credentials c{};
  c.client_id = "testClientID";
  c.redirect_url = "https://test.com/redirect";
  return c;
}

TEST(AuthorizationUrl, BuildsImplicitGrantUrlWithPkce) {
  const std::string url =
      oauth::build_authorization_url("testChallenge", test_credentials(),
                                     "testState");
  EXPECT_EQ(url,
            "https://www.fitbit.com/oauth2/authorize?response_type=token"
            "&client_id=testClientID"
            "&redirect_uri=https%3A%2F%2Ftest.com%2Fredirect"
            "&scope=activity+heartrate+location+profile"
            "&code_challenge=testChallenge&code_challenge_method=S256"
            "&state=testState");
}

TEST(AuthorizationUrl, EmptyScopesGiveEmptyScopeParameter) {
  auto creds = test_credentials();
  creds.scopes.clear();
  const std::string url =
      oauth::build_authorization_url("c", creds, "s");
  EXPECT_NE(url.find("&scope=&code_challenge=c"), std::string::npos) << url;
}

TEST(AuthorizationUrl, PercentEncodesClientId) {
  auto creds = test_credentials();
  creds.client_id = "a b&c";
  const std::string url = oauth::build_authorization_url("c", creds, "s");
  EXPECT_NE(url.find("client_id=a%20b%26c&"), std::string::npos) << url;
}

TEST(AuthorizationUrl, SessionOverloadRecordsState) {
  oauth::AuthSession session;
  auto url =
      oauth::build_authorization_url("ch", test_credentials(), session);
  ASSERT_TRUE(url.is_ok()) << url.error().what;

  const std::string state = session.expected_state();
  ASSERT_EQ(state.size(), oauth::kStateLength);
  const std::string suffix = "&state=" + state;
  ASSERT_GE(url.value().size(), suffix.size());
  EXPECT_EQ(url.value().substr(url.value().size() - suffix.size()), suffix);
}

TEST(AuthorizationUrl, GeneratedStateUsesAlphanumerics) {
  oauth::AuthSession session;
  auto first = oauth::generate_state(session);
  ASSERT_TRUE(first.is_ok());
  EXPECT_EQ(first.value().find_first_not_of(oauth::kStateAlphabet),
            std::string::npos);
  EXPECT_EQ(session.expected_state(), first.value());

  auto second = oauth::generate_state(session);
  ASSERT_TRUE(second.is_ok());
  EXPECT_NE(first.value(), second.value());
  EXPECT_EQ(session.expected_state(), second.value());
}

} // namespace
