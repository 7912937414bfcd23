#include "oauth/authorization_url.hpp"

#include <fmt/format.h>

#include "openssl/crypt_util.hpp"
#include "util/string_util.hpp"

namespace fitbridge::oauth {

monad::MyResult<std::string> generate_state(AuthSession &session) {
  auto state = cryptutil::random_string(kStateLength, kStateAlphabet);
  if (state.is_err()) {
    return state;
  }
  session.set_expected_state(state.value());
  return state;
}

std::string build_authorization_url(std::string_view challenge,
                                    const Credentials &credentials,
                                    std::string_view state) {
  return fmt::format(
      "{}?response_type=token&client_id={}&redirect_uri={}&scope={}"
      "&code_challenge={}&code_challenge_method=S256&state={}",
      credentials.authorize_endpoint,
      stringutil::url_encode(credentials.client_id),
      stringutil::url_encode(credentials.redirect_url),
      stringutil::join(credentials.scopes, "+"), challenge, state);
}

monad::MyResult<std::string>
build_authorization_url(std::string_view challenge,
                        const Credentials &credentials, AuthSession &session) {
  auto state = generate_state(session);
  if (state.is_err()) {
    return state;
  }
  return monad::MyResult<std::string>::Ok(
      build_authorization_url(challenge, credentials, state.value()));
}

} // namespace fitbridge::oauth
