#pragma once

#include <cstddef>
#include <string>
#include <string_view>

#include "conf/credentials_config.hpp"
#include "oauth/auth_session.hpp"
#include "result_monad.hpp"

namespace fitbridge::oauth {

inline constexpr std::string_view kStateAlphabet =
    "abcdefghijklmnopqrstuvwxyz0123456789ABCDEFGHIJKLMNOPQRSTUVWXYZ";

inline constexpr std::size_t kStateLength = 32;

/**
 * Anti-forgery value for one authorization request. The value is recorded as
 * the session's expected state before it is returned; a later call replaces
 * it.
 */
monad::MyResult<std::string> generate_state(AuthSession &session);

/**
 * Implicit-grant authorization URL with PKCE parameters:
 *
 *   <endpoint>?response_type=token&client_id=..&redirect_uri=..&scope=a+b
 *     &code_challenge=..&code_challenge_method=S256&state=..
 *
 * client_id and redirect_uri are percent-encoded; scopes are joined with '+'.
 */
std::string build_authorization_url(std::string_view challenge,
                                    const Credentials &credentials,
                                    std::string_view state);

// Generates the state into `session` and builds the URL with it.
monad::MyResult<std::string>
build_authorization_url(std::string_view challenge,
                        const Credentials &credentials, AuthSession &session);

} // namespace fitbridge::oauth
