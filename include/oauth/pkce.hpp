#pragma once

#include <cstddef>
#include <string>
#include <string_view>

#include "result_monad.hpp"

namespace fitbridge::oauth {

// RFC 7636 section 4.1: ALPHA / DIGIT / "-" / "." / "_" / "~"
inline constexpr std::string_view kVerifierAlphabet =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789-._~";

inline constexpr std::size_t kMinVerifierLength = 43;
inline constexpr std::size_t kMaxVerifierLength = 128;

struct PkcePair {
  std::string verifier;
  std::string challenge;
};

/**
 * Random code verifier of exactly `length` characters from
 * kVerifierAlphabet. Lengths outside [43, 128] are rejected with
 * PKCE::INVALID_LENGTH.
 */
monad::MyResult<std::string> generate_code_verifier(std::size_t length);

/**
 * S256 transform: base64url (no padding) of SHA-256(verifier). Always 43
 * characters for a non-empty verifier. Empty input is PKCE::EMPTY_INPUT.
 */
monad::MyResult<std::string> generate_code_challenge(std::string_view verifier);

monad::MyResult<PkcePair>
make_pkce_pair(std::size_t length = kMinVerifierLength);

} // namespace fitbridge::oauth
