#include "oauth/pkce.hpp"

#include <fmt/format.h>

#include "my_error_codes.hpp"
#include "openssl/crypt_util.hpp"

namespace fitbridge::oauth {

monad::MyResult<std::string> generate_code_verifier(std::size_t length) {
  if (length < kMinVerifierLength || length > kMaxVerifierLength) {
    return monad::MyResult<std::string>::Err(monad::make_error(
        my_errors::PKCE::INVALID_LENGTH,
        fmt::format("code verifier length must be between {} and {}, got {}",
                    kMinVerifierLength, kMaxVerifierLength, length)));
  }
  return cryptutil::random_string(length, kVerifierAlphabet);
}

monad::MyResult<std::string>
generate_code_challenge(std::string_view verifier) {
  if (verifier.empty()) {
    return monad::MyResult<std::string>::Err(monad::make_error(
        my_errors::PKCE::EMPTY_INPUT, "code verifier must not be empty"));
  }
  auto digest = cryptutil::sha256(verifier);
  if (digest.is_err()) {
    return monad::MyResult<std::string>::Err(std::move(digest).error());
  }
  const auto &bytes = digest.value();
  return monad::MyResult<std::string>::Ok(cryptutil::base64_to_base64url(
      cryptutil::base64_encode(bytes.data(), bytes.size())));
}

monad::MyResult<PkcePair> make_pkce_pair(std::size_t length) {
  auto verifier = generate_code_verifier(length);
  if (verifier.is_err()) {
    return monad::MyResult<PkcePair>::Err(std::move(verifier).error());
  }
  auto challenge = generate_code_challenge(verifier.value());
  if (challenge.is_err()) {
    return monad::MyResult<PkcePair>::Err(std::move(challenge).error());
  }
  return monad::MyResult<PkcePair>::Ok(
      PkcePair{.verifier = verifier.value(), .challenge = challenge.value()});
}

} // namespace fitbridge::oauth
