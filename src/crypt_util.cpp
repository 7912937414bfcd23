#include "openssl/crypt_util.hpp"

#include <algorithm>

#include "my_error_codes.hpp"

namespace fitbridge {
namespace cryptutil {

monad::MyResult<std::vector<unsigned char>> sha256(std::string_view input) {
  EVP_MD_CTX_ptr context{EVP_MD_CTX_new(), &EVP_MD_CTX_free};
  if (!context) {
    return monad::MyResult<std::vector<unsigned char>>::Err(
        monad::make_error(my_errors::GENERAL::UNEXPECTED_RESULT,
                          "Failed to create digest context"));
  }
  if (EVP_DigestInit_ex(context.get(), EVP_sha256(), nullptr) != 1 ||
      EVP_DigestUpdate(context.get(), input.data(), input.size()) != 1) {
    return monad::MyResult<std::vector<unsigned char>>::Err(
        monad::make_error(my_errors::GENERAL::UNEXPECTED_RESULT,
                          "Failed to compute SHA256 digest"));
  }
  std::vector<unsigned char> hash(EVP_MAX_MD_SIZE);
  unsigned int hash_len = 0;
  if (EVP_DigestFinal_ex(context.get(), hash.data(), &hash_len) != 1) {
    return monad::MyResult<std::vector<unsigned char>>::Err(
        monad::make_error(my_errors::GENERAL::UNEXPECTED_RESULT,
                          "Failed to finalize SHA256 digest"));
  }
  hash.resize(hash_len);
  return monad::MyResult<std::vector<unsigned char>>::Ok(std::move(hash));
}

std::string base64_encode(const unsigned char *data, std::size_t len) {
  if (len == 0) {
    return {};
  }
  // EVP_EncodeBlock writes 4 bytes per 3 input bytes plus a NUL.
  std::string out(4 * ((len + 2) / 3) + 1, '\0');
  const int written =
      EVP_EncodeBlock(reinterpret_cast<unsigned char *>(out.data()), data,
                      static_cast<int>(len));
  out.resize(written > 0 ? static_cast<std::size_t>(written) : 0);
  return out;
}

std::string base64_to_base64url(const std::string &base64) {
  std::string base64url = base64;
  std::replace(base64url.begin(), base64url.end(), '+', '-');
  std::replace(base64url.begin(), base64url.end(), '/', '_');
  base64url.erase(std::remove(base64url.begin(), base64url.end(), '='),
                  base64url.end());
  return base64url;
}

monad::MyResult<std::size_t> rnd_index(std::size_t n) {
  if (n == 0 || n > 256) {
    return monad::MyResult<std::size_t>::Err(monad::make_error(
        my_errors::GENERAL::INVALID_ARGUMENT, "rnd_index range out of bounds"));
  }
  unsigned char b = 0;
  const std::size_t maxMultiple = (256 / n) * n; // highest multiple of n <= 256
  do {
    if (RAND_bytes(&b, 1) != 1) {
      return monad::MyResult<std::size_t>::Err(monad::make_error(
          my_errors::PKCE::RANDOM_FAILURE, "RAND_bytes failed"));
    }
  } while (b >= maxMultiple);
  return monad::MyResult<std::size_t>::Ok(b % n);
}

monad::MyResult<std::string> random_string(std::size_t length,
                                           std::string_view alphabet) {
  std::string out;
  out.reserve(length);
  for (std::size_t i = 0; i < length; ++i) {
    auto idx = rnd_index(alphabet.size());
    if (idx.is_err()) {
      return monad::MyResult<std::string>::Err(std::move(idx).error());
    }
    out.push_back(alphabet[idx.value()]);
  }
  return monad::MyResult<std::string>::Ok(std::move(out));
}

} // namespace cryptutil
} // namespace fitbridge
