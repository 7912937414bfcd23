#pragma once

#include <openssl/evp.h>
#include <openssl/rand.h>

#include <cstddef>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "result_monad.hpp"

namespace fitbridge {
namespace cryptutil {

using EVP_MD_CTX_ptr = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;

/**
 * Raw SHA-256 digest of the input bytes (32 bytes).
 */
monad::MyResult<std::vector<unsigned char>> sha256(std::string_view input);

// Standard base64 with padding.
std::string base64_encode(const unsigned char *data, std::size_t len);

std::string base64_to_base64url(const std::string &base64);

/**
 * Uniform index in [0, n) from RAND_bytes, rejection-sampled so that every
 * index is equally likely. n must be in [1, 256].
 */
monad::MyResult<std::size_t> rnd_index(std::size_t n);

/**
 * length characters drawn independently and uniformly from alphabet.
 */
monad::MyResult<std::string> random_string(std::size_t length,
                                           std::string_view alphabet);

} // namespace cryptutil
} // namespace fitbridge
