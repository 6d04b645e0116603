// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of dnschat, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <openssl/rand.h>

namespace dnschat
{
namespace crypto
{

/// \brief OpenSSL-backed random bytes and keyed hashing used by the tunnel
/// (nonces, keys, session tokens, token authentication).
class SecureRng
{
public:
  /// \brief Fill a buffer with cryptographically secure random bytes.
  /// \throws std::runtime_error if RAND_bytes fails
  static void fill(std::uint8_t *dst, std::size_t len)
  {
    if (len == 0)
    {
      return;
    }
    if (RAND_bytes(dst, static_cast<int>(len)) != 1)
    {
      throw std::runtime_error("SecureRng: RAND_bytes failed: " + lastError());
    }
  }

  /// \brief Fill a container with random bytes.
  template <typename Container> static void fill(Container &c)
  {
    static_assert(sizeof(typename Container::value_type) == 1, "byte container required");
    fill(reinterpret_cast<std::uint8_t *>(c.data()), c.size());
  }

  static std::vector<std::uint8_t> bytes(std::size_t len)
  {
    std::vector<std::uint8_t> out(len);
    fill(out);
    return out;
  }

  /// \brief Uniform integer in [0, bound) by rejection sampling.
  static std::uint32_t uniform(std::uint32_t bound)
  {
    if (bound <= 1)
    {
      return 0;
    }
    const std::uint32_t limit = UINT32_MAX - (UINT32_MAX % bound);
    std::uint32_t v = 0;
    do
    {
      fill(reinterpret_cast<std::uint8_t *>(&v), sizeof(v));
    } while (v >= limit);
    return v % bound;
  }

  /// \brief HMAC-SHA256 of \p data under \p key.
  /// \throws std::invalid_argument if key is empty
  /// \throws std::runtime_error if HMAC computation fails
  static std::vector<std::uint8_t> hmacSha256(const std::vector<std::uint8_t> &key,
                                              const std::uint8_t *data, std::size_t len)
  {
    if (key.empty())
    {
      throw std::invalid_argument("SecureRng/hmacSha256: key cannot be empty");
    }

    std::vector<std::uint8_t> out(EVP_MAX_MD_SIZE);
    unsigned int outLen = 0;
    unsigned char *result = HMAC(EVP_sha256(), key.data(), static_cast<int>(key.size()), data,
                                 len, out.data(), &outLen);
    if (result == nullptr || outLen != 32U)
    {
      throw std::runtime_error("SecureRng/hmacSha256: HMAC failed: " + lastError());
    }
    out.resize(outLen);
    return out;
  }

  /// \brief Get the last OpenSSL error as a string
  static std::string lastError()
  {
    unsigned long code = ERR_peek_last_error(); // NOLINT(google-runtime-int)
    if (code == 0UL)
    {
      return "no OpenSSL error available";
    }
    char buf[256] = {0};
    ERR_error_string_n(code, buf, sizeof(buf));
    return std::string(buf);
  }
};

} // namespace crypto
} // namespace dnschat
