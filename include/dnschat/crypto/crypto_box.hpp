// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of dnschat, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <array>
#include <cstdint>
#include <cstring>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/kdf.h>

#include "dnschat/crypto/secure_rng.hpp"
#include "dnschat/util/base64_url.hpp"

namespace dnschat
{
namespace crypto
{

/// \brief Raised for malformed tokens, failed authentication, or an unusable
/// key.
class CryptoException : public std::runtime_error
{
public:
  explicit CryptoException(const std::string &message)
      : std::runtime_error("Crypto Error: " + message)
  {
  }
};

/// \brief Authenticated encryption shared by both tunnel ends.
///
/// Token layout (encrypt-then-MAC):
///   "CH20" | nonce (12) | ChaCha20 ciphertext | HMAC-SHA256 tag (32)
/// The tag covers magic, nonce and ciphertext. Encryption and MAC keys are
/// derived from the 32-byte master key with HKDF-SHA256.
class CryptoBox
{
public:
  static constexpr std::size_t KEY_SIZE = 32;
  static constexpr std::size_t NONCE_SIZE = 12;
  static constexpr std::size_t TAG_SIZE = 32;
  static constexpr std::size_t MAGIC_SIZE = 4;
  static constexpr std::size_t OVERHEAD = MAGIC_SIZE + NONCE_SIZE + TAG_SIZE;

  /// \param keyMaterial Base64url text of 32 raw bytes, or any passphrase
  /// (stretched with HKDF).
  /// \throws CryptoException if the key material is empty.
  explicit CryptoBox(const std::string &keyMaterial)
  {
    auto master = normalizeKey(keyMaterial);
    auto derived = hkdfSha256(master, "chacha20+hmac", "enc+mac", 2 * KEY_SIZE);
    _encKey.assign(derived.begin(), derived.begin() + KEY_SIZE);
    _macKey.assign(derived.begin() + KEY_SIZE, derived.end());
    OPENSSL_cleanse(master.data(), master.size());
    OPENSSL_cleanse(derived.data(), derived.size());
  }

  ~CryptoBox()
  {
    OPENSSL_cleanse(_encKey.data(), _encKey.size());
    OPENSSL_cleanse(_macKey.data(), _macKey.size());
  }

  CryptoBox(const CryptoBox &) = default;
  CryptoBox &operator=(const CryptoBox &) = default;

  /// \brief Fresh random key as padded base64url text (44 characters).
  static std::string generateKey()
  {
    auto key = SecureRng::bytes(KEY_SIZE);
    return util::Base64Url::encode(key);
  }

  /// \brief Encrypt to raw token bytes. A fresh nonce is drawn per call.
  std::vector<std::uint8_t> seal(const std::string &plaintext) const
  {
    std::vector<std::uint8_t> token;
    token.reserve(OVERHEAD + plaintext.size());
    token.insert(token.end(), kMagic, kMagic + MAGIC_SIZE);

    std::array<std::uint8_t, NONCE_SIZE> nonce{};
    SecureRng::fill(nonce);
    token.insert(token.end(), nonce.begin(), nonce.end());

    auto ciphertext = chacha20(nonce, reinterpret_cast<const std::uint8_t *>(plaintext.data()),
                               plaintext.size());
    token.insert(token.end(), ciphertext.begin(), ciphertext.end());

    auto tag = SecureRng::hmacSha256(_macKey, token.data(), token.size());
    token.insert(token.end(), tag.begin(), tag.end());
    return token;
  }

  /// \brief Verify and decrypt raw token bytes.
  /// \throws CryptoException on short input, wrong magic, or tag mismatch.
  std::string open(const std::vector<std::uint8_t> &token) const
  {
    if (token.size() < OVERHEAD)
    {
      throw CryptoException("token too short (" + std::to_string(token.size()) + " bytes)");
    }
    if (std::memcmp(token.data(), kMagic, MAGIC_SIZE) != 0)
    {
      throw CryptoException("bad token magic");
    }

    const std::size_t macOffset = token.size() - TAG_SIZE;
    auto expected = SecureRng::hmacSha256(_macKey, token.data(), macOffset);
    if (CRYPTO_memcmp(expected.data(), token.data() + macOffset, TAG_SIZE) != 0)
    {
      throw CryptoException("authentication failed");
    }

    std::array<std::uint8_t, NONCE_SIZE> nonce{};
    std::memcpy(nonce.data(), token.data() + MAGIC_SIZE, NONCE_SIZE);
    const std::size_t ctOffset = MAGIC_SIZE + NONCE_SIZE;
    auto plain = chacha20(nonce, token.data() + ctOffset, macOffset - ctOffset);
    return std::string(plain.begin(), plain.end());
  }

  /// \brief Encrypt to base64url text.
  std::string encrypt(const std::string &plaintext) const
  {
    return util::Base64Url::encode(seal(plaintext));
  }

  /// \throws CryptoException on invalid base64url or any open() failure.
  std::string decrypt(const std::string &token) const
  {
    auto raw = util::Base64Url::decode(token);
    if (!raw)
    {
      throw CryptoException("token is not valid base64url");
    }
    return open(*raw);
  }

private:
  static constexpr std::uint8_t kMagic[MAGIC_SIZE] = {'C', 'H', '2', '0'};

  std::vector<std::uint8_t> _encKey;
  std::vector<std::uint8_t> _macKey;

  static std::vector<std::uint8_t> normalizeKey(const std::string &keyMaterial)
  {
    if (keyMaterial.empty())
    {
      throw CryptoException("encryption key is empty");
    }
    auto decoded = util::Base64Url::decode(keyMaterial);
    if (decoded && decoded->size() == KEY_SIZE)
    {
      return *decoded;
    }
    std::vector<std::uint8_t> secret(keyMaterial.begin(), keyMaterial.end());
    return hkdfSha256(secret, "key-normalize", "master", KEY_SIZE);
  }

  static std::vector<std::uint8_t> hkdfSha256(const std::vector<std::uint8_t> &ikm,
                                              const std::string &salt, const std::string &info,
                                              std::size_t length)
  {
    std::unique_ptr<EVP_PKEY_CTX, decltype(&EVP_PKEY_CTX_free)> ctx(
      EVP_PKEY_CTX_new_id(EVP_PKEY_HKDF, nullptr), &EVP_PKEY_CTX_free);
    if (!ctx)
    {
      throw CryptoException("HKDF context allocation failed: " + SecureRng::lastError());
    }

    std::vector<std::uint8_t> out(length);
    std::size_t outLen = length;
    if (EVP_PKEY_derive_init(ctx.get()) <= 0 ||
        EVP_PKEY_CTX_set_hkdf_md(ctx.get(), EVP_sha256()) <= 0 ||
        EVP_PKEY_CTX_set1_hkdf_salt(ctx.get(),
                                    reinterpret_cast<const unsigned char *>(salt.data()),
                                    static_cast<int>(salt.size())) <= 0 ||
        EVP_PKEY_CTX_set1_hkdf_key(ctx.get(), ikm.data(), static_cast<int>(ikm.size())) <= 0 ||
        EVP_PKEY_CTX_add1_hkdf_info(ctx.get(),
                                    reinterpret_cast<const unsigned char *>(info.data()),
                                    static_cast<int>(info.size())) <= 0 ||
        EVP_PKEY_derive(ctx.get(), out.data(), &outLen) <= 0 || outLen != length)
    {
      throw CryptoException("HKDF derivation failed: " + SecureRng::lastError());
    }
    return out;
  }

  /// ChaCha20 keystream XOR with the block counter starting at 1.
  std::vector<std::uint8_t> chacha20(const std::array<std::uint8_t, NONCE_SIZE> &nonce,
                                     const std::uint8_t *input, std::size_t len) const
  {
    // OpenSSL takes a 16-byte IV: 32-bit little-endian counter then nonce.
    std::array<std::uint8_t, 16> iv{};
    iv[0] = 1;
    std::memcpy(iv.data() + 4, nonce.data(), NONCE_SIZE);

    std::unique_ptr<EVP_CIPHER_CTX, decltype(&EVP_CIPHER_CTX_free)> ctx(EVP_CIPHER_CTX_new(),
                                                                        &EVP_CIPHER_CTX_free);
    if (!ctx)
    {
      throw CryptoException("cipher context allocation failed: " + SecureRng::lastError());
    }

    std::vector<std::uint8_t> out(len + 16);
    int outLen = 0;
    int finalLen = 0;
    if (EVP_EncryptInit_ex(ctx.get(), EVP_chacha20(), nullptr, _encKey.data(), iv.data()) != 1 ||
        EVP_EncryptUpdate(ctx.get(), out.data(), &outLen, input, static_cast<int>(len)) != 1 ||
        EVP_EncryptFinal_ex(ctx.get(), out.data() + outLen, &finalLen) != 1)
    {
      throw CryptoException("ChaCha20 failed: " + SecureRng::lastError());
    }
    out.resize(static_cast<std::size_t>(outLen + finalLen));
    return out;
  }
};

} // namespace crypto
} // namespace dnschat
