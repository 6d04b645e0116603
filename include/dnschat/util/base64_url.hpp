// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of dnschat, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace dnschat
{
namespace util
{

  /// \brief Base64URL codec (RFC 4648 section 5).
  ///
  /// Uses '-' and '_' instead of '+' and '/'. Encryption tokens carry '='
  /// padding; decode accepts padded and unpadded input alike.
  class Base64Url
  {
  public:
    static std::string encode(const std::uint8_t *data, std::size_t len, bool pad = true)
    {
      static constexpr char kTable[65] =
        "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789-_";
      std::string out;
      out.reserve(((len + 2) / 3) * 4);

      std::size_t i = 0;
      while (i + 3 <= len)
      {
        std::uint32_t v = (static_cast<std::uint32_t>(data[i]) << 16) |
                          (static_cast<std::uint32_t>(data[i + 1]) << 8) |
                          (static_cast<std::uint32_t>(data[i + 2]));
        out.push_back(kTable[(v >> 18) & 0x3F]);
        out.push_back(kTable[(v >> 12) & 0x3F]);
        out.push_back(kTable[(v >> 6) & 0x3F]);
        out.push_back(kTable[v & 0x3F]);
        i += 3;
      }

      std::size_t rem = len - i;
      if (rem == 1)
      {
        std::uint32_t v = static_cast<std::uint32_t>(data[i]) << 16;
        out.push_back(kTable[(v >> 18) & 0x3F]);
        out.push_back(kTable[(v >> 12) & 0x3F]);
        if (pad)
        {
          out.append("==");
        }
      }
      else if (rem == 2)
      {
        std::uint32_t v = (static_cast<std::uint32_t>(data[i]) << 16) |
                          (static_cast<std::uint32_t>(data[i + 1]) << 8);
        out.push_back(kTable[(v >> 18) & 0x3F]);
        out.push_back(kTable[(v >> 12) & 0x3F]);
        out.push_back(kTable[(v >> 6) & 0x3F]);
        if (pad)
        {
          out.push_back('=');
        }
      }
      return out;
    }

    static std::string encode(const std::vector<std::uint8_t> &bytes, bool pad = true)
    {
      return encode(bytes.data(), bytes.size(), pad);
    }

    /// \brief Decode Base64URL text.
    /// \return std::nullopt on characters outside the alphabet, misplaced
    /// padding, or an impossible length.
    static std::optional<std::vector<std::uint8_t>> decode(const std::string &text)
    {
      std::string body = text;
      std::size_t padCount = 0;
      while (!body.empty() && body.back() == '=')
      {
        body.pop_back();
        ++padCount;
      }
      if (padCount > 2 || (padCount > 0 && (body.size() + padCount) % 4 != 0) ||
          body.size() % 4 == 1)
      {
        return std::nullopt;
      }

      std::vector<std::uint8_t> out;
      out.reserve(body.size() * 3 / 4);
      std::uint32_t acc = 0;
      int bits = 0;
      for (char c : body)
      {
        int v = value(c);
        if (v < 0)
        {
          return std::nullopt;
        }
        acc = (acc << 6) | static_cast<std::uint32_t>(v);
        bits += 6;
        if (bits >= 8)
        {
          bits -= 8;
          out.push_back(static_cast<std::uint8_t>((acc >> bits) & 0xFF));
        }
      }
      return out;
    }

  private:
    static int value(char c)
    {
      if (c >= 'A' && c <= 'Z')
        return c - 'A';
      if (c >= 'a' && c <= 'z')
        return c - 'a' + 26;
      if (c >= '0' && c <= '9')
        return c - '0' + 52;
      if (c == '-')
        return 62;
      if (c == '_')
        return 63;
      return -1;
    }
  };

} // namespace util
} // namespace dnschat
