// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of dnschat, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <algorithm>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace dnschat
{
namespace util
{

  /// \brief Length-prefixed base36 codec for DNS label payloads.
  ///
  /// The payload is treated as one big-endian unsigned integer and written
  /// with the alphabet [0-9a-z], which is legal in DNS labels and survives
  /// resolvers that fold case. A fixed-width base36 prefix carries the
  /// original byte count so leading zero bytes come back on decode.
  class Base36
  {
  public:
    static constexpr std::size_t LENGTH_PREFIX_WIDTH = 4;
    /// 36^4 - 1
    static constexpr std::size_t MAX_PAYLOAD_BYTES = 1679615;

    /// \throws std::length_error if the payload exceeds MAX_PAYLOAD_BYTES.
    static std::string encode(const std::vector<std::uint8_t> &data)
    {
      if (data.size() > MAX_PAYLOAD_BYTES)
      {
        throw std::length_error("Base36: payload of " + std::to_string(data.size()) +
                                " bytes exceeds " + std::to_string(MAX_PAYLOAD_BYTES));
      }

      std::string out = encodeLength(data.size());

      // Strip leading zero bytes; the length prefix restores them.
      auto first = std::find_if(data.begin(), data.end(), [](std::uint8_t b) { return b != 0; });
      std::vector<std::uint8_t> number(first, data.end());

      std::string digits;
      digits.reserve(number.size() * 155 / 100 + 5);
      while (!number.empty())
      {
        // Divide by 36^5 so each pass over the bytes yields five digits.
        std::uint64_t remainder = 0;
        std::vector<std::uint8_t> quotient;
        quotient.reserve(number.size());
        for (std::uint8_t byte : number)
        {
          std::uint64_t cur = (remainder << 8) | byte;
          std::uint8_t q = static_cast<std::uint8_t>(cur / kGroupBase);
          remainder = cur % kGroupBase;
          if (!quotient.empty() || q != 0)
          {
            quotient.push_back(q);
          }
        }
        for (std::size_t i = 0; i < kGroupDigits; ++i)
        {
          digits.push_back(kAlphabet[remainder % 36]);
          remainder /= 36;
        }
        number.swap(quotient);
      }

      while (!digits.empty() && digits.back() == '0')
      {
        digits.pop_back();
      }
      out.append(digits.rbegin(), digits.rend());
      return out;
    }

    /// \brief Decode text produced by encode(); case-insensitive.
    /// \return std::nullopt for a short prefix, a foreign character, or a
    /// value that does not fit the declared byte count.
    static std::optional<std::vector<std::uint8_t>> decode(const std::string &text)
    {
      if (text.size() < LENGTH_PREFIX_WIDTH)
      {
        return std::nullopt;
      }

      std::size_t length = 0;
      for (std::size_t i = 0; i < LENGTH_PREFIX_WIDTH; ++i)
      {
        int v = digitValue(text[i]);
        if (v < 0)
        {
          return std::nullopt;
        }
        length = length * 36 + static_cast<std::size_t>(v);
      }

      // Little-endian accumulator while multiplying in groups of five digits.
      std::vector<std::uint8_t> acc;
      std::size_t pos = LENGTH_PREFIX_WIDTH;
      while (pos < text.size())
      {
        std::size_t take = std::min(kGroupDigits, text.size() - pos);
        std::uint64_t multiplier = 1;
        std::uint64_t group = 0;
        for (std::size_t i = 0; i < take; ++i)
        {
          int v = digitValue(text[pos + i]);
          if (v < 0)
          {
            return std::nullopt;
          }
          group = group * 36 + static_cast<std::uint64_t>(v);
          multiplier *= 36;
        }
        pos += take;

        std::uint64_t carry = group;
        for (auto &byte : acc)
        {
          std::uint64_t cur = static_cast<std::uint64_t>(byte) * multiplier + carry;
          byte = static_cast<std::uint8_t>(cur & 0xFF);
          carry = cur >> 8;
        }
        while (carry != 0)
        {
          acc.push_back(static_cast<std::uint8_t>(carry & 0xFF));
          carry >>= 8;
        }
        if (acc.size() > length)
        {
          return std::nullopt;
        }
      }

      std::vector<std::uint8_t> out(length - acc.size(), 0);
      out.insert(out.end(), acc.rbegin(), acc.rend());
      return out;
    }

  private:
    static constexpr const char *kAlphabet = "0123456789abcdefghijklmnopqrstuvwxyz";
    static constexpr std::size_t kGroupDigits = 5;
    static constexpr std::uint64_t kGroupBase = 60466176; // 36^5

    static std::string encodeLength(std::size_t length)
    {
      std::string prefix(LENGTH_PREFIX_WIDTH, '0');
      for (std::size_t i = LENGTH_PREFIX_WIDTH; i-- > 0;)
      {
        prefix[i] = kAlphabet[length % 36];
        length /= 36;
      }
      return prefix;
    }

    static int digitValue(char c)
    {
      if (c >= '0' && c <= '9')
        return c - '0';
      if (c >= 'a' && c <= 'z')
        return c - 'a' + 10;
      if (c >= 'A' && c <= 'Z')
        return c - 'A' + 10;
      return -1;
    }
  };

} // namespace util
} // namespace dnschat
