// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of dnschat, which is licensed under the Mozilla Public License 2.0.
// See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for details.

#pragma once

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "dnschat/network/dns/dns_types.hpp"

namespace dnschat
{
namespace tunnel
{

/// \brief Wire vocabulary shared by client and server.
namespace protocol
{
  constexpr int VERSION = 1;

  constexpr const char *DEFAULT_SUFFIX = "llm.local";

  constexpr const char *TAG_FRAGMENT = "m";
  constexpr const char *TAG_FETCH = "g";
  constexpr const char *TAG_INFO = "v";
  constexpr const char *TAG_INFO_LONG = "version";
  constexpr const char *TAG_CLEANUP = "c";

  constexpr const char *REPLY_OK = "OK";
  constexpr const char *REPLY_NOT_FOUND = "NOT_FOUND";

  /// Appended to the plaintext before the last encryption of a response.
  constexpr const char *END_OF_STREAM = "<<END_OF_STREAM>>";

  constexpr std::size_t DEFAULT_RESPONSE_CHUNK_SIZE = 200;
  constexpr std::size_t DEFAULT_SESSION_DIGITS = 4;
  /// Upper bound on "{index}:{total}:" so a chunk record fits one TXT string.
  constexpr std::size_t RESPONSE_PREFIX_RESERVE = 16;
} // namespace protocol

/// \brief Tunables of the query-name grammar.
struct ProtocolConfig
{
  std::string suffix = protocol::DEFAULT_SUFFIX;
  std::size_t maxNameLength = network::dns::constants::DNS_MAX_NAME_SIZE;
  std::size_t maxLabelLength = network::dns::constants::DNS_MAX_LABEL_SIZE;
  std::size_t responseChunkSize = protocol::DEFAULT_RESPONSE_CHUNK_SIZE;
  std::size_t sessionDigits = protocol::DEFAULT_SESSION_DIGITS;
};

/// \brief Command carried by the first label of a query name.
enum class Command
{
  Fragment,
  Fetch,
  Info,
  Cleanup,
  Unknown ///< inside our suffix, unrecognised tag
};

/// \brief Label-level helpers for query names.
class QueryName
{
public:
  /// \brief Split a dotted name into labels; one trailing dot is tolerated.
  /// \return std::nullopt for an empty name or an empty label
  static std::optional<std::vector<std::string>> split(const std::string &name)
  {
    std::string trimmed = name;
    if (!trimmed.empty() && trimmed.back() == '.')
    {
      trimmed.pop_back();
    }
    if (trimmed.empty())
    {
      return std::nullopt;
    }

    std::vector<std::string> labels;
    std::size_t start = 0;
    while (true)
    {
      std::size_t dot = trimmed.find('.', start);
      std::string label = trimmed.substr(start, dot == std::string::npos ? std::string::npos
                                                                          : dot - start);
      if (label.empty())
      {
        return std::nullopt;
      }
      labels.push_back(std::move(label));
      if (dot == std::string::npos)
      {
        break;
      }
      start = dot + 1;
    }
    return labels;
  }

  static std::string join(const std::vector<std::string> &labels, std::size_t begin,
                          std::size_t end, const std::string &separator = ".")
  {
    std::string out;
    for (std::size_t i = begin; i < end && i < labels.size(); ++i)
    {
      if (i != begin)
      {
        out += separator;
      }
      out += labels[i];
    }
    return out;
  }

  static bool iequals(const std::string &a, const std::string &b)
  {
    return a.size() == b.size() &&
           std::equal(a.begin(), a.end(), b.begin(), [](char x, char y)
                      {
                        return std::tolower(static_cast<unsigned char>(x)) ==
                               std::tolower(static_cast<unsigned char>(y));
                      });
  }

  /// \brief True if the trailing labels of \p labels equal \p suffix (case-insensitive).
  static bool hasSuffix(const std::vector<std::string> &labels,
                        const std::vector<std::string> &suffix)
  {
    if (suffix.size() > labels.size())
    {
      return false;
    }
    std::size_t offset = labels.size() - suffix.size();
    for (std::size_t i = 0; i < suffix.size(); ++i)
    {
      if (!iequals(labels[offset + i], suffix[i]))
      {
        return false;
      }
    }
    return true;
  }

  /// \brief Strict unsigned decimal; rejects signs, blanks and overflow.
  static std::optional<std::size_t> parseIndex(const std::string &label)
  {
    if (label.empty() || label.size() > 9)
    {
      return std::nullopt;
    }
    std::size_t value = 0;
    for (char c : label)
    {
      if (c < '0' || c > '9')
      {
        return std::nullopt;
      }
      value = value * 10 + static_cast<std::size_t>(c - '0');
    }
    return value;
  }

  static Command classify(const std::string &tag)
  {
    if (iequals(tag, protocol::TAG_FRAGMENT))
      return Command::Fragment;
    if (iequals(tag, protocol::TAG_FETCH))
      return Command::Fetch;
    if (iequals(tag, protocol::TAG_INFO) || iequals(tag, protocol::TAG_INFO_LONG))
      return Command::Info;
    if (iequals(tag, protocol::TAG_CLEANUP))
      return Command::Cleanup;
    return Command::Unknown;
  }
};

} // namespace tunnel
} // namespace dnschat
