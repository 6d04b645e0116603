// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of dnschat, which is licensed under the Mozilla Public License 2.0.
// See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for details.

#pragma once

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>

#include "dnschat/core/logger.hpp"
#include "dnschat/tunnel/protocol.hpp"
#include "dnschat/util/base36.hpp"

namespace dnschat
{
namespace tunnel
{

/// \brief A payload cannot be placed into legal query names.
class ChunkingException : public std::runtime_error
{
public:
  explicit ChunkingException(const std::string &message)
    : std::runtime_error("Chunking Error: " + message)
  {
  }
};

/// \brief Parsed `m.<session>.<index>.<total>.<data...>.<suffix>` query.
struct FragmentQuery
{
  std::string session;
  std::size_t index = 0;
  std::size_t total = 0;
  std::string data;
};

/// \brief Parsed `g.<session>.<index>.<suffix>` query.
struct FetchQuery
{
  std::string session;
  std::size_t index = 0;
};

/// \brief One `"{index}:{total}:{data}"` TXT chunk record.
struct ResponseChunk
{
  std::size_t index = 0;
  std::size_t total = 0;
  std::string data;
};

/// \brief Fragments of one inbound message, keyed by index.
struct ReassemblyState
{
  std::size_t total = 0;
  std::map<std::size_t, std::string> fragments;
  std::chrono::steady_clock::time_point lastUpdate;
};

using ReassemblyMap = std::unordered_map<std::string, ReassemblyState>;
using ResponseChunkMap = std::map<std::size_t, std::string>;

enum class FragmentStatus
{
  Invalid,
  Incomplete,
  Complete
};

struct FragmentResult
{
  FragmentStatus status = FragmentStatus::Invalid;
  std::string session;
  std::size_t received = 0;
  std::size_t total = 0;
  std::vector<std::uint8_t> payload; ///< set when Complete
  std::uint64_t generation = 0;      ///< assigned by SessionStore when Complete
};

/// \brief Stateless transformation between payloads and query names / TXT chunks.
///
/// Mutable reassembly state is passed in explicitly so that one owner (the
/// session store) keeps all of it under a single lock.
class Chunker
{
public:
  /// \throws ChunkingException on an unusable suffix or response chunk size
  explicit Chunker(ProtocolConfig config = ProtocolConfig())
    : _config(std::move(config))
  {
    auto labels = QueryName::split(_config.suffix);
    if (!labels)
    {
      throw ChunkingException("invalid domain suffix '" + _config.suffix + "'");
    }
    _suffixLabels = *labels;
    _suffix = QueryName::join(_suffixLabels, 0, _suffixLabels.size());

    const std::size_t maxChunk = network::dns::constants::DNS_MAX_CHARACTER_STRING -
                                 protocol::RESPONSE_PREFIX_RESERVE;
    if (_config.responseChunkSize == 0 || _config.responseChunkSize > maxChunk)
    {
      throw ChunkingException("response chunk size must be between 1 and " +
                              std::to_string(maxChunk));
    }
    if (_config.maxLabelLength == 0 ||
        _config.maxLabelLength > network::dns::constants::DNS_MAX_LABEL_SIZE ||
        _config.maxNameLength > network::dns::constants::DNS_MAX_NAME_SIZE)
    {
      throw ChunkingException("name limits exceed RFC 1035");
    }
  }

  const ProtocolConfig &config() const { return _config; }
  const std::string &suffix() const { return _suffix; }
  const std::vector<std::string> &suffixLabels() const { return _suffixLabels; }

  /// \brief Data characters that fit in one fragment name for the given
  /// session and index/total width. Zero if nothing fits.
  std::size_t fragmentDataBudget(const std::string &session, std::size_t counterDigits) const
  {
    // cmd . session . index . total . <data> . suffix
    const std::size_t fixed = std::char_traits<char>::length(protocol::TAG_FRAGMENT) +
                              session.size() + 2 * counterDigits + _suffix.size() + 5;
    if (fixed >= _config.maxNameLength)
    {
      return 0;
    }
    const std::size_t avail = _config.maxNameLength - fixed;
    // n data characters occupy n + ceil(n / maxLabel) - 1 name characters.
    std::size_t budget = avail;
    while (budget > 0 &&
           budget + (budget + _config.maxLabelLength - 1) / _config.maxLabelLength - 1 > avail)
    {
      --budget;
    }
    return budget;
  }

  /// \brief Encode \p payload into ordered fragment query names.
  /// \throws ChunkingException if the payload or session cannot be carried
  std::vector<std::string> createChunks(const std::vector<std::uint8_t> &payload,
                                        const std::string &session) const
  {
    if (session.empty() || session.size() > _config.maxLabelLength ||
        session.find('.') != std::string::npos)
    {
      throw ChunkingException("session token '" + session + "' is not a single DNS label");
    }

    std::string encoded;
    try
    {
      encoded = util::Base36::encode(payload);
    }
    catch (const std::length_error &e)
    {
      throw ChunkingException(e.what());
    }

    std::size_t digits = 1;
    std::size_t budget = 0;
    std::size_t total = 0;
    while (true)
    {
      budget = fragmentDataBudget(session, digits);
      if (budget == 0)
      {
        throw ChunkingException("no room for data in a " + std::to_string(_config.maxNameLength) +
                                "-character name with suffix '" + _suffix + "'");
      }
      total = std::max<std::size_t>(1, (encoded.size() + budget - 1) / budget);
      std::size_t needed = countDigits(total);
      if (needed <= digits)
      {
        break;
      }
      digits = needed;
    }

    std::vector<std::string> names;
    names.reserve(total);
    const std::string totalText = std::to_string(total);
    for (std::size_t i = 0; i < total; ++i)
    {
      std::string data = encoded.substr(i * budget, budget);

      std::string name = protocol::TAG_FRAGMENT;
      name += '.';
      name += session;
      name += '.';
      name += std::to_string(i);
      name += '.';
      name += totalText;
      for (std::size_t pos = 0; pos < data.size(); pos += _config.maxLabelLength)
      {
        name += '.';
        name += data.substr(pos, _config.maxLabelLength);
      }
      name += '.';
      name += _suffix;

      if (name.size() > _config.maxNameLength)
      {
        throw ChunkingException("fragment " + std::to_string(i) + " exceeds " +
                                std::to_string(_config.maxNameLength) + " characters");
      }
      names.push_back(std::move(name));
    }

    DNSCHAT_LOG_DEBUG("Chunker: " << payload.size() << " bytes -> " << total
                                  << " fragment(s) for session " << session);
    return names;
  }

  /// \return std::nullopt unless \p qname is a well-formed fragment query
  std::optional<FragmentQuery> parseFragmentQuery(const std::string &qname) const
  {
    auto labels = QueryName::split(qname);
    // cmd, session, index, total, at least one data label
    if (!labels || labels->size() < 5 + _suffixLabels.size() ||
        !QueryName::hasSuffix(*labels, _suffixLabels) ||
        QueryName::classify((*labels)[0]) != Command::Fragment)
    {
      return std::nullopt;
    }

    auto index = QueryName::parseIndex((*labels)[2]);
    auto total = QueryName::parseIndex((*labels)[3]);
    if (!index || !total || *total == 0 || *index >= *total)
    {
      return std::nullopt;
    }

    FragmentQuery query;
    query.session = (*labels)[1];
    query.index = *index;
    query.total = *total;
    query.data = QueryName::join(*labels, 4, labels->size() - _suffixLabels.size(), "");
    return query;
  }

  /// \return std::nullopt unless \p qname is a well-formed fetch query
  std::optional<FetchQuery> parseFetchQuery(const std::string &qname) const
  {
    auto labels = QueryName::split(qname);
    if (!labels || labels->size() != 3 + _suffixLabels.size() ||
        !QueryName::hasSuffix(*labels, _suffixLabels) ||
        QueryName::classify((*labels)[0]) != Command::Fetch)
    {
      return std::nullopt;
    }

    auto index = QueryName::parseIndex((*labels)[2]);
    if (!index)
    {
      return std::nullopt;
    }
    return FetchQuery{(*labels)[1], *index};
  }

  /// \brief Parse \p qname and record it in \p pending.
  FragmentResult processFragmentQuery(const std::string &qname, ReassemblyMap &pending,
                                      std::chrono::steady_clock::time_point now =
                                        std::chrono::steady_clock::now()) const
  {
    auto query = parseFragmentQuery(qname);
    if (!query)
    {
      return FragmentResult{};
    }
    return addFragment(*query, pending, now);
  }

  /// \brief Record one fragment; on completion the session's state is
  /// removed and the decoded payload returned.
  ///
  /// The first fragment seen fixes the total. A repeated index overwrites the
  /// earlier data and does not count twice.
  FragmentResult addFragment(const FragmentQuery &query, ReassemblyMap &pending,
                             std::chrono::steady_clock::time_point now =
                               std::chrono::steady_clock::now()) const
  {
    FragmentResult result;
    result.session = query.session;
    result.total = query.total;

    auto it = pending.find(query.session);
    if (it == pending.end())
    {
      ReassemblyState state;
      state.total = query.total;
      it = pending.emplace(query.session, std::move(state)).first;
    }
    else if (it->second.total != query.total)
    {
      DNSCHAT_LOG_WARN("Chunker: session " << query.session << " fragment " << query.index
                                           << " declares total " << query.total << ", expected "
                                           << it->second.total);
      result.total = it->second.total;
      return result;
    }

    ReassemblyState &state = it->second;
    state.fragments[query.index] = query.data;
    state.lastUpdate = now;
    result.received = state.fragments.size();

    if (state.fragments.size() < state.total)
    {
      result.status = FragmentStatus::Incomplete;
      return result;
    }

    std::string encoded;
    for (std::size_t i = 0; i < state.total; ++i)
    {
      auto fragment = state.fragments.find(i);
      if (fragment == state.fragments.end())
      {
        DNSCHAT_LOG_WARN("Chunker: session " << query.session << " missing fragment " << i);
        pending.erase(it);
        return result;
      }
      encoded += fragment->second;
    }
    pending.erase(it);

    auto payload = util::Base36::decode(encoded);
    if (!payload)
    {
      DNSCHAT_LOG_WARN("Chunker: session " << query.session << " carried undecodable data");
      return result;
    }

    result.status = FragmentStatus::Complete;
    result.payload = std::move(*payload);
    return result;
  }

  /// \brief Drop reassembly states idle for longer than \p timeout.
  /// \return number of sessions removed
  static std::size_t purgeStale(ReassemblyMap &pending, std::chrono::steady_clock::time_point now,
                                std::chrono::seconds timeout)
  {
    std::size_t removed = 0;
    for (auto it = pending.begin(); it != pending.end();)
    {
      if (now - it->second.lastUpdate > timeout)
      {
        DNSCHAT_LOG_DEBUG("Chunker: dropping stale reassembly for session "
                          << it->first << " (" << it->second.fragments.size() << "/"
                          << it->second.total << ")");
        it = pending.erase(it);
        ++removed;
      }
      else
      {
        ++it;
      }
    }
    return removed;
  }

  /// \brief Slice a textual token into `"{i}:{n}:{data}"` records.
  ResponseChunkMap createResponseChunks(const std::string &token) const
  {
    ResponseChunkMap chunks;
    const std::size_t size = _config.responseChunkSize;
    const std::size_t total = std::max<std::size_t>(1, (token.size() + size - 1) / size);
    const std::string totalText = std::to_string(total);
    for (std::size_t i = 0; i < total; ++i)
    {
      std::string data = i * size < token.size() ? token.substr(i * size, size) : std::string();
      chunks.emplace(i, std::to_string(i) + ":" + totalText + ":" + data);
    }
    return chunks;
  }

  /// \return std::nullopt unless \p record has the `index:total:data` shape
  static std::optional<ResponseChunk> parseResponseChunk(const std::string &record)
  {
    std::size_t first = record.find(':');
    if (first == std::string::npos)
    {
      return std::nullopt;
    }
    std::size_t second = record.find(':', first + 1);
    if (second == std::string::npos)
    {
      return std::nullopt;
    }
    auto index = QueryName::parseIndex(record.substr(0, first));
    auto total = QueryName::parseIndex(record.substr(first + 1, second - first - 1));
    if (!index || !total || *total == 0 || *index >= *total)
    {
      return std::nullopt;
    }
    return ResponseChunk{*index, *total, record.substr(second + 1)};
  }

  /// \brief Concatenate chunk payloads in index order. Records that do not
  /// parse are skipped; missing indices are simply absent from the result.
  static std::string reassembleResponse(const ResponseChunkMap &chunks)
  {
    std::string token;
    for (const auto &entry : chunks)
    {
      auto chunk = parseResponseChunk(entry.second);
      if (chunk)
      {
        token += chunk->data;
      }
    }
    return token;
  }

private:
  ProtocolConfig _config;
  std::vector<std::string> _suffixLabels;
  std::string _suffix;

  static std::size_t countDigits(std::size_t value)
  {
    std::size_t digits = 1;
    while (value >= 10)
    {
      value /= 10;
      ++digits;
    }
    return digits;
  }
};

} // namespace tunnel
} // namespace dnschat
