// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of dnschat, which is licensed under the Mozilla Public License 2.0.
// See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for details.

#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "dnschat/core/logger.hpp"
#include "dnschat/crypto/crypto_box.hpp"
#include "dnschat/crypto/secure_rng.hpp"
#include "dnschat/network/udp_query_transport.hpp"
#include "dnschat/tunnel/chunking.hpp"
#include "dnschat/tunnel/protocol.hpp"

namespace dnschat
{
namespace tunnel
{

struct ClientConfig
{
  ProtocolConfig protocol;
  /// Overall wall-clock limit for retrieving one answer.
  std::chrono::milliseconds timeout{std::chrono::seconds(120)};
  /// Pause between sending the last fragment and the first poll.
  std::chrono::milliseconds initialDelay{300};
  std::chrono::milliseconds pollInterval{500};
  /// Pause before the confirming re-poll once the end marker is seen.
  std::chrono::milliseconds confirmDelay{500};
  /// Highest chunk index requested in one round.
  std::size_t maxChunks = 1000;
  /// Consecutive misses that end a polling round.
  std::size_t missTolerance = 3;
  std::size_t retryRounds = 3;
  std::chrono::milliseconds retryBackoff{200};
  /// Smallest payload accepted from a targeted re-fetch.
  std::size_t minChunkPayload = 1;
  std::size_t traditionalAttempts = 10;
  std::chrono::milliseconds traditionalInterval{1000};
};

/// \brief Outcome of one request/answer exchange.
struct ExchangeResult
{
  /// Decrypted answer without the end marker.
  std::string text;
  /// The end marker was seen.
  bool complete = false;
  /// At least one snapshot could be decrypted.
  bool received = false;
};

/// \brief Client side of the tunnel.
///
/// Sends an encrypted message as fragment queries, then pulls the answer
/// chunk by chunk. In streaming mode every decryptable snapshot that extends
/// the text already shown is reported through the delta callback.
class TunnelClient
{
public:
  using DeltaCallback = std::function<void(const std::string &delta)>;

  /// \param session session token; generated when empty
  /// \throws ChunkingException on an unusable protocol configuration
  /// \throws std::invalid_argument on a missing crypto box or transport
  TunnelClient(ClientConfig config, std::shared_ptr<const crypto::CryptoBox> crypto,
               std::shared_ptr<network::QueryTransport> transport, std::string session = "")
    : _config(std::move(config)),
      _chunker(_config.protocol),
      _crypto(std::move(crypto)),
      _transport(std::move(transport)),
      _session(session.empty() ? generateSessionToken(_config.protocol.sessionDigits)
                               : std::move(session))
  {
    if (!_crypto || !_transport)
    {
      throw std::invalid_argument("TunnelClient requires a crypto box and a transport");
    }
  }

  const std::string &session() const { return _session; }
  const Chunker &chunker() const { return _chunker; }

  /// \brief Zero-padded decimal token mixing the clock with random bits.
  static std::string generateSessionToken(std::size_t digits)
  {
    if (digits == 0 || digits > 9)
    {
      throw std::invalid_argument("session token width must be 1..9 digits");
    }
    std::uint32_t space = 1;
    for (std::size_t i = 0; i < digits; ++i)
    {
      space *= 10;
    }
    auto now = static_cast<std::uint64_t>(
      std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::system_clock::now().time_since_epoch())
        .count());
    std::uint64_t mixed = (now ^ (static_cast<std::uint64_t>(crypto::SecureRng::uniform(space)) *
                                  2654435761ULL)) %
                          space;
    std::string token = std::to_string(mixed);
    return std::string(digits - token.size(), '0') + token;
  }

  /// \brief Encrypt and transmit \p message.
  /// \return number of fragments sent
  /// \throws ChunkingException if the message cannot be placed into query names
  std::size_t send(const std::string &message)
  {
    auto names = _chunker.createChunks(_crypto->seal(message), _session);
    DNSCHAT_LOG_DEBUG("TunnelClient: session " << _session << " sending " << names.size()
                                               << " fragment(s)");
    for (std::size_t i = 0; i < names.size(); ++i)
    {
      auto reply = _transport->query(names[i]);
      if (!reply)
      {
        core::Logger::warning("TunnelClient: no reply for fragment " + std::to_string(i + 1) +
                              "/" + std::to_string(names.size()));
      }
      else if (*reply != protocol::REPLY_OK)
      {
        core::Logger::warning("TunnelClient: unexpected reply for fragment " +
                              std::to_string(i + 1) + "/" + std::to_string(names.size()) + ": " +
                              *reply);
      }
    }
    return names.size();
  }

  /// \brief Send \p message and retrieve the answer.
  ExchangeResult exchange(const std::string &message, const DeltaCallback &onDelta = nullptr,
                          bool streaming = true)
  {
    send(message);
    return streaming ? receiveStreaming(onDelta) : receiveTraditional();
  }

  /// \brief Poll until the end marker is confirmed or the timeout expires.
  ExchangeResult receiveStreaming(const DeltaCallback &onDelta = nullptr)
  {
    using Clock = std::chrono::steady_clock;
    const auto deadline = Clock::now() + _config.timeout;
    ExchangeResult result;
    bool markerSeen = false;

    sleepFor(_config.initialDelay);
    while (Clock::now() < deadline)
    {
      Snapshot snapshot = pollRound();
      retryMissing(snapshot);

      auto text = decryptSnapshot(snapshot);
      if (text)
      {
        result.received = true;
        bool done = stripMarker(*text);
        if (text->size() > result.text.size() &&
            text->compare(0, result.text.size(), result.text) == 0)
        {
          if (onDelta)
          {
            onDelta(text->substr(result.text.size()));
          }
          result.text = *text;
        }
        else if (*text != result.text)
        {
          DNSCHAT_LOG_DEBUG("TunnelClient: snapshot diverged from text already shown");
        }

        if (done)
        {
          if (markerSeen)
          {
            result.complete = true;
            return result;
          }
          markerSeen = true;
          sleepFor(_config.confirmDelay);
          continue;
        }
      }
      sleepFor(_config.pollInterval);
    }

    if (markerSeen)
    {
      result.complete = true;
      return result;
    }
    core::Logger::warning("TunnelClient: session " + _session + " timed out after " +
                          std::to_string(_config.timeout.count()) + " ms");
    return result;
  }

  /// \brief Fixed number of full fetch attempts; returns the last snapshot.
  ExchangeResult receiveTraditional()
  {
    ExchangeResult result;
    sleepFor(_config.initialDelay);
    for (std::size_t attempt = 0; attempt < _config.traditionalAttempts; ++attempt)
    {
      Snapshot snapshot = pollRound();
      retryMissing(snapshot);
      auto text = decryptSnapshot(snapshot);
      if (text)
      {
        result.received = true;
        result.complete = stripMarker(*text);
        result.text = *text;
        if (result.complete)
        {
          return result;
        }
      }
      DNSCHAT_LOG_DEBUG("TunnelClient: attempt " << attempt + 1 << "/"
                                                 << _config.traditionalAttempts
                                                 << " found no complete answer");
      sleepFor(_config.traditionalInterval);
    }
    return result;
  }

  /// \return the server-info record, e.g. `{"version":"1.0.0","protocol":1,"model":"..."}`
  std::optional<std::string> serverInfo()
  {
    return _transport->query(std::string(protocol::TAG_INFO) + "." + _chunker.suffix());
  }

  /// \brief Ask the server to drop state held for this session.
  /// \return true when acknowledged
  bool cleanup()
  {
    auto reply = _transport->query(std::string(protocol::TAG_CLEANUP) + "." + _session + "." +
                                   _chunker.suffix());
    return reply && *reply == protocol::REPLY_OK;
  }

private:
  struct Snapshot
  {
    ResponseChunkMap chunks;
    std::size_t total = 0;
  };

  ClientConfig _config;
  Chunker _chunker;
  std::shared_ptr<const crypto::CryptoBox> _crypto;
  std::shared_ptr<network::QueryTransport> _transport;
  std::string _session;

  std::string fetchName(std::size_t index) const
  {
    return std::string(protocol::TAG_FETCH) + "." + _session + "." + std::to_string(index) + "." +
           _chunker.suffix();
  }

  std::optional<ResponseChunk> fetch(std::size_t index, std::string &record)
  {
    auto reply = _transport->query(fetchName(index));
    if (!reply || *reply == protocol::REPLY_NOT_FOUND)
    {
      return std::nullopt;
    }
    auto chunk = Chunker::parseResponseChunk(*reply);
    if (!chunk || chunk->index != index)
    {
      core::Logger::warning("TunnelClient: malformed chunk record for index " +
                            std::to_string(index));
      return std::nullopt;
    }
    record = std::move(*reply);
    return chunk;
  }

  /// \brief One scan from index 0. Ends at the declared total or after
  /// missTolerance consecutive misses. A chunk declaring a different total
  /// belongs to a newer snapshot and restarts the collection.
  Snapshot pollRound()
  {
    Snapshot snapshot;
    std::size_t misses = 0;
    for (std::size_t i = 0; i < _config.maxChunks; ++i)
    {
      if (snapshot.total != 0 && i >= snapshot.total)
      {
        break;
      }
      std::string record;
      auto chunk = fetch(i, record);
      if (!chunk)
      {
        if (++misses >= _config.missTolerance)
        {
          break;
        }
        continue;
      }
      misses = 0;
      if (chunk->total != snapshot.total)
      {
        if (snapshot.total != 0)
        {
          DNSCHAT_LOG_DEBUG("TunnelClient: snapshot changed (" << snapshot.total << " -> "
                                                               << chunk->total << " chunks)");
          snapshot.chunks.clear();
        }
        snapshot.total = chunk->total;
      }
      snapshot.chunks[i] = std::move(record);
    }
    return snapshot;
  }

  /// \brief Re-fetch indices below the declared total that the scan missed.
  void retryMissing(Snapshot &snapshot)
  {
    for (std::size_t round = 0; round < _config.retryRounds; ++round)
    {
      std::vector<std::size_t> missing;
      for (std::size_t i = 0; i < snapshot.total; ++i)
      {
        if (snapshot.chunks.find(i) == snapshot.chunks.end())
        {
          missing.push_back(i);
        }
      }
      if (missing.empty())
      {
        return;
      }

      sleepFor(_config.retryBackoff * (1 << round));
      DNSCHAT_LOG_DEBUG("TunnelClient: retry round " << round + 1 << " for " << missing.size()
                                                     << " missing chunk(s)");
      for (auto index : missing)
      {
        std::string record;
        auto chunk = fetch(index, record);
        if (!chunk || chunk->total != snapshot.total ||
            chunk->data.size() < _config.minChunkPayload)
        {
          continue;
        }
        snapshot.chunks[index] = std::move(record);
      }
    }
  }

  /// \return plaintext of a complete snapshot, std::nullopt while not ready
  std::optional<std::string> decryptSnapshot(const Snapshot &snapshot) const
  {
    if (snapshot.total == 0 || snapshot.chunks.size() < snapshot.total)
    {
      return std::nullopt;
    }
    try
    {
      return _crypto->decrypt(Chunker::reassembleResponse(snapshot.chunks));
    }
    catch (const crypto::CryptoException &e)
    {
      DNSCHAT_LOG_DEBUG("TunnelClient: snapshot not decryptable yet: " << e.what());
      return std::nullopt;
    }
  }

  static bool stripMarker(std::string &text)
  {
    const std::string marker = protocol::END_OF_STREAM;
    if (text.size() >= marker.size() &&
        text.compare(text.size() - marker.size(), marker.size(), marker) == 0)
    {
      text.erase(text.size() - marker.size());
      return true;
    }
    return false;
  }

  static void sleepFor(std::chrono::milliseconds duration)
  {
    if (duration.count() > 0)
    {
      std::this_thread::sleep_for(duration);
    }
  }
};

} // namespace tunnel
} // namespace dnschat
