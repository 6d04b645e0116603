// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of dnschat, which is licensed under the Mozilla Public License 2.0.
// See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for details.

#pragma once

#include <chrono>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "dnschat/core/logger.hpp"
#include "dnschat/llm/conversation.hpp"
#include "dnschat/tunnel/chunking.hpp"

namespace dnschat
{
namespace tunnel
{

/// \brief Server-side session state: inbound reassembly, published response
/// chunks and conversation history, all behind one mutex.
///
/// Every completed message starts a new generation for its session. Writes
/// tagged with an older generation are dropped, so a worker still answering
/// a previous message cannot overwrite the current answer.
class SessionStore
{
public:
  using Clock = std::chrono::steady_clock;

  explicit SessionStore(std::size_t historyTurns = 20,
                        std::chrono::seconds reassemblyTimeout = std::chrono::seconds(300),
                        std::chrono::seconds idleTimeout = std::chrono::seconds(3600))
    : _historyTurns(historyTurns), _reassemblyTimeout(reassemblyTimeout), _idleTimeout(idleTimeout)
  {
  }

  SessionStore(const SessionStore &) = delete;
  SessionStore &operator=(const SessionStore &) = delete;

  /// \brief Record one inbound fragment.
  ///
  /// Idle reassembly states and idle sessions are purged first. When the
  /// message completes, the session's previously published chunks are
  /// discarded in the same critical section and the result carries the new
  /// generation.
  FragmentResult addFragment(const Chunker &chunker, const FragmentQuery &fragment,
                             Clock::time_point now = Clock::now())
  {
    std::lock_guard<std::mutex> lock(_mutex);
    Chunker::purgeStale(_pending, now, _reassemblyTimeout);
    purgeIdle(now);

    auto result = chunker.addFragment(fragment, _pending, now);
    if (result.status == FragmentStatus::Complete)
    {
      auto &state = _sessions[result.session];
      state.outbound.clear();
      state.generation = ++_lastGeneration;
      state.lastActivity = now;
      result.generation = state.generation;
    }
    return result;
  }

  /// \brief Replace the session's chunk map wholesale.
  /// \param generation exchange that produced \p chunks; 0 publishes unconditionally
  /// \return false when \p generation has been superseded
  bool publish(const std::string &session, ResponseChunkMap chunks, std::uint64_t generation = 0)
  {
    std::lock_guard<std::mutex> lock(_mutex);
    auto *state = current(session, generation);
    if (!state)
    {
      return false;
    }
    state->outbound = std::move(chunks);
    state->lastActivity = Clock::now();
    return true;
  }

  std::optional<std::string> chunk(const std::string &session, std::size_t index) const
  {
    std::lock_guard<std::mutex> lock(_mutex);
    auto it = _sessions.find(session);
    if (it == _sessions.end())
    {
      return std::nullopt;
    }
    it->second.lastActivity = Clock::now();
    auto chunkIt = it->second.outbound.find(index);
    if (chunkIt == it->second.outbound.end())
    {
      return std::nullopt;
    }
    return chunkIt->second;
  }

  std::size_t chunkCount(const std::string &session) const
  {
    std::lock_guard<std::mutex> lock(_mutex);
    auto it = _sessions.find(session);
    return it == _sessions.end() ? 0 : it->second.outbound.size();
  }

  /// \brief Copy of the session's history.
  std::vector<llm::ChatMessage> history(const std::string &session) const
  {
    std::lock_guard<std::mutex> lock(_mutex);
    auto it = _sessions.find(session);
    if (it == _sessions.end() || !it->second.history)
    {
      return {};
    }
    return it->second.history->messages();
  }

  /// \return false when \p generation has been superseded
  bool appendExchange(const std::string &session, const std::string &user,
                      const std::string &assistant, std::uint64_t generation = 0)
  {
    std::lock_guard<std::mutex> lock(_mutex);
    auto *state = current(session, generation);
    if (!state)
    {
      return false;
    }
    if (!state->history)
    {
      state->history.emplace(_historyTurns);
    }
    state->history->appendExchange(user, assistant);
    state->lastActivity = Clock::now();
    return true;
  }

  void clearHistory(const std::string &session)
  {
    std::lock_guard<std::mutex> lock(_mutex);
    auto it = _sessions.find(session);
    if (it != _sessions.end())
    {
      it->second.history.reset();
    }
  }

  /// \brief Forget everything held for \p session. Writes from a worker
  /// still busy with it are dropped afterwards.
  void cleanup(const std::string &session)
  {
    std::lock_guard<std::mutex> lock(_mutex);
    _sessions.erase(session);
    _pending.erase(session);
  }

  std::size_t pendingCount() const
  {
    std::lock_guard<std::mutex> lock(_mutex);
    return _pending.size();
  }

  std::size_t sessionCount() const
  {
    std::lock_guard<std::mutex> lock(_mutex);
    return _sessions.size();
  }

private:
  struct SessionState
  {
    ResponseChunkMap outbound;
    std::optional<llm::Conversation> history;
    std::uint64_t generation = 0;
    mutable Clock::time_point lastActivity = Clock::now();
  };

  mutable std::mutex _mutex;
  std::size_t _historyTurns;
  std::chrono::seconds _reassemblyTimeout;
  std::chrono::seconds _idleTimeout;
  std::uint64_t _lastGeneration = 0;
  ReassemblyMap _pending;
  std::unordered_map<std::string, SessionState> _sessions;

  /// Caller holds _mutex. Null when \p generation is stale.
  SessionState *current(const std::string &session, std::uint64_t generation)
  {
    auto it = _sessions.find(session);
    if (generation == 0)
    {
      return it == _sessions.end() ? &_sessions[session] : &it->second;
    }
    if (it == _sessions.end() || it->second.generation != generation)
    {
      DNSCHAT_LOG_DEBUG("SessionStore: dropped write of superseded generation "
                        << generation << " for session " << session);
      return nullptr;
    }
    return &it->second;
  }

  /// Caller holds _mutex.
  void purgeIdle(Clock::time_point now)
  {
    for (auto it = _sessions.begin(); it != _sessions.end();)
    {
      if (now - it->second.lastActivity > _idleTimeout)
      {
        core::Logger::debug("SessionStore: expired idle session " + it->first);
        it = _sessions.erase(it);
      }
      else
      {
        ++it;
      }
    }
  }
};

} // namespace tunnel
} // namespace dnschat
