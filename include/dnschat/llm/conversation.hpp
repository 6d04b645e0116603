// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of dnschat, which is licensed under the Mozilla Public License 2.0.
// See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for details.

#pragma once

#include <cstddef>
#include <deque>
#include <string>
#include <vector>

namespace dnschat
{
namespace llm
{

/// \brief One role-tagged turn ("system", "user" or "assistant").
struct ChatMessage
{
  std::string role;
  std::string content;

  bool operator==(const ChatMessage &other) const
  {
    return role == other.role && content == other.content;
  }
};

/// \brief Per-session history bounded to a number of user/assistant
/// exchanges; the oldest exchange is evicted first.
class Conversation
{
public:
  explicit Conversation(std::size_t maxTurns = 20) : _maxTurns(maxTurns) {}

  void appendExchange(const std::string &user, const std::string &assistant)
  {
    if (_maxTurns == 0)
    {
      return;
    }
    _messages.push_back(ChatMessage{"user", user});
    _messages.push_back(ChatMessage{"assistant", assistant});
    while (_messages.size() > 2 * _maxTurns)
    {
      _messages.pop_front();
      _messages.pop_front();
    }
  }

  std::vector<ChatMessage> messages() const
  {
    return std::vector<ChatMessage>(_messages.begin(), _messages.end());
  }

  std::size_t turns() const { return _messages.size() / 2; }
  bool empty() const { return _messages.empty(); }
  void clear() { _messages.clear(); }

private:
  std::size_t _maxTurns;
  std::deque<ChatMessage> _messages;
};

} // namespace llm
} // namespace dnschat
