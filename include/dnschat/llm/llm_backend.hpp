// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of dnschat, which is licensed under the Mozilla Public License 2.0.
// See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for details.

#pragma once

#include <functional>
#include <stdexcept>
#include <string>
#include <vector>

#include "dnschat/llm/conversation.hpp"

namespace dnschat
{
namespace llm
{

/// \brief The model service answered with an error or an unreadable body.
class BackendException : public std::runtime_error
{
public:
  explicit BackendException(const std::string &message)
    : std::runtime_error("LLM Backend Error: " + message)
  {
  }
};

/// \brief Text-generation service seen by the tunnel server.
///
/// Implementations must be safe to call from several worker threads.
class LlmBackend
{
public:
  /// Receives each new piece of generated text, in order.
  using DeltaCallback = std::function<void(const std::string &delta)>;

  virtual ~LlmBackend() = default;

  /// \brief Generate a reply to \p messages.
  /// \param onDelta invoked per increment; may be empty
  /// \return the complete reply text
  /// \throws BackendException or network::HttpException on failure
  virtual std::string complete(const std::vector<ChatMessage> &messages,
                               const DeltaCallback &onDelta) = 0;

  /// \brief Model identifiers the service offers.
  virtual std::vector<std::string> listModels() = 0;

  virtual std::string model() const = 0;
  virtual void setModel(const std::string &model) = 0;
};

} // namespace llm
} // namespace dnschat
