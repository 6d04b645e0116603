// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of dnschat, which is licensed under the Mozilla Public License 2.0.
// See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for details.

#pragma once

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include "dnschat/core/logger.hpp"
#include "dnschat/core/thread_pool.hpp"
#include "dnschat/crypto/crypto_box.hpp"
#include "dnschat/llm/llm_backend.hpp"
#include "dnschat/parsers/json.hpp"
#include "dnschat/tunnel/chunking.hpp"
#include "dnschat/tunnel/protocol.hpp"
#include "dnschat/tunnel/session_store.hpp"
#include "dnschat/version.hpp"

namespace dnschat
{
namespace tunnel
{

struct ResolverConfig
{
  ProtocolConfig protocol;
  std::size_t workers = 4;
  std::size_t maxQueuedMessages = 256;
  std::size_t historyTurns = 20;
  std::chrono::seconds reassemblyTimeout{300};
  std::chrono::seconds sessionIdleTimeout{3600};
};

/// \brief Server side of the tunnel: maps one query name to one TXT answer.
///
/// Completed messages are handed to a worker pool. Workers decrypt, answer
/// in-band commands or call the model backend, and publish encrypted
/// snapshots of the growing reply through the session store. The last
/// snapshot carries the end-of-stream marker.
class TunnelResolver
{
public:
  /// \throws ChunkingException on an unusable protocol configuration
  /// \throws std::invalid_argument on a missing crypto box or backend
  TunnelResolver(const ResolverConfig &config, std::shared_ptr<const crypto::CryptoBox> crypto,
                 std::shared_ptr<llm::LlmBackend> backend)
    : _chunker(config.protocol),
      _store(config.historyTurns, config.reassemblyTimeout, config.sessionIdleTimeout),
      _crypto(std::move(crypto)),
      _backend(std::move(backend)),
      _pool(config.workers, config.maxQueuedMessages)
  {
    if (!_crypto || !_backend)
    {
      throw std::invalid_argument("TunnelResolver requires a crypto box and a backend");
    }
  }

  ~TunnelResolver() { shutdown(); }

  TunnelResolver(const TunnelResolver &) = delete;
  TunnelResolver &operator=(const TunnelResolver &) = delete;

  /// \brief Answer one query name.
  /// \return TXT text, or std::nullopt for an empty answer section
  std::optional<std::string> resolve(const std::string &qname)
  {
    try
    {
      return dispatch(qname);
    }
    catch (const std::exception &e)
    {
      core::Logger::error("TunnelResolver: failed to handle " + qname + ": " + e.what());
      return std::nullopt;
    }
  }

  /// \brief Decrypt and answer one reassembled message; runs on a worker.
  /// \param generation value from SessionStore::addFragment; once a newer
  /// message completes on \p session, this worker's output is discarded
  void processMessage(const std::string &session, const std::vector<std::uint8_t> &payload,
                      std::uint64_t generation)
  {
    std::string message;
    try
    {
      message = _crypto->open(payload);
    }
    catch (const crypto::CryptoException &e)
    {
      core::Logger::warning("TunnelResolver: session " + session + ": " + e.what());
      publishFinal(session, generation,
                   std::string("Error: could not decrypt message: ") + e.what());
      return;
    }
    DNSCHAT_LOG_DEBUG("TunnelResolver: session " << session << " message: "
                                                 << message.substr(0, 100));

    try
    {
      auto commandReply = handleCommand(session, message);
      if (commandReply)
      {
        publishFinal(session, generation, *commandReply);
        return;
      }

      auto history = _store.history(session);
      history.push_back(llm::ChatMessage{"user", message});

      std::string partial;
      std::string reply = _backend->complete(history,
                                             [&](const std::string &delta)
                                             {
                                               partial += delta;
                                               publishSnapshot(session, generation, partial);
                                             });
      if (!publishFinal(session, generation, reply) ||
          !_store.appendExchange(session, message, reply, generation))
      {
        core::Logger::info("TunnelResolver: session " + session +
                           " moved on; discarded a superseded answer");
        return;
      }
      core::Logger::info("TunnelResolver: session " + session + " answered (" +
                         std::to_string(reply.size()) + " chars)");
    }
    catch (const std::exception &e)
    {
      core::Logger::error("TunnelResolver: session " + session + ": " + e.what());
      publishFinal(session, generation, std::string("Error processing message: ") + e.what());
    }
  }

  /// \brief `{"version":...,"protocol":...,"model":...}`
  std::string serverInfo() const
  {
    std::ostringstream oss;
    oss << "{\"version\":" << parsers::Json::escape(DNSCHAT_VERSION)
        << ",\"protocol\":" << protocol::VERSION
        << ",\"model\":" << parsers::Json::escape(_backend->model()) << "}";
    return oss.str();
  }

  static std::string helpText()
  {
    return "Available commands:\n"
           "  /help           Show this help\n"
           "  /clear, /reset  Forget the conversation history of this session\n"
           "  /list           List available models\n"
           "  /model <name>   Switch the active model";
  }

  /// \brief Wait for queued messages to finish and stop the workers.
  void shutdown() { _pool.shutdown(); }

  SessionStore &store() { return _store; }
  const Chunker &chunker() const { return _chunker; }

private:
  Chunker _chunker;
  SessionStore _store;
  std::shared_ptr<const crypto::CryptoBox> _crypto;
  std::shared_ptr<llm::LlmBackend> _backend;
  core::ThreadPool _pool;

  std::optional<std::string> dispatch(const std::string &qname)
  {
    DNSCHAT_LOG_DEBUG("TunnelResolver: query " << qname);

    auto labels = QueryName::split(qname);
    if (!labels || !QueryName::hasSuffix(*labels, _chunker.suffixLabels()) ||
        labels->size() == _chunker.suffixLabels().size())
    {
      core::Logger::warning("TunnelResolver: foreign query " + qname);
      return std::nullopt;
    }
    const std::size_t commandLabels = labels->size() - _chunker.suffixLabels().size();

    switch (QueryName::classify(labels->front()))
    {
    case Command::Fragment:
      return handleFragment(qname);

    case Command::Fetch:
    {
      auto fetch = _chunker.parseFetchQuery(qname);
      if (!fetch)
      {
        core::Logger::warning("TunnelResolver: invalid fetch query " + qname);
        return std::nullopt;
      }
      auto chunk = _store.chunk(fetch->session, fetch->index);
      if (!chunk)
      {
        DNSCHAT_LOG_DEBUG("TunnelResolver: chunk " << fetch->index << " of session "
                                                   << fetch->session << " not found");
        return std::string(protocol::REPLY_NOT_FOUND);
      }
      DNSCHAT_LOG_DEBUG("TunnelResolver: served chunk " << fetch->index << " of session "
                                                        << fetch->session);
      return chunk;
    }

    case Command::Info:
      if (commandLabels != 1)
      {
        core::Logger::warning("TunnelResolver: invalid info query " + qname);
        return std::nullopt;
      }
      return serverInfo();

    case Command::Cleanup:
      if (commandLabels != 2)
      {
        core::Logger::warning("TunnelResolver: invalid cleanup query " + qname);
        return std::nullopt;
      }
      _store.cleanup((*labels)[1]);
      core::Logger::debug("TunnelResolver: cleaned up session " + (*labels)[1]);
      return std::string(protocol::REPLY_OK);

    case Command::Unknown:
      break;
    }

    core::Logger::warning("TunnelResolver: unknown command in " + qname);
    return std::nullopt;
  }

  std::optional<std::string> handleFragment(const std::string &qname)
  {
    auto fragment = _chunker.parseFragmentQuery(qname);
    if (!fragment)
    {
      core::Logger::warning("TunnelResolver: invalid fragment query " + qname);
      return std::nullopt;
    }

    auto result = _store.addFragment(_chunker, *fragment);
    switch (result.status)
    {
    case FragmentStatus::Invalid:
      core::Logger::warning("TunnelResolver: rejected fragment " + qname);
      return std::nullopt;

    case FragmentStatus::Incomplete:
      DNSCHAT_LOG_DEBUG("TunnelResolver: session " << result.session << " fragment "
                                                   << fragment->index << " ("
                                                   << result.received << "/" << result.total
                                                   << ")");
      return std::string(protocol::REPLY_OK);

    case FragmentStatus::Complete:
      break;
    }

    core::Logger::info("TunnelResolver: complete message for session " + result.session + " (" +
                       std::to_string(result.payload.size()) + " bytes)");
    try
    {
      auto session = result.session;
      auto generation = result.generation;
      _pool.enqueue([this, session, generation, payload = std::move(result.payload)]()
                    { processMessage(session, payload, generation); });
    }
    catch (const std::runtime_error &e)
    {
      core::Logger::error("TunnelResolver: cannot queue session " + result.session + ": " +
                          e.what());
      publishFinal(result.session, result.generation, "Error: server is busy, please retry");
    }
    return std::string(protocol::REPLY_OK);
  }

  /// \return reply text for an in-band command, std::nullopt for chat text
  std::optional<std::string> handleCommand(const std::string &session, const std::string &message)
  {
    std::string trimmed = message;
    trimmed.erase(0, trimmed.find_first_not_of(" \t\r\n"));
    trimmed.erase(trimmed.find_last_not_of(" \t\r\n") + 1);
    if (trimmed.empty() || trimmed[0] != '/')
    {
      return std::nullopt;
    }

    std::string command = trimmed;
    std::string argument;
    auto space = trimmed.find_first_of(" \t");
    if (space != std::string::npos)
    {
      command = trimmed.substr(0, space);
      argument = trimmed.substr(trimmed.find_first_not_of(" \t", space));
    }
    std::transform(command.begin(), command.end(), command.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (command == "/help")
    {
      return helpText();
    }
    if (command == "/clear" || command == "/reset")
    {
      _store.clearHistory(session);
      core::Logger::info("TunnelResolver: history cleared for session " + session);
      return std::string("Conversation history cleared.");
    }
    if (command == "/list")
    {
      const std::string active = _backend->model();
      std::string text = "Available models:";
      for (const auto &model : _backend->listModels())
      {
        text += (model == active) ? "\n* " : "\n  ";
        text += model;
        if (model == active)
        {
          text += " (active)";
        }
      }
      return text;
    }
    if (command == "/model")
    {
      if (argument.empty())
      {
        return "Current model: " + _backend->model() + "\nUsage: /model <name>";
      }
      _backend->setModel(argument);
      core::Logger::info("TunnelResolver: model switched to " + argument);
      return "Switched model to " + argument;
    }
    return "Unknown command: " + command + "\n" + helpText();
  }

  bool publishSnapshot(const std::string &session, std::uint64_t generation,
                       const std::string &text)
  {
    auto chunks = _chunker.createResponseChunks(_crypto->encrypt(text));
    const std::size_t count = chunks.size();
    if (!_store.publish(session, std::move(chunks), generation))
    {
      return false;
    }
    DNSCHAT_LOG_DEBUG("TunnelResolver: session " << session << " published " << count
                                                 << " chunk(s)");
    return true;
  }

  bool publishFinal(const std::string &session, std::uint64_t generation, const std::string &text)
  {
    return publishSnapshot(session, generation, text + protocol::END_OF_STREAM);
  }
};

} // namespace tunnel
} // namespace dnschat
