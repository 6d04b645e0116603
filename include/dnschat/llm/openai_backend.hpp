// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of dnschat, which is licensed under the Mozilla Public License 2.0.
// See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for details.

#pragma once

#include <algorithm>
#include <chrono>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "dnschat/core/logger.hpp"
#include "dnschat/llm/llm_backend.hpp"
#include "dnschat/network/http_client.hpp"
#include "dnschat/parsers/json.hpp"

namespace dnschat
{
namespace llm
{

struct OpenAiConfig
{
  std::string baseUrl = "https://api.openai.com/v1";
  std::string apiKey;
  std::string model = "gpt-3.5-turbo";
  /// Offered by listModels() when the service cannot enumerate its own.
  std::vector<std::string> models;
  std::string systemPrompt;
  int maxTokens = 1000;
  double temperature = 0.7;
  std::chrono::seconds timeout{120};
  bool stream = true;
  int retries = 1;
};

/// \brief OpenAI-compatible chat completions client.
///
/// Streaming requests consume server-sent events (`data: {...}` lines ending
/// with `data: [DONE]`); each `choices[0].delta.content` is forwarded to the
/// delta callback.
class OpenAiBackend : public LlmBackend
{
public:
  explicit OpenAiBackend(OpenAiConfig config)
    : _config(std::move(config)), _model(_config.model), _http(makeHttpConfig(_config))
  {
    while (!_config.baseUrl.empty() && _config.baseUrl.back() == '/')
    {
      _config.baseUrl.pop_back();
    }
    // Validates the URL up front.
    network::HttpClient::parseUrl(_config.baseUrl + "/chat/completions");
  }

  std::string complete(const std::vector<ChatMessage> &messages,
                       const DeltaCallback &onDelta) override
  {
    const std::string model = this->model();
    const std::string body = buildRequestBody(messages, model).dump();
    const std::string url = _config.baseUrl + "/chat/completions";
    DNSCHAT_LOG_DEBUG("OpenAiBackend: " << messages.size() << " message(s) to model " << model);

    if (!_config.stream)
    {
      auto response = _http.post(url, body, headers(), _config.retries);
      const auto json = parseBody(response);
      const auto &content = json["choices"].at(0)["message"]["content"];
      if (!content.isString())
      {
        throw BackendException("response carries no message content");
      }
      if (onDelta)
      {
        onDelta(content.getString());
      }
      return content.getString();
    }

    std::string text;
    bool done = false;
    auto response = _http.postStream(
      url, body, headers(),
      [&](const std::string &line)
      {
        if (done)
          return;
        auto delta = parseStreamLine(line, done);
        if (delta && !delta->empty())
        {
          text += *delta;
          if (onDelta)
          {
            onDelta(*delta);
          }
        }
      },
      _config.retries);

    if (!response.success())
    {
      throw BackendException(describeError(response));
    }
    return text;
  }

  std::vector<std::string> listModels() override
  {
    try
    {
      auto response = _http.get(_config.baseUrl + "/models", headers(), _config.retries);
      const auto json = parseBody(response);
      std::vector<std::string> ids;
      const auto &data = json["data"];
      for (std::size_t i = 0; i < data.size(); ++i)
      {
        const auto &id = data.at(i)["id"];
        if (id.isString())
        {
          ids.push_back(id.getString());
        }
      }
      if (!ids.empty())
      {
        std::sort(ids.begin(), ids.end());
        return ids;
      }
    }
    catch (const std::exception &e)
    {
      core::Logger::warning(std::string("OpenAiBackend: cannot list models: ") + e.what());
    }

    std::vector<std::string> fallback = _config.models;
    const std::string current = model();
    if (std::find(fallback.begin(), fallback.end(), current) == fallback.end())
    {
      fallback.push_back(current);
    }
    return fallback;
  }

  std::string model() const override
  {
    std::lock_guard<std::mutex> lock(_mutex);
    return _model;
  }

  void setModel(const std::string &model) override
  {
    std::lock_guard<std::mutex> lock(_mutex);
    _model = model;
  }

  /// \brief Chat completion request body, system prompt first.
  parsers::Json buildRequestBody(const std::vector<ChatMessage> &messages,
                                 const std::string &model) const
  {
    auto body = parsers::Json::object();
    body["model"] = model;

    auto list = parsers::Json::array();
    if (!_config.systemPrompt.empty())
    {
      auto system = parsers::Json::object();
      system["role"] = "system";
      system["content"] = _config.systemPrompt;
      list.push_back(std::move(system));
    }
    for (const auto &message : messages)
    {
      auto entry = parsers::Json::object();
      entry["role"] = message.role;
      entry["content"] = message.content;
      list.push_back(std::move(entry));
    }
    body["messages"] = std::move(list);
    body["max_tokens"] = _config.maxTokens;
    body["temperature"] = _config.temperature;
    body["stream"] = _config.stream;
    return body;
  }

  /// \brief Decode one server-sent-event line.
  /// \param done set once `data: [DONE]` is seen
  /// \return the content delta, or std::nullopt for lines carrying none
  static std::optional<std::string> parseStreamLine(const std::string &line, bool &done)
  {
    static const std::string prefix = "data:";
    if (line.compare(0, prefix.size(), prefix) != 0)
    {
      return std::nullopt;
    }
    std::string payload = line.substr(prefix.size());
    payload.erase(0, payload.find_first_not_of(" \t"));
    if (payload == "[DONE]")
    {
      done = true;
      return std::nullopt;
    }

    auto result = parsers::Json::parse(payload);
    if (!result.ok)
    {
      core::Logger::debug("OpenAiBackend: skipping unparsable event: " + payload);
      return std::nullopt;
    }
    const parsers::Json &event = result.value;
    if (event.contains("error"))
    {
      throw BackendException(event["error"].stringOr("message", "stream error"));
    }
    const auto &content = event["choices"].at(0)["delta"]["content"];
    if (!content.isString())
    {
      return std::nullopt;
    }
    return content.getString();
  }

private:
  OpenAiConfig _config;
  mutable std::mutex _mutex;
  std::string _model;
  network::HttpClient _http;

  static network::HttpClient::Config makeHttpConfig(const OpenAiConfig &config)
  {
    network::HttpClient::Config http;
    http.requestTimeout = std::chrono::duration_cast<std::chrono::milliseconds>(config.timeout);
    return http;
  }

  network::HttpHeaders headers() const
  {
    network::HttpHeaders h;
    h["Content-Type"] = "application/json";
    h["Accept"] = _config.stream ? "text/event-stream" : "application/json";
    if (!_config.apiKey.empty())
    {
      h["Authorization"] = "Bearer " + _config.apiKey;
    }
    return h;
  }

  static parsers::Json parseBody(const network::HttpClient::Response &response)
  {
    if (!response.success())
    {
      throw BackendException(describeError(response));
    }
    auto result = parsers::Json::parse(response.body);
    if (!result.ok)
    {
      throw BackendException("unparsable response body: " + result.error.message);
    }
    return std::move(result.value);
  }

  static std::string describeError(const network::HttpClient::Response &response)
  {
    std::string detail = response.statusText;
    auto result = parsers::Json::parse(response.body);
    const parsers::Json &json = result.value;
    if (result.ok && json["error"].isObject())
    {
      detail = json["error"].stringOr("message", detail);
    }
    return "status " + std::to_string(response.statusCode) + ": " + detail;
  }
};

} // namespace llm
} // namespace dnschat
