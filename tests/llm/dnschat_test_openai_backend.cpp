// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of dnschat, which is licensed under the Mozilla Public License 2.0.
// See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for details.

#define CATCH_CONFIG_MAIN
#include "test_helpers.hpp"
#include <catch2/catch.hpp>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

using dnschat::llm::BackendException;
using dnschat::llm::ChatMessage;
using dnschat::llm::OpenAiBackend;
using dnschat::llm::OpenAiConfig;

namespace
{

/// \brief Loopback HTTP/1.1 server answering every request with a canned reply.
class CannedHttpServer
{
public:
  using Handler = std::function<std::string(const std::string &request)>;

  explicit CannedHttpServer(Handler handler) : _handler(std::move(handler))
  {
    _fd = ::socket(AF_INET, SOCK_STREAM, 0);
    REQUIRE(_fd >= 0);
    int on = 1;
    ::setsockopt(_fd, SOL_SOCKET, SO_REUSEADDR, &on, sizeof(on));

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    addr.sin_port = 0;
    REQUIRE(::bind(_fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) == 0);
    REQUIRE(::listen(_fd, 8) == 0);

    socklen_t len = sizeof(addr);
    ::getsockname(_fd, reinterpret_cast<sockaddr*>(&addr), &len);
    _port = ntohs(addr.sin_port);
    _thread = std::thread([this]() { serve(); });
  }

  ~CannedHttpServer()
  {
    _stop = true;
    _thread.join();
    ::close(_fd);
  }

  std::string baseUrl() const { return "http://127.0.0.1:" + std::to_string(_port) + "/v1"; }

  std::vector<std::string> requests() const
  {
    std::lock_guard<std::mutex> lock(_mutex);
    return _requests;
  }

  static std::string reply(int status, const std::string &contentType, const std::string &body)
  {
    return "HTTP/1.1 " + std::to_string(status) + (status == 200 ? " OK" : " Error") +
           "\r\nContent-Type: " + contentType + "\r\nContent-Length: " +
           std::to_string(body.size()) + "\r\nConnection: close\r\n\r\n" + body;
  }

private:
  Handler _handler;
  int _fd = -1;
  std::uint16_t _port = 0;
  std::atomic<bool> _stop{false};
  std::thread _thread;
  mutable std::mutex _mutex;
  std::vector<std::string> _requests;

  void serve()
  {
    while (!_stop)
    {
      pollfd pfd{_fd, POLLIN, 0};
      if (::poll(&pfd, 1, 50) <= 0)
      {
        continue;
      }
      int client = ::accept(_fd, nullptr, nullptr);
      if (client < 0)
      {
        continue;
      }
      std::string request = readRequest(client);
      {
        std::lock_guard<std::mutex> lock(_mutex);
        _requests.push_back(request);
      }
      std::string response = _handler(request);
      std::size_t sent = 0;
      while (sent < response.size())
      {
        ssize_t n = ::send(client, response.data() + sent, response.size() - sent, MSG_NOSIGNAL);
        if (n <= 0)
        {
          break;
        }
        sent += static_cast<std::size_t>(n);
      }
      ::close(client);
    }
  }

  static std::string readRequest(int client)
  {
    std::string data;
    char buffer[4096];
    std::size_t expected = std::string::npos;
    while (expected == std::string::npos || data.size() < expected)
    {
      ssize_t n = ::recv(client, buffer, sizeof(buffer), 0);
      if (n <= 0)
      {
        break;
      }
      data.append(buffer, static_cast<std::size_t>(n));
      auto headerEnd = data.find("\r\n\r\n");
      if (expected == std::string::npos && headerEnd != std::string::npos)
      {
        std::string lower = data.substr(0, headerEnd);
        std::transform(lower.begin(), lower.end(), lower.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        std::size_t length = 0;
        auto pos = lower.find("content-length:");
        if (pos != std::string::npos)
        {
          length = std::stoul(lower.substr(pos + 15));
        }
        expected = headerEnd + 4 + length;
      }
    }
    return data;
  }
};

std::string sseBody(const std::vector<std::string> &deltas)
{
  std::string body = "data: {\"choices\":[{\"delta\":{\"role\":\"assistant\"}}]}\n\n";
  for (const auto &delta : deltas)
  {
    body += "data: {\"choices\":[{\"delta\":{\"content\":" +
            dnschat::parsers::Json::escape(delta) + "}}]}\n\n";
  }
  body += "data: [DONE]\n\n";
  return body;
}

} // namespace

TEST_CASE("OpenAiBackend parses stream lines", "[llm][OpenAiBackend]")
{
  bool done = false;

  SECTION("Content delta")
  {
    auto delta = OpenAiBackend::parseStreamLine(
      R"(data: {"choices":[{"delta":{"content":"Hel"}}]})", done);
    REQUIRE(delta == std::optional<std::string>("Hel"));
    REQUIRE_FALSE(done);
  }

  SECTION("Lines without content")
  {
    REQUIRE_FALSE(OpenAiBackend::parseStreamLine("", done).has_value());
    REQUIRE_FALSE(OpenAiBackend::parseStreamLine(": keep-alive", done).has_value());
    REQUIRE_FALSE(OpenAiBackend::parseStreamLine("event: ping", done).has_value());
    REQUIRE_FALSE(
      OpenAiBackend::parseStreamLine(R"(data: {"choices":[{"delta":{"role":"assistant"}}]})", done)
        .has_value());
    REQUIRE_FALSE(OpenAiBackend::parseStreamLine("data: {not json", done).has_value());
    REQUIRE_FALSE(done);
  }

  SECTION("End of stream")
  {
    REQUIRE_FALSE(OpenAiBackend::parseStreamLine("data: [DONE]", done).has_value());
    REQUIRE(done);
  }

  SECTION("Error events throw")
  {
    REQUIRE_THROWS_WITH(
      OpenAiBackend::parseStreamLine(R"(data: {"error":{"message":"quota exceeded"}})", done),
      Catch::Contains("quota exceeded"));
  }
}

TEST_CASE("OpenAiBackend builds request bodies", "[llm][OpenAiBackend]")
{
  OpenAiConfig config;
  config.baseUrl = "http://127.0.0.1:9/v1/";
  config.systemPrompt = "Be brief.";
  config.maxTokens = 64;
  config.temperature = 0.25;
  OpenAiBackend backend(config);

  std::vector<ChatMessage> history = {{"user", "hi"}, {"assistant", "hello"}, {"user", "bye"}};
  auto body = backend.buildRequestBody(history, "model-x");

  REQUIRE(body["model"].getString() == "model-x");
  REQUIRE(body["max_tokens"].getInt() == 64);
  REQUIRE(body["temperature"].getDouble() == Approx(0.25));
  REQUIRE(body["stream"].getBool());
  REQUIRE(body["messages"].size() == 4);
  REQUIRE(body["messages"].at(0)["role"].getString() == "system");
  REQUIRE(body["messages"].at(0)["content"].getString() == "Be brief.");
  REQUIRE(body["messages"].at(3)["content"].getString() == "bye");

  SECTION("No system prompt")
  {
    OpenAiConfig plain;
    plain.baseUrl = "http://127.0.0.1:9/v1";
    OpenAiBackend other(plain);
    REQUIRE(other.buildRequestBody(history, "m")["messages"].size() == 3);
  }

  SECTION("Model selection")
  {
    REQUIRE(backend.model() == "gpt-3.5-turbo");
    backend.setModel("other");
    REQUIRE(backend.model() == "other");
  }

  SECTION("Bad base URL")
  {
    OpenAiConfig bad;
    bad.baseUrl = "not a url";
    REQUIRE_THROWS_AS(OpenAiBackend(bad), std::invalid_argument);
  }
}

TEST_CASE("OpenAiBackend streams completions over HTTP", "[llm][OpenAiBackend][http]")
{
  dnschat::test::initializeTestLogging();
  CannedHttpServer server([](const std::string &)
                          { return CannedHttpServer::reply(200, "text/event-stream",
                                                           sseBody({"Hello", ", ", "DNS"})); });

  OpenAiConfig config;
  config.baseUrl = server.baseUrl();
  config.apiKey = "sk-test";
  config.model = "stream-model";
  OpenAiBackend backend(config);

  std::vector<std::string> deltas;
  auto text = backend.complete({{"user", "hi"}},
                               [&](const std::string &delta) { deltas.push_back(delta); });

  REQUIRE(text == "Hello, DNS");
  REQUIRE(deltas == std::vector<std::string>{"Hello", ", ", "DNS"});

  auto requests = server.requests();
  REQUIRE(requests.size() == 1);
  REQUIRE(requests[0].rfind("POST /v1/chat/completions HTTP/1.1", 0) == 0);
  REQUIRE(requests[0].find("Authorization: Bearer sk-test") != std::string::npos);
  REQUIRE(requests[0].find("\"stream-model\"") != std::string::npos);
}

TEST_CASE("OpenAiBackend non-streaming completion", "[llm][OpenAiBackend][http]")
{
  CannedHttpServer server(
    [](const std::string &)
    {
      return CannedHttpServer::reply(
        200, "application/json",
        R"({"choices":[{"message":{"role":"assistant","content":"whole answer"}}]})");
    });

  OpenAiConfig config;
  config.baseUrl = server.baseUrl();
  config.stream = false;
  OpenAiBackend backend(config);

  std::string streamed;
  auto text = backend.complete({{"user", "hi"}}, [&](const std::string &d) { streamed += d; });
  REQUIRE(text == "whole answer");
  REQUIRE(streamed == "whole answer");
  REQUIRE(server.requests().at(0).find("Authorization") == std::string::npos);
}

TEST_CASE("OpenAiBackend reports service errors", "[llm][OpenAiBackend][http]")
{
  CannedHttpServer server(
    [](const std::string &)
    {
      return CannedHttpServer::reply(401, "application/json",
                                     R"({"error":{"message":"Invalid API key"}})");
    });

  OpenAiConfig config;
  config.baseUrl = server.baseUrl();
  config.retries = 0;

  SECTION("Streaming")
  {
    OpenAiBackend backend(config);
    REQUIRE_THROWS_WITH(backend.complete({{"user", "hi"}}, nullptr),
                        Catch::Contains("status 401") && Catch::Contains("Invalid API key"));
  }

  SECTION("Non-streaming")
  {
    config.stream = false;
    OpenAiBackend backend(config);
    REQUIRE_THROWS_AS(backend.complete({{"user", "hi"}}, nullptr), BackendException);
  }
}

TEST_CASE("OpenAiBackend lists models", "[llm][OpenAiBackend][http]")
{
  SECTION("From the service, sorted")
  {
    CannedHttpServer server(
      [](const std::string &)
      {
        return CannedHttpServer::reply(200, "application/json",
                                       R"({"data":[{"id":"zeta"},{"id":"alpha"},{"x":1}]})");
      });
    OpenAiConfig config;
    config.baseUrl = server.baseUrl();
    OpenAiBackend backend(config);

    REQUIRE(backend.listModels() == std::vector<std::string>{"alpha", "zeta"});
    REQUIRE(server.requests().at(0).rfind("GET /v1/models HTTP/1.1", 0) == 0);
  }

  SECTION("Configured list when the service cannot answer")
  {
    CannedHttpServer server([](const std::string &)
                            { return CannedHttpServer::reply(500, "text/plain", "down"); });
    OpenAiConfig config;
    config.baseUrl = server.baseUrl();
    config.model = "local";
    config.models = {"a", "b"};
    config.retries = 0;
    OpenAiBackend backend(config);

    REQUIRE(backend.listModels() == std::vector<std::string>{"a", "b", "local"});
  }
}
