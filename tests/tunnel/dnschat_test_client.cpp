// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of dnschat, which is licensed under the Mozilla Public License 2.0.
// See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for details.

#define CATCH_CONFIG_MAIN
#include "test_helpers.hpp"
#include <catch2/catch.hpp>

using namespace dnschat::tunnel;
using dnschat::test::ResolverTransport;
using dnschat::test::ScriptedBackend;

namespace
{
struct ClientFixture
{
  std::shared_ptr<ScriptedBackend> backend;
  std::unique_ptr<TunnelResolver> resolver;
  std::shared_ptr<ResolverTransport> transport;

  explicit ClientFixture(std::vector<std::string> deltas = {"Hello", ", ", "world"})
    : backend(std::make_shared<ScriptedBackend>(std::move(deltas)))
  {
    dnschat::test::initializeTestLogging();
    resolver = std::make_unique<TunnelResolver>(ResolverConfig(), dnschat::test::testCrypto(),
                                                backend);
    transport = std::make_shared<ResolverTransport>(*resolver);
  }

  TunnelClient client(const std::string &session = "",
                      ClientConfig config = dnschat::test::fastClientConfig())
  {
    return TunnelClient(config, dnschat::test::testCrypto(), transport, session);
  }
};
} // namespace

TEST_CASE("TunnelClient streaming exchange", "[tunnel][TunnelClient]")
{
  ClientFixture fx;
  auto client = fx.client("1234");

  std::string streamed;
  std::size_t deltas = 0;
  auto result = client.exchange("hello there",
                                [&](const std::string &delta)
                                {
                                  streamed += delta;
                                  ++deltas;
                                });

  REQUIRE(result.complete);
  REQUIRE(result.received);
  REQUIRE(result.text == "Hello, world");
  REQUIRE(streamed == result.text);
  REQUIRE(deltas >= 1);
  REQUIRE(fx.backend->requests().at(0).back().content == "hello there");
}

TEST_CASE("TunnelClient streams partial answers as they grow", "[tunnel][TunnelClient]")
{
  ClientFixture fx({"one ", "two ", "three ", "four"});
  fx.backend->pauseBetweenDeltas(std::chrono::milliseconds(150));
  auto client = fx.client("2345");

  std::vector<std::string> seen;
  auto result = client.exchange("count", [&](const std::string &delta) { seen.push_back(delta); });

  REQUIRE(result.complete);
  REQUIRE(result.text == "one two three four");
  REQUIRE(seen.size() > 1);
  std::string joined;
  for (const auto &piece : seen)
  {
    joined += piece;
  }
  REQUIRE(joined == result.text);
}

TEST_CASE("TunnelClient long message and long answer", "[tunnel][TunnelClient]")
{
  const std::string longAnswer(2000, 'A');
  ClientFixture fx({longAnswer});
  auto client = fx.client("3456");

  const std::string longMessage(1200, 'm');
  REQUIRE(client.send(longMessage) > 1);
  auto result = client.receiveStreaming();

  REQUIRE(result.complete);
  REQUIRE(result.text == longAnswer);
  REQUIRE(fx.backend->requests().at(0).back().content == longMessage);
}

TEST_CASE("TunnelClient recovers from lost fetches", "[tunnel][TunnelClient]")
{
  const std::string answer(1500, 'z');
  ClientFixture fx({answer});
  std::map<std::string, int> attempts;
  fx.transport->setDrop(
    [&attempts](const std::string &qname)
    {
      // Every chunk query is lost on its first attempt.
      return qname.rfind("g.", 0) == 0 && attempts[qname]++ == 0;
    });

  auto client = fx.client("4567");
  auto result = client.exchange("lossy");

  REQUIRE(result.complete);
  REQUIRE(result.text == answer);
}

TEST_CASE("TunnelClient traditional mode", "[tunnel][TunnelClient]")
{
  ClientFixture fx;
  auto client = fx.client("5678");

  bool called = false;
  auto result = client.exchange("plain", [&](const std::string &) { called = true; }, false);

  REQUIRE(result.complete);
  REQUIRE(result.text == "Hello, world");
  REQUIRE_FALSE(called);
}

TEST_CASE("TunnelClient gives up at the timeout", "[tunnel][TunnelClient]")
{
  std::atomic<bool> release{false};
  ClientFixture fx;
  fx.backend->setGate(
    [&release]()
    { dnschat::test::waitFor([&release]() { return release.load(); }, std::chrono::seconds(10)); });

  auto config = dnschat::test::fastClientConfig();
  config.timeout = std::chrono::milliseconds(300);
  auto client = fx.client("6789", config);

  auto started = std::chrono::steady_clock::now();
  auto result = client.exchange("nobody home");
  auto elapsed = std::chrono::steady_clock::now() - started;

  REQUIRE_FALSE(result.complete);
  REQUIRE_FALSE(result.received);
  REQUIRE(result.text.empty());
  REQUIRE(elapsed < std::chrono::seconds(5));

  SECTION("Traditional mode runs out of attempts")
  {
    config.traditionalAttempts = 3;
    auto traditional = fx.client("6790", config);
    auto plain = traditional.exchange("nobody home", nullptr, false);
    REQUIRE_FALSE(plain.complete);
    REQUIRE_FALSE(plain.received);
  }

  release = true;
}

TEST_CASE("TunnelClient info and cleanup", "[tunnel][TunnelClient]")
{
  ClientFixture fx;
  auto client = fx.client("7890");

  auto info = client.serverInfo();
  REQUIRE(info.has_value());
  auto json = dnschat::parsers::Json::parseOrThrow(*info);
  REQUIRE(json["model"].getString() == "scripted-model");

  REQUIRE(client.exchange("hi").complete);
  REQUIRE(dnschat::test::waitFor([&]() { return fx.resolver->store().history("7890").size() == 2; }));
  REQUIRE(client.cleanup());
  REQUIRE(fx.resolver->store().chunkCount("7890") == 0);
  REQUIRE(fx.resolver->store().history("7890").empty());
}

TEST_CASE("TunnelClient sessions", "[tunnel][TunnelClient]")
{
  SECTION("Generated tokens are zero-padded digits")
  {
    for (std::size_t digits : {1u, 3u, 4u, 9u})
    {
      auto token = TunnelClient::generateSessionToken(digits);
      REQUIRE(token.size() == digits);
      REQUIRE(token.find_first_not_of("0123456789") == std::string::npos);
    }
    REQUIRE_THROWS_AS(TunnelClient::generateSessionToken(0), std::invalid_argument);
    REQUIRE_THROWS_AS(TunnelClient::generateSessionToken(10), std::invalid_argument);
  }

  SECTION("Client picks a token of the configured width")
  {
    ClientFixture fx;
    auto config = dnschat::test::fastClientConfig();
    config.protocol.sessionDigits = 6;
    auto client = fx.client("", config);
    REQUIRE(client.session().size() == 6);
  }

  SECTION("Two clients with distinct sessions do not see each other's answers")
  {
    ClientFixture fx;
    auto first = fx.client("1111");
    auto second = fx.client("2222");
    first.send("to first");
    second.send("to second");
    REQUIRE(first.receiveStreaming().text == "Hello, world");
    REQUIRE(second.receiveStreaming().text == "Hello, world");
    REQUIRE(fx.backend->requests().size() == 2);
  }

  SECTION("Missing collaborators are rejected")
  {
    ClientFixture fx;
    REQUIRE_THROWS_AS(TunnelClient(dnschat::test::fastClientConfig(), nullptr, fx.transport),
                      std::invalid_argument);
    REQUIRE_THROWS_AS(TunnelClient(dnschat::test::fastClientConfig(), dnschat::test::testCrypto(),
                                   nullptr),
                      std::invalid_argument);
  }
}
