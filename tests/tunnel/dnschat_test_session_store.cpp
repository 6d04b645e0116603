// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of dnschat, which is licensed under the Mozilla Public License 2.0.
// See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for details.

#define CATCH_CONFIG_MAIN
#include "test_helpers.hpp"
#include <catch2/catch.hpp>

using namespace dnschat::tunnel;

TEST_CASE("SessionStore reassembles fragments", "[tunnel][SessionStore]")
{
  Chunker chunker;
  SessionStore store;
  auto payload = dnschat::test::randomBytes(500);
  auto names = chunker.createChunks(payload, "5555");
  REQUIRE(names.size() > 1);

  for (std::size_t i = 0; i + 1 < names.size(); ++i)
  {
    auto result = store.addFragment(chunker, chunker.parseFragmentQuery(names[i]).value());
    REQUIRE(result.status == FragmentStatus::Incomplete);
  }
  REQUIRE(store.pendingCount() == 1);

  auto result = store.addFragment(chunker, chunker.parseFragmentQuery(names.back()).value());
  REQUIRE(result.status == FragmentStatus::Complete);
  REQUIRE(result.payload == payload);
  REQUIRE(store.pendingCount() == 0);
}

TEST_CASE("SessionStore publishes chunk maps wholesale", "[tunnel][SessionStore]")
{
  Chunker chunker;
  SessionStore store;

  REQUIRE_FALSE(store.chunk("1234", 0).has_value());
  REQUIRE(store.chunkCount("1234") == 0);

  store.publish("1234", chunker.createResponseChunks(std::string(450, 'a')));
  REQUIRE(store.chunkCount("1234") == 3);
  REQUIRE(store.chunk("1234", 2).value().rfind("2:3:", 0) == 0);

  SECTION("A shorter snapshot drops indices of the longer one")
  {
    store.publish("1234", chunker.createResponseChunks("short"));
    REQUIRE(store.chunkCount("1234") == 1);
    REQUIRE(store.chunk("1234", 0).value() == "0:1:short");
    REQUIRE_FALSE(store.chunk("1234", 2).has_value());
  }

  SECTION("A new complete message clears the previous answer")
  {
    auto names = chunker.createChunks({1, 2, 3}, "1234");
    auto result = store.addFragment(chunker, chunker.parseFragmentQuery(names[0]).value());
    REQUIRE(result.status == FragmentStatus::Complete);
    REQUIRE(store.chunkCount("1234") == 0);
  }

  SECTION("Sessions do not share chunks")
  {
    REQUIRE_FALSE(store.chunk("9999", 0).has_value());
    REQUIRE(store.sessionCount() == 1);
  }
}

TEST_CASE("SessionStore keeps bounded history", "[tunnel][SessionStore]")
{
  SessionStore store(2);

  store.appendExchange("s", "q1", "a1");
  store.appendExchange("s", "q2", "a2");
  store.appendExchange("s", "q3", "a3");
  store.appendExchange("other", "x", "y");

  auto history = store.history("s");
  REQUIRE(history.size() == 4);
  REQUIRE(history[0] == dnschat::llm::ChatMessage{"user", "q2"});
  REQUIRE(history[3] == dnschat::llm::ChatMessage{"assistant", "a3"});
  REQUIRE(store.history("other").size() == 2);

  store.clearHistory("s");
  REQUIRE(store.history("s").empty());
  REQUIRE(store.history("other").size() == 2);
}

TEST_CASE("SessionStore cleanup forgets everything for a session", "[tunnel][SessionStore]")
{
  Chunker chunker;
  SessionStore store;
  auto names = chunker.createChunks(dnschat::test::randomBytes(600), "7777");

  store.addFragment(chunker, chunker.parseFragmentQuery(names[0]).value());
  store.publish("7777", chunker.createResponseChunks("answer"));
  store.appendExchange("7777", "q", "a");

  store.cleanup("7777");
  REQUIRE(store.pendingCount() == 0);
  REQUIRE(store.chunkCount("7777") == 0);
  REQUIRE(store.history("7777").empty());

  REQUIRE_NOTHROW(store.cleanup("never-seen"));
}

TEST_CASE("SessionStore expires idle reassembly", "[tunnel][SessionStore]")
{
  Chunker chunker;
  SessionStore store(20, std::chrono::seconds(5));
  auto stale = chunker.createChunks(dnschat::test::randomBytes(600, 1), "1000");
  auto fresh = chunker.createChunks(dnschat::test::randomBytes(600, 2), "2000");

  const auto start = SessionStore::Clock::now();
  store.addFragment(chunker, chunker.parseFragmentQuery(stale[0]).value(), start);
  REQUIRE(store.pendingCount() == 1);

  store.addFragment(chunker, chunker.parseFragmentQuery(fresh[0]).value(),
                    start + std::chrono::seconds(6));
  REQUIRE(store.pendingCount() == 1);

  auto late = store.addFragment(chunker, chunker.parseFragmentQuery(stale[1]).value(),
                                start + std::chrono::seconds(7));
  REQUIRE(late.status == FragmentStatus::Incomplete);
  REQUIRE(late.received == 1);
}

TEST_CASE("SessionStore is safe under concurrent use", "[tunnel][SessionStore][threaded]")
{
  Chunker chunker;
  SessionStore store;
  std::atomic<int> completed{0};
  std::vector<std::thread> workers;

  for (int t = 0; t < 8; ++t)
  {
    workers.emplace_back(
      [&, t]()
      {
        const std::string session = "t" + std::to_string(t);
        auto payload = dnschat::test::randomBytes(400, static_cast<unsigned>(t));
        for (const auto &name : chunker.createChunks(payload, session))
        {
          auto result = store.addFragment(chunker, chunker.parseFragmentQuery(name).value());
          if (result.status == FragmentStatus::Complete && result.payload == payload)
          {
            completed++;
          }
        }
        store.publish(session, chunker.createResponseChunks(session));
        store.appendExchange(session, "q", "a");
      });
  }
  for (auto &w : workers)
  {
    w.join();
  }

  REQUIRE(completed == 8);
  REQUIRE(store.sessionCount() == 8);
  REQUIRE(store.pendingCount() == 0);
}

TEST_CASE("SessionStore drops writes from a superseded generation", "[tunnel][SessionStore]")
{
  Chunker chunker;
  SessionStore store;

  auto first = store.addFragment(chunker,
                                 chunker.parseFragmentQuery(chunker.createChunks({1}, "4242")[0])
                                   .value());
  REQUIRE(first.status == FragmentStatus::Complete);
  REQUIRE(first.generation != 0);

  REQUIRE(store.publish("4242", chunker.createResponseChunks("partial"), first.generation));

  auto second = store.addFragment(chunker,
                                  chunker.parseFragmentQuery(chunker.createChunks({2}, "4242")[0])
                                    .value());
  REQUIRE(second.generation > first.generation);
  REQUIRE(store.chunkCount("4242") == 0);

  REQUIRE(store.publish("4242", chunker.createResponseChunks("newer"), second.generation));
  REQUIRE_FALSE(store.publish("4242", chunker.createResponseChunks("older"), first.generation));
  REQUIRE(store.chunk("4242", 0).value() == "0:1:newer");

  REQUIRE_FALSE(store.appendExchange("4242", "q1", "a1", first.generation));
  REQUIRE(store.history("4242").empty());
  REQUIRE(store.appendExchange("4242", "q2", "a2", second.generation));
  REQUIRE(store.history("4242").size() == 2);

  SECTION("Cleanup supersedes every generation")
  {
    store.cleanup("4242");
    REQUIRE_FALSE(store.publish("4242", chunker.createResponseChunks("late"), second.generation));
    REQUIRE(store.sessionCount() == 0);
  }

  SECTION("Generations are never reused after cleanup")
  {
    store.cleanup("4242");
    auto third = store.addFragment(chunker,
                                   chunker.parseFragmentQuery(chunker.createChunks({3}, "4242")[0])
                                     .value());
    REQUIRE(third.generation > second.generation);
    REQUIRE_FALSE(store.publish("4242", chunker.createResponseChunks("stale"), first.generation));
  }
}

TEST_CASE("SessionStore forgets idle sessions", "[tunnel][SessionStore]")
{
  Chunker chunker;
  SessionStore store(20, std::chrono::seconds(300), std::chrono::seconds(60));

  store.publish("idle", chunker.createResponseChunks("old answer"));
  store.appendExchange("idle", "q", "a");
  REQUIRE(store.sessionCount() == 1);

  const auto start = SessionStore::Clock::now();
  auto unrelated = chunker.createChunks(dnschat::test::randomBytes(600), "9000");
  store.addFragment(chunker, chunker.parseFragmentQuery(unrelated[0]).value(),
                    start + std::chrono::seconds(30));
  REQUIRE(store.sessionCount() == 1);
  REQUIRE(store.chunkCount("idle") == 1);

  auto fresh = store.addFragment(
    chunker, chunker.parseFragmentQuery(chunker.createChunks({7}, "8000")[0]).value(),
    start + std::chrono::seconds(61));
  REQUIRE(fresh.status == FragmentStatus::Complete);

  REQUIRE(store.chunkCount("idle") == 0);
  REQUIRE(store.history("idle").empty());
  REQUIRE(store.sessionCount() == 1);
  REQUIRE(store.pendingCount() == 1);
  REQUIRE(store.publish("8000", chunker.createResponseChunks("hi"), fresh.generation));
}
