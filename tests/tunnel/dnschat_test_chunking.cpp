// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of dnschat, which is licensed under the Mozilla Public License 2.0.
// See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for details.

#define CATCH_CONFIG_MAIN
#include "test_helpers.hpp"
#include <catch2/catch.hpp>

using namespace dnschat::tunnel;

namespace
{
/// Feed every name through the decoder; returns the last result.
FragmentResult feed(const Chunker &chunker, const std::vector<std::string> &names,
                    ReassemblyMap &pending)
{
  FragmentResult last;
  for (const auto &name : names)
  {
    last = chunker.processFragmentQuery(name, pending);
  }
  return last;
}
} // namespace

TEST_CASE("Chunker encodes a short message into one fragment", "[tunnel][Chunker]")
{
  Chunker chunker;
  auto crypto = dnschat::test::testCrypto();

  auto names = chunker.createChunks(crypto->seal("small message"), "test123");
  REQUIRE(names.size() == 1);

  auto labels = QueryName::split(names[0]).value();
  REQUIRE(labels[0] == "m");
  REQUIRE(labels[1] == "test123");
  REQUIRE(labels[2] == "0");
  REQUIRE(labels[3] == "1");
  REQUIRE(labels[labels.size() - 2] == "llm");
  REQUIRE(labels.back() == "local");

  auto parsed = chunker.parseFragmentQuery(names[0]);
  REQUIRE(parsed.has_value());
  REQUIRE(parsed->session == "test123");
  REQUIRE(parsed->index == 0);
  REQUIRE(parsed->total == 1);

  ReassemblyMap pending;
  auto result = chunker.processFragmentQuery(names[0], pending);
  REQUIRE(result.status == FragmentStatus::Complete);
  REQUIRE(crypto->open(result.payload) == "small message");
  REQUIRE(pending.empty());
}

TEST_CASE("Chunker produces legal DNS names", "[tunnel][Chunker]")
{
  Chunker chunker;
  auto payload = dnschat::test::randomBytes(3000);
  auto names = chunker.createChunks(payload, "0042");

  REQUIRE(names.size() > 1);
  for (const auto &name : names)
  {
    REQUIRE(name.size() <= dnschat::network::dns::constants::DNS_MAX_NAME_SIZE);
    auto labels = QueryName::split(name);
    REQUIRE(labels.has_value());
    for (const auto &label : *labels)
    {
      REQUIRE(label.size() <= dnschat::network::dns::constants::DNS_MAX_LABEL_SIZE);
    }
    REQUIRE_NOTHROW(dnschat::network::dns::DnsMessage::encodeName(name));
  }
}

TEST_CASE("Chunker reassembles out of order", "[tunnel][Chunker]")
{
  Chunker chunker;

  SECTION("1000 bytes fed in reverse")
  {
    auto payload = dnschat::test::randomBytes(1000);
    auto names = chunker.createChunks(payload, "rev1");
    REQUIRE(names.size() > 1);
    std::reverse(names.begin(), names.end());

    ReassemblyMap pending;
    for (std::size_t i = 0; i + 1 < names.size(); ++i)
    {
      auto partial = chunker.processFragmentQuery(names[i], pending);
      REQUIRE(partial.status == FragmentStatus::Incomplete);
      REQUIRE(partial.received == i + 1);
    }
    auto result = chunker.processFragmentQuery(names.back(), pending);
    REQUIRE(result.status == FragmentStatus::Complete);
    REQUIRE(result.payload == payload);
  }

  SECTION("Shuffled payloads of assorted sizes")
  {
    std::mt19937 rng(7);
    for (std::size_t len : {0u, 1u, 2u, 100u, 101u, 500u, 4096u})
    {
      INFO("length " << len);
      auto payload = dnschat::test::randomBytes(len, static_cast<unsigned>(len));
      auto names = chunker.createChunks(payload, "s" + std::to_string(len));
      std::shuffle(names.begin(), names.end(), rng);

      ReassemblyMap pending;
      auto result = feed(chunker, names, pending);
      REQUIRE(result.status == FragmentStatus::Complete);
      REQUIRE(result.payload == payload);
    }
  }

  SECTION("Leading zero bytes survive")
  {
    std::vector<std::uint8_t> payload(40, 0);
    payload.push_back(9);
    ReassemblyMap pending;
    auto result = feed(chunker, chunker.createChunks(payload, "zz"), pending);
    REQUIRE(result.payload == payload);
  }
}

TEST_CASE("Chunker keeps sessions isolated", "[tunnel][Chunker]")
{
  Chunker chunker;
  auto first = dnschat::test::randomBytes(600, 1);
  auto second = dnschat::test::randomBytes(700, 2);
  auto namesA = chunker.createChunks(first, "1111");
  auto namesB = chunker.createChunks(second, "2222");

  ReassemblyMap pending;
  std::vector<FragmentResult> completed;
  for (std::size_t i = 0; i < std::max(namesA.size(), namesB.size()); ++i)
  {
    for (const auto *names : {&namesA, &namesB})
    {
      if (i < names->size())
      {
        auto result = chunker.processFragmentQuery((*names)[i], pending);
        if (result.status == FragmentStatus::Complete)
        {
          completed.push_back(result);
        }
      }
    }
  }

  REQUIRE(completed.size() == 2);
  for (const auto &result : completed)
  {
    REQUIRE(result.payload == (result.session == "1111" ? first : second));
  }
  REQUIRE(pending.empty());
}

TEST_CASE("Chunker tolerates duplicated fragments", "[tunnel][Chunker]")
{
  Chunker chunker;
  auto payload = dnschat::test::randomBytes(800);
  auto names = chunker.createChunks(payload, "dup");
  REQUIRE(names.size() >= 3);

  ReassemblyMap pending;
  for (std::size_t i = 0; i + 1 < names.size(); ++i)
  {
    REQUIRE(chunker.processFragmentQuery(names[i], pending).status == FragmentStatus::Incomplete);
    auto again = chunker.processFragmentQuery(names[i], pending);
    REQUIRE(again.status == FragmentStatus::Incomplete);
    REQUIRE(again.received == i + 1);
  }
  auto result = chunker.processFragmentQuery(names.back(), pending);
  REQUIRE(result.status == FragmentStatus::Complete);
  REQUIRE(result.payload == payload);

  SECTION("A repeated index replaces the earlier data")
  {
    ReassemblyMap map;
    auto q0 = chunker.parseFragmentQuery(names[0]).value();
    auto bogus = q0;
    bogus.data = "zzzz";
    REQUIRE(chunker.addFragment(bogus, map).status == FragmentStatus::Incomplete);
    REQUIRE(chunker.addFragment(q0, map).received == 1);
    REQUIRE(map.at("dup").fragments.at(0) == q0.data);
  }

  SECTION("A conflicting total is rejected")
  {
    ReassemblyMap map;
    auto q0 = chunker.parseFragmentQuery(names[0]).value();
    REQUIRE(chunker.addFragment(q0, map).status == FragmentStatus::Incomplete);
    auto other = chunker.parseFragmentQuery(names[1]).value();
    other.total += 1;
    REQUIRE(chunker.addFragment(other, map).status == FragmentStatus::Invalid);
    REQUIRE(map.at("dup").fragments.size() == 1);
  }
}

TEST_CASE("Chunker rejects malformed fragment queries", "[tunnel][Chunker]")
{
  Chunker chunker;
  const std::vector<std::string> invalid = {
    "",
    ".",
    "llm.local",
    "x.1234.0.1.abcd.llm.local",
    "g.1234.0.1.abcd.llm.local",
    "m.1234.zero.1.abcd.llm.local",
    "m.1234.0.one.abcd.llm.local",
    "m.1234.-1.1.abcd.llm.local",
    "m.1234.1.1.abcd.llm.local",
    "m.1234.0.0.abcd.llm.local",
    "m.1234.0.1.abcd.example.com",
    "m.1234.0.1.abcd.llm",
    "m.1234.0.1.llm.local",
    "m.1234.0.llm.local",
    "m..0.1.abcd.llm.local",
  };

  ReassemblyMap pending;
  for (const auto &name : invalid)
  {
    INFO("query: " << name);
    REQUIRE_FALSE(chunker.parseFragmentQuery(name).has_value());
    REQUIRE(chunker.processFragmentQuery(name, pending).status == FragmentStatus::Invalid);
  }
  REQUIRE(pending.empty());

  SECTION("Tag and suffix compare case-insensitively")
  {
    REQUIRE(chunker.parseFragmentQuery("M.1234.0.1.0001z.LLM.Local").has_value());
  }

  SECTION("Undecodable data completes as invalid")
  {
    auto result = chunker.processFragmentQuery("m.1234.0.1.0001zzzz.llm.local", pending);
    REQUIRE(result.status == FragmentStatus::Invalid);
    REQUIRE(pending.empty());
  }
}

TEST_CASE("Chunker parses fetch queries", "[tunnel][Chunker]")
{
  Chunker chunker;

  auto fetch = chunker.parseFetchQuery("g.4321.7.llm.local");
  REQUIRE(fetch.has_value());
  REQUIRE(fetch->session == "4321");
  REQUIRE(fetch->index == 7);

  REQUIRE_FALSE(chunker.parseFetchQuery("g.4321.llm.local").has_value());
  REQUIRE_FALSE(chunker.parseFetchQuery("g.4321.x.llm.local").has_value());
  REQUIRE_FALSE(chunker.parseFetchQuery("g.4321.7.8.llm.local").has_value());
  REQUIRE_FALSE(chunker.parseFetchQuery("m.4321.7.llm.local").has_value());
  REQUIRE_FALSE(chunker.parseFetchQuery("g.4321.7.other.zone").has_value());
}

TEST_CASE("Chunker response chunks", "[tunnel][Chunker]")
{
  Chunker chunker;

  SECTION("13-byte payload")
  {
    const std::string token = "thirteen-byte";
    REQUIRE(token.size() == 13);
    auto chunks = chunker.createResponseChunks(token);
    REQUIRE(chunks.size() == 1);
    REQUIRE(chunks.at(0) == "0:1:thirteen-byte");
    REQUIRE(Chunker::reassembleResponse(chunks) == token);
  }

  SECTION("Encrypted text spanning several chunks")
  {
    auto crypto = dnschat::test::testCrypto();
    const std::string plain(900, 'q');
    auto token = crypto->encrypt(plain);
    auto chunks = chunker.createResponseChunks(token);
    REQUIRE(chunks.size() == (token.size() + 199) / 200);

    for (const auto &entry : chunks)
    {
      auto chunk = Chunker::parseResponseChunk(entry.second);
      REQUIRE(chunk.has_value());
      REQUIRE(chunk->index == entry.first);
      REQUIRE(chunk->total == chunks.size());
      REQUIRE(chunk->data.size() <= 200);
      REQUIRE(entry.second.size() <= dnschat::network::dns::constants::DNS_MAX_CHARACTER_STRING);
    }
    REQUIRE(crypto->decrypt(Chunker::reassembleResponse(chunks)) == plain);

    SECTION("A strict subset never yields the full text")
    {
      for (std::size_t skip = 0; skip < chunks.size(); ++skip)
      {
        auto subset = chunks;
        subset.erase(skip);
        auto partial = Chunker::reassembleResponse(subset);
        REQUIRE(partial != token);
        REQUIRE_THROWS_AS(crypto->decrypt(partial), dnschat::crypto::CryptoException);
      }
    }
  }

  SECTION("Empty token still yields one chunk")
  {
    auto chunks = chunker.createResponseChunks("");
    REQUIRE(chunks.size() == 1);
    REQUIRE(chunks.at(0) == "0:1:");
  }

  SECTION("Malformed chunk records")
  {
    REQUIRE_FALSE(Chunker::parseResponseChunk("NOT_FOUND").has_value());
    REQUIRE_FALSE(Chunker::parseResponseChunk("OK").has_value());
    REQUIRE_FALSE(Chunker::parseResponseChunk("1:x:data").has_value());
    REQUIRE_FALSE(Chunker::parseResponseChunk("3:3:data").has_value());
    REQUIRE_FALSE(Chunker::parseResponseChunk("0:0:").has_value());
    auto withColons = Chunker::parseResponseChunk("0:2:a:b");
    REQUIRE(withColons.has_value());
    REQUIRE(withColons->data == "a:b");
  }
}

TEST_CASE("Chunker configuration", "[tunnel][Chunker]")
{
  SECTION("Custom suffix is normalised")
  {
    ProtocolConfig config;
    config.suffix = "chat.example.org.";
    Chunker chunker(config);
    REQUIRE(chunker.suffix() == "chat.example.org");
    REQUIRE(chunker.suffixLabels().size() == 3);

    auto names = chunker.createChunks({1, 2, 3}, "7");
    REQUIRE(names[0].substr(names[0].size() - 17) == ".chat.example.org");
  }

  SECTION("Invalid settings are rejected")
  {
    ProtocolConfig config;
    config.suffix = "bad..suffix";
    REQUIRE_THROWS_AS(Chunker(config), ChunkingException);

    config = ProtocolConfig();
    config.responseChunkSize = 0;
    REQUIRE_THROWS_AS(Chunker(config), ChunkingException);

    config = ProtocolConfig();
    config.maxLabelLength = 64;
    REQUIRE_THROWS_AS(Chunker(config), ChunkingException);
  }

  SECTION("A suffix that leaves no room for data")
  {
    ProtocolConfig config;
    config.suffix = std::string(61, 'a') + "." + std::string(61, 'b') + "." +
                    std::string(61, 'c') + "." + std::string(61, 'd');
    Chunker chunker(config);
    REQUIRE_THROWS_AS(chunker.createChunks({1}, "1"), ChunkingException);
  }

  SECTION("Session tokens must be one label")
  {
    Chunker chunker;
    REQUIRE_THROWS_AS(chunker.createChunks({1}, ""), ChunkingException);
    REQUIRE_THROWS_AS(chunker.createChunks({1}, "a.b"), ChunkingException);
  }
}

TEST_CASE("Chunker purges stale reassembly state", "[tunnel][Chunker]")
{
  Chunker chunker;
  auto names = chunker.createChunks(dnschat::test::randomBytes(600), "old");
  REQUIRE(names.size() > 1);

  const auto start = std::chrono::steady_clock::now();
  ReassemblyMap pending;
  chunker.processFragmentQuery(names[0], pending, start);
  REQUIRE(pending.size() == 1);

  REQUIRE(Chunker::purgeStale(pending, start + std::chrono::seconds(10),
                              std::chrono::seconds(30)) == 0);
  REQUIRE(Chunker::purgeStale(pending, start + std::chrono::seconds(31),
                              std::chrono::seconds(30)) == 1);
  REQUIRE(pending.empty());
}
