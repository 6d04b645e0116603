// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of dnschat, which is licensed under the Mozilla Public License 2.0.
// See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for details.

// Shared test helpers for the dnschat test suite.

#pragma once

#include "dnschat/dnschat.hpp"
#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <functional>
#include <mutex>
#include <random>
#include <thread>

namespace dnschat::test
{

/// \brief Automatic logger initialization for tests
struct LoggerInit
{
  LoggerInit() { dnschat::core::Logger::setLevel(dnschat::core::Logger::Level::Debug); }
};

/// \brief Static logger initializer - call once per test executable
inline void initializeTestLogging()
{
  static LoggerInit init;
  (void)init;
}

/// \brief Fixed key shared by the client and server side of a test.
inline const std::string &testKey()
{
  static const std::string key = "dnschat-test-passphrase";
  return key;
}

inline std::shared_ptr<const dnschat::crypto::CryptoBox> testCrypto()
{
  return std::make_shared<const dnschat::crypto::CryptoBox>(testKey());
}

/// \brief Backend that replays scripted increments.
class ScriptedBackend : public dnschat::llm::LlmBackend
{
public:
  explicit ScriptedBackend(std::vector<std::string> deltas = {"Hello", ", ", "world"})
    : _deltas(std::move(deltas))
  {
  }

  std::string complete(const std::vector<dnschat::llm::ChatMessage> &messages,
                       const DeltaCallback &onDelta) override
  {
    {
      std::lock_guard<std::mutex> lock(_mutex);
      _requests.push_back(messages);
    }
    if (_gate)
    {
      _gate();
    }
    if (!_failure.empty())
    {
      throw dnschat::llm::BackendException(_failure);
    }
    std::string text;
    for (const auto &delta : _deltas)
    {
      text += delta;
      if (onDelta)
      {
        onDelta(delta);
      }
      if (_deltaPause.count() > 0)
      {
        std::this_thread::sleep_for(_deltaPause);
      }
    }
    return text;
  }

  std::vector<std::string> listModels() override { return {"alpha", "beta", model()}; }

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

  void failWith(const std::string &message) { _failure = message; }
  void pauseBetweenDeltas(std::chrono::milliseconds pause) { _deltaPause = pause; }
  /// Runs on the worker before any text is produced.
  void setGate(std::function<void()> gate) { _gate = std::move(gate); }

  std::vector<std::vector<dnschat::llm::ChatMessage>> requests() const
  {
    std::lock_guard<std::mutex> lock(_mutex);
    return _requests;
  }

private:
  std::vector<std::string> _deltas;
  std::string _failure;
  std::chrono::milliseconds _deltaPause{0};
  std::function<void()> _gate;
  mutable std::mutex _mutex;
  std::string _model = "scripted-model";
  std::vector<std::vector<dnschat::llm::ChatMessage>> _requests;
};

/// \brief QueryTransport wired straight into a resolver, with optional loss.
class ResolverTransport : public dnschat::network::QueryTransport
{
public:
  using DropPredicate = std::function<bool(const std::string &qname)>;

  explicit ResolverTransport(dnschat::tunnel::TunnelResolver &resolver) : _resolver(resolver) {}

  std::optional<std::string> query(const std::string &qname) override
  {
    _queries.fetch_add(1);
    if (_drop && _drop(qname))
    {
      return std::nullopt;
    }
    return _resolver.resolve(qname);
  }

  void setDrop(DropPredicate drop) { _drop = std::move(drop); }
  std::size_t queries() const { return _queries.load(); }

private:
  dnschat::tunnel::TunnelResolver &_resolver;
  DropPredicate _drop;
  std::atomic<std::size_t> _queries{0};
};

/// \brief Client timings short enough for unit tests.
inline dnschat::tunnel::ClientConfig fastClientConfig()
{
  dnschat::tunnel::ClientConfig config;
  config.timeout = std::chrono::seconds(10);
  config.initialDelay = std::chrono::milliseconds(10);
  config.pollInterval = std::chrono::milliseconds(20);
  config.confirmDelay = std::chrono::milliseconds(20);
  config.retryBackoff = std::chrono::milliseconds(5);
  config.traditionalInterval = std::chrono::milliseconds(50);
  config.traditionalAttempts = 40;
  return config;
}

/// \brief RAII helper for temporary test files
class TempFileManager
{
public:
  TempFileManager() = default;
  ~TempFileManager() { cleanup(); }

  void addFile(const std::string &filename) { _files.push_back(filename); }

  void cleanup()
  {
    for (const auto &file : _files)
    {
      std::remove(file.c_str());
    }
    _files.clear();
  }

private:
  std::vector<std::string> _files;
};

/// \brief Remove files in the working directory whose name starts with \p prefix
inline void removeFilesMatchingPrefix(const std::string &prefix)
{
  std::error_code ec;
  for (const auto &entry : std::filesystem::directory_iterator(".", ec))
  {
    if (entry.path().filename().string().rfind(prefix, 0) == 0)
    {
      std::filesystem::remove(entry.path(), ec);
    }
  }
}

/// \brief Read a whole file into a string
inline std::string readFile(const std::string &path)
{
  std::ifstream in(path);
  return std::string((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
}

/// \brief Helper to wait for a condition with timeout
template <typename Predicate>
bool waitFor(Predicate pred, std::chrono::milliseconds timeout = std::chrono::milliseconds(5000))
{
  auto start = std::chrono::steady_clock::now();
  while (!pred())
  {
    if (std::chrono::steady_clock::now() - start > timeout)
    {
      return false;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }
  return true;
}

/// \brief Helper to generate random byte payloads for testing
inline std::vector<std::uint8_t> randomBytes(std::size_t length, unsigned seed = 42)
{
  std::mt19937 gen(seed);
  std::uniform_int_distribution<int> dist(0, 255);
  std::vector<std::uint8_t> out(length);
  for (auto &b : out)
  {
    b = static_cast<std::uint8_t>(dist(gen));
  }
  return out;
}

} // namespace dnschat::test
