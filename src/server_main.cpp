// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of dnschat, which is licensed under the Mozilla Public License 2.0.
// See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for details.

#include "dnschat/dnschat.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <optional>
#include <thread>

namespace
{

struct ServerOptions
{
  std::optional<std::string> configFile;
  std::optional<std::string> bind;
  std::optional<int> port;
  std::optional<std::size_t> workers;
  std::optional<std::string> suffix;
  std::optional<std::size_t> responseChunkSize;
  std::optional<std::size_t> sessionDigits;
  std::optional<std::string> key;
  struct
  {
    std::optional<std::string> baseUrl;
    std::optional<std::string> apiKey;
    std::optional<std::string> model;
    std::optional<std::vector<std::string>> models;
    std::optional<std::string> systemPrompt;
    std::optional<int> maxTokens;
    std::optional<double> temperature;
    std::optional<int> timeoutSeconds;
    std::optional<bool> stream;
  } llm;
  struct
  {
    std::optional<std::size_t> historyTurns;
    std::optional<int> reassemblyTimeoutSeconds;
    std::optional<int> idleTimeoutSeconds;
  } session;
  struct
  {
    std::optional<std::string> level;
    std::optional<std::string> file;
    std::optional<bool> async;
    std::optional<int> retentionDays;
    std::optional<std::string> timeFormat;
    std::optional<std::string> format;
  } log;
};

std::atomic<bool> g_stop{false};

/// \brief Print help message
void printHelp()
{
  std::cout
    << "dnschat-server " << DNSCHAT_VERSION << " (" << DNSCHAT_GIT_SHA << ")\n"
    << "Options:\n"
    << "  -h, --help                 Show this help message\n"
    << "  -c, --config <file>        Configuration file path (default: "
    << DNSCHAT_DEFAULT_CONFIG_FILE_PATH << ")\n"
    << "  -b, --bind <address>       Listen address (default: 127.0.0.1)\n"
    << "  -p, --port <port>          Listen port (default: 5353)\n"
    << "      --suffix <domain>      Tunnel domain suffix (default: llm.local)\n"
    << "  -k, --key <key>            Encryption key (base64url or passphrase)\n"
    << "      --llm-base-url <url>   OpenAI-compatible API base URL\n"
    << "      --llm-model <model>    Model name\n"
    << "      --workers <n>          Worker threads (default: 4)\n"
    << "  -l, --log-level <level>    Log level (trace, debug, info, warning, error, fatal)\n"
    << "  -f, --log-file <file>      Log file path\n"
    << "      --log-async            Enable async logging\n"
    << "      --generate-key         Print a new encryption key and exit\n"
    << "\n"
    << "Environment: LLM_PROXY_KEY, OPENAI_API_KEY, OPENAI_BASE_URL, OPENAI_MODEL, "
       "LLM_DNS_SUFFIX\n";
}

template <typename T> T parseNumber(const std::string &value, const std::string &what)
{
  try
  {
    std::size_t used = 0;
    long long n = std::stoll(value, &used);
    if (used != value.size() || n < 0)
    {
      throw std::invalid_argument(value);
    }
    return static_cast<T>(n);
  }
  catch (const std::exception &)
  {
    throw std::runtime_error("Invalid " + what + ": " + value);
  }
}

/// \brief Parse command-line arguments into the options
/// \return false when the process should exit without serving
bool parseCliArgs(int argc, char** argv, ServerOptions &options)
{
  for (int i = 1; i < argc; ++i)
  {
    std::string arg = argv[i];
    if ((arg == "-c" || arg == "--config") && i + 1 < argc)
    {
      options.configFile = argv[++i];
    }
    else if ((arg == "-b" || arg == "--bind") && i + 1 < argc)
    {
      options.bind = argv[++i];
    }
    else if ((arg == "-p" || arg == "--port") && i + 1 < argc)
    {
      int port = parseNumber<int>(argv[++i], "port number");
      if (port > 65535)
      {
        throw std::runtime_error("Invalid port number: " + std::string(argv[i]));
      }
      options.port = port;
    }
    else if (arg == "--suffix" && i + 1 < argc)
    {
      options.suffix = argv[++i];
    }
    else if ((arg == "-k" || arg == "--key") && i + 1 < argc)
    {
      options.key = argv[++i];
    }
    else if (arg == "--llm-base-url" && i + 1 < argc)
    {
      options.llm.baseUrl = argv[++i];
    }
    else if (arg == "--llm-model" && i + 1 < argc)
    {
      options.llm.model = argv[++i];
    }
    else if (arg == "--workers" && i + 1 < argc)
    {
      options.workers = parseNumber<std::size_t>(argv[++i], "worker count");
    }
    else if ((arg == "-l" || arg == "--log-level") && i + 1 < argc)
    {
      options.log.level = argv[++i];
    }
    else if ((arg == "-f" || arg == "--log-file") && i + 1 < argc)
    {
      options.log.file = argv[++i];
    }
    else if (arg == "--log-async")
    {
      options.log.async = true;
    }
    else if (arg == "--generate-key")
    {
      std::cout << "Generated encryption key: " << dnschat::crypto::CryptoBox::generateKey()
                << "\nSet this as the LLM_PROXY_KEY environment variable on server and client"
                << std::endl;
      return false;
    }
    else if (arg == "-h" || arg == "--help")
    {
      printHelp();
      return false;
    }
    else
    {
      throw std::runtime_error("Unknown option: " + arg);
    }
  }
  return true;
}

void applyEnvironment(ServerOptions &options)
{
  auto fill = [](std::optional<std::string> &target, const char *name)
  {
    const char *value = std::getenv(name);
    if (!target && value && *value)
    {
      target = value;
    }
  };
  fill(options.key, "LLM_PROXY_KEY");
  fill(options.llm.apiKey, "OPENAI_API_KEY");
  fill(options.llm.baseUrl, "OPENAI_BASE_URL");
  fill(options.llm.model, "OPENAI_MODEL");
  fill(options.suffix, "LLM_DNS_SUFFIX");
}

/// \brief Fill options not set on the command line or in the environment
void parseTomlConfig(ServerOptions &options)
{
  const bool explicitFile = options.configFile.has_value();
  const std::string file = options.configFile.value_or(DNSCHAT_DEFAULT_CONFIG_FILE_PATH);
  std::unique_ptr<dnschat::core::ConfigLoader> loader;
  try
  {
    loader = std::make_unique<dnschat::core::ConfigLoader>(file);
    DNSCHAT_LOG_INFO("Using config file: " + file);
  }
  catch (const std::exception &e)
  {
    if (explicitFile)
    {
      throw;
    }
    dnschat::core::Logger::debug("No default config file loaded: " + std::string(e.what()));
    return;
  }

  auto setString = [&](std::optional<std::string> &target, const std::string &key)
  {
    if (!target)
    {
      if (auto v = loader->getString(key))
        target = *v;
    }
  };
  auto setSize = [&](std::optional<std::size_t> &target, const std::string &key)
  {
    if (!target)
    {
      if (auto v = loader->getInt(key))
        target = static_cast<std::size_t>(*v);
    }
  };
  auto setInt = [&](std::optional<int> &target, const std::string &key)
  {
    if (!target)
    {
      if (auto v = loader->getInt(key))
        target = static_cast<int>(*v);
    }
  };
  auto setBool = [&](std::optional<bool> &target, const std::string &key)
  {
    if (!target)
    {
      if (auto v = loader->getBool(key))
        target = *v;
    }
  };

  setString(options.bind, "dnschat.server.bind");
  setInt(options.port, "dnschat.server.port");
  setSize(options.workers, "dnschat.server.workers");
  setString(options.suffix, "dnschat.protocol.suffix");
  setSize(options.responseChunkSize, "dnschat.protocol.responseChunkSize");
  setSize(options.sessionDigits, "dnschat.protocol.sessionDigits");
  setString(options.key, "dnschat.crypto.key");

  setString(options.llm.baseUrl, "dnschat.llm.baseUrl");
  setString(options.llm.apiKey, "dnschat.llm.apiKey");
  setString(options.llm.model, "dnschat.llm.model");
  if (!options.llm.models)
  {
    options.llm.models = loader->getStringArray("dnschat.llm.models");
  }
  setString(options.llm.systemPrompt, "dnschat.llm.systemPrompt");
  setInt(options.llm.maxTokens, "dnschat.llm.maxTokens");
  if (!options.llm.temperature)
  {
    options.llm.temperature = loader->getDouble("dnschat.llm.temperature");
  }
  setInt(options.llm.timeoutSeconds, "dnschat.llm.timeoutSeconds");
  setBool(options.llm.stream, "dnschat.llm.stream");

  setSize(options.session.historyTurns, "dnschat.session.historyTurns");
  setInt(options.session.reassemblyTimeoutSeconds, "dnschat.session.reassemblyTimeoutSeconds");
  setInt(options.session.idleTimeoutSeconds, "dnschat.session.idleTimeoutSeconds");

  setString(options.log.level, "dnschat.log.level");
  setString(options.log.file, "dnschat.log.file");
  setBool(options.log.async, "dnschat.log.async");
  setInt(options.log.retentionDays, "dnschat.log.retentionDays");
  setString(options.log.timeFormat, "dnschat.log.timeFormat");
  setString(options.log.format, "dnschat.log.format");
}

void initLogging(const ServerOptions &options)
{
  dnschat::core::Logger::init(
    dnschat::core::Logger::parseLevel(options.log.level.value_or("info")),
    options.log.file.value_or(""), options.log.async.value_or(false),
    options.log.retentionDays.value_or(7), options.log.timeFormat.value_or("%Y-%m-%d %H:%M:%S"));
  if (options.log.format)
  {
    dnschat::core::Logger::setLogFormat(*options.log.format);
  }
}

int run(ServerOptions &options)
{
  using namespace dnschat;

  if (!options.llm.apiKey && !options.llm.baseUrl)
  {
    std::cerr << "Error: OPENAI_API_KEY is required (or configure a key-less llm.baseUrl)"
              << std::endl;
    return EXIT_FAILURE;
  }

  std::string key;
  if (options.key)
  {
    key = *options.key;
  }
  else
  {
    key = crypto::CryptoBox::generateKey();
    core::Logger::warning("No encryption key configured; generated an ephemeral key");
    std::cerr << "Ephemeral encryption key (set LLM_PROXY_KEY on the client): " << key
              << std::endl;
  }
  auto cryptoBox = std::make_shared<const crypto::CryptoBox>(key);

  llm::OpenAiConfig llmConfig;
  if (options.llm.baseUrl)
    llmConfig.baseUrl = *options.llm.baseUrl;
  llmConfig.apiKey = options.llm.apiKey.value_or("");
  if (options.llm.model)
    llmConfig.model = *options.llm.model;
  if (options.llm.models)
    llmConfig.models = *options.llm.models;
  llmConfig.systemPrompt = options.llm.systemPrompt.value_or("");
  if (options.llm.maxTokens)
    llmConfig.maxTokens = *options.llm.maxTokens;
  if (options.llm.temperature)
    llmConfig.temperature = *options.llm.temperature;
  if (options.llm.timeoutSeconds)
    llmConfig.timeout = std::chrono::seconds(*options.llm.timeoutSeconds);
  if (options.llm.stream)
    llmConfig.stream = *options.llm.stream;
  auto backend = std::make_shared<llm::OpenAiBackend>(llmConfig);

  tunnel::ResolverConfig resolverConfig;
  if (options.suffix)
    resolverConfig.protocol.suffix = *options.suffix;
  if (options.responseChunkSize)
    resolverConfig.protocol.responseChunkSize = *options.responseChunkSize;
  if (options.sessionDigits)
    resolverConfig.protocol.sessionDigits = *options.sessionDigits;
  if (options.workers)
    resolverConfig.workers = *options.workers;
  if (options.session.historyTurns)
    resolverConfig.historyTurns = *options.session.historyTurns;
  if (options.session.reassemblyTimeoutSeconds)
    resolverConfig.reassemblyTimeout =
      std::chrono::seconds(*options.session.reassemblyTimeoutSeconds);
  if (options.session.idleTimeoutSeconds)
    resolverConfig.sessionIdleTimeout = std::chrono::seconds(*options.session.idleTimeoutSeconds);
  tunnel::TunnelResolver resolver(resolverConfig, cryptoBox, backend);

  network::DnsServer::Config serverConfig;
  if (options.bind)
    serverConfig.bind = *options.bind;
  if (options.port)
    serverConfig.port = static_cast<std::uint16_t>(*options.port);
  network::DnsServer server(serverConfig, [&resolver](const std::string &qname)
                            { return resolver.resolve(qname); });

  if (!server.start())
  {
    std::cerr << "Error: cannot start DNS server: " << server.lastError() << std::endl;
    return EXIT_FAILURE;
  }

  core::Logger::info("dnschat-server " + std::string(DNSCHAT_VERSION) + " serving suffix " +
                     resolver.chunker().suffix() + " with model " + backend->model() + " via " +
                     llmConfig.baseUrl);

  std::signal(SIGINT, [](int) { g_stop.store(true); });
  std::signal(SIGTERM, [](int) { g_stop.store(true); });
  while (!g_stop.load())
  {
    std::this_thread::sleep_for(std::chrono::milliseconds(200));
  }

  core::Logger::info("Shutting down");
  server.stop();
  resolver.shutdown();
  return EXIT_SUCCESS;
}

} // namespace

int main(int argc, char** argv)
{
  int rc = EXIT_SUCCESS;
  try
  {
    ServerOptions options;
    if (!parseCliArgs(argc, argv, options))
    {
      return EXIT_SUCCESS;
    }
    applyEnvironment(options);
    parseTomlConfig(options);
    initLogging(options);
    rc = run(options);
  }
  catch (const std::exception &ex)
  {
    std::cerr << "Error: " << ex.what() << std::endl;
    rc = EXIT_FAILURE;
  }

  dnschat::core::Logger::shutdown();
  return rc;
}
