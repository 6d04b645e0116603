// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of dnschat, which is licensed under the Mozilla Public License 2.0.
// See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for details.

#include "dnschat/dnschat.hpp"

#include <atomic>
#include <chrono>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>

namespace
{

struct ClientOptions
{
  std::string command = "chat";
  std::optional<std::string> message;
  std::string server = "127.0.0.1";
  int port = 5353;
  std::optional<std::string> suffix;
  std::optional<std::string> key;
  bool traditional = false;
  int timeoutSeconds = 120;
  bool quiet = false;
  std::string logLevel = "warning";
};

/// \brief Print help message
void printHelp()
{
  std::cout
    << "dnschat-client " << DNSCHAT_VERSION << " (" << DNSCHAT_GIT_SHA << ")\n"
    << "Usage: dnschat-client [command] [options]\n"
    << "Commands:\n"
    << "  chat                       Interactive chat, or one message with -m (default)\n"
    << "  test-connection            Send a greeting and print the answer\n"
    << "  info                       Query server version and model\n"
    << "  generate-key               Print a new encryption key\n"
    << "Options:\n"
    << "  -h, --help                 Show this help message\n"
    << "  -m, --message <text>       Single message to send\n"
    << "  -s, --server <address>     DNS server address (default: 127.0.0.1)\n"
    << "  -p, --port <port>          DNS server port (default: 5353)\n"
    << "      --suffix <domain>      Tunnel domain suffix (default: llm.local)\n"
    << "  -k, --key <key>            Encryption key (default: $LLM_PROXY_KEY)\n"
    << "      --traditional          Wait for the complete answer instead of streaming\n"
    << "      --timeout <seconds>    Give up on an answer after this long (default: 120)\n"
    << "      --quiet                No progress spinner\n"
    << "  -l, --log-level <level>    Log level (default: warning)\n";
}

int parseInt(const std::string &value, const std::string &what)
{
  try
  {
    std::size_t used = 0;
    int n = std::stoi(value, &used);
    if (used != value.size() || n < 0)
    {
      throw std::invalid_argument(value);
    }
    return n;
  }
  catch (const std::exception &)
  {
    throw std::runtime_error("Invalid " + what + ": " + value);
  }
}

/// \return false when the process should exit right away
bool parseCliArgs(int argc, char** argv, ClientOptions &options)
{
  int i = 1;
  if (argc > 1 && argv[1][0] != '-')
  {
    options.command = argv[1];
    i = 2;
  }
  for (; i < argc; ++i)
  {
    std::string arg = argv[i];
    if ((arg == "-m" || arg == "--message") && i + 1 < argc)
    {
      options.message = argv[++i];
    }
    else if ((arg == "-s" || arg == "--server") && i + 1 < argc)
    {
      options.server = argv[++i];
    }
    else if ((arg == "-p" || arg == "--port") && i + 1 < argc)
    {
      options.port = parseInt(argv[++i], "port number");
      if (options.port > 65535)
      {
        throw std::runtime_error("Invalid port number: " + std::string(argv[i]));
      }
    }
    else if (arg == "--suffix" && i + 1 < argc)
    {
      options.suffix = argv[++i];
    }
    else if ((arg == "-k" || arg == "--key") && i + 1 < argc)
    {
      options.key = argv[++i];
    }
    else if (arg == "--traditional")
    {
      options.traditional = true;
    }
    else if (arg == "--timeout" && i + 1 < argc)
    {
      options.timeoutSeconds = parseInt(argv[++i], "timeout");
    }
    else if (arg == "--quiet")
    {
      options.quiet = true;
    }
    else if ((arg == "-l" || arg == "--log-level") && i + 1 < argc)
    {
      options.logLevel = argv[++i];
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

  auto fromEnv = [](std::optional<std::string> &target, const char *name)
  {
    const char *value = std::getenv(name);
    if (!target && value && *value)
    {
      target = value;
    }
  };
  fromEnv(options.key, "LLM_PROXY_KEY");
  fromEnv(options.suffix, "LLM_DNS_SUFFIX");
  return true;
}

/// \brief Spinner on stderr until the first bytes of an answer arrive.
class Spinner
{
public:
  explicit Spinner(bool enabled)
  {
    if (!enabled)
    {
      return;
    }
    _running = true;
    _thread = std::thread(
      [this]
      {
        static const char frames[] = {'|', '/', '-', '\\'};
        std::size_t frame = 0;
        while (_running.load())
        {
          {
            std::lock_guard<std::mutex> lock(_mutex);
            std::cerr << "\r" << frames[frame++ % 4] << " waiting for answer..." << std::flush;
          }
          std::this_thread::sleep_for(std::chrono::milliseconds(120));
        }
        std::lock_guard<std::mutex> lock(_mutex);
        std::cerr << "\r                         \r" << std::flush;
      });
  }

  ~Spinner() { stop(); }

  void stop()
  {
    if (_running.exchange(false) && _thread.joinable())
    {
      _thread.join();
    }
  }

private:
  std::atomic<bool> _running{false};
  std::mutex _mutex;
  std::thread _thread;
};

/// \return true if an answer was received
bool converse(dnschat::tunnel::TunnelClient &client, const std::string &message,
              const ClientOptions &options)
{
  Spinner spinner(!options.quiet);
  bool started = false;
  auto onDelta = [&](const std::string &delta)
  {
    if (!started)
    {
      spinner.stop();
      std::cout << "Assistant: ";
      started = true;
    }
    std::cout << delta << std::flush;
  };

  dnschat::tunnel::ExchangeResult result;
  if (options.traditional)
  {
    client.send(message);
    result = client.receiveTraditional();
    if (result.received)
    {
      onDelta(result.text);
    }
  }
  else
  {
    result = client.exchange(message, onDelta, true);
  }
  spinner.stop();

  if (!result.received)
  {
    std::cout << "No response received from server" << std::endl;
    return false;
  }
  if (!result.complete)
  {
    std::cout << " [incomplete: answer timed out]";
  }
  std::cout << std::endl;
  return true;
}

int run(const ClientOptions &options)
{
  using namespace dnschat;

  if (options.command == "generate-key")
  {
    std::cout << crypto::CryptoBox::generateKey() << std::endl;
    return EXIT_SUCCESS;
  }
  if (options.command != "chat" && options.command != "test-connection" &&
      options.command != "info")
  {
    throw std::runtime_error("Unknown command: " + options.command);
  }
  if (!options.key)
  {
    throw std::runtime_error("No encryption key: set LLM_PROXY_KEY or pass --key");
  }

  network::UdpQueryTransport::Config transportConfig;
  transportConfig.server = options.server;
  transportConfig.port = static_cast<std::uint16_t>(options.port);
  auto transport = std::make_shared<network::UdpQueryTransport>(transportConfig);

  tunnel::ClientConfig clientConfig;
  if (options.suffix)
    clientConfig.protocol.suffix = *options.suffix;
  clientConfig.timeout = std::chrono::seconds(options.timeoutSeconds);
  tunnel::TunnelClient client(clientConfig, std::make_shared<const crypto::CryptoBox>(*options.key),
                              transport);
  core::Logger::debug("Session token " + client.session());

  if (options.command == "info")
  {
    auto info = client.serverInfo();
    if (!info)
    {
      std::cout << "No answer from " << options.server << ":" << options.port << std::endl;
      return EXIT_FAILURE;
    }
    auto parsed = parsers::Json::parse(*info);
    if (!parsed.ok)
    {
      std::cout << *info << std::endl;
      return EXIT_SUCCESS;
    }
    const parsers::Json &json = parsed.value;
    std::cout << "Server version:   " << json.stringOr("version", "?") << "\n"
              << "Protocol version: " << json["protocol"].dump() << "\n"
              << "Model:            " << json.stringOr("model", "?") << std::endl;
    return EXIT_SUCCESS;
  }

  int rc = EXIT_SUCCESS;
  if (options.command == "test-connection")
  {
    std::cout << "Testing connection to " << options.server << ":" << options.port << std::endl;
    rc = converse(client, "Hello, this is a test message.", options) ? EXIT_SUCCESS
                                                                       : EXIT_FAILURE;
  }
  else if (options.message)
  {
    std::cout << "You: " << *options.message << std::endl;
    rc = converse(client, *options.message, options) ? EXIT_SUCCESS : EXIT_FAILURE;
  }
  else
  {
    std::cout << "dnschat via " << options.server << ":" << options.port
              << ". Type 'quit' to exit, '/help' for commands." << std::endl;
    std::string line;
    while (true)
    {
      std::cout << "You: " << std::flush;
      if (!std::getline(std::cin, line))
      {
        break;
      }
      if (line == "quit" || line == "exit")
      {
        break;
      }
      if (line.find_first_not_of(" \t") == std::string::npos)
      {
        continue;
      }
      converse(client, line, options);
    }
  }

  if (!client.cleanup())
  {
    core::Logger::debug("Session cleanup not acknowledged");
  }
  return rc;
}

} // namespace

int main(int argc, char** argv)
{
  int rc = EXIT_SUCCESS;
  try
  {
    ClientOptions options;
    if (!parseCliArgs(argc, argv, options))
    {
      return EXIT_SUCCESS;
    }
    dnschat::core::Logger::init(dnschat::core::Logger::parseLevel(options.logLevel));
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
