// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of dnschat, which is licensed under the Mozilla Public License 2.0.
// See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for details.

#pragma once

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/epoll.h>
#include <sys/eventfd.h>
#include <sys/socket.h>
#include <unistd.h>

#include <atomic>
#include <cerrno>
#include <cstring>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "dnschat/core/logger.hpp"
#include "dnschat/network/dns/dns_message.hpp"

namespace dnschat
{
namespace network
{

/// \brief Authoritative-only UDP DNS responder.
///
/// Each TXT or ANY question is passed to a handler that returns the TXT text
/// (or nothing, for an empty answer section). Other query types get an empty
/// NOERROR reply; malformed queries get FORMERR when a header can be read.
/// One epoll loop thread serves all packets; stop() wakes it through an
/// eventfd.
class DnsServer
{
public:
  using Handler = std::function<std::optional<std::string>(const std::string &qname)>;

  struct Config
  {
    std::string bind = "127.0.0.1";
    std::uint16_t port = 5353;
    std::uint32_t ttl = 0;
    int epollMaxEvents = 64;
  };

  DnsServer(Config config, Handler handler)
    : _config(std::move(config)), _handler(std::move(handler))
  {
  }

  ~DnsServer() { stop(); }

  DnsServer(const DnsServer &) = delete;
  DnsServer &operator=(const DnsServer &) = delete;

  /// \brief Bind and start the loop thread.
  /// \return false if already running or on a socket error (see lastError())
  bool start()
  {
    bool exp = false;
    if (!_running.compare_exchange_strong(exp, true))
      return false;

    if (!openSocket())
    {
      cleanupFail();
      return false;
    }
    _epollFd = ::epoll_create1(EPOLL_CLOEXEC);
    if (_epollFd < 0)
    {
      setError("epoll_create1: " + lastErr());
      cleanupFail();
      return false;
    }
    _eventFd = ::eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
    if (_eventFd < 0)
    {
      setError("eventfd: " + lastErr());
      cleanupFail();
      return false;
    }
    if (!addEpoll(_eventFd) || !addEpoll(_sockFd))
    {
      cleanupFail();
      return false;
    }

    core::Logger::info("DnsServer: listening on " + _config.bind + ":" +
                       std::to_string(_boundPort));
    _loop = std::thread([this] { loop(); });
    return true;
  }

  void stop()
  {
    bool exp = true;
    if (!_running.compare_exchange_strong(exp, false))
      return;
    std::uint64_t one = 1;
    if (::write(_eventFd, &one, sizeof(one)) < 0)
    {
      core::Logger::warning("DnsServer: eventfd write: " + lastErr());
    }
    if (_loop.joinable())
      _loop.join();
    closeAll();
    core::Logger::info("DnsServer: stopped");
  }

  bool isRunning() const { return _running.load(); }

  /// \brief Port actually bound (useful when configured with port 0).
  std::uint16_t boundPort() const { return _boundPort; }

  std::string lastError() const
  {
    std::lock_guard<std::mutex> lock(_errorMutex);
    return _lastError;
  }

  /// \brief Build the reply to one datagram. Never throws.
  /// \return reply bytes; empty when the datagram deserves no reply
  std::vector<std::uint8_t> handlePacket(const std::uint8_t *data, std::size_t size) const
  {
    using namespace dns;

    if (size < constants::DNS_HEADER_SIZE)
    {
      core::Logger::debug("DnsServer: dropping runt datagram of " + std::to_string(size) +
                          " bytes");
      return {};
    }

    DnsHeader header = DnsMessage::parseHeaderOnly(data, size);
    if (header.qr)
    {
      return {};
    }

    try
    {
      return answer(data, size);
    }
    catch (const std::exception &e)
    {
      core::Logger::error(std::string("DnsServer: reply failed: ") + e.what());
      return DnsMessage::buildErrorResponse(header, DnsResponseCode::SERVFAIL);
    }
  }

private:
  std::vector<std::uint8_t> answer(const std::uint8_t *data, std::size_t size) const
  {
    using namespace dns;

    DnsResult query;
    try
    {
      query = DnsMessage::parse(data, size);
    }
    catch (const DnsParseException &e)
    {
      core::Logger::warning(std::string("DnsServer: ") + e.what());
      return DnsMessage::buildErrorResponse(DnsMessage::parseHeaderOnly(data, size),
                                            DnsResponseCode::FORMERR);
    }

    if (query.header.opcode != DnsOpcode::Query)
    {
      return DnsMessage::buildEmptyResponse(query, DnsResponseCode::NOTIMP);
    }
    if (query.questions.empty())
    {
      return DnsMessage::buildErrorResponse(query.header, DnsResponseCode::FORMERR);
    }

    const DnsQuestion &question = query.questions.front();
    if (question.qtype != DnsType::TXT && question.qtype != DnsType::ANY)
    {
      DNSCHAT_LOG_DEBUG("DnsServer: qtype " << static_cast<int>(question.qtype) << " for "
                                            << question.qname << " answered empty");
      return DnsMessage::buildEmptyResponse(query);
    }

    std::optional<std::string> text;
    try
    {
      text = _handler(question.qname);
    }
    catch (const std::exception &e)
    {
      core::Logger::error("DnsServer: handler failed for " + question.qname + ": " + e.what());
      return DnsMessage::buildErrorResponse(query.header, DnsResponseCode::SERVFAIL);
    }
    if (!text)
    {
      return DnsMessage::buildEmptyResponse(query);
    }
    return DnsMessage::buildTxtResponse(query, *text, _config.ttl);
  }

  Config _config;
  Handler _handler;
  std::atomic<bool> _running{false};
  std::thread _loop;
  int _sockFd{-1};
  int _epollFd{-1};
  int _eventFd{-1};
  std::uint16_t _boundPort{0};
  mutable std::mutex _errorMutex;
  std::string _lastError;

  static std::string lastErr() { return std::strerror(errno); }

  void setError(const std::string &message)
  {
    core::Logger::error("DnsServer: " + message);
    std::lock_guard<std::mutex> lock(_errorMutex);
    _lastError = message;
  }

  bool openSocket()
  {
    sockaddr_storage ss{};
    socklen_t sl = 0;
    in6_addr t6{};
    if (::inet_pton(AF_INET6, _config.bind.c_str(), &t6) == 1)
    {
      _sockFd = ::socket(AF_INET6, SOCK_DGRAM | SOCK_NONBLOCK | SOCK_CLOEXEC, 0);
      if (_sockFd < 0)
      {
        setError("socket v6: " + lastErr());
        return false;
      }
      int v6only = 0;
      ::setsockopt(_sockFd, IPPROTO_IPV6, IPV6_V6ONLY, &v6only, sizeof(v6only));
      sockaddr_in6 sa6{};
      sa6.sin6_family = AF_INET6;
      sa6.sin6_port = htons(_config.port);
      sa6.sin6_addr = t6;
      std::memcpy(&ss, &sa6, sizeof(sa6));
      sl = sizeof(sa6);
    }
    else
    {
      in_addr t4{};
      if (::inet_pton(AF_INET, _config.bind.c_str(), &t4) != 1)
      {
        setError("invalid bind address: " + _config.bind);
        return false;
      }
      _sockFd = ::socket(AF_INET, SOCK_DGRAM | SOCK_NONBLOCK | SOCK_CLOEXEC, 0);
      if (_sockFd < 0)
      {
        setError("socket v4: " + lastErr());
        return false;
      }
      sockaddr_in sa4{};
      sa4.sin_family = AF_INET;
      sa4.sin_port = htons(_config.port);
      sa4.sin_addr = t4;
      std::memcpy(&ss, &sa4, sizeof(sa4));
      sl = sizeof(sa4);
    }

    int reuse = 1;
    ::setsockopt(_sockFd, SOL_SOCKET, SO_REUSEADDR, &reuse, sizeof(reuse));
    if (::bind(_sockFd, reinterpret_cast<sockaddr*>(&ss), sl) < 0)
    {
      setError("bind " + _config.bind + ":" + std::to_string(_config.port) + ": " + lastErr());
      return false;
    }

    sockaddr_storage local{};
    socklen_t localLen = sizeof(local);
    if (::getsockname(_sockFd, reinterpret_cast<sockaddr*>(&local), &localLen) == 0)
    {
      if (local.ss_family == AF_INET6)
        _boundPort = ntohs(reinterpret_cast<sockaddr_in6*>(&local)->sin6_port);
      else
        _boundPort = ntohs(reinterpret_cast<sockaddr_in*>(&local)->sin_port);
    }
    return true;
  }

  bool addEpoll(int fd)
  {
    epoll_event ev{};
    ev.events = EPOLLIN;
    ev.data.fd = fd;
    if (::epoll_ctl(_epollFd, EPOLL_CTL_ADD, fd, &ev) < 0)
    {
      setError("epoll_ctl: " + lastErr());
      return false;
    }
    return true;
  }

  void loop()
  {
    std::vector<epoll_event> evs(static_cast<std::size_t>(_config.epollMaxEvents));
    std::vector<std::uint8_t> buf(dns::constants::DNS_MAX_UDP_MESSAGE);
    while (_running.load())
    {
      int n = ::epoll_wait(_epollFd, evs.data(), static_cast<int>(evs.size()), -1);
      if (n < 0)
      {
        if (errno == EINTR)
          continue;
        setError("epoll_wait: " + lastErr());
        continue;
      }
      for (int i = 0; i < n; ++i)
      {
        int fd = evs[static_cast<std::size_t>(i)].data.fd;
        if (fd == _eventFd)
        {
          std::uint64_t v;
          while (::read(_eventFd, &v, sizeof(v)) > 0)
          {
          }
          continue;
        }
        if (fd == _sockFd)
        {
          readDatagrams(buf);
        }
      }
    }
  }

  void readDatagrams(std::vector<std::uint8_t> &buf)
  {
    while (true)
    {
      sockaddr_storage peer{};
      socklen_t peerLen = sizeof(peer);
      ssize_t n = ::recvfrom(_sockFd, buf.data(), buf.size(), 0,
                             reinterpret_cast<sockaddr*>(&peer), &peerLen);
      if (n < 0)
      {
        if (errno == EINTR)
          continue;
        if (errno != EAGAIN && errno != EWOULDBLOCK)
          core::Logger::warning("DnsServer: recvfrom: " + lastErr());
        return;
      }

      auto reply = handlePacket(buf.data(), static_cast<std::size_t>(n));
      if (reply.empty())
        continue;

      if (::sendto(_sockFd, reply.data(), reply.size(), 0, reinterpret_cast<sockaddr*>(&peer),
                   peerLen) < 0)
      {
        core::Logger::warning("DnsServer: sendto: " + lastErr());
      }
    }
  }

  void closeAll()
  {
    if (_sockFd >= 0)
    {
      ::close(_sockFd);
      _sockFd = -1;
    }
    if (_eventFd >= 0)
    {
      ::close(_eventFd);
      _eventFd = -1;
    }
    if (_epollFd >= 0)
    {
      ::close(_epollFd);
      _epollFd = -1;
    }
  }

  void cleanupFail()
  {
    closeAll();
    _running.store(false);
  }
};

} // namespace network
} // namespace dnschat
