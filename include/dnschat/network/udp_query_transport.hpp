// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of dnschat, which is licensed under the Mozilla Public License 2.0.
// See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for details.

#pragma once

#include <netdb.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <chrono>
#include <cctype>
#include <cerrno>
#include <cstring>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "dnschat/core/logger.hpp"
#include "dnschat/network/dns/dns_message.hpp"

namespace dnschat
{
namespace network
{

/// \brief DNS transport exceptions
class DnsTransportException : public std::runtime_error
{
public:
  explicit DnsTransportException(const std::string &message)
    : std::runtime_error("DNS Transport Error: " + message)
  {
  }
};

/// \brief "Send one query, get one TXT answer or none."
class QueryTransport
{
public:
  virtual ~QueryTransport() = default;

  /// \return the joined TXT text of the answer, or std::nullopt on timeout
  /// or an answer without TXT records
  virtual std::optional<std::string> query(const std::string &qname) = 0;
};

/// \brief Blocking UDP implementation of QueryTransport.
///
/// Each attempt sends a fresh TXT query with a random id and waits up to the
/// configured timeout for a reply carrying the same id and question name.
/// Stray datagrams are discarded without consuming the attempt.
class UdpQueryTransport : public QueryTransport
{
public:
  struct Config
  {
    std::string server = "127.0.0.1";
    std::uint16_t port = 5353;
    std::chrono::milliseconds timeout{2000};
    int retries = 2;
  };

  /// \throws DnsTransportException if the server address cannot be resolved
  /// or no socket can be created
  explicit UdpQueryTransport(Config config) : _config(std::move(config))
  {
    addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_DGRAM;
    addrinfo *res = nullptr;
    const std::string port = std::to_string(_config.port);
    int rc = ::getaddrinfo(_config.server.c_str(), port.c_str(), &hints, &res);
    if (rc != 0 || !res)
    {
      throw DnsTransportException("cannot resolve " + _config.server + ": " +
                                  ::gai_strerror(rc));
    }
    std::memcpy(&_peer, res->ai_addr, res->ai_addrlen);
    _peerLen = res->ai_addrlen;
    _sockFd = ::socket(res->ai_family, SOCK_DGRAM | SOCK_CLOEXEC, 0);
    ::freeaddrinfo(res);
    if (_sockFd < 0)
    {
      throw DnsTransportException(std::string("socket: ") + std::strerror(errno));
    }
    if (::connect(_sockFd, reinterpret_cast<sockaddr*>(&_peer), _peerLen) < 0)
    {
      std::string err = std::strerror(errno);
      ::close(_sockFd);
      throw DnsTransportException("connect " + _config.server + ": " + err);
    }
  }

  ~UdpQueryTransport() override
  {
    if (_sockFd >= 0)
    {
      ::close(_sockFd);
    }
  }

  UdpQueryTransport(const UdpQueryTransport &) = delete;
  UdpQueryTransport &operator=(const UdpQueryTransport &) = delete;

  std::optional<std::string> query(const std::string &qname) override
  {
    using namespace dns;

    for (int attempt = 0; attempt <= _config.retries; ++attempt)
    {
      const std::uint16_t id = DnsMessage::generateQueryId();
      auto packet = DnsMessage::buildQuery(DnsQuestion(qname, DnsType::TXT), id);
      if (::send(_sockFd, packet.data(), packet.size(), 0) < 0)
      {
        core::Logger::warning("UdpQueryTransport: send: " + std::string(std::strerror(errno)));
        continue;
      }

      auto reply = awaitReply(id, qname);
      if (!reply)
      {
        DNSCHAT_LOG_DEBUG("UdpQueryTransport: timeout on attempt " << attempt + 1 << " for "
                                                                   << qname);
        continue;
      }
      if (reply->header.rcode != DnsResponseCode::NOERROR)
      {
        DNSCHAT_LOG_DEBUG("UdpQueryTransport: rcode " << static_cast<int>(reply->header.rcode)
                                                      << " for " << qname);
        return std::nullopt;
      }
      if (reply->txt_records.empty())
      {
        return std::nullopt;
      }
      return reply->txt_records.front().joined();
    }
    return std::nullopt;
  }

  const Config &config() const { return _config; }

private:
  Config _config;
  int _sockFd{-1};
  sockaddr_storage _peer{};
  socklen_t _peerLen{0};

  std::optional<dns::DnsResult> awaitReply(std::uint16_t id, const std::string &qname)
  {
    using Clock = std::chrono::steady_clock;
    const auto deadline = Clock::now() + _config.timeout;
    std::vector<std::uint8_t> buf(dns::constants::DNS_MAX_UDP_MESSAGE);

    while (true)
    {
      auto remaining =
        std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now());
      if (remaining.count() <= 0)
      {
        return std::nullopt;
      }

      pollfd pfd{};
      pfd.fd = _sockFd;
      pfd.events = POLLIN;
      int rc = ::poll(&pfd, 1, static_cast<int>(remaining.count()));
      if (rc < 0)
      {
        if (errno == EINTR)
          continue;
        core::Logger::warning("UdpQueryTransport: poll: " + std::string(std::strerror(errno)));
        return std::nullopt;
      }
      if (rc == 0)
      {
        return std::nullopt;
      }

      ssize_t n = ::recv(_sockFd, buf.data(), buf.size(), 0);
      if (n < 0)
      {
        if (errno == EINTR)
          continue;
        // ECONNREFUSED surfaces here when nothing listens on the port.
        DNSCHAT_LOG_DEBUG("UdpQueryTransport: recv: " << std::strerror(errno));
        return std::nullopt;
      }

      try
      {
        auto result = dns::DnsMessage::parse(buf.data(), static_cast<std::size_t>(n));
        if (!result.header.qr || result.header.id != id)
        {
          continue;
        }
        if (!result.questions.empty() &&
            !equalsIgnoreCase(result.questions.front().qname, qname))
        {
          continue;
        }
        return result;
      }
      catch (const dns::DnsParseException &e)
      {
        core::Logger::warning(std::string("UdpQueryTransport: ") + e.what());
      }
    }
  }

  static bool equalsIgnoreCase(std::string a, std::string b)
  {
    auto strip = [](std::string &s)
    {
      if (!s.empty() && s.back() == '.')
        s.pop_back();
      for (auto &c : s)
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    };
    strip(a);
    strip(b);
    return a == b;
  }
};

} // namespace network
} // namespace dnschat
