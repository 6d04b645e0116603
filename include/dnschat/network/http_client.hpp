// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of dnschat, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <chrono>
#include <cstdlib>
#include <cstring>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <regex>
#include <sstream>
#include <stdexcept>
#include <string>
#include <thread>

#include <fcntl.h>
#include <netdb.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <sys/types.h>
#include <unistd.h>

#include <openssl/err.h>
#include <openssl/ssl.h>
#include <openssl/x509v3.h>

#include "dnschat/core/logger.hpp"
#include "dnschat/parsers/json.hpp"

namespace dnschat
{
namespace network
{

  /// \brief Connection, TLS or protocol failure while talking HTTP.
  class HttpException : public std::runtime_error
  {
  public:
    explicit HttpException(const std::string& message)
      : std::runtime_error("HTTP Error: " + message)
    {
    }
  };

  /// \brief Case-insensitive ordering for header names.
  struct HeaderNameLess
  {
    bool operator()(const std::string& a, const std::string& b) const
    {
      return std::lexicographical_compare(
        a.begin(), a.end(), b.begin(), b.end(), [](char x, char y)
        {
          return std::tolower(static_cast<unsigned char>(x)) <
                 std::tolower(static_cast<unsigned char>(y));
        });
    }
  };

  using HttpHeaders = std::map<std::string, std::string, HeaderNameLess>;

  /// \brief Blocking HTTP/1.1 client over POSIX sockets with OpenSSL TLS.
  /// \details
  ///   - One connection per request (`Connection: close`)
  ///   - Content-Length, chunked and read-until-close bodies
  ///   - Optional line-by-line delivery of the body as it arrives, used for
  ///     server-sent events
  ///   - Retries with exponential backoff for failures before any body data
  ///     has been delivered
  class HttpClient
  {
  public:
    /// \brief TLS configuration for HTTPS requests
    struct TlsConfig
    {
      std::string caFile;
      bool verifyPeer = true;
    };

    /// \brief HTTP response structure
    struct Response
    {
      int statusCode = 0;
      std::string statusText;
      HttpHeaders headers;
      std::string body;
      bool success() const { return statusCode >= 200 && statusCode < 300; }
    };

    /// \brief Configuration for HTTP client
    struct Config
    {
      std::chrono::milliseconds connectTimeout;
      std::chrono::milliseconds requestTimeout;
      std::string userAgent;
      std::size_t maxResponseSize;

      Config()
        : connectTimeout(5000),
          requestTimeout(120000),
          userAgent("dnschat-HttpClient/1.0"),
          maxResponseSize(16 * 1024 * 1024)
      {
      }
    };

    using LineCallback = std::function<void(const std::string& line)>;

    explicit HttpClient(const Config& config = Config{}) : _config(config) {}

    ~HttpClient()
    {
      if (_sslCtx)
      {
        ::SSL_CTX_free(_sslCtx);
      }
    }

    HttpClient(const HttpClient&) = delete;
    HttpClient& operator=(const HttpClient&) = delete;

    void setTlsConfig(const TlsConfig& config)
    {
      std::lock_guard<std::mutex> lock(_mutex);
      _tlsConfig = config;
      if (_sslCtx)
      {
        ::SSL_CTX_free(_sslCtx);
        _sslCtx = nullptr;
      }
    }

    const Config& config() const { return _config; }

    Response get(const std::string& url, const HttpHeaders& headers = {}, int retries = 0)
    {
      return performRequest("GET", url, "", headers, retries, nullptr);
    }

    Response post(const std::string& url, const std::string& body,
                  const HttpHeaders& headers = {}, int retries = 0)
    {
      return performRequest("POST", url, body, headers, retries, nullptr);
    }

    Response postJson(const std::string& url, const parsers::Json& body,
                      const HttpHeaders& headers = {}, int retries = 0)
    {
      HttpHeaders jsonHeaders = headers;
      jsonHeaders["Content-Type"] = "application/json";
      return performRequest("POST", url, body.dump(), jsonHeaders, retries, nullptr);
    }

    /// \brief POST and hand each body line to \p onLine as it is received.
    ///
    /// Lines are only delivered for 2xx responses; the full body is still
    /// returned in Response::body.
    Response postStream(const std::string& url, const std::string& body,
                        const HttpHeaders& headers, const LineCallback& onLine,
                        int retries = 0)
    {
      return performRequest("POST", url, body, headers, retries, onLine);
    }

    /// \brief Parse JSON response or throw on error
    static parsers::Json parseJsonOrThrow(const Response& response)
    {
      if (!response.success())
      {
        throw HttpException("HTTP failed with status: " + std::to_string(response.statusCode));
      }
      auto result = parsers::Json::parse(response.body);
      if (!result.ok)
      {
        throw HttpException("JSON parse error: " + result.error.message);
      }
      return std::move(result.value);
    }

    /// \brief URL parsing structure
    struct ParsedUrl
    {
      std::string scheme;
      std::string host;
      std::uint16_t port = 0;
      std::string path;
      std::string query;

      bool isHttps() const { return scheme == "https"; }
      std::string getPathWithQuery() const
      {
        if (query.empty())
          return path.empty() ? "/" : path;
        return (path.empty() ? "/" : path) + "?" + query;
      }
      std::string getHostPort() const { return host + ":" + std::to_string(port); }
    };

    /// \throws std::invalid_argument on anything but http(s)://host[:port][/path][?query]
    static ParsedUrl parseUrl(const std::string& url)
    {
      ParsedUrl parsed;

      std::regex urlRegex(
        R"(^(https?):\/\/([^:\/\s]+)(?::(\d+))?(\/?[^?\s]*)(?:\?([^#\s]*))?(?:#.*)?$)",
        std::regex::icase);
      std::smatch match;

      if (!std::regex_match(url, match, urlRegex))
      {
        throw std::invalid_argument("Invalid URL format: " + url);
      }

      parsed.scheme = match[1].str();
      std::transform(parsed.scheme.begin(), parsed.scheme.end(), parsed.scheme.begin(),
                     [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
      parsed.host = match[2].str();

      if (match[3].matched)
      {
        int port = std::stoi(match[3].str());
        if (port <= 0 || port > 65535)
        {
          throw std::invalid_argument("Invalid port in URL: " + url);
        }
        parsed.port = static_cast<std::uint16_t>(port);
      }
      else
      {
        parsed.port = parsed.isHttps() ? 443 : 80;
      }

      parsed.path = match[4].str();
      if (parsed.path.empty())
        parsed.path = "/";

      parsed.query = match[5].str();

      return parsed;
    }

  private:
    /// \brief One TCP (optionally TLS) connection; closed on destruction.
    class Connection
    {
    public:
      Connection() = default;
      ~Connection() { close(); }
      Connection(const Connection&) = delete;
      Connection& operator=(const Connection&) = delete;

      void open(const ParsedUrl& url, SSL_CTX* sslCtx, bool verifyPeer,
                std::chrono::milliseconds connectTimeout, std::chrono::milliseconds ioTimeout)
      {
        addrinfo hints{};
        hints.ai_family = AF_UNSPEC;
        hints.ai_socktype = SOCK_STREAM;
        addrinfo* res = nullptr;
        int rc = ::getaddrinfo(url.host.c_str(), std::to_string(url.port).c_str(), &hints, &res);
        if (rc != 0)
        {
          throw HttpException("Cannot resolve " + url.host + ": " + ::gai_strerror(rc));
        }
        std::unique_ptr<addrinfo, decltype(&::freeaddrinfo)> guard(res, &::freeaddrinfo);

        std::string lastError = "no addresses";
        for (addrinfo* ai = res; ai != nullptr; ai = ai->ai_next)
        {
          int fd = ::socket(ai->ai_family, ai->ai_socktype | SOCK_CLOEXEC, ai->ai_protocol);
          if (fd < 0)
          {
            lastError = std::strerror(errno);
            continue;
          }
          if (connectWithTimeout(fd, ai->ai_addr, ai->ai_addrlen, connectTimeout, lastError))
          {
            _fd = fd;
            break;
          }
          ::close(fd);
        }
        if (_fd < 0)
        {
          throw HttpException("Connection failed to " + url.getHostPort() + " (" + lastError +
                              ")");
        }

        timeval tv{};
        tv.tv_sec = static_cast<time_t>(ioTimeout.count() / 1000);
        tv.tv_usec = static_cast<suseconds_t>((ioTimeout.count() % 1000) * 1000);
        ::setsockopt(_fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
        ::setsockopt(_fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));

        if (sslCtx != nullptr)
        {
          _ssl = ::SSL_new(sslCtx);
          if (_ssl == nullptr)
          {
            throw HttpException("SSL_new(client) failed: " + sslError());
          }
          ::SSL_set_fd(_ssl, _fd);
          ::SSL_set_tlsext_host_name(_ssl, url.host.c_str());
          if (verifyPeer)
          {
            ::SSL_set1_host(_ssl, url.host.c_str());
          }
          if (::SSL_connect(_ssl) != 1)
          {
            throw HttpException("TLS handshake with " + url.getHostPort() +
                                " failed: " + sslError());
          }
        }
      }

      void sendAll(const std::string& data)
      {
        std::size_t sent = 0;
        while (sent < data.size())
        {
          int n = 0;
          if (_ssl != nullptr)
          {
            n = ::SSL_write(_ssl, data.data() + sent, static_cast<int>(data.size() - sent));
            if (n <= 0)
            {
              throw HttpException("Failed to send HTTP request: " + sslError());
            }
          }
          else
          {
            ssize_t w = ::send(_fd, data.data() + sent, data.size() - sent, MSG_NOSIGNAL);
            if (w < 0)
            {
              if (errno == EINTR)
                continue;
              throw HttpException(std::string("Failed to send HTTP request: ") +
                                  std::strerror(errno));
            }
            n = static_cast<int>(w);
          }
          sent += static_cast<std::size_t>(n);
        }
      }

      /// \return bytes read, 0 at end of stream
      std::size_t receive(char* buffer, std::size_t len)
      {
        while (true)
        {
          if (_ssl != nullptr)
          {
            int n = ::SSL_read(_ssl, buffer, static_cast<int>(len));
            if (n > 0)
              return static_cast<std::size_t>(n);
            int err = ::SSL_get_error(_ssl, n);
            if (err == SSL_ERROR_ZERO_RETURN)
              return 0;
            if (err == SSL_ERROR_SYSCALL && (errno == EAGAIN || errno == EWOULDBLOCK))
              throw HttpException("HTTP response timeout");
            if (err == SSL_ERROR_SYSCALL && errno == 0)
              return 0; // peer closed without close_notify
            throw HttpException("TLS read failed: " + sslError());
          }

          ssize_t n = ::recv(_fd, buffer, len, 0);
          if (n >= 0)
            return static_cast<std::size_t>(n);
          if (errno == EINTR)
            continue;
          if (errno == EAGAIN || errno == EWOULDBLOCK)
            throw HttpException("HTTP response timeout");
          throw HttpException(std::string("Receive failed: ") + std::strerror(errno));
        }
      }

      void close()
      {
        if (_ssl != nullptr)
        {
          ::SSL_shutdown(_ssl);
          ::SSL_free(_ssl);
          _ssl = nullptr;
        }
        if (_fd >= 0)
        {
          ::close(_fd);
          _fd = -1;
        }
      }

    private:
      int _fd = -1;
      SSL* _ssl = nullptr;

      static bool connectWithTimeout(int fd, const sockaddr* addr, socklen_t len,
                                     std::chrono::milliseconds timeout, std::string& error)
      {
        int flags = ::fcntl(fd, F_GETFL, 0);
        ::fcntl(fd, F_SETFL, flags | O_NONBLOCK);
        int rc = ::connect(fd, addr, len);
        if (rc < 0 && errno != EINPROGRESS)
        {
          error = std::strerror(errno);
          return false;
        }
        if (rc < 0)
        {
          pollfd pfd{fd, POLLOUT, 0};
          rc = ::poll(&pfd, 1, static_cast<int>(timeout.count()));
          if (rc == 0)
          {
            error = "connect timeout";
            return false;
          }
          if (rc < 0)
          {
            error = std::strerror(errno);
            return false;
          }
          int soError = 0;
          socklen_t soLen = sizeof(soError);
          ::getsockopt(fd, SOL_SOCKET, SO_ERROR, &soError, &soLen);
          if (soError != 0)
          {
            error = std::strerror(soError);
            return false;
          }
        }
        ::fcntl(fd, F_SETFL, flags);
        return true;
      }
    };

    /// \brief Buffered reads over a Connection.
    class Reader
    {
    public:
      explicit Reader(Connection& conn) : _conn(conn) {}

      /// \return false at end of stream
      bool fill()
      {
        char buffer[8192];
        std::size_t n = _conn.receive(buffer, sizeof(buffer));
        if (n == 0)
          return false;
        _buf.append(buffer, n);
        return true;
      }

      /// \brief Read through CRLF; the terminator is stripped.
      std::string readLine()
      {
        while (true)
        {
          auto pos = _buf.find('\n', _pos);
          if (pos != std::string::npos)
          {
            std::string line = _buf.substr(_pos, pos - _pos);
            _pos = pos + 1;
            if (!line.empty() && line.back() == '\r')
              line.pop_back();
            compact();
            return line;
          }
          if (!fill())
          {
            throw HttpException("Connection closed before receiving complete HTTP response");
          }
        }
      }

      std::string readExact(std::size_t n)
      {
        while (_buf.size() - _pos < n)
        {
          if (!fill())
          {
            throw HttpException("Connection closed before receiving complete HTTP response");
          }
        }
        std::string out = _buf.substr(_pos, n);
        _pos += n;
        compact();
        return out;
      }

      /// \return buffered bytes, reading more if none; empty at end of stream
      std::string readSome()
      {
        if (_pos >= _buf.size() && !fill())
        {
          return std::string();
        }
        std::string out = _buf.substr(_pos);
        _buf.clear();
        _pos = 0;
        return out;
      }

    private:
      Connection& _conn;
      std::string _buf;
      std::size_t _pos = 0;

      void compact()
      {
        if (_pos > 4096)
        {
          _buf.erase(0, _pos);
          _pos = 0;
        }
      }
    };

    /// \brief Accumulates the body and splits it into lines for the callback.
    class BodySink
    {
    public:
      BodySink(Response& response, const LineCallback* onLine, std::size_t limit)
        : _response(response), _onLine(onLine), _limit(limit)
      {
      }

      void append(const std::string& piece)
      {
        if (_response.body.size() + piece.size() > _limit)
        {
          throw HttpException("Response exceeds maximum size of " + std::to_string(_limit) +
                              " bytes");
        }
        _response.body += piece;
        if (_onLine == nullptr)
          return;
        _pending += piece;
        std::size_t start = 0;
        std::size_t pos;
        while ((pos = _pending.find('\n', start)) != std::string::npos)
        {
          std::string line = _pending.substr(start, pos - start);
          if (!line.empty() && line.back() == '\r')
            line.pop_back();
          _delivered = true;
          (*_onLine)(line);
          start = pos + 1;
        }
        _pending.erase(0, start);
      }

      void finish()
      {
        if (_onLine != nullptr && !_pending.empty())
        {
          _delivered = true;
          (*_onLine)(_pending);
          _pending.clear();
        }
      }

      bool delivered() const { return _delivered; }

    private:
      Response& _response;
      const LineCallback* _onLine;
      std::size_t _limit;
      std::string _pending;
      bool _delivered = false;
    };

    Config _config;
    TlsConfig _tlsConfig;
    SSL_CTX* _sslCtx = nullptr;
    std::mutex _mutex;

    static std::string sslError()
    {
      unsigned long code = ::ERR_get_error(); // NOLINT(google-runtime-int)
      if (code == 0UL)
      {
        return errno != 0 ? std::string(std::strerror(errno)) : std::string("unknown error");
      }
      char buf[256] = {0};
      ::ERR_error_string_n(code, buf, sizeof(buf));
      return std::string(buf);
    }

    SSL_CTX* clientContext()
    {
      std::lock_guard<std::mutex> lock(_mutex);
      if (_sslCtx)
      {
        return _sslCtx;
      }
      _sslCtx = ::SSL_CTX_new(TLS_client_method());
      if (!_sslCtx)
      {
        throw HttpException("SSL_CTX_new(client) failed: " + sslError());
      }
      ::SSL_CTX_set_min_proto_version(_sslCtx, TLS1_2_VERSION);
      if (_tlsConfig.verifyPeer)
      {
        ::SSL_CTX_set_verify(_sslCtx, SSL_VERIFY_PEER, nullptr);
        if (!_tlsConfig.caFile.empty())
        {
          if (::SSL_CTX_load_verify_locations(_sslCtx, _tlsConfig.caFile.c_str(), nullptr) != 1)
          {
            std::string err = sslError();
            ::SSL_CTX_free(_sslCtx);
            _sslCtx = nullptr;
            throw HttpException("client load CA failed: " + err);
          }
        }
        else
        {
          ::SSL_CTX_set_default_verify_paths(_sslCtx);
        }
      }
      return _sslCtx;
    }

    /// \brief Perform HTTP request with retry logic
    Response performRequest(const std::string& method, const std::string& url,
                            const std::string& body, const HttpHeaders& headers, int retries,
                            const LineCallback& onLine)
    {
      core::Logger::debug("HttpClient: " + method + " " + url +
                          " (body size: " + std::to_string(body.size()) + " bytes)");

      int attempt = 0;
      while (true)
      {
        bool delivered = false;
        try
        {
          auto response = executeRequest(method, url, body, headers, onLine, delivered);
          core::Logger::debug("HttpClient: Received " + std::to_string(response.statusCode) +
                              " response from " + url + " (body size: " +
                              std::to_string(response.body.size()) + " bytes)");
          return response;
        }
        catch (const HttpException& e)
        {
          if (attempt >= retries || delivered)
          {
            core::Logger::error("HttpClient: Request to " + url + " failed after " +
                                std::to_string(attempt + 1) + " attempts: " + e.what());
            throw;
          }

          core::Logger::debug("HttpClient: Retrying request to " + url + " (attempt " +
                              std::to_string(attempt + 1) + "/" + std::to_string(retries + 1) +
                              "): " + e.what());

          // Exponential backoff with jitter
          int backoffMs = (1 << attempt) * 100 + (std::rand() % 100);
          std::this_thread::sleep_for(std::chrono::milliseconds(backoffMs));
          attempt++;
        }
      }
    }

    /// \brief Execute single HTTP request
    Response executeRequest(const std::string& method, const std::string& url,
                            const std::string& body, const HttpHeaders& headers,
                            const LineCallback& onLine, bool& delivered)
    {
      auto parsedUrl = parseUrl(url);

      Connection conn;
      conn.open(parsedUrl, parsedUrl.isHttps() ? clientContext() : nullptr,
                _tlsConfig.verifyPeer, _config.connectTimeout, _config.requestTimeout);

      std::ostringstream request;
      request << method << " " << parsedUrl.getPathWithQuery() << " HTTP/1.1\r\n";
      request << "Host: " << parsedUrl.host;
      if (parsedUrl.port != (parsedUrl.isHttps() ? 443 : 80))
      {
        request << ":" << parsedUrl.port;
      }
      request << "\r\n";
      request << "User-Agent: " << _config.userAgent << "\r\n";
      request << "Connection: close\r\n";
      for (const auto& header : headers)
      {
        request << header.first << ": " << header.second << "\r\n";
      }
      if (!body.empty() || method == "POST")
      {
        request << "Content-Length: " << body.size() << "\r\n";
      }
      request << "\r\n";
      request << body;
      conn.sendAll(request.str());

      Reader reader(conn);
      Response response;
      parseStatusLine(reader.readLine(), response);
      while (true)
      {
        std::string line = reader.readLine();
        if (line.empty())
          break;
        auto colonPos = line.find(':');
        if (colonPos == std::string::npos)
          continue;
        std::string name = trim(line.substr(0, colonPos));
        std::string value = trim(line.substr(colonPos + 1));
        response.headers[name] = value;
      }

      BodySink sink(response, response.success() && onLine ? &onLine : nullptr,
                    _config.maxResponseSize);
      try
      {
        readBody(reader, response, sink);
      }
      catch (const HttpException&)
      {
        delivered = sink.delivered();
        throw;
      }
      sink.finish();
      delivered = sink.delivered();
      return response;
    }

    void readBody(Reader& reader, const Response& response, BodySink& sink) const
    {
      auto contentLengthIt = response.headers.find("Content-Length");
      auto transferEncodingIt = response.headers.find("Transfer-Encoding");
      bool chunked = transferEncodingIt != response.headers.end() &&
                     transferEncodingIt->second.find("chunked") != std::string::npos;

      if (chunked)
      {
        while (true)
        {
          std::string sizeLine = reader.readLine();
          std::size_t chunkSize = 0;
          try
          {
            chunkSize = std::stoul(sizeLine, nullptr, 16);
          }
          catch (const std::exception&)
          {
            throw HttpException("Invalid chunk size line: " + sizeLine);
          }
          if (chunkSize == 0)
          {
            // Trailers end with an empty line.
            while (!reader.readLine().empty())
            {
            }
            break;
          }
          sink.append(reader.readExact(chunkSize));
          reader.readLine();
        }
      }
      else if (contentLengthIt != response.headers.end())
      {
        std::size_t remaining = 0;
        try
        {
          remaining = std::stoul(contentLengthIt->second);
        }
        catch (const std::exception&)
        {
          throw HttpException("Invalid Content-Length: " + contentLengthIt->second);
        }
        while (remaining > 0)
        {
          std::string piece = reader.readSome();
          if (piece.empty())
          {
            throw HttpException("Connection closed before receiving complete HTTP response");
          }
          if (piece.size() > remaining)
            piece.resize(remaining);
          remaining -= piece.size();
          sink.append(piece);
        }
      }
      else
      {
        while (true)
        {
          std::string piece = reader.readSome();
          if (piece.empty())
            break;
          sink.append(piece);
        }
      }
    }

    static void parseStatusLine(const std::string& statusLine, Response& response)
    {
      std::regex statusRegex(R"(HTTP/\d\.\d\s+(\d+)\s*(.*))");
      std::smatch statusMatch;
      if (!std::regex_match(statusLine, statusMatch, statusRegex))
      {
        throw HttpException("Invalid HTTP status line: " + statusLine);
      }
      response.statusCode = std::stoi(statusMatch[1].str());
      response.statusText = statusMatch[2].str();
    }

    static std::string trim(const std::string& s)
    {
      auto begin = s.find_first_not_of(" \t");
      if (begin == std::string::npos)
        return std::string();
      auto end = s.find_last_not_of(" \t");
      return s.substr(begin, end - begin + 1);
    }
  };

} // namespace network
} // namespace dnschat
