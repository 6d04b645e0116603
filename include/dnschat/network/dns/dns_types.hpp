// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of dnschat, which is licensed under the Mozilla Public License 2.0.
// See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for details.

#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace dnschat
{
namespace network
{
namespace dns
{

/// \brief DNS message opcodes (RFC 1035)
enum class DnsOpcode : std::uint8_t
{
  Query = 0,        ///< Standard query
  IQuery = 1,       ///< Inverse query (obsolete)
  Status = 2        ///< Server status request
};

/// \brief DNS response codes (RFC 1035)
enum class DnsResponseCode : std::uint8_t
{
  NOERROR = 0,      ///< No error
  FORMERR = 1,      ///< Format error
  SERVFAIL = 2,     ///< Server failure
  NXDOMAIN = 3,     ///< Name does not exist
  NOTIMP = 4,       ///< Not implemented
  REFUSED = 5       ///< Query refused
};

/// \brief Record types the tunnel sees on the wire
enum class DnsType : std::uint16_t
{
  A = 1,            ///< IPv4 address
  CNAME = 5,        ///< Canonical name
  TXT = 16,         ///< Text record (tunnel payload carrier)
  AAAA = 28,        ///< IPv6 address
  OPT = 41,         ///< EDNS0 pseudo-record
  ANY = 255         ///< All records
};

/// \brief DNS record class (RFC 1035)
enum class DnsClass : std::uint16_t
{
  IN = 1,           ///< Internet class
  CH = 3,           ///< CHAOS class
  ANY = 255         ///< Any class
};

/// \brief DNS message flags and header structure
struct DnsHeader
{
  std::uint16_t id;                 ///< Query identifier
  bool qr;                          ///< Query/Response flag
  DnsOpcode opcode;                 ///< Operation code
  bool aa;                          ///< Authoritative answer
  bool tc;                          ///< Truncation flag
  bool rd;                          ///< Recursion desired
  bool ra;                          ///< Recursion available
  std::uint8_t z;                   ///< Reserved (must be zero)
  DnsResponseCode rcode;            ///< Response code
  std::uint16_t qdcount;            ///< Question count
  std::uint16_t ancount;            ///< Answer count
  std::uint16_t nscount;            ///< Authority count
  std::uint16_t arcount;            ///< Additional count

  DnsHeader()
    : id(0), qr(false), opcode(DnsOpcode::Query), aa(false), tc(false),
      rd(true), ra(false), z(0), rcode(DnsResponseCode::NOERROR),
      qdcount(0), ancount(0), nscount(0), arcount(0)
  {
  }
};

/// \brief DNS question section
struct DnsQuestion
{
  std::string qname;                ///< Domain name
  DnsType qtype;                    ///< Query type
  DnsClass qclass;                  ///< Query class

  DnsQuestion(const std::string &name = "", DnsType type = DnsType::TXT,
              DnsClass cls = DnsClass::IN)
    : qname(name), qtype(type), qclass(cls)
  {
  }
};

/// \brief Base DNS resource record
struct DnsResourceRecord
{
  std::string name;                 ///< Domain name
  DnsType type;                     ///< Record type
  DnsClass cls;                     ///< Record class
  std::uint32_t ttl;                ///< Time to live (seconds)
  std::vector<std::uint8_t> rdata;  ///< Resource data (raw)

  DnsResourceRecord(const std::string &n = "", DnsType t = DnsType::TXT,
                    DnsClass c = DnsClass::IN, std::uint32_t ttl_val = 0)
    : name(n), type(t), cls(c), ttl(ttl_val)
  {
  }
};

/// \brief TXT record: one or more character-strings
struct TxtRecord : public DnsResourceRecord
{
  std::vector<std::string> text;

  TxtRecord(const std::string &name = "",
            const std::vector<std::string> &txt = {},
            std::uint32_t ttl_val = 0)
    : DnsResourceRecord(name, DnsType::TXT, DnsClass::IN, ttl_val),
      text(txt)
  {
  }

  /// \brief Character-strings joined in order (RFC 7208 style).
  std::string joined() const
  {
    std::string out;
    for (const auto &s : text)
    {
      out += s;
    }
    return out;
  }
};

/// \brief Parsed DNS message
struct DnsResult
{
  DnsHeader header;
  std::vector<DnsQuestion> questions;
  std::vector<DnsResourceRecord> answers;
  std::vector<TxtRecord> txt_records;
};

namespace constants
{
  constexpr std::size_t DNS_HEADER_SIZE = 12;
  constexpr std::size_t DNS_MAX_LABEL_SIZE = 63;
  constexpr std::size_t DNS_MAX_NAME_SIZE = 253;
  constexpr std::size_t DNS_MAX_WIRE_NAME_SIZE = 255;
  constexpr std::size_t DNS_MAX_CHARACTER_STRING = 255;
  constexpr std::size_t DNS_MAX_UDP_MESSAGE = 65535;
  constexpr std::uint8_t DNS_COMPRESSION_MASK = 0xC0;
  constexpr std::uint16_t DNS_COMPRESSION_POINTER_MASK = 0x3FFF;
} // namespace constants

} // namespace dns
} // namespace network
} // namespace dnschat
