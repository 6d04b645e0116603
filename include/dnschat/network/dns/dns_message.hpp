// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of dnschat, which is licensed under the Mozilla Public License 2.0.
// See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for details.

#pragma once

#include "dns_types.hpp"
#include <arpa/inet.h>
#include <cstring>
#include <random>
#include <sstream>
#include <stdexcept>
#include <unordered_set>

namespace dnschat
{
namespace network
{
namespace dns
{

/// \brief DNS parsing exceptions
class DnsParseException : public std::runtime_error
{
public:
  explicit DnsParseException(const std::string &message)
      : std::runtime_error("DNS Parse Error: " + message)
  {
  }
};

/// \brief DNS message parsing and construction utilities
class DnsMessage
{
public:
  /// \brief Parse DNS message from binary data
  /// \param data Binary DNS message data
  /// \param size Size of the data
  /// \return Parsed DNS result structure
  /// \throws DnsParseException on parsing errors
  static DnsResult parse(const std::uint8_t *data, std::size_t size);

  /// \brief Parse DNS message from vector
  /// \throws DnsParseException on parsing errors
  static DnsResult parse(const std::vector<std::uint8_t> &data)
  {
    return parse(data.data(), data.size());
  }

  /// \brief Parse only the 12-byte header
  /// \throws DnsParseException if fewer than 12 bytes are available
  static DnsHeader parseHeaderOnly(const std::uint8_t *data, std::size_t size)
  {
    DnsHeader header;
    parseHeader(data, 0, size, header);
    return header;
  }

  /// \brief Build DNS query message
  /// \param question DNS question to query
  /// \param id Query identifier (0 = auto-generate)
  /// \return Binary DNS query message
  static std::vector<std::uint8_t> buildQuery(const DnsQuestion &question, std::uint16_t id = 0);

  /// \brief Build an authoritative reply carrying one TXT answer.
  ///
  /// The question section of \p query is echoed. \p text is split into
  /// character-strings of at most 255 bytes; the answer owner name is a
  /// compression pointer to the first question.
  /// \throws DnsParseException if the query carries no question
  static std::vector<std::uint8_t> buildTxtResponse(const DnsResult &query,
                                                    const std::string &text,
                                                    std::uint32_t ttl = 0);

  /// \brief Build a reply with no answer records.
  static std::vector<std::uint8_t>
  buildEmptyResponse(const DnsResult &query,
                     DnsResponseCode rcode = DnsResponseCode::NOERROR);

  /// \brief Build a header-only reply (no question echoed) for queries whose
  /// question section could not be parsed.
  static std::vector<std::uint8_t> buildErrorResponse(const DnsHeader &queryHeader,
                                                      DnsResponseCode rcode);

  /// \brief Generate random query ID
  static std::uint16_t generateQueryId();

  /// \brief Encode domain name to DNS wire format
  /// \throws DnsParseException on a label over 63 bytes or a name over 255 wire bytes
  static std::vector<std::uint8_t> encodeName(const std::string &name);

  /// \brief Decode domain name from DNS wire format
  /// \param data Message data
  /// \param offset Starting offset
  /// \param size Total message size
  /// \param name Output domain name
  /// \return New offset after the name
  /// \throws DnsParseException on parsing errors
  static std::size_t decodeName(const std::uint8_t *data, std::size_t offset, std::size_t size,
                                std::string &name);

  /// \brief Split text into RFC 1035 character-strings (at most 255 bytes each).
  static std::vector<std::string> splitCharacterStrings(const std::string &text);

  /// \brief Decode the character-strings of a TXT record's RDATA.
  /// \throws DnsParseException on a string running past the RDATA
  static TxtRecord parseTxtRecord(const DnsResourceRecord &rr);

private:
  static std::size_t decodeNameWithLoopDetection(const std::uint8_t *data, std::size_t offset,
                                                 std::size_t size, std::string &name,
                                                 std::unordered_set<std::uint16_t> &visitedPointers);

  static std::size_t parseHeader(const std::uint8_t *data, std::size_t offset, std::size_t size,
                                 DnsHeader &header);

  static std::size_t parseQuestion(const std::uint8_t *data, std::size_t offset, std::size_t size,
                                   DnsQuestion &question);

  static std::size_t parseResourceRecord(const std::uint8_t *data, std::size_t offset,
                                         std::size_t size, DnsResourceRecord &rr);

  static void writeHeader(std::vector<std::uint8_t> &buffer, const DnsHeader &header);

  static void writeQuestion(std::vector<std::uint8_t> &buffer, const DnsQuestion &question);

  static DnsHeader responseHeaderFor(const DnsHeader &queryHeader, DnsResponseCode rcode);

  static void writeUint16(std::vector<std::uint8_t> &buffer, std::uint16_t value);

  static void writeUint32(std::vector<std::uint8_t> &buffer, std::uint32_t value);

  static std::uint16_t readUint16(const std::uint8_t *data, std::size_t offset);

  static std::uint32_t readUint32(const std::uint8_t *data, std::size_t offset);

  static void checkBounds(std::size_t offset, std::size_t needed, std::size_t total);

  static std::mt19937 &getRandomGenerator();
};

// ==================== Implementation ====================

inline std::uint16_t DnsMessage::generateQueryId()
{
  static std::uniform_int_distribution<std::uint16_t> dist(1, 65535);
  return dist(getRandomGenerator());
}

inline std::mt19937 &DnsMessage::getRandomGenerator()
{
  thread_local std::mt19937 gen(std::random_device{}());
  return gen;
}

inline void DnsMessage::writeUint16(std::vector<std::uint8_t> &buffer, std::uint16_t value)
{
  std::uint16_t netValue = htons(value);
  const std::uint8_t *bytes = reinterpret_cast<const std::uint8_t *>(&netValue);
  buffer.insert(buffer.end(), bytes, bytes + 2);
}

inline void DnsMessage::writeUint32(std::vector<std::uint8_t> &buffer, std::uint32_t value)
{
  std::uint32_t netValue = htonl(value);
  const std::uint8_t *bytes = reinterpret_cast<const std::uint8_t *>(&netValue);
  buffer.insert(buffer.end(), bytes, bytes + 4);
}

inline std::uint16_t DnsMessage::readUint16(const std::uint8_t *data, std::size_t offset)
{
  std::uint16_t netValue;
  std::memcpy(&netValue, data + offset, 2);
  return ntohs(netValue);
}

inline std::uint32_t DnsMessage::readUint32(const std::uint8_t *data, std::size_t offset)
{
  std::uint32_t netValue;
  std::memcpy(&netValue, data + offset, 4);
  return ntohl(netValue);
}

inline void DnsMessage::checkBounds(std::size_t offset, std::size_t needed, std::size_t total)
{
  if (offset + needed > total)
  {
    throw DnsParseException("Insufficient data at offset " + std::to_string(offset) + ", needed " +
                            std::to_string(needed) + ", total " + std::to_string(total));
  }
}

inline std::vector<std::uint8_t> DnsMessage::encodeName(const std::string &name)
{
  std::vector<std::uint8_t> encoded;

  if (name.empty() || name == ".")
  {
    encoded.push_back(0); // Root domain
    return encoded;
  }

  std::istringstream iss(name);
  std::string label;

  while (std::getline(iss, label, '.'))
  {
    if (label.empty())
      continue;

    if (label.length() > constants::DNS_MAX_LABEL_SIZE)
    {
      throw DnsParseException("Label too long: " + label + " (max " +
                              std::to_string(constants::DNS_MAX_LABEL_SIZE) + ")");
    }

    encoded.push_back(static_cast<std::uint8_t>(label.length()));
    encoded.insert(encoded.end(), label.begin(), label.end());
  }

  encoded.push_back(0); // Null terminator

  if (encoded.size() > constants::DNS_MAX_WIRE_NAME_SIZE)
  {
    throw DnsParseException("Domain name too long: " + name);
  }

  return encoded;
}

inline void DnsMessage::writeHeader(std::vector<std::uint8_t> &buffer, const DnsHeader &header)
{
  writeUint16(buffer, header.id);

  std::uint16_t flags = 0;
  if (header.qr)
    flags |= 0x8000;
  flags |= static_cast<std::uint16_t>((static_cast<std::uint16_t>(header.opcode) & 0x0F) << 11);
  if (header.aa)
    flags |= 0x0400;
  if (header.tc)
    flags |= 0x0200;
  if (header.rd)
    flags |= 0x0100;
  if (header.ra)
    flags |= 0x0080;
  flags |= static_cast<std::uint16_t>(static_cast<std::uint16_t>(header.rcode) & 0x0F);
  writeUint16(buffer, flags);

  writeUint16(buffer, header.qdcount);
  writeUint16(buffer, header.ancount);
  writeUint16(buffer, header.nscount);
  writeUint16(buffer, header.arcount);
}

inline void DnsMessage::writeQuestion(std::vector<std::uint8_t> &buffer,
                                      const DnsQuestion &question)
{
  auto encodedName = encodeName(question.qname);
  buffer.insert(buffer.end(), encodedName.begin(), encodedName.end());
  writeUint16(buffer, static_cast<std::uint16_t>(question.qtype));
  writeUint16(buffer, static_cast<std::uint16_t>(question.qclass));
}

inline DnsHeader DnsMessage::responseHeaderFor(const DnsHeader &queryHeader,
                                               DnsResponseCode rcode)
{
  DnsHeader header;
  header.id = queryHeader.id;
  header.qr = true;
  header.opcode = queryHeader.opcode;
  header.aa = true;
  header.rd = queryHeader.rd;
  header.ra = false;
  header.rcode = rcode;
  return header;
}

inline std::vector<std::uint8_t> DnsMessage::buildQuery(const DnsQuestion &question,
                                                        std::uint16_t id)
{
  std::vector<std::uint8_t> message;
  message.reserve(constants::DNS_HEADER_SIZE + question.qname.size() + 6);

  DnsHeader header;
  header.id = (id == 0) ? generateQueryId() : id;
  header.rd = true;
  header.qdcount = 1;
  writeHeader(message, header);
  writeQuestion(message, question);
  return message;
}

inline std::vector<std::string> DnsMessage::splitCharacterStrings(const std::string &text)
{
  std::vector<std::string> strings;
  if (text.empty())
  {
    strings.emplace_back();
    return strings;
  }
  for (std::size_t pos = 0; pos < text.size(); pos += constants::DNS_MAX_CHARACTER_STRING)
  {
    strings.push_back(text.substr(pos, constants::DNS_MAX_CHARACTER_STRING));
  }
  return strings;
}

inline std::vector<std::uint8_t> DnsMessage::buildTxtResponse(const DnsResult &query,
                                                              const std::string &text,
                                                              std::uint32_t ttl)
{
  if (query.questions.empty())
  {
    throw DnsParseException("Cannot answer a query without a question");
  }
  const DnsQuestion &question = query.questions.front();

  std::vector<std::uint8_t> rdata;
  for (const auto &piece : splitCharacterStrings(text))
  {
    rdata.push_back(static_cast<std::uint8_t>(piece.size()));
    rdata.insert(rdata.end(), piece.begin(), piece.end());
  }
  if (rdata.size() > 0xFFFF)
  {
    throw DnsParseException("TXT RDATA too large: " + std::to_string(rdata.size()) + " bytes");
  }

  std::vector<std::uint8_t> message;
  message.reserve(constants::DNS_HEADER_SIZE + question.qname.size() + rdata.size() + 32);

  DnsHeader header = responseHeaderFor(query.header, DnsResponseCode::NOERROR);
  header.qdcount = 1;
  header.ancount = 1;
  writeHeader(message, header);
  writeQuestion(message, question);

  // Owner name: pointer to the question name right after the header.
  writeUint16(message, static_cast<std::uint16_t>(0xC000 | constants::DNS_HEADER_SIZE));
  writeUint16(message, static_cast<std::uint16_t>(DnsType::TXT));
  writeUint16(message, static_cast<std::uint16_t>(DnsClass::IN));
  writeUint32(message, ttl);
  writeUint16(message, static_cast<std::uint16_t>(rdata.size()));
  message.insert(message.end(), rdata.begin(), rdata.end());
  return message;
}

inline std::vector<std::uint8_t> DnsMessage::buildEmptyResponse(const DnsResult &query,
                                                                DnsResponseCode rcode)
{
  std::vector<std::uint8_t> message;
  DnsHeader header = responseHeaderFor(query.header, rcode);
  header.qdcount = query.questions.empty() ? 0 : 1;
  writeHeader(message, header);
  if (!query.questions.empty())
  {
    writeQuestion(message, query.questions.front());
  }
  return message;
}

inline std::vector<std::uint8_t> DnsMessage::buildErrorResponse(const DnsHeader &queryHeader,
                                                                DnsResponseCode rcode)
{
  std::vector<std::uint8_t> message;
  writeHeader(message, responseHeaderFor(queryHeader, rcode));
  return message;
}

inline DnsResult DnsMessage::parse(const std::uint8_t *data, std::size_t size)
{
  if (size < constants::DNS_HEADER_SIZE)
  {
    throw DnsParseException("Message too short for DNS header: " + std::to_string(size) +
                            " bytes, minimum " + std::to_string(constants::DNS_HEADER_SIZE) +
                            " required");
  }

  DnsResult result;
  std::size_t offset = 0;

  offset = parseHeader(data, offset, size, result.header);

  result.questions.reserve(result.header.qdcount);
  for (std::uint16_t i = 0; i < result.header.qdcount; ++i)
  {
    DnsQuestion question;
    offset = parseQuestion(data, offset, size, question);
    result.questions.push_back(question);
  }

  // Authority and additional sections carry nothing the tunnel reads.
  result.answers.reserve(result.header.ancount);
  for (std::uint16_t i = 0; i < result.header.ancount; ++i)
  {
    DnsResourceRecord rr;
    offset = parseResourceRecord(data, offset, size, rr);
    if (rr.type == DnsType::TXT)
    {
      result.txt_records.push_back(parseTxtRecord(rr));
    }
    result.answers.push_back(std::move(rr));
  }

  return result;
}

inline std::size_t DnsMessage::parseHeader(const std::uint8_t *data, std::size_t offset,
                                           std::size_t size, DnsHeader &header)
{
  checkBounds(offset, constants::DNS_HEADER_SIZE, size);

  header.id = readUint16(data, offset);
  offset += 2;

  std::uint16_t flags = readUint16(data, offset);
  header.qr = (flags & 0x8000) != 0;
  header.opcode = static_cast<DnsOpcode>((flags >> 11) & 0x0F);
  header.aa = (flags & 0x0400) != 0;
  header.tc = (flags & 0x0200) != 0;
  header.rd = (flags & 0x0100) != 0;
  header.ra = (flags & 0x0080) != 0;
  header.z = static_cast<std::uint8_t>((flags >> 4) & 0x07);
  header.rcode = static_cast<DnsResponseCode>(flags & 0x0F);
  offset += 2;

  header.qdcount = readUint16(data, offset);
  offset += 2;
  header.ancount = readUint16(data, offset);
  offset += 2;
  header.nscount = readUint16(data, offset);
  offset += 2;
  header.arcount = readUint16(data, offset);
  offset += 2;

  return offset;
}

inline std::size_t DnsMessage::parseQuestion(const std::uint8_t *data, std::size_t offset,
                                             std::size_t size, DnsQuestion &question)
{
  offset = decodeName(data, offset, size, question.qname);

  checkBounds(offset, 4, size);
  question.qtype = static_cast<DnsType>(readUint16(data, offset));
  offset += 2;
  question.qclass = static_cast<DnsClass>(readUint16(data, offset));
  offset += 2;

  return offset;
}

inline std::size_t DnsMessage::parseResourceRecord(const std::uint8_t *data, std::size_t offset,
                                                   std::size_t size, DnsResourceRecord &rr)
{
  offset = decodeName(data, offset, size, rr.name);

  checkBounds(offset, 10, size);
  rr.type = static_cast<DnsType>(readUint16(data, offset));
  offset += 2;
  rr.cls = static_cast<DnsClass>(readUint16(data, offset));
  offset += 2;
  rr.ttl = readUint32(data, offset);
  offset += 4;
  std::uint16_t rdlength = readUint16(data, offset);
  offset += 2;

  checkBounds(offset, rdlength, size);
  rr.rdata.assign(data + offset, data + offset + rdlength);
  offset += rdlength;

  return offset;
}

inline TxtRecord DnsMessage::parseTxtRecord(const DnsResourceRecord &rr)
{
  TxtRecord txt(rr.name, {}, rr.ttl);
  txt.rdata = rr.rdata;

  std::size_t offset = 0;
  const std::size_t size = rr.rdata.size();
  while (offset < size)
  {
    std::uint8_t length = rr.rdata[offset++];
    checkBounds(offset, length, size);
    txt.text.emplace_back(reinterpret_cast<const char *>(rr.rdata.data() + offset), length);
    offset += length;
  }
  return txt;
}

inline std::size_t DnsMessage::decodeName(const std::uint8_t *data, std::size_t offset,
                                          std::size_t size, std::string &name)
{
  std::unordered_set<std::uint16_t> visitedPointers;
  return decodeNameWithLoopDetection(data, offset, size, name, visitedPointers);
}

inline std::size_t
DnsMessage::decodeNameWithLoopDetection(const std::uint8_t *data, std::size_t offset,
                                        std::size_t size, std::string &name,
                                        std::unordered_set<std::uint16_t> &visitedPointers)
{
  name.clear();
  std::size_t resumeOffset = 0;
  bool jumped = false;
  bool terminated = false;

  while (offset < size)
  {
    std::uint8_t length = data[offset];

    if ((length & constants::DNS_COMPRESSION_MASK) == constants::DNS_COMPRESSION_MASK)
    {
      checkBounds(offset, 2, size);
      if (!jumped)
      {
        resumeOffset = offset + 2;
        jumped = true;
      }

      std::uint16_t pointer = readUint16(data, offset) & constants::DNS_COMPRESSION_POINTER_MASK;
      if (pointer >= size)
      {
        throw DnsParseException("Invalid compression pointer: " + std::to_string(pointer) +
                                ", message size: " + std::to_string(size));
      }
      if (!visitedPointers.insert(pointer).second)
      {
        throw DnsParseException("Compression pointer loop detected at offset: " +
                                std::to_string(pointer));
      }

      offset = pointer;
      continue;
    }

    if ((length & constants::DNS_COMPRESSION_MASK) != 0)
    {
      throw DnsParseException("Reserved label type at offset " + std::to_string(offset));
    }

    if (length == 0)
    {
      offset++;
      terminated = true;
      break;
    }

    checkBounds(offset + 1, length, size);

    if (!name.empty())
    {
      name += ".";
    }
    name.append(reinterpret_cast<const char *>(data + offset + 1), length);
    offset += 1 + length;

    // 253 presentation characters is 255 wire bytes; anything longer cannot be echoed.
    if (name.size() > constants::DNS_MAX_NAME_SIZE)
    {
      throw DnsParseException("Decoded name exceeds " +
                              std::to_string(constants::DNS_MAX_NAME_SIZE) + " characters");
    }
  }

  if (!terminated)
  {
    throw DnsParseException("Unterminated domain name");
  }

  return jumped ? resumeOffset : offset;
}

} // namespace dns
} // namespace network
} // namespace dnschat
