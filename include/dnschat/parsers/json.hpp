// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of dnschat, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once
/// \file json.hpp
/// \brief JSON value, parser, and serializer used for backend payloads and
/// the server-info reply.
///
/// - DOM-like \c Json value: null, bool, int64, double, string, array, object
/// - Non-throwing parse with line/column errors, plus parseOrThrow
/// - \uXXXX escapes (including surrogate pairs) are decoded to UTF-8
/// - Object key order is not preserved; use sortKeys for stable output

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <unordered_map>
#include <utility>
#include <variant>
#include <vector>

namespace dnschat
{
namespace parsers
{
enum class JsonType
{
  Null,
  Boolean,
  Int,
  Double,
  String,
  Array,
  Object
};

struct JsonLocation
{
  std::size_t offset{0};
  std::size_t line{1};
  std::size_t column{1};
};

struct JsonError
{
  std::string message;
  JsonLocation where;
};

/// \brief Parse limits to prevent resource exhaustion.
struct ParseLimits
{
  std::size_t arrayItemsMax{10000};
  std::size_t membersMax{10000};
  std::size_t depthMax{64};
  std::size_t stringLengthMax{4 * 1024 * 1024};
};

struct SerializeOptions
{
  bool pretty{false};
  bool sortKeys{false};
  std::string indent{"  "};
};

struct ParseResult;

class Json
{
public:
  using Array = std::vector<Json>;
  using Object = std::unordered_map<std::string, Json>;

  Json() : _value(nullptr) {}
  Json(std::nullptr_t) : _value(nullptr) {}
  Json(bool b) : _value(b) {}
  template <typename T,
            std::enable_if_t<std::is_integral_v<T> && !std::is_same_v<T, bool>, int> = 0>
  Json(T i) : _value(static_cast<std::int64_t>(i))
  {
  }
  Json(double d) : _value(d) {}
  Json(const char *s) : _value(std::string(s)) {}
  Json(const std::string &s) : _value(s) {}
  Json(std::string &&s) : _value(std::move(s)) {}
  Json(Array a) : _value(std::move(a)) {}
  Json(Object o) : _value(std::move(o)) {}

  static Json object() { return Json(Object{}); }
  static Json array() { return Json(Array{}); }

  JsonType type() const { return static_cast<JsonType>(_value.index()); }

  bool isNull() const { return std::holds_alternative<std::nullptr_t>(_value); }
  bool isBool() const { return std::holds_alternative<bool>(_value); }
  bool isInt() const { return std::holds_alternative<std::int64_t>(_value); }
  bool isDouble() const { return std::holds_alternative<double>(_value); }
  bool isNumber() const { return isInt() || isDouble(); }
  bool isString() const { return std::holds_alternative<std::string>(_value); }
  bool isArray() const { return std::holds_alternative<Array>(_value); }
  bool isObject() const { return std::holds_alternative<Object>(_value); }

  bool getBool() const { return std::get<bool>(_value); }
  std::int64_t getInt() const { return std::get<std::int64_t>(_value); }
  double getDouble() const
  {
    if (isInt())
      return static_cast<double>(getInt());
    return std::get<double>(_value);
  }
  const std::string &getString() const { return std::get<std::string>(_value); }
  const Array &getArray() const { return std::get<Array>(_value); }
  const Object &getObject() const { return std::get<Object>(_value); }
  Array &getArray() { return std::get<Array>(_value); }
  Object &getObject() { return std::get<Object>(_value); }

  /// \brief String member or \p fallback when absent or not a string.
  std::string stringOr(const std::string &key, const std::string &fallback = "") const
  {
    const Json &v = (*this)[key];
    return v.isString() ? v.getString() : fallback;
  }

  Json &operator[](const std::string &key)
  {
    if (!isObject())
    {
      _value = Object{};
    }
    return getObject()[key];
  }

  Json &operator[](const char *key) { return operator[](std::string(key)); }

  const Json &operator[](const std::string &key) const
  {
    static const Json nullJson;
    if (!isObject())
    {
      return nullJson;
    }
    auto it = getObject().find(key);
    return (it != getObject().end()) ? it->second : nullJson;
  }

  const Json &operator[](const char *key) const { return operator[](std::string(key)); }

  /// \brief Array element or null when out of range.
  const Json &at(std::size_t index) const
  {
    static const Json nullJson;
    if (!isArray() || index >= getArray().size())
    {
      return nullJson;
    }
    return getArray()[index];
  }

  bool contains(const std::string &key) const
  {
    return isObject() && getObject().find(key) != getObject().end();
  }

  std::size_t size() const
  {
    if (isArray())
      return getArray().size();
    if (isObject())
      return getObject().size();
    if (isString())
      return getString().size();
    return 0;
  }

  void push_back(Json val)
  {
    if (!isArray())
    {
      _value = Array{};
    }
    getArray().push_back(std::move(val));
  }

  std::string serialize(const SerializeOptions &options = {}) const
  {
    std::string out;
    serializeTo(out, options, 0);
    return out;
  }

  std::string dump(bool sortKeys = false) const
  {
    SerializeOptions opts;
    opts.sortKeys = sortKeys;
    return serialize(opts);
  }

  static ParseResult parse(std::string_view text, const ParseLimits &limits = ParseLimits{});

  /// \throws std::runtime_error carrying the parser message and location.
  static Json parseOrThrow(std::string_view text, const ParseLimits &limits = ParseLimits{});

  static std::string escape(const std::string &str)
  {
    std::string result = "\"";
    for (char c : str)
    {
      switch (c)
      {
      case '"':
        result += "\\\"";
        break;
      case '\\':
        result += "\\\\";
        break;
      case '\b':
        result += "\\b";
        break;
      case '\f':
        result += "\\f";
        break;
      case '\n':
        result += "\\n";
        break;
      case '\r':
        result += "\\r";
        break;
      case '\t':
        result += "\\t";
        break;
      default:
        if (static_cast<unsigned char>(c) < 32)
        {
          char buf[8];
          std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned char>(c));
          result += buf;
        }
        else
        {
          result += c;
        }
      }
    }
    result += "\"";
    return result;
  }

private:
  std::variant<std::nullptr_t, bool, std::int64_t, double, std::string, Array, Object> _value;

  void serializeTo(std::string &out, const SerializeOptions &options, int depth) const
  {
    auto newline = [&](int level)
    {
      if (!options.pretty)
        return;
      out += '\n';
      for (int j = 0; j < level; ++j)
        out += options.indent;
    };

    switch (type())
    {
    case JsonType::Null:
      out += "null";
      break;
    case JsonType::Boolean:
      out += getBool() ? "true" : "false";
      break;
    case JsonType::Int:
      out += std::to_string(getInt());
      break;
    case JsonType::Double:
    {
      char buf[32];
      std::snprintf(buf, sizeof(buf), "%.15g", std::get<double>(_value));
      out += buf;
      break;
    }
    case JsonType::String:
      out += escape(getString());
      break;
    case JsonType::Array:
    {
      const auto &arr = getArray();
      out += '[';
      for (std::size_t i = 0; i < arr.size(); ++i)
      {
        newline(depth + 1);
        arr[i].serializeTo(out, options, depth + 1);
        if (i + 1 < arr.size())
          out += ',';
      }
      if (!arr.empty())
        newline(depth);
      out += ']';
      break;
    }
    case JsonType::Object:
    {
      const auto &obj = getObject();
      std::vector<const std::string *> keys;
      keys.reserve(obj.size());
      for (const auto &pair : obj)
      {
        keys.push_back(&pair.first);
      }
      if (options.sortKeys)
      {
        std::sort(keys.begin(), keys.end(),
                  [](const std::string *a, const std::string *b) { return *a < *b; });
      }
      out += '{';
      for (std::size_t i = 0; i < keys.size(); ++i)
      {
        newline(depth + 1);
        out += escape(*keys[i]);
        out += options.pretty ? ": " : ":";
        obj.at(*keys[i]).serializeTo(out, options, depth + 1);
        if (i + 1 < keys.size())
          out += ',';
      }
      if (!keys.empty())
        newline(depth);
      out += '}';
      break;
    }
    }
  }
};

/// \brief Result of a non-throwing parse operation.
struct ParseResult
{
  Json value;
  bool ok{false};
  JsonError error;
};

class JsonParser
{
public:
  JsonParser(std::string_view text, const ParseLimits &limits) : _text(text), _limits(limits) {}

  ParseResult parse()
  {
    ParseResult result;
    _skipWhitespace();
    if (_parseValue(result.value, 0))
    {
      _skipWhitespace();
      if (_pos < _text.size())
      {
        _error = "Extra characters after JSON value";
      }
      else
      {
        result.ok = true;
        return result;
      }
    }
    result.value = Json();
    result.error.message = _error.empty() ? "Parse error" : _error;
    result.error.where = _location();
    return result;
  }

private:
  std::string_view _text;
  std::size_t _pos{0};
  ParseLimits _limits;
  std::string _error;

  JsonLocation _location() const
  {
    JsonLocation loc;
    loc.offset = _pos;
    for (std::size_t i = 0; i < _pos && i < _text.size(); ++i)
    {
      if (_text[i] == '\n')
      {
        ++loc.line;
        loc.column = 1;
      }
      else
      {
        ++loc.column;
      }
    }
    return loc;
  }

  bool _fail(const char *message)
  {
    _error = message;
    return false;
  }

  void _skipWhitespace()
  {
    while (_pos < _text.size() && std::isspace(static_cast<unsigned char>(_text[_pos])))
    {
      ++_pos;
    }
  }

  bool _literal(std::string_view word)
  {
    if (_text.substr(_pos, word.size()) == word)
    {
      _pos += word.size();
      return true;
    }
    return false;
  }

  bool _parseValue(Json &out, std::size_t depth)
  {
    if (depth > _limits.depthMax)
    {
      return _fail("Maximum nesting depth exceeded");
    }
    _skipWhitespace();
    if (_pos >= _text.size())
    {
      return _fail("Unexpected end of input");
    }

    char c = _text[_pos];
    switch (c)
    {
    case 'n':
      out = Json();
      return _literal("null") || _fail("Invalid null literal");
    case 't':
      out = Json(true);
      return _literal("true") || _fail("Invalid boolean literal");
    case 'f':
      out = Json(false);
      return _literal("false") || _fail("Invalid boolean literal");
    case '"':
    {
      std::string str;
      if (!_parseString(str))
        return false;
      out = Json(std::move(str));
      return true;
    }
    case '[':
      return _parseArray(out, depth);
    case '{':
      return _parseObject(out, depth);
    default:
      if (c == '-' || std::isdigit(static_cast<unsigned char>(c)))
        return _parseNumber(out);
      return _fail("Unexpected character");
    }
  }

  bool _digits()
  {
    std::size_t start = _pos;
    while (_pos < _text.size() && std::isdigit(static_cast<unsigned char>(_text[_pos])))
    {
      ++_pos;
    }
    return _pos > start;
  }

  bool _parseNumber(Json &out)
  {
    std::size_t start = _pos;
    if (_text[_pos] == '-')
      ++_pos;
    if (!_digits())
      return _fail("Invalid number format");

    bool isDouble = false;
    if (_pos < _text.size() && _text[_pos] == '.')
    {
      isDouble = true;
      ++_pos;
      if (!_digits())
        return _fail("Invalid number format");
    }
    if (_pos < _text.size() && (_text[_pos] == 'e' || _text[_pos] == 'E'))
    {
      isDouble = true;
      ++_pos;
      if (_pos < _text.size() && (_text[_pos] == '+' || _text[_pos] == '-'))
        ++_pos;
      if (!_digits())
        return _fail("Invalid number format");
    }

    std::string_view numStr = _text.substr(start, _pos - start);
    if (!isDouble)
    {
      std::int64_t i = 0;
      auto res = std::from_chars(numStr.data(), numStr.data() + numStr.size(), i);
      if (res.ec == std::errc{})
      {
        out = Json(i);
        return true;
      }
    }
    out = Json(std::strtod(std::string(numStr).c_str(), nullptr));
    return true;
  }

  static void _appendUtf8(std::string &out, std::uint32_t cp)
  {
    if (cp < 0x80)
    {
      out += static_cast<char>(cp);
    }
    else if (cp < 0x800)
    {
      out += static_cast<char>(0xC0 | (cp >> 6));
      out += static_cast<char>(0x80 | (cp & 0x3F));
    }
    else if (cp < 0x10000)
    {
      out += static_cast<char>(0xE0 | (cp >> 12));
      out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
      out += static_cast<char>(0x80 | (cp & 0x3F));
    }
    else
    {
      out += static_cast<char>(0xF0 | (cp >> 18));
      out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
      out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
      out += static_cast<char>(0x80 | (cp & 0x3F));
    }
  }

  bool _hex4(std::uint32_t &cp)
  {
    if (_pos + 4 > _text.size())
      return false;
    cp = 0;
    for (int i = 0; i < 4; ++i)
    {
      char h = _text[_pos++];
      cp <<= 4;
      if (h >= '0' && h <= '9')
        cp |= static_cast<std::uint32_t>(h - '0');
      else if (h >= 'a' && h <= 'f')
        cp |= static_cast<std::uint32_t>(h - 'a' + 10);
      else if (h >= 'A' && h <= 'F')
        cp |= static_cast<std::uint32_t>(h - 'A' + 10);
      else
        return false;
    }
    return true;
  }

  bool _parseString(std::string &str)
  {
    ++_pos; // opening quote
    while (_pos < _text.size() && _text[_pos] != '"')
    {
      if (str.size() > _limits.stringLengthMax)
        return _fail("String length exceeds limit");

      char c = _text[_pos++];
      if (static_cast<unsigned char>(c) < 0x20)
        return _fail("Control character in string");
      if (c != '\\')
      {
        str += c;
        continue;
      }
      if (_pos >= _text.size())
        return _fail("Unexpected end of string");

      char e = _text[_pos++];
      switch (e)
      {
      case '"':
        str += '"';
        break;
      case '\\':
        str += '\\';
        break;
      case '/':
        str += '/';
        break;
      case 'b':
        str += '\b';
        break;
      case 'f':
        str += '\f';
        break;
      case 'n':
        str += '\n';
        break;
      case 'r':
        str += '\r';
        break;
      case 't':
        str += '\t';
        break;
      case 'u':
      {
        std::uint32_t cp = 0;
        if (!_hex4(cp))
          return _fail("Invalid unicode escape");
        if (cp >= 0xD800 && cp <= 0xDBFF)
        {
          std::uint32_t low = 0;
          if (_pos + 2 > _text.size() || _text[_pos] != '\\' || _text[_pos + 1] != 'u')
            return _fail("Unpaired surrogate in unicode escape");
          _pos += 2;
          if (!_hex4(low) || low < 0xDC00 || low > 0xDFFF)
            return _fail("Invalid low surrogate in unicode escape");
          cp = 0x10000 + ((cp - 0xD800) << 10) + (low - 0xDC00);
        }
        _appendUtf8(str, cp);
        break;
      }
      default:
        return _fail("Invalid escape sequence");
      }
    }
    if (_pos >= _text.size())
      return _fail("Unterminated string");
    ++_pos; // closing quote
    return true;
  }

  bool _parseArray(Json &out, std::size_t depth)
  {
    ++_pos; // '['
    Json::Array arr;
    _skipWhitespace();
    if (_pos < _text.size() && _text[_pos] == ']')
    {
      ++_pos;
      out = Json(std::move(arr));
      return true;
    }

    while (true)
    {
      if (arr.size() >= _limits.arrayItemsMax)
        return _fail("Array size exceeds limit");

      Json element;
      if (!_parseValue(element, depth + 1))
        return false;
      arr.push_back(std::move(element));

      _skipWhitespace();
      if (_pos >= _text.size())
        return _fail("Unexpected end of array");
      if (_text[_pos] == ']')
      {
        ++_pos;
        break;
      }
      if (_text[_pos] != ',')
        return _fail("Expected ',' or ']'");
      ++_pos;
    }
    out = Json(std::move(arr));
    return true;
  }

  bool _parseObject(Json &out, std::size_t depth)
  {
    ++_pos; // '{'
    Json::Object obj;
    _skipWhitespace();
    if (_pos < _text.size() && _text[_pos] == '}')
    {
      ++_pos;
      out = Json(std::move(obj));
      return true;
    }

    while (true)
    {
      if (obj.size() >= _limits.membersMax)
        return _fail("Object size exceeds limit");

      _skipWhitespace();
      if (_pos >= _text.size() || _text[_pos] != '"')
        return _fail("Expected string key");
      std::string key;
      if (!_parseString(key))
        return false;

      _skipWhitespace();
      if (_pos >= _text.size() || _text[_pos] != ':')
        return _fail("Expected ':'");
      ++_pos;

      Json value;
      if (!_parseValue(value, depth + 1))
        return false;
      obj[key] = std::move(value);

      _skipWhitespace();
      if (_pos >= _text.size())
        return _fail("Unexpected end of object");
      if (_text[_pos] == '}')
      {
        ++_pos;
        break;
      }
      if (_text[_pos] != ',')
        return _fail("Expected ',' or '}'");
      ++_pos;
    }
    out = Json(std::move(obj));
    return true;
  }
};

inline ParseResult Json::parse(std::string_view text, const ParseLimits &limits)
{
  JsonParser parser(text, limits);
  return parser.parse();
}

inline Json Json::parseOrThrow(std::string_view text, const ParseLimits &limits)
{
  auto result = parse(text, limits);
  if (!result.ok)
  {
    throw std::runtime_error("JSON parse error at line " + std::to_string(result.error.where.line) +
                             ", column " + std::to_string(result.error.where.column) + ": " +
                             result.error.message);
  }
  return std::move(result.value);
}

} // namespace parsers
} // namespace dnschat
