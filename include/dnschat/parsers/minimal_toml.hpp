// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of dnschat, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <cctype>
#include <cstdint>
#include <fstream>
#include <memory>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

namespace dnschat
{
namespace parsers
{
namespace toml
{

class table;
class array;

using value_type = std::variant<std::monostate, int64_t, double, bool, std::string,
                                std::shared_ptr<table>, std::shared_ptr<array>>;

/// \brief Raised for malformed TOML input; carries the 1-based line number.
class parse_error : public std::runtime_error
{
public:
  parse_error(const std::string &message, std::size_t line)
      : std::runtime_error("TOML parse error at line " + std::to_string(line) + ": " + message),
        _line(line)
  {
  }

  std::size_t line() const { return _line; }

private:
  std::size_t _line;
};

class array
{
public:
  using container_type = std::vector<value_type>;
  using const_iterator = container_type::const_iterator;

  void push_back(value_type &&val) { _values.push_back(std::move(val)); }

  size_t size() const { return _values.size(); }
  bool empty() const { return _values.empty(); }

  const_iterator begin() const { return _values.begin(); }
  const_iterator end() const { return _values.end(); }

  const value_type &operator[](size_t idx) const { return _values[idx]; }

private:
  container_type _values;
};

class node
{
public:
  node() = default;
  node(value_type val) : _value(std::move(val)) {}

  bool is_value() const
  {
    return !std::holds_alternative<std::monostate>(_value) && !is_table() && !is_array();
  }
  bool is_string() const { return std::holds_alternative<std::string>(_value); }
  bool is_integer() const { return std::holds_alternative<int64_t>(_value); }
  bool is_floating_point() const { return std::holds_alternative<double>(_value); }
  bool is_boolean() const { return std::holds_alternative<bool>(_value); }
  bool is_array() const { return std::holds_alternative<std::shared_ptr<array>>(_value); }
  bool is_table() const { return std::holds_alternative<std::shared_ptr<table>>(_value); }

  /// \brief Typed view of a scalar; integers widen to double on request.
  template <typename T> std::optional<T> as() const
  {
    if constexpr (std::is_same_v<T, int64_t>)
    {
      if (auto *val = std::get_if<int64_t>(&_value))
        return *val;
    }
    else if constexpr (std::is_same_v<T, double>)
    {
      if (auto *val = std::get_if<double>(&_value))
        return *val;
      if (auto *val = std::get_if<int64_t>(&_value))
        return static_cast<double>(*val);
    }
    else if constexpr (std::is_same_v<T, bool>)
    {
      if (auto *val = std::get_if<bool>(&_value))
        return *val;
    }
    else if constexpr (std::is_same_v<T, std::string>)
    {
      if (auto *val = std::get_if<std::string>(&_value))
        return *val;
    }
    return std::nullopt;
  }

  const array *as_array() const
  {
    if (auto *val = std::get_if<std::shared_ptr<array>>(&_value))
      return val->get();
    return nullptr;
  }

  table *as_table()
  {
    if (auto *val = std::get_if<std::shared_ptr<table>>(&_value))
      return val->get();
    return nullptr;
  }

  const table *as_table() const
  {
    if (auto *val = std::get_if<std::shared_ptr<table>>(&_value))
      return val->get();
    return nullptr;
  }

  explicit operator bool() const { return !std::holds_alternative<std::monostate>(_value); }

private:
  value_type _value;
};

inline std::vector<std::string> split_path(const std::string &dottedPath)
{
  std::vector<std::string> parts;
  std::stringstream ss(dottedPath);
  std::string part;
  while (std::getline(ss, part, '.'))
  {
    if (!part.empty())
      parts.push_back(part);
  }
  return parts;
}

class table
{
public:
  using container_type = std::unordered_map<std::string, node>;
  using const_iterator = container_type::const_iterator;

  bool contains(const std::string &key) const { return _values.find(key) != _values.end(); }
  bool empty() const { return _values.empty(); }
  size_t size() const { return _values.size(); }

  node &operator[](const std::string &key) { return _values[key]; }

  /// \brief Walk a dotted path through nested tables; empty node when absent.
  node at_path(const std::string &dottedPath) const
  {
    auto parts = split_path(dottedPath);
    if (parts.empty())
      return node();

    const table *current = this;
    for (size_t i = 0; i < parts.size(); ++i)
    {
      auto it = current->_values.find(parts[i]);
      if (it == current->_values.end())
        return node();
      if (i == parts.size() - 1)
        return it->second;
      current = it->second.as_table();
      if (!current)
        return node();
    }
    return node();
  }

  const_iterator begin() const { return _values.begin(); }
  const_iterator end() const { return _values.end(); }

  void insert(const std::string &key, node value) { _values[key] = std::move(value); }

private:
  container_type _values;
};

/// \brief Parser for the TOML subset used by dnschat configuration files:
/// [section] and [a.b] headers, bare/dotted keys, strings, integers, floats,
/// booleans, arrays and # comments.
class parser
{
public:
  explicit parser(const std::string &input) : _input(input), _pos(0), _line(1) {}

  table parse()
  {
    table root;
    table *currentTable = &root;

    while (true)
    {
      skipWhitespaceAndComments();
      if (isEnd())
        break;

      if (peek() == '[')
      {
        currentTable = ensureTable(&root, split_path(parseSection()));
      }
      else
      {
        auto keyPath = split_path(parseKey());
        if (keyPath.empty())
          fail("Expected key");
        skipWhitespace();
        if (peek() != '=')
          fail("Expected '=' after key");
        advance();
        skipWhitespace();

        std::string leaf = keyPath.back();
        keyPath.pop_back();
        table *target = ensureTable(currentTable, keyPath);
        if (target->contains(leaf))
          fail("Duplicate key: " + leaf);
        target->insert(leaf, node(parseValue()));
      }

      skipWhitespace();
      if (peek() == '#')
        skipComment();
      if (!isEnd() && peek() != '\n' && peek() != '\r')
        fail("Unexpected trailing characters");
    }
    return root;
  }

private:
  std::string _input;
  size_t _pos;
  size_t _line;

  [[noreturn]] void fail(const std::string &message) const { throw parse_error(message, _line); }

  bool isEnd() const { return _pos >= _input.size(); }
  char peek() const { return isEnd() ? '\0' : _input[_pos]; }
  char advance()
  {
    if (isEnd())
      return '\0';
    char c = _input[_pos++];
    if (c == '\n')
      ++_line;
    return c;
  }

  void skipWhitespace()
  {
    while (!isEnd() && (peek() == ' ' || peek() == '\t'))
      advance();
  }

  void skipComment()
  {
    while (!isEnd() && peek() != '\n')
      advance();
  }

  void skipWhitespaceAndComments()
  {
    while (!isEnd())
    {
      if (std::isspace(static_cast<unsigned char>(peek())))
        advance();
      else if (peek() == '#')
        skipComment();
      else
        break;
    }
  }

  std::string parseSection()
  {
    advance(); // '['
    std::string section;
    while (!isEnd() && peek() != ']' && peek() != '\n')
    {
      char c = advance();
      if (c != ' ' && c != '\t')
        section += c;
    }
    if (peek() != ']')
      fail("Unterminated section header");
    advance();
    if (section.empty())
      fail("Empty section header");
    return section;
  }

  std::string parseKey()
  {
    std::string key;
    while (!isEnd())
    {
      char c = peek();
      if (std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '-' || c == '.')
        key += advance();
      else
        break;
    }
    return key;
  }

  value_type parseValue()
  {
    skipWhitespace();
    char c = peek();

    if (c == '"' || c == '\'')
      return parseString();
    if (c == '[')
      return parseArray();
    if (c == 't' || c == 'f')
      return parseBool();
    if (c == '+' || c == '-' || std::isdigit(static_cast<unsigned char>(c)))
      return parseNumber();
    fail("Invalid value");
  }

  std::string parseString()
  {
    char quote = advance();
    std::string str;
    while (!isEnd() && peek() != quote && peek() != '\n')
    {
      // Single-quoted strings are literal.
      if (quote == '"' && peek() == '\\')
      {
        advance();
        char c = advance();
        switch (c)
        {
        case 'n':
          str += '\n';
          break;
        case 't':
          str += '\t';
          break;
        case 'r':
          str += '\r';
          break;
        case '\\':
          str += '\\';
          break;
        case '"':
          str += '"';
          break;
        default:
          fail(std::string("Invalid escape sequence: \\") + c);
        }
      }
      else
      {
        str += advance();
      }
    }
    if (peek() != quote)
      fail("Unterminated string");
    advance();
    return str;
  }

  value_type parseArray()
  {
    advance(); // '['
    auto arr = std::make_shared<array>();
    skipWhitespaceAndComments();

    while (!isEnd() && peek() != ']')
    {
      arr->push_back(parseValue());
      skipWhitespaceAndComments();
      if (peek() == ',')
      {
        advance();
        skipWhitespaceAndComments();
      }
      else if (peek() != ']')
      {
        fail("Expected ',' or ']' in array");
      }
    }

    if (peek() != ']')
      fail("Unterminated array");
    advance();
    return arr;
  }

  value_type parseBool()
  {
    std::string word;
    while (!isEnd() && std::isalpha(static_cast<unsigned char>(peek())))
      word += advance();

    if (word == "true")
      return true;
    if (word == "false")
      return false;
    fail("Invalid boolean value: " + word);
  }

  value_type parseNumber()
  {
    std::string num;
    bool isFloat = false;

    if (peek() == '+' || peek() == '-')
      num += advance();

    while (!isEnd())
    {
      char c = peek();
      if (c == '_')
      {
        advance();
        continue;
      }
      if (c == '.' || c == 'e' || c == 'E')
        isFloat = true;
      else if (!std::isdigit(static_cast<unsigned char>(c)) &&
               !((c == '+' || c == '-') && !num.empty() &&
                 (num.back() == 'e' || num.back() == 'E')))
        break;
      num += advance();
    }

    try
    {
      std::size_t used = 0;
      if (isFloat)
      {
        double d = std::stod(num, &used);
        if (used != num.size())
          fail("Invalid number: " + num);
        return d;
      }
      long long i = std::stoll(num, &used);
      if (used != num.size())
        fail("Invalid number: " + num);
      return static_cast<int64_t>(i);
    }
    catch (const std::logic_error &)
    {
      fail("Invalid number: " + num);
    }
  }

  table *ensureTable(table *root, const std::vector<std::string> &parts)
  {
    table *current = root;
    for (const auto &key : parts)
    {
      if (!current->contains(key))
      {
        current->insert(key, node(std::make_shared<table>()));
      }
      current = (*current)[key].as_table();
      if (!current)
        fail("Key is not a table: " + key);
    }
    return current;
  }
};

inline table parse(const std::string &tomlString)
{
  parser p(tomlString);
  return p.parse();
}

inline table parse_file(const std::string &filename)
{
  std::ifstream file(filename);
  if (!file.is_open())
    throw std::runtime_error("Cannot open file: " + filename);

  std::stringstream buffer;
  buffer << file.rdbuf();
  return parse(buffer.str());
}

} // namespace toml
} // namespace parsers
} // namespace dnschat
