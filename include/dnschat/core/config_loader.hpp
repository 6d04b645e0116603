// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of dnschat, which is licensed under the Mozilla Public License 2.0.
// See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for details.

#pragma once

#include "dnschat/parsers/minimal_toml.hpp"
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace dnschat
{
namespace core
{
/// \brief Loads a TOML configuration file and exposes dotted-key lookups.
class ConfigLoader
{
public:
  /// \brief Constructs and loads a TOML configuration file.
  /// \throws std::runtime_error if the file cannot be read or parsed.
  explicit ConfigLoader(const std::string &filename) : _filename(filename) { load(); }

  /// \brief Builds a loader over in-memory TOML text (no backing file).
  static ConfigLoader fromString(const std::string &text)
  {
    return ConfigLoader(parsers::toml::parse(text));
  }

  /// \brief Reloads the configuration from disk, keeping the previous table
  /// on failure.
  bool reload()
  {
    if (_filename.empty())
    {
      return false;
    }
    try
    {
      _table = parsers::toml::parse_file(_filename);
      _lastError.clear();
      return true;
    }
    catch (const std::exception &e)
    {
      _lastError = e.what();
      return false;
    }
  }

  const parsers::toml::table &load()
  {
    if (!reload())
    {
      throw std::runtime_error("Failed to load configuration file: " + _filename +
                               (_lastError.empty() ? "" : " (" + _lastError + ")"));
    }
    return _table;
  }

  const parsers::toml::table &table() const { return _table; }

  const std::string &filename() const { return _filename; }

  /// \tparam T One of int64_t, double, bool, std::string.
  template <typename T> std::optional<T> get(const std::string &dottedKey) const
  {
    auto node = _table.at_path(dottedKey);
    if (node && node.is_value())
    {
      return node.as<T>();
    }
    return std::nullopt;
  }

  std::optional<int64_t> getInt(const std::string &key) const { return get<int64_t>(key); }

  std::optional<double> getDouble(const std::string &key) const { return get<double>(key); }

  std::optional<bool> getBool(const std::string &key) const { return get<bool>(key); }

  std::optional<std::string> getString(const std::string &key) const
  {
    return get<std::string>(key);
  }

  /// \throws std::runtime_error if the key is an array holding a non-string.
  std::optional<std::vector<std::string>> getStringArray(const std::string &key) const
  {
    auto node = _table.at_path(key);
    if (!node || !node.is_array())
    {
      return std::nullopt;
    }
    std::vector<std::string> result;
    for (const auto &elem : *node.as_array())
    {
      if (auto *strVal = std::get_if<std::string>(&elem))
      {
        result.push_back(*strVal);
      }
      else
      {
        throw std::runtime_error("ConfigLoader: Array element at '" + key + "' is not a string");
      }
    }
    return result;
  }

private:
  explicit ConfigLoader(parsers::toml::table table) : _table(std::move(table)) {}

  std::string _filename;
  std::string _lastError;
  parsers::toml::table _table;
};

} // namespace core
} // namespace dnschat
