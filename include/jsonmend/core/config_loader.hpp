// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Jsonmend, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <jsonmend/parsers/minimal_toml.hpp>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace jsonmend
{
namespace core
{
/// \brief Typed, dotted-key access to a TOML configuration file.
class ConfigLoader
{
public:
  /// \brief Loads \p filename immediately.
  /// \throws std::runtime_error when the file cannot be read or parsed.
  explicit ConfigLoader(const std::string &filename) : _filename(filename) { reload(); }

  /// \brief Wraps an already parsed table (used for in-memory configuration).
  explicit ConfigLoader(parsers::toml::table table) : _table(std::move(table)) {}

  /// \brief Build a loader from TOML text.
  static ConfigLoader fromString(const std::string &toml)
  {
    return ConfigLoader(parsers::toml::parse(toml));
  }

  /// \brief Re-reads the file. On failure the previous table is kept and the
  /// error is rethrown as std::runtime_error naming the file.
  void reload()
  {
    if (_filename.empty())
    {
      return;
    }
    try
    {
      _table = parsers::toml::parse_file(_filename);
    }
    catch (const std::exception &e)
    {
      throw std::runtime_error("Failed to load configuration file '" + _filename +
                               "': " + e.what());
    }
  }

  const std::string &filename() const { return _filename; }
  const parsers::toml::table &table() const { return _table; }

  template <typename T> std::optional<T> get(const std::string &dottedKey) const
  {
    auto node = _table.at_path(dottedKey);
    if (node && node.is_value())
    {
      return node.as<T>();
    }
    return std::nullopt;
  }

  std::optional<std::int64_t> getInt(const std::string &key) const
  {
    return get<std::int64_t>(key);
  }

  std::optional<bool> getBool(const std::string &key) const { return get<bool>(key); }

  std::optional<std::string> getString(const std::string &key) const
  {
    return get<std::string>(key);
  }

  /// \brief Gets an array of strings.
  /// \throws std::runtime_error if the key holds an array with a non-string element.
  std::optional<std::vector<std::string>> getStringArray(const std::string &key) const
  {
    auto node = _table.at_path(key);
    if (!node.is_array())
    {
      return std::nullopt;
    }
    std::vector<std::string> result;
    for (const auto &elem : *node.as_array())
    {
      auto *strVal = std::get_if<std::string>(&elem);
      if (!strVal)
      {
        throw std::runtime_error("ConfigLoader: array element at '" + key + "' is not a string");
      }
      result.push_back(*strVal);
    }
    return result;
  }

private:
  std::string _filename;
  parsers::toml::table _table;
};

} // namespace core
} // namespace jsonmend
