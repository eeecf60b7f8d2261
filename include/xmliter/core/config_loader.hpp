// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Xmliter, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <xmliter/core/logger.hpp>
#include <xmliter/parsers/minimal_toml.hpp>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>

namespace xmliter
{
namespace core
{
/// \brief Loads a TOML configuration file and exposes typed dotted-key lookups.
class ConfigLoader
{
public:
  /// \brief Loads filename; throws std::runtime_error if it is missing or
  /// malformed.
  explicit ConfigLoader(const std::string &filename) : _filename(filename) { load(); }

  /// \brief Re-reads the file. On failure the previous table is kept and the
  /// error is logged.
  bool reload()
  {
    try
    {
      _table = parsers::toml::parse_file(_filename);
      _loaded = true;
      return true;
    }
    catch (const std::exception &e)
    {
      XMLITER_LOG_WARN("ConfigLoader: failed to load '" << _filename << "': " << e.what());
      return false;
    }
  }

  const parsers::toml::table &load()
  {
    if (!_loaded && !reload())
    {
      throw std::runtime_error("Failed to load configuration file: " + _filename);
    }
    return _table;
  }

  bool isLoaded() const { return _loaded; }

  const std::string &filename() const { return _filename; }

  const parsers::toml::table &table() const { return _table; }

  /// \brief Gets a typed value from the configuration.
  /// \tparam T int64_t, bool or std::string
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

  std::optional<bool> getBool(const std::string &key) const { return get<bool>(key); }

  std::optional<std::string> getString(const std::string &key) const
  {
    return get<std::string>(key);
  }

  /// \brief Gets a non-negative integer as std::size_t.
  /// \throws std::runtime_error if the value is negative.
  std::optional<std::size_t> getSize(const std::string &key) const
  {
    auto v = getInt(key);
    if (!v)
    {
      return std::nullopt;
    }
    if (*v < 0)
    {
      throw std::runtime_error("ConfigLoader: '" + key + "' must not be negative");
    }
    return static_cast<std::size_t>(*v);
  }

private:
  std::string _filename;
  parsers::toml::table _table;
  bool _loaded{false};
};

} // namespace core
} // namespace xmliter
