// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Xmliter, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <xmliter/core/config_loader.hpp>
#include <xmliter/core/logger.hpp>
#include <xmliter/options.hpp>
#include <cstdint>
#include <optional>
#include <string>

namespace xmliter
{

/// \brief Settings read from a TOML file. Unset keys keep the library
/// defaults.
///
/// \code
/// [reader]
/// buffer_size = 65536
/// max_depth = 256
/// trim_text = false
/// encoding = "ISO-8859-1"
///
/// [reducer]
/// max_events = 100000
///
/// [log]
/// level = "debug"
/// file = "xmliter.log"
/// format = "[%T] [%L] %m"
/// \endcode
struct Config
{
  struct ReaderConfig
  {
    std::optional<std::size_t> bufferSize;
    std::optional<std::size_t> maxDepth;
    std::optional<std::size_t> maxNameLength;
    std::optional<std::size_t> maxTextSpan;
    std::optional<std::size_t> maxTotalTokens;
    std::optional<bool> trimText;
    std::optional<bool> stripNamespacePrefix;
    std::optional<std::string> encoding;
  } reader;

  struct ReducerConfig
  {
    std::optional<std::size_t> maxDepth;
    std::optional<std::uint64_t> maxEvents;
  } reducer;

  struct LogConfig
  {
    std::optional<std::string> level;
    std::optional<std::string> file;
    std::optional<std::string> format;
  } log;

  /// \brief Reads path. Throws std::runtime_error if the file is missing,
  /// malformed, or holds a negative size.
  static Config fromFile(const std::string &path)
  {
    core::ConfigLoader loader(path);
    Config cfg;
    cfg.reader.bufferSize = loader.getSize("reader.buffer_size");
    cfg.reader.maxDepth = loader.getSize("reader.max_depth");
    cfg.reader.maxNameLength = loader.getSize("reader.max_name_length");
    cfg.reader.maxTextSpan = loader.getSize("reader.max_text_span");
    cfg.reader.maxTotalTokens = loader.getSize("reader.max_total_tokens");
    cfg.reader.trimText = loader.getBool("reader.trim_text");
    cfg.reader.stripNamespacePrefix = loader.getBool("reader.strip_namespace_prefix");
    cfg.reader.encoding = loader.getString("reader.encoding");

    cfg.reducer.maxDepth = loader.getSize("reducer.max_depth");
    if (auto v = loader.getSize("reducer.max_events"))
    {
      cfg.reducer.maxEvents = static_cast<std::uint64_t>(*v);
    }

    cfg.log.level = loader.getString("log.level");
    cfg.log.file = loader.getString("log.file");
    cfg.log.format = loader.getString("log.format");
    return cfg;
  }

  ReaderOptions readerOptions() const
  {
    ReaderOptions opt;
    opt.bufferSize = reader.bufferSize.value_or(opt.bufferSize);
    opt.maxDepth = reader.maxDepth.value_or(opt.maxDepth);
    opt.maxNameLength = reader.maxNameLength.value_or(opt.maxNameLength);
    opt.maxTextSpan = reader.maxTextSpan.value_or(opt.maxTextSpan);
    opt.maxTotalTokens = reader.maxTotalTokens.value_or(opt.maxTotalTokens);
    opt.trimText = reader.trimText.value_or(opt.trimText);
    opt.stripNamespacePrefix = reader.stripNamespacePrefix.value_or(opt.stripNamespacePrefix);
    opt.encoding = reader.encoding.value_or(opt.encoding);
    return opt;
  }

  ReduceOptions reduceOptions() const
  {
    ReduceOptions opt;
    opt.maxDepth = reducer.maxDepth.value_or(opt.maxDepth);
    opt.maxEvents = reducer.maxEvents.value_or(opt.maxEvents);
    return opt;
  }

  /// \brief Initializes the process logger from the [log] section.
  void applyLogging() const
  {
    core::Logger::init(core::Logger::levelFromString(log.level.value_or("info")),
                       log.file.value_or(""));
    if (log.format)
    {
      core::Logger::setLogFormat(*log.format);
    }
    XMLITER_LOG_DEBUG("Config: log.level = " << log.level.value_or("<unset>"));
    XMLITER_LOG_DEBUG("Config: log.file = " << log.file.value_or("<unset>"));
  }
};

} // namespace xmliter
