// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Xmliter, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <cctype>
#include <chrono>
#include <ctime>
#include <fstream>
#include <functional>
#include <iomanip>
#include <iostream>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <vector>

namespace xmliter
{
namespace core
{

namespace detail
{
  /// \brief Extract filename from full path at compile-time
  constexpr const char *basename(const char *path)
  {
    const char *file = path;
    while (*path)
    {
      if (*path == '/' || *path == '\\')
      {
        file = path + 1;
      }
      ++path;
    }
    return file;
  }
} // namespace detail

class LoggerStream;

/// \brief Process-wide logger with levels, optional file output, a
/// configurable line format and an external handler hook.
///
/// Output goes to stderr unless init() was given a file path or an external
/// handler is registered. All entry points are thread-safe.
class Logger
{
public:
  enum class Level
  {
    Trace,
    Debug,
    Info,
    Warning,
    Error,
    Fatal
  };

  /// \brief External log handler: level, formatted line, raw message.
  using ExternalHandler = std::function<void(Level level, const std::string &formattedMessage,
                                             const std::string &rawMessage)>;

  struct Endl
  {
  };
  static inline constexpr Endl endl{};

  /// \brief Set the minimum level and, optionally, a file that log lines are
  /// appended to. An empty path logs to stderr.
  static void init(Level level = Level::Info, const std::string &filePath = "",
                   const std::string &timeFormat = "%Y-%m-%d %H:%M:%S")
  {
    auto &data = getData();
    std::lock_guard<std::mutex> lock(data.mutex);
    data.minLevel = level;
    data.timestampFormat = timeFormat;
    data.fileStream.reset();
    data.filePath = filePath;
    if (!filePath.empty())
    {
      data.fileStream = std::make_unique<std::ofstream>(filePath, std::ios::app);
      if (!data.fileStream->is_open())
      {
        data.fileStream.reset();
        std::cerr << "xmliter: cannot open log file '" << filePath << "', using stderr"
                  << std::endl;
      }
    }
  }

  static void flush()
  {
    auto &data = getData();
    std::lock_guard<std::mutex> lock(data.mutex);
    if (data.fileStream)
    {
      data.fileStream->flush();
    }
    else
    {
      std::cerr.flush();
    }
  }

  /// \brief Flush and close the log file; later messages go to stderr.
  static void shutdown()
  {
    flush();
    auto &data = getData();
    std::lock_guard<std::mutex> lock(data.mutex);
    data.fileStream.reset();
    data.filePath.clear();
  }

  static void setLevel(Level level)
  {
    auto &data = getData();
    std::lock_guard<std::mutex> lock(data.mutex);
    data.minLevel = level;
  }

  static Level getLevel()
  {
    auto &data = getData();
    std::lock_guard<std::mutex> lock(data.mutex);
    return data.minLevel;
  }

  /// \brief Register an external log handler; file and stderr output are
  /// bypassed while it is set.
  static void setExternalHandler(ExternalHandler handler)
  {
    auto &data = getData();
    std::lock_guard<std::mutex> lock(data.mutex);
    data.externalHandler = std::move(handler);
  }

  static void clearExternalHandler()
  {
    auto &data = getData();
    std::lock_guard<std::mutex> lock(data.mutex);
    data.externalHandler = nullptr;
  }

  /// \brief Set the log line format.
  /// Supported placeholders:
  ///   %T - timestamp
  ///   %L - log level (e.g. INFO, DEBUG, ERROR)
  ///   %m - message content
  ///   %F - source file name (only filename, no directory path)
  ///   %l - source line number
  ///   %f - function name
  ///   %% - literal percent sign
  /// Empty format strings are ignored. Source location placeholders expand to
  /// nothing unless the message came through an XMLITER_LOG_* macro.
  static void setLogFormat(const std::string &format)
  {
    if (format.empty())
    {
      return;
    }
    auto &data = getData();
    std::lock_guard<std::mutex> lock(data.mutex);
    data.logFormat = format;
    compileFormat(format, data.compiledFormat);
  }

  static std::string getLogFormat()
  {
    auto &data = getData();
    std::lock_guard<std::mutex> lock(data.mutex);
    return data.logFormat;
  }

  /// \brief Maps "trace", "debug", "info", "warn"/"warning", "error", "fatal"
  /// (any case) to a level; anything else is Info.
  static Level levelFromString(const std::string &s)
  {
    std::string v;
    v.reserve(s.size());
    for (char c : s)
    {
      v.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }
    if (v == "trace")
    {
      return Level::Trace;
    }
    if (v == "debug")
    {
      return Level::Debug;
    }
    if (v == "warn" || v == "warning")
    {
      return Level::Warning;
    }
    if (v == "error")
    {
      return Level::Error;
    }
    if (v == "fatal")
    {
      return Level::Fatal;
    }
    return Level::Info;
  }

  static const char *levelToString(Level level)
  {
    switch (level)
    {
    case Level::Trace:
      return "TRACE";
    case Level::Debug:
      return "DEBUG";
    case Level::Info:
      return "INFO";
    case Level::Warning:
      return "WARN";
    case Level::Error:
      return "ERROR";
    case Level::Fatal:
      return "FATAL";
    default:
      return "UNKNOWN";
    }
  }

  static void trace(const std::string &message) { log(Level::Trace, message); }
  static void debug(const std::string &message) { log(Level::Debug, message); }
  static void info(const std::string &message) { log(Level::Info, message); }
  static void warning(const std::string &message) { log(Level::Warning, message); }
  static void error(const std::string &message) { log(Level::Error, message); }
  static void fatal(const std::string &message) { log(Level::Fatal, message); }

  static LoggerStream stream(Level level);

  static void log(Level level, const std::string &message)
  {
    log(level, message, nullptr, 0, nullptr);
  }

  /// \brief Log a message with source location information.
  static void log(Level level, const std::string &message, const char *file, int line,
                  const char *function)
  {
    auto &data = getData();
    std::lock_guard<std::mutex> lock(data.mutex);
    if (level < data.minLevel)
    {
      return;
    }
    if (data.compiledFormat.empty())
    {
      compileFormat(data.logFormat, data.compiledFormat);
    }
    std::string output = formatLine(data, level, message, file, line, function);

    if (data.externalHandler)
    {
      data.externalHandler(level, output, message);
    }
    else if (data.fileStream)
    {
      (*data.fileStream) << output;
      data.fileStream->flush();
    }
    else
    {
      std::cerr << output;
    }
  }

private:
  enum class FormatToken
  {
    Literal,
    Timestamp,
    Level,
    Message,
    File,
    Line,
    Function
  };

  struct FormatSegment
  {
    FormatToken token;
    std::string literal; ///< Only used when token == Literal
  };

  struct LoggerData
  {
    std::mutex mutex;
    Level minLevel = Level::Info;
    std::unique_ptr<std::ofstream> fileStream;
    std::string filePath;
    std::string timestampFormat = "%Y-%m-%d %H:%M:%S";
    ExternalHandler externalHandler;
    std::string logFormat = "[%T] [%L] %m";
    std::vector<FormatSegment> compiledFormat;
  };

  static LoggerData &getData()
  {
    static LoggerData data;
    return data;
  }

  static std::string timestamp(const std::string &format)
  {
    auto now = std::chrono::system_clock::now();
    std::time_t t = std::chrono::system_clock::to_time_t(now);
    std::tm tm{};
    localtime_r(&t, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, format.c_str());
    return oss.str();
  }

  static void compileFormat(const std::string &format, std::vector<FormatSegment> &segments)
  {
    segments.clear();
    std::string currentLiteral;

    for (std::size_t i = 0; i < format.size(); ++i)
    {
      if (format[i] != '%' || i + 1 >= format.size())
      {
        currentLiteral += format[i];
        continue;
      }

      FormatToken token = FormatToken::Literal;
      switch (format[i + 1])
      {
      case 'T':
        token = FormatToken::Timestamp;
        break;
      case 'L':
        token = FormatToken::Level;
        break;
      case 'm':
        token = FormatToken::Message;
        break;
      case 'F':
        token = FormatToken::File;
        break;
      case 'l':
        token = FormatToken::Line;
        break;
      case 'f':
        token = FormatToken::Function;
        break;
      case '%':
        currentLiteral += '%';
        ++i;
        continue;
      default:
        // Unknown placeholder, keep the '%' as literal text
        currentLiteral += format[i];
        continue;
      }

      if (!currentLiteral.empty())
      {
        segments.push_back({FormatToken::Literal, std::move(currentLiteral)});
        currentLiteral.clear();
      }
      segments.push_back({token, ""});
      ++i;
    }

    if (!currentLiteral.empty())
    {
      segments.push_back({FormatToken::Literal, std::move(currentLiteral)});
    }
  }

  static std::string formatLine(const LoggerData &data, Level level, const std::string &message,
                                const char *file, int line, const char *function)
  {
    std::string out;
    out.reserve(message.size() + 48);
    for (const auto &seg : data.compiledFormat)
    {
      switch (seg.token)
      {
      case FormatToken::Literal:
        out += seg.literal;
        break;
      case FormatToken::Timestamp:
        out += timestamp(data.timestampFormat);
        break;
      case FormatToken::Level:
        out += levelToString(level);
        break;
      case FormatToken::Message:
        out += message;
        break;
      case FormatToken::File:
        if (file)
        {
          out += detail::basename(file);
        }
        break;
      case FormatToken::Line:
        if (file)
        {
          out += std::to_string(line);
        }
        break;
      case FormatToken::Function:
        if (function)
        {
          out += function;
        }
        break;
      }
    }
    out += '\n';
    return out;
  }
};

/// \brief Stream interface for composing a log message; emitted on endl or
/// when the stream goes out of scope.
class LoggerStream
{
public:
  explicit LoggerStream(Logger::Level level) : _level(level), _flushed(false) {}

  LoggerStream(LoggerStream &&other) noexcept
      : _level(other._level), _stream(std::move(other._stream)), _flushed(other._flushed)
  {
    other._flushed = true;
  }

  template <typename T> LoggerStream &operator<<(const T &value)
  {
    _stream << value;
    return *this;
  }

  LoggerStream &operator<<(Logger::Endl)
  {
    flush();
    return *this;
  }

  ~LoggerStream()
  {
    if (!_flushed && !_stream.str().empty())
    {
      flush();
    }
  }

private:
  Logger::Level _level;
  std::ostringstream _stream;
  bool _flushed;

  void flush()
  {
    Logger::log(_level, _stream.str());
    _stream.str("");
    _flushed = true;
  }
};

inline LoggerStream Logger::stream(Logger::Level level) { return LoggerStream(level); }

} // namespace core
} // namespace xmliter

/// \brief Stream-style logging macro with source location support
#define XMLITER_LOG_WITH_LEVEL(level, msg)                                                         \
  do                                                                                               \
  {                                                                                                \
    std::ostringstream _oss;                                                                       \
    _oss << msg;                                                                                   \
    xmliter::core::Logger::log(xmliter::core::Logger::Level::level, _oss.str(), __FILE__,          \
                               __LINE__, __func__);                                                \
  } while (0)

#define XMLITER_LOG_TRACE(msg) XMLITER_LOG_WITH_LEVEL(Trace, msg)
#define XMLITER_LOG_DEBUG(msg) XMLITER_LOG_WITH_LEVEL(Debug, msg)
#define XMLITER_LOG_INFO(msg) XMLITER_LOG_WITH_LEVEL(Info, msg)
#define XMLITER_LOG_WARN(msg) XMLITER_LOG_WITH_LEVEL(Warning, msg)
#define XMLITER_LOG_ERROR(msg) XMLITER_LOG_WITH_LEVEL(Error, msg)
#define XMLITER_LOG_FATAL(msg) XMLITER_LOG_WITH_LEVEL(Fatal, msg)
