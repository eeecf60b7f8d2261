// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Xmliter, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>

namespace xmliter
{
/// \brief Failure classes reported by the tokenizer and the event stream.
enum class ErrorKind
{
  Io,              ///< Read failure on the underlying file
  Decode,          ///< Bytes invalid under the resolved encoding
  Malformed,       ///< Lexical or structural violation
  MismatchedTag,   ///< End tag does not match the innermost open element
  UnclosedElement, ///< Input ended with elements still open
  Limit            ///< A configured safety limit was exceeded
};

/// \brief Error information for stream failures.
struct Error
{
  ErrorKind kind{ErrorKind::Malformed};
  std::size_t offset{0}; ///< Byte offset (raw input for Decode, decoded UTF-8 otherwise)
  std::size_t line{1};
  std::size_t column{1};
  std::string message;
};

inline const char *toString(ErrorKind kind)
{
  switch (kind)
  {
  case ErrorKind::Io:
    return "io";
  case ErrorKind::Decode:
    return "decode";
  case ErrorKind::Malformed:
    return "malformed";
  case ErrorKind::MismatchedTag:
    return "mismatched-tag";
  case ErrorKind::UnclosedElement:
    return "unclosed-element";
  case ErrorKind::Limit:
    return "limit";
  default:
    return "unknown";
  }
}

/// \brief Formats an error as "kind at line:column (offset N): message".
inline std::string describe(const Error &err)
{
  return std::string(toString(err.kind)) + " at " + std::to_string(err.line) + ":" +
         std::to_string(err.column) + " (offset " + std::to_string(err.offset) +
         "): " + err.message;
}

/// \brief Thrown when an input file cannot be opened.
class IoError : public std::runtime_error
{
public:
  explicit IoError(const std::string &what) : std::runtime_error(what) {}
};

/// \brief Thrown by the tokenizer instead of returning false when built with
/// XMLITER_THROW_ON_ERROR=1.
class ParseError : public std::runtime_error
{
public:
  explicit ParseError(const Error &err) : std::runtime_error(describe(err)), _error(err) {}

  const Error &error() const { return _error; }

private:
  Error _error;
};

} // namespace xmliter
