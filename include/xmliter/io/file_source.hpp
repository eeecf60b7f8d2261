// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Xmliter, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <xmliter/error.hpp>
#include <cerrno>
#include <cstddef>
#include <cstring>
#include <fcntl.h>
#include <string>
#include <unistd.h>
#include <utility>

namespace xmliter
{
namespace io
{
/// \brief Read-only file handle that reads in caller-sized chunks. The
/// descriptor is closed when the object is destroyed.
class FileSource
{
public:
  /// \throws IoError if the file cannot be opened.
  explicit FileSource(const std::string &path) : _path(path)
  {
    do
    {
      _fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
    } while (_fd < 0 && errno == EINTR);
    if (_fd < 0)
    {
      throw IoError("Failed to open XML file '" + path + "': " + std::strerror(errno));
    }
  }

  ~FileSource() { close(); }

  FileSource(const FileSource &) = delete;
  FileSource &operator=(const FileSource &) = delete;

  FileSource(FileSource &&other) noexcept
      : _path(std::move(other._path)), _fd(other._fd), _eof(other._eof),
        _bytesRead(other._bytesRead), _lastError(std::move(other._lastError))
  {
    other._fd = -1;
  }

  /// \brief Reads up to n bytes into buf. Returns 0 at end of file or on a
  /// read error; failed() tells the two apart.
  std::size_t read(char *buf, std::size_t n)
  {
    if (_fd < 0 || _eof)
    {
      return 0;
    }
    while (true)
    {
      ssize_t r = ::read(_fd, buf, n);
      if (r > 0)
      {
        _bytesRead += static_cast<std::size_t>(r);
        return static_cast<std::size_t>(r);
      }
      if (r == 0)
      {
        _eof = true;
        return 0;
      }
      if (errno == EINTR)
      {
        continue;
      }
      _lastError = std::strerror(errno);
      _eof = true;
      return 0;
    }
  }

  bool eof() const { return _eof; }
  bool failed() const { return !_lastError.empty(); }
  const std::string &lastError() const { return _lastError; }

  /// \brief Total bytes handed out by read() so far.
  std::size_t bytesRead() const { return _bytesRead; }

  const std::string &path() const { return _path; }

  bool isOpen() const { return _fd >= 0; }

  void close()
  {
    if (_fd >= 0)
    {
      ::close(_fd);
      _fd = -1;
    }
  }

private:
  std::string _path;
  int _fd{-1};
  bool _eof{false};
  std::size_t _bytesRead{0};
  std::string _lastError;
};

} // namespace io
} // namespace xmliter
