// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Xmliter, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <xmliter/core/logger.hpp>
#include <xmliter/error.hpp>
#include <xmliter/options.hpp>
#include <xmliter/stream/event_stream.hpp>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace xmliter
{

using ElementPath = std::vector<std::string>;
using PathCounts = std::map<ElementPath, std::uint64_t>;

struct PathCountResult
{
  PathCounts counts;
  std::uint64_t eventsConsumed{0};
  std::optional<Error> error;
};

/// \brief Counts elements by their full path from the root, the element
/// itself included.
class PathCounter
{
public:
  void feed(const Event &ev)
  {
    switch (ev.kind)
    {
    case EventKind::Start:
      _path.push_back(ev.value);
      ++_counts[_path];
      break;
    case EventKind::Empty:
      _path.push_back(ev.value);
      ++_counts[_path];
      _path.pop_back();
      break;
    case EventKind::End:
      if (!_path.empty())
      {
        _path.pop_back();
      }
      break;
    default:
      break;
    }
  }

  const PathCounts &counts() const { return _counts; }

  PathCounts take()
  {
    _path.clear();
    return std::move(_counts);
  }

private:
  ElementPath _path;
  PathCounts _counts;
};

/// \brief Joins a path as "a/b/c" for display.
inline std::string joinPath(const ElementPath &path, char sep = '/')
{
  std::string out;
  for (std::size_t i = 0; i < path.size(); ++i)
  {
    if (i)
      out.push_back(sep);
    out += path[i];
  }
  return out;
}

inline PathCountResult countPaths(const std::string &path,
                                  const ReaderOptions &opt = ReaderOptions{},
                                  std::uint64_t maxEvents = 0)
{
  EventStream stream(path, opt);
  PathCounter counter;
  PathCountResult result;
  Event ev;
  try
  {
    while ((maxEvents == 0 || result.eventsConsumed < maxEvents) && stream.next(ev))
    {
      counter.feed(ev);
      ++result.eventsConsumed;
    }
    if (const Error *e = stream.error())
    {
      result.error = *e;
    }
  }
  catch (const ParseError &e)
  {
    result.error = e.error();
  }
  if (result.error)
  {
    XMLITER_LOG_WARN("countPaths: partial counts for " << path << " after "
                                                      << result.eventsConsumed
                                                      << " events: " << describe(*result.error));
  }
  stream.close();
  result.counts = counter.take();
  return result;
}

} // namespace xmliter
