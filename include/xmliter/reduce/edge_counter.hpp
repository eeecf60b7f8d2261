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

using Edge = std::pair<std::string, std::string>;
using EdgeCounts = std::map<Edge, std::uint64_t>;

struct EdgeCountResult
{
  EdgeCounts counts;
  std::uint64_t eventsConsumed{0};
  std::optional<Error> error;
};

/// \brief Counts (parent, child) element pairs.
class EdgeCounter
{
public:
  void feed(const Event &ev)
  {
    switch (ev.kind)
    {
    case EventKind::Start:
      count(ev.value);
      _stack.push_back(ev.value);
      break;
    case EventKind::Empty:
      count(ev.value);
      break;
    case EventKind::End:
      if (!_stack.empty())
      {
        _stack.pop_back();
      }
      break;
    default:
      break;
    }
  }

  const EdgeCounts &counts() const { return _counts; }

  EdgeCounts take()
  {
    _stack.clear();
    return std::move(_counts);
  }

private:
  void count(const std::string &tag)
  {
    if (!_stack.empty())
    {
      ++_counts[Edge(_stack.back(), tag)];
    }
  }

  std::vector<std::string> _stack;
  EdgeCounts _counts;
};

/// \brief Counts parent/child pairs over a file. maxEvents of 0 reads the
/// whole document; a stream failure returns the counts so far with error set.
inline EdgeCountResult countEdges(const std::string &path,
                                  const ReaderOptions &opt = ReaderOptions{},
                                  std::uint64_t maxEvents = 0)
{
  EventStream stream(path, opt);
  EdgeCounter counter;
  EdgeCountResult result;
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
    XMLITER_LOG_WARN("countEdges: partial counts for " << path << " after "
                                                      << result.eventsConsumed
                                                      << " events: " << describe(*result.error));
  }
  stream.close();
  result.counts = counter.take();
  return result;
}

} // namespace xmliter
