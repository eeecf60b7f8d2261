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
#include <xmliter/reduce/node.hpp>
#include <xmliter/stream/event_stream.hpp>
#include <xmliter/util/text.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace xmliter
{

/// \brief Result of converting a document into nested data.
struct ConversionResult
{
  Node root;                      ///< Map holding the root element as its only key
  std::uint64_t eventsConsumed{0};
  bool truncated{false};          ///< A ReduceOptions limit cut off content
  std::optional<Error> error;     ///< Set when the stream failed mid-way
};

/// \brief Folds an event sequence into xmltodict-shaped data.
///
/// Every open element has a context collecting its text and its child
/// entries. When the element closes, a context with children becomes a map
/// and its text is dropped; otherwise the stripped text becomes a leaf, or
/// null if nothing is left. The result is attached to the parent under the
/// tag name, turning into a list on the second sibling with the same name.
class DictReducer
{
public:
  explicit DictReducer(const ReduceOptions &opt = ReduceOptions{}) : _opt(opt)
  {
    _contexts.emplace_back();
  }

  /// \brief Consumes one event. Returns false once maxEvents was reached and
  /// no more events should be fed.
  bool feed(const Event &ev)
  {
    if (_opt.maxEvents != 0 && _consumed >= _opt.maxEvents)
    {
      _truncated = true;
      return false;
    }
    ++_consumed;

    switch (ev.kind)
    {
    case EventKind::Start:
      ++_depth;
      if (!skipping())
      {
        _contexts.emplace_back();
        _contexts.back().tag = ev.value;
      }
      else
      {
        _truncated = true;
      }
      break;
    case EventKind::End:
      if (!skipping())
      {
        closeContext();
      }
      if (_depth > 0)
      {
        --_depth;
      }
      break;
    case EventKind::Empty:
      if (_opt.maxDepth == 0 || _depth + 1 <= _opt.maxDepth)
      {
        current().children.attach(ev.value, Node());
        current().hasChildren = true;
      }
      else
      {
        _truncated = true;
      }
      break;
    case EventKind::Text:
      if (!skipping())
      {
        current().text += ev.value;
      }
      break;
    }
    return _opt.maxEvents == 0 || _consumed < _opt.maxEvents;
  }

  /// \brief Closes every context still open and returns the document.
  /// cause is the stream error that ended the input early, if any.
  ConversionResult finish(const Error *cause = nullptr)
  {
    bool partial = _contexts.size() > 1;
    while (_contexts.size() > 1)
    {
      closeContext();
    }
    _depth = 0;

    ConversionResult result;
    result.root = Node::map();
    result.root.asMap() = std::move(_contexts.front().children);
    result.eventsConsumed = _consumed;
    result.truncated = _truncated;
    if (cause)
    {
      result.error = *cause;
      XMLITER_LOG_WARN("DictReducer: returning partial document after "
                       << _consumed << " events: " << describe(*cause));
    }
    else if (partial)
    {
      XMLITER_LOG_DEBUG("DictReducer: closed open elements after " << _consumed << " events");
    }

    _contexts.clear();
    _contexts.emplace_back();
    _consumed = 0;
    _truncated = false;
    return result;
  }

  std::uint64_t eventsConsumed() const { return _consumed; }

  /// \brief Number of open element contexts.
  std::size_t depth() const { return _contexts.size() - 1; }

private:
  struct Context
  {
    std::string tag;
    std::string text;
    NodeMap children;
    bool hasChildren{false};
  };

  // Elements below maxDepth are dropped together with their subtree.
  bool skipping() const { return _opt.maxDepth != 0 && _depth > _opt.maxDepth; }

  Context &current() { return _contexts.back(); }

  void closeContext()
  {
    Context ctx = std::move(_contexts.back());
    _contexts.pop_back();

    Node value;
    if (ctx.hasChildren)
    {
      value = Node::map();
      value.asMap() = std::move(ctx.children);
    }
    else
    {
      std::string_view stripped = util::trimWhitespace(ctx.text);
      if (!stripped.empty())
      {
        value = Node::leaf(std::string(stripped));
      }
    }
    current().children.attach(ctx.tag, std::move(value));
    current().hasChildren = true;
  }

  ReduceOptions _opt;
  std::vector<Context> _contexts;
  std::size_t _depth{0};
  std::uint64_t _consumed{0};
  bool _truncated{false};
};

/// \brief Converts an XML file into nested data.
///
/// A stream failure does not throw, even when the stream itself is built to
/// throw ParseError: the elements read so far are returned with error set.
/// Only opening the file throws (IoError).
inline ConversionResult toMapping(const std::string &path,
                                  const ReaderOptions &readerOpt = ReaderOptions{},
                                  const ReduceOptions &reduceOpt = ReduceOptions{})
{
  EventStream stream(path, readerOpt);
  DictReducer reducer(reduceOpt);
  Event ev;
  bool more = true;
  bool truncated = false;
  std::optional<Error> thrown;
  try
  {
    while (more && stream.next(ev))
    {
      more = reducer.feed(ev);
    }
    if (!more)
    {
      // Limit hit; content is only cut off if more input follows.
      truncated = stream.next(ev) || stream.error() != nullptr;
    }
  }
  catch (const ParseError &e)
  {
    thrown = e.error();
    truncated = truncated || !more;
  }
  // A failure past the limit is not reported.
  const Error *cause = nullptr;
  if (more)
  {
    cause = thrown ? &*thrown : stream.error();
  }
  ConversionResult result = reducer.finish(cause);
  result.truncated = result.truncated || truncated;
  stream.close();
  return result;
}

} // namespace xmliter
