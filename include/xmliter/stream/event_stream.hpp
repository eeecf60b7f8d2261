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
#include <xmliter/parsers/xml.hpp>
#include <xmliter/stream/event.hpp>
#include <xmliter/util/text.hpp>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace xmliter
{

/// \brief Pull-based stream of normalized events over an XML file.
///
/// Each call to next() advances the tokenizer only as far as needed to
/// produce one event; at most one element token is held back while a text
/// run is being coalesced. Comments, processing instructions, the XML
/// declaration and DOCTYPE never surface. Text is entity-decoded and
/// coalesced across CDATA sections and comments but not trimmed (see
/// ReaderOptions::trimText).
///
/// Failures are not recovered from: once next() returns false with error()
/// set, the stream is finished. The file is closed at the end of input, on
/// failure, by close(), or when the stream is destroyed.
class EventStream
{
public:
  /// \throws IoError if the file cannot be opened.
  explicit EventStream(const std::string &path, const ReaderOptions &opt = ReaderOptions{})
      : _tokenizer(path, opt), _opt(opt)
  {
  }

  EventStream(const EventStream &) = delete;
  EventStream &operator=(const EventStream &) = delete;

  /// \brief Produces the next event into out. Returns false at the end of
  /// input or on failure; error() tells the two apart.
  bool next(Event &out)
  {
    while (!_hasError && !_finished && !_closed)
    {
      if (_held)
      {
        Held h = std::move(*_held);
        _held.reset();
        return element(h, out);
      }
      if (_inputEnded)
      {
        finish();
        break;
      }
      if (!_tokenizer.next())
      {
        _inputEnded = true;
        if (flushText(out))
        {
          return true;
        }
        continue;
      }

      const parsers::xml::Token &t = _tokenizer.current();
      switch (t.kind)
      {
      case parsers::xml::TokenKind::Text:
      {
        Error err;
        std::size_t before = _text.size();
        if (!parsers::xml::Tokenizer::decodeEntities(t.text, _text, &err))
        {
          // err.offset is relative to the token
          return fail(err.kind, err.message, t.offset + err.offset, t.line, t.column);
        }
        if (_text.size() > _opt.maxTextSpan)
        {
          return fail(ErrorKind::Limit, "text run too large", t.offset, t.line, t.column);
        }
        _textOpen = _textOpen || _text.size() > before || !t.text.empty();
        break;
      }
      case parsers::xml::TokenKind::CData:
        util::appendNormalizedNewlines(_text, t.text);
        _textOpen = _textOpen || !t.text.empty();
        if (_text.size() > _opt.maxTextSpan)
        {
          return fail(ErrorKind::Limit, "text run too large", t.offset, t.line, t.column);
        }
        break;
      case parsers::xml::TokenKind::StartElement:
      case parsers::xml::TokenKind::EndElement:
      case parsers::xml::TokenKind::EmptyElement:
      {
        Held h{t.kind, std::string(t.name), t.offset, t.line, t.column};
        if (flushText(out))
        {
          _held = std::move(h);
          return true;
        }
        return element(h, out);
      }
      default:
        // Comments, PIs, XML declaration and DOCTYPE are dropped.
        break;
      }
    }
    return false;
  }

  /// \brief Returns last error pointer if any (nullptr if none).
  const Error *error() const { return _hasError ? &_error : nullptr; }

  /// \brief True once the end of a well-formed document was reached.
  bool finished() const { return _finished; }

  /// \brief Number of events produced so far.
  std::uint64_t eventsProduced() const { return _nextIndex; }

  /// \brief Number of currently open elements.
  std::size_t depth() const { return _tagStack.size(); }

  encoding::Encoding encoding() const { return _tokenizer.encoding(); }

  const parsers::xml::Tokenizer &tokenizer() const { return _tokenizer; }

  /// \brief Releases the file early; next() returns false afterwards.
  void close()
  {
    _tokenizer.close();
    _closed = true;
    _held.reset();
  }

private:
  // Element token held back while a preceding text run is delivered.
  struct Held
  {
    parsers::xml::TokenKind kind;
    std::string name;
    std::size_t offset;
    std::size_t line;
    std::size_t column;
  };

  bool element(Held &h, Event &out)
  {
    switch (h.kind)
    {
    case parsers::xml::TokenKind::StartElement:
      _tagStack.push_back(h.name);
      emit(EventKind::Start, reported(std::move(h.name)), out);
      return true;
    case parsers::xml::TokenKind::EndElement:
      if (_tagStack.empty() || _tagStack.back() != h.name)
      {
        std::string expected = _tagStack.empty() ? std::string("none") : "</" + _tagStack.back() + ">";
        return fail(ErrorKind::MismatchedTag,
                    "mismatched end tag - expected " + expected + " but got </" + h.name + ">",
                    h.offset, h.line, h.column);
      }
      _tagStack.pop_back();
      emit(EventKind::End, reported(std::move(h.name)), out);
      return true;
    default:
      emit(EventKind::Empty, reported(std::move(h.name)), out);
      return true;
    }
  }

  std::string reported(std::string name) const
  {
    if (_opt.stripNamespacePrefix)
    {
      std::size_t colon = name.find(':');
      if (colon != std::string::npos)
      {
        return name.substr(colon + 1);
      }
    }
    return name;
  }

  bool flushText(Event &out)
  {
    if (!_textOpen)
    {
      return false;
    }
    _textOpen = false;
    std::string text = std::move(_text);
    _text = std::string();
    if (_opt.trimText)
    {
      std::string_view trimmed = util::trimWhitespace(text);
      if (trimmed.empty())
      {
        return false;
      }
      text = std::string(trimmed);
    }
    emit(EventKind::Text, std::move(text), out);
    return true;
  }

  void emit(EventKind kind, std::string value, Event &out)
  {
    out.index = _nextIndex++;
    out.kind = kind;
    out.value = std::move(value);
  }

  void finish()
  {
    if (const Error *e = _tokenizer.error())
    {
      _hasError = true;
      _error = *e;
      XMLITER_LOG_DEBUG("EventStream: stopped after " << _nextIndex
                                                      << " events: " << describe(_error));
      return;
    }
    if (!_tagStack.empty())
    {
      Error e;
      e.kind = ErrorKind::UnclosedElement;
      const parsers::xml::Token &eof = _tokenizer.current();
      e.offset = eof.offset;
      e.line = eof.line;
      e.column = eof.column;
      e.message = "unclosed element <" + _tagStack.back() + "> at end of document (" +
                  std::to_string(_tagStack.size()) + " open)";
      _hasError = true;
      _error = std::move(e);
      XMLITER_LOG_DEBUG("EventStream: stopped after " << _nextIndex
                                                      << " events: " << describe(_error));
      return;
    }
    _finished = true;
  }

  bool fail(ErrorKind kind, const std::string &msg, std::size_t offset, std::size_t line,
            std::size_t column)
  {
    _hasError = true;
    _error = Error{kind, offset, line, column, msg};
    _held.reset();
    _tokenizer.close();
    XMLITER_LOG_DEBUG("EventStream: stopped after " << _nextIndex
                                                    << " events: " << describe(_error));
#if XMLITER_THROW_ON_ERROR
    throw ParseError(_error);
#endif
    return false;
  }

  parsers::xml::Tokenizer _tokenizer;
  ReaderOptions _opt;
  std::vector<std::string> _tagStack;
  std::optional<Held> _held;
  std::string _text;
  bool _textOpen{false};
  bool _inputEnded{false};
  bool _finished{false};
  bool _closed{false};
  bool _hasError{false};
  Error _error{};
  std::uint64_t _nextIndex{0};
};

/// \brief Outcome of a visitor run over an event stream.
struct StreamSummary
{
  std::uint64_t events{0}; ///< Events handed to the visitor
  bool stoppedEarly{false}; ///< The visitor asked to stop
  std::optional<Error> error;
};

/// \brief Visitor returns true to continue, false to stop.
using EventVisitor = std::function<bool(const Event &)>;

/// \brief Feeds every event of an open stream to visitor.
inline StreamSummary forEachEvent(EventStream &stream, const EventVisitor &visitor)
{
  StreamSummary summary;
  Event ev;
  while (stream.next(ev))
  {
    ++summary.events;
    if (!visitor(ev))
    {
      summary.stoppedEarly = true;
      stream.close();
      return summary;
    }
  }
  if (const Error *e = stream.error())
  {
    summary.error = *e;
  }
  return summary;
}

/// \brief Opens path and feeds its events to visitor.
/// \throws IoError if the file cannot be opened.
inline StreamSummary forEachEvent(const std::string &path, const EventVisitor &visitor,
                                  const ReaderOptions &opt = ReaderOptions{})
{
  EventStream stream(path, opt);
  return forEachEvent(stream, visitor);
}

} // namespace xmliter
