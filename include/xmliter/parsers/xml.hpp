#pragma once
/// \file xml.hpp
/// \brief Streaming, non-validating XML 1.0 tokenizer with a pull API.
///
/// Design goals:
///  - Reads the file in fixed-size chunks; memory is bounded by the longest
///    single token plus one chunk, never by document size
///  - Non-validating (no DTD/XSD); safe-by-default (no external entity expansion)
///  - Input decoded to UTF-8 first (see encoding/decoder.hpp)
///  - Attributes are syntax-checked and skipped
///
/// Example:
/// \code
/// xmliter::parsers::xml::Tokenizer tok("doc.xml");
/// while (tok.next())
/// {
///   const auto &t = tok.current();
///   if (t.kind == xmliter::parsers::xml::TokenKind::StartElement)
///   {
///     // ...
///   }
/// }
/// if (tok.error()) { /* handle */ }
/// \endcode
///
/// Token views stay valid until the next call to next().
///
/// SPDX-License-Identifier: MPL-2.0

#include <xmliter/core/logger.hpp>
#include <xmliter/encoding/decoder.hpp>
#include <xmliter/error.hpp>
#include <xmliter/io/file_source.hpp>
#include <xmliter/options.hpp>
#include <xmliter/util/text.hpp>
#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#ifndef XMLITER_THROW_ON_ERROR
#define XMLITER_THROW_ON_ERROR 0
#endif

namespace xmliter
{
namespace parsers
{
namespace xml
{
/// \brief Token kinds produced by the tokenizer.
enum class TokenKind
{
  Invalid,
  Eof,
  XmlDecl,
  Doctype,
  StartElement,
  EndElement,
  EmptyElement,
  Text,
  CData,
  Comment,
  ProcessingInstruction
};

/// \brief Token produced by the tokenizer.
struct Token
{
  TokenKind kind{TokenKind::Invalid};
  std::string_view name; ///< For elements/PI: raw name or target
  std::string_view text; ///< For Text/Comment/CData/PI/Doctype: raw slice, entities undecoded
  std::size_t depth{0};  ///< Element depth at this token (root element has depth 1)
  std::size_t offset{0}; ///< Offset of token start in the decoded stream
  std::size_t line{1};
  std::size_t column{1};
};

/// \brief Tokenizer: non-validating XML lexer over a file, with pull API.
class Tokenizer
{
public:
  /// \brief Opens path and resolves its encoding.
  /// \throws IoError if the file cannot be opened.
  explicit Tokenizer(const std::string &path, const ReaderOptions &opt = ReaderOptions{})
      : _source(path), _opt(opt)
  {
    _chunk.resize(std::max<std::size_t>(_opt.bufferSize, 64));
    start();
  }

  Tokenizer(const Tokenizer &) = delete;
  Tokenizer &operator=(const Tokenizer &) = delete;

  /// \brief Returns the current token after a successful next().
  const Token &current() const { return _token; }

  /// \brief Returns last error pointer if any (nullptr if none).
  const Error *error() const { return _hasError ? &_error : nullptr; }

  /// \brief Resolved input encoding.
  encoding::Encoding encoding() const { return _encoding; }

  /// \brief Current element depth.
  std::size_t depth() const { return _depth; }

  /// \brief Raw bytes read from the file so far.
  std::size_t bytesRead() const { return _source.bytesRead(); }

  /// \brief Decoded bytes currently held in the window.
  std::size_t bufferedBytes() const { return _buf.size(); }

  /// \brief Releases the file handle; later next() calls return false.
  void close()
  {
    _source.close();
    _inputDone = true;
    _emittedEof = true;
  }

  /// \brief Advance to the next token. Returns false on error or when EOF has been emitted.
  bool next()
  {
    if (_hasError || _emittedEof)
    {
      return false;
    }
    if (_opt.maxTotalTokens != 0 && _producedTokens >= _opt.maxTotalTokens)
    {
      return fail(ErrorKind::Limit, "token limit exceeded");
    }

    compact();
    if (_depth == 0 && !skipWhitespaceOutsideRoot())
    {
      return false;
    }
    if (!more())
    {
      return _hasError ? false : emitEof();
    }

    std::size_t startOffset = absolute();
    std::size_t startLine = _line;
    std::size_t startCol = _col;

    if (peek() != '<')
    {
      return readText(startOffset, startLine, startCol);
    }

    // Tag, comment, CDATA, PI, doctype
    advance();
    if (!more())
    {
      return _hasError ? false : fail(ErrorKind::Malformed, "unexpected end after '<'");
    }
    char n = peek();
    if (n == '?')
    {
      advance();
      return readProcessingInstruction(startOffset, startLine, startCol);
    }
    if (n == '!')
    {
      advance();
      if (matchString("--"))
      {
        return readComment(startOffset, startLine, startCol);
      }
      if (matchString("[CDATA["))
      {
        return readCData(startOffset, startLine, startCol);
      }
      if (matchWordCaseInsensitive("DOCTYPE"))
      {
        return readDoctype(startOffset, startLine, startCol);
      }
      return _hasError ? false : fail(ErrorKind::Malformed, "unsupported markup declaration");
    }
    if (n == '/')
    {
      advance();
      return readEndTag(startOffset, startLine, startCol);
    }
    return readStartOrEmptyTag(startOffset, startLine, startCol);
  }

  /// \brief Appends in to out with predefined entities and numeric char refs
  /// decoded. Literal line breaks are normalized to LF; a character reference
  /// such as &#13; is kept as written.
  static bool decodeEntities(std::string_view in, std::string &out, Error *err = nullptr)
  {
    out.reserve(out.size() + in.size());
    for (std::size_t i = 0; i < in.size();)
    {
      std::size_t amp = in.find('&', i);
      if (amp == std::string_view::npos)
      {
        util::appendNormalizedNewlines(out, in.substr(i));
        break;
      }
      util::appendNormalizedNewlines(out, in.substr(i, amp - i));
      std::size_t semi = in.find(';', amp + 1);
      if (semi == std::string_view::npos)
      {
        return entityError(err, amp, "unterminated entity");
      }
      std::string_view ent = in.substr(amp + 1, semi - (amp + 1));
      if (ent == "lt")
        out.push_back('<');
      else if (ent == "gt")
        out.push_back('>');
      else if (ent == "amp")
        out.push_back('&');
      else if (ent == "apos")
        out.push_back('\'');
      else if (ent == "quot")
        out.push_back('"');
      else if (!ent.empty() && ent[0] == '#')
      {
        if (!appendCharRef(ent, out))
        {
          return entityError(err, amp, "invalid character reference");
        }
      }
      else
      {
        return entityError(err, amp, "undefined entity '&" + std::string(ent) + ";'");
      }
      i = semi + 1;
    }
    return true;
  }

private:
  struct Span
  {
    std::size_t start{0};
    std::size_t len{0};
  };

  // ===== Input window =====
  void start()
  {
    // Keep reading until the declaration is complete, even with a read
    // buffer smaller than it.
    std::string head;
    bool ended = false;
    while (!ended && !encoding::detectionReady(head))
    {
      std::size_t n = _source.read(_chunk.data(), _chunk.size());
      if (_source.failed())
      {
        fail(ErrorKind::Io, "read failed: " + _source.lastError());
        return;
      }
      head.append(_chunk.data(), n);
      ended = n == 0;
    }
    encoding::Detection det = encoding::detect(head);
    _encoding = det.encoding;
    if (det.fallback)
    {
      XMLITER_LOG_WARN("Tokenizer: unsupported encoding '" << det.declared << "' in "
                                                           << _source.path()
                                                           << ", decoding as UTF-8");
    }
    if (!_opt.encoding.empty())
    {
      if (auto forced = encoding::fromName(_opt.encoding))
      {
        _encoding = *forced;
      }
      else
      {
        XMLITER_LOG_WARN("Tokenizer: unsupported encoding '" << _opt.encoding
                                                             << "' requested, decoding as UTF-8");
        _encoding = encoding::Encoding::Utf8;
      }
    }
    XMLITER_LOG_DEBUG("Tokenizer: reading " << _source.path() << " as "
                                            << encoding::toString(_encoding));
    _decoder.emplace(_encoding, det.bomLength);
    decodeChunk(std::string_view(head).substr(std::min(det.bomLength, head.size())), ended);
  }

  void decodeChunk(std::string_view raw, bool final)
  {
    Error derr;
    if (!_decoder->decode(raw, final, _buf, derr))
    {
      // Valid output before the bad byte stays usable; the error is raised
      // when the cursor reaches it.
      _pendingError = derr;
      _inputDone = true;
      return;
    }
    if (final)
    {
      _inputDone = true;
      _source.close();
    }
  }

  // Appends decoded input to the window. Returns false when nothing more can
  // be added; error() is set if that was caused by a failure.
  bool fill()
  {
    if (_hasError)
    {
      return false;
    }
    std::size_t before = _buf.size();
    while (_buf.size() == before)
    {
      if (_inputDone)
      {
        if (_pendingError)
        {
          Error e = *_pendingError;
          _pendingError.reset();
          e.line = _line + static_cast<std::size_t>(
                             std::count(_buf.begin() + static_cast<std::ptrdiff_t>(_cur),
                                        _buf.end(), '\n'));
          e.column = 0;
          return raise(e);
        }
        return false;
      }
      std::size_t n = _source.read(_chunk.data(), _chunk.size());
      if (_source.failed())
      {
        return fail(ErrorKind::Io, "read failed: " + _source.lastError());
      }
      decodeChunk(std::string_view(_chunk.data(), n), n == 0);
    }
    return true;
  }

  // Drops consumed text once enough has accumulated.
  void compact()
  {
    if (_cur == _buf.size())
    {
      _base += _cur;
      _buf.clear();
      _cur = 0;
    }
    else if (_cur >= _opt.bufferSize)
    {
      _base += _cur;
      _buf.erase(0, _cur);
      _cur = 0;
    }
  }

  std::size_t absolute() const { return _base + _cur; }

  std::string_view view(const Span &s) const
  {
    return std::string_view(_buf.data() + s.start, s.len);
  }

  // ===== Low-level cursor helpers =====
  bool more() { return _cur < _buf.size() || fill(); }

  char peek() const { return _buf[_cur]; }

  char get()
  {
    char ch = _buf[_cur++];
    if (ch == '\n')
    {
      ++_line;
      _col = 1;
    }
    else
    {
      ++_col;
    }
    return ch;
  }

  void advance() { (void)get(); }

  void advanceTo(std::size_t pos)
  {
    while (_cur < pos)
    {
      advance();
    }
  }

  static bool isSpace(char ch) { return ch == ' ' || ch == '\t' || ch == '\r' || ch == '\n'; }

  static bool isNameStart(char ch)
  {
    return (ch == ':' || ch == '_' || (ch >= 'A' && ch <= 'Z') || (ch >= 'a' && ch <= 'z') ||
            static_cast<unsigned char>(ch) >= 0x80);
  }

  static bool isNameChar(char ch)
  {
    return isNameStart(ch) || (ch == '-' || ch == '.' || (ch >= '0' && ch <= '9'));
  }

  void skipSpaces()
  {
    while (more() && isSpace(peek()))
    {
      advance();
    }
  }

  bool skipWhitespaceOutsideRoot()
  {
    while (more())
    {
      char ch = peek();
      if (isSpace(ch))
      {
        advance();
        continue;
      }
      if (ch == '<')
      {
        return true;
      }
      return fail(ErrorKind::Malformed, _rootClosed ? "junk after document element"
                                                    : "text outside root element");
    }
    return !_hasError;
  }

  bool ensure(std::size_t n)
  {
    while (_buf.size() - _cur < n)
    {
      if (!fill())
      {
        return false;
      }
    }
    return true;
  }

  bool matchString(const char *s)
  {
    std::size_t len = std::char_traits<char>::length(s);
    if (!ensure(len) || _buf.compare(_cur, len, s) != 0)
    {
      return false;
    }
    advanceTo(_cur + len);
    return true;
  }

  bool matchWordCaseInsensitive(const char *s)
  {
    // Matches a word ignoring ASCII case, requires a following whitespace or '>' or '['
    std::size_t len = std::char_traits<char>::length(s);
    if (!ensure(len + 1))
    {
      return false;
    }
    for (std::size_t i = 0; i < len; ++i)
    {
      char a = _buf[_cur + i];
      char b = s[i];
      if (a >= 'a' && a <= 'z')
      {
        a = static_cast<char>(a - 'a' + 'A');
      }
      if (b >= 'a' && b <= 'z')
      {
        b = static_cast<char>(b - 'a' + 'A');
      }
      if (a != b)
      {
        return false;
      }
    }
    char next = _buf[_cur + len];
    if (!(isSpace(next) || next == '>' || next == '['))
    {
      return false;
    }
    advanceTo(_cur + len);
    return true;
  }

  bool readName(Span &out)
  {
    if (!more() || !isNameStart(peek()))
    {
      return false;
    }
    out.start = _cur;
    advance();
    while (more() && isNameChar(peek()))
    {
      advance();
    }
    out.len = _cur - out.start;
    if (out.len > _opt.maxNameLength)
    {
      return fail(ErrorKind::Limit, "name too long");
    }
    return true;
  }

  // Scans to endSeq; out covers the content before it and the cursor moves past it.
  bool readUntil(std::string_view endSeq, Span &out, const char *unterminated)
  {
    std::size_t from = _cur;
    while (true)
    {
      std::size_t pos = _buf.find(endSeq.data(), from, endSeq.size());
      if (pos != std::string::npos)
      {
        out.start = _cur;
        out.len = pos - _cur;
        if (out.len > _opt.maxTextSpan)
        {
          return fail(ErrorKind::Limit, "markup span too large");
        }
        advanceTo(pos + endSeq.size());
        return true;
      }
      if (_buf.size() - _cur > _opt.maxTextSpan)
      {
        return fail(ErrorKind::Limit, "markup span too large");
      }
      if (_buf.size() >= endSeq.size())
      {
        from = std::max(from, _buf.size() - endSeq.size() + 1);
      }
      if (!fill())
      {
        return _hasError ? false : fail(ErrorKind::Malformed, unterminated);
      }
    }
  }

  bool skipQuotedValue()
  {
    if (!more())
    {
      return _hasError ? false : fail(ErrorKind::Malformed, "expected quote");
    }
    char quote = peek();
    if (quote != '"' && quote != '\'')
    {
      return fail(ErrorKind::Malformed, "expected '\"' or '\'' for attribute value");
    }
    advance();
    std::size_t start = _cur;
    while (more() && peek() != quote)
    {
      if (peek() == '<')
      {
        return fail(ErrorKind::Malformed, "'<' in attribute value");
      }
      if (_cur - start >= _opt.maxTextSpan)
      {
        return fail(ErrorKind::Limit, "attribute value too long");
      }
      advance();
    }
    if (!more())
    {
      return _hasError ? false : fail(ErrorKind::Malformed, "unterminated attribute value");
    }
    advance(); // consume closing quote
    return true;
  }

  // Attribute values are never reported; only their syntax is checked.
  bool skipAttributes()
  {
    while (true)
    {
      skipSpaces();
      if (!more())
      {
        return _hasError ? false : fail(ErrorKind::Malformed, "unexpected end in attributes");
      }
      char ch = peek();
      if (ch == '/' || ch == '>')
      {
        return true;
      }
      Span name;
      if (!readName(name))
      {
        return _hasError ? false : fail(ErrorKind::Malformed, "invalid attribute name");
      }
      skipSpaces();
      if (!more() || peek() != '=')
      {
        return _hasError ? false : fail(ErrorKind::Malformed, "expected '=' after attribute name");
      }
      advance();
      skipSpaces();
      if (!skipQuotedValue())
      {
        return false;
      }
    }
  }

  void setToken(TokenKind kind, std::size_t offset, std::size_t line, std::size_t col)
  {
    _token = Token{};
    _token.kind = kind;
    _token.depth = _depth;
    _token.offset = offset;
    _token.line = line;
    _token.column = col;
  }

  bool readProcessingInstruction(std::size_t startOffset, std::size_t startLine,
                                 std::size_t startCol)
  {
    Span target;
    if (!readName(target))
    {
      return _hasError ? false : fail(ErrorKind::Malformed, "invalid PI target");
    }
    Span content;
    if (!readUntil("?>", content, "unterminated processing instruction"))
    {
      return false;
    }

    std::string_view name = view(target);
    bool isXml = name.size() == 3 && (name[0] == 'x' || name[0] == 'X') &&
                 (name[1] == 'm' || name[1] == 'M') && (name[2] == 'l' || name[2] == 'L');
    if (isXml && (startOffset != 0 || name != "xml"))
    {
      return fail(ErrorKind::Malformed, "XML or text declaration not at start of entity");
    }
    setToken(isXml ? TokenKind::XmlDecl : TokenKind::ProcessingInstruction, startOffset,
             startLine, startCol);
    _token.name = name;
    _token.text = view(content);
    return produced();
  }

  bool readComment(std::size_t startOffset, std::size_t startLine, std::size_t startCol)
  {
    Span body;
    if (!readUntil("-->", body, "unterminated comment"))
    {
      return false;
    }
    setToken(TokenKind::Comment, startOffset, startLine, startCol);
    _token.text = view(body);
    return produced();
  }

  bool readCData(std::size_t startOffset, std::size_t startLine, std::size_t startCol)
  {
    if (_depth == 0)
    {
      return fail(ErrorKind::Malformed, "CDATA section outside root element");
    }
    Span body;
    if (!readUntil("]]>", body, "unterminated CDATA"))
    {
      return false;
    }
    setToken(TokenKind::CData, startOffset, startLine, startCol);
    _token.text = view(body);
    return produced();
  }

  bool readDoctype(std::size_t startOffset, std::size_t startLine, std::size_t startCol)
  {
    if (_rootSeen)
    {
      return fail(ErrorKind::Malformed, "DOCTYPE after root element");
    }
    // Up to the next '>' outside the internal subset
    std::size_t start = _cur;
    int bracket = 0;
    while (true)
    {
      if (!more())
      {
        return _hasError ? false : fail(ErrorKind::Malformed, "unterminated doctype");
      }
      char ch = peek();
      if (ch == '[')
      {
        ++bracket;
      }
      else if (ch == ']' && bracket > 0)
      {
        --bracket;
      }
      else if (ch == '>' && bracket == 0)
      {
        break;
      }
      if (_cur - start >= _opt.maxTextSpan)
      {
        return fail(ErrorKind::Limit, "doctype too large");
      }
      advance();
    }
    Span body{start, _cur - start};
    advance(); // '>'
    setToken(TokenKind::Doctype, startOffset, startLine, startCol);
    _token.text = view(body);
    return produced();
  }

  bool readEndTag(std::size_t startOffset, std::size_t startLine, std::size_t startCol)
  {
    Span name;
    if (!readName(name))
    {
      return _hasError ? false : fail(ErrorKind::Malformed, "invalid end tag name");
    }
    skipSpaces();
    if (!more() || peek() != '>')
    {
      return _hasError ? false : fail(ErrorKind::Malformed, "expected '>' after end tag name");
    }
    advance();
    if (_depth == 0)
    {
      return fail(ErrorKind::Malformed, "end tag without matching start tag");
    }

    setToken(TokenKind::EndElement, startOffset, startLine, startCol);
    _token.name = view(name);
    --_depth;
    if (_depth == 0)
    {
      _rootClosed = true;
    }
    return produced();
  }

  bool readStartOrEmptyTag(std::size_t startOffset, std::size_t startLine, std::size_t startCol)
  {
    Span name;
    if (!readName(name))
    {
      return _hasError ? false : fail(ErrorKind::Malformed, "invalid start tag name");
    }
    if (!skipAttributes())
    {
      return false;
    }

    bool empty = false;
    if (peek() == '/')
    {
      empty = true;
      advance();
    }
    if (!more() || peek() != '>')
    {
      return _hasError ? false : fail(ErrorKind::Malformed, "expected '>' to end start tag");
    }
    advance();

    if (_depth == 0 && _rootClosed)
    {
      return fail(ErrorKind::Malformed, "junk after document element");
    }
    if (_opt.maxDepth != 0 && _depth + 1 > _opt.maxDepth)
    {
      return fail(ErrorKind::Limit, "maximum element depth exceeded");
    }
    _rootSeen = true;

    ++_depth;
    setToken(empty ? TokenKind::EmptyElement : TokenKind::StartElement, startOffset, startLine,
             startCol);
    _token.name = view(name);
    if (empty)
    {
      // Depth returns to previous because it's empty
      --_depth;
      if (_depth == 0)
      {
        _rootClosed = true;
      }
    }
    return produced();
  }

  bool readText(std::size_t startOffset, std::size_t startLine, std::size_t startCol)
  {
    std::size_t start = _cur;
    while (more() && peek() != '<')
    {
      if ((_cur - start) >= _opt.maxTextSpan)
      {
        return fail(ErrorKind::Limit, "text span too large");
      }
      advance();
    }
    if (_hasError)
    {
      return false;
    }
    setToken(TokenKind::Text, startOffset, startLine, startCol);
    _token.text = view(Span{start, _cur - start});
    return produced();
  }

  bool emitEof()
  {
    if (!_rootSeen)
    {
      return fail(ErrorKind::Malformed, "no element found");
    }
    setToken(TokenKind::Eof, absolute(), _line, _col);
    _emittedEof = true;
    _source.close();
    return false;
  }

  bool produced()
  {
    ++_producedTokens;
    return true;
  }

  bool fail(ErrorKind kind, const std::string &msg)
  {
    Error e;
    e.kind = kind;
    e.offset = absolute();
    e.line = _line;
    e.column = _col;
    e.message = msg;
    return raise(e);
  }

  bool raise(const Error &e)
  {
    _hasError = true;
    _error = e;
    _token = Token{};
    _source.close();
#if XMLITER_THROW_ON_ERROR
    throw ParseError(_error);
#endif
    return false;
  }

  static bool entityError(Error *err, std::size_t at, const std::string &msg)
  {
    if (err)
    {
      *err = Error{ErrorKind::Malformed, at, 0, 0, msg};
    }
    return false;
  }

  // Append a numeric char ref (e.g. "#10" or "#x1F4A9") to out as UTF-8.
  static bool appendCharRef(std::string_view entBody, std::string &out)
  {
    // entBody starts with '#'
    if (entBody.size() < 2)
    {
      return false;
    }
    uint32_t code = 0;
    bool hex = entBody[1] == 'x' || entBody[1] == 'X';
    std::size_t first = hex ? 2 : 1;
    if (first >= entBody.size())
    {
      return false;
    }
    for (std::size_t i = first; i < entBody.size(); ++i)
    {
      char c = entBody[i];
      uint32_t v = 0;
      if (c >= '0' && c <= '9')
      {
        v = static_cast<uint32_t>(c - '0');
      }
      else if (hex && c >= 'a' && c <= 'f')
      {
        v = static_cast<uint32_t>(c - 'a' + 10);
      }
      else if (hex && c >= 'A' && c <= 'F')
      {
        v = static_cast<uint32_t>(c - 'A' + 10);
      }
      else
      {
        return false;
      }
      code = hex ? ((code << 4) | v) : (code * 10u + v);
      if (code > 0x10FFFFu)
      {
        return false;
      }
    }
    return encoding::isXmlChar(code) && encoding::appendUtf8(code, out);
  }

private:
  io::FileSource _source;
  ReaderOptions _opt{};
  std::vector<char> _chunk;
  std::optional<encoding::Decoder> _decoder;
  encoding::Encoding _encoding{encoding::Encoding::Utf8};
  std::optional<Error> _pendingError;
  bool _inputDone{false};

  std::string _buf;     ///< Decoded UTF-8 window
  std::size_t _base{0}; ///< Decoded offset of _buf[0]
  std::size_t _cur{0};
  std::size_t _line{1};
  std::size_t _col{1};
  std::size_t _depth{0};
  bool _rootSeen{false};
  bool _rootClosed{false};

  Token _token{};

  bool _hasError{false};
  Error _error{};
  bool _emittedEof{false};
  std::size_t _producedTokens{0};
};

} // namespace xml
} // namespace parsers
} // namespace xmliter
