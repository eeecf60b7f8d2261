// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Xmliter, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once
/// \file decoder.hpp
/// \brief Encoding detection and incremental transcoding of raw input bytes
/// to UTF-8.
///
/// Detection order: byte-order mark, UTF-16 byte pattern of "<?", the
/// encoding pseudo-attribute of the XML declaration, then UTF-8. A declared
/// encoding that is not supported resolves to UTF-8 and is flagged so the
/// caller can warn about it.

#include <xmliter/error.hpp>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace xmliter
{
namespace encoding
{

enum class Encoding
{
  Utf8,
  Utf16LE,
  Utf16BE,
  Latin1,
  Ascii
};

inline const char *toString(Encoding enc)
{
  switch (enc)
  {
  case Encoding::Utf8:
    return "UTF-8";
  case Encoding::Utf16LE:
    return "UTF-16LE";
  case Encoding::Utf16BE:
    return "UTF-16BE";
  case Encoding::Latin1:
    return "ISO-8859-1";
  case Encoding::Ascii:
    return "US-ASCII";
  default:
    return "unknown";
  }
}

/// \brief Maps an encoding label (any case) to a supported encoding.
/// "UTF-16" without byte order resolves to little endian.
inline std::optional<Encoding> fromName(std::string_view name)
{
  std::string v;
  v.reserve(name.size());
  for (char c : name)
  {
    if (c >= 'a' && c <= 'z')
    {
      c = static_cast<char>(c - 'a' + 'A');
    }
    if (c == '_')
    {
      c = '-';
    }
    v.push_back(c);
  }
  if (v == "UTF-8" || v == "UTF8")
  {
    return Encoding::Utf8;
  }
  if (v == "US-ASCII" || v == "ASCII")
  {
    return Encoding::Ascii;
  }
  if (v == "ISO-8859-1" || v == "LATIN1" || v == "LATIN-1" || v == "ISO8859-1")
  {
    return Encoding::Latin1;
  }
  if (v == "UTF-16" || v == "UTF-16LE")
  {
    return Encoding::Utf16LE;
  }
  if (v == "UTF-16BE")
  {
    return Encoding::Utf16BE;
  }
  return std::nullopt;
}

/// \brief Appends code point cp to out as UTF-8. Returns false for surrogate
/// halves and values above U+10FFFF.
inline bool appendUtf8(uint32_t cp, std::string &out)
{
  if (cp <= 0x7Fu)
  {
    out.push_back(static_cast<char>(cp));
  }
  else if (cp <= 0x7FFu)
  {
    out.push_back(static_cast<char>(0xC0u | ((cp >> 6) & 0x1Fu)));
    out.push_back(static_cast<char>(0x80u | (cp & 0x3Fu)));
  }
  else if (cp <= 0xFFFFu)
  {
    if (cp >= 0xD800u && cp <= 0xDFFFu)
    {
      return false;
    }
    out.push_back(static_cast<char>(0xE0u | ((cp >> 12) & 0x0Fu)));
    out.push_back(static_cast<char>(0x80u | ((cp >> 6) & 0x3Fu)));
    out.push_back(static_cast<char>(0x80u | (cp & 0x3Fu)));
  }
  else if (cp <= 0x10FFFFu)
  {
    out.push_back(static_cast<char>(0xF0u | ((cp >> 18) & 0x07u)));
    out.push_back(static_cast<char>(0x80u | ((cp >> 12) & 0x3Fu)));
    out.push_back(static_cast<char>(0x80u | ((cp >> 6) & 0x3Fu)));
    out.push_back(static_cast<char>(0x80u | (cp & 0x3Fu)));
  }
  else
  {
    return false;
  }
  return true;
}

/// \brief True for code points XML 1.0 allows in a document.
inline bool isXmlChar(uint32_t cp)
{
  if (cp < 0x20u)
  {
    return cp == 0x9u || cp == 0xAu || cp == 0xDu;
  }
  return (cp <= 0xD7FFu) || (cp >= 0xE000u && cp <= 0xFFFDu) ||
         (cp >= 0x10000u && cp <= 0x10FFFFu);
}

/// \brief Extracts the encoding pseudo-attribute from an ASCII-compatible
/// XML declaration at the start of head. Empty when there is none.
inline std::string_view declaredEncoding(std::string_view head)
{
  if (head.substr(0, 5) != "<?xml")
  {
    return {};
  }
  std::size_t end = head.find("?>");
  if (end == std::string_view::npos)
  {
    return {};
  }
  std::string_view decl = head.substr(0, end);
  std::size_t pos = decl.find("encoding");
  if (pos == std::string_view::npos)
  {
    return {};
  }
  pos += 8;
  while (pos < decl.size() && (decl[pos] == ' ' || decl[pos] == '\t' || decl[pos] == '\r' ||
                               decl[pos] == '\n'))
  {
    ++pos;
  }
  if (pos >= decl.size() || decl[pos] != '=')
  {
    return {};
  }
  ++pos;
  while (pos < decl.size() && (decl[pos] == ' ' || decl[pos] == '\t'))
  {
    ++pos;
  }
  if (pos >= decl.size() || (decl[pos] != '"' && decl[pos] != '\''))
  {
    return {};
  }
  char quote = decl[pos++];
  std::size_t close = decl.find(quote, pos);
  if (close == std::string_view::npos)
  {
    return {};
  }
  return decl.substr(pos, close - pos);
}

/// \brief Longest input prefix examined for an XML declaration.
constexpr std::size_t kMaxDetectionBytes = 1024;

/// \brief True once head holds enough of the input for detect() to decide:
/// a byte-order mark or UTF-16 pattern is visible, the input cannot start
/// with an XML declaration, or the declaration is complete.
inline bool detectionReady(std::string_view head)
{
  if (head.size() >= kMaxDetectionBytes)
  {
    return true;
  }
  if (head.size() < 4)
  {
    return false;
  }
  constexpr std::string_view decl = "<?xml";
  if (head.size() < decl.size())
  {
    return head != decl.substr(0, head.size());
  }
  if (head.substr(0, decl.size()) != decl)
  {
    return true;
  }
  return head.find("?>") != std::string_view::npos;
}

/// \brief Outcome of encoding detection.
struct Detection
{
  Encoding encoding{Encoding::Utf8};
  std::size_t bomLength{0};  ///< Bytes to skip before decoding
  std::string declared;      ///< Label from the XML declaration, if any
  bool fallback{false};      ///< Declared label was unsupported; UTF-8 used instead
};

/// \brief Resolves the encoding from the first bytes of the input.
inline Detection detect(std::string_view head)
{
  Detection d;
  auto byte = [&](std::size_t i) { return static_cast<unsigned char>(head[i]); };

  if (head.size() >= 3 && byte(0) == 0xEF && byte(1) == 0xBB && byte(2) == 0xBF)
  {
    d.encoding = Encoding::Utf8;
    d.bomLength = 3;
    return d;
  }
  if (head.size() >= 2 && byte(0) == 0xFF && byte(1) == 0xFE)
  {
    d.encoding = Encoding::Utf16LE;
    d.bomLength = 2;
    return d;
  }
  if (head.size() >= 2 && byte(0) == 0xFE && byte(1) == 0xFF)
  {
    d.encoding = Encoding::Utf16BE;
    d.bomLength = 2;
    return d;
  }
  if (head.size() >= 4 && byte(0) == '<' && byte(1) == 0 && byte(2) == '?' && byte(3) == 0)
  {
    d.encoding = Encoding::Utf16LE;
    return d;
  }
  if (head.size() >= 4 && byte(0) == 0 && byte(1) == '<' && byte(2) == 0 && byte(3) == '?')
  {
    d.encoding = Encoding::Utf16BE;
    return d;
  }

  std::string_view label = declaredEncoding(head);
  if (label.empty())
  {
    return d;
  }
  d.declared = std::string(label);
  auto enc = fromName(label);
  // A UTF-16 label on ASCII-compatible bytes cannot be right.
  if (!enc || *enc == Encoding::Utf16LE || *enc == Encoding::Utf16BE)
  {
    d.fallback = true;
    return d;
  }
  d.encoding = *enc;
  return d;
}

/// \brief Incremental decoder from one encoding to UTF-8. Input may be split
/// at any byte; incomplete sequences are carried to the next call.
class Decoder
{
public:
  /// \param baseOffset raw byte offset of the first byte passed to decode()
  explicit Decoder(Encoding enc, std::size_t baseOffset = 0) : _enc(enc), _base(baseOffset) {}

  Encoding encoding() const { return _enc; }

  /// \brief Decodes data and appends UTF-8 to out.
  /// \param final true when no more input follows
  /// \return false with err filled on an invalid byte sequence or character
  bool decode(std::string_view data, bool final, std::string &out, Error &err)
  {
    std::string joined;
    if (!_carry.empty())
    {
      joined.reserve(_carry.size() + data.size());
      joined.append(_carry);
      joined.append(data.data(), data.size());
      _carry.clear();
      data = joined;
    }

    std::size_t used = 0;
    bool ok = false;
    switch (_enc)
    {
    case Encoding::Utf8:
      ok = decodeUtf8(data, final, out, err, used);
      break;
    case Encoding::Utf16LE:
    case Encoding::Utf16BE:
      ok = decodeUtf16(data, final, out, err, used);
      break;
    case Encoding::Latin1:
    case Encoding::Ascii:
      ok = decodeSingleByte(data, out, err, used);
      break;
    }
    if (!ok)
    {
      return false;
    }
    _carry.assign(data.data() + used, data.size() - used);
    _base += used;
    return true;
  }

private:
  Encoding _enc;
  std::size_t _base;  ///< Raw offset of the first byte not yet consumed
  std::string _carry; ///< Incomplete trailing sequence from the previous call

  bool fail(Error &err, std::size_t at, ErrorKind kind, const char *msg)
  {
    err = Error{};
    err.kind = kind;
    err.offset = _base + at;
    err.line = 0;
    err.column = 0;
    err.message = std::string(msg) + " for " + toString(_enc);
    return false;
  }

  bool emit(uint32_t cp, std::string &out, Error &err, std::size_t at)
  {
    if (!isXmlChar(cp))
    {
      return fail(err, at, ErrorKind::Malformed, "invalid XML character");
    }
    appendUtf8(cp, out);
    return true;
  }

  bool decodeUtf8(std::string_view in, bool final, std::string &out, Error &err,
                  std::size_t &used)
  {
    out.reserve(out.size() + in.size());
    std::size_t i = 0;
    while (i < in.size())
    {
      unsigned char c = static_cast<unsigned char>(in[i]);
      if (c < 0x80)
      {
        if (c < 0x20 && c != '\t' && c != '\n' && c != '\r')
        {
          return fail(err, i, ErrorKind::Malformed, "invalid XML character");
        }
        out.push_back(static_cast<char>(c));
        ++i;
        continue;
      }

      std::size_t len = 0;
      uint32_t cp = 0;
      uint32_t min = 0;
      if ((c & 0xE0u) == 0xC0u)
      {
        len = 2;
        cp = c & 0x1Fu;
        min = 0x80u;
      }
      else if ((c & 0xF0u) == 0xE0u)
      {
        len = 3;
        cp = c & 0x0Fu;
        min = 0x800u;
      }
      else if ((c & 0xF8u) == 0xF0u)
      {
        len = 4;
        cp = c & 0x07u;
        min = 0x10000u;
      }
      else
      {
        return fail(err, i, ErrorKind::Decode, "invalid lead byte");
      }

      if (i + len > in.size())
      {
        // Check what is there so a bad sequence is reported now, not later.
        for (std::size_t k = i + 1; k < in.size(); ++k)
        {
          if ((static_cast<unsigned char>(in[k]) & 0xC0u) != 0x80u)
          {
            return fail(err, i, ErrorKind::Decode, "invalid continuation byte");
          }
        }
        if (final)
        {
          return fail(err, i, ErrorKind::Decode, "truncated byte sequence");
        }
        break;
      }
      for (std::size_t k = 1; k < len; ++k)
      {
        unsigned char cc = static_cast<unsigned char>(in[i + k]);
        if ((cc & 0xC0u) != 0x80u)
        {
          return fail(err, i, ErrorKind::Decode, "invalid continuation byte");
        }
        cp = (cp << 6) | (cc & 0x3Fu);
      }
      if (cp < min || cp > 0x10FFFFu || (cp >= 0xD800u && cp <= 0xDFFFu))
      {
        return fail(err, i, ErrorKind::Decode, "invalid code point");
      }
      if (!isXmlChar(cp))
      {
        return fail(err, i, ErrorKind::Malformed, "invalid XML character");
      }
      out.append(in.data() + i, len);
      i += len;
    }
    used = i;
    return true;
  }

  bool decodeUtf16(std::string_view in, bool final, std::string &out, Error &err,
                   std::size_t &used)
  {
    const bool little = _enc == Encoding::Utf16LE;
    auto unit = [&](std::size_t at) -> uint32_t
    {
      uint32_t a = static_cast<unsigned char>(in[at]);
      uint32_t b = static_cast<unsigned char>(in[at + 1]);
      return little ? (a | (b << 8)) : ((a << 8) | b);
    };

    std::size_t i = 0;
    while (i + 2 <= in.size())
    {
      uint32_t u = unit(i);
      if (u >= 0xD800u && u <= 0xDBFFu)
      {
        if (i + 4 > in.size())
        {
          break;
        }
        uint32_t lo = unit(i + 2);
        if (lo < 0xDC00u || lo > 0xDFFFu)
        {
          return fail(err, i, ErrorKind::Decode, "unpaired surrogate");
        }
        if (!emit(0x10000u + ((u - 0xD800u) << 10) + (lo - 0xDC00u), out, err, i))
        {
          return false;
        }
        i += 4;
        continue;
      }
      if (u >= 0xDC00u && u <= 0xDFFFu)
      {
        return fail(err, i, ErrorKind::Decode, "unpaired surrogate");
      }
      if (!emit(u, out, err, i))
      {
        return false;
      }
      i += 2;
    }
    if (final && i < in.size())
    {
      return fail(err, i, ErrorKind::Decode, "truncated code unit");
    }
    used = i;
    return true;
  }

  bool decodeSingleByte(std::string_view in, std::string &out, Error &err, std::size_t &used)
  {
    out.reserve(out.size() + in.size());
    for (std::size_t i = 0; i < in.size(); ++i)
    {
      uint32_t c = static_cast<unsigned char>(in[i]);
      if (c >= 0x80u && _enc == Encoding::Ascii)
      {
        return fail(err, i, ErrorKind::Decode, "byte outside 7-bit range");
      }
      if (!emit(c, out, err, i))
      {
        return false;
      }
    }
    used = in.size();
    return true;
  }
};

} // namespace encoding
} // namespace xmliter
