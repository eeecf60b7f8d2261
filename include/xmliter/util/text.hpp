// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Xmliter, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace xmliter
{
namespace util
{

/// \brief True for code points Python's str.isspace() accepts; xmltodict
/// strips text with str.strip(), so leaf values follow the same set.
inline bool isUnicodeSpace(uint32_t cp)
{
  return (cp >= 0x09u && cp <= 0x0Du) || (cp >= 0x1Cu && cp <= 0x20u) || cp == 0x85u ||
         cp == 0xA0u || cp == 0x1680u || (cp >= 0x2000u && cp <= 0x200Au) || cp == 0x2028u ||
         cp == 0x2029u || cp == 0x202Fu || cp == 0x205Fu || cp == 0x3000u;
}

namespace detail
{
  // Decodes the UTF-8 sequence starting at s[i]; len receives its length.
  // Input is already validated by the decoder.
  inline uint32_t codePointAt(std::string_view s, std::size_t i, std::size_t &len)
  {
    unsigned char c = static_cast<unsigned char>(s[i]);
    if (c < 0x80u)
    {
      len = 1;
      return c;
    }
    uint32_t cp = 0;
    if ((c & 0xE0u) == 0xC0u)
    {
      len = 2;
      cp = c & 0x1Fu;
    }
    else if ((c & 0xF0u) == 0xE0u)
    {
      len = 3;
      cp = c & 0x0Fu;
    }
    else
    {
      len = 4;
      cp = c & 0x07u;
    }
    for (std::size_t k = 1; k < len && i + k < s.size(); ++k)
    {
      cp = (cp << 6) | (static_cast<unsigned char>(s[i + k]) & 0x3Fu);
    }
    return cp;
  }
} // namespace detail

/// \brief Strips leading and trailing Unicode whitespace from UTF-8 text.
inline std::string_view trimWhitespace(std::string_view s)
{
  std::size_t begin = 0;
  while (begin < s.size())
  {
    std::size_t len = 1;
    if (!isUnicodeSpace(detail::codePointAt(s, begin, len)))
    {
      break;
    }
    begin += len;
  }

  std::size_t end = s.size();
  while (end > begin)
  {
    // Back up to the lead byte of the last sequence.
    std::size_t lead = end - 1;
    while (lead > begin && (static_cast<unsigned char>(s[lead]) & 0xC0u) == 0x80u)
    {
      --lead;
    }
    std::size_t len = 1;
    if (!isUnicodeSpace(detail::codePointAt(s, lead, len)))
    {
      break;
    }
    end = lead;
  }
  return s.substr(begin, end - begin);
}

/// \brief Appends in to out with XML end-of-line handling applied: CRLF and
/// a lone CR both become LF.
inline void appendNormalizedNewlines(std::string &out, std::string_view in)
{
  std::size_t i = 0;
  while (i < in.size())
  {
    std::size_t cr = in.find('\r', i);
    if (cr == std::string_view::npos)
    {
      out.append(in.data() + i, in.size() - i);
      break;
    }
    out.append(in.data() + i, cr - i);
    out.push_back('\n');
    i = cr + 1;
    if (i < in.size() && in[i] == '\n')
    {
      ++i;
    }
  }
}

} // namespace util
} // namespace xmliter
