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

namespace xmliter
{
/// \brief Tokenizer and event stream configuration and safety limits.
struct ReaderOptions
{
  std::size_t bufferSize{64 * 1024}; ///< Bytes requested from the file per read
  std::size_t maxDepth{0};           ///< Max element nesting depth; 0=unbounded
  std::size_t maxNameLength{1024};   ///< Max length of element or attribute names
  std::size_t maxTextSpan{16u << 20}; ///< Max text run, CDATA, comment or PI in bytes
  std::size_t maxTotalTokens{0};     ///< 0=unbounded; otherwise cap total tokens
  bool trimText{false};              ///< Trim text runs and drop whitespace-only ones
  bool stripNamespacePrefix{false};  ///< Report "ns:tag" as "tag"
  std::string encoding;              ///< Forced encoding label; empty=detect
};

/// \brief Limits applied by the dict reducer on top of the event stream.
struct ReduceOptions
{
  std::uint64_t maxEvents{0}; ///< Stop after this many events; 0=unbounded
  std::size_t maxDepth{0};    ///< Drop elements nested deeper than this; 0=unbounded
};

} // namespace xmliter
