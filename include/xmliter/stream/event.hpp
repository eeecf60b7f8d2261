// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Xmliter, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <cstdint>
#include <ostream>
#include <string>

namespace xmliter
{

enum class EventKind
{
  Start,
  End,
  Text,
  Empty
};

inline const char *toString(EventKind kind)
{
  switch (kind)
  {
  case EventKind::Start:
    return "start";
  case EventKind::End:
    return "end";
  case EventKind::Text:
    return "text";
  case EventKind::Empty:
    return "empty";
  default:
    return "unknown";
  }
}

/// \brief One structural event. index starts at 0 and grows by one per event
/// of a stream; value is the tag name, or the character data for Text.
struct Event
{
  std::uint64_t index{0};
  EventKind kind{EventKind::Start};
  std::string value;
};

inline bool operator==(const Event &a, const Event &b)
{
  return a.index == b.index && a.kind == b.kind && a.value == b.value;
}

inline bool operator!=(const Event &a, const Event &b) { return !(a == b); }

inline std::ostream &operator<<(std::ostream &os, const Event &ev)
{
  return os << "(" << ev.index << ", " << toString(ev.kind) << ", \"" << ev.value << "\")";
}

} // namespace xmliter
