// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Xmliter, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <xmliter/core/json.hpp>
#include <xmliter/reduce/node.hpp>
#include <ostream>

namespace xmliter
{

/// \brief Renders a node the way json.dumps renders xmltodict output: null,
/// string, array, or object in document order.
inline core::Json toJson(const Node &node)
{
  switch (node.type())
  {
  case NodeType::Leaf:
    return core::Json(node.asLeaf());
  case NodeType::List:
  {
    core::Json arr = core::Json::array();
    for (const Node &item : node.asList())
    {
      arr.push_back(toJson(item));
    }
    return arr;
  }
  case NodeType::Map:
  {
    core::Json obj = core::Json::object();
    for (const auto &entry : node.asMap())
    {
      obj[entry.first] = toJson(entry.second);
    }
    return obj;
  }
  default:
    return core::Json(nullptr);
  }
}

inline std::ostream &operator<<(std::ostream &os, const Node &node)
{
  return os << toJson(node).dump();
}

} // namespace xmliter
