// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Xmliter, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <cstddef>
#include <memory>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <utility>
#include <variant>
#include <vector>

namespace xmliter
{

class Node;
class NodeMap;
using NodeList = std::vector<Node>;

enum class NodeType
{
  Null,
  Leaf,
  List,
  Map
};

/// \brief Value produced by the dict reducer: null, a text leaf, a list of
/// repeated siblings or a map of child elements.
class Node
{
public:
  Node() = default;

  static Node leaf(std::string text)
  {
    Node n;
    n._v = std::move(text);
    return n;
  }

  static Node list(NodeList items = {})
  {
    Node n;
    n._v = std::make_shared<NodeList>(std::move(items));
    return n;
  }

  static Node map();

  NodeType type() const { return static_cast<NodeType>(_v.index()); }
  bool isNull() const { return type() == NodeType::Null; }
  bool isLeaf() const { return type() == NodeType::Leaf; }
  bool isList() const { return type() == NodeType::List; }
  bool isMap() const { return type() == NodeType::Map; }

  const std::string &asLeaf() const
  {
    if (!isLeaf())
      throw std::runtime_error("node is not a leaf");
    return std::get<std::string>(_v);
  }

  const NodeList &asList() const
  {
    if (!isList())
      throw std::runtime_error("node is not a list");
    return *std::get<std::shared_ptr<NodeList>>(_v);
  }

  NodeList &asList()
  {
    if (!isList())
      throw std::runtime_error("node is not a list");
    return *std::get<std::shared_ptr<NodeList>>(_v);
  }

  const NodeMap &asMap() const;
  NodeMap &asMap();

  /// \brief Map lookup; throws std::out_of_range if the key is missing.
  const Node &get(const std::string &key) const;

  /// \brief List element access with bounds checking.
  const Node &at(std::size_t i) const { return asList().at(i); }

  /// \brief Number of list items or map entries; 0 for null and leaves.
  std::size_t size() const;

  bool operator==(const Node &other) const;
  bool operator!=(const Node &other) const { return !(*this == other); }

private:
  std::variant<std::monostate, std::string, std::shared_ptr<NodeList>, std::shared_ptr<NodeMap>> _v;
};

/// \brief Insertion-ordered string to Node mapping.
class NodeMap
{
public:
  using Entry = std::pair<std::string, Node>;
  using const_iterator = std::vector<Entry>::const_iterator;

  const Node *find(const std::string &key) const
  {
    auto it = _index.find(key);
    return it == _index.end() ? nullptr : &_entries[it->second].second;
  }

  bool contains(const std::string &key) const { return _index.count(key) != 0; }

  /// \brief Adds value under key. A second value for the same key turns the
  /// entry into a list; later values are appended to it.
  void attach(const std::string &key, Node value)
  {
    auto it = _index.find(key);
    if (it == _index.end())
    {
      _index.emplace(key, _entries.size());
      _entries.emplace_back(key, std::move(value));
      return;
    }
    Node &slot = _entries[it->second].second;
    if (slot.isList())
    {
      slot.asList().push_back(std::move(value));
      return;
    }
    NodeList items;
    items.reserve(2);
    items.push_back(std::move(slot));
    items.push_back(std::move(value));
    slot = Node::list(std::move(items));
  }

  std::size_t size() const { return _entries.size(); }
  bool empty() const { return _entries.empty(); }
  const_iterator begin() const { return _entries.begin(); }
  const_iterator end() const { return _entries.end(); }

  // Order of entries does not take part in equality.
  bool operator==(const NodeMap &other) const
  {
    if (_entries.size() != other._entries.size())
    {
      return false;
    }
    for (const auto &entry : _entries)
    {
      const Node *theirs = other.find(entry.first);
      if (!theirs || !(entry.second == *theirs))
      {
        return false;
      }
    }
    return true;
  }

private:
  std::vector<Entry> _entries;
  std::unordered_map<std::string, std::size_t> _index;
};

inline Node Node::map()
{
  Node n;
  n._v = std::make_shared<NodeMap>();
  return n;
}

inline const NodeMap &Node::asMap() const
{
  if (!isMap())
    throw std::runtime_error("node is not a map");
  return *std::get<std::shared_ptr<NodeMap>>(_v);
}

inline NodeMap &Node::asMap()
{
  if (!isMap())
    throw std::runtime_error("node is not a map");
  return *std::get<std::shared_ptr<NodeMap>>(_v);
}

inline const Node &Node::get(const std::string &key) const
{
  const Node *n = asMap().find(key);
  if (!n)
  {
    throw std::out_of_range("no such key: " + key);
  }
  return *n;
}

inline std::size_t Node::size() const
{
  switch (type())
  {
  case NodeType::List:
    return asList().size();
  case NodeType::Map:
    return asMap().size();
  default:
    return 0;
  }
}

inline bool Node::operator==(const Node &other) const
{
  if (type() != other.type())
  {
    return false;
  }
  switch (type())
  {
  case NodeType::Null:
    return true;
  case NodeType::Leaf:
    return asLeaf() == other.asLeaf();
  case NodeType::List:
    return asList() == other.asList();
  case NodeType::Map:
    return asMap() == other.asMap();
  }
  return false;
}

} // namespace xmliter
