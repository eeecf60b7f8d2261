// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Xmliter, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <cctype>
#include <cstdint>
#include <fstream>
#include <map>
#include <memory>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>

namespace xmliter
{
namespace parsers
{
namespace toml
{

/// \brief Subset of TOML sufficient for configuration files: [section] and
/// [dotted.section] headers, bare or dotted keys, basic and literal strings,
/// integers, booleans and '#' comments.

class table;

using value_type =
    std::variant<std::monostate, int64_t, bool, std::string, std::shared_ptr<table>>;

/// \brief Thrown on syntax errors; message includes the 1-based line number.
class parse_error : public std::runtime_error
{
public:
  parse_error(const std::string &what, std::size_t line)
      : std::runtime_error("line " + std::to_string(line) + ": " + what), _line(line)
  {
  }

  std::size_t line() const { return _line; }

private:
  std::size_t _line;
};

class node
{
public:
  node() = default;
  node(value_type val) : _value(std::move(val)) {}

  bool is_value() const
  {
    return !std::holds_alternative<std::monostate>(_value) && !is_table();
  }
  bool is_string() const { return std::holds_alternative<std::string>(_value); }
  bool is_integer() const { return std::holds_alternative<int64_t>(_value); }
  bool is_boolean() const { return std::holds_alternative<bool>(_value); }
  bool is_table() const { return std::holds_alternative<std::shared_ptr<table>>(_value); }

  /// \brief Typed access; no conversion between types.
  template <typename T> std::optional<T> as() const
  {
    if (auto *val = std::get_if<T>(&_value))
    {
      return *val;
    }
    return std::nullopt;
  }

  const table *as_table() const
  {
    auto *val = std::get_if<std::shared_ptr<table>>(&_value);
    return val ? val->get() : nullptr;
  }

  table *as_table()
  {
    auto *val = std::get_if<std::shared_ptr<table>>(&_value);
    return val ? val->get() : nullptr;
  }

  explicit operator bool() const { return !std::holds_alternative<std::monostate>(_value); }

  const value_type &get_value() const { return _value; }

private:
  value_type _value;
};

class table
{
public:
  using container_type = std::map<std::string, node>;
  using const_iterator = container_type::const_iterator;

  bool contains(const std::string &key) const { return _values.count(key) != 0; }
  bool empty() const { return _values.empty(); }
  std::size_t size() const { return _values.size(); }

  const_iterator begin() const { return _values.begin(); }
  const_iterator end() const { return _values.end(); }

  node &operator[](const std::string &key) { return _values[key]; }

  /// \brief Look up "a.b.c"; returns an empty node when any part is missing.
  node at_path(const std::string &dottedPath) const
  {
    const table *current = this;
    std::size_t start = 0;
    while (current)
    {
      std::size_t dot = dottedPath.find('.', start);
      std::string part = dottedPath.substr(start, dot == std::string::npos ? dot : dot - start);
      auto it = current->_values.find(part);
      if (it == current->_values.end())
      {
        return node();
      }
      if (dot == std::string::npos)
      {
        return it->second;
      }
      current = it->second.as_table();
      start = dot + 1;
    }
    return node();
  }

  /// \brief Returns the sub-table for key, creating it when absent.
  table &subtable(const std::string &key, std::size_t line)
  {
    node &n = _values[key];
    if (!n)
    {
      n = node(std::make_shared<table>());
    }
    table *t = n.as_table();
    if (!t)
    {
      throw parse_error("key '" + key + "' is not a table", line);
    }
    return *t;
  }

private:
  container_type _values;
};

class parser
{
public:
  explicit parser(std::string input) : _input(std::move(input)) {}

  table parse()
  {
    table root;
    table *current = &root;
    while (true)
    {
      skipBlank();
      if (isEnd())
      {
        break;
      }
      if (peek() == '[')
      {
        current = &resolve(root, parseHeader());
      }
      else
      {
        parseKeyValue(*current);
      }
      expectLineEnd();
    }
    return root;
  }

private:
  std::string _input;
  std::size_t _pos{0};
  std::size_t _line{1};

  bool isEnd() const { return _pos >= _input.size(); }
  char peek() const { return isEnd() ? '\0' : _input[_pos]; }

  char advance()
  {
    char c = _input[_pos++];
    if (c == '\n')
    {
      ++_line;
    }
    return c;
  }

  void skipSpaces()
  {
    while (!isEnd() && (peek() == ' ' || peek() == '\t'))
    {
      advance();
    }
  }

  void skipComment()
  {
    if (peek() == '#')
    {
      while (!isEnd() && peek() != '\n')
      {
        advance();
      }
    }
  }

  // Whitespace, newlines and comments between statements.
  void skipBlank()
  {
    while (!isEnd())
    {
      char c = peek();
      if (c == ' ' || c == '\t' || c == '\r' || c == '\n')
      {
        advance();
      }
      else if (c == '#')
      {
        skipComment();
      }
      else
      {
        break;
      }
    }
  }

  void expectLineEnd()
  {
    skipSpaces();
    skipComment();
    if (peek() == '\r')
    {
      advance();
    }
    if (!isEnd() && peek() != '\n')
    {
      throw parse_error("unexpected trailing characters", _line);
    }
  }

  std::vector<std::string> parseDottedKey()
  {
    std::vector<std::string> parts;
    while (true)
    {
      skipSpaces();
      std::string part;
      if (peek() == '"' || peek() == '\'')
      {
        part = parseString();
      }
      else
      {
        while (!isEnd() && (std::isalnum(static_cast<unsigned char>(peek())) || peek() == '_' ||
                            peek() == '-'))
        {
          part += advance();
        }
      }
      if (part.empty())
      {
        throw parse_error("expected key", _line);
      }
      parts.push_back(std::move(part));
      skipSpaces();
      if (peek() != '.')
      {
        return parts;
      }
      advance();
    }
  }

  std::vector<std::string> parseHeader()
  {
    advance(); // '['
    auto parts = parseDottedKey();
    if (peek() != ']')
    {
      throw parse_error("unterminated table header", _line);
    }
    advance();
    return parts;
  }

  table &resolve(table &root, const std::vector<std::string> &path)
  {
    table *t = &root;
    for (const auto &part : path)
    {
      t = &t->subtable(part, _line);
    }
    return *t;
  }

  void parseKeyValue(table &current)
  {
    auto parts = parseDottedKey();
    if (peek() != '=')
    {
      throw parse_error("expected '=' after key", _line);
    }
    advance();
    skipSpaces();
    std::string leaf = parts.back();
    parts.pop_back();
    table &target = resolve(current, parts);
    if (target.contains(leaf))
    {
      throw parse_error("duplicate key '" + leaf + "'", _line);
    }
    target[leaf] = node(parseValue());
  }

  value_type parseValue()
  {
    char c = peek();
    if (c == '"' || c == '\'')
    {
      return parseString();
    }
    if (c == 't' || c == 'f')
    {
      return parseBool();
    }
    if (c == '+' || c == '-' || std::isdigit(static_cast<unsigned char>(c)))
    {
      return parseNumber();
    }
    throw parse_error("invalid value", _line);
  }

  std::string parseString()
  {
    char quote = advance();
    std::string str;
    while (!isEnd() && peek() != quote && peek() != '\n')
    {
      char c = advance();
      if (c != '\\' || quote == '\'')
      {
        str += c;
        continue;
      }
      if (isEnd())
      {
        break;
      }
      char esc = advance();
      switch (esc)
      {
      case 'n':
        str += '\n';
        break;
      case 't':
        str += '\t';
        break;
      case 'r':
        str += '\r';
        break;
      case '\\':
      case '"':
        str += esc;
        break;
      default:
        throw parse_error(std::string("invalid escape '\\") + esc + "'", _line);
      }
    }
    if (peek() != quote)
    {
      throw parse_error("unterminated string", _line);
    }
    advance();
    return str;
  }

  bool parseBool()
  {
    std::string word;
    while (!isEnd() && std::isalpha(static_cast<unsigned char>(peek())))
    {
      word += advance();
    }
    if (word == "true")
    {
      return true;
    }
    if (word == "false")
    {
      return false;
    }
    throw parse_error("invalid boolean '" + word + "'", _line);
  }

  int64_t parseNumber()
  {
    std::string num;
    if (peek() == '+' || peek() == '-')
    {
      num += advance();
    }
    while (!isEnd() && (std::isdigit(static_cast<unsigned char>(peek())) || peek() == '_'))
    {
      char c = advance();
      if (c != '_')
      {
        num += c;
      }
    }
    try
    {
      return static_cast<int64_t>(std::stoll(num));
    }
    catch (const std::exception &)
    {
      throw parse_error("invalid integer '" + num + "'", _line);
    }
  }
};

inline table parse(const std::string &tomlString) { return parser(tomlString).parse(); }

inline table parse_file(const std::string &filename)
{
  std::ifstream file(filename);
  if (!file.is_open())
  {
    throw std::runtime_error("Cannot open file: " + filename);
  }
  std::stringstream buffer;
  buffer << file.rdbuf();
  return parse(buffer.str());
}

} // namespace toml
} // namespace parsers
} // namespace xmliter
