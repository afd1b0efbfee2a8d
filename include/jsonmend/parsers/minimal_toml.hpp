// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Jsonmend, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

/// \file minimal_toml.hpp
/// \brief Read-only subset of TOML used for Jsonmend configuration files.
///
/// Supported: `[a.b]` section headers, bare and dotted keys, basic and
/// literal strings, integers, floats, booleans, single-line or multi-line
/// arrays, and `#` comments anywhere a value may end. Inline tables, dates and
/// multi-line strings are rejected with a toml::parse_error.

#include <cctype>
#include <cstdint>
#include <fstream>
#include <map>
#include <memory>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <variant>
#include <vector>

namespace jsonmend
{
namespace parsers
{
namespace toml
{

class table;
class array;

using value_type = std::variant<std::monostate, std::int64_t, double, bool, std::string,
                                std::shared_ptr<table>, std::shared_ptr<array>>;

/// \brief Thrown on malformed input; carries the 1-based line number.
class parse_error : public std::runtime_error
{
public:
  parse_error(const std::string &message, std::size_t line)
      : std::runtime_error("TOML error at line " + std::to_string(line) + ": " + message),
        _line(line)
  {
  }

  std::size_t line() const { return _line; }

private:
  std::size_t _line;
};

class array
{
public:
  using container_type = std::vector<value_type>;

  void push_back(value_type val) { _values.push_back(std::move(val)); }
  std::size_t size() const { return _values.size(); }
  bool empty() const { return _values.empty(); }

  container_type::const_iterator begin() const { return _values.begin(); }
  container_type::const_iterator end() const { return _values.end(); }
  const value_type &operator[](std::size_t idx) const { return _values[idx]; }

private:
  container_type _values;
};

/// \brief A looked-up value; empty when the key was missing.
class node
{
public:
  node() = default;
  node(value_type val) : _value(std::move(val)) {}

  explicit operator bool() const { return !std::holds_alternative<std::monostate>(_value); }

  bool is_value() const
  {
    return static_cast<bool>(*this) && !is_table() && !is_array();
  }
  bool is_string() const { return std::holds_alternative<std::string>(_value); }
  bool is_integer() const { return std::holds_alternative<std::int64_t>(_value); }
  bool is_boolean() const { return std::holds_alternative<bool>(_value); }
  bool is_array() const { return std::holds_alternative<std::shared_ptr<array>>(_value); }
  bool is_table() const { return std::holds_alternative<std::shared_ptr<table>>(_value); }

  /// \brief Typed access. Integers widen to double; nothing else converts.
  template <typename T> std::optional<T> as() const
  {
    if constexpr (std::is_same_v<T, double>)
    {
      if (auto *val = std::get_if<std::int64_t>(&_value))
        return static_cast<double>(*val);
    }
    if (auto *val = std::get_if<T>(&_value))
      return *val;
    return std::nullopt;
  }

  const array *as_array() const
  {
    auto *val = std::get_if<std::shared_ptr<array>>(&_value);
    return val ? val->get() : nullptr;
  }

  table *as_table() const
  {
    auto *val = std::get_if<std::shared_ptr<table>>(&_value);
    return val ? val->get() : nullptr;
  }

private:
  value_type _value;
};

class table
{
public:
  using container_type = std::map<std::string, node>;

  bool contains(const std::string &key) const { return _values.count(key) != 0; }
  bool empty() const { return _values.empty(); }
  std::size_t size() const { return _values.size(); }

  node get(const std::string &key) const
  {
    auto it = _values.find(key);
    return it == _values.end() ? node() : it->second;
  }

  void insert(const std::string &key, node value) { _values[key] = std::move(value); }

  /// \brief Resolve "a.b.c" through nested tables.
  node at_path(const std::string &dottedPath) const
  {
    const table *current = this;
    std::size_t start = 0;
    while (current)
    {
      std::size_t dot = dottedPath.find('.', start);
      std::string part = dottedPath.substr(start, dot == std::string::npos ? dot : dot - start);
      node found = current->get(part);
      if (dot == std::string::npos || !found)
      {
        return found;
      }
      current = found.as_table();
      start = dot + 1;
    }
    return node();
  }

  container_type::const_iterator begin() const { return _values.begin(); }
  container_type::const_iterator end() const { return _values.end(); }

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
      _skipBlank();
      if (_atEnd())
        break;

      if (_peek() == '[')
      {
        ++_pos;
        std::vector<std::string> path = _parseKeyPath(']');
        _expect(']');
        current = _descend(&root, path, path.size());
      }
      else
      {
        std::vector<std::string> path = _parseKeyPath('=');
        _skipInline();
        _expect('=');
        _skipInline();
        value_type value = _parseValue();
        table *owner = _descend(current, path, path.size() - 1);
        if (owner->contains(path.back()))
          _fail("duplicate key '" + path.back() + "'");
        owner->insert(path.back(), node(std::move(value)));
      }
      _endOfLine();
    }
    return root;
  }

private:
  std::string _input;
  std::size_t _pos{0};
  std::size_t _line{1};

  bool _atEnd() const { return _pos >= _input.size(); }
  char _peek() const { return _atEnd() ? '\0' : _input[_pos]; }

  [[noreturn]] void _fail(const std::string &message) const { throw parse_error(message, _line); }

  void _expect(char c)
  {
    if (_peek() != c)
      _fail(std::string("expected '") + c + "'");
    ++_pos;
  }

  void _skipInline()
  {
    while (_peek() == ' ' || _peek() == '\t')
      ++_pos;
  }

  void _skipComment()
  {
    if (_peek() == '#')
    {
      while (!_atEnd() && _peek() != '\n')
        ++_pos;
    }
  }

  // Blank lines, comments and newlines, including inside arrays.
  void _skipBlank()
  {
    while (!_atEnd())
    {
      _skipInline();
      _skipComment();
      if (_peek() == '\n' || _peek() == '\r')
      {
        if (_peek() == '\n')
          ++_line;
        ++_pos;
        continue;
      }
      break;
    }
  }

  void _endOfLine()
  {
    _skipInline();
    _skipComment();
    if (_peek() == '\r')
      ++_pos;
    if (!_atEnd() && _peek() != '\n')
      _fail("unexpected trailing characters");
  }

  static bool _isBareKeyChar(char c)
  {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '-';
  }

  std::vector<std::string> _parseKeyPath(char terminator)
  {
    std::vector<std::string> path;
    while (true)
    {
      _skipInline();
      std::string part;
      if (_peek() == '"' || _peek() == '\'')
      {
        part = _parseString();
      }
      else
      {
        while (_isBareKeyChar(_peek()))
          part += _input[_pos++];
        if (part.empty())
          _fail("expected a key");
      }
      path.push_back(part);
      _skipInline();
      if (_peek() == '.')
      {
        ++_pos;
        continue;
      }
      if (_peek() != terminator)
        _fail(std::string("expected '") + terminator + "' after key");
      return path;
    }
  }

  table *_descend(table *from, const std::vector<std::string> &path, std::size_t count)
  {
    table *current = from;
    for (std::size_t i = 0; i < count; ++i)
    {
      node existing = current->get(path[i]);
      if (!existing)
      {
        auto created = std::make_shared<table>();
        current->insert(path[i], node(created));
        current = created.get();
        continue;
      }
      current = existing.as_table();
      if (!current)
        _fail("key '" + path[i] + "' is not a table");
    }
    return current;
  }

  value_type _parseValue()
  {
    char c = _peek();
    if (c == '"' || c == '\'')
      return _parseString();
    if (c == '[')
      return _parseArray();
    if (c == '{')
      _fail("inline tables are not supported");
    if (std::isalpha(static_cast<unsigned char>(c)))
      return _parseBool();
    if (c == '+' || c == '-' || std::isdigit(static_cast<unsigned char>(c)))
      return _parseNumber();
    _fail("invalid value");
  }

  std::string _parseString()
  {
    char quote = _input[_pos++];
    if (_peek() == quote && _pos + 1 < _input.size() && _input[_pos + 1] == quote)
      _fail("multi-line strings are not supported");

    std::string str;
    while (!_atEnd() && _peek() != quote)
    {
      char c = _input[_pos++];
      if (c == '\n')
        _fail("newline in string");
      if (c != '\\' || quote == '\'')
      {
        str += c;
        continue;
      }
      char esc = _atEnd() ? '\0' : _input[_pos++];
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
        str += '\\';
        break;
      case '"':
        str += '"';
        break;
      default:
        _fail(std::string("invalid escape '\\") + esc + "'");
      }
    }
    if (_atEnd())
      _fail("unterminated string");
    ++_pos;
    return str;
  }

  value_type _parseArray()
  {
    ++_pos;
    auto arr = std::make_shared<array>();
    while (true)
    {
      _skipBlank();
      if (_peek() == ']')
        break;
      if (_atEnd())
        _fail("unterminated array");
      arr->push_back(_parseValue());
      _skipBlank();
      if (_peek() == ',')
      {
        ++_pos;
        continue;
      }
      if (_peek() != ']')
        _fail("expected ',' or ']' in array");
    }
    ++_pos;
    return arr;
  }

  bool _parseBool()
  {
    std::string word;
    while (std::isalpha(static_cast<unsigned char>(_peek())))
      word += _input[_pos++];
    if (word == "true")
      return true;
    if (word == "false")
      return false;
    _fail("invalid value '" + word + "'");
  }

  value_type _parseNumber()
  {
    std::string num;
    bool isFloat = false;
    while (!_atEnd())
    {
      char c = _peek();
      if (c == '.' || c == 'e' || c == 'E')
        isFloat = true;
      else if (!(std::isdigit(static_cast<unsigned char>(c)) || c == '+' || c == '-' || c == '_'))
        break;
      if (c != '_')
        num += c;
      ++_pos;
    }

    try
    {
      std::size_t used = 0;
      value_type result;
      if (isFloat)
        result = std::stod(num, &used);
      else
        result = static_cast<std::int64_t>(std::stoll(num, &used));
      if (used != num.size())
        _fail("invalid number '" + num + "'");
      return result;
    }
    catch (const std::logic_error &)
    {
      _fail("invalid number '" + num + "'");
    }
  }
};

inline table parse(const std::string &tomlString) { return parser(tomlString).parse(); }

inline table parse_file(const std::string &filename)
{
  std::ifstream file(filename);
  if (!file.is_open())
    throw std::runtime_error("Cannot open file: " + filename);

  std::stringstream buffer;
  buffer << file.rdbuf();
  return parse(buffer.str());
}

} // namespace toml
} // namespace parsers
} // namespace jsonmend
