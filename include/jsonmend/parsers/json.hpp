// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Jsonmend, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once
/// \file json.hpp
/// \brief Single-header JSON value, strict parser, and serializer for Jsonmend.
///
/// Features
/// --------
/// - Header-only, C++17, no third-party deps
/// - DOM-like \c Json value: null, bool, int64, double, string, array, object
/// - Strict RFC 8259 parser with located errors, no exceptions by default
/// - Optional throwing parse (parseOrThrow)
/// - Serializer with pretty-printing and key sorting
///
/// Notes
/// -----
/// - The parser is deliberately unforgiving: no trailing commas, comments,
///   single quotes, unquoted keys or raw control characters in strings. The
///   repair pipeline relies on it to decide whether text is finished.
/// - Object members keep insertion order. A duplicate key replaces the earlier
///   value in place.
/// - \uXXXX escapes (including surrogate pairs) are decoded to UTF-8.
///

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cmath>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <initializer_list>
#include <iostream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace jsonmend
{
namespace parsers
{
/// \brief JSON type tags.
enum class JsonType
{
  Null,
  Boolean,
  Int,
  Double,
  String,
  Array,
  Object
};

/// \brief Location of a parse error in the source text.
struct JsonLocation
{
  std::size_t offset{0};
  std::size_t line{1};
  std::size_t column{1};
};

/// \brief Error information produced by the parser.
struct JsonError
{
  std::string message;
  JsonLocation where;

  /// \brief Human readable "message at line L, column C".
  std::string describe() const
  {
    return message + " at line " + std::to_string(where.line) + ", column " +
           std::to_string(where.column);
  }
};

/// \brief Parse limits to prevent resource exhaustion.
struct ParseLimits
{
  std::size_t arrayItemsMax{100000};     ///< Maximum array elements
  std::size_t membersMax{100000};        ///< Maximum object members
  std::size_t depthMax{256};             ///< Maximum nesting depth
  std::size_t stringLengthMax{16777216}; ///< Maximum decoded string length
};

/// \brief Serialization options.
struct SerializeOptions
{
  bool pretty{false};       ///< Pretty-print with indentation
  bool sortKeys{false};     ///< Sort object keys alphabetically
  std::string indent{"  "}; ///< Indentation string for pretty printing
};

struct ParseResult;

// =============================================================
// Json class - main JSON value representation
// =============================================================
class Json
{
public:
  using Array = std::vector<Json>;
  using Member = std::pair<std::string, Json>;
  using Object = std::vector<Member>;

private:
#ifdef __GNUC__
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wmaybe-uninitialized"
#endif
  using Value =
    std::variant<std::nullptr_t, bool, std::int64_t, double, std::string, Array, Object>;
  Value _value;
#ifdef __GNUC__
#pragma GCC diagnostic pop
#endif

public:
  Json() : _value(nullptr) {}
  Json(std::nullptr_t) : _value(nullptr) {}
  Json(bool b) : _value(b) {}
  template <typename T,
            std::enable_if_t<std::is_integral_v<T> && !std::is_same_v<T, bool>, int> = 0>
  Json(T i) : _value(static_cast<std::int64_t>(i))
  {
  }
  Json(double d) : _value(d) {}
  Json(const char *s) : _value(std::string(s)) {}
  Json(const std::string &s) : _value(s) {}
  Json(std::string &&s) : _value(std::move(s)) {}
  Json(const Array &a) : _value(a) {}
  Json(Array &&a) : _value(std::move(a)) {}
  Json(const Object &o) : _value(o) {}
  Json(Object &&o) : _value(std::move(o)) {}

  static Json object() { return Json(Object{}); }
  static Json array() { return Json(Array{}); }

  /// \brief Build an object from key/value pairs, preserving order.
  static Json object(std::initializer_list<Member> members)
  {
    Json result = object();
    for (const auto &member : members)
    {
      result.set(member.first, member.second);
    }
    return result;
  }

  /// \brief Build an array from values.
  static Json array(std::initializer_list<Json> values) { return Json(Array(values)); }

  JsonType type() const { return static_cast<JsonType>(_value.index()); }

  bool isNull() const { return std::holds_alternative<std::nullptr_t>(_value); }
  bool isBool() const { return std::holds_alternative<bool>(_value); }
  bool isInt() const { return std::holds_alternative<std::int64_t>(_value); }
  bool isDouble() const { return std::holds_alternative<double>(_value); }
  bool isNumber() const { return isInt() || isDouble(); }
  bool isString() const { return std::holds_alternative<std::string>(_value); }
  bool isArray() const { return std::holds_alternative<Array>(_value); }
  bool isObject() const { return std::holds_alternative<Object>(_value); }

  bool getBool() const { return std::get<bool>(_value); }
  std::int64_t getInt() const { return std::get<std::int64_t>(_value); }
  double getDouble() const { return std::get<double>(_value); }
  const std::string &getString() const { return std::get<std::string>(_value); }
  const Array &getArray() const { return std::get<Array>(_value); }
  const Object &getObject() const { return std::get<Object>(_value); }

  std::string &getString() { return std::get<std::string>(_value); }
  Array &getArray() { return std::get<Array>(_value); }
  Object &getObject() { return std::get<Object>(_value); }

  /// \brief Numeric value regardless of int/double storage.
  double getNumber() const
  {
    if (isInt())
    {
      return static_cast<double>(getInt());
    }
    if (isDouble())
    {
      return getDouble();
    }
    throw type_error("value is not a number");
  }

  /// \brief Member lookup; returns nullptr when absent or not an object.
  const Json *find(const std::string &key) const
  {
    if (!isObject())
    {
      return nullptr;
    }
    for (const auto &member : getObject())
    {
      if (member.first == key)
      {
        return &member.second;
      }
    }
    return nullptr;
  }

  Json *find(const std::string &key)
  {
    return const_cast<Json *>(static_cast<const Json &>(*this).find(key));
  }

  bool contains(const std::string &key) const { return find(key) != nullptr; }

  /// \brief Insert or replace a member, keeping the position of an existing key.
  void set(const std::string &key, Json value)
  {
    if (!isObject())
    {
      _value = Object{};
    }
    if (Json *existing = find(key))
    {
      *existing = std::move(value);
      return;
    }
    getObject().emplace_back(key, std::move(value));
  }

  void push_back(Json value)
  {
    if (!isArray())
    {
      _value = Array{};
    }
    getArray().push_back(std::move(value));
  }

  const Json &operator[](const std::string &key) const
  {
    static const Json nullJson;
    const Json *found = find(key);
    return found ? *found : nullJson;
  }

  const Json &operator[](const char *key) const { return operator[](std::string(key)); }

  const Json &operator[](std::size_t index) const
  {
    static const Json nullJson;
    if (!isArray() || index >= getArray().size())
    {
      return nullJson;
    }
    return getArray()[index];
  }

  const Json &at(const std::string &key) const
  {
    if (!isObject())
      throw type_error("cannot use at() with non-object");
    const Json *found = find(key);
    if (!found)
      throw std::out_of_range("key '" + key + "' not found");
    return *found;
  }

  const Json &at(std::size_t index) const
  {
    if (!isArray())
      throw type_error("cannot use at() with non-array");
    const auto &arr = getArray();
    if (index >= arr.size())
      throw std::out_of_range("array index " + std::to_string(index) + " out of range");
    return arr[index];
  }

  std::size_t size() const
  {
    if (isArray())
      return getArray().size();
    if (isObject())
      return getObject().size();
    if (isString())
      return getString().size();
    if (isNull())
      return 0;
    throw type_error("cannot get size of scalar");
  }

  bool empty() const
  {
    if (isArray())
      return getArray().empty();
    if (isObject())
      return getObject().empty();
    if (isString())
      return getString().empty();
    return isNull();
  }

  /// \brief Name of the stored type, used in validation messages.
  const char *typeName() const
  {
    switch (type())
    {
    case JsonType::Null:
      return "null";
    case JsonType::Boolean:
      return "boolean";
    case JsonType::Int:
    case JsonType::Double:
      return "number";
    case JsonType::String:
      return "string";
    case JsonType::Array:
      return "array";
    case JsonType::Object:
      return "object";
    }
    return "unknown";
  }

  std::string serialize(const SerializeOptions &options = {}) const
  {
    std::string out;
    _serialize(out, options, 0);
    return out;
  }

  std::string dump(int indent = -1) const
  {
    SerializeOptions opts;
    if (indent >= 0)
    {
      opts.pretty = true;
      opts.indent = std::string(static_cast<std::size_t>(indent), ' ');
    }
    return serialize(opts);
  }

  static ParseResult parse(std::string_view text, const ParseLimits &limits = ParseLimits{});
  static Json parseOrThrow(std::string_view text, const ParseLimits &limits = ParseLimits{});

  /// \brief Structural equality; object member order is not significant and
  /// numbers compare by value.
  bool operator==(const Json &other) const
  {
    if (isNumber() && other.isNumber())
    {
      if (isInt() && other.isInt())
        return getInt() == other.getInt();
      return getNumber() == other.getNumber();
    }
    if (type() != other.type())
      return false;
    if (isObject())
    {
      const auto &lhs = getObject();
      if (lhs.size() != other.getObject().size())
        return false;
      for (const auto &member : lhs)
      {
        const Json *match = other.find(member.first);
        if (!match || !(member.second == *match))
          return false;
      }
      return true;
    }
    return _value == other._value;
  }

  bool operator!=(const Json &other) const { return !(*this == other); }

  friend std::ostream &operator<<(std::ostream &os, const Json &j)
  {
    os << j.dump();
    return os;
  }

  class parse_error : public std::runtime_error
  {
  public:
    explicit parse_error(const std::string &msg) : std::runtime_error(msg) {}
  };

  class type_error : public std::runtime_error
  {
  public:
    explicit type_error(const std::string &msg) : std::runtime_error(msg) {}
  };

  /// \brief Escape and quote a string for JSON output.
  static std::string quote(const std::string &str)
  {
    std::string out;
    _appendEscaped(out, str);
    return out;
  }

private:
  void _serialize(std::string &out, const SerializeOptions &options, int depth) const
  {
    switch (type())
    {
    case JsonType::Null:
      out += "null";
      break;
    case JsonType::Boolean:
      out += getBool() ? "true" : "false";
      break;
    case JsonType::Int:
      out += std::to_string(getInt());
      break;
    case JsonType::Double:
      out += _formatDouble(getDouble());
      break;
    case JsonType::String:
      _appendEscaped(out, getString());
      break;
    case JsonType::Array:
      _serializeArray(out, options, depth);
      break;
    case JsonType::Object:
      _serializeObject(out, options, depth);
      break;
    }
  }

  static void _newline(std::string &out, const SerializeOptions &options, int depth)
  {
    if (!options.pretty)
      return;
    out += '\n';
    for (int j = 0; j < depth; ++j)
    {
      out += options.indent;
    }
  }

  void _serializeArray(std::string &out, const SerializeOptions &options, int depth) const
  {
    const auto &arr = getArray();
    if (arr.empty())
    {
      out += "[]";
      return;
    }
    out += '[';
    for (std::size_t i = 0; i < arr.size(); ++i)
    {
      if (i > 0)
        out += ',';
      _newline(out, options, depth + 1);
      arr[i]._serialize(out, options, depth + 1);
    }
    _newline(out, options, depth);
    out += ']';
  }

  void _serializeObject(std::string &out, const SerializeOptions &options, int depth) const
  {
    const auto &obj = getObject();
    if (obj.empty())
    {
      out += "{}";
      return;
    }

    std::vector<const Member *> members;
    members.reserve(obj.size());
    for (const auto &member : obj)
    {
      members.push_back(&member);
    }
    if (options.sortKeys)
    {
      std::sort(members.begin(), members.end(),
                [](const Member *a, const Member *b) { return a->first < b->first; });
    }

    out += '{';
    for (std::size_t i = 0; i < members.size(); ++i)
    {
      if (i > 0)
        out += ',';
      _newline(out, options, depth + 1);
      _appendEscaped(out, members[i]->first);
      out += options.pretty ? ": " : ":";
      members[i]->second._serialize(out, options, depth + 1);
    }
    _newline(out, options, depth);
    out += '}';
  }

  static std::string _formatDouble(double d)
  {
    if (!std::isfinite(d))
    {
      return "null";
    }
    char buf[32];
    for (int precision = 15; precision <= 17; ++precision)
    {
      std::snprintf(buf, sizeof(buf), "%.*g", precision, d);
      if (std::strtod(buf, nullptr) == d)
      {
        break;
      }
    }
    return buf;
  }

  static void _appendEscaped(std::string &out, const std::string &str)
  {
    out += '"';
    for (char c : str)
    {
      switch (c)
      {
      case '"':
        out += "\\\"";
        break;
      case '\\':
        out += "\\\\";
        break;
      case '\b':
        out += "\\b";
        break;
      case '\f':
        out += "\\f";
        break;
      case '\n':
        out += "\\n";
        break;
      case '\r':
        out += "\\r";
        break;
      case '\t':
        out += "\\t";
        break;
      default:
        if (static_cast<unsigned char>(c) < 0x20)
        {
          char buf[8];
          std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned char>(c));
          out += buf;
        }
        else
        {
          out += c;
        }
      }
    }
    out += '"';
  }
};

/// \brief Result of a non-throwing parse operation.
struct ParseResult
{
  Json value;      ///< Parsed JSON value (null if ok == false)
  bool ok{false};  ///< True if parsing succeeded
  JsonError error; ///< Error info when ok == false
};

// =============================================================
// JSON Parser implementation
// =============================================================
class JsonParser
{
public:
  explicit JsonParser(std::string_view text, const ParseLimits &limits)
      : _text(text), _pos(0), _limits(limits)
  {
  }

  ParseResult parse()
  {
    ParseResult result;
    _skipWhitespace();

    if (_pos >= _text.size())
    {
      result.error.message = "Unexpected end of input";
      result.error.where = _location();
      return result;
    }

    if (_parseValue(result.value, 0U))
    {
      _skipWhitespace();
      if (_pos < _text.size())
      {
        result.value = Json();
        result.error.message = "Unexpected non-whitespace character after JSON value";
        result.error.where = _location();
        return result;
      }
      result.ok = true;
    }
    else
    {
      result.value = Json();
      result.error.message = _error.empty() ? "Parse error" : _error;
      result.error.where = _location();
    }

    return result;
  }

private:
  std::string_view _text;
  std::size_t _pos;
  ParseLimits _limits;
  std::string _error;

  JsonLocation _location() const
  {
    JsonLocation loc;
    loc.offset = _pos;
    for (std::size_t i = 0; i < _pos && i < _text.size(); ++i)
    {
      if (_text[i] == '\n')
      {
        ++loc.line;
        loc.column = 1;
      }
      else
      {
        ++loc.column;
      }
    }
    return loc;
  }

  bool _fail(std::string message)
  {
    _error = std::move(message);
    return false;
  }

  bool _unexpected()
  {
    if (_pos >= _text.size())
    {
      return _fail("Unexpected end of input");
    }
    std::string message = "Unexpected character '";
    message += _text[_pos];
    message += "'";
    return _fail(message);
  }

  // JSON whitespace only: space, tab, LF, CR.
  void _skipWhitespace()
  {
    while (_pos < _text.size() &&
           (_text[_pos] == ' ' || _text[_pos] == '\t' || _text[_pos] == '\n' ||
            _text[_pos] == '\r'))
    {
      ++_pos;
    }
  }

  bool _parseValue(Json &out, std::size_t depth)
  {
    if (depth > _limits.depthMax)
    {
      return _fail("Maximum nesting depth exceeded");
    }

    _skipWhitespace();
    if (_pos >= _text.size())
    {
      return _fail("Unexpected end of input");
    }

    switch (_text[_pos])
    {
    case 'n':
      return _parseLiteral("null", Json(), out);
    case 't':
      return _parseLiteral("true", Json(true), out);
    case 'f':
      return _parseLiteral("false", Json(false), out);
    case '"':
    {
      std::string str;
      if (!_parseString(str))
        return false;
      out = Json(std::move(str));
      return true;
    }
    case '[':
      return _parseArray(out, depth);
    case '{':
      return _parseObject(out, depth);
    default:
      if (_text[_pos] == '-' || std::isdigit(static_cast<unsigned char>(_text[_pos])))
      {
        return _parseNumber(out);
      }
      return _unexpected();
    }
  }

  bool _parseLiteral(std::string_view literal, Json value, Json &out)
  {
    if (_text.substr(_pos, literal.size()) != literal)
    {
      return _unexpected();
    }
    _pos += literal.size();
    out = std::move(value);
    return true;
  }

  bool _digitAt(std::size_t pos) const
  {
    return pos < _text.size() && std::isdigit(static_cast<unsigned char>(_text[pos]));
  }

  bool _parseNumber(Json &out)
  {
    std::size_t start = _pos;
    if (_text[_pos] == '-')
      ++_pos;

    if (!_digitAt(_pos))
    {
      return _fail("No number after minus sign");
    }

    if (_text[_pos] == '0')
    {
      ++_pos;
      if (_digitAt(_pos))
      {
        return _fail("Leading zeros are not allowed");
      }
    }
    else
    {
      while (_digitAt(_pos))
        ++_pos;
    }

    bool isFloat = false;
    if (_pos < _text.size() && _text[_pos] == '.')
    {
      isFloat = true;
      ++_pos;
      if (!_digitAt(_pos))
      {
        return _fail("Unterminated fractional number");
      }
      while (_digitAt(_pos))
        ++_pos;
    }

    if (_pos < _text.size() && (_text[_pos] == 'e' || _text[_pos] == 'E'))
    {
      isFloat = true;
      ++_pos;
      if (_pos < _text.size() && (_text[_pos] == '+' || _text[_pos] == '-'))
        ++_pos;
      if (!_digitAt(_pos))
      {
        return _fail("Exponent part is missing a number");
      }
      while (_digitAt(_pos))
        ++_pos;
    }

    std::string_view numStr = _text.substr(start, _pos - start);
    if (!isFloat)
    {
      std::int64_t i = 0;
      auto result = std::from_chars(numStr.data(), numStr.data() + numStr.size(), i);
      if (result.ec == std::errc{} && result.ptr == numStr.data() + numStr.size())
      {
        out = Json(i);
        return true;
      }
    }
    out = Json(std::strtod(std::string(numStr).c_str(), nullptr));
    return true;
  }

  static int _hexValue(char c)
  {
    if (c >= '0' && c <= '9')
      return c - '0';
    if (c >= 'a' && c <= 'f')
      return c - 'a' + 10;
    if (c >= 'A' && c <= 'F')
      return c - 'A' + 10;
    return -1;
  }

  bool _readHex4(unsigned &codeUnit)
  {
    if (_pos + 4 > _text.size())
    {
      return _fail("Incomplete unicode escape");
    }
    codeUnit = 0;
    for (std::size_t i = 0; i < 4; ++i)
    {
      int v = _hexValue(_text[_pos + i]);
      if (v < 0)
      {
        return _fail("Bad unicode escape");
      }
      codeUnit = (codeUnit << 4) | static_cast<unsigned>(v);
    }
    _pos += 4;
    return true;
  }

  static void _appendUtf8(std::string &out, unsigned cp)
  {
    if (cp < 0x80)
    {
      out += static_cast<char>(cp);
    }
    else if (cp < 0x800)
    {
      out += static_cast<char>(0xC0 | (cp >> 6));
      out += static_cast<char>(0x80 | (cp & 0x3F));
    }
    else if (cp < 0x10000)
    {
      out += static_cast<char>(0xE0 | (cp >> 12));
      out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
      out += static_cast<char>(0x80 | (cp & 0x3F));
    }
    else
    {
      out += static_cast<char>(0xF0 | (cp >> 18));
      out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
      out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
      out += static_cast<char>(0x80 | (cp & 0x3F));
    }
  }

  bool _parseUnicodeEscape(std::string &str)
  {
    unsigned cp = 0;
    if (!_readHex4(cp))
      return false;

    if (cp >= 0xD800 && cp <= 0xDBFF && _text.substr(_pos, 2) == "\\u")
    {
      std::size_t save = _pos;
      _pos += 2;
      unsigned low = 0;
      if (!_readHex4(low))
        return false;
      if (low >= 0xDC00 && low <= 0xDFFF)
      {
        cp = 0x10000 + ((cp - 0xD800) << 10) + (low - 0xDC00);
      }
      else
      {
        _pos = save;
      }
    }
    _appendUtf8(str, cp);
    return true;
  }

  bool _parseString(std::string &str)
  {
    if (_pos >= _text.size() || _text[_pos] != '"')
    {
      return _unexpected();
    }
    ++_pos;

    while (_pos < _text.size() && _text[_pos] != '"')
    {
      if (str.size() > _limits.stringLengthMax)
      {
        return _fail("String length exceeds limit");
      }

      char c = _text[_pos];
      if (static_cast<unsigned char>(c) < 0x20)
      {
        return _fail("Bad control character in string literal");
      }

      if (c != '\\')
      {
        str += c;
        ++_pos;
        continue;
      }

      ++_pos;
      if (_pos >= _text.size())
      {
        return _fail("Unterminated string");
      }

      char esc = _text[_pos++];
      switch (esc)
      {
      case '"':
        str += '"';
        break;
      case '\\':
        str += '\\';
        break;
      case '/':
        str += '/';
        break;
      case 'b':
        str += '\b';
        break;
      case 'f':
        str += '\f';
        break;
      case 'n':
        str += '\n';
        break;
      case 'r':
        str += '\r';
        break;
      case 't':
        str += '\t';
        break;
      case 'u':
        if (!_parseUnicodeEscape(str))
          return false;
        break;
      default:
        --_pos;
        return _fail("Bad escaped character");
      }
    }

    if (_pos >= _text.size())
    {
      return _fail("Unterminated string");
    }

    ++_pos;
    return true;
  }

  bool _parseArray(Json &out, std::size_t depth)
  {
    ++_pos;
    Json::Array arr;
    _skipWhitespace();

    if (_pos < _text.size() && _text[_pos] == ']')
    {
      ++_pos;
      out = Json(std::move(arr));
      return true;
    }

    while (true)
    {
      if (arr.size() >= _limits.arrayItemsMax)
      {
        return _fail("Array size exceeds limit");
      }

      Json element;
      if (!_parseValue(element, depth + 1))
      {
        return false;
      }
      arr.push_back(std::move(element));

      _skipWhitespace();
      if (_pos >= _text.size())
      {
        return _fail("Unexpected end of input in array");
      }

      if (_text[_pos] == ']')
      {
        ++_pos;
        break;
      }
      if (_text[_pos] != ',')
      {
        return _fail(std::string("Expected ',' or ']' after array element but found '") +
                     _text[_pos] + "'");
      }
      ++_pos;
    }

    out = Json(std::move(arr));
    return true;
  }

  bool _parseObject(Json &out, std::size_t depth)
  {
    ++_pos;
    Json obj = Json::object();
    _skipWhitespace();

    if (_pos < _text.size() && _text[_pos] == '}')
    {
      ++_pos;
      out = std::move(obj);
      return true;
    }

    while (true)
    {
      if (obj.size() >= _limits.membersMax)
      {
        return _fail("Object size exceeds limit");
      }

      _skipWhitespace();
      if (_pos >= _text.size() || _text[_pos] != '"')
      {
        if (_pos < _text.size())
        {
          return _fail(std::string("Expected double-quoted property name but found '") +
                       _text[_pos] + "'");
        }
        return _fail("Unexpected end of input in object");
      }

      std::string key;
      if (!_parseString(key))
      {
        return false;
      }

      _skipWhitespace();
      if (_pos >= _text.size() || _text[_pos] != ':')
      {
        return _fail("Expected ':' after property name");
      }
      ++_pos;

      Json value;
      if (!_parseValue(value, depth + 1))
      {
        return false;
      }
      obj.set(key, std::move(value));

      _skipWhitespace();
      if (_pos >= _text.size())
      {
        return _fail("Unexpected end of input in object");
      }

      if (_text[_pos] == '}')
      {
        ++_pos;
        break;
      }
      if (_text[_pos] != ',')
      {
        return _fail(std::string("Expected ',' or '}' after property value but found '") +
                     _text[_pos] + "'");
      }
      ++_pos;
    }

    out = std::move(obj);
    return true;
  }
};

inline ParseResult Json::parse(std::string_view text, const ParseLimits &limits)
{
  JsonParser parser(text, limits);
  return parser.parse();
}

inline Json Json::parseOrThrow(std::string_view text, const ParseLimits &limits)
{
  auto result = parse(text, limits);
  if (!result.ok)
  {
    throw parse_error("JSON parse error: " + result.error.describe());
  }
  return std::move(result.value);
}

} // namespace parsers
} // namespace jsonmend
