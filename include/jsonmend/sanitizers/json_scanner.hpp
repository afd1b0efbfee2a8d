// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Jsonmend, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

/// \file json_scanner.hpp
/// \brief Tolerant single-pass tokenizer for text that should be JSON.
///
/// The scanner never fails. It splits the text into string literals,
/// structural characters ({ } [ ] , :) and runs of anything else, skipping
/// whitespace. Repair strategies use it to tell string content from
/// structure without re-counting quotes themselves.

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <string_view>
#include <vector>

namespace jsonmend
{
namespace sanitizers
{

enum class TokenKind
{
  StringLiteral,
  Structural,
  Other
};

struct Token
{
  TokenKind kind;
  std::size_t offset;
  std::size_t length;
  char symbol{'\0'};      ///< Structural character, '\0' otherwise
  bool terminated{true};  ///< False for a string literal cut off by end of text

  std::size_t end() const { return offset + length; }
  bool is(char c) const { return kind == TokenKind::Structural && symbol == c; }
  bool isString() const { return kind == TokenKind::StringLiteral; }
  bool isOther() const { return kind == TokenKind::Other; }
  bool isOpener() const { return is('{') || is('['); }
  bool isCloser() const { return is('}') || is(']'); }
};

inline bool isStructuralChar(char c)
{
  return c == '{' || c == '}' || c == '[' || c == ']' || c == ',' || c == ':';
}

inline bool isJsonSpace(char c) { return std::isspace(static_cast<unsigned char>(c)) != 0; }

inline char closerFor(char opener) { return opener == '{' ? '}' : ']'; }

/// \brief Token stream over a borrowed text. The text must outlive the scanner.
class JsonScanner
{
public:
  explicit JsonScanner(std::string_view text) : _text(text) { _scan(); }

  std::string_view text() const { return _text; }
  const std::vector<Token> &tokens() const { return _tokens; }
  std::size_t size() const { return _tokens.size(); }
  const Token &operator[](std::size_t index) const { return _tokens[index]; }

  /// \brief Text of a token.
  std::string_view textOf(const Token &token) const
  {
    return _text.substr(token.offset, token.length);
  }

  /// \brief Content of a string literal without its quotes.
  std::string_view stringContent(const Token &token) const
  {
    std::size_t inner = token.length - 1 - (token.terminated && token.length > 1 ? 1 : 0);
    return _text.substr(token.offset + 1, inner);
  }

  /// \brief True when \p offset lies between the quotes of a string literal.
  /// The quote characters themselves are not inside.
  bool insideString(std::size_t offset) const
  {
    auto it = std::upper_bound(_strings.begin(), _strings.end(), offset,
                               [this](std::size_t value, std::size_t index)
                               { return value < _tokens[index].offset; });
    if (it == _strings.begin())
    {
      return false;
    }
    const Token &token = _tokens[*(it - 1)];
    if (offset == token.offset)
    {
      return false;
    }
    return token.terminated ? offset + 1 < token.end() : true;
  }

  /// \brief True when the text ends inside an unterminated string literal.
  bool endsInsideString() const
  {
    return !_strings.empty() && !_tokens[_strings.back()].terminated;
  }

  /// \brief Index of the first token starting at or after \p offset.
  std::size_t indexAt(std::size_t offset) const
  {
    auto it = std::lower_bound(_tokens.begin(), _tokens.end(), offset,
                               [](const Token &token, std::size_t value)
                               { return token.offset < value; });
    return static_cast<std::size_t>(it - _tokens.begin());
  }

  /// \brief Whether the innermost unclosed container before \p offset is an
  /// array. Looks back at most \p lookback bytes, outside strings; an
  /// unmatched '[' must be found before any unmatched '{'.
  bool isInArrayContext(std::size_t offset, std::size_t lookback) const
  {
    std::size_t windowStart = offset > lookback ? offset - lookback : 0;
    int depth = 0;
    for (std::size_t i = indexAt(offset); i-- > 0;)
    {
      const Token &token = _tokens[i];
      if (token.offset < windowStart)
      {
        break;
      }
      if (token.isCloser())
      {
        ++depth;
      }
      else if (token.isOpener())
      {
        if (depth == 0)
        {
          return token.symbol == '[';
        }
        --depth;
      }
    }
    return false;
  }

  /// \brief Whether the gap between two offsets contains a line break.
  bool newlineBetween(std::size_t from, std::size_t to) const
  {
    return _text.substr(from, to - from).find('\n') != std::string_view::npos;
  }

private:
  std::string_view _text;
  std::vector<Token> _tokens;
  std::vector<std::size_t> _strings;

  void _scan()
  {
    const std::size_t n = _text.size();
    std::size_t i = 0;
    while (i < n)
    {
      char c = _text[i];
      if (isJsonSpace(c))
      {
        ++i;
        continue;
      }

      if (c == '"')
      {
        std::size_t start = i++;
        bool terminated = false;
        while (i < n)
        {
          if (_text[i] == '\\')
          {
            i = std::min(i + 2, n);
            continue;
          }
          if (_text[i++] == '"')
          {
            terminated = true;
            break;
          }
        }
        _strings.push_back(_tokens.size());
        _tokens.push_back({TokenKind::StringLiteral, start, i - start, '\0', terminated});
        continue;
      }

      if (isStructuralChar(c))
      {
        _tokens.push_back({TokenKind::Structural, i, 1, c, true});
        ++i;
        continue;
      }

      std::size_t start = i;
      while (i < n && !isJsonSpace(_text[i]) && _text[i] != '"' && !isStructuralChar(_text[i]))
      {
        ++i;
      }
      _tokens.push_back({TokenKind::Other, start, i - start, '\0', true});
    }
  }
};

} // namespace sanitizers
} // namespace jsonmend
