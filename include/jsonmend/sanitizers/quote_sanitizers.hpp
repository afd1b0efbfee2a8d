// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Jsonmend, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <jsonmend/sanitizers/json_scanner.hpp>
#include <jsonmend/sanitizers/noise_sanitizers.hpp>
#include <jsonmend/sanitizers/sanitizer_types.hpp>
#include <jsonmend/sanitizers/text_edit.hpp>
#include <regex>
#include <string>
#include <vector>

namespace jsonmend
{
namespace sanitizers
{

/// \brief Escapes quotes that a model left raw inside a string value.
///
/// Quote parity is exactly what is broken here, so this strategy matches
/// patterns on the raw text and only consults the token stream to leave a
/// properly closed string alone:
///  - HTML/XML attribute values, `<a href="x">` inside a value, become
///    `<a href=\"x\">`
///  - an escaped quote directly followed by a raw one, `\""`, becomes `\"\"`
/// Both fire only when the text before the match shows a property value
/// being written.
class FixUnescapedQuotes : public Sanitizer
{
public:
  FixUnescapedQuotes() : Sanitizer(toString(SanitizerId::FixUnescapedQuotes)) {}

protected:
  SanitizerOutcome _sanitize(const std::string &text, const SanitizerConfig &config) const override
  {
    static const std::regex attributeQuote(R"re((=\s*)"([^"]*)"(?=\s*>|\s+[a-zA-Z]|\s*"))re");
    static const std::regex doubledQuote(R"re(\\""(?=\s*\+|\s*\]|\s*,|\s*[a-zA-Z_$]))re");

    std::vector<TextEdit> edits;
    std::vector<std::string> repairs;

    for (std::sregex_iterator it(text.begin(), text.end(), attributeQuote), end; it != end; ++it)
    {
      const std::smatch &match = *it;
      std::size_t pos = static_cast<std::size_t>(match.position(0));
      if (!_inAttributeContext(_contextBefore(text, pos, config)))
      {
        continue;
      }
      std::size_t open = pos + static_cast<std::size_t>(match.length(1));
      std::size_t close = open + 1 + static_cast<std::size_t>(match.length(2));
      edits.push_back(TextEdit::insert(open, "\\"));
      edits.push_back(TextEdit::insert(close, "\\"));
      repairs.push_back("Escaped quotes around attribute value \"" + match.str(2) + "\"");
    }

    std::string working = applyEdits(text, edits);
    std::size_t adjacent = 0;
    edits.clear();
    JsonScanner scan(working);
    for (std::sregex_iterator it(working.begin(), working.end(), doubledQuote), end; it != end;
         ++it)
    {
      std::size_t pos = static_cast<std::size_t>(it->position(0));
      if (!_inEscapedQuoteContext(_contextBefore(working, pos, config)) ||
          _closesString(scan, pos + 2))
      {
        continue;
      }
      edits.push_back(TextEdit::insert(pos + 2, "\\"));
      ++adjacent;
    }
    if (adjacent > 0)
    {
      repairs.push_back("Escaped " + detail::plural(adjacent, "quote") +
                        " following an escaped quote");
      working = applyEdits(working, edits);
    }

    if (repairs.empty())
    {
      return SanitizerOutcome::unchanged(text);
    }
    return SanitizerOutcome::modified(working, "Fixed unescaped quotes in string values", repairs);
  }

private:
  // The quote at \p quote ends a string literal that is followed by ',', ':'
  // or a closer, as in `"say \"hi\"",`.
  static bool _closesString(const JsonScanner &scan, std::size_t quote)
  {
    std::size_t next = scan.indexAt(quote + 1);
    if (next == 0 || next >= scan.size())
    {
      return false;
    }
    const Token &literal = scan[next - 1];
    const Token &after = scan[next];
    return literal.isString() && literal.terminated && literal.end() == quote + 1 &&
           (after.is(',') || after.is(':') || after.isCloser());
  }

  static std::string _contextBefore(const std::string &text, std::size_t pos,
                                    const SanitizerConfig &config)
  {
    std::size_t start = pos > config.contextLookback ? pos - config.contextLookback : 0;
    return text.substr(start, pos - start);
  }

  // A ':' that is not immediately followed by the quote of a property name.
  static bool _colonOutsideName(const std::string &context)
  {
    static const std::regex endsWithQuote(R"re("\s*$)re");
    return context.find(':') != std::string::npos && !std::regex_search(context, endsWithQuote);
  }

  static bool _inAttributeContext(const std::string &context)
  {
    static const std::regex valueWithEquals(R"re(:\s*"?[^"]*=)re");
    return std::regex_search(context, valueWithEquals) ||
           context.find("\": \"") != std::string::npos ||
           context.find("\":{") != std::string::npos || _colonOutsideName(context);
  }

  static bool _inEscapedQuoteContext(const std::string &context)
  {
    static const std::regex valueWithEscape(R"re(:\s*"[^"]*[`\\])re");
    return std::regex_search(context, valueWithEscape) ||
           context.find("\": \"") != std::string::npos || _colonOutsideName(context);
  }
};

} // namespace sanitizers
} // namespace jsonmend
