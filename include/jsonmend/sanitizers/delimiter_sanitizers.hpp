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
#include <string>
#include <vector>

namespace jsonmend
{
namespace sanitizers
{

/// \brief Replaces closers that do not match the innermost open container.
///
/// Corrections are recorded against the original offsets and applied in one
/// pass. Rules, in order, for a closer that does not match the top opener:
///  - '}' while an array element containing ':' is open: the element lost its
///    '{'. Left alone for FixMissingArrayObjectBraces.
///  - ']' where '}' was expected, with an array beneath and a string next
///    (after whitespace and commas): the object was never closed. Becomes "}]".
///  - anything else is rewritten to the expected closer.
/// Closers with nothing open are left as they are.
class FixMismatchedDelimiters : public Sanitizer
{
public:
  FixMismatchedDelimiters() : Sanitizer(toString(SanitizerId::FixMismatchedDelimiters)) {}

protected:
  SanitizerOutcome _sanitize(const std::string &text, const SanitizerConfig &) const override
  {
    struct Frame
    {
      char opener;
      bool elementHasColon;
    };

    JsonScanner scan(text);
    std::vector<Frame> stack;
    std::vector<TextEdit> edits;
    std::vector<std::string> repairs;

    for (std::size_t k = 0; k < scan.size(); ++k)
    {
      const Token &token = scan[k];
      if (token.isOpener())
      {
        stack.push_back({token.symbol, false});
        continue;
      }
      if (stack.empty())
      {
        continue;
      }
      Frame &top = stack.back();
      if (token.is(':') || token.is(','))
      {
        if (top.opener == '[')
          top.elementHasColon = token.is(':');
        continue;
      }
      if (!token.isCloser())
      {
        continue;
      }

      char expected = closerFor(top.opener);
      if (token.symbol == expected)
      {
        stack.pop_back();
        continue;
      }
      if (token.symbol == '}' && top.elementHasColon)
      {
        continue;
      }

      bool arrayBeneath = stack.size() >= 2 && stack[stack.size() - 2].opener == '[';
      if (token.symbol == ']' && arrayBeneath && _nextIsString(scan, k))
      {
        edits.push_back({token.offset, 1, "}]"});
        repairs.push_back("Closed object before ']' at offset " + std::to_string(token.offset));
        stack.pop_back();
        stack.pop_back();
        continue;
      }

      edits.push_back({token.offset, 1, std::string(1, expected)});
      repairs.push_back(std::string("Replaced '") + token.symbol + "' with '" + expected +
                        "' at offset " + std::to_string(token.offset));
      stack.pop_back();
    }

    if (edits.empty())
    {
      return SanitizerOutcome::unchanged(text);
    }
    return SanitizerOutcome::modified(applyEdits(text, edits),
                                      "Fixed " + detail::plural(edits.size(), "mismatched delimiter"),
                                      repairs);
  }

private:
  static bool _nextIsString(const JsonScanner &scan, std::size_t k)
  {
    std::size_t j = k + 1;
    while (j < scan.size() && scan[j].is(','))
      ++j;
    return j < scan.size() && scan[j].isString();
  }
};

/// \brief Closes what a truncated response left open: an unterminated string,
/// then every open container in reverse order. A dangling comma at the cut
/// is dropped and a dangling ':' gets a null value.
class CompleteTruncatedStructures : public Sanitizer
{
public:
  CompleteTruncatedStructures()
      : Sanitizer(toString(SanitizerId::CompleteTruncatedStructures))
  {
  }

protected:
  SanitizerOutcome _sanitize(const std::string &text, const SanitizerConfig &) const override
  {
    auto [first, last] = detail::trimmedBounds(text);
    if (first == last)
    {
      return SanitizerOutcome::unchanged(text);
    }

    std::string result = text.substr(0, last);
    JsonScanner scan(result);
    std::vector<char> open;
    for (const auto &token : scan.tokens())
    {
      if (token.isOpener())
        open.push_back(token.symbol);
      else if (token.isCloser() && !open.empty())
        open.pop_back();
    }

    bool inString = scan.endsInsideString();
    if (!inString && open.empty())
    {
      return SanitizerOutcome::unchanged(text);
    }

    std::vector<std::string> repairs;
    if (inString)
    {
      std::size_t backslashes = 0;
      while (backslashes < result.size() && result[result.size() - 1 - backslashes] == '\\')
        ++backslashes;
      if (backslashes % 2 == 1)
        result.pop_back();
      result += '"';
      repairs.emplace_back("Closed incomplete string");
    }
    else
    {
      const Token &lastToken = scan.tokens().back();
      if (lastToken.is(','))
      {
        result.erase(lastToken.offset);
        while (!result.empty() && isJsonSpace(result.back()))
          result.pop_back();
        repairs.emplace_back("Dropped dangling comma");
      }
      else if (lastToken.is(':'))
      {
        result += " null";
        repairs.emplace_back("Completed dangling property with null");
      }
    }

    for (auto it = open.rbegin(); it != open.rend(); ++it)
    {
      result += closerFor(*it);
    }
    if (!open.empty())
    {
      repairs.push_back("Added " + detail::plural(open.size(), "closing delimiter"));
    }
    return SanitizerOutcome::modified(result, "Completed truncated structures", repairs);
  }
};

} // namespace sanitizers
} // namespace jsonmend
