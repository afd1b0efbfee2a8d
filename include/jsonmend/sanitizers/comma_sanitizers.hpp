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
#include <cctype>
#include <string>
#include <string_view>
#include <vector>

namespace jsonmend
{
namespace sanitizers
{

namespace detail
{
  inline bool isIdentifier(std::string_view name)
  {
    if (name.empty() || !(std::isalpha(static_cast<unsigned char>(name[0])) || name[0] == '_' ||
                          name[0] == '$'))
    {
      return false;
    }
    for (char c : name)
    {
      if (!(std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '$'))
        return false;
    }
    return true;
  }

  inline bool isKeyword(std::string_view word)
  {
    return word == "true" || word == "false" || word == "null";
  }

  /// \brief Whether \p token can end a JSON value.
  inline bool endsValue(const JsonScanner &scan, const Token &token)
  {
    if (token.isString())
      return token.terminated;
    if (token.isCloser())
      return true;
    if (!token.isOther())
      return false;
    std::string_view word = scan.textOf(token);
    return std::isdigit(static_cast<unsigned char>(word.back())) || isKeyword(word);
  }
} // namespace detail

/// \brief Inserts commas between elements that sit on separate lines (or are
/// adjacent strings in an array) with nothing separating them.
///
/// Three passes run in order, each over a fresh scan of the previous result:
///  - a value followed on a new line by a quoted property name and ':'
///  - two adjacent non-empty strings in an array, followed by ',' or ']'
///  - in an array, a closed element followed on a new line by '"', '{' or '['
class AddMissingCommas : public Sanitizer
{
public:
  AddMissingCommas() : Sanitizer(toString(SanitizerId::AddMissingCommas)) {}

protected:
  SanitizerOutcome _sanitize(const std::string &text, const SanitizerConfig &config) const override
  {
    std::string working = text;
    std::size_t total = 0;
    std::vector<std::string> repairs;

    auto runPass = [&](const char *label, auto &&collect)
    {
      JsonScanner scan(working);
      std::vector<TextEdit> edits;
      collect(scan, edits);
      if (!edits.empty())
      {
        total += edits.size();
        repairs.push_back("Inserted " + detail::plural(edits.size(), "comma") + " " + label);
        working = applyEdits(working, edits);
      }
    };

    runPass("before property names",
            [](const JsonScanner &scan, std::vector<TextEdit> &edits)
            {
              for (std::size_t k = 1; k + 1 < scan.size(); ++k)
              {
                const Token &name = scan[k];
                const Token &prev = scan[k - 1];
                if (!name.isString() || !name.terminated || !scan[k + 1].is(':') ||
                    !detail::isIdentifier(scan.stringContent(name)) ||
                    !detail::endsValue(scan, prev) || prev.end() - 1 < 5 ||
                    !scan.newlineBetween(prev.end(), name.offset))
                {
                  continue;
                }
                edits.push_back(TextEdit::insert(prev.end(), ","));
              }
            });

    runPass("between adjacent array strings",
            [&config](const JsonScanner &scan, std::vector<TextEdit> &edits)
            {
              for (std::size_t k = 0; k + 2 < scan.size(); ++k)
              {
                const Token &first = scan[k];
                const Token &second = scan[k + 1];
                const Token &after = scan[k + 2];
                if (!first.isString() || !second.isString() || !first.terminated ||
                    !second.terminated || scan.stringContent(first).empty() ||
                    scan.stringContent(second).empty() || !(after.is(',') || after.is(']')) ||
                    !scan.isInArrayContext(first.offset, config.contextLookback))
                {
                  continue;
                }
                edits.push_back(
                  TextEdit::insert(first.end(), first.end() == second.offset ? ", " : ","));
              }
            });

    runPass("between array elements",
            [&config](const JsonScanner &scan, std::vector<TextEdit> &edits)
            {
              for (std::size_t k = 0; k + 1 < scan.size(); ++k)
              {
                const Token &prev = scan[k];
                const Token &next = scan[k + 1];
                bool closesElement = prev.isCloser() || (prev.isString() && prev.terminated);
                bool opensElement = next.isString() || next.isOpener();
                if (!closesElement || !opensElement ||
                    !scan.newlineBetween(prev.end(), next.offset) ||
                    !scan.isInArrayContext(prev.end(), config.contextLookback))
                {
                  continue;
                }
                edits.push_back(TextEdit::insert(prev.end(), ","));
              }
            });

    if (total == 0)
    {
      return SanitizerOutcome::unchanged(text);
    }
    return SanitizerOutcome::modified(working,
                                      "Added " + detail::plural(total, "missing comma"), repairs);
  }
};

/// \brief Drops commas (and the whitespace after them) that directly precede
/// a closing brace or bracket.
class RemoveTrailingCommas : public Sanitizer
{
public:
  RemoveTrailingCommas() : Sanitizer(toString(SanitizerId::RemoveTrailingCommas)) {}

protected:
  SanitizerOutcome _sanitize(const std::string &text, const SanitizerConfig &) const override
  {
    JsonScanner scan(text);
    std::vector<TextEdit> edits;
    std::size_t removed = 0;

    for (std::size_t k = 0; k < scan.size(); ++k)
    {
      if (!scan[k].is(',') || (k > 0 && scan[k - 1].is(',')))
      {
        continue;
      }
      std::size_t last = k;
      while (last + 1 < scan.size() && scan[last + 1].is(','))
        ++last;
      if (last + 1 < scan.size() && scan[last + 1].isCloser())
      {
        edits.push_back(TextEdit::erase(scan[k].offset, scan[last + 1].offset - scan[k].offset));
        removed += last - k + 1;
      }
    }

    if (edits.empty())
    {
      return SanitizerOutcome::unchanged(text);
    }
    return SanitizerOutcome::modified(applyEdits(text, edits), "Removed trailing commas",
                                      {"Removed " + detail::plural(removed, "trailing comma")});
  }
};

} // namespace sanitizers
} // namespace jsonmend
