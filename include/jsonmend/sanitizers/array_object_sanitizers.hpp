// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Jsonmend, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <jsonmend/sanitizers/comma_sanitizers.hpp>
#include <jsonmend/sanitizers/json_scanner.hpp>
#include <jsonmend/sanitizers/sanitizer_types.hpp>
#include <jsonmend/sanitizers/text_edit.hpp>
#include <algorithm>
#include <cctype>
#include <string>
#include <string_view>
#include <vector>

namespace jsonmend
{
namespace sanitizers
{

/// \brief Restores the '{' of an array element that lost it.
///
/// Every pattern starts right after "}," inside an array:
///  - stray letters glued to a quoted value followed by ','
///    (`}, ab"text",`) become `{"name": "text",`
///  - optional stray letters glued to a quoted property name followed by ':'
///    (`}, xy"id":` or `}, "id":`) become `{"id":`
///  - a bare word on the next line ending in `",` becomes `{"name": "word",`
///
/// The choice between value and property name is a guess. It improves the
/// success rate on common model output and is not a correctness guarantee.
class FixMissingArrayObjectBraces : public Sanitizer
{
public:
  FixMissingArrayObjectBraces()
      : Sanitizer(toString(SanitizerId::FixMissingArrayObjectBraces))
  {
  }

protected:
  SanitizerOutcome _sanitize(const std::string &text, const SanitizerConfig &config) const override
  {
    std::string working = text;
    std::vector<std::string> repairs;

    auto runPass = [&](auto &&collect)
    {
      JsonScanner scan(working);
      std::vector<TextEdit> edits;
      for (std::size_t k = 0; k + 2 < scan.size(); ++k)
      {
        if (scan[k].is('}') && scan[k + 1].is(',') &&
            scan.isInArrayContext(scan[k + 1].end(), config.contextLookback))
        {
          collect(scan, k + 2, edits);
        }
      }
      if (!edits.empty())
      {
        working = applyEdits(working, edits);
      }
    };

    // Stray token before a quoted value.
    runPass(
      [&](const JsonScanner &scan, std::size_t k, std::vector<TextEdit> &edits)
      {
        if (k + 2 >= scan.size() || !_isStrayToken(scan, scan[k], config))
          return;
        const Token &value = scan[k + 1];
        if (!value.isString() || !value.terminated || value.offset != scan[k].end() ||
            scan.stringContent(value).empty() || !scan[k + 2].is(','))
          return;
        edits.push_back({scan[k].offset, scan[k].length, "{\"name\": "});
        repairs.push_back("Removed stray \"" + std::string(scan.textOf(scan[k])) +
                          "\" and opened an object before value " +
                          std::string(scan.textOf(value)));
      });

    // Optional stray token before a quoted property name.
    runPass(
      [&](const JsonScanner &scan, std::size_t k, std::vector<TextEdit> &edits)
      {
        bool hasStray = _isStrayToken(scan, scan[k], config);
        std::size_t nameIndex = hasStray ? k + 1 : k;
        if (nameIndex + 1 >= scan.size())
          return;
        const Token &name = scan[nameIndex];
        if (!name.isString() || !name.terminated || !scan[nameIndex + 1].is(':') ||
            (hasStray && name.offset != scan[k].end()))
          return;
        if (hasStray)
        {
          edits.push_back({scan[k].offset, scan[k].length, "{"});
          repairs.push_back("Removed stray \"" + std::string(scan.textOf(scan[k])) +
                            "\" and opened an object before property " +
                            std::string(scan.textOf(name)));
        }
        else
        {
          edits.push_back(TextEdit::insert(name.offset, "{"));
          repairs.push_back("Opened an object before property " + std::string(scan.textOf(name)));
        }
      });

    // Bare word closed by a stray quote on a new line.
    runPass(
      [&](const JsonScanner &scan, std::size_t k, std::vector<TextEdit> &edits)
      {
        const Token &word = scan[k];
        std::string_view source = scan.text();
        if (!word.isOther() || !std::isalpha(static_cast<unsigned char>(source[word.offset])) ||
            !detail::isIdentifier(scan.textOf(word)) ||
            !scan.newlineBetween(scan[k - 1].end(), word.offset) ||
            word.end() >= source.size() || source[word.end()] != '"')
          return;
        std::size_t after = word.end() + 1;
        while (after < source.size() && isJsonSpace(source[after]))
          ++after;
        if (after >= source.size() || source[after] != ',')
          return;
        edits.push_back(
          {word.offset, word.length + 1, "{\"name\": \"" + std::string(scan.textOf(word)) + "\""});
        repairs.push_back("Opened an object around truncated element " +
                          std::string(scan.textOf(word)));
      });

    if (working == text)
    {
      return SanitizerOutcome::unchanged(text);
    }
    return SanitizerOutcome::modified(working,
                                      "Fixed missing opening braces for new objects in arrays",
                                      repairs);
  }

private:
  static bool _isStrayToken(const JsonScanner &scan, const Token &token,
                            const SanitizerConfig &config)
  {
    if (!token.isOther() || token.length > config.strayTokenMaxLength)
      return false;
    std::string_view word = scan.textOf(token);
    if (!std::all_of(word.begin(), word.end(),
                     [](char c) { return std::isalpha(static_cast<unsigned char>(c)) != 0; }))
      return false;
    std::string lower(word);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return !detail::isKeyword(lower) && lower != "undefined";
  }
};

} // namespace sanitizers
} // namespace jsonmend
