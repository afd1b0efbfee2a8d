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
#include <string>
#include <vector>

namespace jsonmend
{
namespace sanitizers
{

/// \brief Quotes bare identifiers used as property names: `{ name: 1 }`.
class FixUnquotedPropertyNames : public Sanitizer
{
public:
  FixUnquotedPropertyNames() : Sanitizer(toString(SanitizerId::FixUnquotedPropertyNames)) {}

protected:
  SanitizerOutcome _sanitize(const std::string &text, const SanitizerConfig &) const override
  {
    JsonScanner scan(text);
    std::vector<TextEdit> edits;
    std::vector<std::string> repairs;

    for (std::size_t k = 1; k + 1 < scan.size(); ++k)
    {
      const Token &name = scan[k];
      if (!name.isOther() || !(scan[k - 1].is('{') || scan[k - 1].is(',')) ||
          !scan[k + 1].is(':'))
      {
        continue;
      }
      std::string word(scan.textOf(name));
      if (!detail::isIdentifier(word) || detail::isKeyword(word) || word == "undefined")
      {
        continue;
      }
      edits.push_back({name.offset, name.length, "\"" + word + "\""});
      repairs.push_back("Quoted property name " + word);
    }

    if (edits.empty())
    {
      return SanitizerOutcome::unchanged(text);
    }
    return SanitizerOutcome::modified(applyEdits(text, edits), "Fixed unquoted property names",
                                      repairs);
  }
};

/// \brief Replaces a bare `undefined` in value position with `null`.
class FixUndefinedValues : public Sanitizer
{
public:
  FixUndefinedValues() : Sanitizer(toString(SanitizerId::FixUndefinedValues)) {}

protected:
  SanitizerOutcome _sanitize(const std::string &text, const SanitizerConfig &) const override
  {
    JsonScanner scan(text);
    std::vector<TextEdit> edits;

    for (std::size_t k = 1; k < scan.size(); ++k)
    {
      const Token &value = scan[k];
      if (!value.isOther() || scan.textOf(value) != "undefined")
      {
        continue;
      }
      const Token &prev = scan[k - 1];
      bool valuePosition = prev.is(':') || prev.is(',') || prev.is('[');
      bool followedByEnd = k + 1 == scan.size() || scan[k + 1].is(',') || scan[k + 1].isCloser();
      if (valuePosition && followedByEnd)
      {
        edits.push_back({value.offset, value.length, "null"});
      }
    }

    if (edits.empty())
    {
      return SanitizerOutcome::unchanged(text);
    }
    return SanitizerOutcome::modified(
      applyEdits(text, edits), "Replaced undefined values with null",
      {"Replaced " + detail::plural(edits.size(), "undefined value") + " with null"});
  }
};

} // namespace sanitizers
} // namespace jsonmend
