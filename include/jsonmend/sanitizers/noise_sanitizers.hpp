// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Jsonmend, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

/// \file noise_sanitizers.hpp
/// \brief Strategies that strip what surrounds or pollutes the JSON payload:
/// whitespace, Markdown fences, thought preambles, stray control characters,
/// prose around the payload and a repeated copy of the payload.

#include <jsonmend/sanitizers/json_scanner.hpp>
#include <jsonmend/sanitizers/sanitizer_types.hpp>
#include <jsonmend/sanitizers/text_edit.hpp>
#include <cctype>
#include <cstdio>
#include <optional>
#include <regex>
#include <string>
#include <vector>

namespace jsonmend
{
namespace sanitizers
{

namespace detail
{
  /// \brief [first, last) of \p text without surrounding whitespace.
  inline std::pair<std::size_t, std::size_t> trimmedBounds(const std::string &text)
  {
    std::size_t first = 0;
    std::size_t last = text.size();
    while (first < last && isJsonSpace(text[first]))
      ++first;
    while (last > first && isJsonSpace(text[last - 1]))
      --last;
    return {first, last};
  }

  /// \brief Offset of the closer that balances the opener at \p start,
  /// counting only the opener's own bracket type and skipping strings.
  inline std::optional<std::size_t> matchingCloser(const std::string &text, std::size_t start)
  {
    const char open = text[start];
    const char close = closerFor(open);
    int depth = 0;
    bool inString = false;
    for (std::size_t i = start; i < text.size(); ++i)
    {
      char c = text[i];
      if (inString)
      {
        if (c == '\\')
          ++i;
        else if (c == '"')
          inString = false;
        continue;
      }
      if (c == '"')
        inString = true;
      else if (c == open)
        ++depth;
      else if (c == close && --depth == 0)
        return i;
    }
    return std::nullopt;
  }

  inline std::string plural(std::size_t count, const char *noun)
  {
    return std::to_string(count) + " " + noun + (count == 1 ? "" : "s");
  }
} // namespace detail

class TrimWhitespace : public Sanitizer
{
public:
  TrimWhitespace() : Sanitizer(toString(SanitizerId::TrimWhitespace)) {}

protected:
  SanitizerOutcome _sanitize(const std::string &text, const SanitizerConfig &) const override
  {
    auto [first, last] = detail::trimmedBounds(text);
    if (first == last)
    {
      return SanitizerOutcome::unchanged(text);
    }
    return SanitizerOutcome::modified(text.substr(first, last - first),
                                      "Trimmed leading/trailing whitespace");
  }
};

/// \brief Removes Markdown code fences and model "thinking" preambles.
class RemoveCodeFences : public Sanitizer
{
public:
  RemoveCodeFences() : Sanitizer(toString(SanitizerId::RemoveCodeFences)) {}

protected:
  SanitizerOutcome _sanitize(const std::string &text, const SanitizerConfig &) const override
  {
    static const std::regex thinkBlock(R"(^\s*<(think|thinking)>[\s\S]*?</\1>\s*)",
                                       std::regex::icase);
    static const std::regex ctrlThought(R"(<ctrl\d+>\s*thought\s*\n)", std::regex::icase);
    static const std::regex thoughtLabel(R"(^\s*thought\s*:?\s*\n)", std::regex::icase);

    std::string working = text;
    std::vector<std::string> repairs;

    auto stripFirst = [&](const std::regex &pattern, const char *note)
    {
      std::smatch match;
      if (std::regex_search(working, match, pattern))
      {
        working.erase(static_cast<std::size_t>(match.position(0)),
                      static_cast<std::size_t>(match.length(0)));
        repairs.emplace_back(note);
      }
    };
    stripFirst(thinkBlock, "Removed thinking block");
    stripFirst(ctrlThought, "Removed control-style thought marker");
    stripFirst(thoughtLabel, "Removed thought marker");

    std::vector<TextEdit> edits;
    JsonScanner scan(working);
    for (std::size_t pos = working.find("```"); pos != std::string::npos;
         pos = working.find("```", pos + 3))
    {
      if (scan.insideString(pos))
      {
        continue;
      }
      std::size_t end = pos + 3;
      while (end < working.size() && (std::isalnum(static_cast<unsigned char>(working[end])) ||
                                      working[end] == '-' || working[end] == '_'))
      {
        ++end;
      }
      edits.push_back(TextEdit::erase(pos, end - pos));
    }
    if (!edits.empty())
    {
      repairs.push_back("Removed " + detail::plural(edits.size(), "code fence"));
      working = applyEdits(working, edits);
    }

    if (repairs.empty())
    {
      return SanitizerOutcome::unchanged(text);
    }
    return SanitizerOutcome::modified(working, "Removed code fences and wrappers", repairs);
  }
};

/// \brief Outside strings: drops control characters and a byte order mark and
/// turns typographic double quotes into '"'. Inside strings: escapes raw
/// control characters.
class NormalizeCharacters : public Sanitizer
{
public:
  NormalizeCharacters() : Sanitizer(toString(SanitizerId::NormalizeCharacters)) {}

protected:
  SanitizerOutcome _sanitize(const std::string &text, const SanitizerConfig &) const override
  {
    JsonScanner scan(text);
    std::string out;
    out.reserve(text.size());
    std::size_t dropped = 0;
    std::size_t quotes = 0;
    std::size_t escaped = 0;

    auto outside = [&](std::size_t from, std::size_t to)
    {
      for (std::size_t i = from; i < to; ++i)
      {
        unsigned char c = static_cast<unsigned char>(text[i]);
        if (c == 0xEF && text.compare(i, 3, "\xEF\xBB\xBF") == 0)
        {
          i += 2;
          ++dropped;
        }
        else if (c == 0xE2 && (text.compare(i, 3, "\xE2\x80\x9C") == 0 ||
                               text.compare(i, 3, "\xE2\x80\x9D") == 0))
        {
          out += '"';
          i += 2;
          ++quotes;
        }
        else if ((c < 0x20 && c != '\t' && c != '\n' && c != '\r') || c == 0x7F)
        {
          ++dropped;
        }
        else
        {
          out += static_cast<char>(c);
        }
      }
    };

    auto inside = [&](std::size_t from, std::size_t to)
    {
      for (std::size_t i = from; i < to; ++i)
      {
        char c = text[i];
        if (c == '\\' && i + 1 < to)
        {
          out += c;
          out += text[++i];
          continue;
        }
        switch (c)
        {
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
          if (static_cast<unsigned char>(c) >= 0x20)
          {
            out += c;
            continue;
          }
          char buf[8];
          std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned char>(c));
          out += buf;
        }
        ++escaped;
      }
    };

    std::size_t pos = 0;
    for (const auto &token : scan.tokens())
    {
      if (!token.isString())
      {
        continue;
      }
      outside(pos, token.offset);
      inside(token.offset, token.end());
      pos = token.end();
    }
    outside(pos, text.size());

    std::vector<std::string> repairs;
    if (dropped > 0)
      repairs.push_back("Removed " + detail::plural(dropped, "stray control character"));
    if (quotes > 0)
      repairs.push_back("Replaced " + detail::plural(quotes, "typographic quote"));
    if (escaped > 0)
      repairs.push_back("Escaped " + detail::plural(escaped, "raw control character") +
                        " inside strings");

    if (repairs.empty())
    {
      return SanitizerOutcome::unchanged(text);
    }
    return SanitizerOutcome::modified(out, "Normalized characters", repairs);
  }
};

/// \brief Keeps only the JSON payload when prose surrounds it.
class ExtractJsonSpan : public Sanitizer
{
public:
  ExtractJsonSpan() : Sanitizer(toString(SanitizerId::ExtractJsonSpan)) {}

  /// \brief Whether the opener at \p pos is followed by something a JSON
  /// value could continue with. A '{' glued to a word (`else{`) is code.
  static bool looksLikeJsonStart(const std::string &text, std::size_t pos)
  {
    if (pos + 1 >= text.size())
    {
      return false;
    }
    if (text[pos] == '{' && pos > 0)
    {
      char before = text[pos - 1];
      if (std::isalpha(static_cast<unsigned char>(before)) || before == '_' || before == '$')
      {
        return false;
      }
    }
    char next = text[pos + 1];
    if (isJsonSpace(next) || next == '"')
    {
      return true;
    }
    if (text[pos] == '{')
    {
      return next == '}';
    }
    return next == ']' || next == '{' || next == '[' || next == '-' || next == 't' ||
           next == 'f' || next == 'n' || std::isdigit(static_cast<unsigned char>(next));
  }

protected:
  SanitizerOutcome _sanitize(const std::string &text, const SanitizerConfig &) const override
  {
    auto [first, last] = detail::trimmedBounds(text);
    for (std::size_t i = first; i < last; ++i)
    {
      if ((text[i] != '{' && text[i] != '[') || !looksLikeJsonStart(text, i))
      {
        continue;
      }

      auto end = detail::matchingCloser(text, i);
      if (!end || (i == first && *end + 1 == last) || _structureAfter(text, *end + 1, last))
      {
        return SanitizerOutcome::unchanged(text);
      }

      std::size_t leading = i - first;
      std::size_t trailing = last - (*end + 1);
      return SanitizerOutcome::modified(
        text.substr(i, *end + 1 - i), "Extracted JSON span from surrounding text",
        {"Removed " + detail::plural(leading, "leading character") + " and " +
         detail::plural(trailing, "trailing character")});
    }
    return SanitizerOutcome::unchanged(text);
  }

private:
  // A bracket outside strings in [from, to) means the span ended early on a
  // missing opener, not that prose follows.
  static bool _structureAfter(const std::string &text, std::size_t from, std::size_t to)
  {
    JsonScanner scan(text);
    for (std::size_t k = scan.indexAt(from); k < scan.size() && scan[k].offset < to; ++k)
    {
      if (scan[k].isOpener() || scan[k].isCloser())
      {
        return true;
      }
    }
    return false;
  }
};

/// \brief Collapses a top-level object that was emitted twice in a row.
class CollapseDuplicateObject : public Sanitizer
{
public:
  CollapseDuplicateObject() : Sanitizer(toString(SanitizerId::CollapseDuplicateObject)) {}

protected:
  SanitizerOutcome _sanitize(const std::string &text, const SanitizerConfig &) const override
  {
    auto [first, last] = detail::trimmedBounds(text);
    if (first == last || text[first] != '{')
    {
      return SanitizerOutcome::unchanged(text);
    }

    auto end = detail::matchingCloser(text, first);
    if (!end || *end + 1 == last)
    {
      return SanitizerOutcome::unchanged(text);
    }

    std::string object = text.substr(first, *end + 1 - first);
    std::size_t second = *end + 1;
    while (second < last && isJsonSpace(text[second]))
      ++second;
    if (text.compare(second, last - second, object) != 0)
    {
      return SanitizerOutcome::unchanged(text);
    }
    return SanitizerOutcome::modified(object, "Collapsed duplicate JSON object");
  }
};

} // namespace sanitizers
} // namespace jsonmend
