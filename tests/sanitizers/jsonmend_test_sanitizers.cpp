// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Jsonmend, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#define CATCH_CONFIG_MAIN
#include "test_helpers.hpp"
#include <catch2/catch.hpp>

#include <stdexcept>
#include <string>
#include <vector>

using namespace jsonmend::sanitizers;
using jsonmend::test::parses;

namespace
{

template <typename S> SanitizerOutcome run(const std::string &text, const SanitizerConfig &config = {})
{
  S sanitizer;
  return sanitizer.apply(text, config);
}

/// \brief Applies \p S and checks the result no longer triggers it.
template <typename S> std::string repairOnce(const std::string &text)
{
  auto first = run<S>(text);
  REQUIRE(first.changed);
  REQUIRE(first.description.has_value());
  auto second = run<S>(first.content);
  REQUIRE_FALSE(second.changed);
  REQUIRE(second.content == first.content);
  return first.content;
}

template <typename S> void requireUnchanged(const std::string &text)
{
  auto outcome = run<S>(text);
  REQUIRE_FALSE(outcome.changed);
  REQUIRE(outcome.content == text);
  REQUIRE_FALSE(outcome.description.has_value());
}

class ThrowingSanitizer : public Sanitizer
{
public:
  ThrowingSanitizer() : Sanitizer("boom") {}

protected:
  SanitizerOutcome _sanitize(const std::string &, const SanitizerConfig &) const override
  {
    throw std::runtime_error("kaput");
  }
};

class ChattySanitizer : public Sanitizer
{
public:
  ChattySanitizer() : Sanitizer("chatty") {}

protected:
  SanitizerOutcome _sanitize(const std::string &text, const SanitizerConfig &) const override
  {
    return SanitizerOutcome::modified(text + " ", "Appended a space",
                                      {"one", "two", "three", "four", "five"});
  }
};

} // namespace

TEST_CASE("JsonScanner - Token Stream", "[sanitizers][scanner]")
{
  SECTION("Structural characters inside strings are not tokens")
  {
    const std::string text = R"({"a": "x,]"})";
    JsonScanner scan(text);
    REQUIRE(scan.size() == 5);
    REQUIRE(scan[0].is('{'));
    REQUIRE(scan[1].isString());
    REQUIRE(scan[2].is(':'));
    REQUIRE(scan[3].isString());
    REQUIRE(scan.stringContent(scan[3]) == "x,]");
    REQUIRE(scan[4].is('}'));
    REQUIRE(scan.insideString(text.find(',')));
    REQUIRE_FALSE(scan.insideString(scan[3].offset));
    REQUIRE_FALSE(scan.insideString(scan[3].end() - 1));
  }

  SECTION("Backslash runs are paired")
  {
    const std::string text = R"(["a\\", "b\"c"])";
    JsonScanner scan(text);
    REQUIRE(scan.size() == 5);
    REQUIRE(scan.stringContent(scan[1]) == R"(a\\)");
    REQUIRE(scan.stringContent(scan[3]) == R"(b\"c)");
    REQUIRE(scan[4].is(']'));
  }

  SECTION("Unterminated trailing string")
  {
    JsonScanner scan(R"({"a": "abc)");
    REQUIRE(scan.endsInsideString());
    REQUIRE_FALSE(scan.tokens().back().terminated);
    REQUIRE_FALSE(JsonScanner(R"({"a": "abc"})").endsInsideString());
  }

  SECTION("Other tokens")
  {
    JsonScanner scan("{name: undefined}");
    REQUIRE(scan[1].isOther());
    REQUIRE(scan.textOf(scan[1]) == "name");
    REQUIRE(scan.textOf(scan[3]) == "undefined");
  }
}

TEST_CASE("JsonScanner - Array Context", "[sanitizers][scanner]")
{
  SECTION("Innermost open container decides")
  {
    const std::string inArray = R"([{"a": 1}, )";
    REQUIRE(JsonScanner(inArray).isInArrayContext(inArray.size(), 500));

    const std::string inObject = R"({"a": [1], )";
    REQUIRE_FALSE(JsonScanner(inObject).isInArrayContext(inObject.size(), 500));
  }

  SECTION("Brackets inside strings are ignored")
  {
    const std::string text = R"({"a": "[", )";
    REQUIRE_FALSE(JsonScanner(text).isInArrayContext(text.size(), 500));
  }

  SECTION("Lookback window limits the search")
  {
    const std::string text = "[" + std::string(50, ' ') + "1, ";
    JsonScanner scan(text);
    REQUIRE(scan.isInArrayContext(text.size(), 500));
    REQUIRE_FALSE(scan.isInArrayContext(text.size(), 10));
  }
}

TEST_CASE("TextEdit - Correction List", "[sanitizers][edits]")
{
  SECTION("Edits use original offsets")
  {
    std::vector<TextEdit> edits = {TextEdit::insert(3, "X"), TextEdit::erase(0, 1), {4, 1, "Y"}};
    REQUIRE(applyEdits("abcdef", edits) == "bcXdYf");
  }

  SECTION("Overlapping and out-of-range edits are dropped")
  {
    std::vector<TextEdit> edits = {{1, 3, "Z"}, {2, 1, "W"}, TextEdit::insert(99, "!")};
    REQUIRE(applyEdits("abcdef", edits) == "aZef");
  }

  SECTION("Insertions at one offset keep their order")
  {
    std::vector<TextEdit> edits = {TextEdit::insert(1, "1"), TextEdit::insert(1, "2")};
    REQUIRE(applyEdits("ab", edits) == "a12b");
  }
}

TEST_CASE("Sanitizer - Contract", "[sanitizers][contract]")
{
  SECTION("Internal failures are contained")
  {
    ThrowingSanitizer sanitizer;
    auto outcome = sanitizer.apply("{\"a\": 1}");
    REQUIRE_FALSE(outcome.changed);
    REQUIRE(outcome.content == "{\"a\": 1}");
    REQUIRE(outcome.repairs.size() == 1);
    REQUIRE(outcome.repairs[0] == "boom failed: kaput");
  }

  SECTION("Unguarded runs propagate")
  {
    ThrowingSanitizer sanitizer;
    REQUIRE_THROWS_WITH(sanitizer.applyUnguarded("{}"), "kaput");
  }

  SECTION("Repair notes are capped")
  {
    SanitizerConfig config;
    config.maxDiagnostics = 2;
    auto outcome = ChattySanitizer().apply("{}", config);
    REQUIRE(outcome.changed);
    REQUIRE((outcome.repairs == std::vector<std::string>{"one", "two", "... 3 more"}));
  }

  SECTION("Names are stable")
  {
    REQUIRE(std::string(toString(SanitizerId::FixMismatchedDelimiters)) ==
            "fix_mismatched_delimiters");
    REQUIRE(AddMissingCommas().name() == "add_missing_commas");
  }
}

TEST_CASE("Sanitizers - Noise Removal", "[sanitizers][noise]")
{
  SECTION("trim_whitespace")
  {
    REQUIRE(repairOnce<TrimWhitespace>("  {\"a\": 1}\n") == "{\"a\": 1}");
    requireUnchanged<TrimWhitespace>("{\"a\": 1}");
    requireUnchanged<TrimWhitespace>("   ");
  }

  SECTION("remove_code_fences")
  {
    REQUIRE(repairOnce<RemoveCodeFences>("```json\n{\"a\": 1}\n```") == "\n{\"a\": 1}\n");
    REQUIRE(repairOnce<RemoveCodeFences>("<think>plan it</think>\n{\"a\": 1}") == "{\"a\": 1}");
    REQUIRE(repairOnce<RemoveCodeFences>("thought:\n{\"a\": 1}") == "{\"a\": 1}");
    requireUnchanged<RemoveCodeFences>(R"({"code": "```js"})");
  }

  SECTION("normalize_characters")
  {
    REQUIRE(repairOnce<NormalizeCharacters>("{\"a\": \"x\ny\"}") == R"({"a": "x\ny"})");
    REQUIRE(repairOnce<NormalizeCharacters>("{\"a\": \"x\ty\x01\"}") == R"({"a": "x\ty\u0001"})");
    REQUIRE(repairOnce<NormalizeCharacters>("\xEF\xBB\xBF{\x01\"a\": 1}") == R"({"a": 1})");
    REQUIRE(repairOnce<NormalizeCharacters>("{\xE2\x80\x9C" "a\xE2\x80\x9D: 1}") ==
            R"({"a": 1})");
    requireUnchanged<NormalizeCharacters>("{\n  \"a\": \"\\n\"\n}");
  }

  SECTION("extract_json_span")
  {
    REQUIRE(repairOnce<ExtractJsonSpan>("Here is the result: {\"a\": [1]} Hope it helps!") ==
            "{\"a\": [1]}");
    REQUIRE(repairOnce<ExtractJsonSpan>("Output:\n[1, 2]\nDone") == "[1, 2]");
    requireUnchanged<ExtractJsonSpan>("{\"a\": 1}");
    requireUnchanged<ExtractJsonSpan>("Result: {\"a\": 1");
    requireUnchanged<ExtractJsonSpan>("no json here");
  }

  SECTION("extract_json_span keeps closers that follow a missing opener")
  {
    requireUnchanged<ExtractJsonSpan>(R"({"a": [{"b":1}, x"c":2}]})");
    requireUnchanged<ExtractJsonSpan>(R"(Result: {"a": {"b": 1}}]})");
    REQUIRE(repairOnce<ExtractJsonSpan>(R"(Result: {"a": 1} "see [notes]")") == R"({"a": 1})");
  }

  SECTION("extract_json_span skips braces glued to code")
  {
    REQUIRE(repairOnce<ExtractJsonSpan>("if (x) else{ return; } then {\"a\": 1} done") ==
            "{\"a\": 1}");
  }

  SECTION("collapse_duplicate_object")
  {
    REQUIRE(repairOnce<CollapseDuplicateObject>("{\"a\": 1}\n{\"a\": 1}") == "{\"a\": 1}");
    requireUnchanged<CollapseDuplicateObject>("{\"a\": 1}\n{\"a\": 2}");
    requireUnchanged<CollapseDuplicateObject>("{\"a\": 1}");
  }
}

TEST_CASE("Sanitizers - Commas", "[sanitizers][commas]")
{
  SECTION("Missing comma before a property on a new line")
  {
    auto repaired = repairOnce<AddMissingCommas>("{\"a\": 1\n\"b\": 2}");
    REQUIRE(repaired == "{\"a\": 1,\n\"b\": 2}");
    REQUIRE(parses(repaired));
  }

  SECTION("Missing comma between array strings")
  {
    REQUIRE(repairOnce<AddMissingCommas>(R"(["a" "b"])") == R"(["a", "b"])");
    REQUIRE(repairOnce<AddMissingCommas>(R"(["a""b"])") == R"(["a", "b"])");
  }

  SECTION("Missing comma between array elements on separate lines")
  {
    auto repaired = repairOnce<AddMissingCommas>("[\n  {\"a\": 1}\n  {\"b\": 2}\n]");
    REQUIRE(repaired == "[\n  {\"a\": 1},\n  {\"b\": 2}\n]");
    REQUIRE(parses(repaired));
  }

  SECTION("Strings in objects are not treated as array elements")
  {
    requireUnchanged<AddMissingCommas>("{\"a\": \"x\" \"y\"}");
  }

  SECTION("Trailing commas")
  {
    REQUIRE(repairOnce<RemoveTrailingCommas>("{\"a\": 1,}") == "{\"a\": 1}");
    REQUIRE(repairOnce<RemoveTrailingCommas>("{\"a\": [1, 2,], }") == "{\"a\": [1, 2]}");
    REQUIRE(repairOnce<RemoveTrailingCommas>("[1,,\n]") == "[1]");
  }

  SECTION("Commas inside strings are untouched")
  {
    requireUnchanged<RemoveTrailingCommas>(R"({"a": "x,}"})");
    requireUnchanged<AddMissingCommas>(R"({"msg": "a, b]"})");
  }
}

TEST_CASE("Sanitizers - Delimiters", "[sanitizers][delimiters]")
{
  SECTION("Wrong closer is replaced")
  {
    REQUIRE(repairOnce<FixMismatchedDelimiters>(R"({"a": [1, 2}})") == R"({"a": [1, 2]})");
  }

  SECTION("Array closer where an object closer belongs")
  {
    auto repaired = repairOnce<FixMismatchedDelimiters>(R"({"x": [{"a": 1], "b": 2})");
    REQUIRE(repaired == R"({"x": [{"a": 1}], "b": 2})");
    REQUIRE(parses(repaired));
  }

  SECTION("Object closer for an element that lost its opener is left alone")
  {
    requireUnchanged<FixMismatchedDelimiters>(R"({"items": [{"id":1}, xy"id":2}]})");
  }

  SECTION("Balanced and string-embedded delimiters")
  {
    requireUnchanged<FixMismatchedDelimiters>(R"({"a": [1, {"b": "]}"}]})");
  }

  SECTION("Truncated structures are completed")
  {
    REQUIRE(repairOnce<CompleteTruncatedStructures>(R"({"a": {"b": 1)") ==
            R"({"a": {"b": 1}})");
    REQUIRE(repairOnce<CompleteTruncatedStructures>(R"({"a": "abc)") == R"({"a": "abc"})");
    REQUIRE(repairOnce<CompleteTruncatedStructures>("{\"a\": [1, 2,\n") == "{\"a\": [1, 2]}");
    REQUIRE(repairOnce<CompleteTruncatedStructures>(R"({"a":)") == R"({"a": null})");
    REQUIRE(repairOnce<CompleteTruncatedStructures>(R"({"a": "x\)") == R"({"a": "x"})");
    requireUnchanged<CompleteTruncatedStructures>(R"({"a": [1]})");
  }
}

TEST_CASE("Sanitizers - Missing Array Object Braces", "[sanitizers][braces]")
{
  SECTION("Stray token before a property name")
  {
    auto repaired =
      repairOnce<FixMissingArrayObjectBraces>(R"({"items": [{"id":1}, xy"id":2}]})");
    REQUIRE(repaired == R"({"items": [{"id":1}, {"id":2}]})");
    REQUIRE(parses(repaired));
  }

  SECTION("Missing opener without a stray token")
  {
    REQUIRE(repairOnce<FixMissingArrayObjectBraces>(R"([{"id":1}, "id":2}])") ==
            R"([{"id":1}, {"id":2}])");
  }

  SECTION("Stray token before a value")
  {
    REQUIRE(repairOnce<FixMissingArrayObjectBraces>(R"([{"name": "a"}, ab"text", 1])") ==
            R"([{"name": "a"}, {"name": "text", 1])");
  }

  SECTION("Bare word closed by a stray quote")
  {
    REQUIRE(repairOnce<FixMissingArrayObjectBraces>("[{\"a\": 1},\nword\", 2]") ==
            "[{\"a\": 1},\n{\"name\": \"word\", 2]");
  }

  SECTION("Only inside arrays")
  {
    requireUnchanged<FixMissingArrayObjectBraces>(R"({"a": {"b": 1}, xy"c": 2})");
  }

  SECTION("Keywords and long words are not stray tokens")
  {
    requireUnchanged<FixMissingArrayObjectBraces>(R"([{"id":1}, null"x", 2])");
    requireUnchanged<FixMissingArrayObjectBraces>(R"([{"id":1}, abcd"x", 2])");
  }
}

TEST_CASE("Sanitizers - Quotes and Property Names", "[sanitizers][quotes]")
{
  SECTION("Attribute quotes inside a string value")
  {
    auto repaired = repairOnce<FixUnescapedQuotes>(R"({"html": "<a href="x">link</a>"})");
    REQUIRE(repaired == R"({"html": "<a href=\"x\">link</a>"})");
    REQUIRE(parses(repaired));
  }

  SECTION("Raw quote after an escaped quote")
  {
    auto repaired = repairOnce<FixUnescapedQuotes>(R"({"a": "say \""hi"})");
    REQUIRE(repaired == R"({"a": "say \"\"hi"})");
    REQUIRE(parses(repaired));
  }

  SECTION("Plain values are untouched")
  {
    requireUnchanged<FixUnescapedQuotes>(R"({"a": "plain", "b": [1, 2]})");
  }

  SECTION("Escaped quote at the end of a closed string")
  {
    requireUnchanged<FixUnescapedQuotes>(R"({"a": "say \"hi\"", "b": 1})");
    requireUnchanged<FixUnescapedQuotes>(R"({"a": "say \"hi\"", b: 1})");
    requireUnchanged<FixUnescapedQuotes>(R"(["say \"hi\""])");
  }

  SECTION("Unquoted property names")
  {
    auto repaired = repairOnce<FixUnquotedPropertyNames>(R"({name: "x", age: 3})");
    REQUIRE(repaired == R"({"name": "x", "age": 3})");
    REQUIRE(parses(repaired));
    requireUnchanged<FixUnquotedPropertyNames>(R"({"a": "b, c: d"})");
  }

  SECTION("Undefined values")
  {
    auto repaired = repairOnce<FixUndefinedValues>(R"({"a": undefined, "b": [undefined]})");
    REQUIRE(repaired == R"({"a": null, "b": [null]})");
    requireUnchanged<FixUndefinedValues>(R"({"a": "undefined"})");
  }
}

TEST_CASE("Sanitizers - Valid JSON Is Left Alone", "[sanitizers][noop]")
{
  const std::vector<std::string> documents = {
    R"({"msg": "a, b]"})",
    R"({"items": [{"id": 1}, {"id": 2}], "ok": true, "none": null})",
    "{\n  \"a\": [\n    \"x\",\n    \"y\"\n  ],\n  \"b\": {\"c\": -1.5e3}\n}",
    R"(["{", "}", "[", "]", ",", ":"])",
  };

  for (const auto &doc : documents)
  {
    INFO("document: " << doc);
    REQUIRE(parses(doc));
    for (const auto &sanitizer : SanitizerRegistry::builtin().defaultOrder())
    {
      INFO("strategy: " << sanitizer->name());
      auto outcome = sanitizer->apply(doc);
      REQUIRE_FALSE(outcome.changed);
      REQUIRE(outcome.content == doc);
    }
  }
}
