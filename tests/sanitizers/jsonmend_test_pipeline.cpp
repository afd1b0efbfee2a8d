// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Jsonmend, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#define CATCH_CONFIG_MAIN
#include "test_helpers.hpp"
#include <catch2/catch.hpp>

#include <algorithm>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

using namespace jsonmend::sanitizers;

namespace
{

class FailingSanitizer : public Sanitizer
{
public:
  FailingSanitizer() : Sanitizer("boom") {}

protected:
  SanitizerOutcome _sanitize(const std::string &, const SanitizerConfig &) const override
  {
    throw std::runtime_error("kaput");
  }
};

bool containsLine(const std::vector<std::string> &lines, const std::string &needle)
{
  return std::any_of(lines.begin(), lines.end(), [&needle](const std::string &line)
                     { return line.find(needle) != std::string::npos; });
}

} // namespace

TEST_CASE("SanitizerRegistry - Default Order", "[pipeline][registry]")
{
  const std::vector<std::string> expected = {
    "trim_whitespace",
    "remove_code_fences",
    "normalize_characters",
    "extract_json_span",
    "collapse_duplicate_object",
    "add_missing_commas",
    "remove_trailing_commas",
    "fix_mismatched_delimiters",
    "complete_truncated_structures",
    "fix_missing_array_object_braces",
    "fix_unescaped_quotes",
    "fix_unquoted_property_names",
    "fix_undefined_values",
  };

  SanitizerPipeline pipeline;
  REQUIRE(pipeline.strategyNames() == expected);

  SECTION("Structural repairs run in dependency order")
  {
    auto names = pipeline.strategyNames();
    auto position = [&names](const char *name)
    { return std::find(names.begin(), names.end(), name) - names.begin(); };
    REQUIRE(position("add_missing_commas") < position("fix_mismatched_delimiters"));
    REQUIRE(position("fix_mismatched_delimiters") < position("complete_truncated_structures"));
    REQUIRE(position("complete_truncated_structures") <
            position("fix_missing_array_object_braces"));
  }

  SECTION("Every id resolves to its named instance")
  {
    const auto &registry = SanitizerRegistry::builtin();
    for (SanitizerId id : SanitizerRegistry::defaultIds())
    {
      REQUIRE(registry.get(id)->name() == toString(id));
    }
  }
}

TEST_CASE("SanitizerRegistry - Resolving Names", "[pipeline][registry]")
{
  const auto &registry = SanitizerRegistry::builtin();

  SECTION("Custom order is preserved")
  {
    auto list = registry.resolve({"remove_trailing_commas", "trim_whitespace"});
    REQUIRE(list.size() == 2);
    REQUIRE(list[0]->name() == "remove_trailing_commas");
    REQUIRE(list[1]->name() == "trim_whitespace");
  }

  SECTION("Unknown names are rejected")
  {
    REQUIRE_THROWS_AS(registry.resolve({"trim_whitespace", "make_it_valid"}),
                      std::invalid_argument);
  }

  SECTION("Custom strategies can be registered")
  {
    SanitizerRegistry local;
    local.add(std::make_shared<FailingSanitizer>());
    REQUIRE(local.contains("boom"));
    REQUIRE_FALSE(registry.contains("boom"));
    REQUIRE(local.resolve({"boom"}).front()->name() == "boom");
  }
}

TEST_CASE("SanitizerPipeline - Execution", "[pipeline][execute]")
{
  SanitizerPipeline pipeline;

  SECTION("Empty input is returned unchanged")
  {
    auto result = pipeline.execute("");
    REQUIRE_FALSE(result.changed);
    REQUIRE(result.content.empty());
    REQUIRE(result.appliedStrategies.empty());
    REQUIRE_FALSE(result.description.has_value());
  }

  SECTION("Applied strategies are reported in order")
  {
    auto result = pipeline("  {\"a\": 1,}  ");
    REQUIRE(result.changed);
    REQUIRE(result.content == "{\"a\": 1}");
    REQUIRE((result.appliedStrategies ==
             std::vector<std::string>{"trim_whitespace", "remove_trailing_commas"}));
    REQUIRE(result.description == std::string("Applied: trim_whitespace, remove_trailing_commas"));
    REQUIRE(containsLine(result.diagnostics, "remove_trailing_commas: Removed trailing commas"));
    REQUIRE(containsLine(result.diagnostics, "remove_trailing_commas: Removed 1 trailing comma"));
  }

  SECTION("Valid JSON passes through untouched")
  {
    const std::string doc = R"({"msg": "a, b]", "n": [1, 2]})";
    auto result = pipeline.execute(doc);
    REQUIRE_FALSE(result.changed);
    REQUIRE(result.content == doc);
    REQUIRE(result.diagnostics.empty());
  }

  SECTION("Second run changes nothing")
  {
    const std::vector<std::string> inputs = {
      "{\"a\": 1\n\"b\": 2}",
      "{\"a\": 1,}",
      "{\"a\": [1, 2}",
      "{\"a\": {\"b\": 1",
      "{\"items\": [{\"id\":1}, xy\"id\":2}]}",
      "{name: \"x\", value: undefined,}",
      R"({"a": "say \"hi\"", b: 1})",
    };
    for (const auto &input : inputs)
    {
      INFO("input: " << input);
      auto first = pipeline.execute(input);
      REQUIRE(first.changed);
      auto second = pipeline.execute(first.content);
      REQUIRE_FALSE(second.changed);
      REQUIRE(second.content == first.content);
    }
  }
}

TEST_CASE("SanitizerPipeline - Repair Scenarios", "[pipeline][scenarios]")
{
  SanitizerPipeline pipeline;
  auto repaired = [&pipeline](const std::string &text)
  { return jsonmend::test::parseJson(pipeline.execute(text).content); };

  REQUIRE(repaired("{\"a\": 1\n\"b\": 2}") == jsonmend::test::parseJson(R"({"a":1,"b":2})"));
  REQUIRE(repaired("{\"a\": 1,}") == jsonmend::test::parseJson(R"({"a":1})"));
  REQUIRE(repaired("{\"a\": [1, 2}") == jsonmend::test::parseJson(R"({"a":[1,2]})"));
  REQUIRE(repaired("{\"a\": {\"b\": 1") == jsonmend::test::parseJson(R"({"a":{"b":1}})"));
  REQUIRE(repaired("{\"items\": [{\"id\":1}, xy\"id\":2}]}") ==
          jsonmend::test::parseJson(R"({"items":[{"id":1},{"id":2}]})"));
}

TEST_CASE("SanitizerPipeline - Error Containment", "[pipeline][errors]")
{
  SanitizerList strategies = {std::make_shared<FailingSanitizer>(),
                              SanitizerRegistry::builtin().get(SanitizerId::RemoveTrailingCommas)};

  SECTION("Failures become diagnostics by default")
  {
    auto result = executePipeline(strategies, "[1,]");
    REQUIRE(result.content == "[1]");
    REQUIRE((result.appliedStrategies == std::vector<std::string>{"remove_trailing_commas"}));
    REQUIRE(containsLine(result.diagnostics, "boom: boom failed: kaput"));
  }

  SECTION("Failures propagate when containment is off")
  {
    SanitizerPipeline strict(strategies, SanitizerConfig{}, false);
    try
    {
      strict.execute("[1,]");
      FAIL("expected SanitizerError");
    }
    catch (const SanitizerError &e)
    {
      REQUIRE(e.strategy() == "boom");
      REQUIRE(std::string(e.what()) == "boom failed: kaput");
    }
  }

  SECTION("Failures are logged")
  {
    jsonmend::test::LogCapture capture(jsonmend::core::Logger::Level::Warning);
    executePipeline(strategies, "[1,]");
    REQUIRE(capture.contains(jsonmend::core::Logger::Level::Warning, "boom failed: kaput"));
  }
}
