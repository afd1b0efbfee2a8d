// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Jsonmend, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <jsonmend/core/logger.hpp>
#include <cstddef>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace jsonmend
{
namespace sanitizers
{

/// \brief Tuning knobs shared by all strategies.
struct SanitizerConfig
{
  /// Bytes scanned backwards when deciding array or property-value context.
  std::size_t contextLookback{500};
  /// Cap on fine-grained repair notes kept per strategy run.
  std::size_t maxDiagnostics{20};
  /// Longest stray token removed before an orphaned array object.
  std::size_t strayTokenMaxLength{3};
};

/// \brief Result of one strategy run.
///
/// When \c changed is false, \c content is the strategy input byte for byte.
/// Use the factory functions rather than filling the fields by hand.
struct SanitizerOutcome
{
  std::string content;
  bool changed{false};
  std::optional<std::string> description;
  std::vector<std::string> repairs;

  static SanitizerOutcome unchanged(std::string input, std::vector<std::string> notes = {})
  {
    SanitizerOutcome outcome;
    outcome.content = std::move(input);
    outcome.repairs = std::move(notes);
    return outcome;
  }

  static SanitizerOutcome modified(std::string content, std::string description,
                                   std::vector<std::string> repairs = {})
  {
    SanitizerOutcome outcome;
    outcome.content = std::move(content);
    outcome.changed = true;
    outcome.description = std::move(description);
    outcome.repairs = std::move(repairs);
    return outcome;
  }
};

/// \brief Every built-in strategy, in default pipeline order.
enum class SanitizerId
{
  TrimWhitespace,
  RemoveCodeFences,
  NormalizeCharacters,
  ExtractJsonSpan,
  CollapseDuplicateObject,
  AddMissingCommas,
  RemoveTrailingCommas,
  FixMismatchedDelimiters,
  CompleteTruncatedStructures,
  FixMissingArrayObjectBraces,
  FixUnescapedQuotes,
  FixUnquotedPropertyNames,
  FixUndefinedValues
};

/// \brief Stable snake_case name, as reported in applied steps and accepted
/// in configuration files.
inline const char *toString(SanitizerId id)
{
  switch (id)
  {
  case SanitizerId::TrimWhitespace:
    return "trim_whitespace";
  case SanitizerId::RemoveCodeFences:
    return "remove_code_fences";
  case SanitizerId::NormalizeCharacters:
    return "normalize_characters";
  case SanitizerId::ExtractJsonSpan:
    return "extract_json_span";
  case SanitizerId::CollapseDuplicateObject:
    return "collapse_duplicate_object";
  case SanitizerId::AddMissingCommas:
    return "add_missing_commas";
  case SanitizerId::RemoveTrailingCommas:
    return "remove_trailing_commas";
  case SanitizerId::FixMismatchedDelimiters:
    return "fix_mismatched_delimiters";
  case SanitizerId::CompleteTruncatedStructures:
    return "complete_truncated_structures";
  case SanitizerId::FixMissingArrayObjectBraces:
    return "fix_missing_array_object_braces";
  case SanitizerId::FixUnescapedQuotes:
    return "fix_unescaped_quotes";
  case SanitizerId::FixUnquotedPropertyNames:
    return "fix_unquoted_property_names";
  case SanitizerId::FixUndefinedValues:
    return "fix_undefined_values";
  }
  return "unknown";
}

/// \brief Thrown out of a pipeline run when error containment is disabled.
class SanitizerError : public std::runtime_error
{
public:
  SanitizerError(const std::string &strategy, const std::string &what)
      : std::runtime_error(strategy + " failed: " + what), _strategy(strategy)
  {
  }

  const std::string &strategy() const { return _strategy; }

private:
  std::string _strategy;
};

/// \brief One stateless text repair.
///
/// Implementations override _sanitize(). Callers use apply(), which contains
/// any exception thrown by the implementation, or applyUnguarded() when they
/// want failures to propagate.
class Sanitizer
{
public:
  explicit Sanitizer(std::string name) : _name(std::move(name)) {}
  virtual ~Sanitizer() = default;

  Sanitizer(const Sanitizer &) = delete;
  Sanitizer &operator=(const Sanitizer &) = delete;

  const std::string &name() const { return _name; }

  /// \brief Run the strategy; an internal failure yields an unchanged outcome
  /// whose only repair note is "<name> failed: <reason>".
  SanitizerOutcome apply(const std::string &text, const SanitizerConfig &config = {}) const
  {
    try
    {
      return applyUnguarded(text, config);
    }
    catch (const std::exception &e)
    {
      JSONMEND_LOG_WARN("Sanitizer " << _name << " failed: " << e.what());
      return SanitizerOutcome::unchanged(text, {_name + " failed: " + e.what()});
    }
  }

  /// \brief Run the strategy and let exceptions escape.
  SanitizerOutcome applyUnguarded(const std::string &text,
                                  const SanitizerConfig &config = {}) const
  {
    SanitizerOutcome outcome = _sanitize(text, config);
    if (!outcome.changed || outcome.content == text)
    {
      return SanitizerOutcome::unchanged(text);
    }
    if (outcome.repairs.size() > config.maxDiagnostics)
    {
      std::size_t dropped = outcome.repairs.size() - config.maxDiagnostics;
      outcome.repairs.resize(config.maxDiagnostics);
      outcome.repairs.push_back("... " + std::to_string(dropped) + " more");
    }
    return outcome;
  }

protected:
  virtual SanitizerOutcome _sanitize(const std::string &text,
                                     const SanitizerConfig &config) const = 0;

private:
  std::string _name;
};

using SanitizerPtr = std::shared_ptr<const Sanitizer>;
using SanitizerList = std::vector<SanitizerPtr>;

} // namespace sanitizers
} // namespace jsonmend
