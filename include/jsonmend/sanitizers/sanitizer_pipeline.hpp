// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Jsonmend, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <jsonmend/core/logger.hpp>
#include <jsonmend/sanitizers/sanitizer_registry.hpp>
#include <jsonmend/sanitizers/sanitizer_types.hpp>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace jsonmend
{
namespace sanitizers
{

/// \brief Outcome of running an ordered list of strategies over one text.
struct PipelineResult
{
  std::string content;
  bool changed{false};
  /// "Applied: A, B, C" when at least one strategy changed the text.
  std::optional<std::string> description;
  /// Strategy descriptions, repair notes and failure notes, each prefixed
  /// with the originating strategy name.
  std::vector<std::string> diagnostics;
  std::vector<std::string> appliedStrategies;
};

namespace detail
{
  inline std::string joinNames(const std::vector<std::string> &names)
  {
    std::string joined;
    for (const auto &name : names)
    {
      if (!joined.empty())
      {
        joined += ", ";
      }
      joined += name;
    }
    return joined;
  }

  /// \brief Fold one strategy outcome into the running diagnostics and step
  /// list. Returns true when the working text changed.
  inline bool recordOutcome(const Sanitizer &sanitizer, SanitizerOutcome &outcome,
                            std::string &working, std::vector<std::string> &steps,
                            std::vector<std::string> &diagnostics)
  {
    const std::string &name = sanitizer.name();
    if (outcome.changed && outcome.description)
    {
      diagnostics.push_back(name + ": " + *outcome.description);
    }
    for (const auto &repair : outcome.repairs)
    {
      diagnostics.push_back(name + ": " + repair);
    }
    if (!outcome.changed)
    {
      return false;
    }
    working = std::move(outcome.content);
    steps.push_back(name);
    return true;
  }

  /// \brief Run one strategy at the pipeline boundary.
  ///
  /// With containment, failures come back as an unchanged outcome carrying a
  /// failure note. Without it they are rethrown as SanitizerError.
  inline SanitizerOutcome runStrategy(const Sanitizer &sanitizer, const std::string &text,
                                      const SanitizerConfig &config, bool continueOnError)
  {
    if (continueOnError)
    {
      return sanitizer.apply(text, config);
    }
    try
    {
      return sanitizer.applyUnguarded(text, config);
    }
    catch (const SanitizerError &)
    {
      throw;
    }
    catch (const std::exception &e)
    {
      throw SanitizerError(sanitizer.name(), e.what());
    }
  }
} // namespace detail

/// \brief Apply \p strategies in order to \p text.
inline PipelineResult executePipeline(const SanitizerList &strategies, const std::string &text,
                                      const SanitizerConfig &config = {},
                                      bool continueOnError = true)
{
  PipelineResult result;
  result.content = text;
  if (text.empty())
  {
    return result;
  }

  for (const auto &sanitizer : strategies)
  {
    if (!sanitizer)
    {
      continue;
    }
    SanitizerOutcome outcome =
      detail::runStrategy(*sanitizer, result.content, config, continueOnError);
    detail::recordOutcome(*sanitizer, outcome, result.content, result.appliedStrategies,
                          result.diagnostics);
  }

  if (!result.appliedStrategies.empty())
  {
    result.changed = true;
    result.description = "Applied: " + detail::joinNames(result.appliedStrategies);
    JSONMEND_LOG_DEBUG("Sanitizer pipeline " << *result.description);
  }
  return result;
}

/// \brief Reusable pipeline bound to a strategy list and its settings.
///
/// Holds no per-call state; one instance may be shared by concurrent callers.
class SanitizerPipeline
{
public:
  SanitizerPipeline()
      : SanitizerPipeline(SanitizerRegistry::builtin().defaultOrder())
  {
  }

  explicit SanitizerPipeline(SanitizerList strategies, SanitizerConfig config = {},
                             bool continueOnError = true)
      : _strategies(std::move(strategies)),
        _config(config),
        _continueOnError(continueOnError)
  {
  }

  PipelineResult execute(const std::string &text) const
  {
    return executePipeline(_strategies, text, _config, _continueOnError);
  }

  PipelineResult operator()(const std::string &text) const { return execute(text); }

  const SanitizerList &strategies() const { return _strategies; }
  const SanitizerConfig &config() const { return _config; }
  bool continueOnError() const { return _continueOnError; }

  std::vector<std::string> strategyNames() const
  {
    std::vector<std::string> names;
    for (const auto &sanitizer : _strategies)
    {
      names.push_back(sanitizer->name());
    }
    return names;
  }

private:
  SanitizerList _strategies;
  SanitizerConfig _config;
  bool _continueOnError;
};

} // namespace sanitizers
} // namespace jsonmend
