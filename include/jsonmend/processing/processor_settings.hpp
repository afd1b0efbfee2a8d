// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Jsonmend, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <jsonmend/core/config_loader.hpp>
#include <jsonmend/core/logger.hpp>
#include <jsonmend/processing/json_processor.hpp>
#include <jsonmend/sanitizers/sanitizer_registry.hpp>
#include <jsonmend/sanitizers/sanitizer_types.hpp>
#include <cstdint>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace jsonmend
{
namespace processing
{

/// \brief Processor and logging settings read from a configuration file.
///
/// \code
/// [jsonmend.sanitizer]
/// contextLookback = 500
/// maxDiagnostics = 20
/// strayTokenMaxLength = 3
/// strategies = ["trim_whitespace", "remove_trailing_commas"]
///
/// [jsonmend.processor]
/// logSteps = true
/// continueOnError = true
///
/// [jsonmend.log]
/// level = "info"
/// file = "/var/log/jsonmend.log"
/// format = "[%T] [%L] %m"
/// \endcode
struct ProcessorSettings
{
  sanitizers::SanitizerConfig sanitizer;
  /// Ordered strategy names; empty selects the default order.
  std::vector<std::string> strategies;
  bool logSteps{true};
  bool continueOnError{true};
  std::optional<std::string> logLevel;
  std::optional<std::string> logFile;
  std::optional<std::string> logFormat;

  /// \throws std::invalid_argument on an unknown strategy name.
  sanitizers::SanitizerList resolveStrategies(
    const sanitizers::SanitizerRegistry &registry = sanitizers::SanitizerRegistry::builtin()) const
  {
    return strategies.empty() ? registry.defaultOrder() : registry.resolve(strategies);
  }

  CompletionOptions<parsers::Json> completionOptions() const
  {
    CompletionOptions<parsers::Json> options;
    options.sanitizerConfig = sanitizer;
    options.logSteps = logSteps;
    return options;
  }

  JsonProcessor makeProcessor(std::shared_ptr<ProcessingLogger> logger =
                                std::make_shared<DefaultProcessingLogger>()) const
  {
    return JsonProcessor(resolveStrategies(), std::move(logger), continueOnError);
  }
};

namespace detail
{
  inline void readSize(const core::ConfigLoader &loader, const std::string &key,
                       std::size_t &target)
  {
    if (auto value = loader.getInt(key))
    {
      if (*value < 0)
      {
        throw std::invalid_argument("Configuration key '" + key + "' must not be negative");
      }
      target = static_cast<std::size_t>(*value);
    }
  }
} // namespace detail

/// \brief Read every jsonmend.* key present in \p loader; absent keys keep
/// their defaults.
/// \throws std::invalid_argument on a negative size or an unknown strategy.
inline ProcessorSettings loadProcessorSettings(const core::ConfigLoader &loader)
{
  ProcessorSettings settings;
  detail::readSize(loader, "jsonmend.sanitizer.contextLookback",
                   settings.sanitizer.contextLookback);
  detail::readSize(loader, "jsonmend.sanitizer.maxDiagnostics", settings.sanitizer.maxDiagnostics);
  detail::readSize(loader, "jsonmend.sanitizer.strayTokenMaxLength",
                   settings.sanitizer.strayTokenMaxLength);
  if (auto names = loader.getStringArray("jsonmend.sanitizer.strategies"))
  {
    settings.strategies = *names;
    settings.resolveStrategies();
  }
  if (auto logSteps = loader.getBool("jsonmend.processor.logSteps"))
  {
    settings.logSteps = *logSteps;
  }
  if (auto continueOnError = loader.getBool("jsonmend.processor.continueOnError"))
  {
    settings.continueOnError = *continueOnError;
  }
  settings.logLevel = loader.getString("jsonmend.log.level");
  settings.logFile = loader.getString("jsonmend.log.file");
  settings.logFormat = loader.getString("jsonmend.log.format");
  return settings;
}

/// \brief Apply the log settings to core::Logger.
/// \throws std::invalid_argument on an unknown level name.
inline void applyLogSettings(const ProcessorSettings &settings)
{
  core::Logger::Level level = core::Logger::getLevel();
  if (settings.logLevel)
  {
    auto parsed = core::Logger::levelFromString(*settings.logLevel);
    if (!parsed)
    {
      throw std::invalid_argument("Unknown log level '" + *settings.logLevel + "'");
    }
    level = *parsed;
  }
  if (settings.logFile)
  {
    core::Logger::init(level, *settings.logFile);
  }
  else
  {
    core::Logger::setLevel(level);
  }
  if (settings.logFormat)
  {
    core::Logger::setLogFormat(*settings.logFormat);
  }
}

} // namespace processing
} // namespace jsonmend
