// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Jsonmend, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <jsonmend/core/logger.hpp>
#include <jsonmend/parsers/json.hpp>
#include <jsonmend/processing/processing_error.hpp>
#include <jsonmend/processing/processing_logger.hpp>
#include <jsonmend/processing/processor_result.hpp>
#include <jsonmend/processing/shape_validator.hpp>
#include <jsonmend/sanitizers/sanitizer_pipeline.hpp>
#include <jsonmend/sanitizers/sanitizer_registry.hpp>
#include <jsonmend/sanitizers/sanitizer_types.hpp>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

namespace jsonmend
{
namespace processing
{

/// \brief Per-call options for JsonProcessor::parseAndValidate.
template <typename T = parsers::Json> struct CompletionOptions
{
  /// Required unless T is parsers::Json, in which case any document passes.
  std::shared_ptr<const ShapeValidator<T>> validator;
  sanitizers::SanitizerConfig sanitizerConfig;
  bool logSteps{true};
};

/// \brief Replaces `{"type":"object","properties":{...}}` with its non-empty
/// properties object. Models sometimes answer with the schema they were
/// given instead of data matching it.
/// \return true when \p value was replaced.
inline bool unwrapJsonSchemaStructure(parsers::Json &value)
{
  if (!value.isObject())
  {
    return false;
  }
  const parsers::Json *type = value.find("type");
  const parsers::Json *properties = value.find("properties");
  if (!type || !properties || !type->isString() || type->getString() != "object" ||
      !properties->isObject() || properties->empty())
  {
    return false;
  }
  parsers::Json unwrapped = *properties;
  value = std::move(unwrapped);
  return true;
}

/// \brief Whether \p steps contains anything worth reporting. Whitespace
/// trimming on its own is routine.
inline bool hasSignificantSteps(const std::vector<std::string> &steps)
{
  for (const auto &step : steps)
  {
    if (step != sanitizers::toString(sanitizers::SanitizerId::TrimWhitespace))
    {
      return true;
    }
  }
  return false;
}

/// \brief Parse, validate and repair loop over model-generated JSON text.
///
/// The raw text is parsed first. Each strategy is then applied to the
/// current text in order; a strategy that changes nothing does not trigger
/// a new parse. The loop stops at the first document that parses and
/// validates, and fails immediately when a document parses but does not
/// validate, since further text repair cannot change its shape.
///
/// A processor holds no per-call state and may be shared between threads
/// as long as its logger is thread safe.
class JsonProcessor
{
public:
  JsonProcessor()
      : JsonProcessor(sanitizers::SanitizerRegistry::builtin().defaultOrder())
  {
  }

  explicit JsonProcessor(sanitizers::SanitizerList strategies,
                         std::shared_ptr<ProcessingLogger> logger =
                           std::make_shared<DefaultProcessingLogger>(),
                         bool continueOnError = true)
      : _strategies(std::move(strategies)),
        _logger(std::move(logger)),
        _continueOnError(continueOnError)
  {
  }

  const sanitizers::SanitizerList &strategies() const { return _strategies; }

  void setLogger(std::shared_ptr<ProcessingLogger> logger) { _logger = std::move(logger); }

  /// \brief Repair, parse and validate \p content.
  ///
  /// Strategy failures become diagnostics unless the processor was built
  /// with continueOnError == false, in which case sanitizers::SanitizerError
  /// escapes this call.
  /// \throws std::invalid_argument when no validator is given and T is not
  /// parsers::Json.
  template <typename T = parsers::Json>
  ProcessorResult<T> parseAndValidate(const std::string &content, const std::string &resourceName,
                                      const CompletionOptions<T> &options = {}) const
  {
    auto validator = _validatorFor(options);
    const auto &config = options.sanitizerConfig;

    std::string working = content;
    std::vector<std::string> steps;
    std::vector<std::string> diagnostics;
    std::optional<std::string> lastStrategy;
    std::string lastError;

    auto attempt = _attempt(working, *validator);
    if (auto *success = std::get_if<ParseSuccess<T>>(&attempt))
    {
      return ProcessorResult<T>::success(std::move(success->data), steps, diagnostics);
    }
    if (auto *invalid = std::get_if<ValidationFailure>(&attempt))
    {
      return _fail<T>(_validationError(resourceName, content, working, steps, lastStrategy,
                                       diagnostics, *invalid));
    }
    lastError = std::get<ParseFailure>(attempt).message;

    for (const auto &sanitizer : _strategies)
    {
      if (!sanitizer)
      {
        continue;
      }
      auto outcome = sanitizers::detail::runStrategy(*sanitizer, working, config, _continueOnError);
      if (!sanitizers::detail::recordOutcome(*sanitizer, outcome, working, steps, diagnostics))
      {
        continue;
      }
      lastStrategy = sanitizer->name();

      attempt = _attempt(working, *validator);
      if (auto *success = std::get_if<ParseSuccess<T>>(&attempt))
      {
        if (options.logSteps && _logger && hasSignificantSteps(steps))
        {
          _logger->logSanitizationSummary(resourceName, steps, diagnostics);
        }
        return ProcessorResult<T>::success(std::move(success->data), std::move(steps),
                                           std::move(diagnostics));
      }
      if (auto *invalid = std::get_if<ValidationFailure>(&attempt))
      {
        return _fail<T>(_validationError(resourceName, content, working, steps, lastStrategy,
                                         diagnostics, *invalid));
      }
      lastError = std::get<ParseFailure>(attempt).message;
    }

    ProcessingErrorDetails details;
    details.kind = ProcessingErrorKind::Parse;
    details.resource = resourceName;
    details.originalText = content;
    details.finalText = working;
    details.steps = std::move(steps);
    details.cause = lastError;
    details.lastStrategy = lastStrategy;
    details.diagnostics = std::move(diagnostics);
    std::string message = "Response for resource '" + resourceName +
                          "' cannot be parsed to JSON after " +
                          std::to_string(details.steps.size()) +
                          " sanitization step(s): " + lastError;
    return _fail<T>(JsonProcessingError(message, std::move(details)));
  }

  template <typename T = parsers::Json>
  ProcessorResult<T> parseAndValidate(const char *content, const std::string &resourceName,
                                      const CompletionOptions<T> &options = {}) const
  {
    return parseAndValidate<T>(std::string(content ? content : ""), resourceName, options);
  }

  /// \brief Already-structured content. Only a JSON string is processed;
  /// anything else is a NotAStringResponse failure.
  template <typename T = parsers::Json>
  ProcessorResult<T> parseAndValidate(const parsers::Json &content,
                                      const std::string &resourceName,
                                      const CompletionOptions<T> &options = {}) const
  {
    if (content.isString())
    {
      return parseAndValidate<T>(content.getString(), resourceName, options);
    }
    ProcessingErrorDetails details;
    details.kind = ProcessingErrorKind::NotAStringResponse;
    details.resource = resourceName;
    details.originalText = content.dump();
    details.finalText = details.originalText;
    details.cause = std::string("expected a string, got ") + content.typeName();
    std::string message = "Response for resource '" + resourceName +
                          "' is not a string and cannot be processed as JSON text (" +
                          details.cause + ")";
    return _fail<T>(JsonProcessingError(message, std::move(details)));
  }

private:
  sanitizers::SanitizerList _strategies;
  std::shared_ptr<ProcessingLogger> _logger;
  bool _continueOnError;

  template <typename T>
  static std::shared_ptr<const ShapeValidator<T>> _validatorFor(const CompletionOptions<T> &options)
  {
    if (options.validator)
    {
      return options.validator;
    }
    if constexpr (std::is_same_v<T, parsers::Json>)
    {
      return std::make_shared<PassThroughValidator>();
    }
    else
    {
      throw std::invalid_argument("parseAndValidate: a shape validator is required");
    }
  }

  template <typename T>
  static ParseAttemptResult<T> _attempt(const std::string &text, const ShapeValidator<T> &validator)
  {
    auto parsed = parsers::Json::parse(text);
    if (!parsed.ok)
    {
      return ParseFailure{parsed.error.describe()};
    }
    if (unwrapJsonSchemaStructure(parsed.value))
    {
      JSONMEND_LOG_DEBUG("Unwrapped JSON Schema structure to its properties");
    }
    auto validation = validator.validate(parsed.value);
    if (validation.success && validation.data)
    {
      return ParseSuccess<T>{std::move(*validation.data)};
    }
    if (validation.issues.empty())
    {
      validation.issues.push_back({"", "validator rejected the document"});
    }
    return ValidationFailure{renderIssues(validation.issues), std::move(validation.issues)};
  }

  static JsonProcessingError _validationError(const std::string &resource,
                                              const std::string &original,
                                              const std::string &working,
                                              const std::vector<std::string> &steps,
                                              const std::optional<std::string> &lastStrategy,
                                              const std::vector<std::string> &diagnostics,
                                              const ValidationFailure &failure)
  {
    ProcessingErrorDetails details;
    details.kind = ProcessingErrorKind::Validation;
    details.resource = resource;
    details.originalText = original;
    details.finalText = working;
    details.steps = steps;
    details.cause = failure.message;
    details.lastStrategy = lastStrategy;
    details.diagnostics = diagnostics;
    details.issues = failure.issues;
    return JsonProcessingError("Response for resource '" + resource +
                                 "' parsed as JSON but failed shape validation: " +
                                 failure.message,
                               std::move(details));
  }

  template <typename T> ProcessorResult<T> _fail(JsonProcessingError error) const
  {
    if (_logger)
    {
      _logger->logFailure(error);
    }
    return ProcessorResult<T>::failure(std::move(error));
  }
};

} // namespace processing
} // namespace jsonmend
