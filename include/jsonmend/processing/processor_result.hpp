// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Jsonmend, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <jsonmend/processing/processing_error.hpp>
#include <jsonmend/processing/shape_validator.hpp>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace jsonmend
{
namespace processing
{

/// \name Outcome of a single parse and validate attempt.
/// @{
template <typename T> struct ParseSuccess
{
  T data;
};

struct ParseFailure
{
  std::string message;
};

struct ValidationFailure
{
  std::string message;
  std::vector<ValidationIssue> issues;
};

template <typename T>
using ParseAttemptResult = std::variant<ParseSuccess<T>, ParseFailure, ValidationFailure>;
/// @}

/// \brief Either the validated document with its audit trail, or the error
/// that ended processing.
template <typename T> class ProcessorResult
{
public:
  struct Success
  {
    T data;
    std::vector<std::string> steps;
    std::vector<std::string> diagnostics;
  };

  struct Failure
  {
    JsonProcessingError error;
  };

  ProcessorResult(Success success) : _result(std::move(success)) {}
  ProcessorResult(Failure failure) : _result(std::move(failure)) {}

  static ProcessorResult success(T data, std::vector<std::string> steps,
                                 std::vector<std::string> diagnostics)
  {
    return ProcessorResult(Success{std::move(data), std::move(steps), std::move(diagnostics)});
  }

  static ProcessorResult failure(JsonProcessingError error)
  {
    return ProcessorResult(Failure{std::move(error)});
  }

  bool ok() const { return std::holds_alternative<Success>(_result); }
  explicit operator bool() const { return ok(); }

  /// \throws JsonProcessingError when the result is a failure.
  const T &value() const
  {
    if (!ok())
    {
      throw std::get<Failure>(_result).error;
    }
    return std::get<Success>(_result).data;
  }

  /// \throws std::logic_error when the result is a success.
  const JsonProcessingError &error() const
  {
    if (ok())
    {
      throw std::logic_error("ProcessorResult holds a value, not an error");
    }
    return std::get<Failure>(_result).error;
  }

  /// \brief Strategy names applied, in order, for either outcome.
  const std::vector<std::string> &steps() const
  {
    return ok() ? std::get<Success>(_result).steps : std::get<Failure>(_result).error.steps();
  }

  const std::vector<std::string> &diagnostics() const
  {
    return ok() ? std::get<Success>(_result).diagnostics
                : std::get<Failure>(_result).error.diagnostics();
  }

  /// \brief Diagnostics joined with "; ", or empty when there are none.
  std::optional<std::string> diagnosticsText() const
  {
    const auto &lines = diagnostics();
    if (lines.empty())
    {
      return std::nullopt;
    }
    std::string joined;
    for (const auto &line : lines)
    {
      if (!joined.empty())
      {
        joined += "; ";
      }
      joined += line;
    }
    return joined;
  }

private:
  std::variant<Success, Failure> _result;
};

} // namespace processing
} // namespace jsonmend
