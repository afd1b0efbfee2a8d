// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Jsonmend, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <jsonmend/parsers/json.hpp>
#include <functional>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace jsonmend
{
namespace processing
{

/// \brief One reason a parsed document does not have the expected shape.
struct ValidationIssue
{
  /// Location of the offending value, e.g. "items[2].id". Empty for the root.
  std::string path;
  std::string message;

  std::string toString() const { return path.empty() ? message : path + ": " + message; }
};

/// \brief Renders issues as "path: message; path: message".
inline std::string renderIssues(const std::vector<ValidationIssue> &issues)
{
  std::string rendered;
  for (const auto &issue : issues)
  {
    if (!rendered.empty())
    {
      rendered += "; ";
    }
    rendered += issue.toString();
  }
  return rendered;
}

template <typename T> struct ValidationOutcome
{
  bool success{false};
  std::optional<T> data;
  std::vector<ValidationIssue> issues;

  static ValidationOutcome ok(T value)
  {
    ValidationOutcome outcome;
    outcome.success = true;
    outcome.data = std::move(value);
    return outcome;
  }

  static ValidationOutcome fail(std::vector<ValidationIssue> issues)
  {
    ValidationOutcome outcome;
    outcome.issues = std::move(issues);
    return outcome;
  }

  static ValidationOutcome fail(std::string path, std::string message)
  {
    return fail({ValidationIssue{std::move(path), std::move(message)}});
  }
};

/// \brief Checks that a parsed document matches the caller's expected
/// structure and converts it to \c T.
template <typename T> class ShapeValidator
{
public:
  virtual ~ShapeValidator() = default;
  virtual ValidationOutcome<T> validate(const parsers::Json &value) const = 0;
};

/// \brief Adapts any callable `ValidationOutcome<T>(const Json&)`.
template <typename T> class FunctionShapeValidator : public ShapeValidator<T>
{
public:
  using Function = std::function<ValidationOutcome<T>(const parsers::Json &)>;

  explicit FunctionShapeValidator(Function fn) : _fn(std::move(fn)) {}

  ValidationOutcome<T> validate(const parsers::Json &value) const override { return _fn(value); }

private:
  Function _fn;
};

/// \brief Accepts any document unchanged.
class PassThroughValidator : public ShapeValidator<parsers::Json>
{
public:
  ValidationOutcome<parsers::Json> validate(const parsers::Json &value) const override
  {
    return ValidationOutcome<parsers::Json>::ok(value);
  }
};

} // namespace processing
} // namespace jsonmend
