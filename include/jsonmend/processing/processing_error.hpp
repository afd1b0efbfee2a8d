// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Jsonmend, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <jsonmend/processing/shape_validator.hpp>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace jsonmend
{
namespace processing
{

enum class ProcessingErrorKind
{
  /// Content was not text at all. Nothing was attempted.
  NotAStringResponse,
  /// No strategy produced parseable text.
  Parse,
  /// Text parsed but the document has the wrong shape.
  Validation
};

inline const char *toString(ProcessingErrorKind kind)
{
  switch (kind)
  {
  case ProcessingErrorKind::NotAStringResponse:
    return "not_a_string_response";
  case ProcessingErrorKind::Parse:
    return "parse";
  case ProcessingErrorKind::Validation:
    return "validation";
  }
  return "unknown";
}

/// \brief Everything needed to reproduce a failed processing run.
struct ProcessingErrorDetails
{
  ProcessingErrorKind kind{ProcessingErrorKind::Parse};
  std::string resource;
  std::string originalText;
  /// The most-sanitized text that was attempted last.
  std::string finalText;
  std::vector<std::string> steps;
  /// Parser message or rendered validation issues.
  std::string cause;
  std::optional<std::string> lastStrategy;
  std::vector<std::string> diagnostics;
  std::vector<ValidationIssue> issues;
};

class JsonProcessingError : public std::runtime_error
{
public:
  JsonProcessingError(const std::string &message, ProcessingErrorDetails details)
      : std::runtime_error(message), _details(std::move(details))
  {
  }

  ProcessingErrorKind kind() const { return _details.kind; }
  const std::string &resource() const { return _details.resource; }
  const std::string &originalText() const { return _details.originalText; }
  const std::string &finalText() const { return _details.finalText; }
  const std::vector<std::string> &steps() const { return _details.steps; }
  const std::string &cause() const { return _details.cause; }
  const std::optional<std::string> &lastStrategy() const { return _details.lastStrategy; }
  const std::vector<std::string> &diagnostics() const { return _details.diagnostics; }
  const std::vector<ValidationIssue> &issues() const { return _details.issues; }
  const ProcessingErrorDetails &details() const { return _details; }

private:
  ProcessingErrorDetails _details;
};

} // namespace processing
} // namespace jsonmend
