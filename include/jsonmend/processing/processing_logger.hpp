// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Jsonmend, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <jsonmend/core/logger.hpp>
#include <jsonmend/processing/processing_error.hpp>
#include <string>
#include <vector>

namespace jsonmend
{
namespace processing
{

/// \brief Receives processing summaries. Implementations must not throw.
class ProcessingLogger
{
public:
  virtual ~ProcessingLogger() = default;

  virtual void logSanitizationSummary(const std::string &resource,
                                      const std::vector<std::string> &steps,
                                      const std::vector<std::string> &diagnostics) = 0;

  virtual void logFailure(const JsonProcessingError &error) = 0;
};

/// \brief Writes summaries through core::Logger.
class DefaultProcessingLogger : public ProcessingLogger
{
public:
  void logSanitizationSummary(const std::string &resource, const std::vector<std::string> &steps,
                              const std::vector<std::string> &diagnostics) override
  {
    JSONMEND_LOG_INFO("Resource '" << resource << "': applied " << steps.size()
                                   << " sanitization step(s): " << _join(steps, " -> ")
                                   << (diagnostics.empty() ? "" : " | Diagnostics: ")
                                   << _join(diagnostics, "; "));
  }

  void logFailure(const JsonProcessingError &error) override
  {
    JSONMEND_LOG_WARN(error.what() << " [kind=" << toString(error.kind())
                                   << ", steps=" << _join(error.steps(), " -> ")
                                   << (error.lastStrategy() ? ", last=" + *error.lastStrategy()
                                                            : std::string())
                                   << "]");
  }

private:
  static std::string _join(const std::vector<std::string> &items, const char *separator)
  {
    std::string joined;
    for (const auto &item : items)
    {
      if (!joined.empty())
      {
        joined += separator;
      }
      joined += item;
    }
    return joined;
  }
};

} // namespace processing
} // namespace jsonmend
