// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Jsonmend, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <jsonmend/sanitizers/array_object_sanitizers.hpp>
#include <jsonmend/sanitizers/comma_sanitizers.hpp>
#include <jsonmend/sanitizers/delimiter_sanitizers.hpp>
#include <jsonmend/sanitizers/noise_sanitizers.hpp>
#include <jsonmend/sanitizers/property_sanitizers.hpp>
#include <jsonmend/sanitizers/quote_sanitizers.hpp>
#include <jsonmend/sanitizers/sanitizer_types.hpp>
#include <map>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace jsonmend
{
namespace sanitizers
{

/// \brief Name to strategy lookup, pre-populated with every built-in.
///
/// The default order is a contract: noise removal first, then comma repair
/// before delimiter repair before truncation completion before brace
/// insertion, then the quoting fixes.
class SanitizerRegistry
{
public:
  SanitizerRegistry()
  {
    for (SanitizerId id : defaultIds())
    {
      add(_create(id));
    }
  }

  /// \brief Shared read-only registry of the built-in strategies.
  static const SanitizerRegistry &builtin()
  {
    static const SanitizerRegistry registry;
    return registry;
  }

  static const std::vector<SanitizerId> &defaultIds()
  {
    static const std::vector<SanitizerId> ids = {
      SanitizerId::TrimWhitespace,
      SanitizerId::RemoveCodeFences,
      SanitizerId::NormalizeCharacters,
      SanitizerId::ExtractJsonSpan,
      SanitizerId::CollapseDuplicateObject,
      SanitizerId::AddMissingCommas,
      SanitizerId::RemoveTrailingCommas,
      SanitizerId::FixMismatchedDelimiters,
      SanitizerId::CompleteTruncatedStructures,
      SanitizerId::FixMissingArrayObjectBraces,
      SanitizerId::FixUnescapedQuotes,
      SanitizerId::FixUnquotedPropertyNames,
      SanitizerId::FixUndefinedValues,
    };
    return ids;
  }

  /// \brief Register a strategy under its name, replacing any previous one.
  void add(SanitizerPtr sanitizer)
  {
    if (!sanitizer)
    {
      throw std::invalid_argument("SanitizerRegistry: null sanitizer");
    }
    _byName[sanitizer->name()] = std::move(sanitizer);
  }

  bool contains(const std::string &name) const { return _byName.count(name) != 0; }

  /// \throws std::invalid_argument for an unknown name.
  SanitizerPtr get(const std::string &name) const
  {
    auto it = _byName.find(name);
    if (it == _byName.end())
    {
      throw std::invalid_argument("Unknown sanitizer '" + name + "'");
    }
    return it->second;
  }

  SanitizerPtr get(SanitizerId id) const { return get(toString(id)); }

  SanitizerList defaultOrder() const
  {
    SanitizerList list;
    for (SanitizerId id : defaultIds())
    {
      list.push_back(get(id));
    }
    return list;
  }

  /// \brief Ordered strategy list from configured names.
  /// \throws std::invalid_argument naming the first unknown entry.
  SanitizerList resolve(const std::vector<std::string> &names) const
  {
    SanitizerList list;
    list.reserve(names.size());
    for (const auto &name : names)
    {
      list.push_back(get(name));
    }
    return list;
  }

  std::vector<std::string> names() const
  {
    std::vector<std::string> result;
    for (const auto &entry : _byName)
    {
      result.push_back(entry.first);
    }
    return result;
  }

private:
  std::map<std::string, SanitizerPtr> _byName;

  static SanitizerPtr _create(SanitizerId id)
  {
    switch (id)
    {
    case SanitizerId::TrimWhitespace:
      return std::make_shared<TrimWhitespace>();
    case SanitizerId::RemoveCodeFences:
      return std::make_shared<RemoveCodeFences>();
    case SanitizerId::NormalizeCharacters:
      return std::make_shared<NormalizeCharacters>();
    case SanitizerId::ExtractJsonSpan:
      return std::make_shared<ExtractJsonSpan>();
    case SanitizerId::CollapseDuplicateObject:
      return std::make_shared<CollapseDuplicateObject>();
    case SanitizerId::AddMissingCommas:
      return std::make_shared<AddMissingCommas>();
    case SanitizerId::RemoveTrailingCommas:
      return std::make_shared<RemoveTrailingCommas>();
    case SanitizerId::FixMismatchedDelimiters:
      return std::make_shared<FixMismatchedDelimiters>();
    case SanitizerId::CompleteTruncatedStructures:
      return std::make_shared<CompleteTruncatedStructures>();
    case SanitizerId::FixMissingArrayObjectBraces:
      return std::make_shared<FixMissingArrayObjectBraces>();
    case SanitizerId::FixUnescapedQuotes:
      return std::make_shared<FixUnescapedQuotes>();
    case SanitizerId::FixUnquotedPropertyNames:
      return std::make_shared<FixUnquotedPropertyNames>();
    case SanitizerId::FixUndefinedValues:
      return std::make_shared<FixUndefinedValues>();
    }
    throw std::invalid_argument("Unknown sanitizer id");
  }
};

} // namespace sanitizers
} // namespace jsonmend
