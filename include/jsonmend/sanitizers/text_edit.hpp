// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Jsonmend, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <algorithm>
#include <cstddef>
#include <string>
#include <utility>
#include <vector>

namespace jsonmend
{
namespace sanitizers
{

/// \brief Replace \c length bytes at \c offset (in the original text) with
/// \c replacement. A zero length is an insertion.
struct TextEdit
{
  std::size_t offset;
  std::size_t length;
  std::string replacement;

  static TextEdit insert(std::size_t offset, std::string text)
  {
    return {offset, 0, std::move(text)};
  }
  static TextEdit erase(std::size_t offset, std::size_t length) { return {offset, length, ""}; }
};

/// \brief Apply edits recorded against \p text, back to front, so earlier
/// offsets stay valid. Out-of-range edits and edits overlapping one that
/// starts earlier are dropped. Two insertions at the same offset keep their
/// recorded order.
inline std::string applyEdits(const std::string &text, std::vector<TextEdit> edits)
{
  std::stable_sort(edits.begin(), edits.end(),
                   [](const TextEdit &a, const TextEdit &b) { return a.offset < b.offset; });

  std::vector<const TextEdit *> accepted;
  std::size_t reachedEnd = 0;
  for (const auto &edit : edits)
  {
    if (edit.offset > text.size() || edit.length > text.size() - edit.offset)
    {
      continue;
    }
    if (!accepted.empty() && edit.offset < reachedEnd)
    {
      continue;
    }
    accepted.push_back(&edit);
    reachedEnd = std::max(reachedEnd, edit.offset + edit.length);
  }

  std::string result = text;
  for (auto it = accepted.rbegin(); it != accepted.rend(); ++it)
  {
    result.replace((*it)->offset, (*it)->length, (*it)->replacement);
  }
  return result;
}

} // namespace sanitizers
} // namespace jsonmend
