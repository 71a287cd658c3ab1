#pragma once

#include <cstddef>
#include <string_view>

#include "arbor/vector.hpp"

namespace arbor {

// Calls 'callback' on each segment of 'str' delimited by 'sep', in order.
// Partition semantics: an empty string yields one empty segment, and empty segments
// (leading, trailing or between consecutive separators) are always visited.
// The callback returns false to stop the iteration.
// Returns true if all segments were visited.
template <class Callback>
constexpr bool ForEachSegment(std::string_view str, char sep, Callback &&callback) {
  std::size_t start = 0;
  for (std::size_t pos = 0; pos < str.size(); ++pos) {
    if (str[pos] == sep) {
      if (!callback(str.substr(start, pos - start))) {
        return false;
      }
      start = pos + 1U;
    }
  }
  return callback(str.substr(start));
}

// Returns the segments of 'str' delimited by 'sep' as views on 'str'.
// The returned vector is never empty, see ForEachSegment for the exact semantics.
vector<std::string_view> SplitSegments(std::string_view str, char sep = '/');

}  // namespace arbor
