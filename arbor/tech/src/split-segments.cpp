#include "arbor/split-segments.hpp"

#include <string_view>

#include "arbor/vector.hpp"

namespace arbor {

vector<std::string_view> SplitSegments(std::string_view str, char sep) {
  vector<std::string_view> segments;
  ForEachSegment(str, sep, [&segments](std::string_view segment) {
    segments.push_back(segment);
    return true;
  });
  return segments;
}

}  // namespace arbor
