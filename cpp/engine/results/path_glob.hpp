#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace rascheck::results {

// Hierarchical path glob over '/'-separated segments:
//   *   any run of characters inside one segment
//   ?   one character inside one segment
//   **  zero or more whole segments
// Leading and trailing '/' are ignored on both sides.
bool glob_match(std::string_view pattern, std::string_view path);

// Non-empty segments of a '/'-separated path.
std::vector<std::string> path_segments(std::string_view path);

} // namespace rascheck::results
