#pragma once

#include <string>
#include <string_view>

namespace triemux {

// Returns the shortest path name lexically equivalent to 'path', applying iteratively:
//   1. Replace multiple slashes with a single slash.
//   2. Eliminate each '.' path name element.
//   3. Eliminate each inner '..' path name element and the non-'..' element preceding it.
//   4. Eliminate '..' elements that begin a rooted path ("/.." becomes "/").
// Trailing slashes are removed except for the root. An empty input gives ".".
// No file system access nor percent-decoding is performed.
[[nodiscard]] std::string CleanPath(std::string_view path);

// Joins 'prefix' and 'path' with a separating slash and cleans the result.
// Empty elements are ignored; if both are empty, an empty string is returned.
[[nodiscard]] std::string JoinPath(std::string_view prefix, std::string_view path);

}  // namespace triemux
