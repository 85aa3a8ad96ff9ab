#pragma once

#include <string_view>
#include <system_error>

#include "triemux/path-params.hpp"

namespace triemux {

// Reconstruct the named parameters of 'pattern' from the concrete 'path' it matched.
//
// This is a string-based pass independent from the trie. Both strings are split on '/' and
// compared segment by segment:
//   - ':name' captures the path segment at the same index under 'name'.
//   - '*name' captures the remaining path segments joined by '/' under 'name' ("catch" when unnamed).
//     It must be the last pattern segment, and capture stops there.
// For instance, pattern "/hello/:name" and path "/hello/world" give {name: world},
// pattern "/files/*" and path "/files/a/b.png" give {catch: a/b.png}.
//
// 'params' is cleared first, then filled in pattern-segment order.
// Errors: BadPattern if the path has fewer segments than the pattern (nothing captured), or if a catch-all
// is not the last pattern segment (captures preceding it are kept).
[[nodiscard]] std::error_code ExtractPathParams(std::string_view path, std::string_view pattern, PathParams& params);

}  // namespace triemux
