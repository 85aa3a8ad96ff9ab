#include "triemux/path-clean.hpp"

#include <cstddef>
#include <string>
#include <string_view>

namespace triemux {

std::string CleanPath(std::string_view path) {
  if (path.empty()) {
    return ".";
  }

  const std::size_t sz = path.size();
  const bool rooted = path.front() == '/';

  std::string out;
  out.reserve(sz);

  std::size_t pos = 0;
  if (rooted) {
    out.push_back('/');
    pos = 1;
  }

  // Position in 'out' up to which '..' cannot backtrack
  std::size_t dotdot = out.size();

  while (pos < sz) {
    if (path[pos] == '/') {
      // empty path element
      ++pos;
    } else if (path[pos] == '.' && (pos + 1U == sz || path[pos + 1U] == '/')) {
      // . element
      ++pos;
    } else if (path[pos] == '.' && path[pos + 1U] == '.' && (pos + 2U == sz || path[pos + 2U] == '/')) {
      // .. element: remove to last separator
      pos += 2U;
      if (out.size() > dotdot) {
        std::size_t newSize = out.size() - 1U;
        while (newSize > dotdot && out[newSize] != '/') {
          --newSize;
        }
        out.resize(newSize);
      } else if (!rooted) {
        // cannot backtrack, keep the .. element
        if (!out.empty()) {
          out.push_back('/');
        }
        out.append("..");
        dotdot = out.size();
      }
    } else {
      // real path element, add slash if needed
      if ((rooted && out.size() != 1U) || (!rooted && !out.empty())) {
        out.push_back('/');
      }
      for (; pos < sz && path[pos] != '/'; ++pos) {
        out.push_back(path[pos]);
      }
    }
  }

  if (out.empty()) {
    return ".";
  }
  return out;
}

std::string JoinPath(std::string_view prefix, std::string_view path) {
  if (prefix.empty()) {
    if (path.empty()) {
      return {};
    }
    return CleanPath(path);
  }

  std::string joined;
  joined.reserve(prefix.size() + 1U + path.size());
  joined.append(prefix);
  joined.push_back('/');
  joined.append(path);
  return CleanPath(joined);
}

}  // namespace triemux
