#include "triemux/path-param-extract.hpp"

#include <cstddef>
#include <string_view>
#include <system_error>

#include "triemux/path-params.hpp"
#include "triemux/router-error.hpp"
#include "triemux/vector.hpp"

namespace triemux {

namespace {

constexpr std::string_view kDefaultCatchAllName = "catch";

// Split on every '/', keeping empty segments so that indexes of path and pattern segments line up.
void SplitSegments(std::string_view str, vector<std::string_view>& segments) {
  segments.clear();
  for (std::size_t pos = 0;;) {
    const std::size_t nextSlash = str.find('/', pos);
    if (nextSlash == std::string_view::npos) {
      segments.push_back(str.substr(pos));
      break;
    }
    segments.push_back(str.substr(pos, nextSlash - pos));
    pos = nextSlash + 1U;
  }
}

}  // namespace

std::error_code ExtractPathParams(std::string_view path, std::string_view pattern, PathParams& params) {
  params.clear();

  if (!pattern.contains(':') && !pattern.contains('*')) {
    return {};
  }

  vector<std::string_view> pathSegments;
  vector<std::string_view> patternSegments;
  SplitSegments(path, pathSegments);
  SplitSegments(pattern, patternSegments);

  if (pathSegments.size() < patternSegments.size()) {
    return RouterErrc::BadPattern;
  }

  const std::size_t nbPatternSegments = patternSegments.size();
  for (std::size_t segmentPos = 0; segmentPos < nbPatternSegments; ++segmentPos) {
    const std::string_view segment = patternSegments[segmentPos];
    if (segment.empty()) {
      continue;
    }
    switch (segment.front()) {
      case ':':
        params.set(segment.substr(1U), pathSegments[segmentPos]);
        break;
      case '*': {
        if (segmentPos + 1U != nbPatternSegments) {
          return RouterErrc::BadPattern;
        }
        const std::string_view name = segment.size() > 1U ? segment.substr(1U) : kDefaultCatchAllName;
        // Remaining segments are contiguous in 'path', so their '/' join is the path suffix.
        const std::string_view first = pathSegments[segmentPos];
        params.set(name, std::string_view(first.data(), path.data() + path.size()));
        return {};
      }
      default:
        break;
    }
  }
  return {};
}

}  // namespace triemux
