#include "triemux/http-method-parse.hpp"

#include <optional>
#include <string_view>

#include "triemux/http-method.hpp"
#include "triemux/string-equal-ignore-case.hpp"

namespace triemux::http {

namespace {

std::optional<Method> MatchMethod(std::string_view str, Method candidate) {
  if (CaseInsensitiveEqual(str, MethodToStr(candidate))) {
    return candidate;
  }
  return std::nullopt;
}

}  // namespace

std::optional<Method> MethodStrToOptEnum(std::string_view str) {
  switch (str.size()) {
    case 3:  // GET, PUT
      switch (ToLowerAscii(str[0])) {
        case 'g':
          return MatchMethod(str, Method::GET);
        case 'p':
          return MatchMethod(str, Method::PUT);
        default:
          return std::nullopt;
      }

    case 4:  // HEAD, POST
      switch (ToLowerAscii(str[0])) {
        case 'h':
          return MatchMethod(str, Method::HEAD);
        case 'p':
          return MatchMethod(str, Method::POST);
        default:
          return std::nullopt;
      }

    case 5:  // TRACE, PATCH
      switch (ToLowerAscii(str[0])) {
        case 't':
          return MatchMethod(str, Method::TRACE);
        case 'p':
          return MatchMethod(str, Method::PATCH);
        default:
          return std::nullopt;
      }

    case 6:  // DELETE
      return MatchMethod(str, Method::DELETE);

    case 7:  // CONNECT, OPTIONS
      switch (ToLowerAscii(str[0])) {
        case 'c':
          return MatchMethod(str, Method::CONNECT);
        case 'o':
          return MatchMethod(str, Method::OPTIONS);
        default:
          return std::nullopt;
      }
    default:
      return std::nullopt;
  }
}

}  // namespace triemux::http
