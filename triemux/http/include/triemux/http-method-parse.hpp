#pragma once

#include <optional>
#include <string_view>

#include "triemux/http-method.hpp"

namespace triemux::http {

// Attempt to parse a HTTP method.
// RFC 9110 §9.1: The method token is case-sensitive, BUT:
// RFC 9110 §2.5 encourages robustness:
// "Although methods are case-sensitive, the implementation SHOULD be case-insensitive when parsing received messages.”
[[nodiscard]] std::optional<Method> MethodStrToOptEnum(std::string_view str);

}  // namespace triemux::http
