#pragma once

#include <string_view>

namespace triemux::http {

inline constexpr std::string_view ContentType = "Content-Type";

inline constexpr std::string_view ContentTypeTextPlain = "text/plain";
inline constexpr std::string_view ContentTypeTextHtmlUtf8 = "text/html; charset=UTF-8";
inline constexpr std::string_view ContentTypeApplicationJson = "application/json";

}  // namespace triemux::http
