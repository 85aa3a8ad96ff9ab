#include "triemux/http-response.hpp"

#include <algorithm>
#include <optional>
#include <string>
#include <string_view>

#include "triemux/http-constants.hpp"
#include "triemux/string-equal-ignore-case.hpp"

namespace triemux {

std::optional<std::string_view> HttpResponse::headerValue(std::string_view name) const noexcept {
  const auto it = std::ranges::find_if(
      _headers, [name](const HttpHeader& header) { return CaseInsensitiveEqual(header.name, name); });
  if (it == _headers.end()) {
    return std::nullopt;
  }
  return std::string_view(it->value);
}

HttpResponse& HttpResponse::header(std::string_view name, std::string_view value) {
  const auto it = std::ranges::find_if(
      _headers, [name](const HttpHeader& header) { return CaseInsensitiveEqual(header.name, name); });
  if (it == _headers.end()) {
    return addHeader(name, value);
  }
  it->value.assign(value);
  return *this;
}

HttpResponse& HttpResponse::addHeader(std::string_view name, std::string_view value) {
  _headers.push_back(HttpHeader{std::string(name), std::string(value)});
  return *this;
}

HttpResponse& HttpResponse::body(std::string_view body, std::string_view contentType) {
  _body.assign(body);
  return header(http::ContentType, contentType);
}

HttpResponse& HttpResponse::appendBody(std::string_view data) {
  _body.append(data);
  return *this;
}

}  // namespace triemux
