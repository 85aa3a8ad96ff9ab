#pragma once

#include <optional>
#include <string>
#include <string_view>

#include "triemux/http-constants.hpp"
#include "triemux/http-status-code.hpp"
#include "triemux/vector.hpp"

namespace triemux {

struct HttpHeader {
  std::string name;
  std::string value;
};

// Response under construction, written by handlers and middleware.
// Serialization to the wire is the host's responsibility.
class HttpResponse {
 public:
  HttpResponse() noexcept = default;

  explicit HttpResponse(http::StatusCode statusCode) noexcept : _statusCode(statusCode) {}

  [[nodiscard]] http::StatusCode status() const noexcept { return _statusCode; }

  HttpResponse& status(http::StatusCode statusCode) noexcept {
    _statusCode = statusCode;
    return *this;
  }

  // Get the value of the first header named 'name' (case-insensitive), if any.
  [[nodiscard]] std::optional<std::string_view> headerValue(std::string_view name) const noexcept;

  // Get the value of the first header named 'name', or an empty string_view if absent.
  [[nodiscard]] std::string_view headerValueOrEmpty(std::string_view name) const noexcept {
    return headerValue(name).value_or(std::string_view{});
  }

  // Set header 'name' to 'value', replacing any existing header with the same name (case-insensitive).
  HttpResponse& header(std::string_view name, std::string_view value);

  // Append a header without checking for duplicates.
  HttpResponse& addHeader(std::string_view name, std::string_view value);

  [[nodiscard]] const auto& headers() const noexcept { return _headers; }

  [[nodiscard]] std::string_view body() const noexcept { return _body; }

  // Replace the body and set its content type.
  HttpResponse& body(std::string_view body, std::string_view contentType = http::ContentTypeTextPlain);

  // Append to the body, leaving headers untouched.
  HttpResponse& appendBody(std::string_view data);

 private:
  http::StatusCode _statusCode{http::StatusCodeOK};
  vector<HttpHeader> _headers;
  std::string _body;
};

}  // namespace triemux
