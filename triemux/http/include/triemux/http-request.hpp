#pragma once

#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include "triemux/path-params.hpp"

namespace triemux {

// Request context handed to handlers and middleware.
// The host fills the method and path; the router fills the path parameters.
// The attribute map is a free side-channel for middleware to pass data downstream.
class HttpRequest {
 public:
  HttpRequest() = default;

  HttpRequest(std::string_view method, std::string_view path) : _method(method), _path(path) {}

  [[nodiscard]] std::string_view method() const noexcept { return _method; }

  [[nodiscard]] std::string_view path() const noexcept { return _path; }

  HttpRequest& method(std::string_view method) {
    _method.assign(method);
    return *this;
  }

  HttpRequest& path(std::string_view path) {
    _path.assign(path);
    return *this;
  }

  // Path parameters captured by the router for the matched route.
  // Empty when the route has no parameter or before dispatch.
  [[nodiscard]] const PathParams& pathParams() const noexcept { return _pathParams; }

  void pathParams(PathParams params) noexcept { _pathParams = std::move(params); }

  // Returns the attribute value for 'key', or std::nullopt if absent.
  [[nodiscard]] std::optional<std::string_view> attribute(std::string_view key) const noexcept;

  // Sets (or replaces) attribute 'key'.
  HttpRequest& attribute(std::string_view key, std::string_view value);

 private:
  std::string _method;
  std::string _path;
  PathParams _pathParams;
  std::map<std::string, std::string, std::less<>> _attributes;
};

// Returns the path parameters stashed in 'request' by the router.
inline const PathParams& GetPathParams(const HttpRequest& request) noexcept { return request.pathParams(); }

}  // namespace triemux
