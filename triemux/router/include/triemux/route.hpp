#pragma once

#include <span>
#include <string>
#include <string_view>

#include "triemux/handler.hpp"
#include "triemux/http-request.hpp"
#include "triemux/http-response.hpp"
#include "triemux/vector.hpp"

namespace triemux {

// A registered (pattern, handler, middleware) triple. Immutable once built.
//
// The middleware chain is folded around the handler at construction, the last middleware
// of the list being the outermost wrapper:
//   chain = middleware[n-1](middleware[n-2](...middleware[0](handler)))
class Route {
 public:
  // Throws std::invalid_argument if 'handler' is empty or if a middleware returns an empty handler.
  Route(std::string_view pattern, Handler handler, std::span<const Middleware> middleware = {});

  // The pattern as registered (prefix already joined), for instance "/hello/:name".
  [[nodiscard]] std::string_view pattern() const noexcept { return _pattern; }

  // The middleware list snapshotted at registration time, in registration order.
  [[nodiscard]] std::span<const Middleware> middleware() const noexcept { return _middleware; }

  // Invoke the handler through its middleware chain.
  void serve(HttpRequest& request, HttpResponse& response) const { _chain(request, response); }

 private:
  std::string _pattern;
  vector<Middleware> _middleware;
  Handler _chain;
};

}  // namespace triemux
