#pragma once

#include <initializer_list>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

#include "triemux/handler.hpp"
#include "triemux/http-method.hpp"
#include "triemux/http-request.hpp"
#include "triemux/http-response.hpp"
#include "triemux/router-config.hpp"
#include "triemux/router.hpp"
#include "triemux/vector.hpp"

namespace triemux {

// Registration and dispatch handle over a shared Router.
//
// A Mux carries its own path prefix and middleware list. Groups created with 'group' share the routing
// tries, the not-found handler and the configuration of their parent, but take a copy of its middleware:
// further 'use' calls on either side do not affect the other one.
//
// Registration and dispatch may run concurrently. The handle itself ('use') is not synchronized and is
// expected to be configured before being shared.
class Mux {
 public:
  Mux() : Mux(RouterConfig{}) {}

  explicit Mux(RouterConfig config);

  // Register 'handler' for 'method' (case-insensitive) on JoinPath(prefix(), pattern), which also cleans the pattern.
  // The current middleware list is snapshotted into the route.
  // Errors: UnknownMethod, EmptyPattern, MustStartWithSlash, DuplicateRoute.
  // Throws std::invalid_argument if 'handler' is empty.
  [[nodiscard]] std::error_code addRoute(std::string_view method, std::string_view pattern, Handler handler);
  [[nodiscard]] std::error_code addRoute(http::Method method, std::string_view pattern, Handler handler);

  [[nodiscard]] std::error_code get(std::string_view pattern, Handler handler) {
    return addRoute(http::Method::GET, pattern, std::move(handler));
  }
  [[nodiscard]] std::error_code put(std::string_view pattern, Handler handler) {
    return addRoute(http::Method::PUT, pattern, std::move(handler));
  }
  [[nodiscard]] std::error_code post(std::string_view pattern, Handler handler) {
    return addRoute(http::Method::POST, pattern, std::move(handler));
  }
  [[nodiscard]] std::error_code head(std::string_view pattern, Handler handler) {
    return addRoute(http::Method::HEAD, pattern, std::move(handler));
  }
  [[nodiscard]] std::error_code patch(std::string_view pattern, Handler handler) {
    return addRoute(http::Method::PATCH, pattern, std::move(handler));
  }
  [[nodiscard]] std::error_code trace(std::string_view pattern, Handler handler) {
    return addRoute(http::Method::TRACE, pattern, std::move(handler));
  }
  [[nodiscard]] std::error_code del(std::string_view pattern, Handler handler) {
    return addRoute(http::Method::DELETE, pattern, std::move(handler));
  }
  [[nodiscard]] std::error_code options(std::string_view pattern, Handler handler) {
    return addRoute(http::Method::OPTIONS, pattern, std::move(handler));
  }
  [[nodiscard]] std::error_code connect(std::string_view pattern, Handler handler) {
    return addRoute(http::Method::CONNECT, pattern, std::move(handler));
  }

  // Append middleware to this handle. Only routes registered afterwards through this handle are affected.
  // Throws std::invalid_argument if a middleware is empty.
  Mux& use(Middleware middleware);
  Mux& use(std::initializer_list<Middleware> middleware);

  // New handle sharing this router, with prefix JoinPath(prefix(), prefix) and a copy of the middleware.
  [[nodiscard]] Mux group(std::string_view prefix) const;

  // Tells whether a route is registered for the raw 'path' (no cleaning, no prefix).
  // An empty 'method' checks every method. An unrecognized method returns false and sets UnknownMethod.
  // 'ec' is cleared otherwise.
  [[nodiscard]] bool hasRoute(std::string_view path, std::string_view method, std::error_code& ec) const;

  // Replace the not-found handler shared by all the handles of this router.
  // An empty handler restores the default one.
  void notFoundHandler(Handler handler) { _router->notFoundHandler(std::move(handler)); }

  // Route 'request' to its handler, or to the not-found handler.
  // Exceptions thrown by handlers and middleware propagate to the caller.
  void serve(HttpRequest& request, HttpResponse& response) const;

  void operator()(HttpRequest& request, HttpResponse& response) const { serve(request, response); }

  [[nodiscard]] std::string_view prefix() const noexcept { return _prefix; }

  [[nodiscard]] std::span<const Middleware> middleware() const noexcept { return _middleware; }

  [[nodiscard]] const RouterConfig& config() const noexcept { return _router->config(); }

 private:
  Mux(std::shared_ptr<Router> router, std::string prefix, vector<Middleware> middleware)
      : _router(std::move(router)), _prefix(std::move(prefix)), _middleware(std::move(middleware)) {}

  std::shared_ptr<Router> _router;
  std::string _prefix;
  vector<Middleware> _middleware;
};

}  // namespace triemux
