#include "triemux/mux.hpp"

#include <initializer_list>
#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

#include "triemux/handler.hpp"
#include "triemux/http-method-parse.hpp"
#include "triemux/http-method.hpp"
#include "triemux/http-request.hpp"
#include "triemux/http-response.hpp"
#include "triemux/log.hpp"
#include "triemux/path-clean.hpp"
#include "triemux/path-param-extract.hpp"
#include "triemux/path-params.hpp"
#include "triemux/router-config.hpp"
#include "triemux/router-error.hpp"
#include "triemux/router.hpp"

namespace triemux {

Mux::Mux(RouterConfig config) : _router(std::make_shared<Router>(std::move(config))) {}

std::error_code Mux::addRoute(std::string_view method, std::string_view pattern, Handler handler) {
  const auto optMethod = http::MethodStrToOptEnum(method);
  if (!optMethod) {
    log::warn("Cannot register '{}' for unknown method '{}'", pattern, method);
    return RouterErrc::UnknownMethod;
  }
  return addRoute(*optMethod, pattern, std::move(handler));
}

std::error_code Mux::addRoute(http::Method method, std::string_view pattern, Handler handler) {
  if (pattern.empty()) {
    return RouterErrc::EmptyPattern;
  }
  if (pattern.front() != '/') {
    return RouterErrc::MustStartWithSlash;
  }
  // Patterns are cleaned the same way as request paths.
  return _router->addRoute(method, JoinPath(_prefix, pattern), std::move(handler), _middleware);
}

Mux& Mux::use(Middleware middleware) {
  if (!middleware) {
    throw std::invalid_argument("Cannot use an empty middleware");
  }
  _middleware.push_back(std::move(middleware));
  return *this;
}

Mux& Mux::use(std::initializer_list<Middleware> middleware) {
  for (const Middleware& ware : middleware) {
    use(ware);
  }
  return *this;
}

Mux Mux::group(std::string_view prefix) const { return {_router, JoinPath(_prefix, prefix), _middleware}; }

bool Mux::hasRoute(std::string_view path, std::string_view method, std::error_code& ec) const {
  ec.clear();
  if (method.empty()) {
    for (http::Method candidate : http::kAllMethods) {
      if (_router->find(candidate, path).found()) {
        return true;
      }
    }
    return false;
  }
  const auto optMethod = http::MethodStrToOptEnum(method);
  if (!optMethod) {
    ec = RouterErrc::UnknownMethod;
    return false;
  }
  return _router->find(*optMethod, path).found();
}

void Mux::serve(HttpRequest& request, HttpResponse& response) const {
  std::string cleanedPath;
  std::string_view path = request.path();
  if (_router->config().pathCleaning) {
    cleanedPath = CleanPath(path);
    path = cleanedPath;
  }

  TrieNode::FindResult result;
  const auto optMethod = http::MethodStrToOptEnum(request.method());
  if (optMethod) {
    result = _router->find(*optMethod, path);
  } else {
    result.error = RouterErrc::UnknownMethod;
  }

  if (!result.found()) {
    log::trace("No route for {} '{}': {}", request.method(), path, result.error.message());
    auto pNotFound = _router->notFoundHandler();
    (*pNotFound)(request, response);
    return;
  }

  PathParams params;
  if (auto err = ExtractPathParams(path, result.route->pattern(), params)) {
    log::warn("Cannot extract parameters of '{}' from '{}': {}", result.route->pattern(), path, err.message());
    params.clear();
  }
  request.pathParams(std::move(params));
  result.route->serve(request, response);
}

}  // namespace triemux
