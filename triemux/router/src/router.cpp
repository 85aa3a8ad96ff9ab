#include "triemux/router.hpp"

#include <memory>
#include <mutex>
#include <shared_mutex>
#include <span>
#include <string_view>
#include <system_error>
#include <utility>

#include "triemux/handler.hpp"
#include "triemux/http-constants.hpp"
#include "triemux/http-method.hpp"
#include "triemux/http-request.hpp"
#include "triemux/http-response.hpp"
#include "triemux/http-status-code.hpp"
#include "triemux/log.hpp"
#include "triemux/route.hpp"
#include "triemux/router-config.hpp"
#include "triemux/trie-node.hpp"

namespace triemux {

void DefaultNotFoundHandler([[maybe_unused]] HttpRequest& request, HttpResponse& response) {
  response.status(http::StatusCodeNotFound);
  response.body("404 - Not Found", http::ContentTypeTextHtmlUtf8);
}

Router::Router(RouterConfig config)
    : _config(std::move(config)), _notFound(std::make_shared<const Handler>(DefaultNotFoundHandler)) {}

std::error_code Router::addRoute(http::Method method, std::string_view pattern, Handler handler,
                                 std::span<const Middleware> middleware) {
  auto route = std::make_shared<const Route>(pattern, std::move(handler), middleware);
  auto err = _tries[http::MethodToIdx(method)].insert(pattern, std::move(route), _config.duplicatePolicy);
  if (err) {
    log::debug("Failed to register {} '{}': {}", http::MethodToStr(method), pattern, err.message());
  } else {
    log::debug("Registered {} '{}' with {} middleware(s)", http::MethodToStr(method), pattern, middleware.size());
  }
  return err;
}

TrieNode::FindResult Router::find(http::Method method, std::string_view path) const {
  return _tries[http::MethodToIdx(method)].find(path);
}

void Router::notFoundHandler(Handler handler) {
  auto notFound = handler ? std::make_shared<const Handler>(std::move(handler))
                          : std::make_shared<const Handler>(DefaultNotFoundHandler);
  std::unique_lock lock(_notFoundMutex);
  _notFound = std::move(notFound);
}

std::shared_ptr<const Handler> Router::notFoundHandler() const {
  std::shared_lock lock(_notFoundMutex);
  return _notFound;
}

}  // namespace triemux
