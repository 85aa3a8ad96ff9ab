#pragma once

#include <array>
#include <memory>
#include <shared_mutex>
#include <span>
#include <string_view>
#include <system_error>

#include "triemux/handler.hpp"
#include "triemux/http-method.hpp"
#include "triemux/http-request.hpp"
#include "triemux/http-response.hpp"
#include "triemux/route-trie.hpp"
#include "triemux/router-config.hpp"
#include "triemux/trie-node.hpp"

namespace triemux {

// Fallback used when no route matches: 404 with a small HTML body.
void DefaultNotFoundHandler(HttpRequest& request, HttpResponse& response);

// Routing state shared by a Mux and all the groups branched from it:
// one routing trie per HTTP method, the not-found handler and the configuration.
//
// All methods are safe to call concurrently.
class Router {
 public:
  explicit Router(RouterConfig config = {});

  Router(const Router&) = delete;
  Router(Router&&) = delete;
  Router& operator=(const Router&) = delete;
  Router& operator=(Router&&) = delete;

  ~Router() = default;

  // Register 'handler' wrapped by 'middleware' for 'method' and the final 'pattern' (prefix already joined).
  // Throws std::invalid_argument if 'handler' is empty.
  [[nodiscard]] std::error_code addRoute(http::Method method, std::string_view pattern, Handler handler,
                                         std::span<const Middleware> middleware = {});

  // Look up 'path' (already normalized) in the trie of 'method'.
  [[nodiscard]] TrieNode::FindResult find(http::Method method, std::string_view path) const;

  // Replace the not-found handler. An empty handler restores DefaultNotFoundHandler.
  void notFoundHandler(Handler handler);

  // Current not-found handler, never nullptr.
  [[nodiscard]] std::shared_ptr<const Handler> notFoundHandler() const;

  [[nodiscard]] const RouterConfig& config() const noexcept { return _config; }

 private:
  RouterConfig _config;
  std::array<RouteTrie, http::kNbMethods> _tries;

  mutable std::shared_mutex _notFoundMutex;
  std::shared_ptr<const Handler> _notFound;
};

}  // namespace triemux
