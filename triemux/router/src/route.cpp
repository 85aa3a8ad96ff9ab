#include "triemux/route.hpp"

#include <span>
#include <stdexcept>
#include <string_view>
#include <utility>

#include "triemux/handler.hpp"

namespace triemux {

Route::Route(std::string_view pattern, Handler handler, std::span<const Middleware> middleware)
    : _pattern(pattern), _chain(std::move(handler)) {
  if (!_chain) {
    throw std::invalid_argument("Cannot register an empty Handler");
  }
  _middleware.reserve(middleware.size());
  for (const Middleware& ware : middleware) {
    _middleware.push_back(ware);
    _chain = ware(std::move(_chain));
    if (!_chain) {
      throw std::invalid_argument("Middleware returned an empty Handler");
    }
  }
}

}  // namespace triemux
