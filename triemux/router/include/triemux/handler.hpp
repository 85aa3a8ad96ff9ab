#pragma once

#include <functional>

#include "triemux/http-request.hpp"
#include "triemux/http-response.hpp"

namespace triemux {

// Terminal request handler. It produces the response as a side effect on 'response'.
using Handler = std::function<void(HttpRequest& request, HttpResponse& response)>;

// Transforms a handler into another one wrapping it. The returned handler decides whether
// (and when) to call the wrapped one.
using Middleware = std::function<Handler(Handler next)>;

}  // namespace triemux
