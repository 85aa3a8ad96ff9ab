#pragma once

#include "triemux/handler.hpp"           // IWYU pragma: export
#include "triemux/http-constants.hpp"    // IWYU pragma: export
#include "triemux/http-method.hpp"       // IWYU pragma: export
#include "triemux/http-request.hpp"      // IWYU pragma: export
#include "triemux/http-response.hpp"     // IWYU pragma: export
#include "triemux/http-status-code.hpp"  // IWYU pragma: export
#include "triemux/mux.hpp"               // IWYU pragma: export
#include "triemux/path-params.hpp"       // IWYU pragma: export
#include "triemux/router-config.hpp"     // IWYU pragma: export
#include "triemux/router-error.hpp"      // IWYU pragma: export
