#pragma once

#include <cstdint>
#include <system_error>
#include <type_traits>

namespace triemux {

// Errors reported by the router, as std::error_code values of the "triemux" category.
// None of them is fatal: registration errors are returned to the caller, lookup misses
// trigger the not-found handler and extraction errors only degrade parameter capture.
enum class RouterErrc : std::uint8_t {
  EmptyPattern = 1,    // registration with an empty pattern
  MustStartWithSlash,  // registration with a pattern not starting with '/'
  InsertOnNonRoot,     // insertion invoked on a trie node which is not a root
  FindOnNonRoot,       // lookup invoked on a trie node which is not a root
  UnknownMethod,       // method outside of the routable set
  DuplicateRoute,      // identical pattern already registered (only with DuplicatePolicy::Reject)
  RouteNotFound,       // no route matches the path
  BadPattern           // path and pattern disagree during parameter extraction
};

[[nodiscard]] const std::error_category& RouterCategory() noexcept;

[[nodiscard]] std::error_code make_error_code(RouterErrc errc) noexcept;

}  // namespace triemux

template <>
struct std::is_error_code_enum<triemux::RouterErrc> : std::true_type {};
