#pragma once

#include <cstdint>

namespace triemux {

struct RouterConfig {
  enum class DuplicatePolicy : std::uint8_t { Shadow, Reject };

  // Clean the request path (collapse duplicate slashes, resolve '.' and '..', drop trailing slash)
  // before looking it up.
  // Default: true
  bool pathCleaning{true};

  // Behavior when a pattern ending on the same trie terminal is registered twice for the same method.
  //   Shadow: the last registration replaces the previous route (a warning is logged).
  //   Reject: the registration fails with RouterErrc::DuplicateRoute and the router is unchanged.
  // Note that parameter names are not part of the trie, so '/a/:x' and '/a/:y' are duplicates.
  // Default: Shadow
  DuplicatePolicy duplicatePolicy{DuplicatePolicy::Shadow};

  RouterConfig& withPathCleaning(bool enable = true);

  RouterConfig& withDuplicatePolicy(DuplicatePolicy policy);
};

}  // namespace triemux
