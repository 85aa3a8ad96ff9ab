#include "triemux/router-config.hpp"

namespace triemux {

RouterConfig& RouterConfig::withPathCleaning(bool enable) {
  pathCleaning = enable;
  return *this;
}

RouterConfig& RouterConfig::withDuplicatePolicy(DuplicatePolicy policy) {
  duplicatePolicy = policy;
  return *this;
}

}  // namespace triemux
