#pragma once

#include <memory>
#include <shared_mutex>
#include <string_view>
#include <system_error>

#include "triemux/route.hpp"
#include "triemux/router-config.hpp"
#include "triemux/trie-node.hpp"

namespace triemux {

// Routing trie of a single HTTP method, safe for concurrent use.
//
// A single reader/writer lock guards the whole trie: insert() holds it exclusively for the full
// mutation while find() holds it shared for the walk. Many lookups may run concurrently, an insertion
// blocks every other operation on this trie until complete. A lookup racing an insertion may or may
// not observe the new route. Route tables are expected to be built at startup, so insert-heavy
// registration under live traffic will contend on this lock.
class RouteTrie {
 public:
  RouteTrie() noexcept = default;

  [[nodiscard]] std::error_code insert(
      std::string_view pattern, std::shared_ptr<const Route> route,
      RouterConfig::DuplicatePolicy duplicatePolicy = RouterConfig::DuplicatePolicy::Shadow);

  [[nodiscard]] TrieNode::FindResult find(std::string_view path) const;

  [[nodiscard]] bool empty() const;

 private:
  mutable std::shared_mutex _mutex;
  TrieNode _root;
};

}  // namespace triemux
