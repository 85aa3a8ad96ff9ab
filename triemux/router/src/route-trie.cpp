#include "triemux/route-trie.hpp"

#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string_view>
#include <system_error>
#include <utility>

#include "triemux/route.hpp"
#include "triemux/router-config.hpp"
#include "triemux/trie-node.hpp"

namespace triemux {

std::error_code RouteTrie::insert(std::string_view pattern, std::shared_ptr<const Route> route,
                                  RouterConfig::DuplicatePolicy duplicatePolicy) {
  std::unique_lock lock(_mutex);
  return _root.insert(pattern, std::move(route), duplicatePolicy);
}

TrieNode::FindResult RouteTrie::find(std::string_view path) const {
  std::shared_lock lock(_mutex);
  return _root.find(path);
}

bool RouteTrie::empty() const {
  std::shared_lock lock(_mutex);
  return _root.nbChildren() == 0;
}

}  // namespace triemux
