#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string_view>
#include <system_error>
#include <utility>

#include "triemux/route.hpp"
#include "triemux/router-config.hpp"
#include "triemux/vector.hpp"

namespace triemux {

// Single character node of a routing trie.
//
// Each node exclusively owns its children. Sibling keys are unique. The pattern characters ':' and '*'
// open respectively a Parameter and a CatchAll node. A parameter or catch-all name is not stored in the
// trie: the name characters are absorbed by the node which opened it, so only the extraction pass,
// working on the pattern string, knows the names.
// A complete pattern ends with a Terminal child, keyed by kTerminalKey, holding the registered Route.
class TrieNode {
 public:
  enum class Kind : std::uint8_t { Root, Literal, Parameter, CatchAll, Terminal };

  static constexpr char kTerminalKey = '\0';
  static constexpr char kParameterKey = ':';
  static constexpr char kCatchAllKey = '*';

  struct FindResult {
    [[nodiscard]] bool found() const noexcept { return route != nullptr; }

    std::shared_ptr<const Route> route;
    std::error_code error;
  };

  // Creates a Root node.
  TrieNode() noexcept = default;

  TrieNode(char key, Kind kind, std::shared_ptr<const Route> route = {}) noexcept
      : _route(std::move(route)), _key(key), _kind(kind) {}

  TrieNode(const TrieNode&) = delete;
  TrieNode(TrieNode&&) noexcept = default;
  TrieNode& operator=(const TrieNode&) = delete;
  TrieNode& operator=(TrieNode&&) noexcept = default;

  ~TrieNode() = default;

  [[nodiscard]] char key() const noexcept { return _key; }

  [[nodiscard]] Kind kind() const noexcept { return _kind; }

  // Route stored on a Terminal node, nullptr for any other kind.
  [[nodiscard]] const std::shared_ptr<const Route>& route() const noexcept { return _route; }

  [[nodiscard]] std::size_t nbChildren() const noexcept { return _children.size(); }

  // Linear scan of the children, returns nullptr if there is no child keyed by 'key'.
  [[nodiscard]] TrieNode* findChild(char key) noexcept;
  [[nodiscard]] const TrieNode* findChild(char key) const noexcept;

  // Append a new child and return it. Callers are responsible for key uniqueness.
  TrieNode& branch(char key, Kind kind, std::shared_ptr<const Route> route = {});

  // Insert 'pattern' in the trie rooted at this node, storing 'route' at its terminus.
  // Errors: InsertOnNonRoot, EmptyPattern, MustStartWithSlash, DuplicateRoute (Reject policy only).
  // On error, the trie is left untouched.
  [[nodiscard]] std::error_code insert(
      std::string_view pattern, std::shared_ptr<const Route> route,
      RouterConfig::DuplicatePolicy duplicatePolicy = RouterConfig::DuplicatePolicy::Shadow);

  // Walk 'path' (already normalized) from this node and return the matching route.
  // Precedence at each step: ongoing parameter, then Parameter child, then CatchAll child, then Literal child.
  // Errors: FindOnNonRoot, RouteNotFound.
  [[nodiscard]] FindResult find(std::string_view path) const;

 private:
  vector<std::unique_ptr<TrieNode>> _children;
  std::shared_ptr<const Route> _route;
  char _key{};
  Kind _kind{Kind::Root};
};

}  // namespace triemux
