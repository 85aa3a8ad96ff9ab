#include "triemux/trie-node.hpp"

#include <memory>
#include <string_view>
#include <system_error>
#include <utility>

#include "triemux/log.hpp"
#include "triemux/route.hpp"
#include "triemux/router-config.hpp"
#include "triemux/router-error.hpp"

namespace triemux {

namespace {

constexpr bool AbsorbsNameCharacters(TrieNode::Kind kind) {
  return kind == TrieNode::Kind::Parameter || kind == TrieNode::Kind::CatchAll;
}

constexpr TrieNode::Kind KindFromPatternChar(char ch) {
  switch (ch) {
    case TrieNode::kParameterKey:
      return TrieNode::Kind::Parameter;
    case TrieNode::kCatchAllKey:
      return TrieNode::Kind::CatchAll;
    default:
      return TrieNode::Kind::Literal;
  }
}

}  // namespace

TrieNode* TrieNode::findChild(char key) noexcept {
  for (auto& child : _children) {
    if (child->_key == key) {
      return child.get();
    }
  }
  return nullptr;
}

const TrieNode* TrieNode::findChild(char key) const noexcept {
  for (const auto& child : _children) {
    if (child->_key == key) {
      return child.get();
    }
  }
  return nullptr;
}

TrieNode& TrieNode::branch(char key, Kind kind, std::shared_ptr<const Route> route) {
  return *_children.emplace_back(std::make_unique<TrieNode>(key, kind, std::move(route)));
}

std::error_code TrieNode::insert(std::string_view pattern, std::shared_ptr<const Route> route,
                                 RouterConfig::DuplicatePolicy duplicatePolicy) {
  if (_kind != Kind::Root) {
    return RouterErrc::InsertOnNonRoot;
  }
  if (pattern.empty()) {
    return RouterErrc::EmptyPattern;
  }
  if (pattern.front() != '/') {
    return RouterErrc::MustStartWithSlash;
  }

  TrieNode* pLevel = this;
  for (const char ch : pattern) {
    if (AbsorbsNameCharacters(pLevel->_kind) && ch != '/') {
      continue;
    }
    if (TrieNode* pChild = pLevel->findChild(ch); pChild != nullptr) {
      pLevel = pChild;
      continue;
    }
    pLevel = &pLevel->branch(ch, KindFromPatternChar(ch));
  }

  // An existing terminal implies that no node has been created above.
  if (TrieNode* pEnd = pLevel->findChild(kTerminalKey); pEnd != nullptr) {
    if (duplicatePolicy == RouterConfig::DuplicatePolicy::Reject) {
      return RouterErrc::DuplicateRoute;
    }
    log::warn("Route '{}' shadows previously registered route '{}'", pattern, pEnd->_route->pattern());
    pEnd->_route = std::move(route);
    return {};
  }

  pLevel->branch(kTerminalKey, Kind::Terminal, std::move(route));
  return {};
}

TrieNode::FindResult TrieNode::find(std::string_view path) const {
  FindResult result;
  if (_kind != Kind::Root) {
    result.error = RouterErrc::FindOnNonRoot;
    return result;
  }

  const TrieNode* pLevel = this;
  bool inParameter = false;
  for (const char ch : path) {
    if (inParameter) {
      if (ch != '/') {
        continue;
      }
      inParameter = false;
    }

    // Parameter and catch-all children take precedence over any literal child.
    if (const TrieNode* pParam = pLevel->findChild(kParameterKey); pParam != nullptr) {
      pLevel = pParam;
      inParameter = true;
      continue;
    }
    if (const TrieNode* pCatchAll = pLevel->findChild(kCatchAllKey); pCatchAll != nullptr) {
      pLevel = pCatchAll;
      break;
    }

    const TrieNode* pChild = pLevel->findChild(ch);
    if (pChild == nullptr || pChild->_kind == Kind::Terminal) {
      result.error = RouterErrc::RouteNotFound;
      return result;
    }
    pLevel = pChild;
  }

  if (pLevel == this) {
    // empty path
    result.error = RouterErrc::RouteNotFound;
    return result;
  }

  if (const TrieNode* pEnd = pLevel->findChild(kTerminalKey); pEnd != nullptr) {
    result.route = pEnd->_route;
    return result;
  }

  // Tolerate a trailing slash in the pattern which is absent from the path.
  if (const TrieNode* pSlash = pLevel->findChild('/'); pSlash != nullptr) {
    if (const TrieNode* pEnd = pSlash->findChild(kTerminalKey); pEnd != nullptr) {
      result.route = pEnd->_route;
      return result;
    }
  }

  result.error = RouterErrc::RouteNotFound;
  return result;
}

}  // namespace triemux
