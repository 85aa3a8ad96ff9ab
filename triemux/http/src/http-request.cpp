#include "triemux/http-request.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace triemux {

std::optional<std::string_view> HttpRequest::attribute(std::string_view key) const noexcept {
  const auto it = _attributes.find(key);
  if (it == _attributes.end()) {
    return std::nullopt;
  }
  return std::string_view(it->second);
}

HttpRequest& HttpRequest::attribute(std::string_view key, std::string_view value) {
  const auto it = _attributes.find(key);
  if (it == _attributes.end()) {
    _attributes.emplace(std::string(key), std::string(value));
  } else {
    it->second.assign(value);
  }
  return *this;
}

}  // namespace triemux
