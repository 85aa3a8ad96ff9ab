#include "triemux/path-params.hpp"

#include <algorithm>
#include <cstddef>
#include <string>
#include <string_view>

namespace triemux {

const PathParam* PathParams::find(std::string_view key) const noexcept {
  const auto it = std::ranges::find_if(_params, [key](const PathParam& param) { return param.key == key; });
  return it == _params.end() ? nullptr : &*it;
}

void PathParams::set(std::string_view key, std::string_view value) {
  const auto it = std::ranges::find_if(_params, [key](const PathParam& param) { return param.key == key; });
  if (it != _params.end()) {
    it->value.assign(value);
    return;
  }
  _params.push_back(PathParam{std::string(key), std::string(value)});
}

std::string_view PathParams::get(std::string_view key) const noexcept {
  const PathParam* pParam = find(key);
  return pParam == nullptr ? std::string_view{} : std::string_view(pParam->value);
}

bool PathParams::contains(std::string_view key) const noexcept { return find(key) != nullptr; }

std::string PathParams::encode() const {
  std::size_t sz = 0;
  for (const PathParam& param : _params) {
    sz += param.key.size() + 1U + param.value.size() + 1U;
  }

  std::string out;
  out.reserve(sz);
  for (const PathParam& param : _params) {
    if (!out.empty()) {
      out.push_back(',');
    }
    out.append(param.key);
    out.push_back(':');
    out.append(param.value);
  }
  return out;
}

bool PathParams::operator==(const PathParams& other) const noexcept {
  return std::ranges::equal(*this, other);
}

}  // namespace triemux
