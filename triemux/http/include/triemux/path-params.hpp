#pragma once

#include <cstddef>
#include <string>
#include <string_view>

#include "triemux/vector.hpp"

namespace triemux {

struct PathParam {
  bool operator==(const PathParam&) const noexcept = default;

  std::string key;
  std::string value;
};

// Path parameters captured for a single request, kept in pattern-segment order.
// Keys are unique: setting an existing key replaces its value in place.
class PathParams {
 public:
  using const_iterator = const PathParam*;

  PathParams() noexcept = default;

  // Set the value of 'key', appending it if not present yet.
  void set(std::string_view key, std::string_view value);

  // Get the value associated to 'key', or an empty string_view if absent.
  [[nodiscard]] std::string_view get(std::string_view key) const noexcept;

  [[nodiscard]] bool contains(std::string_view key) const noexcept;

  [[nodiscard]] std::size_t size() const noexcept { return _params.size(); }

  [[nodiscard]] bool empty() const noexcept { return _params.empty(); }

  [[nodiscard]] const_iterator begin() const noexcept { return _params.data(); }
  [[nodiscard]] const_iterator end() const noexcept { return _params.data() + _params.size(); }

  void clear() noexcept { _params.clear(); }

  // Flat 'name:value' entries separated by commas, in capture order.
  // Useful for hosts forwarding captures through a single header value.
  [[nodiscard]] std::string encode() const;

  bool operator==(const PathParams& other) const noexcept;

 private:
  [[nodiscard]] const PathParam* find(std::string_view key) const noexcept;

  vector<PathParam> _params;
};

}  // namespace triemux
