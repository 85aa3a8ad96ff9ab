#pragma once

#include <array>
#include <cstdint>
#include <string_view>
#include <type_traits>

namespace triemux::http {

// Fixed set of routable methods.
// The enumeration order is the lookup order used when probing every method (see Mux::hasRoute).
enum class Method : uint8_t { GET, PUT, POST, HEAD, PATCH, TRACE, DELETE, OPTIONS, CONNECT };

using MethodIdx = std::underlying_type_t<Method>;
inline constexpr MethodIdx kNbMethods = 9;

constexpr MethodIdx MethodToIdx(Method method) { return static_cast<MethodIdx>(method); }

constexpr Method MethodFromIdx(MethodIdx methodIdx) { return static_cast<Method>(methodIdx); }

inline constexpr std::string_view kMethodStrings[] = {"GET",   "PUT",    "POST",    "HEAD",   "PATCH",
                                                      "TRACE", "DELETE", "OPTIONS", "CONNECT"};

static_assert(std::size(kMethodStrings) == kNbMethods);

constexpr std::string_view MethodToStr(Method method) { return kMethodStrings[MethodToIdx(method)]; }

inline constexpr std::array<Method, kNbMethods> kAllMethods = []() {
  std::array<Method, kNbMethods> methods{};
  for (MethodIdx methodIdx = 0; methodIdx < kNbMethods; ++methodIdx) {
    methods[methodIdx] = MethodFromIdx(methodIdx);
  }
  return methods;
}();

}  // namespace triemux::http
