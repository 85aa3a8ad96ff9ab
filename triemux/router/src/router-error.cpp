#include "triemux/router-error.hpp"

#include <string>
#include <system_error>

namespace triemux {

namespace {

class RouterErrorCategory final : public std::error_category {
 public:
  [[nodiscard]] const char* name() const noexcept override { return "triemux"; }

  [[nodiscard]] std::string message(int condition) const override {
    switch (static_cast<RouterErrc>(condition)) {
      case RouterErrc::EmptyPattern:
        return "empty pattern is not supported";
      case RouterErrc::MustStartWithSlash:
        return "path must start with '/'";
      case RouterErrc::InsertOnNonRoot:
        return "insert on non root node";
      case RouterErrc::FindOnNonRoot:
        return "find on non root node";
      case RouterErrc::UnknownMethod:
        return "unknown http method";
      case RouterErrc::DuplicateRoute:
        return "route already registered for this pattern";
      case RouterErrc::RouteNotFound:
        return "route not found";
      case RouterErrc::BadPattern:
        return "bad pattern";
      default:
        return "unknown router error";
    }
  }
};

}  // namespace

const std::error_category& RouterCategory() noexcept {
  static const RouterErrorCategory kCategory;
  return kCategory;
}

std::error_code make_error_code(RouterErrc errc) noexcept { return {static_cast<int>(errc), RouterCategory()}; }

}  // namespace triemux
