#include <cstdlib>
#include <exception>
#include <iostream>
#include <string_view>
#include <system_error>
#include <utility>

#include "triemux/log.hpp"
#include "triemux/triemux.hpp"

using namespace triemux;

// Dispatches the requests given on the command line as pairs of METHOD PATH
// (or a built-in sample when none are given) and prints the produced responses.
int main(int argc, char** argv) {
  log::set_level(log::level::debug);

  try {
    Mux mux;

    mux.use([](Handler next) -> Handler {
      return [next = std::move(next)](HttpRequest& req, HttpResponse& resp) {
        next(req, resp);
        resp.header("X-Served-By", "triemux");
      };
    });

    auto check = [](std::error_code ec) {
      if (ec) {
        throw std::system_error(ec);
      }
    };

    check(mux.get("/", [](HttpRequest&, HttpResponse& resp) { resp.body("Hello from triemux!\n"); }));
    check(mux.get("/hello/:name", [](HttpRequest& req, HttpResponse& resp) {
      resp.body("Hello ");
      resp.appendBody(GetPathParams(req).get("name"));
      resp.appendBody("!\n");
    }));

    Mux files = mux.group("/files");
    check(files.get("/*path", [](HttpRequest& req, HttpResponse& resp) {
      resp.body("Serving file ");
      resp.appendBody(GetPathParams(req).get("path"));
      resp.appendBody("\n");
    }));

    Mux api = mux.group("/api/v1");
    check(api.post("/users/:id", [](HttpRequest& req, HttpResponse& resp) {
      resp.status(http::StatusCodeCreated);
      resp.body(R"({"id":")", http::ContentTypeApplicationJson);
      resp.appendBody(GetPathParams(req).get("id"));
      resp.appendBody("\"}\n");
    }));

    auto dispatch = [&mux](std::string_view method, std::string_view path) {
      HttpRequest req(method, path);
      HttpResponse resp;
      mux.serve(req, resp);
      std::cout << method << ' ' << path << " -> " << resp.status() << '\n';
      for (const auto& [name, value] : resp.headers()) {
        std::cout << "  " << name << ": " << value << '\n';
      }
      std::cout << resp.body() << '\n';
    };

    if (argc > 2) {
      for (int argPos = 1; argPos + 1 < argc; argPos += 2) {
        dispatch(argv[argPos], argv[argPos + 1]);
      }
    } else {
      dispatch("GET", "/");
      dispatch("GET", "/hello/world");
      dispatch("GET", "//files/./images/../css/site.css");
      dispatch("POST", "/api/v1/users/42");
      dispatch("GET", "/nowhere");
    }
  } catch (const std::exception& e) {
    std::cerr << "Router example encountered error: " << e.what() << '\n';
    return EXIT_FAILURE;
  }

  return EXIT_SUCCESS;
}
