#include "triemux/mux.hpp"

#include <gtest/gtest.h>

#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

#include "triemux/handler.hpp"
#include "triemux/http-constants.hpp"
#include "triemux/http-method.hpp"
#include "triemux/http-request.hpp"
#include "triemux/http-response.hpp"
#include "triemux/http-status-code.hpp"
#include "triemux/path-params.hpp"
#include "triemux/router-config.hpp"
#include "triemux/router-error.hpp"

namespace triemux {

namespace {

// Handler writing its name and the encoded path parameters in the body.
Handler Named(std::string_view name) {
  return [name = std::string(name)](HttpRequest& req, HttpResponse& resp) {
    std::string body = name;
    if (!req.pathParams().empty()) {
      body.push_back(' ');
      body.append(req.pathParams().encode());
    }
    resp.body(body);
  };
}

// Middleware appending 'tag' to a "trace" header, then calling the next handler.
Middleware Tagging(std::string_view tag) {
  return [tag = std::string(tag)](Handler next) -> Handler {
    return [tag, next = std::move(next)](HttpRequest& req, HttpResponse& resp) {
      std::string trace(resp.headerValueOrEmpty("trace"));
      trace.append(tag);
      resp.header("trace", trace);
      next(req, resp);
    };
  };
}

}  // namespace

class MuxTest : public ::testing::Test {
 protected:
  HttpResponse dispatch(std::string_view method, std::string_view path) {
    HttpRequest req(method, path);
    HttpResponse resp;
    mux.serve(req, resp);
    lastParams = req.pathParams();
    return resp;
  }

  Mux mux;
  PathParams lastParams;
};

TEST_F(MuxTest, RegisterAndServe) {
  ASSERT_FALSE(mux.get("/hello", Named("hello")));

  auto resp = dispatch("GET", "/hello");
  EXPECT_EQ(resp.status(), http::StatusCodeOK);
  EXPECT_EQ(resp.body(), "hello");
  EXPECT_TRUE(lastParams.empty());
}

TEST_F(MuxTest, MethodsAreIndependent) {
  ASSERT_FALSE(mux.get("/item", Named("get")));
  ASSERT_FALSE(mux.put("/item", Named("put")));
  ASSERT_FALSE(mux.post("/item", Named("post")));
  ASSERT_FALSE(mux.head("/item", Named("head")));
  ASSERT_FALSE(mux.patch("/item", Named("patch")));
  ASSERT_FALSE(mux.trace("/item", Named("trace")));
  ASSERT_FALSE(mux.del("/item", Named("delete")));
  ASSERT_FALSE(mux.options("/item", Named("options")));
  ASSERT_FALSE(mux.connect("/item", Named("connect")));

  EXPECT_EQ(dispatch("GET", "/item").body(), "get");
  EXPECT_EQ(dispatch("PUT", "/item").body(), "put");
  EXPECT_EQ(dispatch("POST", "/item").body(), "post");
  EXPECT_EQ(dispatch("HEAD", "/item").body(), "head");
  EXPECT_EQ(dispatch("PATCH", "/item").body(), "patch");
  EXPECT_EQ(dispatch("TRACE", "/item").body(), "trace");
  EXPECT_EQ(dispatch("DELETE", "/item").body(), "delete");
  EXPECT_EQ(dispatch("OPTIONS", "/item").body(), "options");
  EXPECT_EQ(dispatch("CONNECT", "/item").body(), "connect");
}

TEST_F(MuxTest, AddRouteWithMethodString) {
  ASSERT_FALSE(mux.addRoute("GET", "/a", Named("a")));
  ASSERT_FALSE(mux.addRoute("post", "/a", Named("post a")));
  EXPECT_EQ(mux.addRoute("FETCH", "/a", Named("fetch")), RouterErrc::UnknownMethod);
  EXPECT_EQ(mux.addRoute("", "/a", Named("empty")), RouterErrc::UnknownMethod);

  EXPECT_EQ(dispatch("GET", "/a").body(), "a");
  EXPECT_EQ(dispatch("POST", "/a").body(), "post a");
  EXPECT_EQ(dispatch("FETCH", "/a").status(), http::StatusCodeNotFound);
}

TEST_F(MuxTest, RegistrationErrors) {
  EXPECT_EQ(mux.get("", Named("x")), RouterErrc::EmptyPattern);
  EXPECT_EQ(mux.get("hello", Named("x")), RouterErrc::MustStartWithSlash);
  EXPECT_THROW((void)mux.get("/x", Handler{}), std::invalid_argument);

  std::error_code ec;
  EXPECT_FALSE(mux.hasRoute("/x", "", ec));
  EXPECT_FALSE(ec);
}

TEST_F(MuxTest, ParameterRoute) {
  ASSERT_FALSE(mux.get("/hello/:name", Named("hello")));

  EXPECT_EQ(dispatch("GET", "/hello/world").body(), "hello name:world");
  EXPECT_EQ(lastParams.get("name"), "world");
}

TEST_F(MuxTest, NamedCatchAllRoute) {
  ASSERT_FALSE(mux.get("/hello/*name", Named("catch")));

  dispatch("GET", "/hello/my/magical/sheeplike/ship");
  EXPECT_EQ(lastParams.get("name"), "my/magical/sheeplike/ship");
}

TEST_F(MuxTest, UnnamedCatchAllRoute) {
  ASSERT_FALSE(mux.get("/hello/*", Named("catch")));

  EXPECT_EQ(dispatch("GET", "/hello/a/b").body(), "catch catch:a/b");
  EXPECT_EQ(lastParams.get("catch"), "a/b");
}

TEST_F(MuxTest, ParameterBeatsLiteral) {
  ASSERT_FALSE(mux.get("/users/:id", Named("user")));
  ASSERT_FALSE(mux.get("/users/new", Named("new user")));

  EXPECT_EQ(dispatch("GET", "/users/new").body(), "user id:new");
  EXPECT_EQ(lastParams.get("id"), "new");
}

TEST_F(MuxTest, DefaultNotFound) {
  auto resp = dispatch("GET", "/missing");
  EXPECT_EQ(resp.status(), http::StatusCodeNotFound);
  EXPECT_EQ(resp.headerValueOrEmpty(http::ContentType), http::ContentTypeTextHtmlUtf8);
  EXPECT_EQ(resp.body(), "404 - Not Found");
}

TEST_F(MuxTest, CustomNotFoundSharedWithGroups) {
  Mux api = mux.group("/api");
  api.notFoundHandler([](HttpRequest& req, HttpResponse& resp) {
    resp.status(http::StatusCodeNotFound);
    resp.body(std::string("nothing at ") + std::string(req.path()));
  });

  EXPECT_EQ(dispatch("GET", "/nowhere").body(), "nothing at /nowhere");

  mux.notFoundHandler(Handler{});
  EXPECT_EQ(dispatch("GET", "/nowhere").body(), "404 - Not Found");
}

TEST_F(MuxTest, WrongMethodIsNotFound) {
  ASSERT_FALSE(mux.get("/only-get", Named("get")));
  EXPECT_EQ(dispatch("POST", "/only-get").status(), http::StatusCodeNotFound);
}

TEST_F(MuxTest, PathIsCleanedBeforeLookup) {
  ASSERT_FALSE(mux.get("/a/c", Named("ac")));

  EXPECT_EQ(dispatch("GET", "//a/./b/../c").body(), "ac");
  EXPECT_EQ(dispatch("GET", "/a/c/").body(), "ac");
}

TEST(MuxConfig, PathCleaningCanBeDisabled) {
  Mux mux(RouterConfig{}.withPathCleaning(false));
  ASSERT_FALSE(mux.get("/a/c", Named("ac")));
  EXPECT_FALSE(mux.config().pathCleaning);

  HttpRequest req("GET", "//a/./b/../c");
  HttpResponse resp;
  mux.serve(req, resp);
  EXPECT_EQ(resp.status(), http::StatusCodeNotFound);
}

TEST(MuxConfig, DuplicatePolicy) {
  Mux shadowing;
  ASSERT_FALSE(shadowing.get("/dup", Named("first")));
  ASSERT_FALSE(shadowing.get("/dup", Named("second")));
  HttpRequest req("GET", "/dup");
  HttpResponse resp;
  shadowing.serve(req, resp);
  EXPECT_EQ(resp.body(), "second");

  Mux rejecting(RouterConfig{}.withDuplicatePolicy(RouterConfig::DuplicatePolicy::Reject));
  ASSERT_FALSE(rejecting.get("/dup", Named("first")));
  EXPECT_EQ(rejecting.get("/dup", Named("second")), RouterErrc::DuplicateRoute);
  HttpResponse resp2;
  rejecting.serve(req, resp2);
  EXPECT_EQ(resp2.body(), "first");
}

TEST_F(MuxTest, HasRouteOnEmptyRouter) {
  std::error_code ec;
  EXPECT_FALSE(mux.hasRoute("/missing", "GET", ec));
  EXPECT_FALSE(ec);
}

TEST_F(MuxTest, HasRoute) {
  ASSERT_FALSE(mux.post("/users/:id", Named("user")));

  std::error_code ec;
  EXPECT_TRUE(mux.hasRoute("/users/42", "POST", ec));
  EXPECT_FALSE(ec);
  EXPECT_TRUE(mux.hasRoute("/users/42", "post", ec));
  EXPECT_FALSE(mux.hasRoute("/users/42", "GET", ec));
  EXPECT_FALSE(ec);
  EXPECT_TRUE(mux.hasRoute("/users/42", "", ec));
  EXPECT_FALSE(ec);

  EXPECT_FALSE(mux.hasRoute("/users/42", "BREW", ec));
  EXPECT_EQ(ec, RouterErrc::UnknownMethod);

  // hasRoute looks up the raw path
  EXPECT_FALSE(mux.hasRoute("//users/42", "POST", ec));
  EXPECT_FALSE(ec);
}

TEST_F(MuxTest, GroupPrefix) {
  Mux api = mux.group("/api");
  Mux v1 = api.group("v1");
  EXPECT_EQ(api.prefix(), "/api");
  EXPECT_EQ(v1.prefix(), "/api/v1");

  ASSERT_FALSE(v1.get("/users/:id", Named("user v1")));
  ASSERT_FALSE(api.get("/", Named("api root")));

  std::error_code ec;
  EXPECT_TRUE(mux.hasRoute("/api/v1/users/3", "GET", ec));
  EXPECT_FALSE(mux.hasRoute("/users/3", "GET", ec));

  EXPECT_EQ(dispatch("GET", "/api/v1/users/3").body(), "user v1 id:3");
  EXPECT_EQ(dispatch("GET", "/api").body(), "api root");
}

TEST_F(MuxTest, GroupRelativePatternIsRejected) {
  Mux api = mux.group("/api");
  EXPECT_EQ(api.get("users", Named("users")), RouterErrc::MustStartWithSlash);
  EXPECT_EQ(api.get("", Named("users")), RouterErrc::EmptyPattern);
}

TEST_F(MuxTest, MiddlewareAppliesToLaterRegistrationsOnly) {
  ASSERT_FALSE(mux.get("/before", Named("before")));
  mux.use(Tagging("A"));
  ASSERT_FALSE(mux.get("/after", Named("after")));

  EXPECT_EQ(dispatch("GET", "/before").headerValueOrEmpty("trace"), "");
  EXPECT_EQ(dispatch("GET", "/after").headerValueOrEmpty("trace"), "A");
}

TEST_F(MuxTest, MiddlewareOrder) {
  mux.use({Tagging("1"), Tagging("2")}).use(Tagging("3"));
  EXPECT_EQ(mux.middleware().size(), 3U);
  ASSERT_FALSE(mux.get("/", Named("root")));

  // last registered is outermost, so it runs first
  EXPECT_EQ(dispatch("GET", "/").headerValueOrEmpty("trace"), "321");
}

TEST_F(MuxTest, GroupsHaveIndependentMiddleware) {
  mux.use(Tagging("root"));
  Mux branchedBefore = mux.group("/before");
  mux.use(Tagging("+"));
  Mux branchedAfter = mux.group("/after");
  branchedBefore.use(Tagging("-b"));

  EXPECT_EQ(mux.middleware().size(), 2U);
  EXPECT_EQ(branchedBefore.middleware().size(), 2U);
  EXPECT_EQ(branchedAfter.middleware().size(), 2U);

  ASSERT_FALSE(mux.get("/main", Named("main")));
  ASSERT_FALSE(branchedBefore.get("/x", Named("before")));
  ASSERT_FALSE(branchedAfter.get("/x", Named("after")));

  EXPECT_EQ(dispatch("GET", "/main").headerValueOrEmpty("trace"), "+root");
  EXPECT_EQ(dispatch("GET", "/before/x").headerValueOrEmpty("trace"), "-broot");
  EXPECT_EQ(dispatch("GET", "/after/x").headerValueOrEmpty("trace"), "+root");
}

TEST_F(MuxTest, EmptyMiddlewareThrows) { EXPECT_THROW(mux.use(Middleware{}), std::invalid_argument); }

TEST_F(MuxTest, RootPatternsAreCleaned) {
  ASSERT_FALSE(mux.get("/a//b", Named("ab")));
  ASSERT_FALSE(mux.get("/x/./y", Named("xy")));
  ASSERT_FALSE(mux.get("/p/q/../r", Named("pr")));

  EXPECT_EQ(dispatch("GET", "/a//b").body(), "ab");
  EXPECT_EQ(dispatch("GET", "/a/b").body(), "ab");
  EXPECT_EQ(dispatch("GET", "/x/./y").body(), "xy");
  EXPECT_EQ(dispatch("GET", "/p/r").body(), "pr");

  std::error_code ec;
  EXPECT_TRUE(mux.hasRoute("/a/b", "GET", ec));
  EXPECT_FALSE(mux.hasRoute("/a//b", "GET", ec));
}

TEST_F(MuxTest, RootAndGroupPatternsAreCleanedAlike) {
  Mux group = mux.group("/g");
  ASSERT_FALSE(group.get("/a//b", Named("group")));
  ASSERT_FALSE(mux.get("/h/a//b", Named("root")));

  EXPECT_EQ(dispatch("GET", "/g/a//b").body(), "group");
  EXPECT_EQ(dispatch("GET", "/h/a//b").body(), "root");
}

TEST_F(MuxTest, TrailingSlashParameterPatternCapturesParameter) {
  ASSERT_FALSE(mux.get("/users/:id/", Named("user")));

  auto resp = dispatch("GET", "/users/42");
  EXPECT_EQ(resp.status(), http::StatusCodeOK);
  EXPECT_EQ(resp.body(), "user id:42");
  EXPECT_EQ(lastParams.get("id"), "42");
  EXPECT_EQ(dispatch("GET", "/users/42/").body(), "user id:42");
}

TEST_F(MuxTest, ServeIsIdempotent) {
  ASSERT_FALSE(mux.get("/hello/:name", Named("hello")));

  for (int iter = 0; iter < 3; ++iter) {
    EXPECT_EQ(dispatch("GET", "/hello/world").body(), "hello name:world");
  }
}

TEST_F(MuxTest, CallOperator) {
  ASSERT_FALSE(mux.get("/x", Named("x")));
  HttpRequest req("GET", "/x");
  HttpResponse resp;
  mux(req, resp);
  EXPECT_EQ(resp.body(), "x");
}

TEST_F(MuxTest, HandlerExceptionPropagates) {
  ASSERT_FALSE(mux.get("/boom", [](HttpRequest&, HttpResponse&) { throw std::runtime_error("boom"); }));
  HttpRequest req("GET", "/boom");
  HttpResponse resp;
  EXPECT_THROW(mux.serve(req, resp), std::runtime_error);
}

}  // namespace triemux
