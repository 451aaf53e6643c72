#include <doctest/doctest.h>
#include "frontdoor/request_context.hpp"
#include "test_support.hpp"

using namespace frontdoor;
using frontdoor::testing::FakeIdentityBackend;

namespace {

FakeIdentityBackend makeBackend() {
    FakeIdentityBackend backend;
    backend.scopes["scope.a"] = OAuthUserInfo{"client-a", "a@example.org", "1", "example.org", false};
    backend.scopes["scope.b"] = OAuthUserInfo{"client-b", "b@example.org", "2", "example.org", true};
    return backend;
}

}  // namespace

TEST_CASE("ParseAuthorizationHeader") {
    CHECK(parseAuthorizationHeader("Bearer token") == "token");
    CHECK(parseAuthorizationHeader("bearer foo") == "foo");
    CHECK(parseAuthorizationHeader("OAuth baz") == "baz");
    CHECK(parseAuthorizationHeader("oauth xxx") == "xxx");
    CHECK(parseAuthorizationHeader("  BEARER \t tok ") == "tok");

    CHECK(parseAuthorizationHeader("Bearer") == "");
    CHECK(parseAuthorizationHeader("Bearer  ") == "");
    CHECK(parseAuthorizationHeader("") == "");
    CHECK(parseAuthorizationHeader("Basic dXNlcjpwYXNz") == "");
    CHECK(parseAuthorizationHeader("Bearer a b") == "");
}

TEST_CASE("RequestContext - Token from header") {
    FakeIdentityBackend backend;
    RequestContext ctx("OAuth ya29.token", backend);
    CHECK(ctx.authorizationHeader() == "OAuth ya29.token");
    CHECK(ctx.token() == "ya29.token");
}

TEST_CASE("RequestContext - Repeated lookups for one scope hit the backend once") {
    auto backend = makeBackend();
    RequestContext ctx("Bearer tok", backend);

    CHECK(ctx.currentOAuthClientId("scope.a") == "client-a");
    auto user = ctx.currentOAuthUser("scope.a");
    CHECK(user.email == "a@example.org");
    CHECK(user.userId == "1");
    CHECK(user.authDomain == "example.org");
    CHECK(user.clientId == "client-a");
    CHECK(backend.calls == 1);
    CHECK(ctx.cachedScope() == std::optional<std::string>("scope.a"));
}

TEST_CASE("RequestContext - Only the latest scope stays cached") {
    auto backend = makeBackend();
    RequestContext ctx("Bearer tok", backend);

    ctx.currentOAuthClientId("scope.a");
    ctx.currentOAuthClientId("scope.b");
    CHECK(ctx.cachedScope() == std::optional<std::string>("scope.b"));
    CHECK(ctx.currentOAuthUser("scope.b").isAdmin);
    CHECK(backend.calls == 2);

    // scope.a was evicted by scope.b
    ctx.currentOAuthClientId("scope.a");
    CHECK(backend.calls == 3);
}

TEST_CASE("RequestContext - Failed lookup leaves the cache empty") {
    auto backend = makeBackend();
    RequestContext ctx("Bearer tok", backend);

    ctx.currentOAuthClientId("scope.a");
    CHECK_THROWS_AS(ctx.currentOAuthClientId("unknown.scope"), BackendError);
    CHECK_FALSE(ctx.cachedScope().has_value());

    ctx.currentOAuthClientId("scope.a");
    CHECK(backend.calls == 3);
}

TEST_CASE("RequestContext - No token") {
    auto backend = makeBackend();
    RequestContext ctx("", backend);

    CHECK(ctx.token().empty());
    CHECK_THROWS_AS(ctx.currentOAuthUser("scope.a"), NoTokenError);
    CHECK(backend.calls == 0);
}
