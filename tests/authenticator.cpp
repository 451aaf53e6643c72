#include <doctest/doctest.h>
#include "frontdoor/authenticator.hpp"
#include "test_support.hpp"

using namespace frontdoor;
using frontdoor::testing::FakeHttpClient;
using frontdoor::testing::FakeIdentityBackend;
using frontdoor::testing::FixedClock;

namespace {

const std::string CLIENT_ID = "my-client-id";
const std::string BEARER_EMAIL = "bearer@example.org";
const std::string VALID_SCOPE = "valid.scope";

// Known token claims: aud my-client-id, azp hello-android
const std::string JWT_AUDIENCE = "my-client-id";
const std::string JWT_CLIENT_ID = "hello-android";

struct AuthFixture {
    std::shared_ptr<FakeHttpClient> http = std::make_shared<FakeHttpClient>();
    CertificateCache cache{http, std::make_shared<InMemoryCacheStore>()};
    SignedTokenVerifier verifier{cache};
    std::shared_ptr<FixedClock> clock = std::make_shared<FixedClock>(testing::VALID_TOKEN_TIME);
    Authenticator authenticator{verifier, clock};
    FakeIdentityBackend backend;

    AuthFixture() {
        http->respond(DEFAULT_CERT_URI, 200, testing::GOOGLE_CERTS);
        OAuthUserInfo info{CLIENT_ID, BEARER_EMAIL, "12345", "example.org", false};
        backend.scopes[VALID_SCOPE] = info;
        backend.scopes[EMAIL_SCOPE] = info;
    }

    AuthResult<AuthenticatedIdentity> run(const std::string& header, const AuthPolicy& policy) {
        RequestContext ctx(header, backend);
        return authenticator.authenticate(ctx, policy);
    }
};

AuthPolicy policy(std::vector<std::string> scopes, std::vector<std::string> audiences,
                  std::vector<std::string> clientIds) {
    return AuthPolicy{std::move(scopes), std::move(audiences), std::move(clientIds)};
}

}  // namespace

TEST_CASE("Authenticator - Identity token") {
    AuthFixture f;
    auto result = f.run("oauth " + testing::VALID_TOKEN,
                        policy({EMAIL_SCOPE}, {JWT_AUDIENCE}, {JWT_CLIENT_ID}));
    REQUIRE(result.isSuccess());
    CHECK(result.value().email == "dude@gmail.com");
    CHECK(result.value().userId.empty());
    CHECK(f.backend.calls == 0);
}

TEST_CASE("Authenticator - Access token under the email scope") {
    AuthFixture f;
    auto result = f.run("oauth ya29.token", policy({EMAIL_SCOPE}, {CLIENT_ID}, {CLIENT_ID}));
    REQUIRE(result.isSuccess());
    CHECK(result.value().email == BEARER_EMAIL);
    CHECK(result.value().userId == "12345");
    CHECK(result.value().clientId == CLIENT_ID);
}

TEST_CASE("Authenticator - Access token with several scopes") {
    AuthFixture f;
    auto result = f.run("oauth ya29.token", policy({EMAIL_SCOPE, VALID_SCOPE}, {CLIENT_ID}, {CLIENT_ID}));
    REQUIRE(result.isSuccess());
    CHECK(result.value().email == BEARER_EMAIL);
}

TEST_CASE("Authenticator - Access token with a custom scope") {
    AuthFixture f;
    auto result = f.run("Bearer 1/token", policy({VALID_SCOPE}, {CLIENT_ID}, {CLIENT_ID}));
    REQUIRE(result.isSuccess());
    CHECK(result.value().email == BEARER_EMAIL);
}

TEST_CASE("Authenticator - Identity token for another client falls back and fails") {
    AuthFixture f;
    auto result = f.run("oauth " + testing::VALID_TOKEN,
                        policy({EMAIL_SCOPE}, {"other-client"}, {"other-client"}));
    REQUIRE(result.isError());
    CHECK(result.error().errorCode() == AuthErrorCode::MISMATCHED_CLIENT_ID);
    CHECK(f.backend.calls == 1);
}

TEST_CASE("Authenticator - Broken identity token is tried as an access token") {
    AuthFixture f;
    f.backend.knownToken = "some.invalid.jwt";
    f.backend.scopes.erase(EMAIL_SCOPE);

    auto result = f.run("oauth some.invalid.jwt", policy({EMAIL_SCOPE}, {JWT_AUDIENCE}, {JWT_CLIENT_ID}));
    REQUIRE(result.isError());
    CHECK(result.error().errorCode() == AuthErrorCode::NO_VALID_SCOPE);
    CHECK(f.backend.calls == 1);
}

TEST_CASE("Authenticator - Cryptographically invalid identity token still falls back") {
    AuthFixture f;
    f.backend.knownToken = testing::FOREIGN_KEY_TOKEN;

    auto result = f.run("Bearer " + testing::FOREIGN_KEY_TOKEN,
                        policy({EMAIL_SCOPE}, {CLIENT_ID}, {CLIENT_ID}));
    REQUIRE(result.isSuccess());
    CHECK(result.value().email == BEARER_EMAIL);
}

TEST_CASE("Authenticator - Identity token path needs client IDs") {
    AuthFixture f;
    auto result = f.run("oauth " + testing::VALID_TOKEN, policy({EMAIL_SCOPE}, {JWT_AUDIENCE}, {}));
    REQUIRE(result.isError());
    // Access-token path: the backend resolves the scope but no client is allowed
    CHECK(result.error().errorCode() == AuthErrorCode::MISMATCHED_CLIENT_ID);
    CHECK(f.http->requests.empty());
}

TEST_CASE("Authenticator - No token") {
    AuthFixture f;
    auto policyWithScope = policy({VALID_SCOPE}, {CLIENT_ID}, {CLIENT_ID});

    auto missing = f.run("", policyWithScope);
    REQUIRE(missing.isError());
    CHECK(missing.error().errorCode() == AuthErrorCode::NO_TOKEN);

    auto malformed = f.run("oauth doesn't matter", policyWithScope);
    REQUIRE(malformed.isError());
    CHECK(malformed.error().errorCode() == AuthErrorCode::NO_TOKEN);
    CHECK(f.backend.calls == 0);
}

TEST_CASE("Authenticator - Invalid scope") {
    AuthFixture f;
    auto result = f.run("oauth ya29.invalid", policy({"invalid.scope"}, {CLIENT_ID}, {CLIENT_ID}));
    REQUIRE(result.isError());
    CHECK(result.error().errorCode() == AuthErrorCode::NO_VALID_SCOPE);
}

TEST_CASE("Authenticator - Empty policy") {
    AuthFixture f;
    auto result = f.run("oauth ya29.token", AuthPolicy{});
    REQUIRE(result.isError());
    CHECK(result.error().errorCode() == AuthErrorCode::NO_POLICY_PROVIDED);
    CHECK(f.backend.calls == 0);
}

TEST_CASE("Authenticator - Partial policies are not empty") {
    AuthFixture f;
    auto noScopes = f.run("oauth ya29.token", policy({}, {CLIENT_ID}, {CLIENT_ID}));
    REQUIRE(noScopes.isError());
    CHECK(noScopes.error().errorCode() == AuthErrorCode::NO_VALID_SCOPE);

    auto noAudiences = f.run("oauth ya29.token", policy({EMAIL_SCOPE}, {}, {CLIENT_ID}));
    CHECK(noAudiences.isSuccess());
}

TEST_CASE("Authenticator - Same request twice yields the same identity") {
    AuthFixture f;
    auto jwtPolicy = policy({EMAIL_SCOPE}, {JWT_AUDIENCE}, {JWT_CLIENT_ID});
    auto first = f.run("oauth " + testing::VALID_TOKEN, jwtPolicy);
    auto second = f.run("oauth " + testing::VALID_TOKEN, jwtPolicy);
    REQUIRE(first.isSuccess());
    REQUIRE(second.isSuccess());
    CHECK(first.value() == second.value());
    CHECK(f.http->requests.size() == 2);  // Known certificates carry no max-age

    auto bearerPolicy = policy({VALID_SCOPE}, {CLIENT_ID}, {CLIENT_ID});
    auto third = f.run("oauth ya29.token", bearerPolicy);
    auto fourth = f.run("oauth ya29.token", bearerPolicy);
    REQUIRE(third.isSuccess());
    CHECK(third.value() == fourth.value());
}

TEST_CASE("Authenticator - Identity token respects the injected clock") {
    AuthFixture f;
    f.clock->now = testing::VALID_TOKEN_TIME + 86400;
    f.backend.scopes.clear();

    auto result = f.run("oauth " + testing::VALID_TOKEN,
                        policy({EMAIL_SCOPE}, {JWT_AUDIENCE}, {JWT_CLIENT_ID}));
    REQUIRE(result.isError());
    CHECK(result.error().errorCode() == AuthErrorCode::NO_VALID_SCOPE);
}

TEST_CASE("Authenticator - CurrentIdTokenUser") {
    AuthFixture f;
    std::vector<std::string> audiences = {JWT_AUDIENCE, JWT_CLIENT_ID};
    std::vector<std::string> clientIds = {JWT_CLIENT_ID};

    auto user = f.authenticator.currentIdTokenUser(testing::VALID_TOKEN, audiences, clientIds,
                                                   testing::VALID_TOKEN_TIME);
    CHECK(user.email == "dude@gmail.com");

    std::vector<std::string> otherClients = {"my-other-client-id"};
    CHECK_THROWS_AS(f.authenticator.currentIdTokenUser(testing::VALID_TOKEN, audiences, otherClients,
                                                       testing::VALID_TOKEN_TIME),
                    ClaimsRejectedError);
    CHECK_THROWS_AS(f.authenticator.currentIdTokenUser("some.invalid.jwt", audiences, clientIds,
                                                       testing::VALID_TOKEN_TIME),
                    MalformedTokenError);
}

TEST_CASE("Authenticator - Expected issuer comes from the configuration") {
    const int64_t iat = 1700000000;
    const std::string issuer = "https://issuer.example.org";
    testing::TestRsaKey key;
    auto claims = testing::googleClaims(iat);
    claims["iss"] = issuer;
    auto token = key.makeToken(claims);

    auto http = std::make_shared<FakeHttpClient>();
    http->respond(DEFAULT_CERT_URI, 200, key.certificateDocument());
    CertificateCache cache(http, std::make_shared<InMemoryCacheStore>());
    SignedTokenVerifier verifier(cache);
    auto clock = std::make_shared<FixedClock>(iat);
    FakeIdentityBackend backend;
    AuthPolicy idPolicy = policy({EMAIL_SCOPE}, {CLIENT_ID}, {CLIENT_ID});

    SUBCASE("Configured issuer is accepted") {
        Authenticator authenticator(verifier, clock, AuthConfig().withExpectedIssuer(issuer));
        RequestContext ctx("Bearer " + token, backend);
        auto result = authenticator.authenticate(ctx, idPolicy);
        REQUIRE(result.isSuccess());
        CHECK(result.value().email == "dude@gmail.com");
        CHECK(backend.calls == 0);
    }

    SUBCASE("Default configuration still expects the production issuer") {
        Authenticator authenticator(verifier, clock);
        std::vector<std::string> clientIds = {CLIENT_ID};
        CHECK_THROWS_AS(authenticator.currentIdTokenUser(token, clientIds, clientIds, iat),
                        ClaimsRejectedError);

        RequestContext ctx("Bearer " + token, backend);
        auto result = authenticator.authenticate(ctx, idPolicy);
        REQUIRE(result.isError());
        CHECK(result.error().errorCode() == AuthErrorCode::NO_VALID_SCOPE);
    }
}
