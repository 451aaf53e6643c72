#include <doctest/doctest.h>
#include "frontdoor/http_client.hpp"

using namespace frontdoor;

TEST_CASE("HttpResponse - Header lookup ignores case") {
    HttpResponse response;
    response.setHeader("Cache-Control", "max-age=3600");
    response.setHeader("AGE", "600");

    CHECK(response.header("cache-control").value() == "max-age=3600");
    CHECK(response.header("CACHE-CONTROL").value() == "max-age=3600");
    CHECK(response.header("Age").value() == "600");
    CHECK_FALSE(response.header("expires").has_value());
}

TEST_CASE("HttpResponse - Later header wins") {
    HttpResponse response;
    response.setHeader("Age", "1");
    response.setHeader("age", "2");
    CHECK(response.header("Age").value() == "2");
    CHECK(response.headers.size() == 1);
}

TEST_CASE("UrlQueryEscape") {
    CHECK(urlQueryEscape("ya29.a0-b_c~d") == "ya29.a0-b_c~d");
    CHECK(urlQueryEscape("1/abc") == "1%2Fabc");
    CHECK(urlQueryEscape("a b+c=d&e") == "a%20b%2Bc%3Dd%26e");
    CHECK(urlQueryEscape("") == "");
}

TEST_CASE("CurlHttpClient - Unreachable host is an IoError") {
    CurlHttpClient client(std::chrono::seconds{1});
    CHECK_THROWS_AS(client.get("http://127.0.0.1:1/certs"), IoError);
}
