#include <catch2/catch_test_macros.hpp>

#include "callguard/utils/http.hpp"

#include <stdexcept>
#include <string>

using callguard::utils::parse_url;
using callguard::utils::resolve_redirect_url;

TEST_CASE("parse_url splits scheme host port and path") {
    const auto url = parse_url("https://hooks.example.com:8443/notify/escalations");
    REQUIRE(url.scheme == "https");
    REQUIRE(url.host == "hooks.example.com");
    REQUIRE(url.port == 8443);
    REQUIRE(url.path == "/notify/escalations");
    REQUIRE(url.origin() == "https://hooks.example.com:8443");
}

TEST_CASE("parse_url picks default ports") {
    const auto secure = parse_url("WSS://pager.example.com");
    REQUIRE(secure.scheme == "wss");
    REQUIRE(secure.port == 443);
    REQUIRE(secure.path == "/");

    const auto plain = parse_url("localhost/hook");
    REQUIRE(plain.scheme == "http");
    REQUIRE(plain.port == 80);
    REQUIRE(plain.origin() == "http://localhost");

    REQUIRE_THROWS_AS(parse_url("http://host:port/x"), std::invalid_argument);
}

TEST_CASE("resolve_redirect_url handles absolute and relative redirects") {
    const std::string base_url = "https://example.com/path/file";
    REQUIRE(resolve_redirect_url(base_url, "/new") == "https://example.com/new");
    REQUIRE(resolve_redirect_url(base_url, "other") == "https://example.com/path/other");
    REQUIRE(resolve_redirect_url(base_url, "https://host/x") == "https://host/x");
    REQUIRE(resolve_redirect_url(base_url, "").empty());
}
