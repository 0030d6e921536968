#include <catch2/catch_test_macros.hpp>
#include <tinyroute/http/common/method.hpp>

using namespace tinyroute::http;

TEST_CASE("HTTP method names", "[method][unit]") {

    SECTION("Method enum to string conversion") {
        REQUIRE(get_method(method::GET) == "GET");
        REQUIRE(get_method(method::HEAD) == "HEAD");
        REQUIRE(get_method(method::POST) == "POST");
        REQUIRE(get_method(method::PUT) == "PUT");
        REQUIRE(get_method(method::PATCH) == "PATCH");
        REQUIRE(get_method(method::DELETE) == "DELETE");
        REQUIRE(get_method(method::OPTIONS) == "OPTIONS");
        REQUIRE(get_method(method::UNKNOWN) == "UNKNOWN");
    }

    SECTION("String to method enum conversion") {
        REQUIRE(parse_method("GET") == method::GET);
        REQUIRE(parse_method("delete") == method::DELETE);
        REQUIRE(parse_method("Patch") == method::PATCH);
        REQUIRE(parse_method("PROPFIND") == method::UNKNOWN);
        REQUIRE(parse_method("") == method::UNKNOWN);
    }

    SECTION("Every registrable method round-trips") {
        for (auto m : registrable_methods) {
            REQUIRE(parse_method(get_method(m)) == m);
        }
    }

    SECTION("Route method names") {
        REQUIRE(get_route_method(method::PUT) == "PUT");
        REQUIRE(get_route_method(std::nullopt) == "ALL");
    }
}

TEST_CASE("HTTP method matching", "[method][unit]") {

    SECTION("Any-method route accepts everything") {
        REQUIRE(method_matches("GET", std::nullopt));
        REQUIRE(method_matches("PROPFIND", std::nullopt));
    }

    SECTION("Names compare case-insensitively") {
        REQUIRE(method_matches("post", method::POST));
        REQUIRE(method_matches("Delete", method::DELETE));
        REQUIRE_FALSE(method_matches("POST", method::PUT));
    }

    SECTION("GET routes also accept HEAD") {
        REQUIRE(method_matches("HEAD", method::GET));
        REQUIRE(method_matches("head", method::GET));
        REQUIRE_FALSE(method_matches("GET", method::HEAD));
        REQUIRE_FALSE(method_matches("HEAD", method::POST));
    }
}
