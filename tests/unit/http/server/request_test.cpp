#include <catch2/catch_test_macros.hpp>
#include <tinyroute/http/server/request.hpp>

using namespace tinyroute::http;

TEST_CASE("Request construction", "[request][unit]") {

    SECTION("Method is upper-cased") {
        request req("get", "/hoa");
        REQUIRE(req.get_method() == "GET");
    }

    SECTION("Path and query are split") {
        request req("GET", "/search?q=hello+world&page=2");
        REQUIRE(req.get_path() == "/search");
        REQUIRE(req.get_query_string() == "q=hello+world&page=2");
        REQUIRE(req.query("q") == "hello world");
        REQUIRE(req.query("page") == "2");
    }

    SECTION("Missing query values use defaults") {
        request req("GET", "/search");
        REQUIRE(req.get_query_string().empty());
        REQUIRE(req.query("q").empty());
        REQUIRE(req.query("page", "1") == "1");
    }

    SECTION("Empty path becomes root") {
        request req("GET", "");
        REQUIRE(req.get_path() == "/");
        request with_query("GET", "?a=1");
        REQUIRE(with_query.get_path() == "/");
        REQUIRE(with_query.query("a") == "1");
    }

    SECTION("Path is kept undecoded") {
        request req("GET", "/package/a%2Fb");
        REQUIRE(req.get_path() == "/package/a%2Fb");
    }
}

TEST_CASE("Request route match", "[request][unit]") {

    request req("GET", "/users/alice");

    SECTION("No parameters before a match") {
        REQUIRE(req.params().empty());
        REQUIRE(req.route_path().empty());
        REQUIRE(req["id"].empty());
        REQUIRE_FALSE(req.has("id"));
        REQUIRE_FALSE(req.param("id").has_value());
    }

    SECTION("Parameters attached by a match") {
        req.set_route_match({{"name", std::string("alice")}, {"path", std::nullopt}}, "/users/:name");

        REQUIRE(req.route_path() == "/users/:name");
        REQUIRE(req["name"] == "alice");
        REQUIRE(req.has("name"));
        REQUIRE(req.param("name") == "alice");

        REQUIRE(req.params().size() == 2);
        REQUIRE(req.params().contains("path"));
        REQUIRE_FALSE(req.has("path"));
        REQUIRE(req["path"].empty());
    }

    SECTION("A new match replaces the previous one") {
        req.set_route_match({{"name", std::string("alice")}}, "/users/:name");
        req.set_route_match({}, "/users/*");

        REQUIRE(req.params().empty());
        REQUIRE(req.route_path() == "/users/*");
        REQUIRE_FALSE(req.has("name"));
    }

    SECTION("Debug output lists parameters") {
        req.set_route_match({{"name", std::string("alice")}, {"path", std::nullopt}}, "/users/:name");
        auto text = req.debug_parameters();
        REQUIRE(text.find("(name:alice)") != std::string::npos);
        REQUIRE(text.find("(path:<absent>)") != std::string::npos);
    }
}
