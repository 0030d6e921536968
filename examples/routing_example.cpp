#include <tinyroute/tinyroute.hpp>
#include <tinyroute/http/util/url.hpp>
#include <nlohmann/json.hpp>
#include <ctime>
#include <string>
#include <utility>
#include <vector>

using namespace tinyroute;

int main(int argc, char* argv[]) {
    // Initialize logging
    logging::enable();
    logging::set_log_level(spdlog::level::debug);

    LOG_INFO("Starting routing example");

    // Route options can come from configuration files
    auto options = nlohmann::json::parse(R"({"sensitive": false, "trailing": true})").get<http::route_options>();
    http::router routes(options);

    // Handler signatures:
    // 1. [](http::context& ctx, http::next_function next) -> awaitable<void> - may continue
    // 2. [](http::context& ctx) -> awaitable<void>                        - terminal coroutine
    // 3. [](http::context& ctx)                                           - terminal, synchronous
    routes.get("/", [](http::context& ctx) {
        ctx.res().json({
            {"message", "Welcome to tinyroute!"},
            {"endpoints", {
                "/health",
                "/api/v1/users/:user",
                "/api/v1/users/:user/devices/:device",
                "/api/v1/files/:path+",
                "/static/*"
            }}
        });
    });

    routes.get("/health", [](http::context& ctx) -> awaitable<void> {
        ctx.res().json({{"status", "ok"}, {"timestamp", std::time(nullptr)}});
        co_return;
    });

    // several handlers on one route, the first one validates and continues
    routes.get("/api/v1/users/:user",
        [](http::context& ctx, http::next_function next) -> awaitable<void> {
            if (ctx.req()["user"].size() > 32) {
                ctx.res().error(http::http_status::bad_request, "user id too long");
                co_return;
            }
            ctx.state()["user"] = ctx.req()["user"];
            co_await next();
        },
        [](http::context& ctx) {
            const auto user_id = ctx.state()["user"].get<std::string>();
            ctx.res().json({
                {"id", user_id},
                {"name", "User " + user_id},
                {"email", user_id + "@example.com"}
            });
        });

    routes.get("/api/v1/users/:user/devices/:device", [](http::context& ctx) {
        ctx.res().json({
            {"id", ctx.req()["device"]},
            {"owner", ctx.req()["user"]},
            {"route", ctx.req().route_path()}
        });
    });

    routes.del("/api/v1/users/:user/devices/:device", [](http::context& ctx) {
        LOG_INFO("Deleting device {} for user {}", ctx.req()["device"], ctx.req()["user"]);
        ctx.res().status(http::http_status::no_content);
    });

    // greedy parameter, captures slashes
    routes.get("/api/v1/files/:path+", [](http::context& ctx) {
        ctx.res().json({
            {"file", ctx.req()["path"]},
            {"exists", false}
        });
    });

    // anonymous wildcard, no parameter
    routes.all("/static/*", [](http::context& ctx) {
        ctx.res().send("static content for " + ctx.req().get_path());
    });

    LOG_INFO("Route table: {}", routes.to_json().dump());

    http::application app;
    app.use([](http::context& ctx, http::next_function next) -> awaitable<void> {
        ctx.res().header("X-Powered-By", "tinyroute");
        co_await next();
    });
    app.use(routes);

    std::vector<std::pair<std::string, std::string>> requests;
    if (argc > 2) {
        requests.emplace_back(argv[1], argv[2]);
    } else {
        requests = {
            {"GET", "/"},
            {"GET", "/api/v1/users/john_doe"},
            {"HEAD", "/api/v1/users/john_doe"},
            {"GET", "/api/v1/users/john_doe/devices/device1"},
            {"DELETE", "/api/v1/users/john_doe/devices/device1"},
            {"GET", "/api/v1/files/path/to/file.txt"},
            {"GET", "/api/v1/users/" + http::util::url::url_encode("john doe@example.com")},
            {"POST", "/static/css/site.css"},
            {"GET", "/api/v1/files/%E0%A4%A"},
            {"GET", "/missing"}
        };
    }

    for (const auto& [method, target] : requests) {
        auto ctx = app.fetch(method, target);
        LOG_INFO("{} {} -> {} {}", method, target, ctx.res().get_status_code(), ctx.res().get_body());
    }

    return 0;
}
