#include "application.hpp"
#include "../common/http_status.hpp"
#include "../util/url.hpp"
#include "../../util/logger.hpp"

#include <exception>
#include <string>
#include <boost/asio/io_context.hpp>

namespace tinyroute::http {

application& application::add(middleware_function middleware) {
    middlewares_.push_back(std::move(middleware));
    pipeline_ = compose(middlewares_);
    return *this;
}

application& application::use(const router& routes) {
    return add([&routes](context& ctx, next_function next) {
        return routes(ctx, std::move(next));
    });
}

tinyroute::awaitable<void> application::handle(context& ctx) const {
    auto pipeline = pipeline_;
    auto& req = ctx.req();

    try {
        if (pipeline) {
            co_await pipeline(ctx, next_function{});
        }
    } catch (const util::url::uri_error& e) {
        LOG_ERROR("Bad request {} {}: {}", req.get_method(), req.get_path(), e.what());
        ctx.res().error(http_status::bad_request, std::string(get_reason_phrase(http_status::bad_request)));
    } catch (const std::exception& e) {
        LOG_ERROR("Exception handling request {} {}: {}", req.get_method(), req.get_path(), e.what());
        ctx.res().error(http_status::internal_server_error,
                        std::string(get_reason_phrase(http_status::internal_server_error)));
    }

    if (req.get_method() == "HEAD") {
        ctx.res().strip_body();
    }

    LOG_DEBUG("{} {} -> {}", req.get_method(), req.get_path(), ctx.res().get_status_code());
}

context application::fetch(std::string_view method, std::string_view target) const {
    context ctx{method, target};
    boost::asio::io_context io_context;
    std::exception_ptr failure;

    tinyroute::co_spawn(io_context, handle(ctx), [&failure](std::exception_ptr e) {
        failure = e;
    });
    io_context.run();

    if (failure) {
        std::rethrow_exception(failure);
    }
    return ctx;
}

} // namespace tinyroute::http
