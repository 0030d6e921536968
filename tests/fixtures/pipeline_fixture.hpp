#ifndef TINYROUTE_TEST_PIPELINE_FIXTURE_HPP
#define TINYROUTE_TEST_PIPELINE_FIXTURE_HPP

#include <tinyroute/http/server/context.hpp>
#include <tinyroute/http/server/middleware.hpp>
#include <tinyroute/util/types.hpp>
#include <boost/asio/io_context.hpp>
#include <exception>
#include <string>
#include <vector>

namespace tinyroute::http::test {

// Run a coroutine to completion, rethrowing whatever escaped it
inline void run(tinyroute::awaitable<void> task) {
    boost::asio::io_context io_context;
    std::exception_ptr failure;
    tinyroute::co_spawn(io_context, std::move(task), [&failure](std::exception_ptr e) {
        failure = e;
    });
    io_context.run();
    if (failure) {
        std::rethrow_exception(failure);
    }
}

// Run a single pipeline step; next_called reports whether it continued
inline void run_step(const middleware_function& step, context& ctx, bool* next_called = nullptr) {
    run(step(ctx, [next_called]() -> tinyroute::awaitable<void> {
        if (next_called) *next_called = true;
        co_return;
    }));
}

// Middleware appending a tag to state["trace"], continuing unless told otherwise
inline middleware_function tracer(std::string tag, bool forward = true) {
    return [tag, forward](context& ctx, next_function next) -> tinyroute::awaitable<void> {
        ctx.state()["trace"].push_back(tag);
        if (forward) {
            co_await next();
        }
    };
}

inline std::vector<std::string> trace_of(const context& ctx) {
    std::vector<std::string> trace;
    if (ctx.state().contains("trace")) {
        for (const auto& tag : ctx.state()["trace"]) {
            trace.push_back(tag.get<std::string>());
        }
    }
    return trace;
}

} // namespace tinyroute::http::test

#endif // TINYROUTE_TEST_PIPELINE_FIXTURE_HPP
