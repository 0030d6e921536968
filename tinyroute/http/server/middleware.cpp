#include "middleware.hpp"
#include "context.hpp"
#include <memory>

namespace tinyroute::http {

namespace {

    using middleware_chain = std::shared_ptr<const std::vector<middleware_function>>;

    // started holds the index of the next step allowed to run; revisiting an earlier one
    // means some step resumed the pipeline twice
    tinyroute::awaitable<void> dispatch(middleware_chain chain, std::size_t index, context& ctx,
                                        next_function next, std::shared_ptr<std::size_t> started) {
        if (index < *started) {
            throw pipeline_error("next() called multiple times");
        }
        *started = index + 1;

        if (index == chain->size()) {
            co_await call_next(std::move(next));
            co_return;
        }

        const auto& step = (*chain)[index];
        co_await step(ctx, [chain, index, &ctx, next, started]() {
            return dispatch(chain, index + 1, ctx, next, started);
        });
    }

}

tinyroute::awaitable<void> call_next(next_function next) {
    if (next) {
        co_await next();
    }
}

middleware_function compose(std::vector<middleware_function> middlewares) {
    auto chain = std::make_shared<const std::vector<middleware_function>>(std::move(middlewares));
    return [chain](context& ctx, next_function next) {
        return dispatch(chain, 0, ctx, std::move(next), std::make_shared<std::size_t>(0));
    };
}

} // namespace tinyroute::http
