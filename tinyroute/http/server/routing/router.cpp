#include "router.hpp"
#include "../context.hpp"
#include "../../../util/logger.hpp"

namespace tinyroute::http {

router::router(route_options options) : options_(options) {}

router& router::add(std::optional<method> http_method, const std::string& pattern,
                    std::vector<middleware_function> handlers) {
    auto registered = std::make_shared<const route>(http_method, pattern, std::move(handlers), options_);
    LOG_DEBUG("Registered route: {} {} ({})", get_route_method(http_method), pattern,
              registered->get_matcher().get_expression());
    routes_.push_back(std::move(registered));

    // chain every route into one step, in registration order
    std::vector<middleware_function> steps;
    steps.reserve(routes_.size());
    for (const auto& current : routes_) {
        steps.emplace_back([current](context& ctx, next_function next) {
            return (*current)(ctx, std::move(next));
        });
    }
    pipeline_ = compose(std::move(steps));
    return *this;
}

tinyroute::awaitable<void> router::operator()(context& ctx, next_function next) const {
    if (!pipeline_) {
        return call_next(std::move(next));
    }
    return pipeline_(ctx, std::move(next));
}

nlohmann::json router::to_json() const {
    nlohmann::json routes = nlohmann::json::array();
    for (const auto& current : routes_) {
        routes.push_back(current->to_json());
    }
    return {
        {"options", options_},
        {"routes", routes}
    };
}

} // namespace tinyroute::http
