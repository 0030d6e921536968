#ifndef TINYROUTE_HTTP_CONTEXT_HPP
#define TINYROUTE_HTTP_CONTEXT_HPP

#include "request.hpp"
#include "response.hpp"
#include <nlohmann/json.hpp>
#include <string_view>

namespace tinyroute::http {

    /**
     * Per-request state handed to every pipeline step. It lives for a single request and
     * is never shared between requests, so steps may mutate it freely.
     */
    class context {
    public:
        context(std::string_view method, std::string_view target) :
            request_{method, target}
        {}

        request& req() { return request_; }
        const request& req() const { return request_; }

        response& res() { return response_; }
        const response& res() const { return response_; }

        /// free-form data shared between the steps of one request
        nlohmann::json& state() { return state_; }
        const nlohmann::json& state() const { return state_; }

    private:
        request request_;
        response response_;
        nlohmann::json state_ = nlohmann::json::object();
    };

}

#endif
