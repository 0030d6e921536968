#ifndef TINYROUTE_HTTP_STATUS_HPP
#define TINYROUTE_HTTP_STATUS_HPP

#include <string_view>

namespace tinyroute::http {

    // the status of a response
    enum class http_status {
        ok = 200,
        created = 201,
        accepted = 202,
        no_content = 204,
        bad_request = 400,
        not_found = 404,
        internal_server_error = 500
    };

    // reason phrase, also used as the body of error responses
    inline std::string_view get_reason_phrase(http_status status) {
        switch (status) {
            case http_status::ok: return "OK";
            case http_status::created: return "Created";
            case http_status::accepted: return "Accepted";
            case http_status::no_content: return "No Content";
            case http_status::bad_request: return "Bad Request";
            case http_status::not_found: return "Not Found";
            case http_status::internal_server_error: return "Internal Server Error";
        }
        return "Unknown Status";
    }

}

#endif
