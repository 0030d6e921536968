#ifndef TINYROUTE_HTTP_UTIL_URL_HPP
#define TINYROUTE_HTTP_UTIL_URL_HPP

#include <map>
#include <stdexcept>
#include <string>
#include <string_view>

namespace tinyroute::http::util::url {

    /// raised when a URI component carries a malformed escape sequence
    class uri_error : public std::runtime_error {
    public:
        explicit uri_error(const std::string& message) : std::runtime_error(message) {}
    };

    // RFC 3986 Section 2.3: everything but unreserved characters is percent-encoded
    std::string url_encode(const std::string& value);

    // application/x-www-form-urlencoded decoding ('+' is a space); false on malformed input
    bool url_decode(const std::string& in, std::string& out);

    std::string url_decode(const std::string& in);

    /**
     * Decode a single URI component. Every %XX escape is decoded, reserved characters
     * included, and '+' is kept as is. Throws uri_error when an escape is truncated, has
     * non-hex digits, or when the decoded bytes are not valid UTF-8.
     */
    std::string decode_component(std::string_view in);

    void parse_url_encoded_data(const std::string& data, std::multimap<std::string, std::string>& store);

}

#endif
