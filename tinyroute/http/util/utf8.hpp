#ifndef TINYROUTE_HTTP_UTF8_HPP
#define TINYROUTE_HTTP_UTF8_HPP

#include <cstddef>
#include <cstdint>
#include <string_view>

namespace tinyroute::http::utf8 {

// Well-formed UTF-8 byte sequences, Unicode 6.0 Table 3-7. Overlong forms, surrogates
// and code points above U+10FFFF are rejected.
inline bool is_valid(const uint8_t* data, size_t len) {
    size_t i = 0;
    while (i < len) {
        const uint8_t lead = data[i];
        if (lead <= 0x7F) {
            ++i;
            continue;
        }

        size_t bytes;
        uint8_t second_min = 0x80;
        uint8_t second_max = 0xBF;

        if (lead >= 0xC2 && lead <= 0xDF) {
            bytes = 2;
        } else if (lead >= 0xE0 && lead <= 0xEF) {
            bytes = 3;
            if (lead == 0xE0) second_min = 0xA0;
            else if (lead == 0xED) second_max = 0x9F;
        } else if (lead >= 0xF0 && lead <= 0xF4) {
            bytes = 4;
            if (lead == 0xF0) second_min = 0x90;
            else if (lead == 0xF4) second_max = 0x8F;
        } else {
            return false;
        }

        if (len - i < bytes) return false;
        if (data[i + 1] < second_min || data[i + 1] > second_max) return false;
        for (size_t k = 2; k < bytes; ++k) {
            if (data[i + k] < 0x80 || data[i + k] > 0xBF) return false;
        }
        i += bytes;
    }
    return true;
}

inline bool is_valid(std::string_view sv) {
    return is_valid(reinterpret_cast<const uint8_t*>(sv.data()), sv.size());
}

} // namespace tinyroute::http::utf8

#endif // TINYROUTE_HTTP_UTF8_HPP
