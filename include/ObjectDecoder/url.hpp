#pragma once

#include <utility>
#include <optional>
#include <string>
#include <string_view>

#include "well_known_types.hpp"

namespace ObjectDecoder {

namespace url_detail {

constexpr bool is_allowed(unsigned char c) {
    if(c >= 'a' && c <= 'z') return true;
    if(c >= 'A' && c <= 'Z') return true;
    if(c >= '0' && c <= '9') return true;
    switch(c) {
    case '-': case '.': case '_': case '~': case '/': case '?':
        return true;
    default:
        return false;
    }
}

inline std::string percent_encode(std::string_view raw) {
    constexpr char hex[] = "0123456789ABCDEF";
    std::string out;
    out.reserve(raw.size());
    for(char ch : raw) {
        unsigned char c = static_cast<unsigned char>(ch);
        if(is_allowed(c)) {
            out.push_back(ch);
        } else {
            out.push_back('%');
            out.push_back(hex[c >> 4]);
            out.push_back(hex[c & 0x0F]);
        }
    }
    return out;
}

}

inline std::optional<Url> Url::from_string(std::string_view raw) {
    std::string encoded = url_detail::percent_encode(raw);
    // Every character is now in the unreserved set or a %XX escape, so the only
    // unusable outcome left is an empty reference.
    if(encoded.empty()) {
        return std::nullopt;
    }
    return Url(std::move(encoded));
}

} // namespace ObjectDecoder
