#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>
#include <vector>

namespace ObjectDecoder {

namespace base64_detail {

constexpr int decode_char(char c) {
    if(c >= 'A' && c <= 'Z') return c - 'A';
    if(c >= 'a' && c <= 'z') return c - 'a' + 26;
    if(c >= '0' && c <= '9') return c - '0' + 52;
    if(c == '+') return 62;
    if(c == '/') return 63;
    return -1;
}

}

/// Standard alphabet, padded. Length must be a multiple of 4 and '=' may only
/// appear in the last two positions; anything else yields nullopt.
inline std::optional<std::vector<std::byte>> base64_decode(std::string_view text) {
    if(text.size() % 4 != 0) {
        return std::nullopt;
    }
    std::vector<std::byte> out;
    out.reserve(text.size() / 4 * 3);

    for(std::size_t i = 0; i < text.size(); i += 4) {
        const bool last = i + 4 == text.size();
        int v[4];
        std::size_t pad = 0;
        for(std::size_t j = 0; j < 4; j ++) {
            char c = text[i + j];
            if(c == '=') {
                if(!last || j < 2) return std::nullopt;
                pad ++;
                v[j] = 0;
                continue;
            }
            if(pad != 0) return std::nullopt; // data after padding
            v[j] = base64_detail::decode_char(c);
            if(v[j] < 0) return std::nullopt;
        }
        std::uint32_t triple = (std::uint32_t(v[0]) << 18) | (std::uint32_t(v[1]) << 12)
                             | (std::uint32_t(v[2]) << 6) | std::uint32_t(v[3]);
        out.push_back(std::byte((triple >> 16) & 0xFF));
        if(pad < 2) out.push_back(std::byte((triple >> 8) & 0xFF));
        if(pad < 1) out.push_back(std::byte(triple & 0xFF));
    }
    return out;
}

} // namespace ObjectDecoder
