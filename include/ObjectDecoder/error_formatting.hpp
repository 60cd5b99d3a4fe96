#pragma once

#include <format>
#include <string>

#include "decode_result.hpp"

namespace ObjectDecoder {

/// One line diagnostic:
///     When decoding $.users[2].id, error 'DATA_CORRUPTED': Parsed number <3.5> does not fit in int32_t.
inline std::string DecodeResultToString(const DecodeResult & res) {
    if(res) {
        return "No error";
    }
    std::string kinds;
    if(res.expectedKind() && res.actualKind()) {
        kinds = std::format(" (expected {}, found {})",
                            kind_to_string(*res.expectedKind()), kind_to_string(*res.actualKind()));
    }
    return std::format("When decoding {}, error '{}': {}{}",
                       res.errorPath().to_string(), error_to_string(res.error()), res.message(), kinds);
}

} // namespace ObjectDecoder
