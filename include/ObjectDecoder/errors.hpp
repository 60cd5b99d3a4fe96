#pragma once

#include <string_view>
namespace ObjectDecoder {


enum class DecodeError {
    NO_ERROR,

    KEY_NOT_FOUND,
    VALUE_NOT_FOUND,
    TYPE_MISMATCH,
    DATA_CORRUPTED,

    DEPTH_LIMIT_EXCEEDED
};

constexpr std::string_view error_to_string(DecodeError e) {
    switch(e) {
    case DecodeError::NO_ERROR: return "NO_ERROR"; break;
    case DecodeError::KEY_NOT_FOUND: return "KEY_NOT_FOUND"; break;
    case DecodeError::VALUE_NOT_FOUND: return "VALUE_NOT_FOUND"; break;
    case DecodeError::TYPE_MISMATCH: return "TYPE_MISMATCH"; break;
    case DecodeError::DATA_CORRUPTED: return "DATA_CORRUPTED"; break;
    case DecodeError::DEPTH_LIMIT_EXCEEDED: return "DEPTH_LIMIT_EXCEEDED"; break;
    }
    return "N/A";
}

} // namespace ObjectDecoder
