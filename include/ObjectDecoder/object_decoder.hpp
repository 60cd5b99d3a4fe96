#pragma once

#include <utility>

#include "node.hpp"
#include "strategies.hpp"
#include "decode_result.hpp"
#include "decoder.hpp"
#include "decodable.hpp"

namespace ObjectDecoder {

/// Fills out from the tree rooted at root. The first failing read aborts the
/// decode; out is then in an unspecified but valid state.
template<class T>
DecodeResult Decode(T & out, const Node & root, const Options & options = {}) {
    Decoder decoder(root, options);
    if(!decoder.single_value_container().decode(out)) {
        return DecodeResult(decoder.last_error());
    }
    return DecodeResult{};
}

template<class T>
DecodeValueResult<T> Decode(const Node & root, const Options & options = {}) {
    T value{};
    Decoder decoder(root, options);
    if(!decoder.single_value_container().decode(value)) {
        return DecodeValueResult<T>(decoder.last_error());
    }
    return DecodeValueResult<T>(std::move(value));
}

} // namespace ObjectDecoder
