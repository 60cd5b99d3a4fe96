#pragma once

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include "node.hpp"
#include "path.hpp"
#include "errors.hpp"

namespace ObjectDecoder {


/// Failure details recorded at the point of failure.
struct ErrorInfo {
    DecodeError error = DecodeError::NO_ERROR;
    CodingPath path;
    std::string message;
    std::optional<NodeKind> expected;
    std::optional<NodeKind> actual;
};


class DecodeResult {
    ErrorInfo m_info;

public:
    DecodeResult() = default;
    explicit DecodeResult(ErrorInfo info): m_info(std::move(info)) {}

    operator bool() const {
        return m_info.error == DecodeError::NO_ERROR;
    }

    DecodeError error() const {
        return m_info.error;
    }
    const CodingPath & errorPath() const {
        return m_info.path;
    }
    const std::string & message() const {
        return m_info.message;
    }
    // Set for TYPE_MISMATCH (and for container acquisition on the wrong kind)
    std::optional<NodeKind> expectedKind() const {
        return m_info.expected;
    }
    std::optional<NodeKind> actualKind() const {
        return m_info.actual;
    }
};


template <class T>
class DecodeValueResult: public DecodeResult {
    std::optional<T> m_value;

public:
    explicit DecodeValueResult(ErrorInfo info): DecodeResult(std::move(info)) {}
    explicit DecodeValueResult(T && value): m_value(std::move(value)) {}

    bool has_value() const { return m_value.has_value(); }

    T &       value() &       { return *m_value; }
    const T & value() const & { return *m_value; }
    T &&      value() &&      { return std::move(*m_value); }

    T *       operator->()       { return std::addressof(*m_value); }
    const T * operator->() const { return std::addressof(*m_value); }
};

} // namespace ObjectDecoder
