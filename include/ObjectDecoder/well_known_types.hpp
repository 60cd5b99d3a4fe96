#pragma once

#include <charconv>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>
#include <optional>
#include <utility>

namespace ObjectDecoder {

/// Types the coercion engine intercepts by identity before generic recursion.

using Date = std::chrono::system_clock::time_point;

using Data = std::vector<std::byte>;


class Url {
    std::string m_text;

    explicit Url(std::string text): m_text(std::move(text)) {}
public:
    Url() = default;

    // Percent-encodes everything outside ASCII alphanumerics and "-._~/?";
    // nullopt when the result is not a usable URL. Defined in url.hpp.
    static std::optional<Url> from_string(std::string_view raw);

    const std::string & string() const { return m_text; }
    bool empty() const { return m_text.empty(); }

    friend bool operator==(const Url &, const Url &) = default;
};


/// Base-10 value produced from the double path. Carries the shortest decimal
/// text that round-trips to the same double, so 0.1 stays "0.1".
class Decimal {
    double m_value = 0;

public:
    constexpr Decimal() = default;
    constexpr explicit Decimal(double v): m_value(v) {}

    constexpr double to_double() const { return m_value; }
    std::string to_string() const;

    friend constexpr bool operator==(const Decimal &, const Decimal &) = default;
};

inline std::string Decimal::to_string() const {
    char buf[32];
    auto [ptr, ec] = std::to_chars(buf, buf + sizeof(buf), m_value);
    if(ec != std::errc{}) {
        return {};
    }
    return std::string(buf, ptr);
}

} // namespace ObjectDecoder
