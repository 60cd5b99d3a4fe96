#pragma once

#include <any>
#include <cstddef>
#include <functional>
#include <map>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>

#include "well_known_types.hpp"

namespace ObjectDecoder {

class Decoder;


/// strptime-style pattern, interpreted in UTC with the classic locale:
///     DateFormatter{"%Y-%m-%d %H:%M:%S"}
struct DateFormatter {
    std::string format;
};


struct DateStrategy {
    // Date's own build capability reads {year, month, day, ...}
    struct DeferredToDate {};
    struct SecondsSince1970 {};
    struct MillisecondsSince1970 {};
    // YYYY-MM-DDTHH:MM:SS followed by Z or +HH:MM / -HH:MM
    struct ISO8601 {};
    struct Formatted {
        DateFormatter formatter;
    };
    // Invoked with the offending node as the decoder's current node
    struct Custom {
        std::function<bool(Date &, Decoder &)> fn;
    };

    using Kind = std::variant<DeferredToDate, SecondsSince1970, MillisecondsSince1970, ISO8601, Formatted, Custom>;
    Kind kind;

    DateStrategy() = default;
    template<class S>
        requires std::is_constructible_v<Kind, S&&>
    DateStrategy(S && s): kind(std::forward<S>(s)) {}
};


struct DataStrategy {
    // Data's own build capability reads a sequence of byte numbers
    struct DeferredToData {};
    struct Base64 {};
    struct Custom {
        std::function<bool(Data &, Decoder &)> fn;
    };

    using Kind = std::variant<DeferredToData, Base64, Custom>;
    Kind kind = Base64{};

    DataStrategy() = default;
    template<class S>
        requires std::is_constructible_v<Kind, S&&>
    DataStrategy(S && s): kind(std::forward<S>(s)) {}
};


struct NonConformingFloatStrategy {
    // Non-finite values are rejected
    struct Throw {};
    // Text equal to one of the sentinels maps to the matching value
    struct ConvertFromString {
        std::string positive_infinity;
        std::string negative_infinity;
        std::string nan;
    };

    using Kind = std::variant<Throw, ConvertFromString>;
    Kind kind;

    NonConformingFloatStrategy() = default;
    template<class S>
        requires std::is_constructible_v<Kind, S&&>
    NonConformingFloatStrategy(S && s): kind(std::forward<S>(s)) {}
};


using UserInfo = std::map<std::string, std::any>;


/// Immutable snapshot handed to every step of one Decode call.
struct Options {
    DateStrategy               date_strategy;
    DataStrategy               data_strategy;
    NonConformingFloatStrategy non_conforming_float_strategy;
    UserInfo                   user_info;
    std::size_t                max_depth = 256;
};

} // namespace ObjectDecoder
