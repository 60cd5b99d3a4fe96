#pragma once

#include <chrono>
#include <cmath>
#include <cstdint>
#include <ctime>
#include <iomanip>
#include <locale>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>

#include "well_known_types.hpp"
#include "strategies.hpp"

namespace ObjectDecoder {

namespace date_formats {

namespace detail {

// Representable span of Date, in whole seconds on either side of the epoch
inline constexpr std::int64_t max_seconds =
    std::chrono::duration_cast<std::chrono::seconds>(Date::duration::max()).count() - 1;

constexpr bool parse_digits(std::string_view s, std::size_t pos, std::size_t count, int & out) {
    if(pos + count > s.size()) return false;
    int v = 0;
    for(std::size_t i = pos; i < pos + count; i ++) {
        if(s[i] < '0' || s[i] > '9') return false;
        v = v * 10 + (s[i] - '0');
    }
    out = v;
    return true;
}

}

/// Builds an instant from UTC civil fields; nullopt for impossible calendar
/// dates, out of range clock fields or instants outside Date's span.
inline std::optional<Date> from_civil(int year, unsigned month, unsigned day,
                                      int hour = 0, int minute = 0, int second = 0,
                                      std::int64_t nanosecond = 0) {
    using namespace std::chrono;
    // chrono's calendar types hold short / unsigned char; reject before they wrap
    if(year < -32767 || year > 32767 || month < 1 || month > 12 || day < 1 || day > 31) {
        return std::nullopt;
    }
    year_month_day ymd{std::chrono::year{year}, std::chrono::month{month}, std::chrono::day{day}};
    if(!ymd.ok()) {
        return std::nullopt;
    }
    if(hour < 0 || hour > 23 || minute < 0 || minute > 59 || second < 0 || second > 60) {
        return std::nullopt;
    }
    if(nanosecond < 0 || nanosecond >= 1'000'000'000) {
        return std::nullopt;
    }
    std::int64_t days_since_epoch = sys_days{ymd}.time_since_epoch().count();
    std::int64_t secs = days_since_epoch * 86400 + hour * 3600 + minute * 60 + second;
    if(secs > detail::max_seconds || secs < -detail::max_seconds) {
        return std::nullopt;
    }
    return Date{duration_cast<Date::duration>(seconds{secs} + nanoseconds{nanosecond})};
}

/// Fractional seconds relative to 1970-01-01T00:00:00Z.
inline std::optional<Date> from_seconds_since_1970(double seconds) {
    if(!std::isfinite(seconds)) {
        return std::nullopt;
    }
    if(seconds > double(detail::max_seconds) || seconds < -double(detail::max_seconds)) {
        return std::nullopt;
    }
    return Date{std::chrono::duration_cast<Date::duration>(std::chrono::duration<double>(seconds))};
}

/// Internet date-time: YYYY-MM-DDTHH:MM:SS then Z or a +HH:MM / -HH:MM offset.
inline std::optional<Date> parse_iso8601(std::string_view s) {
    using detail::parse_digits;
    int year, month, day, hour, minute, second;
    if(s.size() < 20) return std::nullopt;
    if(!parse_digits(s, 0, 4, year) || s[4] != '-'
       || !parse_digits(s, 5, 2, month) || s[7] != '-'
       || !parse_digits(s, 8, 2, day) || s[10] != 'T'
       || !parse_digits(s, 11, 2, hour) || s[13] != ':'
       || !parse_digits(s, 14, 2, minute) || s[16] != ':'
       || !parse_digits(s, 17, 2, second)) {
        return std::nullopt;
    }

    int offset_seconds = 0;
    std::string_view zone = s.substr(19);
    if(zone == "Z") {
        offset_seconds = 0;
    } else if(zone.size() == 6 && (zone[0] == '+' || zone[0] == '-') && zone[3] == ':') {
        int oh, om;
        if(!parse_digits(zone, 1, 2, oh) || !parse_digits(zone, 4, 2, om) || oh > 23 || om > 59) {
            return std::nullopt;
        }
        offset_seconds = (oh * 3600 + om * 60) * (zone[0] == '-' ? -1 : 1);
    } else {
        return std::nullopt;
    }

    auto local = from_civil(year, unsigned(month), unsigned(day), hour, minute, second);
    if(!local) {
        return std::nullopt;
    }
    return *local - std::chrono::seconds{offset_seconds};
}

/// Whole string must match the formatter's pattern.
inline std::optional<Date> parse_formatted(std::string_view s, const DateFormatter & formatter) {
    std::tm tm{};
    tm.tm_mday = 1; // patterns without a day field
    std::istringstream in{std::string(s)};
    in.imbue(std::locale::classic());
    in >> std::get_time(&tm, formatter.format.c_str());
    if(in.fail()) {
        return std::nullopt;
    }
    if(in.peek() != std::char_traits<char>::eof()) {
        return std::nullopt;
    }
    return from_civil(tm.tm_year + 1900, unsigned(tm.tm_mon + 1), unsigned(tm.tm_mday),
                      tm.tm_hour, tm.tm_min, tm.tm_sec);
}

} // namespace date_formats

} // namespace ObjectDecoder
