#pragma once

#include "../config.hpp"
#include "scalar_impl.hpp"
#include <cmath>
#include <cstdint>

namespace co::form {

// =============================================================================
// Date Strategy Implementation
// =============================================================================

inline date_strategy date_strategy::deferred() {
    return date_strategy{};
}

inline date_strategy date_strategy::seconds_since_epoch() {
    date_strategy s;
    s.kind_ = kind::seconds_since_epoch;
    return s;
}

inline date_strategy date_strategy::milliseconds_since_epoch() {
    date_strategy s;
    s.kind_ = kind::milliseconds_since_epoch;
    return s;
}

inline date_strategy date_strategy::iso8601() {
    date_strategy s;
    s.kind_ = kind::iso8601;
    return s;
}

inline date_strategy date_strategy::formatted(std::string pattern) {
    date_strategy s;
    s.kind_ = kind::formatted;
    s.pattern_ = std::move(pattern);
    return s;
}

inline date_strategy date_strategy::custom(format_fn format, parse_fn parse) {
    date_strategy s;
    s.kind_ = kind::custom;
    s.format_ = std::move(format);
    s.parse_ = std::move(parse);
    return s;
}

inline std::string date_strategy::format(time_point tp) const {
    using namespace std::chrono;
    switch (kind_) {
        case kind::deferred:
            return detail::format_number(static_cast<std::int64_t>(tp.time_since_epoch().count()));
        case kind::seconds_since_epoch:
            return detail::format_number(
                static_cast<std::int64_t>(floor<seconds>(tp).time_since_epoch().count()));
        case kind::milliseconds_since_epoch:
            return detail::format_number(
                static_cast<std::int64_t>(floor<milliseconds>(tp).time_since_epoch().count()));
        case kind::iso8601:
            return detail::format_iso8601(tp);
        case kind::formatted:
            return detail::format_pattern(tp, pattern_);
        case kind::custom:
            return format_ ? format_(tp) : std::string{};
    }
    return {};
}

inline std::optional<time_point> date_strategy::parse(std::string_view text) const {
    using namespace std::chrono;
    switch (kind_) {
        case kind::deferred: {
            auto ticks = detail::parse_number<std::int64_t>(text);
            if (!ticks) return std::nullopt;
            return time_point{system_clock::duration{*ticks}};
        }
        case kind::seconds_since_epoch:
        case kind::milliseconds_since_epoch: {
            bool millis = kind_ == kind::milliseconds_since_epoch;
            std::optional<system_clock::duration> ticks;
            if (auto whole = detail::parse_number<std::int64_t>(text)) {
                ticks = millis ? detail::to_clock_duration(milliseconds{*whole})
                               : detail::to_clock_duration(seconds{*whole});
            } else if (auto value = detail::parse_number<double>(text)) {
                ticks = millis ? detail::to_clock_duration(duration<double, std::milli>{*value})
                               : detail::to_clock_duration(duration<double>{*value});
            }
            if (!ticks) return std::nullopt;
            return time_point{*ticks};
        }
        case kind::iso8601:
            return detail::parse_iso8601(text);
        case kind::formatted:
            return detail::parse_pattern(text, pattern_);
        case kind::custom:
            if (!parse_) return std::nullopt;
            return parse_(text);
    }
    return std::nullopt;
}

// =============================================================================
// Data Strategy Implementation
// =============================================================================

inline data_strategy data_strategy::deferred() {
    return data_strategy{};
}

inline data_strategy data_strategy::base64() {
    data_strategy s;
    s.kind_ = kind::base64;
    return s;
}

inline data_strategy data_strategy::custom(format_fn format, parse_fn parse) {
    data_strategy s;
    s.kind_ = kind::custom;
    s.format_ = std::move(format);
    s.parse_ = std::move(parse);
    return s;
}

inline std::string data_strategy::format(const bytes& data) const {
    switch (kind_) {
        case kind::base64:
            return detail::base64_encode(std::string_view(
                reinterpret_cast<const char*>(data.data()), data.size()));
        case kind::custom:
            return format_ ? format_(data) : std::string{};
        case kind::deferred:
            break;
    }
    return {};
}

inline std::optional<bytes> data_strategy::parse(std::string_view text) const {
    switch (kind_) {
        case kind::base64: {
            auto decoded = detail::base64_decode(text);
            if (!decoded) return std::nullopt;
            return bytes(decoded->begin(), decoded->end());
        }
        case kind::custom:
            if (!parse_) return std::nullopt;
            return parse_(text);
        case kind::deferred:
            break;
    }
    return std::nullopt;
}

// =============================================================================
// Codec Configuration Implementation
// =============================================================================

inline codec_config codec_config::with_nesting(nesting_strategy n) const {
    codec_config c = *this;
    c.nesting = n;
    return c;
}

inline codec_config codec_config::with_dates(date_strategy d) const {
    codec_config c = *this;
    c.dates = std::move(d);
    return c;
}

inline codec_config codec_config::with_data(data_strategy d) const {
    codec_config c = *this;
    c.data = std::move(d);
    return c;
}

inline codec_config codec_config::with_ordering(key_ordering o) const {
    codec_config c = *this;
    c.ordering = o;
    return c;
}

inline std::string to_string(nesting_strategy strategy) {
    switch (strategy) {
        case nesting_strategy::accumulate: return "accumulate";
        case nesting_strategy::brackets: return "brackets";
        case nesting_strategy::indexed_brackets: return "indexed_brackets";
    }
    return "unknown";
}

} // namespace co::form
