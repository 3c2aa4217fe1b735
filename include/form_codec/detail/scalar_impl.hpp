#pragma once

#include "../core.hpp"
#include <array>
#include <charconv>
#include <chrono>
#include <cmath>
#include <cstdio>
#include <ctime>
#include <iomanip>
#include <locale>
#include <optional>
#include <ratio>
#include <sstream>
#include <string>
#include <string_view>
#include <system_error>
#include <type_traits>

namespace co::form::detail {

// =============================================================================
// Numbers
// =============================================================================

template<typename T>
    requires std::is_arithmetic_v<T>
inline std::string format_number(T value) {
    char buf[128];
    auto [ptr, ec] = std::to_chars(buf, buf + sizeof(buf), value);
    if (ec != std::errc{}) {
        return {};
    }
    return std::string(buf, ptr);
}

// Whole-string parse; rejects partial matches and out-of-range values
template<typename T>
    requires std::is_arithmetic_v<T>
inline std::optional<T> parse_number(std::string_view text) noexcept {
    if (text.empty()) {
        return std::nullopt;
    }
    T value{};
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || ptr != text.data() + text.size()) {
        return std::nullopt;
    }
    return value;
}

inline char ascii_lower(char c) noexcept {
    return (c >= 'A' && c <= 'Z') ? static_cast<char>(c + 32) : c;
}

inline bool iequals(std::string_view a, std::string_view b) noexcept {
    if (a.size() != b.size()) return false;
    for (size_t i = 0; i < a.size(); ++i) {
        if (ascii_lower(a[i]) != ascii_lower(b[i])) return false;
    }
    return true;
}

inline std::optional<bool> parse_bool(std::string_view text) noexcept {
    if (iequals(text, "true") || text == "1" || iequals(text, "on")) return true;
    if (iequals(text, "false") || text == "0" || iequals(text, "off")) return false;
    return std::nullopt;
}

// =============================================================================
// Dates
// =============================================================================

inline std::tm to_utc_tm(std::chrono::system_clock::time_point tp) {
    using namespace std::chrono;
    auto dp = floor<days>(tp);
    year_month_day ymd{dp};
    hh_mm_ss hms{floor<seconds>(tp - dp)};

    std::tm tm{};
    tm.tm_year = static_cast<int>(ymd.year()) - 1900;
    tm.tm_mon = static_cast<int>(static_cast<unsigned>(ymd.month())) - 1;
    tm.tm_mday = static_cast<int>(static_cast<unsigned>(ymd.day()));
    tm.tm_hour = static_cast<int>(hms.hours().count());
    tm.tm_min = static_cast<int>(hms.minutes().count());
    tm.tm_sec = static_cast<int>(hms.seconds().count());
    tm.tm_wday = static_cast<int>(weekday{dp}.c_encoding());
    tm.tm_yday = static_cast<int>((dp - sys_days{ymd.year() / January / 1}).count());
    return tm;
}

// Converts to the clock's tick type, or nullopt when the value falls outside
// the clock's range (about 1677 to 2262 with nanosecond ticks)
template<typename Rep, typename Period>
std::optional<std::chrono::system_clock::duration> to_clock_duration(
    std::chrono::duration<Rep, Period> d) noexcept {
    using namespace std::chrono;
    using target = system_clock::duration;

    if constexpr (std::is_floating_point_v<Rep>) {
        if (!std::isfinite(d.count())) return std::nullopt;
        duration<long double, target::period> wide = d;
        const auto limit = static_cast<long double>(target::max().count());
        if (!(wide.count() < limit) || !(wide.count() > -limit)) return std::nullopt;
        return round<target>(wide);
    } else {
        using conv = std::ratio_divide<Period, target::period>;
        static_assert(conv::num == 1 || conv::den == 1, "unsupported duration ratio");
        if constexpr (conv::den == 1) {
            constexpr auto limit = target::max().count() / conv::num;
            if (d.count() > limit || d.count() < -limit) return std::nullopt;
        }
        return duration_cast<target>(d);
    }
}

inline std::optional<std::chrono::sys_seconds> utc_fields_to_seconds(
    int y, int mon, int d, int h, int min, int s) noexcept {
    using namespace std::chrono;
    if (mon < 1 || mon > 12 || d < 1 || d > 31) return std::nullopt;
    if (h < 0 || h > 23 || min < 0 || min > 59 || s < 0 || s > 60) return std::nullopt;

    year_month_day ymd{year{y}, month{static_cast<unsigned>(mon)}, day{static_cast<unsigned>(d)}};
    if (!ymd.ok()) return std::nullopt;

    return sys_seconds{sys_days{ymd}} + hours{h} + minutes{min} + seconds{s};
}

inline std::optional<std::chrono::system_clock::time_point> from_utc_fields(
    int y, int mon, int d, int h, int min, int s) noexcept {
    auto secs = utc_fields_to_seconds(y, mon, d, h, min, s);
    if (!secs) return std::nullopt;
    auto ticks = to_clock_duration(secs->time_since_epoch());
    if (!ticks) return std::nullopt;
    return std::chrono::system_clock::time_point{*ticks};
}

// yyyy-MM-ddTHH:mm:ss.SSS+00:00
inline std::string format_iso8601(std::chrono::system_clock::time_point tp) {
    using namespace std::chrono;
    auto ms_tp = floor<milliseconds>(tp);
    auto dp = floor<days>(ms_tp);
    year_month_day ymd{dp};
    hh_mm_ss hms{ms_tp - dp};

    char buf[64];
    std::snprintf(buf, sizeof(buf), "%04d-%02u-%02uT%02d:%02d:%02d.%03d+00:00",
        static_cast<int>(ymd.year()),
        static_cast<unsigned>(ymd.month()),
        static_cast<unsigned>(ymd.day()),
        static_cast<int>(hms.hours().count()),
        static_cast<int>(hms.minutes().count()),
        static_cast<int>(hms.seconds().count()),
        static_cast<int>(hms.subseconds().count()));
    return buf;
}

// Accepts any fraction length and Z, +HH:MM, -HH:MM, +HHMM or no zone (UTC)
inline std::optional<std::chrono::system_clock::time_point> parse_iso8601(std::string_view text) noexcept {
    using namespace std::chrono;
    size_t pos = 0;

    auto digits = [&](size_t count) -> std::optional<int> {
        if (pos + count > text.size()) return std::nullopt;
        int value = 0;
        for (size_t i = 0; i < count; ++i) {
            char c = text[pos + i];
            if (c < '0' || c > '9') return std::nullopt;
            value = value * 10 + (c - '0');
        }
        pos += count;
        return value;
    };
    auto expect = [&](char c) -> bool {
        if (pos < text.size() && text[pos] == c) {
            ++pos;
            return true;
        }
        return false;
    };

    auto y = digits(4);
    if (!y || !expect('-')) return std::nullopt;
    auto mon = digits(2);
    if (!mon || !expect('-')) return std::nullopt;
    auto d = digits(2);
    if (!d) return std::nullopt;
    if (!(expect('T') || expect('t') || expect(' '))) return std::nullopt;
    auto h = digits(2);
    if (!h || !expect(':')) return std::nullopt;
    auto min = digits(2);
    if (!min || !expect(':')) return std::nullopt;
    auto s = digits(2);
    if (!s) return std::nullopt;

    auto base = utc_fields_to_seconds(*y, *mon, *d, *h, *min, *s);
    if (!base) return std::nullopt;

    milliseconds fraction{0};
    if (expect('.')) {
        int scale = 100;
        size_t start = pos;
        while (pos < text.size() && text[pos] >= '0' && text[pos] <= '9') {
            fraction += milliseconds{(text[pos] - '0') * scale};
            scale /= 10;
            ++pos;
        }
        if (pos == start) return std::nullopt;
    }

    minutes offset{0};
    if (pos < text.size()) {
        if (expect('Z') || expect('z')) {
            // UTC
        } else if (text[pos] == '+' || text[pos] == '-') {
            int sign = text[pos] == '-' ? -1 : 1;
            ++pos;
            auto oh = digits(2);
            if (!oh) return std::nullopt;
            expect(':');
            auto om = digits(2);
            if (!om || *oh > 23 || *om > 59) return std::nullopt;
            offset = minutes{sign * (*oh * 60 + *om)};
        } else {
            return std::nullopt;
        }
    }
    if (pos != text.size()) return std::nullopt;

    auto ticks = to_clock_duration((*base + fraction - offset).time_since_epoch());
    if (!ticks) return std::nullopt;
    return system_clock::time_point{*ticks};
}

inline std::string format_pattern(std::chrono::system_clock::time_point tp, const std::string& pattern) {
    std::tm tm = to_utc_tm(tp);
    std::ostringstream oss;
    oss.imbue(std::locale::classic());
    oss << std::put_time(&tm, pattern.c_str());
    return oss.str();
}

inline std::optional<std::chrono::system_clock::time_point> parse_pattern(
    std::string_view text, const std::string& pattern) {
    std::tm tm{};
    tm.tm_mday = 1;

    std::istringstream iss{std::string(text)};
    iss.imbue(std::locale::classic());
    iss >> std::get_time(&tm, pattern.c_str());
    if (iss.fail()) {
        return std::nullopt;
    }
    // Trailing input the pattern did not consume is a mismatch
    if (iss.peek() != std::char_traits<char>::eof()) {
        return std::nullopt;
    }

    return from_utc_fields(tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday,
                           tm.tm_hour, tm.tm_min, tm.tm_sec);
}

// =============================================================================
// Base64 (RFC 4648, padded)
// =============================================================================

inline constexpr char b64_chars[] =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

inline constexpr std::array<std::int8_t, 256> b64_table = [] {
    std::array<std::int8_t, 256> table{};
    for (auto& v : table) v = -1;
    for (int i = 0; i < 64; ++i) {
        table[static_cast<unsigned char>(b64_chars[i])] = static_cast<std::int8_t>(i);
    }
    return table;
}();

inline std::string base64_encode(std::string_view input) {
    std::string out;
    out.reserve((input.size() + 2) / 3 * 4);

    size_t i = 0;
    for (; i + 2 < input.size(); i += 3) {
        std::uint32_t n = (static_cast<std::uint8_t>(input[i]) << 16) |
                          (static_cast<std::uint8_t>(input[i + 1]) << 8) |
                          static_cast<std::uint8_t>(input[i + 2]);
        out += b64_chars[(n >> 18) & 0x3F];
        out += b64_chars[(n >> 12) & 0x3F];
        out += b64_chars[(n >> 6) & 0x3F];
        out += b64_chars[n & 0x3F];
    }

    size_t rest = input.size() - i;
    if (rest == 1) {
        std::uint32_t n = static_cast<std::uint8_t>(input[i]) << 16;
        out += b64_chars[(n >> 18) & 0x3F];
        out += b64_chars[(n >> 12) & 0x3F];
        out += "==";
    } else if (rest == 2) {
        std::uint32_t n = (static_cast<std::uint8_t>(input[i]) << 16) |
                          (static_cast<std::uint8_t>(input[i + 1]) << 8);
        out += b64_chars[(n >> 18) & 0x3F];
        out += b64_chars[(n >> 12) & 0x3F];
        out += b64_chars[(n >> 6) & 0x3F];
        out += '=';
    }
    return out;
}

inline std::optional<std::string> base64_decode(std::string_view input) {
    size_t padding = 0;
    while (!input.empty() && input.back() == '=' && padding < 2) {
        input.remove_suffix(1);
        ++padding;
    }
    if (input.size() % 4 == 1) {
        return std::nullopt;
    }

    std::string out;
    out.reserve(input.size() * 3 / 4);

    std::uint32_t accum = 0;
    int bits = 0;
    for (char c : input) {
        auto val = b64_table[static_cast<unsigned char>(c)];
        if (val < 0) {
            return std::nullopt;
        }
        accum = (accum << 6) | static_cast<std::uint32_t>(val);
        bits += 6;
        if (bits >= 8) {
            bits -= 8;
            out += static_cast<char>((accum >> bits) & 0xFF);
        }
    }
    return out;
}

// =============================================================================
// UTF-8
// =============================================================================

inline bool is_valid_utf8(std::string_view text) noexcept {
    size_t i = 0;
    while (i < text.size()) {
        auto c = static_cast<unsigned char>(text[i]);
        size_t len = 0;
        std::uint32_t cp = 0;

        if (c < 0x80) { ++i; continue; }
        else if ((c & 0xE0) == 0xC0) { len = 2; cp = c & 0x1F; }
        else if ((c & 0xF0) == 0xE0) { len = 3; cp = c & 0x0F; }
        else if ((c & 0xF8) == 0xF0) { len = 4; cp = c & 0x07; }
        else return false;

        if (i + len > text.size()) return false;
        for (size_t k = 1; k < len; ++k) {
            auto cc = static_cast<unsigned char>(text[i + k]);
            if ((cc & 0xC0) != 0x80) return false;
            cp = (cp << 6) | (cc & 0x3F);
        }

        // Overlong forms, surrogates, out of range
        if ((len == 2 && cp < 0x80) || (len == 3 && cp < 0x800) || (len == 4 && cp < 0x10000)) return false;
        if (cp >= 0xD800 && cp <= 0xDFFF) return false;
        if (cp > 0x10FFFF) return false;

        i += len;
    }
    return true;
}

} // namespace co::form::detail
