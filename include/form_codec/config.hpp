#pragma once

#include "core.hpp"
#include <chrono>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace co::form {

// =============================================================================
// Nesting and Ordering
// =============================================================================

enum class nesting_strategy {
    accumulate,        // tags=a&tags=b
    brackets,          // user[name]=John
    indexed_brackets   // items[0]=apple&items[1]=banana
};

enum class key_ordering {
    sorted,     // byte-wise key order at every mapping level
    insertion   // record declaration / first-seen order
};

// =============================================================================
// Scalar Strategies
// =============================================================================

using time_point = std::chrono::system_clock::time_point;

class date_strategy {
public:
    enum class kind {
        deferred,                   // time_point tick count
        seconds_since_epoch,
        milliseconds_since_epoch,
        iso8601,                    // yyyy-MM-ddTHH:mm:ss.SSS+00:00
        formatted,                  // strftime pattern, UTC
        custom
    };

    using format_fn = std::function<std::string(time_point)>;
    using parse_fn = std::function<std::optional<time_point>(std::string_view)>;

    static date_strategy deferred();
    static date_strategy seconds_since_epoch();
    static date_strategy milliseconds_since_epoch();
    static date_strategy iso8601();
    static date_strategy formatted(std::string pattern);
    static date_strategy custom(format_fn format, parse_fn parse = {});

    kind type() const noexcept { return kind_; }
    const std::string& pattern() const noexcept { return pattern_; }

    std::string format(time_point tp) const;
    std::optional<time_point> parse(std::string_view text) const;

private:
    kind kind_ = kind::deferred;
    std::string pattern_;
    format_fn format_;
    parse_fn parse_;
};

class data_strategy {
public:
    enum class kind {
        deferred,   // sequence of byte values
        base64,
        custom
    };

    using format_fn = std::function<std::string(const bytes&)>;
    using parse_fn = std::function<std::optional<bytes>(std::string_view)>;

    static data_strategy deferred();
    static data_strategy base64();
    static data_strategy custom(format_fn format, parse_fn parse = {});

    kind type() const noexcept { return kind_; }

    // Only meaningful for base64 and custom
    std::string format(const bytes& data) const;
    std::optional<bytes> parse(std::string_view text) const;

private:
    kind kind_ = kind::deferred;
    format_fn format_;
    parse_fn parse_;
};

// =============================================================================
// Codec Configuration
// =============================================================================

// Fixed before first use; passed by value into every encode/decode call.
struct codec_config {
    nesting_strategy nesting = nesting_strategy::accumulate;
    date_strategy dates = date_strategy::deferred();
    data_strategy data = data_strategy::deferred();
    key_ordering ordering = key_ordering::sorted;

    codec_config with_nesting(nesting_strategy n) const;
    codec_config with_dates(date_strategy d) const;
    codec_config with_data(data_strategy d) const;
    codec_config with_ordering(key_ordering o) const;
};

std::string to_string(nesting_strategy strategy);

} // namespace co::form

// Include implementation
#include "detail/config_impl.hpp"
