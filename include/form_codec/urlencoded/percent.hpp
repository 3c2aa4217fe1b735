#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace co::form::urlencoded {

// =============================================================================
// Percent Coding
// =============================================================================

// One key/value pair in decoded form. A bare pair (no '=' on the wire) carries
// a root scalar in value and an empty key.
struct field_pair {
    std::string key;
    std::string value;
    bool bare = false;

    bool operator==(const field_pair&) const = default;
};

// Unreserved characters plus '/' and '?'; everything else becomes %XX.
bool is_form_safe(char c) noexcept;

// Structural brackets in keys stay literal when keep_brackets is set.
std::string percent_encode(std::string_view input, bool keep_brackets = false);

// Single left-to-right pass: '+' becomes a space, %XX becomes the byte, so
// "%2B" yields '+'. Malformed escapes are kept verbatim.
std::string percent_decode(std::string_view input, bool plus_as_space = true);

// Splits on '&' (empty pairs skipped) and on the first '=' of each pair,
// decoding keys and values.
std::vector<field_pair> split_pairs(std::string_view wire);

// Joins pairs with '&'; brackets in keys stay literal when keep_brackets is set.
std::string join_pairs(const std::vector<field_pair>& pairs, bool keep_brackets = false);

} // namespace co::form::urlencoded

// Include implementation
#include "percent_impl.hpp"
