#pragma once

#include "percent.hpp"
#include "../buffer.hpp"

namespace co::form::urlencoded {

namespace detail {

inline int hex_digit(char c) noexcept {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    return -1;
}

inline constexpr char hex_chars[] = "0123456789ABCDEF";

} // namespace detail

inline bool is_form_safe(char c) noexcept {
    return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') ||
           (c >= '0' && c <= '9') || c == '-' || c == '_' ||
           c == '.' || c == '~' || c == '/' || c == '?';
}

inline std::string percent_encode(std::string_view input, bool keep_brackets) {
    std::string out;
    out.reserve(input.size() * 3 / 2);

    for (char c : input) {
        if (is_form_safe(c) || (keep_brackets && (c == '[' || c == ']'))) {
            out += c;
        } else {
            out += '%';
            out += detail::hex_chars[static_cast<unsigned char>(c) >> 4];
            out += detail::hex_chars[static_cast<unsigned char>(c) & 0x0F];
        }
    }
    return out;
}

inline std::string percent_decode(std::string_view input, bool plus_as_space) {
    std::string out;
    out.reserve(input.size());

    for (std::size_t i = 0; i < input.size(); ++i) {
        if (input[i] == '%' && i + 2 < input.size()) {
            int hi = detail::hex_digit(input[i + 1]);
            int lo = detail::hex_digit(input[i + 2]);
            if (hi >= 0 && lo >= 0) {
                out += static_cast<char>((hi << 4) | lo);
                i += 2;
                continue;
            }
        }
        if (plus_as_space && input[i] == '+') {
            out += ' ';
        } else {
            out += input[i];
        }
    }
    return out;
}

inline std::vector<field_pair> split_pairs(std::string_view wire) {
    std::vector<field_pair> out;

    while (!wire.empty()) {
        auto amp = wire.find('&');
        auto pair = amp != std::string_view::npos ? wire.substr(0, amp) : wire;

        if (!pair.empty()) {
            auto eq = pair.find('=');
            if (eq != std::string_view::npos) {
                out.push_back({percent_decode(pair.substr(0, eq)),
                               percent_decode(pair.substr(eq + 1)), false});
            } else {
                out.push_back({{}, percent_decode(pair), true});
            }
        }

        if (amp == std::string_view::npos) break;
        wire.remove_prefix(amp + 1);
    }
    return out;
}

inline std::string join_pairs(const std::vector<field_pair>& pairs, bool keep_brackets) {
    output_buffer buffer;
    for (const auto& pair : pairs) {
        buffer.append_separator('&');
        if (pair.bare) {
            buffer.append(percent_encode(pair.value));
            continue;
        }
        buffer.append(percent_encode(pair.key, keep_brackets));
        buffer.append('=');
        buffer.append(percent_encode(pair.value));
    }
    return buffer.release_string();
}

} // namespace co::form::urlencoded
