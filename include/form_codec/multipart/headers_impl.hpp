#pragma once

#include "headers.hpp"
#include "../detail/scalar_impl.hpp"
#include "../urlencoded/percent.hpp"

namespace co::form::multipart {

namespace detail {

// Skips optional whitespace (SP / HTAB)
inline std::string_view skip_ows(std::string_view s) noexcept {
    while (!s.empty() && (s.front() == ' ' || s.front() == '\t')) {
        s.remove_prefix(1);
    }
    return s;
}

inline std::string_view trim_ows(std::string_view s) noexcept {
    s = skip_ows(s);
    while (!s.empty() && (s.back() == ' ' || s.back() == '\t')) {
        s.remove_suffix(1);
    }
    return s;
}

// Quoted string with \" and \\ escapes; returns the value and the rest
inline std::pair<std::string, std::string_view> parse_quoted_string(std::string_view s) {
    if (s.empty() || s.front() != '"') {
        return {{}, s};
    }
    s.remove_prefix(1);

    std::string value;
    while (!s.empty()) {
        if (s.front() == '"') {
            s.remove_prefix(1);
            return {value, s};
        }
        if (s.front() == '\\' && s.size() > 1) {
            value += s[1];
            s.remove_prefix(2);
        } else {
            value += s.front();
            s.remove_prefix(1);
        }
    }
    return {value, s};  // unterminated, best effort
}

// RFC 7230 token
inline std::pair<std::string, std::string_view> parse_token(std::string_view s) {
    std::size_t i = 0;
    while (i < s.size()) {
        char c = s[i];
        if ((c >= '!' && c <= '~') && c != '"' && c != '(' && c != ')' &&
            c != ',' && c != '/' && c != ':' && c != ';' && c != '<' &&
            c != '=' && c != '>' && c != '?' && c != '@' && c != '[' &&
            c != ']' && c != '{' && c != '}' && c != '\\') {
            ++i;
        } else {
            break;
        }
    }
    return {std::string(s.substr(0, i)), s.substr(i)};
}

inline std::string to_lower(std::string s) {
    for (auto& c : s) {
        c = form::detail::ascii_lower(c);
    }
    return s;
}

// RFC 5987 ext-value: charset'language'percent-encoded
inline std::string decode_ext_value(std::string_view input) {
    auto tick1 = input.find('\'');
    if (tick1 == std::string_view::npos) return std::string(input);
    auto tick2 = input.find('\'', tick1 + 1);
    if (tick2 == std::string_view::npos) return std::string(input);
    return urlencoded::percent_decode(input.substr(tick2 + 1), false);
}

} // namespace detail

// =============================================================================
// Content-Type
// =============================================================================

inline std::string_view content_type::param(std::string_view name) const noexcept {
    for (const auto& [key, value] : params) {
        if (form::detail::iequals(key, name)) {
            return value;
        }
    }
    return {};
}

inline content_type parse_content_type(std::string_view header) {
    content_type ct;
    header = detail::skip_ows(header);

    auto [type_part, rest] = detail::parse_token(header);
    if (!rest.empty() && rest.front() == '/') {
        rest.remove_prefix(1);
        auto [sub, rest2] = detail::parse_token(rest);
        ct.mime = detail::to_lower(type_part) + "/" + detail::to_lower(sub);
        rest = rest2;
    } else {
        ct.mime = detail::to_lower(type_part);
    }

    while (!rest.empty()) {
        rest = detail::skip_ows(rest);
        if (rest.empty() || rest.front() != ';') break;
        rest.remove_prefix(1);
        rest = detail::skip_ows(rest);

        auto [pname, rest2] = detail::parse_token(rest);
        rest = rest2;
        if (pname.empty()) break;

        if (rest.empty() || rest.front() != '=') {
            ct.params.emplace_back(detail::to_lower(pname), std::string{});
            continue;
        }
        rest.remove_prefix(1);

        std::string pval;
        if (!rest.empty() && rest.front() == '"') {
            auto [qval, rest3] = detail::parse_quoted_string(rest);
            pval = std::move(qval);
            rest = rest3;
        } else {
            auto [tval, rest3] = detail::parse_token(rest);
            pval = std::move(tval);
            rest = rest3;
        }
        ct.params.emplace_back(detail::to_lower(pname), std::move(pval));
    }
    return ct;
}

inline result<std::string> boundary_from_content_type(std::string_view header) {
    auto ct = parse_content_type(header);
    if (ct.mime != "multipart/form-data") {
        return std::unexpected(invalid_content_type(ct.mime));
    }
    auto boundary = ct.param("boundary");
    if (boundary.empty()) {
        return std::unexpected(malformed_boundary("content type has no boundary parameter"));
    }
    return std::string(boundary);
}

inline std::string form_data_content_type(std::string_view boundary) {
    std::string out = "multipart/form-data; boundary=";
    out += boundary;
    return out;
}

// =============================================================================
// Content-Disposition
// =============================================================================

inline std::optional<std::string> content_disposition::effective_filename() const {
    if (filename_star) return filename_star;
    return filename;
}

inline content_disposition parse_content_disposition(std::string_view header) {
    content_disposition cd;
    header = detail::skip_ows(header);

    auto [dtype, rest] = detail::parse_token(header);
    cd.type = detail::to_lower(dtype);

    while (!rest.empty()) {
        rest = detail::skip_ows(rest);
        if (rest.empty() || rest.front() != ';') break;
        rest.remove_prefix(1);
        rest = detail::skip_ows(rest);

        auto [pname, rest2] = detail::parse_token(rest);
        rest = rest2;
        if (pname.empty()) break;

        auto pname_lower = detail::to_lower(pname);
        if (rest.empty() || rest.front() != '=') continue;
        rest.remove_prefix(1);

        // ext-value is unquoted and runs to ';' or the end
        if (pname_lower == "filename*") {
            auto end = rest.find(';');
            auto raw = detail::trim_ows(end != std::string_view::npos ? rest.substr(0, end) : rest);
            cd.filename_star = detail::decode_ext_value(raw);
            rest = end != std::string_view::npos ? rest.substr(end) : std::string_view{};
            continue;
        }

        std::string pval;
        if (!rest.empty() && rest.front() == '"') {
            auto [qval, rest3] = detail::parse_quoted_string(rest);
            pval = std::move(qval);
            rest = rest3;
        } else {
            auto [tval, rest3] = detail::parse_token(rest);
            pval = std::move(tval);
            rest = rest3;
        }

        if (pname_lower == "name") {
            cd.name = std::move(pval);
        } else if (pname_lower == "filename") {
            cd.filename = std::move(pval);
        }
    }
    return cd;
}

inline const std::string* find_header(const header_list& headers, std::string_view name) noexcept {
    for (const auto& [key, value] : headers) {
        if (form::detail::iequals(key, name)) {
            return &value;
        }
    }
    return nullptr;
}

// =============================================================================
// Sanitizing
// =============================================================================

inline std::string strip_line_breaks(std::string_view value) {
    std::string out;
    out.reserve(value.size());
    for (char c : value) {
        if (c != '\r' && c != '\n') {
            out += c;
        }
    }
    return out;
}

inline std::string quote_escape(std::string_view value) {
    std::string out;
    out.reserve(value.size() + 2);
    for (char c : value) {
        if (c == '\\' || c == '"') {
            out += '\\';
        }
        out += c;
    }
    return out;
}

} // namespace co::form::multipart
