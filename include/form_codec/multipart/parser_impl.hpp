#pragma once

#include "parser.hpp"
#include "boundary.hpp"
#include "../log.hpp"
#include <algorithm>

namespace co::form::multipart {

namespace detail {

// Splits a part into its header block and payload at the first blank line
inline result<std::pair<std::string_view, std::string_view>> split_part(std::string_view part_data) {
    // No headers at all
    if (part_data.starts_with("\r\n")) {
        return std::pair{std::string_view{}, part_data.substr(2)};
    }
    if (part_data.starts_with("\n")) {
        return std::pair{std::string_view{}, part_data.substr(1)};
    }

    auto end = part_data.find("\r\n\r\n");
    if (end != std::string_view::npos) {
        return std::pair{part_data.substr(0, end), part_data.substr(end + 4)};
    }
    end = part_data.find("\n\n");
    if (end != std::string_view::npos) {
        return std::pair{part_data.substr(0, end), part_data.substr(end + 2)};
    }
    return std::unexpected(invalid_format("part has no blank line after its headers"));
}

inline result<parsed_part> parse_part(std::string_view part_data, std::size_t index) {
    auto split = split_part(part_data);
    if (!split) {
        return std::unexpected(std::move(split.error()));
    }
    auto [header_block, payload] = *split;

    auto headers = parse_part_headers(header_block);
    if (!headers) {
        return std::unexpected(std::move(headers.error()));
    }

    const std::string* disposition_header = find_header(*headers, "Content-Disposition");
    if (disposition_header == nullptr) {
        return std::unexpected(invalid_format("part has no Content-Disposition header", path{index}));
    }
    auto disposition = parse_content_disposition(*disposition_header);
    if (disposition.type != "form-data") {
        return std::unexpected(invalid_format("Content-Disposition is not form-data", path{index}));
    }
    if (!disposition.name) {
        return std::unexpected(invalid_format("Content-Disposition has no name", path{index}));
    }

    parsed_part out;
    out.name = std::move(*disposition.name);
    out.filename = disposition.effective_filename();
    if (const std::string* type = find_header(*headers, "Content-Type")) {
        out.content_type = *type;
    }
    out.payload = std::string(payload);
    out.headers = std::move(*headers);
    return out;
}

// A boundary match only delimits when followed by "--", by optional padding
// and a line break, or by the end of the body
inline bool ends_delimiter(std::string_view body, std::size_t after) noexcept {
    auto rest = body.substr(std::min(after, body.size()));
    if (rest.empty() || rest.starts_with("--")) {
        return true;
    }
    auto text = rest.find_first_not_of(" \t");
    if (text == std::string_view::npos) {
        return true;
    }
    rest.remove_prefix(text);
    return rest.starts_with("\r\n") || rest.starts_with("\n");
}

inline std::size_t find_delimiter(std::string_view body, std::string_view delimiter, std::size_t from) noexcept {
    auto found = body.find(delimiter, from);
    while (found != std::string_view::npos && !ends_delimiter(body, found + delimiter.size())) {
        found = body.find(delimiter, found + 1);
    }
    return found;
}

} // namespace detail

inline result<header_list> parse_part_headers(std::string_view block) {
    header_list headers;
    std::string current_key;
    std::string current_value;

    auto flush = [&]() {
        if (!current_key.empty()) {
            headers.emplace_back(std::move(current_key), std::move(current_value));
            current_key.clear();
            current_value.clear();
        }
    };

    while (!block.empty()) {
        std::size_t eol = std::string_view::npos;
        bool crlf = false;
        for (std::size_t i = 0; i < block.size(); ++i) {
            if (block[i] == '\r' && i + 1 < block.size() && block[i + 1] == '\n') {
                eol = i;
                crlf = true;
                break;
            }
            if (block[i] == '\n') {
                eol = i;
                break;
            }
        }

        std::string_view line;
        if (eol == std::string_view::npos) {
            line = block;
            block = {};
        } else {
            line = block.substr(0, eol);
            block.remove_prefix(eol + (crlf ? 2 : 1));
        }

        if (line.empty()) continue;

        // Folded continuation
        if (line.front() == ' ' || line.front() == '\t') {
            if (current_key.empty()) {
                return std::unexpected(invalid_format("continuation line before any header"));
            }
            current_value += ' ';
            current_value += detail::trim_ows(line);
            continue;
        }

        flush();

        auto colon = line.find(':');
        if (colon == std::string_view::npos) {
            return std::unexpected(invalid_format("header line without ':'"));
        }
        current_key = std::string(detail::trim_ows(line.substr(0, colon)));
        current_value = std::string(detail::trim_ows(line.substr(colon + 1)));
        if (current_key.empty()) {
            return std::unexpected(invalid_format("header line with an empty name"));
        }
    }

    flush();
    return headers;
}

inline result<std::vector<parsed_part>> parse(std::string_view body, std::string_view boundary) {
    auto boundary_ok = check_boundary(boundary);
    if (!boundary_ok) {
        return std::unexpected(std::move(boundary_ok.error()));
    }

    const std::string delimiter = "--" + std::string(boundary);
    const std::string next_delimiter = "\r\n" + delimiter;

    auto first = detail::find_delimiter(body, delimiter, 0);
    if (first == std::string_view::npos) {
        logger()->debug("multipart parse rejected: no opening delimiter");
        return std::unexpected(malformed_boundary("no opening delimiter"));
    }

    std::vector<parsed_part> parts;
    std::size_t pos = first + delimiter.size();

    while (true) {
        auto rest = body.substr(pos);

        // Close delimiter; the epilogue is discarded
        if (rest.starts_with("--")) {
            break;
        }

        // Transport padding, then the line break ending the delimiter
        while (pos < body.size() && (body[pos] == ' ' || body[pos] == '\t')) {
            ++pos;
        }
        if (body.substr(pos).starts_with("\r\n")) {
            pos += 2;
        } else if (body.substr(pos).starts_with("\n")) {
            pos += 1;
        } else {
            logger()->debug("multipart parse rejected: delimiter not followed by a line break");
            return std::unexpected(malformed_boundary(pos >= body.size()
                ? "missing closing delimiter"
                : "delimiter not followed by a line break"));
        }

        auto next = detail::find_delimiter(body, next_delimiter, pos);
        if (next == std::string_view::npos) {
            logger()->debug("multipart parse rejected: missing closing delimiter");
            return std::unexpected(malformed_boundary("missing closing delimiter"));
        }

        auto parsed = detail::parse_part(body.substr(pos, next - pos), parts.size());
        if (!parsed) {
            logger()->debug("multipart parse rejected: {}", describe(parsed.error()));
            return std::unexpected(std::move(parsed.error()));
        }
        parts.push_back(std::move(*parsed));

        pos = next + next_delimiter.size();
    }

    logger()->trace("multipart parse: {} parts", parts.size());
    return parts;
}

} // namespace co::form::multipart
