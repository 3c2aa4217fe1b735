#pragma once

#include "../core.hpp"
#include "headers.hpp"
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace co::form::multipart {

// =============================================================================
// Multipart Parser (multipart/form-data body -> parts)
// =============================================================================

struct parsed_part {
    std::string name;
    std::optional<std::string> filename;
    std::optional<std::string> content_type;
    std::string payload;
    header_list headers;

    bool is_file() const noexcept { return filename.has_value(); }
};

// Preamble and epilogue are discarded. Fails with malformed_boundary when
// the opening or closing delimiter is missing, and with invalid_format when
// a part has no "Content-Disposition: form-data" header with a name.
// Content-Transfer-Encoding is not decoded.
result<std::vector<parsed_part>> parse(std::string_view body, std::string_view boundary);

// Header block of one part: "Key: Value" lines, folded continuations joined
result<header_list> parse_part_headers(std::string_view block);

} // namespace co::form::multipart

// Include implementation
#include "parser_impl.hpp"
