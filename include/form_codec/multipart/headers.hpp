#pragma once

#include "../core.hpp"
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace co::form::multipart {

// =============================================================================
// Header Values
// =============================================================================

using header_list = std::vector<std::pair<std::string, std::string>>;

struct content_type {
    std::string mime;       // lower-cased "type/subtype"
    header_list params;     // names lower-cased

    // Empty when absent
    std::string_view param(std::string_view name) const noexcept;
};

struct content_disposition {
    std::string type;                           // lower-cased, e.g. "form-data"
    std::optional<std::string> name;
    std::optional<std::string> filename;
    std::optional<std::string> filename_star;   // RFC 5987, decoded

    // filename* wins over filename
    std::optional<std::string> effective_filename() const;
};

content_type parse_content_type(std::string_view header);
content_disposition parse_content_disposition(std::string_view header);

// Boundary announced by a "multipart/form-data; boundary=..." header.
// Other media types fail with invalid_content_type, a missing or empty
// boundary with malformed_boundary.
result<std::string> boundary_from_content_type(std::string_view header);

// "multipart/form-data; boundary={boundary}"
std::string form_data_content_type(std::string_view boundary);

// Case-insensitive header lookup
const std::string* find_header(const header_list& headers, std::string_view name) noexcept;

// =============================================================================
// Header Sanitizing
// =============================================================================

// Strips CR and LF so a value cannot start a new header line
std::string strip_line_breaks(std::string_view value);

// Backslash-escapes '\' and '"' for a quoted-string parameter
std::string quote_escape(std::string_view value);

} // namespace co::form::multipart

// Include implementation
#include "headers_impl.hpp"
