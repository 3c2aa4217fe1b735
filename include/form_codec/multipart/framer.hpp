#pragma once

#include "../config.hpp"
#include "../core.hpp"
#include "../file_type.hpp"
#include "../node.hpp"
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace co::form::multipart {

// =============================================================================
// Multipart Framer (parts -> multipart/form-data body)
// =============================================================================

struct part {
    std::string name;
    std::optional<std::string> filename;
    std::optional<std::string> content_type;
    std::string payload;

    // Checked before framing when set
    std::optional<upload_rule> rule;

    static part field(std::string name, std::string value);
    static part file(std::string name, std::string filename, std::string content_type, std::string payload);
};

// Each part: delimiter, Content-Disposition, optional Content-Type, blank
// line, payload, CRLF. Then the close delimiter. Names and filenames lose
// CR/LF and have '\' and '"' escaped. Non-file payloads must be UTF-8.
result<std::string> frame(const std::vector<part>& parts, std::string_view boundary);

// Text parts for every leaf of a mapping tree. Values pass through the
// URL-encoded serializer and back, so each part carries the decoded text
// under the wire key the configured nesting produces.
result<std::vector<part>> fields_from_tree(const node& tree, const codec_config& config = {});

} // namespace co::form::multipart

// Include implementation
#include "framer_impl.hpp"
