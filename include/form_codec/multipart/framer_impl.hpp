#pragma once

#include "framer.hpp"
#include "boundary.hpp"
#include "headers.hpp"
#include "../buffer.hpp"
#include "../content_types.hpp"
#include "../detail/scalar_impl.hpp"
#include "../log.hpp"
#include "../urlencoded/serializer.hpp"

namespace co::form::multipart {

// =============================================================================
// Part Construction
// =============================================================================

inline part part::field(std::string name, std::string value) {
    part p;
    p.name = std::move(name);
    p.payload = std::move(value);
    return p;
}

inline part part::file(std::string name, std::string filename, std::string content_type, std::string payload) {
    part p;
    p.name = std::move(name);
    p.filename = std::move(filename);
    p.content_type = std::move(content_type);
    p.payload = std::move(payload);
    return p;
}

// =============================================================================
// Framing
// =============================================================================

inline result<std::string> frame(const std::vector<part>& parts, std::string_view boundary) {
    auto boundary_ok = check_boundary(boundary);
    if (!boundary_ok) {
        return std::unexpected(std::move(boundary_ok.error()));
    }

    std::size_t estimate = boundary.size() + 8;
    for (const auto& p : parts) {
        estimate += p.payload.size() + p.name.size() + boundary.size() + 96;
    }

    output_buffer out(estimate);
    for (const auto& p : parts) {
        auto name = strip_line_breaks(p.name);
        if (name.empty()) {
            return std::unexpected(encoding_failure(path{p.name}, "field name is empty"));
        }
        if (!form::detail::is_valid_utf8(name)) {
            return std::unexpected(encoding_failure(path{name}, "field name is not valid UTF-8"));
        }

        std::string disposition = "Content-Disposition: form-data; name=\"" + quote_escape(name) + "\"";
        if (p.filename) {
            auto filename = strip_line_breaks(*p.filename);
            if (!form::detail::is_valid_utf8(filename)) {
                return std::unexpected(encoding_failure(path{name}, "filename is not valid UTF-8"));
            }
            disposition += "; filename=\"" + quote_escape(filename) + "\"";
        } else if (!form::detail::is_valid_utf8(p.payload)) {
            return std::unexpected(encoding_failure(path{name}, "field value is not valid UTF-8"));
        }

        if (p.rule) {
            auto checked = p.rule->check(p.payload);
            if (!checked) {
                return std::unexpected(std::move(checked.error()));
            }
        }

        out.append("--");
        out.append_line(boundary);
        out.append_line(disposition);
        if (p.content_type) {
            out.append("Content-Type: ");
            out.append_line(strip_line_breaks(*p.content_type));
        }
        out.append_line();
        out.append(p.payload);
        out.append_line();
    }

    out.append("--");
    out.append(boundary);
    out.append_line("--");

    logger()->trace("multipart frame: {} parts, {} bytes", parts.size(), out.size());
    return out.release_string();
}

inline result<std::vector<part>> fields_from_tree(const node& tree, const codec_config& config) {
    if (!tree.is_mapping()) {
        return std::unexpected(encoding_failure({}, "multipart fields need a mapping at the root"));
    }

    // Encode then decode, so parts carry canonical decoded text
    urlencoded::serializer serializer(config.nesting, config.ordering);
    auto wire = serializer.serialize(tree);
    if (!wire) {
        return std::unexpected(std::move(wire.error()));
    }

    std::vector<part> out;
    for (auto& pair : urlencoded::split_pairs(*wire)) {
        part p = part::field(std::move(pair.key), std::move(pair.value));
        p.content_type = std::string(content_types::text_plain);
        out.push_back(std::move(p));
    }
    return out;
}

} // namespace co::form::multipart
