#pragma once

#include "../builder.hpp"
#include "../multipart/boundary.hpp"
#include "../multipart/headers.hpp"

namespace co::form::multipart {

// =============================================================================
// Form Builder Implementation
// =============================================================================

inline form_builder::form_builder() : boundary_(generate_boundary()) {}

inline form_builder::form_builder(std::string boundary) : boundary_(std::move(boundary)) {}

inline form_builder& form_builder::field(std::string name, std::string value) {
    parts_.push_back(multipart::part::field(std::move(name), std::move(value)));
    return *this;
}

inline form_builder& form_builder::file(std::string name, std::string filename,
                                        std::string content_type, std::string payload) {
    parts_.push_back(multipart::part::file(std::move(name), std::move(filename),
                                std::move(content_type), std::move(payload)));
    return *this;
}

inline form_builder& form_builder::upload(upload_rule rule, std::string name,
                                          std::string filename, std::string payload) {
    auto p = multipart::part::file(std::move(name), std::move(filename), rule.type.content_type, std::move(payload));
    p.rule = std::move(rule);
    parts_.push_back(std::move(p));
    return *this;
}

inline form_builder& form_builder::fields(const node& tree, const codec_config& config) {
    auto converted = fields_from_tree(tree, config);
    if (!converted) {
        if (!deferred_error_) {
            deferred_error_ = std::move(converted.error());
        }
        return *this;
    }
    for (auto& p : *converted) {
        parts_.push_back(std::move(p));
    }
    return *this;
}

inline form_builder& form_builder::add(multipart::part p) {
    parts_.push_back(std::move(p));
    return *this;
}

inline std::string form_builder::content_type() const {
    return form_data_content_type(boundary_);
}

inline result<std::string> form_builder::build() const {
    if (deferred_error_) {
        return std::unexpected(*deferred_error_);
    }
    return frame(parts_, boundary_);
}

} // namespace co::form::multipart
