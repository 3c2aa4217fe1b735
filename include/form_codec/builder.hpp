#pragma once

#include "config.hpp"
#include "core.hpp"
#include "file_type.hpp"
#include "multipart/framer.hpp"
#include "node.hpp"
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace co::form::multipart {

// =============================================================================
// Builder Pattern Classes
// =============================================================================

class form_builder {
public:
    // Random boundary
    form_builder();
    explicit form_builder(std::string boundary);

    form_builder& field(std::string name, std::string value);
    form_builder& file(std::string name, std::string filename, std::string content_type, std::string payload);

    // File part checked against rule when built; the rule's type supplies the
    // Content-Type
    form_builder& upload(upload_rule rule, std::string name, std::string filename, std::string payload);

    // One text part per leaf of tree; errors surface from build()
    form_builder& fields(const node& tree, const codec_config& config = {});

    form_builder& add(multipart::part p);

    const std::string& boundary() const noexcept { return boundary_; }
    std::string content_type() const;
    const std::vector<multipart::part>& parts() const noexcept { return parts_; }

    result<std::string> build() const;

private:
    std::string boundary_;
    std::vector<multipart::part> parts_;
    std::optional<error> deferred_error_;
};

} // namespace co::form::multipart

// Include implementation
#include "detail/builder_impl.hpp"
