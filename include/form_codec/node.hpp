#pragma once

#include "core.hpp"
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace co::form {

// =============================================================================
// Neutral Value Tree
// =============================================================================

enum class node_kind {
    scalar,
    sequence,
    mapping
};

class node {
public:
    using scalar_type = std::string;
    using sequence_type = std::vector<node>;
    using entry = std::pair<std::string, node>;
    using mapping_type = std::vector<entry>;

    // Default node is the empty scalar
    node() = default;

    static node make_scalar(std::string value);
    static node make_sequence(sequence_type elements = {});
    static node make_mapping(mapping_type entries = {});

    node_kind kind() const noexcept;
    bool is_scalar() const noexcept { return kind() == node_kind::scalar; }
    bool is_sequence() const noexcept { return kind() == node_kind::sequence; }
    bool is_mapping() const noexcept { return kind() == node_kind::mapping; }

    // Empty scalar is the encoding of an absent value
    bool is_empty_scalar() const noexcept;

    // Accessors (precondition: matching kind)
    const std::string& scalar() const;
    const sequence_type& elements() const;
    sequence_type& elements();
    const mapping_type& entries() const;
    mapping_type& entries();

    // Mapping operations
    const node* find(std::string_view key) const noexcept;
    node* find(std::string_view key) noexcept;
    node& set(std::string key, node value);

    // Sequence operations
    node& push_back(node value);

    // Element or entry count; 0 for scalars
    size_t size() const noexcept;

    bool operator==(const node& other) const;

private:
    std::variant<scalar_type, sequence_type, mapping_type> value_;
};

std::string to_string(node_kind kind);

} // namespace co::form

// Include implementation
#include "detail/node_impl.hpp"
