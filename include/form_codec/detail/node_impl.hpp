#pragma once

#include "../node.hpp"
#include <algorithm>

namespace co::form {

// =============================================================================
// Node Implementation
// =============================================================================

inline node node::make_scalar(std::string value) {
    node n;
    n.value_ = std::move(value);
    return n;
}

inline node node::make_sequence(sequence_type elements) {
    node n;
    n.value_ = std::move(elements);
    return n;
}

inline node node::make_mapping(mapping_type entries) {
    node n;
    n.value_ = std::move(entries);
    return n;
}

inline node_kind node::kind() const noexcept {
    switch (value_.index()) {
        case 0: return node_kind::scalar;
        case 1: return node_kind::sequence;
        default: return node_kind::mapping;
    }
}

inline bool node::is_empty_scalar() const noexcept {
    const auto* s = std::get_if<scalar_type>(&value_);
    return s != nullptr && s->empty();
}

inline const std::string& node::scalar() const {
    return std::get<scalar_type>(value_);
}

inline const node::sequence_type& node::elements() const {
    return std::get<sequence_type>(value_);
}

inline node::sequence_type& node::elements() {
    return std::get<sequence_type>(value_);
}

inline const node::mapping_type& node::entries() const {
    return std::get<mapping_type>(value_);
}

inline node::mapping_type& node::entries() {
    return std::get<mapping_type>(value_);
}

inline const node* node::find(std::string_view key) const noexcept {
    const auto* map = std::get_if<mapping_type>(&value_);
    if (map == nullptr) {
        return nullptr;
    }
    auto it = std::find_if(map->begin(), map->end(),
        [key](const entry& e) { return e.first == key; });
    return it != map->end() ? &it->second : nullptr;
}

inline node* node::find(std::string_view key) noexcept {
    return const_cast<node*>(std::as_const(*this).find(key));
}

inline node& node::set(std::string key, node value) {
    if (!is_mapping()) {
        value_ = mapping_type{};
    }
    if (auto* existing = find(key)) {
        *existing = std::move(value);
        return *existing;
    }
    auto& map = entries();
    map.emplace_back(std::move(key), std::move(value));
    return map.back().second;
}

inline node& node::push_back(node value) {
    if (!is_sequence()) {
        value_ = sequence_type{};
    }
    auto& seq = elements();
    seq.push_back(std::move(value));
    return seq.back();
}

inline size_t node::size() const noexcept {
    if (const auto* seq = std::get_if<sequence_type>(&value_)) {
        return seq->size();
    }
    if (const auto* map = std::get_if<mapping_type>(&value_)) {
        return map->size();
    }
    return 0;
}

inline bool node::operator==(const node& other) const {
    return value_ == other.value_;
}

inline std::string to_string(node_kind kind) {
    switch (kind) {
        case node_kind::scalar: return "scalar";
        case node_kind::sequence: return "sequence";
        case node_kind::mapping: return "mapping";
    }
    return "unknown";
}

} // namespace co::form
