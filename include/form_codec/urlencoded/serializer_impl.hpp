#pragma once

#include "serializer.hpp"
#include "../log.hpp"
#include <algorithm>

namespace co::form::urlencoded {

// =============================================================================
// Serializer Implementation
// =============================================================================

inline serializer::serializer(nesting_strategy nesting, key_ordering ordering)
    : nesting_(nesting), ordering_(ordering) {}

inline std::vector<const node::entry*> serializer::ordered_entries(const node& mapping) const {
    std::vector<const node::entry*> out;
    out.reserve(mapping.size());
    for (const auto& entry : mapping.entries()) {
        out.push_back(&entry);
    }
    if (ordering_ == key_ordering::sorted) {
        std::stable_sort(out.begin(), out.end(),
            [](const node::entry* a, const node::entry* b) { return a->first < b->first; });
    }
    return out;
}

inline result<std::vector<field_pair>> serializer::pairs(const node& tree) const {
    std::vector<field_pair> out;

    // Root scalar: bare value
    if (tree.is_scalar()) {
        out.push_back({{}, tree.scalar(), true});
        return out;
    }

    if (nesting_ == nesting_strategy::accumulate) {
        auto flattened = flatten_accumulate(tree, out);
        if (!flattened) {
            logger()->debug("urlencoded serialize failed: {}", describe(flattened.error()));
            return std::unexpected(std::move(flattened.error()));
        }
        return out;
    }

    path where;
    auto flattened = flatten_brackets(tree, where, {}, out);
    if (!flattened) {
        logger()->debug("urlencoded serialize failed: {}", describe(flattened.error()));
        return std::unexpected(std::move(flattened.error()));
    }
    return out;
}

inline result<std::string> serializer::serialize(const node& tree) const {
    auto flat = pairs(tree);
    if (!flat) {
        return std::unexpected(std::move(flat.error()));
    }
    logger()->trace("urlencoded serialize: {} pairs ({})", flat->size(), to_string(nesting_));
    return join_pairs(*flat, nesting_ != nesting_strategy::accumulate);
}

inline result<void> serializer::flatten_accumulate(const node& tree, std::vector<field_pair>& out) const {
    if (!tree.is_mapping()) {
        return std::unexpected(encoding_failure({},
            "accumulate nesting needs a mapping at the root"));
    }

    for (const auto* entry : ordered_entries(tree)) {
        const auto& [key, child] = *entry;
        switch (child.kind()) {
            case node_kind::scalar:
                out.push_back({key, child.scalar(), false});
                break;
            case node_kind::sequence: {
                std::size_t index = 0;
                for (const auto& element : child.elements()) {
                    if (!element.is_scalar()) {
                        return std::unexpected(encoding_failure(path{key, index},
                            "accumulate nesting cannot represent nested containers"));
                    }
                    out.push_back({key, element.scalar(), false});
                    ++index;
                }
                break;
            }
            case node_kind::mapping:
                return std::unexpected(encoding_failure(path{key},
                    "accumulate nesting cannot represent nested mappings"));
        }
    }
    return {};
}

inline result<void> serializer::flatten_brackets(const node& current, path& where, const std::string& prefix,
                                                 std::vector<field_pair>& out) const {
    switch (current.kind()) {
        case node_kind::scalar:
            out.push_back({prefix, current.scalar(), false});
            return {};

        case node_kind::sequence: {
            std::size_t index = 0;
            for (const auto& element : current.elements()) {
                where.push(index);
                auto flattened = flatten_brackets(element, where,
                    prefix + "[" + std::to_string(index) + "]", out);
                where.pop();
                if (!flattened) return flattened;
                ++index;
            }
            return {};
        }

        case node_kind::mapping: {
            for (const auto* entry : ordered_entries(current)) {
                const auto& [key, child] = *entry;
                if (key.find_first_of("[]") != std::string::npos) {
                    return std::unexpected(encoding_failure(where.appended(key),
                        "key segment contains a bracket"));
                }
                if (key.empty() && !where.empty()) {
                    return std::unexpected(encoding_failure(where.appended(key),
                        "empty nested key reads back as an append"));
                }

                where.push(key);
                auto flattened = flatten_brackets(child, where,
                    where.size() == 1 ? key : prefix + "[" + key + "]", out);
                where.pop();
                if (!flattened) return flattened;
            }
            return {};
        }
    }
    return {};
}

} // namespace co::form::urlencoded
