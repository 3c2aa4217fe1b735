#pragma once

#include "parser.hpp"
#include "../detail/scalar_impl.hpp"
#include "../log.hpp"
#include <algorithm>
#include <string_view>
#include <unordered_map>
#include <utility>

namespace co::form::urlencoded {

// =============================================================================
// Key Parsing
// =============================================================================

inline result<std::vector<key_segment>> parse_key(std::string_view key, nesting_strategy nesting) {
    std::vector<key_segment> segments;

    auto open = key.find('[');
    auto base = key.substr(0, open);
    if (base.find(']') != std::string_view::npos) {
        return std::unexpected(invalid_format("unbalanced ']' in key"));
    }
    if (!base.empty() || open == std::string_view::npos) {
        segments.emplace_back(std::string(base));
    }

    auto pos = open;
    while (pos != std::string_view::npos && pos < key.size()) {
        if (key[pos] != '[') {
            return std::unexpected(invalid_format("text after ']' in key"));
        }
        auto close = key.find(']', pos + 1);
        if (close == std::string_view::npos) {
            return std::unexpected(invalid_format("unbalanced '[' in key"));
        }
        auto content = key.substr(pos + 1, close - pos - 1);
        if (content.find('[') != std::string_view::npos) {
            return std::unexpected(invalid_format("nested '[' in key"));
        }

        if (content.empty()) {
            segments.emplace_back(append_segment{});
        } else if (nesting == nesting_strategy::indexed_brackets &&
                   std::all_of(content.begin(), content.end(), [](char c) { return c >= '0' && c <= '9'; })) {
            auto index = form::detail::parse_number<std::size_t>(content);
            if (!index) {
                return std::unexpected(invalid_format("index out of range in key"));
            }
            segments.emplace_back(*index);
        } else {
            segments.emplace_back(std::string(content));
        }
        pos = close + 1;
    }
    return segments;
}

namespace detail {

// Mutable tree used while pairs are merged; sparse indices stay sparse until
// materialize() decides between a sequence and an index-keyed mapping.
struct build_node {
    enum class shape { unset, scalar, keyed, indexed };

    shape kind = shape::unset;
    std::string value;
    std::vector<std::pair<std::string, build_node>> keyed;
    std::vector<std::pair<std::size_t, build_node>> indexed;

    // Positions into keyed / indexed, so repeated keys resolve in constant time
    std::unordered_map<std::string, std::size_t> keyed_slots;
    std::unordered_map<std::size_t, std::size_t> indexed_slots;
    std::size_t next_index = 0;

    build_node* child_named(const std::string& name) {
        auto [slot, inserted] = keyed_slots.try_emplace(name, keyed.size());
        if (inserted) {
            keyed.emplace_back(name, build_node{});
        }
        return &keyed[slot->second].second;
    }

    build_node* child_at(std::size_t index) {
        auto [slot, inserted] = indexed_slots.try_emplace(index, indexed.size());
        if (inserted) {
            indexed.emplace_back(index, build_node{});
            next_index = std::max(next_index, index + 1);
        }
        return &indexed[slot->second].second;
    }

    build_node* child_appended() {
        return child_at(next_index);
    }

    node materialize() && {
        switch (kind) {
            case shape::unset:
                return node{};
            case shape::scalar:
                return node::make_scalar(std::move(value));
            case shape::keyed: {
                node::mapping_type entries;
                entries.reserve(keyed.size());
                for (auto& [key, child] : keyed) {
                    entries.emplace_back(std::move(key), std::move(child).materialize());
                }
                return node::make_mapping(std::move(entries));
            }
            case shape::indexed: {
                std::sort(indexed.begin(), indexed.end(),
                    [](const auto& a, const auto& b) { return a.first < b.first; });

                bool contiguous = true;
                for (std::size_t i = 0; i < indexed.size(); ++i) {
                    if (indexed[i].first != i) {
                        contiguous = false;
                        break;
                    }
                }

                if (contiguous) {
                    node::sequence_type elements;
                    elements.reserve(indexed.size());
                    for (auto& [index, child] : indexed) {
                        elements.push_back(std::move(child).materialize());
                    }
                    return node::make_sequence(std::move(elements));
                }

                // Gaps: keep the indices so fixed-arity decoding can name the hole
                node::mapping_type entries;
                entries.reserve(indexed.size());
                for (auto& [index, child] : indexed) {
                    entries.emplace_back(std::to_string(index), std::move(child).materialize());
                }
                return node::make_mapping(std::move(entries));
            }
        }
        return node{};
    }
};

inline std::string describe_key(const std::vector<key_segment>& segments) {
    std::string out;
    for (const auto& segment : segments) {
        if (const auto* name = std::get_if<std::string>(&segment)) {
            out += out.empty() ? *name : "[" + *name + "]";
        } else if (const auto* index = std::get_if<std::size_t>(&segment)) {
            out += "[" + std::to_string(*index) + "]";
        } else {
            out += "[]";
        }
    }
    return out;
}

inline path to_path(const std::vector<key_segment>& segments, std::size_t count) {
    path out;
    for (std::size_t i = 0; i < count && i < segments.size(); ++i) {
        if (const auto* name = std::get_if<std::string>(&segments[i])) {
            out.push(*name);
        } else if (const auto* index = std::get_if<std::size_t>(&segments[i])) {
            out.push(*index);
        }
    }
    return out;
}

inline result<void> insert(build_node& root, const std::vector<key_segment>& segments, std::string value) {
    build_node* current = &root;

    for (std::size_t i = 0; i < segments.size(); ++i) {
        const auto& segment = segments[i];
        build_node* next = nullptr;

        if (const auto* name = std::get_if<std::string>(&segment)) {
            if (current->kind == build_node::shape::unset) {
                current->kind = build_node::shape::keyed;
            }
            if (current->kind != build_node::shape::keyed) {
                return std::unexpected(invalid_format(
                    "key '" + describe_key(segments) + "' mixes names and indices",
                    to_path(segments, i)));
            }
            next = current->child_named(*name);
        } else {
            if (current->kind == build_node::shape::unset) {
                current->kind = build_node::shape::indexed;
            }
            if (current->kind != build_node::shape::indexed) {
                return std::unexpected(invalid_format(
                    "key '" + describe_key(segments) + "' mixes names and indices",
                    to_path(segments, i)));
            }
            if (const auto* index = std::get_if<std::size_t>(&segment)) {
                next = current->child_at(*index);
            } else {
                next = current->child_appended();
            }
        }

        bool last = i + 1 == segments.size();
        if (last) {
            // Duplicate full key overwrites
            if (next->kind != build_node::shape::unset && next->kind != build_node::shape::scalar) {
                return std::unexpected(invalid_format(
                    "key '" + describe_key(segments) + "' collides with a nested key",
                    to_path(segments, i + 1)));
            }
            next->kind = build_node::shape::scalar;
            next->value = std::move(value);
            return {};
        }

        if (next->kind == build_node::shape::scalar) {
            return std::unexpected(invalid_format(
                "key '" + describe_key(segments) + "' passes through a value",
                to_path(segments, i + 1)));
        }
        current = next;
    }
    return {};
}

} // namespace detail

// =============================================================================
// Parser Implementation
// =============================================================================

inline parser::parser(nesting_strategy nesting) : nesting_(nesting) {}

inline result<node> parser::parse(std::string_view wire) const {
    return parse_pairs(split_pairs(wire));
}

inline result<node> parser::parse_pairs(const std::vector<field_pair>& pairs) const {
    if (pairs.empty()) {
        return node::make_mapping();
    }

    bool has_bare = std::any_of(pairs.begin(), pairs.end(),
        [](const field_pair& p) { return p.bare; });
    if (has_bare) {
        if (pairs.size() == 1) {
            return node::make_scalar(pairs.front().value);
        }
        logger()->debug("urlencoded parse rejected: bare value among {} pairs", pairs.size());
        return std::unexpected(invalid_format("bare value mixed with key=value pairs"));
    }

    logger()->trace("urlencoded parse: {} pairs ({})", pairs.size(), to_string(nesting_));
    auto tree = nesting_ == nesting_strategy::accumulate ? accumulate(pairs) : nest(pairs);
    if (!tree) {
        logger()->debug("urlencoded parse rejected: {}", describe(tree.error()));
    }
    return tree;
}

inline result<node> parser::accumulate(const std::vector<field_pair>& pairs) const {
    node::mapping_type entries;
    std::unordered_map<std::string_view, std::size_t> slots;
    slots.reserve(pairs.size());

    for (const auto& pair : pairs) {
        auto [slot, inserted] = slots.try_emplace(pair.key, entries.size());
        if (inserted) {
            entries.emplace_back(pair.key, node::make_scalar(pair.value));
            continue;
        }
        node& existing = entries[slot->second].second;
        if (existing.is_scalar()) {
            // Second occurrence upgrades to a sequence
            node first = std::move(existing);
            existing = node::make_sequence({std::move(first), node::make_scalar(pair.value)});
        } else {
            existing.push_back(node::make_scalar(pair.value));
        }
    }
    return node::make_mapping(std::move(entries));
}

inline result<node> parser::nest(const std::vector<field_pair>& pairs) const {
    detail::build_node root;
    for (const auto& pair : pairs) {
        auto segments = parse_key(pair.key, nesting_);
        if (!segments) {
            return std::unexpected(std::move(segments.error()));
        }
        auto inserted = detail::insert(root, *segments, pair.value);
        if (!inserted) {
            return std::unexpected(std::move(inserted.error()));
        }
    }
    if (root.kind == detail::build_node::shape::unset) {
        return node::make_mapping();
    }
    return std::move(root).materialize();
}

} // namespace co::form::urlencoded
