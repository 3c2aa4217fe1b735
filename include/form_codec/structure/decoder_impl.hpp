#pragma once

#include "decoder.hpp"
#include "../detail/scalar_impl.hpp"
#include "../log.hpp"
#include <algorithm>
#include <optional>
#include <tuple>
#include <utility>
#include <vector>

namespace co::form::structure {

namespace detail {

using indexed_entry = std::pair<std::size_t, const node*>;

inline result<const std::string*> scalar_text(const node* n, const decode_context& ctx,
                                              std::string_view expected_kind) {
    if (n == nullptr) {
        return std::unexpected(missing_field(ctx.where));
    }
    // Accumulated single occurrence
    if (n->is_sequence() && n->size() == 1 && n->elements().front().is_scalar()) {
        return &n->elements().front().scalar();
    }
    if (!n->is_scalar()) {
        return std::unexpected(type_mismatch(ctx.where, std::string(expected_kind),
            "found " + to_string(n->kind())));
    }
    return &n->scalar();
}

inline std::optional<std::size_t> parse_index(std::string_view key) noexcept {
    if (key.empty() || !std::all_of(key.begin(), key.end(), [](char c) { return c >= '0' && c <= '9'; })) {
        return std::nullopt;
    }
    return form::detail::parse_number<std::size_t>(key);
}

// Entries of an index-keyed mapping in numeric order
inline result<std::vector<indexed_entry>> indexed_entries(const node& mapping, const decode_context& ctx,
                                                          std::string_view expected_kind) {
    std::vector<indexed_entry> out;
    out.reserve(mapping.size());
    for (const auto& [key, child] : mapping.entries()) {
        auto index = parse_index(key);
        if (!index) {
            return std::unexpected(type_mismatch(ctx.where, std::string(expected_kind),
                "mapping key '" + key + "' is not an index"));
        }
        out.emplace_back(*index, &child);
    }
    std::sort(out.begin(), out.end(),
        [](const indexed_entry& a, const indexed_entry& b) { return a.first < b.first; });
    return out;
}

template<typename Container, typename Value>
void insert_element(Container& container, Value&& value) {
    if constexpr (requires { container.push_back(std::forward<Value>(value)); }) {
        container.push_back(std::forward<Value>(value));
    } else {
        container.insert(std::forward<Value>(value));
    }
}

template<typename Container>
result<Container> decode_sequence(const node* n, decode_context& ctx) {
    using value_type = typename Container::value_type;
    Container out{};
    if (n == nullptr) {
        return out;
    }

    auto add = [&](const node* element, std::size_t index) -> result<void> {
        ctx.where.push(index);
        auto decoded = decode_value<value_type>(element, ctx);
        ctx.where.pop();
        if (!decoded) {
            return std::unexpected(std::move(decoded.error()));
        }
        insert_element(out, std::move(*decoded));
        return {};
    };

    switch (n->kind()) {
        case node_kind::scalar: {
            auto added = add(n, 0);
            if (!added) return std::unexpected(std::move(added.error()));
            break;
        }
        case node_kind::sequence: {
            std::size_t index = 0;
            for (const auto& element : n->elements()) {
                auto added = add(&element, index++);
                if (!added) return std::unexpected(std::move(added.error()));
            }
            break;
        }
        case node_kind::mapping: {
            auto ordered = indexed_entries(*n, ctx, "sequence");
            if (!ordered) return std::unexpected(std::move(ordered.error()));
            for (const auto& [index, element] : *ordered) {
                auto added = add(element, index);
                if (!added) return std::unexpected(std::move(added.error()));
            }
            break;
        }
    }
    return out;
}

template<typename Array>
result<Array> decode_array(const node* n, decode_context& ctx) {
    using value_type = typename Array::value_type;
    constexpr std::size_t N = std::tuple_size_v<Array>;
    const std::string expected = "array of " + std::to_string(N);

    Array out{};
    if (n == nullptr) {
        if constexpr (N == 0) {
            return out;
        } else {
            return std::unexpected(missing_field(ctx.where));
        }
    }

    auto set_at = [&](std::size_t index, const node* element) -> result<void> {
        ctx.where.push(index);
        auto decoded = decode_value<value_type>(element, ctx);
        ctx.where.pop();
        if (!decoded) {
            return std::unexpected(std::move(decoded.error()));
        }
        out[index] = std::move(*decoded);
        return {};
    };

    switch (n->kind()) {
        case node_kind::scalar: {
            if (N != 1) {
                return std::unexpected(type_mismatch(ctx.where, expected, "found a single value"));
            }
            auto placed = set_at(0, n);
            if (!placed) return std::unexpected(std::move(placed.error()));
            break;
        }
        case node_kind::sequence: {
            if (n->size() != N) {
                return std::unexpected(type_mismatch(ctx.where, expected,
                    "found " + std::to_string(n->size()) + " elements"));
            }
            for (std::size_t i = 0; i < N; ++i) {
                auto placed = set_at(i, &n->elements()[i]);
                if (!placed) return std::unexpected(std::move(placed.error()));
            }
            break;
        }
        case node_kind::mapping: {
            auto ordered = indexed_entries(*n, ctx, expected);
            if (!ordered) return std::unexpected(std::move(ordered.error()));

            std::size_t expected_index = 0;
            for (const auto& [index, element] : *ordered) {
                if (index != expected_index) {
                    return std::unexpected(missing_field(ctx.where.appended(expected_index)));
                }
                if (index >= N) {
                    return std::unexpected(type_mismatch(ctx.where.appended(index), expected,
                        "index out of range"));
                }
                auto placed = set_at(index, element);
                if (!placed) return std::unexpected(std::move(placed.error()));
                ++expected_index;
            }
            if (expected_index < N) {
                return std::unexpected(missing_field(ctx.where.appended(expected_index)));
            }
            break;
        }
    }
    return out;
}

template<typename Map>
result<Map> decode_map(const node* n, decode_context& ctx) {
    using mapped_type = typename Map::mapped_type;
    Map out{};
    if (n == nullptr || n->is_empty_scalar()) {
        return out;
    }

    auto put = [&](const std::string& key, const node* child) -> result<void> {
        ctx.where.push(key);
        auto decoded = decode_value<mapped_type>(child, ctx);
        ctx.where.pop();
        if (!decoded) {
            return std::unexpected(std::move(decoded.error()));
        }
        out.insert_or_assign(key, std::move(*decoded));
        return {};
    };

    if (n->is_mapping()) {
        for (const auto& [key, child] : n->entries()) {
            auto stored = put(key, &child);
            if (!stored) return std::unexpected(std::move(stored.error()));
        }
    } else if (n->is_sequence()) {
        std::size_t index = 0;
        for (const auto& child : n->elements()) {
            auto stored = put(std::to_string(index++), &child);
            if (!stored) return std::unexpected(std::move(stored.error()));
        }
    } else {
        return std::unexpected(type_mismatch(ctx.where, "mapping", "found scalar"));
    }
    return out;
}

template<typename Record, typename Owner, typename Member>
bool decode_field(Record& out, const field_descriptor<Owner, Member>& field, const node* source,
                  decode_context& ctx, std::optional<error>& failure) {
    const node* child = source != nullptr ? source->find(field.name) : nullptr;
    ctx.where.push(std::string(field.name));
    auto decoded = decode_value<Member>(child, ctx);
    ctx.where.pop();
    if (!decoded) {
        failure = std::move(decoded.error());
        return false;
    }
    out.*(field.member) = std::move(*decoded);
    return true;
}

template<typename Record>
result<Record> decode_record(const node* n, decode_context& ctx) {
    if (n != nullptr && !n->is_mapping() && !n->is_empty_scalar()) {
        return std::unexpected(type_mismatch(ctx.where, "mapping", "found " + to_string(n->kind())));
    }

    Record out{};
    std::optional<error> failure;
    bool ok = std::apply([&](const auto&... field) {
        return (decode_field(out, field, n, ctx, failure) && ...);
    }, record_traits<Record>::fields());

    if (!ok) {
        return std::unexpected(std::move(*failure));
    }
    return out;
}

} // namespace detail

template<typename T>
result<T> decode_value(const node* n, decode_context& ctx) {
    if constexpr (has_value_codec<T>) {
        return value_codec<T>::decode(n, ctx);
    } else if constexpr (optional_type<T>) {
        if (n == nullptr || n->is_empty_scalar()) {
            return T{};
        }
        auto inner = decode_value<typename T::value_type>(n, ctx);
        if (!inner) {
            return std::unexpected(std::move(inner.error()));
        }
        return T{std::move(*inner)};
    } else if constexpr (record_type<T>) {
        return detail::decode_record<T>(n, ctx);
    } else if constexpr (std::same_as<T, std::string>) {
        auto text = detail::scalar_text(n, ctx, "string");
        if (!text) return std::unexpected(std::move(text.error()));
        return **text;
    } else if constexpr (std::same_as<T, std::string_view>) {
        static_assert(structure::detail::dependent_false<T>,
            "std::string_view cannot own decoded text; decode into std::string");
    } else if constexpr (boolean_type<T>) {
        auto text = detail::scalar_text(n, ctx, "bool");
        if (!text) return std::unexpected(std::move(text.error()));
        auto value = form::detail::parse_bool(**text);
        if (!value) {
            return std::unexpected(type_mismatch(ctx.where, "bool", "not a boolean literal"));
        }
        return *value;
    } else if constexpr (enum_type<T>) {
        using underlying = std::underlying_type_t<T>;
        auto text = detail::scalar_text(n, ctx, "enum");
        if (!text) return std::unexpected(std::move(text.error()));
        auto value = form::detail::parse_number<underlying>(**text);
        if (!value) {
            return std::unexpected(type_mismatch(ctx.where, "enum", "not an integer in range"));
        }
        return static_cast<T>(*value);
    } else if constexpr (integer_type<T>) {
        auto text = detail::scalar_text(n, ctx, "integer");
        if (!text) return std::unexpected(std::move(text.error()));
        auto value = form::detail::parse_number<T>(**text);
        if (!value) {
            return std::unexpected(type_mismatch(ctx.where, "integer", "not an integer in range"));
        }
        return *value;
    } else if constexpr (floating_type<T>) {
        auto text = detail::scalar_text(n, ctx, "number");
        if (!text) return std::unexpected(std::move(text.error()));
        auto value = form::detail::parse_number<T>(**text);
        if (!value) {
            return std::unexpected(type_mismatch(ctx.where, "number", "not a number"));
        }
        return *value;
    } else if constexpr (timestamp_type<T>) {
        auto text = detail::scalar_text(n, ctx, "date");
        if (!text) return std::unexpected(std::move(text.error()));
        auto value = ctx.config.dates.parse(**text);
        if (!value) {
            return std::unexpected(type_mismatch(ctx.where, "date", "does not match the date strategy"));
        }
        return *value;
    } else if constexpr (blob_type<T>) {
        if (ctx.config.data.type() == data_strategy::kind::deferred) {
            return detail::decode_sequence<T>(n, ctx);
        }
        if (n == nullptr) {
            return T{};
        }
        auto text = detail::scalar_text(n, ctx, "data");
        if (!text) return std::unexpected(std::move(text.error()));
        auto value = ctx.config.data.parse(**text);
        if (!value) {
            return std::unexpected(type_mismatch(ctx.where, "data", "does not match the data strategy"));
        }
        return std::move(*value);
    } else if constexpr (string_map_type<T>) {
        return detail::decode_map<T>(n, ctx);
    } else if constexpr (fixed_array_type<T>) {
        return detail::decode_array<T>(n, ctx);
    } else if constexpr (sequence_container<T>) {
        return detail::decode_sequence<T>(n, ctx);
    } else {
        static_assert(structure::detail::dependent_false<T>,
            "type has no form decoding: declare it with FORM_CODEC_RECORD or specialize value_codec");
    }
}

// =============================================================================
// Decoder Implementation
// =============================================================================

inline decoder::decoder(codec_config config) : config_(std::move(config)) {}

template<typename T>
result<T> decoder::decode(const node& tree) const {
    decode_context ctx{config_, {}};
    auto out = decode_value<T>(&tree, ctx);
    if (!out) {
        logger()->debug("form decode rejected: {}", describe(out.error()));
    }
    return out;
}

} // namespace co::form::structure

namespace co::form {

template<typename T>
result<T> from_node(const node& tree, const codec_config& config) {
    return structure::decoder(config).decode<T>(tree);
}

} // namespace co::form
