#pragma once

#include "encoder.hpp"
#include "../detail/scalar_impl.hpp"
#include "../log.hpp"
#include <optional>
#include <tuple>
#include <utility>

namespace co::form::structure {

namespace detail {

template<typename Container>
result<node> encode_elements(const Container& container, encode_context& ctx) {
    node out = node::make_sequence();
    std::size_t index = 0;
    for (const auto& element : container) {
        ctx.where.push(index);
        auto child = encode_value(element, ctx);
        ctx.where.pop();
        if (!child) {
            return child;
        }
        out.push_back(std::move(*child));
        ++index;
    }
    return out;
}

template<typename Record, typename Owner, typename Member>
bool encode_field(const Record& value, const field_descriptor<Owner, Member>& field,
                  node& out, encode_context& ctx, std::optional<error>& failure) {
    ctx.where.push(std::string(field.name));
    auto child = encode_value(value.*(field.member), ctx);
    ctx.where.pop();
    if (!child) {
        failure = std::move(child.error());
        return false;
    }
    out.set(std::string(field.name), std::move(*child));
    return true;
}

template<typename Record>
result<node> encode_record(const Record& value, encode_context& ctx) {
    node out = node::make_mapping();
    std::optional<error> failure;

    bool ok = std::apply([&](const auto&... field) {
        return (encode_field(value, field, out, ctx, failure) && ...);
    }, record_traits<Record>::fields());

    if (!ok) {
        return std::unexpected(std::move(*failure));
    }
    return out;
}

} // namespace detail

template<typename T>
result<node> encode_value(const T& value, encode_context& ctx) {
    if constexpr (has_value_codec<T>) {
        return value_codec<T>::encode(value, std::as_const(ctx));
    } else if constexpr (optional_type<T>) {
        // Absent leaves encode as the empty scalar
        if (!value.has_value()) {
            return node{};
        }
        return encode_value(*value, ctx);
    } else if constexpr (record_type<T>) {
        return detail::encode_record(value, ctx);
    } else if constexpr (text_type<T>) {
        return node::make_scalar(std::string(value));
    } else if constexpr (boolean_type<T>) {
        return node::make_scalar(value ? "true" : "false");
    } else if constexpr (enum_type<T>) {
        return node::make_scalar(form::detail::format_number(
            static_cast<std::underlying_type_t<T>>(value)));
    } else if constexpr (integer_type<T> || floating_type<T>) {
        return node::make_scalar(form::detail::format_number(value));
    } else if constexpr (timestamp_type<T>) {
        const auto& dates = ctx.config.dates;
        if (dates.type() == date_strategy::kind::custom) {
            auto text = dates.format(value);
            if (text.empty()) {
                return std::unexpected(encoding_failure(ctx.where, "custom date strategy produced no value"));
            }
            return node::make_scalar(std::move(text));
        }
        return node::make_scalar(dates.format(value));
    } else if constexpr (blob_type<T>) {
        if (ctx.config.data.type() == data_strategy::kind::deferred) {
            return detail::encode_elements(value, ctx);
        }
        return node::make_scalar(ctx.config.data.format(value));
    } else if constexpr (string_map_type<T>) {
        node out = node::make_mapping();
        for (const auto& [key, item] : value) {
            ctx.where.push(key);
            auto child = encode_value(item, ctx);
            ctx.where.pop();
            if (!child) {
                return child;
            }
            out.set(key, std::move(*child));
        }
        return out;
    } else if constexpr (fixed_array_type<T> || sequence_container<T>) {
        return detail::encode_elements(value, ctx);
    } else {
        static_assert(structure::detail::dependent_false<T>,
            "type has no form encoding: declare it with FORM_CODEC_RECORD or specialize value_codec");
    }
}

// =============================================================================
// Encoder Implementation
// =============================================================================

inline encoder::encoder(codec_config config) : config_(std::move(config)) {}

template<typename T>
result<node> encoder::encode(const T& value) const {
    encode_context ctx{config_, {}};
    auto out = encode_value(value, ctx);
    if (!out) {
        logger()->debug("form encode failed: {}", describe(out.error()));
    }
    return out;
}

} // namespace co::form::structure

namespace co::form {

template<typename T>
result<node> to_node(const T& value, const codec_config& config) {
    return structure::encoder(config).encode(value);
}

} // namespace co::form
