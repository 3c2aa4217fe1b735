#pragma once

#include "../config.hpp"
#include "../core.hpp"
#include "../node.hpp"
#include <array>
#include <concepts>
#include <cstddef>
#include <optional>
#include <ranges>
#include <string>
#include <string_view>
#include <tuple>
#include <type_traits>

namespace co::form::structure {

// =============================================================================
// Structural Description
// =============================================================================

// Specialized by FORM_CODEC_RECORD; exposes a static fields() tuple.
template<typename T>
struct record_traits;

// User extension point. A specialization provides
//   static result<node> encode(const T&, const encode_context&);
//   static result<T> decode(const node*, decode_context&);
// where a null node pointer means the key was absent.
// Specializations must be visible before the type is first encoded.
template<typename T>
struct value_codec;

struct encode_context {
    const codec_config& config;
    path where;
};

struct decode_context {
    const codec_config& config;
    path where;
};

template<typename Record, typename Member>
struct field_descriptor {
    using record_type = Record;
    using member_type = Member;

    std::string_view name;
    Member Record::* member;
};

template<typename Record, typename Member>
constexpr field_descriptor<Record, Member> field_of(std::string_view name, Member Record::* member) noexcept {
    return {name, member};
}

namespace detail {

template<typename T>
struct is_optional : std::false_type {};

template<typename T>
struct is_optional<std::optional<T>> : std::true_type {};

template<typename T>
struct is_std_array : std::false_type {};

template<typename T, std::size_t N>
struct is_std_array<std::array<T, N>> : std::true_type {};

template<typename>
inline constexpr bool dependent_false = false;

} // namespace detail

// =============================================================================
// Shape Concepts
// =============================================================================

template<typename T>
concept record_type = std::default_initializable<T> && requires {
    { record_traits<T>::fields() };
};

template<typename T>
concept has_value_codec = requires(const T& value, const encode_context& ec,
                                   const node* n, decode_context& dc) {
    { value_codec<T>::encode(value, ec) } -> std::same_as<result<node>>;
    { value_codec<T>::decode(n, dc) } -> std::same_as<result<T>>;
};

template<typename T>
concept text_type = std::same_as<T, std::string> || std::same_as<T, std::string_view>;

template<typename T>
concept boolean_type = std::same_as<T, bool>;

template<typename T>
concept integer_type = std::integral<T> && !boolean_type<T>;

template<typename T>
concept floating_type = std::floating_point<T>;

template<typename T>
concept enum_type = std::is_enum_v<T>;

template<typename T>
concept timestamp_type = std::same_as<T, time_point>;

template<typename T>
concept blob_type = std::same_as<T, bytes>;

template<typename T>
concept optional_type = detail::is_optional<T>::value;

template<typename T>
concept fixed_array_type = detail::is_std_array<T>::value;

template<typename T>
concept string_map_type = requires {
    typename T::key_type;
    typename T::mapped_type;
} && std::same_as<typename T::key_type, std::string> && std::ranges::range<T>;

template<typename T>
concept sequence_container = std::ranges::range<T> && std::default_initializable<T> &&
    !text_type<T> && !blob_type<T> && !fixed_array_type<T> &&
    !requires { typename T::mapped_type; } &&
    (requires(T& c, typename T::value_type v) { c.push_back(std::move(v)); } ||
     requires(T& c, typename T::value_type v) { c.insert(std::move(v)); });

} // namespace co::form::structure
