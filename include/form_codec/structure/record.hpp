#pragma once

// =============================================================================
// FORM_CODEC_RECORD / FORM_CODEC_FIELD
// =============================================================================
//
// Usage (at global namespace scope, after the type is complete):
//
//   struct signup {
//       std::string                name;
//       int                        age;
//       std::optional<std::string> referrer;
//       std::vector<std::string>   tags;
//   };
//
//   FORM_CODEC_RECORD(signup,
//       FORM_CODEC_FIELD(name),
//       FORM_CODEC_FIELD(age),
//       FORM_CODEC_FIELD(referrer, "ref"),
//       FORM_CODEC_FIELD(tags)
//   )
//
// Fields encode in the order listed here. The optional second argument of
// FORM_CODEC_FIELD overrides the wire name.

#include "concepts.hpp"
#include <tuple>

// FORM_CODEC_FIELD(member)
#define FORM_CODEC_FIELD_1(M) \
    ::co::form::structure::field_of(#M, &_form_codec_record_type::M)

// FORM_CODEC_FIELD(member, "wire_name")
#define FORM_CODEC_FIELD_2(M, NAME) \
    ::co::form::structure::field_of(NAME, &_form_codec_record_type::M)

#define FORM_CODEC_FIELD_SELECT(_1, _2, NAME, ...) NAME
#define FORM_CODEC_FIELD(...) \
    FORM_CODEC_FIELD_SELECT(__VA_ARGS__, FORM_CODEC_FIELD_2, FORM_CODEC_FIELD_1)(__VA_ARGS__)

// FORM_CODEC_RECORD(Type, FORM_CODEC_FIELD(...), ...)
#define FORM_CODEC_RECORD(TYPE, ...) \
    template<> \
    struct co::form::structure::record_traits<TYPE> { \
        using _form_codec_record_type = TYPE; \
        static constexpr auto fields() { \
            return std::make_tuple(__VA_ARGS__); \
        } \
    };
