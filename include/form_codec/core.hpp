#pragma once

#include <cstddef>
#include <cstdint>
#include <expected>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace co::form {

// =============================================================================
// Core Types and Enums
// =============================================================================

enum class error_code {
    success = 0,
    // Encoding
    encoding_error,
    // Decoding
    invalid_format,
    missing_field,
    type_mismatch,
    // Multipart
    file_too_large,
    invalid_content_type,
    content_mismatch,
    empty_data,
    malformed_boundary
};

// Raw binary payload type handled by the data strategies
using bytes = std::vector<std::uint8_t>;

// =============================================================================
// Path
// =============================================================================

// A path segment is either a mapping key or a sequence index
using path_segment = std::variant<std::string, std::size_t>;

struct path {
    std::vector<path_segment> segments;

    path() = default;
    path(std::initializer_list<path_segment> init) : segments(init) {}

    bool empty() const noexcept { return segments.empty(); }
    size_t size() const noexcept { return segments.size(); }

    path appended(std::string key) const;
    path appended(std::size_t index) const;

    void push(std::string key) { segments.emplace_back(std::move(key)); }
    void push(std::size_t index) { segments.emplace_back(index); }
    void pop() { segments.pop_back(); }

    bool operator==(const path&) const = default;
};

// =============================================================================
// Error
// =============================================================================

struct error {
    error_code code = error_code::success;
    path where;
    std::string message;

    // content_mismatch: expected/detected content types
    // type_mismatch: expected holds the expected kind
    std::string expected;
    std::string detected;

    // file_too_large
    std::size_t size = 0;
    std::size_t max_size = 0;
};

template<typename T>
using result = std::expected<T, error>;

// Error factories
error encoding_failure(path where, std::string reason);
error invalid_format(std::string reason, path where = {});
error missing_field(path where);
error type_mismatch(path where, std::string expected_kind, std::string reason = {});
error file_too_large(std::size_t size, std::size_t max_size);
error invalid_content_type(std::string type);
error content_mismatch(std::string expected, std::string detected = {});
error empty_data();
error malformed_boundary(std::string reason = {});

bool is_decoding_error(error_code code) noexcept;
bool is_multipart_error(error_code code) noexcept;

std::string to_string(error_code e);
std::string to_string(const path& p);
std::string describe(const error& e);

} // namespace co::form

// Include implementation
#include "detail/core_impl.hpp"
