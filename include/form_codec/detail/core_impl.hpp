#pragma once

#include "../core.hpp"
#include <string>

namespace co::form {

// =============================================================================
// Path Implementation
// =============================================================================

inline path path::appended(std::string key) const {
    path p = *this;
    p.push(std::move(key));
    return p;
}

inline path path::appended(std::size_t index) const {
    path p = *this;
    p.push(index);
    return p;
}

// =============================================================================
// Error Factories
// =============================================================================

inline error encoding_failure(path where, std::string reason) {
    error e;
    e.code = error_code::encoding_error;
    e.where = std::move(where);
    e.message = std::move(reason);
    return e;
}

inline error invalid_format(std::string reason, path where) {
    error e;
    e.code = error_code::invalid_format;
    e.where = std::move(where);
    e.message = std::move(reason);
    return e;
}

inline error missing_field(path where) {
    error e;
    e.code = error_code::missing_field;
    e.where = std::move(where);
    return e;
}

inline error type_mismatch(path where, std::string expected_kind, std::string reason) {
    error e;
    e.code = error_code::type_mismatch;
    e.where = std::move(where);
    e.expected = std::move(expected_kind);
    e.message = std::move(reason);
    return e;
}

inline error file_too_large(std::size_t size, std::size_t max_size) {
    error e;
    e.code = error_code::file_too_large;
    e.size = size;
    e.max_size = max_size;
    return e;
}

inline error invalid_content_type(std::string type) {
    error e;
    e.code = error_code::invalid_content_type;
    e.detected = std::move(type);
    return e;
}

inline error content_mismatch(std::string expected, std::string detected) {
    error e;
    e.code = error_code::content_mismatch;
    e.expected = std::move(expected);
    e.detected = std::move(detected);
    return e;
}

inline error empty_data() {
    error e;
    e.code = error_code::empty_data;
    return e;
}

inline error malformed_boundary(std::string reason) {
    error e;
    e.code = error_code::malformed_boundary;
    e.message = std::move(reason);
    return e;
}

inline bool is_decoding_error(error_code code) noexcept {
    return code == error_code::invalid_format ||
           code == error_code::missing_field ||
           code == error_code::type_mismatch;
}

inline bool is_multipart_error(error_code code) noexcept {
    switch (code) {
        case error_code::file_too_large:
        case error_code::invalid_content_type:
        case error_code::content_mismatch:
        case error_code::empty_data:
        case error_code::malformed_boundary:
        case error_code::encoding_error:
            return true;
        default:
            return false;
    }
}

// =============================================================================
// Utility Functions
// =============================================================================

inline std::string to_string(error_code e) {
    switch (e) {
        case error_code::success: return "Success";
        case error_code::encoding_error: return "Encoding error";
        case error_code::invalid_format: return "Invalid format";
        case error_code::missing_field: return "Missing field";
        case error_code::type_mismatch: return "Type mismatch";
        case error_code::file_too_large: return "File too large";
        case error_code::invalid_content_type: return "Invalid content type";
        case error_code::content_mismatch: return "Content mismatch";
        case error_code::empty_data: return "Empty data";
        case error_code::malformed_boundary: return "Malformed boundary";
    }
    return "Unknown error";
}

inline std::string to_string(const path& p) {
    if (p.empty()) {
        return "<root>";
    }

    std::string out;
    for (const auto& segment : p.segments) {
        if (const auto* key = std::get_if<std::string>(&segment)) {
            if (!out.empty()) out += '.';
            out += *key;
        } else {
            out += '[';
            out += std::to_string(std::get<std::size_t>(segment));
            out += ']';
        }
    }
    return out;
}

inline std::string describe(const error& e) {
    std::string out = to_string(e.code);

    switch (e.code) {
        case error_code::file_too_large:
            out += ": file size " + std::to_string(e.size) +
                   " exceeds maximum allowed size of " + std::to_string(e.max_size) + " bytes";
            return out;
        case error_code::content_mismatch:
            out += ": expected " + e.expected + ", detected " +
                   (e.detected.empty() ? std::string("unknown") : e.detected);
            return out;
        case error_code::invalid_content_type:
            out += ": " + e.detected;
            return out;
        case error_code::empty_data:
        case error_code::success:
            return out;
        default:
            break;
    }

    if (e.code == error_code::encoding_error || is_decoding_error(e.code)) {
        out += " at " + to_string(e.where);
    }
    if (e.code == error_code::type_mismatch && !e.expected.empty()) {
        out += " (expected " + e.expected + ")";
    }
    if (!e.message.empty()) {
        out += ": " + e.message;
    }
    return out;
}

} // namespace co::form
