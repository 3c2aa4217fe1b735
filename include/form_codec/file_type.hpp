#pragma once

#include "core.hpp"
#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace co::form {

// =============================================================================
// File Types
// =============================================================================

inline constexpr std::size_t default_max_upload_size = 10 * 1024 * 1024;  // 10 MiB

struct file_type {
    // Fails with content_mismatch; an empty validator accepts any payload
    using validator_fn = std::function<result<void>(std::string_view)>;

    std::string content_type;
    std::string extension;
    validator_fn validator;

    // True when the validator checks a byte signature; such types take part
    // in detect()
    bool has_signature = false;
};

namespace file_types {

// Signature-checked
file_type jpeg();
file_type png();
file_type gif();
file_type webp();
file_type tiff();
file_type bmp();
file_type heic();
file_type avif();
file_type pdf();

// UTF-8 check only
file_type csv();

// Accepted as declared
file_type excel();
file_type json();
file_type text();
file_type docx();
file_type doc();
file_type zip();
file_type mp3();
file_type wav();
file_type mp4();
file_type sqlite();
file_type javascript();
file_type ttf();
file_type svg();

file_type custom(std::string content_type, std::string extension,
                 file_type::validator_fn validator = {});

// Every built-in, signature-bearing types first
const std::vector<file_type>& all();

// Case-insensitive; parameters after ';' are ignored
std::optional<file_type> find_by_content_type(std::string_view content_type);

// Case-insensitive; a leading '.' is ignored
std::optional<file_type> find_by_extension(std::string_view extension);

} // namespace file_types

// First signature-bearing built-in whose signature matches
std::optional<file_type> detect(std::string_view payload);

// Runs the type's validator. A content_mismatch failure carries the detected
// type, when one is recognised.
result<void> validate(std::string_view payload, const file_type& type);

// =============================================================================
// Upload Rule
// =============================================================================

struct upload_rule {
    file_type type;
    std::size_t max_size = default_max_upload_size;

    // empty_data, then file_too_large, then the signature
    result<void> check(std::string_view payload) const;
};

} // namespace co::form

// Include implementation
#include "detail/file_type_impl.hpp"
