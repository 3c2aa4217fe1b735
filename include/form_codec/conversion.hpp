#pragma once

#include "config.hpp"
#include "content_types.hpp"
#include "core.hpp"
#include "file_type.hpp"
#include "multipart/boundary.hpp"
#include "multipart/framer.hpp"
#include "multipart/headers.hpp"
#include "multipart/parser.hpp"
#include "structure/decoder.hpp"
#include "structure/encoder.hpp"
#include "urlencoded/parser.hpp"
#include "urlencoded/serializer.hpp"
#include <string>
#include <string_view>
#include <vector>

namespace co::form {

// =============================================================================
// URL-encoded Round Trip
// =============================================================================

// typed value -> node -> application/x-www-form-urlencoded
template<typename T>
result<std::string> encode(const T& value, const codec_config& config = {});

// application/x-www-form-urlencoded -> node -> typed value
template<typename T>
result<T> decode(std::string_view wire, const codec_config& config = {});

template<typename T>
class form_conversion {
public:
    explicit form_conversion(codec_config config = {});

    result<T> apply(std::string_view wire) const;
    result<std::string> unapply(const T& value) const;

    std::string_view content_type() const noexcept { return content_types::form_urlencoded; }
    const codec_config& config() const noexcept { return config_; }

private:
    codec_config config_;
};

// =============================================================================
// Multipart Conversion
// =============================================================================

// Owns one boundary for its lifetime; both directions use it.
template<typename T>
class multipart_conversion {
public:
    explicit multipart_conversion(codec_config config = {});
    multipart_conversion(codec_config config, std::string boundary);

    // Parses with this instance's boundary
    result<T> apply(std::string_view body) const;

    // Parses with the boundary announced by content_type_header
    result<T> apply(std::string_view body, std::string_view content_type_header) const;

    result<std::string> unapply(const T& value) const;

    const std::string& boundary() const noexcept { return boundary_; }
    std::string content_type() const;
    const codec_config& config() const noexcept { return config_; }

private:
    result<T> decode_parts(const std::vector<multipart::parsed_part>& parts) const;

    codec_config config_;
    std::string boundary_;
};

// Decoded key/value pairs for every part, files included, in body order
std::vector<urlencoded::field_pair> to_pairs(const std::vector<multipart::parsed_part>& parts);

// =============================================================================
// File Upload
// =============================================================================

class file_upload {
public:
    file_upload(std::string field_name, std::string filename, file_type type,
                std::size_t max_size = default_max_upload_size);

    static file_upload csv(std::string field_name = "file", std::string filename = "file.csv",
                           std::size_t max_size = default_max_upload_size);
    static file_upload pdf(std::string field_name = "file", std::string filename = "file.pdf",
                           std::size_t max_size = default_max_upload_size);

    // Filename defaults to "file.{extension}"
    static file_upload image(file_type image_type, std::string field_name = "file",
                             std::string filename = {},
                             std::size_t max_size = default_max_upload_size);

    // empty_data, file_too_large, then the type's signature
    result<void> validate(std::string_view payload) const;

    // Validates, then frames a single file part
    result<std::string> unapply(std::string_view payload) const;

    // Locates the part named field_name, validates it, returns its payload
    result<std::string> apply(std::string_view body) const;
    result<std::string> apply(std::string_view body, std::string_view content_type_header) const;

    const std::string& field_name() const noexcept { return field_name_; }
    const std::string& filename() const noexcept { return filename_; }
    const upload_rule& rule() const noexcept { return rule_; }
    const std::string& boundary() const noexcept { return boundary_; }
    std::string content_type() const;

private:
    result<std::string> extract(std::string_view body, std::string_view boundary) const;

    std::string field_name_;
    std::string filename_;
    upload_rule rule_;
    std::string boundary_;
};

} // namespace co::form

// Include implementation
#include "detail/conversion_impl.hpp"
