#pragma once

#include "../conversion.hpp"
#include "../log.hpp"

namespace co::form {

// =============================================================================
// URL-encoded Round Trip
// =============================================================================

template<typename T>
result<std::string> encode(const T& value, const codec_config& config) {
    auto tree = to_node(value, config);
    if (!tree) {
        return std::unexpected(std::move(tree.error()));
    }
    return urlencoded::serializer(config.nesting, config.ordering).serialize(*tree);
}

template<typename T>
result<T> decode(std::string_view wire, const codec_config& config) {
    auto tree = urlencoded::parser(config.nesting).parse(wire);
    if (!tree) {
        return std::unexpected(std::move(tree.error()));
    }
    return from_node<T>(*tree, config);
}

template<typename T>
form_conversion<T>::form_conversion(codec_config config) : config_(std::move(config)) {}

template<typename T>
result<T> form_conversion<T>::apply(std::string_view wire) const {
    return decode<T>(wire, config_);
}

template<typename T>
result<std::string> form_conversion<T>::unapply(const T& value) const {
    return encode(value, config_);
}

// =============================================================================
// Multipart Conversion
// =============================================================================

inline std::vector<urlencoded::field_pair> to_pairs(const std::vector<multipart::parsed_part>& parts) {
    std::vector<urlencoded::field_pair> out;
    out.reserve(parts.size());
    for (const auto& p : parts) {
        out.push_back({p.name, p.payload, false});
    }
    return out;
}

template<typename T>
multipart_conversion<T>::multipart_conversion(codec_config config)
    : config_(std::move(config)), boundary_(multipart::generate_boundary()) {
    logger()->trace("multipart conversion boundary {}", boundary_);
}

template<typename T>
multipart_conversion<T>::multipart_conversion(codec_config config, std::string boundary)
    : config_(std::move(config)), boundary_(std::move(boundary)) {}

template<typename T>
std::string multipart_conversion<T>::content_type() const {
    return multipart::form_data_content_type(boundary_);
}

template<typename T>
result<std::string> multipart_conversion<T>::unapply(const T& value) const {
    auto tree = to_node(value, config_);
    if (!tree) {
        return std::unexpected(std::move(tree.error()));
    }
    auto fields = multipart::fields_from_tree(*tree, config_);
    if (!fields) {
        return std::unexpected(std::move(fields.error()));
    }
    return multipart::frame(*fields, boundary_);
}

template<typename T>
result<T> multipart_conversion<T>::apply(std::string_view body) const {
    auto parts = multipart::parse(body, boundary_);
    if (!parts) {
        return std::unexpected(std::move(parts.error()));
    }
    return decode_parts(*parts);
}

template<typename T>
result<T> multipart_conversion<T>::apply(std::string_view body, std::string_view content_type_header) const {
    auto announced = multipart::boundary_from_content_type(content_type_header);
    if (!announced) {
        return std::unexpected(std::move(announced.error()));
    }
    auto parts = multipart::parse(body, *announced);
    if (!parts) {
        return std::unexpected(std::move(parts.error()));
    }
    return decode_parts(*parts);
}

template<typename T>
result<T> multipart_conversion<T>::decode_parts(const std::vector<multipart::parsed_part>& parts) const {
    auto tree = urlencoded::parser(config_.nesting).parse_pairs(to_pairs(parts));
    if (!tree) {
        return std::unexpected(std::move(tree.error()));
    }
    return from_node<T>(*tree, config_);
}

// =============================================================================
// File Upload
// =============================================================================

inline file_upload::file_upload(std::string field_name, std::string filename, file_type type,
                                std::size_t max_size)
    : field_name_(std::move(field_name)),
      filename_(std::move(filename)),
      rule_{std::move(type), max_size},
      boundary_(multipart::generate_boundary()) {}

inline file_upload file_upload::csv(std::string field_name, std::string filename, std::size_t max_size) {
    return file_upload(std::move(field_name), std::move(filename), file_types::csv(), max_size);
}

inline file_upload file_upload::pdf(std::string field_name, std::string filename, std::size_t max_size) {
    return file_upload(std::move(field_name), std::move(filename), file_types::pdf(), max_size);
}

inline file_upload file_upload::image(file_type image_type, std::string field_name, std::string filename,
                                      std::size_t max_size) {
    if (filename.empty()) {
        filename = "file." + image_type.extension;
    }
    return file_upload(std::move(field_name), std::move(filename), std::move(image_type), max_size);
}

inline std::string file_upload::content_type() const {
    return multipart::form_data_content_type(boundary_);
}

inline result<void> file_upload::validate(std::string_view payload) const {
    return rule_.check(payload);
}

inline result<std::string> file_upload::unapply(std::string_view payload) const {
    auto checked = validate(payload);
    if (!checked) {
        return std::unexpected(std::move(checked.error()));
    }
    std::vector<multipart::part> parts;
    parts.push_back(multipart::part::file(field_name_, filename_, rule_.type.content_type, std::string(payload)));
    return multipart::frame(parts, boundary_);
}

inline result<std::string> file_upload::apply(std::string_view body) const {
    return extract(body, boundary_);
}

inline result<std::string> file_upload::apply(std::string_view body, std::string_view content_type_header) const {
    auto announced = multipart::boundary_from_content_type(content_type_header);
    if (!announced) {
        return std::unexpected(std::move(announced.error()));
    }
    return extract(body, *announced);
}

inline result<std::string> file_upload::extract(std::string_view body, std::string_view boundary) const {
    auto parts = multipart::parse(body, boundary);
    if (!parts) {
        return std::unexpected(std::move(parts.error()));
    }
    for (auto& p : *parts) {
        if (p.name != field_name_) {
            continue;
        }
        auto checked = validate(p.payload);
        if (!checked) {
            return std::unexpected(std::move(checked.error()));
        }
        return std::move(p.payload);
    }
    return std::unexpected(missing_field(path{field_name_}));
}

} // namespace co::form
