#pragma once

#include "../file_type.hpp"
#include "../log.hpp"
#include "scalar_impl.hpp"
#include <algorithm>

namespace co::form {

namespace detail {

inline bool matches_at(std::string_view payload, std::size_t offset, std::string_view magic) noexcept {
    return payload.size() >= offset + magic.size() &&
           payload.substr(offset, magic.size()) == magic;
}

inline result<void> require(bool matched, const char* expected) {
    if (!matched) {
        return std::unexpected(content_mismatch(expected));
    }
    return {};
}

inline file_type signature_type(const char* content_type, const char* extension,
                                file_type::validator_fn validator) {
    return file_type{content_type, extension, std::move(validator), true};
}

inline file_type plain_type(const char* content_type, const char* extension) {
    return file_type{content_type, extension, {}, false};
}

inline std::string lower(std::string_view text) {
    std::string out(text);
    for (auto& c : out) {
        c = ascii_lower(c);
    }
    return out;
}

} // namespace detail

namespace file_types {

using namespace std::string_view_literals;

// =============================================================================
// Images
// =============================================================================

inline file_type jpeg() {
    return detail::signature_type("image/jpeg", "jpg", [](std::string_view p) {
        return detail::require(detail::matches_at(p, 0, "\xFF\xD8\xFF"sv), "image/jpeg");
    });
}

inline file_type png() {
    return detail::signature_type("image/png", "png", [](std::string_view p) {
        return detail::require(detail::matches_at(p, 0, "\x89PNG\r\n\x1A\n"sv), "image/png");
    });
}

inline file_type gif() {
    return detail::signature_type("image/gif", "gif", [](std::string_view p) {
        return detail::require(
            detail::matches_at(p, 0, "GIF87a"sv) || detail::matches_at(p, 0, "GIF89a"sv),
            "image/gif");
    });
}

inline file_type webp() {
    return detail::signature_type("image/webp", "webp", [](std::string_view p) {
        return detail::require(
            detail::matches_at(p, 0, "RIFF"sv) && detail::matches_at(p, 8, "WEBP"sv),
            "image/webp");
    });
}

inline file_type tiff() {
    return detail::signature_type("image/tiff", "tiff", [](std::string_view p) {
        return detail::require(
            detail::matches_at(p, 0, "II*\0"sv) || detail::matches_at(p, 0, "MM\0*"sv),
            "image/tiff");
    });
}

inline file_type bmp() {
    return detail::signature_type("image/bmp", "bmp", [](std::string_view p) {
        return detail::require(detail::matches_at(p, 0, "BM"sv), "image/bmp");
    });
}

// ISO-BMFF: 'ftyp' box type at 4, major brand at 8
inline file_type heic() {
    return detail::signature_type("image/heic", "heic", [](std::string_view p) {
        return detail::require(
            detail::matches_at(p, 4, "ftyp"sv) && detail::matches_at(p, 8, "heic"sv),
            "image/heic");
    });
}

inline file_type avif() {
    return detail::signature_type("image/avif", "avif", [](std::string_view p) {
        return detail::require(
            detail::matches_at(p, 4, "ftyp"sv) && detail::matches_at(p, 8, "avif"sv),
            "image/avif");
    });
}

// =============================================================================
// Documents
// =============================================================================

inline file_type pdf() {
    return detail::signature_type("application/pdf", "pdf", [](std::string_view p) {
        return detail::require(detail::matches_at(p, 0, "%PDF"sv), "application/pdf");
    });
}

inline file_type csv() {
    return file_type{"text/csv", "csv", [](std::string_view p) {
        return detail::require(detail::is_valid_utf8(p), "text/csv");
    }, false};
}

inline file_type excel() {
    return detail::plain_type("application/vnd.openxmlformats-officedocument.spreadsheetml.sheet", "xlsx");
}

inline file_type json() { return detail::plain_type("application/json", "json"); }
inline file_type text() { return detail::plain_type("text/plain", "txt"); }

inline file_type docx() {
    return detail::plain_type("application/vnd.openxmlformats-officedocument.wordprocessingml.document", "docx");
}

inline file_type doc() { return detail::plain_type("application/msword", "doc"); }
inline file_type zip() { return detail::plain_type("application/zip", "zip"); }
inline file_type mp3() { return detail::plain_type("audio/mpeg", "mp3"); }
inline file_type wav() { return detail::plain_type("audio/wav", "wav"); }
inline file_type mp4() { return detail::plain_type("video/mp4", "mp4"); }
inline file_type sqlite() { return detail::plain_type("application/x-sqlite3", "sqlite"); }
inline file_type javascript() { return detail::plain_type("application/javascript", "js"); }
inline file_type ttf() { return detail::plain_type("font/ttf", "ttf"); }
inline file_type svg() { return detail::plain_type("image/svg+xml", "svg"); }

inline file_type custom(std::string content_type, std::string extension, file_type::validator_fn validator) {
    return file_type{std::move(content_type), std::move(extension), std::move(validator), false};
}

// =============================================================================
// Registry
// =============================================================================

inline const std::vector<file_type>& all() {
    static const std::vector<file_type> registry = {
        jpeg(), png(), gif(), webp(), tiff(), bmp(), heic(), avif(), pdf(),
        csv(), excel(), json(), text(), docx(), doc(), zip(), mp3(), wav(),
        mp4(), sqlite(), javascript(), ttf(), svg()
    };
    return registry;
}

inline std::optional<file_type> find_by_content_type(std::string_view content_type) {
    auto semi = content_type.find(';');
    auto mime = content_type.substr(0, semi);
    while (!mime.empty() && (mime.back() == ' ' || mime.back() == '\t')) mime.remove_suffix(1);
    while (!mime.empty() && (mime.front() == ' ' || mime.front() == '\t')) mime.remove_prefix(1);

    for (const auto& type : all()) {
        if (form::detail::iequals(type.content_type, mime)) {
            return type;
        }
    }
    return std::nullopt;
}

inline std::optional<file_type> find_by_extension(std::string_view extension) {
    if (!extension.empty() && extension.front() == '.') {
        extension.remove_prefix(1);
    }
    if (form::detail::iequals(extension, "jpeg")) {
        return jpeg();
    }
    if (form::detail::iequals(extension, "tif")) {
        return tiff();
    }
    for (const auto& type : all()) {
        if (form::detail::iequals(type.extension, extension)) {
            return type;
        }
    }
    return std::nullopt;
}

} // namespace file_types

// =============================================================================
// Validation
// =============================================================================

inline std::optional<file_type> detect(std::string_view payload) {
    for (const auto& type : file_types::all()) {
        if (type.has_signature && type.validator && type.validator(payload)) {
            return type;
        }
    }
    return std::nullopt;
}

inline result<void> validate(std::string_view payload, const file_type& type) {
    if (!type.validator) {
        return {};
    }
    auto checked = type.validator(payload);
    if (!checked) {
        auto failure = std::move(checked.error());
        if (failure.code == error_code::content_mismatch && failure.detected.empty()) {
            if (auto found = detect(payload)) {
                failure.detected = found->content_type;
            }
        }
        logger()->debug("upload rejected: {}", describe(failure));
        return std::unexpected(std::move(failure));
    }
    return {};
}

inline result<void> upload_rule::check(std::string_view payload) const {
    if (payload.empty()) {
        logger()->debug("upload rejected: empty payload for {}", type.content_type);
        return std::unexpected(empty_data());
    }
    if (payload.size() > max_size) {
        logger()->debug("upload rejected: {} bytes over limit {}", payload.size(), max_size);
        return std::unexpected(file_too_large(payload.size(), max_size));
    }
    return validate(payload, type);
}

} // namespace co::form
