#pragma once

#include "../core.hpp"
#include <cstddef>
#include <random>
#include <string>
#include <string_view>

namespace co::form::multipart {

// =============================================================================
// Boundary Token
// =============================================================================

inline constexpr std::string_view boundary_prefix = "Boundary-";
inline constexpr std::size_t boundary_random_length = 24;

// RFC 2046 caps a boundary at 70 characters
inline constexpr std::size_t max_boundary_length = 70;

// "Boundary-" followed by 24 random alphanumerics. Collisions with payload
// bytes are not checked.
inline std::string generate_boundary() {
    static constexpr char chars[] =
        "0123456789ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz";
    // Eight 32-bit draws so the seed carries more entropy than one boundary
    thread_local std::mt19937_64 engine = [] {
        std::random_device device;
        std::seed_seq seed{device(), device(), device(), device(),
                           device(), device(), device(), device()};
        return std::mt19937_64{seed};
    }();
    std::uniform_int_distribution<std::size_t> pick(0, sizeof(chars) - 2);

    std::string boundary(boundary_prefix);
    boundary.reserve(boundary_prefix.size() + boundary_random_length);
    for (std::size_t i = 0; i < boundary_random_length; ++i) {
        boundary += chars[pick(engine)];
    }
    return boundary;
}

inline result<void> check_boundary(std::string_view boundary) {
    if (boundary.empty()) {
        return std::unexpected(malformed_boundary("boundary is empty"));
    }
    if (boundary.size() > max_boundary_length) {
        return std::unexpected(malformed_boundary("boundary longer than 70 characters"));
    }
    for (char c : boundary) {
        if (c == '\r' || c == '\n') {
            return std::unexpected(malformed_boundary("boundary contains a line break"));
        }
    }
    return {};
}

} // namespace co::form::multipart
