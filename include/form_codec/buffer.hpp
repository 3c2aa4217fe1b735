#pragma once

#include <cstdint>
#include <span>
#include <string>
#include <string_view>

namespace co::form {

// =============================================================================
// Output Buffer
// =============================================================================

// Accumulates wire output for the URL-encoded serializer and the multipart framer.
class output_buffer {
public:
    output_buffer() = default;
    explicit output_buffer(size_t initial_capacity);

    // Non-copyable, movable
    output_buffer(const output_buffer&) = delete;
    output_buffer& operator=(const output_buffer&) = delete;
    output_buffer(output_buffer&&) = default;
    output_buffer& operator=(output_buffer&&) = default;

    // Append data
    void append(std::string_view data);
    void append(std::span<const uint8_t> data);
    void append(char c);

    // Appends data followed by CRLF
    void append_line(std::string_view data = {});

    // Appends sep unless the buffer is still empty
    void append_separator(char sep);

    void reserve(size_t capacity);

    std::string_view view() const noexcept;
    std::span<const uint8_t> span() const noexcept;
    size_t size() const noexcept;
    bool empty() const noexcept;

    void clear() noexcept;

    // Transfer ownership
    std::string release_string();

private:
    std::string buffer_;
};

} // namespace co::form

// Include implementation
#include "detail/buffer_impl.hpp"
