#pragma once

#include <string_view>

namespace co::form::content_types {

inline constexpr std::string_view form_urlencoded = "application/x-www-form-urlencoded";
inline constexpr std::string_view multipart_form_data = "multipart/form-data";
inline constexpr std::string_view text_plain = "text/plain";
inline constexpr std::string_view text_csv = "text/csv";
inline constexpr std::string_view application_json = "application/json";
inline constexpr std::string_view application_pdf = "application/pdf";
inline constexpr std::string_view octet_stream = "application/octet-stream";

} // namespace co::form::content_types
