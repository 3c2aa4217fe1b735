#pragma once

#include "../log.hpp"

namespace co::form {

namespace detail {

inline std::shared_ptr<spdlog::logger>& installed_logger() {
    static std::shared_ptr<spdlog::logger> instance;
    return instance;
}

} // namespace detail

inline void set_logger(std::shared_ptr<spdlog::logger> logger) {
    detail::installed_logger() = std::move(logger);
}

inline spdlog::logger* logger() {
    if (auto& installed = detail::installed_logger()) {
        return installed.get();
    }
    return spdlog::default_logger_raw();
}

} // namespace co::form
