#pragma once

#include <string_view>

#include "lcr/log/logger.hpp"


namespace gridwire::examples {

inline void set_log_level(std::string_view log_level, bool color = false) {
    auto& logger = lcr::log::Logger::instance();
    logger.set_level(lcr::log::parse_level(log_level));
    logger.enable_color(color);
}

} // namespace gridwire::examples
