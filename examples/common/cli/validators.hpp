#pragma once

#include <string>

#include <CLI/CLI.hpp>

#include "gridwire/config/codec.hpp"
#include "gridwire/frame/layout.hpp"


namespace gridwire::examples::cli {

// -------------------------------------------------------------
// Max frame size validator
// -------------------------------------------------------------
inline auto max_frame_size_validator = CLI::Validator(
    [](std::string& value) -> std::string {
        try {
            const auto n = std::stoull(value);
            if (n <= gridwire::frame::HEADER_SIZE) {
                return "Max frame size must exceed the " + std::to_string(gridwire::frame::HEADER_SIZE) + "-byte header";
            }
            if (n > gridwire::config::codec::MAX_FRAME_LENGTH) {
                return "Max frame size must fit in 31 bits";
            }
            return {};
        } catch (const std::exception&) {
            return "Max frame size must be a valid integer";
        }
    },
    "Frame size validator"
);


// -------------------------------------------------------------
// Correlation id validator (bit 31 is reserved)
// -------------------------------------------------------------
inline auto correlation_id_validator = CLI::Validator(
    [](std::string& value) -> std::string {
        try {
            if (std::stoull(value) > gridwire::frame::VALUE_MASK_31) {
                return "Correlation id must fit in 31 bits";
            }
            return {};
        } catch (const std::exception&) {
            return "Correlation id must be a valid integer";
        }
    },
    "Correlation id validator"
);


// -------------------------------------------------------------
// Log level validator
// -------------------------------------------------------------
inline auto log_level_validator = CLI::IsMember({"trace", "debug", "info", "warn", "error", "fatal", "off"});

} // namespace gridwire::examples::cli
