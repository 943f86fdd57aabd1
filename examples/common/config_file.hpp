#pragma once

#include <cstdint>
#include <string>
#include <string_view>

#include "simdjson.h"

#include "lcr/optional.hpp"
#include "lcr/log/logger.hpp"

/*
================================================================================
Codec config file
================================================================================

Optional JSON file with codec settings for the example tools. Every key is
optional; CLI flags given explicitly override file values.

    {
      "max_frame_size": 1024,
      "version": 1,
      "type": 42,
      "correlation_id": 7,
      "payload_size": 10000,
      "log_level": "debug"
    }

Unknown keys are ignored. A key with the wrong JSON type fails the load.
================================================================================
*/

namespace gridwire::examples::config {

struct FileValues {
    lcr::optional<std::uint64_t> max_frame_size;
    lcr::optional<std::uint64_t> version;
    lcr::optional<std::uint64_t> type;
    lcr::optional<std::uint64_t> correlation_id;
    lcr::optional<std::uint64_t> payload_size;
    lcr::optional<std::string> log_level;
};

namespace helper {

// Missing key -> true (not present). Wrong type -> false.
[[nodiscard]]
inline bool parse_uint_optional(const simdjson::dom::element& root, const char* key, lcr::optional<std::uint64_t>& out) noexcept {
    auto field = root[key];
    if (field.error()) {
        return true;
    }
    std::uint64_t value = 0;
    if (field.get(value)) {
        return false;
    }
    out = value;
    return true;
}

[[nodiscard]]
inline bool parse_string_optional(const simdjson::dom::element& root, const char* key, lcr::optional<std::string>& out) {
    auto field = root[key];
    if (field.error()) {
        return true;
    }
    std::string_view value;
    if (field.get(value)) {
        return false;
    }
    out = std::string(value);
    return true;
}

} // namespace helper


[[nodiscard]]
inline bool load(const std::string& path, FileValues& out) {
    simdjson::dom::parser parser;
    simdjson::dom::element root;
    if (auto err = parser.load(path).get(root); err) {
        GW_ERROR("[CONFIG] Cannot load " << path << ": " << simdjson::error_message(err));
        return false;
    }
    if (root.type() != simdjson::dom::element_type::OBJECT) {
        GW_ERROR("[CONFIG] " << path << ": top-level value must be an object");
        return false;
    }

    const bool ok =
        helper::parse_uint_optional(root, "max_frame_size", out.max_frame_size) &&
        helper::parse_uint_optional(root, "version", out.version) &&
        helper::parse_uint_optional(root, "type", out.type) &&
        helper::parse_uint_optional(root, "correlation_id", out.correlation_id) &&
        helper::parse_uint_optional(root, "payload_size", out.payload_size) &&
        helper::parse_string_optional(root, "log_level", out.log_level);

    if (!ok) {
        GW_ERROR("[CONFIG] " << path << ": field has the wrong type");
        return false;
    }
    GW_DEBUG("[CONFIG] Loaded " << path
             << " (max_frame_size=" << out.max_frame_size
             << ", version=" << out.version
             << ", type=" << out.type
             << ", correlation_id=" << out.correlation_id
             << ", payload_size=" << out.payload_size
             << ", log_level=" << out.log_level << ")");
    return true;
}

} // namespace gridwire::examples::config
