#pragma once

#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <ostream>
#include <string>
#include <string_view>

#include <CLI/CLI.hpp>

#include "common/cli/validators.hpp"
#include "common/config_file.hpp"
#include "common/logger.hpp"
#include "gridwire/config/codec.hpp"
#include "gridwire/frame/layout.hpp"


namespace gridwire::examples::cli {

struct Params {
    std::string config_path;
    std::uint32_t max_frame_size = gridwire::config::codec::DEFAULT_MAX_FRAME_SIZE;
    std::uint32_t version        = gridwire::config::codec::PROTOCOL_VERSION;
    std::uint32_t type           = 42;
    std::uint32_t correlation_id = 7;
    std::uint64_t payload_size   = 10000;
    std::string log_level        = "info";
    bool color                   = false;

    inline void dump(const std::string& header, std::ostream& os) const {
        os << header << ":\n"
           << "  Config         : " << (config_path.empty() ? "(none)" : config_path) << "\n"
           << "  Max frame size : " << max_frame_size << "\n"
           << "  Version        : " << version << "\n"
           << "  Type           : " << type << "\n"
           << "  Correlation id : " << correlation_id << "\n"
           << "  Payload size   : " << payload_size << "\n"
           << "  Log level      : " << log_level << "\n";
    }
};

namespace detail {

// File value applies only when the flag was not given on the command line
template <typename T, typename U>
inline void apply_if_unset(const CLI::Option* opt, const lcr::optional<U>& file_value, T& target) {
    if (opt->count() == 0 && file_value) {
        target = static_cast<T>(*file_value);
    }
}

} // namespace detail


[[nodiscard]]
inline Params configure(int argc, char** argv, std::string_view description, std::string_view footer) {
    CLI::App app{std::string(description)};
    Params params{};

    auto* config_opt = app.add_option("-c,--config", params.config_path, "JSON codec config file")->check(CLI::ExistingFile);
    auto* frame_opt  = app.add_option("-m,--max-frame-size", params.max_frame_size, "Largest physical frame in bytes (header included)")
                          ->check(max_frame_size_validator)->default_val(params.max_frame_size);
    auto* ver_opt    = app.add_option("--protocol-version", params.version, "Protocol version written to the header")
                          ->check(CLI::Range(0u, 255u))->default_val(params.version);
    auto* type_opt   = app.add_option("-t,--type", params.type, "Message type code")
                          ->check(CLI::Range(0u, 65535u))->default_val(params.type);
    auto* cid_opt    = app.add_option("-i,--correlation-id", params.correlation_id, "Correlation id (31-bit)")
                          ->check(correlation_id_validator)->default_val(params.correlation_id);
    auto* size_opt   = app.add_option("-s,--payload-size", params.payload_size, "Logical payload size in bytes")
                          ->default_val(params.payload_size);
    auto* log_opt    = app.add_option("-l,--log-level", params.log_level, "Log level: trace | debug | info | warn | error | fatal | off")
                          ->check(log_level_validator)->default_val(params.log_level);
    app.add_flag("--color", params.color, "Colored log output");

    app.footer(std::string(footer));

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        std::exit(app.exit(e, std::cout, std::cerr));
    }

    set_log_level(params.log_level, params.color);

    if (config_opt->count() > 0) {
        config::FileValues file{};
        if (!config::load(params.config_path, file)) {
            std::exit(EXIT_FAILURE);
        }
        detail::apply_if_unset(frame_opt, file.max_frame_size, params.max_frame_size);
        detail::apply_if_unset(ver_opt, file.version, params.version);
        detail::apply_if_unset(type_opt, file.type, params.type);
        detail::apply_if_unset(cid_opt, file.correlation_id, params.correlation_id);
        detail::apply_if_unset(size_opt, file.payload_size, params.payload_size);
        detail::apply_if_unset(log_opt, file.log_level, params.log_level);

        set_log_level(params.log_level, params.color);
    }

    if (params.max_frame_size <= gridwire::frame::HEADER_SIZE || params.version > 255u ||
        params.type > 65535u || params.correlation_id > gridwire::frame::VALUE_MASK_31) {
        std::cerr << "Invalid codec settings after applying " << params.config_path << "\n";
        std::exit(EXIT_FAILURE);
    }

    return params;
}

} // namespace gridwire::examples::cli
