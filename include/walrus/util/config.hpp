#ifndef WALRUS_UTIL_CONFIG_HPP
#define WALRUS_UTIL_CONFIG_HPP

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

#include "walrus/util/logger.hpp"

namespace walrus::util {

struct Config {
    // server
    std::string host = "127.0.0.1";
    uint16_t port = 6379;
    std::size_t max_connections = 1000;
    int client_timeout_seconds = 0;  // 0 = no socket timeout

    // connection
    std::size_t read_buffer_kib = 32;

    // logging
    LogLevel log_level = LogLevel::Info;

    // Load from file (key = value lines)
    static std::optional<Config> load_file(const std::filesystem::path& path);

    // parse CLI args, returns nullopt on --help
    static std::optional<Config> parse_args(int argc, char* argv[]);

    // merge: CLI overrides file
    static Config merge(const Config& file_config, const Config& cli_config,
                        const Config& defaults);
};

[[nodiscard]] LogLevel parse_log_level(const std::string& s);

}  // namespace walrus::util

#endif
