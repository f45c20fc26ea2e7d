#ifndef RESPKV_UTIL_CONFIG_HPP
#define RESPKV_UTIL_CONFIG_HPP

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

#include "respkv/util/logger.hpp"

namespace respkv::util {

struct Config {
    // server
    std::string host = "0.0.0.0";
    uint16_t port = 6379;
    int client_timeout_seconds = 300;

    // protocol limits
    std::size_t max_bulk_length = 512 * 1024 * 1024;
    std::size_t max_array_length = 1024 * 1024;

    // logging
    LogLevel log_level = LogLevel::Info;

    // Load from file (key = value lines, '#' comments)
    static std::optional<Config> load_file(const std::filesystem::path& path);

    // parse CLI args, returns nullopt on --help
    static std::optional<Config> parse_args(int argc, char* argv[]);

    // value of -c/--config, if given
    static std::optional<std::filesystem::path> find_config_path(int argc, char* argv[]);

    // merge: CLI overrides file overrides defaults
    static Config merge(const Config& file_config, const Config& cli_config,
                        const Config& defaults);
};

[[nodiscard]] std::optional<LogLevel> parse_log_level(const std::string& s);

}  // namespace respkv::util

#endif
