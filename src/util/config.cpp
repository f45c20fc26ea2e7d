#include "respkv/util/config.hpp"

#include <fstream>
#include <iostream>
#include <limits>
#include <string_view>

namespace respkv::util {

namespace {

std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

// std::stoull & friends throw on garbage. a bad value keeps the current setting
template <typename T>
void assign_number(T& target, const std::string& value, std::string_view name) {
    try {
        size_t pos = 0;
        unsigned long long parsed = std::stoull(value, &pos);
        if (pos != value.size() || value.front() == '-' ||
            parsed > std::numeric_limits<T>::max()) {
            throw std::out_of_range(std::string(name));
        }
        target = static_cast<T>(parsed);
    } catch (const std::exception&) {
        LOG_WARN("Ignoring invalid value for " + std::string(name) + ": '" + value + "'");
    }
}

void assign_log_level(LogLevel& target, const std::string& value) {
    auto level = parse_log_level(value);
    if (level) {
        target = *level;
    } else {
        LOG_WARN("Ignoring unknown log level: '" + value + "'");
    }
}

}  // namespace

std::optional<LogLevel> parse_log_level(const std::string& s) {
    if (s == "debug") return LogLevel::Debug;
    if (s == "info") return LogLevel::Info;
    if (s == "warn") return LogLevel::Warn;
    if (s == "error") return LogLevel::Error;
    if (s == "none") return LogLevel::None;
    return std::nullopt;
}

std::optional<Config> Config::load_file(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return std::nullopt;
    }

    Config config;
    std::string line;

    while (std::getline(file, line)) {
        line = trim(line);

        if (line.empty() || line[0] == '#') {
            continue;
        }

        size_t eq = line.find('=');
        if (eq == std::string::npos) {
            continue;
        }

        std::string key = trim(line.substr(0, eq));
        std::string value = trim(line.substr(eq + 1));

        // remove quotes if present
        if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
            value = value.substr(1, value.size() - 2);
        }

        if (key == "host") {
            config.host = value;
        } else if (key == "port") {
            assign_number(config.port, value, key);
        } else if (key == "client_timeout_seconds") {
            assign_number(config.client_timeout_seconds, value, key);
        } else if (key == "max_bulk_length") {
            assign_number(config.max_bulk_length, value, key);
        } else if (key == "max_array_length") {
            assign_number(config.max_array_length, value, key);
        } else if (key == "log_level") {
            assign_log_level(config.log_level, value);
        } else {
            LOG_WARN("Unknown config key: " + key);
        }
    }

    return config;
}

std::optional<Config> Config::parse_args(int argc, char* argv[]) {
    Config config;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            std::cout << "Usage: " << argv[0] << " [options]\n"
                      << "Options:\n"
                      << "  -c, --config FILE          Config file path\n"
                      << "  -H, --host HOST            Host to bind (default: 0.0.0.0)\n"
                      << "  -p, --port PORT            Port to listen on (default: 6379)\n"
                      << "  -l, --log-level LEVEL      Log level: debug, info, warn, error, none\n"
                      << "  --client-timeout SEC       Client timeout seconds, 0 = none (default: 300)\n"
                      << "  --max-bulk-length N        Largest accepted bulk string (default: 536870912)\n"
                      << "  --max-array-length N       Largest accepted array count (default: 1048576)\n"
                      << "  -h, --help                 Show this help\n";
            return std::nullopt;
        }
        if ((arg == "-H" || arg == "--host") && i + 1 < argc) {
            config.host = argv[++i];
        } else if ((arg == "-p" || arg == "--port") && i + 1 < argc) {
            assign_number(config.port, argv[++i], "port");
        } else if ((arg == "-l" || arg == "--log-level") && i + 1 < argc) {
            assign_log_level(config.log_level, argv[++i]);
        } else if (arg == "--client-timeout" && i + 1 < argc) {
            assign_number(config.client_timeout_seconds, argv[++i], "client-timeout");
        } else if (arg == "--max-bulk-length" && i + 1 < argc) {
            assign_number(config.max_bulk_length, argv[++i], "max-bulk-length");
        } else if (arg == "--max-array-length" && i + 1 < argc) {
            assign_number(config.max_array_length, argv[++i], "max-array-length");
        } else if ((arg == "-c" || arg == "--config") && i + 1 < argc) {
            // config file handled by find_config_path
            ++i;
        } else {
            LOG_WARN("Ignoring unknown argument: " + arg);
        }
    }

    return config;
}

std::optional<std::filesystem::path> Config::find_config_path(int argc, char* argv[]) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if ((arg == "-c" || arg == "--config") && i + 1 < argc) {
            return std::filesystem::path(argv[i + 1]);
        }
    }
    return std::nullopt;
}

Config Config::merge(const Config& file_config, const Config& cli_config, const Config& defaults) {
    Config result = defaults;

    // file overrides defaults, CLI overrides file
    for (const Config* layer : {&file_config, &cli_config}) {
        if (layer->host != defaults.host) result.host = layer->host;
        if (layer->port != defaults.port) result.port = layer->port;
        if (layer->client_timeout_seconds != defaults.client_timeout_seconds)
            result.client_timeout_seconds = layer->client_timeout_seconds;
        if (layer->max_bulk_length != defaults.max_bulk_length)
            result.max_bulk_length = layer->max_bulk_length;
        if (layer->max_array_length != defaults.max_array_length)
            result.max_array_length = layer->max_array_length;
        if (layer->log_level != defaults.log_level) result.log_level = layer->log_level;
    }

    return result;
}

}  // namespace respkv::util
