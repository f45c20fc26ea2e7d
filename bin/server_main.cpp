#include <iostream>

#include "respkv/core/store.hpp"
#include "respkv/net/server.hpp"
#include "respkv/util/config.hpp"
#include "respkv/util/logger.hpp"
#include "respkv/util/signal_handler.hpp"

int main(int argc, char* argv[]) {
    try {
        respkv::util::Config defaults;
        respkv::util::Config file_config = defaults;

        // load config file if specified
        if (auto config_path = respkv::util::Config::find_config_path(argc, argv)) {
            auto loaded = respkv::util::Config::load_file(*config_path);
            if (loaded) {
                file_config = *loaded;
            } else {
                std::cerr << "Warning: Could not load config file: " << *config_path << std::endl;
            }
        }

        auto cli_config = respkv::util::Config::parse_args(argc, argv);
        if (!cli_config) {
            return 0;  // --help was shown
        }

        // CLI > file > defaults
        auto config = respkv::util::Config::merge(file_config, *cli_config, defaults);

        respkv::util::Logger::instance().set_level(config.log_level);

        // the one keyspace every request runs against
        respkv::core::Store store;

        respkv::net::ServerOptions server_opts;
        server_opts.host = config.host;
        server_opts.port = config.port;
        server_opts.client_timeout_seconds = config.client_timeout_seconds;
        server_opts.limits.max_bulk_length = config.max_bulk_length;
        server_opts.limits.max_array_length = config.max_array_length;

        respkv::net::Server server(store, server_opts);

        respkv::util::SignalHandler::install();

        server.start();
        LOG_INFO("Press Ctrl+C to shutdown");

        respkv::util::SignalHandler::wait_for_shutdown();

        server.stop();
        LOG_INFO("Shutdown complete, " + std::to_string(store.size()) + " keys in memory discarded");
        return 0;

    } catch (const std::exception& e) {
        LOG_ERROR("fatal error: " + std::string(e.what()));
        return 1;
    }
}
