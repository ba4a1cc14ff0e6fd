#include <chrono>
#include <filesystem>
#include <iostream>
#include <thread>

#include "walrus/core/db.hpp"
#include "walrus/net/server.hpp"
#include "walrus/util/config.hpp"
#include "walrus/util/logger.hpp"
#include "walrus/util/signal_handler.hpp"

int main(int argc, char* argv[]) {
    try {
        walrus::util::Config defaults;
        walrus::util::Config file_config = defaults;
        walrus::util::Config cli_config = defaults;

        // first pass: find config_path
        std::filesystem::path config_path;
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            if ((arg == "-c" || arg == "--config") && i + 1 < argc) {
                config_path = argv[++i];
                break;
            }
        }

        if (!config_path.empty()) {
            auto loaded = walrus::util::Config::load_file(config_path);
            if (loaded) {
                file_config = *loaded;
            } else {
                std::cerr << "Warning: Could not load config file: " << config_path << std::endl;
            }
        }

        auto cli_result = walrus::util::Config::parse_args(argc, argv);
        if (!cli_result) {
            return 0;  // --help was shown
        }
        cli_config = *cli_result;

        // CLI > file > defaults
        auto config = walrus::util::Config::merge(file_config, cli_config, defaults);

        walrus::util::Logger::instance().set_level(config.log_level);

        // the guard outlives the server so the reaper stops only after every handler is joined
        walrus::core::DbGuard db_guard;

        walrus::net::ServerOptions server_opts;
        server_opts.host = config.host;
        server_opts.port = config.port;
        server_opts.max_connections = config.max_connections;
        server_opts.client_timeout_seconds = config.client_timeout_seconds;
        server_opts.read_buffer_capacity = config.read_buffer_kib * 1024;

        walrus::net::Server server(db_guard.db(), server_opts);

        walrus::util::SignalHandler::install();

        server.start();

        WALRUS_LOG_INFO("Press Ctrl+C to shutdown");

        // wake up on a signal, or when the acceptor gives up and the server can't take clients
        while (!walrus::util::SignalHandler::should_shutdown() && !server.failed()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }

        bool failed = server.failed();
        if (failed) {
            WALRUS_LOG_ERROR("server can no longer accept connections, shutting down");
        } else {
            WALRUS_LOG_INFO("shutting down");
        }
        server.stop();
        db_guard.shutdown();

        WALRUS_LOG_INFO("Shutdown complete");
        return failed ? 1 : 0;

    } catch (const std::exception& e) {
        WALRUS_LOG_ERROR("fatal error: " + std::string(e.what()));
        return 1;
    }
}
