#include <algorithm>
#include <cctype>
#include <chrono>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include "walrus/net/client.hpp"
#include "walrus/net/frame.hpp"

using walrus::net::Client;
using walrus::net::ClientOptions;

namespace {

void print_usage(const char* program) {
    std::cout << "Usage: " << program << " [options] <command> [args...]\n"
              << "Options:\n"
              << "  -H, --host HOST   Server host (default: 127.0.0.1)\n"
              << "  -p, --port PORT   Server port (default: 6379)\n"
              << "  --timeout SECS    Socket timeout (default: 30)\n"
              << "  --help            Show this help\n"
              << "\n"
              << "Commands:\n"
              << "  ping [msg]                          Health check, echoes msg if given\n"
              << "  get key                             Retrieve a value\n"
              << "  set key value [ex secs | px millis] Store a value, optionally with a TTL\n"
              << "  rpush key item [item ...]           Append to a list\n"
              << "\n"
              << "Anything else is sent as is and the raw reply is printed.\n";
}

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

int usage_error(const std::string& usage) {
    std::cerr << "ERROR usage: " << usage << std::endl;
    return 1;
}

int run(Client& client, const std::vector<std::string>& args) {
    std::string cmd = to_lower(args[0]);

    if (cmd == "ping") {
        if (args.size() > 2) {
            return usage_error("ping [msg]");
        }
        std::optional<std::string> msg;
        if (args.size() == 2) {
            msg = args[1];
        }
        std::cout << client.ping(msg) << std::endl;

    } else if (cmd == "get") {
        if (args.size() != 2) {
            return usage_error("get key");
        }
        auto value = client.get(args[1]);
        if (value) {
            std::cout << "\"" << *value << "\"" << std::endl;
        } else {
            std::cout << "(nil)" << std::endl;
        }

    } else if (cmd == "set") {
        if (args.size() == 3) {
            client.set(args[1], args[2]);
        } else if (args.size() == 5) {
            std::string option = to_lower(args[3]);
            auto amount = std::stoll(args[4]);
            if (option == "ex") {
                client.set(args[1], args[2], std::chrono::seconds(amount));
            } else if (option == "px") {
                client.set(args[1], args[2], std::chrono::milliseconds(amount));
            } else {
                return usage_error("set key value [ex secs | px millis]");
            }
        } else {
            return usage_error("set key value [ex secs | px millis]");
        }
        std::cout << "OK" << std::endl;

    } else if (cmd == "rpush") {
        if (args.size() < 3) {
            return usage_error("rpush key item [item ...]");
        }
        std::vector<std::string> items(args.begin() + 2, args.end());
        std::cout << "(integer) " << client.rpush(args[1], items) << std::endl;

    } else {
        walrus::net::FrameArrayBuilder builder;
        for (const auto& arg : args) {
            builder.push_bulk(arg);
        }
        auto reply = client.request(std::move(builder).build());
        std::cout << reply.to_string() << std::endl;
        if (reply.is(walrus::net::FrameType::Error)) {
            return 1;
        }
    }
    return 0;
}

}  // namespace

int main(int argc, char* argv[]) {
    ClientOptions opts;
    std::vector<std::string> args;

    try {
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            if (!args.empty()) {
                // everything after the command name belongs to the command
                args.push_back(arg);
            } else if ((arg == "-H" || arg == "--host") && i + 1 < argc) {
                opts.host = argv[++i];
            } else if ((arg == "-p" || arg == "--port") && i + 1 < argc) {
                opts.port = static_cast<uint16_t>(std::stoi(argv[++i]));
            } else if (arg == "--timeout" && i + 1 < argc) {
                opts.timeout_seconds = std::stoi(argv[++i]);
            } else if (arg == "--help") {
                print_usage(argv[0]);
                return 0;
            } else if (!arg.empty() && arg[0] == '-') {
                std::cerr << "Unknown option: " << arg << std::endl;
                print_usage(argv[0]);
                return 1;
            } else {
                args.push_back(arg);
            }
        }
    } catch (const std::exception& e) {
        std::cerr << "Invalid argument: " << e.what() << std::endl;
        return 1;
    }

    if (args.empty()) {
        print_usage(argv[0]);
        return 1;
    }

    Client client(opts);

    try {
        client.connect();
        int rc = run(client, args);
        client.disconnect();
        return rc;
    } catch (const std::exception& e) {
        std::cerr << "ERROR " << e.what() << std::endl;
        return 1;
    }
}
