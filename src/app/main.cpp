/**
 * @file main.cpp
 * @brief ISO 8583 gateway CLI executable entrypoint
 *
 * Usage:
 *   iso8583_gateway --config <path>             Start with configuration file
 *   iso8583_gateway --config <path> --schema <path>
 *   iso8583_gateway --help                      Show help message
 *   iso8583_gateway --version                   Show version information
 */

#include "iso8583/gateway/config/config_loader.h"
#include "iso8583/gateway/engine/iso_engine.h"
#include "iso8583/gateway/integration/logger_adapter.h"

#include <atomic>
#include <cctype>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <string>
#include <string_view>
#include <thread>

namespace {

constexpr std::string_view VERSION = "0.1.0";
constexpr std::string_view PROGRAM_NAME = "iso8583_gateway";

std::atomic<bool> g_shutdown_requested{false};

void signal_handler(int signal) {
    if (signal == SIGINT || signal == SIGTERM) {
        g_shutdown_requested.store(true, std::memory_order_release);
    }
}

void install_signal_handlers() {
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);
}

void print_version() {
    std::cout << PROGRAM_NAME << " version " << VERSION << "\n";
    std::cout << "ISO 8583 Gateway - financial message codec and TCP dispatcher\n";
}

void print_usage() {
    std::cout << "Usage: " << PROGRAM_NAME << " [OPTIONS]\n\n";
    std::cout << "ISO 8583 Gateway - length-prefixed ISO 8583 request server\n\n";
    std::cout << "Options:\n";
    std::cout << "  -c, --config <path>    Path to configuration file (YAML/JSON)\n";
    std::cout << "  -s, --schema <path>    Field schema file (overrides schema.path)\n";
    std::cout << "  -h, --help             Show this help message\n";
    std::cout << "  -v, --version          Show version information\n";
    std::cout << "\n";
    std::cout << "Examples:\n";
    std::cout << "  " << PROGRAM_NAME << " --config /etc/iso8583/gateway.yaml\n";
    std::cout << "  " << PROGRAM_NAME
              << " -c ./gateway.yaml -s ./isopackager.yml\n";
    std::cout << "\n";
    std::cout << "Configuration:\n";
    std::cout << "  The configuration file should contain:\n";
    std::cout << "    - server: port, bind address, idle timeout\n";
    std::cout << "    - routing.fields: field indices forming the routing key\n";
    std::cout << "    - schema.path: ISO 8583 field schema document\n";
    std::cout << "    - logging.level: trace, debug, info, warning, error\n";
    std::cout << "\n";
    std::cout << "Signals:\n";
    std::cout << "  SIGINT  (Ctrl+C)    Graceful shutdown\n";
    std::cout << "  SIGTERM             Graceful shutdown\n";
}

struct cli_options {
    std::filesystem::path config_path;
    std::filesystem::path schema_path;
    bool show_help = false;
    bool show_version = false;
    bool valid = true;
    std::string error_message;
};

cli_options parse_args(int argc, char* argv[]) {
    cli_options opts;

    for (int i = 1; i < argc; ++i) {
        std::string_view arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            opts.show_help = true;
            return opts;
        }

        if (arg == "-v" || arg == "--version") {
            opts.show_version = true;
            return opts;
        }

        if (arg == "-c" || arg == "--config" || arg == "-s" ||
            arg == "--schema") {
            if (i + 1 >= argc) {
                opts.valid = false;
                opts.error_message = "Missing argument for " + std::string(arg);
                return opts;
            }
            if (arg == "-c" || arg == "--config") {
                opts.config_path = argv[++i];
            } else {
                opts.schema_path = argv[++i];
            }
            continue;
        }

        opts.valid = false;
        opts.error_message = "Unknown argument: " + std::string(arg);
        return opts;
    }

    return opts;
}

/**
 * @brief Answer every request with its response MTI and approval code
 */
void echo_approval(iso8583::gateway::codec::iso_message& message) {
    auto mti = message.mti();
    if (mti.size() == 4 &&
        std::isdigit(static_cast<unsigned char>(mti[2])) && mti[2] != '9') {
        mti[2] = static_cast<char>(mti[2] + 1);
        message.set_mti(mti);
    }
    if (!message.has_field(39)) {
        message.set_field(39, "00");
    }
}

}  // namespace

int main(int argc, char* argv[]) {
    using namespace iso8583::gateway;

    auto opts = parse_args(argc, argv);

    if (!opts.valid) {
        std::cerr << "Error: " << opts.error_message << "\n\n";
        print_usage();
        return EXIT_FAILURE;
    }

    if (opts.show_version) {
        print_version();
        return EXIT_SUCCESS;
    }

    if (opts.show_help) {
        print_usage();
        return EXIT_SUCCESS;
    }

    if (opts.config_path.empty()) {
        std::cerr << "Error: Configuration file required\n\n";
        print_usage();
        return EXIT_FAILURE;
    }

    auto config = config::config_loader::load(opts.config_path);
    if (!config) {
        std::cerr << "Failed to load configuration: "
                  << config.error().to_string() << "\n";
        return EXIT_FAILURE;
    }

    auto& logger = integration::get_logger();
    logger.set_level(config->logging.level);

    const auto schema_path =
        opts.schema_path.empty() ? config->schema_path : opts.schema_path;
    auto schema = config::config_loader::load_schema(schema_path);
    if (!schema) {
        std::cerr << "Failed to load field schema: "
                  << schema.error().to_string() << "\n";
        return EXIT_FAILURE;
    }

    std::cout << "Starting " << config->name << " " << VERSION << "...\n";
    std::cout << "Configuration: " << opts.config_path << "\n";
    std::cout << "Field schema:  " << schema_path << " ("
              << (*schema)->size() << " fields)\n";

    engine::iso_engine server(config->engine, *schema);
    server.add_default_handler(echo_approval);

    install_signal_handlers();

    auto start_result = server.run_in_background();
    if (!start_result) {
        std::cerr << "Failed to start server: "
                  << engine::to_string(start_result.error()) << "\n";
        return EXIT_FAILURE;
    }

    std::cout << config->name << " listening on port " << server.port() << "\n";
    std::cout << "Press Ctrl+C to shutdown...\n";

    while (!g_shutdown_requested.load(std::memory_order_acquire) &&
           server.is_running()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    std::cout << "\nShutdown signal received, stopping server...\n";
    server.stop();

    auto stats = server.statistics();
    std::cout << "Final statistics:\n";
    std::cout << "  Connections:        " << stats.total_connections << "\n";
    std::cout << "  Messages received:  " << stats.messages_received << "\n";
    std::cout << "  Responses sent:     " << stats.responses_sent << "\n";
    std::cout << "  Decode errors:      " << stats.decode_errors << "\n";
    std::cout << "  Unrouted messages:  " << stats.unrouted_messages << "\n";

    logger.flush();
    std::cout << config->name << " stopped successfully\n";
    return EXIT_SUCCESS;
}
