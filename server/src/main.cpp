/**
 * ScanLink Device Manager
 * Main entry point of the device-facing WebSocket server
 */

#include <atomic>
#include <chrono>
#include <csignal>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

#include "oatpp/core/base/Environment.hpp"

#include "core/config.hpp"
#include "core/device_manager.hpp"
#include "services/device_authenticator.hpp"
#include "services/device_repository.hpp"
#include "shared/logging/logger.h"

// Command line argument parsing
#include <getopt.h>

namespace scanlink {

/**
 * Set by the signal handler, polled by the main loop
 */
std::atomic<bool> g_shutdown_requested{false};

void signal_handler(int) {
    g_shutdown_requested = true;
}

void setup_signal_handlers() {
    signal(SIGINT, signal_handler);
    signal(SIGTERM, signal_handler);
    signal(SIGQUIT, signal_handler);
}

void print_usage(const char* program_name) {
    std::cout << "ScanLink Device Manager\n\n";
    std::cout << "Usage: " << program_name << " [OPTIONS]\n\n";
    std::cout << "Options:\n";
    std::cout << "  -c, --config FILE        Configuration file path (default: device_manager.json)\n";
    std::cout << "  -p, --port PORT          Override server.port\n";
    std::cout << "  -v, --verbose            Increase verbosity (-v for INFO, -vv for DEBUG)\n";
    std::cout << "  -l, --log-file FILE      Log to file instead of console\n";
    std::cout << "      --provision FILE     Create a device from a details JSON file and print its credentials\n";
    std::cout << "  -h, --help               Show this help message\n";
    std::cout << "  --version                Show version information\n\n";
    std::cout << "Environment:\n";
    std::cout << "  DATA_LAKE_DIRECTORY      Root directory for uploaded results\n\n";
    std::cout << "Examples:\n";
    std::cout << "  " << program_name << " -c device_manager.json -v\n";
    std::cout << "  " << program_name << " --provision scanner.json\n";
    std::cout << std::endl;
}

void print_version() {
    std::cout << "ScanLink Device Manager v0.1.0" << std::endl;
}

struct Arguments {
    std::string config_file = "device_manager.json";
    int port = -1;
    int verbosity = 0;
    std::string log_file;
    std::string provision_file;
    bool help = false;
    bool version = false;
};

Arguments parse_arguments(int argc, char* argv[]) {
    Arguments args;

    enum { OPT_VERSION = 1000, OPT_PROVISION };

    static struct option long_options[] = {
        {"config",    required_argument, 0, 'c'},
        {"port",      required_argument, 0, 'p'},
        {"verbose",   no_argument,       0, 'v'},
        {"log-file",  required_argument, 0, 'l'},
        {"provision", required_argument, 0, OPT_PROVISION},
        {"help",      no_argument,       0, 'h'},
        {"version",   no_argument,       0, OPT_VERSION},
        {0, 0, 0, 0}
    };

    int c;
    int option_index = 0;

    while ((c = getopt_long(argc, argv, "c:p:vl:h", long_options, &option_index)) != -1) {
        switch (c) {
            case 'c':
                args.config_file = optarg;
                break;
            case 'p':
                try {
                    args.port = std::stoi(optarg);
                } catch (const std::exception&) {
                    std::cerr << "Invalid port: " << optarg << std::endl;
                    exit(1);
                }
                break;
            case 'v':
                args.verbosity++;
                break;
            case 'l':
                args.log_file = optarg;
                break;
            case OPT_PROVISION:
                args.provision_file = optarg;
                break;
            case 'h':
                args.help = true;
                break;
            case OPT_VERSION:
                args.version = true;
                break;
            case '?':
                // getopt_long already printed an error message
                exit(1);
            default:
                std::cerr << "Unknown option: " << c << std::endl;
                exit(1);
        }
    }

    return args;
}

/**
 * Load the configuration file, falling back to defaults when it does not exist
 */
std::unique_ptr<core::ManagerConfig> load_config(const std::string& path, const std::shared_ptr<logging::Logger>& logger) {
    if (!std::filesystem::exists(path)) {
        logger->warning("Configuration file not found, using defaults", logging::LogContext().add("config_file", path));
        return core::ManagerConfig::create_default();
    }
    return core::ManagerConfig::from_file(path);
}

int provision(const core::ManagerConfig& config, const std::string& details_file) {
    std::ifstream in(details_file);
    if (!in.is_open()) {
        std::cerr << "Cannot open device details file: " << details_file << std::endl;
        return 1;
    }

    nlohmann::json details_json = nlohmann::json::parse(in, nullptr, false);
    if (details_json.is_discarded()) {
        std::cerr << "Invalid JSON in device details file: " << details_file << std::endl;
        return 1;
    }

    auto details = protocol::DeviceDetails::from_json(details_json);
    services::SqliteDeviceRepository repository(config.storage.database_path);
    services::DeviceAuthenticator authenticator(repository, config.security.hash_iterations);
    auto credentials = authenticator.provision_device(details);

    std::cout << nlohmann::json{{"device_id", credentials.first}, {"device_token", credentials.second}}.dump(4)
              << std::endl;
    return 0;
}

} // namespace scanlink

int main(int argc, char* argv[]) {
    using namespace scanlink;

    try {
        auto args = parse_arguments(argc, argv);

        if (args.help) {
            print_usage(argv[0]);
            return 0;
        }

        if (args.version) {
            print_version();
            return 0;
        }

        // Bootstrap logging from the command line; the config file may raise it later
        logging::LogLevel log_level = logging::LogLevel::WARNING;
        if (args.verbosity == 1) {
            log_level = logging::LogLevel::INFO;
        } else if (args.verbosity >= 2) {
            log_level = logging::LogLevel::DEBUG;
        }
        logging::setup_logging(log_level, args.log_file, args.log_file.empty());
        auto logger = logging::get_logger("main");

        std::unique_ptr<core::ManagerConfig> config;
        try {
            config = load_config(args.config_file, logger);
        } catch (const std::exception& e) {
            logger->error("Failed to load configuration",
                          logging::LogContext().add("config_file", args.config_file).add("error", e.what()));
            return 1;
        }

        // Command-line overrides
        if (args.port > 0) {
            config->server.port = static_cast<uint16_t>(args.port);
        }
        config->apply_environment();

        if (args.verbosity == 0) {
            log_level = logging::LoggerManager::string_to_level(config->logging.level);
        }
        std::string log_file = args.log_file.empty() ? config->logging.file : args.log_file;
        logging::setup_logging(log_level, log_file, log_file.empty() || config->logging.console);

        if (!config->validate()) {
            logger->error("Configuration validation failed");
            return 1;
        }

        if (!args.provision_file.empty()) {
            return provision(*config, args.provision_file);
        }

        setup_signal_handlers();
        oatpp::base::Environment::init();

        int exit_code = 0;
        {
            core::DeviceManager manager(std::move(config));
            if (!manager.start()) {
                logger->error("Failed to start device manager");
                exit_code = 1;
            } else {
                logger->info("Device manager running", logging::LogContext().add("config_file", args.config_file));

                while (!g_shutdown_requested && manager.is_running()) {
                    std::this_thread::sleep_for(std::chrono::milliseconds(200));
                }

                logger->info("Shutting down gracefully...");
                manager.stop();
            }
        }

        oatpp::base::Environment::destroy();
        return exit_code;

    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << std::endl;
        return 1;
    }
}
