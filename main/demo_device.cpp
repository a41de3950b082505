/**
 * ScanLink SDK Demo - Simulated acquisition device
 *
 * Connects to the device manager with the credentials from a client
 * configuration, waits for "start" commands and answers each one with a
 * simulated acquisition: progress updates in steps, then one acquisition
 * packet file uploaded as the result.
 */

#include <atomic>
#include <chrono>
#include <algorithm>
#include <cmath>
#include <csignal>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

#include <getopt.h>

#include "oatpp/core/base/Environment.hpp"

#include "scanlink_sdk.h"
#include "shared/protocol/acquisition_packet.h"

namespace
{

std::atomic<bool> g_shutdown_requested{false};

void signal_handler(int)
{
    g_shutdown_requested = true;
}

struct Arguments
{
    std::string config_file = "device.json";
    std::string output_dir = "acquisitions";
    int steps = 10;
    int step_ms = 500;
    int samples = 256;
    int verbosity = 0;
    bool help = false;
};

void print_usage(const char *program_name)
{
    std::cout << "ScanLink demo device\n\n";
    std::cout << "Usage: " << program_name << " [OPTIONS]\n\n";
    std::cout << "Options:\n";
    std::cout << "  -c, --config FILE      Client configuration (default: device.json)\n";
    std::cout << "  -o, --output DIR       Directory for acquisition files (default: acquisitions)\n";
    std::cout << "  -s, --steps N          Progress steps per scan (default: 10)\n";
    std::cout << "  -d, --step-delay MS    Delay between steps (default: 500)\n";
    std::cout << "  -n, --samples N        Samples per readout (default: 256)\n";
    std::cout << "  -v, --verbose          Increase verbosity\n";
    std::cout << "  -h, --help             Show this help message\n";
    std::cout << std::endl;
}

Arguments parse_arguments(int argc, char *argv[])
{
    Arguments args;

    static struct option long_options[] = {
        {"config", required_argument, 0, 'c'},
        {"output", required_argument, 0, 'o'},
        {"steps", required_argument, 0, 's'},
        {"step-delay", required_argument, 0, 'd'},
        {"samples", required_argument, 0, 'n'},
        {"verbose", no_argument, 0, 'v'},
        {"help", no_argument, 0, 'h'},
        {0, 0, 0, 0}};

    int c;
    while ((c = getopt_long(argc, argv, "c:o:s:d:n:vh", long_options, nullptr)) != -1)
    {
        try
        {
            switch (c)
            {
            case 'c':
                args.config_file = optarg;
                break;
            case 'o':
                args.output_dir = optarg;
                break;
            case 's':
                args.steps = std::max(1, std::stoi(optarg));
                break;
            case 'd':
                args.step_ms = std::max(0, std::stoi(optarg));
                break;
            case 'n':
                args.samples = std::max(1, std::stoi(optarg));
                break;
            case 'v':
                args.verbosity++;
                break;
            case 'h':
                args.help = true;
                break;
            default:
                exit(1);
            }
        }
        catch (const std::exception &)
        {
            std::cerr << "Invalid value for -" << static_cast<char>(c) << ": " << optarg << std::endl;
            exit(1);
        }
    }
    return args;
}

// One readout per step: a decaying complex sinusoid, interleaved re/im float32
scanlink::protocol::AcquisitionItem simulate_readout(uint32_t id, int samples)
{
    scanlink::protocol::AcquisitionItem item;
    item.id = id;
    item.coil_count = 1;
    item.sample_count = static_cast<uint32_t>(samples);
    item.payload.resize(static_cast<size_t>(samples) * 2 * sizeof(float));

    float *values = reinterpret_cast<float *>(&item.payload[0]);
    for (int i = 0; i < samples; ++i)
    {
        float t = static_cast<float>(i) / static_cast<float>(samples);
        float decay = std::exp(-3.0f * t);
        values[2 * i] = decay * std::cos(2.0f * 3.14159265f * (id + 1) * t);
        values[2 * i + 1] = decay * std::sin(2.0f * 3.14159265f * (id + 1) * t);
    }
    return item;
}

} // namespace

int main(int argc, char *argv[])
{
    using namespace scanlink;

    Arguments args = parse_arguments(argc, argv);
    if (args.help)
    {
        print_usage(argv[0]);
        return 0;
    }

    std::unique_ptr<sdk::ClientConfig> config;
    try
    {
        config = sdk::ClientConfig::from_file(args.config_file);
    }
    catch (const std::exception &e)
    {
        std::cerr << "Failed to load configuration: " << e.what() << std::endl;
        return 1;
    }
    if (!config->validate())
    {
        return 1;
    }

    logging::LogLevel level = logging::LoggerManager::string_to_level(config->log_level);
    if (args.verbosity == 1)
        level = logging::LogLevel::INFO;
    else if (args.verbosity >= 2)
        level = logging::LogLevel::DEBUG;
    logging::setup_logging(level, config->log_file, config->log_file.empty());
    auto logger = logging::get_logger("demo_device");

    std::error_code ec;
    std::filesystem::create_directories(args.output_dir, ec);
    if (ec)
    {
        logger->error("Cannot create output directory", logging::LogContext().add("path", args.output_dir).add("error", ec.message()));
        return 1;
    }

    signal(SIGINT, signal_handler);
    signal(SIGTERM, signal_handler);

    oatpp::base::Environment::init();
    int exit_code = 0;
    {
        sdk::WebSocketTransport transport(config->endpoint);
        sdk::DeviceClient client(*config, transport);

        client.setFeedbackHandler([logger](const std::string &message) {
            logger->info("Feedback", logging::LogContext().add("message", message));
        });
        client.setErrorHandler([logger](const std::string &message) {
            logger->warning("Server message not understood", logging::LogContext().add("message", message));
        });

        client.setScanCallback([&](const protocol::AcquisitionPayload &task, sdk::CancellationToken &token) {
            logger->info("Scan started", logging::LogContext().add("task_id", task.id));

            std::vector<protocol::AcquisitionItem> readouts;
            for (int step = 1; step <= args.steps; ++step)
            {
                if (!token.waitFor(std::chrono::milliseconds(args.step_ms)))
                {
                    token.throwIfCancelled();
                }
                readouts.push_back(simulate_readout(static_cast<uint32_t>(step - 1), args.samples));

                int progress = step * 100 / args.steps;
                // 100% is reported by the server once the result file is stored
                if (progress < 100)
                {
                    client.sendScanningStatus(progress, task.id, task.access_token);
                }
            }

            std::filesystem::path file = std::filesystem::path(args.output_dir) / (task.id + ".acq");
            std::ofstream out(file, std::ios::binary | std::ios::trunc);
            out << protocol::encode_acquisition_packet(readouts);
            out.close();
            if (!out)
            {
                throw std::runtime_error("Failed to write " + file.string());
            }

            sdk::UploadJob job;
            job.file_path = file.string();
            job.name = file.filename().string();
            job.device_parameter = task.device_parameter;
            job.task_id = task.id;
            job.user_access_token = task.access_token;
            client.uploadFileResult(job);
        });

        if (!client.start())
        {
            logger->error("Could not connect to the device manager");
            exit_code = 1;
        }
        else
        {
            while (!g_shutdown_requested)
            {
                std::this_thread::sleep_for(std::chrono::milliseconds(200));
            }
            logger->info("Shutting down");
            client.stop();
        }
    }
    oatpp::base::Environment::destroy();
    return exit_code;
}
