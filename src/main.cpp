#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include "buffer/adaptive_buffer_manager.hpp"
#include "core/adaptive_streaming_session.hpp"
#include "memory/memory_sampler.hpp"
#include "memory/polling_memory_monitor.hpp"
#include "network/network_monitor.hpp"
#include "utils/config.hpp"
#include "utils/error_handler.hpp"
#include "utils/logging.hpp"

using namespace streamingcore;

namespace {

std::atomic<bool> g_running(true);

void handleSignal(int) {
    g_running = false;
}

void printUsage(const char* program) {
    std::cout << "Usage: " << program << " [options]\n"
              << "Options:\n"
              << "  --config <path>       Load settings from a JSON file (default: config/streaming.json)\n"
              << "  --duration <seconds>  Stop after the given time (default: run until Ctrl+C)\n"
              << "  --log-level <level>   DEBUG, INFO, WARN or ERROR (overrides the config file)\n"
              << "  --help, -h            Show this help message\n";
}

} // namespace

int main(int argc, char* argv[]) {
    std::string configPath = "config/streaming.json";
    std::string logLevelOverride;
    int durationSeconds = 0;

    // Parse command line arguments
    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            configPath = argv[++i];
        } else if (arg == "--duration" && i + 1 < argc) {
            try {
                durationSeconds = std::stoi(argv[++i]);
            } catch (const std::exception&) {
                std::cerr << "Invalid duration: " << argv[i] << std::endl;
                return 1;
            }
            if (durationSeconds < 0) {
                std::cerr << "Duration must not be negative" << std::endl;
                return 1;
            }
        } else if (arg == "--log-level" && i + 1 < argc) {
            logLevelOverride = argv[++i];
        } else if (arg == "--help" || arg == "-h") {
            printUsage(argv[0]);
            return 0;
        } else {
            std::cerr << "Unknown option: " << arg << std::endl;
            printUsage(argv[0]);
            return 1;
        }
    }

    try {
        utils::Logger::initialize();

        auto config = utils::Config::load(configPath);
        utils::Logger::setLevel(utils::Logger::parseLevel(
            logLevelOverride.empty() ? config.getLogLevel() : logLevelOverride));

        utils::ErrorHandler::getInstance().setErrorCallback([](const utils::ErrorInfo& error) {
            if (error.severity == utils::ErrorSeverity::CRITICAL) {
                g_running = false;
            }
        });

        auto sampler = std::make_shared<memory::SystemMemorySampler>();
        auto memoryMonitor = std::make_shared<memory::PollingMemoryMonitor>(
            sampler, config.getMemoryThresholds());
        auto bufferManager = std::make_shared<buffer::AdaptiveBufferManager>(
            config.getMemoryThresholds(), config.getCeilingPolicy());

        // No network sampler ships with the monitor; quality stays at its default
        auto networkMonitor = std::make_shared<network::NetworkMonitor>();
        networkMonitor->initialize(config.getNetworkMonitoringIntervalMs(), config.getNetworkHistorySize());

        auto subscription = bufferManager->subscribe([](const buffer::BufferConfiguration& configuration) {
            std::cout << "Buffer configuration: " << configuration.toString() << std::endl;
        });

        std::signal(SIGINT, handleSignal);
        std::signal(SIGTERM, handleSignal);

        core::AdaptiveStreamingSession session(memoryMonitor, bufferManager, networkMonitor);
        session.start();

        std::cout << "Initial buffer configuration: "
                  << bufferManager->currentConfiguration().toString() << std::endl;
        if (durationSeconds == 0) {
            std::cout << "Press Ctrl+C to stop monitoring" << std::endl;
        }

        auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(durationSeconds);
        while (g_running.load()) {
            if (durationSeconds > 0 && std::chrono::steady_clock::now() >= deadline) {
                break;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }

        std::cout << "Shutting down..." << std::endl;
        session.stop();

        auto stats = bufferManager->getStatistics();
        std::cout << "Updates: " << static_cast<uint64_t>(stats["total_updates"])
                  << ", configuration changes: " << static_cast<uint64_t>(stats["configuration_changes"])
                  << std::endl;

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
