// MediaRelay Relay Server
// Runs the signaling server with HLS recording until SIGINT or SIGTERM

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

#include "mediarelay/mediarelay.hpp"
#include "mediarelay/pal/linux/linux_log_sinks.hpp"

std::atomic<bool> g_running{true};
std::atomic<bool> g_engineFailed{false};

void signalHandler(int) {
    g_running = false;
}

void printUsage(const char* programName) {
    std::cout << "MediaRelay Server v" << mediarelay::version() << "\n"
              << "Usage: " << programName << " [options] [config.json]\n"
              << "\nOptions:\n"
              << "  -p, --port PORT       Signaling port (default: 3001)\n"
              << "  --print-config        Print the effective configuration and exit\n"
              << "  -h, --help            Show this help\n"
              << "\nEnvironment overrides: MEDIARELAY_PORT, MEDIARELAY_BIND_ADDRESS,\n"
              << "  MEDIARELAY_LOG_LEVEL, MEDIARELAY_LOG_JSON, MEDIARELAY_ANNOUNCED_IP,\n"
              << "  MEDIARELAY_HLS_ROOT, MEDIARELAY_ENCODER_PATH, MEDIARELAY_WORKER_THREADS\n"
              << "\nSignaling:  ws://localhost:3001/\n"
              << "Playback:   http://localhost:3001/api/hls/<stream>/playlist.m3u8\n"
              << std::endl;
}

int main(int argc, char* argv[]) {
    std::string configPath;
    uint16_t portOverride = 0;
    bool printConfig = false;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            printUsage(argv[0]);
            return 0;
        } else if ((arg == "-p" || arg == "--port") && i + 1 < argc) {
            char* end = nullptr;
            unsigned long port = std::strtoul(argv[++i], &end, 10);
            if (*end != '\0' || port == 0 || port > 65535) {
                std::cerr << "Invalid port: " << argv[i] << std::endl;
                return 1;
            }
            portOverride = static_cast<uint16_t>(port);
        } else if (arg == "--print-config") {
            printConfig = true;
        } else if (!arg.empty() && arg[0] != '-') {
            configPath = arg;
        } else {
            std::cerr << "Unknown option: " << arg << std::endl;
            printUsage(argv[0]);
            return 1;
        }
    }

    auto logger = std::make_shared<mediarelay::core::StructuredLogger>();
    logger->addSink(std::make_shared<mediarelay::pal::linux::ConsoleSink>());

    mediarelay::core::ConfigManager configManager;
    configManager.setLogCallback([logger](const std::string& message) {
        logger->info(message, "Config");
    });

    if (!configPath.empty()) {
        auto loaded = configManager.loadFromFile(configPath);
        if (loaded.isError()) {
            std::cerr << "[ERROR] " << configPath << ": " << loaded.error().message << std::endl;
            return 1;
        }
    }

    configManager.applyEnvironmentOverrides();

    auto valid = configManager.validate();
    if (valid.isError()) {
        std::cerr << "[ERROR] Invalid configuration";
        if (!valid.error().field.empty()) {
            std::cerr << " (" << valid.error().field << ")";
        }
        std::cerr << ": " << valid.error().message << std::endl;
        return 1;
    }

    if (printConfig) {
        std::cout << configManager.dumpConfig() << std::endl;
        return 0;
    }

    mediarelay::core::Configuration config = configManager.getConfig();
    if (portOverride != 0) {
        config.server.port = portOverride;
    }

    logger->setLevel(config.logging.level);
    logger->setJsonFormat(config.logging.json);
    if (config.logging.syslog) {
        logger->addSink(std::make_shared<mediarelay::pal::linux::SyslogSink>("mediarelay"));
    }

    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);

    mediarelay::api::SignalingServer server;
    server.setFatalErrorCallback([](const std::string&) {
        g_engineFailed = true;
        g_running = false;
    });

    auto initResult = server.initialize(config, logger);
    if (initResult.isError()) {
        logger->error("Failed to initialize: " + initResult.error().message, "Main");
        return 1;
    }

    auto startResult = server.start();
    if (startResult.isError()) {
        logger->error("Failed to start: " + startResult.error().message, "Main");
        return 1;
    }

    logger->info("Server running on port " + std::to_string(server.port()) +
                 ", HLS output in " + config.recording.outputRoot, "Main");

    while (g_running) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }

    if (g_engineFailed) {
        logger->error("Media engine failed, shutting down", "Main");
    } else {
        logger->info("Shutdown requested", "Main");
    }

    auto stopResult = server.stop();
    if (stopResult.isError()) {
        logger->error("Failed to stop cleanly: " + stopResult.error().message, "Main");
        return 1;
    }

    return g_engineFailed ? 1 : 0;
}
