// hostlink bridge
// Cloud-side WebSocket endpoint, request correlator and REST API

#include <filesystem>
#include <iostream>
#include <string>
#include "logging/logger.hpp"
#include "runtime/bridge_runtime.hpp"
#include "runtime/config.hpp"
#include "runtime/signal_handler.hpp"

int main(int argc, char **argv)
{
    std::string config_path = "hostlink.yaml"; // Default
    bool config_explicit = false;

    for (int i = 1; i < argc; ++i)
    {
        std::string arg = argv[i];

        if (arg == "--config" && i + 1 < argc)
        {
            config_path = argv[++i];
            config_explicit = true;
        }
        else if (arg.substr(0, 9) == "--config=")
        {
            config_path = arg.substr(9);
            config_explicit = true;
        }
        else if (arg == "--help" || arg == "-h")
        {
            std::cerr << "Usage: hostlink-bridge [OPTIONS]\n\n";
            std::cerr << "Options:\n";
            std::cerr << "  --config=PATH    Path to config file (default: hostlink.yaml)\n";
            std::cerr << "  --help, -h       Show this help\n";
            return 0;
        }
        else
        {
            std::cerr << "Unknown argument: " << arg << "\n";
            std::cerr << "Use --help for usage information\n";
            return 1;
        }
    }

    hostlink::runtime::HostlinkConfig config;
    std::string error;

    if (std::filesystem::exists(config_path))
    {
        if (!hostlink::runtime::load_config(config_path, config, error))
        {
            LOG_ERROR("Failed to load config: " << error);
            return 1;
        }
    }
    else if (config_explicit)
    {
        // Using cerr here as logger might not be initialized/configured
        std::cerr << "ERROR: Config file not found: " << config_path << "\n";
        return 1;
    }
    else
    {
        LOG_WARN("No " << config_path << " found, using defaults");
    }

    if (!hostlink::runtime::validate_bridge_config(config, error))
    {
        LOG_ERROR("Invalid config: " << error);
        return 1;
    }

    hostlink::logging::Logger::set_level(hostlink::logging::string_to_level(config.logging.level));
    if (!config.logging.file.empty() && !hostlink::logging::Logger::set_file(config.logging.file, error))
    {
        LOG_ERROR("Cannot open log file: " << error);
        return 1;
    }

    LOG_INFO("hostlink bridge starting...");

    hostlink::runtime::SignalHandler::install();

    hostlink::runtime::BridgeRuntime runtime(config);
    if (!runtime.initialize(error))
    {
        LOG_ERROR("Bridge initialization failed: " << error);
        return 1;
    }

    LOG_INFO("Bridge Ready");
    LOG_INFO("  WebSocket: " << config.bridge.websocket.bind << ":" << config.bridge.websocket.port
                             << config.bridge.websocket.path);
    if (config.bridge.api.enabled)
    {
        LOG_INFO("  REST API: " << config.bridge.api.bind << ":" << config.bridge.api.port);
    }

    runtime.run();
    runtime.shutdown();

    LOG_INFO("Shutdown complete");
    return 0;
}
