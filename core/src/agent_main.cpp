// hostlink agent
// User-side duplex client and loopback daemon

#include <filesystem>
#include <iostream>
#include <string>
#include "logging/logger.hpp"
#include "runtime/agent_host.hpp"
#include "runtime/config.hpp"
#include "runtime/signal_handler.hpp"

namespace
{
    bool starts_with(const std::string &arg, const std::string &prefix)
    {
        return arg.compare(0, prefix.size(), prefix) == 0;
    }
} // namespace

int main(int argc, char **argv)
{
    std::string config_path = "hostlink.yaml"; // Default
    bool config_explicit = false;
    std::string user_id;
    std::string server_url;
    std::string token;

    for (int i = 1; i < argc; ++i)
    {
        std::string arg = argv[i];

        if (arg == "--config" && i + 1 < argc)
        {
            config_path = argv[++i];
            config_explicit = true;
        }
        else if (starts_with(arg, "--config="))
        {
            config_path = arg.substr(9);
            config_explicit = true;
        }
        else if (starts_with(arg, "--user-id="))
        {
            user_id = arg.substr(10);
        }
        else if (starts_with(arg, "--server-url="))
        {
            server_url = arg.substr(13);
        }
        else if (starts_with(arg, "--token="))
        {
            token = arg.substr(8);
        }
        else if (arg == "--help" || arg == "-h")
        {
            std::cerr << "Usage: hostlink-agent [OPTIONS]\n\n";
            std::cerr << "Options:\n";
            std::cerr << "  --config=PATH       Path to config file (default: hostlink.yaml)\n";
            std::cerr << "  --user-id=ID        Override agent.user_id\n";
            std::cerr << "  --server-url=URL    Override agent.server_url (ws:// or wss://)\n";
            std::cerr << "  --token=TOKEN       Override agent.auth_token (or set HOSTLINK_AUTH_TOKEN)\n";
            std::cerr << "  --help, -h          Show this help\n";
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
        std::cerr << "ERROR: Config file not found: " << config_path << "\n";
        return 1;
    }
    else
    {
        LOG_WARN("No " << config_path << " found, using defaults");
    }

    // Command line wins over the file
    if (!user_id.empty())
    {
        config.agent.user_id = user_id;
    }
    if (!server_url.empty())
    {
        config.agent.server_url = server_url;
    }
    if (!token.empty())
    {
        config.agent.auth_token = token;
    }

    if (!hostlink::runtime::validate_agent_config(config, error))
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

    LOG_INFO("hostlink agent starting...");

    hostlink::runtime::SignalHandler::install();

    hostlink::runtime::AgentHost host(config);
    if (!host.initialize(error))
    {
        LOG_ERROR("Agent initialization failed: " << error);
        return 1;
    }

    LOG_INFO("Agent Ready");
    LOG_INFO("  Bridge: " << config.agent.server_url << config.agent.path);
    if (config.daemon.http.enabled)
    {
        LOG_INFO("  Daemon: http://" << config.daemon.http.bind << ":" << config.daemon.http.port);
    }

    const bool ok = host.run();
    host.shutdown();

    LOG_INFO("Shutdown complete");
    return ok ? 0 : 1;
}
