#include "config.hpp"

#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <cstdlib>

#include "../logging/logger.hpp"

namespace hostlink {
namespace runtime {

namespace {

bool validate_http(const HttpConfig &http, const std::string &section, std::string &error) {
    if (!http.enabled) {
        return true;
    }
    if (http.port < 1 || http.port > 65535) {
        error = section + " port must be between 1 and 65535";
        return false;
    }
    if (http.thread_pool_size < 1) {
        error = section + " thread_pool_size must be at least 1";
        return false;
    }
    if (http.cors_allowed_origins.empty()) {
        error = section + ".cors_allowed_origins must not be empty";
        return false;
    }
    return true;
}

void load_http(const YAML::Node &node, HttpConfig &http) {
    if (node["enabled"]) {
        http.enabled = node["enabled"].as<bool>();
    }
    if (node["bind"]) {
        http.bind = node["bind"].as<std::string>();
    }
    if (node["port"]) {
        http.port = node["port"].as<int>();
    }

    // CORS allowlist (supports scalar or sequence)
    if (node["cors_allowed_origins"]) {
        const auto &origins_node = node["cors_allowed_origins"];
        http.cors_allowed_origins.clear();
        if (origins_node.IsSequence()) {
            for (const auto &origin : origins_node) {
                http.cors_allowed_origins.push_back(origin.as<std::string>());
            }
        } else if (origins_node.IsScalar()) {
            http.cors_allowed_origins.push_back(origins_node.as<std::string>());
        }
        if (http.cors_allowed_origins.empty()) {
            http.cors_allowed_origins.push_back("*");
        }
    }
    if (node["cors_allow_credentials"]) {
        http.cors_allow_credentials = node["cors_allow_credentials"].as<bool>();
    }
    if (node["thread_pool_size"]) {
        http.thread_pool_size = node["thread_pool_size"].as<int>();
    }
}

void load_bridge(const YAML::Node &node, BridgeConfig &bridge) {
    if (node["websocket"]) {
        const auto &ws = node["websocket"];
        if (ws["bind"]) {
            bridge.websocket.bind = ws["bind"].as<std::string>();
        }
        if (ws["port"]) {
            bridge.websocket.port = ws["port"].as<int>();
        }
        if (ws["path"]) {
            bridge.websocket.path = ws["path"].as<std::string>();
        }
    }
    if (node["api"]) {
        load_http(node["api"], bridge.api);
    }
    if (node["request_timeout_ms"]) {
        bridge.request_timeout_ms = node["request_timeout_ms"].as<int64_t>();
    }
    if (node["max_inflight_per_user"]) {
        bridge.max_inflight_per_user = node["max_inflight_per_user"].as<size_t>();
    }
    if (node["sweep_interval_ms"]) {
        bridge.sweep_interval_ms = node["sweep_interval_ms"].as<int>();
    }
    if (node["idle_timeout_ms"]) {
        bridge.idle_timeout_ms = node["idle_timeout_ms"].as<int64_t>();
    }
    if (node["daemon_url"]) {
        bridge.daemon_url = node["daemon_url"].as<std::string>();
    }
    if (node["health_timeout_ms"]) {
        bridge.health_timeout_ms = node["health_timeout_ms"].as<int>();
    }
    if (node["status_timeout_ms"]) {
        bridge.status_timeout_ms = node["status_timeout_ms"].as<int>();
    }
}

void load_agent(const YAML::Node &node, AgentConfig &agent) {
    if (node["server_url"]) {
        agent.server_url = node["server_url"].as<std::string>();
    }
    if (node["path"]) {
        agent.path = node["path"].as<std::string>();
    }
    if (node["user_id"]) {
        agent.user_id = node["user_id"].as<std::string>();
    }
    if (node["auth_token"]) {
        agent.auth_token = node["auth_token"].as<std::string>();
    }
    if (node["heartbeat_interval_ms"]) {
        agent.heartbeat_interval_ms = node["heartbeat_interval_ms"].as<int>();
    }
    if (node["connect_timeout_ms"]) {
        agent.connect_timeout_ms = node["connect_timeout_ms"].as<int>();
    }
    if (node["workers"]) {
        agent.workers = node["workers"].as<int>();
    }
    if (node["reconnect"]) {
        const auto &rc = node["reconnect"];
        if (rc["base_delay_ms"]) {
            agent.reconnect.base_delay_ms = rc["base_delay_ms"].as<int>();
        }
        if (rc["max_delay_ms"]) {
            agent.reconnect.max_delay_ms = rc["max_delay_ms"].as<int>();
        }
        if (rc["max_attempts"]) {
            agent.reconnect.max_attempts = rc["max_attempts"].as<int>();
        }
    }
    if (node["index"]) {
        const auto &index = node["index"];
        if (index["enabled"]) {
            agent.index.enabled = index["enabled"].as<bool>();
        }
        if (index["max_depth"]) {
            agent.index.max_depth = index["max_depth"].as<int>();
        }
    }
    if (node["exec"]) {
        const auto &exec = node["exec"];
        if (exec["shell"]) {
            agent.exec.shell = exec["shell"].as<std::string>();
        }
        if (exec["default_timeout_ms"]) {
            agent.exec.default_timeout_ms = exec["default_timeout_ms"].as<int64_t>();
        }
        if (exec["max_output_bytes"]) {
            agent.exec.max_output_bytes = exec["max_output_bytes"].as<size_t>();
        }
    }
}

}  // namespace

bool is_loopback_address(const std::string &address) {
    if (address == "localhost" || address == "::1" || address == "[::1]") {
        return true;
    }
    return address.rfind("127.", 0) == 0;
}

bool validate_logging_config(const LoggingConfig &config, std::string &error) {
    if (config.level != "debug" && config.level != "info" && config.level != "warn" && config.level != "error") {
        error = "Invalid log level: " + config.level;
        return false;
    }
    return true;
}

bool validate_bridge_config(const HostlinkConfig &config, std::string &error) {
    if (!validate_logging_config(config.logging, error)) {
        return false;
    }

    const auto &bridge = config.bridge;
    if (bridge.websocket.port < 1 || bridge.websocket.port > 65535) {
        error = "bridge.websocket port must be between 1 and 65535";
        return false;
    }
    if (bridge.websocket.path.empty() || bridge.websocket.path[0] != '/') {
        error = "bridge.websocket.path must start with '/'";
        return false;
    }
    if (!validate_http(bridge.api, "bridge.api", error)) {
        return false;
    }
    if (bridge.api.enabled && bridge.api.port == bridge.websocket.port) {
        error = "bridge.api and bridge.websocket must use different ports";
        return false;
    }
    if (bridge.request_timeout_ms < 100) {
        error = "bridge.request_timeout_ms must be >= 100ms";
        return false;
    }
    if (bridge.max_inflight_per_user < 1) {
        error = "bridge.max_inflight_per_user must be at least 1";
        return false;
    }
    if (bridge.sweep_interval_ms < 10 || bridge.sweep_interval_ms > 5000) {
        error = "bridge.sweep_interval_ms must be between 10 and 5000ms";
        return false;
    }
    if (bridge.idle_timeout_ms < 1000) {
        error = "bridge.idle_timeout_ms must be >= 1000ms";
        return false;
    }
    if (bridge.health_timeout_ms < 1 || bridge.status_timeout_ms < 1) {
        error = "bridge health/status probe timeouts must be positive";
        return false;
    }
    return true;
}

bool validate_agent_config(const HostlinkConfig &config, std::string &error) {
    if (!validate_logging_config(config.logging, error)) {
        return false;
    }

    const auto &agent = config.agent;
    if (agent.user_id.empty()) {
        error = "agent.user_id is required";
        return false;
    }
    if (agent.server_url.rfind("ws://", 0) != 0 && agent.server_url.rfind("wss://", 0) != 0) {
        error = "agent.server_url must start with ws:// or wss://";
        return false;
    }
    if (agent.heartbeat_interval_ms < 100) {
        error = "agent.heartbeat_interval_ms must be >= 100ms";
        return false;
    }
    if (agent.connect_timeout_ms < 100) {
        error = "agent.connect_timeout_ms must be >= 100ms";
        return false;
    }
    if (agent.workers < 1) {
        error = "agent.workers must be at least 1";
        return false;
    }

    const auto &rc = agent.reconnect;
    if (rc.base_delay_ms < 0 || rc.max_delay_ms < rc.base_delay_ms) {
        error = "agent.reconnect requires 0 <= base_delay_ms <= max_delay_ms";
        return false;
    }
    if (rc.max_attempts < 1) {
        error = "agent.reconnect.max_attempts must be >= 1";
        return false;
    }

    if (agent.index.max_depth < 0 || agent.index.max_depth > 8) {
        error = "agent.index.max_depth must be between 0 and 8";
        return false;
    }
    if (agent.exec.shell.empty()) {
        error = "agent.exec.shell must not be empty";
        return false;
    }
    if (agent.exec.default_timeout_ms < 1) {
        error = "agent.exec.default_timeout_ms must be positive";
        return false;
    }

    const auto &daemon = config.daemon;
    if (!validate_http(daemon.http, "daemon", error)) {
        return false;
    }
    if (daemon.http.enabled && !is_loopback_address(daemon.http.bind)) {
        error = "daemon.bind must be a loopback address, got '" + daemon.http.bind + "'";
        return false;
    }
    if (daemon.audit_log_capacity < 1) {
        error = "daemon.audit_log_capacity must be at least 1";
        return false;
    }
    return true;
}

bool load_config(const std::string &config_path, HostlinkConfig &config, std::string &error) {
    try {
        YAML::Node yaml = YAML::LoadFile(config_path);

        // Check for unknown top-level keys
        const std::vector<std::string> valid_keys = {"logging", "bridge", "agent", "daemon"};
        for (const auto &key_node : yaml) {
            std::string key = key_node.first.as<std::string>();
            if (std::find(valid_keys.begin(), valid_keys.end(), key) == valid_keys.end()) {
                LOG_WARN("[Config] Unknown top-level key: '" << key << "' (will be ignored)");
            }
        }

        if (yaml["logging"]) {
            if (yaml["logging"]["level"]) {
                config.logging.level = yaml["logging"]["level"].as<std::string>();
            }
            if (yaml["logging"]["file"]) {
                config.logging.file = yaml["logging"]["file"].as<std::string>();
            }
        }

        if (yaml["bridge"]) {
            load_bridge(yaml["bridge"], config.bridge);
        }

        if (yaml["agent"]) {
            load_agent(yaml["agent"], config.agent);
        }

        if (yaml["daemon"]) {
            const auto &daemon = yaml["daemon"];
            load_http(daemon, config.daemon.http);
            if (daemon["audit_log_capacity"]) {
                config.daemon.audit_log_capacity = daemon["audit_log_capacity"].as<size_t>();
            }
        }

        // Token from environment variable if not in config
        if (config.agent.auth_token.empty()) {
            const char *token_env = std::getenv("HOSTLINK_AUTH_TOKEN");
            if (token_env != nullptr) {
                config.agent.auth_token = token_env;
            }
        }

        LOG_INFO("[Config] Loaded " << config_path);
        LOG_INFO("[Config] Log level: " << config.logging.level);
        return true;
    } catch (const YAML::BadFile &e) {
        error = "Cannot open config file: " + config_path;
        return false;
    } catch (const YAML::ParserException &e) {
        error = "YAML parse error: " + std::string(e.what());
        return false;
    } catch (const std::exception &e) {
        error = "Config load error: " + std::string(e.what());
        return false;
    }
}

}  // namespace runtime
}  // namespace hostlink
