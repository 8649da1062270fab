#include "config_manager.hpp"

#include <crow/logging.h>
#include <fstream>

#include "yaml_utils.hpp"

namespace ouroboros {

ConfigManager::ConfigManager(const std::filesystem::path& config_file)
    : config_file(config_file), base_path(config_file.parent_path()) {}

void ConfigManager::loadConfig() {
    if (!std::filesystem::exists(config_file)) {
        CROW_LOG_INFO << "Configuration file " << config_file << " not found, using defaults";
        return;
    }

    CROW_LOG_INFO << "Loading configuration file: " << config_file;
    std::ifstream file(config_file);
    if (!file) {
        throw ConfigurationError("Cannot open configuration file " + config_file.string());
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    loadFromString(buffer.str());
    CROW_LOG_INFO << "Configuration loaded successfully";
}

void ConfigManager::loadFromString(const std::string& yaml_content) {
    YAML::Node config;
    try {
        config = YAML::Load(yaml_content);
    } catch (const YAML::Exception& e) {
        throw ConfigurationError(std::string("Invalid YAML: ") + e.what());
    }

    if (!YamlUtils::isPresent(config)) {
        return;
    }
    if (!config.IsMap()) {
        throw ConfigurationError("Configuration root must be a map");
    }
    parseConfig(config);
}

void ConfigManager::parseConfig(const YAML::Node& config) {
    project_name = safeGet<std::string>(config, "project-name", "project-name", project_name);
    http_port = safeGet<int>(config, "http-port", "http-port", http_port);
    if (http_port <= 0 || http_port > 65535) {
        throw ConfigurationError("Port out of range: " + std::to_string(http_port), "http-port");
    }

    parseRestConfig(YamlUtils::child(config, "rest"));
    parseWebSocketConfig(YamlUtils::child(config, "websocket"));

    CROW_LOG_DEBUG << "Project Name: " << project_name;
    CROW_LOG_DEBUG << "HTTP Port: " << http_port;
    CROW_LOG_DEBUG << "REST spec: " << getRestSpecPath();
    CROW_LOG_DEBUG << "WebSocket spec: " << getWebSocketSpecPath();
}

void ConfigManager::parseRestConfig(const YAML::Node& node) {
    if (!YamlUtils::isPresent(node)) {
        return;
    }
    if (!node.IsMap()) {
        throw ConfigurationError("Expected a map", "rest");
    }
    rest_config.spec_file = safeGet<std::string>(node, "spec-file", "rest.spec-file", rest_config.spec_file);
    rest_config.scanned_spec_file =
        safeGet<std::string>(node, "scanned-spec-file", "rest.scanned-spec-file", rest_config.scanned_spec_file);
    rest_config.server.url = safeGet<std::string>(node, "server-url", "rest.server-url", rest_config.server.url);
    rest_config.server.description = safeGet<std::string>(node, "server-description", "rest.server-description",
                                                          rest_config.server.description);
}

void ConfigManager::parseWebSocketConfig(const YAML::Node& node) {
    if (!YamlUtils::isPresent(node)) {
        return;
    }
    if (!node.IsMap()) {
        throw ConfigurationError("Expected a map", "websocket");
    }
    websocket_config.spec_file =
        safeGet<std::string>(node, "spec-file", "websocket.spec-file", websocket_config.spec_file);
    websocket_config.default_host =
        safeGet<std::string>(node, "default-host", "websocket.default-host", websocket_config.default_host);
}

std::filesystem::path ConfigManager::resolvePath(const std::string& value) const {
    std::filesystem::path path(value);
    if (path.is_absolute()) {
        return path;
    }
    return (base_path / path).lexically_normal();
}

std::filesystem::path ConfigManager::getRestSpecPath() const {
    return resolvePath(rest_config.spec_file);
}

std::filesystem::path ConfigManager::getWebSocketSpecPath() const {
    return resolvePath(websocket_config.spec_file);
}

std::optional<std::filesystem::path> ConfigManager::getScannedSpecPath() const {
    if (rest_config.scanned_spec_file.empty()) {
        return std::nullopt;
    }
    return resolvePath(rest_config.scanned_spec_file);
}

template<typename T>
T ConfigManager::safeGet(const YAML::Node& node, const std::string& key, const std::string& path, const T& defaultValue) const {
    YAML::Node value = YamlUtils::child(node, key);
    if (!YamlUtils::isPresent(value)) {
        return defaultValue;
    }
    try {
        return value.as<T>();
    } catch (const YAML::Exception& e) {
        throw ConfigurationError("Invalid value for key: " + key + ", Error: " + e.what(), path);
    }
}

} // namespace ouroboros
