#pragma once

#include <yaml-cpp/yaml.h>
#include <filesystem>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>

#include "spec_document.hpp"

namespace ouroboros {

struct RestSpecConfig {
    std::string spec_file = "ouroboros/rest/ourorest.yml";
    std::string scanned_spec_file;      // Empty when no scanner output is configured
    RestServerInfo server;
};

struct WebSocketSpecConfig {
    std::string spec_file = "ouroboros/websocket/ourowebsocket.yml";
    std::string default_host = "localhost:8080";
};

/**
 * Service configuration, read from a YAML file (default ouroboros.yaml).
 *
 * Every key is optional. Relative spec paths resolve against the
 * directory of the configuration file.
 */
class ConfigManager {
public:
    explicit ConfigManager(const std::filesystem::path& config_file);

    /**
     * Load the configuration file. A missing file keeps the defaults.
     * @throws ConfigurationError if the file is malformed
     */
    void loadConfig();

    /**
     * Parse configuration from YAML text (used by loadConfig and tests).
     * @throws ConfigurationError on invalid values
     */
    void loadFromString(const std::string& yaml_content);

    std::string getProjectName() const { return project_name; }
    int getHttpPort() const { return http_port; }
    void setHttpPort(int port) { http_port = port; }

    const RestSpecConfig& getRestConfig() const { return rest_config; }
    const WebSocketSpecConfig& getWebSocketConfig() const { return websocket_config; }

    // Absolute spec paths
    std::filesystem::path getRestSpecPath() const;
    std::filesystem::path getWebSocketSpecPath() const;
    std::optional<std::filesystem::path> getScannedSpecPath() const;

    std::filesystem::path getBasePath() const { return base_path; }

private:
    void parseConfig(const YAML::Node& config);
    void parseRestConfig(const YAML::Node& node);
    void parseWebSocketConfig(const YAML::Node& node);
    std::filesystem::path resolvePath(const std::string& value) const;

    template<typename T>
    T safeGet(const YAML::Node& node, const std::string& key, const std::string& path, const T& defaultValue) const;

    std::filesystem::path config_file;
    std::filesystem::path base_path;

    std::string project_name = "ouroboros";
    int http_port = 8080;
    RestSpecConfig rest_config;
    WebSocketSpecConfig websocket_config;
};

class ConfigurationError : public std::runtime_error {
public:
    ConfigurationError(const std::string& message, const std::string& yamlPath = "")
        : std::runtime_error(formatMessage(message, yamlPath)) {}

private:
    static std::string formatMessage(const std::string& message, const std::string& yamlPath) {
        std::ostringstream oss;
        oss << "Configuration error";
        if (!yamlPath.empty()) {
            oss << " at " << yamlPath;
        }
        oss << ": " << message;
        return oss.str();
    }
};

} // namespace ouroboros
