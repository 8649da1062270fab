#pragma once

#include <yaml-cpp/yaml.h>
#include <optional>
#include <string>

namespace ouroboros {

/**
 * Maintains the servers section of an AsyncAPI document.
 */
class WebSocketServerManager {
public:
    explicit WebSocketServerManager(std::string default_host = "localhost:8080");

    /**
     * Reuse or create the server for protocol + pathname.
     * @return The server name ("{protocol}-{sanitized pathname}")
     */
    std::string ensureServerExists(YAML::Node doc, const std::string& protocol, const std::string& pathname) const;

    static std::string generateServerName(const std::string& protocol, const std::string& pathname);

    // Protocol and pathname of the first server, if any
    static std::optional<std::string> extractProtocol(const YAML::Node& doc);
    static std::optional<std::string> extractPathname(const YAML::Node& doc);

    const std::string& defaultHost() const { return default_host_; }

private:
    std::string default_host_;
};

} // namespace ouroboros
