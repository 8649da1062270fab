#include "websocket_server_manager.hpp"
#include "yaml_utils.hpp"

#include <algorithm>
#include <cctype>
#include <utility>
#include <crow/logging.h>

namespace ouroboros {

namespace {

YAML::Node firstServer(const YAML::Node& doc) {
    YAML::Node servers = YamlUtils::child(doc, "servers");
    if (!servers.IsDefined() || !servers.IsMap()) {
        return YAML::Node();
    }
    for (const auto& entry : servers) {
        if (entry.second.IsMap()) {
            return entry.second;
        }
    }
    return YAML::Node();
}

} // namespace

WebSocketServerManager::WebSocketServerManager(std::string default_host)
    : default_host_(std::move(default_host)) {}

std::string WebSocketServerManager::ensureServerExists(YAML::Node doc,
                                                       const std::string& protocol,
                                                       const std::string& pathname) const {
    const std::string name = generateServerName(protocol, pathname);
    YAML::Node servers = YamlUtils::getOrCreateMap(doc, "servers");

    if (YamlUtils::isPresent(YamlUtils::child(servers, name))) {
        CROW_LOG_DEBUG << "Reusing existing server: " << name;
        return name;
    }

    std::string upper_protocol = protocol;
    std::transform(upper_protocol.begin(), upper_protocol.end(), upper_protocol.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    YAML::Node server(YAML::NodeType::Map);
    server["host"] = default_host_;
    server["pathname"] = pathname;
    server["protocol"] = protocol;
    server["description"] = upper_protocol + " WebSocket server at " + pathname;
    servers[name] = server;

    CROW_LOG_INFO << "Created server '" << name << "' (" << protocol << ", " << pathname << ")";
    return name;
}

std::string WebSocketServerManager::generateServerName(const std::string& protocol,
                                                       const std::string& pathname) {
    std::string sanitized = pathname;
    if (!sanitized.empty() && sanitized.front() == '/') {
        sanitized.erase(0, 1);
    }
    std::replace(sanitized.begin(), sanitized.end(), '/', '_');
    return protocol + "-" + sanitized;
}

std::optional<std::string> WebSocketServerManager::extractProtocol(const YAML::Node& doc) {
    return YamlUtils::getString(firstServer(doc), "protocol");
}

std::optional<std::string> WebSocketServerManager::extractPathname(const YAML::Node& doc) {
    return YamlUtils::getString(firstServer(doc), "pathname");
}

} // namespace ouroboros
