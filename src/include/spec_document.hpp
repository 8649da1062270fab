#pragma once

#include <yaml-cpp/yaml.h>
#include <string>
#include <vector>

namespace ouroboros {

enum class SpecKind { Rest, WebSocket };

std::string toString(SpecKind kind);

/**
 * Server entry written into a fresh REST document.
 */
struct RestServerInfo {
    std::string url = "http://localhost:8080";
    std::string description = "Local server";
};

/**
 * Construction and structural repair of spec documents.
 */
class SpecDocument {
public:
    static YAML::Node createMinimalRestDocument(const RestServerInfo& server = RestServerInfo());

    static YAML::Node createMinimalWebSocketDocument();

    /**
     * Fill absent or null required sections with empty structures.
     *
     * REST: paths, components, components.schemas.
     * WebSocket: servers, channels, operations, components.
     *
     * @param doc Document to repair in place; must be a map
     * @return Names of the sections that were repaired (empty if none)
     */
    static std::vector<std::string> repair(YAML::Node doc, SpecKind kind);
};

} // namespace ouroboros
