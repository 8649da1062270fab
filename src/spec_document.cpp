#include "spec_document.hpp"
#include "yaml_utils.hpp"

namespace ouroboros {

namespace {

void ensureMap(YAML::Node parent, const std::string& key, const std::string& label,
               std::vector<std::string>& repaired) {
    YAML::Node existing = YamlUtils::child(parent, key);
    if (existing.IsDefined() && existing.IsMap()) {
        return;
    }
    parent[key] = YAML::Node(YAML::NodeType::Map);
    repaired.push_back(label);
}

} // namespace

std::string toString(SpecKind kind) {
    return kind == SpecKind::Rest ? "rest" : "websocket";
}

YAML::Node SpecDocument::createMinimalRestDocument(const RestServerInfo& server) {
    YAML::Node doc(YAML::NodeType::Map);
    doc["openapi"] = "3.1.0";
    doc["info"]["title"] = "API Documentation";
    doc["info"]["version"] = "1.0.0";

    YAML::Node server_entry(YAML::NodeType::Map);
    server_entry["url"] = server.url;
    server_entry["description"] = server.description;
    YAML::Node servers(YAML::NodeType::Sequence);
    servers.push_back(server_entry);
    doc["servers"] = servers;

    doc["security"] = YAML::Node(YAML::NodeType::Sequence);
    doc["paths"] = YAML::Node(YAML::NodeType::Map);
    doc["components"]["schemas"] = YAML::Node(YAML::NodeType::Map);
    return doc;
}

YAML::Node SpecDocument::createMinimalWebSocketDocument() {
    YAML::Node doc(YAML::NodeType::Map);
    doc["asyncapi"] = "3.0.0";
    doc["info"]["title"] = "WebSocket API Documentation";
    doc["info"]["version"] = "1.0.0";
    doc["defaultContentType"] = "application/json";
    doc["servers"] = YAML::Node(YAML::NodeType::Map);
    doc["channels"] = YAML::Node(YAML::NodeType::Map);
    doc["operations"] = YAML::Node(YAML::NodeType::Map);
    doc["components"] = YAML::Node(YAML::NodeType::Map);
    return doc;
}

std::vector<std::string> SpecDocument::repair(YAML::Node doc, SpecKind kind) {
    std::vector<std::string> repaired;

    if (kind == SpecKind::Rest) {
        ensureMap(doc, "paths", "paths", repaired);
        ensureMap(doc, "components", "components", repaired);
        ensureMap(YamlUtils::child(doc, "components"), "schemas", "components.schemas", repaired);
        return repaired;
    }

    ensureMap(doc, "servers", "servers", repaired);
    ensureMap(doc, "channels", "channels", repaired);
    ensureMap(doc, "operations", "operations", repaired);
    ensureMap(doc, "components", "components", repaired);
    return repaired;
}

} // namespace ouroboros
