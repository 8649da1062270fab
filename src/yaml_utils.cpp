#include "yaml_utils.hpp"
#include "error.hpp"

namespace ouroboros {

YAML::Node YamlUtils::child(const YAML::Node& parent, const std::string& key) {
    if (!parent.IsDefined() || !parent.IsMap()) {
        return YAML::Node();
    }
    const YAML::Node& const_parent = parent;
    YAML::Node value = const_parent[key];
    if (!value.IsDefined()) {
        return YAML::Node();
    }
    return value;
}

std::optional<std::string> YamlUtils::getString(const YAML::Node& parent, const std::string& key) {
    YAML::Node value = child(parent, key);
    if (!isPresent(value) || !value.IsScalar()) {
        return std::nullopt;
    }
    return value.as<std::string>();
}

std::string YamlUtils::getString(const YAML::Node& parent,
                                 const std::string& key,
                                 const std::string& default_value) {
    auto value = getString(parent, key);
    return value ? *value : default_value;
}

YAML::Node YamlUtils::getOrCreateMap(YAML::Node parent, const std::string& key) {
    YAML::Node existing = child(parent, key);
    if (existing.IsDefined() && existing.IsMap()) {
        return existing;
    }
    parent[key] = YAML::Node(YAML::NodeType::Map);
    return child(parent, key);
}

std::vector<std::string> YamlUtils::keys(const YAML::Node& map) {
    std::vector<std::string> result;
    if (!map.IsDefined() || !map.IsMap()) {
        return result;
    }
    for (const auto& entry : map) {
        result.push_back(entry.first.as<std::string>());
    }
    return result;
}

bool YamlUtils::removeKey(YAML::Node parent, const std::string& key) {
    if (!parent.IsDefined() || !parent.IsMap()) {
        return false;
    }
    return parent.remove(key);
}

YAML::Node YamlUtils::parse(const std::string& content, const std::string& source_name) {
    try {
        return YAML::Load(content);
    } catch (const YAML::Exception& e) {
        throw SpecParseError("Failed to parse YAML '" + source_name + "': " + e.what());
    }
}

std::string YamlUtils::emit(const YAML::Node& node) {
    YAML::Emitter out;
    out.SetIndent(2);
    out << node;
    std::string text = out.c_str();
    if (text.empty() || text.back() != '\n') {
        text += '\n';
    }
    return text;
}

} // namespace ouroboros
