#include "reference_converter.hpp"
#include "spec_model.hpp"
#include "yaml_utils.hpp"

#include <optional>

namespace ouroboros {

namespace {

const char* const kExtensionKeys[] = {
    "id", "diff", "progress", "tag", "orders", "entrypoint",
    "mock", "response", "reqLog", "resLog"};

// Keys whose values are literal user data, copied without conversion.
const char* const kLiteralKeys[] = {"example", "examples", "default", "enum", "const"};

bool isLiteralKey(const std::string& key) {
    for (const char* literal : kLiteralKeys) {
        if (key == literal) {
            return true;
        }
    }
    return false;
}

bool startsWith(const std::string& text, const std::string& prefix) {
    return text.compare(0, prefix.size(), prefix) == 0;
}

} // namespace

bool ReferenceConverter::isExtensionKey(const std::string& api_key) {
    for (const char* key : kExtensionKeys) {
        if (api_key == key) {
            return true;
        }
    }
    return false;
}

YAML::Node ReferenceConverter::toApiForm(const YAML::Node& node) {
    return convert(node, true, false);
}

YAML::Node ReferenceConverter::toDocumentForm(const YAML::Node& node) {
    return convert(node, false, false);
}

YAML::Node ReferenceConverter::convert(const YAML::Node& node, bool to_api, bool keys_are_names) {
    if (node.IsSequence()) {
        YAML::Node result(YAML::NodeType::Sequence);
        for (const auto& element : node) {
            result.push_back(convert(element, to_api, false));
        }
        return result;
    }
    if (!node.IsMap()) {
        return YAML::Clone(node);
    }

    const std::string prefix(ext::kPrefix);
    YAML::Node result(YAML::NodeType::Map);
    for (const auto& entry : node) {
        const std::string key = entry.first.as<std::string>();
        const YAML::Node& value = entry.second;

        if (keys_are_names) {
            result[key] = convert(value, to_api, false);
            continue;
        }

        if (isLiteralKey(key)) {
            result[key] = YAML::Clone(value);
            continue;
        }

        const bool children_are_names = key == "properties";
        if (to_api) {
            if (key == "$ref") {
                result["ref"] = YAML::Clone(value);
            } else if (startsWith(key, prefix)) {
                result[key.substr(prefix.size())] = convert(value, to_api, false);
            } else {
                result[key] = convert(value, to_api, children_are_names);
            }
        } else {
            if (key == "ref" && value.IsScalar()) {
                std::string ref = value.as<std::string>();
                if (!startsWith(ref, "#")) {
                    ref = std::string(kSchemaRefPrefix) + cleanRefValue(ref);
                }
                result["$ref"] = ref;
            } else if (isExtensionKey(key)) {
                result[prefix + key] = convert(value, to_api, false);
            } else {
                result[key] = convert(value, to_api, children_are_names);
            }
        }
    }
    return result;
}

template<typename Rewrite>
int ReferenceConverter::rewriteRefs(YAML::Node node, const Rewrite& rewrite) {
    int rewritten = 0;
    if (node.IsSequence()) {
        for (std::size_t i = 0; i < node.size(); ++i) {
            rewritten += rewriteRefs(node[i], rewrite);
        }
        return rewritten;
    }
    if (!node.IsMap()) {
        return rewritten;
    }

    for (auto entry : node) {
        const std::string key = entry.first.as<std::string>();
        if (key == "$ref" && entry.second.IsScalar()) {
            std::optional<std::string> replacement = rewrite(entry.second.as<std::string>());
            if (replacement) {
                entry.second = *replacement;
                rewritten++;
            }
        } else {
            rewritten += rewriteRefs(entry.second, rewrite);
        }
    }
    return rewritten;
}

int ReferenceConverter::updateSchemaReferences(YAML::Node node, const RenameMap& renames) {
    if (renames.empty()) {
        return 0;
    }
    return rewriteRefs(node, [&renames](const std::string& ref) -> std::optional<std::string> {
        auto name = schemaRefName(ref);
        if (!name) {
            return std::nullopt;
        }
        auto it = renames.find(*name);
        if (it == renames.end()) {
            return std::nullopt;
        }
        return std::string(kSchemaRefPrefix) + it->second;
    });
}

int ReferenceConverter::updateMessageReferences(YAML::Node node, const RenameMap& renames) {
    if (renames.empty()) {
        return 0;
    }
    return rewriteRefs(node, [&renames](const std::string& ref) -> std::optional<std::string> {
        const std::string component_prefix(kMessageRefPrefix);
        const std::string channel_prefix(kChannelRefPrefix);
        const std::string marker("/messages/");

        std::string head;
        std::string name;
        if (startsWith(ref, component_prefix)) {
            head = component_prefix;
            name = ref.substr(component_prefix.size());
        } else if (startsWith(ref, channel_prefix)) {
            auto pos = ref.find(marker, channel_prefix.size());
            if (pos == std::string::npos) {
                return std::nullopt;
            }
            head = ref.substr(0, pos + marker.size());
            name = ref.substr(pos + marker.size());
        } else {
            return std::nullopt;
        }

        auto it = renames.find(name);
        if (it == renames.end()) {
            return std::nullopt;
        }
        return head + it->second;
    });
}

int ReferenceConverter::updateChannelReferences(YAML::Node node, const RenameMap& renames) {
    if (renames.empty()) {
        return 0;
    }
    return rewriteRefs(node, [&renames](const std::string& ref) -> std::optional<std::string> {
        const std::string prefix(kChannelRefPrefix);
        if (!startsWith(ref, prefix)) {
            return std::nullopt;
        }
        auto end = ref.find('/', prefix.size());
        std::string name = ref.substr(prefix.size(), end == std::string::npos ? std::string::npos
                                                                             : end - prefix.size());
        auto it = renames.find(name);
        if (it == renames.end()) {
            return std::nullopt;
        }
        std::string rest = end == std::string::npos ? "" : ref.substr(end);
        return prefix + it->second + rest;
    });
}

std::string ReferenceConverter::cleanRefValue(const std::string& ref) {
    std::string name = ref;
    auto slash = name.rfind('/');
    if (slash != std::string::npos) {
        name = name.substr(slash + 1);
    }
    auto dot = name.rfind('.');
    if (dot != std::string::npos && dot + 1 < name.size()) {
        name = name.substr(dot + 1);
    }
    return name;
}

} // namespace ouroboros
