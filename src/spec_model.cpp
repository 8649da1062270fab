#include "spec_model.hpp"
#include "id_generator.hpp"
#include "yaml_utils.hpp"

#include <algorithm>
#include <cctype>

namespace ouroboros {

namespace {

std::string toLower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

std::string toUpper(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return text;
}

} // namespace

const char* operationKey(HttpMethod method) {
    switch (method) {
        case HttpMethod::Get:
            return "get";
        case HttpMethod::Post:
            return "post";
        case HttpMethod::Put:
            return "put";
        case HttpMethod::Patch:
            return "patch";
        case HttpMethod::Delete:
            return "delete";
    }
    return "get";
}

std::string toString(HttpMethod method) {
    return toUpper(operationKey(method));
}

std::optional<HttpMethod> parseHttpMethod(const std::string& name) {
    const std::string lowered = toLower(name);
    for (HttpMethod method : kAllHttpMethods) {
        if (lowered == operationKey(method)) {
            return method;
        }
    }
    return std::nullopt;
}

std::string toString(DiffState state) {
    switch (state) {
        case DiffState::None:
            return "none";
        case DiffState::Request:
            return "request";
        case DiffState::Response:
            return "response";
        case DiffState::Both:
            return "both";
        case DiffState::Endpoint:
            return "endpoint";
    }
    return "none";
}

std::optional<DiffState> parseDiffState(const std::string& text) {
    if (text == "none") return DiffState::None;
    if (text == "request") return DiffState::Request;
    if (text == "response") return DiffState::Response;
    if (text == "both") return DiffState::Both;
    if (text == "endpoint") return DiffState::Endpoint;
    return std::nullopt;
}

DiffState withRequestDiff(DiffState current, bool differs) {
    if (current == DiffState::Endpoint) {
        return current;
    }
    const bool response_side = current == DiffState::Response || current == DiffState::Both;
    if (differs) {
        return response_side ? DiffState::Both : DiffState::Request;
    }
    return response_side ? DiffState::Response : DiffState::None;
}

DiffState withResponseDiff(DiffState current, bool differs) {
    if (current == DiffState::Endpoint) {
        return current;
    }
    const bool request_side = current == DiffState::Request || current == DiffState::Both;
    if (differs) {
        return request_side ? DiffState::Both : DiffState::Response;
    }
    return request_side ? DiffState::Request : DiffState::None;
}

std::string toString(ProgressState state) {
    switch (state) {
        case ProgressState::None:
            return "none";
        case ProgressState::Mock:
            return "mock";
        case ProgressState::Completed:
            return "completed";
    }
    return "none";
}

std::optional<ProgressState> parseProgressState(const std::string& text) {
    if (text == "none") return ProgressState::None;
    if (text == "mock") return ProgressState::Mock;
    if (text == "completed") return ProgressState::Completed;
    return std::nullopt;
}

std::string toString(WsAction action) {
    return action == WsAction::Send ? "send" : "receive";
}

std::optional<WsAction> parseWsAction(const std::string& text) {
    if (text == "send") return WsAction::Send;
    if (text == "receive") return WsAction::Receive;
    return std::nullopt;
}

std::shared_ptr<Schema> Schema::fromYaml(const YAML::Node& node) {
    if (!YamlUtils::isPresent(node) || !node.IsMap()) {
        return nullptr;
    }

    auto schema = std::make_shared<Schema>();
    schema->type = YamlUtils::getString(node, "type", "");
    schema->format = YamlUtils::getString(node, "format", "");
    schema->ref = YamlUtils::getString(node, "$ref", "");

    YAML::Node properties = YamlUtils::child(node, "properties");
    if (properties.IsDefined() && properties.IsMap()) {
        for (const auto& entry : properties) {
            schema->properties.emplace_back(entry.first.as<std::string>(),
                                            fromYaml(entry.second));
        }
    }

    schema->items = fromYaml(YamlUtils::child(node, "items"));
    return schema;
}

SchemaMap schemasFromComponents(const YAML::Node& components) {
    SchemaMap result;
    YAML::Node schemas = YamlUtils::child(components, "schemas");
    if (!schemas.IsDefined() || !schemas.IsMap()) {
        return result;
    }
    for (const auto& entry : schemas) {
        result[entry.first.as<std::string>()] = Schema::fromYaml(entry.second);
    }
    return result;
}

std::string refName(const std::string& ref) {
    auto pos = ref.rfind('/');
    if (pos == std::string::npos || pos + 1 >= ref.size()) {
        return ref;
    }
    return ref.substr(pos + 1);
}

std::optional<std::string> schemaRefName(const std::string& ref) {
    const std::string prefix(kSchemaRefPrefix);
    if (ref.size() <= prefix.size() || ref.compare(0, prefix.size(), prefix) != 0) {
        return std::nullopt;
    }
    return ref.substr(prefix.size());
}

YAML::Node getOperation(const YAML::Node& path_item, HttpMethod method) {
    YAML::Node operation = YamlUtils::child(path_item, operationKey(method));
    if (!YamlUtils::isPresent(operation) || !operation.IsMap()) {
        return YAML::Node();
    }
    return operation;
}

void setOperation(YAML::Node path_item, HttpMethod method, const YAML::Node& operation) {
    path_item[operationKey(method)] = operation;
}

void clearOperation(YAML::Node path_item, HttpMethod method) {
    YamlUtils::removeKey(path_item, operationKey(method));
}

DiffState getDiff(const YAML::Node& operation) {
    auto text = YamlUtils::getString(operation, ext::kDiff);
    if (!text) {
        return DiffState::None;
    }
    return parseDiffState(*text).value_or(DiffState::None);
}

void setDiff(YAML::Node operation, DiffState state) {
    operation[ext::kDiff] = toString(state);
}

ProgressState getProgress(const YAML::Node& operation) {
    auto text = YamlUtils::getString(operation, ext::kProgress);
    if (!text) {
        return ProgressState::None;
    }
    return parseProgressState(*text).value_or(ProgressState::None);
}

void setProgress(YAML::Node operation, ProgressState state) {
    operation[ext::kProgress] = toString(state);
}

bool ensureOperationId(YAML::Node operation) {
    auto id = YamlUtils::getString(operation, ext::kId);
    if (id && !id->empty()) {
        return false;
    }
    operation[ext::kId] = IdGenerator::generateUuid();
    return true;
}

void normalizeTags(YAML::Node operation) {
    YAML::Node tags = YamlUtils::child(operation, "tags");
    if (!tags.IsDefined() || !tags.IsSequence()) {
        return;
    }
    YAML::Node normalized(YAML::NodeType::Sequence);
    for (const auto& tag : tags) {
        if (tag.IsScalar()) {
            normalized.push_back(toUpper(tag.as<std::string>()));
        }
    }
    operation["tags"] = normalized;
}

} // namespace ouroboros
