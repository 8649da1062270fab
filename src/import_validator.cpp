#include "import_validator.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>

#include <crow/logging.h>

#include "spec_model.hpp"
#include "yaml_utils.hpp"

namespace ouroboros {

namespace {

const std::vector<std::string> kPathItemFields = {
    "summary", "description", "parameters", "servers"};

std::string toLower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

bool endsWith(const std::string& text, const std::string& suffix) {
    return text.size() >= suffix.size() &&
           text.compare(text.size() - suffix.size(), suffix.size(), suffix) == 0;
}

// A plain scalar that reads as a number or boolean is not a string
bool isStringScalar(const YAML::Node& node) {
    if (!node.IsScalar()) {
        return false;
    }
    if (node.Tag() == "!") {
        return true;
    }
    double number;
    if (YAML::convert<double>::decode(node, number)) {
        return false;
    }
    bool flag;
    if (YAML::convert<bool>::decode(node, flag)) {
        return false;
    }
    return true;
}

std::string joinList(const std::vector<std::string>& items) {
    std::string joined = "[";
    for (size_t i = 0; i < items.size(); ++i) {
        if (i > 0) {
            joined += ", ";
        }
        joined += items[i];
    }
    return joined + "]";
}

std::vector<std::string> methodNames() {
    std::vector<std::string> names;
    for (HttpMethod method : kAllHttpMethods) {
        names.emplace_back(operationKey(method));
    }
    return names;
}

} // namespace

void ImportValidator::ValidationResult::addError(const std::string& location,
                                                 const std::string& code,
                                                 const std::string& message) {
    valid = false;
    errors.push_back(ErrorDetail{location, code, message});
}

std::string ImportValidator::ValidationResult::getErrorSummary() const {
    if (errors.empty()) {
        return "";
    }

    std::stringstream ss;
    ss << "Errors (" << errors.size() << "):\n";
    for (size_t i = 0; i < errors.size(); ++i) {
        ss << "  " << (i + 1) << ". [" << errors[i].code << "] "
           << errors[i].location << ": " << errors[i].message << "\n";
    }
    return ss.str();
}

Error ImportValidator::ValidationResult::toError() const {
    Error error = Error::Validation("YAML validation failed", getErrorSummary());
    error.errors = errors;
    return error;
}

const std::vector<std::string>& ImportValidator::validDataTypes() {
    static const std::vector<std::string> types = {
        "string", "number", "integer", "boolean", "array", "object"};
    return types;
}

std::vector<ErrorDetail> ImportValidator::validateFileName(const std::string& filename) {
    std::vector<ErrorDetail> errors;

    std::string trimmed = filename;
    trimmed.erase(std::remove_if(trimmed.begin(), trimmed.end(),
                                 [](unsigned char c) { return std::isspace(c); }),
                  trimmed.end());
    if (trimmed.empty()) {
        errors.push_back(ErrorDetail{"file", "INVALID_FILENAME", "Filename is null or empty"});
        return errors;
    }

    std::string lower = toLower(filename);
    if (!endsWith(lower, ".yml") && !endsWith(lower, ".yaml")) {
        errors.push_back(ErrorDetail{"file", "INVALID_FILE_EXTENSION",
                                     "File extension must be .yml or .yaml"});
    }
    return errors;
}

ImportValidator::ValidationResult ImportValidator::validate(const std::string& filename,
                                                            const std::string& yaml_content) const {
    auto name_errors = validateFileName(filename);
    if (!name_errors.empty()) {
        ValidationResult result;
        for (const auto& error : name_errors) {
            result.addError(error.location, error.code, error.message);
        }
        return result;
    }
    return validate(yaml_content);
}

ImportValidator::ValidationResult ImportValidator::validate(const std::string& yaml_content) const {
    ValidationResult result;

    YAML::Node doc;
    try {
        doc = YAML::Load(yaml_content);
    } catch (const YAML::Exception& e) {
        result.addError("root", "YAML_PARSE_ERROR", std::string("Failed to parse YAML: ") + e.what());
        return result;
    }

    if (!doc.IsMap()) {
        result.addError("root", "INVALID_YAML_STRUCTURE", "YAML root must be an object/map");
        return result;
    }

    validateVersion(doc, result);

    if (!YamlUtils::hasKey(doc, "info")) {
        result.addError("info", "MISSING_REQUIRED_FIELD", "Missing required field 'info'");
    }
    const char* body_key = kind_ == SpecKind::Rest ? "paths" : "channels";
    if (!YamlUtils::hasKey(doc, body_key)) {
        result.addError(body_key, "MISSING_REQUIRED_FIELD",
                        std::string("Missing required field '") + body_key + "'");
    }

    validateInfo(doc, result);
    if (kind_ == SpecKind::Rest) {
        validatePaths(doc, result);
    } else {
        validateChannels(doc, result);
        validateWebSocketOperations(doc, result);
    }
    validateComponentSchemas(doc, result);

    if (result.valid) {
        result.document = doc;
    } else {
        CROW_LOG_DEBUG << "Import validation failed with " << result.errors.size() << " error(s)";
    }
    return result;
}

void ImportValidator::validateVersion(const YAML::Node& doc, ValidationResult& result) const {
    const std::string field = kind_ == SpecKind::Rest ? "openapi" : "asyncapi";
    const std::string label = kind_ == SpecKind::Rest ? "OpenAPI" : "AsyncAPI";

    YAML::Node version = YamlUtils::child(doc, field);
    if (!YamlUtils::isPresent(version)) {
        result.addError(field, "MISSING_REQUIRED_FIELD", "Missing required field '" + field + "'");
        return;
    }
    if (!isStringScalar(version)) {
        result.addError(field, "INVALID_DATA_TYPE", "Field '" + field + "' must be a string");
        return;
    }

    std::string text = version.as<std::string>();
    if (text.compare(0, 2, "3.") != 0) {
        result.addError(field, "UNSUPPORTED_VERSION",
                        label + " version must be 3.x.x (found: " + text + ")");
    }
}

void ImportValidator::validateInfo(const YAML::Node& doc, ValidationResult& result) const {
    YAML::Node info = YamlUtils::child(doc, "info");
    if (!YamlUtils::isPresent(info)) {
        return;
    }
    if (!info.IsMap()) {
        result.addError("info", "INVALID_DATA_TYPE", "Field 'info' must be an object");
        return;
    }
    for (const char* key : {"title", "version"}) {
        if (!YamlUtils::hasKey(info, key)) {
            result.addError(std::string("info.") + key, "MISSING_REQUIRED_FIELD",
                            std::string("Missing required field 'info.") + key + "'");
        }
    }
}

void ImportValidator::validatePaths(const YAML::Node& doc, ValidationResult& result) const {
    YAML::Node paths = YamlUtils::child(doc, "paths");
    if (!YamlUtils::isPresent(paths)) {
        return;
    }
    if (!paths.IsMap()) {
        result.addError("paths", "INVALID_DATA_TYPE", "Field 'paths' must be an object");
        return;
    }

    for (const auto& path : YamlUtils::keys(paths)) {
        YAML::Node item = YamlUtils::child(paths, path);
        const std::string location = "paths." + path;
        if (!item.IsMap()) {
            result.addError(location, "INVALID_DATA_TYPE", "Path item must be an object");
            continue;
        }

        for (const auto& key : YamlUtils::keys(item)) {
            if (std::find(kPathItemFields.begin(), kPathItemFields.end(), key) != kPathItemFields.end() ||
                key.compare(0, 1, "$") == 0 || key.compare(0, 2, "x-") == 0) {
                continue;
            }
            // Path item keys are lower case
            auto method = parseHttpMethod(key);
            if (!method || key != operationKey(*method)) {
                result.addError(location + "." + key, "INVALID_HTTP_METHOD",
                                "Invalid HTTP method: '" + key + "'. Valid methods: " +
                                    joinList(methodNames()));
                continue;
            }
            YAML::Node operation = YamlUtils::child(item, key);
            if (!operation.IsMap()) {
                result.addError(location + "." + key, "INVALID_DATA_TYPE", "Operation must be an object");
                continue;
            }
            validateOperation(operation, location + "." + key, result);
        }
    }
}

void ImportValidator::validateOperation(const YAML::Node& operation,
                                        const std::string& location,
                                        ValidationResult& result) const {
    YAML::Node responses = YamlUtils::child(operation, "responses");
    if (!YamlUtils::isPresent(responses)) {
        result.addError(location + ".responses", "MISSING_REQUIRED_FIELD",
                        "Missing required field 'responses'");
    } else if (!responses.IsMap()) {
        result.addError(location + ".responses", "INVALID_DATA_TYPE",
                        "Field 'responses' must be an object");
    }

    YAML::Node body = YamlUtils::child(operation, "requestBody");
    if (!YamlUtils::isPresent(body)) {
        return;
    }
    if (!body.IsMap()) {
        result.addError(location + ".requestBody", "INVALID_DATA_TYPE", "RequestBody must be an object");
        return;
    }
    YAML::Node content = YamlUtils::child(body, "content");
    for (const auto& media_type : YamlUtils::keys(content)) {
        YAML::Node schema = YamlUtils::child(YamlUtils::child(content, media_type), "schema");
        validateSchema(schema, location + ".requestBody.content." + media_type + ".schema", result);
    }
}

void ImportValidator::validateChannels(const YAML::Node& doc, ValidationResult& result) const {
    YAML::Node channels = YamlUtils::child(doc, "channels");
    if (!YamlUtils::isPresent(channels)) {
        return;
    }
    if (!channels.IsMap()) {
        result.addError("channels", "INVALID_DATA_TYPE", "Field 'channels' must be an object");
        return;
    }

    for (const auto& name : YamlUtils::keys(channels)) {
        YAML::Node channel = YamlUtils::child(channels, name);
        if (!channel.IsMap()) {
            result.addError("channels." + name, "INVALID_DATA_TYPE", "Channel must be an object");
            continue;
        }
        if (!YamlUtils::hasKey(channel, "address")) {
            result.addError("channels." + name + ".address", "MISSING_REQUIRED_FIELD",
                            "Missing required field 'address'");
        }
    }
}

void ImportValidator::validateWebSocketOperations(const YAML::Node& doc, ValidationResult& result) const {
    YAML::Node operations = YamlUtils::child(doc, "operations");
    // operations are optional in AsyncAPI 3
    if (!YamlUtils::isPresent(operations)) {
        return;
    }
    if (!operations.IsMap()) {
        result.addError("operations", "INVALID_DATA_TYPE", "Field 'operations' must be an object");
        return;
    }

    for (const auto& name : YamlUtils::keys(operations)) {
        YAML::Node operation = YamlUtils::child(operations, name);
        const std::string location = "operations." + name;
        if (!operation.IsMap()) {
            result.addError(location, "INVALID_DATA_TYPE", "Operation must be an object");
            continue;
        }

        YAML::Node action = YamlUtils::child(operation, "action");
        if (!YamlUtils::isPresent(action)) {
            result.addError(location + ".action", "MISSING_REQUIRED_FIELD",
                            "Missing required field 'action'");
        } else if (!isStringScalar(action)) {
            result.addError(location + ".action", "INVALID_DATA_TYPE",
                            "Field 'action' must be a string");
        } else if (!parseWsAction(toLower(action.as<std::string>()))) {
            result.addError(location + ".action", "INVALID_ACTION",
                            "Invalid action: '" + action.as<std::string>() +
                                "'. Valid actions: [send, receive]");
        }

        if (!YamlUtils::hasKey(operation, "channel")) {
            result.addError(location + ".channel", "MISSING_REQUIRED_FIELD",
                            "Missing required field 'channel'");
        }
    }
}

void ImportValidator::validateComponentSchemas(const YAML::Node& doc, ValidationResult& result) const {
    YAML::Node schemas = YamlUtils::child(YamlUtils::child(doc, "components"), "schemas");
    for (const auto& name : YamlUtils::keys(schemas)) {
        validateSchema(YamlUtils::child(schemas, name), "components.schemas." + name, result);
    }
}

void ImportValidator::validateSchema(const YAML::Node& schema,
                                     const std::string& location,
                                     ValidationResult& result) const {
    if (!schema.IsMap() || YamlUtils::hasKey(schema, "$ref")) {
        return;
    }

    auto type = YamlUtils::getString(schema, "type");
    const auto& types = validDataTypes();
    if (type && std::find(types.begin(), types.end(), *type) == types.end()) {
        result.addError(location + ".type", "INVALID_DATA_TYPE",
                        "Invalid schema type: '" + *type + "'. Valid types: " + joinList(types));
    }

    YAML::Node properties = YamlUtils::child(schema, "properties");
    for (const auto& property : YamlUtils::keys(properties)) {
        validateSchema(YamlUtils::child(properties, property),
                       location + ".properties." + property, result);
    }

    validateSchema(YamlUtils::child(schema, "items"), location + ".items", result);
}

} // namespace ouroboros
