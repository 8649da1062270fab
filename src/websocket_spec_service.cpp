#include "websocket_spec_service.hpp"

#include <crow/logging.h>

#include "import_validator.hpp"
#include "yaml_utils.hpp"

namespace ouroboros {

namespace {

YAML::Node componentSection(const YAML::Node& doc, const std::string& section) {
    return YamlUtils::child(YamlUtils::child(doc, "components"), section);
}

YAML::Node storedSchema(const YAML::Node& schema) {
    YAML::Node stored = YamlUtils::isPresent(schema) ? YAML::Clone(schema) : YAML::Node(YAML::NodeType::Map);
    YAML::Node properties = YamlUtils::child(stored, "properties");
    if (stored.IsMap() && properties.IsDefined() && properties.IsMap() &&
        !YamlUtils::hasKey(stored, ext::kOrders)) {
        YAML::Node orders(YAML::NodeType::Sequence);
        for (const auto& name : YamlUtils::keys(properties)) {
            orders.push_back(name);
        }
        stored[ext::kOrders] = orders;
    }
    return stored;
}

} // namespace

WebSocketSpecService::WebSocketSpecService(std::shared_ptr<SpecStore> store,
                                           WebSocketOperationManager operation_manager)
    : store_(std::move(store)), operation_manager_(std::move(operation_manager)) {}

WebSocketOperation WebSocketSpecService::detached(const WebSocketOperation& operation) {
    return WebSocketOperation{operation.name, YAML::Clone(operation.node), operation.tag};
}

std::vector<NamedNode> WebSocketSpecService::listSection(const YAML::Node& section) {
    std::vector<NamedNode> result;
    for (const auto& name : YamlUtils::keys(section)) {
        result.push_back(NamedNode{name, YAML::Clone(YamlUtils::child(section, name))});
    }
    return result;
}

Result<NamedNode> WebSocketSpecService::getEntry(const YAML::Node& section,
                                                 const std::string& name,
                                                 const std::string& kind) {
    YAML::Node entry = YamlUtils::child(section, name);
    if (!entry.IsDefined()) {
        return Error::NotFound(kind + " '" + name + "' not found");
    }
    return NamedNode{name, YAML::Clone(entry)};
}

Result<std::vector<WebSocketOperation>> WebSocketSpecService::createOperations(
    const CreateOperationRequest& request) {
    return store_->write("create WebSocket operations",
                         [&](YAML::Node& doc) -> Result<std::vector<WebSocketOperation>> {
        std::vector<WebSocketOperation> created;
        for (const auto& operation : operation_manager_.createOperations(doc, request)) {
            created.push_back(detached(operation));
        }
        return created;
    });
}

std::vector<WebSocketOperation> WebSocketSpecService::listOperations() const {
    return store_->read([](const YAML::Node& doc) {
        std::vector<WebSocketOperation> result;
        for (const auto& operation : WebSocketOperationManager::listOperations(doc)) {
            result.push_back(detached(operation));
        }
        return result;
    });
}

Result<WebSocketOperation> WebSocketSpecService::getOperation(const std::string& id) const {
    return store_->read([&id](const YAML::Node& doc) -> Result<WebSocketOperation> {
        auto operation = WebSocketOperationManager::findOperationById(doc, id);
        if (!operation) {
            return Error::NotFound("Operation with id '" + id + "' not found");
        }
        return detached(*operation);
    });
}

Result<WebSocketOperation> WebSocketSpecService::updateOperation(const std::string& id,
                                                                 const UpdateOperationRequest& request) {
    return store_->write("update WebSocket operation", [&](YAML::Node& doc) -> Result<WebSocketOperation> {
        return detached(operation_manager_.updateOperation(doc, id, request));
    });
}

Result<WebSocketOperation> WebSocketSpecService::deleteOperation(const std::string& id) {
    return store_->write("delete WebSocket operation", [&](YAML::Node& doc) -> Result<WebSocketOperation> {
        return operation_manager_.deleteOperation(doc, id);
    });
}

std::vector<NamedNode> WebSocketSpecService::listChannels() const {
    return store_->read([](const YAML::Node& doc) { return listSection(YamlUtils::child(doc, "channels")); });
}

Result<NamedNode> WebSocketSpecService::getChannel(const std::string& name) const {
    return store_->read([&name](const YAML::Node& doc) {
        return getEntry(YamlUtils::child(doc, "channels"), name, "Channel");
    });
}

void WebSocketSpecService::applyMessageFields(YAML::Node message, const MessageRequest& request) {
    if (request.name) {
        message["name"] = *request.name;
    }
    if (request.content_type) {
        message["contentType"] = *request.content_type;
    }
    if (request.description) {
        message["description"] = *request.description;
    }
    if (YamlUtils::isPresent(request.headers)) {
        message["headers"] = YAML::Clone(request.headers);
    }
    if (YamlUtils::isPresent(request.payload)) {
        message["payload"] = YAML::Clone(request.payload);
    }
}

Result<NamedNode> WebSocketSpecService::createMessage(const MessageRequest& request) {
    if (request.message_name.empty()) {
        return Error::Validation("Message name must be provided");
    }
    return store_->write("create WebSocket message", [&request](YAML::Node& doc) -> Result<NamedNode> {
        YAML::Node messages = YamlUtils::getOrCreateMap(YamlUtils::getOrCreateMap(doc, "components"), "messages");
        if (YamlUtils::hasKey(messages, request.message_name)) {
            return Error::Conflict("Message '" + request.message_name + "' already exists");
        }
        YAML::Node message(YAML::NodeType::Map);
        message["contentType"] = "application/json";
        applyMessageFields(message, request);
        messages[request.message_name] = message;

        CROW_LOG_INFO << "Created message '" << request.message_name << "'";
        return NamedNode{request.message_name, YAML::Clone(message)};
    });
}

std::vector<NamedNode> WebSocketSpecService::listMessages() const {
    return store_->read([](const YAML::Node& doc) { return listSection(componentSection(doc, "messages")); });
}

Result<NamedNode> WebSocketSpecService::getMessage(const std::string& name) const {
    return store_->read([&name](const YAML::Node& doc) {
        return getEntry(componentSection(doc, "messages"), name, "Message");
    });
}

Result<NamedNode> WebSocketSpecService::updateMessage(const std::string& name, const MessageRequest& request) {
    return store_->write("update WebSocket message", [&](YAML::Node& doc) -> Result<NamedNode> {
        YAML::Node message = YamlUtils::child(componentSection(doc, "messages"), name);
        if (!message.IsDefined()) {
            return Error::NotFound("Message '" + name + "' not found");
        }
        if (!message.IsMap()) {
            return Error::Validation("Message '" + name + "' is not an object");
        }
        applyMessageFields(message, request);

        CROW_LOG_INFO << "Updated message '" << name << "'";
        return NamedNode{name, YAML::Clone(message)};
    });
}

Result<NamedNode> WebSocketSpecService::deleteMessage(const std::string& name) {
    return store_->write("delete WebSocket message", [&name](YAML::Node& doc) -> Result<NamedNode> {
        YAML::Node messages = componentSection(doc, "messages");
        auto removed = getEntry(messages, name, "Message");
        if (removed) {
            YamlUtils::removeKey(messages, name);
            CROW_LOG_INFO << "Deleted message '" << name << "'";
        }
        return removed;
    });
}

Result<NamedNode> WebSocketSpecService::createSchema(const std::string& name, const YAML::Node& schema) {
    if (name.empty()) {
        return Error::Validation("Schema name must be provided");
    }
    return store_->write("create WebSocket schema", [&](YAML::Node& doc) -> Result<NamedNode> {
        YAML::Node schemas = YamlUtils::getOrCreateMap(YamlUtils::getOrCreateMap(doc, "components"), "schemas");
        if (YamlUtils::hasKey(schemas, name)) {
            return Error::Conflict("Schema '" + name + "' already exists");
        }
        YAML::Node stored = storedSchema(schema);
        schemas[name] = stored;

        CROW_LOG_INFO << "Created WebSocket schema '" << name << "'";
        return NamedNode{name, YAML::Clone(stored)};
    });
}

std::vector<NamedNode> WebSocketSpecService::listSchemas() const {
    return store_->read([](const YAML::Node& doc) { return listSection(componentSection(doc, "schemas")); });
}

Result<NamedNode> WebSocketSpecService::getSchema(const std::string& name) const {
    return store_->read([&name](const YAML::Node& doc) {
        return getEntry(componentSection(doc, "schemas"), name, "Schema");
    });
}

Result<NamedNode> WebSocketSpecService::updateSchema(const std::string& name, const YAML::Node& schema) {
    return store_->write("update WebSocket schema", [&](YAML::Node& doc) -> Result<NamedNode> {
        YAML::Node schemas = componentSection(doc, "schemas");
        if (!YamlUtils::child(schemas, name).IsDefined()) {
            return Error::NotFound("Schema '" + name + "' not found");
        }
        YAML::Node stored = storedSchema(schema);
        schemas[name] = stored;

        CROW_LOG_INFO << "Updated WebSocket schema '" << name << "'";
        return NamedNode{name, YAML::Clone(stored)};
    });
}

Result<NamedNode> WebSocketSpecService::deleteSchema(const std::string& name) {
    return store_->write("delete WebSocket schema", [&name](YAML::Node& doc) -> Result<NamedNode> {
        YAML::Node schemas = componentSection(doc, "schemas");
        auto removed = getEntry(schemas, name, "Schema");
        if (removed) {
            YamlUtils::removeKey(schemas, name);
            CROW_LOG_INFO << "Deleted WebSocket schema '" << name << "'";
        }
        return removed;
    });
}

Result<ImportResult> WebSocketSpecService::importYaml(const std::string& filename, const std::string& content) {
    ImportValidator validator(SpecKind::WebSocket);
    auto validation = validator.validate(filename, content);
    if (!validation.valid) {
        CROW_LOG_WARNING << "Rejected WebSocket import '" << filename << "':\n" << validation.getErrorSummary();
        return validation.toError();
    }

    return store_->write("import WebSocket spec", [&validation](YAML::Node& doc) -> Result<ImportResult> {
        return YamlImportMerger::mergeWebSocket(doc, validation.document);
    });
}

std::string WebSocketSpecService::exportYaml() const {
    return store_->read([](const YAML::Node& doc) { return YamlUtils::emit(doc); });
}

} // namespace ouroboros
