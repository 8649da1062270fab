#include "spec_http_service.hpp"

#include <crow/logging.h>

#include "json_utils.hpp"
#include "reference_converter.hpp"
#include "yaml_utils.hpp"

namespace ouroboros {

namespace {

constexpr const char* kYamlContentType = "application/x-yaml";

crow::response success(int code, crow::json::wvalue&& data) {
    return crow::response(code, JsonUtils::createSuccessResponse(std::move(data)));
}

crow::response badRequest(const std::string& message) {
    return Error::Validation(message).toHttpResponse();
}

crow::response internalError(const std::exception& e) {
    CROW_LOG_ERROR << "Request failed: " << e.what();
    return Error::Internal("Internal server error", e.what()).toHttpResponse();
}

crow::response yamlResponse(const std::string& body) {
    crow::response res(200, body);
    res.set_header("Content-Type", kYamlContentType);
    return res;
}

/**
 * Parse a JSON object body into a document-form YAML map, dropping the
 * listed routing keys.
 */
std::optional<YAML::Node> documentBody(const crow::json::rvalue& json,
                                       std::initializer_list<const char*> drop) {
    if (!json || json.t() != crow::json::type::Object) {
        return std::nullopt;
    }
    YAML::Node body = JsonUtils::jsonToYaml(json);
    for (const char* key : drop) {
        YamlUtils::removeKey(body, key);
    }
    return ReferenceConverter::toDocumentForm(body);
}

crow::json::wvalue apiJson(const YAML::Node& node) {
    return JsonUtils::yamlToJson(ReferenceConverter::toApiForm(node));
}

crow::json::wvalue restOperationJson(const RestOperationEntry& entry) {
    crow::json::wvalue json = apiJson(entry.operation);
    json["id"] = entry.id;
    json["path"] = entry.path;
    json["method"] = toString(entry.method);
    return json;
}

crow::json::wvalue namedJson(const std::string& name_key, const std::string& name, const YAML::Node& node) {
    crow::json::wvalue json = node.IsMap() ? apiJson(node) : crow::json::wvalue(crow::json::wvalue::object{});
    json[name_key] = name;
    return json;
}

crow::json::wvalue webSocketOperationJson(const WebSocketOperation& operation) {
    crow::json::wvalue json;
    json["operationName"] = operation.name;
    json["tag"] = operation.tag;
    json["operation"] = apiJson(operation.node);
    return json;
}

crow::json::wvalue importResultJson(const ImportResult& result) {
    crow::json::wvalue json;
    json["imported"] = result.imported;
    json["importedChannels"] = result.imported_channels;
    json["importedOperations"] = result.imported_operations;
    json["importedSchemas"] = result.imported_schemas;
    json["importedMessages"] = result.imported_messages;
    json["renamed"] = result.renamed();
    json["summary"] = result.summary;

    crow::json::wvalue::list renamed;
    for (const auto& item : result.renamed_list) {
        crow::json::wvalue entry;
        entry["type"] = item.type;
        entry["original"] = item.original;
        entry["renamed"] = item.renamed;
        if (item.action) {
            entry["action"] = *item.action;
        }
        if (item.method) {
            entry["method"] = *item.method;
        }
        renamed.push_back(std::move(entry));
    }
    json["renamedList"] = std::move(renamed);
    return json;
}

crow::json::wvalue syncReportJson(const SyncReport& report) {
    crow::json::wvalue json;
    json["compared"] = report.compared;
    json["responseChecked"] = report.response_checked;
    json["endpointDrift"] = report.endpoint_drift;
    json["mockSkipped"] = report.mock_skipped;
    json["swept"] = report.swept;
    json["schemasCopied"] = report.schemas_copied;
    return json;
}

ChannelMessageInfo channelInfo(const crow::json::rvalue& json) {
    ChannelMessageInfo info;
    info.channel_ref = JsonUtils::extractOptionalString(json, "channelRef");
    info.address = JsonUtils::extractOptionalString(json, "address");
    info.messages = JsonUtils::extractStringList(json, "messages");
    return info;
}

std::vector<ChannelMessageInfo> channelInfoList(const crow::json::rvalue& json, const std::string& key) {
    std::vector<ChannelMessageInfo> result;
    if (!json.has(key) || json[key].t() != crow::json::type::List) {
        return result;
    }
    for (const auto& item : json[key]) {
        if (item.t() == crow::json::type::Object) {
            result.push_back(channelInfo(item));
        }
    }
    return result;
}

YAML::Node optionalDocumentField(const crow::json::rvalue& json, const std::string& key) {
    if (!json.has(key)) {
        return YAML::Node();
    }
    return ReferenceConverter::toDocumentForm(JsonUtils::jsonToYaml(json[key]));
}

MessageRequest messageRequest(const crow::json::rvalue& json, const std::string& message_name) {
    MessageRequest request;
    request.message_name = message_name;
    request.name = JsonUtils::extractOptionalString(json, "name");
    request.content_type = JsonUtils::extractOptionalString(json, "contentType");
    request.description = JsonUtils::extractOptionalString(json, "description");
    request.headers = optionalDocumentField(json, "headers");
    request.payload = optionalDocumentField(json, "payload");
    return request;
}

std::string importFilename(const crow::request& req) {
    const char* filename = req.url_params.get("filename");
    return filename ? std::string(filename) : std::string();
}

} // namespace

// ---------------------------------------------------------------------------
// RestSpecHandler

RestSpecHandler::RestSpecHandler(std::shared_ptr<RestSpecService> service)
    : service_(std::move(service)) {}

crow::response RestSpecHandler::listOperations(const crow::request&) {
    try {
        crow::json::wvalue::list items;
        for (const auto& entry : service_->listOperations()) {
            items.push_back(restOperationJson(entry));
        }
        crow::json::wvalue data;
        data = std::move(items);
        return success(200, std::move(data));
    } catch (const std::exception& e) {
        return internalError(e);
    }
}

crow::response RestSpecHandler::createOperation(const crow::request& req) {
    try {
        auto json = crow::json::load(req.body);
        auto body = documentBody(json, {"path", "method"});
        if (!body) {
            return badRequest("Invalid JSON");
        }

        CreateRestOperationRequest request;
        request.path = JsonUtils::extractOptionalString(json, "path").value_or("");
        request.method = JsonUtils::extractOptionalString(json, "method").value_or("");
        request.operation = *body;

        auto result = service_->createOperation(request);
        if (!result) {
            return result.error().toHttpResponse();
        }
        return success(201, restOperationJson(*result));
    } catch (const std::exception& e) {
        return internalError(e);
    }
}

crow::response RestSpecHandler::getOperation(const crow::request&, const std::string& id) {
    try {
        auto result = service_->getOperation(id);
        if (!result) {
            return result.error().toHttpResponse();
        }
        return success(200, restOperationJson(*result));
    } catch (const std::exception& e) {
        return internalError(e);
    }
}

crow::response RestSpecHandler::updateOperation(const crow::request& req, const std::string& id) {
    try {
        auto json = crow::json::load(req.body);
        auto body = documentBody(json, {"path", "method", "id"});
        if (!body) {
            return badRequest("Invalid JSON");
        }

        UpdateRestOperationRequest request;
        request.path = JsonUtils::extractOptionalString(json, "path");
        request.method = JsonUtils::extractOptionalString(json, "method");
        request.fields = *body;

        auto result = service_->updateOperation(id, request);
        if (!result) {
            return result.error().toHttpResponse();
        }
        return success(200, restOperationJson(*result));
    } catch (const std::exception& e) {
        return internalError(e);
    }
}

crow::response RestSpecHandler::deleteOperation(const crow::request&, const std::string& id) {
    try {
        auto result = service_->deleteOperation(id);
        if (!result) {
            return result.error().toHttpResponse();
        }
        return success(200, restOperationJson(*result));
    } catch (const std::exception& e) {
        return internalError(e);
    }
}

crow::response RestSpecHandler::listSchemas(const crow::request&) {
    try {
        crow::json::wvalue::list items;
        for (const auto& schema : service_->listSchemas()) {
            items.push_back(namedJson("schemaName", schema.name, schema.schema));
        }
        crow::json::wvalue data;
        data = std::move(items);
        return success(200, std::move(data));
    } catch (const std::exception& e) {
        return internalError(e);
    }
}

crow::response RestSpecHandler::createSchema(const crow::request& req) {
    try {
        auto json = crow::json::load(req.body);
        auto body = documentBody(json, {"schemaName"});
        if (!body) {
            return badRequest("Invalid JSON");
        }
        const std::string name = JsonUtils::extractOptionalString(json, "schemaName").value_or("");

        auto result = service_->createSchema(name, *body);
        if (!result) {
            return result.error().toHttpResponse();
        }
        return success(201, namedJson("schemaName", result->name, result->schema));
    } catch (const std::exception& e) {
        return internalError(e);
    }
}

crow::response RestSpecHandler::getSchema(const crow::request&, const std::string& name) {
    try {
        auto result = service_->getSchema(name);
        if (!result) {
            return result.error().toHttpResponse();
        }
        return success(200, namedJson("schemaName", result->name, result->schema));
    } catch (const std::exception& e) {
        return internalError(e);
    }
}

crow::response RestSpecHandler::updateSchema(const crow::request& req, const std::string& name) {
    try {
        auto json = crow::json::load(req.body);
        auto body = documentBody(json, {"schemaName"});
        if (!body) {
            return badRequest("Invalid JSON");
        }

        auto result = service_->updateSchema(name, *body);
        if (!result) {
            return result.error().toHttpResponse();
        }
        return success(200, namedJson("schemaName", result->name, result->schema));
    } catch (const std::exception& e) {
        return internalError(e);
    }
}

crow::response RestSpecHandler::deleteSchema(const crow::request&, const std::string& name) {
    try {
        auto result = service_->deleteSchema(name);
        if (!result) {
            return result.error().toHttpResponse();
        }
        return success(200, namedJson("schemaName", result->name, result->schema));
    } catch (const std::exception& e) {
        return internalError(e);
    }
}

crow::response RestSpecHandler::sync(const crow::request& req) {
    try {
        const bool use_scanner = req.body.find_first_not_of(" \t\r\n") == std::string::npos;
        YAML::Node scanned;
        if (!use_scanner) {
            try {
                scanned = YamlUtils::parse(req.body, "request body");
            } catch (const SpecParseError& e) {
                return Error::Parse("Scanned spec could not be parsed", e.what()).toHttpResponse();
            }
        }

        auto result = use_scanner ? service_->syncFromScanner() : service_->sync(scanned);
        if (!result) {
            return result.error().toHttpResponse();
        }
        return success(200, syncReportJson(*result));
    } catch (const std::exception& e) {
        return internalError(e);
    }
}

crow::response RestSpecHandler::importYaml(const crow::request& req) {
    try {
        auto result = service_->importYaml(importFilename(req), req.body);
        if (!result) {
            return result.error().toHttpResponse();
        }
        return success(200, importResultJson(*result));
    } catch (const std::exception& e) {
        return internalError(e);
    }
}

crow::response RestSpecHandler::exportYaml(const crow::request&) {
    try {
        return yamlResponse(service_->exportYaml());
    } catch (const std::exception& e) {
        return internalError(e);
    }
}

// ---------------------------------------------------------------------------
// WebSocketSpecHandler

WebSocketSpecHandler::WebSocketSpecHandler(std::shared_ptr<WebSocketSpecService> service)
    : service_(std::move(service)) {}

crow::response WebSocketSpecHandler::listOperations(const crow::request&) {
    try {
        crow::json::wvalue::list items;
        for (const auto& operation : service_->listOperations()) {
            items.push_back(webSocketOperationJson(operation));
        }
        crow::json::wvalue data;
        data = std::move(items);
        return success(200, std::move(data));
    } catch (const std::exception& e) {
        return internalError(e);
    }
}

crow::response WebSocketSpecHandler::createOperations(const crow::request& req) {
    try {
        auto json = crow::json::load(req.body);
        if (!json || json.t() != crow::json::type::Object) {
            return badRequest("Invalid JSON");
        }

        CreateOperationRequest request;
        request.protocol = JsonUtils::extractOptionalString(json, "protocol").value_or("");
        request.pathname = JsonUtils::extractOptionalString(json, "pathname").value_or("");
        request.receives = channelInfoList(json, "receives");
        request.replies = channelInfoList(json, "replies");

        auto result = service_->createOperations(request);
        if (!result) {
            return result.error().toHttpResponse();
        }
        crow::json::wvalue::list items;
        for (const auto& operation : *result) {
            items.push_back(webSocketOperationJson(operation));
        }
        crow::json::wvalue data;
        data = std::move(items);
        return success(201, std::move(data));
    } catch (const std::exception& e) {
        return internalError(e);
    }
}

crow::response WebSocketSpecHandler::getOperation(const crow::request&, const std::string& id) {
    try {
        auto result = service_->getOperation(id);
        if (!result) {
            return result.error().toHttpResponse();
        }
        return success(200, webSocketOperationJson(*result));
    } catch (const std::exception& e) {
        return internalError(e);
    }
}

crow::response WebSocketSpecHandler::updateOperation(const crow::request& req, const std::string& id) {
    try {
        auto json = crow::json::load(req.body);
        if (!json || json.t() != crow::json::type::Object) {
            return badRequest("Invalid JSON");
        }

        UpdateOperationRequest request;
        request.protocol = JsonUtils::extractOptionalString(json, "protocol");
        request.pathname = JsonUtils::extractOptionalString(json, "pathname");
        if (JsonUtils::hasObject(json, "receive")) {
            request.receive = channelInfo(json["receive"]);
        }
        if (JsonUtils::hasObject(json, "reply")) {
            request.reply = channelInfo(json["reply"]);
        }

        auto result = service_->updateOperation(id, request);
        if (!result) {
            return result.error().toHttpResponse();
        }
        return success(200, webSocketOperationJson(*result));
    } catch (const std::exception& e) {
        return internalError(e);
    }
}

crow::response WebSocketSpecHandler::deleteOperation(const crow::request&, const std::string& id) {
    try {
        auto result = service_->deleteOperation(id);
        if (!result) {
            return result.error().toHttpResponse();
        }
        return success(200, webSocketOperationJson(*result));
    } catch (const std::exception& e) {
        return internalError(e);
    }
}

crow::response WebSocketSpecHandler::listChannels(const crow::request&) {
    try {
        crow::json::wvalue::list items;
        for (const auto& channel : service_->listChannels()) {
            items.push_back(namedJson("channelName", channel.name, channel.node));
        }
        crow::json::wvalue data;
        data = std::move(items);
        return success(200, std::move(data));
    } catch (const std::exception& e) {
        return internalError(e);
    }
}

crow::response WebSocketSpecHandler::getChannel(const crow::request&, const std::string& name) {
    try {
        auto result = service_->getChannel(name);
        if (!result) {
            return result.error().toHttpResponse();
        }
        return success(200, namedJson("channelName", result->name, result->node));
    } catch (const std::exception& e) {
        return internalError(e);
    }
}

crow::response WebSocketSpecHandler::listMessages(const crow::request&) {
    try {
        crow::json::wvalue::list items;
        for (const auto& message : service_->listMessages()) {
            items.push_back(namedJson("messageName", message.name, message.node));
        }
        crow::json::wvalue data;
        data = std::move(items);
        return success(200, std::move(data));
    } catch (const std::exception& e) {
        return internalError(e);
    }
}

crow::response WebSocketSpecHandler::createMessage(const crow::request& req) {
    try {
        auto json = crow::json::load(req.body);
        if (!json || json.t() != crow::json::type::Object) {
            return badRequest("Invalid JSON");
        }
        const std::string message_name = JsonUtils::extractOptionalString(json, "messageName").value_or("");

        auto result = service_->createMessage(messageRequest(json, message_name));
        if (!result) {
            return result.error().toHttpResponse();
        }
        return success(201, namedJson("messageName", result->name, result->node));
    } catch (const std::exception& e) {
        return internalError(e);
    }
}

crow::response WebSocketSpecHandler::getMessage(const crow::request&, const std::string& name) {
    try {
        auto result = service_->getMessage(name);
        if (!result) {
            return result.error().toHttpResponse();
        }
        return success(200, namedJson("messageName", result->name, result->node));
    } catch (const std::exception& e) {
        return internalError(e);
    }
}

crow::response WebSocketSpecHandler::updateMessage(const crow::request& req, const std::string& name) {
    try {
        auto json = crow::json::load(req.body);
        if (!json || json.t() != crow::json::type::Object) {
            return badRequest("Invalid JSON");
        }

        auto result = service_->updateMessage(name, messageRequest(json, name));
        if (!result) {
            return result.error().toHttpResponse();
        }
        return success(200, namedJson("messageName", result->name, result->node));
    } catch (const std::exception& e) {
        return internalError(e);
    }
}

crow::response WebSocketSpecHandler::deleteMessage(const crow::request&, const std::string& name) {
    try {
        auto result = service_->deleteMessage(name);
        if (!result) {
            return result.error().toHttpResponse();
        }
        return success(200, namedJson("messageName", result->name, result->node));
    } catch (const std::exception& e) {
        return internalError(e);
    }
}

crow::response WebSocketSpecHandler::listSchemas(const crow::request&) {
    try {
        crow::json::wvalue::list items;
        for (const auto& schema : service_->listSchemas()) {
            items.push_back(namedJson("schemaName", schema.name, schema.node));
        }
        crow::json::wvalue data;
        data = std::move(items);
        return success(200, std::move(data));
    } catch (const std::exception& e) {
        return internalError(e);
    }
}

crow::response WebSocketSpecHandler::createSchema(const crow::request& req) {
    try {
        auto json = crow::json::load(req.body);
        auto body = documentBody(json, {"schemaName"});
        if (!body) {
            return badRequest("Invalid JSON");
        }
        const std::string name = JsonUtils::extractOptionalString(json, "schemaName").value_or("");

        auto result = service_->createSchema(name, *body);
        if (!result) {
            return result.error().toHttpResponse();
        }
        return success(201, namedJson("schemaName", result->name, result->node));
    } catch (const std::exception& e) {
        return internalError(e);
    }
}

crow::response WebSocketSpecHandler::getSchema(const crow::request&, const std::string& name) {
    try {
        auto result = service_->getSchema(name);
        if (!result) {
            return result.error().toHttpResponse();
        }
        return success(200, namedJson("schemaName", result->name, result->node));
    } catch (const std::exception& e) {
        return internalError(e);
    }
}

crow::response WebSocketSpecHandler::updateSchema(const crow::request& req, const std::string& name) {
    try {
        auto json = crow::json::load(req.body);
        auto body = documentBody(json, {"schemaName"});
        if (!body) {
            return badRequest("Invalid JSON");
        }

        auto result = service_->updateSchema(name, *body);
        if (!result) {
            return result.error().toHttpResponse();
        }
        return success(200, namedJson("schemaName", result->name, result->node));
    } catch (const std::exception& e) {
        return internalError(e);
    }
}

crow::response WebSocketSpecHandler::deleteSchema(const crow::request&, const std::string& name) {
    try {
        auto result = service_->deleteSchema(name);
        if (!result) {
            return result.error().toHttpResponse();
        }
        return success(200, namedJson("schemaName", result->name, result->node));
    } catch (const std::exception& e) {
        return internalError(e);
    }
}

crow::response WebSocketSpecHandler::importYaml(const crow::request& req) {
    try {
        auto result = service_->importYaml(importFilename(req), req.body);
        if (!result) {
            return result.error().toHttpResponse();
        }
        return success(200, importResultJson(*result));
    } catch (const std::exception& e) {
        return internalError(e);
    }
}

crow::response WebSocketSpecHandler::exportYaml(const crow::request&) {
    try {
        return yamlResponse(service_->exportYaml());
    } catch (const std::exception& e) {
        return internalError(e);
    }
}

// ---------------------------------------------------------------------------
// SpecHttpService

SpecHttpService::SpecHttpService(std::shared_ptr<RestSpecService> rest_service,
                                 std::shared_ptr<WebSocketSpecService> websocket_service)
    : rest_handler_(std::make_unique<RestSpecHandler>(std::move(rest_service))),
      websocket_handler_(std::make_unique<WebSocketSpecHandler>(std::move(websocket_service))) {}

void SpecHttpService::registerRoutes(OuroborosApp& app) {
    CROW_LOG_INFO << "Registering spec routes";

    // REST spec. Fixed segments are registered before the <string> routes.
    CROW_ROUTE(app, "/ouro/rest-specs/sync")
        .methods("POST"_method)
        ([this](const crow::request& req) { return rest_handler_->sync(req); });

    CROW_ROUTE(app, "/ouro/rest-specs/import")
        .methods("POST"_method)
        ([this](const crow::request& req) { return rest_handler_->importYaml(req); });

    CROW_ROUTE(app, "/ouro/rest-specs/export/yaml")
        .methods("GET"_method)
        ([this](const crow::request& req) { return rest_handler_->exportYaml(req); });

    CROW_ROUTE(app, "/ouro/rest-specs/schemas")
        .methods("GET"_method, "POST"_method)
        ([this](const crow::request& req) {
            if (req.method == crow::HTTPMethod::Get)
                return rest_handler_->listSchemas(req);
            else
                return rest_handler_->createSchema(req);
        });

    CROW_ROUTE(app, "/ouro/rest-specs/schemas/<string>")
        .methods("GET"_method, "PUT"_method, "DELETE"_method)
        ([this](const crow::request& req, const std::string& name) {
            switch (req.method) {
                case crow::HTTPMethod::Get:
                    return rest_handler_->getSchema(req, name);
                case crow::HTTPMethod::Put:
                    return rest_handler_->updateSchema(req, name);
                case crow::HTTPMethod::Delete:
                    return rest_handler_->deleteSchema(req, name);
                default:
                    return crow::response(405);
            }
        });

    CROW_ROUTE(app, "/ouro/rest-specs")
        .methods("GET"_method, "POST"_method)
        ([this](const crow::request& req) {
            if (req.method == crow::HTTPMethod::Get)
                return rest_handler_->listOperations(req);
            else
                return rest_handler_->createOperation(req);
        });

    CROW_ROUTE(app, "/ouro/rest-specs/<string>")
        .methods("GET"_method, "PUT"_method, "DELETE"_method)
        ([this](const crow::request& req, const std::string& id) {
            switch (req.method) {
                case crow::HTTPMethod::Get:
                    return rest_handler_->getOperation(req, id);
                case crow::HTTPMethod::Put:
                    return rest_handler_->updateOperation(req, id);
                case crow::HTTPMethod::Delete:
                    return rest_handler_->deleteOperation(req, id);
                default:
                    return crow::response(405);
            }
        });

    // WebSocket spec
    CROW_ROUTE(app, "/ouro/websocket-specs/import")
        .methods("POST"_method)
        ([this](const crow::request& req) { return websocket_handler_->importYaml(req); });

    CROW_ROUTE(app, "/ouro/websocket-specs/export/yaml")
        .methods("GET"_method)
        ([this](const crow::request& req) { return websocket_handler_->exportYaml(req); });

    CROW_ROUTE(app, "/ouro/websocket-specs/operations")
        .methods("GET"_method, "POST"_method)
        ([this](const crow::request& req) {
            if (req.method == crow::HTTPMethod::Get)
                return websocket_handler_->listOperations(req);
            else
                return websocket_handler_->createOperations(req);
        });

    CROW_ROUTE(app, "/ouro/websocket-specs/operations/<string>")
        .methods("GET"_method, "PUT"_method, "DELETE"_method)
        ([this](const crow::request& req, const std::string& id) {
            switch (req.method) {
                case crow::HTTPMethod::Get:
                    return websocket_handler_->getOperation(req, id);
                case crow::HTTPMethod::Put:
                    return websocket_handler_->updateOperation(req, id);
                case crow::HTTPMethod::Delete:
                    return websocket_handler_->deleteOperation(req, id);
                default:
                    return crow::response(405);
            }
        });

    CROW_ROUTE(app, "/ouro/websocket-specs/channels")
        .methods("GET"_method)
        ([this](const crow::request& req) { return websocket_handler_->listChannels(req); });

    CROW_ROUTE(app, "/ouro/websocket-specs/channels/<string>")
        .methods("GET"_method)
        ([this](const crow::request& req, const std::string& name) {
            return websocket_handler_->getChannel(req, name);
        });

    CROW_ROUTE(app, "/ouro/websocket-specs/messages")
        .methods("GET"_method, "POST"_method)
        ([this](const crow::request& req) {
            if (req.method == crow::HTTPMethod::Get)
                return websocket_handler_->listMessages(req);
            else
                return websocket_handler_->createMessage(req);
        });

    CROW_ROUTE(app, "/ouro/websocket-specs/messages/<string>")
        .methods("GET"_method, "PUT"_method, "DELETE"_method)
        ([this](const crow::request& req, const std::string& name) {
            switch (req.method) {
                case crow::HTTPMethod::Get:
                    return websocket_handler_->getMessage(req, name);
                case crow::HTTPMethod::Put:
                    return websocket_handler_->updateMessage(req, name);
                case crow::HTTPMethod::Delete:
                    return websocket_handler_->deleteMessage(req, name);
                default:
                    return crow::response(405);
            }
        });

    CROW_ROUTE(app, "/ouro/websocket-specs/schemas")
        .methods("GET"_method, "POST"_method)
        ([this](const crow::request& req) {
            if (req.method == crow::HTTPMethod::Get)
                return websocket_handler_->listSchemas(req);
            else
                return websocket_handler_->createSchema(req);
        });

    CROW_ROUTE(app, "/ouro/websocket-specs/schemas/<string>")
        .methods("GET"_method, "PUT"_method, "DELETE"_method)
        ([this](const crow::request& req, const std::string& name) {
            switch (req.method) {
                case crow::HTTPMethod::Get:
                    return websocket_handler_->getSchema(req, name);
                case crow::HTTPMethod::Put:
                    return websocket_handler_->updateSchema(req, name);
                case crow::HTTPMethod::Delete:
                    return websocket_handler_->deleteSchema(req, name);
                default:
                    return crow::response(405);
            }
        });
}

} // namespace ouroboros
