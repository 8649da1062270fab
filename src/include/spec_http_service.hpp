#pragma once

#include <crow.h>
#include <memory>
#include <string>

#include "api_server.hpp"
#include "rest_spec_service.hpp"
#include "websocket_spec_service.hpp"

namespace ouroboros {

/**
 * HTTP handlers for the REST spec document.
 * Responsibility: operation and schema CRUD, sync, import and export
 */
class RestSpecHandler {
public:
    explicit RestSpecHandler(std::shared_ptr<RestSpecService> service);

    crow::response listOperations(const crow::request& req);
    crow::response createOperation(const crow::request& req);
    crow::response getOperation(const crow::request& req, const std::string& id);
    crow::response updateOperation(const crow::request& req, const std::string& id);
    crow::response deleteOperation(const crow::request& req, const std::string& id);

    crow::response listSchemas(const crow::request& req);
    crow::response createSchema(const crow::request& req);
    crow::response getSchema(const crow::request& req, const std::string& name);
    crow::response updateSchema(const crow::request& req, const std::string& name);
    crow::response deleteSchema(const crow::request& req, const std::string& name);

    // Body: scanned spec as JSON or YAML; empty body uses the configured scanner
    crow::response sync(const crow::request& req);
    // Body: YAML document; ?filename= names the upload
    crow::response importYaml(const crow::request& req);
    crow::response exportYaml(const crow::request& req);

private:
    std::shared_ptr<RestSpecService> service_;
};

/**
 * HTTP handlers for the WebSocket (AsyncAPI) spec document.
 * Responsibility: operations, read-only channels, messages and schemas, import and export
 */
class WebSocketSpecHandler {
public:
    explicit WebSocketSpecHandler(std::shared_ptr<WebSocketSpecService> service);

    crow::response listOperations(const crow::request& req);
    crow::response createOperations(const crow::request& req);
    crow::response getOperation(const crow::request& req, const std::string& id);
    crow::response updateOperation(const crow::request& req, const std::string& id);
    crow::response deleteOperation(const crow::request& req, const std::string& id);

    crow::response listChannels(const crow::request& req);
    crow::response getChannel(const crow::request& req, const std::string& name);

    crow::response listMessages(const crow::request& req);
    crow::response createMessage(const crow::request& req);
    crow::response getMessage(const crow::request& req, const std::string& name);
    crow::response updateMessage(const crow::request& req, const std::string& name);
    crow::response deleteMessage(const crow::request& req, const std::string& name);

    crow::response listSchemas(const crow::request& req);
    crow::response createSchema(const crow::request& req);
    crow::response getSchema(const crow::request& req, const std::string& name);
    crow::response updateSchema(const crow::request& req, const std::string& name);
    crow::response deleteSchema(const crow::request& req, const std::string& name);

    crow::response importYaml(const crow::request& req);
    crow::response exportYaml(const crow::request& req);

private:
    std::shared_ptr<WebSocketSpecService> service_;
};

/**
 * Registers the /ouro/rest-specs and /ouro/websocket-specs routes.
 */
class SpecHttpService {
public:
    SpecHttpService(std::shared_ptr<RestSpecService> rest_service,
                    std::shared_ptr<WebSocketSpecService> websocket_service);

    void registerRoutes(OuroborosApp& app);

    RestSpecHandler& restHandler() { return *rest_handler_; }
    WebSocketSpecHandler& webSocketHandler() { return *websocket_handler_; }

private:
    std::unique_ptr<RestSpecHandler> rest_handler_;
    std::unique_ptr<WebSocketSpecHandler> websocket_handler_;
};

} // namespace ouroboros
