#include "api_server.hpp"

#include "file_provider.hpp"
#include "rest_spec_service.hpp"
#include "scanned_spec_provider.hpp"
#include "spec_http_service.hpp"
#include "spec_repository.hpp"
#include "spec_store.hpp"
#include "websocket_spec_service.hpp"

namespace ouroboros {

APIServer::APIServer(std::shared_ptr<ConfigManager> cm)
    : configManager(std::move(cm))
{
    createServices();
    loadDocuments();
    setupRoutes();
    setupCORS();

    CROW_LOG_INFO << "APIServer initialized for project '" << configManager->getProjectName() << "'";
}

APIServer::~APIServer() = default;

void APIServer::createServices()
{
    auto fileProvider = createDefaultFileProvider();

    auto restRepository = std::make_shared<SpecRepository>(
        SpecKind::Rest, configManager->getRestSpecPath().string(), fileProvider,
        configManager->getRestConfig().server);
    auto webSocketRepository = std::make_shared<SpecRepository>(
        SpecKind::WebSocket, configManager->getWebSocketSpecPath().string(), fileProvider);

    restStore = std::make_shared<SpecStore>(restRepository);
    webSocketStore = std::make_shared<SpecStore>(webSocketRepository);

    std::shared_ptr<IScannedSpecProvider> scanner;
    if (auto scannedPath = configManager->getScannedSpecPath()) {
        scanner = std::make_shared<FileScannedSpecProvider>(scannedPath->string(), fileProvider);
        CROW_LOG_INFO << "Scanned spec source: " << scanner->describe();
    }

    restService = std::make_shared<RestSpecService>(restStore, scanner);
    webSocketService = std::make_shared<WebSocketSpecService>(
        webSocketStore,
        WebSocketOperationManager(WebSocketServerManager(configManager->getWebSocketConfig().default_host)));

    specHttpService = std::make_unique<SpecHttpService>(restService, webSocketService);
}

void APIServer::loadDocuments()
{
    // A document that fails to load stays at its minimal form until the next reload
    auto rest = restStore->reload();
    if (!rest) {
        CROW_LOG_WARNING << "REST spec not loaded: " << rest.error().message;
    }
    auto webSocket = webSocketStore->reload();
    if (!webSocket) {
        CROW_LOG_WARNING << "WebSocket spec not loaded: " << webSocket.error().message;
    }
}

void APIServer::setupRoutes() {
    CROW_LOG_INFO << "Setting up routes...";

    CROW_ROUTE(app, "/")([](){
        return crow::response(200, "text/plain", "Ouroboros API specification service\n");
    });

    CROW_ROUTE(app, "/config")
        .methods("GET"_method)
        ([this]() {
            return getConfig();
        });

    CROW_ROUTE(app, "/config")
        .methods("DELETE"_method)
        ([this]() {
            CROW_LOG_INFO << "Spec reload requested";
            return reloadDocuments();
        });

    specHttpService->registerRoutes(app);

    CROW_LOG_INFO << "Routes set up completed";
}

void APIServer::setupCORS() {
    auto& cors = app.get_middleware<crow::CORSHandler>();
    cors.global()
        .headers("*")
        .methods("GET"_method, "POST"_method, "PUT"_method, "DELETE"_method);
}

crow::response APIServer::getConfig() {
    try {
        crow::json::wvalue config;
        config["projectName"] = configManager->getProjectName();
        config["httpPort"] = configManager->getHttpPort();
        config["restSpecFile"] = configManager->getRestSpecPath().string();
        config["webSocketSpecFile"] = configManager->getWebSocketSpecPath().string();
        if (auto scanned = configManager->getScannedSpecPath()) {
            config["scannedSpecFile"] = scanned->string();
        }
        config["webSocketDefaultHost"] = configManager->getWebSocketConfig().default_host;
        return crow::response(200, config.dump(2));
    } catch (const std::exception& e) {
        CROW_LOG_ERROR << "Error in getConfig: " << e.what();
        return crow::response(500, std::string("Internal Server Error: ") + e.what());
    }
}

crow::response APIServer::reloadDocuments() {
    auto rest = restStore->reload();
    if (!rest) {
        return rest.error().toHttpResponse();
    }
    auto webSocket = webSocketStore->reload();
    if (!webSocket) {
        return webSocket.error().toHttpResponse();
    }
    return crow::response(200, "Spec documents reloaded successfully");
}

void APIServer::run(int port) {
    if (port > 0) {
        configManager->setHttpPort(port);
    }

    CROW_LOG_INFO << "Server starting on port " << configManager->getHttpPort() << "...";
    app.port(configManager->getHttpPort())
       .server_name("Ouroboros")
       .multithreaded()
       .run();
}

void APIServer::stop() {
    app.stop();
}

} // namespace ouroboros
