#pragma once

#include <crow.h>
#include "crow/middlewares/cors.h"

#include <memory>

#include "config_manager.hpp"

namespace ouroboros {

using OuroborosApp = crow::App<crow::CORSHandler>;

class RestSpecService;
class SpecHttpService;
class SpecStore;
class WebSocketSpecService;

class APIServer
{
public:
    explicit APIServer(std::shared_ptr<ConfigManager> config_manager);
    ~APIServer();

    void run(int port = 0);
    void stop();

    std::shared_ptr<RestSpecService> getRestService() const { return restService; }
    std::shared_ptr<WebSocketSpecService> getWebSocketService() const { return webSocketService; }

private:
    void createServices();
    void loadDocuments();
    void setupRoutes();
    void setupCORS();

    crow::response getConfig();
    crow::response reloadDocuments();

    OuroborosApp app;
    std::shared_ptr<ConfigManager> configManager;
    std::shared_ptr<SpecStore> restStore;
    std::shared_ptr<SpecStore> webSocketStore;
    std::shared_ptr<RestSpecService> restService;
    std::shared_ptr<WebSocketSpecService> webSocketService;
    std::unique_ptr<SpecHttpService> specHttpService;
};

} // namespace ouroboros
