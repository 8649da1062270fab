#include <argparse/argparse.hpp>
#include <exception>
#include <iostream>
#include <cstdlib>
#include <csignal>
#include <atomic>
#include <filesystem>
#include <thread>

#include "api_server.hpp"
#include "config_manager.hpp"
#include "file_provider.hpp"
#include "import_validator.hpp"
#include "rest_spec_service.hpp"
#include "scanned_spec_provider.hpp"
#include "websocket_spec_service.hpp"

using namespace ouroboros;

std::atomic<bool> should_exit(false);
std::shared_ptr<APIServer> api_server;

void set_log_level(const std::string& log_level) {
    if (log_level == "debug") {
        crow::logger::setLogLevel(crow::LogLevel::Debug);
    } else if (log_level == "info") {
        crow::logger::setLogLevel(crow::LogLevel::Info);
    } else if (log_level == "warning") {
        crow::logger::setLogLevel(crow::LogLevel::Warning);
    } else if (log_level == "error") {
        crow::logger::setLogLevel(crow::LogLevel::Error);
    } else if (log_level == "critical") {
        crow::logger::setLogLevel(crow::LogLevel::Critical);
    } else {
        std::cerr << "Invalid log level: " << log_level << ". Using default (info)." << std::endl;
        crow::logger::setLogLevel(crow::LogLevel::Info);
    }
}

std::shared_ptr<ConfigManager> initializeConfig(const std::string& config_file) {
    std::shared_ptr<ConfigManager> config_manager = std::make_shared<ConfigManager>(std::filesystem::path(config_file));
    try {
        config_manager->loadConfig();
    } catch (const std::exception& e) {
        throw std::runtime_error("Error while loading configuration, Details: " + std::string(e.what()));
    }
    return config_manager;
}

std::optional<SpecKind> parseProtocol(const std::string& protocol) {
    if (protocol == "rest") {
        return SpecKind::Rest;
    }
    if (protocol == "websocket") {
        return SpecKind::WebSocket;
    }
    std::cerr << "Invalid protocol: " << protocol << " (expected rest or websocket)" << std::endl;
    return std::nullopt;
}

int reportError(const Error& error) {
    std::cerr << error.getCategoryName() << ": " << error.message << std::endl;
    if (!error.details.empty()) {
        std::cerr << error.details << std::endl;
    }
    return 1;
}

int runSync(APIServer& server, const std::string& scanned_file) {
    FileScannedSpecProvider scanner(scanned_file, createDefaultFileProvider());
    YAML::Node scanned;
    try {
        scanned = scanner.scan();
    } catch (const std::exception& e) {
        std::cerr << "Failed to read scanned spec: " << e.what() << std::endl;
        return 1;
    }

    auto result = server.getRestService()->sync(scanned);
    if (!result) {
        return reportError(result.error());
    }
    std::cout << "Sync completed: " << result->compared << " compared, "
              << result->endpoint_drift << " endpoint drift, "
              << result->mock_skipped << " mock skipped" << std::endl;
    return 0;
}

int runImport(APIServer& server, const std::string& file, SpecKind kind) {
    std::string content;
    try {
        content = createDefaultFileProvider()->ReadFile(file);
    } catch (const FileOperationError& e) {
        std::cerr << e.what() << std::endl;
        return 1;
    }

    const std::string filename = std::filesystem::path(file).filename().string();
    auto result = kind == SpecKind::Rest
        ? server.getRestService()->importYaml(filename, content)
        : server.getWebSocketService()->importYaml(filename, content);
    if (!result) {
        return reportError(result.error());
    }
    std::cout << result->summary << std::endl;
    for (const auto& item : result->renamed_list) {
        std::cout << "  " << item.type << ": " << item.original << " -> " << item.renamed << std::endl;
    }
    return 0;
}

int runValidate(const std::string& file, SpecKind kind) {
    std::string content;
    try {
        content = createDefaultFileProvider()->ReadFile(file);
    } catch (const FileOperationError& e) {
        std::cerr << e.what() << std::endl;
        return 1;
    }

    ImportValidator validator(kind);
    auto result = validator.validate(std::filesystem::path(file).filename().string(), content);
    if (!result.valid) {
        std::cerr << result.getErrorSummary() << std::endl;
        return 1;
    }
    std::cout << file << " is valid" << std::endl;
    return 0;
}

void terminateHandler() {
    CROW_LOG_ERROR << "Unhandled exception caught! ouroboros is giving up";

    auto ex = std::current_exception();
    try {
        std::rethrow_exception (ex);
    } catch (const std::exception& e) {
        CROW_LOG_ERROR << "exception caught: " << e.what();
    }
    std::abort();
}

void signal_handler(int signal) {
    if (signal == SIGINT) {
        CROW_LOG_INFO << "Received SIGINT, shutting down...";
        should_exit = true;
        if (api_server) {
            api_server->stop();
        }
    }
}

int main(int argc, char* argv[])
{
    std::set_terminate(terminateHandler);
    struct sigaction sa;
    sa.sa_handler = signal_handler;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0;
    sigaction(SIGINT, &sa, nullptr);

    static argparse::ArgumentParser program("ouroboros");

    program.add_argument("-c", "--config")
        .help("Path to the ouroboros.yaml configuration file")
        .default_value(std::string("ouroboros.yaml"));

    program.add_argument("-p", "--port")
        .help("Port number for the web server")
        .default_value(-1)
        .scan<'i', int>();

    program.add_argument("--log-level")
        .help("Set the log level (debug, info, warning, error, critical)")
        .default_value(std::string("info"));

    program.add_argument("--sync")
        .help("Reconcile the REST spec against a scanned spec file and exit");

    program.add_argument("--import")
        .help("Import a YAML spec file into the spec document and exit");

    program.add_argument("--validate")
        .help("Validate a YAML spec file for import and exit");

    program.add_argument("--protocol")
        .help("Spec kind for --import and --validate (rest, websocket)")
        .default_value(std::string("rest"));

    try {
        program.parse_args(argc, argv);
    } catch (const std::runtime_error& err) {
        std::cerr << err.what() << std::endl;
        std::cerr << program;
        return 1;
    }

    std::string config_file = program.get<std::string>("--config");
    int cmd_port = program.get<int>("--port");
    std::string log_level = program.get<std::string>("--log-level");

    set_log_level(log_level);

    auto protocol = parseProtocol(program.get<std::string>("--protocol"));
    if (!protocol) {
        return 1;
    }

    if (auto file = program.present("--validate")) {
        return runValidate(*file, *protocol);
    }

    std::shared_ptr<ConfigManager> config_manager;
    try {
        config_manager = initializeConfig(config_file);
    } catch (const std::exception& e) {
        std::cerr << e.what() << std::endl;
        return 1;
    }

    if (cmd_port != -1) {
        config_manager->setHttpPort(cmd_port);
    }

    api_server = std::make_shared<APIServer>(config_manager);

    if (auto file = program.present("--sync")) {
        return runSync(*api_server, *file);
    }
    if (auto file = program.present("--import")) {
        return runImport(*api_server, *file, *protocol);
    }

    std::thread server_thread([config_manager, server = api_server]() {
        server->run(config_manager->getHttpPort());
    });

    CROW_LOG_INFO << "Ouroboros server started on port " << config_manager->getHttpPort();

    server_thread.join();

    return 0;
}
