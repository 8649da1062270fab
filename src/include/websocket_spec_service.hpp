#pragma once

#include <yaml-cpp/yaml.h>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "error.hpp"
#include "spec_store.hpp"
#include "websocket_operation_manager.hpp"
#include "yaml_import_merger.hpp"

namespace ouroboros {

/**
 * A named entry of the AsyncAPI document (channel, message or schema).
 */
struct NamedNode {
    std::string name;
    YAML::Node node;    // Deep copy, document form
};

struct MessageRequest {
    std::string message_name;                   // Key under components.messages
    std::optional<std::string> name;
    std::optional<std::string> content_type;
    std::optional<std::string> description;
    YAML::Node headers;                         // Document form; null when not given
    YAML::Node payload;
};

/**
 * WebSocket (AsyncAPI) spec operations over the shared document.
 *
 * Operation create/update/delete keep the channel and server graph
 * consistent: channels are created on demand and removed once no
 * operation references them.
 */
class WebSocketSpecService {
public:
    WebSocketSpecService(std::shared_ptr<SpecStore> store, WebSocketOperationManager operation_manager);

    // Operations (returned nodes are deep copies)
    Result<std::vector<WebSocketOperation>> createOperations(const CreateOperationRequest& request);
    std::vector<WebSocketOperation> listOperations() const;
    Result<WebSocketOperation> getOperation(const std::string& id) const;
    Result<WebSocketOperation> updateOperation(const std::string& id, const UpdateOperationRequest& request);
    Result<WebSocketOperation> deleteOperation(const std::string& id);

    // Channels are maintained by the operation calls and are read-only here
    std::vector<NamedNode> listChannels() const;
    Result<NamedNode> getChannel(const std::string& name) const;

    // Messages
    Result<NamedNode> createMessage(const MessageRequest& request);
    std::vector<NamedNode> listMessages() const;
    Result<NamedNode> getMessage(const std::string& name) const;
    Result<NamedNode> updateMessage(const std::string& name, const MessageRequest& request);
    Result<NamedNode> deleteMessage(const std::string& name);

    // Schemas
    Result<NamedNode> createSchema(const std::string& name, const YAML::Node& schema);
    std::vector<NamedNode> listSchemas() const;
    Result<NamedNode> getSchema(const std::string& name) const;
    Result<NamedNode> updateSchema(const std::string& name, const YAML::Node& schema);
    Result<NamedNode> deleteSchema(const std::string& name);

    /**
     * Validate and merge an uploaded AsyncAPI document.
     */
    Result<ImportResult> importYaml(const std::string& filename, const std::string& content);

    std::string exportYaml() const;

private:
    static WebSocketOperation detached(const WebSocketOperation& operation);
    static std::vector<NamedNode> listSection(const YAML::Node& section);
    static Result<NamedNode> getEntry(const YAML::Node& section, const std::string& name, const std::string& kind);
    static void applyMessageFields(YAML::Node message, const MessageRequest& request);

    std::shared_ptr<SpecStore> store_;
    WebSocketOperationManager operation_manager_;
};

} // namespace ouroboros
