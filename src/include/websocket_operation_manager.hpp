#pragma once

#include <yaml-cpp/yaml.h>
#include <optional>
#include <string>
#include <vector>

#include "spec_model.hpp"
#include "websocket_channel_manager.hpp"
#include "websocket_server_manager.hpp"

namespace ouroboros {

struct CreateOperationRequest {
    std::string protocol;
    std::string pathname;
    std::vector<ChannelMessageInfo> receives;
    std::vector<ChannelMessageInfo> replies;
};

struct UpdateOperationRequest {
    std::optional<std::string> protocol;
    std::optional<std::string> pathname;
    std::optional<ChannelMessageInfo> receive;
    std::optional<ChannelMessageInfo> reply;
};

/**
 * A named operation of an AsyncAPI document.
 * node shares storage with the document it was read from.
 */
struct WebSocketOperation {
    std::string name;
    YAML::Node node;
    std::string tag;
};

/**
 * Creates, updates and deletes AsyncAPI operations, keeping servers and
 * channels consistent with them. Works on the document in place; throws
 * SpecOperationError on invalid requests and unknown ids.
 */
class WebSocketOperationManager {
public:
    explicit WebSocketOperationManager(WebSocketServerManager server_manager);

    /**
     * Create operations for every receive x reply pair, or one per side when
     * only receives or only replies are given.
     */
    std::vector<WebSocketOperation> createOperations(YAML::Node doc, const CreateOperationRequest& request) const;

    WebSocketOperation updateOperation(YAML::Node doc, const std::string& id, const UpdateOperationRequest& request) const;

    /**
     * Remove an operation and every channel only it referenced.
     * @return The removed operation
     */
    WebSocketOperation deleteOperation(YAML::Node doc, const std::string& id) const;

    static std::optional<WebSocketOperation> findOperationById(const YAML::Node& doc, const std::string& id);

    static std::vector<WebSocketOperation> listOperations(const YAML::Node& doc);

    /**
     * "sendto" for send, "duplicate" for receive with a reply, "receive" otherwise.
     */
    static std::string calculateOperationTag(const YAML::Node& operation);

    /**
     * {receive}_to_{reply}, {receive}_receive or {reply}_send, suffixed
     * _1, _2, ... until unused in doc.
     */
    static std::string generateOperationName(const YAML::Node& doc,
                                             const std::optional<std::string>& receive_channel,
                                             const std::optional<std::string>& reply_channel);

    static YAML::Node buildOperationDefinition(const std::optional<std::string>& receive_channel,
                                               const std::vector<std::string>& receive_messages,
                                               const std::optional<std::string>& reply_channel,
                                               const std::vector<std::string>& reply_messages,
                                               const std::string& pathname);

    const WebSocketServerManager& serverManager() const { return server_manager_; }

private:
    static YAML::Node channelReference(const std::string& channel);
    static YAML::Node messageReferences(const std::string& channel, const std::vector<std::string>& messages);

    WebSocketServerManager server_manager_;
};

} // namespace ouroboros
