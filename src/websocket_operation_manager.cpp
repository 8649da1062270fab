#include "websocket_operation_manager.hpp"
#include "error.hpp"
#include "id_generator.hpp"
#include "yaml_utils.hpp"

#include <crow/logging.h>
#include <utility>

namespace ouroboros {

WebSocketOperationManager::WebSocketOperationManager(WebSocketServerManager server_manager)
    : server_manager_(std::move(server_manager)) {}

std::vector<WebSocketOperation> WebSocketOperationManager::createOperations(
    YAML::Node doc,
    const CreateOperationRequest& request) const {
    if (request.protocol.empty()) {
        throw SpecOperationError(ErrorCategory::Validation, "Protocol must be provided (ws or wss)");
    }
    if (request.protocol != "ws" && request.protocol != "wss") {
        throw SpecOperationError(ErrorCategory::Validation, "Protocol must be either 'ws' or 'wss'");
    }
    if (request.pathname.empty()) {
        throw SpecOperationError(ErrorCategory::Validation, "Pathname must be provided");
    }
    if (request.receives.empty() && request.replies.empty()) {
        throw SpecOperationError(ErrorCategory::Validation,
                                 "At least one receive or reply channel must be provided");
    }

    server_manager_.ensureServerExists(doc, request.protocol, request.pathname);
    YAML::Node operations = YamlUtils::getOrCreateMap(doc, "operations");

    std::vector<WebSocketOperation> created;
    auto add = [&](const std::optional<std::string>& receive_channel,
                   const std::vector<std::string>& receive_messages,
                   const std::optional<std::string>& reply_channel,
                   const std::vector<std::string>& reply_messages) {
        std::string name = generateOperationName(doc, receive_channel, reply_channel);
        YAML::Node definition = buildOperationDefinition(receive_channel, receive_messages,
                                                         reply_channel, reply_messages,
                                                         request.pathname);
        operations[name] = definition;
        created.push_back({name, YamlUtils::child(operations, name), calculateOperationTag(definition)});
        CROW_LOG_INFO << "Created operation '" << name << "'";
    };

    if (request.receives.empty()) {
        for (const auto& reply : request.replies) {
            std::string reply_channel = WebSocketChannelManager::ensureChannelExists(doc, reply);
            add(std::nullopt, {}, reply_channel, reply.messages);
        }
        return created;
    }

    for (const auto& receive : request.receives) {
        std::string receive_channel = WebSocketChannelManager::ensureChannelExists(doc, receive);
        if (request.replies.empty()) {
            add(receive_channel, receive.messages, std::nullopt, {});
            continue;
        }
        for (const auto& reply : request.replies) {
            std::string reply_channel = WebSocketChannelManager::ensureChannelExists(doc, reply);
            add(receive_channel, receive.messages, reply_channel, reply.messages);
        }
    }
    return created;
}

WebSocketOperation WebSocketOperationManager::updateOperation(YAML::Node doc,
                                                              const std::string& id,
                                                              const UpdateOperationRequest& request) const {
    auto existing = findOperationById(doc, id);
    if (!existing) {
        throw SpecOperationError(ErrorCategory::NotFound, "Operation with id '" + id + "' not found");
    }

    std::optional<std::string> updated_pathname;
    if (request.protocol || request.pathname) {
        auto protocol = request.protocol ? request.protocol : WebSocketServerManager::extractProtocol(doc);
        auto pathname = request.pathname ? request.pathname : WebSocketServerManager::extractPathname(doc);
        if (protocol && pathname) {
            server_manager_.ensureServerExists(doc, *protocol, *pathname);
            updated_pathname = pathname;
        }
    }

    const std::set<std::string> old_channels =
        WebSocketChannelManager::extractChannelReferences(existing->node);

    YAML::Node updated = YAML::Clone(existing->node);

    if (updated_pathname) {
        updated[ext::kEntrypoint] = *updated_pathname;
    }

    if (request.receive) {
        updated["action"] = toString(WsAction::Receive);
    } else if (request.reply) {
        updated["action"] = toString(WsAction::Send);
    }

    if (request.receive) {
        std::string channel = WebSocketChannelManager::ensureChannelExists(doc, *request.receive);
        updated["channel"] = channelReference(channel);
        if (!request.receive->messages.empty()) {
            updated["messages"] = messageReferences(channel, request.receive->messages);
        }
    }

    if (request.reply) {
        std::string channel = WebSocketChannelManager::ensureChannelExists(doc, *request.reply);
        if (!request.receive) {
            // send-only: the reply channel becomes the main channel
            updated["channel"] = channelReference(channel);
            if (!request.reply->messages.empty()) {
                updated["messages"] = messageReferences(channel, request.reply->messages);
            }
            updated.remove("reply");
        } else {
            YAML::Node reply(YAML::NodeType::Map);
            reply["channel"] = channelReference(channel);
            if (!request.reply->messages.empty()) {
                reply["messages"] = messageReferences(channel, request.reply->messages);
            }
            updated["reply"] = reply;
        }
    }

    std::set<std::string> removed_channels;
    const std::set<std::string> new_channels = WebSocketChannelManager::extractChannelReferences(updated);
    for (const auto& channel : old_channels) {
        if (new_channels.count(channel) == 0) {
            removed_channels.insert(channel);
        }
    }

    YAML::Node operations = YamlUtils::getOrCreateMap(doc, "operations");
    operations[existing->name] = updated;
    WebSocketChannelManager::cleanupUnusedChannels(doc, removed_channels);

    CROW_LOG_INFO << "Updated operation '" << existing->name << "'";
    return {existing->name, YamlUtils::child(operations, existing->name), calculateOperationTag(updated)};
}

WebSocketOperation WebSocketOperationManager::deleteOperation(YAML::Node doc, const std::string& id) const {
    auto existing = findOperationById(doc, id);
    if (!existing) {
        throw SpecOperationError(ErrorCategory::NotFound, "Operation with id '" + id + "' not found");
    }

    YAML::Node removed = YAML::Clone(existing->node);
    const std::set<std::string> referenced = WebSocketChannelManager::extractChannelReferences(removed);

    YAML::Node operations = YamlUtils::child(doc, "operations");
    operations.remove(existing->name);
    WebSocketChannelManager::cleanupUnusedChannels(doc, referenced);

    CROW_LOG_INFO << "Deleted operation '" << existing->name << "'";
    return {existing->name, removed, calculateOperationTag(removed)};
}

std::optional<WebSocketOperation> WebSocketOperationManager::findOperationById(const YAML::Node& doc,
                                                                                const std::string& id) {
    YAML::Node operations = YamlUtils::child(doc, "operations");
    if (!operations.IsDefined() || !operations.IsMap()) {
        return std::nullopt;
    }
    for (const auto& entry : operations) {
        if (YamlUtils::getString(entry.second, ext::kId, "") == id) {
            return WebSocketOperation{entry.first.as<std::string>(), entry.second,
                                      calculateOperationTag(entry.second)};
        }
    }
    return std::nullopt;
}

std::vector<WebSocketOperation> WebSocketOperationManager::listOperations(const YAML::Node& doc) {
    std::vector<WebSocketOperation> result;
    YAML::Node operations = YamlUtils::child(doc, "operations");
    if (!operations.IsDefined() || !operations.IsMap()) {
        return result;
    }
    for (const auto& entry : operations) {
        if (entry.second.IsMap()) {
            result.push_back({entry.first.as<std::string>(), entry.second,
                              calculateOperationTag(entry.second)});
        }
    }
    return result;
}

std::string WebSocketOperationManager::calculateOperationTag(const YAML::Node& operation) {
    auto action = parseWsAction(YamlUtils::getString(operation, "action", ""));
    if (!action) {
        return "";
    }
    if (*action == WsAction::Send) {
        return "sendto";
    }
    return YamlUtils::hasKey(operation, "reply") ? "duplicate" : "receive";
}

std::string WebSocketOperationManager::generateOperationName(
    const YAML::Node& doc,
    const std::optional<std::string>& receive_channel,
    const std::optional<std::string>& reply_channel) {
    std::string base_name;
    if (receive_channel && reply_channel) {
        base_name = *receive_channel + "_to_" + *reply_channel;
    } else if (receive_channel) {
        base_name = *receive_channel + "_receive";
    } else if (reply_channel) {
        base_name = *reply_channel + "_send";
    } else {
        base_name = "unnamed_operation";
    }

    YAML::Node operations = YamlUtils::child(doc, "operations");
    std::string name = base_name;
    for (int counter = 1; YamlUtils::hasKey(operations, name); ++counter) {
        name = base_name + "_" + std::to_string(counter);
    }
    return name;
}

YAML::Node WebSocketOperationManager::buildOperationDefinition(
    const std::optional<std::string>& receive_channel,
    const std::vector<std::string>& receive_messages,
    const std::optional<std::string>& reply_channel,
    const std::vector<std::string>& reply_messages,
    const std::string& pathname) {
    YAML::Node operation(YAML::NodeType::Map);

    if (receive_channel) {
        operation["action"] = toString(WsAction::Receive);
        operation["channel"] = channelReference(*receive_channel);
        if (!receive_messages.empty()) {
            operation["messages"] = messageReferences(*receive_channel, receive_messages);
        }
    } else if (reply_channel) {
        operation["action"] = toString(WsAction::Send);
        operation["channel"] = channelReference(*reply_channel);
        if (!reply_messages.empty()) {
            operation["messages"] = messageReferences(*reply_channel, reply_messages);
        }
    }

    if (receive_channel && reply_channel) {
        YAML::Node reply(YAML::NodeType::Map);
        reply["channel"] = channelReference(*reply_channel);
        if (!reply_messages.empty()) {
            reply["messages"] = messageReferences(*reply_channel, reply_messages);
        }
        operation["reply"] = reply;
    }

    operation[ext::kId] = IdGenerator::generateUuid();
    operation[ext::kEntrypoint] = pathname;
    operation["bindings"]["stomp"] = YAML::Node(YAML::NodeType::Map);
    operation[ext::kDiff] = toString(DiffState::None);
    operation[ext::kProgress] = toString(ProgressState::None);
    return operation;
}

YAML::Node WebSocketOperationManager::channelReference(const std::string& channel) {
    YAML::Node reference(YAML::NodeType::Map);
    reference["$ref"] = std::string(kChannelRefPrefix) + channel;
    return reference;
}

YAML::Node WebSocketOperationManager::messageReferences(const std::string& channel,
                                                        const std::vector<std::string>& messages) {
    YAML::Node references(YAML::NodeType::Sequence);
    for (const auto& message : messages) {
        YAML::Node reference(YAML::NodeType::Map);
        reference["$ref"] = std::string(kChannelRefPrefix) + channel + "/messages/" + message;
        references.push_back(reference);
    }
    return references;
}

} // namespace ouroboros
