#include "websocket_channel_manager.hpp"
#include "error.hpp"
#include "spec_model.hpp"
#include "yaml_utils.hpp"

#include <crow/logging.h>

namespace ouroboros {

namespace {

std::optional<std::string> channelNameFromRef(const YAML::Node& reference) {
    auto ref = YamlUtils::getString(reference, "$ref");
    const std::string prefix(kChannelRefPrefix);
    if (!ref || ref->compare(0, prefix.size(), prefix) != 0) {
        return std::nullopt;
    }
    return ref->substr(prefix.size());
}

} // namespace

std::string WebSocketChannelManager::ensureChannelExists(YAML::Node doc, const ChannelMessageInfo& info) {
    YAML::Node channels = YamlUtils::getOrCreateMap(doc, "channels");

    if (info.channel_ref && !info.channel_ref->empty()) {
        const std::string& name = *info.channel_ref;
        YAML::Node channel = YamlUtils::child(channels, name);
        if (!YamlUtils::isPresent(channel)) {
            throw SpecOperationError(ErrorCategory::NotFound, "Channel '" + name + "' not found");
        }
        addMessageReferences(channel, info.messages);
        return name;
    }

    if (info.address && !info.address->empty()) {
        const std::string name = addressToChannelName(*info.address);
        YAML::Node existing = YamlUtils::child(channels, name);
        if (YamlUtils::isPresent(existing)) {
            addMessageReferences(existing, info.messages);
            return name;
        }

        YAML::Node channel(YAML::NodeType::Map);
        channel["address"] = *info.address;
        channel["messages"] = YAML::Node(YAML::NodeType::Map);
        addMessageReferences(channel, info.messages);
        channel["bindings"]["stomp"] = YAML::Node(YAML::NodeType::Map);
        channels[name] = channel;

        CROW_LOG_INFO << "Created channel '" << name << "' for address " << *info.address;
        return name;
    }

    throw SpecOperationError(ErrorCategory::Validation, "Either address or channelRef must be provided");
}

std::string WebSocketChannelManager::addressToChannelName(const std::string& address) {
    std::string name = address;
    if (!name.empty() && name.front() == '/') {
        name.erase(0, 1);
    }
    for (auto& c : name) {
        if (c == '/') {
            c = '_';
        }
    }
    return "_" + name;
}

std::set<std::string> WebSocketChannelManager::extractChannelReferences(const YAML::Node& operation) {
    std::set<std::string> names;
    if (auto main = channelNameFromRef(YamlUtils::child(operation, "channel"))) {
        names.insert(*main);
    }
    YAML::Node reply = YamlUtils::child(operation, "reply");
    if (auto reply_channel = channelNameFromRef(YamlUtils::child(reply, "channel"))) {
        names.insert(*reply_channel);
    }
    return names;
}

bool WebSocketChannelManager::isChannelUsedByOperations(const YAML::Node& doc,
                                                        const std::string& channel_name) {
    YAML::Node operations = YamlUtils::child(doc, "operations");
    if (!operations.IsDefined() || !operations.IsMap()) {
        return false;
    }
    for (const auto& entry : operations) {
        if (extractChannelReferences(entry.second).count(channel_name) > 0) {
            return true;
        }
    }
    return false;
}

std::vector<std::string> WebSocketChannelManager::cleanupUnusedChannels(
    YAML::Node doc,
    const std::set<std::string>& candidates) {
    std::vector<std::string> removed;
    YAML::Node channels = YamlUtils::child(doc, "channels");
    if (!channels.IsDefined() || !channels.IsMap()) {
        return removed;
    }

    for (const auto& name : candidates) {
        if (!YamlUtils::hasKey(channels, name) || isChannelUsedByOperations(doc, name)) {
            continue;
        }
        channels.remove(name);
        removed.push_back(name);
        CROW_LOG_INFO << "Removed unused channel '" << name << "'";
    }
    return removed;
}

void WebSocketChannelManager::addMessageReferences(YAML::Node channel,
                                                   const std::vector<std::string>& messages) {
    if (messages.empty()) {
        return;
    }
    YAML::Node channel_messages = YamlUtils::getOrCreateMap(channel, "messages");
    for (const auto& message : messages) {
        if (YamlUtils::hasKey(channel_messages, message)) {
            continue;
        }
        YAML::Node reference(YAML::NodeType::Map);
        reference["$ref"] = std::string(kMessageRefPrefix) + message;
        channel_messages[message] = reference;
    }
}

} // namespace ouroboros
