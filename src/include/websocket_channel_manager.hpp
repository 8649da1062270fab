#pragma once

#include <yaml-cpp/yaml.h>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace ouroboros {

/**
 * One side (receive or reply) of an operation as requested by a caller:
 * either an existing channel by name or a bare address, plus the message
 * names to attach.
 */
struct ChannelMessageInfo {
    std::optional<std::string> channel_ref;
    std::optional<std::string> address;
    std::vector<std::string> messages;
};

/**
 * Maintains the channels section of an AsyncAPI document: creates channels
 * on demand and removes channels that no operation references anymore.
 * All functions work on the document in place and throw SpecOperationError
 * on precondition failures.
 */
class WebSocketChannelManager {
public:
    /**
     * Make sure the channel described by info exists.
     *
     * @param doc AsyncAPI document
     * @param info Existing channel name, or an address to derive one from
     * @return Name of the channel in doc["channels"]
     * @throws SpecOperationError if the named channel does not exist or neither field is set
     */
    static std::string ensureChannelExists(YAML::Node doc, const ChannelMessageInfo& info);

    /**
     * Channel name for an address: leading '/' dropped, remaining '/'
     * replaced by '_', prefixed with '_' ("/chat.send" -> "_chat.send").
     */
    static std::string addressToChannelName(const std::string& address);

    /**
     * Channel names referenced by an operation (main channel and reply channel).
     */
    static std::set<std::string> extractChannelReferences(const YAML::Node& operation);

    static bool isChannelUsedByOperations(const YAML::Node& doc, const std::string& channel_name);

    /**
     * Remove every candidate channel that no operation references.
     * @return Names of the removed channels
     */
    static std::vector<std::string> cleanupUnusedChannels(YAML::Node doc,
                                                          const std::set<std::string>& candidates);

private:
    static void addMessageReferences(YAML::Node channel, const std::vector<std::string>& messages);
};

} // namespace ouroboros
