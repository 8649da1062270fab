#pragma once

#include <yaml-cpp/yaml.h>
#include <map>
#include <string>

namespace ouroboros {

using RenameMap = std::map<std::string, std::string>;

/**
 * Conversions between the persisted document form and the JSON form
 * exposed to API clients, and rewriting of references after renames.
 *
 * Document form: "$ref" keys, "x-ouroboros-*" metadata keys.
 * API form: "ref" keys, metadata keys without the "x-ouroboros-" prefix.
 * Keys of a "properties" map are field names and are never converted.
 * Values of "example", "examples", "default", "enum" and "const" are user
 * data and are copied as is in both directions.
 */
class ReferenceConverter {
public:
    /**
     * Deep copy of node in API form.
     */
    static YAML::Node toApiForm(const YAML::Node& node);

    /**
     * Deep copy of node in document form. A "ref" value that does not start
     * with '#' is taken as a schema name and expanded to #/components/schemas/<name>.
     */
    static YAML::Node toDocumentForm(const YAML::Node& node);

    /**
     * Rewrite #/components/schemas/<old> references anywhere under node.
     * @return Number of references rewritten
     */
    static int updateSchemaReferences(YAML::Node node, const RenameMap& renames);

    /**
     * Rewrite message references anywhere under node, both the component
     * form (#/components/messages/<old>) and the channel-scoped form
     * (#/channels/<channel>/messages/<old>).
     * @return Number of references rewritten
     */
    static int updateMessageReferences(YAML::Node node, const RenameMap& renames);

    /**
     * Rewrite channel references (#/channels/<old> and anything below it,
     * such as #/channels/<old>/messages/M) anywhere under node.
     * @return Number of references rewritten
     */
    static int updateChannelReferences(YAML::Node node, const RenameMap& renames);

    /**
     * Strip a reference down to a bare name: the part after the last '/',
     * then after the last '.' ("#/components/schemas/com.acme.User" -> "User").
     */
    static std::string cleanRefValue(const std::string& ref);

    /**
     * Metadata keys that travel without prefix in API form.
     */
    static bool isExtensionKey(const std::string& api_key);

private:
    static YAML::Node convert(const YAML::Node& node, bool to_api, bool keys_are_names);

    template<typename Rewrite>
    static int rewriteRefs(YAML::Node node, const Rewrite& rewrite);
};

} // namespace ouroboros
