#pragma once

#include <yaml-cpp/yaml.h>
#include <optional>
#include <string>
#include <vector>

namespace ouroboros {

/**
 * Helpers for working with the spec document tree.
 *
 * yaml-cpp nodes have reference semantics and a non-const operator[]
 * inserts missing keys, so every lookup here goes through a const node.
 * A returned child shares storage with the document: writes through it
 * are visible in the parent.
 */
class YamlUtils {
public:
    /**
     * Look up a map entry without inserting it.
     *
     * @param parent Node to look in (any type)
     * @param key Map key
     * @return The child, or a null node if parent is not a map or has no such key
     */
    static YAML::Node child(const YAML::Node& parent, const std::string& key);

    /**
     * @return true if node is defined and not null
     */
    static bool isPresent(const YAML::Node& node) {
        return node.IsDefined() && !node.IsNull();
    }

    static bool hasKey(const YAML::Node& parent, const std::string& key) {
        return isPresent(child(parent, key));
    }

    /**
     * Scalar value of a map entry as string.
     * @return The scalar text, or std::nullopt if absent or not a scalar
     */
    static std::optional<std::string> getString(const YAML::Node& parent, const std::string& key);

    static std::string getString(const YAML::Node& parent,
                                 const std::string& key,
                                 const std::string& default_value);

    /**
     * Return the map stored under key, replacing an absent, null or
     * non-map value with an empty map first.
     */
    static YAML::Node getOrCreateMap(YAML::Node parent, const std::string& key);

    /**
     * Keys of a map node in document order; empty for non-maps.
     */
    static std::vector<std::string> keys(const YAML::Node& map);

    static bool removeKey(YAML::Node parent, const std::string& key);

    /**
     * Parse YAML text.
     *
     * @param content Document text
     * @param source_name Name used in the error message (file name, "request body", ...)
     * @throws SpecParseError if the text is not valid YAML
     */
    static YAML::Node parse(const std::string& content, const std::string& source_name);

    /**
     * Serialize a document to block-style YAML text.
     */
    static std::string emit(const YAML::Node& node);
};

} // namespace ouroboros
