#pragma once

#include <yaml-cpp/yaml.h>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "reference_converter.hpp"

namespace ouroboros {

/**
 * One rename performed while merging an imported document.
 */
struct RenamedItem {
    std::string type;                   // channel, operation, schema, message, server or api
    std::string original;
    std::string renamed;
    std::optional<std::string> action;  // operations only
    std::optional<std::string> method;  // REST apis only, upper case
};

struct ImportResult {
    int imported = 0;                   // APIs (REST) or operations (WebSocket)
    int imported_channels = 0;
    int imported_operations = 0;
    int imported_schemas = 0;
    int imported_messages = 0;
    int imported_servers = 0;
    std::vector<RenamedItem> renamed_list;
    std::string summary;

    int renamed() const { return static_cast<int>(renamed_list.size()); }
};

/**
 * Merges an imported spec document into the persisted one.
 *
 * Colliding names are renamed (X-import, X-import1, X-import2, ...) and
 * every reference to a renamed item inside the imported content is
 * rewritten. Imported content is deep-copied; the imported document is
 * never modified. Both merges run on the caller's working copy, which the
 * caller persists as a whole.
 */
class YamlImportMerger {
public:
    /**
     * AsyncAPI merge. Order: schemas, messages, servers, channels, operations.
     * Operations get an id (if missing), progress/diff "none" and the
     * pathname of the first imported server as entrypoint.
     */
    static ImportResult mergeWebSocket(YAML::Node existing, const YAML::Node& imported);

    /**
     * OpenAPI merge. Schemas are enriched for mock generation; a path+method
     * that already exists is imported under a renamed path.
     */
    static ImportResult mergeRest(YAML::Node existing, const YAML::Node& imported);

    /**
     * First free name of the form original-import, original-import1, ...
     *
     * @param taken Predicate telling whether a candidate is already in use
     */
    static std::string uniqueName(const std::string& original,
                                  const std::function<bool(const std::string&)>& taken);

    /**
     * Add x-ouroboros-mock to every non-$ref property (recursively through
     * nested objects and array items) and x-ouroboros-orders listing the
     * property names in document order.
     */
    static void enrichRestSchema(YAML::Node schema);

private:
    /**
     * Copy every entry of source into target, renaming collisions.
     * @return Names the entries were stored under, in source order
     */
    static std::vector<std::string> mergeSection(YAML::Node target,
                                                 const YAML::Node& source,
                                                 const std::string& type,
                                                 RenameMap& renames,
                                                 std::vector<RenamedItem>& renamed_list);

    static void renameChannelMessageKeys(YAML::Node channel, const RenameMap& message_renames);

    static std::optional<std::string> firstServerPathname(const YAML::Node& imported);
};

} // namespace ouroboros
