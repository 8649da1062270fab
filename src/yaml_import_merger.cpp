#include "yaml_import_merger.hpp"

#include <crow/logging.h>

#include "spec_model.hpp"
#include "yaml_utils.hpp"

namespace ouroboros {

namespace {

std::string summarySuffix(const ImportResult& result) {
    if (result.renamed_list.empty()) {
        return "";
    }
    return ", renamed " + std::to_string(result.renamed()) + " items due to duplicates";
}

void setIfAbsent(YAML::Node node, const char* key, const std::string& value) {
    if (!YamlUtils::hasKey(node, key)) {
        node[key] = value;
    }
}

} // namespace

std::string YamlImportMerger::uniqueName(const std::string& original,
                                         const std::function<bool(const std::string&)>& taken) {
    std::string candidate = original + "-import";
    int counter = 1;
    while (taken(candidate)) {
        candidate = original + "-import" + std::to_string(counter++);
    }
    return candidate;
}

std::vector<std::string> YamlImportMerger::mergeSection(YAML::Node target,
                                                        const YAML::Node& source,
                                                        const std::string& type,
                                                        RenameMap& renames,
                                                        std::vector<RenamedItem>& renamed_list) {
    std::vector<std::string> stored;
    auto taken = [&target](const std::string& name) { return YamlUtils::hasKey(target, name); };

    for (const auto& name : YamlUtils::keys(source)) {
        YAML::Node entry = YAML::Clone(YamlUtils::child(source, name));
        std::string final_name = name;

        if (taken(name)) {
            final_name = uniqueName(name, taken);
            RenamedItem item{type, name, final_name, std::nullopt, std::nullopt};
            if (type == "operation") {
                item.action = YamlUtils::getString(entry, "action");
            }
            renamed_list.push_back(item);
            renames[name] = final_name;
            CROW_LOG_INFO << "Imported " << type << " '" << name << "' renamed to '"
                          << final_name << "' due to duplicate";
        }

        target[final_name] = entry;
        stored.push_back(final_name);
    }
    return stored;
}

void YamlImportMerger::renameChannelMessageKeys(YAML::Node channel, const RenameMap& message_renames) {
    YAML::Node messages = YamlUtils::child(channel, "messages");
    if (message_renames.empty() || !messages.IsDefined() || !messages.IsMap()) {
        return;
    }

    YAML::Node renamed(YAML::NodeType::Map);
    for (const auto& key : YamlUtils::keys(messages)) {
        auto it = message_renames.find(key);
        renamed[it == message_renames.end() ? key : it->second] = YamlUtils::child(messages, key);
    }
    channel["messages"] = renamed;
}

std::optional<std::string> YamlImportMerger::firstServerPathname(const YAML::Node& imported) {
    YAML::Node servers = YamlUtils::child(imported, "servers");
    auto names = YamlUtils::keys(servers);
    if (names.empty()) {
        return std::nullopt;
    }
    return YamlUtils::getString(YamlUtils::child(servers, names.front()), "pathname");
}

ImportResult YamlImportMerger::mergeWebSocket(YAML::Node existing, const YAML::Node& imported) {
    ImportResult result;
    RenameMap schema_renames;
    RenameMap message_renames;
    RenameMap server_renames;
    RenameMap channel_renames;
    RenameMap operation_renames;

    YAML::Node imported_components = YamlUtils::child(imported, "components");

    // Schemas
    YAML::Node imported_schemas = YamlUtils::child(imported_components, "schemas");
    if (!YamlUtils::keys(imported_schemas).empty()) {
        YAML::Node schemas = YamlUtils::getOrCreateMap(YamlUtils::getOrCreateMap(existing, "components"), "schemas");
        auto stored = mergeSection(schemas, imported_schemas, "schema", schema_renames, result.renamed_list);
        for (const auto& name : stored) {
            ReferenceConverter::updateSchemaReferences(YamlUtils::child(schemas, name), schema_renames);
        }
        result.imported_schemas = static_cast<int>(stored.size());
    }

    // Messages, with payload schema references following schema renames
    YAML::Node imported_messages = YamlUtils::child(imported_components, "messages");
    if (!YamlUtils::keys(imported_messages).empty()) {
        YAML::Node messages = YamlUtils::getOrCreateMap(YamlUtils::getOrCreateMap(existing, "components"), "messages");
        auto stored = mergeSection(messages, imported_messages, "message", message_renames, result.renamed_list);
        for (const auto& name : stored) {
            ReferenceConverter::updateSchemaReferences(YamlUtils::child(messages, name), schema_renames);
        }
        result.imported_messages = static_cast<int>(stored.size());
    }

    // Servers
    YAML::Node imported_servers = YamlUtils::child(imported, "servers");
    if (!YamlUtils::keys(imported_servers).empty()) {
        YAML::Node servers = YamlUtils::getOrCreateMap(existing, "servers");
        auto stored = mergeSection(servers, imported_servers, "server", server_renames, result.renamed_list);
        result.imported_servers = static_cast<int>(stored.size());
    }
    std::optional<std::string> entrypoint = firstServerPathname(imported);

    // Channels, with message keys and references following message renames
    YAML::Node imported_channels = YamlUtils::child(imported, "channels");
    if (!YamlUtils::keys(imported_channels).empty()) {
        YAML::Node channels = YamlUtils::getOrCreateMap(existing, "channels");
        auto stored = mergeSection(channels, imported_channels, "channel", channel_renames, result.renamed_list);
        for (const auto& name : stored) {
            YAML::Node channel = YamlUtils::child(channels, name);
            renameChannelMessageKeys(channel, message_renames);
            ReferenceConverter::updateMessageReferences(channel, message_renames);
        }
        result.imported_channels = static_cast<int>(stored.size());
    }

    // Operations
    YAML::Node imported_operations = YamlUtils::child(imported, "operations");
    if (!YamlUtils::keys(imported_operations).empty()) {
        YAML::Node operations = YamlUtils::getOrCreateMap(existing, "operations");
        auto stored = mergeSection(operations, imported_operations, "operation", operation_renames,
                                   result.renamed_list);
        for (const auto& name : stored) {
            YAML::Node operation = YamlUtils::child(operations, name);
            ensureOperationId(operation);
            setIfAbsent(operation, ext::kProgress, toString(ProgressState::None));
            setIfAbsent(operation, ext::kDiff, toString(DiffState::None));
            if (entrypoint) {
                setIfAbsent(operation, ext::kEntrypoint, *entrypoint);
            }
            ReferenceConverter::updateMessageReferences(operation, message_renames);
            ReferenceConverter::updateChannelReferences(operation, channel_renames);
        }
        result.imported_operations = static_cast<int>(stored.size());
    }

    result.imported = result.imported_operations;
    result.summary = "Successfully imported " + std::to_string(result.imported_channels) + " channels, " +
                     std::to_string(result.imported_operations) + " operations, " +
                     std::to_string(result.imported_schemas) + " schemas, " +
                     std::to_string(result.imported_messages) + " messages" + summarySuffix(result);

    CROW_LOG_INFO << result.summary;
    return result;
}

void YamlImportMerger::enrichRestSchema(YAML::Node schema) {
    if (!schema.IsDefined() || !schema.IsMap() || YamlUtils::hasKey(schema, "$ref")) {
        return;
    }

    YAML::Node properties = YamlUtils::child(schema, "properties");
    if (properties.IsDefined() && properties.IsMap()) {
        YAML::Node orders(YAML::NodeType::Sequence);
        for (const auto& name : YamlUtils::keys(properties)) {
            orders.push_back(name);
            YAML::Node property = YamlUtils::child(properties, name);
            if (!property.IsMap()) {
                continue;
            }
            if (!YamlUtils::hasKey(property, "$ref")) {
                setIfAbsent(property, ext::kMock, "");
            }
            const std::string type = YamlUtils::getString(property, "type", "");
            if (type == "object" && YamlUtils::hasKey(property, "properties")) {
                enrichRestSchema(property);
            }
            if (type == "array") {
                enrichRestSchema(YamlUtils::child(property, "items"));
            }
        }
        if (!YamlUtils::hasKey(schema, ext::kOrders)) {
            schema[ext::kOrders] = orders;
        }
    }

    if (YamlUtils::getString(schema, "type", "") == "array") {
        enrichRestSchema(YamlUtils::child(schema, "items"));
    }
}

ImportResult YamlImportMerger::mergeRest(YAML::Node existing, const YAML::Node& imported) {
    ImportResult result;
    RenameMap schema_renames;

    YAML::Node imported_schemas = YamlUtils::child(YamlUtils::child(imported, "components"), "schemas");
    YAML::Node schemas = YamlUtils::getOrCreateMap(YamlUtils::getOrCreateMap(existing, "components"), "schemas");
    auto stored_schemas = mergeSection(schemas, imported_schemas, "schema", schema_renames, result.renamed_list);
    for (const auto& name : stored_schemas) {
        YAML::Node schema = YamlUtils::child(schemas, name);
        enrichRestSchema(schema);
        ReferenceConverter::updateSchemaReferences(schema, schema_renames);
    }
    result.imported_schemas = static_cast<int>(stored_schemas.size());

    YAML::Node paths = YamlUtils::getOrCreateMap(existing, "paths");
    YAML::Node imported_paths = YamlUtils::child(imported, "paths");
    for (const auto& path : YamlUtils::keys(imported_paths)) {
        YAML::Node imported_item = YamlUtils::child(imported_paths, path);

        for (const auto& key : YamlUtils::keys(imported_item)) {
            auto method = parseHttpMethod(key);
            if (!method) {
                continue;
            }

            auto taken = [&paths, &method](const std::string& candidate) {
                return YamlUtils::isPresent(getOperation(YamlUtils::child(paths, candidate), *method));
            };

            std::string final_path = path;
            if (taken(path)) {
                final_path = uniqueName(path, taken);
                result.renamed_list.push_back(
                    RenamedItem{"api", path, final_path, std::nullopt, toString(*method)});
                CROW_LOG_INFO << "Imported API '" << toString(*method) << " " << path
                              << "' renamed to '" << final_path << "' due to duplicate";
            }

            YAML::Node operation = YAML::Clone(YamlUtils::child(imported_item, key));
            ReferenceConverter::updateSchemaReferences(operation, schema_renames);
            ensureOperationId(operation);
            setIfAbsent(operation, ext::kProgress, toString(ProgressState::Mock));
            setIfAbsent(operation, ext::kTag, "none");
            setIfAbsent(operation, ext::kDiff, toString(DiffState::None));

            setOperation(YamlUtils::getOrCreateMap(paths, final_path), *method, operation);
            result.imported++;
        }
    }

    result.summary = "Successfully imported " + std::to_string(result.imported) + " APIs and " +
                     std::to_string(result.imported_schemas) + " schemas" + summarySuffix(result);

    CROW_LOG_INFO << result.summary;
    return result;
}

} // namespace ouroboros
