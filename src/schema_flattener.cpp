#include "schema_flattener.hpp"

#include <crow/logging.h>

namespace ouroboros {

TypeCounts SchemaFlattener::flatten(const std::string& schema_name,
                                    const std::shared_ptr<Schema>& schema,
                                    const SchemaMap& all_schemas,
                                    std::set<std::string>& visited) {
    TypeCounts counts;
    if (!schema) {
        return counts;
    }
    if (visited.count(schema_name) > 0) {
        CROW_LOG_DEBUG << "Schema cycle detected at '" << schema_name << "'";
        return counts;
    }

    visited.insert(schema_name);

    RefResolver resolve = [&all_schemas, &visited](const std::string& ref) {
        auto target = schemaRefName(ref);
        if (!target) {
            return TypeCounts{};
        }
        auto it = all_schemas.find(*target);
        if (it == all_schemas.end()) {
            return TypeCounts{};
        }
        return flatten(*target, it->second, all_schemas, visited);
    };

    if (schema->isRef()) {
        merge(counts, resolve(schema->ref));
    } else {
        for (const auto& [name, property] : schema->properties) {
            if (property) {
                countProperty(name, *property, counts, resolve);
            }
        }
        if (schema->items) {
            countProperty("items", *schema->items, counts, resolve);
        }
    }

    visited.erase(schema_name);
    return counts;
}

std::map<std::string, TypeCounts> SchemaFlattener::flattenAll(const SchemaMap& all_schemas) {
    std::map<std::string, TypeCounts> result;
    for (const auto& [name, schema] : all_schemas) {
        std::set<std::string> visited;
        result[name] = flatten(name, schema, all_schemas, visited);
    }
    return result;
}

void SchemaFlattener::countProperty(const std::string& name,
                                    const Schema& schema,
                                    TypeCounts& counts,
                                    const RefResolver& resolve) {
    if (schema.isRef()) {
        merge(counts, resolve(schema.ref));
        return;
    }

    if (schema.type == "array") {
        if (!schema.items) {
            return;
        }
        // Arrays of inline objects or nested arrays are not counted.
        const Schema& element = *schema.items;
        if (element.isRef()) {
            counts[name + ":array." + refName(element.ref)] += 1;
        } else if (isPrimitive(element.type)) {
            const std::string type = element.format == "binary" ? "binary" : element.type;
            counts[name + ":array." + type] += 1;
        }
        return;
    }

    if (schema.hasProperties()) {
        for (const auto& [nested_name, nested] : schema.properties) {
            if (nested) {
                countProperty(nested_name, *nested, counts, resolve);
            }
        }
        return;
    }

    if (isPrimitive(schema.type)) {
        const std::string type = schema.format == "binary" ? "binary" : schema.type;
        counts[name + ":" + type] += 1;
    }
}

void SchemaFlattener::merge(TypeCounts& into, const TypeCounts& from) {
    for (const auto& [key, count] : from) {
        into[key] += count;
    }
}

bool SchemaFlattener::isPrimitive(const std::string& type) {
    return type == "string" || type == "integer" || type == "number" || type == "boolean";
}

} // namespace ouroboros
