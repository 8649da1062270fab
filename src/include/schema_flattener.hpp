#pragma once

#include <functional>
#include <map>
#include <set>
#include <string>

#include "spec_model.hpp"

namespace ouroboros {

/**
 * Multiset of "field:type" signatures, e.g. {"road:string": 1, "tags:array.string": 1}.
 */
using TypeCounts = std::map<std::string, int>;

/**
 * Flattens a schema graph into TypeCounts.
 *
 * Referenced and inline nested objects are inlined into the parent's
 * namespace (no field-name prefix). Arrays collapse to a single
 * "name:array.<Element>" entry. Only primitive leaves are counted.
 *
 * Schemas are addressed by name through a SchemaMap; the visited set holds
 * the names on the current resolution chain, so a schema reached again
 * through its own references contributes nothing.
 */
class SchemaFlattener {
public:
    /**
     * Resolves a $ref string to the counts it contributes.
     */
    using RefResolver = std::function<TypeCounts(const std::string& ref)>;

    /**
     * Flatten one named schema.
     *
     * @param schema_name Name of the schema (used for cycle detection)
     * @param schema Schema to flatten; nullptr yields empty counts
     * @param all_schemas Every schema of the document, by name
     * @param visited Names on the current resolution chain; restored on return
     * @return Flattened counts
     */
    static TypeCounts flatten(const std::string& schema_name,
                              const std::shared_ptr<Schema>& schema,
                              const SchemaMap& all_schemas,
                              std::set<std::string>& visited);

    /**
     * Flatten every schema of a document independently.
     */
    static std::map<std::string, TypeCounts> flattenAll(const SchemaMap& all_schemas);

    /**
     * Count one named field into counts.
     *
     * $ref merges the resolved counts unprefixed, arrays emit one
     * "name:array.X" entry, inline objects recurse into their properties,
     * primitives emit "name:type" ("name:binary" for binary strings).
     */
    static void countProperty(const std::string& name,
                              const Schema& schema,
                              TypeCounts& counts,
                              const RefResolver& resolve);

    static void merge(TypeCounts& into, const TypeCounts& from);

    static bool isPrimitive(const std::string& type);
};

} // namespace ouroboros
