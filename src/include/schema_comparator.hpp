#pragma once

#include <yaml-cpp/yaml.h>
#include <map>
#include <string>
#include <vector>

#include "schema_flattener.hpp"

namespace ouroboros {

/**
 * One key whose count differs between the file and the scanned side.
 */
struct CountDifference {
    std::string key;
    int file_count;
    int scan_count;
};

/**
 * Per-schema equivalence results of one comparison.
 * scan_results is driven by scan-side names, file_results by file-side names.
 */
struct SchemaComparisonResult {
    std::map<std::string, bool> scan_results;
    std::map<std::string, bool> file_results;

    /**
     * Both result sets combined; scan-side entries win on name collisions.
     */
    std::map<std::string, bool> merged() const;

    bool isSame(const std::string& schema_name) const;
};

class SchemaComparator {
public:
    /**
     * Compare the component schemas of a scanned and a file document.
     *
     * @param scan_components "components" node of the scanned spec (may be null)
     * @param file_components "components" node of the file spec (may be null)
     */
    static SchemaComparisonResult compareSchemas(const YAML::Node& scan_components,
                                                 const YAML::Node& file_components);

    /**
     * For each name in base: true if other has the same name with identical counts.
     */
    static std::map<std::string, bool> compareFlattened(
        const std::map<std::string, TypeCounts>& base,
        const std::map<std::string, TypeCounts>& other);

    /**
     * Equality over the union of keys, a missing key counting as zero.
     */
    static bool sameCounts(const TypeCounts& a, const TypeCounts& b);

    /**
     * Keys whose counts differ, in key order.
     */
    static std::vector<CountDifference> differences(const TypeCounts& file_counts,
                                                    const TypeCounts& scan_counts);
};

} // namespace ouroboros
