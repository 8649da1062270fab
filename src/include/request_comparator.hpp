#pragma once

#include <yaml-cpp/yaml.h>
#include <map>
#include <string>
#include <vector>

#include "schema_comparator.hpp"
#include "schema_flattener.hpp"
#include "spec_model.hpp"

namespace ouroboros {

/**
 * Compares the request side (non-path parameters and request body) of a
 * file operation against its scanned counterpart and marks the file
 * operation's diff/progress/tag/reqLog fields.
 */
class RequestComparator {
public:
    /**
     * @param path Path of the operation (logging only)
     * @param file_operation Operation in the file spec; mutated in place
     * @param scan_operation Scanned operation; read only
     * @param method HTTP method of both operations
     * @param file_flattened Flattened file-side schemas, by name
     * @param scan_flattened Flattened scan-side schemas, by name
     */
    static void compareAndMarkRequest(const std::string& path,
                                      YAML::Node file_operation,
                                      const YAML::Node& scan_operation,
                                      HttpMethod method,
                                      const std::map<std::string, TypeCounts>& file_flattened,
                                      const std::map<std::string, TypeCounts>& scan_flattened);

    /**
     * Type-count signature of an operation's request side.
     * $ref schemas are looked up in flattened by their last path segment.
     */
    static TypeCounts collectTypeCounts(const YAML::Node& operation,
                                        const std::map<std::string, TypeCounts>& flattened);

    /**
     * Human-readable diff log: one header line plus one bullet per differing key.
     */
    static std::string buildDiffLog(const std::vector<CountDifference>& differences);

    static constexpr const char* kDiffLogHeader = "Request type counts differ";
};

} // namespace ouroboros
