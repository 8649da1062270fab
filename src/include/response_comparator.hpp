#pragma once

#include <yaml-cpp/yaml.h>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "spec_model.hpp"

namespace ouroboros {

/**
 * Compares the declared responses of a file operation with the responses
 * observed by the scanner and marks the file operation accordingly.
 *
 * Content types are ignored: a scanned schema only has to match one of the
 * file schemas of the same status code (and vice versa). Status codes seen
 * only by the scanner are copied into the file operation; status codes
 * declared only in the file are mismatches.
 */
class ResponseComparator {
public:
    /**
     * @param path Path of the operation (logging only)
     * @param method HTTP method (logging only)
     * @param scan_operation Scanned operation; null means no-op
     * @param file_operation File operation; null means no-op, mutated otherwise
     * @param schema_match_results Per-schema equivalence for this pass
     * @return Mismatch reasons (empty when the responses match or on no-op)
     */
    static std::vector<std::string> compareResponsesForMethod(
        const std::string& path,
        HttpMethod method,
        const YAML::Node& scan_operation,
        YAML::Node file_operation,
        const std::map<std::string, bool>& schema_match_results);

private:
    static std::optional<std::string> compareContent(const YAML::Node& scan_content,
                                                     const YAML::Node& file_content,
                                                     const std::map<std::string, bool>& schema_match_results);

    static std::optional<std::string> compareSchemas(const YAML::Node& scan_schema,
                                                     const YAML::Node& file_schema,
                                                     const std::map<std::string, bool>& schema_match_results);

    static std::vector<YAML::Node> contentSchemas(const YAML::Node& content);
};

} // namespace ouroboros
