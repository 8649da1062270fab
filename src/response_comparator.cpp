#include "response_comparator.hpp"
#include "yaml_utils.hpp"

#include <crow/logging.h>

namespace ouroboros {

std::vector<std::string> ResponseComparator::compareResponsesForMethod(
    const std::string& path,
    HttpMethod method,
    const YAML::Node& scan_operation,
    YAML::Node file_operation,
    const std::map<std::string, bool>& schema_match_results) {
    std::vector<std::string> reasons;
    if (!YamlUtils::isPresent(scan_operation) || !YamlUtils::isPresent(file_operation)) {
        return reasons;
    }

    YAML::Node scan_responses = YamlUtils::child(scan_operation, "responses");
    YAML::Node file_responses = YamlUtils::getOrCreateMap(file_operation, "responses");
    const std::vector<std::string> file_statuses = YamlUtils::keys(file_responses);

    for (const auto& status : YamlUtils::keys(scan_responses)) {
        YAML::Node scan_response = YamlUtils::child(scan_responses, status);
        YAML::Node file_response = YamlUtils::child(file_responses, status);

        if (!YamlUtils::isPresent(file_response)) {
            file_responses[status] = YAML::Clone(scan_response);
            CROW_LOG_DEBUG << "Copied newly observed status " << status << " into "
                           << toString(method) << " " << path;
            continue;
        }

        auto mismatch = compareContent(YamlUtils::child(scan_response, "content"),
                                       YamlUtils::child(file_response, "content"),
                                       schema_match_results);
        if (mismatch) {
            reasons.push_back("Status " + status + ": " + *mismatch);
        }
    }

    for (const auto& status : file_statuses) {
        if (!YamlUtils::hasKey(scan_responses, status)) {
            reasons.push_back("Status " + status + ": declared in spec but not observed in scan");
        }
    }

    DiffState diff = withResponseDiff(getDiff(file_operation), !reasons.empty());
    setDiff(file_operation, diff);

    if (!reasons.empty()) {
        setProgress(file_operation, ProgressState::Mock);
        std::string log;
        for (const auto& reason : reasons) {
            if (!log.empty()) log += "\n";
            log += reason;
        }
        file_operation[ext::kResLog] = log;
        CROW_LOG_INFO << "Response mismatch on " << toString(method) << " " << path
                      << ": " << reasons.front();
    } else {
        if (diff == DiffState::None) {
            setProgress(file_operation, ProgressState::Completed);
        }
        YamlUtils::removeKey(file_operation, ext::kResLog);
    }

    return reasons;
}

std::optional<std::string> ResponseComparator::compareContent(
    const YAML::Node& scan_content,
    const YAML::Node& file_content,
    const std::map<std::string, bool>& schema_match_results) {
    auto scan_schemas = contentSchemas(scan_content);
    auto file_schemas = contentSchemas(file_content);

    if (scan_schemas.empty() && file_schemas.empty()) {
        return std::nullopt;
    }
    if (scan_schemas.empty()) {
        return std::string("response body not observed in scan");
    }
    if (file_schemas.empty()) {
        return std::string("response body missing from spec");
    }

    // Every scanned schema must match some file schema, and the reverse.
    auto all_matched = [&](const std::vector<YAML::Node>& left,
                           const std::vector<YAML::Node>& right,
                           bool left_is_scan) -> std::optional<std::string> {
        for (const auto& candidate : left) {
            std::optional<std::string> last_mismatch;
            bool matched = false;
            for (const auto& other : right) {
                auto mismatch = left_is_scan
                    ? compareSchemas(candidate, other, schema_match_results)
                    : compareSchemas(other, candidate, schema_match_results);
                if (!mismatch) {
                    matched = true;
                    break;
                }
                last_mismatch = mismatch;
            }
            if (!matched) {
                return last_mismatch;
            }
        }
        return std::nullopt;
    };

    if (auto mismatch = all_matched(scan_schemas, file_schemas, true)) {
        return mismatch;
    }
    return all_matched(file_schemas, scan_schemas, false);
}

std::optional<std::string> ResponseComparator::compareSchemas(
    const YAML::Node& scan_schema,
    const YAML::Node& file_schema,
    const std::map<std::string, bool>& schema_match_results) {
    const std::string scan_ref = YamlUtils::getString(scan_schema, "$ref", "");
    const std::string file_ref = YamlUtils::getString(file_schema, "$ref", "");

    if (!scan_ref.empty() || !file_ref.empty()) {
        if (scan_ref != file_ref) {
            return "$ref differs (scan=" + (scan_ref.empty() ? std::string("inline") : scan_ref) +
                   ", spec=" + (file_ref.empty() ? std::string("inline") : file_ref) + ")";
        }
        auto name = schemaRefName(scan_ref);
        if (!name) {
            return "unresolvable $ref " + scan_ref;
        }
        auto it = schema_match_results.find(*name);
        if (it == schema_match_results.end() || !it->second) {
            return "referenced schema '" + *name + "' differs";
        }
        return std::nullopt;
    }

    const std::string scan_type = YamlUtils::getString(scan_schema, "type", "");
    const std::string file_type = YamlUtils::getString(file_schema, "type", "");
    if (scan_type != file_type) {
        return "type differs (scan=" + scan_type + ", spec=" + file_type + ")";
    }
    return std::nullopt;
}

std::vector<YAML::Node> ResponseComparator::contentSchemas(const YAML::Node& content) {
    std::vector<YAML::Node> schemas;
    if (!content.IsDefined() || !content.IsMap()) {
        return schemas;
    }
    for (const auto& media_type : content) {
        YAML::Node schema = YamlUtils::child(media_type.second, "schema");
        if (YamlUtils::isPresent(schema) && schema.IsMap()) {
            schemas.push_back(schema);
        }
    }
    return schemas;
}

} // namespace ouroboros
