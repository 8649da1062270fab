#include "request_comparator.hpp"
#include "yaml_utils.hpp"

#include <crow/logging.h>
#include <sstream>

namespace ouroboros {

namespace {

void countParameters(const YAML::Node& parameters,
                     TypeCounts& counts,
                     const SchemaFlattener::RefResolver& resolve) {
    if (!parameters.IsDefined() || !parameters.IsSequence()) {
        return;
    }

    for (const auto& parameter : parameters) {
        if (!parameter.IsMap()) {
            continue;
        }
        if (YamlUtils::getString(parameter, "in", "") == "path") {
            continue;
        }
        auto schema = Schema::fromYaml(YamlUtils::child(parameter, "schema"));
        std::string name = YamlUtils::getString(parameter, "name", "");
        if (!schema || name.empty()) {
            continue;
        }
        SchemaFlattener::countProperty(name, *schema, counts, resolve);
    }
}

void countRequestBody(const YAML::Node& request_body,
                      TypeCounts& counts,
                      const SchemaFlattener::RefResolver& resolve) {
    YAML::Node content = YamlUtils::child(request_body, "content");
    if (!content.IsDefined() || !content.IsMap()) {
        return;
    }

    for (const auto& media_type : content) {
        auto schema = Schema::fromYaml(YamlUtils::child(media_type.second, "schema"));
        if (!schema) {
            continue;
        }
        if (schema->hasProperties()) {
            for (const auto& [name, property] : schema->properties) {
                if (property && !name.empty()) {
                    SchemaFlattener::countProperty(name, *property, counts, resolve);
                }
            }
        } else {
            SchemaFlattener::countProperty("body", *schema, counts, resolve);
        }
    }
}

} // namespace

void RequestComparator::compareAndMarkRequest(const std::string& path,
                                              YAML::Node file_operation,
                                              const YAML::Node& scan_operation,
                                              HttpMethod method,
                                              const std::map<std::string, TypeCounts>& file_flattened,
                                              const std::map<std::string, TypeCounts>& scan_flattened) {
    if (!YamlUtils::isPresent(file_operation) || !YamlUtils::isPresent(scan_operation)) {
        return;
    }

    TypeCounts file_counts = collectTypeCounts(file_operation, file_flattened);
    TypeCounts scan_counts = collectTypeCounts(scan_operation, scan_flattened);
    auto differences = SchemaComparator::differences(file_counts, scan_counts);

    DiffState diff = withRequestDiff(getDiff(file_operation), !differences.empty());
    setDiff(file_operation, diff);
    file_operation[ext::kTag] = "none";

    if (!differences.empty()) {
        setProgress(file_operation, ProgressState::Mock);
        file_operation[ext::kReqLog] = buildDiffLog(differences);
        CROW_LOG_INFO << "Request mismatch on " << toString(method) << " " << path
                      << " (" << differences.size() << " differing fields)";
    } else {
        setProgress(file_operation, ProgressState::Completed);
        YamlUtils::removeKey(file_operation, ext::kReqLog);
        CROW_LOG_DEBUG << "Request matches on " << toString(method) << " " << path;
    }
}

TypeCounts RequestComparator::collectTypeCounts(const YAML::Node& operation,
                                                const std::map<std::string, TypeCounts>& flattened) {
    TypeCounts counts;
    if (!YamlUtils::isPresent(operation)) {
        return counts;
    }

    SchemaFlattener::RefResolver resolve = [&flattened](const std::string& ref) {
        auto it = flattened.find(refName(ref));
        return it == flattened.end() ? TypeCounts{} : it->second;
    };

    countParameters(YamlUtils::child(operation, "parameters"), counts, resolve);
    countRequestBody(YamlUtils::child(operation, "requestBody"), counts, resolve);
    return counts;
}

std::string RequestComparator::buildDiffLog(const std::vector<CountDifference>& differences) {
    if (differences.empty()) {
        return "";
    }

    std::ostringstream log;
    log << kDiffLogHeader;

    for (const auto& difference : differences) {
        std::string display = difference.key;
        auto delimiter = difference.key.find(':');
        if (delimiter != std::string::npos && delimiter + 1 < difference.key.size()) {
            display = difference.key.substr(0, delimiter) + "(" +
                      difference.key.substr(delimiter + 1) + ")";
        } else if (delimiter != std::string::npos) {
            display = difference.key.substr(0, delimiter);
        }

        log << "\n - " << display;
        if (difference.file_count == 0) {
            log << " missing from spec (scan=" << difference.scan_count << ")";
        } else if (difference.scan_count == 0) {
            log << " not observed in scan (spec=" << difference.file_count << ")";
        } else {
            log << " count differs (spec=" << difference.file_count
                << ", scan=" << difference.scan_count << ")";
        }
    }
    return log.str();
}

} // namespace ouroboros
