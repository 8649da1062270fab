#include "rest_spec_sync_pipeline.hpp"
#include "request_comparator.hpp"
#include "response_comparator.hpp"
#include "schema_comparator.hpp"
#include "yaml_utils.hpp"

#include <crow/logging.h>

namespace ouroboros {

SyncResult RestSpecSyncPipeline::validate(YAML::Node file_spec, const YAML::Node& scanned_spec) const {
    YAML::Node scan = YamlUtils::isPresent(scanned_spec) ? YAML::Clone(scanned_spec)
                                                         : YAML::Node(YAML::NodeType::Map);
    YAML::Node scan_paths = YamlUtils::child(scan, "paths");

    if (!YamlUtils::isPresent(file_spec) && scan_paths.IsMap() && scan_paths.size() > 0) {
        return adoptScannedSpec(scan);
    }
    if (!YamlUtils::isPresent(file_spec)) {
        CROW_LOG_WARNING << "No file spec and no scanned paths, nothing to reconcile";
        return SyncResult{YAML::Node(YAML::NodeType::Map), SyncReport{}};
    }

    SyncReport report;

    preserveSecuritySchemes(file_spec, scan);

    auto file_flattened = SchemaFlattener::flattenAll(
        schemasFromComponents(YamlUtils::child(file_spec, "components")));
    auto scan_flattened = SchemaFlattener::flattenAll(
        schemasFromComponents(YamlUtils::child(scan, "components")));
    auto schema_results = SchemaComparator::compareFlattened(scan_flattened, file_flattened);

    YAML::Node file_paths = YamlUtils::getOrCreateMap(file_spec, "paths");

    ProvisionalMap provisional;
    sweepEndpointOperations(file_paths, provisional, report);

    for (const auto& path : YamlUtils::keys(scan_paths)) {
        YAML::Node scan_item = YamlUtils::child(scan_paths, path);
        if (!scan_item.IsMap()) {
            continue;
        }

        if (!YamlUtils::hasKey(file_paths, path)) {
            CROW_LOG_INFO << "Path " << path << " is not declared in the file document, copying it";
            file_paths[path] = YAML::Clone(scan_item);
            YAML::Node added = YamlUtils::child(file_paths, path);
            for (HttpMethod method : kAllHttpMethods) {
                YAML::Node operation = getOperation(added, method);
                if (YamlUtils::isPresent(operation)) {
                    markDiffEndpoint(path, method, operation, file_spec, scan, provisional, report);
                }
            }
            continue;
        }

        YAML::Node file_item = YamlUtils::child(file_paths, path);

        for (HttpMethod method : kAllHttpMethods) {
            YAML::Node scan_operation = getOperation(scan_item, method);
            if (!YamlUtils::isPresent(scan_operation)) {
                continue;
            }

            YAML::Node file_operation = getOperation(file_item, method);
            if (!YamlUtils::isPresent(file_operation)) {
                CROW_LOG_INFO << toString(method) << " " << path << " is not declared in the file document";
                setOperation(file_item, method, YAML::Clone(scan_operation));
                markDiffEndpoint(path, method, getOperation(file_item, method),
                                 file_spec, scan, provisional, report);
                continue;
            }

            if (getDiff(file_operation) == DiffState::Endpoint) {
                continue;
            }

            if (getProgress(scan_operation) == ProgressState::Mock) {
                setProgress(file_operation, ProgressState::Mock);
                file_operation[ext::kTag] = YamlUtils::getString(scan_operation, ext::kTag, "none");
                report.mock_skipped++;
                CROW_LOG_DEBUG << toString(method) << " " << path << " is mocked, skipping comparison";
                continue;
            }

            RequestComparator::compareAndMarkRequest(path, file_operation, scan_operation, method,
                                                     file_flattened, scan_flattened);
            report.compared++;

            if (YamlUtils::getString(scan_operation, ext::kResponse, "") == "use") {
                ResponseComparator::compareResponsesForMethod(path, method, scan_operation,
                                                              file_operation, schema_results);
                report.response_checked++;
            }
        }
    }

    CROW_LOG_INFO << "Reconciliation pass finished: " << report.compared << " compared, "
                  << report.endpoint_drift << " undeclared, " << report.mock_skipped
                  << " mocked, " << report.swept << " provisional cleared";

    return SyncResult{file_spec, report};
}

SyncResult RestSpecSyncPipeline::adoptScannedSpec(const YAML::Node& scan) {
    SyncReport report;
    YAML::Node paths = YamlUtils::child(scan, "paths");

    for (const auto& path : YamlUtils::keys(paths)) {
        YAML::Node item = YamlUtils::child(paths, path);
        for (HttpMethod method : kAllHttpMethods) {
            YAML::Node operation = getOperation(item, method);
            if (!YamlUtils::isPresent(operation)) {
                continue;
            }
            if (ensureOperationId(operation)) {
                CROW_LOG_DEBUG << "Generated id for " << toString(method) << " " << path;
            }
            setDiff(operation, DiffState::Endpoint);
            operation[ext::kTag] = "none";
            report.endpoint_drift++;
        }
    }

    CROW_LOG_INFO << "No file spec present, adopted the scanned spec with "
                  << report.endpoint_drift << " operations";
    return SyncResult{scan, report};
}

void RestSpecSyncPipeline::sweepEndpointOperations(YAML::Node file_paths,
                                                   ProvisionalMap& provisional,
                                                   SyncReport& report) {
    for (const auto& path : YamlUtils::keys(file_paths)) {
        YAML::Node item = YamlUtils::child(file_paths, path);
        if (!item.IsMap()) {
            file_paths.remove(path);
            continue;
        }

        int remaining = 0;
        for (HttpMethod method : kAllHttpMethods) {
            YAML::Node operation = getOperation(item, method);
            if (!YamlUtils::isPresent(operation)) {
                continue;
            }

            if (getDiff(operation) == DiffState::Endpoint) {
                provisional[{path, method}] = Provisional{
                    YAML::Clone(YamlUtils::child(operation, ext::kId)),
                    YAML::Clone(YamlUtils::child(operation, "security"))};
                clearOperation(item, method);
                report.swept++;
            } else {
                remaining++;
                setDiff(operation, DiffState::None);
                setProgress(operation, ProgressState::Mock);
                operation[ext::kTag] = "none";
            }
        }

        if (remaining == 0) {
            file_paths.remove(path);
        }
    }
}

void RestSpecSyncPipeline::preserveSecuritySchemes(const YAML::Node& file_spec, YAML::Node scan) {
    YAML::Node schemes = YamlUtils::child(YamlUtils::child(file_spec, "components"), "securitySchemes");
    if (!YamlUtils::isPresent(schemes)) {
        return;
    }
    YAML::Node scan_components = YamlUtils::getOrCreateMap(scan, "components");
    scan_components["securitySchemes"] = YAML::Clone(schemes);
    CROW_LOG_INFO << "Preserved " << schemes.size() << " security scheme(s) from the file spec";
}

void RestSpecSyncPipeline::markDiffEndpoint(const std::string& path,
                                            HttpMethod method,
                                            YAML::Node operation,
                                            YAML::Node file_spec,
                                            const YAML::Node& scan,
                                            const ProvisionalMap& provisional,
                                            SyncReport& report) {
    auto previous = provisional.find({path, method});
    if (previous != provisional.end()) {
        if (YamlUtils::isPresent(previous->second.id) && !YamlUtils::hasKey(operation, ext::kId)) {
            operation[ext::kId] = previous->second.id;
        }
        if (YamlUtils::isPresent(previous->second.security)) {
            operation["security"] = previous->second.security;
        }
    }

    if (ensureOperationId(operation)) {
        CROW_LOG_DEBUG << "Generated id for " << toString(method) << " " << path;
    }
    normalizeTags(operation);
    setDiff(operation, DiffState::Endpoint);
    operation[ext::kTag] = "none";
    report.endpoint_drift++;
    report.schemas_copied += addMissingSchemas(operation, file_spec, scan);
}

int RestSpecSyncPipeline::addMissingSchemas(const YAML::Node& operation,
                                            YAML::Node file_spec,
                                            const YAML::Node& scan) {
    YAML::Node scan_schemas = YamlUtils::child(YamlUtils::child(scan, "components"), "schemas");
    if (!scan_schemas.IsDefined() || !scan_schemas.IsMap()) {
        return 0;
    }

    std::set<std::string> referenced;
    collectSchemaReferences(operation, scan_schemas, referenced);
    if (referenced.empty()) {
        return 0;
    }

    YAML::Node file_components = YamlUtils::getOrCreateMap(file_spec, "components");
    YAML::Node file_schemas = YamlUtils::getOrCreateMap(file_components, "schemas");

    int added = 0;
    for (const auto& name : referenced) {
        YAML::Node source = YamlUtils::child(scan_schemas, name);
        if (YamlUtils::hasKey(file_schemas, name) || !YamlUtils::isPresent(source)) {
            continue;
        }
        file_schemas[name] = YAML::Clone(source);
        added++;
        CROW_LOG_DEBUG << "Added missing schema '" << name << "' from the scanned spec";
    }
    return added;
}

void RestSpecSyncPipeline::collectSchemaReferences(const YAML::Node& node,
                                                   const YAML::Node& scan_schemas,
                                                   std::set<std::string>& names) {
    if (node.IsSequence()) {
        for (const auto& element : node) {
            collectSchemaReferences(element, scan_schemas, names);
        }
        return;
    }
    if (!node.IsMap()) {
        return;
    }

    for (const auto& entry : node) {
        if (entry.first.as<std::string>() == "$ref" && entry.second.IsScalar()) {
            auto name = schemaRefName(entry.second.as<std::string>());
            if (name && names.insert(*name).second) {
                collectSchemaReferences(YamlUtils::child(scan_schemas, *name), scan_schemas, names);
            }
            continue;
        }
        collectSchemaReferences(entry.second, scan_schemas, names);
    }
}

} // namespace ouroboros
