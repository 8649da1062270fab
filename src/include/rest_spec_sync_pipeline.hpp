#pragma once

#include <yaml-cpp/yaml.h>
#include <map>
#include <set>
#include <string>
#include <utility>

#include "schema_flattener.hpp"
#include "spec_model.hpp"

namespace ouroboros {

/**
 * Counters of one reconciliation pass.
 */
struct SyncReport {
    int compared = 0;         // operations run through the request comparator
    int response_checked = 0; // ... and through the response comparator
    int endpoint_drift = 0;   // scanned operations copied in as diff=endpoint
    int mock_skipped = 0;     // scanned operations marked mock, not compared
    int swept = 0;            // provisional endpoint operations cleared before the pass
    int schemas_copied = 0;   // scanned schemas added to the file components
};

struct SyncResult {
    YAML::Node document;
    SyncReport report;
};

/**
 * Reconciles a REST file spec against a scanned spec.
 *
 * The pass sweeps provisional (diff=endpoint) operations, then walks every
 * scanned path and method: undeclared operations are copied in as
 * diff=endpoint, mock operations are left alone, everything else goes
 * through the request comparator and, when the scanner recorded the
 * response shape explicitly, the response comparator.
 */
class RestSpecSyncPipeline {
public:
    /**
     * Run one reconciliation pass.
     *
     * @param file_spec File spec; mutated in place (pass a clone to keep the original)
     * @param scanned_spec Scanned spec; never modified
     * @return The reconciled document (file_spec, or a new document if file_spec is null) and counters
     */
    SyncResult validate(YAML::Node file_spec, const YAML::Node& scanned_spec) const;

private:
    struct Provisional {
        YAML::Node id;
        YAML::Node security;
    };
    using ProvisionalMap = std::map<std::pair<std::string, HttpMethod>, Provisional>;

    static SyncResult adoptScannedSpec(const YAML::Node& scan);

    static void sweepEndpointOperations(YAML::Node file_paths, ProvisionalMap& provisional, SyncReport& report);

    static void preserveSecuritySchemes(const YAML::Node& file_spec, YAML::Node scan);

    /**
     * Mark a copied scanned operation as undeclared in the file spec and
     * pull in every schema it references.
     */
    static void markDiffEndpoint(const std::string& path,
                                 HttpMethod method,
                                 YAML::Node operation,
                                 YAML::Node file_spec,
                                 const YAML::Node& scan,
                                 const ProvisionalMap& provisional,
                                 SyncReport& report);

    static int addMissingSchemas(const YAML::Node& operation, YAML::Node file_spec, const YAML::Node& scan);

    static void collectSchemaReferences(const YAML::Node& node,
                                        const YAML::Node& scan_schemas,
                                        std::set<std::string>& names);
};

} // namespace ouroboros
