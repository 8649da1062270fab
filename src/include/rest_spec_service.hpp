#pragma once

#include <yaml-cpp/yaml.h>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "error.hpp"
#include "rest_spec_sync_pipeline.hpp"
#include "scanned_spec_provider.hpp"
#include "spec_model.hpp"
#include "spec_store.hpp"
#include "yaml_import_merger.hpp"

namespace ouroboros {

/**
 * One REST operation as seen by API clients.
 */
struct RestOperationEntry {
    std::string id;
    std::string path;
    HttpMethod method;
    YAML::Node operation;   // Deep copy, document form
};

struct CreateRestOperationRequest {
    std::string path;
    std::string method;
    YAML::Node operation;   // Operation body in document form
};

struct UpdateRestOperationRequest {
    std::optional<std::string> path;
    std::optional<std::string> method;
    YAML::Node fields;      // Top-level operation fields to replace
};

struct NamedSchema {
    std::string name;
    YAML::Node schema;
};

/**
 * REST spec operations over the shared document: operation and schema
 * CRUD, import, export and reconciliation against a scanned spec.
 *
 * Every call is one SpecStore critical section. Rejections are returned
 * as errors; nothing is written unless the call succeeds.
 */
class RestSpecService {
public:
    explicit RestSpecService(std::shared_ptr<SpecStore> store,
                             std::shared_ptr<IScannedSpecProvider> scanner = nullptr);

    // Operations
    Result<RestOperationEntry> createOperation(const CreateRestOperationRequest& request);
    std::vector<RestOperationEntry> listOperations() const;
    Result<RestOperationEntry> getOperation(const std::string& id) const;
    Result<RestOperationEntry> updateOperation(const std::string& id, const UpdateRestOperationRequest& request);
    Result<RestOperationEntry> deleteOperation(const std::string& id);

    // Schemas
    Result<NamedSchema> createSchema(const std::string& name, const YAML::Node& schema);
    std::vector<NamedSchema> listSchemas() const;
    Result<NamedSchema> getSchema(const std::string& name) const;
    Result<NamedSchema> updateSchema(const std::string& name, const YAML::Node& schema);
    Result<NamedSchema> deleteSchema(const std::string& name);

    /**
     * Validate and merge an uploaded OpenAPI document.
     * Validation failures carry one ErrorDetail per problem.
     */
    Result<ImportResult> importYaml(const std::string& filename, const std::string& content);

    /**
     * Reconcile the persisted document against a scanned spec.
     */
    Result<SyncReport> sync(const YAML::Node& scanned);

    /**
     * Reconcile against the configured scanner.
     */
    Result<SyncReport> syncFromScanner();

    std::string exportYaml() const;

private:
    struct Location {
        std::string path;
        HttpMethod method;
        YAML::Node operation;
    };

    static std::optional<Location> findById(const YAML::Node& doc, const std::string& id);
    static RestOperationEntry toEntry(const Location& location);
    static void enrichOperation(YAML::Node operation);

    std::shared_ptr<SpecStore> store_;
    std::shared_ptr<IScannedSpecProvider> scanner_;
    RestSpecSyncPipeline pipeline_;
};

} // namespace ouroboros
