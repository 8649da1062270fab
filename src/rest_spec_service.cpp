#include "rest_spec_service.hpp"

#include <crow/logging.h>

#include "import_validator.hpp"
#include "yaml_utils.hpp"

namespace ouroboros {

namespace {

bool hasOperations(const YAML::Node& path_item) {
    for (HttpMethod method : kAllHttpMethods) {
        if (YamlUtils::isPresent(getOperation(path_item, method))) {
            return true;
        }
    }
    return false;
}

void addPropertyOrders(YAML::Node schema) {
    YAML::Node properties = YamlUtils::child(schema, "properties");
    if (!schema.IsMap() || !properties.IsDefined() || !properties.IsMap() ||
        YamlUtils::hasKey(schema, ext::kOrders)) {
        return;
    }
    YAML::Node orders(YAML::NodeType::Sequence);
    for (const auto& name : YamlUtils::keys(properties)) {
        orders.push_back(name);
    }
    schema[ext::kOrders] = orders;
}

Result<HttpMethod> requireMethod(const std::string& name) {
    auto method = parseHttpMethod(name);
    if (!method) {
        return Error::Validation("Unsupported HTTP method: '" + name + "'",
                                 "Expected one of GET, POST, PUT, PATCH, DELETE");
    }
    return *method;
}

} // namespace

RestSpecService::RestSpecService(std::shared_ptr<SpecStore> store,
                                 std::shared_ptr<IScannedSpecProvider> scanner)
    : store_(std::move(store)), scanner_(std::move(scanner)) {}

std::optional<RestSpecService::Location> RestSpecService::findById(const YAML::Node& doc,
                                                                   const std::string& id) {
    YAML::Node paths = YamlUtils::child(doc, "paths");
    for (const auto& path : YamlUtils::keys(paths)) {
        YAML::Node item = YamlUtils::child(paths, path);
        for (HttpMethod method : kAllHttpMethods) {
            YAML::Node operation = getOperation(item, method);
            if (YamlUtils::getString(operation, ext::kId) == id) {
                return Location{path, method, operation};
            }
        }
    }
    return std::nullopt;
}

RestOperationEntry RestSpecService::toEntry(const Location& location) {
    return RestOperationEntry{YamlUtils::getString(location.operation, ext::kId, ""),
                              location.path, location.method, YAML::Clone(location.operation)};
}

void RestSpecService::enrichOperation(YAML::Node operation) {
    ensureOperationId(operation);
    if (!YamlUtils::hasKey(operation, ext::kProgress)) {
        setProgress(operation, ProgressState::Mock);
    }
    if (!YamlUtils::hasKey(operation, ext::kTag)) {
        operation[ext::kTag] = "none";
    }
    if (!YamlUtils::hasKey(operation, ext::kDiff)) {
        setDiff(operation, DiffState::None);
    }
    normalizeTags(operation);
}

Result<RestOperationEntry> RestSpecService::createOperation(const CreateRestOperationRequest& request) {
    if (request.path.empty()) {
        return Error::Validation("Path must be provided");
    }
    auto method = requireMethod(request.method);
    if (!method) {
        return std::move(method.error());
    }
    if (YamlUtils::isPresent(request.operation) && !request.operation.IsMap()) {
        return Error::Validation("Operation must be an object");
    }

    const HttpMethod http_method = *method;
    return store_->write("create REST operation",
                         [&](YAML::Node& doc) -> Result<RestOperationEntry> {
        YAML::Node paths = YamlUtils::getOrCreateMap(doc, "paths");
        if (YamlUtils::isPresent(getOperation(YamlUtils::child(paths, request.path), http_method))) {
            return Error::Conflict("API specification already exists for " + toString(http_method) +
                                   " " + request.path);
        }

        YAML::Node operation = YamlUtils::isPresent(request.operation)
                                   ? YAML::Clone(request.operation)
                                   : YAML::Node(YAML::NodeType::Map);
        enrichOperation(operation);
        setOperation(YamlUtils::getOrCreateMap(paths, request.path), http_method, operation);

        CROW_LOG_INFO << "Created REST operation " << toString(http_method) << " " << request.path
                      << " (id " << YamlUtils::getString(operation, ext::kId, "") << ")";
        return toEntry(Location{request.path, http_method, operation});
    });
}

std::vector<RestOperationEntry> RestSpecService::listOperations() const {
    return store_->read([](const YAML::Node& doc) {
        std::vector<RestOperationEntry> entries;
        YAML::Node paths = YamlUtils::child(doc, "paths");
        for (const auto& path : YamlUtils::keys(paths)) {
            YAML::Node item = YamlUtils::child(paths, path);
            for (HttpMethod method : kAllHttpMethods) {
                YAML::Node operation = getOperation(item, method);
                if (YamlUtils::isPresent(operation)) {
                    entries.push_back(toEntry(Location{path, method, operation}));
                }
            }
        }
        return entries;
    });
}

Result<RestOperationEntry> RestSpecService::getOperation(const std::string& id) const {
    return store_->read([&id](const YAML::Node& doc) -> Result<RestOperationEntry> {
        auto location = findById(doc, id);
        if (!location) {
            return Error::NotFound("REST API specification with ID '" + id + "' not found");
        }
        return toEntry(*location);
    });
}

Result<RestOperationEntry> RestSpecService::updateOperation(const std::string& id,
                                                            const UpdateRestOperationRequest& request) {
    std::optional<HttpMethod> new_method;
    if (request.method) {
        auto method = requireMethod(*request.method);
        if (!method) {
            return std::move(method.error());
        }
        new_method = *method;
    }
    if (YamlUtils::isPresent(request.fields) && !request.fields.IsMap()) {
        return Error::Validation("Operation fields must be an object");
    }

    return store_->write("update REST operation",
                         [&](YAML::Node& doc) -> Result<RestOperationEntry> {
        auto location = findById(doc, id);
        if (!location) {
            return Error::NotFound("REST API specification with ID '" + id + "' not found");
        }

        YAML::Node paths = YamlUtils::getOrCreateMap(doc, "paths");
        YAML::Node operation = location->operation;

        // Metadata is owned by the reconciliation pass, not by clients
        for (const auto& key : YamlUtils::keys(request.fields)) {
            if (key.compare(0, std::string(ext::kPrefix).size(), ext::kPrefix) == 0) {
                continue;
            }
            YAML::Node value = YamlUtils::child(request.fields, key);
            if (YamlUtils::isPresent(value)) {
                operation[key] = YAML::Clone(value);
            } else {
                YamlUtils::removeKey(operation, key);
            }
        }
        normalizeTags(operation);

        const std::string final_path = request.path.value_or(location->path);
        const HttpMethod final_method = new_method.value_or(location->method);
        if (final_path != location->path || final_method != location->method) {
            if (YamlUtils::isPresent(getOperation(YamlUtils::child(paths, final_path), final_method))) {
                return Error::Conflict("Cannot move operation: API specification already exists for " +
                                       toString(final_method) + " " + final_path);
            }
            YAML::Node moved = YAML::Clone(operation);
            YAML::Node old_item = YamlUtils::child(paths, location->path);
            clearOperation(old_item, location->method);
            if (!hasOperations(old_item)) {
                YamlUtils::removeKey(paths, location->path);
            }
            setOperation(YamlUtils::getOrCreateMap(paths, final_path), final_method, moved);

            CROW_LOG_INFO << "Moved REST operation " << id << " from " << toString(location->method) << " "
                          << location->path << " to " << toString(final_method) << " " << final_path;
            return toEntry(Location{final_path, final_method, moved});
        }

        CROW_LOG_INFO << "Updated REST operation " << toString(location->method) << " " << location->path;
        return toEntry(*location);
    });
}

Result<RestOperationEntry> RestSpecService::deleteOperation(const std::string& id) {
    return store_->write("delete REST operation",
                         [&id](YAML::Node& doc) -> Result<RestOperationEntry> {
        auto location = findById(doc, id);
        if (!location) {
            return Error::NotFound("REST API specification with ID '" + id + "' not found");
        }
        RestOperationEntry removed = toEntry(*location);

        YAML::Node paths = YamlUtils::child(doc, "paths");
        YAML::Node item = YamlUtils::child(paths, location->path);
        clearOperation(item, location->method);
        if (!hasOperations(item)) {
            YamlUtils::removeKey(paths, location->path);
        }

        CROW_LOG_INFO << "Deleted REST operation " << toString(removed.method) << " " << removed.path;
        return removed;
    });
}

Result<NamedSchema> RestSpecService::createSchema(const std::string& name, const YAML::Node& schema) {
    if (name.empty()) {
        return Error::Validation("Schema name must be provided");
    }
    return store_->write("create REST schema", [&](YAML::Node& doc) -> Result<NamedSchema> {
        YAML::Node schemas = YamlUtils::getOrCreateMap(YamlUtils::getOrCreateMap(doc, "components"), "schemas");
        if (YamlUtils::hasKey(schemas, name)) {
            return Error::Conflict("Schema '" + name + "' already exists");
        }
        YAML::Node stored = YamlUtils::isPresent(schema) ? YAML::Clone(schema) : YAML::Node(YAML::NodeType::Map);
        addPropertyOrders(stored);
        schemas[name] = stored;
        CROW_LOG_INFO << "Created REST schema '" << name << "'";
        return NamedSchema{name, YAML::Clone(stored)};
    });
}

std::vector<NamedSchema> RestSpecService::listSchemas() const {
    return store_->read([](const YAML::Node& doc) {
        std::vector<NamedSchema> result;
        YAML::Node schemas = YamlUtils::child(YamlUtils::child(doc, "components"), "schemas");
        for (const auto& name : YamlUtils::keys(schemas)) {
            result.push_back(NamedSchema{name, YAML::Clone(YamlUtils::child(schemas, name))});
        }
        return result;
    });
}

Result<NamedSchema> RestSpecService::getSchema(const std::string& name) const {
    return store_->read([&name](const YAML::Node& doc) -> Result<NamedSchema> {
        YAML::Node schema = YamlUtils::child(YamlUtils::child(YamlUtils::child(doc, "components"), "schemas"), name);
        if (!schema.IsDefined()) {
            return Error::NotFound("Schema '" + name + "' not found");
        }
        return NamedSchema{name, YAML::Clone(schema)};
    });
}

Result<NamedSchema> RestSpecService::updateSchema(const std::string& name, const YAML::Node& schema) {
    return store_->write("update REST schema", [&](YAML::Node& doc) -> Result<NamedSchema> {
        YAML::Node schemas = YamlUtils::child(YamlUtils::child(doc, "components"), "schemas");
        if (!YamlUtils::child(schemas, name).IsDefined()) {
            return Error::NotFound("Schema '" + name + "' not found");
        }
        YAML::Node stored = YamlUtils::isPresent(schema) ? YAML::Clone(schema) : YAML::Node(YAML::NodeType::Map);
        addPropertyOrders(stored);
        schemas[name] = stored;
        CROW_LOG_INFO << "Updated REST schema '" << name << "'";
        return NamedSchema{name, YAML::Clone(stored)};
    });
}

Result<NamedSchema> RestSpecService::deleteSchema(const std::string& name) {
    return store_->write("delete REST schema", [&name](YAML::Node& doc) -> Result<NamedSchema> {
        YAML::Node schemas = YamlUtils::child(YamlUtils::child(doc, "components"), "schemas");
        YAML::Node schema = YamlUtils::child(schemas, name);
        if (!schema.IsDefined()) {
            return Error::NotFound("Schema '" + name + "' not found");
        }
        NamedSchema removed{name, YAML::Clone(schema)};
        YamlUtils::removeKey(schemas, name);
        CROW_LOG_INFO << "Deleted REST schema '" << name << "'";
        return removed;
    });
}

Result<ImportResult> RestSpecService::importYaml(const std::string& filename, const std::string& content) {
    ImportValidator validator(SpecKind::Rest);
    auto validation = validator.validate(filename, content);
    if (!validation.valid) {
        CROW_LOG_WARNING << "Rejected REST import '" << filename << "':\n" << validation.getErrorSummary();
        return validation.toError();
    }

    return store_->write("import REST spec", [&validation](YAML::Node& doc) -> Result<ImportResult> {
        return YamlImportMerger::mergeRest(doc, validation.document);
    });
}

Result<SyncReport> RestSpecService::sync(const YAML::Node& scanned) {
    if (!YamlUtils::isPresent(scanned) || !scanned.IsMap()) {
        return Error::Validation("Scanned spec must be a document");
    }
    return store_->write("REST sync", [this, &scanned](YAML::Node& doc) -> Result<SyncReport> {
        SyncResult result = pipeline_.validate(doc, scanned);
        doc.reset(result.document);
        return result.report;
    });
}

Result<SyncReport> RestSpecService::syncFromScanner() {
    if (!scanner_) {
        return Error::Config("No scanned spec source configured");
    }

    YAML::Node scanned;
    try {
        scanned = scanner_->scan();
    } catch (const SpecParseError& e) {
        CROW_LOG_ERROR << "Scanned spec from " << scanner_->describe() << " is invalid: " << e.what();
        return Error::Parse("Scanned spec could not be parsed", e.what());
    } catch (const FileOperationError& e) {
        CROW_LOG_ERROR << "Scanned spec from " << scanner_->describe() << " is unreadable: " << e.what();
        return Error::Io("Scanned spec could not be read", e.what());
    }
    return sync(scanned);
}

std::string RestSpecService::exportYaml() const {
    return store_->read([](const YAML::Node& doc) { return YamlUtils::emit(doc); });
}

} // namespace ouroboros
