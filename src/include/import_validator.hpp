#pragma once

#include <yaml-cpp/yaml.h>
#include <string>
#include <vector>

#include "error.hpp"
#include "spec_document.hpp"

namespace ouroboros {

/**
 * Validates an uploaded spec document before it is merged.
 *
 * Checks structure only:
 * - File name ends in .yml or .yaml
 * - Content parses to a map
 * - openapi/asyncapi version is a 3.x string
 * - info.title and info.version exist
 * - REST: path items only hold HTTP methods, each operation has responses
 * - WebSocket: channels have an address, operations have a valid action and a channel
 *
 * Does NOT modify the document.
 */
class ImportValidator {
public:
    struct ValidationResult {
        bool valid = true;
        std::vector<ErrorDetail> errors;
        YAML::Node document;                // Parsed document (null if parsing failed)

        void addError(const std::string& location, const std::string& code, const std::string& message);

        std::string getErrorSummary() const;

        /**
         * Error carrying every detail, for the service boundary.
         */
        Error toError() const;
    };

    explicit ImportValidator(SpecKind kind) : kind_(kind) {}

    /**
     * Validate the uploaded file name.
     * @return Errors with location "file"; empty when the name is acceptable
     */
    static std::vector<ErrorDetail> validateFileName(const std::string& filename);

    /**
     * Parse and validate the document text.
     */
    ValidationResult validate(const std::string& yaml_content) const;

    /**
     * File name check followed by content validation.
     */
    ValidationResult validate(const std::string& filename, const std::string& yaml_content) const;

    static const std::vector<std::string>& validDataTypes();

private:
    SpecKind kind_;

    void validateVersion(const YAML::Node& doc, ValidationResult& result) const;
    void validateInfo(const YAML::Node& doc, ValidationResult& result) const;
    void validatePaths(const YAML::Node& doc, ValidationResult& result) const;
    void validateOperation(const YAML::Node& operation, const std::string& location,
                           ValidationResult& result) const;
    void validateChannels(const YAML::Node& doc, ValidationResult& result) const;
    void validateWebSocketOperations(const YAML::Node& doc, ValidationResult& result) const;
    void validateComponentSchemas(const YAML::Node& doc, ValidationResult& result) const;
    void validateSchema(const YAML::Node& schema, const std::string& location,
                        ValidationResult& result) const;
};

} // namespace ouroboros
