#pragma once

#include <yaml-cpp/yaml.h>
#include <memory>
#include <string>

#include "file_provider.hpp"
#include "spec_document.hpp"

namespace ouroboros {

/**
 * Reads and writes one persisted spec document.
 *
 * load() self-heals: a missing or empty file yields a minimal document,
 * absent required sections are filled in, and a repaired document is
 * written back immediately.
 */
class SpecRepository {
public:
    SpecRepository(SpecKind kind,
                   std::string path,
                   std::shared_ptr<IFileProvider> file_provider,
                   RestServerInfo rest_server = RestServerInfo());

    /**
     * Load the document from disk, repairing it if needed.
     *
     * @return The parsed (and possibly repaired) document
     * @throws SpecParseError if the file is not valid YAML or its root is not a map
     * @throws FileOperationError if the file cannot be read, or a repair cannot be written
     */
    YAML::Node load();

    /**
     * Serialize and write the whole document.
     * @throws FileOperationError on write failure
     */
    void save(const YAML::Node& doc);

    bool exists();

    /**
     * Current file contents, or the serialized minimal document if no file exists.
     */
    std::string readRaw();

    YAML::Node createMinimal() const;

    SpecKind kind() const { return kind_; }
    const std::string& path() const { return path_; }

private:
    SpecKind kind_;
    std::string path_;
    std::shared_ptr<IFileProvider> file_provider_;
    RestServerInfo rest_server_;
};

} // namespace ouroboros
