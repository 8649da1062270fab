#pragma once

#include <yaml-cpp/yaml.h>
#include <memory>
#include <string>

#include "file_provider.hpp"

namespace ouroboros {

/**
 * Source of the scanned REST document (what the running service actually
 * exposes). The scanner itself is an external tool.
 */
class IScannedSpecProvider {
public:
    virtual ~IScannedSpecProvider() = default;

    /**
     * @return The scanned document; callers never modify it
     * @throws SpecParseError if the scanner output is not valid YAML or JSON
     * @throws FileOperationError if the scanner output cannot be read
     */
    virtual YAML::Node scan() = 0;

    virtual std::string describe() const = 0;
};

/**
 * Reads a YAML or JSON document written by the scanner.
 */
class FileScannedSpecProvider : public IScannedSpecProvider {
public:
    FileScannedSpecProvider(std::string path, std::shared_ptr<IFileProvider> file_provider);

    YAML::Node scan() override;

    std::string describe() const override { return "file " + path_; }

private:
    std::string path_;
    std::shared_ptr<IFileProvider> file_provider_;
};

} // namespace ouroboros
