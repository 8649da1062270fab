#pragma once

#include <memory>
#include <stdexcept>
#include <string>

namespace ouroboros {

/**
 * Exception thrown when a file operation fails.
 */
class FileOperationError : public std::runtime_error {
public:
    explicit FileOperationError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * Abstract interface for byte-level persistence of spec documents.
 *
 * The spec repositories never touch the filesystem directly, so tests can
 * substitute an in-memory provider.
 */
class IFileProvider {
public:
    virtual ~IFileProvider() = default;

    /**
     * Read the entire contents of a file.
     *
     * @param path File path
     * @return File contents as string
     * @throws FileOperationError if file cannot be read
     */
    virtual std::string ReadFile(const std::string& path) = 0;

    /**
     * Replace the contents of a file, creating parent directories as needed.
     *
     * @param path File path
     * @param content New file contents
     * @throws FileOperationError if file cannot be written
     */
    virtual void WriteFile(const std::string& path, const std::string& content) = 0;

    /**
     * Check if a file exists.
     *
     * @param path File path to check
     * @return true if file exists and is a regular file
     */
    virtual bool FileExists(const std::string& path) = 0;

    /**
     * Get the provider name for debugging/logging.
     */
    virtual std::string GetProviderName() const = 0;
};

/**
 * Local filesystem implementation of IFileProvider.
 * Accepts plain paths and file:// URIs.
 */
class LocalFileProvider : public IFileProvider {
public:
    LocalFileProvider() = default;
    ~LocalFileProvider() override = default;

    std::string ReadFile(const std::string& path) override;
    void WriteFile(const std::string& path, const std::string& content) override;
    bool FileExists(const std::string& path) override;
    std::string GetProviderName() const override { return "local"; }

    static std::string StripFileScheme(const std::string& path);
};

std::shared_ptr<IFileProvider> createDefaultFileProvider();

} // namespace ouroboros
