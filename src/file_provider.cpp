#include "file_provider.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>

namespace ouroboros {

namespace {
constexpr const char* kFileScheme = "file://";
}

std::string LocalFileProvider::StripFileScheme(const std::string& path) {
    const std::string scheme(kFileScheme);
    if (path.compare(0, scheme.size(), scheme) == 0) {
        return path.substr(scheme.size());
    }
    return path;
}

std::string LocalFileProvider::ReadFile(const std::string& path) {
    std::string actual_path = StripFileScheme(path);

    if (!FileExists(actual_path)) {
        throw FileOperationError("File not found: " + path);
    }

    std::ifstream file(actual_path, std::ios::in | std::ios::binary);
    if (!file) {
        throw FileOperationError("Failed to open file: " + path);
    }

    std::ostringstream contents;
    contents << file.rdbuf();

    if (file.bad()) {
        throw FileOperationError("Error reading file: " + path);
    }

    return contents.str();
}

void LocalFileProvider::WriteFile(const std::string& path, const std::string& content) {
    std::filesystem::path actual_path(StripFileScheme(path));

    try {
        if (actual_path.has_parent_path()) {
            std::filesystem::create_directories(actual_path.parent_path());
        }
    } catch (const std::filesystem::filesystem_error& e) {
        throw FileOperationError("Failed to create directory for " + path + ": " + e.what());
    }

    std::ofstream file(actual_path, std::ios::out | std::ios::binary | std::ios::trunc);
    if (!file) {
        throw FileOperationError("Failed to open file for writing: " + path);
    }

    file << content;
    file.flush();

    if (!file) {
        throw FileOperationError("Error writing file: " + path);
    }
}

bool LocalFileProvider::FileExists(const std::string& path) {
    std::string actual_path = StripFileScheme(path);

    try {
        return std::filesystem::exists(actual_path) &&
               std::filesystem::is_regular_file(actual_path);
    } catch (const std::filesystem::filesystem_error&) {
        return false;
    }
}

std::shared_ptr<IFileProvider> createDefaultFileProvider() {
    return std::make_shared<LocalFileProvider>();
}

} // namespace ouroboros
