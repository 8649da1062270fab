#pragma once

#include <yaml-cpp/yaml.h>
#include <filesystem>
#include <fstream>
#include <memory>
#include <sstream>
#include <string>
#include <random>

#include "file_provider.hpp"
#include "spec_repository.hpp"
#include "spec_store.hpp"

namespace ouroboros {
namespace test {

/**
 * RAII wrapper for a temporary file.
 * Creates file on construction, deletes on destruction.
 */
class TempFile {
public:
    explicit TempFile(const std::string& content,
                      const std::string& filename = "temp_test.yaml")
        : path_(std::filesystem::temp_directory_path() / generateUniqueName(filename)) {
        std::ofstream file(path_);
        file << content;
        file.close();
    }

    ~TempFile() {
        cleanup();
    }

    // Non-copyable, movable
    TempFile(const TempFile&) = delete;
    TempFile& operator=(const TempFile&) = delete;
    TempFile(TempFile&& other) noexcept : path_(std::move(other.path_)) {
        other.path_.clear();
    }
    TempFile& operator=(TempFile&& other) noexcept {
        if (this != &other) {
            cleanup();
            path_ = std::move(other.path_);
            other.path_.clear();
        }
        return *this;
    }

    std::string path() const { return path_.string(); }
    std::filesystem::path fsPath() const { return path_; }

private:
    std::filesystem::path path_;

    void cleanup() {
        if (!path_.empty() && std::filesystem::exists(path_)) {
            std::filesystem::remove(path_);
        }
    }

    static std::string generateUniqueName(const std::string& base) {
        static std::random_device rd;
        static std::mt19937 gen(rd());
        static std::uniform_int_distribution<> dis(10000, 99999);

        auto stem = std::filesystem::path(base).stem().string();
        auto ext = std::filesystem::path(base).extension().string();
        return stem + "_" + std::to_string(dis(gen)) + ext;
    }
};

/**
 * RAII wrapper for a temporary directory.
 * Creates directory on construction, recursively deletes on destruction.
 */
class TempDirectory {
public:
    explicit TempDirectory(const std::string& prefix = "ouroboros_test")
        : path_(std::filesystem::temp_directory_path() / generateUniqueName(prefix)) {
        std::filesystem::create_directories(path_);
    }

    ~TempDirectory() {
        cleanup();
    }

    // Non-copyable, movable
    TempDirectory(const TempDirectory&) = delete;
    TempDirectory& operator=(const TempDirectory&) = delete;
    TempDirectory(TempDirectory&& other) noexcept : path_(std::move(other.path_)) {
        other.path_.clear();
    }
    TempDirectory& operator=(TempDirectory&& other) noexcept {
        if (this != &other) {
            cleanup();
            path_ = std::move(other.path_);
            other.path_.clear();
        }
        return *this;
    }

    std::string path() const { return path_.string(); }
    std::filesystem::path fsPath() const { return path_; }

    // Create a file in this directory
    std::filesystem::path writeFile(const std::string& filename, const std::string& content) {
        auto file_path = path_ / filename;
        std::filesystem::create_directories(file_path.parent_path());
        std::ofstream file(file_path);
        file << content;
        file.close();
        return file_path;
    }

    std::string readFile(const std::string& filename) const {
        std::ifstream file(path_ / filename);
        std::stringstream buffer;
        buffer << file.rdbuf();
        return buffer.str();
    }

private:
    std::filesystem::path path_;

    void cleanup() {
        if (!path_.empty() && std::filesystem::exists(path_)) {
            std::filesystem::remove_all(path_);
        }
    }

    static std::string generateUniqueName(const std::string& prefix) {
        static std::random_device rd;
        static std::mt19937 gen(rd());
        static std::uniform_int_distribution<> dis(10000, 99999);
        return prefix + "_" + std::to_string(dis(gen));
    }
};

/**
 * A temp directory holding one spec document file and a SpecStore over it.
 * The file is only written when initial content is given.
 */
class TempSpecStore {
public:
    explicit TempSpecStore(SpecKind kind, const std::string& initial_content = "")
        : dir_("ouroboros_spec"),
          file_path_(dir_.fsPath() / (kind == SpecKind::Rest ? "rest/ourorest.yml" : "websocket/ourowebsocket.yml")) {
        if (!initial_content.empty()) {
            dir_.writeFile(std::filesystem::relative(file_path_, dir_.fsPath()).string(), initial_content);
        }
        repository_ = std::make_shared<SpecRepository>(kind, file_path_.string(), std::make_shared<LocalFileProvider>());
        store_ = std::make_shared<SpecStore>(repository_);
    }

    std::shared_ptr<SpecStore> store() const { return store_; }
    std::shared_ptr<SpecRepository> repository() const { return repository_; }
    std::string filePath() const { return file_path_.string(); }

    // Current file content parsed from disk
    YAML::Node readBack() const {
        return YAML::LoadFile(file_path_.string());
    }

private:
    TempDirectory dir_;
    std::filesystem::path file_path_;
    std::shared_ptr<SpecRepository> repository_;
    std::shared_ptr<SpecStore> store_;
};

inline YAML::Node yaml(const std::string& text) {
    return YAML::Load(text);
}

} // namespace test
} // namespace ouroboros
