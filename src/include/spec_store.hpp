#pragma once

#include <yaml-cpp/yaml.h>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <utility>

#include <crow/logging.h>

#include "error.hpp"
#include "file_provider.hpp"
#include "spec_repository.hpp"

namespace ouroboros {

/**
 * The single shared, lock-guarded copy of one spec document.
 *
 * Every public service operation is exactly one critical section:
 * read() under a shared lock against the cached document, or write()
 * under an exclusive lock. write() reloads the file (so manual edits are
 * picked up), runs the mutation on that fresh copy, persists it and only
 * then swaps it in as the cached document. A failing mutation leaves both
 * the file and the cache untouched.
 */
class SpecStore {
public:
    explicit SpecStore(std::shared_ptr<SpecRepository> repository)
        : repository_(std::move(repository)),
          document_(repository_->createMinimal()) {}

    SpecStore(const SpecStore&) = delete;
    SpecStore& operator=(const SpecStore&) = delete;

    /**
     * Reload the cached document from disk (repairing it if needed).
     * On failure the cached document is kept.
     */
    Result<bool> reload() {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        try {
            YAML::Node loaded = repository_->load();
            document_.reset(loaded);
            return true;
        } catch (const SpecParseError& e) {
            CROW_LOG_ERROR << e.what();
            return Error::Parse("Spec document could not be parsed", e.what());
        } catch (const FileOperationError& e) {
            CROW_LOG_ERROR << e.what();
            return Error::Io("Spec document could not be read", e.what());
        }
    }

    /**
     * Run fn(const YAML::Node&) under the shared lock.
     * fn must copy out whatever it returns.
     */
    template<typename Fn>
    auto read(Fn&& fn) const {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        const YAML::Node& doc = document_;
        return fn(doc);
    }

    /**
     * Run fn(YAML::Node&) -> Result<T> under the exclusive lock and persist
     * the mutated document if fn succeeds.
     *
     * @param action Short description used in log messages
     */
    template<typename Fn>
    auto write(const std::string& action, Fn&& fn) -> decltype(fn(std::declval<YAML::Node&>())) {
        using ResultType = decltype(fn(std::declval<YAML::Node&>()));
        std::unique_lock<std::shared_mutex> lock(mutex_);
        try {
            YAML::Node working = repository_->load();
            ResultType result = fn(working);
            if (!result) {
                CROW_LOG_DEBUG << action << " rejected: " << result.error().message;
                return result;
            }
            repository_->save(working);
            document_.reset(working);
            return result;
        } catch (const SpecOperationError& e) {
            CROW_LOG_DEBUG << action << " rejected: " << e.what();
            return ResultType(e.toError());
        } catch (const SpecParseError& e) {
            CROW_LOG_ERROR << action << " aborted: " << e.what();
            return ResultType(Error::Parse("Spec document could not be parsed", e.what()));
        } catch (const FileOperationError& e) {
            CROW_LOG_ERROR << action << " aborted: " << e.what();
            return ResultType(Error::Io("Spec document could not be written", e.what()));
        } catch (const YAML::Exception& e) {
            CROW_LOG_ERROR << action << " aborted: " << e.what();
            return ResultType(Error::Internal("Malformed spec document", e.what()));
        }
    }

    SpecRepository& repository() { return *repository_; }

private:
    std::shared_ptr<SpecRepository> repository_;
    YAML::Node document_;
    mutable std::shared_mutex mutex_;
};

} // namespace ouroboros
