#include "spec_repository.hpp"
#include "error.hpp"
#include "yaml_utils.hpp"

#include <crow/logging.h>
#include <utility>

namespace ouroboros {

SpecRepository::SpecRepository(SpecKind kind,
                               std::string path,
                               std::shared_ptr<IFileProvider> file_provider,
                               RestServerInfo rest_server)
    : kind_(kind),
      path_(std::move(path)),
      file_provider_(std::move(file_provider)),
      rest_server_(std::move(rest_server)) {}

YAML::Node SpecRepository::load() {
    if (!file_provider_->FileExists(path_)) {
        CROW_LOG_DEBUG << "No " << toString(kind_) << " spec at " << path_ << ", using a minimal document";
        return createMinimal();
    }

    YAML::Node doc = YamlUtils::parse(file_provider_->ReadFile(path_), path_);

    if (!doc.IsDefined() || doc.IsNull()) {
        CROW_LOG_WARNING << "Spec file " << path_ << " is empty, replacing it with a minimal document";
        doc.reset(createMinimal());
        save(doc);
        return doc;
    }
    if (!doc.IsMap()) {
        throw SpecParseError("Spec file '" + path_ + "' does not contain a YAML mapping");
    }

    auto repaired = SpecDocument::repair(doc, kind_);
    if (!repaired.empty()) {
        std::string sections;
        for (const auto& section : repaired) {
            if (!sections.empty()) sections += ", ";
            sections += section;
        }
        CROW_LOG_WARNING << "Repaired " << toString(kind_) << " spec " << path_
                         << " (missing: " << sections << ")";
        save(doc);
    }
    return doc;
}

void SpecRepository::save(const YAML::Node& doc) {
    file_provider_->WriteFile(path_, YamlUtils::emit(doc));
    CROW_LOG_DEBUG << "Wrote " << toString(kind_) << " spec to " << path_;
}

bool SpecRepository::exists() {
    return file_provider_->FileExists(path_);
}

std::string SpecRepository::readRaw() {
    if (!exists()) {
        return YamlUtils::emit(createMinimal());
    }
    return file_provider_->ReadFile(path_);
}

YAML::Node SpecRepository::createMinimal() const {
    return kind_ == SpecKind::Rest ? SpecDocument::createMinimalRestDocument(rest_server_)
                                   : SpecDocument::createMinimalWebSocketDocument();
}

} // namespace ouroboros
