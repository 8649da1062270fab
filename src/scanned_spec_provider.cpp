#include "scanned_spec_provider.hpp"

#include <crow/logging.h>

#include "error.hpp"
#include "yaml_utils.hpp"

namespace ouroboros {

FileScannedSpecProvider::FileScannedSpecProvider(std::string path,
                                                 std::shared_ptr<IFileProvider> file_provider)
    : path_(std::move(path)), file_provider_(std::move(file_provider)) {}

YAML::Node FileScannedSpecProvider::scan() {
    CROW_LOG_DEBUG << "Reading scanned spec from " << path_;
    YAML::Node scanned = YamlUtils::parse(file_provider_->ReadFile(path_), path_);
    if (YamlUtils::isPresent(scanned) && !scanned.IsMap()) {
        throw SpecParseError("Scanned spec '" + path_ + "' is not a document");
    }
    return scanned;
}

} // namespace ouroboros
