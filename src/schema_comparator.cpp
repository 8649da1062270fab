#include "schema_comparator.hpp"

#include <crow/logging.h>
#include <set>

namespace ouroboros {

std::map<std::string, bool> SchemaComparisonResult::merged() const {
    std::map<std::string, bool> result = file_results;
    for (const auto& [name, same] : scan_results) {
        result[name] = same;
    }
    return result;
}

bool SchemaComparisonResult::isSame(const std::string& schema_name) const {
    auto it = scan_results.find(schema_name);
    if (it != scan_results.end()) {
        return it->second;
    }
    it = file_results.find(schema_name);
    return it != file_results.end() && it->second;
}

SchemaComparisonResult SchemaComparator::compareSchemas(const YAML::Node& scan_components,
                                                        const YAML::Node& file_components) {
    auto scan_flat = SchemaFlattener::flattenAll(schemasFromComponents(scan_components));
    auto file_flat = SchemaFlattener::flattenAll(schemasFromComponents(file_components));

    SchemaComparisonResult result;
    result.scan_results = compareFlattened(scan_flat, file_flat);
    result.file_results = compareFlattened(file_flat, scan_flat);

    CROW_LOG_DEBUG << "Compared " << scan_flat.size() << " scanned and "
                   << file_flat.size() << " file schemas";
    return result;
}

std::map<std::string, bool> SchemaComparator::compareFlattened(
    const std::map<std::string, TypeCounts>& base,
    const std::map<std::string, TypeCounts>& other) {
    std::map<std::string, bool> results;
    for (const auto& [name, counts] : base) {
        auto it = other.find(name);
        results[name] = it != other.end() && sameCounts(counts, it->second);
    }
    return results;
}

bool SchemaComparator::sameCounts(const TypeCounts& a, const TypeCounts& b) {
    return differences(a, b).empty();
}

std::vector<CountDifference> SchemaComparator::differences(const TypeCounts& file_counts,
                                                           const TypeCounts& scan_counts) {
    std::set<std::string> keys;
    for (const auto& entry : file_counts) keys.insert(entry.first);
    for (const auto& entry : scan_counts) keys.insert(entry.first);

    std::vector<CountDifference> result;
    for (const auto& key : keys) {
        auto f = file_counts.find(key);
        auto s = scan_counts.find(key);
        int file_count = f == file_counts.end() ? 0 : f->second;
        int scan_count = s == scan_counts.end() ? 0 : s->second;
        if (file_count != scan_count) {
            result.push_back({key, file_count, scan_count});
        }
    }
    return result;
}

} // namespace ouroboros
