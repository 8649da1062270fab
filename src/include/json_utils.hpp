#pragma once

#include <crow.h>
#include <yaml-cpp/yaml.h>
#include <optional>
#include <string>
#include <vector>

namespace ouroboros {

/**
 * Utility functions for the JSON side of the HTTP surface: safe field
 * extraction from request bodies and conversion between crow JSON values
 * and the YAML document tree.
 */
class JsonUtils {
public:
    /**
     * Extract optional string from JSON object by key.
     * Returns nullopt if key is missing or value is not a string.
     */
    static std::optional<std::string> extractOptionalString(
        const crow::json::rvalue& json,
        const std::string& key) {

        if (json.t() != crow::json::type::Object || !json.has(key)) {
            return std::nullopt;
        }

        auto value = json[key];
        if (value.t() != crow::json::type::String) {
            return std::nullopt;
        }

        return std::string(value.s());
    }

    /**
     * Extract required string from JSON object by key.
     *
     * @throws std::runtime_error if key missing or wrong type
     */
    static std::string extractRequiredString(
        const crow::json::rvalue& json,
        const std::string& key) {

        auto result = extractOptionalString(json, key);
        if (!result) {
            throw std::runtime_error("Missing required field: " + key);
        }
        return result.value();
    }

    /**
     * Extract a list of strings; non-string entries are skipped.
     * Returns an empty vector when the key is missing or not a list.
     */
    static std::vector<std::string> extractStringList(
        const crow::json::rvalue& json,
        const std::string& key) {

        std::vector<std::string> result;
        if (json.t() != crow::json::type::Object || !json.has(key)) {
            return result;
        }
        auto list = json[key];
        if (list.t() != crow::json::type::List) {
            return result;
        }
        for (const auto& item : list) {
            if (item.t() == crow::json::type::String) {
                result.emplace_back(item.s());
            }
        }
        return result;
    }

    static bool hasObject(const crow::json::rvalue& json, const std::string& key) {
        return json.t() == crow::json::type::Object && json.has(key) &&
               json[key].t() == crow::json::type::Object;
    }

    /**
     * Convert a YAML node to a crow JSON value.
     * Plain scalars that read as booleans, integers, floats or null are
     * typed accordingly; quoted scalars stay strings.
     */
    static crow::json::wvalue yamlToJson(const YAML::Node& node);

    /**
     * Convert a parsed JSON value to a YAML node.
     */
    static YAML::Node jsonToYaml(const crow::json::rvalue& value);

    static crow::json::wvalue createSuccessResponse(crow::json::wvalue&& data) {
        crow::json::wvalue response;
        response["success"] = true;
        response["data"] = std::move(data);
        return response;
    }
};

} // namespace ouroboros
