#include "json_utils.hpp"

#include <cerrno>
#include <cstdlib>

namespace ouroboros {

namespace {

crow::json::wvalue scalarToJson(const YAML::Node& node) {
    const std::string& text = node.Scalar();

    if (node.Tag() == "!") {
        return crow::json::wvalue(text);
    }
    if (text == "true" || text == "True" || text == "TRUE") {
        return crow::json::wvalue(true);
    }
    if (text == "false" || text == "False" || text == "FALSE") {
        return crow::json::wvalue(false);
    }
    if (text.empty() && node.Tag() == "?") {
        return crow::json::wvalue(nullptr);
    }
    if (text == "null" || text == "~") {
        return crow::json::wvalue(nullptr);
    }

    if (!text.empty()) {
        const char* begin = text.c_str();
        char* end = nullptr;

        errno = 0;
        long long integer = std::strtoll(begin, &end, 10);
        if (errno == 0 && end != begin && *end == '\0') {
            return crow::json::wvalue(static_cast<int64_t>(integer));
        }

        errno = 0;
        double floating = std::strtod(begin, &end);
        if (errno == 0 && end != begin && *end == '\0' &&
            text.find_first_of("0123456789") != std::string::npos) {
            return crow::json::wvalue(floating);
        }
    }

    return crow::json::wvalue(text);
}

} // namespace

crow::json::wvalue JsonUtils::yamlToJson(const YAML::Node& node) {
    if (!node.IsDefined() || node.IsNull()) {
        return crow::json::wvalue(nullptr);
    }

    if (node.IsScalar()) {
        return scalarToJson(node);
    }

    if (node.IsSequence()) {
        std::vector<crow::json::wvalue> items;
        for (const auto& element : node) {
            items.push_back(yamlToJson(element));
        }
        crow::json::wvalue list;
        list = std::move(items);
        return list;
    }

    crow::json::wvalue object(crow::json::wvalue::object{});
    for (const auto& entry : node) {
        object[entry.first.as<std::string>()] = yamlToJson(entry.second);
    }
    return object;
}

YAML::Node JsonUtils::jsonToYaml(const crow::json::rvalue& value) {
    switch (value.t()) {
        case crow::json::type::Null:
            return YAML::Node();
        case crow::json::type::True:
            return YAML::Node(true);
        case crow::json::type::False:
            return YAML::Node(false);
        case crow::json::type::Number:
            if (value.nt() == crow::json::num_type::Signed_integer) {
                return YAML::Node(static_cast<long long>(value.i()));
            }
            if (value.nt() == crow::json::num_type::Unsigned_integer) {
                return YAML::Node(static_cast<unsigned long long>(value.u()));
            }
            return YAML::Node(value.d());
        case crow::json::type::String:
            return YAML::Node(std::string(value.s()));
        case crow::json::type::List: {
            YAML::Node sequence(YAML::NodeType::Sequence);
            for (const auto& element : value) {
                sequence.push_back(jsonToYaml(element));
            }
            return sequence;
        }
        case crow::json::type::Object: {
            YAML::Node map(YAML::NodeType::Map);
            for (const auto& element : value) {
                map[element.key()] = jsonToYaml(element);
            }
            return map;
        }
        default:
            return YAML::Node();
    }
}

} // namespace ouroboros
