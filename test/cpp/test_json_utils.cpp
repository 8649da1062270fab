#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_all.hpp>
#include "json_utils.hpp"

using namespace ouroboros;

namespace {

crow::json::rvalue roundTrip(const crow::json::wvalue& value) {
    return crow::json::load(value.dump());
}

} // namespace

TEST_CASE("JsonUtils::extractOptionalString", "[json][utils]") {
    SECTION("Returns value when present") {
        crow::json::rvalue json = crow::json::load(R"({"key":"value"})");
        auto result = JsonUtils::extractOptionalString(json, "key");
        REQUIRE(result.has_value());
        REQUIRE(result.value() == "value");
    }

    SECTION("Returns nullopt when missing") {
        crow::json::rvalue json = crow::json::load(R"({})");
        auto result = JsonUtils::extractOptionalString(json, "key");
        REQUIRE_FALSE(result.has_value());
    }

    SECTION("Returns nullopt for non-string type") {
        crow::json::rvalue json = crow::json::load(R"({"key":123})");
        auto result = JsonUtils::extractOptionalString(json, "key");
        REQUIRE_FALSE(result.has_value());
    }

    SECTION("Returns nullopt when the body is not an object") {
        crow::json::rvalue json = crow::json::load(R"(["key"])");
        REQUIRE_FALSE(JsonUtils::extractOptionalString(json, "key").has_value());
    }
}

TEST_CASE("JsonUtils::extractRequiredString", "[json][utils]") {
    SECTION("Returns value when present") {
        crow::json::rvalue json = crow::json::load(R"({"required":"value"})");
        REQUIRE(JsonUtils::extractRequiredString(json, "required") == "value");
    }

    SECTION("Throws when missing") {
        crow::json::rvalue json = crow::json::load(R"({})");
        REQUIRE_THROWS_AS(
            JsonUtils::extractRequiredString(json, "missing"),
            std::runtime_error
        );
    }

    SECTION("Throws for wrong type") {
        crow::json::rvalue json = crow::json::load(R"({"required":false})");
        REQUIRE_THROWS_WITH(
            JsonUtils::extractRequiredString(json, "required"),
            "Missing required field: required"
        );
    }
}

TEST_CASE("JsonUtils::extractStringList", "[json][utils]") {
    SECTION("Collects string entries") {
        auto json = crow::json::load(R"({"messages":["chat","typing"]})");
        auto result = JsonUtils::extractStringList(json, "messages");
        REQUIRE(result == std::vector<std::string>{"chat", "typing"});
    }

    SECTION("Skips non-string entries") {
        auto json = crow::json::load(R"({"messages":["chat",1,null,"typing"]})");
        REQUIRE(JsonUtils::extractStringList(json, "messages").size() == 2);
    }

    SECTION("Empty for missing key or non-list") {
        auto json = crow::json::load(R"({"messages":"chat"})");
        REQUIRE(JsonUtils::extractStringList(json, "messages").empty());
        REQUIRE(JsonUtils::extractStringList(json, "other").empty());
    }
}

TEST_CASE("JsonUtils::hasObject", "[json][utils]") {
    auto json = crow::json::load(R"({"receive":{"address":"/chat"},"reply":"none"})");
    REQUIRE(JsonUtils::hasObject(json, "receive"));
    REQUIRE_FALSE(JsonUtils::hasObject(json, "reply"));
    REQUIRE_FALSE(JsonUtils::hasObject(json, "missing"));
}

TEST_CASE("JsonUtils::yamlToJson", "[json][yaml]") {
    SECTION("Plain scalars are typed") {
        auto node = YAML::Load(R"(
count: 42
ratio: 0.5
enabled: true
disabled: false
nothing: null
name: user
)");
        auto json = roundTrip(JsonUtils::yamlToJson(node));
        REQUIRE(json["count"].t() == crow::json::type::Number);
        REQUIRE(json["count"].i() == 42);
        REQUIRE(json["ratio"].d() == 0.5);
        REQUIRE(json["enabled"].t() == crow::json::type::True);
        REQUIRE(json["disabled"].t() == crow::json::type::False);
        REQUIRE(json["nothing"].t() == crow::json::type::Null);
        REQUIRE(std::string(json["name"].s()) == "user");
    }

    SECTION("Quoted scalars stay strings") {
        auto node = YAML::Load(R"(
code: "200"
flag: 'true'
)");
        auto json = roundTrip(JsonUtils::yamlToJson(node));
        REQUIRE(json["code"].t() == crow::json::type::String);
        REQUIRE(std::string(json["code"].s()) == "200");
        REQUIRE(json["flag"].t() == crow::json::type::String);
    }

    SECTION("Sequences and nested maps") {
        auto node = YAML::Load(R"(
tags: [USER, ADMIN]
schema:
  type: object
  properties:
    id: {type: integer}
)");
        auto json = roundTrip(JsonUtils::yamlToJson(node));
        REQUIRE(json["tags"].size() == 2);
        REQUIRE(std::string(json["tags"][1].s()) == "ADMIN");
        REQUIRE(std::string(json["schema"]["properties"]["id"]["type"].s()) == "integer");
    }

    SECTION("Empty map stays an object") {
        auto json = roundTrip(JsonUtils::yamlToJson(YAML::Load("{}")));
        REQUIRE(json.t() == crow::json::type::Object);
    }
}

TEST_CASE("JsonUtils::jsonToYaml", "[json][yaml]") {
    SECTION("Objects, lists and scalars") {
        auto json = crow::json::load(R"({
            "summary": "List users",
            "deprecated": false,
            "limit": 10,
            "tags": ["user"],
            "extra": null
        })");
        auto node = JsonUtils::jsonToYaml(json);
        REQUIRE(node.IsMap());
        REQUIRE(node["summary"].as<std::string>() == "List users");
        REQUIRE(node["deprecated"].as<bool>() == false);
        REQUIRE(node["limit"].as<int>() == 10);
        REQUIRE(node["tags"].IsSequence());
        REQUIRE(node["tags"][0].as<std::string>() == "user");
        REQUIRE(node["extra"].IsNull());
    }

    SECTION("Negative and floating numbers") {
        auto json = crow::json::load(R"({"min":-5,"scale":1.25})");
        auto node = JsonUtils::jsonToYaml(json);
        REQUIRE(node["min"].as<int>() == -5);
        REQUIRE(node["scale"].as<double>() == 1.25);
    }
}

TEST_CASE("JsonUtils::createSuccessResponse", "[json][utils]") {
    crow::json::wvalue data;
    data["id"] = "abc";
    auto json = roundTrip(JsonUtils::createSuccessResponse(std::move(data)));
    REQUIRE(json["success"].t() == crow::json::type::True);
    REQUIRE(std::string(json["data"]["id"].s()) == "abc");
}
