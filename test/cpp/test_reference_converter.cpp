#include <catch2/catch_test_macros.hpp>
#include "reference_converter.hpp"
#include "test_utils.hpp"
#include "yaml_utils.hpp"

using namespace ouroboros;
using namespace ouroboros::test;

TEST_CASE("ReferenceConverter::toApiForm", "[reference]") {
    auto document = yaml(R"(
x-ouroboros-id: abc
x-ouroboros-diff: none
summary: Get user
responses:
  '200':
    content:
      application/json:
        schema:
          $ref: '#/components/schemas/User'
)");

    auto api = ReferenceConverter::toApiForm(document);

    REQUIRE(api["id"].as<std::string>() == "abc");
    REQUIRE(api["diff"].as<std::string>() == "none");
    REQUIRE_FALSE(YamlUtils::hasKey(api, "x-ouroboros-id"));
    REQUIRE(api["responses"]["200"]["content"]["application/json"]["schema"]["ref"].as<std::string>() ==
            "#/components/schemas/User");

    SECTION("Input is not modified") {
        REQUIRE(YamlUtils::hasKey(document, "x-ouroboros-id"));
    }
}

TEST_CASE("ReferenceConverter::toDocumentForm", "[reference]") {
    SECTION("Bare schema names expand to component references") {
        auto doc = ReferenceConverter::toDocumentForm(yaml("{schema: {ref: User}}"));
        REQUIRE(doc["schema"]["$ref"].as<std::string>() == "#/components/schemas/User");
    }

    SECTION("Qualified names are cleaned") {
        auto doc = ReferenceConverter::toDocumentForm(yaml("{schema: {ref: com.acme.User}}"));
        REQUIRE(doc["schema"]["$ref"].as<std::string>() == "#/components/schemas/User");
    }

    SECTION("Full references are kept") {
        auto doc = ReferenceConverter::toDocumentForm(yaml("{ref: '#/components/messages/chat'}"));
        REQUIRE(doc["$ref"].as<std::string>() == "#/components/messages/chat");
    }

    SECTION("Metadata keys gain the prefix") {
        auto doc = ReferenceConverter::toDocumentForm(yaml("{progress: mock, tag: none, summary: s}"));
        REQUIRE(doc["x-ouroboros-progress"].as<std::string>() == "mock");
        REQUIRE(doc["x-ouroboros-tag"].as<std::string>() == "none");
        REQUIRE(doc["summary"].as<std::string>() == "s");
    }
}

TEST_CASE("ReferenceConverter leaves property names alone", "[reference]") {
    auto api = yaml(R"(
type: object
properties:
  id: {type: string}
  tag: {type: string}
  ref: {type: string, mock: "{{uuid}}"}
)");

    auto doc = ReferenceConverter::toDocumentForm(api);

    REQUIRE(YamlUtils::hasKey(doc["properties"], "id"));
    REQUIRE(YamlUtils::hasKey(doc["properties"], "tag"));
    REQUIRE(YamlUtils::hasKey(doc["properties"], "ref"));
    REQUIRE_FALSE(YamlUtils::hasKey(doc["properties"], "x-ouroboros-id"));
    REQUIRE(doc["properties"]["ref"]["x-ouroboros-mock"].as<std::string>() == "{{uuid}}");

    auto back = ReferenceConverter::toApiForm(doc);
    REQUIRE(back["properties"]["ref"]["mock"].as<std::string>() == "{{uuid}}");
    REQUIRE(YamlUtils::hasKey(back["properties"], "id"));
}

TEST_CASE("ReferenceConverter reference rewriting", "[reference]") {
    SECTION("Schema references") {
        auto node = yaml(R"(
payload:
  $ref: '#/components/schemas/User'
other:
  - $ref: '#/components/schemas/Order'
  - $ref: '#/components/messages/User'
)");
        int count = ReferenceConverter::updateSchemaReferences(node, {{"User", "User-import"}});
        REQUIRE(count == 1);
        REQUIRE(node["payload"]["$ref"].as<std::string>() == "#/components/schemas/User-import");
        REQUIRE(node["other"][0]["$ref"].as<std::string>() == "#/components/schemas/Order");
        REQUIRE(node["other"][1]["$ref"].as<std::string>() == "#/components/messages/User");
    }

    SECTION("Message references in both forms") {
        auto node = yaml(R"(
messages:
  chat: {$ref: '#/components/messages/chat'}
list:
  - $ref: '#/channels/_room/messages/chat'
  - $ref: '#/channels/_room/messages/typing'
)");
        int count = ReferenceConverter::updateMessageReferences(node, {{"chat", "chat-import"}});
        REQUIRE(count == 2);
        REQUIRE(node["messages"]["chat"]["$ref"].as<std::string>() == "#/components/messages/chat-import");
        REQUIRE(node["list"][0]["$ref"].as<std::string>() == "#/channels/_room/messages/chat-import");
        REQUIRE(node["list"][1]["$ref"].as<std::string>() == "#/channels/_room/messages/typing");
    }

    SECTION("Channel references") {
        auto node = yaml(R"(
channel: {$ref: '#/channels/_room'}
messages:
  - $ref: '#/channels/_room/messages/chat'
  - $ref: '#/channels/_roomy/messages/chat'
)");
        int count = ReferenceConverter::updateChannelReferences(node, {{"_room", "_room-import"}});
        REQUIRE(count == 2);
        REQUIRE(node["channel"]["$ref"].as<std::string>() == "#/channels/_room-import");
        REQUIRE(node["messages"][0]["$ref"].as<std::string>() == "#/channels/_room-import/messages/chat");
        REQUIRE(node["messages"][1]["$ref"].as<std::string>() == "#/channels/_roomy/messages/chat");
    }

    SECTION("Empty rename map rewrites nothing") {
        auto node = yaml("{$ref: '#/components/schemas/User'}");
        REQUIRE(ReferenceConverter::updateSchemaReferences(node, {}) == 0);
    }
}

TEST_CASE("ReferenceConverter::cleanRefValue", "[reference]") {
    REQUIRE(ReferenceConverter::cleanRefValue("#/components/schemas/com.acme.User") == "User");
    REQUIRE(ReferenceConverter::cleanRefValue("User") == "User");
    REQUIRE(ReferenceConverter::cleanRefValue("#/components/schemas/Order") == "Order");
}

TEST_CASE("ReferenceConverter copies literal values as is", "[reference]") {
    auto api = yaml(R"(
progress: mock
requestBody:
  content:
    application/json:
      schema: {ref: Order}
      example: {id: 7, tag: vip, orders: 3, ref: Other}
      examples:
        first:
          value: {id: 1, diff: none}
responses:
  '200':
    content:
      application/json:
        schema:
          type: object
          properties:
            status: {type: string, enum: [open, closed], default: open}
            owner: {type: object, default: {id: 9, progress: done}}
)");

    auto doc = ReferenceConverter::toDocumentForm(api);

    REQUIRE(doc["x-ouroboros-progress"].as<std::string>() == "mock");
    auto media = doc["requestBody"]["content"]["application/json"];
    REQUIRE(media["schema"]["$ref"].as<std::string>() == "#/components/schemas/Order");
    REQUIRE(media["example"]["id"].as<int>() == 7);
    REQUIRE(media["example"]["tag"].as<std::string>() == "vip");
    REQUIRE(media["example"]["orders"].as<int>() == 3);
    REQUIRE(media["example"]["ref"].as<std::string>() == "Other");
    REQUIRE_FALSE(YamlUtils::hasKey(media["example"], "x-ouroboros-id"));
    REQUIRE_FALSE(YamlUtils::hasKey(media["example"], "$ref"));
    REQUIRE(media["examples"]["first"]["value"]["diff"].as<std::string>() == "none");

    auto owner = doc["responses"]["200"]["content"]["application/json"]["schema"]["properties"]["owner"];
    REQUIRE(owner["default"]["id"].as<int>() == 9);
    REQUIRE_FALSE(YamlUtils::hasKey(owner["default"], "x-ouroboros-progress"));

    SECTION("Converting back restores the request body") {
        auto back = ReferenceConverter::toApiForm(doc);
        REQUIRE(YamlUtils::emit(back["requestBody"]["content"]["application/json"]["example"]) ==
                YamlUtils::emit(api["requestBody"]["content"]["application/json"]["example"]));
        REQUIRE(back["progress"].as<std::string>() == "mock");
    }

    SECTION("Document keys inside literals survive the API form") {
        auto stored = yaml("{x-ouroboros-id: abc, example: {x-ouroboros-id: keep, $ref: raw}}");
        auto out = ReferenceConverter::toApiForm(stored);
        REQUIRE(out["id"].as<std::string>() == "abc");
        REQUIRE(out["example"]["x-ouroboros-id"].as<std::string>() == "keep");
        REQUIRE(out["example"]["$ref"].as<std::string>() == "raw");
    }
}
