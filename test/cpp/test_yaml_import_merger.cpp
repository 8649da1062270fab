#include <catch2/catch_test_macros.hpp>
#include "spec_document.hpp"
#include "spec_model.hpp"
#include "test_utils.hpp"
#include "yaml_import_merger.hpp"
#include "yaml_utils.hpp"

#include <set>

using namespace ouroboros;
using namespace ouroboros::test;

namespace {

const char* kChatImport = R"(
asyncapi: 3.0.0
info: {title: Chat, version: 1.0.0}
servers:
  ws-ws: {host: 'localhost:8080', pathname: /ws, protocol: ws}
channels:
  _room:
    address: /room
    messages:
      User: {$ref: '#/components/messages/User'}
operations:
  _room_receive:
    action: receive
    channel: {$ref: '#/channels/_room'}
    messages:
      - $ref: '#/channels/_room/messages/User'
components:
  schemas:
    User:
      type: object
      properties:
        name: {type: string}
  messages:
    User:
      payload:
        $ref: '#/components/schemas/User'
)";

} // namespace

TEST_CASE("YamlImportMerger::uniqueName", "[import][merger]") {
    std::set<std::string> used{"User-import", "User-import1"};
    auto taken = [&used](const std::string& name) { return used.count(name) > 0; };

    REQUIRE(YamlImportMerger::uniqueName("User", taken) == "User-import2");
    REQUIRE(YamlImportMerger::uniqueName("Order", taken) == "Order-import");
}

TEST_CASE("YamlImportMerger::mergeWebSocket into an empty document", "[import][merger]") {
    auto existing = SpecDocument::createMinimalWebSocketDocument();
    auto imported = yaml(kChatImport);

    auto result = YamlImportMerger::mergeWebSocket(existing, imported);

    REQUIRE(result.imported == 1);
    REQUIRE(result.imported_channels == 1);
    REQUIRE(result.imported_schemas == 1);
    REQUIRE(result.imported_messages == 1);
    REQUIRE(result.renamed() == 0);
    REQUIRE(result.summary == "Successfully imported 1 channels, 1 operations, 1 schemas, 1 messages");

    auto operation = existing["operations"]["_room_receive"];
    REQUIRE(YamlUtils::hasKey(operation, ext::kId));
    REQUIRE(operation[ext::kProgress].as<std::string>() == "none");
    REQUIRE(operation[ext::kDiff].as<std::string>() == "none");
    REQUIRE(operation[ext::kEntrypoint].as<std::string>() == "/ws");

    SECTION("Imported document is not modified") {
        REQUIRE_FALSE(YamlUtils::hasKey(imported["operations"]["_room_receive"], ext::kId));
    }
}

TEST_CASE("YamlImportMerger::mergeWebSocket renames duplicates", "[import][merger]") {
    auto existing = SpecDocument::createMinimalWebSocketDocument();
    YamlImportMerger::mergeWebSocket(existing, yaml(kChatImport));
    const std::string first_id = existing["operations"]["_room_receive"][ext::kId].as<std::string>();

    auto result = YamlImportMerger::mergeWebSocket(existing, yaml(kChatImport));

    REQUIRE(result.summary ==
            "Successfully imported 1 channels, 1 operations, 1 schemas, 1 messages, "
            "renamed 5 items due to duplicates");

    SECTION("Every section gets an -import copy") {
        REQUIRE(YamlUtils::hasKey(existing["components"]["schemas"], "User-import"));
        REQUIRE(YamlUtils::hasKey(existing["components"]["messages"], "User-import"));
        REQUIRE(YamlUtils::hasKey(existing["servers"], "ws-ws-import"));
        REQUIRE(YamlUtils::hasKey(existing["channels"], "_room-import"));
        REQUIRE(YamlUtils::hasKey(existing["operations"], "_room_receive-import"));
    }

    SECTION("References inside the imported content follow the renames") {
        auto message = existing["components"]["messages"]["User-import"];
        REQUIRE(message["payload"]["$ref"].as<std::string>() == "#/components/schemas/User-import");

        auto channel = existing["channels"]["_room-import"];
        REQUIRE(channel["messages"]["User-import"]["$ref"].as<std::string>() ==
                "#/components/messages/User-import");
        REQUIRE_FALSE(YamlUtils::hasKey(channel["messages"], "User"));

        auto operation = existing["operations"]["_room_receive-import"];
        REQUIRE(operation["channel"]["$ref"].as<std::string>() == "#/channels/_room-import");
        REQUIRE(operation["messages"][0]["$ref"].as<std::string>() ==
                "#/channels/_room-import/messages/User-import");
    }

    SECTION("Existing content keeps its references") {
        REQUIRE(existing["components"]["messages"]["User"]["payload"]["$ref"].as<std::string>() ==
                "#/components/schemas/User");
        REQUIRE(existing["operations"]["_room_receive"][ext::kId].as<std::string>() == first_id);
    }

    SECTION("Renamed operations report their action") {
        bool found = false;
        for (const auto& item : result.renamed_list) {
            if (item.type == "operation") {
                found = true;
                REQUIRE(item.action == std::optional<std::string>("receive"));
                REQUIRE(item.renamed == "_room_receive-import");
            }
        }
        REQUIRE(found);
    }

    SECTION("A third import counts up") {
        YamlImportMerger::mergeWebSocket(existing, yaml(kChatImport));
        REQUIRE(YamlUtils::hasKey(existing["components"]["schemas"], "User-import1"));
    }
}

TEST_CASE("YamlImportMerger::enrichRestSchema", "[import][merger]") {
    auto schema = yaml(R"(
type: object
properties:
  id: {type: string, x-ouroboros-mock: '{{uuid}}'}
  owner: {$ref: '#/components/schemas/User'}
  address:
    type: object
    properties:
      city: {type: string}
  tags:
    type: array
    items:
      type: object
      properties:
        label: {type: string}
)");

    YamlImportMerger::enrichRestSchema(schema);

    auto properties = schema["properties"];
    REQUIRE(schema[ext::kOrders].size() == 4);
    REQUIRE(schema[ext::kOrders][0].as<std::string>() == "id");
    REQUIRE(properties["id"][ext::kMock].as<std::string>() == "{{uuid}}");
    REQUIRE_FALSE(YamlUtils::hasKey(properties["owner"], ext::kMock));
    REQUIRE(YamlUtils::hasKey(properties["address"], ext::kMock));
    REQUIRE(YamlUtils::hasKey(properties["address"]["properties"]["city"], ext::kMock));
    REQUIRE(YamlUtils::hasKey(properties["tags"]["items"]["properties"]["label"], ext::kMock));
}

TEST_CASE("YamlImportMerger::mergeRest", "[import][merger]") {
    auto existing = SpecDocument::createMinimalRestDocument(RestServerInfo{});
    existing["paths"]["/users"]["get"] = yaml("{x-ouroboros-id: keep, summary: existing}");
    existing["components"]["schemas"]["User"] = yaml("{type: object}");

    auto imported = yaml(R"(
openapi: 3.1.0
paths:
  /users:
    summary: dropped
    get:
      summary: imported list
      responses:
        '200':
          content:
            application/json:
              schema: {$ref: '#/components/schemas/User'}
    post:
      summary: imported create
components:
  schemas:
    User:
      type: object
      properties:
        name: {type: string}
)");

    auto result = YamlImportMerger::mergeRest(existing, imported);

    REQUIRE(result.imported == 2);
    REQUIRE(result.imported_schemas == 1);
    REQUIRE(result.summary ==
            "Successfully imported 2 APIs and 1 schemas, renamed 2 items due to duplicates");

    SECTION("Colliding method goes to a renamed path") {
        REQUIRE(existing["paths"]["/users"]["get"][ext::kId].as<std::string>() == "keep");
        auto moved = existing["paths"]["/users-import"]["get"];
        REQUIRE(moved["summary"].as<std::string>() == "imported list");
        REQUIRE(moved[ext::kProgress].as<std::string>() == "mock");
        REQUIRE(moved[ext::kTag].as<std::string>() == "none");
        REQUIRE(moved[ext::kDiff].as<std::string>() == "none");
        REQUIRE(moved["responses"]["200"]["content"]["application/json"]["schema"]["$ref"].as<std::string>() ==
                "#/components/schemas/User-import");

        const auto& api = result.renamed_list.back();
        REQUIRE(api.type == "api");
        REQUIRE(api.method == std::optional<std::string>("GET"));
    }

    SECTION("Free method lands on the original path") {
        REQUIRE(existing["paths"]["/users"]["post"]["summary"].as<std::string>() == "imported create");
        REQUIRE(YamlUtils::hasKey(existing["paths"]["/users"]["post"], ext::kId));
        REQUIRE_FALSE(YamlUtils::hasKey(existing["paths"]["/users"], "summary"));
    }

    SECTION("Imported schemas are enriched") {
        auto schema = existing["components"]["schemas"]["User-import"];
        REQUIRE(schema[ext::kOrders][0].as<std::string>() == "name");
        REQUIRE(existing["components"]["schemas"]["User"].size() == 1);
    }
}
