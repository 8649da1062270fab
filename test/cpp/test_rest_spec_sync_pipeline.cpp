#include <catch2/catch_test_macros.hpp>
#include "rest_spec_sync_pipeline.hpp"
#include "test_utils.hpp"
#include "yaml_utils.hpp"

using namespace ouroboros;
using namespace ouroboros::test;

namespace {

const char* kUserSpec = R"(
openapi: 3.1.0
info: {title: Users, version: 1.0.0}
paths:
  /users/{id}:
    get:
      x-ouroboros-id: 11111111-1111-1111-1111-111111111111
      parameters:
        - name: id
          in: path
          schema: {type: string}
      responses:
        '200':
          description: OK
          content:
            application/json:
              schema:
                $ref: '#/components/schemas/User'
components:
  schemas:
    User:
      type: object
      properties:
        id: {type: string}
        name: {type: string}
)";

YAML::Node fileOperation(const YAML::Node& doc, const std::string& path, const std::string& method) {
    return YamlUtils::child(YamlUtils::child(YamlUtils::child(doc, "paths"), path), method);
}

} // namespace

TEST_CASE("Sync pipeline exact match", "[sync][pipeline]") {
    RestSpecSyncPipeline pipeline;
    auto file = yaml(kUserSpec);
    auto scan = yaml(kUserSpec);
    scan["paths"]["/users/{id}"]["get"][ext::kResponse] = "use";

    auto result = pipeline.validate(file, scan);

    auto operation = fileOperation(result.document, "/users/{id}", "get");
    REQUIRE(operation[ext::kDiff].as<std::string>() == "none");
    REQUIRE(operation[ext::kProgress].as<std::string>() == "completed");
    REQUIRE(result.report.compared == 1);
    REQUIRE(result.report.response_checked == 1);
    REQUIRE(result.report.endpoint_drift == 0);
}

TEST_CASE("Sync pipeline endpoint drift", "[sync][pipeline]") {
    RestSpecSyncPipeline pipeline;
    auto file = yaml(kUserSpec);
    auto scan = yaml(kUserSpec);
    scan["paths"]["/orders"]["post"] = yaml(R"(
tags: [orders]
requestBody:
  content:
    application/json:
      schema:
        $ref: '#/components/schemas/Order'
responses:
  '201': {description: Created}
)");
    scan["components"]["schemas"]["Order"] = yaml(R"(
type: object
properties:
  item:
    $ref: '#/components/schemas/Item'
)");
    scan["components"]["schemas"]["Item"] = yaml("{type: object, properties: {sku: {type: string}}}");

    auto result = pipeline.validate(file, scan);

    auto operation = fileOperation(result.document, "/orders", "post");
    REQUIRE(YamlUtils::isPresent(operation));
    REQUIRE(operation[ext::kDiff].as<std::string>() == "endpoint");
    REQUIRE(operation[ext::kTag].as<std::string>() == "none");
    REQUIRE_FALSE(operation[ext::kId].as<std::string>().empty());
    REQUIRE_FALSE(YamlUtils::hasKey(operation, ext::kProgress));
    REQUIRE(operation["tags"][0].as<std::string>() == "ORDERS");

    SECTION("Referenced schemas are copied transitively") {
        auto schemas = result.document["components"]["schemas"];
        REQUIRE(YamlUtils::hasKey(schemas, "Order"));
        REQUIRE(YamlUtils::hasKey(schemas, "Item"));
        REQUIRE(result.report.schemas_copied == 2);
    }

    SECTION("Scanned document is untouched") {
        REQUIRE_FALSE(YamlUtils::hasKey(scan["paths"]["/orders"]["post"], ext::kDiff));
    }
}

TEST_CASE("Sync pipeline method drift keeps security", "[sync][pipeline]") {
    RestSpecSyncPipeline pipeline;
    auto file = yaml(kUserSpec);
    file["paths"]["/users/{id}"]["delete"] = yaml(R"(
x-ouroboros-id: 22222222-2222-2222-2222-222222222222
x-ouroboros-diff: endpoint
security:
  - bearerAuth: []
responses:
  '204': {description: Gone}
)");
    auto scan = yaml(kUserSpec);
    scan["paths"]["/users/{id}"]["delete"] = yaml("{responses: {'204': {description: Gone}}}");

    auto result = pipeline.validate(file, scan);

    auto operation = fileOperation(result.document, "/users/{id}", "delete");
    REQUIRE(operation[ext::kDiff].as<std::string>() == "endpoint");
    REQUIRE(operation[ext::kId].as<std::string>() == "22222222-2222-2222-2222-222222222222");
    REQUIRE(operation["security"][0]["bearerAuth"].IsSequence());
    REQUIRE(result.report.swept == 1);
}

TEST_CASE("Sync pipeline sweeps vanished provisional endpoints", "[sync][pipeline]") {
    RestSpecSyncPipeline pipeline;
    auto file = yaml(kUserSpec);
    file["paths"]["/legacy"]["get"] = yaml("{x-ouroboros-diff: endpoint, responses: {'200': {description: OK}}}");
    auto scan = yaml(kUserSpec);

    auto result = pipeline.validate(file, scan);

    REQUIRE_FALSE(YamlUtils::hasKey(result.document["paths"], "/legacy"));
    REQUIRE(YamlUtils::hasKey(result.document["paths"], "/users/{id}"));
}

TEST_CASE("Sync pipeline request mismatch", "[sync][pipeline]") {
    RestSpecSyncPipeline pipeline;
    auto file = yaml(kUserSpec);
    auto scan = yaml(kUserSpec);
    scan["paths"]["/users/{id}"]["get"]["parameters"].push_back(yaml("{name: verbose, in: query, schema: {type: boolean}}"));

    auto result = pipeline.validate(file, scan);

    auto operation = fileOperation(result.document, "/users/{id}", "get");
    REQUIRE(operation[ext::kDiff].as<std::string>() == "request");
    REQUIRE(operation[ext::kProgress].as<std::string>() == "mock");
    REQUIRE(operation[ext::kReqLog].as<std::string>().find("verbose(boolean) missing from spec") != std::string::npos);
}

TEST_CASE("Sync pipeline skips response check without opt-in", "[sync][pipeline]") {
    RestSpecSyncPipeline pipeline;
    auto file = yaml(kUserSpec);
    auto scan = yaml(kUserSpec);
    scan["components"]["schemas"]["User"]["properties"]["email"]["type"] = "string";

    SECTION("No marker") {
        auto result = pipeline.validate(file, scan);
        auto operation = fileOperation(result.document, "/users/{id}", "get");
        REQUIRE(operation[ext::kDiff].as<std::string>() == "none");
        REQUIRE(result.report.response_checked == 0);
    }

    SECTION("With marker the differing schema is a response diff") {
        scan["paths"]["/users/{id}"]["get"][ext::kResponse] = "use";
        auto result = pipeline.validate(file, scan);
        auto operation = fileOperation(result.document, "/users/{id}", "get");
        REQUIRE(operation[ext::kDiff].as<std::string>() == "response");
        REQUIRE(operation[ext::kProgress].as<std::string>() == "mock");
    }
}

TEST_CASE("Sync pipeline mock escape hatch", "[sync][pipeline]") {
    RestSpecSyncPipeline pipeline;
    auto file = yaml(kUserSpec);
    auto scan = yaml(kUserSpec);
    scan["paths"]["/users/{id}"]["get"][ext::kProgress] = "mock";
    scan["paths"]["/users/{id}"]["get"][ext::kTag] = "sendto";
    scan["paths"]["/users/{id}"]["get"]["parameters"].push_back(yaml("{name: q, in: query, schema: {type: string}}"));

    auto result = pipeline.validate(file, scan);

    auto operation = fileOperation(result.document, "/users/{id}", "get");
    REQUIRE(operation[ext::kProgress].as<std::string>() == "mock");
    REQUIRE(operation[ext::kTag].as<std::string>() == "sendto");
    REQUIRE(operation[ext::kDiff].as<std::string>() == "none");
    REQUIRE_FALSE(YamlUtils::hasKey(operation, ext::kReqLog));
    REQUIRE(result.report.mock_skipped == 1);
    REQUIRE(result.report.compared == 0);
}

TEST_CASE("Sync pipeline mock and real flicker across passes", "[sync][pipeline]") {
    RestSpecSyncPipeline pipeline;
    auto file = yaml(kUserSpec);
    auto real = yaml(kUserSpec);
    auto mocked = yaml(kUserSpec);
    mocked["paths"]["/users/{id}"]["get"][ext::kProgress] = "mock";

    auto first = pipeline.validate(file, real);
    REQUIRE(fileOperation(first.document, "/users/{id}", "get")[ext::kProgress].as<std::string>() == "completed");

    auto second = pipeline.validate(first.document, mocked);
    REQUIRE(fileOperation(second.document, "/users/{id}", "get")[ext::kProgress].as<std::string>() == "mock");

    auto third = pipeline.validate(second.document, real);
    REQUIRE(fileOperation(third.document, "/users/{id}", "get")[ext::kProgress].as<std::string>() == "completed");
}

TEST_CASE("Sync pipeline preserves security schemes", "[sync][pipeline]") {
    RestSpecSyncPipeline pipeline;
    auto file = yaml(kUserSpec);
    file["components"]["securitySchemes"]["bearerAuth"] = yaml("{type: http, scheme: bearer}");
    auto scan = yaml(kUserSpec);

    auto result = pipeline.validate(file, scan);

    REQUIRE(result.document["components"]["securitySchemes"]["bearerAuth"]["scheme"].as<std::string>() == "bearer");
    REQUIRE_FALSE(YamlUtils::hasKey(YamlUtils::child(scan, "components"), "securitySchemes"));
}

TEST_CASE("Sync pipeline adopts the scan without a file spec", "[sync][pipeline]") {
    RestSpecSyncPipeline pipeline;
    auto scan = yaml(kUserSpec);
    YamlUtils::removeKey(scan["paths"]["/users/{id}"]["get"], ext::kId);

    auto result = pipeline.validate(YAML::Node(), scan);

    auto operation = fileOperation(result.document, "/users/{id}", "get");
    REQUIRE(operation[ext::kDiff].as<std::string>() == "endpoint");
    REQUIRE(operation[ext::kTag].as<std::string>() == "none");
    REQUIRE(YamlUtils::hasKey(operation, ext::kId));
    REQUIRE(result.document["info"]["title"].as<std::string>() == "Users");
    REQUIRE_FALSE(YamlUtils::hasKey(scan["paths"]["/users/{id}"]["get"], ext::kId));
}

TEST_CASE("Sync pipeline keeps an empty file spec's metadata", "[sync][pipeline]") {
    RestSpecSyncPipeline pipeline;
    auto file = yaml(R"(
openapi: 3.1.0
info: {title: Mine, version: 2.0.0}
paths: {}
components: {schemas: {}}
)");
    auto scan = yaml(kUserSpec);

    auto result = pipeline.validate(file, scan);

    REQUIRE(result.document["info"]["title"].as<std::string>() == "Mine");
    REQUIRE(fileOperation(result.document, "/users/{id}", "get")[ext::kDiff].as<std::string>() == "endpoint");
    REQUIRE(YamlUtils::hasKey(result.document["components"]["schemas"], "User"));
}
