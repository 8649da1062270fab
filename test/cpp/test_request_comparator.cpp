#include <catch2/catch_test_macros.hpp>
#include "request_comparator.hpp"
#include "test_utils.hpp"
#include "yaml_utils.hpp"

using namespace ouroboros;
using namespace ouroboros::test;

namespace {

const char* kListUsers = R"(
parameters:
  - name: id
    in: path
    schema: {type: string}
  - name: page
    in: query
    schema: {type: integer}
  - name: tags
    in: query
    schema:
      type: array
      items: {type: string}
responses:
  '200': {description: OK}
)";

std::map<std::string, TypeCounts> flattened(const std::string& components) {
    return SchemaFlattener::flattenAll(schemasFromComponents(yaml(components)));
}

} // namespace

TEST_CASE("RequestComparator::collectTypeCounts", "[request][comparator]") {
    std::map<std::string, TypeCounts> none;

    SECTION("Path parameters are skipped") {
        auto counts = RequestComparator::collectTypeCounts(yaml(kListUsers), none);
        REQUIRE(counts == TypeCounts{{"page:integer", 1}, {"tags:array.string", 1}});
    }

    SECTION("Parameters without schema or name are skipped") {
        auto counts = RequestComparator::collectTypeCounts(yaml(R"(
parameters:
  - name: nameless-schema
    in: query
  - in: query
    schema: {type: string}
)"), none);
        REQUIRE(counts.empty());
    }

    SECTION("Arrays of inline objects add no entry") {
        auto with_rows = RequestComparator::collectTypeCounts(yaml(R"(
requestBody:
  content:
    application/json:
      schema:
        type: object
        properties:
          name: {type: string}
          rows:
            type: array
            items: {type: object, properties: {cell: {type: string}}}
)"), none);
        REQUIRE(with_rows == TypeCounts{{"name:string", 1}});
    }

    SECTION("Inline body properties are counted by name") {
        auto counts = RequestComparator::collectTypeCounts(yaml(R"(
requestBody:
  content:
    application/json:
      schema:
        type: object
        properties:
          name: {type: string}
          age: {type: integer}
)"), none);
        REQUIRE(counts == TypeCounts{{"name:string", 1}, {"age:integer", 1}});
    }

    SECTION("Primitive body counts under body") {
        auto counts = RequestComparator::collectTypeCounts(yaml(R"(
requestBody:
  content:
    text/plain:
      schema: {type: string}
)"), none);
        REQUIRE(counts == TypeCounts{{"body:string", 1}});
    }

    SECTION("Referenced body merges the flattened schema") {
        auto schemas = flattened(R"(
schemas:
  CreateUser:
    type: object
    properties:
      email: {type: string}
      admin: {type: boolean}
)");
        auto counts = RequestComparator::collectTypeCounts(yaml(R"(
requestBody:
  content:
    application/json:
      schema:
        $ref: '#/components/schemas/CreateUser'
)"), schemas);
        REQUIRE(counts == TypeCounts{{"email:string", 1}, {"admin:boolean", 1}});
    }
}

TEST_CASE("RequestComparator marks a matching request", "[request][comparator]") {
    std::map<std::string, TypeCounts> none;
    auto file = yaml(kListUsers);
    file[ext::kReqLog] = "stale";
    file[ext::kTag] = "sendto";
    auto scan = yaml(kListUsers);

    RequestComparator::compareAndMarkRequest("/users/{id}", file, scan, HttpMethod::Get, none, none);

    REQUIRE(file[ext::kDiff].as<std::string>() == "none");
    REQUIRE(file[ext::kProgress].as<std::string>() == "completed");
    REQUIRE(file[ext::kTag].as<std::string>() == "none");
    REQUIRE_FALSE(YamlUtils::hasKey(file, ext::kReqLog));
}

TEST_CASE("RequestComparator marks a differing request", "[request][comparator]") {
    std::map<std::string, TypeCounts> none;
    auto file = yaml(kListUsers);
    auto scan = yaml(kListUsers);
    scan["parameters"][1]["schema"]["type"] = "string";

    SECTION("Request diff with log") {
        RequestComparator::compareAndMarkRequest("/users/{id}", file, scan, HttpMethod::Get, none, none);

        REQUIRE(file[ext::kDiff].as<std::string>() == "request");
        REQUIRE(file[ext::kProgress].as<std::string>() == "mock");
        REQUIRE(file[ext::kTag].as<std::string>() == "none");
        REQUIRE(file[ext::kReqLog].as<std::string>() ==
                "Request type counts differ"
                "\n - page(integer) not observed in scan (spec=1)"
                "\n - page(string) missing from spec (scan=1)");
    }

    SECTION("Existing response diff is promoted to both") {
        file[ext::kDiff] = "response";
        RequestComparator::compareAndMarkRequest("/users/{id}", file, scan, HttpMethod::Get, none, none);
        REQUIRE(file[ext::kDiff].as<std::string>() == "both");
    }

    SECTION("Scanned side is never modified") {
        auto before = YamlUtils::emit(scan);
        RequestComparator::compareAndMarkRequest("/users/{id}", file, scan, HttpMethod::Get, none, none);
        REQUIRE(YamlUtils::emit(scan) == before);
    }
}

TEST_CASE("RequestComparator completes a match and keeps a response-side diff", "[request][comparator]") {
    std::map<std::string, TypeCounts> none;
    auto file = yaml(kListUsers);
    file[ext::kDiff] = "both";
    file[ext::kProgress] = "mock";
    auto scan = yaml(kListUsers);

    RequestComparator::compareAndMarkRequest("/users/{id}", file, scan, HttpMethod::Get, none, none);

    REQUIRE(file[ext::kDiff].as<std::string>() == "response");
    REQUIRE(file[ext::kProgress].as<std::string>() == "completed");
    REQUIRE_FALSE(YamlUtils::hasKey(file, ext::kReqLog));
}

TEST_CASE("RequestComparator::buildDiffLog", "[request][comparator]") {
    SECTION("Count mismatch") {
        auto log = RequestComparator::buildDiffLog({{"ids:array.integer", 1, 2}});
        REQUIRE(log == "Request type counts differ\n - ids(array.integer) count differs (spec=1, scan=2)");
    }

    SECTION("Empty list gives empty log") {
        REQUIRE(RequestComparator::buildDiffLog({}).empty());
    }
}
