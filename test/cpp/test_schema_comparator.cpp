#include <catch2/catch_test_macros.hpp>
#include "schema_comparator.hpp"
#include "test_utils.hpp"

using namespace ouroboros;
using namespace ouroboros::test;

namespace {

const char* kUserComponents = R"(
schemas:
  User:
    type: object
    properties:
      id: {type: integer}
      name: {type: string}
      address:
        $ref: '#/components/schemas/Address'
  Address:
    type: object
    properties:
      road: {type: string}
)";

} // namespace

TEST_CASE("SchemaComparator identical shapes are the same", "[schema][comparator]") {
    auto scan = yaml(kUserComponents);
    auto file = yaml(kUserComponents);

    auto result = SchemaComparator::compareSchemas(scan, file);

    REQUIRE(result.scan_results.at("User"));
    REQUIRE(result.file_results.at("User"));
    REQUIRE(result.isSame("Address"));
}

TEST_CASE("SchemaComparator detects structural changes", "[schema][comparator]") {
    auto scan = yaml(kUserComponents);
    auto file = yaml(kUserComponents);

    SECTION("Added field") {
        file["schemas"]["User"]["properties"]["email"]["type"] = "string";
        REQUIRE_FALSE(SchemaComparator::compareSchemas(scan, file).isSame("User"));
    }

    SECTION("Removed field") {
        YamlUtils::removeKey(file["schemas"]["User"]["properties"], "name");
        REQUIRE_FALSE(SchemaComparator::compareSchemas(scan, file).isSame("User"));
    }

    SECTION("Retyped field") {
        file["schemas"]["User"]["properties"]["id"]["type"] = "string";
        REQUIRE_FALSE(SchemaComparator::compareSchemas(scan, file).isSame("User"));
    }

    SECTION("Change in a referenced schema propagates") {
        file["schemas"]["Address"]["properties"]["road"]["type"] = "integer";
        auto result = SchemaComparator::compareSchemas(scan, file);
        REQUIRE_FALSE(result.isSame("Address"));
        REQUIRE_FALSE(result.isSame("User"));
    }

    SECTION("Field renamed into a differently named reference target is still the same") {
        file["schemas"]["Location"] = YAML::Clone(file["schemas"]["Address"]);
        file["schemas"]["User"]["properties"]["address"]["$ref"] = "#/components/schemas/Location";
        REQUIRE(SchemaComparator::compareSchemas(scan, file).isSame("User"));
    }
}

TEST_CASE("SchemaComparator one-sided schemas", "[schema][comparator]") {
    auto scan = yaml(R"(
schemas:
  OnlyScan:
    type: object
    properties:
      a: {type: string}
)");
    auto file = yaml(R"(
schemas:
  OnlyFile:
    type: object
    properties:
      a: {type: string}
)");

    auto result = SchemaComparator::compareSchemas(scan, file);

    REQUIRE(result.scan_results.size() == 1);
    REQUIRE(result.file_results.size() == 1);
    REQUIRE_FALSE(result.scan_results.at("OnlyScan"));
    REQUIRE_FALSE(result.file_results.at("OnlyFile"));
    REQUIRE(result.merged().size() == 2);
}

TEST_CASE("SchemaComparator tolerates missing components", "[schema][comparator]") {
    auto result = SchemaComparator::compareSchemas(YAML::Node(), yaml(kUserComponents));
    REQUIRE(result.scan_results.empty());
    REQUIRE_FALSE(result.file_results.at("User"));
    REQUIRE_FALSE(result.isSame("Unknown"));
}

TEST_CASE("SchemaComparator::differences", "[schema][comparator]") {
    TypeCounts file{{"id:integer", 1}, {"name:string", 1}};
    TypeCounts scan{{"id:integer", 2}, {"email:string", 1}};

    auto diffs = SchemaComparator::differences(file, scan);

    REQUIRE(diffs.size() == 3);
    REQUIRE(diffs[0].key == "email:string");
    REQUIRE(diffs[0].file_count == 0);
    REQUIRE(diffs[0].scan_count == 1);
    REQUIRE(diffs[1].key == "id:integer");
    REQUIRE(diffs[1].file_count == 1);
    REQUIRE(diffs[1].scan_count == 2);
    REQUIRE(diffs[2].key == "name:string");
    REQUIRE(diffs[2].scan_count == 0);

    REQUIRE(SchemaComparator::sameCounts(file, file));
    REQUIRE_FALSE(SchemaComparator::sameCounts(file, scan));
}
