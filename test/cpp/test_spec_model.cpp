#include <catch2/catch_test_macros.hpp>
#include "id_generator.hpp"
#include "spec_model.hpp"
#include "test_utils.hpp"
#include "yaml_utils.hpp"

using namespace ouroboros;
using namespace ouroboros::test;

TEST_CASE("HttpMethod names", "[model]") {
    for (HttpMethod method : kAllHttpMethods) {
        REQUIRE(parseHttpMethod(operationKey(method)) == method);
        REQUIRE(parseHttpMethod(toString(method)) == method);
    }
    REQUIRE(toString(HttpMethod::Patch) == "PATCH");
    REQUIRE_FALSE(parseHttpMethod("options").has_value());
    REQUIRE_FALSE(parseHttpMethod("").has_value());
}

TEST_CASE("Diff and progress enums use the persisted spelling", "[model]") {
    REQUIRE(toString(DiffState::Endpoint) == "endpoint");
    REQUIRE(parseDiffState("both") == DiffState::Both);
    REQUIRE_FALSE(parseDiffState("Both").has_value());
    REQUIRE(toString(ProgressState::Completed) == "completed");
    REQUIRE(parseProgressState("mock") == ProgressState::Mock);
    REQUIRE(parseWsAction("send") == WsAction::Send);
    REQUIRE(toString(WsAction::Receive) == "receive");
    REQUIRE_FALSE(parseWsAction("publish").has_value());
}

TEST_CASE("Diff side helpers", "[model]") {
    SECTION("Request side") {
        REQUIRE(withRequestDiff(DiffState::None, true) == DiffState::Request);
        REQUIRE(withRequestDiff(DiffState::Response, true) == DiffState::Both);
        REQUIRE(withRequestDiff(DiffState::Both, false) == DiffState::Response);
        REQUIRE(withRequestDiff(DiffState::Request, false) == DiffState::None);
    }

    SECTION("Response side") {
        REQUIRE(withResponseDiff(DiffState::None, true) == DiffState::Response);
        REQUIRE(withResponseDiff(DiffState::Request, true) == DiffState::Both);
        REQUIRE(withResponseDiff(DiffState::Both, false) == DiffState::Request);
    }

    SECTION("Endpoint is left alone") {
        REQUIRE(withRequestDiff(DiffState::Endpoint, true) == DiffState::Endpoint);
        REQUIRE(withResponseDiff(DiffState::Endpoint, false) == DiffState::Endpoint);
    }
}

TEST_CASE("Operation accessors on path items", "[model]") {
    auto item = yaml(R"(
summary: Users
get: {summary: list}
post: ~
)");

    REQUIRE(YamlUtils::isPresent(getOperation(item, HttpMethod::Get)));
    REQUIRE_FALSE(YamlUtils::isPresent(getOperation(item, HttpMethod::Post)));
    REQUIRE_FALSE(YamlUtils::isPresent(getOperation(item, HttpMethod::Delete)));
    REQUIRE_FALSE(YamlUtils::hasKey(item, "delete"));

    setOperation(item, HttpMethod::Put, yaml("{summary: replace}"));
    REQUIRE(getOperation(item, HttpMethod::Put)["summary"].as<std::string>() == "replace");

    clearOperation(item, HttpMethod::Get);
    REQUIRE_FALSE(YamlUtils::hasKey(item, "get"));
    REQUIRE(item["summary"].as<std::string>() == "Users");
}

TEST_CASE("Operation metadata", "[model]") {
    YAML::Node operation(YAML::NodeType::Map);

    SECTION("Defaults when absent or unknown") {
        REQUIRE(getDiff(operation) == DiffState::None);
        REQUIRE(getProgress(operation) == ProgressState::None);
        operation[ext::kDiff] = "weird";
        REQUIRE(getDiff(operation) == DiffState::None);
    }

    SECTION("Ids are generated once") {
        REQUIRE(ensureOperationId(operation));
        const std::string id = operation[ext::kId].as<std::string>();
        REQUIRE(IdGenerator::isValidUuid(id));
        REQUIRE_FALSE(ensureOperationId(operation));
        REQUIRE(operation[ext::kId].as<std::string>() == id);
    }

    SECTION("Tags are upper-cased") {
        operation["tags"] = yaml("[users, Admin]");
        normalizeTags(operation);
        REQUIRE(operation["tags"][0].as<std::string>() == "USERS");
        REQUIRE(operation["tags"][1].as<std::string>() == "ADMIN");
    }
}

TEST_CASE("Reference names", "[model]") {
    REQUIRE(refName("#/components/schemas/User") == "User");
    REQUIRE(refName("User") == "User");
    REQUIRE(schemaRefName("#/components/schemas/User") == std::optional<std::string>("User"));
    REQUIRE_FALSE(schemaRefName("#/components/messages/User").has_value());
    REQUIRE_FALSE(schemaRefName("#/components/schemas/").has_value());
}

TEST_CASE("IdGenerator", "[model][id]") {
    auto a = IdGenerator::generateUuid();
    auto b = IdGenerator::generateUuid();
    REQUIRE(a != b);
    REQUIRE(a.size() == 36);
    REQUIRE(a[14] == '4');
    REQUIRE(IdGenerator::isValidUuid(a));
    REQUIRE_FALSE(IdGenerator::isValidUuid("not-a-uuid"));
    REQUIRE_FALSE(IdGenerator::isValidUuid("3f2b8c1e-9d4a-4f6b-8e2c-1a7d5b9c0e3"));
}
