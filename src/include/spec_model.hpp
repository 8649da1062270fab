#pragma once

#include <yaml-cpp/yaml.h>
#include <array>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace ouroboros {

// Vendor extension keys carried on operations and schemas
namespace ext {
constexpr const char* kId = "x-ouroboros-id";
constexpr const char* kDiff = "x-ouroboros-diff";
constexpr const char* kProgress = "x-ouroboros-progress";
constexpr const char* kTag = "x-ouroboros-tag";
constexpr const char* kOrders = "x-ouroboros-orders";
constexpr const char* kEntrypoint = "x-ouroboros-entrypoint";
constexpr const char* kMock = "x-ouroboros-mock";
constexpr const char* kResponse = "x-ouroboros-response";
constexpr const char* kReqLog = "x-ouroboros-reqLog";
constexpr const char* kResLog = "x-ouroboros-resLog";
constexpr const char* kPrefix = "x-ouroboros-";
} // namespace ext

constexpr const char* kSchemaRefPrefix = "#/components/schemas/";
constexpr const char* kMessageRefPrefix = "#/components/messages/";
constexpr const char* kChannelRefPrefix = "#/channels/";

enum class HttpMethod { Get, Post, Put, Patch, Delete };

constexpr std::array<HttpMethod, 5> kAllHttpMethods = {
    HttpMethod::Get, HttpMethod::Post, HttpMethod::Put, HttpMethod::Patch, HttpMethod::Delete};

/**
 * Path-item key for a method ("get", "post", ...).
 */
const char* operationKey(HttpMethod method);

// Upper-case name ("GET", ...)
std::string toString(HttpMethod method);

/**
 * Parse a method name, case-insensitive.
 * @return std::nullopt for anything that is not one of the five methods
 */
std::optional<HttpMethod> parseHttpMethod(const std::string& name);

enum class DiffState { None, Request, Response, Both, Endpoint };

std::string toString(DiffState state);
std::optional<DiffState> parseDiffState(const std::string& text);

/**
 * Add (or remove) the request or response side of a diff marker.
 * Endpoint is left untouched; it is only ever set by the sync pipeline.
 */
DiffState withRequestDiff(DiffState current, bool differs);
DiffState withResponseDiff(DiffState current, bool differs);

enum class ProgressState { None, Mock, Completed };

std::string toString(ProgressState state);
std::optional<ProgressState> parseProgressState(const std::string& text);

enum class WsAction { Send, Receive };

std::string toString(WsAction action);
std::optional<WsAction> parseWsAction(const std::string& text);

/**
 * Typed view of a schema node, parsed at the document boundary.
 *
 * Only the fields that take part in structural comparison are lifted out;
 * everything else (description, required, vendor extensions) stays in the
 * YAML tree. Properties keep document order.
 */
struct Schema {
    std::string type;
    std::string format;
    std::string ref;
    std::vector<std::pair<std::string, std::shared_ptr<Schema>>> properties;
    std::shared_ptr<Schema> items;

    bool isRef() const { return !ref.empty(); }
    bool hasProperties() const { return !properties.empty(); }

    /**
     * Build a schema tree from a YAML node.
     * @return nullptr for null, undefined and non-map nodes
     */
    static std::shared_ptr<Schema> fromYaml(const YAML::Node& node);
};

using SchemaMap = std::map<std::string, std::shared_ptr<Schema>>;

/**
 * Parse components.schemas of a document into typed schemas.
 * A missing section yields an empty map.
 */
SchemaMap schemasFromComponents(const YAML::Node& components);

/**
 * Name after the last '/' of a reference ("#/components/schemas/User" -> "User").
 */
std::string refName(const std::string& ref);

/**
 * Name of a component schema reference, or std::nullopt when the
 * reference does not point into #/components/schemas/.
 */
std::optional<std::string> schemaRefName(const std::string& ref);

/**
 * Operation stored under method in a path item; null node if absent.
 */
YAML::Node getOperation(const YAML::Node& path_item, HttpMethod method);
void setOperation(YAML::Node path_item, HttpMethod method, const YAML::Node& operation);
void clearOperation(YAML::Node path_item, HttpMethod method);

// Metadata accessors on operation nodes
DiffState getDiff(const YAML::Node& operation);
void setDiff(YAML::Node operation, DiffState state);
ProgressState getProgress(const YAML::Node& operation);
void setProgress(YAML::Node operation, ProgressState state);

/**
 * Assign a fresh x-ouroboros-id unless one is already present.
 * @return true if an id was generated
 */
bool ensureOperationId(YAML::Node operation);

/**
 * Upper-case every entry of the operation's tags list.
 */
void normalizeTags(YAML::Node operation);

} // namespace ouroboros
