#pragma once

#include "model/types.hpp"

#include <nlohmann/json.hpp>

#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace apidoc {

// ============================================================================
// Schema
// ============================================================================

struct NamedSchema;

struct Schema {
    std::string type;                   // "object", "string", "integer", ...
    std::string format;
    std::string ref;                    // "#/components/schemas/X" when non-empty
    std::string description;
    bool nullable = false;
    nlohmann::json default_value;       // null = no default
    std::vector<nlohmann::json> enum_values;
    std::vector<NamedSchema> properties;
    // Array element schema: at most one element, empty unless type == "array".
    // A vector only because Schema is incomplete here; the writer rejects more than one.
    std::vector<Schema> items;

    // Non-standard annotations ("x-..."), written verbatim
    std::map<std::string, nlohmann::json> extensions;

    // Declared source type; never serialized
    std::optional<TypeDescriptor> source_type;

    [[nodiscard]] bool has_extension(std::string_view key) const {
        return extensions.find(std::string(key)) != extensions.end();
    }
};

struct NamedSchema {
    std::string name;
    Schema schema;
};

// ============================================================================
// Operation building blocks
// ============================================================================

struct Parameter {
    std::string name;
    ParameterLocation location = ParameterLocation::QUERY;
    std::string description;
    bool required = false;
    Schema schema;

    // Marker attributes of the source declaration; never serialized
    std::vector<std::string> markers;

    [[nodiscard]] bool has_marker(std::string_view marker) const {
        return std::find(markers.begin(), markers.end(), marker) != markers.end();
    }
};

struct Response {
    std::string description;
    std::optional<Schema> schema;       // written as application/json content
};

struct ResponseEntry {
    std::string status_code;
    Response response;
};

// Scheme id -> required scopes
using SecurityRequirement = std::map<std::string, std::vector<std::string>>;

struct Operation {
    std::string operation_id;
    std::string summary;
    std::vector<std::string> tags;
    std::vector<Parameter> parameters;      // order is significant for client signatures
    std::vector<ResponseEntry> responses;   // status codes may repeat; see DocumentWriter
    std::vector<SecurityRequirement> security;

    OperationSource source;

    [[nodiscard]] const Parameter* find_parameter(std::string_view name) const;
    [[nodiscard]] size_t count_responses(std::string_view status_code) const;
};

struct PathItem {
    std::string path;
    std::map<HttpMethod, Operation> operations;
};

// ============================================================================
// Security Schemes
// ============================================================================

enum class SecuritySchemeType : uint8_t {
    OAUTH2,
    API_KEY,
    HTTP
};

[[nodiscard]] constexpr std::string_view to_string(SecuritySchemeType type) noexcept {
    switch (type) {
        case SecuritySchemeType::OAUTH2:  return "oauth2";
        case SecuritySchemeType::API_KEY: return "apiKey";
        case SecuritySchemeType::HTTP:    return "http";
    }
    return "oauth2";
}

struct OAuthFlow {
    std::string token_url;
    std::string refresh_url;
    std::map<std::string, std::string> scopes;  // scope -> description
};

struct SecurityScheme {
    SecuritySchemeType type = SecuritySchemeType::OAUTH2;
    std::string description;
    std::string name;
    ParameterLocation location = ParameterLocation::HEADER;
    std::string scheme;
    std::string bearer_format;
    std::optional<OAuthFlow> password_flow;
};

// ============================================================================
// Document
// ============================================================================

struct Info {
    std::string title;
    std::string version;
    std::string description;
};

struct Components {
    std::vector<NamedSchema> schemas;
    std::map<std::string, SecurityScheme> security_schemes;
};

/**
 * @brief Root of the in-memory API description.
 *
 * Built once per generation request, mutated in place by the filter
 * pipeline, then serialized and discarded.
 */
struct Document {
    std::string openapi_version = "3.0.1";
    Info info;
    std::vector<PathItem> paths;        // unique paths, insertion order
    Components components;

    /**
     * @brief Get the path item for `path`, creating it if absent.
     */
    PathItem& add_path(std::string_view path);

    /**
     * @brief Add an operation; replaces an existing one for the same method.
     */
    Operation& add_operation(std::string_view path, HttpMethod method, Operation operation = {});

    Schema& add_schema(std::string_view name, Schema schema = {});

    [[nodiscard]] PathItem* find_path(std::string_view path);
    [[nodiscard]] const PathItem* find_path(std::string_view path) const;
    [[nodiscard]] Operation* find_operation(std::string_view path, HttpMethod method);
    [[nodiscard]] const Operation* find_operation(std::string_view path, HttpMethod method) const;

    [[nodiscard]] size_t operation_count() const;
};

} // namespace apidoc
