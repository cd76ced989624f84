#pragma once

#include "docs/document_generator.hpp"
#include "model/types.hpp"

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace apidoc {

// ============================================================================
// Client tooling model
// ============================================================================

struct ClientParameter {
    std::string name;
    ParameterLocation location = ParameterLocation::QUERY;
    std::string description;
    bool required = false;
    std::string type;       // schema "type", or the referenced definition name
    std::string format;
    bool nullable = false;
};

struct ClientResponse {
    std::string status_code;
    std::string description;
    std::string type;       // empty when the response has no body
};

struct ClientOperation {
    std::string operation_id;
    std::string path;
    HttpMethod method = HttpMethod::GET;
    std::vector<std::string> tags;
    std::vector<ClientParameter> parameters;
    std::vector<ClientResponse> responses;

    // Scheme id -> scopes, merged over every requirement object
    std::map<std::string, std::vector<std::string>> security;

    [[nodiscard]] const ClientParameter* find_parameter(std::string_view name) const;
    [[nodiscard]] const ClientResponse* find_response(std::string_view status_code) const;
};

struct ClientTypeDefinition {
    std::string name;
    std::string type;
    std::vector<std::string> property_names;
    std::vector<std::string> enum_values;   // textual form of "enum"
    std::vector<std::string> enum_names;    // from "x-enumNames"

    [[nodiscard]] bool is_enum() const { return !enum_values.empty(); }
};

struct ClientSecurityScheme {
    std::string id;
    std::string type;
    std::string token_url;
    std::string refresh_url;
    std::map<std::string, std::string> scopes;
};

/**
 * @brief OpenAPI document as seen by client code generation tooling.
 *
 * Only the parts client generators consume are read: operation ids,
 * parameter lists in order, response codes, security requirements, type
 * definitions with their enum names and security schemes.
 */
class ClientDocument {
public:
    /**
     * @brief Read a serialized OpenAPI 3 JSON document
     * @throws ClientDocumentError on malformed JSON or a missing section
     */
    [[nodiscard]] static ClientDocument parse(std::string_view json);

    [[nodiscard]] const std::string& title() const { return title_; }
    [[nodiscard]] const std::string& version() const { return version_; }
    [[nodiscard]] const std::vector<ClientOperation>& operations() const { return operations_; }
    [[nodiscard]] const std::vector<ClientTypeDefinition>& types() const { return types_; }
    [[nodiscard]] const std::vector<ClientSecurityScheme>& security_schemes() const { return security_schemes_; }

    [[nodiscard]] const ClientOperation* find_operation(std::string_view operation_id) const;
    [[nodiscard]] const ClientOperation* find_operation(std::string_view path, HttpMethod method) const;
    [[nodiscard]] const ClientTypeDefinition* find_type(std::string_view name) const;

private:
    std::string title_;
    std::string version_;
    std::vector<ClientOperation> operations_;
    std::vector<ClientTypeDefinition> types_;
    std::vector<ClientSecurityScheme> security_schemes_;
};

/**
 * @brief Client-dialect document generation.
 *
 * Generates the filtered document, serializes it to JSON and reads the text
 * back with ClientDocument::parse. The client model is never built from the
 * in-memory tree directly.
 */
class ClientDocumentGenerator {
public:
    /**
     * @throws std::invalid_argument if `generator` is null
     */
    explicit ClientDocumentGenerator(std::shared_ptr<const DocumentGenerator> generator);

    [[nodiscard]] ClientDocument generate(std::string_view document_name) const;
    [[nodiscard]] ClientDocument generate() const;

private:
    std::shared_ptr<const DocumentGenerator> generator_;
};

} // namespace apidoc
