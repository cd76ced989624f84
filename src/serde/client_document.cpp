#include "serde/client_document.hpp"
#include "core/error.hpp"
#include "core/utils.hpp"
#include "serde/document_writer.hpp"

#include <nlohmann/json.hpp>

#include <format>
#include <stdexcept>

namespace apidoc {

using json = nlohmann::json;

namespace {

constexpr std::string_view kSchemaRefPrefix = "#/components/schemas/";

std::string string_or(const json& obj, const char* key, std::string fallback = {}) {
    const auto it = obj.find(key);
    if (it == obj.end() || !it->is_string()) return fallback;
    return it->get<std::string>();
}

// "string", or the component name for a $ref, or "array<elem>"
std::string type_name_of(const json& schema) {
    if (!schema.is_object()) return {};
    const std::string ref = string_or(schema, "$ref");
    if (!ref.empty()) {
        return ref.starts_with(kSchemaRefPrefix) ? ref.substr(kSchemaRefPrefix.size()) : ref;
    }
    const std::string type = string_or(schema, "type");
    if (type == "array" && schema.contains("items")) {
        return std::format("array<{}>", type_name_of(schema["items"]));
    }
    return type;
}

std::string scalar_text(const json& value) {
    return value.is_string() ? value.get<std::string>() : value.dump();
}

ClientParameter read_parameter(const json& node) {
    ClientParameter param;
    param.name = string_or(node, "name");
    const auto location = parse_parameter_location(string_or(node, "in", "query"));
    if (!location) {
        throw ClientDocumentError(std::format(
            "Parameter '{}': unknown location '{}'", param.name, string_or(node, "in")));
    }
    param.location = *location;
    param.description = string_or(node, "description");
    param.required = node.value("required", false);
    if (const auto it = node.find("schema"); it != node.end()) {
        param.type = type_name_of(*it);
        param.format = string_or(*it, "format");
        param.nullable = it->value("nullable", false);
    }
    return param;
}

ClientOperation read_operation(const std::string& path, HttpMethod method, const json& node) {
    ClientOperation op;
    op.path = path;
    op.method = method;
    op.operation_id = string_or(node, "operationId");
    if (const auto it = node.find("tags"); it != node.end() && it->is_array()) {
        for (const auto& tag : *it) op.tags.push_back(scalar_text(tag));
    }

    if (const auto it = node.find("parameters"); it != node.end()) {
        for (const auto& param : *it) op.parameters.push_back(read_parameter(param));
    }

    if (const auto it = node.find("responses"); it != node.end()) {
        for (const auto& [code, response] : it->items()) {
            ClientResponse r;
            r.status_code = code;
            r.description = string_or(response, "description");
            if (response.contains("content")) {
                const auto& content = response["content"];
                if (content.contains("application/json") && content["application/json"].contains("schema")) {
                    r.type = type_name_of(content["application/json"]["schema"]);
                }
            }
            op.responses.push_back(std::move(r));
        }
    }

    if (const auto it = node.find("security"); it != node.end()) {
        for (const auto& requirement : *it) {
            for (const auto& [scheme_id, scopes] : requirement.items()) {
                auto& merged = op.security[scheme_id];
                for (const auto& scope : scopes) merged.push_back(scalar_text(scope));
            }
        }
    }
    return op;
}

ClientTypeDefinition read_type(const std::string& name, const json& node) {
    ClientTypeDefinition def;
    def.name = name;
    def.type = string_or(node, "type");
    if (const auto it = node.find("properties"); it != node.end()) {
        for (const auto& [prop, _] : it->items()) def.property_names.push_back(prop);
    }
    if (const auto it = node.find("enum"); it != node.end()) {
        for (const auto& v : *it) def.enum_values.push_back(scalar_text(v));
    }
    if (const auto it = node.find("x-enumNames"); it != node.end() && it->is_array()) {
        for (const auto& v : *it) def.enum_names.push_back(scalar_text(v));
    }
    return def;
}

ClientSecurityScheme read_security_scheme(const std::string& id, const json& node) {
    ClientSecurityScheme scheme;
    scheme.id = id;
    scheme.type = string_or(node, "type");
    if (node.contains("flows") && node["flows"].contains("password")) {
        const auto& flow = node["flows"]["password"];
        scheme.token_url = string_or(flow, "tokenUrl");
        scheme.refresh_url = string_or(flow, "refreshUrl");
        if (const auto it = flow.find("scopes"); it != flow.end()) {
            for (const auto& [scope, description] : it->items()) {
                scheme.scopes.emplace(scope, scalar_text(description));
            }
        }
    }
    return scheme;
}

} // anonymous namespace

// ============================================================================
// ClientOperation
// ============================================================================

const ClientParameter* ClientOperation::find_parameter(std::string_view name) const {
    for (const auto& p : parameters) {
        if (p.name == name) return &p;
    }
    return nullptr;
}

const ClientResponse* ClientOperation::find_response(std::string_view status_code) const {
    for (const auto& r : responses) {
        if (r.status_code == status_code) return &r;
    }
    return nullptr;
}

// ============================================================================
// ClientDocument
// ============================================================================

ClientDocument ClientDocument::parse(std::string_view text) {
    json root;
    try {
        root = json::parse(text);
    } catch (const json::parse_error& e) {
        throw ClientDocumentError(std::format("Malformed API document: {}", e.what()));
    }
    if (!root.is_object()) {
        throw ClientDocumentError("Malformed API document: root is not an object");
    }
    if (!root.contains("openapi") || !root.contains("paths")) {
        throw ClientDocumentError("Malformed API document: 'openapi' and 'paths' are required");
    }

    ClientDocument doc;
    try {
        if (root.contains("info")) {
            doc.title_ = string_or(root["info"], "title");
            doc.version_ = string_or(root["info"], "version");
        }

        for (const auto& [path, item] : root["paths"].items()) {
            for (const auto& [key, op] : item.items()) {
                const auto method = parse_http_method(key);
                if (!method) continue;  // "parameters", "summary", ...
                doc.operations_.push_back(read_operation(path, *method, op));
            }
        }

        if (root.contains("components")) {
            const auto& components = root["components"];
            if (const auto it = components.find("schemas"); it != components.end()) {
                for (const auto& [name, schema] : it->items()) {
                    doc.types_.push_back(read_type(name, schema));
                }
            }
            if (const auto it = components.find("securitySchemes"); it != components.end()) {
                for (const auto& [id, scheme] : it->items()) {
                    doc.security_schemes_.push_back(read_security_scheme(id, scheme));
                }
            }
        }
    } catch (const json::exception& e) {
        throw ClientDocumentError(std::format("Malformed API document: {}", e.what()));
    }
    return doc;
}

const ClientOperation* ClientDocument::find_operation(std::string_view operation_id) const {
    for (const auto& op : operations_) {
        if (op.operation_id == operation_id) return &op;
    }
    return nullptr;
}

const ClientOperation* ClientDocument::find_operation(std::string_view path, HttpMethod method) const {
    for (const auto& op : operations_) {
        if (op.path == path && op.method == method) return &op;
    }
    return nullptr;
}

const ClientTypeDefinition* ClientDocument::find_type(std::string_view name) const {
    for (const auto& t : types_) {
        if (t.name == name) return &t;
    }
    return nullptr;
}

// ============================================================================
// ClientDocumentGenerator
// ============================================================================

ClientDocumentGenerator::ClientDocumentGenerator(std::shared_ptr<const DocumentGenerator> generator)
    : generator_(std::move(generator)) {
    if (!generator_) throw std::invalid_argument("ClientDocumentGenerator: document generator is required");
}

ClientDocument ClientDocumentGenerator::generate(std::string_view document_name) const {
    const std::string text = DocumentWriter::serialize(generator_->generate(document_name), -1);
    auto doc = ClientDocument::parse(text);
    utils::log::debug(std::format("Client document '{}': {} operations, {} types",
        document_name, doc.operations().size(), doc.types().size()));
    return doc;
}

ClientDocument ClientDocumentGenerator::generate() const {
    return generate(generator_->registration().document_name());
}

} // namespace apidoc
