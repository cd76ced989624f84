#include "serde/document_writer.hpp"
#include "core/utils.hpp"

#include <format>
#include <stdexcept>

namespace apidoc {

using ojson = nlohmann::ordered_json;

namespace {

ojson write_parameter(const Parameter& param) {
    ojson out = ojson::object();
    out["name"] = param.name;
    out["in"] = std::string(to_string(param.location));
    if (!param.description.empty()) out["description"] = param.description;
    // Path parameters are always required in OpenAPI 3
    out["required"] = param.required || param.location == ParameterLocation::PATH;
    out["schema"] = DocumentWriter::write_schema(param.schema);
    return out;
}

ojson write_response(const Response& response) {
    ojson out = ojson::object();
    out["description"] = response.description;
    if (response.schema) {
        out["content"]["application/json"]["schema"] = DocumentWriter::write_schema(*response.schema);
    }
    return out;
}

} // anonymous namespace

// ============================================================================
// Schema
// ============================================================================

ojson DocumentWriter::write_schema(const Schema& schema) {
    ojson out = ojson::object();

    // A reference replaces the whole schema object
    if (!schema.ref.empty()) {
        out["$ref"] = schema.ref;
        return out;
    }

    if (!schema.type.empty()) out["type"] = schema.type;
    if (!schema.format.empty()) out["format"] = schema.format;
    if (!schema.description.empty()) out["description"] = schema.description;
    if (schema.nullable) out["nullable"] = true;
    if (!schema.default_value.is_null()) out["default"] = ojson(schema.default_value);

    if (!schema.enum_values.empty()) {
        auto values = ojson::array();
        for (const auto& v : schema.enum_values) values.push_back(ojson(v));
        out["enum"] = std::move(values);
    }

    if (!schema.properties.empty()) {
        auto props = ojson::object();
        for (const auto& prop : schema.properties) {
            props[prop.name] = write_schema(prop.schema);
        }
        out["properties"] = std::move(props);
    }

    if (schema.items.size() > 1) {
        throw std::invalid_argument(std::format(
            "Schema '{}': an array has exactly one item schema, got {}",
            schema.type, schema.items.size()));
    }
    if (!schema.items.empty()) {
        out["items"] = write_schema(schema.items.front());
    }

    for (const auto& [key, value] : schema.extensions) {
        out[key] = ojson(value);
    }
    return out;
}

// ============================================================================
// Operation
// ============================================================================

ojson DocumentWriter::write_operation(const Operation& operation) {
    ojson out = ojson::object();

    if (!operation.tags.empty()) out["tags"] = operation.tags;
    if (!operation.summary.empty()) out["summary"] = operation.summary;
    if (!operation.operation_id.empty()) out["operationId"] = operation.operation_id;

    if (!operation.parameters.empty()) {
        auto params = ojson::array();
        for (const auto& param : operation.parameters) {
            params.push_back(write_parameter(param));
        }
        out["parameters"] = std::move(params);
    }

    auto responses = ojson::object();
    // The first entry for a status code is the host's own; later ones are dropped
    for (const auto& entry : operation.responses) {
        if (responses.contains(entry.status_code)) {
            utils::log::warn(std::format(
                "Operation '{}': duplicate response {} ('{}') dropped, keeping the first entry",
                operation.operation_id, entry.status_code, entry.response.description));
            continue;
        }
        responses[entry.status_code] = write_response(entry.response);
    }
    out["responses"] = std::move(responses);

    if (!operation.security.empty()) {
        auto security = ojson::array();
        for (const auto& requirement : operation.security) {
            auto req = ojson::object();
            for (const auto& [scheme_id, scopes] : requirement) {
                req[scheme_id] = scopes;
            }
            security.push_back(std::move(req));
        }
        out["security"] = std::move(security);
    }
    return out;
}

// ============================================================================
// Security Scheme
// ============================================================================

ojson DocumentWriter::write_security_scheme(const SecurityScheme& scheme) {
    ojson out = ojson::object();
    out["type"] = std::string(to_string(scheme.type));
    if (!scheme.description.empty()) out["description"] = scheme.description;
    if (!scheme.name.empty()) out["name"] = scheme.name;
    out["in"] = std::string(to_string(scheme.location));
    if (!scheme.scheme.empty()) out["scheme"] = scheme.scheme;
    if (!scheme.bearer_format.empty()) out["bearerFormat"] = scheme.bearer_format;

    if (scheme.password_flow) {
        const auto& flow = *scheme.password_flow;
        ojson password = ojson::object();
        password["tokenUrl"] = flow.token_url;
        if (!flow.refresh_url.empty()) password["refreshUrl"] = flow.refresh_url;
        auto scopes = ojson::object();
        for (const auto& [scope, description] : flow.scopes) {
            scopes[scope] = description;
        }
        password["scopes"] = std::move(scopes);
        out["flows"]["password"] = std::move(password);
    }
    return out;
}

// ============================================================================
// Document
// ============================================================================

ojson DocumentWriter::to_json(const Document& document) {
    ojson out = ojson::object();
    out["openapi"] = document.openapi_version;

    ojson info = ojson::object();
    info["title"] = document.info.title;
    if (!document.info.description.empty()) info["description"] = document.info.description;
    info["version"] = document.info.version;
    out["info"] = std::move(info);

    auto paths = ojson::object();
    for (const auto& item : document.paths) {
        auto path_obj = ojson::object();
        for (const auto& [method, operation] : item.operations) {
            path_obj[std::string(to_openapi_key(method))] = write_operation(operation);
        }
        paths[item.path] = std::move(path_obj);
    }
    out["paths"] = std::move(paths);

    ojson components = ojson::object();
    if (!document.components.schemas.empty()) {
        auto schemas = ojson::object();
        for (const auto& named : document.components.schemas) {
            schemas[named.name] = write_schema(named.schema);
        }
        components["schemas"] = std::move(schemas);
    }
    if (!document.components.security_schemes.empty()) {
        auto schemes = ojson::object();
        for (const auto& [id, scheme] : document.components.security_schemes) {
            schemes[id] = write_security_scheme(scheme);
        }
        components["securitySchemes"] = std::move(schemes);
    }
    if (!components.empty()) out["components"] = std::move(components);

    return out;
}

std::string DocumentWriter::serialize(const Document& document, int indent) {
    return to_json(document).dump(indent);
}

} // namespace apidoc
