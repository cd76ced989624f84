#pragma once

#include <algorithm>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace apidoc {

// ============================================================================
// Basic Enums
// ============================================================================

enum class HttpMethod : uint8_t {
    GET,
    PUT,
    POST,
    DELETE,
    OPTIONS,
    HEAD,
    PATCH,
    TRACE
};

enum class ParameterLocation : uint8_t {
    QUERY,
    HEADER,
    PATH,
    COOKIE
};

[[nodiscard]] constexpr std::string_view to_string(HttpMethod method) noexcept {
    switch (method) {
        case HttpMethod::GET:     return "GET";
        case HttpMethod::PUT:     return "PUT";
        case HttpMethod::POST:    return "POST";
        case HttpMethod::DELETE:  return "DELETE";
        case HttpMethod::OPTIONS: return "OPTIONS";
        case HttpMethod::HEAD:    return "HEAD";
        case HttpMethod::PATCH:   return "PATCH";
        case HttpMethod::TRACE:   return "TRACE";
    }
    return "GET";
}

// OpenAPI path item keys are lower-case
[[nodiscard]] constexpr std::string_view to_openapi_key(HttpMethod method) noexcept {
    switch (method) {
        case HttpMethod::GET:     return "get";
        case HttpMethod::PUT:     return "put";
        case HttpMethod::POST:    return "post";
        case HttpMethod::DELETE:  return "delete";
        case HttpMethod::OPTIONS: return "options";
        case HttpMethod::HEAD:    return "head";
        case HttpMethod::PATCH:   return "patch";
        case HttpMethod::TRACE:   return "trace";
    }
    return "get";
}

[[nodiscard]] std::optional<HttpMethod> parse_http_method(std::string_view name);

[[nodiscard]] constexpr std::string_view to_string(ParameterLocation location) noexcept {
    switch (location) {
        case ParameterLocation::QUERY:  return "query";
        case ParameterLocation::HEADER: return "header";
        case ParameterLocation::PATH:   return "path";
        case ParameterLocation::COOKIE: return "cookie";
    }
    return "query";
}

[[nodiscard]] std::optional<ParameterLocation> parse_parameter_location(std::string_view name);

// ============================================================================
// Source Metadata (filter predicates only, never serialized)
// ============================================================================

/**
 * @brief Declared type of a parameter or schema, as reported by the host framework.
 *
 * Assignability is carried as data: `assignable_to` lists every base type and
 * interface the type converts to, so filters never need reflection.
 */
struct TypeDescriptor {
    std::string name;
    std::vector<std::string> assignable_to;
    bool is_enum = false;
    std::vector<std::string> enum_names;    // declaration order

    [[nodiscard]] bool is_assignable_to(std::string_view type_name) const {
        if (name == type_name) return true;
        return std::find(assignable_to.begin(), assignable_to.end(), type_name) != assignable_to.end();
    }
};

struct ParameterDescription {
    std::string name;
    ParameterLocation location = ParameterLocation::QUERY;
    TypeDescriptor type;
    std::vector<std::string> markers;

    [[nodiscard]] bool has_marker(std::string_view marker) const {
        return std::find(markers.begin(), markers.end(), marker) != markers.end();
    }
};

/**
 * @brief Where an operation came from: the handler that declared it and the
 * parameter descriptions the engine uses to decide what gets documented.
 */
struct OperationSource {
    std::string declaring_type;
    std::string method_name;
    std::vector<ParameterDescription> parameters;
};

} // namespace apidoc
