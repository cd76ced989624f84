#include "model/document.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <unordered_map>

namespace apidoc {

// ============================================================================
// Enum parsing
// ============================================================================

std::optional<HttpMethod> parse_http_method(std::string_view name) {
    static const std::unordered_map<std::string, HttpMethod> lookup = {
        {"get",     HttpMethod::GET},
        {"put",     HttpMethod::PUT},
        {"post",    HttpMethod::POST},
        {"delete",  HttpMethod::DELETE},
        {"options", HttpMethod::OPTIONS},
        {"head",    HttpMethod::HEAD},
        {"patch",   HttpMethod::PATCH},
        {"trace",   HttpMethod::TRACE},
    };

    const auto it = lookup.find(utils::to_lower(name));
    return (it != lookup.end()) ? std::make_optional(it->second) : std::nullopt;
}

std::optional<ParameterLocation> parse_parameter_location(std::string_view name) {
    static const std::unordered_map<std::string, ParameterLocation> lookup = {
        {"query",  ParameterLocation::QUERY},
        {"header", ParameterLocation::HEADER},
        {"path",   ParameterLocation::PATH},
        {"cookie", ParameterLocation::COOKIE},
    };

    const auto it = lookup.find(utils::to_lower(name));
    return (it != lookup.end()) ? std::make_optional(it->second) : std::nullopt;
}

// ============================================================================
// Operation
// ============================================================================

const Parameter* Operation::find_parameter(std::string_view name) const {
    const auto it = std::find_if(parameters.begin(), parameters.end(),
        [name](const Parameter& p) { return p.name == name; });
    return it != parameters.end() ? &*it : nullptr;
}

size_t Operation::count_responses(std::string_view status_code) const {
    return static_cast<size_t>(std::count_if(responses.begin(), responses.end(),
        [status_code](const ResponseEntry& r) { return r.status_code == status_code; }));
}

// ============================================================================
// Document
// ============================================================================

PathItem& Document::add_path(std::string_view path) {
    if (auto* existing = find_path(path)) {
        return *existing;
    }
    PathItem item;
    item.path = std::string(path);
    paths.emplace_back(std::move(item));
    return paths.back();
}

Operation& Document::add_operation(std::string_view path, HttpMethod method, Operation operation) {
    auto& item = add_path(path);
    auto& slot = item.operations[method];
    slot = std::move(operation);
    return slot;
}

Schema& Document::add_schema(std::string_view name, Schema schema) {
    for (auto& named : components.schemas) {
        if (named.name == name) {
            named.schema = std::move(schema);
            return named.schema;
        }
    }
    components.schemas.push_back(NamedSchema{std::string(name), std::move(schema)});
    return components.schemas.back().schema;
}

PathItem* Document::find_path(std::string_view path) {
    const auto it = std::find_if(paths.begin(), paths.end(),
        [path](const PathItem& p) { return p.path == path; });
    return it != paths.end() ? &*it : nullptr;
}

const PathItem* Document::find_path(std::string_view path) const {
    const auto it = std::find_if(paths.begin(), paths.end(),
        [path](const PathItem& p) { return p.path == path; });
    return it != paths.end() ? &*it : nullptr;
}

Operation* Document::find_operation(std::string_view path, HttpMethod method) {
    auto* item = find_path(path);
    if (!item) return nullptr;
    const auto it = item->operations.find(method);
    return it != item->operations.end() ? &it->second : nullptr;
}

const Operation* Document::find_operation(std::string_view path, HttpMethod method) const {
    const auto* item = find_path(path);
    if (!item) return nullptr;
    const auto it = item->operations.find(method);
    return it != item->operations.end() ? &it->second : nullptr;
}

size_t Document::operation_count() const {
    size_t count = 0;
    for (const auto& item : paths) {
        count += item.operations.size();
    }
    return count;
}

} // namespace apidoc
