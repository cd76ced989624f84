#pragma once

#include "model/document.hpp"

#include <string>
#include <string_view>

namespace apidoc {

enum class FilterLevel { DOCUMENT, OPERATION, SCHEMA };

[[nodiscard]] constexpr std::string_view to_string(FilterLevel level) noexcept {
    switch (level) {
        case FilterLevel::DOCUMENT:  return "document";
        case FilterLevel::OPERATION: return "operation";
        case FilterLevel::SCHEMA:    return "schema";
    }
    return "document";
}

// ============================================================================
// Filter Contexts
// ============================================================================

struct DocumentContext {
    std::string_view document_name;
};

/**
 * @brief What an operation filter knows besides the operation itself.
 *
 * `description` is the engine-side parameter description list for the
 * operation. Exclusion filters must keep it consistent with
 * Operation::parameters.
 */
struct OperationContext {
    std::string_view path;
    HttpMethod method;
    OperationSource& description;
};

struct SchemaContext {
    std::string pointer;                // JSON pointer-ish location, e.g. "#/components/schemas/Color"
    const TypeDescriptor* type = nullptr;
};

// ============================================================================
// Filter Interfaces
// ============================================================================

/**
 * @brief Transformation applied once to the whole document.
 *
 * Filters run synchronously in registration order. Any exception thrown
 * from apply() aborts the generation.
 */
class IDocumentFilter {
public:
    virtual ~IDocumentFilter() = default;

    virtual void apply(Document& document, const DocumentContext& ctx) = 0;

    /**
     * @brief Human-readable filter name for logging and error reports
     */
    [[nodiscard]] virtual std::string_view name() const = 0;
};

/**
 * @brief Transformation applied to every operation of the document.
 */
class IOperationFilter {
public:
    virtual ~IOperationFilter() = default;

    virtual void apply(Operation& operation, OperationContext& ctx) = 0;

    [[nodiscard]] virtual std::string_view name() const = 0;
};

/**
 * @brief Transformation applied to every schema reachable from the document.
 */
class ISchemaFilter {
public:
    virtual ~ISchemaFilter() = default;

    virtual void apply(Schema& schema, const SchemaContext& ctx) = 0;

    [[nodiscard]] virtual std::string_view name() const = 0;
};

} // namespace apidoc
