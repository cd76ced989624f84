#pragma once

#include "filters/filter.hpp"

#include <string>
#include <string_view>
#include <unordered_set>
#include <utility>
#include <vector>

namespace apidoc {

// Type every host maps "never document this parameter" declarations to
inline constexpr std::string_view kHiddenParameterType = "HiddenParameter";

// Marker attached to a source parameter declaration to hide it
inline constexpr std::string_view kExcludeFromDocsMarker = "ExcludeFromDocs";

// Extension key consumed by client generators to name enum members
inline constexpr std::string_view kEnumNamesExtension = "x-enumNames";

// Route suffix of list-query endpoints that accept paging parameters
inline constexpr std::string_view kListQuerySuffix = "/odata";

// ============================================================================
// Parameter Exclusion
// ============================================================================

/**
 * @brief Removes parameters whose declared type is assignable to a given type.
 *
 * Both the rendered parameter and its description are removed. Idempotent.
 */
class ExcludeParameterTypeFilter final : public IOperationFilter {
public:
    explicit ExcludeParameterTypeFilter(std::string type_name);

    void apply(Operation& operation, OperationContext& ctx) override;
    [[nodiscard]] std::string_view name() const override { return "exclude_parameter_type"; }

    [[nodiscard]] const std::string& type_name() const { return type_name_; }

private:
    std::string type_name_;
};

/**
 * @brief Removes parameters by exact, case-sensitive name across the document.
 */
class ExcludeParameterNamesFilter final : public IDocumentFilter {
public:
    explicit ExcludeParameterNamesFilter(const std::vector<std::string>& names);

    void apply(Document& document, const DocumentContext& ctx) override;
    [[nodiscard]] std::string_view name() const override { return "exclude_parameter_names"; }

private:
    std::unordered_set<std::string> names_;
};

/**
 * @brief Removes parameters whose source declaration carries kExcludeFromDocsMarker.
 */
class ExcludeMarkedParameterFilter final : public IOperationFilter {
public:
    void apply(Operation& operation, OperationContext& ctx) override;
    [[nodiscard]] std::string_view name() const override { return "exclude_marked_parameters"; }
};

// ============================================================================
// Security
// ============================================================================

/**
 * @brief Adds 401/403/400 responses and a security requirement to every operation.
 *
 * Additive: running it twice on the same operation duplicates the entries.
 */
class SecurityRequirementFilter final : public IOperationFilter {
public:
    SecurityRequirementFilter(std::string scheme_id, std::string scope);

    void apply(Operation& operation, OperationContext& ctx) override;
    [[nodiscard]] std::string_view name() const override { return "security_requirement"; }

private:
    std::string scheme_id_;
    std::string scope_;
};

// ============================================================================
// Paging
// ============================================================================

/**
 * @brief Adds count/skip/top/filter/orderBy/apply query parameters to
 * GET list-query endpoints (path ending in kListQuerySuffix).
 *
 * The names are written without the OData `$` unless a prefix is given:
 * hosts that bind the query options by their bare names expect `top`, while
 * a strict OData endpoint expects `$top` and needs the prefix "$".
 */
class PagingParametersFilter final : public IOperationFilter {
public:
    explicit PagingParametersFilter(std::string prefix = {}) : prefix_(std::move(prefix)) {}

    void apply(Operation& operation, OperationContext& ctx) override;
    [[nodiscard]] std::string_view name() const override { return "paging_parameters"; }

    [[nodiscard]] static bool applies_to(HttpMethod method, std::string_view path);
    [[nodiscard]] const std::string& prefix() const { return prefix_; }

private:
    std::string prefix_;
};

// ============================================================================
// Schemas
// ============================================================================

/**
 * @brief Annotates enum schemas with their member names under kEnumNamesExtension.
 */
class EnumNamesFilter final : public ISchemaFilter {
public:
    void apply(Schema& schema, const SchemaContext& ctx) override;
    [[nodiscard]] std::string_view name() const override { return "enum_names"; }
};

// ============================================================================
// Operation Ids
// ============================================================================

/**
 * @brief Derives "<Type>_<Method>" operation ids from the handler that declared
 * the operation, with "Controller" removed from the type name.
 */
class OperationIdFilter final : public IOperationFilter {
public:
    void apply(Operation& operation, OperationContext& ctx) override;
    [[nodiscard]] std::string_view name() const override { return "operation_id"; }

    [[nodiscard]] static std::string derive(std::string_view declaring_type, std::string_view method_name);
};

} // namespace apidoc
