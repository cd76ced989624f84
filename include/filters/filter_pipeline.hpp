#pragma once

#include "filters/filter_registry.hpp"
#include "model/document.hpp"

#include <cstdint>
#include <memory>
#include <string_view>

namespace apidoc {

/**
 * @brief Transformation engine - applies registered filters to a document
 *
 * Order of application:
 * 1. Document filters, once each
 * 2. Operation filters, for every operation (path order, then method order)
 * 3. Schema filters, for every schema reachable from components, parameters
 *    and responses (recursing into properties and array items)
 *
 * Within a level filters run in registration order. A failing filter is
 * never skipped: its exception is rethrown as FilterExecutionError and the
 * document must be discarded.
 */
class FilterPipeline {
public:
    explicit FilterPipeline(std::shared_ptr<const FilterRegistry> registry);

    struct Stats {
        uint64_t operations_visited = 0;
        uint64_t schemas_visited = 0;
        uint64_t filter_invocations = 0;
    };

    /**
     * @brief Apply every registered filter to `document` in place
     * @throws FilterExecutionError if any filter throws
     */
    Stats apply(Document& document, std::string_view document_name = {}) const;

    [[nodiscard]] const FilterRegistry& registry() const { return *registry_; }

private:
    void apply_document_filters(Document& document, std::string_view document_name, Stats& stats) const;
    void apply_operation_filters(Document& document, Stats& stats) const;
    void apply_schema_filters(Document& document, Stats& stats) const;
    void visit_schema(Schema& schema, const std::string& pointer, Stats& stats) const;

    std::shared_ptr<const FilterRegistry> registry_;
};

} // namespace apidoc
