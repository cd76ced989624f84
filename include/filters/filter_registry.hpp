#pragma once

#include "filters/filter.hpp"

#include <memory>
#include <string>
#include <vector>

namespace apidoc {

/**
 * @brief Ordered collection of filters, grouped by level.
 *
 * Registration order is preserved within each level and is the order in
 * which FilterPipeline invokes them. entries() reports the global
 * registration order across levels.
 */
class FilterRegistry {
public:
    struct Entry {
        FilterLevel level;
        std::string name;
    };

    FilterRegistry& add(std::unique_ptr<IDocumentFilter> filter);
    FilterRegistry& add(std::unique_ptr<IOperationFilter> filter);
    FilterRegistry& add(std::unique_ptr<ISchemaFilter> filter);

    template<typename F, typename... Args>
    FilterRegistry& emplace(Args&&... args) {
        return add(std::make_unique<F>(std::forward<Args>(args)...));
    }

    [[nodiscard]] const std::vector<std::unique_ptr<IDocumentFilter>>& document_filters() const { return document_filters_; }
    [[nodiscard]] const std::vector<std::unique_ptr<IOperationFilter>>& operation_filters() const { return operation_filters_; }
    [[nodiscard]] const std::vector<std::unique_ptr<ISchemaFilter>>& schema_filters() const { return schema_filters_; }

    [[nodiscard]] const std::vector<Entry>& entries() const { return entries_; }
    [[nodiscard]] size_t size() const { return entries_.size(); }
    [[nodiscard]] bool empty() const { return entries_.empty(); }

private:
    std::vector<std::unique_ptr<IDocumentFilter>> document_filters_;
    std::vector<std::unique_ptr<IOperationFilter>> operation_filters_;
    std::vector<std::unique_ptr<ISchemaFilter>> schema_filters_;
    std::vector<Entry> entries_;
};

} // namespace apidoc
