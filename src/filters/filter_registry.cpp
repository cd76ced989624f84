#include "filters/filter_registry.hpp"

#include <stdexcept>

namespace apidoc {

FilterRegistry& FilterRegistry::add(std::unique_ptr<IDocumentFilter> filter) {
    if (!filter) throw std::invalid_argument("FilterRegistry: document filter is null");
    entries_.push_back({FilterLevel::DOCUMENT, std::string(filter->name())});
    document_filters_.push_back(std::move(filter));
    return *this;
}

FilterRegistry& FilterRegistry::add(std::unique_ptr<IOperationFilter> filter) {
    if (!filter) throw std::invalid_argument("FilterRegistry: operation filter is null");
    entries_.push_back({FilterLevel::OPERATION, std::string(filter->name())});
    operation_filters_.push_back(std::move(filter));
    return *this;
}

FilterRegistry& FilterRegistry::add(std::unique_ptr<ISchemaFilter> filter) {
    if (!filter) throw std::invalid_argument("FilterRegistry: schema filter is null");
    entries_.push_back({FilterLevel::SCHEMA, std::string(filter->name())});
    schema_filters_.push_back(std::move(filter));
    return *this;
}

} // namespace apidoc
