#include "filters/builtin_filters.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <format>
#include <stdexcept>

namespace apidoc {

namespace {

struct ParameterKey {
    std::string name;
    ParameterLocation location;
};

/**
 * @brief Remove a parameter from the rendered list and the description list.
 *
 * Both lists must change together, otherwise a later stage that re-derives
 * parameters from the descriptions brings the parameter back.
 */
void remove_parameter(Operation& operation, OperationSource& description, const ParameterKey& key) {
    std::erase_if(operation.parameters, [&key](const Parameter& p) {
        return p.name == key.name && p.location == key.location;
    });
    std::erase_if(description.parameters, [&key](const ParameterDescription& d) {
        return d.name == key.name && d.location == key.location;
    });
}

} // anonymous namespace

// ============================================================================
// ExcludeParameterTypeFilter
// ============================================================================

ExcludeParameterTypeFilter::ExcludeParameterTypeFilter(std::string type_name)
    : type_name_(std::move(type_name)) {
    if (type_name_.empty()) {
        throw std::invalid_argument("ExcludeParameterTypeFilter: type name must not be empty");
    }
}

void ExcludeParameterTypeFilter::apply(Operation& operation, OperationContext& ctx) {
    std::vector<ParameterKey> ignored;
    for (const auto& desc : ctx.description.parameters) {
        if (desc.type.is_assignable_to(type_name_)) {
            ignored.push_back({desc.name, desc.location});
        }
    }

    for (const auto& key : ignored) {
        remove_parameter(operation, ctx.description, key);
    }
}

// ============================================================================
// ExcludeParameterNamesFilter
// ============================================================================

ExcludeParameterNamesFilter::ExcludeParameterNamesFilter(const std::vector<std::string>& names)
    : names_(names.begin(), names.end()) {}

void ExcludeParameterNamesFilter::apply(Document& document, const DocumentContext&) {
    if (names_.empty()) return;

    size_t removed = 0;
    for (auto& item : document.paths) {
        for (auto& [method, operation] : item.operations) {
            removed += std::erase_if(operation.parameters, [this](const Parameter& p) {
                return names_.contains(p.name);
            });
            std::erase_if(operation.source.parameters, [this](const ParameterDescription& d) {
                return names_.contains(d.name);
            });
        }
    }

    if (removed > 0) {
        utils::log::debug(std::format("Removed {} ignored parameters by name", removed));
    }
}

// ============================================================================
// ExcludeMarkedParameterFilter
// ============================================================================

void ExcludeMarkedParameterFilter::apply(Operation& operation, OperationContext& ctx) {
    std::vector<ParameterKey> ignored;
    for (const auto& desc : ctx.description.parameters) {
        if (desc.has_marker(kExcludeFromDocsMarker)) {
            ignored.push_back({desc.name, desc.location});
        }
    }
    for (const auto& param : operation.parameters) {
        if (param.has_marker(kExcludeFromDocsMarker)) {
            ignored.push_back({param.name, param.location});
        }
    }

    for (const auto& key : ignored) {
        remove_parameter(operation, ctx.description, key);
    }
}

} // namespace apidoc
