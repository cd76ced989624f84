#include "filters/builtin_filters.hpp"

#include <stdexcept>

namespace apidoc {

SecurityRequirementFilter::SecurityRequirementFilter(std::string scheme_id, std::string scope)
    : scheme_id_(std::move(scheme_id)), scope_(std::move(scope)) {
    if (scheme_id_.empty()) {
        throw std::invalid_argument("SecurityRequirementFilter: scheme id must not be empty");
    }
}

void SecurityRequirementFilter::apply(Operation& operation, OperationContext&) {
    operation.responses.push_back({"401", Response{"Unauthorized", std::nullopt}});
    operation.responses.push_back({"403", Response{"Forbidden", std::nullopt}});
    operation.responses.push_back({"400", Response{"BadRequest", std::nullopt}});

    SecurityRequirement requirement;
    requirement[scheme_id_] = {scope_};
    operation.security.push_back(std::move(requirement));
}

} // namespace apidoc
