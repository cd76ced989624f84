#include "filters/builtin_filters.hpp"
#include "core/utils.hpp"

namespace apidoc {

std::string OperationIdFilter::derive(std::string_view declaring_type, std::string_view method_name) {
    std::string id = utils::erase_all(std::string(declaring_type), "Controller");
    id += '_';
    id += method_name;
    return id;
}

void OperationIdFilter::apply(Operation& operation, OperationContext& ctx) {
    if (ctx.description.declaring_type.empty() || ctx.description.method_name.empty()) return;
    operation.operation_id = derive(ctx.description.declaring_type, ctx.description.method_name);
}

} // namespace apidoc
