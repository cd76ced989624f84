#include "filters/builtin_filters.hpp"
#include "core/utils.hpp"

namespace apidoc {

namespace {

Parameter make_query_parameter(std::string name, std::string type, nlohmann::json default_value,
                               std::string description) {
    Parameter param;
    param.name = std::move(name);
    param.location = ParameterLocation::QUERY;
    param.description = std::move(description);
    param.required = false;
    param.schema.type = std::move(type);
    param.schema.nullable = true;
    param.schema.default_value = std::move(default_value);
    return param;
}

} // anonymous namespace

bool PagingParametersFilter::applies_to(HttpMethod method, std::string_view path) {
    return method == HttpMethod::GET && utils::ends_with(path, kListQuerySuffix);
}

void PagingParametersFilter::apply(Operation& operation, OperationContext& ctx) {
    if (!applies_to(ctx.method, ctx.path)) return;

    operation.parameters.push_back(make_query_parameter(
        prefix_ + "count", "boolean", false,
        "Defines if the total element count should be computed. "
        "ref: https://docs.microsoft.com/en-us/odata/concepts/queryoptions-overview#count"));
    operation.parameters.push_back(make_query_parameter(
        prefix_ + "skip", "integer", 0,
        "Defines how many elements to skip. "
        "ref: https://docs.microsoft.com/en-us/odata/concepts/queryoptions-overview#top-and-skip"));
    operation.parameters.push_back(make_query_parameter(
        prefix_ + "top", "integer", 30,
        "Defines how many elements to return. "
        "ref: https://docs.microsoft.com/en-us/odata/concepts/queryoptions-overview#top-and-skip"));
    operation.parameters.push_back(make_query_parameter(
        prefix_ + "filter", "string", nullptr,
        "Defines the filtering expression. "
        "ref: https://docs.microsoft.com/en-us/odata/concepts/queryoptions-overview#filter"));
    operation.parameters.push_back(make_query_parameter(
        prefix_ + "orderBy", "string", nullptr,
        "Defines the ordering expression. "
        "ref: https://docs.microsoft.com/en-us/odata/concepts/queryoptions-overview#orderby"));
    operation.parameters.push_back(make_query_parameter(
        prefix_ + "apply", "string", nullptr,
        "Defines the Aggregation behavior. "
        "ref: http://docs.oasis-open.org/odata/odata-data-aggregation-ext/v4.0/cs01/"
        "odata-data-aggregation-ext-v4.0-cs01.html#_Toc378326289"));
}

} // namespace apidoc
