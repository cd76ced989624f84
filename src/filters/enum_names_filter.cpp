#include "filters/builtin_filters.hpp"

namespace apidoc {

void EnumNamesFilter::apply(Schema& schema, const SchemaContext& ctx) {
    // The same enum type may be referenced by several schemas; annotate once
    if (!ctx.type || !ctx.type->is_enum || schema.has_extension(kEnumNamesExtension)) {
        return;
    }

    auto names = nlohmann::json::array();
    for (const auto& member : ctx.type->enum_names) {
        names.push_back(member);
    }
    schema.extensions.emplace(std::string(kEnumNamesExtension), std::move(names));
}

} // namespace apidoc
