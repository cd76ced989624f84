#include "filters/filter_pipeline.hpp"
#include "core/error.hpp"
#include "core/utils.hpp"

#include <format>
#include <stdexcept>

namespace apidoc {

namespace {

/**
 * @brief Run one filter, converting any failure into FilterExecutionError.
 */
template<typename Fn>
void run_filter(std::string_view filter_name, const std::string& location, Fn&& fn) {
    try {
        fn();
    } catch (const FilterExecutionError&) {
        throw;
    } catch (const std::exception& e) {
        utils::log::error(std::format("Filter '{}' failed at {}: {}", filter_name, location, e.what()));
        throw FilterExecutionError(std::string(filter_name), location, e.what());
    } catch (...) {
        utils::log::error(std::format("Filter '{}' failed at {}: unknown exception", filter_name, location));
        throw FilterExecutionError(std::string(filter_name), location, "unknown exception");
    }
}

// RFC 6901 escaping for path segments
std::string escape_pointer(std::string_view segment) {
    std::string out;
    out.reserve(segment.size());
    for (const char c : segment) {
        switch (c) {
            case '~': out += "~0"; break;
            case '/': out += "~1"; break;
            default:  out += c;
        }
    }
    return out;
}

} // anonymous namespace

FilterPipeline::FilterPipeline(std::shared_ptr<const FilterRegistry> registry)
    : registry_(std::move(registry)) {
    if (!registry_) throw std::invalid_argument("FilterPipeline: registry is required");
}

FilterPipeline::Stats FilterPipeline::apply(Document& document, std::string_view document_name) const {
    Stats stats;
    utils::Timer timer;

    apply_document_filters(document, document_name, stats);
    apply_operation_filters(document, stats);
    apply_schema_filters(document, stats);

    utils::log::debug(std::format(
        "Filter pipeline: {} filters, {} operations, {} schemas, {} invocations in {}us",
        registry_->size(), stats.operations_visited, stats.schemas_visited,
        stats.filter_invocations, timer.elapsed_us().count()));
    return stats;
}

// ============================================================================
// Document level
// ============================================================================

void FilterPipeline::apply_document_filters(Document& document, std::string_view document_name,
                                            Stats& stats) const {
    const DocumentContext ctx{document_name};
    static const std::string location = "#";
    for (const auto& filter : registry_->document_filters()) {
        run_filter(filter->name(), location, [&] { filter->apply(document, ctx); });
        ++stats.filter_invocations;
    }
}

// ============================================================================
// Operation level
// ============================================================================

void FilterPipeline::apply_operation_filters(Document& document, Stats& stats) const {
    const auto& filters = registry_->operation_filters();

    for (auto& item : document.paths) {
        for (auto& [method, operation] : item.operations) {
            ++stats.operations_visited;
            if (filters.empty()) continue;

            OperationContext ctx{item.path, method, operation.source};
            const std::string location = std::format("{} {}", to_string(method), item.path);
            for (const auto& filter : filters) {
                run_filter(filter->name(), location, [&] { filter->apply(operation, ctx); });
                ++stats.filter_invocations;
            }
        }
    }
}

// ============================================================================
// Schema level
// ============================================================================

void FilterPipeline::apply_schema_filters(Document& document, Stats& stats) const {
    for (auto& named : document.components.schemas) {
        visit_schema(named.schema, "#/components/schemas/" + escape_pointer(named.name), stats);
    }

    for (auto& item : document.paths) {
        const std::string path_pointer = "#/paths/" + escape_pointer(item.path);
        for (auto& [method, operation] : item.operations) {
            const std::string op_pointer = std::format("{}/{}", path_pointer, to_openapi_key(method));

            for (size_t i = 0; i < operation.parameters.size(); ++i) {
                visit_schema(operation.parameters[i].schema,
                             std::format("{}/parameters/{}/schema", op_pointer, i), stats);
            }
            for (auto& entry : operation.responses) {
                if (!entry.response.schema) continue;
                visit_schema(*entry.response.schema,
                             std::format("{}/responses/{}/schema", op_pointer, entry.status_code), stats);
            }
        }
    }
}

void FilterPipeline::visit_schema(Schema& schema, const std::string& pointer, Stats& stats) const {
    ++stats.schemas_visited;

    const auto& filters = registry_->schema_filters();
    if (!filters.empty()) {
        SchemaContext ctx;
        ctx.pointer = pointer;
        ctx.type = schema.source_type ? &*schema.source_type : nullptr;
        for (const auto& filter : filters) {
            run_filter(filter->name(), pointer, [&] { filter->apply(schema, ctx); });
            ++stats.filter_invocations;
        }
    }

    for (auto& property : schema.properties) {
        visit_schema(property.schema, pointer + "/properties/" + escape_pointer(property.name), stats);
    }
    for (auto& item : schema.items) {
        visit_schema(item, pointer + "/items", stats);
    }
}

} // namespace apidoc
