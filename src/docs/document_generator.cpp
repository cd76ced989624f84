#include "docs/document_generator.hpp"
#include "core/error.hpp"
#include "core/utils.hpp"

#include <format>
#include <stdexcept>

namespace apidoc {

DocumentGenerator::DocumentGenerator(std::shared_ptr<const DocsRegistration> registration,
                                     std::shared_ptr<IDocumentProvider> provider)
    : registration_(require_registration(std::move(registration), "document generation")),
      provider_(std::move(provider)),
      pipeline_(registration_->filter_registry()) {
    if (!provider_) throw std::invalid_argument("DocumentGenerator: document provider is required");
}

Document DocumentGenerator::generate(std::string_view document_name) const {
    if (document_name != registration_->document_name()) {
        throw DocumentNotFoundError(std::format(
            "Unknown API document '{}'; the configured document is '{}'",
            document_name, registration_->document_name()));
    }

    const auto& config = registration_->config();
    utils::Timer timer;

    Document document = provider_->build(document_name);
    document.info.title = config.api_title;
    document.info.version = config.api_version;
    document.components.security_schemes.insert_or_assign(
        config.security_scheme, registration_->security_scheme());

    const auto stats = pipeline_.apply(document, document_name);

    utils::log::debug(std::format("Generated API document '{}': {} operations, {} schemas in {}us",
        document_name, stats.operations_visited, stats.schemas_visited, timer.elapsed_us().count()));
    return document;
}

Document DocumentGenerator::generate() const {
    return generate(registration_->document_name());
}

} // namespace apidoc
