#pragma once

#include "docs/docs_registration.hpp"
#include "filters/filter_pipeline.hpp"
#include "model/document.hpp"

#include <memory>
#include <string_view>

namespace apidoc {

/**
 * @brief Source of freshly generated, unfiltered documents.
 *
 * Implemented by the host's route/schema discovery. Every call must return
 * an independent tree.
 */
class IDocumentProvider {
public:
    virtual ~IDocumentProvider() = default;

    [[nodiscard]] virtual Document build(std::string_view document_name) = 0;
};

/**
 * @brief Generation trigger: provider output -> registered filters -> Document
 */
class DocumentGenerator {
public:
    /**
     * @throws SequencingError if `registration` is null
     * @throws std::invalid_argument if `provider` is null
     */
    DocumentGenerator(std::shared_ptr<const DocsRegistration> registration,
                      std::shared_ptr<IDocumentProvider> provider);

    /**
     * @brief Build and filter the document named `document_name`
     * @throws DocumentNotFoundError if the name is not the configured version
     * @throws FilterExecutionError if a filter fails; no document is returned
     */
    [[nodiscard]] Document generate(std::string_view document_name) const;

    /**
     * @brief Build and filter the configured document
     */
    [[nodiscard]] Document generate() const;

    [[nodiscard]] const DocsRegistration& registration() const { return *registration_; }

private:
    std::shared_ptr<const DocsRegistration> registration_;
    std::shared_ptr<IDocumentProvider> provider_;
    FilterPipeline pipeline_;
};

} // namespace apidoc
