#pragma once

#include "docs/docs_registration.hpp"
#include "docs/document_generator.hpp"

#include <nlohmann/json.hpp>

#include <memory>
#include <string>

namespace apidoc {

/**
 * @brief Documentation serving: JSON document + SwaggerUI page
 *
 * The host mounts:
 * - GET document_route() -> document_json(), "application/json"
 * - GET ui_route()       -> swagger_html(), "text/html"
 *
 * Construction runs one generation so that filter or provider failures
 * surface at startup instead of on the first documentation request.
 */
class DocsUiHandler {
public:
    /**
     * @throws SequencingError if `registration` is null
     * @throws std::invalid_argument if `generator` is null
     * @throws ConfigurationError if `generator` was built from another registration
     * @throws FilterExecutionError if the warm-up generation fails
     */
    DocsUiHandler(std::shared_ptr<const DocsRegistration> registration,
                  std::shared_ptr<const DocumentGenerator> generator);

    [[nodiscard]] const std::string& document_route() const { return document_route_; }
    [[nodiscard]] static const std::string& ui_route();

    /// Regenerate and serialize the configured document
    [[nodiscard]] std::string document_json() const;

    /// SwaggerUI page (loads the UI bundle from CDN)
    [[nodiscard]] const std::string& swagger_html() const { return html_; }

    /// Options handed to SwaggerUIBundle
    [[nodiscard]] nlohmann::ordered_json ui_config() const;

private:
    void warm_up() const;
    [[nodiscard]] std::string render_html() const;

    std::shared_ptr<const DocsRegistration> registration_;
    std::shared_ptr<const DocumentGenerator> generator_;
    std::string document_route_;
    std::string html_;
};

} // namespace apidoc
