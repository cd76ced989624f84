#include "docs/docs_ui_handler.hpp"
#include "core/error.hpp"
#include "core/utils.hpp"
#include "serde/document_writer.hpp"

#include <format>
#include <stdexcept>

namespace apidoc {

namespace {

std::string escape_html(std::string_view s) {
    std::string result;
    result.reserve(s.size());
    for (const char c : s) {
        switch (c) {
            case '&':  result += "&amp;"; break;
            case '<':  result += "&lt;"; break;
            case '>':  result += "&gt;"; break;
            case '"':  result += "&quot;"; break;
            case '\'': result += "&#39;"; break;
            default:   result += c;
        }
    }
    return result;
}

// JSON embedded in a <script> block must not close the element
std::string escape_script_json(std::string json) {
    size_t pos = 0;
    while ((pos = json.find("</", pos)) != std::string::npos) {
        json.replace(pos, 2, "<\\/");
        pos += 3;
    }
    return json;
}

} // anonymous namespace

DocsUiHandler::DocsUiHandler(std::shared_ptr<const DocsRegistration> registration,
                             std::shared_ptr<const DocumentGenerator> generator)
    : registration_(require_registration(std::move(registration), "documentation serving")),
      generator_(std::move(generator)),
      document_route_(registration_->document_route()) {
    if (!generator_) throw std::invalid_argument("DocsUiHandler: document generator is required");
    // The served route and UI settings come from registration_; the document from generator_
    if (&generator_->registration() != registration_.get()) {
        throw ConfigurationError(std::format(
            "DocsUiHandler: document generator is bound to registration '{}', not '{}'",
            generator_->registration().document_route(), document_route_));
    }
    html_ = render_html();
    warm_up();
}

const std::string& DocsUiHandler::ui_route() {
    static const std::string route = "/swagger";
    return route;
}

void DocsUiHandler::warm_up() const {
    utils::Timer timer;
    const auto document = generator_->generate(registration_->document_name());
    utils::log::info(std::format("API docs ready at {}: {} operations (warm-up {}us)",
        document_route_, document.operation_count(), timer.elapsed_us().count()));
}

std::string DocsUiHandler::document_json() const {
    return DocumentWriter::serialize(generator_->generate(registration_->document_name()));
}

nlohmann::ordered_json DocsUiHandler::ui_config() const {
    const auto& config = registration_->config();
    nlohmann::ordered_json ui = nlohmann::ordered_json::object();
    ui["urls"] = nlohmann::ordered_json::array({
        {{"url", document_route_}, {"name", std::format("{} {}", config.api_title, config.api_version)}},
    });
    ui["docExpansion"] = "none";
    ui["displayRequestDuration"] = true;
    ui["defaultModelExpandDepth"] = 0;
    ui["defaultModelsExpandDepth"] = -1;
    ui["displayOperationId"] = true;
    return ui;
}

std::string DocsUiHandler::render_html() const {
    const auto& config = registration_->config();
    return std::format(R"HTML(<!DOCTYPE html>
<html lang="en">
<head>
    <meta charset="UTF-8">
    <meta name="viewport" content="width=device-width, initial-scale=1.0">
    <title>{} - Swagger UI</title>
    <link rel="stylesheet" href="https://cdn.jsdelivr.net/npm/swagger-ui-dist@5/swagger-ui.css">
</head>
<body>
    <div id="swagger-ui"></div>
    <script src="https://cdn.jsdelivr.net/npm/swagger-ui-dist@5/swagger-ui-bundle.js"></script>
    <script src="https://cdn.jsdelivr.net/npm/swagger-ui-dist@5/swagger-ui-standalone-preset.js"></script>
    <script>
        const config = {};
        SwaggerUIBundle(Object.assign(config, {{
            dom_id: '#swagger-ui',
            presets: [SwaggerUIBundle.presets.apis, SwaggerUIStandalonePreset],
            layout: 'StandaloneLayout'
        }}));
    </script>
</body>
</html>)HTML", escape_html(config.api_title), escape_script_json(ui_config().dump()));
}

} // namespace apidoc
