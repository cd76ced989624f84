#include "docs/docs_registration.hpp"
#include "core/error.hpp"
#include "core/utils.hpp"
#include "filters/builtin_filters.hpp"

#include <format>

namespace apidoc {

namespace {

bool is_absolute_http_url(std::string_view url) {
    for (const std::string_view scheme : {"http://", "https://"}) {
        if (url.size() > scheme.size() && utils::to_lower(url.substr(0, scheme.size())) == scheme) {
            return true;
        }
    }
    return false;
}

} // anonymous namespace

// ============================================================================
// DocsRegistration
// ============================================================================

DocsRegistration::DocsRegistration(DocsConfig config, SecurityScheme scheme,
                                   std::shared_ptr<const FilterRegistry> filters)
    : config_(std::move(config)), scheme_(std::move(scheme)), filters_(std::move(filters)) {}

std::string DocsRegistration::document_route() const {
    return std::format("/swagger/{}/swagger.json", config_.api_version);
}

// ============================================================================
// DocsRegistrationBuilder
// ============================================================================

std::vector<std::string> DocsRegistrationBuilder::validate(const DocsConfig& config) {
    std::vector<std::string> errors;

    if (!config.token_url) {
        errors.emplace_back("token_url is required");
    } else if (!is_absolute_http_url(*config.token_url)) {
        errors.push_back(std::format(
            "token_url must be an absolute http(s) URL, got '{}'", *config.token_url));
    }

    if (config.api_version.empty()) {
        errors.emplace_back("version must not be empty");
    }
    if (config.security_scheme.empty()) {
        errors.emplace_back("security_scheme must not be empty");
    }
    for (const auto& type : config.excluded_parameter_types) {
        if (type.empty()) {
            errors.emplace_back("excluded_parameter_types must not contain empty names");
            break;
        }
    }
    return errors;
}

SecurityScheme DocsRegistrationBuilder::make_security_scheme(const DocsConfig& config) {
    SecurityScheme scheme;
    scheme.type = SecuritySchemeType::OAUTH2;
    scheme.location = ParameterLocation::HEADER;
    scheme.scheme = "Bearer";
    scheme.name = "Authentication";
    scheme.bearer_format = "Bearer {token}";

    OAuthFlow flow;
    flow.token_url = config.token_url.value_or("");
    flow.refresh_url = flow.token_url;
    flow.scopes.emplace(config.api_name, config.api_title);
    scheme.password_flow = std::move(flow);
    return scheme;
}

std::shared_ptr<const DocsRegistration> DocsRegistrationBuilder::build() const {
    const auto errors = validate(config_);
    if (!errors.empty()) {
        std::string combined = "Invalid documentation config:";
        for (const auto& err : errors) { combined += "\n  - "; combined += err; }
        throw ConfigurationError(combined);
    }

    auto scheme = make_security_scheme(config_);

    auto filters = std::make_shared<FilterRegistry>();
    filters->emplace<OperationIdFilter>();
    filters->emplace<ExcludeParameterTypeFilter>(std::string(kHiddenParameterType));
    for (const auto& type : config_.excluded_parameter_types) {
        filters->emplace<ExcludeParameterTypeFilter>(type);
    }
    filters->emplace<ExcludeParameterNamesFilter>(config_.ignored_parameter_names);
    filters->emplace<ExcludeMarkedParameterFilter>();
    filters->emplace<SecurityRequirementFilter>(config_.security_scheme, config_.api_name);
    filters->emplace<PagingParametersFilter>(config_.paging_parameter_prefix);
    filters->emplace<EnumNamesFilter>();

    utils::log::info(std::format("API docs registered: '{}' {} ({} filters, scheme={})",
        config_.api_title, config_.api_version, filters->size(), config_.security_scheme));

    return std::make_shared<const DocsRegistration>(config_, std::move(scheme), std::move(filters));
}

std::shared_ptr<const DocsRegistration> register_docs(DocsConfig config) {
    return DocsRegistrationBuilder(std::move(config)).build();
}

std::shared_ptr<const DocsRegistration> require_registration(
    std::shared_ptr<const DocsRegistration> registration, std::string_view consumer) {
    if (!registration) {
        throw SequencingError(std::format(
            "Attempting to set up {} without a documentation registration. "
            "Register the documentation first by calling register_docs()", consumer));
    }
    return registration;
}

} // namespace apidoc
