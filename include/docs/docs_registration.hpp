#pragma once

#include "config/config_types.hpp"
#include "filters/filter_registry.hpp"
#include "model/document.hpp"

#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace apidoc {

/**
 * @brief Immutable result of documentation registration.
 *
 * Holds the resolved options, the security scheme built from them and the
 * filter registry. Passed explicitly to DocumentGenerator and DocsUiHandler.
 */
class DocsRegistration {
public:
    DocsRegistration(DocsConfig config, SecurityScheme scheme,
                     std::shared_ptr<const FilterRegistry> filters);

    [[nodiscard]] const DocsConfig& config() const { return config_; }
    [[nodiscard]] const SecurityScheme& security_scheme() const { return scheme_; }
    [[nodiscard]] const FilterRegistry& filters() const { return *filters_; }
    [[nodiscard]] std::shared_ptr<const FilterRegistry> filter_registry() const { return filters_; }

    // Document name doubles as the configured API version
    [[nodiscard]] const std::string& document_name() const { return config_.api_version; }

    // "/swagger/<version>/swagger.json"
    [[nodiscard]] std::string document_route() const;

private:
    DocsConfig config_;
    SecurityScheme scheme_;
    std::shared_ptr<const FilterRegistry> filters_;
};

/**
 * @brief Builder for DocsRegistration.
 *
 * Usage:
 *   auto registration = DocsRegistrationBuilder()
 *       .with_title("Orders API")
 *       .with_token_url("https://auth.example.com/connect/token")
 *       .with_ignored_parameter_names({"tenantId"})
 *       .build();
 *
 * Registered filters, in order:
 *   operation_id, exclude_parameter_type (HiddenParameter, then each
 *   configured type), exclude_parameter_names, exclude_marked_parameters,
 *   security_requirement, paging_parameters, enum_names
 */
class DocsRegistrationBuilder {
public:
    DocsRegistrationBuilder() = default;
    explicit DocsRegistrationBuilder(DocsConfig config) : config_(std::move(config)) {}

    DocsRegistrationBuilder& with_title(std::string v)           { config_.api_title = std::move(v); return *this; }
    DocsRegistrationBuilder& with_version(std::string v)         { config_.api_version = std::move(v); return *this; }
    DocsRegistrationBuilder& with_name(std::string v)            { config_.api_name = std::move(v); return *this; }
    DocsRegistrationBuilder& with_security_scheme(std::string v) { config_.security_scheme = std::move(v); return *this; }
    DocsRegistrationBuilder& with_token_url(std::string v)       { config_.token_url = std::move(v); return *this; }
    DocsRegistrationBuilder& with_paging_parameter_prefix(std::string v) { config_.paging_parameter_prefix = std::move(v); return *this; }
    DocsRegistrationBuilder& with_ignored_parameter_names(std::vector<std::string> v) { config_.ignored_parameter_names = std::move(v); return *this; }
    DocsRegistrationBuilder& with_excluded_parameter_type(std::string v)              { config_.excluded_parameter_types.push_back(std::move(v)); return *this; }

    /**
     * @brief Validate options, build the security scheme and wire the filters.
     * @throws ConfigurationError if an option is missing or invalid; no
     *         filter is registered in that case.
     */
    [[nodiscard]] std::shared_ptr<const DocsRegistration> build() const;

    /**
     * @brief Problems with `config`, one message per problem (empty when valid)
     */
    [[nodiscard]] static std::vector<std::string> validate(const DocsConfig& config);

    /**
     * @brief OAuth2 password-flow scheme described by `config`.
     *
     * Token and refresh endpoints are both the configured token URL; the
     * single scope is api_name, described by api_title.
     */
    [[nodiscard]] static SecurityScheme make_security_scheme(const DocsConfig& config);

private:
    DocsConfig config_;
};

/**
 * @brief Shorthand for DocsRegistrationBuilder(config).build()
 * @throws ConfigurationError
 */
[[nodiscard]] std::shared_ptr<const DocsRegistration> register_docs(DocsConfig config);

/**
 * @brief Pass `registration` through, or throw SequencingError if it is null
 * @param consumer What was attempted, e.g. "document generation"
 */
[[nodiscard]] std::shared_ptr<const DocsRegistration> require_registration(
    std::shared_ptr<const DocsRegistration> registration, std::string_view consumer);

} // namespace apidoc
