#include <catch2/catch_test_macros.hpp>
#include "docs/docs_registration.hpp"
#include "core/error.hpp"
#include "filters/builtin_filters.hpp"
#include "mocks/mock_document_provider.hpp"

#include <string>
#include <vector>

using namespace apidoc;
using namespace apidoc::testing;

// ============================================================================
// Validation
// ============================================================================

TEST_CASE("DocsRegistration: token URL is required", "[registration]") {
    REQUIRE_THROWS_AS(DocsRegistrationBuilder().build(), ConfigurationError);

    try {
        (void)DocsRegistrationBuilder().with_title("Orders API").build();
        FAIL("expected ConfigurationError");
    } catch (const ConfigurationError& e) {
        REQUIRE(std::string(e.what()).find("token_url is required") != std::string::npos);
    }
}

TEST_CASE("DocsRegistration: token URL must be an absolute http(s) URL", "[registration]") {
    REQUIRE_THROWS_AS(DocsRegistrationBuilder().with_token_url("/connect/token").build(), ConfigurationError);
    REQUIRE_THROWS_AS(DocsRegistrationBuilder().with_token_url("ftp://auth/token").build(), ConfigurationError);
    REQUIRE_THROWS_AS(DocsRegistrationBuilder().with_token_url("https://").build(), ConfigurationError);
    REQUIRE_NOTHROW(DocsRegistrationBuilder().with_token_url("http://localhost:5000/token").build());
    REQUIRE_NOTHROW(DocsRegistrationBuilder().with_token_url("HTTPS://auth.example.com/token").build());
}

TEST_CASE("DocsRegistration: validate reports every problem", "[registration]") {
    DocsConfig config;
    config.api_version = "";
    config.security_scheme = "";
    config.excluded_parameter_types = {"CancellationToken", ""};

    const auto errors = DocsRegistrationBuilder::validate(config);
    REQUIRE(errors.size() == 4);
    REQUIRE(errors[0] == "token_url is required");
}

TEST_CASE("DocsRegistration: defaults", "[registration]") {
    const auto registration = DocsRegistrationBuilder().with_token_url(kTestTokenUrl).build();
    const auto& config = registration->config();
    REQUIRE(config.api_title == "Application Web API");
    REQUIRE(config.api_version == "1.0.0");
    REQUIRE(config.api_name == "api");
    REQUIRE(config.security_scheme == "oauth2");
    REQUIRE(registration->document_name() == "1.0.0");
    REQUIRE(registration->document_route() == "/swagger/1.0.0/swagger.json");
}

// ============================================================================
// Security scheme
// ============================================================================

TEST_CASE("DocsRegistration: OAuth2 password-flow scheme from options", "[registration]") {
    const auto registration = DocsRegistrationBuilder()
        .with_title("Orders API")
        .with_name("orders")
        .with_token_url(kTestTokenUrl)
        .build();

    const auto& scheme = registration->security_scheme();
    REQUIRE(scheme.type == SecuritySchemeType::OAUTH2);
    REQUIRE(scheme.location == ParameterLocation::HEADER);
    REQUIRE(scheme.name == "Authentication");
    REQUIRE(scheme.scheme == "Bearer");
    REQUIRE(scheme.bearer_format == "Bearer {token}");
    REQUIRE(scheme.password_flow.has_value());
    REQUIRE(scheme.password_flow->token_url == kTestTokenUrl);
    REQUIRE(scheme.password_flow->refresh_url == kTestTokenUrl);
    REQUIRE(scheme.password_flow->scopes.size() == 1);
    REQUIRE(scheme.password_flow->scopes.at("orders") == "Orders API");
}

// ============================================================================
// Filters
// ============================================================================

TEST_CASE("DocsRegistration: registers the built-in filters in order", "[registration]") {
    const auto registration = DocsRegistrationBuilder()
        .with_token_url(kTestTokenUrl)
        .with_excluded_parameter_type("CancellationToken")
        .build();

    std::vector<std::string> names;
    for (const auto& entry : registration->filters().entries()) names.push_back(entry.name);

    const std::vector<std::string> expected = {
        "operation_id",
        "exclude_parameter_type",
        "exclude_parameter_type",
        "exclude_parameter_names",
        "exclude_marked_parameters",
        "security_requirement",
        "paging_parameters",
        "enum_names",
    };
    REQUIRE(names == expected);
    REQUIRE(registration->filters().document_filters().size() == 1);
    REQUIRE(registration->filters().schema_filters().size() == 1);
}

TEST_CASE("DocsRegistration: hidden type filter is bound to HiddenParameter", "[registration]") {
    const auto registration = register_docs([] {
        DocsConfig config;
        config.token_url = kTestTokenUrl;
        return config;
    }());

    const auto& first_exclusion = registration->filters().operation_filters()[1];
    const auto* by_type = dynamic_cast<const ExcludeParameterTypeFilter*>(first_exclusion.get());
    REQUIRE(by_type != nullptr);
    REQUIRE(by_type->type_name() == kHiddenParameterType);
}

TEST_CASE("DocsRegistration: paging filter takes the configured name prefix", "[registration]") {
    const auto find_paging = [](const DocsRegistration& registration) -> const PagingParametersFilter* {
        for (const auto& filter : registration.filters().operation_filters()) {
            if (const auto* paging = dynamic_cast<const PagingParametersFilter*>(filter.get())) return paging;
        }
        return nullptr;
    };

    const auto plain = DocsRegistrationBuilder().with_token_url(kTestTokenUrl).build();
    const auto* plain_paging = find_paging(*plain);
    REQUIRE(plain_paging != nullptr);
    REQUIRE(plain_paging->prefix().empty());

    const auto odata = DocsRegistrationBuilder()
        .with_token_url(kTestTokenUrl)
        .with_paging_parameter_prefix("$")
        .build();
    const auto* odata_paging = find_paging(*odata);
    REQUIRE(odata_paging != nullptr);
    REQUIRE(odata_paging->prefix() == "$");
}

TEST_CASE("DocsRegistration: separate registrations do not share filters", "[registration]") {
    const auto first = DocsRegistrationBuilder().with_token_url(kTestTokenUrl).build();
    const auto second = DocsRegistrationBuilder().with_token_url(kTestTokenUrl).with_version("2.0").build();

    REQUIRE(first->filter_registry() != second->filter_registry());
    REQUIRE(first->document_name() == "1.0.0");
    REQUIRE(second->document_name() == "2.0");
}

// ============================================================================
// Sequencing
// ============================================================================

TEST_CASE("DocsRegistration: require_registration rejects a missing registration", "[registration]") {
    try {
        (void)require_registration(nullptr, "documentation serving");
        FAIL("expected SequencingError");
    } catch (const SequencingError& e) {
        const std::string message = e.what();
        REQUIRE(message.find("documentation serving") != std::string::npos);
        REQUIRE(message.find("register_docs()") != std::string::npos);
    }

    const auto registration = DocsRegistrationBuilder().with_token_url(kTestTokenUrl).build();
    REQUIRE(require_registration(registration, "x") == registration);
}
