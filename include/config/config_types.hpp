#pragma once

#include <optional>
#include <string>
#include <vector>

namespace apidoc {

// ============================================================================
// Documentation Options
// ============================================================================

struct DocsConfig {
    std::string api_title = "Application Web API";
    std::string api_version = "1.0.0";         // also the document name
    std::string api_name = "api";              // OAuth2 scope
    std::string security_scheme = "oauth2";    // security scheme id
    std::optional<std::string> token_url;      // required

    // Prepended to the injected paging parameter names; "$" gives the OData
    // system query options ($top, $skip, ...). Empty matches hosts that bind
    // the bare names.
    std::string paging_parameter_prefix;

    std::vector<std::string> ignored_parameter_names;
    std::vector<std::string> excluded_parameter_types;
};

// ============================================================================
// Logging Config
// ============================================================================

struct LoggingConfig {
    std::string level = "info";
};

// ============================================================================
// AppConfig - Complete parsed configuration file
// ============================================================================

struct AppConfig {
    DocsConfig docs;
    LoggingConfig logging;
};

} // namespace apidoc
