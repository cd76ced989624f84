#pragma once

#include "config/config_types.hpp"

#include <toml++/toml.hpp>

#include <string>
#include <vector>

namespace apidoc {

// ============================================================================
// ConfigLoader - Extract typed config from a TOML file
// ============================================================================

/**
 * @brief Loads AppConfig from TOML.
 *
 * Layout:
 *   [docs]
 *   title, version, name, security_scheme, token_url,
 *   ignored_parameter_names = [...], excluded_parameter_types = [...]
 *
 *   [logging]
 *   level = "debug" | "info" | "warn" | "error"
 *
 * String values may reference environment variables as ${VAR_NAME}.
 */
class ConfigLoader {
public:
    struct LoadResult {
        bool success;
        std::string error_message;
        AppConfig config;

        static LoadResult ok(AppConfig cfg) {
            LoadResult result;
            result.success = true;
            result.config = std::move(cfg);
            return result;
        }

        static LoadResult error(std::string message) {
            LoadResult result;
            result.success = false;
            result.error_message = std::move(message);
            return result;
        }
    };

    /**
     * @brief Load complete config from TOML file
     * @param config_path Path to the .toml file
     * @return LoadResult with parsed config or error
     */
    [[nodiscard]] static LoadResult load_from_file(const std::string& config_path);

    /**
     * @brief Load complete config from TOML string
     * @param toml_content TOML content
     * @return LoadResult with parsed config or error
     */
    [[nodiscard]] static LoadResult load_from_string(const std::string& toml_content);

    /**
     * @brief Check a parsed config
     * @return One message per problem; empty when valid
     */
    [[nodiscard]] static std::vector<std::string> validate_config(const AppConfig& config);

    /**
     * @brief Set the process-wide log level from [logging]
     * @return false (level unchanged) if the level name is unknown
     */
    static bool apply_logging(const LoggingConfig& config);

private:
    static DocsConfig extract_docs(const toml::table& root);
    static LoggingConfig extract_logging(const toml::table& root);
    static AppConfig extract_all_sections(const toml::table& root);
    static LoadResult validate_and_return(AppConfig config);
};

} // namespace apidoc
