#pragma once

#include "model/document.hpp"

#include <nlohmann/json.hpp>

#include <string>

namespace apidoc {

/**
 * @brief Serializes a Document as an OpenAPI 3.0 JSON document.
 *
 * Key order follows the model's insertion order. Source metadata, parameter
 * markers and schema source types are never written.
 *
 * Responses are keyed by status code: when an operation carries the same
 * code more than once, only the first entry is written. Each dropped
 * duplicate is logged as a warning.
 */
class DocumentWriter {
public:
    [[nodiscard]] static nlohmann::ordered_json to_json(const Document& document);

    /**
     * @brief Serialize to a JSON string
     * @param indent Spaces per level; -1 for compact output
     */
    [[nodiscard]] static std::string serialize(const Document& document, int indent = 2);

    /// @throws std::invalid_argument if a schema carries more than one item schema
    [[nodiscard]] static nlohmann::ordered_json write_schema(const Schema& schema);
    [[nodiscard]] static nlohmann::ordered_json write_operation(const Operation& operation);
    [[nodiscard]] static nlohmann::ordered_json write_security_scheme(const SecurityScheme& scheme);
};

} // namespace apidoc
