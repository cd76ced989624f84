#pragma once

#include <stdexcept>
#include <string>

namespace apidoc {

/**
 * @brief Required option missing or invalid.
 *
 * Raised by registration before any filter is registered.
 */
class ConfigurationError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief Generation or documentation serving invoked without a registration.
 */
class SequencingError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief A registered filter threw while the document was being processed.
 *
 * Carries the failing filter's name and the node it was applied to.
 */
class FilterExecutionError : public std::runtime_error {
public:
    FilterExecutionError(std::string filter_name, std::string location, const std::string& reason)
        : std::runtime_error("Filter '" + filter_name + "' failed at " + location + ": " + reason),
          filter_name_(std::move(filter_name)),
          location_(std::move(location)) {}

    [[nodiscard]] const std::string& filter_name() const noexcept { return filter_name_; }
    [[nodiscard]] const std::string& location() const noexcept { return location_; }

private:
    std::string filter_name_;
    std::string location_;
};

/**
 * @brief Requested document name is not the configured one.
 */
class DocumentNotFoundError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief Serialized document could not be read back by the client bridge.
 */
class ClientDocumentError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

} // namespace apidoc
