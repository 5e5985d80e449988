// include/riskgate/core/config_base.hpp
#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include "riskgate/core/error.hpp"

namespace riskgate {

/**
 * @brief Base class for all configuration types
 *
 * Concrete configs only override the keys present in a document, so a
 * partial JSON file layers on top of the compiled-in defaults.
 */
class ConfigBase {
public:
    virtual ~ConfigBase() = default;

    /**
     * @brief Save configuration to JSON file
     * @param filepath Path to save the file
     * @return Result indicating success or failure
     */
    virtual Result<void> save_to_file(const std::string& filepath) const;

    /**
     * @brief Load configuration from JSON file
     * @param filepath Path to the file
     * @return Result indicating success or failure
     */
    virtual Result<void> load_from_file(const std::string& filepath);

    virtual nlohmann::json to_json() const = 0;

    /**
     * @brief Load configuration from JSON
     * @throws RiskGateError or nlohmann::json::exception on malformed input
     */
    virtual void from_json(const nlohmann::json& j) = 0;
};

}  // namespace riskgate
