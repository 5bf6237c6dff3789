// include/signal_ngin/core/config_base.hpp
#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include "signal_ngin/core/error.hpp"

namespace signal_ngin {

/**
 * @brief Base class for all configuration types
 *
 * Configurations are layered: built-in defaults first, then any partial JSON
 * document overlaid with apply_overrides. Keys absent from an overlay keep
 * their current value at every nesting depth.
 */
class ConfigBase {
public:
    virtual ~ConfigBase() = default;

    /**
     * @brief Write the full configuration as indented JSON
     * @return FILE_IO_ERROR when the file cannot be written
     */
    virtual Result<void> save_to_file(const std::string& filepath) const;

    /**
     * @brief Overlay a JSON file onto the current values
     * @return FILE_NOT_FOUND, JSON_PARSE_ERROR or INVALID_ARGUMENT
     */
    virtual Result<void> load_from_file(const std::string& filepath);

    /**
     * @brief Deep-merge overrides onto to_json() and reload the result
     * @return INVALID_ARGUMENT when the merged document is rejected; the
     *         current values are left untouched in that case
     */
    Result<void> apply_overrides(const nlohmann::json& overrides);

    virtual nlohmann::json to_json() const = 0;

    /**
     * @brief Load configuration from JSON, keeping defaults for absent keys
     */
    virtual void from_json(const nlohmann::json& j) = 0;

    /**
     * @brief Recursively merge JSON objects
     *
     * Nested objects merge key by key; any other source value replaces the target.
     */
    static void merge_json(nlohmann::json& target, const nlohmann::json& source);
};

}  // namespace signal_ngin
