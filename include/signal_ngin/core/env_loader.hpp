// include/signal_ngin/core/env_loader.hpp
#pragma once

#include <optional>
#include <string>
#include "signal_ngin/core/error.hpp"

namespace signal_ngin {

/**
 * @brief Reads KEY=VALUE pairs from a .env file into the process environment
 */
class EnvLoader {
public:
    /**
     * @brief Load a .env file
     * @param filepath Path to the file
     * @param overwrite Replace variables that are already set
     * @return FILE_NOT_FOUND if the file cannot be opened
     */
    static Result<void> load(const std::string& filepath, bool overwrite = false);

    static std::optional<std::string> get(const std::string& key);

    /**
     * @brief Parse a boolean variable ("true", "1", "yes" are true)
     */
    static std::optional<bool> get_bool(const std::string& key);

    /**
     * @brief Parse a non-negative integer variable
     * @return INVALID_ARGUMENT when the value is set but not a valid integer
     */
    static Result<std::optional<long long>> get_int(const std::string& key);
};

}  // namespace signal_ngin
