// src/core/config_base.cpp
#include "signal_ngin/core/config_base.hpp"
#include <fstream>
#include <iomanip>

namespace signal_ngin {

Result<void> ConfigBase::save_to_file(const std::string& filepath) const {
    std::ofstream file(filepath);
    if (!file.is_open()) {
        return make_error<void>(ErrorCode::FILE_IO_ERROR,
                                "Failed to open file for writing: " + filepath, "ConfigBase");
    }

    try {
        file << std::setw(4) << to_json() << std::endl;
    } catch (const std::exception& e) {
        return make_error<void>(ErrorCode::FILE_IO_ERROR,
                                std::string("Error saving config: ") + e.what(), "ConfigBase");
    }
    return Result<void>();
}

Result<void> ConfigBase::load_from_file(const std::string& filepath) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        return make_error<void>(ErrorCode::FILE_NOT_FOUND,
                                "Failed to open file for reading: " + filepath, "ConfigBase");
    }

    nlohmann::json overrides;
    try {
        file >> overrides;
    } catch (const nlohmann::json::parse_error& e) {
        return make_error<void>(ErrorCode::JSON_PARSE_ERROR,
                                "Failed to parse " + filepath + ": " + e.what(), "ConfigBase");
    }
    return apply_overrides(overrides);
}

Result<void> ConfigBase::apply_overrides(const nlohmann::json& overrides) {
    if (!overrides.is_object()) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                "Configuration overrides must be a JSON object", "ConfigBase");
    }

    nlohmann::json merged = to_json();
    merge_json(merged, overrides);

    // Reload from a pristine snapshot if the merged document is rejected halfway
    const nlohmann::json previous = to_json();
    try {
        from_json(merged);
    } catch (const std::exception& e) {
        from_json(previous);
        return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                std::string("Invalid configuration: ") + e.what(), "ConfigBase");
    }
    return Result<void>();
}

void ConfigBase::merge_json(nlohmann::json& target, const nlohmann::json& source) {
    if (!source.is_object()) {
        target = source;
        return;
    }
    if (!target.is_object()) {
        target = nlohmann::json::object();
    }
    for (auto it = source.begin(); it != source.end(); ++it) {
        if (it.value().is_object() && target.contains(it.key()) && target[it.key()].is_object()) {
            merge_json(target[it.key()], it.value());
        } else {
            target[it.key()] = it.value();
        }
    }
}

}  // namespace signal_ngin
