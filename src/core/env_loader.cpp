// src/core/env_loader.cpp

#include "signal_ngin/core/env_loader.hpp"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>

namespace signal_ngin {

namespace {

std::string trim(const std::string& text) {
    const char* whitespace = " \t\r\n";
    size_t begin = text.find_first_not_of(whitespace);
    if (begin == std::string::npos) {
        return "";
    }
    size_t end = text.find_last_not_of(whitespace);
    return text.substr(begin, end - begin + 1);
}

std::string strip_quotes(const std::string& value) {
    if (value.size() >= 2 && (value.front() == '"' || value.front() == '\'') &&
        value.back() == value.front()) {
        return value.substr(1, value.size() - 2);
    }
    return value;
}

}  // namespace

Result<void> EnvLoader::load(const std::string& filepath, bool overwrite) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        return make_error<void>(ErrorCode::FILE_NOT_FOUND,
                                "Failed to open .env file: " + filepath, "EnvLoader");
    }

    std::string line;
    while (std::getline(file, line)) {
        line = trim(line);
        if (line.empty() || line[0] == '#') {
            continue;
        }

        size_t delimiter_pos = line.find('=');
        if (delimiter_pos == std::string::npos) {
            continue;
        }

        std::string key = trim(line.substr(0, delimiter_pos));
        std::string value = strip_quotes(trim(line.substr(delimiter_pos + 1)));
        if (key.empty()) {
            continue;
        }

        setenv(key.c_str(), value.c_str(), overwrite ? 1 : 0);
    }
    return Result<void>();
}

std::optional<std::string> EnvLoader::get(const std::string& key) {
    const char* value = std::getenv(key.c_str());
    if (value == nullptr || *value == '\0') {
        return std::nullopt;
    }
    return std::string(value);
}

std::optional<bool> EnvLoader::get_bool(const std::string& key) {
    auto value = get(key);
    if (!value) {
        return std::nullopt;
    }
    std::string lowered = *value;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lowered == "true" || lowered == "1" || lowered == "yes";
}

Result<std::optional<long long>> EnvLoader::get_int(const std::string& key) {
    auto value = get(key);
    if (!value) {
        return std::optional<long long>();
    }
    try {
        size_t consumed = 0;
        long long parsed = std::stoll(*value, &consumed);
        if (consumed != value->size() || parsed < 0) {
            throw std::invalid_argument(*value);
        }
        return std::optional<long long>(parsed);
    } catch (const std::exception&) {
        return make_error<std::optional<long long>>(
            ErrorCode::INVALID_ARGUMENT, "Environment variable " + key +
                                             " is not a non-negative integer: " + *value,
            "EnvLoader");
    }
}

}  // namespace signal_ngin
