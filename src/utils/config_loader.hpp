#pragma once

#include <nlohmann/json.hpp>
#include <cmath>
#include <fstream>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>

namespace contrail {
    using json = nlohmann::json;

    // Well-formed JSON whose content is unusable; the message names the offending key.
    class ConfigError : public std::runtime_error {
    public:
        using std::runtime_error::runtime_error;
    };

    inline std::optional<json> loadJsonConfig(const std::string& path) {
        std::ifstream file(path);
        if (!file.is_open()) {
            std::cerr << "[Config] Failed to open config file: " << path << std::endl;
            return std::nullopt;
        }
        try {
            json j;
            file >> j;
            return j;
        } catch (const json::exception& e) {
            std::cerr << "[Config] Failed to parse JSON from " << path << ": " << e.what() << std::endl;
            return std::nullopt;
        }
    }

    inline std::string configKeyPath(const std::string& parent, const std::string& key) {
        return parent.empty() ? key : parent + "." + key;
    }

    // Returns nullptr when the section is absent; throws when it is present but not an object.
    inline const json* findConfigSection(const json& obj, const char* key, const std::string& parent = "") {
        if (!obj.is_object() || !obj.contains(key)) {
            return nullptr;
        }
        const json& section = obj[key];
        if (!section.is_object()) {
            throw ConfigError("Expected an object for '" + configKeyPath(parent, key) + "'");
        }
        return &section;
    }

    inline double readConfigNumber(const json& obj, const char* key, double fallback, const std::string& parent = "") {
        if (!obj.contains(key)) {
            return fallback;
        }
        const json& value = obj[key];
        if (!value.is_number()) {
            throw ConfigError("Expected a number for '" + configKeyPath(parent, key) + "'");
        }
        double result = value.get<double>();
        if (!std::isfinite(result)) {
            throw ConfigError("Non-finite value for '" + configKeyPath(parent, key) + "'");
        }
        return result;
    }

    inline std::string readConfigString(const json& obj, const char* key, const std::string& fallback,
                                        const std::string& parent = "") {
        if (!obj.contains(key)) {
            return fallback;
        }
        if (!obj[key].is_string()) {
            throw ConfigError("Expected a string for '" + configKeyPath(parent, key) + "'");
        }
        return obj[key].get<std::string>();
    }
}
