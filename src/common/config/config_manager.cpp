/**
 * @file config_manager.cpp
 */

#include "common/config/config_manager.h"
#include "shared/exception/InfrastructureException.hpp"
#include <json/json.h>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <stdexcept>

namespace epassport::common {

using shared::exception::InfrastructureException;

namespace {

std::string lowercase(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

// Whole-string numeric parse; std::sto* alone would accept "12abc"
template <typename T, typename Parse>
std::optional<T> parseNumber(const std::string& text, Parse parse) {
    try {
        size_t consumed = 0;
        T value = parse(text, &consumed);
        if (consumed == text.size()) {
            return value;
        }
    } catch (const std::logic_error&) {
        // invalid_argument or out_of_range
    }
    return std::nullopt;
}

std::string jsonScalarToString(const std::string& key, const Json::Value& value, const std::string& path) {
    switch (value.type()) {
        case Json::stringValue:  return value.asString();
        case Json::booleanValue: return value.asBool() ? "true" : "false";
        case Json::intValue:
        case Json::uintValue:    return value.isInt64() ? std::to_string(value.asInt64())
                                                        : std::to_string(value.asUInt64());
        case Json::realValue:    return std::to_string(value.asDouble());
        default:
            throw InfrastructureException("CONFIG_LOAD_ERROR",
                "Unsupported value type for '" + key + "' in " + path);
    }
}

} // anonymous namespace

ConfigManager& ConfigManager::getInstance() {
    static ConfigManager instance;
    return instance;
}

std::optional<std::string> ConfigManager::lookup(const std::string& key) const {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = overrides_.find(key);
        if (it != overrides_.end()) {
            return it->second;
        }
    }
    if (const char* env = std::getenv(key.c_str())) {
        return std::string(env);
    }
    return std::nullopt;
}

std::string ConfigManager::getString(const std::string& key, const std::string& defaultValue) const {
    return lookup(key).value_or(defaultValue);
}

int ConfigManager::getInt(const std::string& key, int defaultValue) const {
    auto text = lookup(key);
    if (!text || text->empty()) {
        return defaultValue;
    }
    auto parsed = parseNumber<int>(*text, [](const std::string& s, size_t* n) { return std::stoi(s, n); });
    if (!parsed) {
        spdlog::warn("Config {}='{}' is not an integer, using {}", key, *text, defaultValue);
        return defaultValue;
    }
    return *parsed;
}

bool ConfigManager::getBool(const std::string& key, bool defaultValue) const {
    auto text = lookup(key);
    if (!text || text->empty()) {
        return defaultValue;
    }
    const std::string v = lowercase(*text);
    if (v == "true" || v == "1" || v == "yes" || v == "on") return true;
    if (v == "false" || v == "0" || v == "no" || v == "off") return false;

    spdlog::warn("Config {}='{}' is not a boolean, using {}", key, *text, defaultValue);
    return defaultValue;
}

double ConfigManager::getDouble(const std::string& key, double defaultValue) const {
    auto text = lookup(key);
    if (!text || text->empty()) {
        return defaultValue;
    }
    auto parsed = parseNumber<double>(*text, [](const std::string& s, size_t* n) { return std::stod(s, n); });
    if (!parsed) {
        spdlog::warn("Config {}='{}' is not a number, using {}", key, *text, defaultValue);
        return defaultValue;
    }
    return *parsed;
}

bool ConfigManager::has(const std::string& key) const {
    return lookup(key).has_value();
}

void ConfigManager::set(const std::string& key, const std::string& value) {
    std::lock_guard<std::mutex> lock(mutex_);
    overrides_[key] = value;
}

void ConfigManager::remove(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    overrides_.erase(key);
}

void ConfigManager::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    overrides_.clear();
}

size_t ConfigManager::loadFromFile(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw InfrastructureException("CONFIG_LOAD_ERROR", "Cannot open config file: " + path);
    }

    Json::CharReaderBuilder builder;
    Json::Value root;
    std::string errors;
    if (!Json::parseFromStream(builder, in, &root, &errors)) {
        throw InfrastructureException("CONFIG_LOAD_ERROR", "Invalid JSON in " + path + ": " + errors);
    }
    if (!root.isObject()) {
        throw InfrastructureException("CONFIG_LOAD_ERROR", path + " does not hold a JSON object");
    }

    std::map<std::string, std::string> staged;
    for (const auto& key : root.getMemberNames()) {
        staged[key] = jsonScalarToString(key, root[key], path);
    }

    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& entry : staged) {
        overrides_[entry.first] = std::move(entry.second);
    }
    spdlog::info("Loaded {} setting(s) from {}", staged.size(), path);
    return staged.size();
}

std::string ConfigManager::getEnv(const std::string& key, const std::string& defaultValue) {
    const char* env = std::getenv(key.c_str());
    return env ? std::string(env) : defaultValue;
}

} // namespace epassport::common
