/**
 * @file config_manager.h
 * @brief Process-wide key/value settings
 *
 * A key resolves to the value set in process (set() or loadFromFile()),
 * else the environment variable with the same name, else the caller's
 * default. Typed getters log and fall back to the default when the
 * stored text does not parse.
 */

#pragma once

#include <cstddef>
#include <map>
#include <mutex>
#include <optional>
#include <string>

namespace epassport::common {

class ConfigManager {
private:
    std::map<std::string, std::string> overrides_;
    mutable std::mutex mutex_;

    ConfigManager() = default;

    std::optional<std::string> lookup(const std::string& key) const;

public:
    static ConfigManager& getInstance();

    ConfigManager(const ConfigManager&) = delete;
    ConfigManager& operator=(const ConfigManager&) = delete;

    std::string getString(const std::string& key, const std::string& defaultValue = "") const;
    int getInt(const std::string& key, int defaultValue = 0) const;

    /// true/false, 1/0, yes/no, on/off, any case
    bool getBool(const std::string& key, bool defaultValue = false) const;

    double getDouble(const std::string& key, double defaultValue = 0.0) const;

    bool has(const std::string& key) const;

    void set(const std::string& key, const std::string& value);

    /// The environment becomes visible again for this key.
    void remove(const std::string& key);
    void clear();

    /**
     * @brief Merge a flat JSON object (strings, numbers, booleans) into the
     *        in-process values. Nothing is merged if any entry is rejected.
     * @return number of keys loaded
     * @throws InfrastructureException CONFIG_LOAD_ERROR
     */
    size_t loadFromFile(const std::string& path);

    static std::string getEnv(const std::string& key, const std::string& defaultValue = "");
};

} // namespace epassport::common
