#pragma once

#include <string>
#include <cstdint>
#include <map>
#include <vector>
#include <mutex>

namespace nego {

class SuiteRegistry;
struct SuiteLevel;

/**
 * @brief Runtime configuration for nego
 *
 * key = value pairs from a file, with built-in defaults:
 *   log.level, log.console, log.file
 *   layout.default_levels, layout.entry_len, layout.derive_workers
 *   suite.<name>.levels   per-suite standardized level bound
 * Thread-safe singleton pattern.
 */
class Config {
public:
    static Config& instance() {
        static Config cfg;
        return cfg;
    }

    // Prevent copying
    Config(const Config&) = delete;
    Config& operator=(const Config&) = delete;

    // ==================== Getters ====================
    std::string get(const std::string& key, const std::string& default_val = "") const;
    int getInt(const std::string& key, int default_val = 0) const;
    bool getBool(const std::string& key, bool default_val = false) const;
    bool has(const std::string& key) const;

    // ==================== Setters ====================
    void set(const std::string& key, const std::string& value);
    void setInt(const std::string& key, int value);
    void setBool(const std::string& key, bool value);

    // ==================== File I/O ====================
    bool loadFromFile(const std::string& path);
    bool saveToFile(const std::string& path) const;

    // ==================== Defaults ====================
    void loadDefaults();
    void clear();

    // ==================== Layout helpers ====================

    // suite.<name>.levels, else layout.default_levels
    int levelsFor(const std::string& suite) const;

    // Every suite with a suite.<name>.levels key that the registry knows
    std::vector<SuiteLevel> configuredSuites(const SuiteRegistry& registry) const;

private:
    Config() { loadDefaults(); }

    void loadDefaultsLocked();

    mutable std::mutex mtx_;
    std::map<std::string, std::string> values_;
};

/**
 * @brief Configure nego::Logger from log.* keys
 * @return false if log.file was set but could not be opened
 */
bool apply_logging_config(const Config& cfg);

} // namespace nego
