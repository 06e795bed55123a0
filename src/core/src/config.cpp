#include "../include/nego_config.hpp"
#include "../include/nego_logger.hpp"
#include "../include/nego_suite.hpp"
#include "../include/nego_planner.hpp"

#include <fstream>
#include <sstream>
#include <algorithm>
#include <stdexcept>
#include <cctype>

namespace nego {

namespace {

const std::string SUITE_PREFIX = "suite.";
const std::string LEVELS_SUFFIX = ".levels";

void trim(std::string& s) {
    s.erase(0, s.find_first_not_of(" \t\r"));
    s.erase(s.find_last_not_of(" \t\r") + 1);
}

} // namespace

// ==================== Getters ====================

std::string Config::get(const std::string& key, const std::string& default_val) const {
    std::lock_guard<std::mutex> lock(mtx_);
    auto it = values_.find(key);
    return (it != values_.end()) ? it->second : default_val;
}

int Config::getInt(const std::string& key, int default_val) const {
    std::string v = get(key);
    if (v.empty()) return default_val;
    try {
        size_t used = 0;
        int parsed = std::stoi(v, &used);
        return used == v.size() ? parsed : default_val;
    } catch (const std::invalid_argument&) {
        return default_val;
    } catch (const std::out_of_range&) {
        return default_val;
    }
}

bool Config::getBool(const std::string& key, bool default_val) const {
    std::string v = get(key);
    if (v.empty()) return default_val;
    std::transform(v.begin(), v.end(), v.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return (v == "true" || v == "1" || v == "yes" || v == "on");
}

bool Config::has(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mtx_);
    return values_.count(key) != 0;
}

// ==================== Setters ====================

void Config::set(const std::string& key, const std::string& value) {
    std::lock_guard<std::mutex> lock(mtx_);
    values_[key] = value;
}

void Config::setInt(const std::string& key, int value) {
    set(key, std::to_string(value));
}

void Config::setBool(const std::string& key, bool value) {
    set(key, value ? "true" : "false");
}

// ==================== File I/O ====================

bool Config::loadFromFile(const std::string& path) {
    std::lock_guard<std::mutex> lock(mtx_);
    std::ifstream file(path);
    if (!file.is_open()) return false;

    std::string line;
    while (std::getline(file, line)) {
        // Skip comments and empty lines
        if (line.empty() || line[0] == '#' || line[0] == ';') continue;
        auto pos = line.find('=');
        if (pos == std::string::npos) continue;

        std::string key = line.substr(0, pos);
        std::string val = line.substr(pos + 1);
        trim(key);
        trim(val);
        if (key.empty()) continue;

        values_[key] = val;
    }
    return true;
}

bool Config::saveToFile(const std::string& path) const {
    std::lock_guard<std::mutex> lock(mtx_);
    std::ofstream file(path);
    if (!file.is_open()) return false;

    file << "# nego configuration file\n";
    file << "# Auto-generated\n\n";
    for (const auto& [k, v] : values_) {
        file << k << " = " << v << "\n";
    }
    return static_cast<bool>(file);
}

// ==================== Defaults ====================

void Config::loadDefaults() {
    std::lock_guard<std::mutex> lock(mtx_);
    loadDefaultsLocked();
}

void Config::loadDefaultsLocked() {
    values_["log.level"] = "info";
    values_["log.console"] = "true";
    values_["log.file"] = "";
    values_["layout.default_levels"] = "4";
    values_["layout.entry_len"] = "64";
    values_["layout.derive_workers"] = "1";
}

void Config::clear() {
    std::lock_guard<std::mutex> lock(mtx_);
    values_.clear();
}

// ==================== Layout helpers ====================

int Config::levelsFor(const std::string& suite) const {
    int fallback = getInt("layout.default_levels", 4);
    return getInt(SUITE_PREFIX + suite + LEVELS_SUFFIX, fallback);
}

std::vector<SuiteLevel> Config::configuredSuites(const SuiteRegistry& registry) const {
    std::vector<std::string> names;
    {
        std::lock_guard<std::mutex> lock(mtx_);
        for (const auto& [k, v] : values_) {
            if (k.size() <= SUITE_PREFIX.size() + LEVELS_SUFFIX.size()) continue;
            if (k.compare(0, SUITE_PREFIX.size(), SUITE_PREFIX) != 0) continue;
            if (k.compare(k.size() - LEVELS_SUFFIX.size(), LEVELS_SUFFIX.size(), LEVELS_SUFFIX) != 0) continue;
            names.push_back(k.substr(SUITE_PREFIX.size(),
                                     k.size() - SUITE_PREFIX.size() - LEVELS_SUFFIX.size()));
        }
    }

    std::vector<SuiteLevel> out;
    for (const auto& name : names) {
        SuitePtr suite = registry.find(name);
        if (!suite) {
            NEGO_LOG_WARN("config: unknown ciphersuite " + name + " ignored");
            continue;
        }
        out.push_back(SuiteLevel{suite, levelsFor(name)});
    }
    return out;
}

bool apply_logging_config(const Config& cfg) {
    Logger& log = Logger::instance();
    log.setLevel(Logger::levelFromString(cfg.get("log.level", "info")));
    log.setConsoleOutput(cfg.getBool("log.console", true));
    return log.setFileOutput(cfg.get("log.file"));
}

} // namespace nego
