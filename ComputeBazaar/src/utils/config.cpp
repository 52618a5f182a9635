#include "utils/config.h"
#include "utils/logger.h"
#include <unordered_map>
#include <fstream>
#include <sstream>
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <cmath>
#include <mutex>
#include <stdexcept>

namespace bazaar {
namespace utils {

struct Config::Impl {
    std::unordered_map<std::string, std::string> data;
    std::string configPath;
    std::string dataDir;
    std::function<void(const std::string&)> changeCallback;
    mutable std::mutex mtx;

    void store(const std::string& key, const std::string& value);
    bool lookup(const std::string& key, std::string& out) const;
};

void Config::Impl::store(const std::string& key, const std::string& value) {
    std::function<void(const std::string&)> cb;
    {
        std::lock_guard<std::mutex> lock(mtx);
        data[key] = value;
        cb = changeCallback;
    }
    if (cb) cb(key);
}

bool Config::Impl::lookup(const std::string& key, std::string& out) const {
    std::lock_guard<std::mutex> lock(mtx);
    auto it = data.find(key);
    if (it == data.end()) return false;
    out = it->second;
    return true;
}

Config::Config() : impl_(std::make_unique<Impl>()) {
    const char* home = std::getenv("HOME");
    if (home) {
        impl_->dataDir = std::string(home) + "/.computebazaar";
    } else {
        impl_->dataDir = ".computebazaar";
    }
    loadDefaults();
}

Config& Config::instance() {
    static Config inst;
    return inst;
}

bool Config::loadDefaults() {
    set("market.usage_benchmark", 1.0);
    set("market.default_strategy", "usage-factor-adjusted");
    set("market.invalid_offer_policy", "exclude");
    set("market.persist_usage_factors", true);

    set("log.level", "info");
    set("log.console", true);
    set("log.max_file_size", static_cast<int64_t>(10 * 1024 * 1024));
    set("log.max_files", 5);

    return true;
}

void Config::reset() {
    {
        std::lock_guard<std::mutex> lock(impl_->mtx);
        impl_->data.clear();
        impl_->configPath.clear();
    }
    loadDefaults();
}

bool Config::load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) return false;

    std::lock_guard<std::mutex> lock(impl_->mtx);
    impl_->configPath = path;
    std::string line;

    while (std::getline(file, line)) {
        if (line.empty() || line[0] == '#') continue;

        auto pos = line.find('=');
        if (pos != std::string::npos) {
            std::string key = line.substr(0, pos);
            std::string value = line.substr(pos + 1);

            key.erase(0, key.find_first_not_of(" \t"));
            key.erase(key.find_last_not_of(" \t\r") + 1);
            value.erase(0, value.find_first_not_of(" \t"));
            value.erase(value.find_last_not_of(" \t\r") + 1);

            if (!key.empty()) impl_->data[key] = value;
        }
    }
    return true;
}

bool Config::save(const std::string& path) {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    std::string savePath = path.empty() ? impl_->configPath : path;
    if (savePath.empty()) return false;

    std::ofstream file(savePath);
    if (!file.is_open()) return false;

    file << "# ComputeBazaar node configuration\n\n";

    std::vector<std::string> sortedKeys;
    for (const auto& [key, value] : impl_->data) {
        sortedKeys.push_back(key);
    }
    std::sort(sortedKeys.begin(), sortedKeys.end());

    std::string lastPrefix;
    for (const auto& key : sortedKeys) {
        auto pos = key.find('.');
        std::string prefix = pos != std::string::npos ? key.substr(0, pos) : "";
        if (prefix != lastPrefix && !lastPrefix.empty()) {
            file << "\n";
        }
        lastPrefix = prefix;
        file << key << "=" << impl_->data[key] << "\n";
    }
    return static_cast<bool>(file);
}

std::string Config::getString(const std::string& key, const std::string& def) const {
    std::string v;
    return impl_->lookup(key, v) ? v : def;
}

int Config::getInt(const std::string& key, int def) const {
    std::string v;
    if (!impl_->lookup(key, v)) return def;
    try { return std::stoi(v); }
    catch (const std::exception&) { return def; }
}

int64_t Config::getInt64(const std::string& key, int64_t def) const {
    std::string v;
    if (!impl_->lookup(key, v)) return def;
    try { return std::stoll(v); }
    catch (const std::exception&) { return def; }
}

double Config::getDouble(const std::string& key, double def) const {
    std::string v;
    if (!impl_->lookup(key, v)) return def;
    try { return std::stod(v); }
    catch (const std::exception&) { return def; }
}

bool Config::getBool(const std::string& key, bool def) const {
    std::string val;
    if (!impl_->lookup(key, val)) return def;
    std::transform(val.begin(), val.end(), val.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return val == "true" || val == "1" || val == "yes" || val == "on";
}

void Config::set(const std::string& key, const std::string& value) {
    impl_->store(key, value);
}

void Config::set(const std::string& key, const char* value) {
    impl_->store(key, value ? std::string(value) : std::string());
}

void Config::set(const std::string& key, int value) {
    impl_->store(key, std::to_string(value));
}

void Config::set(const std::string& key, int64_t value) {
    impl_->store(key, std::to_string(value));
}

void Config::set(const std::string& key, double value) {
    std::ostringstream oss;
    oss.precision(17);
    oss << value;
    impl_->store(key, oss.str());
}

void Config::set(const std::string& key, bool value) {
    impl_->store(key, value ? "true" : "false");
}

std::vector<std::string> Config::keys(const std::string& prefix) const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    std::vector<std::string> result;
    for (const auto& [key, value] : impl_->data) {
        if (prefix.empty() || key.compare(0, prefix.size(), prefix) == 0) {
            result.push_back(key);
        }
    }
    std::sort(result.begin(), result.end());
    return result;
}

MarketConfig Config::getMarketConfig() const {
    MarketConfig cfg;
    cfg.usageBenchmark = getDouble("market.usage_benchmark", 1.0);
    if (!std::isfinite(cfg.usageBenchmark) || cfg.usageBenchmark <= 0.0) {
        LOG_WARN("market.usage_benchmark must be positive, using 1.0");
        cfg.usageBenchmark = 1.0;
    }
    cfg.defaultStrategy = getString("market.default_strategy", "usage-factor-adjusted");
    cfg.invalidOfferPolicy = getString("market.invalid_offer_policy", "exclude");
    cfg.persistUsageFactors = getBool("market.persist_usage_factors", true);
    cfg.databasePath = getString("database.path", getDataDir() + "/market.db");
    return cfg;
}

LogConfig Config::getLogConfig() const {
    LogConfig cfg;
    cfg.level = getString("log.level", "info");
    cfg.file = getString("log.file", "");
    cfg.console = getBool("log.console", true);
    cfg.maxFileSize = static_cast<uint64_t>(getInt64("log.max_file_size", 10 * 1024 * 1024));
    cfg.maxFiles = static_cast<uint32_t>(getInt("log.max_files", 5));
    return cfg;
}

void Config::setMarketConfig(const MarketConfig& cfg) {
    set("market.usage_benchmark", cfg.usageBenchmark);
    set("market.default_strategy", cfg.defaultStrategy);
    set("market.invalid_offer_policy", cfg.invalidOfferPolicy);
    set("market.persist_usage_factors", cfg.persistUsageFactors);
    if (!cfg.databasePath.empty()) {
        set("database.path", cfg.databasePath);
    }
}

void Config::onChange(std::function<void(const std::string&)> callback) {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    impl_->changeCallback = callback;
}

std::string Config::getDataDir() const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    return impl_->dataDir;
}

std::string Config::getConfigPath() const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    return impl_->configPath;
}

void Config::setDataDir(const std::string& path) {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    impl_->dataDir = path;
}

}
}
