#pragma once

#include <string>
#include <vector>
#include <memory>
#include <functional>
#include <cstdint>

namespace bazaar {
namespace utils {

struct MarketConfig {
    double usageBenchmark = 1.0;
    std::string defaultStrategy = "usage-factor-adjusted";
    std::string invalidOfferPolicy = "exclude";
    bool persistUsageFactors = true;
    std::string databasePath;
};

struct LogConfig {
    std::string level = "info";
    std::string file;
    bool console = true;
    uint64_t maxFileSize = 10 * 1024 * 1024;
    uint32_t maxFiles = 5;
};

class Config {
public:
    static Config& instance();

    bool load(const std::string& path);
    bool save(const std::string& path);
    bool loadDefaults();
    void reset();

    std::string getString(const std::string& key, const std::string& def = "") const;
    int getInt(const std::string& key, int def = 0) const;
    int64_t getInt64(const std::string& key, int64_t def = 0) const;
    double getDouble(const std::string& key, double def = 0.0) const;
    bool getBool(const std::string& key, bool def = false) const;

    void set(const std::string& key, const std::string& value);
    void set(const std::string& key, const char* value);
    void set(const std::string& key, int value);
    void set(const std::string& key, int64_t value);
    void set(const std::string& key, double value);
    void set(const std::string& key, bool value);

    std::vector<std::string> keys(const std::string& prefix = "") const;

    MarketConfig getMarketConfig() const;
    LogConfig getLogConfig() const;
    void setMarketConfig(const MarketConfig& config);

    void onChange(std::function<void(const std::string&)> callback);

    std::string getDataDir() const;
    std::string getConfigPath() const;
    void setDataDir(const std::string& path);

private:
    Config();
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

}
}
