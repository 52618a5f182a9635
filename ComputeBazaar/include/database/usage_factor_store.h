#pragma once

#include "infrastructure/error_handling.h"
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <cstddef>

namespace bazaar {
namespace database {

// sqlite-backed usage factors, one row per computing node:
//   computing_node(node_id, name)
//   usage_factor(provider_node -> computing_node.node_id, usage_factor)
class UsageFactorStore {
public:
    UsageFactorStore();
    ~UsageFactorStore();
    UsageFactorStore(const UsageFactorStore&) = delete;
    UsageFactorStore& operator=(const UsageFactorStore&) = delete;

    Result<void> open(const std::string& path);
    void close();
    bool isOpen() const;
    std::string getPath() const;

    Result<void> upsertNode(const std::string& nodeId, const std::string& name);
    Result<void> save(const std::string& providerId, double factor);
    Result<void> saveAll(const std::map<std::string, double>& factors);

    Result<std::optional<double>> load(const std::string& providerId) const;
    Result<std::map<std::string, double>> loadAll() const;

    Result<void> remove(const std::string& providerId);
    size_t count() const;
    Result<void> clear();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

}
}
