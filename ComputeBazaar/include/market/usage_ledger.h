#pragma once

#include "market/offer.h"
#include "infrastructure/error_handling.h"
#include <map>
#include <memory>
#include <string>
#include <cstddef>

namespace bazaar {
namespace market {

// Per-provider usage factors learned from completed subtasks. The latest
// valid observation replaces the previous factor. Factors are always finite
// and strictly positive; providers never observed report NEUTRAL_USAGE_FACTOR.
class UsageLedger {
public:
    UsageLedger();
    ~UsageLedger();
    UsageLedger(const UsageLedger&) = delete;
    UsageLedger& operator=(const UsageLedger&) = delete;

    double getFactor(const std::string& providerId) const;
    bool hasFactor(const std::string& providerId) const;

    // factor' = observedUsage / referenceUsage. Degenerate input leaves the
    // stored factor untouched and returns INVALID_USAGE.
    Result<double> recordUsage(const std::string& providerId, double observedUsage,
                               double referenceUsage);

    // Same as recordUsage, applied at most once per (taskId, subtaskId).
    Result<double> recordSubtaskUsage(const std::string& taskId, const std::string& subtaskId,
                                      const std::string& providerId, double observedUsage,
                                      double referenceUsage);

    bool isReported(const std::string& taskId, const std::string& subtaskId) const;
    // Drops the report history of a finished task; its factors stay.
    // Returns the number of subtask entries removed.
    size_t forgetTask(const std::string& taskId);

    void reset();
    size_t size() const;

    std::map<std::string, double> snapshot() const;
    // Seeds factors restored from storage; returns the number accepted.
    size_t load(const std::map<std::string, double>& factors);
    // Factors changed since the previous call, for write-behind persistence.
    std::map<std::string, double> takeDirty();
    // Puts back entries whose write failed, unless a newer value is pending.
    void requeueDirty(const std::map<std::string, double>& entries);

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

}
}
