#pragma once

#include "infrastructure/error_handling.h"
#include <array>
#include <string>
#include <vector>
#include <cstddef>

namespace bazaar {
namespace market {

// Neutral trust: declared performance is taken at face value.
constexpr double NEUTRAL_USAGE_FACTOR = 1.0;
constexpr double DEFAULT_USAGE_BENCHMARK = 1.0;

// A provider's bid for one task. Built by the offer-reception layer after the
// wire message has been validated.
struct Offer {
    std::string providerId;
    double price = 0.0;
    // Benchmark units per unit of the requestor's reference usage benchmark.
    double declaredPerformance = 0.0;
    // Provider efficacy (s, t, f, r) from the local ranking subsystem.
    std::array<double, 4> quality{};
    double reputation = 0.0;
};

struct ScoredOffer {
    Offer offer;
    double usageFactor = NEUTRAL_USAGE_FACTOR;
    double effectivePrice = 0.0;
    bool valid = false;
};

struct UsageObservation {
    std::string providerId;
    std::string subtaskId;
    double observedUsage = 0.0;
};

struct UsageReportResult {
    size_t applied = 0;
    std::vector<Error> rejected;

    bool ok() const { return rejected.empty(); }
};

}
}
