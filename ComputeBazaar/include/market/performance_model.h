#pragma once

#include "market/offer.h"
#include "infrastructure/error_handling.h"
#include <string>

namespace bazaar {
namespace market {

enum class InvalidOfferPolicy {
    EXCLUDE,
    PLACE_LAST
};

const char* invalidOfferPolicyToString(InvalidOfferPolicy policy);
bool parseInvalidOfferPolicy(const std::string& name, InvalidOfferPolicy& out);

class PerformanceModel {
public:
    // Boundary check for offers: non-empty provider, finite price >= 0,
    // finite declared performance > 0.
    static Result<void> validate(const Offer& offer);

    // price / (declaredPerformance / usageFactor) * requestorBenchmark.
    // Lower is better.
    static Result<double> effectivePrice(const Offer& offer, double usageFactor,
                                         double requestorBenchmark);
};

}
}
