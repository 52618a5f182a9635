#include "market/performance_model.h"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <sstream>

namespace bazaar {
namespace market {

static std::string formatValue(double v) {
    std::ostringstream oss;
    oss << v;
    return oss.str();
}

const char* invalidOfferPolicyToString(InvalidOfferPolicy policy) {
    switch (policy) {
        case InvalidOfferPolicy::EXCLUDE: return "exclude";
        case InvalidOfferPolicy::PLACE_LAST: return "place-last";
        default: return "unknown";
    }
}

bool parseInvalidOfferPolicy(const std::string& name, InvalidOfferPolicy& out) {
    std::string v = name;
    std::transform(v.begin(), v.end(), v.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    std::replace(v.begin(), v.end(), '_', '-');
    if (v == "exclude") {
        out = InvalidOfferPolicy::EXCLUDE;
        return true;
    }
    if (v == "place-last" || v == "last") {
        out = InvalidOfferPolicy::PLACE_LAST;
        return true;
    }
    return false;
}

Result<void> PerformanceModel::validate(const Offer& offer) {
    if (offer.providerId.empty()) {
        return makeError(ErrorCode::INVALID_OFFER, "offer has no provider id");
    }
    if (!std::isfinite(offer.price) || offer.price < 0.0) {
        return makeError(ErrorCode::INVALID_OFFER,
                         "price must be non-negative, got " + formatValue(offer.price),
                         offer.providerId);
    }
    if (!std::isfinite(offer.declaredPerformance) || offer.declaredPerformance <= 0.0) {
        return makeError(ErrorCode::INVALID_OFFER,
                         "declared performance must be positive, got " + formatValue(offer.declaredPerformance),
                         offer.providerId);
    }
    return Result<void>();
}

Result<double> PerformanceModel::effectivePrice(const Offer& offer, double usageFactor,
                                                double requestorBenchmark) {
    auto valid = validate(offer);
    if (valid.failed()) return valid.error();

    if (!std::isfinite(usageFactor) || usageFactor <= 0.0) {
        return makeError(ErrorCode::INVALID_ARGUMENT,
                         "usage factor must be positive, got " + formatValue(usageFactor),
                         offer.providerId);
    }
    if (!std::isfinite(requestorBenchmark) || requestorBenchmark <= 0.0) {
        return makeError(ErrorCode::INVALID_ARGUMENT,
                         "requestor benchmark must be positive, got " + formatValue(requestorBenchmark),
                         offer.providerId);
    }

    double trustedPerformance = offer.declaredPerformance / usageFactor;
    double price = offer.price / trustedPerformance * requestorBenchmark;
    if (!std::isfinite(price)) {
        return makeError(ErrorCode::INVALID_OFFER, "effective price overflow", offer.providerId);
    }
    return price;
}

}
}
