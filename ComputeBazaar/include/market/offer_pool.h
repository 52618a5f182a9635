#pragma once

#include "market/offer.h"
#include <memory>
#include <string>
#include <vector>
#include <cstddef>

namespace bazaar {
namespace market {

// Offers received for each task, in arrival order. A task with no offers is
// never present; drain() and clear() remove the task entirely.
class OfferPool {
public:
    OfferPool();
    ~OfferPool();
    OfferPool(const OfferPool&) = delete;
    OfferPool& operator=(const OfferPool&) = delete;

    void add(const std::string& taskId, Offer offer);
    size_t count(const std::string& taskId) const;
    void clear(const std::string& taskId);
    void reset();

    // Takes every pooled offer of the task and removes the task in one step.
    // Offers added afterwards are pooled for the next resolve.
    std::vector<Offer> drain(const std::string& taskId);

    std::vector<std::string> tasks() const;
    size_t totalOffers() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

}
}
