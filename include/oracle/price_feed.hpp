#pragma once

#include "core/fixed_point.hpp"
#include "core/types.hpp"

#include <mutex>
#include <stdexcept>
#include <string>

namespace perpx {

struct PriceObservation {
    Amount    price       = 0;
    Timestamp observed_at = 0;
};

// Reference price source for one market. May throw on failure.
class IPriceFeed {
public:
    virtual ~IPriceFeed() = default;
    virtual PriceObservation latest_price() const = 0;
    virtual std::string description() const = 0;
};

// Settable feed for simulation and tests.
class StaticPriceFeed : public IPriceFeed {
public:
    explicit StaticPriceFeed(std::string description, PriceObservation initial = {})
        : description_(std::move(description)), observation_(initial) {}

    PriceObservation latest_price() const override {
        std::lock_guard lock(mutex_);
        if (failing_) {
            throw std::runtime_error(description_ + ": feed unavailable");
        }
        return observation_;
    }

    std::string description() const override { return description_; }

    void set(Amount price, Timestamp observed_at) {
        std::lock_guard lock(mutex_);
        observation_ = PriceObservation{.price = price, .observed_at = observed_at};
    }

    void set_failing(bool failing) {
        std::lock_guard lock(mutex_);
        failing_ = failing;
    }

private:
    std::string description_;
    mutable std::mutex mutex_;
    PriceObservation observation_;
    bool failing_ = false;
};

} // namespace perpx
