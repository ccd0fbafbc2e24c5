#pragma once

#include "core/types.hpp"

#include <atomic>

namespace perpx {

class IClock {
public:
    virtual ~IClock() = default;
    virtual Timestamp now() const = 0;
};

class SystemClock : public IClock {
public:
    Timestamp now() const override;
};

// Settable clock for simulation and tests.
class ManualClock : public IClock {
public:
    explicit ManualClock(Timestamp start = 0) : now_(start) {}

    Timestamp now() const override { return now_.load(); }
    void set(Timestamp ts) { now_.store(ts); }
    void advance(Timestamp seconds) { now_.fetch_add(seconds); }

private:
    std::atomic<Timestamp> now_;
};

} // namespace perpx
