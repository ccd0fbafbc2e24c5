#pragma once

#include "router/events.hpp"

#include <cstdint>
#include <functional>
#include <mutex>
#include <vector>

namespace perpx {

struct EventRecord {
    uint64_t sequence = 0;
    Event    event;
};

using EventCallback = std::function<void(const EventRecord&)>;

// Append-only, thread-safe record of emitted events. Subscribers are
// invoked synchronously after the record is appended.
class EventLog {
public:
    void emit(Event event);
    void subscribe(EventCallback callback);

    std::vector<EventRecord> records() const;
    size_t size() const;

    // Number of records holding alternative T.
    template <typename T>
    size_t count() const {
        std::lock_guard<std::mutex> lock(mutex_);
        size_t n = 0;
        for (const auto& r : records_) {
            if (std::holds_alternative<T>(r.event)) ++n;
        }
        return n;
    }

private:
    mutable std::mutex mutex_;
    std::vector<EventRecord> records_;
    std::vector<EventCallback> subscribers_;
};

} // namespace perpx
