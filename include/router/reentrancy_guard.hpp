#pragma once

#include "core/types.hpp"

#include <mutex>
#include <unordered_set>

namespace perpx {

// Set of callers with a state-changing call in flight.
class SessionLocks {
public:
    bool try_acquire(const Principal& session);
    void release(const Principal& session);
    bool held(const Principal& session) const;

private:
    mutable std::mutex mutex_;
    std::unordered_set<Principal> active_;
};

// Holds a caller's session for the lifetime of the guard.
// Throws RouterError(ReentrantCall) if the session is already held.
class ReentrancyGuard {
public:
    ReentrancyGuard(SessionLocks& locks, Principal session);
    ~ReentrancyGuard();

    ReentrancyGuard(const ReentrancyGuard&) = delete;
    ReentrancyGuard& operator=(const ReentrancyGuard&) = delete;

private:
    SessionLocks& locks_;
    Principal     session_;
};

} // namespace perpx
