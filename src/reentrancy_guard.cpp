#include "router/reentrancy_guard.hpp"
#include "core/errors.hpp"

namespace perpx {

bool SessionLocks::try_acquire(const Principal& session) {
    std::lock_guard lock(mutex_);
    return active_.insert(session).second;
}

void SessionLocks::release(const Principal& session) {
    std::lock_guard lock(mutex_);
    active_.erase(session);
}

bool SessionLocks::held(const Principal& session) const {
    std::lock_guard lock(mutex_);
    return active_.count(session) > 0;
}

ReentrancyGuard::ReentrancyGuard(SessionLocks& locks, Principal session)
    : locks_(locks), session_(std::move(session)) {
    if (!locks_.try_acquire(session_)) {
        throw RouterError(ErrorCode::ReentrantCall, "call already in flight for " + session_);
    }
}

ReentrancyGuard::~ReentrancyGuard() {
    locks_.release(session_);
}

} // namespace perpx
