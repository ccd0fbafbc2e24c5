#include "core/access_control.hpp"
#include "core/errors.hpp"
#include "router/event_log.hpp"

#include <mutex>

namespace perpx {

AccessControl::AccessControl(Principal owner, EventLog& events)
    : owner_(std::move(owner)), events_(events) {
    if (owner_.empty()) {
        throw RouterError(ErrorCode::InvalidOwner, "owner must not be empty");
    }
}

Principal AccessControl::owner() const {
    std::shared_lock lock(mutex_);
    return owner_;
}

bool AccessControl::is_owner(const Principal& caller) const {
    std::shared_lock lock(mutex_);
    return caller == owner_;
}

void AccessControl::require_owner(const Principal& caller) const {
    if (!is_owner(caller)) {
        throw RouterError(ErrorCode::Unauthorized, "caller '" + caller + "' is not the owner");
    }
}

void AccessControl::transfer_ownership(const Principal& caller, const Principal& new_owner) {
    Principal previous;
    {
        std::unique_lock lock(mutex_);
        if (caller != owner_) {
            throw RouterError(ErrorCode::Unauthorized, "caller '" + caller + "' is not the owner");
        }
        if (new_owner.empty()) {
            throw RouterError(ErrorCode::InvalidOwner, "new owner must not be empty");
        }
        previous = owner_;
        owner_ = new_owner;
    }
    events_.emit(OwnershipTransferred{.previous_owner = previous, .new_owner = new_owner});
}

} // namespace perpx
