#pragma once

#include "core/types.hpp"

#include <shared_mutex>

namespace perpx {

class EventLog;

// Single-owner authorization for administrative operations.
class AccessControl {
public:
    // Throws RouterError(InvalidOwner) if owner is empty.
    AccessControl(Principal owner, EventLog& events);

    Principal owner() const;
    bool is_owner(const Principal& caller) const;

    // Throws RouterError(Unauthorized) unless caller is the owner.
    void require_owner(const Principal& caller) const;

    // Owner only. new_owner must be non-empty.
    void transfer_ownership(const Principal& caller, const Principal& new_owner);

private:
    mutable std::shared_mutex mutex_;
    Principal owner_;
    EventLog& events_;
};

} // namespace perpx
