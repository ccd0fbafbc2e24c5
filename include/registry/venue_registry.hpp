#pragma once

#include "config/venue_config.hpp"
#include "core/access_control.hpp"
#include "execution/venue_gateway.hpp"

#include <memory>
#include <shared_mutex>
#include <unordered_map>
#include <vector>

namespace perpx {

class EventLog;

// An active venue as seen by one router call.
struct ActiveVenue {
    VenueId                        id;
    VenueInfo                      info;
    std::shared_ptr<IVenueGateway> gateway;
};

// Keyed store of venue metadata and gateways. Venues are never deleted;
// deactivation is the removal semantic. Mutations are owner-only.
class VenueRegistry {
public:
    VenueRegistry(Principal owner, EventLog& events);

    void register_venue(const Principal& caller,
                        const VenueId& id,
                        std::shared_ptr<IVenueGateway> gateway,
                        std::string name,
                        uint32_t max_leverage,
                        uint32_t fee_rate_bps);

    void deactivate(const Principal& caller, const VenueId& id);

    // Sets the flag directly. Fails only for handles never registered.
    void set_status(const Principal& caller, const VenueId& id, bool active);

    // Active handles in registration order.
    std::vector<VenueId> list_active() const;

    // Zero-valued record for unknown handles.
    VenueInfo get_info(const VenueId& id) const;

    bool is_registered(const VenueId& id) const;

    // Active venues with metadata and gateways, captured under one lock.
    std::vector<ActiveVenue> active_snapshot() const;

    AccessControl& access() { return access_; }

private:
    struct Entry {
        VenueInfo                      info;
        std::shared_ptr<IVenueGateway> gateway;
    };

    AccessControl access_;
    EventLog&     events_;

    mutable std::shared_mutex mutex_;
    std::unordered_map<VenueId, Entry> venues_;
    std::vector<VenueId> order_;   // registration order, one entry per handle
};

} // namespace perpx
