#include "registry/venue_registry.hpp"
#include "core/errors.hpp"
#include "router/event_log.hpp"

#include <mutex>

namespace perpx {

VenueRegistry::VenueRegistry(Principal owner, EventLog& events)
    : access_(std::move(owner), events), events_(events) {}

void VenueRegistry::register_venue(const Principal& caller,
                                   const VenueId& id,
                                   std::shared_ptr<IVenueGateway> gateway,
                                   std::string name,
                                   uint32_t max_leverage,
                                   uint32_t fee_rate_bps) {
    access_.require_owner(caller);

    if (id.empty() || !gateway) {
        throw RouterError(ErrorCode::InvalidVenue, "venue handle and gateway are required");
    }

    {
        std::unique_lock lock(mutex_);

        auto it = venues_.find(id);
        if (it != venues_.end() && it->second.info.active) {
            throw RouterError(ErrorCode::AlreadyRegistered, "venue " + id);
        }
        if (max_leverage == 0 || max_leverage > kMaxVenueLeverage) {
            throw RouterError(ErrorCode::InvalidLeverage,
                              "max leverage " + std::to_string(max_leverage) + " outside (0, 100]");
        }

        if (it == venues_.end()) {
            order_.push_back(id);
        }
        venues_[id] = Entry{
            .info = VenueInfo{.active = true, .max_leverage = max_leverage,
                              .fee_rate_bps = fee_rate_bps, .name = name},
            .gateway = std::move(gateway),
        };
    }

    events_.emit(VenueRegistered{.venue = id, .name = std::move(name),
                                 .max_leverage = max_leverage, .fee_rate_bps = fee_rate_bps});
}

void VenueRegistry::deactivate(const Principal& caller, const VenueId& id) {
    access_.require_owner(caller);
    {
        std::unique_lock lock(mutex_);
        auto it = venues_.find(id);
        if (it == venues_.end() || !it->second.info.active) {
            throw RouterError(ErrorCode::NotRegistered, "venue " + id + " is not active");
        }
        it->second.info.active = false;
    }
    events_.emit(VenueRemoved{.venue = id});
}

void VenueRegistry::set_status(const Principal& caller, const VenueId& id, bool active) {
    access_.require_owner(caller);
    {
        std::unique_lock lock(mutex_);
        auto it = venues_.find(id);
        if (it == venues_.end()) {
            throw RouterError(ErrorCode::NotRegistered, "venue " + id + " was never registered");
        }
        it->second.info.active = active;
    }
    events_.emit(VenueStatusChanged{.venue = id, .active = active});
}

std::vector<VenueId> VenueRegistry::list_active() const {
    std::shared_lock lock(mutex_);
    std::vector<VenueId> result;
    for (const auto& id : order_) {
        if (venues_.at(id).info.active) {
            result.push_back(id);
        }
    }
    return result;
}

VenueInfo VenueRegistry::get_info(const VenueId& id) const {
    std::shared_lock lock(mutex_);
    auto it = venues_.find(id);
    return it != venues_.end() ? it->second.info : VenueInfo{};
}

bool VenueRegistry::is_registered(const VenueId& id) const {
    std::shared_lock lock(mutex_);
    return venues_.count(id) > 0;
}

std::vector<ActiveVenue> VenueRegistry::active_snapshot() const {
    std::shared_lock lock(mutex_);
    std::vector<ActiveVenue> result;
    for (const auto& id : order_) {
        const auto& entry = venues_.at(id);
        if (entry.info.active) {
            result.push_back(ActiveVenue{.id = id, .info = entry.info, .gateway = entry.gateway});
        }
    }
    return result;
}

} // namespace perpx
