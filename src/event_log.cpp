#include "router/event_log.hpp"

#include <sstream>

namespace perpx {

namespace {

template <class... Ts>
struct overloaded : Ts... {
    using Ts::operator()...;
};
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;

} // namespace

const char* event_name(const Event& event) {
    return std::visit(overloaded{
        [](const PositionOpened&)           { return "PositionOpened"; },
        [](const PositionClosed&)           { return "PositionClosed"; },
        [](const PositionIncreased&)        { return "PositionIncreased"; },
        [](const PositionReduced&)          { return "PositionReduced"; },
        [](const VenueRegistered&)          { return "VenueRegistered"; },
        [](const VenueRemoved&)             { return "VenueRemoved"; },
        [](const VenueStatusChanged&)       { return "VenueStatusChanged"; },
        [](const OracleSet&)                { return "OracleSet"; },
        [](const MaxPriceDeviationUpdated&) { return "MaxPriceDeviationUpdated"; },
        [](const OwnershipTransferred&)     { return "OwnershipTransferred"; },
        [](const RouterPaused&)             { return "Paused"; },
        [](const RouterUnpaused&)           { return "Unpaused"; },
    }, event);
}

std::string describe(const Event& event) {
    std::ostringstream ss;
    ss << event_name(event);

    std::visit(overloaded{
        [&](const PositionOpened& e) {
            ss << " user=" << e.user << " market=" << e.market << " venue=" << e.venue
               << " side=" << (e.is_long ? "long" : "short")
               << " margin=" << format_amount(e.margin) << " leverage=" << e.leverage
               << " size=" << format_amount(e.executed_size)
               << " price=" << format_amount(e.execution_price);
        },
        [&](const PositionClosed& e) {
            ss << " user=" << e.user << " market=" << e.market << " venue=" << e.venue
               << " size=" << format_amount(e.position_size)
               << " payout=" << format_amount(e.payout);
        },
        [&](const PositionIncreased& e) {
            ss << " user=" << e.user << " market=" << e.market << " venue=" << e.venue
               << " margin=" << format_amount(e.additional_margin) << " leverage=" << e.leverage
               << " size=" << format_amount(e.additional_size);
        },
        [&](const PositionReduced& e) {
            ss << " user=" << e.user << " market=" << e.market << " venue=" << e.venue
               << " size=" << format_amount(e.size_reduced)
               << " payout=" << format_amount(e.payout);
        },
        [&](const VenueRegistered& e) {
            ss << " venue=" << e.venue << " name=" << e.name
               << " max_leverage=" << e.max_leverage << " fee_bps=" << e.fee_rate_bps;
        },
        [&](const VenueRemoved& e) { ss << " venue=" << e.venue; },
        [&](const VenueStatusChanged& e) {
            ss << " venue=" << e.venue << " active=" << (e.active ? "true" : "false");
        },
        [&](const OracleSet& e) { ss << " market=" << e.market << " feed=" << e.feed; },
        [&](const MaxPriceDeviationUpdated& e) {
            ss << " old_bps=" << e.old_bps << " new_bps=" << e.new_bps;
        },
        [&](const OwnershipTransferred& e) {
            ss << " from=" << e.previous_owner << " to=" << e.new_owner;
        },
        [&](const RouterPaused& e)   { ss << " by=" << e.by; },
        [&](const RouterUnpaused& e) { ss << " by=" << e.by; },
    }, event);

    return ss.str();
}

void EventLog::emit(Event event) {
    EventRecord record;
    std::vector<EventCallback> subscribers;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        record.sequence = records_.size() + 1;
        record.event = std::move(event);
        records_.push_back(record);
        subscribers = subscribers_;
    }

    for (const auto& cb : subscribers) {
        cb(record);
    }
}

void EventLog::subscribe(EventCallback callback) {
    std::lock_guard<std::mutex> lock(mutex_);
    subscribers_.push_back(std::move(callback));
}

std::vector<EventRecord> EventLog::records() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return records_;
}

size_t EventLog::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return records_.size();
}

} // namespace perpx
