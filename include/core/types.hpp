#pragma once

#include <cstdint>
#include <string>

namespace perpx {

using Principal = std::string;   // account identity; empty is the null principal
using VenueId   = std::string;   // opaque venue handle
using MarketId  = std::string;   // market identifier, e.g. "ETH-USD"
using Timestamp = uint64_t;      // seconds since epoch

} // namespace perpx
