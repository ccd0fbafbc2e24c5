#include "core/clock.hpp"

#include <chrono>

namespace perpx {

Timestamp SystemClock::now() const {
    auto since_epoch = std::chrono::system_clock::now().time_since_epoch();
    return static_cast<Timestamp>(
        std::chrono::duration_cast<std::chrono::seconds>(since_epoch).count());
}

} // namespace perpx
