#include "watch_packet.hpp"
#include <algorithm>

namespace watch {

void WatchPacket::advance(float dt) {
    if (!active || eligible_) return;
    if (dt > 0.0f) elapsed_ += dt;

    const float delay = fired_ ? recheck_delay : init_delay;
    if (elapsed_ >= delay) {
        eligible_ = true;
        elapsed_  = 0.0f;
    }
}

bool WatchPacket::is_satisfied(const MetricSource& source) const {
    auto holds = [&source](const Condition& c) { return evaluate(c, source); };

    switch (policy) {
        case CombinationPolicy::AllMustMatch:
            return std::all_of(conditions.begin(), conditions.end(), holds);
        case CombinationPolicy::AnyMayMatch:
            return std::any_of(conditions.begin(), conditions.end(), holds);
    }
    return false;
}

void WatchPacket::mark_executed() {
    eligible_ = false;
    fired_    = true;
    elapsed_  = 0.0f;
}

} // namespace watch
