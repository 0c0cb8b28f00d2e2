#include "toolbridge/backoff.hpp"
#include <algorithm>

namespace toolbridge {

std::chrono::milliseconds BackoffPolicy::delay_for(int attempt) const {
    if (attempt <= 1) return std::chrono::milliseconds(0);

    double delay = static_cast<double>(initial_delay.count());
    for (int i = 2; i < attempt; ++i) {
        delay *= multiplier;
        if (delay >= static_cast<double>(max_delay.count())) break;
    }
    delay = std::min(delay, static_cast<double>(max_delay.count()));
    return std::chrono::milliseconds(static_cast<long long>(delay));
}

} // namespace toolbridge
