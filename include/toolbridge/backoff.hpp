#pragma once
#include <chrono>

namespace toolbridge {

/// Bounded exponential backoff. Attempts are numbered from 1; attempt 1 is
/// the first try and waits nothing.
struct BackoffPolicy {
    int max_attempts = 2;
    std::chrono::milliseconds initial_delay{100};
    double multiplier = 2.0;
    std::chrono::milliseconds max_delay{5000};

    /// Delay to sleep before `attempt`.
    [[nodiscard]] std::chrono::milliseconds delay_for(int attempt) const;

    [[nodiscard]] bool allows(int attempt) const noexcept {
        return attempt >= 1 && attempt <= max_attempts;
    }
};

} // namespace toolbridge
