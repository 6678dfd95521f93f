#include "CircuitBreaker.hpp"
#include <utility>

CircuitBreaker::CircuitBreaker(std::uint64_t threshold,
                               std::chrono::milliseconds cooldown,
                               Clock clock)
    : threshold_(threshold), cooldown_(cooldown), clock_(std::move(clock)) {
    if (!clock_) clock_ = [] { return std::chrono::steady_clock::now(); };
    state_.window_start = clock_();
}

// Desc: admit or reject a call; resets counters when the cooldown has passed
// In: none
// Out: bool (false -> caller must return the sentinel)
bool CircuitBreaker::allow() {
    if (!state_.is_open) return true;

    const auto now = clock_();
    if (now - state_.window_start < cooldown_) return false;

    state_.is_open = false;
    state_.error_count = 0;
    state_.window_start = now;
    return true;
}

// Desc: accumulate matches and trip when the counter exceeds the threshold
// In: std::uint64_t match_count
// Out: bool (true when the breaker opened on this call)
bool CircuitBreaker::record(std::uint64_t match_count) {
    state_.error_count += match_count;
    if (!state_.is_open && state_.error_count > threshold_) {
        state_.is_open = true;
        state_.window_start = clock_();
        return true;
    }
    return false;
}
