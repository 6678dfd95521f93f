#pragma once
#include <chrono>
#include <cstdint>
#include <functional>

struct CircuitBreakerState {
    std::uint64_t error_count{0};
    std::chrono::steady_clock::time_point window_start{};
    bool is_open{false};
};

// Flood guard owned by one Scanner. Not thread-safe.
class CircuitBreaker {
public:
    using Clock = std::function<std::chrono::steady_clock::time_point()>;

    CircuitBreaker(std::uint64_t threshold,
                   std::chrono::milliseconds cooldown,
                   Clock clock = nullptr);

    // Gate for a new call. Once the cooldown has elapsed an open breaker
    // closes and its counters are cleared in the same step.
    bool allow();

    // Add match_count to the counter; returns true if this trips the breaker.
    bool record(std::uint64_t match_count);

    const CircuitBreakerState& state() const { return state_; }
    std::uint64_t threshold() const { return threshold_; }
    std::chrono::milliseconds cooldown() const { return cooldown_; }

private:
    std::uint64_t threshold_;
    std::chrono::milliseconds cooldown_;
    Clock clock_;
    CircuitBreakerState state_;
};
