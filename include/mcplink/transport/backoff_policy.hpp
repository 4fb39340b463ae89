#ifndef MCPLINK_TRANSPORT_BACKOFF_POLICY_HPP
#define MCPLINK_TRANSPORT_BACKOFF_POLICY_HPP

#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <random>

namespace mcplink {

// ─────────────────────────────────────────────────────────────────────────────
// IBackoffPolicy
// ─────────────────────────────────────────────────────────────────────────────
// Delay before reconnection attempt number `attempt` (0-indexed). The caller
// owns the attempt counter and resets it after a successful handshake.

struct IBackoffPolicy {
    virtual ~IBackoffPolicy() = default;

    virtual std::chrono::milliseconds next_delay(std::size_t attempt) = 0;

    virtual void reset() = 0;
};

// ─────────────────────────────────────────────────────────────────────────────
// ExponentialBackoff
// ─────────────────────────────────────────────────────────────────────────────
// delay = min(max, base * multiplier^attempt), optionally scaled by a random
// factor in [1 - jitter, 1 + jitter] and clamped to max again.
//
// With the defaults (500ms, x2, 30s, no jitter):
//   attempt 0: 500ms   attempt 1: 1s   attempt 2: 2s   ...   attempt 6+: 30s

class ExponentialBackoff : public IBackoffPolicy {
public:
    ExponentialBackoff()
        : ExponentialBackoff(
              std::chrono::milliseconds{500},
              2.0,
              std::chrono::milliseconds{30'000},
              0.0
          ) {}

    ExponentialBackoff(
        std::chrono::milliseconds base,
        double multiplier,
        std::chrono::milliseconds max,
        double jitter_factor = 0.0
    )
        : base_(base)
        , multiplier_(std::max(multiplier, 1.0))
        , max_(std::max(max, base))
        , jitter_factor_(std::clamp(jitter_factor, 0.0, 1.0))
        , rng_(std::random_device{}())
    {}

    std::chrono::milliseconds next_delay(std::size_t attempt) override {
        const double base_ms = static_cast<double>(base_.count());
        const double max_ms = static_cast<double>(max_.count());

        // pow overflows to inf for large attempts; min() still yields max
        const double grown_ms = base_ms * std::pow(multiplier_, static_cast<double>(attempt));
        const double capped_ms = std::min(grown_ms, max_ms);
        const double jittered_ms = std::min(add_jitter(capped_ms), max_ms);

        const auto result_ms = static_cast<std::int64_t>(std::max(0.0, jittered_ms));
        return std::chrono::milliseconds{result_ms};
    }

    void reset() override {}

    [[nodiscard]] std::chrono::milliseconds base() const noexcept { return base_; }
    [[nodiscard]] std::chrono::milliseconds max() const noexcept { return max_; }
    [[nodiscard]] double multiplier() const noexcept { return multiplier_; }

private:
    double add_jitter(double value) {
        const bool has_jitter = (jitter_factor_ > 0.0);
        if (has_jitter == false) {
            return value;
        }
        std::uniform_real_distribution<double> dist(1.0 - jitter_factor_, 1.0 + jitter_factor_);
        return value * dist(rng_);
    }

    std::chrono::milliseconds base_;
    double multiplier_;
    std::chrono::milliseconds max_;
    double jitter_factor_;
    std::mt19937 rng_;
};

// ─────────────────────────────────────────────────────────────────────────────
// NoBackoff
// ─────────────────────────────────────────────────────────────────────────────

class NoBackoff : public IBackoffPolicy {
public:
    std::chrono::milliseconds next_delay(std::size_t /*attempt*/) override {
        return std::chrono::milliseconds{0};
    }

    void reset() override {}
};

}  // namespace mcplink

#endif  // MCPLINK_TRANSPORT_BACKOFF_POLICY_HPP
