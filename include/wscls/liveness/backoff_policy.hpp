#ifndef WSCLS_LIVENESS_BACKOFF_POLICY_HPP
#define WSCLS_LIVENESS_BACKOFF_POLICY_HPP

#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <random>

namespace wscls {

// ─────────────────────────────────────────────────────────────────────────────
// IBackoffPolicy
// ─────────────────────────────────────────────────────────────────────────────
// Decides how long to wait before the next reconnect attempt.
//
// Usage:
//   auto policy = std::make_shared<ExponentialBackoff>();
//   auto delay = policy->next_delay(attempt);   // attempt is 0-indexed
//   policy->reset();                            // after a successful open

struct IBackoffPolicy {
    virtual ~IBackoffPolicy() = default;

    // attempt: 0 = first reconnect after the connection dropped
    virtual std::chrono::milliseconds next_delay(std::size_t attempt) = 0;

    virtual void reset() = 0;
};

// ─────────────────────────────────────────────────────────────────────────────
// ExponentialBackoff
// ─────────────────────────────────────────────────────────────────────────────
// delay = clamp(base * multiplier^attempt * jitter, base, max)
//
// With the defaults (1s base, 2x, 30s max, no jitter):
//   Attempt 0: 1s
//   Attempt 1: 2s
//   Attempt 2: 4s
//   Attempt 3: 8s
//   Attempt 4: 16s
//   Attempt 5+: 30s

class ExponentialBackoff : public IBackoffPolicy {
public:
    ExponentialBackoff()
        : ExponentialBackoff(
              std::chrono::milliseconds{1'000},
              2.0,
              std::chrono::milliseconds{30'000},
              0.0
          ) {}

    ExponentialBackoff(
        std::chrono::milliseconds base,
        double multiplier,
        std::chrono::milliseconds max,
        double jitter_factor  // 0.0 = no jitter, 0.25 = ±25%
    )
        : base_(base)
        , multiplier_(multiplier)
        , max_(std::max(base, max))
        , jitter_factor_(jitter_factor)
        , rng_(std::random_device{}())
    {}

    std::chrono::milliseconds next_delay(std::size_t attempt) override {
        const double exponent = static_cast<double>(attempt);
        const double base_ms = static_cast<double>(base_.count());
        const double max_ms = static_cast<double>(max_.count());

        // Cap before jitter so pow() overflow to inf cannot leak through
        const double grown_ms = std::min(base_ms * std::pow(multiplier_, exponent), max_ms);
        const double jittered_ms = add_jitter(grown_ms);

        // Jitter never takes the delay outside [base, max]
        const double clamped_ms = std::clamp(jittered_ms, base_ms, max_ms);
        return std::chrono::milliseconds{static_cast<std::int64_t>(clamped_ms)};
    }

    void reset() override {}

private:
    double add_jitter(double base_value) {
        const bool has_jitter = (jitter_factor_ > 0.0);
        if (has_jitter == false) {
            return base_value;
        }

        std::uniform_real_distribution<double> dist(
            1.0 - jitter_factor_,
            1.0 + jitter_factor_
        );
        return base_value * dist(rng_);
    }

    std::chrono::milliseconds base_;
    double multiplier_;
    std::chrono::milliseconds max_;
    double jitter_factor_;
    std::mt19937 rng_;
};

// ─────────────────────────────────────────────────────────────────────────────
// ConstantBackoff
// ─────────────────────────────────────────────────────────────────────────────
// Always returns the same delay. Tests use a few milliseconds here.

class ConstantBackoff : public IBackoffPolicy {
public:
    explicit ConstantBackoff(std::chrono::milliseconds delay)
        : delay_(delay) {}

    std::chrono::milliseconds next_delay(std::size_t /*attempt*/) override {
        return delay_;
    }

    void reset() override {}

private:
    std::chrono::milliseconds delay_;
};

}  // namespace wscls

#endif  // WSCLS_LIVENESS_BACKOFF_POLICY_HPP
