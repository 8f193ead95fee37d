#pragma once

#include "error_handler/error.hpp"
#include <chrono>
#include <cmath>
#include <string_view>
#include <thread>
#include <spdlog/spdlog.h>

namespace persevere::infra {
/*

auto res = infra::with_retry([&]() {
    return upload_part(store, state, part);
}, infra::RetryPolicy{}, "part 2 of 3");

*/
// Upper bounds of a policy; config values beyond them are rejected.
inline constexpr int kMaxRetryAttempts = 100;
inline constexpr std::chrono::milliseconds kMaxRetryDelay = std::chrono::hours(1);
inline constexpr double kMaxBackoffFactor = 10.0;

struct RetryPolicy {
    int max_attempts = 3;
    // Zero means retry immediately. A positive delay grows by backoff_factor per attempt.
    std::chrono::milliseconds initial_delay = std::chrono::milliseconds(0);
    double backoff_factor = 2.0;

    [[nodiscard]] auto delay_before(int attempt) const -> std::chrono::milliseconds {
        if (initial_delay.count() <= 0) {
            return std::chrono::milliseconds(0);
        }
        const double delay = static_cast<double>(initial_delay.count())
                           * std::pow(backoff_factor, attempt - 1);
        // Also catches NaN, the cast below is only defined inside the range.
        if (!(delay < static_cast<double>(kMaxRetryDelay.count()))) {
            return kMaxRetryDelay;
        }
        return std::chrono::milliseconds(static_cast<std::chrono::milliseconds::rep>(delay));
    }
};

// Runs `operation` until it succeeds, fails unrecoverably, or has been tried
// policy.max_attempts times. The last retryable error is returned as-is, so a
// retryable error coming out of here means the attempts are exhausted.
template<typename F>
[[nodiscard]] auto with_retry(F&& operation, const RetryPolicy& policy,
                              std::string_view label)
    -> decltype(operation())
{
    const int attempts = policy.max_attempts < 1 ? 1 : policy.max_attempts;

    for (int attempt = 1; ; ++attempt) {
        auto result = operation();
        if (result.has_value()) {
            return result;
        }

        const auto& err = result.error();
        if (err.is_unrecoverable()) {
            return result;
        }
        if (attempt >= attempts) {
            spdlog::error("{} failed after {} attempts: {}", label, attempt, err.message);
            return result;
        }

        spdlog::warn("{} failed, retrying (attempt {} of {}): {}",
                     label, attempt, attempts, err.message);

        const auto delay = policy.delay_before(attempt);
        if (delay.count() > 0) {
            std::this_thread::sleep_for(delay);
        }
    }
}

} // namespace persevere::infra
