#pragma once
#include "errors.hpp"
#include "log.hpp"
#include <algorithm>
#include <chrono>
#include <string>
#include <thread>

namespace ragcore {

struct RetryPolicy {
    int max_retries{3};
    std::chrono::milliseconds initial_backoff{200};
    double multiplier{2.0};
    std::chrono::milliseconds max_backoff{5000};
};

// Retries fn on ProviderUnavailable with exponential backoff. Any other
// exception, and the last ProviderUnavailable, propagate.
template <typename Fn>
auto with_retry(const RetryPolicy& policy, const std::string& what, Fn&& fn) -> decltype(fn()) {
    auto delay = policy.initial_backoff;
    for (int attempt = 0;; ++attempt) {
        try {
            return fn();
        } catch (const ProviderUnavailable& e) {
            if (attempt >= policy.max_retries) {
                log_error(what + " failed after " + std::to_string(attempt + 1) + " attempts: " + e.what());
                throw;
            }
            log_warn(what + " failed (attempt " + std::to_string(attempt + 1) + "): " + e.what() +
                     "; retrying in " + std::to_string(delay.count()) + "ms");
            std::this_thread::sleep_for(delay);
            auto next = std::chrono::milliseconds((long long)(delay.count() * policy.multiplier));
            delay = std::min(policy.max_backoff, next);
        }
    }
}

} // namespace ragcore
