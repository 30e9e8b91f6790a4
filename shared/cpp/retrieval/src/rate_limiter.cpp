#include "../include/rate_limiter.hpp"
#include <algorithm>
#include <thread>

namespace ragcore {

RateLimiter::RateLimiter(double per_second, double burst)
    : rate_(per_second), capacity_(std::max(1.0, burst)), tokens_(std::max(1.0, burst)),
      last_(std::chrono::steady_clock::now()) {}

void RateLimiter::acquire() {
    if (rate_ <= 0.0) return;
    std::chrono::duration<double> wait{0.0};
    {
        std::lock_guard<std::mutex> lock(mtx_);
        auto now = std::chrono::steady_clock::now();
        std::chrono::duration<double> elapsed = now - last_;
        last_ = now;
        tokens_ = std::min(capacity_, tokens_ + elapsed.count() * rate_);
        tokens_ -= 1.0;
        // A negative balance is a reservation: sleep until it would have refilled.
        if (tokens_ < 0.0) wait = std::chrono::duration<double>(-tokens_ / rate_);
    }
    if (wait.count() > 0.0) std::this_thread::sleep_for(wait);
}

} // namespace ragcore
