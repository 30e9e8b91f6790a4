#pragma once
#include <chrono>
#include <mutex>

namespace ragcore {

// Token bucket shared by every caller of one provider. A rate <= 0 disables limiting.
class RateLimiter {
public:
    explicit RateLimiter(double per_second, double burst = 1.0);

    // Blocks until a slot is available.
    void acquire();

private:
    std::mutex mtx_;
    double rate_{0.0};
    double capacity_{1.0};
    double tokens_{1.0};
    std::chrono::steady_clock::time_point last_;
};

} // namespace ragcore
