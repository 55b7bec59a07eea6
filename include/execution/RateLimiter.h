#pragma once

#include <string>
#include <map>
#include <chrono>
#include <mutex>
#include <condition_variable>

namespace gapswing {
namespace execution {

// Per-group request budget over a one second window.
struct RateLimitConfig {
    std::string group_name;
    int max_per_second;
    int current_count;
    std::chrono::steady_clock::time_point window_start;

    RateLimitConfig(const std::string& name, int max_req)
        : group_name(name)
        , max_per_second(max_req)
        , current_count(0)
        , window_start(std::chrono::steady_clock::now())
    {}
};

// Client-side throttle for the exchange REST API. Thread-safe.
class RateLimiter {
public:
    // weight_limit_1m: the exchange's request weight budget per minute.
    explicit RateLimiter(int weight_limit_1m = 2400);

    // Non-blocking: false when the group's window is exhausted or the client is blocked.
    bool tryAcquire(const std::string& group);

    // Blocks until a slot in the group's window is available.
    void acquire(const std::string& group);

    int getRemainingRequests(const std::string& group);

    // X-MBX-USED-WEIGHT-1M response header. Near the budget, pauses until the minute rolls over.
    void updateFromHeader(const std::string& used_weight_header);

    // 429: pause one second. 418 (IP ban): pause one minute.
    void handleRateLimitError(int status_code);

    bool isBlocked();

    struct Stats {
        int total_requests;
        int rejected_requests;
        int forced_waits;
        std::chrono::milliseconds total_wait_time;
    };
    Stats getStats() const;

private:
    std::map<std::string, RateLimitConfig> configs_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;

    int weight_limit_1m_;
    int total_requests_;
    int rejected_requests_;
    int forced_waits_;
    std::chrono::milliseconds total_wait_time_;

    bool is_blocked_;
    std::chrono::steady_clock::time_point block_end_time_;

    RateLimitConfig& configFor(const std::string& group);
    void blockFor(std::chrono::milliseconds duration);
    void resetWindowIfNeeded(RateLimitConfig& config);
};

} // namespace execution
} // namespace gapswing
