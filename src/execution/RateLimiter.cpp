#include "execution/RateLimiter.h"
#include "common/Logger.h"
#include <algorithm>
#include <stdexcept>

namespace gapswing {
namespace execution {

RateLimiter::RateLimiter(int weight_limit_1m)
    : weight_limit_1m_(weight_limit_1m)
    , total_requests_(0)
    , rejected_requests_(0)
    , forced_waits_(0)
    , total_wait_time_(std::chrono::milliseconds(0))
    , is_blocked_(false)
{
    // Binance USD-M futures: 2400 weight/min per IP, 300 orders/10s per account.
    configs_.emplace("market", RateLimitConfig("market", 20));     // klines, ticker, exchangeInfo
    configs_.emplace("account", RateLimitConfig("account", 5));    // balance
    configs_.emplace("order", RateLimitConfig("order", 10));       // order placement / cancel
    configs_.emplace("default", RateLimitConfig("default", 10));
}

RateLimitConfig& RateLimiter::configFor(const std::string& group) {
    auto it = configs_.find(group);
    if (it == configs_.end()) it = configs_.find("default");
    return it->second;
}

bool RateLimiter::tryAcquire(const std::string& group) {
    std::unique_lock<std::mutex> lock(mutex_);

    if (is_blocked_) {
        auto now = std::chrono::steady_clock::now();
        if (now < block_end_time_) {
            rejected_requests_++;
            return false;
        }
        is_blocked_ = false;
        cv_.notify_all();
    }

    auto& config = configFor(group);
    resetWindowIfNeeded(config);

    if (config.current_count < config.max_per_second) {
        config.current_count++;
        total_requests_++;
        return true;
    }

    rejected_requests_++;
    return false;
}

void RateLimiter::acquire(const std::string& group) {
    std::unique_lock<std::mutex> lock(mutex_);
    auto& config = configFor(group);

    while (true) {
        if (is_blocked_) {
            auto status = cv_.wait_until(lock, block_end_time_);
            if (status == std::cv_status::timeout) {
                is_blocked_ = false;
            } else {
                continue;
            }
        }

        resetWindowIfNeeded(config);

        if (config.current_count < config.max_per_second) {
            config.current_count++;
            total_requests_++;
            return;
        }

        // Window exhausted: sleep until it rolls over.
        auto wake_time = config.window_start + std::chrono::seconds(1) + std::chrono::milliseconds(1);

        forced_waits_++;
        auto wait_start = std::chrono::steady_clock::now();
        cv_.wait_until(lock, wake_time);
        total_wait_time_ += std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - wait_start
        );
    }
}

int RateLimiter::getRemainingRequests(const std::string& group) {
    std::unique_lock<std::mutex> lock(mutex_);
    auto& config = configFor(group);
    resetWindowIfNeeded(config);
    return std::max(0, config.max_per_second - config.current_count);
}

bool RateLimiter::isBlocked() {
    std::unique_lock<std::mutex> lock(mutex_);
    if (is_blocked_ && std::chrono::steady_clock::now() >= block_end_time_) {
        is_blocked_ = false;
        cv_.notify_all();
    }
    return is_blocked_;
}

void RateLimiter::updateFromHeader(const std::string& used_weight_header) {
    int used = 0;
    try {
        used = std::stoi(used_weight_header);
    } catch (const std::exception&) {
        return;
    }

    // Keep a 10% margin below the exchange budget.
    if (used * 10 < weight_limit_1m_ * 9) {
        return;
    }

    const auto now = std::chrono::system_clock::now().time_since_epoch();
    const auto ms_into_minute = std::chrono::duration_cast<std::chrono::milliseconds>(now).count() % 60000;
    const auto pause = std::chrono::milliseconds(60000 - ms_into_minute + 100);

    LOG_WARN("Request weight {}/{} used this minute; pausing {} ms", used, weight_limit_1m_, pause.count());
    std::unique_lock<std::mutex> lock(mutex_);
    forced_waits_++;
    blockFor(pause);
}

void RateLimiter::handleRateLimitError(int status_code) {
    std::unique_lock<std::mutex> lock(mutex_);

    if (status_code == 429) {
        LOG_WARN("429 Too Many Requests: pausing all requests for 1 second");
        forced_waits_++;
        blockFor(std::chrono::seconds(1));
    } else if (status_code == 418) {
        LOG_ERROR("418 IP ban detected: pausing all requests for 1 minute");
        forced_waits_++;
        blockFor(std::chrono::minutes(1));
    } else {
        return;
    }

    // Hold the caller for the whole block so its retry starts after it.
    while (is_blocked_) {
        if (cv_.wait_until(lock, block_end_time_) == std::cv_status::timeout) {
            is_blocked_ = false;
            cv_.notify_all();
        }
    }
}

void RateLimiter::blockFor(std::chrono::milliseconds duration) {
    const auto until = std::chrono::steady_clock::now() + duration;
    if (!is_blocked_ || until > block_end_time_) {
        block_end_time_ = until;
    }
    is_blocked_ = true;
}

RateLimiter::Stats RateLimiter::getStats() const {
    std::unique_lock<std::mutex> lock(mutex_);

    Stats stats;
    stats.total_requests = total_requests_;
    stats.rejected_requests = rejected_requests_;
    stats.forced_waits = forced_waits_;
    stats.total_wait_time = total_wait_time_;
    return stats;
}

void RateLimiter::resetWindowIfNeeded(RateLimitConfig& config) {
    auto now = std::chrono::steady_clock::now();
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        now - config.window_start
    );

    if (elapsed.count() >= 1000) {
        config.current_count = 0;
        config.window_start = now;
        cv_.notify_all();
    }
}

} // namespace execution
} // namespace gapswing
