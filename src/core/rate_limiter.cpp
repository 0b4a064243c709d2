#include "core/rate_limiter.hpp"
#include <stdexcept>
#include <string>

RateLimiter::RateLimiter(int requestLimit, std::chrono::milliseconds window)
    : requestLimit_(requestLimit)
    , window_(window)
{
    if (requestLimit_ < 1) {
        throw std::invalid_argument("request limit must be at least 1, got "
                                    + std::to_string(requestLimit_));
    }
    if (window_.count() <= 0) {
        throw std::invalid_argument("request window must be positive");
    }
}

RateLimiter::~RateLimiter() {
    stop();
}

bool RateLimiter::tryAdmit() {
    std::lock_guard<std::mutex> lk(counterMutex_);
    if (requestCounter_ >= requestLimit_) {
        return false;
    }
    requestCounter_ += 1;
    return true;
}

void RateLimiter::reset() {
    std::lock_guard<std::mutex> lk(counterMutex_);
    requestCounter_ = 0;
}

int RateLimiter::inWindow() const {
    std::lock_guard<std::mutex> lk(counterMutex_);
    return requestCounter_;
}

void RateLimiter::start() {
    if (running_.load()) {
        return;
    }
    {
        std::lock_guard<std::mutex> lk(timerMutex_);
        stopRequested_ = false;
    }
    running_ = true;
    resetThread_ = std::thread([this]() { resetLoop(); });
}

void RateLimiter::stop() {
    {
        std::lock_guard<std::mutex> lk(timerMutex_);
        stopRequested_ = true;
    }
    timerCv_.notify_all();
    if (resetThread_.joinable()) {
        resetThread_.join();
    }
    running_ = false;
}

/**
 * Resets first, then waits one window. wait_for wakes early on stop() so
 * shutdown never has to sit out a full window.
 */
void RateLimiter::resetLoop() {
    std::unique_lock<std::mutex> lk(timerMutex_);
    while (!stopRequested_) {
        reset();
        if (timerCv_.wait_for(lk, window_, [this] { return stopRequested_; })) {
            break;
        }
    }
}
