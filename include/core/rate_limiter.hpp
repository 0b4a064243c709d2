#ifndef RATE_LIMITER_HPP
#define RATE_LIMITER_HPP

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <thread>

/**
 * Fixed-window request throttle shared by every fetch of one MarketTool.
 *
 * At most `requestLimit` admits succeed between two resets. A background thread
 * (start/stop) resets the counter once per window. The counter and the reset are
 * serialized through the same mutex, which is never held across a network call.
 */
class RateLimiter {
public:
    explicit RateLimiter(int requestLimit = 3,
                         std::chrono::milliseconds window = std::chrono::milliseconds(1000));
    ~RateLimiter();

    RateLimiter(const RateLimiter&) = delete;
    RateLimiter& operator=(const RateLimiter&) = delete;

    // true => counted against the current window, false => limit reached (no side effect)
    bool tryAdmit();

    // start a new window
    void reset();

    // background reset thread
    void start();
    void stop();
    bool isRunning() const { return running_.load(); }

    int inWindow() const;
    int limit() const { return requestLimit_; }

private:
    void resetLoop();

private:
    const int requestLimit_;
    const std::chrono::milliseconds window_;

    mutable std::mutex counterMutex_;
    int requestCounter_{0};

    // reset thread control
    std::mutex timerMutex_;
    std::condition_variable timerCv_;
    bool stopRequested_{false};
    std::thread resetThread_;
    std::atomic<bool> running_{false};
};

#endif // RATE_LIMITER_HPP
