#ifndef PAYLOAD_FETCHER_HPP
#define PAYLOAD_FETCHER_HPP

#include <atomic>
#include <chrono>
#include <string>

#include "core/rate_limiter.hpp"
#include "exchange/i_http_transport.hpp"
#include "exchange/market_errors.hpp"
#include "exchange/market_types.hpp"

struct FetchResult {
    bool success{false};
    FetchError error{FetchError::NONE};
    int httpStatus{0};
    std::string message;
    Payload payload;
};

/**
 * Performs one logical request against the marketplace API.
 *
 * A fetch waits for a rate-limiter slot (fixed backoff, unbounded retries),
 * issues exactly one GET and decodes the `payload` field. Non-200 answers are
 * returned as errors tagged with the status and are never retried here.
 */
class PayloadFetcher {
public:
    PayloadFetcher(IHttpTransport* transport,
                   RateLimiter* limiter,
                   const std::string& baseUrl = "https://api.warframe.market/v1",
                   std::chrono::milliseconds backoff = std::chrono::milliseconds(1000));

    FetchResult fetch(FetchOperation operation, const std::string& targetName);

    /**
     * Trims surrounding whitespace. Item names are case-insensitive: inner
     * spaces become underscores and the result is lower-cased. Usernames keep
     * their case.
     */
    static std::string normalizeTargetName(FetchOperation operation, const std::string& targetName);

    std::string buildUrl(FetchOperation operation, const std::string& normalizedName) const;

    void setVerbose(bool verbose) { verbose_ = verbose; }

    // number of times a fetch had to back off because the window was full
    long rateLimitRetries() const { return rateLimitRetries_.load(); }

private:
    void waitForSlot(const std::string& target);

private:
    IHttpTransport* transport_;
    RateLimiter* limiter_;
    std::string baseUrl_;
    std::chrono::milliseconds backoff_;
    bool verbose_{false};
    std::atomic<long> rateLimitRetries_{0};
};

#endif // PAYLOAD_FETCHER_HPP
