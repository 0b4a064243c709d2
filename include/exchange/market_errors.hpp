#ifndef MARKET_ERRORS_HPP
#define MARKET_ERRORS_HPP

#include <stdexcept>
#include <string>

enum class FetchError {
    NONE,
    HTTP_STATUS,  // server answered with something other than 200
    TRANSPORT,    // no HTTP answer at all (connect failure, timeout, closed transport)
    DECODE        // 200 but the body could not be decoded
};

std::string toString(FetchError error);

/**
 * A logical fetch failed. Raised by the resolver and the optimizer;
 * carries the failed target and the observed HTTP status (0 if none).
 */
class MarketApiError : public std::runtime_error {
public:
    MarketApiError(const std::string& target,
                   FetchError kind,
                   int httpStatus,
                   const std::string& message);

    const std::string& target() const { return target_; }
    FetchError kind() const { return kind_; }
    int httpStatus() const { return httpStatus_; }

private:
    std::string target_;
    FetchError kind_;
    int httpStatus_;
};

// a profile order without an item reference: the upstream contract is broken
class ProfileIntegrityError : public std::runtime_error {
public:
    explicit ProfileIntegrityError(const std::string& message)
        : std::runtime_error(message) {}
};

#endif // MARKET_ERRORS_HPP
