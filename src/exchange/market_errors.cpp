#include "exchange/market_errors.hpp"

std::string toString(FetchError error) {
    switch (error) {
        case FetchError::NONE:        return "none";
        case FetchError::HTTP_STATUS: return "http status";
        case FetchError::TRANSPORT:   return "transport";
        case FetchError::DECODE:      return "decode";
    }
    return "unknown";
}

MarketApiError::MarketApiError(const std::string& target,
                               FetchError kind,
                               int httpStatus,
                               const std::string& message)
    : std::runtime_error("failed to acquire " + target + ": " + message)
    , target_(target)
    , kind_(kind)
    , httpStatus_(httpStatus)
{
}
