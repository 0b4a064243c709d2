#ifndef FLOOR_PRICE_RESOLVER_HPP
#define FLOOR_PRICE_RESOLVER_HPP

#include <string>
#include "exchange/market_types.hpp"
#include "exchange/payload_fetcher.hpp"

/**
 * "What are the lowest N in-game sell prices for item X right now":
 * fetch -> sell/in-game filter -> ascending prices -> first N.
 */
class FloorPriceResolver {
public:
    explicit FloorPriceResolver(PayloadFetcher* fetcher);

    // throws MarketApiError when the fetch fails; no qualifying orders => empty prices
    FloorPriceResult resolveFloorPrices(const std::string& itemName, int count = 5);

private:
    PayloadFetcher* fetcher_;
};

// "<item> bottom <n> floor prices are: [a, b, c]"
std::string formatFloorPrices(const FloorPriceResult& result, int count);

#endif // FLOOR_PRICE_RESOLVER_HPP
