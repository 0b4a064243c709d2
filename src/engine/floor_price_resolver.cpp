#include "engine/floor_price_resolver.hpp"
#include "engine/order_filter.hpp"
#include "engine/price_extractor.hpp"
#include <sstream>
#include <stdexcept>

FloorPriceResolver::FloorPriceResolver(PayloadFetcher* fetcher)
    : fetcher_(fetcher)
{
    if (!fetcher_) {
        throw std::invalid_argument("FloorPriceResolver needs a fetcher");
    }
}

FloorPriceResult FloorPriceResolver::resolveFloorPrices(const std::string& itemName, int count) {
    if (count < 0) {
        throw std::invalid_argument("floor price count must not be negative");
    }

    FloorPriceResult result;
    result.itemName = PayloadFetcher::normalizeTargetName(FetchOperation::ITEM_ORDERS, itemName);

    FetchResult fetched = fetcher_->fetch(FetchOperation::ITEM_ORDERS, itemName);
    if (!fetched.success) {
        throw MarketApiError(result.itemName, fetched.error, fetched.httpStatus, fetched.message);
    }

    auto sellOrders = OrderFilter::filterItemOrders(fetched.payload.orders, OrderType::SELL);
    auto prices = PriceExtractor::extractPrices(sellOrders);

    if (prices.size() > static_cast<size_t>(count)) {
        prices.resize(static_cast<size_t>(count));
    }
    result.prices = std::move(prices);
    return result;
}

std::string formatFloorPrices(const FloorPriceResult& result, int count) {
    std::ostringstream msg;
    msg << result.itemName << " bottom " << count << " floor prices are: [";
    for (size_t i = 0; i < result.prices.size(); ++i) {
        if (i > 0) msg << ", ";
        msg << result.prices[i];
    }
    msg << "]";
    return msg.str();
}
