#ifndef PRICE_EXTRACTOR_HPP
#define PRICE_EXTRACTOR_HPP

#include <algorithm>
#include <functional>
#include <type_traits>
#include <vector>
#include "exchange/market_types.hpp"

namespace PriceExtractor {

    // false (with a warning) when the order has no usable platinum value
    bool readPrice(const Order& order, int& outPrice);

    /**
     * Platinum prices of `orders`, ascending unless sortDescending.
     * Orders without a valid price are skipped, never fatal.
     */
    template<class OrderT>
    std::vector<int> extractPrices(const std::vector<OrderT>& orders, bool sortDescending = false) {
        static_assert(std::is_base_of<Order, OrderT>::value, "extractPrices expects Order types");

        std::vector<int> prices;
        prices.reserve(orders.size());
        for (const Order& order : orders) {
            int price = 0;
            if (readPrice(order, price)) {
                prices.push_back(price);
            }
        }

        if (sortDescending) {
            std::sort(prices.begin(), prices.end(), std::greater<int>());
        } else {
            std::sort(prices.begin(), prices.end());
        }
        return prices;
    }
}

#endif // PRICE_EXTRACTOR_HPP
