#ifndef ORDER_FILTER_HPP
#define ORDER_FILTER_HPP

#include <vector>
#include "exchange/market_types.hpp"

namespace OrderFilter {

    /**
     * Orders of `wantedType` whose seller is currently in game. Orders with no
     * order type, no seller, or an unknown seller status are dropped with a
     * warning; online/offline sellers are dropped silently. Input order is kept.
     */
    std::vector<ItemOrder> filterItemOrders(const std::vector<ItemOrder>& orders,
                                            OrderType wantedType = OrderType::SELL);

    // hidden profile listings are not competing offers
    std::vector<ProfileOrder> filterVisible(const std::vector<ProfileOrder>& orders);
}

#endif // ORDER_FILTER_HPP
