#include "engine/order_filter.hpp"
#include <iostream>

static bool sellerInGame(const ItemOrder& order) {
    if (!order.user) {
        std::cerr << "[FILTER] order " << order.id << " has no user, dropped\n";
        return false;
    }
    if (!order.user->status) {
        std::cerr << "[FILTER] unsupported status type found in order id " << order.id << "\n";
        return false;
    }
    return *order.user->status == UserStatus::INGAME;
}

std::vector<ItemOrder> OrderFilter::filterItemOrders(const std::vector<ItemOrder>& orders,
                                                     OrderType wantedType)
{
    std::vector<ItemOrder> kept;
    for (const auto& order : orders) {
        if (!order.orderType) {
            std::cerr << "[FILTER] order with id " << order.id << " is invalid (no order type)\n";
            continue;
        }
        if (*order.orderType != wantedType) {
            continue;
        }
        if (sellerInGame(order)) {
            kept.push_back(order);
        }
    }
    return kept;
}

std::vector<ProfileOrder> OrderFilter::filterVisible(const std::vector<ProfileOrder>& orders) {
    std::vector<ProfileOrder> kept;
    for (const auto& order : orders) {
        if (order.visible.value_or(false)) {
            kept.push_back(order);
        }
    }
    return kept;
}
