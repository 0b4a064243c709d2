#include "engine/price_extractor.hpp"
#include <iostream>

bool PriceExtractor::readPrice(const Order& order, int& outPrice) {
    if (!order.platinum) {
        std::cerr << "[PRICE] order " << order.id << " has no platinum value\n";
        return false;
    }
    if (*order.platinum < 0) {
        std::cerr << "[PRICE] order " << order.id << " has negative platinum "
                  << *order.platinum << "\n";
        return false;
    }
    outPrice = *order.platinum;
    return true;
}
