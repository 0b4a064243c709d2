#ifndef PROFILE_OPTIMIZER_HPP
#define PROFILE_OPTIMIZER_HPP

#include <string>
#include <vector>
#include "core/thread_pool.hpp"
#include "engine/floor_price_resolver.hpp"
#include "exchange/market_types.hpp"
#include "exchange/payload_fetcher.hpp"

/**
 * Checks a seller's own listings against the current market floor.
 */
class ProfileOptimizer {
public:
    // pool may be null => floor prices are resolved one after another
    ProfileOptimizer(PayloadFetcher* fetcher,
                     FloorPriceResolver* resolver,
                     ThreadPool* pool = nullptr);

    // sell or buy orders listed on the profile; throws MarketApiError on fetch failure
    std::vector<ProfileOrder> getProfileOrders(const std::string& username,
                                               OrderType orderType = OrderType::SELL);

    /**
     * One result per (visible) profile order, in profile order. Every order
     * must reference an item, otherwise ProfileIntegrityError is thrown before
     * any floor price is fetched. A failed floor-price fetch only marks its
     * own result (success=false, httpStatus, error).
     */
    std::vector<ProfileOrderOptimizerResult> verifyProfileOrders(const std::string& username,
                                                                 OrderType orderType = OrderType::SELL,
                                                                 int count = 5,
                                                                 bool visibleOnly = true);

private:
    ProfileOrderOptimizerResult compareWithFloor(const std::string& urlName,
                                                 std::optional<int> listedPrice,
                                                 int count);

private:
    PayloadFetcher* fetcher_;
    FloorPriceResolver* resolver_;
    ThreadPool* pool_;
};

#endif // PROFILE_OPTIMIZER_HPP
