#include "engine/profile_optimizer.hpp"
#include "engine/order_filter.hpp"
#include <future>
#include <iostream>
#include <stdexcept>

ProfileOptimizer::ProfileOptimizer(PayloadFetcher* fetcher,
                                   FloorPriceResolver* resolver,
                                   ThreadPool* pool)
    : fetcher_(fetcher)
    , resolver_(resolver)
    , pool_(pool)
{
    if (!fetcher_ || !resolver_) {
        throw std::invalid_argument("ProfileOptimizer needs a fetcher and a resolver");
    }
}

std::vector<ProfileOrder> ProfileOptimizer::getProfileOrders(const std::string& username,
                                                             OrderType orderType)
{
    FetchResult fetched = fetcher_->fetch(FetchOperation::PROFILE_ORDERS, username);
    if (!fetched.success) {
        throw MarketApiError(
            PayloadFetcher::normalizeTargetName(FetchOperation::PROFILE_ORDERS, username),
            fetched.error, fetched.httpStatus, fetched.message);
    }
    if (orderType == OrderType::SELL) {
        return std::move(fetched.payload.sellOrders);
    }
    return std::move(fetched.payload.buyOrders);
}

ProfileOrderOptimizerResult ProfileOptimizer::compareWithFloor(const std::string& urlName,
                                                               std::optional<int> listedPrice,
                                                               int count)
{
    ProfileOrderOptimizerResult res;
    res.itemName = urlName;
    res.listedPrice = listedPrice;
    try {
        res.floorPrices = resolver_->resolveFloorPrices(urlName, count).prices;
    } catch (const MarketApiError& e) {
        res.success = false;
        res.httpStatus = e.httpStatus();
        res.error = e.what();
        std::cerr << "[PROFILE] " << e.what() << "\n";
    } catch (const std::exception& e) {
        res.success = false;
        res.error = e.what();
        std::cerr << "[PROFILE] " << urlName << ": " << e.what() << "\n";
    }
    return res;
}

std::vector<ProfileOrderOptimizerResult> ProfileOptimizer::verifyProfileOrders(const std::string& username,
                                                                               OrderType orderType,
                                                                               int count,
                                                                               bool visibleOnly)
{
    if (count < 0) {
        throw std::invalid_argument("floor price count must not be negative");
    }

    std::vector<ProfileOrder> orders = getProfileOrders(username, orderType);
    if (visibleOnly) {
        orders = OrderFilter::filterVisible(orders);
    }

    // resolve every item reference up front so a broken order aborts before any fetch
    std::vector<std::string> urlNames;
    urlNames.reserve(orders.size());
    for (const auto& order : orders) {
        std::string urlName;
        if (order.item) {
            urlName = PayloadFetcher::normalizeTargetName(FetchOperation::ITEM_ORDERS,
                                                          order.item->urlName);
        }
        if (urlName.empty()) {
            throw ProfileIntegrityError("profile order " + order.id + " of " + username
                                        + " has no item reference");
        }
        urlNames.push_back(urlName);
    }

    std::vector<ProfileOrderOptimizerResult> results;
    results.reserve(orders.size());

    if (!pool_) {
        for (size_t i = 0; i < orders.size(); ++i) {
            results.push_back(compareWithFloor(urlNames[i], orders[i].platinum, count));
        }
        return results;
    }

    std::vector<std::future<ProfileOrderOptimizerResult>> pending;
    pending.reserve(orders.size());
    for (size_t i = 0; i < orders.size(); ++i) {
        pending.push_back(pool_->submit([this, name = urlNames[i], listed = orders[i].platinum, count]() {
            return compareWithFloor(name, listed, count);
        }));
    }
    for (auto& f : pending) {
        results.push_back(f.get());
    }
    return results;
}
