#ifndef MARKET_TOOL_HPP
#define MARKET_TOOL_HPP

#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "core/rate_limiter.hpp"
#include "core/thread_pool.hpp"
#include "core/tool_config.hpp"
#include "engine/floor_price_resolver.hpp"
#include "engine/profile_optimizer.hpp"
#include "exchange/i_http_transport.hpp"
#include "exchange/market_types.hpp"
#include "exchange/payload_fetcher.hpp"

using TransportFactory = std::function<std::unique_ptr<IHttpTransport>(const ToolConfig&)>;

/**
 * Entry point for callers (the CLI). Owns the shared transport, the rate
 * limiter with its reset thread, and the worker pool.
 *
 * initialize() acquires them, shutdown() drains the pool, stops the reset
 * thread and closes the transport exactly once. Both are idempotent.
 */
class MarketTool {
public:
    // factory == nullptr => libcurl transport
    explicit MarketTool(const ToolConfig& config = ToolConfig{},
                        TransportFactory factory = nullptr);
    ~MarketTool();

    MarketTool(const MarketTool&) = delete;
    MarketTool& operator=(const MarketTool&) = delete;

    void initialize();
    void shutdown();
    bool isInitialized() const { return initialized_; }

    FloorPriceResult resolveFloorPrices(const std::string& itemName, int count);

    // concurrent; one outcome per input item, in input order
    std::vector<FloorPriceOutcome> resolveFloorPricesBatch(const std::vector<std::string>& itemNames,
                                                           int count);

    std::vector<ProfileOrder> getProfileOrders(const std::string& username,
                                               OrderType orderType = OrderType::SELL);

    std::vector<ProfileOrderOptimizerResult> verifyProfileOrders(const std::string& username,
                                                                 OrderType orderType,
                                                                 int count,
                                                                 bool visibleOnly = true);

    const RateLimiter& limiter() const { return limiter_; }

private:
    void requireInitialized(const char* operation) const;
    FloorPriceOutcome resolveOutcome(const std::string& itemName, int count);

private:
    ToolConfig config_;
    TransportFactory transportFactory_;

    RateLimiter limiter_;
    std::unique_ptr<IHttpTransport> transport_;
    std::unique_ptr<PayloadFetcher> fetcher_;
    std::unique_ptr<FloorPriceResolver> resolver_;
    std::unique_ptr<ThreadPool> pool_;
    std::unique_ptr<ProfileOptimizer> optimizer_;

    bool initialized_{false};
};

#endif // MARKET_TOOL_HPP
