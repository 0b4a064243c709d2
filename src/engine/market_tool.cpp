#include "engine/market_tool.hpp"
#include "exchange/curl_http_transport.hpp"
#include <future>
#include <iostream>
#include <stdexcept>

static std::unique_ptr<IHttpTransport> makeCurlTransport(const ToolConfig& cfg) {
    return std::make_unique<CurlHttpTransport>(cfg.timeoutSeconds, cfg.userAgent);
}

MarketTool::MarketTool(const ToolConfig& config, TransportFactory factory)
    : config_(config)
    , transportFactory_(factory ? std::move(factory) : TransportFactory(makeCurlTransport))
    , limiter_(config.requestLimit, std::chrono::milliseconds(config.windowMs))
{
}

MarketTool::~MarketTool() {
    shutdown();
}

void MarketTool::initialize() {
    if (initialized_) {
        return;
    }

    transport_ = transportFactory_(config_);
    if (!transport_) {
        throw std::runtime_error("transport factory returned no transport");
    }

    fetcher_ = std::make_unique<PayloadFetcher>(transport_.get(), &limiter_, config_.baseUrl,
                                                std::chrono::milliseconds(config_.backoffMs));
    fetcher_->setVerbose(config_.verbose);
    resolver_  = std::make_unique<FloorPriceResolver>(fetcher_.get());
    pool_      = std::make_unique<ThreadPool>(static_cast<size_t>(config_.workerThreads));
    optimizer_ = std::make_unique<ProfileOptimizer>(fetcher_.get(), resolver_.get(), pool_.get());

    limiter_.start();
    initialized_ = true;

    if (config_.verbose) {
        std::cout << "[TOOL] initialized: base=" << config_.baseUrl
                  << " limit=" << config_.requestLimit << "/" << config_.windowMs << "ms"
                  << " workers=" << config_.workerThreads << "\n";
    }
}

void MarketTool::shutdown() {
    if (!initialized_) {
        return;
    }
    initialized_ = false;

    // queued fetches still need fresh windows, so the limiter outlives the pool
    pool_->shutdown();
    limiter_.stop();

    optimizer_.reset();
    pool_.reset();
    resolver_.reset();
    fetcher_.reset();

    transport_->close();
    transport_.reset();

    if (config_.verbose) {
        std::cout << "[TOOL] shut down\n";
    }
}

void MarketTool::requireInitialized(const char* operation) const {
    if (!initialized_) {
        throw std::logic_error(std::string(operation) + " called before initialize()");
    }
}

FloorPriceResult MarketTool::resolveFloorPrices(const std::string& itemName, int count) {
    requireInitialized("resolveFloorPrices");
    return resolver_->resolveFloorPrices(itemName, count);
}

FloorPriceOutcome MarketTool::resolveOutcome(const std::string& itemName, int count) {
    FloorPriceOutcome out;
    out.itemName = PayloadFetcher::normalizeTargetName(FetchOperation::ITEM_ORDERS, itemName);
    try {
        out.result = resolver_->resolveFloorPrices(itemName, count);
        out.success = true;
    } catch (const MarketApiError& e) {
        out.httpStatus = e.httpStatus();
        out.error = e.what();
    } catch (const std::exception& e) {
        out.error = e.what();
        std::cerr << "[TOOL] " << out.itemName << ": " << e.what() << "\n";
    }
    return out;
}

std::vector<FloorPriceOutcome> MarketTool::resolveFloorPricesBatch(const std::vector<std::string>& itemNames,
                                                                   int count)
{
    requireInitialized("resolveFloorPricesBatch");

    std::vector<std::future<FloorPriceOutcome>> pending;
    pending.reserve(itemNames.size());
    for (const auto& name : itemNames) {
        pending.push_back(pool_->submit([this, name, count]() {
            return resolveOutcome(name, count);
        }));
    }

    std::vector<FloorPriceOutcome> outcomes;
    outcomes.reserve(pending.size());
    for (auto& f : pending) {
        outcomes.push_back(f.get());
    }
    return outcomes;
}

std::vector<ProfileOrder> MarketTool::getProfileOrders(const std::string& username, OrderType orderType) {
    requireInitialized("getProfileOrders");
    return optimizer_->getProfileOrders(username, orderType);
}

std::vector<ProfileOrderOptimizerResult> MarketTool::verifyProfileOrders(const std::string& username,
                                                                         OrderType orderType,
                                                                         int count,
                                                                         bool visibleOnly)
{
    requireInitialized("verifyProfileOrders");
    return optimizer_->verifyProfileOrders(username, orderType, count, visibleOnly);
}
