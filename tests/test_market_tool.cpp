#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <atomic>
#include <chrono>
#include <future>
#include <functional>
#include <map>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>

#include "engine/market_tool.hpp"
#include "test_support.hpp"

using ::testing::_;
using ::testing::NiceMock;

namespace {
// not derived from std::exception, so nothing below the tool catches it
struct TransportAbort {};

template <typename T, typename = void>
struct HasWindowAccessor : std::false_type {};
template <typename T>
struct HasWindowAccessor<T, std::void_t<decltype(std::declval<const T&>().window())>> : std::true_type {};

template <typename T, typename = void>
struct HasConfigAccessor : std::false_type {};
template <typename T>
struct HasConfigAccessor<T, std::void_t<decltype(std::declval<const T&>().config())>> : std::true_type {};
}

class MarketToolTest : public ::testing::Test {
protected:
    MarketToolTest() {
        config_.baseUrl = kBaseUrl;
        config_.windowMs = 50;
        config_.backoffMs = 5;
        config_.workerThreads = 4;
    }

    // every transport the tool creates goes through configure_ first
    TransportFactory factory() {
        return [this](const ToolConfig&) {
            auto mock = std::make_unique<NiceMock<MockHttpTransport>>();
            if (configure_) configure_(*mock);
            factoryCalls_++;
            return std::unique_ptr<IHttpTransport>(std::move(mock));
        };
    }

    ToolConfig config_;
    std::function<void(MockHttpTransport&)> configure_;
    int factoryCalls_{0};
};

TEST_F(MarketToolTest, OperationsRequireInitialize) {
    MarketTool tool(config_, factory());
    EXPECT_FALSE(tool.isInitialized());
    EXPECT_THROW(tool.resolveFloorPrices("blind_rage", 5), std::logic_error);
    EXPECT_THROW(tool.resolveFloorPricesBatch({"blind_rage"}, 5), std::logic_error);
    EXPECT_THROW(tool.getProfileOrders("Trader"), std::logic_error);
    EXPECT_THROW(tool.verifyProfileOrders("Trader", OrderType::SELL, 5), std::logic_error);
    EXPECT_EQ(factoryCalls_, 0);
}

TEST_F(MarketToolTest, LifecycleAcquiresAndReleasesSharedResources) {
    configure_ = [](MockHttpTransport& t) {
        EXPECT_CALL(t, close()).Times(1);
    };

    MarketTool tool(config_, factory());
    tool.initialize();
    tool.initialize();
    EXPECT_TRUE(tool.isInitialized());
    EXPECT_TRUE(tool.limiter().isRunning());
    EXPECT_EQ(factoryCalls_, 1);

    tool.shutdown();
    EXPECT_FALSE(tool.isInitialized());
    EXPECT_FALSE(tool.limiter().isRunning());

    tool.shutdown();
    EXPECT_THROW(tool.resolveFloorPrices("blind_rage", 5), std::logic_error);
}

TEST_F(MarketToolTest, DestructorShutsDown) {
    configure_ = [](MockHttpTransport& t) {
        EXPECT_CALL(t, close()).Times(1);
    };
    {
        MarketTool tool(config_, factory());
        tool.initialize();
    }
    EXPECT_EQ(factoryCalls_, 1);
}

TEST_F(MarketToolTest, ResolvesFloorPrices) {
    configure_ = [](MockHttpTransport& t) {
        routeResponses(t, {
            {itemUrl("catalyzing_shields"), httpOk(itemOrdersBody(std::vector<int>{45, 30, 60, 30, 90}))},
        });
    };

    MarketTool tool(config_, factory());
    tool.initialize();
    FloorPriceResult res = tool.resolveFloorPrices("catalyzing_shields", 3);
    EXPECT_EQ(res.itemName, "catalyzing_shields");
    EXPECT_EQ(res.prices, (std::vector<int>{30, 30, 45}));
    tool.shutdown();
}

TEST_F(MarketToolTest, BatchOutcomesAreAttributedInInputOrder) {
    configure_ = [](MockHttpTransport& t) {
        routeResponses(t, {
            {itemUrl("blind_rage"), httpOk(itemOrdersBody(std::vector<int>{22, 20}))},
            {itemUrl("catalyzing_shields"), httpOk(itemOrdersBody(std::vector<int>{45, 30}))},
        });
    };

    MarketTool tool(config_, factory());
    tool.initialize();

    testing::internal::CaptureStderr();
    auto outcomes = tool.resolveFloorPricesBatch({"blind_rage", "no_such_item", " Catalyzing Shields"}, 5);
    testing::internal::GetCapturedStderr();

    ASSERT_EQ(outcomes.size(), 3u);
    EXPECT_TRUE(outcomes[0].success);
    EXPECT_EQ(outcomes[0].itemName, "blind_rage");
    EXPECT_EQ(outcomes[0].result.prices, (std::vector<int>{20, 22}));

    EXPECT_FALSE(outcomes[1].success);
    EXPECT_EQ(outcomes[1].itemName, "no_such_item");
    EXPECT_EQ(outcomes[1].httpStatus, 404);
    EXPECT_FALSE(outcomes[1].error.empty());

    EXPECT_TRUE(outcomes[2].success);
    EXPECT_EQ(outcomes[2].itemName, "catalyzing_shields");
    EXPECT_EQ(outcomes[2].result.prices, (std::vector<int>{30, 45}));
}

TEST_F(MarketToolTest, BatchLargerThanOneWindowStillCompletes) {
    config_.requestLimit = 2;
    std::atomic<int> gets{0};
    configure_ = [&gets](MockHttpTransport& t) {
        ON_CALL(t, get(_)).WillByDefault([&gets](const std::string&) {
            gets++;
            return httpOk(itemOrdersBody(std::vector<int>{10}));
        });
    };

    MarketTool tool(config_, factory());
    tool.initialize();

    testing::internal::CaptureStderr();
    auto outcomes = tool.resolveFloorPricesBatch({"a", "b", "c", "d", "e", "f"}, 5);
    testing::internal::GetCapturedStderr();
    tool.shutdown();

    ASSERT_EQ(outcomes.size(), 6u);
    for (const auto& o : outcomes) {
        EXPECT_TRUE(o.success) << o.itemName << ": " << o.error;
    }
    EXPECT_EQ(gets.load(), 6);
}

TEST_F(MarketToolTest, VerifiesProfileOrders) {
    configure_ = [](MockHttpTransport& t) {
        routeResponses(t, {
            {profileUrl("Trader"), httpOk(profileOrdersBody({profileOrderJson("s1", "blind_rage", 25)}))},
            {itemUrl("blind_rage"), httpOk(itemOrdersBody(std::vector<int>{20, 22, 25, 28, 30}))},
        });
    };

    MarketTool tool(config_, factory());
    tool.initialize();

    auto orders = tool.getProfileOrders("Trader");
    ASSERT_EQ(orders.size(), 1u);
    EXPECT_EQ(orders[0].item->urlName, "blind_rage");

    auto results = tool.verifyProfileOrders("Trader", OrderType::SELL, 5);
    ASSERT_EQ(results.size(), 1u);
    EXPECT_EQ(results[0].itemName, "blind_rage");
    EXPECT_EQ(*results[0].listedPrice, 25);
    EXPECT_EQ(results[0].floorPrices, (std::vector<int>{20, 22, 25, 28, 30}));
}

TEST_F(MarketToolTest, BatchAttributesUnexpectedExceptionsPerItem) {
    configure_ = [](MockHttpTransport& t) {
        routeResponses(t, {
            {itemUrl("blind_rage"), httpOk(itemOrdersBody(std::vector<int>{22, 20}))},
            {itemUrl("narrow_minded"), httpOk(itemOrdersBody(std::vector<int>{11}))},
        });
        ON_CALL(t, get(itemUrl("overextended"))).WillByDefault([](const std::string&) -> HttpResponse {
            throw std::runtime_error("socket reset");
        });
    };

    MarketTool tool(config_, factory());
    tool.initialize();

    testing::internal::CaptureStderr();
    auto outcomes = tool.resolveFloorPricesBatch({"blind_rage", "overextended", "narrow_minded"}, 5);
    std::string log = testing::internal::GetCapturedStderr();
    tool.shutdown();

    ASSERT_EQ(outcomes.size(), 3u);
    EXPECT_TRUE(outcomes[0].success);
    EXPECT_EQ(outcomes[0].result.prices, (std::vector<int>{20, 22}));

    EXPECT_FALSE(outcomes[1].success);
    EXPECT_EQ(outcomes[1].itemName, "overextended");
    EXPECT_EQ(outcomes[1].httpStatus, 0);
    EXPECT_EQ(outcomes[1].error, "socket reset");
    EXPECT_NE(log.find("overextended"), std::string::npos);

    EXPECT_TRUE(outcomes[2].success);
    EXPECT_EQ(outcomes[2].result.prices, std::vector<int>{11});
}

TEST_F(MarketToolTest, ShutdownDrainsQueuedFetchesThatNeedNewWindows) {
    config_.workerThreads = 1;
    config_.requestLimit = 1;
    config_.windowMs = 200;
    configure_ = [](MockHttpTransport& t) {
        routeResponses(t, {
            {profileUrl("Trader"), httpOk(profileOrdersBody({
                profileOrderJson("s1", "blind_rage", 25),
                profileOrderJson("s2", "overextended", 40),
                profileOrderJson("s3", "narrow_minded", 12),
                profileOrderJson("s4", "catalyzing_shields", 50)}))},
        });
        ON_CALL(t, get(itemUrl("blind_rage"))).WillByDefault([](const std::string&) -> HttpResponse {
            throw TransportAbort{};
        });
    };

    MarketTool tool(config_, factory());
    tool.initialize();

    // the first item aborts the call and leaves the other three queued behind one slot per window
    testing::internal::CaptureStderr();
    EXPECT_ANY_THROW(tool.verifyProfileOrders("Trader", OrderType::SELL, 5));

    auto done = std::async(std::launch::async, [&tool]() { tool.shutdown(); });
    ASSERT_EQ(done.wait_for(std::chrono::seconds(10)), std::future_status::ready);
    done.get();
    testing::internal::GetCapturedStderr();

    EXPECT_FALSE(tool.isInitialized());
    EXPECT_FALSE(tool.limiter().isRunning());
}

// the window length and the config stay internal; callers only see admission state
TEST(MarketToolSurfaceTest, ExposesLimiterStateButNotConfiguration) {
    EXPECT_FALSE(HasWindowAccessor<RateLimiter>::value);
    EXPECT_FALSE(HasConfigAccessor<MarketTool>::value);

    MarketTool tool;
    EXPECT_EQ(tool.limiter().limit(), ToolConfig{}.requestLimit);
    EXPECT_FALSE(tool.limiter().isRunning());
}
