#ifndef MARKET_TYPES_HPP
#define MARKET_TYPES_HPP

#include <map>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

enum class OrderType { SELL, BUY };

// seller presence as reported on item orders
enum class UserStatus { INGAME, ONLINE, OFFLINE };

enum class FetchOperation { ITEM_ORDERS, PROFILE_ORDERS };

struct MarketUser {
    std::string id;
    std::string ingameName;
    std::string region;
    std::optional<UserStatus> status; // empty => missing or unsupported upstream value
    int reputation{0};
};

struct CatalogItem {
    std::string id;
    std::string urlName;                       // canonical item identifier
    std::map<std::string, std::string> names;  // language code => display name
};

/**
 * A listing as returned by the API. Only `id` is guaranteed; the decoder
 * never produces an Order without one.
 */
struct Order {
    std::string id;
    std::optional<int> platinum;
    std::optional<OrderType> orderType;
    std::optional<bool> visible;  // profile orders only
    int quantity{0};
    std::string platform;
    std::string region;
    std::string createdAt;
    std::string updatedAt;
};

struct ItemOrder : Order {
    std::optional<MarketUser> user;
};

struct ProfileOrder : Order {
    std::optional<CatalogItem> item;
};

/**
 * Envelope of a single fetch. ITEM_ORDERS fills `orders`,
 * PROFILE_ORDERS fills `sellOrders` / `buyOrders`.
 */
struct Payload {
    FetchOperation operation{FetchOperation::ITEM_ORDERS};
    std::vector<ItemOrder> orders;
    std::vector<ProfileOrder> sellOrders;
    std::vector<ProfileOrder> buyOrders;
};

struct FloorPriceResult {
    std::string itemName;
    std::vector<int> prices; // ascending
};

struct ProfileOrderOptimizerResult {
    std::string itemName;
    std::optional<int> listedPrice;
    std::vector<int> floorPrices;

    // a failed floor-price fetch stays attributed to this entry
    bool success{true};
    int httpStatus{0};
    std::string error;
};

// one entry of a batch floor-price resolution
struct FloorPriceOutcome {
    std::string itemName;
    bool success{false};
    int httpStatus{0};
    std::string error;
    FloorPriceResult result;
};

std::string toString(OrderType type);
std::string toString(UserStatus status);
std::string toString(FetchOperation operation);
std::optional<OrderType> parseOrderType(const std::string& s);
std::optional<UserStatus> parseUserStatus(const std::string& s);

// Decoding of API JSON. A list that is not an array, or an element that is
// not an object, throws std::invalid_argument. Elements without an id are
// dropped with a warning.
std::vector<ItemOrder> decodeItemOrders(const nlohmann::json& list);
std::vector<ProfileOrder> decodeProfileOrders(const nlohmann::json& list);
Payload decodePayload(FetchOperation operation, const nlohmann::json& payload);

// JSON output for the CLI
void to_json(nlohmann::json& j, const FloorPriceResult& r);
void to_json(nlohmann::json& j, const ProfileOrderOptimizerResult& r);
void to_json(nlohmann::json& j, const ProfileOrder& o);
void to_json(nlohmann::json& j, const FloorPriceOutcome& o);

#endif // MARKET_TYPES_HPP
