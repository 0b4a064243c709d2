#include "exchange/market_types.hpp"
#include <iostream>
#include <limits>
#include <stdexcept>

using json = nlohmann::json;

std::string toString(OrderType type) {
    return (type == OrderType::SELL) ? "sell" : "buy";
}

std::string toString(UserStatus status) {
    switch (status) {
        case UserStatus::INGAME:  return "ingame";
        case UserStatus::ONLINE:  return "online";
        case UserStatus::OFFLINE: return "offline";
    }
    return "unknown";
}

std::string toString(FetchOperation operation) {
    return (operation == FetchOperation::ITEM_ORDERS) ? "item orders" : "profile orders";
}

std::optional<OrderType> parseOrderType(const std::string& s) {
    if (s == "sell") return OrderType::SELL;
    if (s == "buy")  return OrderType::BUY;
    return std::nullopt;
}

std::optional<UserStatus> parseUserStatus(const std::string& s) {
    if (s == "ingame")  return UserStatus::INGAME;
    if (s == "online")  return UserStatus::ONLINE;
    if (s == "offline") return UserStatus::OFFLINE;
    return std::nullopt;
}

// The API speaks snake_case; camelCase is accepted as well.
static const json* findField(const json& obj, const char* snake, const char* camel = nullptr) {
    auto it = obj.find(snake);
    if (it != obj.end() && !it->is_null()) {
        return &(*it);
    }
    if (camel) {
        it = obj.find(camel);
        if (it != obj.end() && !it->is_null()) {
            return &(*it);
        }
    }
    return nullptr;
}

static std::string stringField(const json& obj, const char* snake, const char* camel = nullptr) {
    const json* v = findField(obj, snake, camel);
    if (v && v->is_string()) {
        return v->get<std::string>();
    }
    return "";
}

static int intField(const json& obj, const char* key) {
    const json* v = findField(obj, key);
    if (v && v->is_number_integer()) {
        return v->get<int>();
    }
    return 0;
}

static std::optional<int> decodePlatinum(const json& obj) {
    const json* v = findField(obj, "platinum");
    if (!v || !v->is_number_integer()) {
        return std::nullopt;
    }
    long long raw = v->get<long long>();
    if (raw > std::numeric_limits<int>::max() || raw < std::numeric_limits<int>::min()) {
        return std::nullopt;
    }
    return static_cast<int>(raw);
}

static std::optional<MarketUser> decodeUser(const json& obj) {
    const json* u = findField(obj, "user");
    if (!u || !u->is_object()) {
        return std::nullopt;
    }
    MarketUser user;
    user.id         = stringField(*u, "id");
    user.ingameName = stringField(*u, "ingame_name", "ingameName");
    user.region     = stringField(*u, "region");
    user.reputation = intField(*u, "reputation");

    std::string status = stringField(*u, "status");
    if (!status.empty()) {
        user.status = parseUserStatus(status);
        if (!user.status) {
            std::cerr << "[DECODE] unsupported user status \"" << status << "\"\n";
        }
    }
    return user;
}

static std::optional<CatalogItem> decodeItem(const json& obj) {
    const json* i = findField(obj, "item");
    if (!i || !i->is_object()) {
        return std::nullopt;
    }
    CatalogItem item;
    item.id      = stringField(*i, "id");
    item.urlName = stringField(*i, "url_name", "urlName");

    // localized blocks look like "en": {"item_name": "Blind Rage"}
    for (auto it = i->begin(); it != i->end(); ++it) {
        if (!it.value().is_object()) continue;
        std::string name = stringField(it.value(), "item_name", "itemName");
        if (!name.empty()) {
            item.names[it.key()] = name;
        }
    }
    return item;
}

// Fills the shared Order fields. Returns false when the element has no id.
static bool decodeOrderFields(const json& obj, Order& out) {
    if (!obj.is_object()) {
        throw std::invalid_argument("order entry is expected to be an object, got "
                                    + std::string(obj.type_name()));
    }

    out.id = stringField(obj, "id");
    if (out.id.empty()) {
        std::cerr << "[DECODE] dropping order without id\n";
        return false;
    }

    out.platinum  = decodePlatinum(obj);
    out.quantity  = intField(obj, "quantity");
    out.platform  = stringField(obj, "platform");
    out.region    = stringField(obj, "region");
    out.createdAt = stringField(obj, "creation_date", "createdAt");
    out.updatedAt = stringField(obj, "last_update", "updatedAt");

    std::string type = stringField(obj, "order_type", "orderType");
    if (!type.empty()) {
        out.orderType = parseOrderType(type);
        if (!out.orderType) {
            std::cerr << "[DECODE] unsupported order type \"" << type
                      << "\" on order " << out.id << "\n";
        }
    }

    const json* visible = findField(obj, "visible");
    if (visible && visible->is_boolean()) {
        out.visible = visible->get<bool>();
    }
    return true;
}

static void requireArray(const json& list) {
    if (!list.is_array()) {
        throw std::invalid_argument("order list is expected to be an array, got "
                                    + std::string(list.type_name()));
    }
}

std::vector<ItemOrder> decodeItemOrders(const json& list) {
    requireArray(list);
    std::vector<ItemOrder> orders;
    orders.reserve(list.size());
    for (const auto& entry : list) {
        ItemOrder order;
        if (!decodeOrderFields(entry, order)) continue;
        order.user = decodeUser(entry);
        orders.push_back(std::move(order));
    }
    return orders;
}

std::vector<ProfileOrder> decodeProfileOrders(const json& list) {
    requireArray(list);
    std::vector<ProfileOrder> orders;
    orders.reserve(list.size());
    for (const auto& entry : list) {
        ProfileOrder order;
        if (!decodeOrderFields(entry, order)) continue;
        order.item = decodeItem(entry);
        orders.push_back(std::move(order));
    }
    return orders;
}

Payload decodePayload(FetchOperation operation, const json& payload) {
    if (!payload.is_object()) {
        throw std::invalid_argument("payload is expected to be an object, got "
                                    + std::string(payload.type_name()));
    }

    Payload out;
    out.operation = operation;
    if (operation == FetchOperation::ITEM_ORDERS) {
        if (const json* orders = findField(payload, "orders")) {
            out.orders = decodeItemOrders(*orders);
        } else {
            std::cerr << "[DECODE] payload has no orders list\n";
        }
        return out;
    }

    const json* sell = findField(payload, "sell_orders", "sellOrders");
    const json* buy  = findField(payload, "buy_orders", "buyOrders");
    if (!sell && !buy) {
        std::cerr << "[DECODE] payload has no sell_orders or buy_orders list\n";
    }
    if (sell) out.sellOrders = decodeProfileOrders(*sell);
    if (buy)  out.buyOrders  = decodeProfileOrders(*buy);
    return out;
}

void to_json(json& j, const FloorPriceResult& r) {
    j = json{{"item_name", r.itemName}, {"prices", r.prices}};
}

void to_json(json& j, const ProfileOrderOptimizerResult& r) {
    j = json{{"item_name", r.itemName},
             {"floor_prices", r.floorPrices}};
    if (r.listedPrice) {
        j["listed_price"] = *r.listedPrice;
    } else {
        j["listed_price"] = nullptr;
    }
    if (!r.success) {
        j["error"] = r.error;
        j["http_status"] = r.httpStatus;
    }
}

void to_json(json& j, const ProfileOrder& o) {
    j = json{{"id", o.id},
             {"quantity", o.quantity},
             {"platform", o.platform},
             {"region", o.region},
             {"creation_date", o.createdAt},
             {"last_update", o.updatedAt}};
    j["platinum"]   = o.platinum ? json(*o.platinum) : json(nullptr);
    j["order_type"] = o.orderType ? json(toString(*o.orderType)) : json(nullptr);
    j["visible"]    = o.visible ? json(*o.visible) : json(nullptr);
    if (o.item) {
        j["item"] = json{{"id", o.item->id},
                         {"url_name", o.item->urlName},
                         {"names", o.item->names}};
    } else {
        j["item"] = nullptr;
    }
}

void to_json(json& j, const FloorPriceOutcome& o) {
    if (o.success) {
        j = json(o.result);
        return;
    }
    j = json{{"item_name", o.itemName},
             {"error", o.error},
             {"http_status", o.httpStatus}};
}
