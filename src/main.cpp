#include <iostream>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

#include "core/tool_config.hpp"
#include "engine/floor_price_resolver.hpp"
#include "engine/market_tool.hpp"
#include "exchange/market_errors.hpp"

// items the tool reports when started without a command
static const std::vector<std::string> defaultItems = {
    "overextended", "narrow_minded", "catalyzing_shields", "blind_rage"
};

static void printUsage(const char* prog) {
    std::cerr << "usage:\n"
              << "  " << prog << " floor <item> [<item>...] [--count N] [--json]\n"
              << "  " << prog << " profile <user> [--buy] [--json]\n"
              << "  " << prog << " verify <user> [--buy] [--count N] [--all] [--json]\n"
              << "options:\n"
              << "  --config <path>   config file (default config/tool_config.json)\n";
}

struct CliArgs {
    std::string command{"floor"};
    std::vector<std::string> targets;
    std::string configPath{"config/tool_config.json"};
    int count{-1};       // -1 => defaultCount from config
    bool json{false};
    bool buy{false};
    bool all{false};     // verify hidden listings too
};

static bool parseArgs(int argc, char** argv, CliArgs& out) {
    std::vector<std::string> positional;
    for (int i = 1; i < argc; ++i) {
        std::string arg(argv[i]);
        if (arg == "--json") {
            out.json = true;
        } else if (arg == "--buy") {
            out.buy = true;
        } else if (arg == "--all") {
            out.all = true;
        } else if (arg == "--count" || arg == "--config") {
            if (i + 1 >= argc) {
                std::cerr << "[MAIN] " << arg << " needs a value\n";
                return false;
            }
            std::string value(argv[++i]);
            if (arg == "--config") {
                out.configPath = value;
                continue;
            }
            try {
                out.count = std::stoi(value);
            } catch (const std::exception&) {
                std::cerr << "[MAIN] invalid --count value: " << value << "\n";
                return false;
            }
            if (out.count < 0) {
                std::cerr << "[MAIN] --count must not be negative\n";
                return false;
            }
        } else if (arg == "--help" || arg == "-h") {
            return false;
        } else {
            positional.push_back(arg);
        }
    }

    if (positional.empty()) {
        out.targets = defaultItems;
        return true;
    }
    out.command = positional[0];
    out.targets.assign(positional.begin() + 1, positional.end());
    if (out.command != "floor" && out.command != "profile" && out.command != "verify") {
        std::cerr << "[MAIN] unknown command: " << out.command << "\n";
        return false;
    }
    if (out.targets.empty()) {
        std::cerr << "[MAIN] " << out.command << " needs at least one name\n";
        return false;
    }
    return true;
}

static int runFloor(MarketTool& tool, const CliArgs& args, int count) {
    auto outcomes = tool.resolveFloorPricesBatch(args.targets, count);
    bool anyFailed = false;
    nlohmann::json out = nlohmann::json::array();
    for (const auto& o : outcomes) {
        anyFailed = anyFailed || !o.success;
        if (args.json) {
            out.push_back(nlohmann::json(o));
        } else if (o.success) {
            std::cout << formatFloorPrices(o.result, count) << "\n";
        } else {
            std::cout << o.itemName << " failed: " << o.error << "\n";
        }
    }
    if (args.json) {
        std::cout << out.dump(2) << "\n";
    }
    return anyFailed ? 2 : 0;
}

static int runProfile(MarketTool& tool, const CliArgs& args, OrderType type) {
    nlohmann::json out = nlohmann::json::object();
    for (const auto& user : args.targets) {
        auto orders = tool.getProfileOrders(user, type);
        if (args.json) {
            out[user] = orders;
            continue;
        }
        std::cout << user << " has " << orders.size() << " " << toString(type) << " orders\n";
        for (const auto& o : orders) {
            std::cout << "  " << (o.item ? o.item->urlName : std::string("<no item>"))
                      << " @ " << (o.platinum ? std::to_string(*o.platinum) : std::string("?"))
                      << (o.visible.value_or(false) ? "" : " (hidden)") << "\n";
        }
    }
    if (args.json) {
        std::cout << out.dump(2) << "\n";
    }
    return 0;
}

static int runVerify(MarketTool& tool, const CliArgs& args, OrderType type, int count) {
    bool anyFailed = false;
    nlohmann::json out = nlohmann::json::object();
    for (const auto& user : args.targets) {
        auto results = tool.verifyProfileOrders(user, type, count, !args.all);
        if (args.json) {
            out[user] = results;
        }
        for (const auto& r : results) {
            anyFailed = anyFailed || !r.success;
            if (args.json) continue;
            std::cout << r.itemName << ": listed "
                      << (r.listedPrice ? std::to_string(*r.listedPrice) : std::string("?"));
            if (r.success) {
                std::cout << " | " << formatFloorPrices({r.itemName, r.floorPrices}, count) << "\n";
            } else {
                std::cout << " | floor unavailable: " << r.error << "\n";
            }
        }
    }
    if (args.json) {
        std::cout << out.dump(2) << "\n";
    }
    return anyFailed ? 2 : 0;
}

int main(int argc, char** argv) {
    CliArgs args;
    if (!parseArgs(argc, argv, args)) {
        printUsage(argv[0]);
        return 1;
    }

    ToolConfig cfg = loadToolConfig(args.configPath);
    int count = (args.count >= 0) ? args.count : cfg.defaultCount;
    OrderType type = args.buy ? OrderType::BUY : OrderType::SELL;

    MarketTool tool(cfg);
    int rc = 0;
    try {
        tool.initialize();
        if (args.command == "floor") {
            rc = runFloor(tool, args, count);
        } else if (args.command == "profile") {
            rc = runProfile(tool, args, type);
        } else {
            rc = runVerify(tool, args, type, count);
        }
    } catch (const MarketApiError& e) {
        std::cerr << "[MAIN] " << e.what() << "\n";
        rc = 2;
    } catch (const ProfileIntegrityError& e) {
        std::cerr << "[MAIN] integrity violation: " << e.what() << "\n";
        rc = 2;
    } catch (const std::exception& e) {
        std::cerr << "[MAIN] " << e.what() << "\n";
        rc = 1;
    }

    tool.shutdown();
    return rc;
}
