#include "switchyard/core/context.h"
#include "switchyard/core/registry.h"
#include "switchyard/utils/logging.hpp"
#include "switchyard/variants/shapes.h"
#include "switchyard/variants/sorting.h"
#include "switchyard/variants/ticket_ordering.h"
#include "switchyard/variants/trading.h"
#include <exception>
#include <iostream>
#include <string>
#include <vector>

using namespace switchyard;
using namespace switchyard::core;
using namespace switchyard::variants;

namespace {

std::string join(const std::vector<int>& values) {
    std::string out;
    for (size_t i = 0; i < values.size(); ++i) {
        out += (i ? ", " : "") + std::to_string(values[i]);
    }
    return "[" + out + "]";
}

// Configuration layout:
// {
//   "log_level": "info",
//   "sorting": {"descending": false, "cutoff": 16},
//   "tickets": {"strategy": "random", "seed": 7},
//   "trading": {"strategy": "minmax", "min_price": 30000.0, "max_price": 32000.0}
// }
utils::LogLevel parseLogLevel(const std::string& name) {
    if (auto level = utils::logLevelFromString(name)) {
        return *level;
    }
    throw ConfigurationError("log_level", "unknown level '" + name + "'");
}

} // namespace

int main(int argc, char** argv) {
    try {
        const Options config = argc > 1 ? Options::fromFile(argv[1]) : Options();
        utils::setLogLevel(parseLogLevel(config.get<std::string>("log_level", "info")));

        // Shapes: create by key
        Registry<ShapeCapability> shapes;
        registerShapeVariants(shapes);
        for (const auto& key : shapes.listKeys()) {
            std::cout << shapes.create(key)->perform() << "\n";
        }

        // Sorting: same call, different variant
        Registry<SortCapability> sorters;
        registerSortingVariants(sorters);
        Context<std::vector<int>, std::vector<int>> sorting;
        sorting.setConfiguration(config.section("sorting"));

        const std::vector<int> input{4, 2, 7, 1};
        for (const auto& key : sorters.listKeys()) {
            sorting.selectFrom(sorters, key);
            std::cout << key << " sort of " << join(input) << " -> "
                      << join(sorting.execute(input)) << "\n";
        }

        // Support tickets
        const Options ticketConfig = config.section("tickets");
        Registry<OrderingCapability> orderings;
        registerOrderingVariants(orderings);
        OrderingContext ordering;
        ordering.setConfiguration(ticketConfig);
        ordering.selectFrom(orderings, ticketConfig.get<std::string>("strategy", "fifo"));

        SupportDesk desk;
        desk.addTicket("Zack Ali", "My computer makes strange sounds!");
        desk.addTicket("Linus Sebastian", "I can't upload any videos, please help.");
        desk.addTicket("John Smith", "VSCode doesn't automatically solve my bugs.");
        for (const auto& ticket : desk.process(ordering)) {
            std::cout << "handled " << ticket.id << " (" << ticket.customer << ")\n";
        }

        // Trading bot
        const Options tradingConfig = config.section("trading");
        Registry<SignalCapability> signals;
        registerSignalVariants(signals);
        Context<std::vector<double>, Signal> bot;
        bot.setConfiguration(tradingConfig);
        bot.selectFrom(signals, tradingConfig.get<std::string>("strategy", "minmax"));

        const std::vector<double> prices{31800.0, 32100.0, 31900.0, 32500.0};
        std::cout << bot.strategyName() << " signal for BTC/USD: "
                  << toString(bot.execute(prices)) << "\n";
    } catch (const std::exception& e) {
        SWLOG_CRITICAL(e.what());
        return 1;
    }

    return 0;
}
