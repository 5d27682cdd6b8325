#include "orchestrator.hpp"
#include <spdlog/spdlog.h>

AlertOrchestrator::AlertOrchestrator(StateStore& state, util::TimePoint now)
    : evaluator_(state, now) {}

std::vector<TriggeredAlert> AlertOrchestrator::run(const std::vector<AlertConfig>& alerts,
                                                   const std::map<std::string, Quote>& quotes) {
    std::vector<TriggeredAlert> triggered;

    for (const auto& alert : alerts) {
        auto it = quotes.find(alert.ticker);
        if (it == quotes.end()) {
            spdlog::debug("No quote for {}, skipping {} conditions",
                          alert.ticker, alert.conditions.size());
            continue;
        }

        for (const auto& cond : alert.conditions) {
            auto fired = evaluator_.evaluate(alert.ticker, alert.name, cond, it->second);
            if (fired) {
                triggered.push_back(std::move(*fired));
            }
        }
    }

    return triggered;
}
