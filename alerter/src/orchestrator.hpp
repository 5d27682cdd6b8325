#pragma once

#include "config.hpp"
#include "evaluator.hpp"
#include "quote_source.hpp"
#include "state_store.hpp"
#include <map>
#include <string>
#include <vector>

class AlertOrchestrator {
public:
    AlertOrchestrator(StateStore& state, util::TimePoint now);

    // Evaluates every (ticker, condition) pair in config order. Tickers without
    // a quote this run are skipped. Returns fired alerts in config order.
    std::vector<TriggeredAlert> run(const std::vector<AlertConfig>& alerts,
                                    const std::map<std::string, Quote>& quotes);

private:
    ConditionEvaluator evaluator_;
};
