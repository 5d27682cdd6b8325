#pragma once

#include "config.hpp"
#include "evaluator.hpp"
#include "notification_sink.hpp"
#include "quote_source.hpp"
#include <string>
#include <vector>

struct RunOptions {
    bool dry_run = false;
};

struct RunSummary {
    size_t quotes_fetched = 0;
    size_t alerts_sent = 0;
    size_t alerts_failed = 0;
    std::vector<TriggeredAlert> triggered;
};

// One load -> fetch -> evaluate -> notify -> record -> save cycle.
class AlertRun {
public:
    AlertRun(QuoteSource& quotes, NotificationSink& sink);

    // Throws StateCorrupt, AllQuotesFailed, StateSaveFailed. Send failures are
    // counted in the summary and do not stop the run.
    RunSummary execute(const Config& cfg, const std::string& state_path,
                       const RunOptions& options,
                       util::TimePoint now = std::chrono::system_clock::now());

private:
    QuoteSource& quotes_;
    NotificationSink& sink_;

    void dispatch(const std::vector<TriggeredAlert>& triggered, RunSummary& summary);
};
