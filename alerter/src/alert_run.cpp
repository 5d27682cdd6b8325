#include "alert_run.hpp"
#include "errors.hpp"
#include "orchestrator.hpp"
#include "state_store.hpp"
#include <spdlog/spdlog.h>
#include <fmt/format.h>
#include <fmt/ranges.h>

AlertRun::AlertRun(QuoteSource& quotes, NotificationSink& sink)
    : quotes_(quotes), sink_(sink) {}

RunSummary AlertRun::execute(const Config& cfg, const std::string& state_path,
                             const RunOptions& options, util::TimePoint now) {
    RunSummary summary;

    StateStore state = StateStore::load(state_path, cfg.retention);
    spdlog::debug("Loaded state from {}", state_path);

    auto tickers = cfg.unique_tickers();
    spdlog::debug("Fetching prices for {} tickers: {}", tickers.size(), fmt::join(tickers, ", "));

    auto quotes = quotes_.fetch_quotes(tickers);
    summary.quotes_fetched = quotes.size();

    AlertOrchestrator orchestrator(state, now);
    summary.triggered = orchestrator.run(cfg.alerts, quotes);
    spdlog::info("Fetched {}/{} quotes, {} alerts triggered",
                 quotes.size(), tickers.size(), summary.triggered.size());

    if (summary.triggered.empty()) {
        spdlog::debug("No alerts triggered");
    } else if (options.dry_run) {
        fmt::print("Dry run - would send the following alerts:\n");
        for (const auto& alert : summary.triggered) {
            fmt::print("  • {}: {} (price: ${:.2f})\n",
                       alert.name.empty() ? alert.ticker : alert.name,
                       alert.message, alert.price);
        }
    } else {
        dispatch(summary.triggered, summary);
    }

    // New prices only feed the next run's evaluation
    for (const auto& [ticker, quote] : quotes) {
        state.record_price(ticker, quote.price, now);
    }

    state.save(state_path);
    spdlog::debug("State saved to {}", state_path);

    return summary;
}

void AlertRun::dispatch(const std::vector<TriggeredAlert>& triggered, RunSummary& summary) {
    for (const auto& alert : triggered) {
        spdlog::debug("Sending alert: {} - {}", alert.ticker, alert.message);
        try {
            sink_.send_alert(alert.ticker, alert.name, alert.message, alert.price);
            summary.alerts_sent++;
            fmt::print("✓ Alert sent: {} - {}\n",
                       alert.name.empty() ? alert.ticker : alert.name, alert.message);
        } catch (const NotificationSendFailed& e) {
            summary.alerts_failed++;
            spdlog::error("Failed to send alert for {}: {}", alert.ticker, e.what());
        }
    }
}
