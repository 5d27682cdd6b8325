#pragma once

#include "condition.hpp"
#include "util.hpp"
#include <string>
#include <map>
#include <deque>
#include <vector>
#include <chrono>
#include <optional>
#include <nlohmann/json.hpp>

struct PriceRecord {
    double price;
    util::TimePoint timestamp;
};

struct TickerState {
    std::optional<PriceRecord> last;   // previous run's price
    std::deque<PriceRecord> history;   // insertion order, oldest first
};

// Persisted prices, price history and trigger flags for one run.
// Loaded once at start, mutated in memory, saved once at the end.
class StateStore {
public:
    static constexpr std::chrono::seconds DEFAULT_RETENTION{7 * 24 * 3600};

    explicit StateStore(std::chrono::seconds retention = DEFAULT_RETENTION);

    // Missing or empty file is a first run. Throws StateCorrupt otherwise.
    static StateStore load(const std::string& path,
                           std::chrono::seconds retention = DEFAULT_RETENTION);

    // Writes to a temp file beside `path` and renames it over. Throws StateSaveFailed.
    void save(const std::string& path) const;

    nlohmann::json to_json() const;
    static StateStore from_json(const nlohmann::json& doc,
                                std::chrono::seconds retention = DEFAULT_RETENTION);

    // Sets last price, appends to history, prunes entries older than the retention window.
    void record_price(const std::string& ticker, double price, util::TimePoint now);

    std::optional<double> last_price(const std::string& ticker) const;

    // Latest entry at or before now - ago; oldest entry when none is that old.
    // nullopt only when the ticker has no history.
    std::optional<double> price_at(const std::string& ticker, std::chrono::seconds ago,
                                   util::TimePoint now) const;

    bool is_triggered(const std::string& key) const;
    void set_triggered(const std::string& key, bool triggered);

    // "<ticker>:<kind>:<value to 2 decimals>". Values that round alike share a flag.
    static std::string alert_key(const std::string& ticker, ConditionKind kind, double value);

    const TickerState* get_ticker(const std::string& ticker) const;
    std::vector<std::string> tickers() const;
    const std::map<std::string, bool>& triggered_alerts() const { return triggered_; }
    std::chrono::seconds retention() const { return retention_; }

private:
    std::chrono::seconds retention_;
    std::map<std::string, TickerState> tickers_;
    std::map<std::string, bool> triggered_;

    void prune_history(TickerState& state, util::TimePoint now);
};
