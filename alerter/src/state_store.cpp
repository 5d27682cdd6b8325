#include "state_store.hpp"
#include "errors.hpp"
#include <spdlog/spdlog.h>
#include <fmt/format.h>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <system_error>

namespace fs = std::filesystem;

namespace {

nlohmann::json record_to_json(const PriceRecord& rec) {
    return {
        {"price", rec.price},
        {"timestamp", util::format_iso8601(rec.timestamp)}
    };
}

PriceRecord record_from_json(const nlohmann::json& j, const std::string& where) {
    if (!j.is_object() || !j.contains("price") || !j["price"].is_number()) {
        throw StateCorrupt(where + ": price record must have a numeric price");
    }
    if (!j.contains("timestamp") || !j["timestamp"].is_string()) {
        throw StateCorrupt(where + ": price record must have a timestamp");
    }

    auto ts = util::parse_iso8601(j["timestamp"].get<std::string>());
    if (!ts) {
        throw StateCorrupt(where + ": bad timestamp '" +
                           j["timestamp"].get<std::string>() + "'");
    }
    return PriceRecord{j["price"].get<double>(), *ts};
}

const nlohmann::json* object_field(const nlohmann::json& doc, const char* name) {
    if (!doc.contains(name) || doc[name].is_null()) {
        return nullptr;
    }
    if (!doc[name].is_object()) {
        throw StateCorrupt(fmt::format("'{}' must be an object", name));
    }
    return &doc[name];
}

} // namespace

StateStore::StateStore(std::chrono::seconds retention) : retention_(retention) {}

StateStore StateStore::load(const std::string& path, std::chrono::seconds retention) {
    std::error_code ec;
    auto status = fs::status(path, ec);
    if (ec && status.type() != fs::file_type::not_found) {
        throw StateCorrupt(fmt::format("cannot stat state file {}: {}", path, ec.message()));
    }
    if (status.type() == fs::file_type::not_found) {
        spdlog::debug("No state file at {}, starting fresh", path);
        return StateStore(retention);
    }
    if (status.type() != fs::file_type::regular) {
        throw StateCorrupt("state path " + path + " is not a regular file");
    }

    auto size = fs::file_size(path, ec);
    if (ec) {
        throw StateCorrupt(fmt::format("cannot size state file {}: {}", path, ec.message()));
    }

    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw StateCorrupt("cannot open state file " + path);
    }
    std::ostringstream buf;
    if (size > 0) {
        // Streaming zero bytes sets failbit, so only check a non-empty read
        buf << in.rdbuf();
        if (in.bad() || buf.fail()) {
            throw StateCorrupt("reading state file " + path + " failed");
        }
    }
    std::string content = buf.str();

    if (util::trim(content).empty()) {
        spdlog::debug("State file {} is empty, starting fresh", path);
        return StateStore(retention);
    }

    nlohmann::json doc;
    try {
        doc = nlohmann::json::parse(content);
    } catch (const nlohmann::json::parse_error& e) {
        throw StateCorrupt(fmt::format("parsing state file {}: {}", path, e.what()));
    }

    try {
        return from_json(doc, retention);
    } catch (const StateCorrupt& e) {
        throw StateCorrupt(fmt::format("state file {}: {}", path, e.what()));
    }
}

StateStore StateStore::from_json(const nlohmann::json& doc, std::chrono::seconds retention) {
    if (!doc.is_object()) {
        throw StateCorrupt("state document must be an object");
    }

    StateStore store(retention);

    if (auto prices = object_field(doc, "prices")) {
        for (const auto& [ticker, rec] : prices->items()) {
            store.tickers_[ticker].last = record_from_json(rec, "prices." + ticker);
        }
    }

    if (auto flags = object_field(doc, "triggered_alerts")) {
        for (const auto& [key, val] : flags->items()) {
            if (!val.is_boolean()) {
                throw StateCorrupt("triggered_alerts." + key + " must be a boolean");
            }
            store.triggered_[key] = val.get<bool>();
        }
    }

    if (auto history = object_field(doc, "price_history")) {
        for (const auto& [ticker, list] : history->items()) {
            auto& state = store.tickers_[ticker];
            if (list.is_null()) continue;
            if (!list.is_array()) {
                throw StateCorrupt("price_history." + ticker + " must be an array");
            }
            for (size_t i = 0; i < list.size(); i++) {
                state.history.push_back(
                    record_from_json(list[i], fmt::format("price_history.{}[{}]", ticker, i)));
            }
        }
    }

    return store;
}

nlohmann::json StateStore::to_json() const {
    nlohmann::json prices = nlohmann::json::object();
    nlohmann::json history = nlohmann::json::object();

    for (const auto& [ticker, state] : tickers_) {
        if (state.last) {
            prices[ticker] = record_to_json(*state.last);
        }
        nlohmann::json list = nlohmann::json::array();
        for (const auto& rec : state.history) {
            list.push_back(record_to_json(rec));
        }
        history[ticker] = list;
    }

    nlohmann::json flags = nlohmann::json::object();
    for (const auto& [key, val] : triggered_) {
        flags[key] = val;
    }

    return {
        {"prices", prices},
        {"triggered_alerts", flags},
        {"price_history", history}
    };
}

void StateStore::save(const std::string& path) const {
    std::string body = to_json().dump(2);
    std::string tmp_path = path + ".tmp";

    {
        std::ofstream out(tmp_path, std::ios::binary | std::ios::trunc);
        if (!out) {
            throw StateSaveFailed("cannot open " + tmp_path + " for writing");
        }
        out << body << '\n';
        out.flush();
        if (!out) {
            throw StateSaveFailed("writing " + tmp_path + " failed");
        }
    }

    std::error_code ec;
    fs::rename(tmp_path, path, ec);
    if (ec) {
        fs::remove(tmp_path, ec);
        throw StateSaveFailed(fmt::format("replacing {}: {}", path, ec.message()));
    }

    spdlog::debug("Saved state: {} tickers, {} trigger flags", tickers_.size(), triggered_.size());
}

void StateStore::record_price(const std::string& ticker, double price, util::TimePoint now) {
    PriceRecord rec{price, now};
    auto& state = tickers_[ticker];
    state.last = rec;
    state.history.push_back(rec);
    prune_history(state, now);
}

void StateStore::prune_history(TickerState& state, util::TimePoint now) {
    auto cutoff = now - retention_;
    auto& history = state.history;

    std::deque<PriceRecord> kept;
    for (const auto& rec : history) {
        if (rec.timestamp >= cutoff) {
            kept.push_back(rec);
        }
    }
    history.swap(kept);
}

std::optional<double> StateStore::last_price(const std::string& ticker) const {
    auto it = tickers_.find(ticker);
    if (it == tickers_.end() || !it->second.last) return std::nullopt;
    return it->second.last->price;
}

std::optional<double> StateStore::price_at(const std::string& ticker, std::chrono::seconds ago,
                                           util::TimePoint now) const {
    auto it = tickers_.find(ticker);
    if (it == tickers_.end() || it->second.history.empty()) {
        return std::nullopt;
    }

    const auto& history = it->second.history;
    auto target = now - ago;

    const PriceRecord* closest = nullptr;
    for (const auto& rec : history) {
        if (rec.timestamp <= target) {
            if (!closest || rec.timestamp > closest->timestamp) {
                closest = &rec;
            }
        }
    }

    if (!closest) {
        return history.front().price;
    }
    return closest->price;
}

bool StateStore::is_triggered(const std::string& key) const {
    auto it = triggered_.find(key);
    return it != triggered_.end() && it->second;
}

void StateStore::set_triggered(const std::string& key, bool triggered) {
    triggered_[key] = triggered;
}

std::string StateStore::alert_key(const std::string& ticker, ConditionKind kind, double value) {
    return fmt::format("{}:{}:{:.2f}", ticker, kind_to_string(kind), value);
}

const TickerState* StateStore::get_ticker(const std::string& ticker) const {
    auto it = tickers_.find(ticker);
    if (it == tickers_.end()) return nullptr;
    return &it->second;
}

std::vector<std::string> StateStore::tickers() const {
    std::vector<std::string> out;
    for (const auto& [ticker, _] : tickers_) {
        out.push_back(ticker);
    }
    return out;
}
