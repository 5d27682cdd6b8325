#include "config.hpp"
#include "errors.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <fmt/format.h>
#include <nlohmann/json.hpp>
#include <fstream>
#include <set>
#include <sstream>

namespace {

std::string get_string(const nlohmann::json& obj, const char* field, const std::string& where) {
    if (!obj.contains(field) || obj[field].is_null()) return "";
    if (!obj[field].is_string()) {
        throw ConfigInvalid(fmt::format("{}.{} must be a string", where, field));
    }
    return obj[field].get<std::string>();
}

AlertCondition parse_condition(const nlohmann::json& j, const std::string& where) {
    if (!j.is_object()) {
        throw ConfigInvalid(where + " must be an object");
    }

    std::string type = get_string(j, "type", where);
    auto kind = kind_from_string(type);
    if (!kind) {
        throw ConfigInvalid(fmt::format(
            "{}: invalid type \"{}\" (must be above, below, percent_change, or absolute_change)",
            where, type));
    }

    AlertCondition cond;
    cond.kind = *kind;

    if (!j.contains("value") || !j["value"].is_number()) {
        throw ConfigInvalid(where + ": value must be a number");
    }
    cond.value = j["value"].get<double>();

    cond.period_text = get_string(j, "period", where);
    if (!cond.period_text.empty()) {
        cond.period = parse_period(cond.period_text);
        if (!cond.period) {
            throw ConfigInvalid(fmt::format("{}: invalid period \"{}\"", where, cond.period_text));
        }
    }

    std::string message = get_string(j, "message", where);
    if (!message.empty()) {
        cond.message = message;
    }

    return cond;
}

// Expands ${VAR} inside string values only, so a variable can never
// change the document's structure.
void expand_strings(nlohmann::json& node) {
    if (node.is_string()) {
        node = util::expand_env_vars(node.get<std::string>());
    } else if (node.is_object() || node.is_array()) {
        for (auto& child : node) {
            expand_strings(child);
        }
    }
}

} // namespace

Config Config::load(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw ConfigInvalid("reading config file " + path + ": cannot open");
    }
    std::ostringstream buf;
    buf << in.rdbuf();

    Config cfg = parse(buf.str());
    spdlog::debug("Loaded config from {}", path);
    return cfg;
}

Config Config::parse(const std::string& content) {
    nlohmann::json doc;
    try {
        doc = nlohmann::json::parse(content);
    } catch (const nlohmann::json::parse_error& e) {
        throw ConfigInvalid(std::string("parsing config file: ") + e.what());
    }
    expand_strings(doc);
    if (!doc.is_object()) {
        throw ConfigInvalid("config must be an object");
    }

    Config cfg;

    if (doc.contains("ntfy")) {
        const auto& n = doc["ntfy"];
        if (!n.is_object()) {
            throw ConfigInvalid("ntfy must be an object");
        }
        cfg.ntfy.server = get_string(n, "server", "ntfy");
        cfg.ntfy.topic = get_string(n, "topic", "ntfy");
        cfg.ntfy.username = get_string(n, "username", "ntfy");
        cfg.ntfy.password = get_string(n, "password", "ntfy");
        cfg.ntfy.token = get_string(n, "token", "ntfy");
        if (n.contains("priority") && !n["priority"].is_null()) {
            if (!n["priority"].is_number_integer()) {
                throw ConfigInvalid("ntfy.priority must be an integer");
            }
            cfg.ntfy.priority = n["priority"].get<int>();
        }
    }
    if (cfg.ntfy.priority == 0) {
        cfg.ntfy.priority = 3;
    }

    std::string retention = get_string(doc, "retention", "config");
    if (!retention.empty()) {
        cfg.retention_text = retention;
    }
    auto parsed_retention = parse_period(cfg.retention_text);
    if (!parsed_retention || parsed_retention->count() <= 0) {
        throw ConfigInvalid(fmt::format("retention \"{}\" must be a positive duration",
                                        cfg.retention_text));
    }
    cfg.retention = *parsed_retention;

    if (doc.contains("alerts") && !doc["alerts"].is_null()) {
        const auto& alerts = doc["alerts"];
        if (!alerts.is_array()) {
            throw ConfigInvalid("alerts must be an array");
        }
        for (size_t i = 0; i < alerts.size(); i++) {
            std::string where = fmt::format("alerts[{}]", i);
            const auto& a = alerts[i];
            if (!a.is_object()) {
                throw ConfigInvalid(where + " must be an object");
            }

            AlertConfig alert;
            alert.ticker = util::to_upper(util::trim(get_string(a, "ticker", where)));
            alert.name = get_string(a, "name", where);

            if (a.contains("conditions") && !a["conditions"].is_null()) {
                const auto& conds = a["conditions"];
                if (!conds.is_array()) {
                    throw ConfigInvalid(where + ".conditions must be an array");
                }
                for (size_t j = 0; j < conds.size(); j++) {
                    alert.conditions.push_back(
                        parse_condition(conds[j], fmt::format("{}.conditions[{}]", where, j)));
                }
            }
            cfg.alerts.push_back(std::move(alert));
        }
    }

    cfg.validate();
    return cfg;
}

void Config::validate() const {
    if (ntfy.server.empty()) {
        throw ConfigInvalid("ntfy.server is required");
    }
    if (ntfy.topic.empty()) {
        throw ConfigInvalid("ntfy.topic is required");
    }
    if (ntfy.priority < 1 || ntfy.priority > 5) {
        throw ConfigInvalid("ntfy.priority must be between 1 and 5");
    }

    if (alerts.empty()) {
        throw ConfigInvalid("at least one alert is required");
    }

    for (size_t i = 0; i < alerts.size(); i++) {
        const auto& alert = alerts[i];
        if (alert.ticker.empty()) {
            throw ConfigInvalid(fmt::format("alerts[{}].ticker is required", i));
        }
        if (alert.conditions.empty()) {
            throw ConfigInvalid(fmt::format("alerts[{}].conditions is required", i));
        }

        for (size_t j = 0; j < alert.conditions.size(); j++) {
            const auto& cond = alert.conditions[j];
            if (!(cond.value > 0)) {
                throw ConfigInvalid(fmt::format(
                    "alerts[{}].conditions[{}]: value must be positive", i, j));
            }
            if (cond.is_change_based() && !cond.period) {
                throw ConfigInvalid(fmt::format(
                    "alerts[{}].conditions[{}]: period is required for {} conditions",
                    i, j, kind_to_string(cond.kind)));
            }
            if (cond.is_change_based() && cond.period->count() <= 0) {
                throw ConfigInvalid(fmt::format(
                    "alerts[{}].conditions[{}]: period must be positive", i, j));
            }
        }
    }
}

std::vector<std::string> Config::unique_tickers() const {
    std::set<std::string> seen;
    std::vector<std::string> tickers;

    for (const auto& alert : alerts) {
        if (seen.insert(alert.ticker).second) {
            tickers.push_back(alert.ticker);
        }
    }
    return tickers;
}
