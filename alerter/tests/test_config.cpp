#include <catch2/catch_test_macros.hpp>
#include "../src/config.hpp"
#include "../src/errors.hpp"
#include "test_helpers.hpp"
#include <cstdlib>
#include <fstream>

namespace {

const char* VALID = R"({
  "ntfy": {"server": "https://ntfy.example.com", "topic": "prices", "token": "${ALERTER_TEST_TOKEN}"},
  "alerts": [
    {"ticker": "btc-usd", "name": "Bitcoin",
     "conditions": [{"type": "above", "value": 100000},
                    {"type": "percent_change", "value": 5, "period": "24h", "message": "BTC moving"}]},
    {"ticker": "AAPL", "conditions": [{"type": "absolute_change", "value": 2.5, "period": "7d"}]},
    {"ticker": "BTC-USD", "conditions": [{"type": "below", "value": 50000}]}
  ]
})";

std::string with_condition(const std::string& condition) {
    return R"({"ntfy": {"server": "https://ntfy.sh", "topic": "t"},
               "alerts": [{"ticker": "X", "conditions": [)" + condition + "]}]}";
}

} // namespace

TEST_CASE("Config parsing", "[config]") {
    setenv("ALERTER_TEST_TOKEN", "tk_secret", 1);

    SECTION("Valid config with defaults") {
        auto cfg = Config::parse(VALID);

        REQUIRE(cfg.ntfy.server == "https://ntfy.example.com");
        REQUIRE(cfg.ntfy.token == "tk_secret");
        REQUIRE(cfg.ntfy.priority == 3);
        REQUIRE(cfg.retention == test::days(7));
        REQUIRE(cfg.alerts.size() == 3);

        const auto& btc = cfg.alerts[0];
        REQUIRE(btc.ticker == "BTC-USD");
        REQUIRE(btc.name == "Bitcoin");
        REQUIRE(btc.conditions.size() == 2);
        REQUIRE(btc.conditions[0].kind == ConditionKind::Above);
        REQUIRE(btc.conditions[0].value == 100000);
        REQUIRE_FALSE(btc.conditions[0].message.has_value());
        REQUIRE(btc.conditions[1].period == test::hours(24));
        REQUIRE(btc.conditions[1].period_text == "24h");
        REQUIRE(btc.conditions[1].message == std::string("BTC moving"));

        REQUIRE(cfg.alerts[1].conditions[0].kind == ConditionKind::AbsoluteChange);
        REQUIRE(cfg.alerts[1].conditions[0].period == test::days(7));
    }

    SECTION("Unique tickers keep first-seen order") {
        auto cfg = Config::parse(VALID);
        auto tickers = cfg.unique_tickers();
        std::vector<std::string> expected{"BTC-USD", "AAPL"};
        REQUIRE(tickers == expected);
    }

    SECTION("Unset variables stay literal") {
        unsetenv("ALERTER_TEST_TOKEN");
        auto cfg = Config::parse(VALID);
        REQUIRE(cfg.ntfy.token == "${ALERTER_TEST_TOKEN}");
    }

    SECTION("Quotes and backslashes in a variable stay inside the string") {
        setenv("ALERTER_TEST_TOKEN", R"(ab"c\d", "priority": 9, "x": ")", 1);
        auto cfg = Config::parse(VALID);
        REQUIRE(cfg.ntfy.token == R"(ab"c\d", "priority": 9, "x": ")");
        REQUIRE(cfg.ntfy.priority == 3);
    }

    SECTION("Variables expand inside nested strings") {
        setenv("ALERTER_TEST_TICKER", "msft", 1);
        auto cfg = Config::parse(R"({"ntfy": {"server": "s", "topic": "t"},
                                     "alerts": [{"ticker": "${ALERTER_TEST_TICKER}",
                                                 "conditions": [{"type": "above", "value": 1}]}]})");
        REQUIRE(cfg.alerts[0].ticker == "MSFT");
        unsetenv("ALERTER_TEST_TICKER");
    }

    SECTION("Explicit priority and retention") {
        auto cfg = Config::parse(R"({"ntfy": {"server": "s", "topic": "t", "priority": 5},
                                     "retention": "48h",
                                     "alerts": [{"ticker": "X", "conditions": [{"type": "above", "value": 1}]}]})");
        REQUIRE(cfg.ntfy.priority == 5);
        REQUIRE(cfg.retention == test::hours(48));
    }

    SECTION("Loads from a file") {
        auto path = test::temp_path("config");
        {
            std::ofstream out(path);
            out << VALID;
        }
        auto cfg = Config::load(path);
        REQUIRE(cfg.alerts.size() == 3);
        std::filesystem::remove(path);
    }
}

TEST_CASE("Config validation", "[config]") {
    SECTION("Missing file") {
        REQUIRE_THROWS_AS(Config::load(test::temp_path("no_config")), ConfigInvalid);
    }

    SECTION("Malformed JSON") {
        REQUIRE_THROWS_AS(Config::parse("{\"ntfy\": "), ConfigInvalid);
    }

    SECTION("ntfy settings") {
        REQUIRE_THROWS_AS(Config::parse(R"({"ntfy": {"topic": "t"},
            "alerts": [{"ticker": "X", "conditions": [{"type": "above", "value": 1}]}]})"), ConfigInvalid);
        REQUIRE_THROWS_AS(Config::parse(R"({"ntfy": {"server": "s"},
            "alerts": [{"ticker": "X", "conditions": [{"type": "above", "value": 1}]}]})"), ConfigInvalid);
        REQUIRE_THROWS_AS(Config::parse(R"({"ntfy": {"server": "s", "topic": "t", "priority": 6},
            "alerts": [{"ticker": "X", "conditions": [{"type": "above", "value": 1}]}]})"), ConfigInvalid);
    }

    SECTION("Alerts") {
        REQUIRE_THROWS_AS(Config::parse(R"({"ntfy": {"server": "s", "topic": "t"}, "alerts": []})"),
                          ConfigInvalid);
        REQUIRE_THROWS_AS(Config::parse(R"({"ntfy": {"server": "s", "topic": "t"},
            "alerts": [{"conditions": [{"type": "above", "value": 1}]}]})"), ConfigInvalid);
        REQUIRE_THROWS_AS(Config::parse(R"({"ntfy": {"server": "s", "topic": "t"},
            "alerts": [{"ticker": "X", "conditions": []}]})"), ConfigInvalid);
    }

    SECTION("Conditions") {
        REQUIRE_NOTHROW(Config::parse(with_condition(R"({"type": "above", "value": 1})")));
        REQUIRE_THROWS_AS(Config::parse(with_condition(R"({"type": "sideways", "value": 1})")),
                          ConfigInvalid);
        REQUIRE_THROWS_AS(Config::parse(with_condition(R"({"type": "above", "value": 0})")),
                          ConfigInvalid);
        REQUIRE_THROWS_AS(Config::parse(with_condition(R"({"type": "below", "value": -3})")),
                          ConfigInvalid);
        REQUIRE_THROWS_AS(Config::parse(with_condition(R"({"type": "above"})")), ConfigInvalid);
        REQUIRE_THROWS_AS(Config::parse(with_condition(R"({"type": "percent_change", "value": 5})")),
                          ConfigInvalid);
        REQUIRE_THROWS_AS(Config::parse(with_condition(R"({"type": "absolute_change", "value": 5})")),
                          ConfigInvalid);
        REQUIRE_THROWS_AS(Config::parse(with_condition(
                              R"({"type": "percent_change", "value": 5, "period": "soon"})")),
                          ConfigInvalid);
    }

    SECTION("Change periods must be positive and in range") {
        REQUIRE_THROWS_AS(Config::parse(with_condition(
                              R"({"type": "percent_change", "value": 5, "period": "0d"})")),
                          ConfigInvalid);
        REQUIRE_THROWS_AS(Config::parse(with_condition(
                              R"({"type": "absolute_change", "value": 5, "period": "1ms"})")),
                          ConfigInvalid);
        REQUIRE_THROWS_AS(Config::parse(with_condition(
                              R"({"type": "percent_change", "value": 5, "period": "99999999999999999999d"})")),
                          ConfigInvalid);
        REQUIRE_NOTHROW(Config::parse(with_condition(
                            R"({"type": "percent_change", "value": 5, "period": "30m"})")));
    }

    SECTION("Error names the offending condition") {
        try {
            Config::parse(with_condition(R"({"type": "above", "value": 1}, {"type": "above", "value": 0})"));
            FAIL("expected ConfigInvalid");
        } catch (const ConfigInvalid& e) {
            REQUIRE(std::string(e.what()) == "alerts[0].conditions[1]: value must be positive");
        }
    }
}
