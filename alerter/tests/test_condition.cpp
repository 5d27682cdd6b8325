#include <catch2/catch_test_macros.hpp>
#include "../src/condition.hpp"
#include "../src/util.hpp"
#include <cstdlib>

TEST_CASE("Period parsing", "[condition]") {
    SECTION("Day suffix") {
        REQUIRE(parse_period("7d") == std::chrono::seconds(7 * 24 * 3600));
        REQUIRE(parse_period("1d") == std::chrono::seconds(86400));
    }

    SECTION("Hour, minute and second units") {
        REQUIRE(parse_period("24h") == std::chrono::seconds(24 * 3600));
        REQUIRE(parse_period("90m") == std::chrono::seconds(5400));
        REQUIRE(parse_period("45s") == std::chrono::seconds(45));
        REQUIRE(parse_period("1h30m") == std::chrono::seconds(5400));
        REQUIRE(parse_period("1.5h") == std::chrono::seconds(5400));
    }

    SECTION("Rejects malformed periods") {
        REQUIRE_FALSE(parse_period("").has_value());
        REQUIRE_FALSE(parse_period("abc").has_value());
        REQUIRE_FALSE(parse_period("5x").has_value());
        REQUIRE_FALSE(parse_period("h").has_value());
        REQUIRE_FALSE(parse_period("d").has_value());
        REQUIRE_FALSE(parse_period("1.5d").has_value());
        REQUIRE_FALSE(parse_period("24").has_value());
    }

    SECTION("Rejects periods too long to represent") {
        REQUIRE_FALSE(parse_period("99999999999999999999d").has_value());
        REQUIRE_FALSE(parse_period("36501d").has_value());
        REQUIRE_FALSE(parse_period("1e300h").has_value());
        REQUIRE_FALSE(parse_period("99999999999999999999999h").has_value());
        REQUIRE(parse_period("36500d") == std::chrono::seconds(36500LL * 24 * 3600));
    }

    SECTION("Zero-length periods parse as zero") {
        REQUIRE(parse_period("0d") == std::chrono::seconds(0));
        REQUIRE(parse_period("1ms") == std::chrono::seconds(0));
    }
}

TEST_CASE("Condition kinds", "[condition]") {
    REQUIRE(kind_from_string("above") == ConditionKind::Above);
    REQUIRE(kind_from_string("below") == ConditionKind::Below);
    REQUIRE(kind_from_string("percent_change") == ConditionKind::PercentChange);
    REQUIRE(kind_from_string("absolute_change") == ConditionKind::AbsoluteChange);
    REQUIRE_FALSE(kind_from_string("sideways").has_value());
    REQUIRE_FALSE(kind_from_string("Above").has_value());

    REQUIRE(kind_to_string(ConditionKind::PercentChange) == "percent_change");

    AlertCondition cond{ConditionKind::Below, 10.0, std::nullopt, "", std::nullopt};
    REQUIRE_FALSE(cond.is_change_based());
    cond.kind = ConditionKind::AbsoluteChange;
    REQUIRE(cond.is_change_based());
}

TEST_CASE("Timestamps", "[util]") {
    SECTION("UTC with fraction") {
        auto tp = util::parse_iso8601("2023-11-14T22:13:20.250Z");
        REQUIRE(tp.has_value());
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            tp->time_since_epoch()).count();
        REQUIRE(ms == 1700000000250LL);
        REQUIRE(util::format_iso8601(*tp) == "2023-11-14T22:13:20.250Z");
    }

    SECTION("Offset and nanosecond fraction") {
        auto tp = util::parse_iso8601("2023-11-14T17:13:20.123456789-05:00");
        REQUIRE(tp.has_value());
        auto secs = std::chrono::duration_cast<std::chrono::seconds>(
            tp->time_since_epoch()).count();
        REQUIRE(secs == 1700000000LL);
    }

    SECTION("Rejects garbage") {
        REQUIRE_FALSE(util::parse_iso8601("yesterday").has_value());
        REQUIRE_FALSE(util::parse_iso8601("2023-11-14").has_value());
        REQUIRE_FALSE(util::parse_iso8601("2023-13-14T00:00:00Z").has_value());
    }
}

TEST_CASE("Environment expansion", "[util]") {
    setenv("ALERTER_TEST_TOPIC", "prices", 1);
    unsetenv("ALERTER_TEST_MISSING");

    REQUIRE(util::expand_env_vars("topic=${ALERTER_TEST_TOPIC}") == "topic=prices");
    REQUIRE(util::expand_env_vars("${ALERTER_TEST_MISSING}") == "${ALERTER_TEST_MISSING}");
    REQUIRE(util::expand_env_vars("a ${ALERTER_TEST_TOPIC} b ${ALERTER_TEST_TOPIC}") ==
            "a prices b prices");
    REQUIRE(util::expand_env_vars("no vars here") == "no vars here");
}
