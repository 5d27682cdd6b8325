#pragma once

#include "util.hpp"
#include <string>
#include <map>
#include <vector>

struct Quote {
    std::string ticker;
    double price;
    double previous_close;
    util::TimePoint fetched_at;
};

class QuoteSource {
public:
    virtual ~QuoteSource() = default;

    // Tickers missing from the result failed this run and are skipped.
    // Throws AllQuotesFailed when nothing could be fetched.
    virtual std::map<std::string, Quote> fetch_quotes(const std::vector<std::string>& tickers) = 0;
};
