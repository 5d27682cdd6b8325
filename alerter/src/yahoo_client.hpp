#pragma once

#include "quote_source.hpp"
#include <string>
#include <nlohmann/json.hpp>
#include <curl/curl.h>

class YahooClient : public QuoteSource {
public:
    explicit YahooClient(const std::string& base_url = "https://query1.finance.yahoo.com/v8/finance/chart",
                         int timeout_ms = 10000);
    ~YahooClient() override;

    YahooClient(const YahooClient&) = delete;
    YahooClient& operator=(const YahooClient&) = delete;

    // Throws QuoteFetchFailed
    Quote get_quote(const std::string& ticker);

    std::map<std::string, Quote> fetch_quotes(const std::vector<std::string>& tickers) override;

    // Reads chart.result[0].meta; throws QuoteFetchFailed on an error payload.
    static Quote parse_chart(const nlohmann::json& body, const std::string& ticker);

private:
    std::string base_url_;
    int timeout_ms_;
    CURL* curl_;

    nlohmann::json make_request(const std::string& ticker);

    static size_t write_callback(void* contents, size_t size, size_t nmemb, void* userp);
};
