#include "yahoo_client.hpp"
#include "errors.hpp"
#include <spdlog/spdlog.h>
#include <fmt/format.h>

namespace {
const char* USER_AGENT = "Mozilla/5.0 (Macintosh; Intel Mac OS X 10_15_7) AppleWebKit/537.36";
}

YahooClient::YahooClient(const std::string& base_url, int timeout_ms)
    : base_url_(base_url)
    , timeout_ms_(timeout_ms)
    , curl_(curl_easy_init())
{
    if (!curl_) {
        throw std::runtime_error("Failed to initialize CURL for Yahoo");
    }

    curl_easy_setopt(curl_, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl_, CURLOPT_TIMEOUT_MS, static_cast<long>(timeout_ms_));
    curl_easy_setopt(curl_, CURLOPT_USERAGENT, USER_AGENT);
    curl_easy_setopt(curl_, CURLOPT_FOLLOWLOCATION, 1L);
}

YahooClient::~YahooClient() {
    if (curl_) {
        curl_easy_cleanup(curl_);
    }
}

size_t YahooClient::write_callback(void* contents, size_t size, size_t nmemb, void* userp) {
    ((std::string*)userp)->append((char*)contents, size * nmemb);
    return size * nmemb;
}

nlohmann::json YahooClient::make_request(const std::string& ticker) {
    std::string response_string;

    char* escaped = curl_easy_escape(curl_, ticker.c_str(), static_cast<int>(ticker.length()));
    std::string url = base_url_ + "/" + std::string(escaped);
    curl_free(escaped);

    curl_easy_setopt(curl_, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl_, CURLOPT_WRITEDATA, &response_string);

    CURLcode res = curl_easy_perform(curl_);
    if (res != CURLE_OK) {
        throw QuoteFetchFailed(fmt::format("fetching quote: {}", curl_easy_strerror(res)));
    }

    long status = 0;
    curl_easy_getinfo(curl_, CURLINFO_RESPONSE_CODE, &status);
    if (status != 200) {
        throw QuoteFetchFailed(fmt::format("unexpected status code: {}", status));
    }

    try {
        return nlohmann::json::parse(response_string);
    } catch (const nlohmann::json::parse_error& e) {
        throw QuoteFetchFailed(fmt::format("decoding response: {}", e.what()));
    }
}

Quote YahooClient::parse_chart(const nlohmann::json& body, const std::string& ticker) {
    try {
        const auto& chart = body.at("chart");

        if (chart.contains("error") && !chart["error"].is_null()) {
            const auto& err = chart["error"];
            throw QuoteFetchFailed(fmt::format("API error: {} - {}",
                                               err.value("code", ""),
                                               err.value("description", "")));
        }

        if (!chart.contains("result") || !chart["result"].is_array() || chart["result"].empty()) {
            throw QuoteFetchFailed("no data returned for ticker " + ticker);
        }

        const auto& meta = chart["result"][0].at("meta");

        Quote quote;
        quote.ticker = meta.value("symbol", ticker);
        quote.price = meta.at("regularMarketPrice").get<double>();
        quote.previous_close = meta.value("previousClose", 0.0);
        quote.fetched_at = std::chrono::system_clock::time_point(
            std::chrono::seconds(meta.value("regularMarketTime", int64_t{0})));
        return quote;
    } catch (const nlohmann::json::exception& e) {
        throw QuoteFetchFailed(fmt::format("decoding response: {}", e.what()));
    }
}

Quote YahooClient::get_quote(const std::string& ticker) {
    return parse_chart(make_request(ticker), ticker);
}

std::map<std::string, Quote> YahooClient::fetch_quotes(const std::vector<std::string>& tickers) {
    std::map<std::string, Quote> quotes;
    std::string last_error;

    for (const auto& ticker : tickers) {
        try {
            quotes[ticker] = get_quote(ticker);
            spdlog::debug("{}: ${:.2f}", ticker, quotes[ticker].price);
        } catch (const QuoteFetchFailed& e) {
            last_error = fmt::format("fetching {}: {}", ticker, e.what());
            spdlog::warn("Failed to fetch {}: {}", ticker, e.what());
        }
    }

    if (quotes.empty() && !last_error.empty()) {
        throw AllQuotesFailed("all tickers failed, last error: " + last_error);
    }

    return quotes;
}
