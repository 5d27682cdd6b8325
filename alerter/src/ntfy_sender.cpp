#include "ntfy_sender.hpp"
#include "errors.hpp"
#include <spdlog/spdlog.h>
#include <fmt/format.h>

NtfySender::NtfySender(const NtfyConfig& cfg, int timeout_ms)
    : cfg_(cfg)
    , timeout_ms_(timeout_ms)
    , curl_(curl_easy_init())
{
    if (!curl_) {
        throw std::runtime_error("Failed to initialize CURL for ntfy");
    }

    curl_easy_setopt(curl_, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl_, CURLOPT_TIMEOUT_MS, static_cast<long>(timeout_ms_));
}

NtfySender::~NtfySender() {
    if (curl_) {
        curl_easy_cleanup(curl_);
    }
}

size_t NtfySender::write_callback(void* contents, size_t size, size_t nmemb, void* userp) {
    ((std::string*)userp)->append((char*)contents, size * nmemb);
    return size * nmemb;
}

nlohmann::json NtfySender::build_payload(const std::string& title, const std::string& message,
                                         const std::vector<std::string>& tags) const {
    nlohmann::json payload = {
        {"topic", cfg_.topic},
        {"message", message},
        {"priority", cfg_.priority}
    };
    if (!title.empty()) payload["title"] = title;
    if (!tags.empty()) payload["tags"] = tags;
    return payload;
}

void NtfySender::send(const std::string& title, const std::string& message,
                      const std::vector<std::string>& tags) {
    std::string body = build_payload(title, message, tags).dump();
    std::string response_string;

    struct curl_slist* headers = NULL;
    headers = curl_slist_append(headers, "Content-Type: application/json");

    // Token auth takes precedence over basic
    std::string bearer;
    if (!cfg_.token.empty()) {
        bearer = "Authorization: Bearer " + cfg_.token;
        headers = curl_slist_append(headers, bearer.c_str());
    } else if (!cfg_.username.empty() && !cfg_.password.empty()) {
        curl_easy_setopt(curl_, CURLOPT_HTTPAUTH, CURLAUTH_BASIC);
        curl_easy_setopt(curl_, CURLOPT_USERNAME, cfg_.username.c_str());
        curl_easy_setopt(curl_, CURLOPT_PASSWORD, cfg_.password.c_str());
    }

    curl_easy_setopt(curl_, CURLOPT_URL, cfg_.server.c_str());
    curl_easy_setopt(curl_, CURLOPT_HTTPHEADER, headers);
    curl_easy_setopt(curl_, CURLOPT_POSTFIELDS, body.c_str());
    curl_easy_setopt(curl_, CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));
    curl_easy_setopt(curl_, CURLOPT_WRITEDATA, &response_string);

    CURLcode res = curl_easy_perform(curl_);

    long status = 0;
    curl_easy_getinfo(curl_, CURLINFO_RESPONSE_CODE, &status);
    curl_slist_free_all(headers);
    curl_easy_setopt(curl_, CURLOPT_HTTPHEADER, NULL);

    if (res != CURLE_OK) {
        throw NotificationSendFailed(fmt::format("sending notification: {}",
                                                 curl_easy_strerror(res)));
    }
    if (status < 200 || status >= 300) {
        throw NotificationSendFailed(fmt::format("ntfy returned status {}", status));
    }
}

NtfyMessage NtfySender::build_alert(const std::string& ticker, const std::string& name,
                                    const std::string& message, double price) {
    NtfyMessage msg;
    msg.title = fmt::format("💰 {} Alert", name.empty() ? ticker : name);
    msg.body = fmt::format("{}\n\nCurrent price: ${:.2f}", message, price);
    msg.tags = {"chart_with_upwards_trend", ticker};
    return msg;
}

void NtfySender::send_alert(const std::string& ticker, const std::string& name,
                            const std::string& message, double price) {
    auto msg = build_alert(ticker, name, message, price);
    spdlog::debug("Posting to ntfy topic {}: {}", cfg_.topic, msg.title);
    send(msg.title, msg.body, msg.tags);
}
