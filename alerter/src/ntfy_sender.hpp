#pragma once

#include "config.hpp"
#include "notification_sink.hpp"
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include <curl/curl.h>

struct NtfyMessage {
    std::string title;
    std::string body;
    std::vector<std::string> tags;
};

class NtfySender : public NotificationSink {
public:
    explicit NtfySender(const NtfyConfig& cfg, int timeout_ms = 10000);
    ~NtfySender() override;

    NtfySender(const NtfySender&) = delete;
    NtfySender& operator=(const NtfySender&) = delete;

    // POSTs one notification. Throws NotificationSendFailed.
    void send(const std::string& title, const std::string& message,
              const std::vector<std::string>& tags);

    void send_alert(const std::string& ticker, const std::string& name,
                    const std::string& message, double price) override;

    static NtfyMessage build_alert(const std::string& ticker, const std::string& name,
                                   const std::string& message, double price);
    nlohmann::json build_payload(const std::string& title, const std::string& message,
                                 const std::vector<std::string>& tags) const;

private:
    NtfyConfig cfg_;
    int timeout_ms_;
    CURL* curl_;

    static size_t write_callback(void* contents, size_t size, size_t nmemb, void* userp);
};
