#pragma once

#include <string>

class NotificationSink {
public:
    virtual ~NotificationSink() = default;

    // Throws NotificationSendFailed
    virtual void send_alert(const std::string& ticker, const std::string& name,
                            const std::string& message, double price) = 0;
};
