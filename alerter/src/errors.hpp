#pragma once

#include <stdexcept>
#include <string>

// Base for every error the alerter raises on purpose.
class AlertError : public std::runtime_error {
public:
    explicit AlertError(const std::string& what) : std::runtime_error(what) {}
};

// Missing fields, unknown condition type, bad threshold or period.
class ConfigInvalid : public AlertError {
public:
    explicit ConfigInvalid(const std::string& what) : AlertError(what) {}
};

// State file exists but cannot be read back.
class StateCorrupt : public AlertError {
public:
    explicit StateCorrupt(const std::string& what) : AlertError(what) {}
};

class StateSaveFailed : public AlertError {
public:
    explicit StateSaveFailed(const std::string& what) : AlertError(what) {}
};

class QuoteFetchFailed : public AlertError {
public:
    explicit QuoteFetchFailed(const std::string& what) : AlertError(what) {}
};

class AllQuotesFailed : public AlertError {
public:
    explicit AllQuotesFailed(const std::string& what) : AlertError(what) {}
};

class NotificationSendFailed : public AlertError {
public:
    explicit NotificationSendFailed(const std::string& what) : AlertError(what) {}
};
