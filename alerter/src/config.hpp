#pragma once

#include "condition.hpp"
#include <string>
#include <vector>
#include <chrono>

struct NtfyConfig {
    std::string server;
    std::string topic;
    std::string username;
    std::string password;
    std::string token;
    int priority = 3;
};

struct AlertConfig {
    std::string ticker;   // upper-cased on load
    std::string name;     // display name, may be empty
    std::vector<AlertCondition> conditions;
};

struct Config {
    NtfyConfig ntfy;
    std::vector<AlertConfig> alerts;
    std::string retention_text = "7d";
    std::chrono::seconds retention{7 * 24 * 3600};

    // Reads the JSON file, expands ${VAR}, applies defaults and validates.
    // Throws ConfigInvalid.
    static Config load(const std::string& path);
    static Config parse(const std::string& content);

    void validate() const;

    std::vector<std::string> unique_tickers() const;
};
