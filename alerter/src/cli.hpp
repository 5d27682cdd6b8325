#pragma once

#include <string>

struct CliOptions {
    std::string config_path = "config.json";
    std::string state_path;
    bool verbose = false;
    bool dry_run = false;
};

void print_usage(const char* prog);

// Returns false on unknown flags or missing values.
bool parse_args(int argc, char** argv, CliOptions& opts);

// state.json in the config file's directory.
std::string default_state_path(const std::string& config_path);
