#include "cli.hpp"
#include <fmt/format.h>
#include <filesystem>

void print_usage(const char* prog) {
    fmt::print(stderr,
               "Usage: {} [options]\n"
               "  --config PATH   Path to configuration file (default: config.json)\n"
               "  --state PATH    Path to state file (default: state.json beside the config)\n"
               "  -v              Verbose output\n"
               "  --dry-run       Check prices but don't send notifications\n"
               "  -h, --help      Show this help\n",
               prog);
}

bool parse_args(int argc, char** argv, CliOptions& opts) {
    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];

        auto take_value = [&](const std::string& flag, std::string& out) {
            auto eq = arg.find('=');
            if (eq != std::string::npos) {
                out = arg.substr(eq + 1);
                return true;
            }
            if (i + 1 >= argc) {
                fmt::print(stderr, "{} requires a value\n", flag);
                return false;
            }
            out = argv[++i];
            return true;
        };

        if (arg == "--config" || arg == "-config" ||
            arg.rfind("--config=", 0) == 0 || arg.rfind("-config=", 0) == 0) {
            if (!take_value("--config", opts.config_path)) return false;
        } else if (arg == "--state" || arg == "-state" ||
                   arg.rfind("--state=", 0) == 0 || arg.rfind("-state=", 0) == 0) {
            if (!take_value("--state", opts.state_path)) return false;
        } else if (arg == "-v" || arg == "--verbose") {
            opts.verbose = true;
        } else if (arg == "--dry-run" || arg == "-dry-run") {
            opts.dry_run = true;
        } else {
            fmt::print(stderr, "Unknown argument: {}\n", arg);
            return false;
        }
    }
    return true;
}

std::string default_state_path(const std::string& config_path) {
    auto dir = std::filesystem::path(config_path).parent_path();
    return (dir / "state.json").string();
}
