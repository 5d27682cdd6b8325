#include "cli.hpp"
#include "config.hpp"
#include "alert_run.hpp"
#include "errors.hpp"
#include "util.hpp"
#include "ntfy_sender.hpp"
#include "yahoo_client.hpp"
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <curl/curl.h>
#include <string>

void setup_logging(const std::string& log_level) {
    auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    auto logger = std::make_shared<spdlog::logger>("asset-alerts", console_sink);

    if (log_level == "debug") {
        logger->set_level(spdlog::level::debug);
    } else if (log_level == "warn") {
        logger->set_level(spdlog::level::warn);
    } else if (log_level == "error") {
        logger->set_level(spdlog::level::err);
    } else {
        logger->set_level(spdlog::level::info);
    }

    spdlog::set_default_logger(logger);
    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
}

int run(const CliOptions& opts) {
    try {
        Config config = Config::load(opts.config_path);
        spdlog::debug("Loaded config with {} alert groups", config.alerts.size());

        std::string state_path = opts.state_path.empty()
                                     ? default_state_path(opts.config_path)
                                     : opts.state_path;

        RunSummary summary;
        {
            YahooClient yahoo;
            NtfySender sender(config.ntfy);
            AlertRun alert_run(yahoo, sender);

            RunOptions run_opts;
            run_opts.dry_run = opts.dry_run;
            summary = alert_run.execute(config, state_path, run_opts);
        }

        if (summary.alerts_failed > 0) {
            spdlog::warn("{} of {} alerts failed to send",
                         summary.alerts_failed, summary.triggered.size());
        }
        return 0;

    } catch (const ConfigInvalid& e) {
        spdlog::error("Failed to load config: {}", e.what());
        return 1;
    } catch (const StateCorrupt& e) {
        spdlog::error("Failed to load state: {}", e.what());
        return 1;
    } catch (const AllQuotesFailed& e) {
        spdlog::error("Failed to fetch quotes: {}", e.what());
        return 1;
    } catch (const StateSaveFailed& e) {
        spdlog::error("Failed to save state: {}", e.what());
        return 1;
    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return 1;
    }
}

int main(int argc, char** argv) {
    CliOptions opts;
    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            print_usage(argv[0]);
            return 0;
        }
    }
    if (!parse_args(argc, argv, opts)) {
        print_usage(argv[0]);
        return 2;
    }

    setup_logging(opts.verbose ? "debug" : util::get_env("LOG_LEVEL", "info"));

    curl_global_init(CURL_GLOBAL_DEFAULT);
    int rc = run(opts);
    curl_global_cleanup();
    return rc;
}
