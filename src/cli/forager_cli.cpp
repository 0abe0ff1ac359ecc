#include "forager_cli.hpp"
#include "theme.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <core/time_utils.hpp>
#include <core/utils.hpp>
#include <managers/forager_service.hpp>
#include <platform/platform.hpp>
#include <iostream>

int ForagerCLI::run(const ParsedArgs& args) {
    auto loaded = Config::load(args.overrides);
    if (loaded.is_err()) {
        std::cout << theme::fail(loaded.error);
        return EXIT_FAILURE_RUN;
    }
    const Config& config = loaded.value;
    const RunConfig& rc = config.run();

    log_init(config.state_dir() / RUN_LOG, rc.debug);
    if (!config.config_file().empty()) {
        log_debug("Config loaded from " + config.config_file().string());
    }

    platform::install_interrupt_handlers();

    std::cout << theme::step("Source " + rc.source + (rc.dry_run ? theme::yellow("  [dry run]") : ""));

    // Telemetry goes to the run log; an external collector tails it
    auto publish = [](const std::string& topic, const std::string& message) {
        log_debug(topic + " " + message);
    };

    ForagerService service(rc, config.metadata(), nullptr, publish);
    auto result = service.run([](const std::string& msg) {
        std::cout << theme::info(msg);
    });
    if (result.is_err()) {
        std::cout << theme::fail(result.error);
        return EXIT_FAILURE_RUN;
    }

    print_summary(result.value, rc.dry_run);
    return EXIT_OK;
}

void ForagerCLI::print_summary(const RunStats& stats, bool dry_run) const {
    std::cout << theme::section("Summary");
    std::cout << theme::kv("scanned", std::to_string(stats.files_scanned));
    if (dry_run) {
        std::cout << theme::kv("would upload", std::to_string(stats.dry_run_files));
    } else {
        std::cout << theme::kv("uploaded", fmt::format("{} ({})", stats.files_uploaded,
                                                       format_bytes(stats.bytes_uploaded)));
    }
    for (const auto& [reason, count] : stats.skipped) {
        if (count > 0) std::cout << theme::kv("skipped", fmt::format("{} {}", count, reason));
    }
    if (stats.errors > 0) {
        std::cout << theme::kv("errors", theme::red(std::to_string(stats.errors)));
    }
    if (stats.scan_errors > 0) {
        std::cout << theme::kv("scan errors", theme::yellow(std::to_string(stats.scan_errors)));
    }
    std::cout << theme::kv("elapsed", format_elapsed(stats.elapsed_secs));
    if (stats.interrupted) {
        std::cout << theme::warn("Interrupted; remaining files will go in the next run");
    }
    std::cout << "\n";
}
