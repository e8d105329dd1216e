/**
 * @file main.cpp
 * @brief RedEyes campaign orchestrator - Command-line interface
 *
 * Entry point for the redeyes executable. Loads configuration, imports any
 * known targets, runs the seven campaign phases against the given target and
 * writes the registry, the operations log and the JSON campaign report into
 * the results directory.
 *
 * @date 2025
 */

#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include "redeyes/core/campaign_config.hpp"
#include "redeyes/core/campaign_context.hpp"
#include "redeyes/core/campaign_engine.hpp"
#include "redeyes/core/operations_log.hpp"
#include "redeyes/core/oracle.hpp"
#include "redeyes/core/target_registry.hpp"
#include "redeyes/reporters/json_reporter.hpp"
#include "redeyes/utils/string_utils.hpp"

#include <atomic>
#include <csignal>
#include <iomanip>
#include <iostream>
#include <memory>

namespace {

std::atomic<bool> g_interrupted{false};

void HandleSignal(int) {
    g_interrupted = true;
}

void PrintBanner() {
    std::cout << R"(
╔═══════════════════════════════════════════════════════════════╗
║                                                               ║
║   ██████╗ ███████╗██████╗ ███████╗██╗   ██╗███████╗███████╗   ║
║   ██╔══██╗██╔════╝██╔══██╗██╔════╝╚██╗ ██╔╝██╔════╝██╔════╝   ║
║   ██████╔╝█████╗  ██║  ██║█████╗   ╚████╔╝ █████╗  ███████╗   ║
║   ██╔══██╗██╔══╝  ██║  ██║██╔══╝    ╚██╔╝  ██╔══╝  ╚════██║   ║
║   ██║  ██║███████╗██████╔╝███████╗   ██║   ███████╗███████║   ║
║   ╚═╝  ╚═╝╚══════╝╚═════╝ ╚══════╝   ╚═╝   ╚══════╝╚══════╝   ║
║                                                               ║
║            Autonomous Assessment Campaign Orchestrator        ║
║                              v1.0.0                           ║
║                                                               ║
╚═══════════════════════════════════════════════════════════════╝
)" << std::endl;
}

/// Console plus a session log file in the results directory
void ConfigureLogging(const std::filesystem::path& results_dir, bool verbose) {
    auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    console_sink->set_level(verbose ? spdlog::level::debug : spdlog::level::info);

    std::string session = redeyes::core::CampaignEngine::GenerateCampaignID();
    auto log_path = results_dir / ("redeyes_" + session + ".log");
    auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_path.string(), true);
    file_sink->set_level(spdlog::level::debug);

    std::vector<spdlog::sink_ptr> sinks{console_sink, file_sink};
    auto logger = std::make_shared<spdlog::logger>("redeyes", sinks.begin(), sinks.end());
    logger->set_level(spdlog::level::debug);
    spdlog::set_default_logger(logger);
    spdlog::set_pattern("[%H:%M:%S] [%^%l%$] %v");

    spdlog::debug("Session log: {}", log_path.string());
}

void PrintConsoleSummary(const redeyes::core::CampaignResult& result) {
    const auto& s = result.summary;

    std::cout << "\n";
    std::cout << "╔═══════════════════════════════════════════════════════════════╗\n";
    std::cout << "║                     CAMPAIGN SUMMARY                          ║\n";
    std::cout << "╚═══════════════════════════════════════════════════════════════╝\n";
    std::cout << "  Campaign:        " << result.campaign_id << "\n";
    std::cout << "  Operations:      " << s.total_operations
              << " (" << s.successful_operations << " successful, "
              << std::fixed << std::setprecision(1) << s.success_rate * 100.0 << "%)\n";
    std::cout << "  Targets:         " << s.targets_discovered
              << " discovered, " << s.targets_compromised << " compromised\n";
    std::cout << "  Open ports:      " << s.total_open_ports << "\n";
    std::cout << "  Vulnerabilities: " << s.total_vulnerabilities << "\n";
    std::cout << "  Duration:        " << result.total_duration.count() / 1000.0 << " s\n";
    if (result.stopped) {
        std::cout << "\n[!] Campaign was stopped before all phase work completed.\n";
    }
}

} // anonymous namespace

/*******************************************************************************
 * Main Application Entry Point
 ******************************************************************************/

int main(int argc, char** argv) {
    PrintBanner();

    CLI::App app{"RedEyes Campaign Orchestrator"};
    app.footer("\nOnly run campaigns against systems you are authorized to test.");

    std::string target;
    std::vector<std::string> scope;
    std::string config_path;
    std::string targets_path;
    std::string output_dir;
    std::string oracle_command;
    std::vector<std::string> tool_names;
    bool verbose = false;

    app.add_option("target", target, "Primary campaign target (hostname or address)")
        ->required();
    app.add_option("--scope", scope, "Authorized scope statement (repeatable)");
    app.add_option("-c,--config", config_path, "JSON configuration file")
        ->check(CLI::ExistingFile);
    app.add_option("--targets", targets_path, "Import known targets from a registry JSON file")
        ->check(CLI::ExistingFile);
    app.add_option("-o,--output", output_dir, "Results directory (overrides configuration)");
    app.add_option("--oracle", oracle_command, "Oracle command line, prompt is passed on stdin");
    app.add_option("--tool", tool_names, "Mark a tool as available (repeatable)");
    app.add_flag("-v,--verbose", verbose, "Enable verbose logging");

    CLI11_PARSE(app, argc, argv);

    spdlog::set_level(verbose ? spdlog::level::debug : spdlog::level::info);
    spdlog::set_pattern("[%H:%M:%S] [%^%l%$] %v");

    try {
        redeyes::core::CampaignConfig config;
        if (!config_path.empty()) {
            auto loaded = redeyes::core::LoadCampaignConfig(config_path);
            if (!loaded) {
                spdlog::error("[ERROR] Failed to load configuration");
                return 1;
            }
            config = *loaded;
        }

        if (!output_dir.empty()) {
            config.results_directory = output_dir;
        }
        if (!oracle_command.empty()) {
            config.oracle.command = redeyes::utils::StringUtils::SplitWhitespace(oracle_command);
        }
        for (const auto& name : tool_names) {
            config.tools[name].available = true;
        }
        if (verbose) {
            config.verbose_logging = true;
            config.executor.verbose_logging = true;
        }

        std::filesystem::create_directories(config.results_directory);
        ConfigureLogging(config.results_directory, verbose || config.verbose_logging);

        redeyes::core::TargetRegistry registry;
        redeyes::core::OperationsLog operations_log;

        if (!targets_path.empty()) {
            std::size_t imported = registry.ImportJson(targets_path);
            spdlog::info("[INIT] Imported {} target(s) from {}", imported, targets_path);
        }

        spdlog::info("[INIT] Initializing RedEyes Campaign Engine...");

        redeyes::core::ProcessOracle oracle(config.oracle);
        if (!oracle.IsConfigured()) {
            spdlog::warn("[WARN] No oracle command configured; phases will receive no strategy");
        }

        redeyes::core::CampaignEngine engine(config, oracle);
        if (!engine.Initialize()) {
            spdlog::error("[ERROR] Failed to initialize campaign engine");
            return 1;
        }

        redeyes::reporters::JsonReporterConfig report_config;
        report_config.output_directory = config.results_directory;
        auto reporter = std::make_shared<redeyes::reporters::JsonReporter>(report_config);
        engine.AttachReportSink(reporter);

        std::signal(SIGINT, HandleSignal);
        std::signal(SIGTERM, HandleSignal);

        engine.SetPhaseCallback([&engine](const redeyes::core::CampaignStatus& status) {
            if (g_interrupted && !engine.StopRequested()) {
                engine.RequestStop();
            }
            if (status.current_phase) {
                spdlog::info("[PHASE] {}", redeyes::core::PhaseToString(*status.current_phase));
            }
        });

        redeyes::core::CampaignContext context(target, scope, registry, operations_log,
                                               config.results_directory);

        spdlog::info("━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━");
        spdlog::info("[START] Campaign against: {}", target);

        auto result = engine.Run(context);

        spdlog::info("━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━");
        spdlog::info("[DONE] Campaign {} complete", result.campaign_id);

        auto registry_path = config.results_directory / (result.campaign_id + "_targets.json");
        if (registry.ExportJson(registry_path)) {
            spdlog::info("[REPORT] Target registry saved: {}", registry_path.string());
        } else {
            spdlog::warn("[WARN] Failed to export target registry");
        }

        auto log_path = config.results_directory / (result.campaign_id + "_operations.json");
        if (operations_log.ExportJson(log_path)) {
            spdlog::info("[REPORT] Operations log saved: {}", log_path.string());
        } else {
            spdlog::warn("[WARN] Failed to export operations log");
        }

        if (result.report_published) {
            spdlog::info("[REPORT] Campaign report saved: {}", reporter->GetLastReportPath().string());
        } else {
            spdlog::warn("[WARN] Campaign report was not published");
        }

        PrintConsoleSummary(result);
        return 0;

    } catch (const redeyes::core::BookkeepingError& e) {
        spdlog::error("[ERROR] Campaign state error: {}", e.what());
        return 2;
    } catch (const std::filesystem::filesystem_error& e) {
        spdlog::error("[ERROR] Filesystem error: {}", e.what());
        return 1;
    } catch (const std::exception& e) {
        spdlog::error("[ERROR] Fatal error: {}", e.what());
        return 1;
    }
}
