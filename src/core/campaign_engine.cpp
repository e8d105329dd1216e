/**
 * @file campaign_engine.cpp
 * @brief Implementation of the campaign phase orchestrator
 *
 * **Campaign Pipeline**:
 * ```
 * PLANNING          → strategy query, recorded as a plan
 * OSINT             → strategy → extract → execute top N → hosts become targets
 * ENUMERATION       → per target: strategy → extract → execute → ports/services
 * VULNERABILITY     → per target with ports: ... → vulnerability indicators
 * EXPLOITATION      → per vulnerable target: exploit candidates → success latch
 * POST_EXPLOITATION → per exploited target: follow-up commands
 * REPORTING         → final query → summary → report sink
 * ```
 *
 * Every phase except PLANNING and REPORTING closes with an analysis query
 * when it produced at least one record.
 *
 * **Failure Model**:
 * - Per-command exceptions are caught inside the batch job and logged
 * - Oracle exceptions become "AI Error: ..." strings
 * - Unexpected phase failures are logged and recorded; the sequence goes on
 * - BookkeepingError always propagates
 *
 * @date 2025
 */

#include "redeyes/core/campaign_engine.hpp"
#include "redeyes/analyzers/command_extractor.hpp"
#include "redeyes/analyzers/findings_parser.hpp"
#include "redeyes/core/safe_executor.hpp"
#include "redeyes/integrations/resource_script_runner.hpp"
#include "redeyes/utils/hash_utils.hpp"
#include "redeyes/utils/string_utils.hpp"
#include "redeyes/utils/thread_pool.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <ctime>
#include <exception>
#include <iomanip>
#include <random>
#include <sstream>
#include <system_error>

namespace redeyes {
namespace core {

using analyzers::FindingsParser;
using integrations::ResourceScriptRunner;
using utils::HashUtils;
using utils::StringUtils;

namespace {

std::string FormatPorts(const Target& target, std::size_t limit) {
    std::vector<std::string> ports;
    for (int port : target.open_ports) {
        if (ports.size() >= limit) break;
        ports.push_back(std::to_string(port));
    }
    return "[" + StringUtils::Join(ports, ", ") + "]";
}

std::string FormatServices(const Target& target, std::size_t limit) {
    std::vector<std::string> services;
    for (const auto& [port, descriptor] : target.services) {
        if (services.size() >= limit) break;
        services.push_back(std::to_string(port) + ": " + descriptor);
    }
    return "{" + StringUtils::Join(services, ", ") + "}";
}

std::string FormatList(const std::vector<std::string>& items, std::size_t limit) {
    std::vector<std::string> shown(items.begin(),
                                   items.begin() + static_cast<std::ptrdiff_t>(std::min(limit, items.size())));
    std::string text = "[" + StringUtils::Join(shown, ", ") + "]";
    if (items.size() > limit) {
        text += " (+" + std::to_string(items.size() - limit) + " more)";
    }
    return text;
}

std::optional<std::string> DescribeFailure(const ResultEnvelope& envelope) {
    if (envelope.error) {
        return envelope.error;
    }
    if (envelope.success) {
        return std::nullopt;
    }
    std::string stderr_text = StringUtils::Trim(envelope.stderr_output);
    if (!stderr_text.empty()) {
        return StringUtils::Truncate(stderr_text, 500);
    }
    return "exit code " + std::to_string(envelope.exit_code);
}

bool IsExploited(const TargetRegistry& registry, const std::string& id) {
    auto target = registry.Get(id);
    return target && target->exploited;
}

void Banner(const std::string& title) {
    spdlog::info("═══════════════════════════════════════════════════════════════");
    spdlog::info("{}", title);
    spdlog::info("═══════════════════════════════════════════════════════════════");
}

} // anonymous namespace

// ============================================================================
// PHASE TRACKER
// ============================================================================

void PhaseTracker::Enter(Phase phase) {
    const auto& order = AllPhases();

    if (visited_.size() >= order.size()) {
        throw CampaignStateError("Campaign already finished; cannot enter " + PhaseToString(phase));
    }

    Phase expected = order[visited_.size()];
    if (phase != expected) {
        throw CampaignStateError("Illegal phase transition " +
            (current_ ? PhaseToString(*current_) : std::string("<start>")) +
            " -> " + PhaseToString(phase) + " (expected " + PhaseToString(expected) + ")");
    }

    current_ = phase;
    visited_.push_back(phase);
}

// ============================================================================
// PRIVATE IMPLEMENTATION (PIMPL PATTERN)
// ============================================================================

class CampaignEngine::Impl {
public:
    explicit Impl(const CampaignConfig& config)
        : executor(config.executor)
        , extractor(config.extractor)
        , exploit_extractor(config.exploit_extractor)
        , console(executor, config.console) {
    }

    SafeExecutor executor;
    analyzers::CommandExtractor extractor;
    analyzers::ExploitCommandExtractor exploit_extractor;
    FindingsParser parser;
    ResourceScriptRunner console;

    std::unique_ptr<utils::ThreadPool> pool;
    std::shared_ptr<ReportSink> report_sink;

    std::atomic<bool> is_initialized{false};
    std::atomic<bool> report_published{false};
};

CampaignEngine::CampaignEngine(const CampaignConfig& config, Oracle& oracle)
    : config_(config)
    , oracle_(oracle)
    , impl_(std::make_unique<Impl>(config)) {

    Banner("REDEYES Campaign Engine v1.0");

    if (config_.verbose_logging) {
        spdlog::set_level(spdlog::level::debug);
    }
}

CampaignEngine::~CampaignEngine() {
    spdlog::debug("Shutting down Campaign Engine...");
}

bool CampaignEngine::Initialize() {
    Banner("INITIALIZING CAMPAIGN ENGINE");

    if (!ValidateConfig(config_)) {
        spdlog::error("Configuration rejected");
        return false;
    }

    try {
        spdlog::debug("Creating results directory {}...", config_.results_directory.string());
        std::filesystem::create_directories(config_.results_directory);

        spdlog::debug("Starting {} workers...", config_.worker_count);
        impl_->pool = std::make_unique<utils::ThreadPool>(config_.worker_count);

        impl_->is_initialized = true;
        spdlog::info("✓ Campaign Engine initialized ({} workers, results in {})",
                     config_.worker_count, config_.results_directory.string());
        return true;
    }
    catch (const std::exception& e) {
        spdlog::error("Failed to initialize Campaign Engine: {}", e.what());
        return false;
    }
}

void CampaignEngine::AttachReportSink(std::shared_ptr<ReportSink> sink) {
    impl_->report_sink = std::move(sink);
}

void CampaignEngine::SetPhaseCallback(PhaseCallback callback) {
    std::lock_guard<std::mutex> lock(state_mutex_);
    phase_callback_ = std::move(callback);
}

void CampaignEngine::RequestStop() {
    spdlog::warn("Stop requested; remaining phases will be skipped");
    stop_requested_ = true;
}

CampaignStatus CampaignEngine::GetStatus() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    CampaignStatus status = status_;
    status.stop_requested = stop_requested_.load();
    return status;
}

// ============================================================================
// CAMPAIGN RUN
// ============================================================================

CampaignResult CampaignEngine::Run(CampaignContext& context) {
    if (!impl_->is_initialized) {
        throw CampaignStateError("Campaign Engine not initialized");
    }

    CampaignResult result;
    if (context.campaign_id.empty()) {
        context.campaign_id = GenerateCampaignID();
    }
    result.campaign_id = context.campaign_id;
    result.start_time = std::chrono::system_clock::now();

    if (context.tools.empty()) {
        context.tools = config_.tools;
    }

    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        status_ = CampaignStatus{};
        status_.campaign_id = result.campaign_id;
    }
    impl_->report_published = false;

    spdlog::info("");
    Banner("STARTING CAMPAIGN");
    spdlog::info("Campaign ID: {}", result.campaign_id);
    spdlog::info("Target: {}", context.target);
    if (!context.scope.empty()) {
        spdlog::info("Scope: {}", StringUtils::Join(context.scope, "; "));
    }

    PhaseTracker tracker;
    const auto& phases = AllPhases();

    for (std::size_t i = 0; i < phases.size(); ++i) {
        Phase phase = phases[i];
        tracker.Enter(phase);

        UpdateStatus(phase, "Running " + PhaseToString(phase));
        spdlog::info("[{}/{}] {}", i + 1, phases.size(), PhaseToString(phase));

        if (phase != Phase::REPORTING && StopRequested()) {
            spdlog::warn("Skipping {} work: campaign stopped", PhaseToString(phase));
            OperationRecord skipped;
            skipped.phase = PhaseToString(phase);
            skipped.error = "stopped";
            context.log.Append(std::move(skipped));
            result.stopped = true;
            continue;
        }

        try {
            RunPhase(context, phase);
        }
        catch (const BookkeepingError&) {
            throw;
        }
        catch (const std::exception& e) {
            spdlog::error("{} phase failed: {}", PhaseToString(phase), e.what());
            OperationRecord failed;
            failed.phase = PhaseToString(phase);
            failed.error = e.what();
            context.log.Append(std::move(failed));
        }
    }

    result.phases_visited = tracker.Visited();
    result.summary = context.final_summary ? *context.final_summary
                                           : context.log.Summarize(context.registry);
    auto analysis = context.context_data.find("ai_final_analysis");
    if (analysis != context.context_data.end()) {
        result.final_analysis = analysis->second;
    }
    result.report_published = impl_->report_published.load();
    result.end_time = std::chrono::system_clock::now();
    result.total_duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        result.end_time - result.start_time);

    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        status_.is_complete = true;
        status_.status_message = result.stopped ? "Campaign stopped" : "Campaign complete";
    }
    stop_requested_ = false;

    spdlog::info("");
    Banner(result.stopped ? "CAMPAIGN STOPPED" : "CAMPAIGN COMPLETE");
    spdlog::info("Campaign ID: {}", result.campaign_id);
    spdlog::info("Duration: {} ms", result.total_duration.count());
    spdlog::info("Operations: {} ({} successful)",
                 result.summary.total_operations, result.summary.successful_operations);
    spdlog::info("Targets: {} discovered, {} compromised",
                 result.summary.targets_discovered, result.summary.targets_compromised);
    spdlog::info("Vulnerabilities: {}", result.summary.total_vulnerabilities);
    spdlog::info("═══════════════════════════════════════════════════════════════");

    return result;
}

void CampaignEngine::RunPhase(CampaignContext& context, Phase phase) {
    switch (phase) {
        case Phase::PLANNING:          RunPlanning(context); break;
        case Phase::OSINT:             RunOsint(context); break;
        case Phase::ENUMERATION:       RunEnumeration(context); break;
        case Phase::VULNERABILITY:     RunVulnerability(context); break;
        case Phase::EXPLOITATION:      RunExploitation(context); break;
        case Phase::POST_EXPLOITATION: RunPostExploitation(context); break;
        case Phase::REPORTING:         RunReporting(context); break;
    }
}

// ============================================================================
// PHASE WORK
// ============================================================================

void CampaignEngine::RunPlanning(CampaignContext& context) {
    std::ostringstream prompt;
    prompt << "Target: " << context.target << "\n"
           << "Scope: " << (context.scope.empty() ? std::string("Full authorized assessment")
                                                  : StringUtils::Join(context.scope, "; ")) << "\n\n"
           << "Create a comprehensive penetration testing plan including:\n"
           << "1. OSINT reconnaissance strategy\n"
           << "2. Network enumeration approach\n"
           << "3. Vulnerability assessment priorities\n"
           << "4. Potential exploitation vectors\n"
           << "5. Post-exploitation objectives\n"
           << "6. Risk assessment and safety measures\n\n"
           << "Provide specific tools and techniques for each phase.";

    auto plan = QueryOracle(prompt.str(),
        "You are an expert red team leader creating a comprehensive penetration testing "
        "strategy. Be specific about tools, techniques, and priorities.",
        BuildOracleContext(context, Phase::PLANNING, std::nullopt));

    OperationRecord record;
    record.phase = PhaseToString(Phase::PLANNING);
    record.target = context.target;
    record.ai_payload = plan;
    context.log.Append(std::move(record));

    spdlog::info("🧠 Attack plan received ({} chars)", plan.size());
    spdlog::debug("{}", StringUtils::Truncate(plan, 500));
}

void CampaignEngine::RunOsint(CampaignContext& context) {
    auto strategy = QueryOracle(
        "Target: " + context.target + ". Which OSINT tools should I run and in what order? "
        "Consider: whois, DNS recon, subdomain enum, email harvesting, Shodan, social media.",
        "You are executing OSINT. Provide a prioritized list of specific commands and tools.",
        BuildOracleContext(context, Phase::OSINT, std::nullopt));

    auto commands = Take(impl_->extractor.Extract(strategy, context.AvailableTools()),
                         config_.limits.osint_commands);
    if (commands.empty()) {
        spdlog::info("No actionable OSINT commands in strategy");
    }

    std::vector<std::future<void>> batches;
    DispatchBatch(context, Phase::OSINT, std::nullopt, std::move(commands), batches);
    AwaitBatches(batches);

    if (context.registry.Empty() && config_.seed_primary_target && !context.target.empty()) {
        spdlog::info("No hosts discovered, registering primary target {}", context.target);
        context.registry.AddTarget(context.target);
    }

    AnalyzePhaseResults(context, Phase::OSINT);
}

void CampaignEngine::RunEnumeration(CampaignContext& context) {
    if (context.registry.Empty()) {
        spdlog::warn("⚠️ No targets identified, skipping enumeration");
        return;
    }

    auto ids = context.registry.Ids();
    if (ids.size() > config_.limits.enumeration_targets) {
        ids.resize(config_.limits.enumeration_targets);
    }

    std::vector<std::future<void>> batches;
    for (const auto& id : ids) {
        auto strategy = QueryOracle(
            "Target IP: " + id + ". Plan network enumeration: port scanning, service detection, "
            "SMB enum, SNMP enum. What's the optimal scanning strategy?",
            "You are performing network enumeration. Provide specific nmap commands and "
            "enumeration techniques.",
            BuildOracleContext(context, Phase::ENUMERATION, context.registry.Get(id)));

        auto commands = Take(impl_->extractor.Extract(strategy, context.AvailableTools()),
                             config_.limits.enumeration_commands_per_target);
        DispatchBatch(context, Phase::ENUMERATION, id, std::move(commands), batches);
    }
    AwaitBatches(batches);

    AnalyzePhaseResults(context, Phase::ENUMERATION);
}

void CampaignEngine::RunVulnerability(CampaignContext& context) {
    std::vector<Target> candidates;
    for (auto& target : context.registry.Snapshot()) {
        if (!target.open_ports.empty()) {
            candidates.push_back(std::move(target));
        }
    }

    if (candidates.empty()) {
        spdlog::warn("⚠️ No open ports known, skipping vulnerability assessment");
        return;
    }

    std::vector<std::future<void>> batches;
    for (const auto& target : candidates) {
        auto strategy = QueryOracle(
            "Target: " + target.id +
            ", Open ports: " + FormatPorts(target, config_.limits.context_ports) +
            ", Services: " + FormatServices(target, config_.limits.context_services) +
            ". Plan vulnerability assessment: NSE scripts, Nikto, directory brute force, etc.",
            "You are conducting vulnerability assessment. Provide specific vulnerability "
            "scanning commands.",
            BuildOracleContext(context, Phase::VULNERABILITY, target));

        auto commands = Take(impl_->extractor.Extract(strategy, context.AvailableTools()),
                             config_.limits.vulnerability_commands_per_target);
        DispatchBatch(context, Phase::VULNERABILITY, target.id, std::move(commands), batches);
    }
    AwaitBatches(batches);

    AnalyzePhaseResults(context, Phase::VULNERABILITY);
}

void CampaignEngine::RunExploitation(CampaignContext& context) {
    std::vector<Target> candidates;
    for (auto& target : context.registry.Snapshot()) {
        if (!target.vulnerabilities.empty()) {
            candidates.push_back(std::move(target));
        }
    }

    if (candidates.empty()) {
        spdlog::warn("⚠️ No clear vulnerabilities identified for exploitation");
        return;
    }

    std::vector<std::future<void>> batches;
    for (const auto& target : candidates) {
        auto strategy = QueryOracle(
            "Target: " + target.id +
            ", Vulnerabilities: " + FormatList(target.vulnerabilities,
                                               config_.limits.context_vulnerabilities) +
            ". Plan exploitation using Metasploit, Hydra, or other tools. "
            "What exploits should I try?",
            "You are conducting ethical penetration testing exploitation. Provide specific "
            "exploit commands and Metasploit modules.",
            BuildOracleContext(context, Phase::EXPLOITATION, target));

        auto commands = Take(impl_->exploit_extractor.Extract(strategy),
                             config_.limits.exploitation_commands_per_target);
        DispatchBatch(context, Phase::EXPLOITATION, target.id, std::move(commands), batches);
    }
    AwaitBatches(batches);

    AnalyzePhaseResults(context, Phase::EXPLOITATION);
}

void CampaignEngine::RunPostExploitation(CampaignContext& context) {
    std::vector<Target> compromised;
    for (auto& target : context.registry.Snapshot()) {
        if (target.exploited) {
            compromised.push_back(std::move(target));
        }
    }

    if (compromised.empty()) {
        spdlog::warn("⚠️ No targets compromised, skipping post-exploitation");
        return;
    }

    std::vector<std::future<void>> batches;
    for (const auto& target : compromised) {
        auto strategy = QueryOracle(
            "Compromised target: " + target.id + ". Plan post-exploitation: privilege "
            "escalation, persistence, lateral movement, data gathering. What should I do next?",
            "You are conducting post-exploitation activities. Provide specific commands for "
            "privilege escalation and data gathering.",
            BuildOracleContext(context, Phase::POST_EXPLOITATION, target));

        auto commands = Take(impl_->extractor.Extract(strategy, context.AvailableTools()),
                             config_.limits.post_exploitation_commands_per_target);
        DispatchBatch(context, Phase::POST_EXPLOITATION, target.id, std::move(commands), batches);
    }
    AwaitBatches(batches);

    AnalyzePhaseResults(context, Phase::POST_EXPLOITATION);
}

void CampaignEngine::RunReporting(CampaignContext& context) {
    auto summary = context.log.Summarize(context.registry);

    std::ostringstream prompt;
    prompt << "Analyze complete penetration test results. "
           << "Targets: " << summary.targets_discovered
           << ", Total vulnerabilities: " << summary.total_vulnerabilities
           << ", Compromised: " << summary.targets_compromised
           << ", Operations: " << summary.total_operations
           << " (" << summary.successful_operations << " successful)"
           << ". Provide executive summary and recommendations.";

    auto final_analysis = QueryOracle(prompt.str(),
        "You are creating a final penetration test report. Provide executive summary, key "
        "findings, risk assessment, and remediation recommendations.",
        BuildOracleContext(context, Phase::REPORTING, std::nullopt));

    context.context_data["ai_final_analysis"] = final_analysis;

    OperationRecord record;
    record.phase = PhaseToString(Phase::REPORTING);
    record.target = context.target;
    record.ai_payload = final_analysis;
    context.log.Append(std::move(record));

    context.final_summary = context.log.Summarize(context.registry);

    if (impl_->report_sink) {
        try {
            impl_->report_published = impl_->report_sink->Publish(context);
            if (!impl_->report_published) {
                spdlog::warn("Report sink did not publish the campaign");
            }
        }
        catch (const std::exception& e) {
            spdlog::error("Report publication failed: {}", e.what());
        }
    }
}

// ============================================================================
// COMMAND EXECUTION
// ============================================================================

void CampaignEngine::DispatchBatch(CampaignContext& context,
                                   Phase phase,
                                   const std::optional<std::string>& target,
                                   std::vector<std::string> commands,
                                   std::vector<std::future<void>>& batches) {
    if (commands.empty()) {
        return;
    }
    if (!impl_->pool) {
        throw CampaignStateError("Campaign Engine not initialized");
    }

    std::error_code ec;
    std::filesystem::create_directories(context.results_directory, ec);
    if (ec) {
        spdlog::warn("Cannot create results directory {}: {}",
                     context.results_directory.string(), ec.message());
    }

    spdlog::debug("Queueing {} {} commands{}", commands.size(), PhaseToString(phase),
                  target ? " for " + *target : std::string());

    batches.push_back(impl_->pool->Enqueue(
        [this, &context, phase, target, commands = std::move(commands)]() {
            for (const auto& command : commands) {
                try {
                    if (phase == Phase::EXPLOITATION && target) {
                        ExecuteExploitCommand(context, command, *target);
                    } else {
                        ExecuteToolCommand(context, phase, command, target);
                    }
                }
                catch (const BookkeepingError&) {
                    throw;
                }
                catch (const std::exception& e) {
                    spdlog::warn("⚠️ {} command failed: {} - {}", PhaseToString(phase), command, e.what());
                }
            }
        }));
}

void CampaignEngine::AwaitBatches(std::vector<std::future<void>>& batches) {
    std::exception_ptr first_error;

    for (auto& batch : batches) {
        try {
            batch.get();
        }
        catch (...) {
            if (!first_error) {
                first_error = std::current_exception();
            }
        }
    }
    batches.clear();

    if (first_error) {
        std::rethrow_exception(first_error);
    }
}

void CampaignEngine::ExecuteToolCommand(CampaignContext& context,
                                        Phase phase,
                                        const std::string& command,
                                        const std::optional<std::string>& target) {
    const std::string phase_name = PhaseToString(phase);
    spdlog::info("▶ {}: {}{}", phase_name, StringUtils::Truncate(command, 80),
                 target ? " [" + *target + "]" : std::string());

    auto envelope = impl_->executor.Execute(command,
                                            context.results_directory,
                                            config_.executor.default_timeout,
                                            config_.executor.default_max_output_bytes,
                                            OutputPathFor(context, phase, command, target));

    OperationRecord record;
    record.phase = phase_name;
    record.command = command;
    record.target = target;
    record.duration = envelope.duration;
    record.success = envelope.success;
    record.exit_code = envelope.exit_code;
    record.output_length = envelope.stdout_output.size();
    record.error = DescribeFailure(envelope);
    context.log.Append(std::move(record));

    if (envelope.success) {
        spdlog::info("✅ {}: {} ({:.1f}s)", phase_name, StringUtils::Truncate(command, 50),
                     envelope.duration.count() / 1000.0);
    } else {
        spdlog::warn("❌ {}: {} failed (exit {})", phase_name, StringUtils::Truncate(command, 50),
                     envelope.exit_code);
    }

    if (!envelope.stdout_output.empty()) {
        ApplyFindings(context, phase, target, envelope.stdout_output);
    }
}

void CampaignEngine::ExecuteExploitCommand(CampaignContext& context,
                                           const std::string& command,
                                           const std::string& target) {
    OperationRecord record;
    record.phase = PhaseToString(Phase::EXPLOITATION);
    record.command = command;
    record.target = target;

    if (impl_->exploit_extractor.IsDestructive(command)) {
        spdlog::warn("🛑 Dangerous command blocked: {}", command);
        record.duration = std::chrono::milliseconds(0);
        record.success = false;
        record.error = "blocked: destructive pattern";
        record.exploited = IsExploited(context.registry, target);
        context.log.Append(std::move(record));
        return;
    }

    spdlog::info("⚡ Attempting exploitation: {} [{}]", StringUtils::Truncate(command, 60), target);

    auto output_path = OutputPathFor(context, Phase::EXPLOITATION, command, target);
    ResultEnvelope envelope;

    if (ResourceScriptRunner::IsFrameworkCommand(command)) {
        auto console = impl_->console.Run(command, target,
                                          context.results_directory / "exploitation" / "scripts",
                                          output_path);
        envelope = std::move(console.envelope);
    } else {
        envelope = impl_->executor.Execute(command,
                                           context.results_directory,
                                           config_.executor.default_timeout,
                                           config_.executor.default_max_output_bytes,
                                           output_path);
    }

    if (envelope.success) {
        auto indicator = FindingsParser::FindSuccessIndicator(envelope.stdout_output,
                                                              config_.success_indicators);
        if (indicator) {
            context.registry.MarkExploited(target, "Shell via: " + command);
            spdlog::info("🎯 EXPLOITATION SUCCESS: {} (matched '{}')", target, *indicator);
        } else {
            spdlog::info("Exploit attempted but no clear success indicator");
        }
    }

    if (!envelope.stdout_output.empty()) {
        ApplyFindings(context, Phase::EXPLOITATION, target, envelope.stdout_output);
    }

    record.duration = envelope.duration;
    record.success = envelope.success;
    record.exit_code = envelope.exit_code;
    record.output_length = envelope.stdout_output.size();
    record.error = DescribeFailure(envelope);
    record.exploited = IsExploited(context.registry, target);
    context.log.Append(std::move(record));
}

void CampaignEngine::ApplyFindings(CampaignContext& context,
                                   Phase phase,
                                   const std::optional<std::string>& target,
                                   const std::string& output) {
    const auto& parser = impl_->parser;

    switch (phase) {
        case Phase::OSINT:
            for (const auto& host : parser.ParseHosts(output)) {
                context.registry.AddTarget(host.address, host.hostname);
            }
            break;

        case Phase::ENUMERATION:
            if (!target) break;
            for (const auto& finding : parser.ParsePorts(output)) {
                context.registry.AddOpenPort(*target, finding.port);
                if (context.registry.AddService(*target, finding.port, finding.descriptor)) {
                    spdlog::debug("{}:{} {}", *target, finding.port, finding.descriptor);
                }
            }
            break;

        case Phase::VULNERABILITY:
            if (!target) break;
            for (const auto& vuln : parser.ParseVulnerabilities(output)) {
                if (context.registry.AddVulnerability(*target, vuln)) {
                    spdlog::info("🔓 {}: {}", *target, StringUtils::Truncate(vuln, 100));
                }
            }
            break;

        case Phase::EXPLOITATION:
        case Phase::POST_EXPLOITATION:
            if (!target) break;
            for (const auto& credential : parser.ParseCredentials(output)) {
                if (context.registry.AddCredential(*target, credential)) {
                    spdlog::info("🔑 Credential recovered for {}", *target);
                }
            }
            break;

        default:
            break;
    }
}

// ============================================================================
// ORACLE INTERACTION
// ============================================================================

std::string CampaignEngine::QueryOracle(const std::string& prompt,
                                        const std::string& system_prompt,
                                        const std::string& oracle_context) {
    try {
        return oracle_.Query(prompt, system_prompt, oracle_context);
    }
    catch (const std::exception& e) {
        spdlog::warn("Oracle query failed: {}", e.what());
        return std::string("AI Error: ") + e.what();
    }
}

void CampaignEngine::AnalyzePhaseResults(CampaignContext& context, Phase phase) {
    const std::string phase_name = PhaseToString(phase);
    auto records = context.log.ForPhase(phase_name);

    if (records.empty()) {
        return;
    }

    auto successful = std::count_if(records.begin(), records.end(),
        [](const OperationRecord& r) { return r.success.value_or(false); });

    std::ostringstream prompt;
    prompt << "Phase: " << phase_name << "\n"
           << "Operations completed: " << records.size() << "\n"
           << "Successful operations: " << successful << "\n\n"
           << "Current targets: " << FormatList(context.registry.Ids(),
                                                config_.limits.context_target_ids) << "\n"
           << "Current vulnerabilities: " << context.registry.CountVulnerabilities() << "\n\n"
           << "Analyze the results and recommend next steps for the following phase.";

    auto analysis = QueryOracle(prompt.str(),
        "You are analyzing " + phase_name + " results. Provide insights and strategy "
        "adjustments for the next phase.",
        BuildOracleContext(context, phase, std::nullopt));

    OperationRecord record;
    record.phase = AnalysisTag(phase);
    record.ai_payload = analysis;
    record.operations_analyzed = records.size();
    context.log.Append(std::move(record));

    spdlog::info("🤖 {} analysis: {} operations reviewed", phase_name, records.size());
    spdlog::debug("{}", StringUtils::Truncate(analysis, 300));
}

std::string CampaignEngine::BuildOracleContext(const CampaignContext& context,
                                               Phase phase,
                                               const std::optional<Target>& target) const {
    std::ostringstream oss;
    oss << "Campaign target: " << context.target << "\n"
        << "Phase: " << PhaseToString(phase) << "\n"
        << "Known targets: " << context.registry.Size()
        << ", exploited: " << context.registry.CountExploited() << "\n";

    auto tools = context.AvailableTools();
    if (!tools.empty()) {
        oss << "Available tools: "
            << StringUtils::Join(std::vector<std::string>(tools.begin(), tools.end()), ", ") << "\n";
    }

    if (target) {
        oss << "\nCurrent Target Context:\n"
            << "- IP: " << target->id << "\n"
            << "- Hostname: " << target->hostname.value_or("Unknown") << "\n"
            << "- Open Ports: " << FormatPorts(*target, config_.limits.context_ports) << "\n"
            << "- Services: " << FormatServices(*target, config_.limits.context_services) << "\n"
            << "- Vulnerabilities: " << target->vulnerabilities.size() << " found\n";
    }

    return oss.str();
}

// ============================================================================
// HELPERS
// ============================================================================

std::filesystem::path CampaignEngine::OutputPathFor(const CampaignContext& context,
                                                    Phase phase,
                                                    const std::string& command,
                                                    const std::optional<std::string>& target) const {
    const std::string phase_dir = StringUtils::ToLower(PhaseToString(phase));
    const std::string key = target ? *target + "|" + command : command;
    return context.results_directory / phase_dir /
           (phase_dir + "_" + HashUtils::ShortDigest(key) + ".txt");
}

std::vector<std::string> CampaignEngine::Take(std::vector<std::string> commands,
                                              std::size_t limit) const {
    if (commands.size() > limit) {
        commands.resize(limit);
    }
    return commands;
}

void CampaignEngine::UpdateStatus(Phase phase, const std::string& message) {
    PhaseCallback callback;
    CampaignStatus snapshot;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        status_.current_phase = phase;
        status_.status_message = message;
        status_.stop_requested = stop_requested_.load();
        snapshot = status_;
        callback = phase_callback_;
    }

    spdlog::debug("[{}] {}", PhaseToString(phase), message);

    if (callback) {
        callback(snapshot);
    }
}

std::string CampaignEngine::GenerateCampaignID() {
    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::system_clock::to_time_t(now);

    std::tm local{};
    localtime_r(&time, &local);

    std::random_device rd;
    std::mt19937 gen(rd());
    std::uniform_int_distribution<> dis(1000, 9999);

    std::ostringstream oss;
    oss << "campaign_"
        << std::put_time(&local, "%Y%m%d_%H%M%S")
        << "_" << dis(gen);

    return oss.str();
}

} // namespace core
} // namespace redeyes
