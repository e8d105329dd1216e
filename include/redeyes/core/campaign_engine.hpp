/**
 * @file campaign_engine.hpp
 * @brief Phase orchestrator for autonomous assessment campaigns
 *
 * Drives the fixed phase sequence, asks the oracle for strategy text, turns
 * it into candidate commands, runs them through the Safe Executor on a
 * bounded worker pool, and folds the findings into the Target Registry and
 * Operations Log.
 *
 * @date 2025
 */

#pragma once

#include "redeyes/core/campaign_config.hpp"
#include "redeyes/core/campaign_context.hpp"
#include "redeyes/core/models.hpp"
#include "redeyes/core/oracle.hpp"

#include <atomic>
#include <chrono>
#include <filesystem>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace redeyes {
namespace core {

/**
 * @class PhaseTracker
 * @brief Enforces the one-directional phase order
 *
 * Each phase may be entered once, and only immediately after its
 * predecessor. Any other transition throws CampaignStateError.
 */
class PhaseTracker {
public:
    /// @throws CampaignStateError on an out-of-order or repeated transition
    void Enter(Phase phase);

    std::optional<Phase> Current() const { return current_; }
    const std::vector<Phase>& Visited() const { return visited_; }

    /// REPORTING reached
    bool IsTerminal() const { return current_ == Phase::REPORTING; }

private:
    std::optional<Phase> current_;
    std::vector<Phase> visited_;
};

/**
 * @struct CampaignStatus
 * @brief Live progress of a running campaign
 */
struct CampaignStatus {
    std::string campaign_id;
    std::optional<Phase> current_phase;
    std::string status_message;
    bool is_complete{false};
    bool stop_requested{false};
};

/**
 * @struct CampaignResult
 * @brief Outcome of CampaignEngine::Run
 */
struct CampaignResult {
    std::string campaign_id;
    std::vector<Phase> phases_visited;            ///< Always all seven, in order
    CampaignSummary summary;
    std::string final_analysis;
    bool stopped{false};                          ///< A stop request skipped phase work
    bool report_published{false};
    std::chrono::system_clock::time_point start_time;
    std::chrono::system_clock::time_point end_time;
    std::chrono::milliseconds total_duration{0};
};

/// Called from the control thread each time a phase is entered
using PhaseCallback = std::function<void(const CampaignStatus&)>;

/**
 * @class CampaignEngine
 * @brief The campaign state machine
 *
 * **Phase Work**:
 * | Phase             | Precondition              | Work                                   |
 * |-------------------|---------------------------|----------------------------------------|
 * | PLANNING          | none                      | strategy query, recorded, no execution |
 * | OSINT             | none                      | top N commands, hosts become targets   |
 * | ENUMERATION       | registry non-empty        | per target: ports and services         |
 * | VULNERABILITY     | a target has open ports   | per target: vulnerability indicators   |
 * | EXPLOITATION      | a target has vulns        | exploit candidates, success latch      |
 * | POST_EXPLOITATION | a target is exploited     | per exploited target follow-up         |
 * | REPORTING         | none                      | final query, summary, report handoff   |
 *
 * Command failures, oracle failures and exceptions raised while attempting a
 * single command are logged and absorbed. Only BookkeepingError escapes
 * Run().
 *
 * **Concurrency**: Phases run one after another on the calling thread.
 * Within a phase each target's command batch is a single job on the worker
 * pool; the phase awaits all batches before its closing analysis.
 *
 * **Usage Example**:
 * @code
 * TargetRegistry registry;
 * OperationsLog log;
 * ProcessOracle oracle(config.oracle);
 *
 * CampaignEngine engine(config, oracle);
 * if (!engine.Initialize()) return 1;
 *
 * CampaignContext context("example.com", {"external perimeter"}, registry, log,
 *                         config.results_directory);
 * auto result = engine.Run(context);
 * @endcode
 */
class CampaignEngine {
public:
    /**
     * @param config Campaign configuration
     * @param oracle Strategy source; must outlive the engine
     */
    CampaignEngine(const CampaignConfig& config, Oracle& oracle);

    ~CampaignEngine();

    CampaignEngine(const CampaignEngine&) = delete;
    CampaignEngine& operator=(const CampaignEngine&) = delete;

    /**
     * @brief Validate configuration, create the results directory, start workers
     * @return true if the engine is ready
     */
    bool Initialize();

    /// Attach the REPORTING consumer (optional)
    void AttachReportSink(std::shared_ptr<ReportSink> sink);

    void SetPhaseCallback(PhaseCallback callback);

    /**
     * @brief Run every phase in order
     *
     * @param context Campaign state; campaign_id is assigned here
     * @return Summary of the campaign
     * @throws BookkeepingError on registry misuse or an illegal transition
     * @throws CampaignStateError if the engine was not initialized
     */
    CampaignResult Run(CampaignContext& context);

    /**
     * @brief Ask the running campaign to stop
     *
     * Honoured between phases: remaining phases are entered but their work
     * is skipped, and REPORTING still produces the summary.
     */
    void RequestStop();

    bool StopRequested() const { return stop_requested_.load(); }

    CampaignStatus GetStatus() const;

    // Phase work. Run() calls these in order; hosts and tests may call them
    // directly on a context they manage.

    void RunPlanning(CampaignContext& context);
    void RunOsint(CampaignContext& context);
    void RunEnumeration(CampaignContext& context);
    void RunVulnerability(CampaignContext& context);
    void RunExploitation(CampaignContext& context);
    void RunPostExploitation(CampaignContext& context);
    void RunReporting(CampaignContext& context);

    /**
     * @brief Bounded state summary for oracle prompts
     *
     * Lists at most context_ports ports, context_services services and a
     * vulnerability count for @p target, plus campaign-level counts.
     */
    std::string BuildOracleContext(const CampaignContext& context,
                                   Phase phase,
                                   const std::optional<Target>& target) const;

    /**
     * @brief Deterministic output file for a command
     *
     * `<results>/<phase>/<phase>_<sha256(target|command)[:12]>.txt`
     */
    std::filesystem::path OutputPathFor(const CampaignContext& context,
                                        Phase phase,
                                        const std::string& command,
                                        const std::optional<std::string>& target) const;

    static std::string GenerateCampaignID();

    const CampaignConfig& GetConfig() const { return config_; }

private:
    CampaignConfig config_;
    Oracle& oracle_;

    class Impl;
    std::unique_ptr<Impl> impl_;

    std::atomic<bool> stop_requested_{false};
    CampaignStatus status_;
    PhaseCallback phase_callback_;
    mutable std::mutex state_mutex_;

    void RunPhase(CampaignContext& context, Phase phase);
    void UpdateStatus(Phase phase, const std::string& message);

    std::string QueryOracle(const std::string& prompt,
                            const std::string& system_prompt,
                            const std::string& oracle_context);

    /// Queue one target's commands as a single pool job
    void DispatchBatch(CampaignContext& context,
                       Phase phase,
                       const std::optional<std::string>& target,
                       std::vector<std::string> commands,
                       std::vector<std::future<void>>& batches);

    /// Wait for every batch; rethrow the first BookkeepingError afterwards
    void AwaitBatches(std::vector<std::future<void>>& batches);

    void ExecuteToolCommand(CampaignContext& context,
                            Phase phase,
                            const std::string& command,
                            const std::optional<std::string>& target);

    void ExecuteExploitCommand(CampaignContext& context,
                               const std::string& command,
                               const std::string& target);

    void ApplyFindings(CampaignContext& context,
                       Phase phase,
                       const std::optional<std::string>& target,
                       const std::string& output);

    void AnalyzePhaseResults(CampaignContext& context, Phase phase);

    std::vector<std::string> Take(std::vector<std::string> commands, std::size_t limit) const;
};

} // namespace core
} // namespace redeyes
