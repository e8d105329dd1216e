/**
 * @file oracle.hpp
 * @brief Text-generation oracle contract and a local-process adapter
 *
 * The campaign engine only ever sees the Oracle interface. ProcessOracle is
 * the production adapter: it pipes the composed prompt into a configured
 * model CLI (for example `ollama run llama3`) and returns its stdout.
 *
 * @date 2025
 */

#pragma once

#include <chrono>
#include <deque>
#include <mutex>
#include <string>
#include <vector>

namespace redeyes {
namespace core {

/**
 * @class Oracle
 * @brief Source of strategy and candidate-command text
 *
 * Implementations report failures as an error-describing string rather than
 * throwing. Callers still guard each query.
 */
class Oracle {
public:
    virtual ~Oracle() = default;

    /**
     * @brief Ask the oracle
     * @param prompt User request
     * @param system_prompt Role instructions
     * @param context Bounded summary of campaign state (may be empty)
     * @return Response text, or an "AI Error: ..." string
     */
    virtual std::string Query(const std::string& prompt,
                              const std::string& system_prompt,
                              const std::string& context) = 0;

    std::string Query(const std::string& prompt, const std::string& system_prompt) {
        return Query(prompt, system_prompt, std::string());
    }
};

/**
 * @struct ChatMessage
 * @brief One side of an oracle exchange kept in the history
 */
struct ChatMessage {
    std::string sender;    ///< "user" or "ai"
    std::string content;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

/**
 * @class ProcessOracle
 * @brief Oracle backed by a local model CLI reading the prompt on stdin
 *
 * **Prompt layout**:
 * ```
 * System: <system_prompt>
 *
 * Context: <context>
 *
 * User: <prompt>
 * ```
 * The System section is omitted when the system prompt is empty.
 *
 * **Thread Safety**: Query() and History() may be called concurrently.
 */
class ProcessOracle : public Oracle {
public:
    /**
     * @struct Config
     * @brief Model invocation settings
     */
    struct Config {
        std::vector<std::string> command;          ///< argv, e.g. {"ollama","run","llama3"}
        std::chrono::seconds timeout{120};         ///< Per-query limit
        std::size_t max_response_bytes{1024 * 1024};
        std::size_t history_limit{100};            ///< Messages kept (user + ai)
    };

    explicit ProcessOracle(const Config& config);

    using Oracle::Query;

    std::string Query(const std::string& prompt,
                      const std::string& system_prompt,
                      const std::string& context) override;

    /// true when a model command is configured
    bool IsConfigured() const { return !config_.command.empty(); }

    /// Copy of the bounded chat history, oldest first
    std::vector<ChatMessage> History() const;

    /// Compose the text written to the model's stdin
    static std::string ComposePrompt(const std::string& prompt,
                                     const std::string& system_prompt,
                                     const std::string& context);

private:
    void Remember(const std::string& sender, const std::string& content);

    Config config_;
    std::deque<ChatMessage> history_;
    mutable std::mutex history_mutex_;
};

} // namespace core
} // namespace redeyes
