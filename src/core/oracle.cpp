/**
 * @file oracle.cpp
 * @brief Local-process oracle adapter
 *
 * @date 2025
 */

#include "redeyes/core/oracle.hpp"
#include "redeyes/utils/process_utils.hpp"
#include "redeyes/utils/string_utils.hpp"

#include <spdlog/spdlog.h>

namespace redeyes {
namespace core {

using utils::ProcessUtils;
using utils::StringUtils;

ProcessOracle::ProcessOracle(const Config& config)
    : config_(config) {
    if (IsConfigured()) {
        spdlog::info("🤖 Oracle: {}", ProcessUtils::DescribeArgv(config_.command));
    } else {
        spdlog::warn("No oracle command configured; strategy queries will return placeholders");
    }
}

std::string ProcessOracle::ComposePrompt(const std::string& prompt,
                                         const std::string& system_prompt,
                                         const std::string& context) {
    std::string composed;
    if (!system_prompt.empty()) {
        composed += "System: " + system_prompt + "\n\n";
    }
    composed += "Context: " + context + "\n\nUser: " + prompt;
    return composed;
}

std::string ProcessOracle::Query(const std::string& prompt,
                                 const std::string& system_prompt,
                                 const std::string& context) {
    if (!IsConfigured()) {
        return "AI not available - configure an oracle command";
    }

    try {
        utils::ProcessSpec spec;
        spec.argv = config_.command;
        spec.stdin_data = ComposePrompt(prompt, system_prompt, context);
        spec.timeout = std::chrono::duration_cast<std::chrono::milliseconds>(config_.timeout);
        spec.max_output_bytes = config_.max_response_bytes;

        spdlog::debug("[ORACLE] query ({} bytes)", spec.stdin_data->size());
        auto result = ProcessUtils::RunProcess(spec);

        if (result.spawn_failed) {
            spdlog::error("Oracle query failed: {}", result.error_message);
            return "AI Error: " + result.error_message;
        }
        if (result.timed_out) {
            spdlog::error("Oracle query timed out after {}s", config_.timeout.count());
            return "AI Error: query timed out after " + std::to_string(config_.timeout.count()) + "s";
        }
        if (result.exit_code != 0) {
            spdlog::warn("Oracle exited with code {}: {}", result.exit_code,
                         StringUtils::Truncate(StringUtils::Trim(result.stderr_output), 200));
        }

        std::string response = StringUtils::Trim(result.stdout_output);

        Remember("user", prompt);
        Remember("ai", response);

        return response;
    }
    catch (const std::exception& e) {
        spdlog::error("Oracle query failed: {}", e.what());
        return std::string("AI Error: ") + e.what();
    }
}

std::vector<ChatMessage> ProcessOracle::History() const {
    std::lock_guard<std::mutex> lock(history_mutex_);
    return std::vector<ChatMessage>(history_.begin(), history_.end());
}

void ProcessOracle::Remember(const std::string& sender, const std::string& content) {
    std::lock_guard<std::mutex> lock(history_mutex_);
    history_.push_back(ChatMessage{sender, content, std::chrono::system_clock::now()});
    while (history_.size() > config_.history_limit) {
        history_.pop_front();
    }
}

} // namespace core
} // namespace redeyes
