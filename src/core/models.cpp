/**
 * @file models.cpp
 * @brief Phase naming helpers
 *
 * @date 2025
 */

#include "redeyes/core/models.hpp"

namespace redeyes {
namespace core {

const std::vector<Phase>& AllPhases() {
    static const std::vector<Phase> phases = {
        Phase::PLANNING,
        Phase::OSINT,
        Phase::ENUMERATION,
        Phase::VULNERABILITY,
        Phase::EXPLOITATION,
        Phase::POST_EXPLOITATION,
        Phase::REPORTING
    };
    return phases;
}

std::string PhaseToString(Phase phase) {
    switch (phase) {
        case Phase::PLANNING:          return "PLANNING";
        case Phase::OSINT:             return "OSINT";
        case Phase::ENUMERATION:       return "ENUMERATION";
        case Phase::VULNERABILITY:     return "VULNERABILITY";
        case Phase::EXPLOITATION:      return "EXPLOITATION";
        case Phase::POST_EXPLOITATION: return "POST_EXPLOITATION";
        case Phase::REPORTING:         return "REPORTING";
    }
    return "UNKNOWN";
}

std::optional<Phase> PhaseFromString(const std::string& name) {
    for (Phase phase : AllPhases()) {
        if (PhaseToString(phase) == name) {
            return phase;
        }
    }
    return std::nullopt;
}

std::string AnalysisTag(Phase phase) {
    return PhaseToString(phase) + "_ANALYSIS";
}

} // namespace core
} // namespace redeyes
