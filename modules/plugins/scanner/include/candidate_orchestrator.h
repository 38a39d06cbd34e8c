#ifndef MASQUEPLUS_CANDIDATE_ORCHESTRATOR_H
#define MASQUEPLUS_CANDIDATE_ORCHESTRATOR_H

#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace masqueplus {

// What a start function hands back for one candidate.
struct StartAttempt {
    std::function<void()> stop;        // may be empty when nothing was started
    bool success = false;
    std::string error;
};

using StartFunction = std::function<StartAttempt(const std::string& endpoint)>;
using PrecheckFunction = std::function<bool(const std::string& endpoint)>;

struct OrchestratorOptions {
    size_t max_attempts = 0;           // 0 or larger than the list means "all"
    bool precheck = false;
    int precheck_timeout_ms = 0;       // informational, the precheck owns its timeout
    int per_candidate_timeout_ms = 0;  // informational, the start function owns its timeout
};

struct TrialOutcome {
    std::optional<std::string> chosen_endpoint;
    std::optional<std::string> error;
    size_t considered = 0;

    bool ok() const { return chosen_endpoint.has_value(); }
};

// Walks candidates strictly in order and stops at the first one whose start
// function succeeds. Every stop action is called exactly once, before the
// next candidate is touched.
class CandidateOrchestrator {
public:
    CandidateOrchestrator(OrchestratorOptions options, PrecheckFunction precheck);

    TrialOutcome run(const std::vector<std::string>& candidates, const StartFunction& start) const;

    const OrchestratorOptions& options() const { return m_options; }

private:
    OrchestratorOptions m_options;
    PrecheckFunction m_precheck;
};

} // namespace masqueplus

#endif // MASQUEPLUS_CANDIDATE_ORCHESTRATOR_H
