#include "candidate_orchestrator.h"
#include "logger.h"

#include <exception>
#include <utility>

namespace masqueplus {

CandidateOrchestrator::CandidateOrchestrator(OrchestratorOptions options, PrecheckFunction precheck)
    : m_options(std::move(options)), m_precheck(std::move(precheck)) {}

TrialOutcome CandidateOrchestrator::run(const std::vector<std::string>& candidates,
                                        const StartFunction& start) const {
    TrialOutcome outcome;

    size_t max_to_try = m_options.max_attempts;
    if (max_to_try == 0 || max_to_try > candidates.size()) {
        max_to_try = candidates.size();
    }
    const std::string of = std::to_string(max_to_try);

    for (size_t i = 0; i < max_to_try; ++i) {
        const std::string& endpoint = candidates[i];
        outcome.considered = i + 1;
        LOG_INFO("candidate", {{"endpoint", endpoint}, {"idx", std::to_string(i + 1)}, {"of", of}});

        if (m_options.precheck && m_precheck) {
            if (!m_precheck(endpoint)) {
                LOG_INFO("precheck failed; skipping", {{"endpoint", endpoint}});
                continue;
            }
            LOG_DEBUG("precheck ok", {{"endpoint", endpoint}});
        }

        StartAttempt attempt;
        try {
            attempt = start(endpoint);
        } catch (const std::exception& e) {
            attempt = StartAttempt{};
            attempt.error = std::string("start threw: ") + e.what();
        }

        if (attempt.stop) {
            attempt.stop();
        }

        if (attempt.success) {
            outcome.chosen_endpoint = endpoint;
            return outcome;
        }

        LOG_INFO("candidate rejected", {{"endpoint", endpoint},
                                        {"err", attempt.error.empty() ? std::string("start failed") : attempt.error}});
    }

    outcome.error = "no viable endpoint found (tried " + std::to_string(max_to_try) + ")";
    return outcome;
}

} // namespace masqueplus
