#ifndef MASQUEPLUS_MASQUE_APP_H
#define MASQUEPLUS_MASQUE_APP_H

#include "candidate_orchestrator.h"
#include "process_supervisor.h"
#include "random_source.h"
#include "range_expander.h"

#include <atomic>
#include <memory>
#include <string>
#include <vector>

namespace masqueplus {

// Per-run choices that are not settings.
struct AppOptions {
    std::string endpoint;
    bool renew = false;
    bool scan = false;
};

// Desktop driver: registration, endpoint selection, config rewrite and the
// long-running proxy. All tunables come from ConfigManager.
class MasqueApp {
public:
    MasqueApp(AppOptions options, const std::atomic<bool>* cancel);

    // Returns the process exit status.
    int run();

    // Checks the endpoint and bind address before anything is spawned.
    bool validate(std::string* out_err);

    // Registers when forced or when the usque config does not exist yet.
    bool ensureRegistered(bool force, std::string* out_err);

    // Scanner mode: expands the configured ranges and runs every candidate
    // through the orchestrator. Falls back to a built-in endpoint when no
    // candidate could be generated.
    bool selectEndpoint(std::string* out_endpoint, std::string* out_err);

    std::vector<std::string> buildCandidates();

    // Scanner mode is on for --scan and for the placeholder endpoint.
    bool scannerMode() const;

    bool writeEndpoint(const std::string& endpoint, std::string* out_err) const;

    // Starts the production proxy and blocks until it ends. A private-key
    // failure triggers one re-registration and retry.
    int serve(const std::string& endpoint);

private:
    IpVersionFilter ipVersion() const;
    std::string pickDefaultEndpoint();
    StartAttempt tryCandidate(const std::string& endpoint);
    PrecheckFunction makePrecheck() const;
    SupervisorOptions supervisorOptions(const std::string& endpoint, int timeout_ms) const;

    AppOptions m_options;
    const std::atomic<bool>* m_cancel;
    std::unique_ptr<RandomSource> m_rng;
    std::string m_bind_ip;
    std::string m_bind_port;
};

} // namespace masqueplus

#endif // MASQUEPLUS_MASQUE_APP_H
