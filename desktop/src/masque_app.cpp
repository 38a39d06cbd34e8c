#include "masque_app.h"
#include "config_manager.h"
#include "constants.h"
#include "duration_utils.h"
#include "endpoint_config_store.h"
#include "endpoint_prober.h"
#include "logger.h"
#include "registration.h"
#include "socket_utils.h"
#include "warp_validator.h"

#include <algorithm>
#include <cctype>
#include <iterator>
#include <utility>

namespace masqueplus {

namespace {

bool iequals(const std::string& a, const std::string& b) {
    if (a.size() != b.size()) return false;
    for (size_t i = 0; i < a.size(); ++i) {
        if (::tolower(static_cast<unsigned char>(a[i])) != ::tolower(static_cast<unsigned char>(b[i]))) {
            return false;
        }
    }
    return true;
}

} // namespace

MasqueApp::MasqueApp(AppOptions options, const std::atomic<bool>* cancel)
    : m_options(std::move(options)),
      m_cancel(cancel),
      m_rng(make_random_source(ConfigManager::getInstance().getRandomSeed())) {}

bool MasqueApp::scannerMode() const {
    return m_options.scan || iequals(m_options.endpoint, AUTO_SCAN_ENDPOINT);
}

IpVersionFilter MasqueApp::ipVersion() const {
    IpVersionFilter filter = IpVersionFilter::ANY;
    parse_ip_version_filter(ConfigManager::getInstance().getIpVersion(), &filter);
    return filter;
}

bool MasqueApp::validate(std::string* out_err) {
    if (m_options.endpoint.empty() && !m_options.scan) {
        if (out_err) *out_err = "--endpoint is required";
        return false;
    }
    if (!scannerMode()) {
        std::string err;
        if (!parse_endpoint(m_options.endpoint, nullptr, &err)) {
            if (out_err) *out_err = "invalid endpoint: " + err;
            return false;
        }
    }
    IpVersionFilter filter;
    if (!parse_ip_version_filter(ConfigManager::getInstance().getIpVersion(), &filter)) {
        if (out_err) *out_err = "invalid scanner.ip_version: " + ConfigManager::getInstance().getIpVersion();
        return false;
    }
    return parse_bind_address(ConfigManager::getInstance().getBindAddress(), &m_bind_ip, &m_bind_port, out_err);
}

bool MasqueApp::ensureRegistered(bool force, std::string* out_err) {
    const ConfigManager& cfg = ConfigManager::getInstance();
    EndpointConfigStore store(cfg.getUsqueConfigPath());
    if (!force && store.exists()) {
        LOG_INFO("successfully loaded masque identity", {{"config", store.path()}});
        return true;
    }

    LOG_INFO("registering usque", {{"reason", force ? "renew" : "config missing"}});
    RegistrationOptions options;
    options.binary = cfg.getUsqueBinary();
    options.device_name = REGISTER_DEVICE_NAME;
    options.timeout_ms = cfg.getRegisterTimeoutMs();
    std::string err;
    if (!run_registration(options, &err)) {
        if (out_err) *out_err = "registration failed: " + err;
        return false;
    }
    return true;
}

bool MasqueApp::writeEndpoint(const std::string& endpoint, std::string* out_err) const {
    EndpointConfigStore store(ConfigManager::getInstance().getUsqueConfigPath());
    if (!store.load(out_err)) {
        return false;
    }
    if (!store.set_endpoint(endpoint, out_err)) {
        return false;
    }
    return store.save(out_err);
}

std::vector<std::string> MasqueApp::buildCandidates() {
    const ConfigManager& cfg = ConfigManager::getInstance();

    std::vector<uint16_t> ports;
    for (int port : cfg.getPorts()) {
        if (port < 1 || port > 65535) {
            LOG_WARN("invalid scan port; skipping", {{"port", std::to_string(port)}});
            continue;
        }
        ports.push_back(static_cast<uint16_t>(port));
    }

    RangeExpander expander(ports, *m_rng);
    std::vector<std::string> candidates = expander.build(ipVersion(), cfg.getV4Ranges(), cfg.getV6Ranges());
    if (cfg.isShuffleEnabled()) {
        shuffle_candidates(candidates, *m_rng);
    }
    return candidates;
}

std::string MasqueApp::pickDefaultEndpoint() {
    if (ipVersion() == IpVersionFilter::V6) {
        return DEFAULT_V6_ENDPOINTS[m_rng->uniform(std::size(DEFAULT_V6_ENDPOINTS))];
    }
    return DEFAULT_V4_ENDPOINTS[m_rng->uniform(std::size(DEFAULT_V4_ENDPOINTS))];
}

SupervisorOptions MasqueApp::supervisorOptions(const std::string& endpoint, int timeout_ms) const {
    const ConfigManager& cfg = ConfigManager::getInstance();
    SupervisorOptions options;
    options.binary = cfg.getUsqueBinary();
    options.args = build_socks_args(cfg.getUsqueConfigPath(), m_bind_ip, m_bind_port);
    options.endpoint = endpoint;
    options.connect_timeout_ms = timeout_ms;
    options.tunnel_failure_threshold = cfg.getTunnelFailureThreshold();
    options.poll_interval_ms = cfg.getPollIntervalMs();
    options.cancel = m_cancel;
    return options;
}

PrecheckFunction MasqueApp::makePrecheck() const {
    const ConfigManager& cfg = ConfigManager::getInstance();
    ProbeOptions options;
    options.timeout_ms = cfg.getProbeTimeoutMs();
    if (!parse_probe_transport(cfg.getPrecheckMode(), &options.transport)) {
        LOG_WARN("unknown precheck mode; using quic", {{"mode", cfg.getPrecheckMode()}});
        options.transport = ProbeTransport::QUIC;
    }
    if (options.transport == ProbeTransport::QUIC && !EndpointProber::quic_supported()) {
        LOG_WARN("quic probe not available in this build; falling back to tls precheck");
        options.tls_fallback = true;
    }

    auto prober = std::make_shared<EndpointProber>(options);
    return [prober](const std::string& endpoint) {
        return prober->scan({endpoint}).front().success;
    };
}

StartAttempt MasqueApp::tryCandidate(const std::string& endpoint) {
    const ConfigManager& cfg = ConfigManager::getInstance();
    StartAttempt attempt;
    if (m_cancel && m_cancel->load()) {
        attempt.error = "cancelled";
        return attempt;
    }

    std::string err;
    if (!writeEndpoint(endpoint, &err)) {
        attempt.error = "config write failed: " + err;
        return attempt;
    }

    auto supervisor = std::make_shared<ProcessSupervisor>(supervisorOptions(endpoint, cfg.getScanTimeoutMs()));
    attempt.stop = [supervisor]() { supervisor->stop(); };

    const SuperviseResult started = supervisor->start();
    if (!started.success) {
        attempt.error = started.message;
        return attempt;
    }

    if (cfg.isWarpCheckEnabled()) {
        WarpCheckOptions options;
        options.proxy_address = join_host_port(m_bind_ip, m_bind_port);
        options.url = cfg.getWarpCheckUrl();
        options.timeout_ms = cfg.getWarpCheckTimeoutMs();
        options.marker = WARP_ON_MARKER;
        const WarpCheckResult check = WarpValidator(options).check();
        const WarpCheckPolicy policy = cfg.isWarpCheckEnforced() ? WarpCheckPolicy::ENFORCE
                                                                 : WarpCheckPolicy::OBSERVE;
        if (!warp_check_permits(policy, check)) {
            attempt.error = std::string("warp check ") + warp_status_to_string(check.status);
            return attempt;
        }
    }

    attempt.success = true;
    return attempt;
}

bool MasqueApp::selectEndpoint(std::string* out_endpoint, std::string* out_err) {
    const ConfigManager& cfg = ConfigManager::getInstance();
    LOG_INFO("scanner mode enabled", {{"ip_version", ip_version_filter_to_string(ipVersion())}});

    const std::vector<std::string> candidates = buildCandidates();
    if (candidates.empty()) {
        const std::string fallback = pickDefaultEndpoint();
        LOG_WARN("no scan candidates; using built-in endpoint", {{"endpoint", fallback}});
        if (out_endpoint) *out_endpoint = fallback;
        return true;
    }

    OrchestratorOptions options;
    options.max_attempts = static_cast<size_t>(std::max(0, cfg.getMaxCandidates()));
    options.precheck = cfg.isPrecheckEnabled();
    options.precheck_timeout_ms = cfg.getProbeTimeoutMs();
    options.per_candidate_timeout_ms = cfg.getScanTimeoutMs();

    LOG_INFO("scanning candidates", {
        {"count", std::to_string(candidates.size())},
        {"max", std::to_string(options.max_attempts)},
        {"precheck", options.precheck ? "true" : "false"},
        {"timeout", format_duration_ms(options.per_candidate_timeout_ms)},
    });

    CandidateOrchestrator orchestrator(options, options.precheck ? makePrecheck() : PrecheckFunction());
    const TrialOutcome outcome = orchestrator.run(candidates, [this](const std::string& endpoint) {
        return tryCandidate(endpoint);
    });
    if (!outcome.ok()) {
        if (out_err) *out_err = outcome.error.value_or("no viable endpoint found");
        return false;
    }

    LOG_INFO("endpoint selected", {
        {"endpoint", *outcome.chosen_endpoint},
        {"considered", std::to_string(outcome.considered)},
    });
    if (out_endpoint) *out_endpoint = *outcome.chosen_endpoint;
    return true;
}

int MasqueApp::serve(const std::string& endpoint) {
    const ConfigManager& cfg = ConfigManager::getInstance();
    const std::string socks = join_host_port(m_bind_ip, m_bind_port);
    bool reregistered = false;

    for (;;) {
        ProcessSupervisor supervisor(supervisorOptions(endpoint, cfg.getConnectTimeoutMs()));
        SuperviseResult result = supervisor.start();

        if (result.success) {
            LOG_INFO("serving proxy", {{"endpoint", endpoint}, {"socks", socks}});
            std::string err;
            RunState state;
            state.endpoint = endpoint;
            state.socks = socks;
            if (!save_run_state(cfg.getStatePath(), state, &err)) {
                LOG_WARN("failed to save run state", {{"err", err}});
            }
            result = supervisor.wait_for_exit();
        }

        if (result.error == SupervisorError::CANCELLED) {
            LOG_INFO("shutdown complete");
            return 0;
        }
        if (result.error == SupervisorError::PRIVATE_KEY && !reregistered) {
            LOG_ERROR("private key error detected, re-registering");
            reregistered = true;
            std::string err;
            if (!ensureRegistered(true, &err)) {
                LOG_ERROR(err);
                return 1;
            }
            // Registration rewrites the config, so the endpoint goes back in.
            if (!writeEndpoint(endpoint, &err)) {
                LOG_ERROR("failed to write config", {{"err", err}});
                return 1;
            }
            continue;
        }

        LOG_ERROR(reregistered ? "failed to start SOCKS proxy after re-register" : "usque stopped", {
            {"endpoint", endpoint},
            {"err", result.message},
        });
        return 1;
    }
}

int MasqueApp::run() {
    std::string err;
    if (!validate(&err)) {
        LOG_ERROR(err);
        return 1;
    }
    LOG_INFO("running in masque mode");

    if (!ensureRegistered(m_options.renew, &err)) {
        LOG_ERROR(err);
        return 1;
    }

    std::string endpoint = m_options.endpoint;
    if (scannerMode()) {
        const bool selected = selectEndpoint(&endpoint, &err);
        if (m_cancel && m_cancel->load()) {
            LOG_INFO("shutdown complete");
            return 0;
        }
        if (!selected) {
            LOG_ERROR(err);
            return 1;
        }
    }
    if (m_cancel && m_cancel->load()) {
        LOG_INFO("shutdown complete");
        return 0;
    }

    ParsedEndpoint parsed;
    if (!parse_endpoint(endpoint, &parsed, &err)) {
        LOG_ERROR("invalid endpoint", {{"err", err}});
        return 1;
    }
    if (!writeEndpoint(endpoint, &err)) {
        LOG_ERROR("failed to write config", {{"err", err}});
        return 1;
    }
    LOG_INFO(parsed.is_ipv6 ? "using IPv6 endpoint" : "using IPv4 endpoint", {{"endpoint", endpoint}});

    return serve(endpoint);
}

} // namespace masqueplus
