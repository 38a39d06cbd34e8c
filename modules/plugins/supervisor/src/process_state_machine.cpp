#include "process_state_machine.h"
#include "logger.h"

#include <cctype>

namespace masqueplus {

namespace {

struct MarkerRule {
    const char* marker;   // lower case
    SupervisorEvent event;
};

// Checked top to bottom; the first hit wins.
const MarkerRule kMarkerTable[] = {
    {"failed to get private key", SupervisorEvent::PRIVATE_KEY_FAILURE},
    {"invalid endpoint", SupervisorEvent::INVALID_ENDPOINT},
    {"failed to set endpoint", SupervisorEvent::INVALID_ENDPOINT},
    {"handshake failure", SupervisorEvent::HANDSHAKE_FAILURE},
    {"failed to connect tunnel", SupervisorEvent::TUNNEL_CONNECT_FAILED},
    {"tunnel connect failed", SupervisorEvent::TUNNEL_CONNECT_FAILED},
    {"connected to masque server", SupervisorEvent::CONNECTED_MARKER},
    {"no recent network activity", SupervisorEvent::IDLE_NOTICE},
    {"error", SupervisorEvent::ERROR_LINE},
};

} // namespace

SupervisorEvent classify_line(const std::string& line) {
    std::string lower = line;
    for (auto& c : lower) c = static_cast<char>(::tolower(static_cast<unsigned char>(c)));

    for (const auto& rule : kMarkerTable) {
        if (lower.find(rule.marker) != std::string::npos) {
            return rule.event;
        }
    }
    return SupervisorEvent::PLAIN_LINE;
}

ProcessStateMachine::ProcessStateMachine(int tunnel_failure_threshold)
    : m_tunnel_failure_threshold(tunnel_failure_threshold) {}

SupervisorTransition ProcessStateMachine::handle_event(SupervisorEvent event) {
    std::lock_guard<std::mutex> lock(m_mutex);
    const SupervisorState before = derive_state_locked();

    SupervisorTransition result{before, {}};
    switch (event) {
    case SupervisorEvent::PRIVATE_KEY_FAILURE:
        m_private_key_error = true;
        result.actions.push_back(SupervisorAction::KILL_PROCESS);
        break;

    case SupervisorEvent::INVALID_ENDPOINT:
        m_endpoint_invalid = true;
        result.actions.push_back(SupervisorAction::LOG_INVALID_ENDPOINT);
        result.actions.push_back(SupervisorAction::KILL_PROCESS);
        break;

    case SupervisorEvent::HANDSHAKE_FAILURE:
        m_handshake_failed = true;
        result.actions.push_back(SupervisorAction::KILL_PROCESS);
        break;

    case SupervisorEvent::TUNNEL_CONNECT_FAILED:
        ++m_tunnel_failure_count;
        if (m_tunnel_failure_threshold > 0 && m_tunnel_failure_count >= m_tunnel_failure_threshold) {
            result.actions.push_back(SupervisorAction::KILL_PROCESS);
        }
        break;

    case SupervisorEvent::CONNECTED_MARKER:
        m_connected = true;
        if (!m_first_log_announced) {
            m_first_log_announced = true;
            result.actions.push_back(SupervisorAction::ANNOUNCE_CONNECTED);
        }
        break;

    case SupervisorEvent::IDLE_NOTICE:
        result.actions.push_back(SupervisorAction::LOG_CONNECTION_TEST_FAILED);
        break;

    case SupervisorEvent::ERROR_LINE:
        result.actions.push_back(SupervisorAction::LOG_ERROR_LINE);
        break;

    case SupervisorEvent::PROCESS_EXITED:
        m_exited = true;
        break;

    case SupervisorEvent::PLAIN_LINE:
        break;
    }

    result.new_state = derive_state_locked();
    if (result.new_state != before) {
        LOG_DEBUG("supervisor state change", {{"from", supervisor_state_to_string(before)},
                                              {"to", supervisor_state_to_string(result.new_state)},
                                              {"event", supervisor_event_to_string(event)}});
    }
    return result;
}

SupervisorState ProcessStateMachine::derive_state_locked() const {
    if (m_private_key_error) return SupervisorState::PRIVATE_KEY_ERROR;
    if (m_endpoint_invalid) return SupervisorState::ENDPOINT_INVALID;
    if (m_handshake_failed) return SupervisorState::HANDSHAKE_FAILED;
    if (m_tunnel_failure_threshold > 0 && m_tunnel_failure_count >= m_tunnel_failure_threshold) {
        return SupervisorState::TUNNEL_FAIL_EXCEEDED;
    }
    if (m_exited) return SupervisorState::PROCESS_EXITED;
    if (m_connected) return SupervisorState::CONNECTED;
    return SupervisorState::STARTING;
}

SupervisorState ProcessStateMachine::state() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return derive_state_locked();
}

bool ProcessStateMachine::connected() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_connected;
}

bool ProcessStateMachine::handshake_failed() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_handshake_failed;
}

bool ProcessStateMachine::endpoint_invalid() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_endpoint_invalid;
}

bool ProcessStateMachine::private_key_error() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_private_key_error;
}

bool ProcessStateMachine::tunnel_failure_limit_reached() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_tunnel_failure_threshold > 0 && m_tunnel_failure_count >= m_tunnel_failure_threshold;
}

int ProcessStateMachine::tunnel_failure_count() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_tunnel_failure_count;
}

bool ProcessStateMachine::exited() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_exited;
}

SupervisorError ProcessStateMachine::failure() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_private_key_error) return SupervisorError::PRIVATE_KEY;
    if (m_endpoint_invalid) return SupervisorError::ENDPOINT_INVALID;
    if (m_handshake_failed) return SupervisorError::HANDSHAKE_FAILURE;
    if (m_tunnel_failure_threshold > 0 && m_tunnel_failure_count >= m_tunnel_failure_threshold) {
        return SupervisorError::TUNNEL_FAILURE_LIMIT;
    }
    return SupervisorError::NONE;
}

const char* supervisor_state_to_string(SupervisorState state) {
    switch (state) {
    case SupervisorState::STARTING: return "STARTING";
    case SupervisorState::CONNECTED: return "CONNECTED";
    case SupervisorState::HANDSHAKE_FAILED: return "HANDSHAKE_FAILED";
    case SupervisorState::ENDPOINT_INVALID: return "ENDPOINT_INVALID";
    case SupervisorState::PRIVATE_KEY_ERROR: return "PRIVATE_KEY_ERROR";
    case SupervisorState::TUNNEL_FAIL_EXCEEDED: return "TUNNEL_FAIL_EXCEEDED";
    case SupervisorState::PROCESS_EXITED: return "PROCESS_EXITED";
    }
    return "UNKNOWN";
}

const char* supervisor_event_to_string(SupervisorEvent event) {
    switch (event) {
    case SupervisorEvent::PRIVATE_KEY_FAILURE: return "PRIVATE_KEY_FAILURE";
    case SupervisorEvent::INVALID_ENDPOINT: return "INVALID_ENDPOINT";
    case SupervisorEvent::HANDSHAKE_FAILURE: return "HANDSHAKE_FAILURE";
    case SupervisorEvent::TUNNEL_CONNECT_FAILED: return "TUNNEL_CONNECT_FAILED";
    case SupervisorEvent::CONNECTED_MARKER: return "CONNECTED_MARKER";
    case SupervisorEvent::IDLE_NOTICE: return "IDLE_NOTICE";
    case SupervisorEvent::ERROR_LINE: return "ERROR_LINE";
    case SupervisorEvent::PLAIN_LINE: return "PLAIN_LINE";
    case SupervisorEvent::PROCESS_EXITED: return "PROCESS_EXITED";
    }
    return "UNKNOWN";
}

const char* supervisor_error_to_string(SupervisorError error) {
    switch (error) {
    case SupervisorError::NONE: return "none";
    case SupervisorError::START_FAILED: return "start failed";
    case SupervisorError::PRIVATE_KEY: return "failed to get private key";
    case SupervisorError::ENDPOINT_INVALID: return "failed to set endpoint";
    case SupervisorError::HANDSHAKE_FAILURE: return "handshake failure";
    case SupervisorError::TUNNEL_FAILURE_LIMIT: return "tunnel connect failure limit reached";
    case SupervisorError::CONNECT_TIMEOUT: return "connect timeout";
    case SupervisorError::PROCESS_EXITED: return "process exited";
    case SupervisorError::CANCELLED: return "cancelled";
    }
    return "unknown";
}

} // namespace masqueplus
