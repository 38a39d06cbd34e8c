#ifndef MASQUEPLUS_PROCESS_STATE_MACHINE_H
#define MASQUEPLUS_PROCESS_STATE_MACHINE_H

#include <mutex>
#include <string>
#include <vector>

namespace masqueplus {

// =======================================================
// Supervised process state (derived from the flags below)
// =======================================================
enum class SupervisorState {
    STARTING,
    CONNECTED,
    HANDSHAKE_FAILED,
    ENDPOINT_INVALID,
    PRIVATE_KEY_ERROR,
    TUNNEL_FAIL_EXCEEDED,
    PROCESS_EXITED
};

// =======================================================
// Events: one per classified output line, plus process exit
// =======================================================
enum class SupervisorEvent {
    PRIVATE_KEY_FAILURE,
    INVALID_ENDPOINT,
    HANDSHAKE_FAILURE,
    TUNNEL_CONNECT_FAILED,
    CONNECTED_MARKER,
    IDLE_NOTICE,
    ERROR_LINE,
    PLAIN_LINE,
    PROCESS_EXITED
};

// =======================================================
// Actions the supervisor carries out (FSM has no side effects)
// =======================================================
enum class SupervisorAction {
    ANNOUNCE_CONNECTED,
    KILL_PROCESS,
    LOG_CONNECTION_TEST_FAILED,
    LOG_ERROR_LINE,
    LOG_INVALID_ENDPOINT
};

// Final error for a run, in priority order.
enum class SupervisorError {
    NONE,
    START_FAILED,
    PRIVATE_KEY,
    ENDPOINT_INVALID,
    HANDSHAKE_FAILURE,
    TUNNEL_FAILURE_LIMIT,
    CONNECT_TIMEOUT,
    PROCESS_EXITED,
    CANCELLED
};

struct SupervisorTransition {
    SupervisorState new_state;
    std::vector<SupervisorAction> actions;
};

// Marker table lookup. Priority, highest first:
//   private key > invalid endpoint > handshake failure > tunnel connect failed
//   > connected > idle notice > generic "error" line
SupervisorEvent classify_line(const std::string& line);

const char* supervisor_state_to_string(SupervisorState state);
const char* supervisor_event_to_string(SupervisorEvent event);
const char* supervisor_error_to_string(SupervisorError error);

// Mutable state shared by the two output readers and the supervising thread.
// All access goes through these methods under one mutex.
class ProcessStateMachine {
public:
    explicit ProcessStateMachine(int tunnel_failure_threshold);

    SupervisorTransition handle_event(SupervisorEvent event);

    SupervisorState state() const;
    bool connected() const;
    bool handshake_failed() const;
    bool endpoint_invalid() const;
    bool private_key_error() const;
    bool tunnel_failure_limit_reached() const;
    int tunnel_failure_count() const;
    bool exited() const;

    // Classified failure for a process that ended before (or after) connecting.
    // Returns NONE when none of the failure markers were seen.
    SupervisorError failure() const;

private:
    SupervisorState derive_state_locked() const;

    mutable std::mutex m_mutex;
    const int m_tunnel_failure_threshold;

    bool m_connected = false;
    bool m_handshake_failed = false;
    bool m_endpoint_invalid = false;
    bool m_private_key_error = false;
    int m_tunnel_failure_count = 0;
    bool m_first_log_announced = false;
    bool m_exited = false;
};

} // namespace masqueplus

#endif // MASQUEPLUS_PROCESS_STATE_MACHINE_H
