#ifndef MASQUEPLUS_PROCESS_SUPERVISOR_H
#define MASQUEPLUS_PROCESS_SUPERVISOR_H

#include "process_state_machine.h"
#include "subprocess.h"

#include <atomic>
#include <chrono>
#include <string>
#include <thread>
#include <vector>

namespace masqueplus {

struct SupervisorOptions {
    std::string binary;
    std::vector<std::string> args;
    std::string endpoint;              // for log lines only
    int connect_timeout_ms = 0;
    int tunnel_failure_threshold = 3;
    int poll_interval_ms = 50;
    const std::atomic<bool>* cancel = nullptr;
};

struct SuperviseResult {
    bool success = false;
    SupervisorError error = SupervisorError::NONE;
    std::string message;
    std::chrono::milliseconds elapsed{0};
};

// usque socks --config <path> -b <ip> -p <port>
std::vector<std::string> build_socks_args(const std::string& config_path,
                                          const std::string& bind_ip,
                                          const std::string& bind_port);

// Runs one protocol-binary invocation: spawns it, classifies its stdout and
// stderr line by line on two reader threads, and races "connected" against
// process exit and the connect timeout.
//
// Every path out of this object kills the subprocess: a failed start() kills
// and reaps before returning, stop() and the destructor do the same.
class ProcessSupervisor {
public:
    explicit ProcessSupervisor(SupervisorOptions options);
    ~ProcessSupervisor();

    ProcessSupervisor(const ProcessSupervisor&) = delete;
    ProcessSupervisor& operator=(const ProcessSupervisor&) = delete;

    // Blocks until connected (process left running), failure or timeout.
    SuperviseResult start();

    // After a successful start(): blocks until the process exits or the
    // cancel flag is raised, then reports why it ended.
    SuperviseResult wait_for_exit();

    // Kill, reap, join readers. Idempotent.
    void stop();

    SupervisorState state() const { return m_fsm.state(); }
    const ProcessStateMachine& state_machine() const { return m_fsm; }

private:
    void reader_loop(int fd, const char* stream);
    void handle_line(const std::string& line, const char* stream);
    void drain_and_join_readers();
    bool cancelled() const;
    SuperviseResult result_after_exit(std::chrono::steady_clock::time_point started);

    SupervisorOptions m_options;
    Subprocess m_process;
    ProcessStateMachine m_fsm;

    std::thread m_stdout_reader;
    std::thread m_stderr_reader;
    std::atomic<bool> m_stop_readers{false};
    std::atomic<int> m_readers_done{0};

    bool m_started = false;
    bool m_stopped = false;
};

} // namespace masqueplus

#endif // MASQUEPLUS_PROCESS_SUPERVISOR_H
