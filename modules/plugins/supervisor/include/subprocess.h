#ifndef MASQUEPLUS_SUBPROCESS_H
#define MASQUEPLUS_SUBPROCESS_H

#include <sys/types.h>

#include <mutex>
#include <string>
#include <vector>

namespace masqueplus {

enum class ProcessStatus {
    NOT_STARTED,
    RUNNING,
    EXITED
};

// Child process with piped stdin/stdout/stderr, started in its own process
// group. The destructor kills and reaps the child if it is still around.
class Subprocess {
public:
    Subprocess() = default;
    ~Subprocess();

    Subprocess(const Subprocess&) = delete;
    Subprocess& operator=(const Subprocess&) = delete;

    // argv[0] is looked up in PATH when it has no slash. Fails (with errno text)
    // when exec fails, e.g. missing or non-executable binary.
    bool start(const std::vector<std::string>& argv, std::string* out_err);

    // Sends SIGKILL to the process group. Safe to call any number of times,
    // from any thread; a no-op once the child has been reaped.
    void kill();

    // Non-blocking reap. Returns true once the child has exited.
    bool try_wait();

    // Blocking reap.
    void wait();

    bool write_stdin(const std::string& data, std::string* out_err);
    void close_stdin();

    int stdout_fd() const { return m_stdout_fd; }
    int stderr_fd() const { return m_stderr_fd; }

    pid_t pid() const { return m_pid; }
    ProcessStatus status() const;
    bool was_killed() const;

    // Exit status, or -1 while running or when terminated by a signal.
    int exit_code() const;

    // "exit status N", "signal: killed", ...
    std::string exit_description() const;

    void close_output_pipes();

private:
    void record_exit(int raw_status);

    mutable std::mutex m_mutex;
    pid_t m_pid = -1;
    ProcessStatus m_status = ProcessStatus::NOT_STARTED;
    int m_raw_status = 0;
    bool m_kill_sent = false;

    int m_stdin_fd = -1;
    int m_stdout_fd = -1;
    int m_stderr_fd = -1;
};

} // namespace masqueplus

#endif // MASQUEPLUS_SUBPROCESS_H
