#include "subprocess.h"
#include "socket_utils.h"

#include <fcntl.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <cctype>
#include <chrono>
#include <cstring>
#include <thread>

namespace masqueplus {

namespace {

void close_fd(int& fd) {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

bool make_pipe(int fds[2], std::string* out_err) {
    if (::pipe2(fds, O_CLOEXEC) != 0) {
        if (out_err) *out_err = "pipe2() failed: " + errno_string(errno);
        return false;
    }
    return true;
}

} // namespace

Subprocess::~Subprocess() {
    if (status() == ProcessStatus::RUNNING) {
        kill();
        wait();
    }
    close_fd(m_stdin_fd);
    close_output_pipes();
}

bool Subprocess::start(const std::vector<std::string>& argv, std::string* out_err) {
    if (argv.empty()) {
        if (out_err) *out_err = "empty command line";
        return false;
    }
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_status != ProcessStatus::NOT_STARTED) {
            if (out_err) *out_err = "process already started";
            return false;
        }
    }

    int in_pipe[2] = {-1, -1};
    int out_pipe[2] = {-1, -1};
    int err_pipe[2] = {-1, -1};
    int exec_pipe[2] = {-1, -1};
    auto close_all = [&]() {
        for (int* p : {in_pipe, out_pipe, err_pipe, exec_pipe}) {
            close_fd(p[0]);
            close_fd(p[1]);
        }
    };
    if (!make_pipe(in_pipe, out_err) || !make_pipe(out_pipe, out_err) ||
        !make_pipe(err_pipe, out_err) || !make_pipe(exec_pipe, out_err)) {
        close_all();
        return false;
    }

    // Everything the child touches is prepared before fork().
    std::vector<char*> c_argv;
    c_argv.reserve(argv.size() + 1);
    for (const auto& arg : argv) {
        c_argv.push_back(const_cast<char*>(arg.c_str()));
    }
    c_argv.push_back(nullptr);

    const pid_t pid = ::fork();
    if (pid < 0) {
        if (out_err) *out_err = "fork() failed: " + errno_string(errno);
        close_all();
        return false;
    }

    if (pid == 0) {
        ::setpgid(0, 0);
        ::signal(SIGPIPE, SIG_DFL);
        ::dup2(in_pipe[0], STDIN_FILENO);
        ::dup2(out_pipe[1], STDOUT_FILENO);
        ::dup2(err_pipe[1], STDERR_FILENO);
        ::execvp(c_argv[0], c_argv.data());
        const int exec_errno = errno;
        ssize_t ignored = ::write(exec_pipe[1], &exec_errno, sizeof(exec_errno));
        (void)ignored;
        ::_exit(127);
    }

    ::setpgid(pid, pid);
    close_fd(in_pipe[0]);
    close_fd(out_pipe[1]);
    close_fd(err_pipe[1]);
    close_fd(exec_pipe[1]);

    // The exec pipe is CLOEXEC: EOF means exec succeeded, data means it failed.
    int exec_errno = 0;
    ssize_t n;
    do {
        n = ::read(exec_pipe[0], &exec_errno, sizeof(exec_errno));
    } while (n < 0 && errno == EINTR);
    close_fd(exec_pipe[0]);

    if (n == static_cast<ssize_t>(sizeof(exec_errno))) {
        int raw = 0;
        while (::waitpid(pid, &raw, 0) < 0 && errno == EINTR) {
        }
        close_all();
        if (out_err) *out_err = "exec " + argv[0] + ": " + std::strerror(exec_errno);
        return false;
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    m_pid = pid;
    m_status = ProcessStatus::RUNNING;
    m_stdin_fd = in_pipe[1];
    m_stdout_fd = out_pipe[0];
    m_stderr_fd = err_pipe[0];
    return true;
}

void Subprocess::kill() {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_status != ProcessStatus::RUNNING) {
        return;
    }
    if (!m_kill_sent) {
        if (::kill(-m_pid, SIGKILL) != 0) {
            (void)::kill(m_pid, SIGKILL);
        }
        m_kill_sent = true;
    }
}

void Subprocess::record_exit(int raw_status) {
    m_raw_status = raw_status;
    m_status = ProcessStatus::EXITED;
}

bool Subprocess::try_wait() {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_status != ProcessStatus::RUNNING) {
        return m_status == ProcessStatus::EXITED;
    }
    int raw = 0;
    pid_t rc;
    do {
        rc = ::waitpid(m_pid, &raw, WNOHANG);
    } while (rc < 0 && errno == EINTR);
    if (rc == m_pid) {
        record_exit(raw);
        // Helpers left in the group would keep the pipes open.
        (void)::kill(-m_pid, SIGKILL);
        return true;
    }
    if (rc < 0) {
        // ECHILD: someone else reaped it; treat as gone.
        record_exit(0);
        return true;
    }
    return false;
}

void Subprocess::wait() {
    while (!try_wait()) {
        if (status() == ProcessStatus::NOT_STARTED) {
            return;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
}

bool Subprocess::write_stdin(const std::string& data, std::string* out_err) {
    if (m_stdin_fd < 0) {
        if (out_err) *out_err = "stdin is closed";
        return false;
    }
    size_t total = 0;
    while (total < data.size()) {
        const ssize_t n = ::write(m_stdin_fd, data.data() + total, data.size() - total);
        if (n < 0) {
            if (errno == EINTR) continue;
            if (out_err) *out_err = "write(stdin) failed: " + errno_string(errno);
            return false;
        }
        total += static_cast<size_t>(n);
    }
    return true;
}

void Subprocess::close_stdin() {
    close_fd(m_stdin_fd);
}

void Subprocess::close_output_pipes() {
    close_fd(m_stdout_fd);
    close_fd(m_stderr_fd);
}

ProcessStatus Subprocess::status() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_status;
}

bool Subprocess::was_killed() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_kill_sent;
}

int Subprocess::exit_code() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_status != ProcessStatus::EXITED || !WIFEXITED(m_raw_status)) {
        return -1;
    }
    return WEXITSTATUS(m_raw_status);
}

std::string Subprocess::exit_description() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_status != ProcessStatus::EXITED) {
        return m_status == ProcessStatus::RUNNING ? "running" : "not started";
    }
    if (WIFEXITED(m_raw_status)) {
        return "exit status " + std::to_string(WEXITSTATUS(m_raw_status));
    }
    if (WIFSIGNALED(m_raw_status)) {
        const int sig = WTERMSIG(m_raw_status);
        std::string name = ::strsignal(sig) ? ::strsignal(sig) : ("signal " + std::to_string(sig));
        for (auto& c : name) c = static_cast<char>(::tolower(static_cast<unsigned char>(c)));
        return "signal: " + name;
    }
    return "exited";
}

} // namespace masqueplus
