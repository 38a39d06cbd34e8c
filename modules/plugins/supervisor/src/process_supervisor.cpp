#include "process_supervisor.h"
#include "constants.h"
#include "duration_utils.h"
#include "logger.h"

#include <poll.h>
#include <unistd.h>

#include <cctype>
#include <cerrno>
#include <utility>

namespace masqueplus {

namespace {

std::string to_lower(std::string s) {
    for (auto& c : s) c = static_cast<char>(::tolower(static_cast<unsigned char>(c)));
    return s;
}

std::chrono::milliseconds since(std::chrono::steady_clock::time_point started) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started);
}

} // namespace

std::vector<std::string> build_socks_args(const std::string& config_path,
                                          const std::string& bind_ip,
                                          const std::string& bind_port) {
    return {"socks", "--config", config_path, "-b", bind_ip, "-p", bind_port};
}

ProcessSupervisor::ProcessSupervisor(SupervisorOptions options)
    : m_options(std::move(options)),
      m_fsm(m_options.tunnel_failure_threshold) {
    if (m_options.poll_interval_ms <= 0) {
        m_options.poll_interval_ms = SUPERVISOR_POLL_INTERVAL_MS;
    }
}

ProcessSupervisor::~ProcessSupervisor() {
    stop();
}

bool ProcessSupervisor::cancelled() const {
    return m_options.cancel != nullptr && m_options.cancel->load();
}

SuperviseResult ProcessSupervisor::start() {
    const auto started = std::chrono::steady_clock::now();
    SuperviseResult result;

    if (m_started) {
        result.error = SupervisorError::START_FAILED;
        result.message = "supervisor already used";
        return result;
    }
    m_started = true;

    std::vector<std::string> argv;
    argv.reserve(m_options.args.size() + 1);
    argv.push_back(m_options.binary);
    argv.insert(argv.end(), m_options.args.begin(), m_options.args.end());

    std::string err;
    if (!m_process.start(argv, &err)) {
        LOG_ERROR("failed to start usque", {{"endpoint", m_options.endpoint}, {"err", err}});
        result.error = SupervisorError::START_FAILED;
        result.message = "failed to start: " + err;
        result.elapsed = since(started);
        m_stopped = true;
        return result;
    }
    m_process.close_stdin();
    LOG_DEBUG("usque started", {{"endpoint", m_options.endpoint}, {"pid", std::to_string(m_process.pid())}});

    m_stdout_reader = std::thread(&ProcessSupervisor::reader_loop, this, m_process.stdout_fd(), "stdout");
    m_stderr_reader = std::thread(&ProcessSupervisor::reader_loop, this, m_process.stderr_fd(), "stderr");

    const auto deadline = started + std::chrono::milliseconds(m_options.connect_timeout_ms);
    for (;;) {
        if (m_fsm.connected() && m_fsm.failure() == SupervisorError::NONE) {
            result.success = true;
            result.elapsed = since(started);
            return result;
        }

        if (m_process.try_wait()) {
            return result_after_exit(started);
        }

        if (cancelled()) {
            stop();
            result.error = SupervisorError::CANCELLED;
            result.message = "cancelled";
            result.elapsed = since(started);
            return result;
        }

        if (std::chrono::steady_clock::now() >= deadline) {
            stop();
            result.error = SupervisorError::CONNECT_TIMEOUT;
            result.message = "connect timeout after " + format_duration_ms(m_options.connect_timeout_ms);
            result.elapsed = since(started);
            return result;
        }

        std::this_thread::sleep_for(std::chrono::milliseconds(m_options.poll_interval_ms));
    }
}

SuperviseResult ProcessSupervisor::wait_for_exit() {
    const auto started = std::chrono::steady_clock::now();
    if (m_stopped) {
        SuperviseResult result;
        result.error = m_fsm.failure();
        if (result.error == SupervisorError::NONE) {
            result.error = SupervisorError::PROCESS_EXITED;
        }
        result.message = supervisor_error_to_string(result.error);
        return result;
    }

    bool cancel_seen = false;
    while (!m_process.try_wait()) {
        if (!cancel_seen && cancelled()) {
            LOG_INFO("shutting down usque", {{"endpoint", m_options.endpoint}});
            cancel_seen = true;
            m_process.kill();
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(m_options.poll_interval_ms));
    }

    SuperviseResult result = result_after_exit(started);
    if (cancel_seen && result.error != SupervisorError::PRIVATE_KEY) {
        result.error = SupervisorError::CANCELLED;
        result.message = "cancelled";
    }
    return result;
}

SuperviseResult ProcessSupervisor::result_after_exit(std::chrono::steady_clock::time_point started) {
    m_fsm.handle_event(SupervisorEvent::PROCESS_EXITED);
    // Give the readers a chance to consume what the process wrote before dying.
    drain_and_join_readers();
    m_process.close_output_pipes();
    m_stopped = true;

    SuperviseResult result;
    result.elapsed = since(started);
    result.error = m_fsm.failure();
    switch (result.error) {
    case SupervisorError::PRIVATE_KEY:
        result.message = "failed to get private key";
        break;
    case SupervisorError::ENDPOINT_INVALID:
        result.message = "failed to set endpoint";
        break;
    case SupervisorError::HANDSHAKE_FAILURE:
        result.message = "handshake failure";
        break;
    case SupervisorError::TUNNEL_FAILURE_LIMIT:
        result.message = "tunnel connect failed " + std::to_string(m_fsm.tunnel_failure_count()) + " times";
        break;
    default:
        result.error = SupervisorError::PROCESS_EXITED;
        result.message = m_process.exit_description();
        break;
    }
    return result;
}

void ProcessSupervisor::stop() {
    if (m_stopped) {
        return;
    }
    m_stopped = true;
    if (!m_started) {
        return;
    }
    m_process.kill();
    m_process.wait();
    m_fsm.handle_event(SupervisorEvent::PROCESS_EXITED);
    drain_and_join_readers();
    m_process.close_output_pipes();
}

void ProcessSupervisor::drain_and_join_readers() {
    const auto drain_deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(READER_DRAIN_GRACE_MS);
    while (m_readers_done.load() < 2 && std::chrono::steady_clock::now() < drain_deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    m_stop_readers = true;
    if (m_stdout_reader.joinable()) m_stdout_reader.join();
    if (m_stderr_reader.joinable()) m_stderr_reader.join();
}

void ProcessSupervisor::reader_loop(int fd, const char* stream) {
    std::string pending;
    char buf[4096];

    while (!m_stop_readers.load()) {
        pollfd pfd{};
        pfd.fd = fd;
        pfd.events = POLLIN;
        const int rc = ::poll(&pfd, 1, READER_POLL_INTERVAL_MS);
        if (rc < 0) {
            if (errno == EINTR) continue;
            break;
        }
        if (rc == 0) {
            continue;
        }

        const ssize_t n = ::read(fd, buf, sizeof(buf));
        if (n < 0) {
            if (errno == EINTR || errno == EAGAIN) continue;
            break;
        }
        if (n == 0) {
            break;
        }

        pending.append(buf, static_cast<size_t>(n));
        size_t pos;
        while ((pos = pending.find('\n')) != std::string::npos) {
            std::string line = pending.substr(0, pos);
            pending.erase(0, pos + 1);
            if (!line.empty() && line.back() == '\r') line.pop_back();
            handle_line(line, stream);
        }
    }

    if (!pending.empty()) {
        handle_line(pending, stream);
    }
    ++m_readers_done;
}

void ProcessSupervisor::handle_line(const std::string& line, const char* stream) {
    const std::string text = strip_embedded_timestamp(line);
    LOG_DEBUG("usque output", {{"stream", stream}, {"line", text}});

    const SupervisorEvent event = classify_line(line);
    const SupervisorTransition transition = m_fsm.handle_event(event);

    switch (event) {
    case SupervisorEvent::PRIVATE_KEY_FAILURE:
        LOG_WARN("usque could not load its private key", {{"endpoint", m_options.endpoint}});
        break;
    case SupervisorEvent::HANDSHAKE_FAILURE:
        LOG_WARN("handshake failure", {{"endpoint", m_options.endpoint}});
        break;
    case SupervisorEvent::TUNNEL_CONNECT_FAILED:
        LOG_WARN("tunnel connect failed", {{"endpoint", m_options.endpoint},
                                           {"count", std::to_string(m_fsm.tunnel_failure_count())},
                                           {"limit", std::to_string(m_options.tunnel_failure_threshold)}});
        break;
    default:
        break;
    }

    for (SupervisorAction action : transition.actions) {
        switch (action) {
        case SupervisorAction::ANNOUNCE_CONNECTED:
            LOG_INFO("connected to MASQUE server", {{"endpoint", m_options.endpoint}});
            break;
        case SupervisorAction::LOG_CONNECTION_TEST_FAILED:
            LOG_INFO("connection test failed", {{"endpoint", m_options.endpoint}});
            break;
        case SupervisorAction::LOG_ERROR_LINE:
            LOG_INFO(to_lower(text));
            break;
        case SupervisorAction::LOG_INVALID_ENDPOINT:
            LOG_ERROR("invalid endpoint", {{"endpoint", m_options.endpoint}});
            break;
        case SupervisorAction::KILL_PROCESS:
            m_process.kill();
            break;
        }
    }
}

} // namespace masqueplus
