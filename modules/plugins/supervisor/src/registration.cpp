#include "registration.h"
#include "constants.h"
#include "duration_utils.h"
#include "logger.h"
#include "socket_utils.h"
#include "subprocess.h"

#include <poll.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <thread>

namespace masqueplus {

namespace {

// Reads whatever is available on fd and logs complete lines. Returns false at EOF.
bool relay_output(int fd, std::string& pending) {
    char buf[2048];
    const ssize_t n = ::read(fd, buf, sizeof(buf));
    if (n < 0) {
        return errno == EINTR || errno == EAGAIN;
    }
    if (n == 0) {
        if (!pending.empty()) {
            LOG_INFO(strip_embedded_timestamp(pending), {{"source", "register"}});
            pending.clear();
        }
        return false;
    }
    pending.append(buf, static_cast<size_t>(n));
    size_t pos;
    while ((pos = pending.find('\n')) != std::string::npos) {
        std::string line = pending.substr(0, pos);
        pending.erase(0, pos + 1);
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (!line.empty()) {
            LOG_INFO(strip_embedded_timestamp(line), {{"source", "register"}});
        }
    }
    return true;
}

} // namespace

bool run_registration(const RegistrationOptions& options, std::string* out_err) {
    LOG_INFO("registering device", {{"name", options.device_name}});

    Subprocess process;
    std::string err;
    if (!process.start({options.binary, "register", "-n", options.device_name}, &err)) {
        if (out_err) *out_err = "failed to start registration: " + err;
        return false;
    }

    if (!process.write_stdin(REGISTER_CONFIRMATIONS, &err)) {
        LOG_WARN("could not answer registration prompts", {{"err", err}});
    }
    process.close_stdin();

    Deadline deadline(options.timeout_ms);
    std::string out_pending;
    std::string err_pending;
    bool out_open = true;
    bool err_open = true;

    while (out_open || err_open) {
        if (deadline.expired()) {
            process.kill();
            process.wait();
            if (out_err) *out_err = "registration timed out after " + format_duration_ms(options.timeout_ms);
            return false;
        }

        pollfd fds[2];
        nfds_t count = 0;
        if (out_open) {
            fds[count].fd = process.stdout_fd();
            fds[count].events = POLLIN;
            fds[count].revents = 0;
            ++count;
        }
        if (err_open) {
            fds[count].fd = process.stderr_fd();
            fds[count].events = POLLIN;
            fds[count].revents = 0;
            ++count;
        }

        const int rc = ::poll(fds, count, std::min(deadline.remaining_ms(), 200));
        if (rc < 0) {
            if (errno == EINTR) continue;
            if (out_err) *out_err = "poll() failed: " + errno_string(errno);
            process.kill();
            process.wait();
            return false;
        }
        for (nfds_t i = 0; i < count; ++i) {
            if (fds[i].revents == 0) continue;
            if (fds[i].fd == process.stdout_fd()) {
                out_open = relay_output(fds[i].fd, out_pending);
            } else {
                err_open = relay_output(fds[i].fd, err_pending);
            }
        }
    }

    while (!process.try_wait()) {
        if (deadline.expired()) {
            process.kill();
            process.wait();
            if (out_err) *out_err = "registration timed out after " + format_duration_ms(options.timeout_ms);
            return false;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }

    if (process.exit_code() != 0) {
        if (out_err) *out_err = "registration failed: " + process.exit_description();
        return false;
    }
    LOG_INFO("registration complete", {{"name", options.device_name}});
    return true;
}

} // namespace masqueplus
