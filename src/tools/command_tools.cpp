#include "tools/command_tools.hpp"

#include <cerrno>
#include <chrono>
#include <cstdint>
#include <fcntl.h>
#include <filesystem>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>
#include <utility>
#include "core/logging/logger.hpp"

namespace gatehouse::tools {

using core::errors::ErrorCategory;
using core::errors::GatehouseError;
using protocol::ToolResult;

namespace {

struct ProcessCapture {
    int exit_code = -1;
    bool timed_out = false;
    bool cancelled = false;
    std::string stdout_text;
    std::string stderr_text;
    double duration_ms = 0.0;
};

void set_nonblocking(const int fd) {
    const int flags = fcntl(fd, F_GETFL, 0);
    if (flags == -1) {
        return;
    }
    static_cast<void>(fcntl(fd, F_SETFL, flags | O_NONBLOCK));
}

void close_pair(int (&fds)[2]) {
    for (int& fd : fds) {
        if (fd >= 0) {
            static_cast<void>(close(fd));
            fd = -1;
        }
    }
}

void drain_pipe(const int fd, bool& is_open, std::string& out) {
    if (!is_open) {
        return;
    }

    char buffer[4096];
    while (true) {
        const ssize_t n = read(fd, buffer, sizeof(buffer));
        if (n > 0) {
            out.append(buffer, static_cast<std::size_t>(n));
            continue;
        }
        if (n == 0) {
            is_open = false;
            static_cast<void>(close(fd));
            return;
        }
        if (errno == EINTR) {
            continue;
        }
        if (errno == EAGAIN || errno == EWOULDBLOCK) {
            return;
        }
        is_open = false;
        static_cast<void>(close(fd));
        return;
    }
}

// The child leads its own process group so a timeout or cancel reaches every
// stage of a pipeline, not only the shell.
core::errors::Result<ProcessCapture> run_shell_command(
    const std::string& command, const std::optional<std::filesystem::path>& cwd,
    const std::uint32_t timeout_ms,
    const std::shared_ptr<std::atomic_bool>& cancel_token) {
    if (cancel_token && cancel_token->load()) {
        ProcessCapture capture;
        capture.cancelled = true;
        capture.stderr_text = "Command cancelled before start.";
        return capture;
    }

    int stdout_pipe[2] = {-1, -1};
    int stderr_pipe[2] = {-1, -1};
    // O_CLOEXEC keeps concurrent calls from inheriting each other's pipes;
    // dup2 onto stdout/stderr clears it for the child's own ends.
    if (pipe2(stdout_pipe, O_CLOEXEC) != 0) {
        return GatehouseError{ErrorCategory::Internal, "Failed to create process pipes.",
                              "pipe_creation_failed"};
    }
    if (pipe2(stderr_pipe, O_CLOEXEC) != 0) {
        close_pair(stdout_pipe);
        return GatehouseError{ErrorCategory::Internal, "Failed to create process pipes.",
                              "pipe_creation_failed"};
    }

    const long open_max = sysconf(_SC_OPEN_MAX);
    const int last_fd = open_max > 0 && open_max < 65536 ? static_cast<int>(open_max) - 1 : 65535;

    const auto started = std::chrono::steady_clock::now();
    const pid_t pid = fork();
    if (pid < 0) {
        close_pair(stdout_pipe);
        close_pair(stderr_pipe);
        return GatehouseError{ErrorCategory::Internal, "Failed to fork process.",
                              "fork_failed"};
    }

    if (pid == 0) {
        static_cast<void>(setpgid(0, 0));
        if (cwd.has_value() && chdir(cwd->c_str()) != 0) {
            _exit(126);
        }
        const int devnull = open("/dev/null", O_RDONLY);
        if (devnull >= 0) {
            static_cast<void>(dup2(devnull, STDIN_FILENO));
            static_cast<void>(close(devnull));
        }
        static_cast<void>(dup2(stdout_pipe[1], STDOUT_FILENO));
        static_cast<void>(dup2(stderr_pipe[1], STDERR_FILENO));
        close_pair(stdout_pipe);
        close_pair(stderr_pipe);
        // Log files and anything else the server holds stay out of the command.
        if (close_range(3, ~0U, 0) != 0) {
            for (int fd = 3; fd <= last_fd; ++fd) {
                static_cast<void>(close(fd));
            }
        }
        execl("/bin/sh", "sh", "-c", command.c_str(), static_cast<char*>(nullptr));
        _exit(127);
    }

    static_cast<void>(setpgid(pid, pid));
    static_cast<void>(close(stdout_pipe[1]));
    static_cast<void>(close(stderr_pipe[1]));
    set_nonblocking(stdout_pipe[0]);
    set_nonblocking(stderr_pipe[0]);

    ProcessCapture capture;
    bool stdout_open = true;
    bool stderr_open = true;
    bool child_exited = false;
    bool killed = false;
    int status = 0;

    auto kill_group = [pid, &killed]() {
        if (!killed) {
            static_cast<void>(kill(-pid, SIGKILL));
            static_cast<void>(kill(pid, SIGKILL));
            killed = true;
        }
    };

    while (stdout_open || stderr_open || !child_exited) {
        if (cancel_token && cancel_token->load() && !capture.cancelled) {
            capture.cancelled = true;
            kill_group();
        }

        const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
                                 std::chrono::steady_clock::now() - started)
                                 .count();
        if (!capture.timed_out && timeout_ms > 0 &&
            elapsed > static_cast<std::int64_t>(timeout_ms)) {
            capture.timed_out = true;
            kill_group();
        }

        pollfd fds[2];
        nfds_t nfds = 0;
        if (stdout_open) {
            fds[nfds].fd = stdout_pipe[0];
            fds[nfds].events = POLLIN;
            ++nfds;
        }
        if (stderr_open) {
            fds[nfds].fd = stderr_pipe[0];
            fds[nfds].events = POLLIN;
            ++nfds;
        }

        if (nfds > 0) {
            static_cast<void>(poll(fds, nfds, 50));
        } else {
            static_cast<void>(poll(nullptr, 0, 10));
        }

        drain_pipe(stdout_pipe[0], stdout_open, capture.stdout_text);
        drain_pipe(stderr_pipe[0], stderr_open, capture.stderr_text);

        if (!child_exited) {
            const pid_t waited = waitpid(pid, &status, WNOHANG);
            if (waited == pid) {
                child_exited = true;
            }
        }
    }

    if (WIFEXITED(status)) {
        capture.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        capture.exit_code = 128 + WTERMSIG(status);
    } else {
        capture.exit_code = -1;
    }

    capture.duration_ms = std::chrono::duration<double, std::milli>(
                              std::chrono::steady_clock::now() - started)
                              .count();
    return capture;
}

void append_line(std::string& text, const std::string& line) {
    if (!text.empty()) {
        text += "\n";
    }
    text += line;
}

}  // namespace

CommandTools::CommandTools(policy::CommandGuard command_guard, policy::PathGuard path_guard,
                           const std::uint32_t default_timeout_ms)
    : command_guard_(std::move(command_guard)),
      path_guard_(std::move(path_guard)),
      default_timeout_ms_(default_timeout_ms) {}

core::errors::Result<ToolResult> CommandTools::execute_command(
    const CommandRequest& request) const {
    auto decision = command_guard_.validate(request.command);
    if (core::errors::is_error(decision)) {
        const auto& rejection = core::errors::get_error(decision);
        GATEHOUSE_LOG_DEBUG("CommandTools: command rejected (" +
                            policy::to_string(rejection.kind) + "): " + rejection.segment);
        return policy::to_error(rejection);
    }

    std::optional<std::filesystem::path> cwd;
    if (request.working_directory.has_value()) {
        auto resolved = path_guard_.validate(request.working_directory.value());
        if (core::errors::is_error(resolved)) {
            return policy::to_error(core::errors::get_error(resolved));
        }
        cwd = core::errors::get_value(resolved);

        std::error_code ec;
        if (!std::filesystem::is_directory(cwd.value(), ec) || ec) {
            return GatehouseError{ErrorCategory::Input,
                                  "Working directory is not a directory: " +
                                      cwd->string(),
                                  "invalid_working_directory"};
        }
    }

    // Callers may shorten the configured timeout, never extend it.
    std::uint32_t timeout_ms = default_timeout_ms_;
    if (request.timeout_ms.has_value() && request.timeout_ms.value() > 0 &&
        (timeout_ms == 0 || request.timeout_ms.value() < timeout_ms)) {
        timeout_ms = request.timeout_ms.value();
    }
    auto capture_result = run_shell_command(core::errors::get_value(decision), cwd,
                                            timeout_ms, request.cancel_token);
    if (core::errors::is_error(capture_result)) {
        return core::errors::get_error(capture_result);
    }
    const auto& capture = core::errors::get_value(capture_result);

    ToolResult result;
    result.tool_call_id = "execute_command";
    result.output = capture.stdout_text;
    result.error_message = capture.stderr_text;
    result.duration_ms = capture.duration_ms;

    if (capture.cancelled) {
        result.success = false;
        append_line(result.error_message, "Command cancelled.");
        return result;
    }

    if (capture.timed_out) {
        result.success = false;
        append_line(result.error_message,
                    "Command timed out after " + std::to_string(timeout_ms) + " ms.");
        return result;
    }

    result.success = (capture.exit_code == 0);
    if (!result.success && result.error_message.empty()) {
        result.error_message =
            "Command failed with exit code " + std::to_string(capture.exit_code);
    }
    return result;
}

}  // namespace gatehouse::tools
