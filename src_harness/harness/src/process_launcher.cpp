#include "simharness/process_launcher.hpp"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <iostream>
#include <string>
#include <utility>
#include <vector>

#include <fcntl.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace {

// Written by the child into the status pipe when it fails before exec.
struct ChildFailure {
    int step;  // 1 = chdir, 2 = exec
    int error;
};

constexpr int kStepChdir = 1;
constexpr int kStepExec = 2;

bool set_cloexec(int fd) {
    const int flags = ::fcntl(fd, F_GETFD);
    if (flags < 0) return false;
    return ::fcntl(fd, F_SETFD, flags | FD_CLOEXEC) == 0;
}

void close_pipe(int fds[2]) {
    if (fds[0] >= 0) ::close(fds[0]);
    if (fds[1] >= 0) ::close(fds[1]);
    fds[0] = fds[1] = -1;
}

std::string errno_text(int err) {
    return std::string{std::strerror(err)};
}

// Only async-signal-safe calls between fork() and exec.
[[noreturn]] void run_child(const char* workdir, char* const* argv, int status_fd) {
    ChildFailure failure{0, 0};
    if (workdir != nullptr && ::chdir(workdir) != 0) {
        failure = ChildFailure{kStepChdir, errno};
    } else {
        ::execvp(argv[0], argv);
        failure = ChildFailure{kStepExec, errno};
    }
    ssize_t written;
    do {
        written = ::write(status_fd, &failure, sizeof(failure));
    } while (written < 0 && errno == EINTR);
    ::_exit(simharness::kLaunchErrorStatus);
}

// Reads the child's failure report. Returns false once exec closed the pipe.
bool read_child_failure(int fd, ChildFailure& failure) {
    auto* dst = reinterpret_cast<char*>(&failure);
    std::size_t got = 0;
    while (got < sizeof(failure)) {
        const ssize_t n = ::read(fd, dst + got, sizeof(failure) - got);
        if (n < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        if (n == 0) break;
        got += static_cast<std::size_t>(n);
    }
    return got == sizeof(failure);
}

bool wait_child(pid_t pid, int& status) {
    for (;;) {
        if (::waitpid(pid, &status, 0) >= 0) return true;
        if (errno != EINTR) return false;
    }
}

}  // namespace

namespace simharness {

int LaunchOutcome::status_code() const noexcept {
    switch (kind) {
        case Kind::Success: return 0;
        case Kind::NonZeroExit: return exit_code;
        case Kind::Signaled: return kSignalStatusBase + signal;
        case Kind::LaunchError: return kLaunchErrorStatus;
    }
    return kLaunchErrorStatus;
}

LaunchOutcome LaunchOutcome::success() {
    LaunchOutcome outcome;
    outcome.kind = Kind::Success;
    return outcome;
}

LaunchOutcome LaunchOutcome::non_zero_exit(int code) {
    LaunchOutcome outcome;
    outcome.kind = Kind::NonZeroExit;
    outcome.exit_code = code;
    return outcome;
}

LaunchOutcome LaunchOutcome::signaled(int sig) {
    LaunchOutcome outcome;
    outcome.kind = Kind::Signaled;
    outcome.signal = sig;
    return outcome;
}

LaunchOutcome LaunchOutcome::launch_error(std::string message) {
    LaunchOutcome outcome;
    outcome.kind = Kind::LaunchError;
    outcome.error = std::move(message);
    return outcome;
}

const char* to_string(LaunchOutcome::Kind kind) noexcept {
    switch (kind) {
        case LaunchOutcome::Kind::Success: return "success";
        case LaunchOutcome::Kind::NonZeroExit: return "non_zero_exit";
        case LaunchOutcome::Kind::Signaled: return "signaled";
        case LaunchOutcome::Kind::LaunchError: return "launch_error";
    }
    return "unknown";
}

LaunchOutcome launch_process(const LaunchRequest& request) {
    if (request.program.empty()) {
        return LaunchOutcome::launch_error("no simulator program configured");
    }

    // Build argv before forking; the child must not allocate.
    std::vector<std::string> storage;
    storage.reserve(request.arguments.size() + 1);
    storage.push_back(request.program);
    storage.insert(storage.end(), request.arguments.begin(), request.arguments.end());

    std::vector<char*> argv;
    argv.reserve(storage.size() + 1);
    for (auto& arg : storage) {
        argv.push_back(arg.data());
    }
    argv.push_back(nullptr);

    const std::string workdir = request.working_directory.string();
    const char* workdir_c = workdir.empty() ? nullptr : workdir.c_str();

    int status_pipe[2] = {-1, -1};
    if (::pipe(status_pipe) != 0) {
        return LaunchOutcome::launch_error("pipe failed: " + errno_text(errno));
    }
    if (!set_cloexec(status_pipe[0]) || !set_cloexec(status_pipe[1])) {
        const int err = errno;
        close_pipe(status_pipe);
        return LaunchOutcome::launch_error("fcntl failed: " + errno_text(err));
    }

    // Keep our own buffered output ahead of the child's.
    std::cout.flush();
    std::cerr.flush();
    std::fflush(nullptr);

    const pid_t pid = ::fork();
    if (pid < 0) {
        const int err = errno;
        close_pipe(status_pipe);
        return LaunchOutcome::launch_error("fork failed: " + errno_text(err));
    }
    if (pid == 0) {
        ::close(status_pipe[0]);
        run_child(workdir_c, argv.data(), status_pipe[1]);
    }

    ::close(status_pipe[1]);
    status_pipe[1] = -1;

    ChildFailure failure{0, 0};
    const bool child_failed = read_child_failure(status_pipe[0], failure);
    ::close(status_pipe[0]);
    status_pipe[0] = -1;

    int status = 0;
    if (!wait_child(pid, status)) {
        return LaunchOutcome::launch_error("waitpid failed: " + errno_text(errno));
    }

    if (child_failed) {
        if (failure.step == kStepChdir) {
            return LaunchOutcome::launch_error("cannot change directory to '" + workdir +
                                               "': " + errno_text(failure.error));
        }
        return LaunchOutcome::launch_error("cannot execute '" + request.program +
                                           "': " + errno_text(failure.error));
    }

    if (WIFEXITED(status)) {
        const int code = WEXITSTATUS(status);
        return code == 0 ? LaunchOutcome::success() : LaunchOutcome::non_zero_exit(code);
    }
    if (WIFSIGNALED(status)) {
        return LaunchOutcome::signaled(WTERMSIG(status));
    }
    return LaunchOutcome::launch_error("child ended with unrecognised status " +
                                       std::to_string(status));
}

}  // namespace simharness
