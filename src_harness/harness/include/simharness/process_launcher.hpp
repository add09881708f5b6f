#pragma once

#include <filesystem>
#include <string>
#include <vector>

namespace simharness {

/**
 * \brief Everything needed to start one child process.
 *
 * `program` is resolved through PATH when it contains no slash. The
 * working directory is applied in the child only; the caller's own working
 * directory never changes. An empty working directory means "inherit".
 */
struct LaunchRequest {
    std::string program;
    std::vector<std::string> arguments;
    std::filesystem::path working_directory{};
};

/**
 * \brief Tagged result of running a child process to completion.
 *
 * Launch errors (fork, chdir or exec failing) are kept apart from the
 * child's own exit status so callers can tell an infrastructure problem from
 * a simulator-reported failure.
 */
struct LaunchOutcome {
    enum class Kind {
        Success,      ///< exited with status 0
        NonZeroExit,  ///< exited with `exit_code` != 0
        Signaled,     ///< terminated by `signal`
        LaunchError,  ///< never started; see `error`
    };

    Kind kind{Kind::LaunchError};
    int exit_code{0};
    int signal{0};
    std::string error;

    [[nodiscard]] bool succeeded() const noexcept { return kind == Kind::Success; }

    /// Collapses the outcome into a shell-style process exit status.
    [[nodiscard]] int status_code() const noexcept;

    [[nodiscard]] static LaunchOutcome success();
    [[nodiscard]] static LaunchOutcome non_zero_exit(int code);
    [[nodiscard]] static LaunchOutcome signaled(int sig);
    [[nodiscard]] static LaunchOutcome launch_error(std::string message);
};

/// Exit status reported for a child that could not be started.
inline constexpr int kLaunchErrorStatus = 127;

/// Base added to the signal number of a child killed by a signal.
inline constexpr int kSignalStatusBase = 128;

[[nodiscard]] const char* to_string(LaunchOutcome::Kind kind) noexcept;

/**
 * \brief Starts `request.program` with `request.arguments` and blocks until it
 * terminates.
 *
 * Standard streams are inherited. There is no timeout: a child that never
 * exits blocks the caller forever.
 */
[[nodiscard]] LaunchOutcome launch_process(const LaunchRequest& request);

}  // namespace simharness
