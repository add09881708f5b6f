#pragma once

#include <functional>
#include <string>
#include <vector>

#include "harness_config.hpp"
#include "process_launcher.hpp"
#include "test_case.hpp"

namespace simharness {

/// Exit status of the runner when it is not given exactly two arguments.
inline constexpr int kUsageErrorStatus = 1;

/**
 * \brief Lifecycle of one case: Validating -> Running -> {Succeeded, Failed}.
 *
 * Validating goes straight to Failed on an argument-count mismatch. Both
 * Succeeded and Failed are terminal.
 */
enum class RunState { Validating, Running, Succeeded, Failed };

[[nodiscard]] const char* to_string(RunState state) noexcept;

struct RunResult {
    RunState state{RunState::Validating};
    bool usage_error{false};
    LaunchOutcome launch{};
    int exit_code{0};  ///< what the runner process would exit with
    std::string message;

    [[nodiscard]] bool succeeded() const noexcept { return state == RunState::Succeeded; }
};

/**
 * \brief Validates the two-path contract and launches the simulator for one
 * test case.
 *
 * The simulator is started from `SimulatorConfig::working_directory` with
 * the configured arguments followed by `input_file output_file`. The
 * runner's exit status is the simulator's: 0 on success, the child's code on
 * a non-zero exit, 128+N when killed by signal N, 127 when it could not be
 * launched. It does not check that the output file was written.
 */
class CaseRunner {
public:
    using Launcher = std::function<LaunchOutcome(const LaunchRequest&)>;

    explicit CaseRunner(SimulatorConfig config, Launcher launcher = launch_process);

    /// Entry point for positional arguments (argv without argv[0]).
    [[nodiscard]] RunResult run(const std::vector<std::string>& arguments) const;

    [[nodiscard]] RunResult run(const InvocationRequest& request) const;

    /// The exact child invocation `run()` would perform for `request`.
    [[nodiscard]] LaunchRequest build_launch(const InvocationRequest& request) const;

    [[nodiscard]] const SimulatorConfig& config() const noexcept { return config_; }

private:
    SimulatorConfig config_;
    Launcher launcher_;
};

[[nodiscard]] std::string usage_text(const std::string& argv0);

}  // namespace simharness
