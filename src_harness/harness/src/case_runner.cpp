#include "simharness/case_runner.hpp"

#include <filesystem>
#include <string>
#include <system_error>
#include <utility>

namespace fs = std::filesystem;

namespace {

fs::path absolute_or_same(const fs::path& path) {
    std::error_code ec;
    auto resolved = fs::absolute(path, ec);
    return ec ? path : resolved;
}

}  // namespace

namespace simharness {

const char* to_string(RunState state) noexcept {
    switch (state) {
        case RunState::Validating: return "validating";
        case RunState::Running: return "running";
        case RunState::Succeeded: return "succeeded";
        case RunState::Failed: return "failed";
    }
    return "unknown";
}

std::string usage_text(const std::string& argv0) {
    return "Usage: " + argv0 + " input_file.json output_file.json";
}

CaseRunner::CaseRunner(SimulatorConfig config, Launcher launcher)
    : config_{std::move(config)}, launcher_{std::move(launcher)} {}

RunResult CaseRunner::run(const std::vector<std::string>& arguments) const {
    if (arguments.size() != 2) {
        RunResult result;
        result.state = RunState::Failed;
        result.usage_error = true;
        result.exit_code = kUsageErrorStatus;
        result.message = "expected 2 arguments, got " + std::to_string(arguments.size());
        return result;
    }
    return run(InvocationRequest{arguments[0], arguments[1]});
}

LaunchRequest CaseRunner::build_launch(const InvocationRequest& request) const {
    LaunchRequest launch;
    launch.program = config_.program;
    launch.arguments = config_.arguments;
    launch.working_directory = config_.working_directory;

    const fs::path input = config_.resolve_paths ? absolute_or_same(request.input_path)
                                                 : request.input_path;
    const fs::path output = config_.resolve_paths ? absolute_or_same(request.output_path)
                                                  : request.output_path;
    launch.arguments.push_back(input.string());
    launch.arguments.push_back(output.string());
    return launch;
}

RunResult CaseRunner::run(const InvocationRequest& request) const {
    RunResult result;
    result.state = RunState::Running;

    result.launch = launcher_(build_launch(request));
    result.exit_code = result.launch.status_code();

    switch (result.launch.kind) {
        case LaunchOutcome::Kind::Success:
            result.state = RunState::Succeeded;
            break;
        case LaunchOutcome::Kind::NonZeroExit:
            result.state = RunState::Failed;
            result.message = "simulator exited with status " +
                             std::to_string(result.launch.exit_code);
            break;
        case LaunchOutcome::Kind::Signaled:
            result.state = RunState::Failed;
            result.message = "simulator terminated by signal " +
                             std::to_string(result.launch.signal);
            break;
        case LaunchOutcome::Kind::LaunchError:
            result.state = RunState::Failed;
            result.message = "simulator launch failed: " + result.launch.error;
            break;
    }
    return result;
}

}  // namespace simharness
