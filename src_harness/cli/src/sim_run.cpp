#include <exception>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include "simharness/case_runner.hpp"
#include "simharness/harness_config.hpp"

using simharness::CaseRunner;
using simharness::ConfigLoader;
using simharness::RunResult;

// sim-run <input_file.json> <output_file.json>
//
// Launches the simulator once. The exit status is the simulator's own.
int main(int argc, char** argv) {
    const std::string argv0 = argc > 0 ? argv[0] : "sim-run";
    const std::vector<std::string> arguments(argv + (argc > 0 ? 1 : 0), argv + argc);

    // Validate before anything else so a usage error never reads config.
    if (arguments.size() != 2) {
        std::cerr << simharness::usage_text(argv0) << std::endl;
        return simharness::kUsageErrorStatus;
    }

    try {
        const auto config = ConfigLoader{}.load(std::nullopt);
        const CaseRunner runner{config.simulator};

        const RunResult result = runner.run(arguments);
        if (result.launch.kind == simharness::LaunchOutcome::Kind::LaunchError) {
            std::cerr << "ERROR: " << result.message << "\n";
        }
        return result.exit_code;
    } catch (const std::exception& ex) {
        std::cerr << "ERROR: " << ex.what() << "\n";
        return 2;
    } catch (...) {
        std::cerr << "ERROR: Unknown exception\n";
        return 3;
    }
}
