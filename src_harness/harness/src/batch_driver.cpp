#include "simharness/batch_driver.hpp"
#include "simharness/case_discovery.hpp"

#include <algorithm>
#include <string>
#include <utility>
#include <vector>

namespace {

// Status a case contributes when the simulator succeeded but verification did not.
constexpr int kVerificationFailureStatus = 1;

}  // namespace

namespace simharness {

std::size_t BatchReport::passed() const noexcept {
    return static_cast<std::size_t>(
        std::count_if(outcomes.begin(), outcomes.end(), [](const CaseOutcome& o) { return o.passed; }));
}

std::size_t BatchReport::failed() const noexcept {
    return outcomes.size() - passed();
}

BatchDriver::BatchDriver(Config config, const CaseRunner& runner, const OutputVerifier& verifier)
    : config_{std::move(config)}, runner_{runner}, verifier_{verifier} {}

CaseOutcome BatchDriver::run_case(const TestCase& test_case) const {
    CaseOutcome outcome{};
    outcome.test_case = test_case;

    // Same contract as the command-line runner: exactly the two paths.
    const std::vector<std::string> arguments{test_case.input_path.string(),
                                             test_case.output_path.string()};
    outcome.run = runner_.run(arguments);

    if (!outcome.run.succeeded()) {
        outcome.exit_code = outcome.run.exit_code;
        outcome.passed = false;
        return outcome;
    }

    outcome.verification = verifier_.verify(test_case);
    if (outcome.verification.failed()) {
        outcome.exit_code = kVerificationFailureStatus;
        outcome.passed = false;
    } else {
        outcome.exit_code = 0;
        outcome.passed = true;
    }
    return outcome;
}

BatchReport BatchDriver::run() const {
    BatchReport report;
    report.root = config_.root;
    report.policy = config_.policy;

    CaseCursor cursor{config_.root};
    while (auto test_case = cursor.next()) {
        ++report.invocations;
        if (progress_) {
            progress_(report.invocations, *test_case);
        }

        auto outcome = run_case(*test_case);
        const bool failed = !outcome.passed;
        if (failed && report.exit_code == 0) {
            report.exit_code = outcome.exit_code;
        }
        report.outcomes.push_back(std::move(outcome));

        if (failed && config_.policy == BatchPolicy::FailFast) {
            report.aborted = true;
            break;
        }
    }
    return report;
}

}  // namespace simharness
