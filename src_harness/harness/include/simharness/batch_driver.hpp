#pragma once

#include <cstddef>
#include <filesystem>
#include <functional>
#include <string>
#include <utility>
#include <vector>

#include "case_runner.hpp"
#include "harness_config.hpp"
#include "output_verifier.hpp"
#include "test_case.hpp"

namespace simharness {

struct CaseOutcome {
    TestCase test_case;
    RunResult run;
    VerificationResult verification{};
    bool passed{false};
    int exit_code{0};  ///< status this case contributes to the batch
};

struct BatchReport {
    std::filesystem::path root;
    BatchPolicy policy{BatchPolicy::FailFast};
    std::vector<CaseOutcome> outcomes;
    std::size_t invocations{0};
    bool aborted{false};  ///< fail-fast stopped the batch at a failing case
    int exit_code{0};

    [[nodiscard]] std::size_t passed() const noexcept;
    [[nodiscard]] std::size_t failed() const noexcept;
};

/**
 * \brief Drives every test case under a root through the single-case runner.
 *
 * Cases are pulled one at a time from a CaseCursor and run strictly in
 * sequence. Under BatchPolicy::FailFast the first failing case ends the
 * batch and no later case is started. Under BatchPolicy::RunAll every case is
 * run. In both modes the batch exit code is the exit code of the first
 * failing case, or 0.
 *
 * The driver never touches case artifacts itself; the verifier hook, when it
 * is an ExpectedOutputVerifier, is the only reader.
 */
class BatchDriver {
public:
    struct Config {
        std::filesystem::path root{"given_tests"};
        BatchPolicy policy{BatchPolicy::FailFast};
    };

    /// Called before each invocation with the 1-based case index.
    using ProgressHook = std::function<void(std::size_t, const TestCase&)>;

    BatchDriver(Config config, const CaseRunner& runner, const OutputVerifier& verifier);

    void set_progress_hook(ProgressHook hook) { progress_ = std::move(hook); }

    /// Throws std::runtime_error if the root cannot be enumerated.
    [[nodiscard]] BatchReport run() const;

private:
    [[nodiscard]] CaseOutcome run_case(const TestCase& test_case) const;

    Config config_;
    const CaseRunner& runner_;
    const OutputVerifier& verifier_;
    ProgressHook progress_{};
};

}  // namespace simharness
