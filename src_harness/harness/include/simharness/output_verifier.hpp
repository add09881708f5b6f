#pragma once

#include <string>

#include "test_case.hpp"

namespace simharness {

struct VerificationResult {
    enum class Verdict {
        Unverified,  ///< no comparison was performed
        Match,
        Mismatch,
        Error,       ///< a file was missing or unreadable
    };

    Verdict verdict{Verdict::Unverified};
    std::string message;

    /// Only Mismatch and Error count against a case.
    [[nodiscard]] bool failed() const noexcept {
        return verdict == Verdict::Mismatch || verdict == Verdict::Error;
    }
};

[[nodiscard]] const char* to_string(VerificationResult::Verdict verdict) noexcept;

/**
 * \brief Hook run after a case's simulator invocation succeeded.
 */
class OutputVerifier {
public:
    virtual ~OutputVerifier() = default;

    [[nodiscard]] virtual VerificationResult verify(const TestCase& test_case) const = 0;
};

/**
 * \brief Default hook: performs no comparison and says so.
 */
class UnimplementedVerifier final : public OutputVerifier {
public:
    [[nodiscard]] VerificationResult verify(const TestCase& test_case) const override;
};

/**
 * \brief Compares `user_output.json` with the case's `output.json`.
 *
 * Both documents are parsed and compared as JSON values, so key order and
 * whitespace do not matter. The message names the first differing JSON
 * pointer on a mismatch.
 */
class ExpectedOutputVerifier final : public OutputVerifier {
public:
    [[nodiscard]] VerificationResult verify(const TestCase& test_case) const override;
};

}  // namespace simharness
