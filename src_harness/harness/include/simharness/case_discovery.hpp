#pragma once

#include <filesystem>
#include <optional>

#include "test_case.hpp"

namespace simharness {

/**
 * \brief Enumerates test-case directories found directly under a root.
 *
 * The cursor is a lazy, finite, single-pass sequence: each call to next()
 * advances the underlying directory iterator by at most one case directory.
 * Entries that are not directories, and entries whose name starts with `.`,
 * are skipped. No sorting is applied, so the
 * order is whatever the filesystem reports. Once next() has returned
 * std::nullopt the cursor stays exhausted.
 *
 * Layout consumed:
 * \code{.txt}
 * given_tests/
 *   case1/input.json
 *   case2/input.json
 * \endcode
 *
 * A case directory without `input.json` is still yielded; reporting the
 * missing file is the simulator's job.
 */
class CaseCursor {
public:
    /// Throws std::runtime_error if the root is missing or not a directory.
    explicit CaseCursor(const std::filesystem::path& root);

    CaseCursor(const CaseCursor&) = delete;
    CaseCursor& operator=(const CaseCursor&) = delete;

    [[nodiscard]] std::optional<TestCase> next();

    [[nodiscard]] bool exhausted() const noexcept { return exhausted_; }

    [[nodiscard]] const std::filesystem::path& root() const noexcept { return root_; }

private:
    std::filesystem::path root_;
    std::filesystem::directory_iterator it_;
    bool exhausted_{false};
};

}  // namespace simharness
