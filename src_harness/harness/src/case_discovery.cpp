#include "simharness/case_discovery.hpp"

#include <filesystem>
#include <stdexcept>
#include <string>
#include <system_error>

namespace fs = std::filesystem;

namespace simharness {

CaseCursor::CaseCursor(const fs::path& root) : root_{root} {
    if (!fs::exists(root_)) {
        throw std::runtime_error("Test root does not exist: " + root_.string());
    }
    if (!fs::is_directory(root_)) {
        throw std::runtime_error("Test root is not a directory: " + root_.string());
    }

    std::error_code ec;
    it_ = fs::directory_iterator(root_, ec);
    if (ec) {
        throw std::runtime_error("Unable to open test root " + root_.string() + ": " +
                                 ec.message());
    }
}

std::optional<TestCase> CaseCursor::next() {
    if (exhausted_) {
        return std::nullopt;
    }

    std::error_code ec;
    while (it_ != fs::directory_iterator{}) {
        const fs::directory_entry entry = *it_;
        it_.increment(ec);
        if (ec) {
            exhausted_ = true;
            throw std::runtime_error("Failed to enumerate " + root_.string() + ": " +
                                     ec.message());
        }

        // Dot-entries are not cases, matching a shell `root/*` glob.
        const auto name = entry.path().filename().string();
        if (name.empty() || name.front() == '.') {
            continue;
        }

        std::error_code type_ec;
        if (entry.is_directory(type_ec)) {
            return make_test_case(entry.path());
        }
    }

    exhausted_ = true;
    return std::nullopt;
}

}  // namespace simharness
