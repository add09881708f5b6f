#include "simharness/output_verifier.hpp"

#include <filesystem>
#include <fstream>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace {

using nlohmann::json;

std::optional<json> read_json(const std::filesystem::path& path, std::string& diag) {
    std::ifstream input(path);
    if (!input.is_open()) {
        diag = "unable to open " + path.string();
        return std::nullopt;
    }
    try {
        json doc;
        input >> doc;
        return doc;
    } catch (const json::parse_error& ex) {
        diag = "malformed JSON in " + path.string() + ": " + ex.what();
        return std::nullopt;
    }
}

}  // namespace

namespace simharness {

const char* to_string(VerificationResult::Verdict verdict) noexcept {
    switch (verdict) {
        case VerificationResult::Verdict::Unverified: return "unverified";
        case VerificationResult::Verdict::Match: return "match";
        case VerificationResult::Verdict::Mismatch: return "mismatch";
        case VerificationResult::Verdict::Error: return "error";
    }
    return "unknown";
}

VerificationResult UnimplementedVerifier::verify(const TestCase&) const {
    return VerificationResult{VerificationResult::Verdict::Unverified,
                              "verification not implemented"};
}

VerificationResult ExpectedOutputVerifier::verify(const TestCase& test_case) const {
    const auto expected_path = test_case.directory / kExpectedFileName;

    std::string diag;
    const auto actual = read_json(test_case.output_path, diag);
    if (!actual) {
        return VerificationResult{VerificationResult::Verdict::Error, diag};
    }
    const auto expected = read_json(expected_path, diag);
    if (!expected) {
        return VerificationResult{VerificationResult::Verdict::Error, diag};
    }

    if (*actual == *expected) {
        return VerificationResult{VerificationResult::Verdict::Match, {}};
    }

    const json patch = json::diff(*expected, *actual);
    std::string where = "/";
    if (!patch.empty() && patch.front().contains("path")) {
        where = patch.front()["path"].get<std::string>();
        if (where.empty()) where = "/";
    }
    return VerificationResult{VerificationResult::Verdict::Mismatch,
                              "output differs from " + expected_path.filename().string() +
                                  " at " + where};
}

}  // namespace simharness
