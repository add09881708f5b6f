#include "simharness/report_writer.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>

namespace {

using nlohmann::json;

json outcome_to_json(const simharness::CaseOutcome& outcome) {
    const auto& run = outcome.run;

    std::string message = run.message;
    if (message.empty()) {
        message = outcome.verification.message;
    }

    return json{
        {"id", outcome.test_case.id},
        {"directory", outcome.test_case.directory.string()},
        {"passed", outcome.passed},
        {"state", simharness::to_string(run.state)},
        {"outcome", simharness::to_string(run.launch.kind)},
        {"exit_code", outcome.exit_code},
        {"verification", simharness::to_string(outcome.verification.verdict)},
        {"message", message},
    };
}

json build_summary(const simharness::BatchReport& report) {
    json summary = {
        {"root", report.root.string()},
        {"policy", simharness::to_string(report.policy)},
        {"total", report.outcomes.size()},
        {"invoked", report.invocations},
        {"aborted", report.aborted},
        {"exit_code", report.exit_code},
        {"by_state", json::object()},
        {"cases", json::array()},
    };

    auto& by_state = summary["by_state"];
    for (const auto& outcome : report.outcomes) {
        summary["cases"].push_back(outcome_to_json(outcome));
        auto& counter = by_state[outcome.passed ? "passed" : "failed"];
        if (!counter.is_number()) {
            counter = 0;
        }
        counter = counter.get<std::size_t>() + 1;
    }

    return summary;
}

void ensure_parent(const std::filesystem::path& destination) {
    const auto parent = destination.parent_path();
    if (!parent.empty() && !std::filesystem::exists(parent)) {
        std::filesystem::create_directories(parent);
    }
}

void write_file(const std::filesystem::path& destination, const std::string& content) {
    ensure_parent(destination);
    std::ofstream output(destination, std::ios::binary);
    if (!output.is_open()) {
        throw std::runtime_error("Unable to open output file: " + destination.string());
    }
    output << content;
    if (!output) {
        throw std::runtime_error("Failed to write " + destination.string());
    }
}

}  // namespace

namespace simharness {

std::string ReportWriter::render_summary(const BatchReport& report) const {
    return build_summary(report).dump(2);
}

void ReportWriter::write_summary(const std::filesystem::path& destination,
                                 const BatchReport& report) const {
    write_file(destination, render_summary(report));
}

std::string ReportWriter::render_console(const BatchReport& report) const {
    std::ostringstream oss;
    oss << "Simulator test run\n"
        << "  Root: " << report.root.string() << "  Policy: " << to_string(report.policy) << "\n"
        << "  Cases run: " << report.invocations
        << "  PASS: " << report.passed() << "  FAIL: " << report.failed() << "\n";

    for (const auto& outcome : report.outcomes) {
        if (outcome.passed) continue;
        oss << "  FAILED " << outcome.test_case.id << ": ";
        if (!outcome.run.message.empty()) {
            oss << outcome.run.message;
        } else {
            oss << outcome.verification.message;
        }
        oss << "\n";
    }
    if (report.aborted) {
        oss << "  Stopped at first failure; remaining cases were not run.\n";
    }
    return oss.str();
}

}  // namespace simharness
