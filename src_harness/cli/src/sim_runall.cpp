#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

#include "simharness/batch_driver.hpp"
#include "simharness/case_runner.hpp"
#include "simharness/harness_config.hpp"
#include "simharness/output_verifier.hpp"
#include "simharness/report_writer.hpp"

using simharness::BatchDriver;
using simharness::BatchPolicy;
using simharness::CaseRunner;
using simharness::ConfigLoader;
using simharness::ExpectedOutputVerifier;
using simharness::HarnessConfig;
using simharness::OutputVerifier;
using simharness::ReportWriter;
using simharness::TestCase;
using simharness::UnimplementedVerifier;

namespace {

struct Args {
    std::optional<std::filesystem::path> config_file;
    std::optional<std::filesystem::path> root;
    std::optional<std::filesystem::path> summary_path;
    bool keep_going{false};
    bool verify{false};
    bool help{false};
};

void print_usage(const char* argv0) {
    std::cerr
        << "Simulator batch test runner\n"
        << "Usage:\n"
        << "  " << argv0 << " [--root <dir>] [--config <file>] [--keep-going] [--verify]\n"
        << "                 [--summary <path>]\n"
        << "\n"
        << "Options:\n"
        << "  --root        Directory holding one sub-directory per test case (default: given_tests).\n"
        << "  --config      JSON harness config (default: $SIMHARNESS_CONFIG if set).\n"
        << "  --keep-going  Run every case instead of stopping at the first failure.\n"
        << "  --verify      Compare user_output.json with each case's output.json.\n"
        << "  --summary     Write a JSON summary of the run to this path.\n"
        << "  -h, --help    Show this help message.\n"
        << "\n"
        << "Each case runs: <simulator> <case>/input.json <case>/user_output.json\n"
        << std::endl;
}

bool arg_eq(std::string_view a, std::string_view b) {
    return a == b;
}

Args parse_args(int argc, char** argv) {
    Args args;
    for (int i = 1; i < argc; ++i) {
        std::string_view tok = argv[i];
        if (arg_eq(tok, "-h") || arg_eq(tok, "--help")) {
            args.help = true;
            break;
        } else if (arg_eq(tok, "--root")) {
            if (i + 1 >= argc) {
                throw std::runtime_error("--root expects a value");
            }
            args.root = std::filesystem::path(argv[++i]);
        } else if (arg_eq(tok, "--config")) {
            if (i + 1 >= argc) {
                throw std::runtime_error("--config expects a value");
            }
            args.config_file = std::filesystem::path(argv[++i]);
        } else if (arg_eq(tok, "--summary")) {
            if (i + 1 >= argc) {
                throw std::runtime_error("--summary expects a value");
            }
            args.summary_path = std::filesystem::path(argv[++i]);
        } else if (arg_eq(tok, "--keep-going")) {
            args.keep_going = true;
        } else if (arg_eq(tok, "--verify")) {
            args.verify = true;
        } else {
            throw std::runtime_error("Unknown argument '" + std::string(tok) + "'");
        }
    }
    return args;
}

HarnessConfig resolve_config(const Args& args) {
    auto config = ConfigLoader{}.load(args.config_file);
    if (args.root) config.root = *args.root;
    if (args.summary_path) config.summary_path = *args.summary_path;
    if (args.keep_going) config.policy = BatchPolicy::RunAll;
    if (args.verify) config.verify = true;
    return config;
}

} // namespace

int main(int argc, char** argv) {
    try {
        const auto args = parse_args(argc, argv);
        if (args.help) {
            print_usage(argv[0]);
            return 0;
        }

        const auto config = resolve_config(args);

        const CaseRunner runner{config.simulator};
        std::unique_ptr<OutputVerifier> verifier;
        if (config.verify) {
            verifier = std::make_unique<ExpectedOutputVerifier>();
        } else {
            verifier = std::make_unique<UnimplementedVerifier>();
        }

        BatchDriver driver{BatchDriver::Config{.root = config.root, .policy = config.policy},
                           runner, *verifier};
        driver.set_progress_hook([](std::size_t index, const TestCase& test_case) {
            std::cerr << "[" << index << "] " << test_case.id << std::endl;
        });

        const auto report = driver.run();
        if (report.invocations == 0) {
            std::cerr << "WARNING: no test cases found under " << config.root << "\n";
        }

        ReportWriter writer;
        if (!config.summary_path.empty()) {
            writer.write_summary(config.summary_path, report);
        }

        std::cout << writer.render_console(report);
        if (!config.summary_path.empty()) {
            std::cout << "Artifacts:\n"
                      << "  JSON: " << config.summary_path << "\n";
        }
        if (!config.verify) {
            std::cout << "Note: outputs were not compared against expected results (use --verify).\n";
        }

        return report.exit_code;
    } catch (const std::exception& ex) {
        std::cerr << "ERROR: " << ex.what() << "\n";
        print_usage(argv[0]);
        return 2; // configuration/environment issue
    } catch (...) {
        std::cerr << "ERROR: Unknown exception\n";
        return 3; // internal error
    }
}
