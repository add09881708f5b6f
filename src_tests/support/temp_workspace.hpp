#pragma once

// Scratch-directory helpers shared by the simharness tests.

#include "simharness/harness_config.hpp"

#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <system_error>

#include <unistd.h>

namespace simharness::test {

class TempWorkspace {
public:
    TempWorkspace() {
        static std::atomic<unsigned> counter{0};
        const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
        std::ostringstream name;
        name << "simharness_" << ::getpid() << "_" << stamp << "_" << counter++;
        root_ = std::filesystem::temp_directory_path() / name.str();
        std::filesystem::create_directories(root_);
    }

    ~TempWorkspace() {
        std::error_code ec;
        std::filesystem::remove_all(root_, ec);
    }

    TempWorkspace(const TempWorkspace&) = delete;
    TempWorkspace& operator=(const TempWorkspace&) = delete;

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return root_; }

    std::filesystem::path write(const std::filesystem::path& relative, const std::string& content) const {
        const auto target = root_ / relative;
        std::filesystem::create_directories(target.parent_path());
        std::ofstream out(target, std::ios::binary);
        if (!out) throw std::runtime_error("cannot write " + target.string());
        out << content;
        return target;
    }

    /// Creates `<root>/<name>/input.json` holding `input`.
    std::filesystem::path add_case(const std::string& name, const std::string& input) const {
        write(std::filesystem::path{name} / "input.json", input);
        return root_ / name;
    }

private:
    std::filesystem::path root_;
};

inline std::string read_text(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    std::ostringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

/**
 * Simulator stand-in run through `/bin/sh -c`. The script sees the input
 * path as $1 and the output path as $2, exactly as a real simulator would.
 */
inline SimulatorConfig shell_simulator(const std::string& script,
                                       const std::filesystem::path& workdir = {}) {
    SimulatorConfig config;
    config.program = "/bin/sh";
    config.arguments = {"-c", script, "fake-simulator"};
    config.working_directory = workdir;
    config.resolve_paths = false;
    return config;
}

/// Copies input to output and exits with the number stored in `<input dir>/exit_code`, if any.
inline constexpr const char* kEchoSimulator =
    "cp \"$1\" \"$2\" || exit 4; "
    "code_file=\"$(dirname \"$1\")/exit_code\"; "
    "if [ -f \"$code_file\" ]; then exit \"$(cat \"$code_file\")\"; fi; "
    "exit 0";

}  // namespace simharness::test
