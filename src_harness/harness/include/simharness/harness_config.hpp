#pragma once

#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace simharness {

/**
 * \brief How to locate and launch the simulator.
 *
 * The defaults reproduce the historical layout: `cargo run --` executed from
 * `cpusim/src` relative to where the harness is started. The two case paths
 * are appended after `arguments`.
 */
struct SimulatorConfig {
    std::string program{"cargo"};
    std::vector<std::string> arguments{"run", "--"};
    std::filesystem::path working_directory{"cpusim/src"};
    /// Make case paths absolute before they are handed to the child.
    bool resolve_paths{false};
};

enum class BatchPolicy {
    FailFast,  ///< stop at the first failing case
    RunAll,    ///< run every case, report the first failure's status
};

[[nodiscard]] const char* to_string(BatchPolicy policy) noexcept;

/// Accepts `fail-fast` / `run-all` (and `_` spellings). Throws on anything else.
[[nodiscard]] BatchPolicy parse_policy(const std::string& text);

struct HarnessConfig {
    SimulatorConfig simulator{};
    std::filesystem::path root{"given_tests"};
    BatchPolicy policy{BatchPolicy::FailFast};
    bool verify{false};
    std::filesystem::path summary_path{};
};

/// Environment variable names consulted by ConfigLoader.
inline constexpr const char* kEnvConfig = "SIMHARNESS_CONFIG";
inline constexpr const char* kEnvSimulator = "SIMHARNESS_SIMULATOR";
inline constexpr const char* kEnvWorkdir = "SIMHARNESS_WORKDIR";
inline constexpr const char* kEnvRoot = "SIMHARNESS_ROOT";

/**
 * \brief Resolves the harness configuration once at process start.
 *
 * Layers, lowest precedence first:
 *   1. built-in defaults (HarnessConfig{});
 *   2. a JSON config file (explicit path, else `SIMHARNESS_CONFIG`);
 *   3. `SIMHARNESS_SIMULATOR`, `SIMHARNESS_WORKDIR`, `SIMHARNESS_ROOT`.
 * Command-line flags are applied on top by the CLI.
 *
 * Config file schema:
 * \code{.json}
 * {
 *   "simulator": {
 *     "program": "./target/release/cpusim",
 *     "arguments": [],
 *     "working_directory": "cpusim",
 *     "resolve_paths": true
 *   },
 *   "root": "given_tests",
 *   "policy": "fail-fast",
 *   "verify": false,
 *   "summary": "build/summary.json"
 * }
 * \endcode
 *
 * Unknown keys are ignored. A key with the wrong JSON type raises
 * std::runtime_error naming the key and the file.
 */
class ConfigLoader {
public:
    using Environment = std::map<std::string, std::string>;

    ConfigLoader() = default;

    /// Uses an explicit environment instead of the process environment.
    explicit ConfigLoader(Environment environment);

    [[nodiscard]] HarnessConfig load(const std::optional<std::filesystem::path>& config_file) const;

    /// Applies a config file on top of `base`.
    [[nodiscard]] HarnessConfig load_file(const std::filesystem::path& file,
                                          HarnessConfig base) const;

private:
    [[nodiscard]] std::optional<std::string> env(const char* name) const;

    std::optional<Environment> environment_{};
};

}  // namespace simharness
