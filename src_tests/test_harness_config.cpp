/**
 * @file test_harness_config.cpp
 * @brief Tests for simulator location and harness configuration layering
 */

#include <catch2/catch_test_macros.hpp>

#include "simharness/harness_config.hpp"
#include "support/temp_workspace.hpp"

#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

using simharness::BatchPolicy;
using simharness::ConfigLoader;
using simharness::test::TempWorkspace;

TEST_CASE("Defaults reproduce the historical cpusim layout", "[config]") {
    const ConfigLoader loader{ConfigLoader::Environment{}};
    const auto config = loader.load(std::nullopt);

    REQUIRE(config.simulator.program == "cargo");
    REQUIRE(config.simulator.arguments == std::vector<std::string>{"run", "--"});
    REQUIRE(config.simulator.working_directory == std::filesystem::path("cpusim/src"));
    REQUIRE_FALSE(config.simulator.resolve_paths);
    REQUIRE(config.root == std::filesystem::path("given_tests"));
    REQUIRE(config.policy == BatchPolicy::FailFast);
    REQUIRE_FALSE(config.verify);
    REQUIRE(config.summary_path.empty());
}

TEST_CASE("Config file overrides defaults", "[config]") {
    TempWorkspace ws;
    const auto file = ws.write("harness.json", R"({
        "simulator": {
            "program": "./target/release/cpusim",
            "arguments": [],
            "working_directory": "cpusim",
            "resolve_paths": true
        },
        "root": "suites/hw1",
        "policy": "run-all",
        "verify": true,
        "summary": "build/summary.json",
        "comment": "unknown keys are ignored"
    })");

    const ConfigLoader loader{ConfigLoader::Environment{}};
    const auto config = loader.load(file);

    REQUIRE(config.simulator.program == "./target/release/cpusim");
    REQUIRE(config.simulator.arguments.empty());
    REQUIRE(config.simulator.working_directory == std::filesystem::path("cpusim"));
    REQUIRE(config.simulator.resolve_paths);
    REQUIRE(config.root == std::filesystem::path("suites/hw1"));
    REQUIRE(config.policy == BatchPolicy::RunAll);
    REQUIRE(config.verify);
    REQUIRE(config.summary_path == std::filesystem::path("build/summary.json"));
}

TEST_CASE("Partial config file keeps untouched defaults", "[config]") {
    TempWorkspace ws;
    const auto file = ws.write("harness.json", R"({"simulator": {"working_directory": "sim"}})");

    const auto config = ConfigLoader{ConfigLoader::Environment{}}.load(file);
    REQUIRE(config.simulator.program == "cargo");
    REQUIRE(config.simulator.working_directory == std::filesystem::path("sim"));
}

TEST_CASE("Environment takes precedence over the config file", "[config]") {
    TempWorkspace ws;
    const auto file = ws.write("harness.json", R"({"root": "from_file", "simulator": {"program": "x"}})");

    const ConfigLoader loader{ConfigLoader::Environment{
        {simharness::kEnvConfig, file.string()},
        {simharness::kEnvSimulator, "/opt/cpusim/bin/cpusim"},
        {simharness::kEnvWorkdir, "/opt/cpusim"},
        {simharness::kEnvRoot, "from_env"},
    }};
    const auto config = loader.load(std::nullopt);

    REQUIRE(config.simulator.program == "/opt/cpusim/bin/cpusim");
    REQUIRE(config.simulator.arguments.empty());
    REQUIRE(config.simulator.working_directory == std::filesystem::path("/opt/cpusim"));
    REQUIRE(config.root == std::filesystem::path("from_env"));
}

TEST_CASE("Explicit config path wins over SIMHARNESS_CONFIG", "[config]") {
    TempWorkspace ws;
    const auto from_env = ws.write("env.json", R"({"root": "env"})");
    const auto explicit_file = ws.write("cli.json", R"({"root": "cli"})");

    const ConfigLoader loader{ConfigLoader::Environment{{simharness::kEnvConfig, from_env.string()}}};
    REQUIRE(loader.load(explicit_file).root == std::filesystem::path("cli"));
}

TEST_CASE("Config errors name the problem", "[config]") {
    TempWorkspace ws;
    const ConfigLoader loader{ConfigLoader::Environment{}};

    SECTION("missing file") {
        REQUIRE_THROWS_AS((void)loader.load(ws.path() / "absent.json"), std::runtime_error);
    }
    SECTION("malformed JSON") {
        const auto file = ws.write("bad.json", "{ not json");
        REQUIRE_THROWS_AS((void)loader.load(file), std::runtime_error);
    }
    SECTION("wrong type") {
        const auto file = ws.write("bad.json", R"({"simulator": {"arguments": "run"}})");
        try {
            (void)loader.load(file);
            FAIL("expected a type error");
        } catch (const std::runtime_error& ex) {
            REQUIRE(std::string{ex.what()}.find("simulator.arguments") != std::string::npos);
        }
    }
    SECTION("unknown policy") {
        const auto file = ws.write("bad.json", R"({"policy": "sometimes"})");
        REQUIRE_THROWS_AS((void)loader.load(file), std::runtime_error);
    }
}

TEST_CASE("Policy names round-trip", "[config]") {
    REQUIRE(simharness::parse_policy("fail-fast") == BatchPolicy::FailFast);
    REQUIRE(simharness::parse_policy("run_all") == BatchPolicy::RunAll);
    REQUIRE(std::string{simharness::to_string(BatchPolicy::RunAll)} == "run-all");
}
