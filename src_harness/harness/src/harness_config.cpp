#include "simharness/harness_config.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>
#include <utility>

#include <nlohmann/json.hpp>

namespace {

using nlohmann::json;

std::runtime_error type_error(const std::filesystem::path& file,
                              const std::string& key,
                              const char* expected) {
    return std::runtime_error("Config key '" + key + "' in " + file.string() + " must be " +
                              expected);
}

std::string require_string(const json& node,
                           const std::filesystem::path& file,
                           const std::string& key) {
    if (!node.is_string()) throw type_error(file, key, "a string");
    return node.get<std::string>();
}

bool require_bool(const json& node, const std::filesystem::path& file, const std::string& key) {
    if (!node.is_boolean()) throw type_error(file, key, "a boolean");
    return node.get<bool>();
}

void apply_simulator(const json& node,
                     const std::filesystem::path& file,
                     simharness::SimulatorConfig& simulator) {
    if (!node.is_object()) throw type_error(file, "simulator", "an object");

    if (auto it = node.find("program"); it != node.end()) {
        simulator.program = require_string(*it, file, "simulator.program");
    }
    if (auto it = node.find("arguments"); it != node.end()) {
        if (!it->is_array()) throw type_error(file, "simulator.arguments", "an array of strings");
        std::vector<std::string> arguments;
        for (const auto& arg : *it) {
            arguments.push_back(require_string(arg, file, "simulator.arguments"));
        }
        simulator.arguments = std::move(arguments);
    }
    if (auto it = node.find("working_directory"); it != node.end()) {
        simulator.working_directory = require_string(*it, file, "simulator.working_directory");
    }
    if (auto it = node.find("resolve_paths"); it != node.end()) {
        simulator.resolve_paths = require_bool(*it, file, "simulator.resolve_paths");
    }
}

}  // namespace

namespace simharness {

const char* to_string(BatchPolicy policy) noexcept {
    switch (policy) {
        case BatchPolicy::FailFast: return "fail-fast";
        case BatchPolicy::RunAll: return "run-all";
    }
    return "unknown";
}

BatchPolicy parse_policy(const std::string& text) {
    if (text == "fail-fast" || text == "fail_fast") return BatchPolicy::FailFast;
    if (text == "run-all" || text == "run_all") return BatchPolicy::RunAll;
    throw std::runtime_error("Unknown batch policy '" + text + "' (expected fail-fast or run-all)");
}

ConfigLoader::ConfigLoader(Environment environment) : environment_{std::move(environment)} {}

std::optional<std::string> ConfigLoader::env(const char* name) const {
    if (environment_) {
        auto it = environment_->find(name);
        if (it == environment_->end() || it->second.empty()) return std::nullopt;
        return it->second;
    }
    const char* value = std::getenv(name);
    if (value == nullptr || *value == '\0') return std::nullopt;
    return std::string{value};
}

HarnessConfig ConfigLoader::load_file(const std::filesystem::path& file, HarnessConfig base) const {
    if (!std::filesystem::is_regular_file(file)) {
        throw std::runtime_error("Config file does not exist: " + file.string());
    }
    std::ifstream input(file);
    if (!input.is_open()) {
        throw std::runtime_error("Unable to open config file: " + file.string());
    }

    json doc;
    try {
        input >> doc;
    } catch (const json::parse_error& ex) {
        throw std::runtime_error("Malformed config file " + file.string() + ": " + ex.what());
    }
    if (!doc.is_object()) {
        throw std::runtime_error("Config file " + file.string() + " must contain a JSON object");
    }

    if (auto it = doc.find("simulator"); it != doc.end()) {
        apply_simulator(*it, file, base.simulator);
    }
    if (auto it = doc.find("root"); it != doc.end()) {
        base.root = require_string(*it, file, "root");
    }
    if (auto it = doc.find("policy"); it != doc.end()) {
        base.policy = parse_policy(require_string(*it, file, "policy"));
    }
    if (auto it = doc.find("verify"); it != doc.end()) {
        base.verify = require_bool(*it, file, "verify");
    }
    if (auto it = doc.find("summary"); it != doc.end()) {
        base.summary_path = require_string(*it, file, "summary");
    }
    return base;
}

HarnessConfig ConfigLoader::load(const std::optional<std::filesystem::path>& config_file) const {
    HarnessConfig config{};

    std::optional<std::filesystem::path> file = config_file;
    if (!file) {
        if (auto from_env = env(kEnvConfig)) file = std::filesystem::path{*from_env};
    }
    if (file) {
        config = load_file(*file, std::move(config));
    }

    if (auto program = env(kEnvSimulator)) {
        // A bare executable replaces the whole command line, not just argv[0].
        config.simulator.program = *program;
        config.simulator.arguments.clear();
    }
    if (auto workdir = env(kEnvWorkdir)) {
        config.simulator.working_directory = *workdir;
    }
    if (auto root = env(kEnvRoot)) {
        config.root = *root;
    }
    return config;
}

}  // namespace simharness
