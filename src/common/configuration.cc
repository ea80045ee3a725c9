#include "configuration.h"
#include <algorithm>
#include <cstdlib>
#include <cxxopts.hpp>
#include <glog/logging.h>
#include <yaml-cpp/yaml.h>

namespace Shardrun {

// Global function to get configuration instance
const Configuration& GetConfig() {
    return Configuration::getInstance();
}

// Template specializations for environment variable parsing
template<>
std::optional<int> ConfigValue<int>::getEnvValue() const {
    const char* env_val = std::getenv(env_var_.c_str());
    if (env_val) {
        try {
            return std::stoi(env_val);
        } catch (const std::exception& e) {
            LOG(WARNING) << "Failed to parse env var " << env_var_ << ": " << e.what();
        }
    }
    return std::nullopt;
}

template<>
std::optional<std::string> ConfigValue<std::string>::getEnvValue() const {
    const char* env_val = std::getenv(env_var_.c_str());
    if (env_val) {
        return std::string(env_val);
    }
    return std::nullopt;
}

template<>
std::optional<bool> ConfigValue<bool>::getEnvValue() const {
    const char* env_val = std::getenv(env_var_.c_str());
    if (env_val) {
        std::string val(env_val);
        std::transform(val.begin(), val.end(), val.begin(), ::tolower);
        if (val == "true" || val == "1" || val == "yes" || val == "on") {
            return true;
        } else if (val == "false" || val == "0" || val == "no" || val == "off") {
            return false;
        }
        LOG(WARNING) << "Invalid boolean value for env var " << env_var_ << ": " << env_val;
    }
    return std::nullopt;
}

Configuration& Configuration::getInstance() {
    static Configuration instance;
    return instance;
}

void Configuration::applyYAML(const YAML::Node& yaml) {
    if (!yaml["shardrun"]) {
        LOG(WARNING) << "Configuration has no top-level 'shardrun' key; nothing applied";
        return;
    }
    auto root = yaml["shardrun"];

    // Sandbox
    if (root["sandbox"]) {
        auto sandbox = root["sandbox"];
        if (sandbox["max_concurrency"]) config_.sandbox.max_concurrency.set(sandbox["max_concurrency"].as<int>());
        if (sandbox["image_prefix"]) config_.sandbox.image_prefix.set(sandbox["image_prefix"].as<std::string>());
        if (sandbox["image_tag"]) config_.sandbox.image_tag.set(sandbox["image_tag"].as<std::string>());
        if (sandbox["container_prefix"]) config_.sandbox.container_prefix.set(sandbox["container_prefix"].as<std::string>());
        if (sandbox["testbed_path"]) config_.sandbox.testbed_path.set(sandbox["testbed_path"].as<std::string>());
        if (sandbox["expiry_s"]) config_.sandbox.expiry_s.set(sandbox["expiry_s"].as<int>());
        if (sandbox["start_settle_ms"]) config_.sandbox.start_settle_ms.set(sandbox["start_settle_ms"].as<int>());
        if (sandbox["remove_settle_ms"]) config_.sandbox.remove_settle_ms.set(sandbox["remove_settle_ms"].as<int>());
        if (sandbox["image_remove_settle_ms"]) config_.sandbox.image_remove_settle_ms.set(sandbox["image_remove_settle_ms"].as<int>());
        if (sandbox["remove_image"]) config_.sandbox.remove_image.set(sandbox["remove_image"].as<bool>());
        if (sandbox["docker_binary"]) config_.sandbox.docker_binary.set(sandbox["docker_binary"].as<std::string>());
        if (sandbox["docker_timeout_s"]) config_.sandbox.docker_timeout_s.set(sandbox["docker_timeout_s"].as<int>());
        if (sandbox["provision_command"]) config_.sandbox.provision_command.set(sandbox["provision_command"].as<std::string>());
    }

    // Agent
    if (root["agent"]) {
        auto agent = root["agent"];
        if (agent["command"]) config_.agent.command.set(agent["command"].as<std::string>());
        if (agent["generator_name"]) config_.agent.generator_name.set(agent["generator_name"].as<std::string>());
        if (agent["credential_env"]) config_.agent.credential_env.set(agent["credential_env"].as<std::string>());
        if (agent["passthrough_env"]) config_.agent.passthrough_env.set(agent["passthrough_env"].as<std::string>());
        if (agent["timeout_s"]) config_.agent.timeout_s.set(agent["timeout_s"].as<int>());
        if (agent["extra_env"]) {
            config_.agent.extra_env.clear();
            for (const auto& kv : agent["extra_env"]) {
                config_.agent.extra_env[kv.first.as<std::string>()] = kv.second.as<std::string>();
            }
        }
    }

    // Evaluation
    if (root["evaluation"]) {
        auto evaluation = root["evaluation"];
        if (evaluation["enabled"]) config_.evaluation.enabled.set(evaluation["enabled"].as<bool>());
        if (evaluation["command"]) config_.evaluation.command.set(evaluation["command"].as<std::string>());
        if (evaluation["dataset_name"]) config_.evaluation.dataset_name.set(evaluation["dataset_name"].as<std::string>());
        if (evaluation["timeout_s"]) config_.evaluation.timeout_s.set(evaluation["timeout_s"].as<int>());
    }

    // Run
    if (root["run"]) {
        auto run = root["run"];
        if (run["dataset_path"]) config_.run.dataset_path.set(run["dataset_path"].as<std::string>());
        if (run["workspace_root"]) config_.run.workspace_root.set(run["workspace_root"].as<std::string>());
        if (run["output_dir"]) config_.run.output_dir.set(run["output_dir"].as<std::string>());
        if (run["evals_dir"]) config_.run.evals_dir.set(run["evals_dir"].as<std::string>());
        if (run["num_processes"]) config_.run.num_processes.set(run["num_processes"].as<int>());
        if (run["num_candidate_solutions"]) config_.run.num_candidate_solutions.set(run["num_candidate_solutions"].as<int>());
    }
}

bool Configuration::loadFromFile(const std::string& filename) {
    try {
        YAML::Node yaml = YAML::LoadFile(filename);
        applyYAML(yaml);
        return validate();
    } catch (const YAML::Exception& e) {
        LOG(ERROR) << "Failed to parse configuration file " << filename << ": " << e.what();
        return false;
    }
}

bool Configuration::loadFromString(const std::string& yaml_content) {
    try {
        YAML::Node yaml = YAML::Load(yaml_content);
        applyYAML(yaml);
        return validate();
    } catch (const YAML::Exception& e) {
        LOG(ERROR) << "Failed to parse configuration string: " << e.what();
        return false;
    }
}

void Configuration::overrideFromCommandLine(const cxxopts::ParseResult& result) {
    // Only flags the user actually passed; unset flags leave file/default values alone.
    if (result.count("num-processes")) {
        config_.run.num_processes.set(result["num-processes"].as<int>());
    }
    if (result.count("num-candidate-solutions")) {
        config_.run.num_candidate_solutions.set(result["num-candidate-solutions"].as<int>());
    }
    if (result.count("dataset")) {
        config_.run.dataset_path.set(result["dataset"].as<std::string>());
    }
    if (result.count("workspace-root")) {
        config_.run.workspace_root.set(result["workspace-root"].as<std::string>());
    }
    if (result.count("output-dir")) {
        config_.run.output_dir.set(result["output-dir"].as<std::string>());
    }
    if (result.count("evals-dir")) {
        config_.run.evals_dir.set(result["evals-dir"].as<std::string>());
    }
    if (result.count("max-docker-concurrency")) {
        config_.sandbox.max_concurrency.set(result["max-docker-concurrency"].as<int>());
    }
    if (result.count("agent-command")) {
        config_.agent.command.set(result["agent-command"].as<std::string>());
    }
    if (result.count("skip-eval")) {
        config_.evaluation.enabled.set(false);
    }
}

bool Configuration::validate() const {
    validation_errors_.clear();

    // Fan-out
    if (config_.run.num_processes.get() < 1) {
        validation_errors_.push_back("num_processes must be at least 1");
    }
    if (config_.run.num_candidate_solutions.get() < 1) {
        validation_errors_.push_back("num_candidate_solutions must be at least 1");
    }
    if (config_.sandbox.max_concurrency.get() < 1) {
        validation_errors_.push_back("sandbox.max_concurrency must be at least 1");
    }

    // Timeouts and settling delays
    if (config_.sandbox.expiry_s.get() < 1) {
        validation_errors_.push_back("sandbox.expiry_s must be at least 1");
    }
    if (config_.sandbox.docker_timeout_s.get() < 1) {
        validation_errors_.push_back("sandbox.docker_timeout_s must be at least 1");
    }
    if (config_.sandbox.start_settle_ms.get() < 0 || config_.sandbox.remove_settle_ms.get() < 0 ||
        config_.sandbox.image_remove_settle_ms.get() < 0) {
        validation_errors_.push_back("sandbox settle delays cannot be negative");
    }
    if (config_.agent.timeout_s.get() < 0) {
        validation_errors_.push_back("agent.timeout_s cannot be negative");
    }
    if (config_.evaluation.timeout_s.get() < 1) {
        validation_errors_.push_back("evaluation.timeout_s must be at least 1");
    }

    // Commands
    if (config_.agent.command.get().empty()) {
        validation_errors_.push_back("agent.command cannot be empty");
    }
    if (config_.evaluation.enabled.get() && config_.evaluation.command.get().empty()) {
        validation_errors_.push_back("evaluation.command cannot be empty when evaluation is enabled");
    }
    if (config_.agent.credential_env.get().empty()) {
        validation_errors_.push_back("agent.credential_env cannot be empty");
    }
    if (config_.sandbox.testbed_path.get().empty() || config_.sandbox.testbed_path.get()[0] != '/') {
        validation_errors_.push_back("sandbox.testbed_path must be an absolute container path");
    }

    return validation_errors_.empty();
}

std::vector<std::string> Configuration::getValidationErrors() const {
    return validation_errors_;
}

void Configuration::reset() {
    config_ = ShardrunConfig{};
    validation_errors_.clear();
}

} // namespace Shardrun
