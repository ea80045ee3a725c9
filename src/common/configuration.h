#ifndef SHARDRUN_CONFIGURATION_H_
#define SHARDRUN_CONFIGURATION_H_

#include <string>
#include <map>
#include <optional>
#include <vector>
#include <cstdint>

namespace cxxopts {
class ParseResult;
}

namespace YAML {
class Node;
}

namespace Shardrun {

/**
 * Configuration value that can be overridden by environment variables
 */
template<typename T>
class ConfigValue {
public:
    ConfigValue() = default;
    ConfigValue(T default_value, const std::string& env_var = "")
        : value_(default_value), env_var_(env_var) {}

    T get() const {
        if (!env_var_.empty()) {
            auto env_value = getEnvValue();
            if (env_value.has_value()) {
                return env_value.value();
            }
        }
        return value_;
    }

    void set(T value) { value_ = value; }
    const std::string& env_var() const { return env_var_; }

private:
    T value_;
    std::string env_var_;

    std::optional<T> getEnvValue() const;
};

/**
 * Main configuration structure
 */
struct ShardrunConfig {
    // Sandbox lifecycle and container daemon access
    struct Sandbox {
        // Simultaneous image pulls / container starts against the daemon
        ConfigValue<int> max_concurrency{4, "SHARDRUN_MAX_DOCKER_CONCURRENCY"};
        ConfigValue<std::string> image_prefix{"swebench/sweb.eval.x86_64.", "SHARDRUN_IMAGE_PREFIX"};
        ConfigValue<std::string> image_tag{"latest", "SHARDRUN_IMAGE_TAG"};
        ConfigValue<std::string> container_prefix{"sweb.augment.", "SHARDRUN_CONTAINER_PREFIX"};
        ConfigValue<std::string> testbed_path{"/testbed", "SHARDRUN_TESTBED_PATH"};
        // Containers kill themselves after this long even if the orchestrator dies
        ConfigValue<int> expiry_s{7200, "SHARDRUN_SANDBOX_EXPIRY_S"};
        ConfigValue<int> start_settle_ms{5000, "SHARDRUN_START_SETTLE_MS"};
        ConfigValue<int> remove_settle_ms{10000, "SHARDRUN_REMOVE_SETTLE_MS"};
        ConfigValue<int> image_remove_settle_ms{5000, "SHARDRUN_IMAGE_REMOVE_SETTLE_MS"};
        ConfigValue<bool> remove_image{false, "SHARDRUN_REMOVE_IMAGE"};
        ConfigValue<std::string> docker_binary{"docker", "SHARDRUN_DOCKER_BINARY"};
        // Upper bound on any single docker CLI call (pulls of large images included)
        ConfigValue<int> docker_timeout_s{1800, "SHARDRUN_DOCKER_TIMEOUT_S"};
        // Optional host-side setup run under the provisioning mutex; "{workspace}" is substituted
        ConfigValue<std::string> provision_command{"", "SHARDRUN_PROVISION_COMMAND"};
    } sandbox;

    // External agent runner
    struct Agent {
        ConfigValue<std::string> command{"python cli.py", "SHARDRUN_AGENT_COMMAND"};
        ConfigValue<std::string> generator_name{"augment-agent", "SHARDRUN_GENERATOR_NAME"};
        ConfigValue<std::string> credential_env{"ANTHROPIC_API_KEY", "SHARDRUN_CREDENTIAL_ENV"};
        // Comma separated names copied from the orchestrator's environment into the agent's
        ConfigValue<std::string> passthrough_env{"PATH,HOME,LANG,LC_ALL,TMPDIR,PYTHONPATH",
                                                 "SHARDRUN_AGENT_PASSTHROUGH_ENV"};
        // 0 = use sandbox.expiry_s
        ConfigValue<int> timeout_s{0, "SHARDRUN_AGENT_TIMEOUT_S"};
        // "{workspace}" expands to the rollout dir, "{PATH}" in PATH to the passed-through PATH
        std::map<std::string, std::string> extra_env;
    } agent;

    // Official test-harness evaluation
    struct Evaluation {
        ConfigValue<bool> enabled{true, "SHARDRUN_EVAL_ENABLED"};
        ConfigValue<std::string> command{"python -m swebench.harness.run_evaluation", "SHARDRUN_EVAL_COMMAND"};
        ConfigValue<std::string> dataset_name{"princeton-nlp/SWE-bench", "SHARDRUN_EVAL_DATASET"};
        ConfigValue<int> timeout_s{3600, "SHARDRUN_EVAL_TIMEOUT_S"};
    } evaluation;

    // Run layout and fan-out
    struct Run {
        ConfigValue<std::string> dataset_path{"", "SHARDRUN_DATASET"};
        ConfigValue<std::string> workspace_root{"/tmp/workspace", "SHARDRUN_WORKSPACE_ROOT"};
        ConfigValue<std::string> output_dir{".", "SHARDRUN_OUTPUT_DIR"};
        ConfigValue<std::string> evals_dir{"./evals", "SHARDRUN_EVALS_DIR"};
        ConfigValue<int> num_processes{8, "SHARDRUN_NUM_PROCESSES"};
        ConfigValue<int> num_candidate_solutions{8, "SHARDRUN_NUM_CANDIDATE_SOLUTIONS"};
    } run;
};

/**
 * Configuration manager singleton
 */
class Configuration {
public:
    static Configuration& getInstance();

    // Load configuration from file
    bool loadFromFile(const std::string& filename);

    // Load configuration from YAML string
    bool loadFromString(const std::string& yaml_content);

    // Override with parsed command line arguments
    void overrideFromCommandLine(const cxxopts::ParseResult& result);

    // Get the configuration
    const ShardrunConfig& config() const { return config_; }
    ShardrunConfig& config() { return config_; }

    // Validation
    bool validate() const;
    std::vector<std::string> getValidationErrors() const;

    // Back to built-in defaults; used between test cases
    void reset();

private:
    Configuration() = default;
    Configuration(const Configuration&) = delete;
    Configuration& operator=(const Configuration&) = delete;

    ShardrunConfig config_;
    mutable std::vector<std::string> validation_errors_;

    void applyYAML(const YAML::Node& root);
};

// Global accessor
const Configuration& GetConfig();

// Template specializations for getEnvValue
template<>
std::optional<int> ConfigValue<int>::getEnvValue() const;

template<>
std::optional<std::string> ConfigValue<std::string>::getEnvValue() const;

template<>
std::optional<bool> ConfigValue<bool>::getEnvValue() const;

} // namespace Shardrun

#endif // SHARDRUN_CONFIGURATION_H_
