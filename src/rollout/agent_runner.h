#pragma once

#include <chrono>
#include <map>
#include <string>
#include <vector>

#include "common/process_runner.h"
#include "interfaces.h"

namespace Shardrun {

struct ShardrunConfig;

struct AgentOptions {
    // Command prefix, split on whitespace; the per-rollout flags are appended.
    std::vector<std::string> command = {"python", "cli.py"};
    std::string testbed_path = "/testbed";
    std::string credential_env = "ANTHROPIC_API_KEY";
    std::string credential;
    // Copied from the orchestrator's environment when set there
    std::vector<std::string> passthrough_env;
    // Set last. Values may use "{workspace}" and "{NAME}" for the variable's prior value.
    std::map<std::string, std::string> extra_env;
    // Zero means no deadline
    std::chrono::seconds timeout{0};

    // Reads the credential named by agent.credential_env from the environment.
    static AgentOptions FromConfig(const ShardrunConfig& config);
};

/**
 * Runs the agent as a separate OS process with an explicit argv and
 * environment. Output goes to `<artifact_dir>/agent_logs.txt`.
 */
class ProcessAgentRunner : public IAgentRunner {
public:
    ProcessAgentRunner(ProcessRunner& runner, AgentOptions options);

    void Run(const RolloutJob& job, const Sandbox& sandbox) override;

    // Exposed for tests
    ProcessSpec BuildSpec(const RolloutJob& job, const Sandbox& sandbox) const;

private:
    ProcessRunner& runner_;
    AgentOptions options_;
};

} // namespace Shardrun
