#pragma once

#include <chrono>
#include <map>
#include <string>
#include <vector>

namespace Shardrun {

/**
 * Everything needed to launch one external command.
 * The environment is explicit per invocation; the orchestrator never mutates
 * its own environment to configure a child.
 */
struct ProcessSpec {
    std::vector<std::string> argv;

    // When true the child starts from the parent's environment and `env`
    // overrides individual variables. When false the child sees only `env`.
    bool inherit_env = true;
    std::map<std::string, std::string> env;

    // Empty: run in the parent's working directory.
    std::string working_dir;

    // Empty: stdout and stderr are captured into ProcessResult::output.
    // Otherwise both are appended to this file.
    std::string output_path;

    // Zero means no deadline. On expiry the whole process group is killed.
    std::chrono::milliseconds timeout{0};
};

struct ProcessResult {
    int exit_code = -1;
    bool timed_out = false;
    std::string output;
    double elapsed_seconds = 0.0;

    bool Succeeded() const { return !timed_out && exit_code == 0; }
};

/**
 * Launches external commands. Abstract so that callers (docker CLI driver,
 * git, agent and evaluator launchers) can be tested without spawning anything.
 */
class ProcessRunner {
public:
    virtual ~ProcessRunner() = default;

    // Throws std::system_error if the process cannot be created at all.
    // A non-zero exit status is reported through ProcessResult, not thrown.
    virtual ProcessResult Run(const ProcessSpec& spec) = 0;
};

/**
 * fork/exec implementation. The child becomes the leader of its own process
 * group so a deadline can take down everything it spawned.
 */
class SubprocessRunner : public ProcessRunner {
public:
    ProcessResult Run(const ProcessSpec& spec) override;
};

/**
 * Renders argv for log lines, truncating long arguments (problem statements).
 */
std::string FormatCommand(const std::vector<std::string>& argv, size_t max_arg_len = 80);

} // namespace Shardrun
