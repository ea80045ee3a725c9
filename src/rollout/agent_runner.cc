#include "agent_runner.h"

#include <cstdlib>

#include <glog/logging.h>
#include "absl/strings/ascii.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_replace.h"
#include "absl/strings/str_split.h"

#include "common/configuration.h"
#include "common/errors.h"
#include "sandbox/sandbox.h"

namespace Shardrun {

namespace {

// "{workspace}" becomes the rollout's artifact dir, and "{NAME}" (NAME being the
// variable itself) its value before the override. An empty prior value takes
// the adjoining ':' with it.
std::string ExpandEnvValue(const std::string& name, const std::string& value,
                           const std::string& workspace, const std::string& prior) {
    std::string expanded = absl::StrReplaceAll(value, {{"{workspace}", workspace}});
    const std::string self = absl::StrCat("{", name, "}");
    if (prior.empty()) {
        expanded = absl::StrReplaceAll(expanded, {{absl::StrCat(":", self), ""}});
        expanded = absl::StrReplaceAll(expanded, {{absl::StrCat(self, ":"), ""}});
    }
    return absl::StrReplaceAll(expanded, {{self, prior}});
}

} // namespace

AgentOptions AgentOptions::FromConfig(const ShardrunConfig& config) {
    AgentOptions o;
    std::vector<std::string> command = absl::StrSplit(config.agent.command.get(), ' ', absl::SkipWhitespace());
    o.command = std::move(command);
    o.testbed_path = config.sandbox.testbed_path.get();
    o.credential_env = config.agent.credential_env.get();
    if (const char* value = std::getenv(o.credential_env.c_str())) {
        o.credential = value;
    }
    for (absl::string_view name : absl::StrSplit(config.agent.passthrough_env.get(), ',', absl::SkipWhitespace())) {
        o.passthrough_env.emplace_back(absl::StripAsciiWhitespace(name));
    }
    o.extra_env = config.agent.extra_env;
    int timeout_s = config.agent.timeout_s.get();
    o.timeout = std::chrono::seconds(timeout_s > 0 ? timeout_s : config.sandbox.expiry_s.get());
    return o;
}

ProcessAgentRunner::ProcessAgentRunner(ProcessRunner& runner, AgentOptions options)
    : runner_(runner), options_(std::move(options)) {}

ProcessSpec ProcessAgentRunner::BuildSpec(const RolloutJob& job, const Sandbox& sandbox) const {
    ProcessSpec spec;
    spec.argv = options_.command;
    const std::string logs_path = (job.artifact_dir / "agent_logs.txt").string();
    spec.argv.insert(spec.argv.end(), {
        "--workspace", job.workspace_path.string(),
        "--problem-statement", job.statement,
        "--docker-container-id", sandbox.container_id(),
        "--use-container-workspace", options_.testbed_path,
        "--minimize-stdout-logs",
        "--logs-path", logs_path,
    });

    // The child sees only what is listed here.
    spec.inherit_env = false;
    for (const auto& name : options_.passthrough_env) {
        if (const char* value = std::getenv(name.c_str())) {
            spec.env[name] = value;
        }
    }
    if (!options_.credential.empty()) {
        spec.env[options_.credential_env] = options_.credential;
    }
    spec.env["ISSUE_ID"] = job.problem_id;
    spec.env["SWEBENCH_WORKSPACE"] = job.workspace_path.string();
    for (const auto& [key, value] : options_.extra_env) {
        auto prior = spec.env.find(key);
        spec.env[key] = ExpandEnvValue(key, value, job.artifact_dir.string(),
                                       prior != spec.env.end() ? prior->second : std::string());
    }

    spec.working_dir = job.artifact_dir.string();
    spec.output_path = logs_path;
    spec.timeout = options_.timeout;
    return spec;
}

void ProcessAgentRunner::Run(const RolloutJob& job, const Sandbox& sandbox) {
    ProcessSpec spec = BuildSpec(job, sandbox);
    LOG(INFO) << job.Tag() << " Starting agent run";
    VLOG(1) << job.Tag() << " " << FormatCommand(spec.argv);

    ProcessResult r;
    try {
        r = runner_.Run(spec);
    } catch (const std::exception& e) {
        throw AgentExecutionError(absl::StrCat("Cannot start agent: ", e.what()));
    }

    if (r.timed_out) {
        throw AgentExecutionError(absl::StrCat("Agent exceeded its deadline of ", options_.timeout.count(),
                                               "s and was killed"));
    }
    if (r.exit_code != 0) {
        throw AgentExecutionError(absl::StrCat("Agent exited with code ", r.exit_code,
                                               "; see ", spec.output_path));
    }
    LOG(INFO) << job.Tag() << " Agent run completed in " << r.elapsed_seconds << "s";
}

} // namespace Shardrun
