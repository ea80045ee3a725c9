#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <optional>

#include <cxxopts.hpp>
#include <glog/logging.h>
#include "absl/random/random.h"
#include "absl/strings/str_format.h"

#include "aggregator/result_aggregator.h"
#include "common/configuration.h"
#include "common/errors.h"
#include "common/process_runner.h"
#include "orchestrator/shard_runner.h"
#include "planner/problem_source.h"
#include "planner/resume_gate.h"
#include "planner/shard_planner.h"
#include "rollout/agent_runner.h"
#include "rollout/evaluator.h"
#include "rollout/patch_extractor.h"
#include "rollout/rollout_executor.h"
#include "rollout/rollout_scheduler.h"
#include "sandbox/docker_provider.h"
#include "sandbox/sandbox_manager.h"

namespace fs = std::filesystem;
using namespace Shardrun;

namespace {

cxxopts::Options BuildOptions() {
    cxxopts::Options options("shardrun", "Run an agent on one shard of a benchmark, several rollouts per problem");

    options.add_options()
        ("l,log_level", "Log level", cxxopts::value<int>()->default_value("0"))
        ("config", "YAML configuration file", cxxopts::value<std::string>())
        ("dataset", "JSONL problem set (instance_id, problem_statement per line)", cxxopts::value<std::string>())
        ("num-examples", "Number of problems to run from this shard (default: all)", cxxopts::value<int>())
        ("shard-ct", "Number of shards", cxxopts::value<int>()->default_value("1"))
        ("shard-id", "Shard to run, in [0, shard-ct)", cxxopts::value<int>()->default_value("0"))
        ("num-processes", "Worker-pool width per problem", cxxopts::value<int>())
        ("num-candidate-solutions", "Rollouts per problem", cxxopts::value<int>())
        ("max-docker-concurrency", "Simultaneous image pulls / container starts", cxxopts::value<int>())
        ("workspace-root", "Root directory for per-rollout workspaces", cxxopts::value<std::string>())
        ("output-dir", "Directory for the shard checkpoint", cxxopts::value<std::string>())
        ("evals-dir", "Directory for per-problem predictions records", cxxopts::value<std::string>())
        ("agent-command", "Agent command prefix", cxxopts::value<std::string>())
        ("skip-eval", "Do not run the evaluation harness")
        ("h,help", "Print usage");
    return options;
}

int RunShard(const cxxopts::Options& options, const cxxopts::ParseResult& result) {
    if (result.count("help")) {
        std::cout << options.help() << std::endl;
        return 0;
    }
    FLAGS_v = result["log_level"].as<int>();

    Configuration& configuration = Configuration::getInstance();
    if (result.count("config") && !configuration.loadFromFile(result["config"].as<std::string>())) {
        for (const auto& error : configuration.getValidationErrors()) {
            LOG(ERROR) << "Configuration: " << error;
        }
        return 1;
    }
    configuration.overrideFromCommandLine(result);
    if (!configuration.validate()) {
        for (const auto& error : configuration.getValidationErrors()) {
            LOG(ERROR) << "Configuration: " << error;
        }
        return 1;
    }
    const ShardrunConfig& config = configuration.config();

    const std::string credential_env = config.agent.credential_env.get();
    const char* credential = std::getenv(credential_env.c_str());
    if (credential == nullptr || *credential == '\0') {
        LOG(ERROR) << "Error: " << credential_env << " environment variable is not set.";
        return 1;
    }

    ShardSpec shard;
    shard.shard_ct = result["shard-ct"].as<int>();
    shard.shard_id = result["shard-id"].as<int>();
    if (result.count("num-examples")) {
        shard.num_examples = result["num-examples"].as<int>();
    }

    try {
        const std::string dataset = config.run.dataset_path.get();
        if (dataset.empty()) {
            throw ConfigurationError("No problem set given; pass --dataset or set run.dataset_path");
        }
        std::vector<Problem> problems = ShardPlanner::Plan(LoadProblems(dataset), shard);
        LOG(INFO) << "Shard " << shard.shard_id << "/" << shard.shard_ct << ": " << problems.size() << " problems";

        absl::BitGen gen;
        const fs::path run_dir = fs::path(config.run.workspace_root.get()) /
                                 absl::StrFormat("%08x", absl::Uniform<uint32_t>(gen));
        LOG(INFO) << "Workspace base path: " << run_dir;

        SubprocessRunner runner;
        DockerCliProvider docker(runner, config.sandbox.docker_binary.get(),
                                 std::chrono::seconds(config.sandbox.docker_timeout_s.get()));
        SandboxManager sandboxes(docker, runner, SandboxOptions::FromConfig(config));
        ProcessAgentRunner agent(runner, AgentOptions::FromConfig(config));
        GitPatchExtractor patches(runner);
        HarnessEvaluator evaluator(runner, EvaluatorOptions::FromConfig(config));
        RolloutExecutor executor(sandboxes, agent, patches, evaluator, ExecutorOptions::FromConfig(config));
        RolloutScheduler scheduler(executor, SchedulerOptions::FromConfig(config, run_dir));

        ResumeGate gate(config.run.evals_dir.get());
        ResultAggregator aggregator(config.run.output_dir.get(), shard.shard_id, shard.shard_ct);
        aggregator.LoadExisting();

        ShardRunner shard_runner(gate, scheduler, aggregator);
        ShardRunStats stats = shard_runner.Run(problems);

        LOG(INFO) << "All examples processed. Results saved to " << aggregator.checkpoint_path();
        LOG(INFO) << "Sandboxes torn down: " << sandboxes.teardown_count();
        std::cout << "\n"
                  << NextStepsSummary(run_dir, aggregator.checkpoint_path(),
                                      config.run.num_candidate_solutions.get(), problems.size())
                  << std::endl;
        if (stats.failed > 0) {
            LOG(WARNING) << stats.failed << " problems failed and were not checkpointed; rerun to retry them";
        }
        return 0;
    } catch (const ConfigurationError& e) {
        LOG(ERROR) << "Invalid configuration: " << e.what();
        return 1;
    } catch (const PersistenceError& e) {
        LOG(ERROR) << "Checkpoint write failed, stopping: " << e.what();
        return 4;
    }
}

} // namespace

int main(int argc, char* argv[]) {
    // Initialize logging
    google::InitGoogleLogging(argv[0]);
    google::InstallFailureSignalHandler();
    FLAGS_logtostderr = 1; // log only to console, no files.

    cxxopts::Options options = BuildOptions();
    std::optional<cxxopts::ParseResult> result;
    try {
        result.emplace(options.parse(argc, argv));
    } catch (const std::exception& e) {
        std::cerr << e.what() << "\n" << options.help() << std::endl;
        return 2;
    }
    return RunShard(options, *result);
}
