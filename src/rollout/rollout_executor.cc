#include "rollout_executor.h"

#include <chrono>

#include <glog/logging.h>

#include "common/configuration.h"
#include "common/errors.h"
#include "common/json_io.h"
#include "planner/resume_gate.h"
#include "sandbox/sandbox_manager.h"

namespace Shardrun {

ExecutorOptions ExecutorOptions::FromConfig(const ShardrunConfig& config) {
    ExecutorOptions o;
    o.evals_dir = config.run.evals_dir.get();
    o.generator_name = config.agent.generator_name.get();
    o.evaluation_enabled = config.evaluation.enabled.get();
    return o;
}

RolloutExecutor::RolloutExecutor(SandboxManager& sandboxes, IAgentRunner& agent, IPatchExtractor& patches,
                                 IEvaluator& evaluator, ExecutorOptions options)
    : sandboxes_(sandboxes),
      agent_(agent),
      patches_(patches),
      evaluator_(evaluator),
      options_(std::move(options)) {}

std::filesystem::path RolloutExecutor::PredictionsPath(const RolloutJob& job) {
    return job.artifact_dir / "predictions.json";
}

std::filesystem::path RolloutExecutor::EvalsRecordPath(const std::string& problem_id) const {
    return ResumeGate(options_.evals_dir).MarkerPath(problem_id);
}

void RolloutExecutor::WritePredictions(const RolloutJob& job, const std::string& patch) {
    Json::Value prediction(Json::objectValue);
    prediction["instance_id"] = job.problem_id;
    prediction["model_name_or_path"] = options_.generator_name;
    prediction["model_patch"] = patch;
    Json::Value predictions(Json::arrayValue);
    predictions.append(prediction);

    const std::string content = ToJsonString(predictions, "  ");
    WriteFileAtomically(PredictionsPath(job), content);
    WriteFileAtomically(EvalsRecordPath(job.problem_id), content);
    VLOG(1) << job.Tag() << " Saved predictions to " << PredictionsPath(job) << " and "
            << EvalsRecordPath(job.problem_id);
}

DiffResult RolloutExecutor::Execute(const RolloutJob& job, const std::shared_ptr<ConcurrencyToken>& token) {
    const std::string tag = job.Tag();
    LOG(INFO) << tag << " START: workspace=" << job.workspace_path;

    SandboxLease lease;
    try {
        lease = sandboxes_.Acquire(job.problem_id, *token, job.artifact_dir);
        sandboxes_.Materialize(*lease.get(), job.workspace_path);
    } catch (const SandboxAcquisitionError& e) {
        LOG(ERROR) << tag << " Sandbox unavailable: " << e.what();
        lease.Release();
        return DiffResult::Failure(job.rollout_index, RolloutStatus::kSandboxError, e.what());
    }
    LOG(INFO) << tag << " Docker container started with ID: " << lease->container_id();

    DiffResult result;
    result.rollout_index = job.rollout_index;

    auto start = std::chrono::steady_clock::now();
    try {
        agent_.Run(job, *lease.get());
    } catch (const AgentExecutionError& e) {
        LOG(ERROR) << tag << " Agent failed: " << e.what();
        result.status = RolloutStatus::kAgentError;
        result.error = e.what();
    } catch (const std::exception& e) {
        LOG(ERROR) << tag << " Agent raised: " << e.what();
        result.status = RolloutStatus::kAgentError;
        result.error = e.what();
    }
    result.duration_s = std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();

    // Best effort even after an agent failure; partial work is still scored.
    try {
        result.patch = patches_.Extract(job.workspace_path);
    } catch (const std::exception& e) {
        LOG(WARNING) << tag << " Could not extract patch: " << e.what();
    }

    WritePredictions(job, result.patch);

    LOG(INFO) << tag << " Stopping Docker container";
    lease.Release();

    if (!options_.evaluation_enabled) {
        result.eval = EvalOutcome::Skipped("evaluation disabled");
        return result;
    }
    auto eval_start = std::chrono::steady_clock::now();
    try {
        result.eval = EvalOutcome::Resolved(evaluator_.Evaluate(job, PredictionsPath(job)));
    } catch (const EvaluationError& e) {
        LOG(ERROR) << tag << " Failed to evaluate: " << e.what();
        result.eval = EvalOutcome::Error(e.what());
    }
    LOG(INFO) << tag << " Evaluation completed in "
              << std::chrono::duration<double>(std::chrono::steady_clock::now() - eval_start).count() << "s";
    return result;
}

} // namespace Shardrun
