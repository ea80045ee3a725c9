#include "rollout_scheduler.h"

#include <algorithm>
#include <future>
#include <memory>

#include <glog/logging.h>
#include "absl/strings/str_cat.h"

#include "common/configuration.h"
#include "common/errors.h"
#include "sandbox/concurrency_token.h"
#include "worker_pool.h"

namespace Shardrun {

SchedulerOptions SchedulerOptions::FromConfig(const ShardrunConfig& config, const std::filesystem::path& run_dir) {
    SchedulerOptions o;
    o.num_workers = config.run.num_processes.get();
    o.num_rollouts = config.run.num_candidate_solutions.get();
    o.max_concurrency = config.sandbox.max_concurrency.get();
    o.run_dir = run_dir;
    return o;
}

RolloutScheduler::RolloutScheduler(IRolloutExecutor& executor, SchedulerOptions options)
    : executor_(executor), options_(std::move(options)) {
    if (options_.num_workers < 1 || options_.num_rollouts < 1) {
        throw ConfigurationError(absl::StrCat("Worker count and rollouts per problem must be positive, got ",
                                              options_.num_workers, " and ", options_.num_rollouts));
    }
}

std::vector<RolloutJob> RolloutScheduler::PlanJobs(const Problem& problem) const {
    std::vector<RolloutJob> jobs;
    jobs.reserve(options_.num_rollouts);
    for (int i = 0; i < options_.num_rollouts; ++i) {
        RolloutJob job;
        job.problem_id = problem.id;
        job.statement = problem.statement;
        job.rollout_index = i;
        job.artifact_dir = options_.run_dir / problem.id / absl::StrCat("rollout_", i);
        job.workspace_path = job.artifact_dir / "testbed";
        jobs.push_back(std::move(job));
    }
    return jobs;
}

ProblemOutcome RolloutScheduler::RunProblem(const Problem& problem) {
    auto token = std::make_shared<ConcurrencyToken>(options_.max_concurrency);
    std::vector<RolloutJob> jobs = PlanJobs(problem);

    const size_t width = std::min<size_t>(options_.num_workers, jobs.size());
    LOG(INFO) << "[" << problem.id << "] Running " << jobs.size() << " rollouts on " << width << " workers";

    ProblemOutcome outcome;
    outcome.problem_id = problem.id;
    outcome.statement = problem.statement;
    outcome.rollouts.reserve(jobs.size());

    std::vector<std::future<DiffResult>> futures;
    futures.reserve(jobs.size());
    {
        WorkerPool pool(width);
        for (const auto& job : jobs) {
            futures.push_back(pool.Submit([this, &job, token]() { return executor_.Execute(job, token); }));
        }

        for (size_t i = 0; i < futures.size(); ++i) {
            try {
                outcome.rollouts.push_back(futures[i].get());
            } catch (const std::exception& e) {
                LOG(ERROR) << jobs[i].Tag() << " Rollout failed: " << e.what();
                outcome.rollouts.push_back(
                    DiffResult::Failure(jobs[i].rollout_index, RolloutStatus::kInternalError, e.what()));
            }
        }
    }

    VLOG(1) << "[" << problem.id << "] Peak concurrent sandbox operations: " << token->peak_in_flight();
    LOG(INFO) << "[" << problem.id << "] " << outcome.rollouts.size() << " rollouts done, "
              << outcome.FailedCount() << " failed, " << outcome.ResolvedCount() << " resolved, median "
              << outcome.MedianDuration() << "s";
    return outcome;
}

} // namespace Shardrun
