#pragma once

#include <filesystem>
#include <vector>

#include "interfaces.h"
#include "planner/problem.h"

namespace Shardrun {

struct ShardrunConfig;

struct SchedulerOptions {
    // Worker-pool width
    int num_workers = 8;
    // Rollouts per problem
    int num_rollouts = 8;
    // Permits of the per-problem ConcurrencyToken
    int max_concurrency = 4;
    // Per-run directory; rollout i of problem p lives in <run_dir>/<p>/rollout_<i>
    std::filesystem::path run_dir;

    static SchedulerOptions FromConfig(const ShardrunConfig& config, const std::filesystem::path& run_dir);
};

/**
 * Fans the rollouts of one problem out over a bounded worker pool and joins
 * them. One ConcurrencyToken is created per problem and shared by all of its
 * rollouts. A rollout that throws is recorded as an internal_error entry in
 * its own slot; the other rollouts' results are kept.
 */
class RolloutScheduler {
public:
    RolloutScheduler(IRolloutExecutor& executor, SchedulerOptions options);

    std::vector<RolloutJob> PlanJobs(const Problem& problem) const;

    // Blocks until every rollout has finished. Results are ordered by rollout index.
    ProblemOutcome RunProblem(const Problem& problem);

    const SchedulerOptions& options() const { return options_; }

private:
    IRolloutExecutor& executor_;
    SchedulerOptions options_;
};

} // namespace Shardrun
