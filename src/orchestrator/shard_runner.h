#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "planner/problem.h"

namespace Shardrun {

class ResumeGate;
class RolloutScheduler;
class ResultAggregator;

struct ShardRunStats {
    int processed = 0;
    int skipped = 0;
    // Problems whose processing raised; nothing was checkpointed for them
    int failed = 0;
    double elapsed_s = 0.0;
};

/**
 * The per-shard loop. Problems run strictly one after another:
 *   resume gate -> scheduler (all rollouts) -> aggregator append + checkpoint.
 * An exception escaping one problem is logged and the loop moves on, except
 * ConfigurationError and PersistenceError, which end the run.
 */
class ShardRunner {
public:
    ShardRunner(ResumeGate& gate, RolloutScheduler& scheduler, ResultAggregator& aggregator);

    ShardRunStats Run(const std::vector<Problem>& problems);

private:
    bool AlreadyDone(const Problem& problem) const;

    ResumeGate& gate_;
    RolloutScheduler& scheduler_;
    ResultAggregator& aggregator_;
};

/**
 * Operator-facing description of the manual steps after a shard finishes:
 * where the per-rollout artifacts are, merging shard checkpoints, ensembling.
 */
std::string NextStepsSummary(const std::filesystem::path& run_dir, const std::filesystem::path& checkpoint_path,
                             int num_rollouts, size_t num_problems);

} // namespace Shardrun
