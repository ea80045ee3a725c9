#include "shard_runner.h"

#include <chrono>

#include <glog/logging.h>
#include "absl/strings/str_cat.h"

#include "aggregator/result_aggregator.h"
#include "common/errors.h"
#include "planner/resume_gate.h"
#include "rollout/rollout_scheduler.h"

namespace Shardrun {

ShardRunner::ShardRunner(ResumeGate& gate, RolloutScheduler& scheduler, ResultAggregator& aggregator)
    : gate_(gate), scheduler_(scheduler), aggregator_(aggregator) {}

bool ShardRunner::AlreadyDone(const Problem& problem) const {
    if (aggregator_.Contains(problem.id)) {
        LOG(INFO) << "Skipping " << problem.id << " - already in " << aggregator_.checkpoint_path();
        return true;
    }
    return !gate_.ShouldProcess(problem.id);
}

ShardRunStats ShardRunner::Run(const std::vector<Problem>& problems) {
    ShardRunStats stats;
    auto start = std::chrono::steady_clock::now();

    for (size_t i = 0; i < problems.size(); ++i) {
        const Problem& problem = problems[i];
        if (AlreadyDone(problem)) {
            ++stats.skipped;
            continue;
        }
        LOG(INFO) << "Processing " << problem.id << " (" << (i + 1) << "/" << problems.size() << ")";
        try {
            ProblemOutcome outcome = scheduler_.RunProblem(problem);
            aggregator_.Append(outcome);
            ++stats.processed;
        } catch (const ConfigurationError&) {
            throw;
        } catch (const PersistenceError&) {
            throw;
        } catch (const std::exception& e) {
            LOG(ERROR) << "Error processing " << problem.id << ": " << e.what();
            ++stats.failed;
        }
    }

    stats.elapsed_s = std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
    LOG(INFO) << "Shard done: " << stats.processed << " processed, " << stats.skipped << " skipped, "
              << stats.failed << " failed in " << stats.elapsed_s << "s";
    if (stats.processed > 0) {
        LOG(INFO) << "Average time per processed problem: " << stats.elapsed_s / stats.processed << "s";
    }
    aggregator_.ReportLatency();
    return stats;
}

std::string NextStepsSummary(const std::filesystem::path& run_dir, const std::filesystem::path& checkpoint_path,
                             int num_rollouts, size_t num_problems) {
    return absl::StrCat(
        "Generated ", num_rollouts, " rollouts per problem for ", num_problems,
        " problems and collected eval results for each rollout.\n\n",
        "Per-rollout artifacts are under ", run_dir.string(), "/<problem_id>/rollout_<i>/:\n",
        "  agent_logs.txt                   agent output\n",
        "  predictions.json                 the generated diff\n",
        "  <generator>.<problem_id>.json    evaluation report\n",
        "  eval_logs.txt                    evaluator output\n\n",
        "Step 1: merge the shard checkpoints (one JSONL per shard; this shard wrote ",
        checkpoint_path.string(), "):\n",
        "  python merge_shards.py --input <all shard checkpoints> --output pre-ensemble_result_all_shards.jsonl\n\n",
        "Step 2: run the ensembler to pick one solution per problem (needs OPENAI_API_KEY):\n",
        "  python majority_vote_ensembler.py pre-ensemble_result_all_shards.jsonl "
        "--output_path ensembler_results_all_shards.json\n");
}

} // namespace Shardrun
