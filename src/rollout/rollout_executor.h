#pragma once

#include <filesystem>
#include <string>

#include "interfaces.h"

namespace Shardrun {

class SandboxManager;
struct ShardrunConfig;

struct ExecutorOptions {
    std::filesystem::path evals_dir = "./evals";
    std::string generator_name = "augment-agent";
    bool evaluation_enabled = true;

    static ExecutorOptions FromConfig(const ShardrunConfig& config);
};

/**
 * Drives one rollout:
 *   acquire + materialize sandbox -> run agent -> extract patch (always)
 *   -> persist predictions -> release sandbox -> evaluate.
 * The sandbox is released before evaluation starts and on every early exit.
 */
class RolloutExecutor : public IRolloutExecutor {
public:
    RolloutExecutor(SandboxManager& sandboxes, IAgentRunner& agent, IPatchExtractor& patches,
                    IEvaluator& evaluator, ExecutorOptions options);

    DiffResult Execute(const RolloutJob& job, const std::shared_ptr<ConcurrencyToken>& token) override;

    // `<artifact_dir>/predictions.json`
    static std::filesystem::path PredictionsPath(const RolloutJob& job);
    // `<evals_dir>/<problem_id>_predictions.json`
    std::filesystem::path EvalsRecordPath(const std::string& problem_id) const;

private:
    void WritePredictions(const RolloutJob& job, const std::string& patch);

    SandboxManager& sandboxes_;
    IAgentRunner& agent_;
    IPatchExtractor& patches_;
    IEvaluator& evaluator_;
    ExecutorOptions options_;
};

} // namespace Shardrun
