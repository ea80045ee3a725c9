#pragma once

#include <chrono>
#include <string>
#include <vector>

#include "common/process_runner.h"
#include "interfaces.h"

namespace Shardrun {

struct ShardrunConfig;

struct EvaluatorOptions {
    std::vector<std::string> command = {"python", "-m", "swebench.harness.run_evaluation"};
    std::string dataset_name = "princeton-nlp/SWE-bench";
    // Also the "model_name_or_path" of every prediction and the report's file prefix
    std::string generator_name = "augment-agent";
    std::chrono::seconds timeout{3600};

    static EvaluatorOptions FromConfig(const ShardrunConfig& config);
};

/**
 * Runs the external test harness on one predictions file, using the problem
 * id as run id, from inside the rollout's artifact directory. The harness
 * writes `<generator>.<run_id>.json` there; the verdict is whether the
 * problem id appears in its `resolved_ids`.
 */
class HarnessEvaluator : public IEvaluator {
public:
    HarnessEvaluator(ProcessRunner& runner, EvaluatorOptions options);

    bool Evaluate(const RolloutJob& job, const std::filesystem::path& predictions_path) override;

    std::filesystem::path ReportPath(const RolloutJob& job) const;

private:
    ProcessRunner& runner_;
    EvaluatorOptions options_;
};

} // namespace Shardrun
