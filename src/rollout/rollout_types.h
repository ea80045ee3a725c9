#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace Shardrun {

/**
 * One execution attempt of one problem. The workspace is the `testbed/`
 * subdirectory of the artifact directory, so agent logs and predictions
 * written beside it never show up in the patch.
 */
struct RolloutJob {
    std::string problem_id;
    std::string statement;
    int rollout_index = 0;
    std::filesystem::path artifact_dir;
    std::filesystem::path workspace_path;

    // "[<problem_id>#<rollout>]" log prefix
    std::string Tag() const;
};

enum class RolloutStatus {
    kCompleted,
    kAgentError,
    kSandboxError,
    kInternalError,
};

const char* RolloutStatusName(RolloutStatus status);

enum class EvalStatus {
    kResolved,
    kUnresolved,
    kEvalError,
    kSkipped,
};

const char* EvalStatusName(EvalStatus status);

struct EvalOutcome {
    bool is_success = false;
    EvalStatus status = EvalStatus::kSkipped;
    std::string error;

    static EvalOutcome Resolved(bool resolved) {
        return {resolved, resolved ? EvalStatus::kResolved : EvalStatus::kUnresolved, ""};
    }
    static EvalOutcome Error(std::string error) { return {false, EvalStatus::kEvalError, std::move(error)}; }
    static EvalOutcome Skipped(std::string reason = "") {
        return {false, EvalStatus::kSkipped, std::move(reason)};
    }
};

/**
 * Produced once per rollout, whether or not the agent succeeded.
 */
struct DiffResult {
    int rollout_index = 0;
    std::string patch;
    double duration_s = 0.0;
    EvalOutcome eval;
    RolloutStatus status = RolloutStatus::kCompleted;
    std::string error;

    bool failed() const { return status != RolloutStatus::kCompleted; }

    static DiffResult Failure(int rollout_index, RolloutStatus status, std::string error);
};

/**
 * Aggregate of every rollout of one problem, ordered by rollout index.
 */
struct ProblemOutcome {
    std::string problem_id;
    std::string statement;
    std::vector<DiffResult> rollouts;

    std::vector<std::string> Diffs() const;
    std::vector<double> Durations() const;
    // Median of Durations(); 0 when there are no rollouts.
    double MedianDuration() const;
    int ResolvedCount() const;
    int FailedCount() const;
};

// Median of an unsorted sample (mean of the middle pair for even sizes).
double Median(std::vector<double> values);

} // namespace Shardrun
