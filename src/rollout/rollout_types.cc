#include "rollout_types.h"

#include <algorithm>

#include "absl/strings/str_cat.h"

namespace Shardrun {

std::string RolloutJob::Tag() const {
    return absl::StrCat("[", problem_id, "#", rollout_index, "]");
}

const char* RolloutStatusName(RolloutStatus status) {
    switch (status) {
        case RolloutStatus::kCompleted:     return "completed";
        case RolloutStatus::kAgentError:    return "agent_error";
        case RolloutStatus::kSandboxError:  return "sandbox_error";
        case RolloutStatus::kInternalError: return "internal_error";
    }
    return "unknown";
}

const char* EvalStatusName(EvalStatus status) {
    switch (status) {
        case EvalStatus::kResolved:   return "resolved";
        case EvalStatus::kUnresolved: return "unresolved";
        case EvalStatus::kEvalError:  return "eval_error";
        case EvalStatus::kSkipped:    return "skipped";
    }
    return "unknown";
}

DiffResult DiffResult::Failure(int rollout_index, RolloutStatus status, std::string error) {
    DiffResult r;
    r.rollout_index = rollout_index;
    r.status = status;
    r.error = std::move(error);
    r.eval = EvalOutcome::Skipped(r.error);
    return r;
}

std::vector<std::string> ProblemOutcome::Diffs() const {
    std::vector<std::string> out;
    out.reserve(rollouts.size());
    for (const auto& r : rollouts) {
        out.push_back(r.patch);
    }
    return out;
}

std::vector<double> ProblemOutcome::Durations() const {
    std::vector<double> out;
    out.reserve(rollouts.size());
    for (const auto& r : rollouts) {
        out.push_back(r.duration_s);
    }
    return out;
}

double ProblemOutcome::MedianDuration() const {
    return Median(Durations());
}

int ProblemOutcome::ResolvedCount() const {
    return static_cast<int>(std::count_if(rollouts.begin(), rollouts.end(),
                                          [](const DiffResult& r) { return r.eval.is_success; }));
}

int ProblemOutcome::FailedCount() const {
    return static_cast<int>(std::count_if(rollouts.begin(), rollouts.end(),
                                          [](const DiffResult& r) { return r.failed(); }));
}

double Median(std::vector<double> values) {
    if (values.empty()) {
        return 0.0;
    }
    std::sort(values.begin(), values.end());
    const size_t n = values.size();
    if (n % 2 == 1) {
        return values[n / 2];
    }
    return (values[n / 2 - 1] + values[n / 2]) / 2.0;
}

} // namespace Shardrun
