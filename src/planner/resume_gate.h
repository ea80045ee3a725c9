#pragma once

#include <filesystem>
#include <string>

namespace Shardrun {

/**
 * Decides whether a problem still needs work on a rerun.
 *
 * The completion marker is the per-problem predictions record the rollout
 * executor writes into evals_dir. A problem with a marker is skipped.
 */
class ResumeGate {
public:
    enum class Decision { kProcess, kSkip };

    explicit ResumeGate(std::filesystem::path evals_dir);

    Decision Check(const std::string& problem_id) const;
    bool ShouldProcess(const std::string& problem_id) const {
        return Check(problem_id) == Decision::kProcess;
    }

    // <evals_dir>/<problem_id>_predictions.json
    std::filesystem::path MarkerPath(const std::string& problem_id) const;

    const std::filesystem::path& evals_dir() const { return evals_dir_; }

private:
    std::filesystem::path evals_dir_;
};

} // namespace Shardrun
