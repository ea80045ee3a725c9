#include "resume_gate.h"

#include <system_error>

#include <glog/logging.h>

namespace Shardrun {

ResumeGate::ResumeGate(std::filesystem::path evals_dir) : evals_dir_(std::move(evals_dir)) {}

std::filesystem::path ResumeGate::MarkerPath(const std::string& problem_id) const {
    return evals_dir_ / (problem_id + "_predictions.json");
}

ResumeGate::Decision ResumeGate::Check(const std::string& problem_id) const {
    const auto marker = MarkerPath(problem_id);
    std::error_code ec;
    bool present = std::filesystem::exists(marker, ec);
    if (ec) {
        // Unreadable marker location counts as not done.
        LOG(WARNING) << "Cannot stat " << marker << ": " << ec.message();
        present = false;
    }

    if (present) {
        LOG(INFO) << "Skipping " << problem_id << " - already processed (found " << marker
                  << "; delete it to run the problem again)";
        return Decision::kSkip;
    }
    VLOG(1) << "Processing " << problem_id << " (no marker at " << marker << ")";
    return Decision::kProcess;
}

} // namespace Shardrun
