#include "result_aggregator.h"

#include <fstream>

#include <glog/logging.h>
#include "absl/strings/str_cat.h"
#include "absl/strings/str_format.h"

#include "common/errors.h"
#include "common/json_io.h"

namespace fs = std::filesystem;

namespace Shardrun {

ResultAggregator::ResultAggregator(fs::path output_dir, int shard_id, int shard_ct)
    : checkpoint_path_(std::move(output_dir) / CheckpointFileName(shard_id, shard_ct)) {}

std::string ResultAggregator::CheckpointFileName(int shard_id, int shard_ct) {
    return absl::StrCat("pre-ensemble_results_shard", shard_id, "_of_", shard_ct, ".jsonl");
}

Json::Value ResultAggregator::ToRecord(const ProblemOutcome& outcome) {
    Json::Value record(Json::objectValue);
    record["id"] = outcome.problem_id;
    record["instruction"] = outcome.statement;

    Json::Value diffs(Json::arrayValue);
    Json::Value durations(Json::arrayValue);
    Json::Value evals(Json::arrayValue);
    Json::Value statuses(Json::arrayValue);
    for (const auto& r : outcome.rollouts) {
        diffs.append(r.patch);
        durations.append(r.duration_s);

        Json::Value eval(Json::objectValue);
        eval["is_success"] = r.eval.is_success;
        eval["status"] = EvalStatusName(r.eval.status);
        if (!r.eval.error.empty()) {
            eval["error"] = r.eval.error;
        }
        evals.append(eval);

        statuses.append(RolloutStatusName(r.status));
    }
    record["diffs"] = diffs;
    record["agent_durations"] = durations;
    record["median_duration"] = outcome.MedianDuration();
    record["eval_outcomes"] = evals;
    record["rollout_status"] = statuses;
    return record;
}

size_t ResultAggregator::LoadExisting() {
    std::error_code ec;
    if (!fs::exists(checkpoint_path_, ec)) {
        return 0;
    }
    std::ifstream in(checkpoint_path_);
    if (!in.is_open()) {
        throw PersistenceError("Cannot open existing checkpoint " + checkpoint_path_.string());
    }

    std::string line;
    size_t line_no = 0;
    size_t loaded = 0;
    while (std::getline(in, line)) {
        ++line_no;
        if (line.find_first_not_of(" \t\r") == std::string::npos) {
            continue;
        }
        Json::Value record;
        std::string error;
        if (!ParseJson(line, record, &error) || !record.isObject() || !record["id"].isString()) {
            throw PersistenceError(absl::StrCat("Checkpoint ", checkpoint_path_.string(), " line ", line_no,
                                                " is not a valid record: ", error));
        }
        const std::string id = record["id"].asString();
        if (!ids_.insert(id).second) {
            LOG(WARNING) << "Duplicate record for " << id << " in " << checkpoint_path_ << "; keeping the first";
            continue;
        }
        records_.push_back(std::move(record));
        ++loaded;
    }
    LOG(INFO) << "Loaded " << loaded << " records from existing checkpoint " << checkpoint_path_;
    return loaded;
}

bool ResultAggregator::Contains(const std::string& problem_id) const {
    return ids_.count(problem_id) > 0;
}

void ResultAggregator::Append(const ProblemOutcome& outcome) {
    if (Contains(outcome.problem_id)) {
        LOG(WARNING) << "Checkpoint already has a record for " << outcome.problem_id << "; not appending";
        return;
    }
    records_.push_back(ToRecord(outcome));
    ids_.insert(outcome.problem_id);
    Flush();
    LOG(INFO) << "Checkpointed " << outcome.problem_id << " (" << records_.size() << " records) to "
              << checkpoint_path_;
}

void ResultAggregator::Flush() const {
    std::string content;
    for (const auto& record : records_) {
        content += ToJsonString(record);
        content += '\n';
    }
    WriteFileAtomically(checkpoint_path_, content);
}

std::vector<double> ResultAggregator::MedianDurations() const {
    std::vector<double> out;
    out.reserve(records_.size());
    for (const auto& record : records_) {
        if (record["median_duration"].isNumeric()) {
            out.push_back(record["median_duration"].asDouble());
        }
    }
    return out;
}

LatencyStats::Summary ResultAggregator::LatencySummary() const {
    return LatencyStats::ComputeSummary(MedianDurations());
}

void ResultAggregator::ReportLatency() const {
    LatencyStats::Summary s = LatencySummary();
    if (s.count == 0) {
        LOG(INFO) << "No completed problems; no rollout latency statistics";
        return;
    }
    LOG(INFO) << absl::StrFormat(
        "Rollout latency over %d problems: min %.2fs, 25perc %.2fs, median %.2fs, 75perc %.2fs, max %.2fs",
        s.count, s.min_s, s.p25_s, s.p50_s, s.p75_s, s.max_s);
}

} // namespace Shardrun
