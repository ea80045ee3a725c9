#pragma once

#include <filesystem>
#include <string>
#include <unordered_set>
#include <vector>

#include <json/json.h>

#include "latency_stats.h"
#include "rollout/rollout_types.h"

namespace Shardrun {

/**
 * Append-only shard result with a durable JSONL checkpoint.
 *
 * Every Append rewrites the whole checkpoint through a temp file and an
 * atomic rename, so the file on disk is always a complete snapshot of the
 * records appended so far. Not thread-safe; problems are appended one at a
 * time by the shard loop.
 */
class ResultAggregator {
public:
    ResultAggregator(std::filesystem::path output_dir, int shard_id, int shard_ct);

    // "pre-ensemble_results_shard<id>_of_<ct>.jsonl"
    static std::string CheckpointFileName(int shard_id, int shard_ct);

    static Json::Value ToRecord(const ProblemOutcome& outcome);

    /**
     * Adopts the records of a checkpoint left by an earlier run of this shard.
     * @return number of records loaded (0 if there is no checkpoint)
     * @throws PersistenceError if the checkpoint exists but cannot be parsed
     */
    size_t LoadExisting();

    bool Contains(const std::string& problem_id) const;

    // Appends and rewrites the checkpoint. Throws PersistenceError.
    void Append(const ProblemOutcome& outcome);

    size_t size() const { return records_.size(); }
    const std::vector<Json::Value>& records() const { return records_; }
    const std::filesystem::path& checkpoint_path() const { return checkpoint_path_; }

    // One entry per record: its median rollout duration.
    std::vector<double> MedianDurations() const;
    LatencyStats::Summary LatencySummary() const;

    // Logs the latency statistics across all records.
    void ReportLatency() const;

private:
    void Flush() const;

    std::filesystem::path checkpoint_path_;
    std::vector<Json::Value> records_;
    std::unordered_set<std::string> ids_;
};

} // namespace Shardrun
