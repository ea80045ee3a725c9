#include <gtest/gtest.h>
#include "../../src/aggregator/result_aggregator.h"
#include "../../src/common/errors.h"
#include "../../src/common/json_io.h"
#include "../test_util.h"

#include <sstream>

using namespace Shardrun;

namespace {

ProblemOutcome MakeOutcome(const std::string& id, std::vector<double> durations) {
    ProblemOutcome outcome;
    outcome.problem_id = id;
    outcome.statement = "statement of " + id;
    for (size_t i = 0; i < durations.size(); ++i) {
        DiffResult r;
        r.rollout_index = static_cast<int>(i);
        r.patch = "diff --git a/f" + std::to_string(i);
        r.duration_s = durations[i];
        r.eval = EvalOutcome::Resolved(i == 0);
        outcome.rollouts.push_back(r);
    }
    return outcome;
}

std::vector<Json::Value> ReadLines(const std::filesystem::path& path) {
    std::vector<Json::Value> out;
    std::istringstream in(testing_util::ReadText(path));
    std::string line;
    while (std::getline(in, line)) {
        Json::Value v;
        EXPECT_TRUE(ParseJson(line, v)) << line;
        out.push_back(v);
    }
    return out;
}

} // namespace

class ResultAggregatorTest : public ::testing::Test {
protected:
    testing_util::TempDir dir_;
};

TEST_F(ResultAggregatorTest, CheckpointFileName) {
    EXPECT_EQ(ResultAggregator::CheckpointFileName(0, 2), "pre-ensemble_results_shard0_of_2.jsonl");
    ResultAggregator agg(dir_.path(), 3, 10);
    EXPECT_EQ(agg.checkpoint_path(), dir_.path() / "pre-ensemble_results_shard3_of_10.jsonl");
}

TEST_F(ResultAggregatorTest, RecordShape) {
    ProblemOutcome outcome = MakeOutcome("p__q-1", {3.0, 1.0, 2.0});
    outcome.rollouts[1] = DiffResult::Failure(1, RolloutStatus::kAgentError, "agent crashed");

    Json::Value record = ResultAggregator::ToRecord(outcome);
    EXPECT_EQ(record["id"].asString(), "p__q-1");
    EXPECT_EQ(record["instruction"].asString(), "statement of p__q-1");
    ASSERT_EQ(record["diffs"].size(), 3u);
    EXPECT_EQ(record["diffs"][1].asString(), "");
    ASSERT_EQ(record["agent_durations"].size(), 3u);
    // Failure entries carry zero duration: median of {3, 0, 2}
    EXPECT_DOUBLE_EQ(record["median_duration"].asDouble(), 2.0);

    const Json::Value& evals = record["eval_outcomes"];
    ASSERT_EQ(evals.size(), 3u);
    EXPECT_TRUE(evals[0]["is_success"].asBool());
    EXPECT_EQ(evals[0]["status"].asString(), "resolved");
    EXPECT_FALSE(evals[0].isMember("error"));
    EXPECT_EQ(evals[1]["status"].asString(), "skipped");
    EXPECT_EQ(evals[1]["error"].asString(), "agent crashed");
    EXPECT_EQ(evals[2]["status"].asString(), "unresolved");

    EXPECT_EQ(record["rollout_status"][0].asString(), "completed");
    EXPECT_EQ(record["rollout_status"][1].asString(), "agent_error");
}

TEST_F(ResultAggregatorTest, EveryAppendLeavesACompleteFile) {
    ResultAggregator agg(dir_.path(), 0, 1);
    for (int i = 0; i < 5; ++i) {
        agg.Append(MakeOutcome("p__q-" + std::to_string(i), {1.0 + i}));
        auto lines = ReadLines(agg.checkpoint_path());
        ASSERT_EQ(lines.size(), static_cast<size_t>(i + 1));
        EXPECT_EQ(lines.back()["id"].asString(), "p__q-" + std::to_string(i));
    }
    EXPECT_EQ(agg.size(), 5u);
    for (const auto& entry : std::filesystem::directory_iterator(dir_.path())) {
        EXPECT_EQ(entry.path().extension(), ".jsonl") << entry.path();
    }
}

TEST_F(ResultAggregatorTest, DuplicateAppendIsIgnored) {
    ResultAggregator agg(dir_.path(), 0, 1);
    agg.Append(MakeOutcome("p__q-1", {1.0}));
    agg.Append(MakeOutcome("p__q-1", {9.0}));
    EXPECT_EQ(agg.size(), 1u);
    EXPECT_EQ(ReadLines(agg.checkpoint_path()).size(), 1u);
}

TEST_F(ResultAggregatorTest, ResumesFromExistingCheckpoint) {
    {
        ResultAggregator first(dir_.path(), 1, 2);
        first.Append(MakeOutcome("a__b-1", {1.0}));
        first.Append(MakeOutcome("a__b-2", {2.0}));
    }
    ResultAggregator second(dir_.path(), 1, 2);
    EXPECT_EQ(second.LoadExisting(), 2u);
    EXPECT_TRUE(second.Contains("a__b-1"));
    EXPECT_FALSE(second.Contains("a__b-3"));

    second.Append(MakeOutcome("a__b-3", {3.0}));
    auto lines = ReadLines(second.checkpoint_path());
    ASSERT_EQ(lines.size(), 3u);
    EXPECT_EQ(lines[0]["id"].asString(), "a__b-1");
    EXPECT_EQ(lines[2]["id"].asString(), "a__b-3");
}

TEST_F(ResultAggregatorTest, MissingCheckpointLoadsNothing) {
    ResultAggregator agg(dir_.path(), 0, 1);
    EXPECT_EQ(agg.LoadExisting(), 0u);
    EXPECT_EQ(agg.size(), 0u);
}

TEST_F(ResultAggregatorTest, MalformedCheckpointThrows) {
    ResultAggregator agg(dir_.path(), 0, 1);
    testing_util::WriteText(agg.checkpoint_path(), "{\"id\": \"x__y-1\"}\n{truncated\n");
    EXPECT_THROW(agg.LoadExisting(), PersistenceError);
}

TEST_F(ResultAggregatorTest, DuplicateIdsInCheckpointKeepFirst) {
    ResultAggregator agg(dir_.path(), 0, 1);
    testing_util::WriteText(agg.checkpoint_path(),
                            "{\"id\": \"x__y-1\", \"median_duration\": 1.0}\n\n"
                            "{\"id\": \"x__y-1\", \"median_duration\": 5.0}\n");
    EXPECT_EQ(agg.LoadExisting(), 1u);
    EXPECT_DOUBLE_EQ(agg.records()[0]["median_duration"].asDouble(), 1.0);
}

TEST_F(ResultAggregatorTest, LatencyOverProblemMedians) {
    ResultAggregator agg(dir_.path(), 0, 1);
    agg.Append(MakeOutcome("p__q-1", {1.0, 3.0}));
    agg.Append(MakeOutcome("p__q-2", {4.0}));
    agg.Append(MakeOutcome("p__q-3", {}));

    std::vector<double> medians = agg.MedianDurations();
    ASSERT_EQ(medians.size(), 3u);
    EXPECT_DOUBLE_EQ(medians[0], 2.0);
    EXPECT_DOUBLE_EQ(medians[1], 4.0);
    EXPECT_DOUBLE_EQ(medians[2], 0.0);

    LatencyStats::Summary s = agg.LatencySummary();
    EXPECT_EQ(s.count, 3u);
    EXPECT_DOUBLE_EQ(s.max_s, 4.0);
    agg.ReportLatency();
}
