#include <gtest/gtest.h>
#include "../../src/common/errors.h"
#include "../../src/planner/shard_planner.h"

#include <set>

using namespace Shardrun;

namespace {

std::vector<Problem> MakeProblems(size_t n) {
    std::vector<Problem> problems;
    for (size_t i = 0; i < n; ++i) {
        problems.push_back({"owner__repo-" + std::to_string(i), "statement " + std::to_string(i)});
    }
    return problems;
}

std::vector<std::string> Ids(const std::vector<Problem>& problems) {
    std::vector<std::string> ids;
    for (const auto& p : problems) ids.push_back(p.id);
    return ids;
}

} // namespace

class ShardPlannerTest : public ::testing::Test {
protected:
    std::vector<Problem> ten_ = MakeProblems(10);
};

TEST_F(ShardPlannerTest, FirstOfTwoShardsCoversFirstHalf) {
    auto shard = ShardPlanner::Plan(ten_, {2, 0, std::nullopt});
    EXPECT_EQ(Ids(shard), Ids(std::vector<Problem>(ten_.begin(), ten_.begin() + 5)));
}

TEST_F(ShardPlannerTest, SecondOfTwoShardsCoversSecondHalf) {
    auto shard = ShardPlanner::Plan(ten_, {2, 1, std::nullopt});
    EXPECT_EQ(Ids(shard), Ids(std::vector<Problem>(ten_.begin() + 5, ten_.end())));
}

TEST_F(ShardPlannerTest, NumExamplesTakesPrefixOfSlice) {
    auto shard = ShardPlanner::Plan(ten_, {2, 0, 3});
    EXPECT_EQ(Ids(shard), Ids(std::vector<Problem>(ten_.begin(), ten_.begin() + 3)));

    auto second = ShardPlanner::Plan(ten_, {2, 1, 2});
    EXPECT_EQ(Ids(second), (std::vector<std::string>{"owner__repo-5", "owner__repo-6"}));
}

TEST_F(ShardPlannerTest, NumExamplesLargerThanSliceThrows) {
    EXPECT_THROW(ShardPlanner::Plan(ten_, {2, 0, 6}), ConfigurationError);
}

TEST_F(ShardPlannerTest, NumExamplesZeroIsEmpty) {
    EXPECT_TRUE(ShardPlanner::Plan(ten_, {2, 0, 0}).empty());
}

TEST_F(ShardPlannerTest, InvalidArgumentsThrow) {
    EXPECT_THROW(ShardPlanner::Plan(ten_, {0, 0, std::nullopt}), ConfigurationError);
    EXPECT_THROW(ShardPlanner::Plan(ten_, {-1, 0, std::nullopt}), ConfigurationError);
    EXPECT_THROW(ShardPlanner::Plan(ten_, {2, 2, std::nullopt}), ConfigurationError);
    EXPECT_THROW(ShardPlanner::Plan(ten_, {2, -1, std::nullopt}), ConfigurationError);
    EXPECT_THROW(ShardPlanner::Plan(ten_, {2, 0, -1}), ConfigurationError);
}

TEST_F(ShardPlannerTest, RemainderIsExcluded) {
    auto problems = MakeProblems(11);
    EXPECT_EQ(ShardPlanner::SliceSize(11, 3), 3u);
    EXPECT_EQ(ShardPlanner::Remainder(11, 3), 2u);

    auto last = ShardPlanner::Plan(problems, {3, 2, std::nullopt});
    EXPECT_EQ(Ids(last), (std::vector<std::string>{"owner__repo-6", "owner__repo-7", "owner__repo-8"}));
}

TEST_F(ShardPlannerTest, ShardsAreDisjointAndCoverEverythingButRemainder) {
    for (size_t n : {0u, 1u, 7u, 10u, 23u, 100u}) {
        auto problems = MakeProblems(n);
        for (int shard_ct : {1, 2, 3, 4, 7}) {
            std::set<std::string> seen;
            size_t covered = 0;
            for (int shard_id = 0; shard_id < shard_ct; ++shard_id) {
                for (const auto& p : ShardPlanner::Plan(problems, {shard_ct, shard_id, std::nullopt})) {
                    EXPECT_TRUE(seen.insert(p.id).second) << p.id << " in two shards";
                    ++covered;
                }
            }
            EXPECT_EQ(covered, n - ShardPlanner::Remainder(n, shard_ct))
                << "n=" << n << " shard_ct=" << shard_ct;
        }
    }
}

TEST_F(ShardPlannerTest, PlanIsDeterministic) {
    auto a = ShardPlanner::Plan(ten_, {3, 1, std::nullopt});
    auto b = ShardPlanner::Plan(ten_, {3, 1, std::nullopt});
    EXPECT_EQ(Ids(a), Ids(b));
}
