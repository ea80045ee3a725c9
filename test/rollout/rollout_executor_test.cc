#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "../../src/common/errors.h"
#include "../../src/common/json_io.h"
#include "../../src/rollout/rollout_executor.h"
#include "../../src/sandbox/sandbox_manager.h"
#include "../mocks.h"
#include "../test_util.h"

using namespace Shardrun;
using ::testing::_;
using ::testing::Invoke;
using ::testing::NiceMock;
using ::testing::Return;
using ::testing::Throw;

class RolloutExecutorTest : public ::testing::Test {
protected:
    void SetUp() override {
        sandbox_options_.start_settle = std::chrono::milliseconds(0);
        sandbox_options_.remove_settle = std::chrono::milliseconds(0);
        sandbox_options_.image_remove_settle = std::chrono::milliseconds(0);

        ON_CALL(provider_, ContainerExists(_)).WillByDefault(Return(false));
        ON_CALL(provider_, RunContainer(_)).WillByDefault(Return("c0ffee"));
        ON_CALL(provider_, StopContainer(_)).WillByDefault(Return(true));
        ON_CALL(provider_, RemoveContainer(_)).WillByDefault(Return(true));
        ON_CALL(host_runner_, Run(_)).WillByDefault(Return(ExitWith(0, ".git")));

        executor_options_.evals_dir = dir_.path() / "evals";

        job_.problem_id = "psf__requests-2317";
        job_.statement = "Method is a binary string";
        job_.rollout_index = 1;
        job_.artifact_dir = dir_.path() / "run" / "psf__requests-2317" / "rollout_1";
        job_.workspace_path = job_.artifact_dir / "testbed";

        token_ = std::make_shared<ConcurrencyToken>(2);
    }

    DiffResult Execute() {
        SandboxManager manager(provider_, host_runner_, sandbox_options_);
        RolloutExecutor executor(manager, agent_, patches_, evaluator_, executor_options_);
        DiffResult result = executor.Execute(job_, token_);
        teardowns_ = manager.teardown_count();
        return result;
    }

    std::string SavedPatch(const std::filesystem::path& path) {
        Json::Value predictions = ReadJsonFile(path);
        EXPECT_TRUE(predictions.isArray());
        EXPECT_EQ(predictions.size(), 1u);
        EXPECT_EQ(predictions[0]["instance_id"].asString(), "psf__requests-2317");
        EXPECT_EQ(predictions[0]["model_name_or_path"].asString(), "augment-agent");
        return predictions[0]["model_patch"].asString();
    }

    testing_util::TempDir dir_;
    SandboxOptions sandbox_options_;
    ExecutorOptions executor_options_;
    NiceMock<MockSandboxProvider> provider_;
    NiceMock<MockProcessRunner> host_runner_;
    MockAgentRunner agent_;
    MockPatchExtractor patches_;
    MockEvaluator evaluator_;
    RolloutJob job_;
    std::shared_ptr<ConcurrencyToken> token_;
    int teardowns_ = 0;
};

TEST_F(RolloutExecutorTest, ResolvedRollout) {
    const std::string patch = "diff --git a/requests/sessions.py b/requests/sessions.py\n";
    EXPECT_CALL(agent_, Run(_, _)).WillOnce(Invoke([](const RolloutJob&, const Sandbox& sandbox) {
        EXPECT_EQ(sandbox.container_id(), "c0ffee");
        EXPECT_EQ(sandbox.state(), SandboxState::kRunning);
    }));
    EXPECT_CALL(patches_, Extract(job_.workspace_path)).WillOnce(Return(patch));
    EXPECT_CALL(evaluator_, Evaluate(_, RolloutExecutor::PredictionsPath(job_))).WillOnce(Return(true));

    DiffResult result = Execute();

    EXPECT_EQ(result.status, RolloutStatus::kCompleted);
    EXPECT_EQ(result.rollout_index, 1);
    EXPECT_EQ(result.patch, patch);
    EXPECT_GE(result.duration_s, 0.0);
    EXPECT_TRUE(result.eval.is_success);
    EXPECT_EQ(result.eval.status, EvalStatus::kResolved);
    EXPECT_EQ(teardowns_, 1);
    EXPECT_EQ(token_->in_flight(), 0);

    EXPECT_EQ(SavedPatch(RolloutExecutor::PredictionsPath(job_)), patch);
    EXPECT_EQ(SavedPatch(executor_options_.evals_dir / "psf__requests-2317_predictions.json"), patch);
}

TEST_F(RolloutExecutorTest, SandboxIsReleasedBeforeEvaluation) {
    EXPECT_CALL(agent_, Run(_, _));
    EXPECT_CALL(patches_, Extract(_)).WillOnce(Return(""));
    {
        ::testing::InSequence seq;
        EXPECT_CALL(provider_, RemoveContainer("c0ffee")).WillOnce(Return(true));
        EXPECT_CALL(evaluator_, Evaluate(_, _)).WillOnce(Return(false));
    }

    DiffResult result = Execute();
    EXPECT_EQ(result.eval.status, EvalStatus::kUnresolved);
    EXPECT_FALSE(result.eval.is_success);
}

TEST_F(RolloutExecutorTest, SandboxFailureSkipsAgent) {
    EXPECT_CALL(provider_, PullImage(_)).WillOnce(Throw(SandboxAcquisitionError("manifest unknown")));
    EXPECT_CALL(agent_, Run(_, _)).Times(0);
    EXPECT_CALL(patches_, Extract(_)).Times(0);
    EXPECT_CALL(evaluator_, Evaluate(_, _)).Times(0);

    DiffResult result = Execute();

    EXPECT_EQ(result.status, RolloutStatus::kSandboxError);
    EXPECT_TRUE(result.failed());
    EXPECT_TRUE(result.patch.empty());
    EXPECT_EQ(result.eval.status, EvalStatus::kSkipped);
    EXPECT_EQ(teardowns_, 1);
    EXPECT_FALSE(std::filesystem::exists(RolloutExecutor::PredictionsPath(job_)));
}

TEST_F(RolloutExecutorTest, CopyFailureIsSandboxError) {
    EXPECT_CALL(provider_, CopyOut(_, _, _)).WillOnce(Throw(SandboxAcquisitionError("cp failed")));
    EXPECT_CALL(provider_, StopContainer("c0ffee")).WillOnce(Return(true));
    EXPECT_CALL(agent_, Run(_, _)).Times(0);

    DiffResult result = Execute();
    EXPECT_EQ(result.status, RolloutStatus::kSandboxError);
    EXPECT_EQ(teardowns_, 1);
}

TEST_F(RolloutExecutorTest, AgentFailureStillExtractsAndEvaluates) {
    EXPECT_CALL(agent_, Run(_, _)).WillOnce(Throw(AgentExecutionError("agent exceeded deadline")));
    EXPECT_CALL(patches_, Extract(_)).WillOnce(Return("partial diff\n"));
    EXPECT_CALL(evaluator_, Evaluate(_, _)).WillOnce(Return(false));

    DiffResult result = Execute();

    EXPECT_EQ(result.status, RolloutStatus::kAgentError);
    EXPECT_EQ(result.error, "agent exceeded deadline");
    EXPECT_EQ(result.patch, "partial diff\n");
    EXPECT_EQ(result.eval.status, EvalStatus::kUnresolved);
    EXPECT_EQ(teardowns_, 1);
    EXPECT_EQ(SavedPatch(RolloutExecutor::PredictionsPath(job_)), "partial diff\n");
}

TEST_F(RolloutExecutorTest, ExtractionFailureYieldsEmptyPatch) {
    EXPECT_CALL(agent_, Run(_, _));
    EXPECT_CALL(patches_, Extract(_)).WillOnce(Throw(std::runtime_error("not a git repository")));
    EXPECT_CALL(evaluator_, Evaluate(_, _)).WillOnce(Return(false));

    DiffResult result = Execute();

    EXPECT_EQ(result.status, RolloutStatus::kCompleted);
    EXPECT_TRUE(result.patch.empty());
    EXPECT_EQ(SavedPatch(RolloutExecutor::PredictionsPath(job_)), "");
    EXPECT_EQ(teardowns_, 1);
    EXPECT_EQ(token_->in_flight(), 0);
}

TEST_F(RolloutExecutorTest, UnexpectedAgentExceptionStillSavesPatch) {
    EXPECT_CALL(agent_, Run(_, _)).WillOnce(Throw(std::runtime_error("agent crashed")));
    EXPECT_CALL(patches_, Extract(job_.workspace_path)).WillOnce(Return("half done\n"));
    EXPECT_CALL(evaluator_, Evaluate(_, _)).WillOnce(Return(false));

    DiffResult result = Execute();

    EXPECT_EQ(result.status, RolloutStatus::kAgentError);
    EXPECT_EQ(result.error, "agent crashed");
    EXPECT_EQ(result.patch, "half done\n");
    EXPECT_EQ(teardowns_, 1);
    EXPECT_EQ(token_->in_flight(), 0);
    EXPECT_EQ(SavedPatch(RolloutExecutor::PredictionsPath(job_)), "half done\n");
    EXPECT_EQ(SavedPatch(executor_options_.evals_dir / "psf__requests-2317_predictions.json"), "half done\n");
}

TEST_F(RolloutExecutorTest, EvaluationErrorIsRecorded) {
    EXPECT_CALL(agent_, Run(_, _));
    EXPECT_CALL(patches_, Extract(_)).WillOnce(Return("diff\n"));
    EXPECT_CALL(evaluator_, Evaluate(_, _)).WillOnce(Throw(EvaluationError("report missing")));

    DiffResult result = Execute();

    EXPECT_EQ(result.status, RolloutStatus::kCompleted);
    EXPECT_EQ(result.eval.status, EvalStatus::kEvalError);
    EXPECT_FALSE(result.eval.is_success);
    EXPECT_EQ(result.eval.error, "report missing");
}

TEST_F(RolloutExecutorTest, DisabledEvaluationIsSkipped) {
    executor_options_.evaluation_enabled = false;
    EXPECT_CALL(agent_, Run(_, _));
    EXPECT_CALL(patches_, Extract(_)).WillOnce(Return("diff\n"));
    EXPECT_CALL(evaluator_, Evaluate(_, _)).Times(0);

    DiffResult result = Execute();
    EXPECT_EQ(result.eval.status, EvalStatus::kSkipped);
    EXPECT_TRUE(std::filesystem::exists(RolloutExecutor::PredictionsPath(job_)));
}

TEST_F(RolloutExecutorTest, PredictionWriteFailurePropagatesAfterTeardown) {
    // A regular file where the evals directory should be
    testing_util::WriteText(executor_options_.evals_dir, "not a directory");
    executor_options_.evals_dir /= "nested";
    EXPECT_CALL(agent_, Run(_, _));
    EXPECT_CALL(patches_, Extract(_)).WillOnce(Return("diff\n"));
    EXPECT_CALL(evaluator_, Evaluate(_, _)).Times(0);

    SandboxManager manager(provider_, host_runner_, sandbox_options_);
    RolloutExecutor executor(manager, agent_, patches_, evaluator_, executor_options_);
    EXPECT_THROW(executor.Execute(job_, token_), PersistenceError);
    EXPECT_EQ(manager.teardown_count(), 1);
}
