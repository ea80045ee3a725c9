#pragma once

#include <filesystem>
#include <memory>
#include <string>

#include "rollout_types.h"

namespace Shardrun {

class ConcurrencyToken;
class Sandbox;

/**
 * Interface for invoking the external agent on one prepared workspace
 */
class IAgentRunner {
public:
    virtual ~IAgentRunner() = default;

    // Throws AgentExecutionError on spawn failure, non-zero exit or deadline.
    virtual void Run(const RolloutJob& job, const Sandbox& sandbox) = 0;
};

/**
 * Interface for computing a workspace's patch against its initial commit
 */
class IPatchExtractor {
public:
    virtual ~IPatchExtractor() = default;

    // Throws std::runtime_error if the patch cannot be computed.
    virtual std::string Extract(const std::filesystem::path& workspace) = 0;
};

/**
 * Interface for scoring one rollout's predictions file
 */
class IEvaluator {
public:
    virtual ~IEvaluator() = default;

    // Throws EvaluationError when no verdict can be produced.
    virtual bool Evaluate(const RolloutJob& job, const std::filesystem::path& predictions_path) = 0;
};

/**
 * Interface for running one rollout end to end
 */
class IRolloutExecutor {
public:
    virtual ~IRolloutExecutor() = default;

    // `token` is shared by every rollout of the job's problem.
    // Never throws for sandbox, agent, patch or evaluation failures;
    // those become the returned DiffResult's status. PersistenceError propagates.
    virtual DiffResult Execute(const RolloutJob& job, const std::shared_ptr<ConcurrencyToken>& token) = 0;
};

} // namespace Shardrun
