#pragma once

#include <stdexcept>
#include <string>

namespace Shardrun {

/**
 * Base class of every error the orchestrator raises on purpose.
 * Per-rollout errors are caught at the narrowest scope and turned into recorded
 * outcomes; only ConfigurationError and PersistenceError terminate a run.
 */
class ShardrunError : public std::runtime_error {
public:
    explicit ShardrunError(const std::string& what) : std::runtime_error(what) {}
};

// Invalid shard / example-count / configuration values. Fatal before work starts.
class ConfigurationError : public ShardrunError {
public:
    explicit ConfigurationError(const std::string& what) : ShardrunError(what) {}
};

// Image pull, container start or working-tree copy failed.
class SandboxAcquisitionError : public ShardrunError {
public:
    explicit SandboxAcquisitionError(const std::string& what) : ShardrunError(what) {}
};

// The external agent process could not be spawned, failed, or ran past its deadline.
class AgentExecutionError : public ShardrunError {
public:
    explicit AgentExecutionError(const std::string& what) : ShardrunError(what) {}
};

// The evaluation harness could not produce a verdict.
class EvaluationError : public ShardrunError {
public:
    explicit EvaluationError(const std::string& what) : ShardrunError(what) {}
};

// A durable write (checkpoint, predictions record) failed.
class PersistenceError : public ShardrunError {
public:
    explicit PersistenceError(const std::string& what) : ShardrunError(what) {}
};

} // namespace Shardrun
