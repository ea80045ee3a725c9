#pragma once

#include <string>
#include <vector>

namespace Shardrun {

/**
 * Lifecycle of one container-backed sandbox.
 *
 *   CREATED -> PULLING -> STARTING -> COPYING -> VERIFIED -> RUNNING -> STOPPING -> REMOVED
 *
 * FAILED is reachable from every state before STOPPING and always leads to
 * STOPPING (best-effort teardown). STARTING -> STOPPING is allowed for a
 * sandbox that was started but never materialized.
 */
enum class SandboxState {
    kCreated,
    kPulling,
    kStarting,
    kCopying,
    kVerified,
    kRunning,
    kStopping,
    kRemoved,
    kFailed,
};

const char* SandboxStateName(SandboxState state);

bool IsTransitionAllowed(SandboxState from, SandboxState to);

/**
 * One ephemeral isolated execution environment, bound 1:1 to a rollout.
 * Not thread-safe: a sandbox is driven by the single worker that owns it.
 */
class Sandbox {
public:
    Sandbox(std::string problem_id, std::string image, std::string name);

    const std::string& problem_id() const { return problem_id_; }
    const std::string& image() const { return image_; }
    const std::string& name() const { return name_; }

    // Container id once started; empty before.
    const std::string& container_id() const { return container_id_; }
    void set_container_id(std::string id) { container_id_ = std::move(id); }

    // Reference the daemon accepts for stop/rm: the id if known, else the name.
    const std::string& handle() const { return container_id_.empty() ? name_ : container_id_; }

    SandboxState state() const { return state_; }

    // Moves to `to`. Returns false (and logs) if the transition is illegal.
    bool TransitionTo(SandboxState to);

    // Records `reason` and moves to FAILED. No-op once STOPPING or REMOVED.
    void Fail(const std::string& reason);

    const std::string& failure_reason() const { return failure_reason_; }

    // True once a start was requested; a container may exist from then on.
    bool start_requested() const { return start_requested_; }
    void mark_start_requested() { start_requested_ = true; }

    bool verified() const { return verified_; }
    void set_verified(bool v) { verified_ = v; }

    bool released() const { return state_ == SandboxState::kRemoved; }

    // Every state visited, in order; CREATED first.
    const std::vector<SandboxState>& history() const { return history_; }

private:
    std::string problem_id_;
    std::string image_;
    std::string name_;
    std::string container_id_;
    std::string failure_reason_;
    SandboxState state_ = SandboxState::kCreated;
    bool start_requested_ = false;
    bool verified_ = false;
    std::vector<SandboxState> history_;
};

} // namespace Shardrun
