#pragma once

#include <atomic>
#include <chrono>
#include <filesystem>
#include <memory>
#include <string>

#include "common/process_runner.h"
#include "concurrency_token.h"
#include "sandbox.h"
#include "sandbox_provider.h"

namespace Shardrun {

struct ShardrunConfig;

struct SandboxOptions {
    std::string image_prefix = "swebench/sweb.eval.x86_64.";
    std::string image_tag = "latest";
    std::string container_prefix = "sweb.augment.";
    std::string testbed_path = "/testbed";
    int expiry_s = 7200;
    std::chrono::milliseconds start_settle{5000};
    std::chrono::milliseconds remove_settle{10000};
    std::chrono::milliseconds image_remove_settle{5000};
    bool remove_image = false;
    std::string provision_command;

    static SandboxOptions FromConfig(const ShardrunConfig& config);
};

class SandboxManager;

/**
 * Scoped ownership of an acquired sandbox. Whatever path the rollout takes
 * out of its scope, the sandbox is released exactly once.
 */
class SandboxLease {
public:
    SandboxLease() = default;
    SandboxLease(SandboxManager* manager, std::unique_ptr<Sandbox> sandbox);
    ~SandboxLease();

    SandboxLease(SandboxLease&& other) noexcept;
    SandboxLease& operator=(SandboxLease&& other) noexcept;
    SandboxLease(const SandboxLease&) = delete;
    SandboxLease& operator=(const SandboxLease&) = delete;

    Sandbox* get() const { return sandbox_.get(); }
    Sandbox* operator->() const { return sandbox_.get(); }
    explicit operator bool() const { return sandbox_ != nullptr; }

    // Tears the sandbox down now instead of at scope exit.
    void Release();

private:
    SandboxManager* manager_ = nullptr;
    std::unique_ptr<Sandbox> sandbox_;
};

/**
 * Drives the sandbox lifecycle against an ISandboxProvider:
 *   Acquire     -> provision (serialized), pull and start (bounded by the token)
 *   Materialize -> copy the container's working tree to a host workspace
 *   Release     -> stop, settle, remove, optionally remove image
 *
 * Stateless apart from counters, so one manager serves every worker.
 */
class SandboxManager {
public:
    SandboxManager(ISandboxProvider& provider, ProcessRunner& host_runner, SandboxOptions options);

    // "<prefix><id with '__' replaced by '_1776_'>:<tag>", lowercased.
    std::string ResolveImage(const std::string& problem_id) const;

    // "<container_prefix><problem_id>_<8 random hex chars>"
    std::string ContainerName(const std::string& problem_id) const;

    /**
     * Provisions, pulls and starts a container for `problem_id`.
     * @param provision_dir substituted for "{workspace}" in the provisioning command
     * @throws SandboxAcquisitionError; the partially created sandbox has
     *         already been torn down when this throws.
     */
    SandboxLease Acquire(const std::string& problem_id, ConcurrencyToken& token,
                         const std::filesystem::path& provision_dir = {});

    /**
     * Replaces `workspace` with a copy of the container's working tree and
     * checks that the copy is a version-controlled tree.
     * @throws SandboxAcquisitionError if the copy fails
     */
    void Materialize(Sandbox& sandbox, const std::filesystem::path& workspace);

    // Idempotent and never throws; teardown failures are logged.
    void Release(Sandbox& sandbox);

    const SandboxOptions& options() const { return options_; }
    int teardown_count() const { return teardown_count_.load(); }

private:
    void RunProvisioning(const std::string& problem_id, const std::filesystem::path& provision_dir);
    void Settle(std::chrono::milliseconds delay) const;

    ISandboxProvider& provider_;
    ProcessRunner& host_runner_;
    SandboxOptions options_;
    std::atomic<int> teardown_count_{0};
};

} // namespace Shardrun
