#include "sandbox_manager.h"

#include <system_error>
#include <thread>

#include <glog/logging.h>
#include "absl/random/random.h"
#include "absl/strings/ascii.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_format.h"
#include "absl/strings/str_replace.h"
#include "absl/synchronization/mutex.h"

#include "common/configuration.h"
#include "common/errors.h"

namespace fs = std::filesystem;

namespace Shardrun {

SandboxOptions SandboxOptions::FromConfig(const ShardrunConfig& config) {
    SandboxOptions o;
    o.image_prefix = config.sandbox.image_prefix.get();
    o.image_tag = config.sandbox.image_tag.get();
    o.container_prefix = config.sandbox.container_prefix.get();
    o.testbed_path = config.sandbox.testbed_path.get();
    o.expiry_s = config.sandbox.expiry_s.get();
    o.start_settle = std::chrono::milliseconds(config.sandbox.start_settle_ms.get());
    o.remove_settle = std::chrono::milliseconds(config.sandbox.remove_settle_ms.get());
    o.image_remove_settle = std::chrono::milliseconds(config.sandbox.image_remove_settle_ms.get());
    o.remove_image = config.sandbox.remove_image.get();
    o.provision_command = config.sandbox.provision_command.get();
    return o;
}

// ---------------------------------------------------------------------------
// SandboxLease
// ---------------------------------------------------------------------------

SandboxLease::SandboxLease(SandboxManager* manager, std::unique_ptr<Sandbox> sandbox)
    : manager_(manager), sandbox_(std::move(sandbox)) {}

SandboxLease::~SandboxLease() {
    Release();
}

SandboxLease::SandboxLease(SandboxLease&& other) noexcept
    : manager_(other.manager_), sandbox_(std::move(other.sandbox_)) {
    other.manager_ = nullptr;
}

SandboxLease& SandboxLease::operator=(SandboxLease&& other) noexcept {
    if (this != &other) {
        Release();
        manager_ = other.manager_;
        sandbox_ = std::move(other.sandbox_);
        other.manager_ = nullptr;
    }
    return *this;
}

void SandboxLease::Release() {
    if (manager_ && sandbox_) {
        manager_->Release(*sandbox_);
    }
}

// ---------------------------------------------------------------------------
// SandboxManager
// ---------------------------------------------------------------------------

SandboxManager::SandboxManager(ISandboxProvider& provider, ProcessRunner& host_runner,
                               SandboxOptions options)
    : provider_(provider), host_runner_(host_runner), options_(std::move(options)) {}

std::string SandboxManager::ResolveImage(const std::string& problem_id) const {
    std::string encoded = absl::StrReplaceAll(problem_id, {{"__", "_1776_"}});
    return absl::AsciiStrToLower(absl::StrCat(options_.image_prefix, encoded, ":", options_.image_tag));
}

std::string SandboxManager::ContainerName(const std::string& problem_id) const {
    thread_local absl::BitGen gen;
    return absl::StrFormat("%s%s_%08x", options_.container_prefix, problem_id,
                           absl::Uniform<uint32_t>(gen));
}

void SandboxManager::Settle(std::chrono::milliseconds delay) const {
    if (delay.count() > 0) {
        std::this_thread::sleep_for(delay);
    }
}

void SandboxManager::RunProvisioning(const std::string& problem_id, const fs::path& provision_dir) {
    std::string command = absl::StrReplaceAll(options_.provision_command,
                                              {{"{workspace}", provision_dir.string()}});
    LOG(INFO) << "[" << problem_id << "] Provisioning: " << command;

    ProcessSpec spec;
    spec.argv = {"/bin/sh", "-c", command};
    ProcessResult r = host_runner_.Run(spec);
    if (!r.Succeeded()) {
        throw SandboxAcquisitionError(absl::StrCat("Provisioning for ", problem_id, " failed with exit code ",
                                                   r.exit_code, ": ", r.output));
    }
}

SandboxLease SandboxManager::Acquire(const std::string& problem_id, ConcurrencyToken& token,
                                     const fs::path& provision_dir) {
    auto sandbox = std::make_unique<Sandbox>(problem_id, ResolveImage(problem_id), ContainerName(problem_id));
    LOG(INFO) << "[" << problem_id << "] Acquiring sandbox " << sandbox->name()
              << " from " << sandbox->image();

    try {
        // Leftover from an interrupted run under the bare base name
        std::string stale = options_.container_prefix + problem_id;
        if (provider_.ContainerExists(stale)) {
            LOG(WARNING) << "[" << problem_id << "] Removing stale container " << stale;
            if (!provider_.StopContainer(stale) || !provider_.RemoveContainer(stale)) {
                LOG(WARNING) << "[" << problem_id << "] Stale container " << stale << " may still exist";
            }
        }

        if (!options_.provision_command.empty()) {
            absl::MutexLock lock(&token.provisioning_mutex());
            RunProvisioning(problem_id, provision_dir);
        }

        sandbox->TransitionTo(SandboxState::kPulling);
        {
            ConcurrencyToken::Permit permit(token);
            provider_.PullImage(sandbox->image());
        }

        sandbox->TransitionTo(SandboxState::kStarting);
        {
            ConcurrencyToken::Permit permit(token);
            ContainerSpec spec;
            spec.image = sandbox->image();
            spec.name = sandbox->name();
            spec.labels = {{"shardrun.problem_id", problem_id}};
            spec.command = {
                "bash", "-c",
                absl::StrCat("git config --global user.email a && git config --global user.name a && "
                             "git config --global --add safe.directory ", options_.testbed_path,
                             " && git commit --allow-empty -m augment && sleep ", options_.expiry_s)};
            sandbox->mark_start_requested();
            sandbox->set_container_id(provider_.RunContainer(spec));
        }
        Settle(options_.start_settle);
    } catch (const std::exception& e) {
        sandbox->Fail(e.what());
        Release(*sandbox);
        throw SandboxAcquisitionError(absl::StrCat("Failed to acquire sandbox for ", problem_id, ": ", e.what()));
    }

    LOG(INFO) << "[" << problem_id << "] Started container " << sandbox->container_id();
    return SandboxLease(this, std::move(sandbox));
}

void SandboxManager::Materialize(Sandbox& sandbox, const fs::path& workspace) {
    const std::string& problem_id = sandbox.problem_id();
    try {
        std::error_code ec;
        fs::remove_all(workspace, ec);
        if (ec) {
            throw SandboxAcquisitionError("Cannot clear workspace " + workspace.string() + ": " + ec.message());
        }
        fs::create_directories(workspace, ec);
        if (ec) {
            throw SandboxAcquisitionError("Cannot create workspace " + workspace.string() + ": " + ec.message());
        }

        sandbox.TransitionTo(SandboxState::kCopying);
        provider_.CopyOut(sandbox.handle(), options_.testbed_path + "/.", workspace.string());
    } catch (const std::exception& e) {
        sandbox.Fail(e.what());
        throw SandboxAcquisitionError(absl::StrCat("Failed to materialize workspace for ", problem_id,
                                                   ": ", e.what()));
    }

    ProcessSpec verify;
    verify.argv = {"git", "-C", workspace.string(), "rev-parse", "--git-dir"};
    ProcessResult r;
    try {
        r = host_runner_.Run(verify);
    } catch (const std::exception& e) {
        r.output = e.what();
    }
    sandbox.set_verified(r.Succeeded());
    if (!sandbox.verified()) {
        LOG(WARNING) << "[" << problem_id << "] Workspace " << workspace
                     << " is not a git working copy: " << absl::StripAsciiWhitespace(r.output);
    }

    if (VLOG_IS_ON(1)) {
        try {
            ProcessResult listing = provider_.Exec(sandbox.handle(), {"ls", "-la", options_.testbed_path});
            VLOG(1) << "[" << problem_id << "] Contents of " << options_.testbed_path << ":\n" << listing.output;
        } catch (const std::exception& e) {
            VLOG(1) << "[" << problem_id << "] Cannot list " << options_.testbed_path << ": " << e.what();
        }
    }

    sandbox.TransitionTo(SandboxState::kVerified);
    sandbox.TransitionTo(SandboxState::kRunning);
    VLOG(1) << "[" << problem_id << "] Workspace ready at " << workspace;
}

void SandboxManager::Release(Sandbox& sandbox) {
    if (sandbox.released()) {
        return;
    }
    SandboxState from = sandbox.state();
    if (from != SandboxState::kRunning && from != SandboxState::kStarting &&
        from != SandboxState::kFailed && from != SandboxState::kStopping) {
        sandbox.Fail(absl::StrCat("released while ", SandboxStateName(from)));
    }
    if (sandbox.state() != SandboxState::kStopping) {
        sandbox.TransitionTo(SandboxState::kStopping);
    }

    if (sandbox.start_requested()) {
        const std::string container = sandbox.handle();
        LOG(INFO) << "[" << sandbox.problem_id() << "] Stopping container " << container;
        try {
            if (!provider_.StopContainer(container)) {
                LOG(WARNING) << "[" << sandbox.problem_id() << "] Stop failed for " << container
                             << ", removing anyway";
            }
            Settle(options_.remove_settle);
            if (provider_.RemoveContainer(container)) {
                LOG(INFO) << "[" << sandbox.problem_id() << "] Removed container " << container;
            } else {
                LOG(ERROR) << "[" << sandbox.problem_id() << "] Container " << container << " was not removed";
            }
            if (options_.remove_image) {
                Settle(options_.image_remove_settle);
                if (!provider_.RemoveImage(sandbox.image())) {
                    LOG(WARNING) << "[" << sandbox.problem_id() << "] Image " << sandbox.image() << " was not removed";
                }
            }
        } catch (const std::exception& e) {
            LOG(ERROR) << "[" << sandbox.problem_id() << "] Teardown of " << container << " failed: " << e.what();
        }
    }

    sandbox.TransitionTo(SandboxState::kRemoved);
    teardown_count_.fetch_add(1);
}

} // namespace Shardrun
