#pragma once

#include <map>
#include <string>
#include <vector>

#include "common/process_runner.h"

namespace Shardrun {

struct ContainerSpec {
    std::string image;
    // Unique per rollout
    std::string name;
    std::vector<std::string> command;
    std::map<std::string, std::string> labels;
};

/**
 * Interface to the container daemon.
 *
 * Acquisition-side operations (pull, run, copy) throw SandboxAcquisitionError.
 * Teardown-side operations (stop, remove, remove image) report failure through
 * their return value; callers log and carry on.
 */
class ISandboxProvider {
public:
    virtual ~ISandboxProvider() = default;

    virtual void PullImage(const std::string& image) = 0;

    // Starts detached; returns the container id.
    virtual std::string RunContainer(const ContainerSpec& spec) = 0;

    virtual ProcessResult Exec(const std::string& container, const std::vector<std::string>& command) = 0;

    // Copies container_path out of the container into host_dir.
    virtual void CopyOut(const std::string& container, const std::string& container_path,
                         const std::string& host_dir) = 0;

    // Quiet lookup by name or id; never throws.
    virtual bool ContainerExists(const std::string& container) = 0;

    virtual bool StopContainer(const std::string& container) = 0;
    virtual bool RemoveContainer(const std::string& container) = 0;
    virtual bool RemoveImage(const std::string& image) = 0;
};

} // namespace Shardrun
