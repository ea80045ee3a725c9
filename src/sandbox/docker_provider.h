#pragma once

#include <chrono>
#include <string>
#include <vector>

#include "common/process_runner.h"
#include "sandbox_provider.h"

namespace Shardrun {

/**
 * ISandboxProvider backed by the docker CLI. Every call is a separate
 * `docker ...` process with a bounded timeout, so a wedged daemon can stall a
 * rollout but never hang it forever.
 */
class DockerCliProvider : public ISandboxProvider {
public:
    DockerCliProvider(ProcessRunner& runner, std::string docker_binary,
                      std::chrono::seconds call_timeout);

    void PullImage(const std::string& image) override;
    std::string RunContainer(const ContainerSpec& spec) override;
    ProcessResult Exec(const std::string& container, const std::vector<std::string>& command) override;
    void CopyOut(const std::string& container, const std::string& container_path,
                 const std::string& host_dir) override;
    bool ContainerExists(const std::string& container) override;
    bool StopContainer(const std::string& container) override;
    bool RemoveContainer(const std::string& container) override;
    bool RemoveImage(const std::string& image) override;

private:
    ProcessResult Docker(std::vector<std::string> args);

    ProcessRunner& runner_;
    std::string docker_binary_;
    std::chrono::seconds call_timeout_;
};

} // namespace Shardrun
