#pragma once

#include <chrono>

#include "common/process_runner.h"
#include "interfaces.h"

namespace Shardrun {

/**
 * Stages everything in the workspace and diffs it against HEAD, the empty
 * baseline commit made when the sandbox started. Untracked files the agent
 * created are part of the patch; mode-only changes are not.
 */
class GitPatchExtractor : public IPatchExtractor {
public:
    explicit GitPatchExtractor(ProcessRunner& runner,
                               std::chrono::seconds timeout = std::chrono::seconds(300));

    std::string Extract(const std::filesystem::path& workspace) override;

private:
    ProcessResult Git(const std::filesystem::path& workspace, std::vector<std::string> args);

    ProcessRunner& runner_;
    std::chrono::seconds timeout_;
};

} // namespace Shardrun
