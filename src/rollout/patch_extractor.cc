#include "patch_extractor.h"

#include <stdexcept>

#include <glog/logging.h>
#include "absl/strings/str_cat.h"

namespace Shardrun {

GitPatchExtractor::GitPatchExtractor(ProcessRunner& runner, std::chrono::seconds timeout)
    : runner_(runner), timeout_(timeout) {}

ProcessResult GitPatchExtractor::Git(const std::filesystem::path& workspace, std::vector<std::string> args) {
    ProcessSpec spec;
    spec.argv = {"git", "-c", "core.fileMode=false", "-c", "safe.directory=*", "-C", workspace.string()};
    spec.argv.insert(spec.argv.end(), args.begin(), args.end());
    spec.timeout = timeout_;
    return runner_.Run(spec);
}

std::string GitPatchExtractor::Extract(const std::filesystem::path& workspace) {
    ProcessResult add = Git(workspace, {"add", "--all"});
    if (!add.Succeeded()) {
        throw std::runtime_error(absl::StrCat("git add in ", workspace.string(), " failed (exit ",
                                              add.exit_code, "): ", add.output));
    }
    ProcessResult diff = Git(workspace, {"diff", "--cached", "--no-color", "HEAD"});
    if (!diff.Succeeded()) {
        throw std::runtime_error(absl::StrCat("git diff in ", workspace.string(), " failed (exit ",
                                              diff.exit_code, "): ", diff.output));
    }
    VLOG(1) << "Extracted patch of " << diff.output.size() << " bytes from " << workspace;
    return diff.output;
}

} // namespace Shardrun
