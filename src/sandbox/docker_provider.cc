#include "docker_provider.h"

#include <glog/logging.h>
#include "absl/strings/ascii.h"
#include "absl/strings/str_cat.h"

#include "common/errors.h"

namespace Shardrun {

namespace {

std::string Describe(const ProcessResult& r) {
    if (r.timed_out) {
        return "timed out";
    }
    return absl::StrCat("exit code ", r.exit_code, ": ", absl::StripAsciiWhitespace(r.output));
}

} // namespace

DockerCliProvider::DockerCliProvider(ProcessRunner& runner, std::string docker_binary,
                                     std::chrono::seconds call_timeout)
    : runner_(runner), docker_binary_(std::move(docker_binary)), call_timeout_(call_timeout) {}

ProcessResult DockerCliProvider::Docker(std::vector<std::string> args) {
    ProcessSpec spec;
    spec.argv.reserve(args.size() + 1);
    spec.argv.push_back(docker_binary_);
    for (auto& a : args) {
        spec.argv.push_back(std::move(a));
    }
    spec.timeout = call_timeout_;
    try {
        return runner_.Run(spec);
    } catch (const std::exception& e) {
        ProcessResult failed;
        failed.exit_code = -1;
        failed.output = e.what();
        return failed;
    }
}

void DockerCliProvider::PullImage(const std::string& image) {
    LOG(INFO) << "Pulling image " << image;
    ProcessResult r = Docker({"pull", "--quiet", image});
    if (!r.Succeeded()) {
        throw SandboxAcquisitionError("docker pull " + image + " failed: " + Describe(r));
    }
}

std::string DockerCliProvider::RunContainer(const ContainerSpec& spec) {
    std::vector<std::string> args = {"run", "--detach", "--name", spec.name};
    for (const auto& [key, value] : spec.labels) {
        args.push_back("--label");
        args.push_back(key + "=" + value);
    }
    args.push_back(spec.image);
    args.insert(args.end(), spec.command.begin(), spec.command.end());

    ProcessResult r = Docker(std::move(args));
    if (!r.Succeeded()) {
        throw SandboxAcquisitionError("docker run " + spec.image + " failed: " + Describe(r));
    }
    // `docker run --detach` prints the full container id as its last line.
    std::string out(absl::StripAsciiWhitespace(r.output));
    size_t nl = out.find_last_of('\n');
    std::string id = nl == std::string::npos ? out : out.substr(nl + 1);
    if (id.empty()) {
        throw SandboxAcquisitionError("docker run " + spec.image + " returned no container id");
    }
    return id;
}

ProcessResult DockerCliProvider::Exec(const std::string& container,
                                      const std::vector<std::string>& command) {
    std::vector<std::string> args = {"exec", container};
    args.insert(args.end(), command.begin(), command.end());
    return Docker(std::move(args));
}

void DockerCliProvider::CopyOut(const std::string& container, const std::string& container_path,
                                const std::string& host_dir) {
    ProcessResult r = Docker({"cp", container + ":" + container_path, host_dir});
    if (!r.Succeeded()) {
        throw SandboxAcquisitionError("docker cp from " + container + " failed: " + Describe(r));
    }
}

bool DockerCliProvider::ContainerExists(const std::string& container) {
    return Docker({"container", "inspect", "--format", "{{.Id}}", container}).Succeeded();
}

bool DockerCliProvider::StopContainer(const std::string& container) {
    ProcessResult r = Docker({"stop", container});
    if (!r.Succeeded()) {
        LOG(WARNING) << "Failed to stop container " << container << ": " << Describe(r);
        return false;
    }
    return true;
}

bool DockerCliProvider::RemoveContainer(const std::string& container) {
    ProcessResult r = Docker({"rm", "--force", container});
    if (!r.Succeeded()) {
        LOG(WARNING) << "Failed to remove container " << container << ": " << Describe(r);
        return false;
    }
    return true;
}

bool DockerCliProvider::RemoveImage(const std::string& image) {
    ProcessResult r = Docker({"rmi", "--force", image});
    if (!r.Succeeded()) {
        LOG(WARNING) << "Failed to remove image " << image << ": " << Describe(r);
        return false;
    }
    LOG(INFO) << "Removed image " << image;
    return true;
}

} // namespace Shardrun
