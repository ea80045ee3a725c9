#include "process_runner.h"

#include <cerrno>
#include <csignal>
#include <cstring>
#include <stdexcept>
#include <system_error>
#include <thread>
#include <tuple>

#include <fcntl.h>
#include <poll.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <glog/logging.h>

#include "scoped_fd.h"

extern char** environ;

namespace Shardrun {

namespace {

constexpr int kPollIntervalMs = 100;

std::vector<std::string> BuildEnvironment(const ProcessSpec& spec) {
    std::map<std::string, std::string> merged;
    if (spec.inherit_env && environ != nullptr) {
        for (char** entry = environ; *entry != nullptr; ++entry) {
            const char* eq = std::strchr(*entry, '=');
            if (eq == nullptr) continue;
            merged[std::string(*entry, eq - *entry)] = std::string(eq + 1);
        }
    }
    for (const auto& [key, value] : spec.env) {
        merged[key] = value;
    }

    std::vector<std::string> out;
    out.reserve(merged.size());
    for (const auto& [key, value] : merged) {
        out.push_back(key + "=" + value);
    }
    return out;
}

std::vector<char*> ToCharPointers(std::vector<std::string>& strings) {
    std::vector<char*> ptrs;
    ptrs.reserve(strings.size() + 1);
    for (auto& s : strings) {
        ptrs.push_back(s.data());
    }
    ptrs.push_back(nullptr);
    return ptrs;
}

int DecodeExitStatus(int status) {
    if (WIFEXITED(status)) return WEXITSTATUS(status);
    if (WIFSIGNALED(status)) return 128 + WTERMSIG(status);
    return -1;
}

// Reads whatever is available on fd. Returns false on EOF or a hard error.
bool DrainOnce(int fd, std::string& output) {
    char buf[4096];
    ssize_t n = ::read(fd, buf, sizeof(buf));
    if (n > 0) {
        output.append(buf, static_cast<size_t>(n));
        return true;
    }
    if (n < 0 && (errno == EINTR || errno == EAGAIN)) {
        return true;
    }
    return false;
}

} // namespace

ProcessResult SubprocessRunner::Run(const ProcessSpec& spec) {
    if (spec.argv.empty()) {
        throw std::invalid_argument("ProcessSpec::argv must not be empty");
    }

    const bool capture = spec.output_path.empty();

    ScopedFd read_end;
    ScopedFd write_end;
    ScopedFd log_fd;
    if (capture) {
        std::tie(read_end, write_end) = ScopedFd::Pipe();
    } else {
        log_fd = ScopedFd::Open(spec.output_path, O_WRONLY | O_CREAT | O_APPEND);
        if (!log_fd.valid()) {
            throw std::system_error(errno, std::generic_category(),
                                    "open " + spec.output_path);
        }
    }
    ScopedFd dev_null = ScopedFd::Open("/dev/null", O_RDONLY);

    // Everything the child touches is prepared before fork.
    std::vector<std::string> argv_strings = spec.argv;
    std::vector<char*> argv = ToCharPointers(argv_strings);
    std::vector<std::string> env_strings = BuildEnvironment(spec);
    std::vector<char*> envp = ToCharPointers(env_strings);
    const int out_fd = capture ? write_end.get() : log_fd.get();

    VLOG(2) << "Spawning: " << FormatCommand(spec.argv);
    const auto start = std::chrono::steady_clock::now();

    pid_t pid = ::fork();
    if (pid < 0) {
        throw std::system_error(errno, std::generic_category(), "fork");
    }

    if (pid == 0) {
        ::setpgid(0, 0);
        if (dev_null.valid()) ::dup2(dev_null.get(), STDIN_FILENO);
        ::dup2(out_fd, STDOUT_FILENO);
        ::dup2(out_fd, STDERR_FILENO);
        if (!spec.working_dir.empty() && ::chdir(spec.working_dir.c_str()) != 0) {
            ::_exit(126);
        }
        ::execvpe(argv[0], argv.data(), envp.data());
        ::_exit(127);
    }

    // Both sides call setpgid so the group exists before we could ever signal it.
    ::setpgid(pid, pid);
    write_end.reset();
    log_fd.reset();

    ProcessResult result;
    const bool has_deadline = spec.timeout.count() > 0;
    const auto deadline = start + spec.timeout;
    int status = 0;
    bool exited = false;

    while (!exited) {
        if (read_end.valid()) {
            struct pollfd pfd{read_end.get(), POLLIN, 0};
            int rc = ::poll(&pfd, 1, kPollIntervalMs);
            if (rc > 0 && !DrainOnce(read_end.get(), result.output)) {
                read_end.reset();
            }
        } else {
            std::this_thread::sleep_for(std::chrono::milliseconds(kPollIntervalMs));
        }

        pid_t w = ::waitpid(pid, &status, WNOHANG);
        if (w == pid) {
            exited = true;
            result.exit_code = DecodeExitStatus(status);
            break;
        }
        if (w < 0 && errno != EINTR) {
            LOG(ERROR) << "waitpid(" << pid << ") failed: " << strerror(errno);
            break;
        }

        if (has_deadline && std::chrono::steady_clock::now() >= deadline) {
            LOG(WARNING) << "Deadline of " << spec.timeout.count() << "ms expired, killing "
                         << FormatCommand(spec.argv);
            ::kill(-pid, SIGKILL);
            ::waitpid(pid, &status, 0);
            exited = true;
            result.timed_out = true;
            result.exit_code = -1;
        }
    }

    // Collect what the child wrote right before exiting. Grandchildren that
    // inherited the pipe must not keep us here, so only take what is ready.
    while (read_end.valid()) {
        struct pollfd pfd{read_end.get(), POLLIN, 0};
        if (::poll(&pfd, 1, 0) <= 0 || !DrainOnce(read_end.get(), result.output)) {
            break;
        }
    }

    result.elapsed_seconds = std::chrono::duration<double>(
        std::chrono::steady_clock::now() - start).count();
    VLOG(2) << "Exited with " << result.exit_code << " after " << result.elapsed_seconds
            << "s: " << FormatCommand(spec.argv);
    return result;
}

std::string FormatCommand(const std::vector<std::string>& argv, size_t max_arg_len) {
    std::string out;
    for (const auto& arg : argv) {
        if (!out.empty()) out += ' ';
        if (arg.size() > max_arg_len) {
            out += arg.substr(0, max_arg_len);
            out += "...";
        } else {
            out += arg;
        }
    }
    return out;
}

} // namespace Shardrun
