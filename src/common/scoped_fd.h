// Owning file descriptor for the process runner and atomic writers: pipe
// ends, log files, /dev/null, temp files. Closed on scope exit, including
// the early-return paths of a failed fork/exec.
#ifndef SHARDRUN_SRC_COMMON_SCOPED_FD_H_
#define SHARDRUN_SRC_COMMON_SCOPED_FD_H_

#include <cerrno>
#include <string>
#include <system_error>
#include <utility>

#include <fcntl.h>
#include <sys/types.h>
#include <unistd.h>

namespace Shardrun {

class ScopedFd {
public:
	ScopedFd() = default;
	explicit ScopedFd(int fd) : fd_(fd) {}
	~ScopedFd() { reset(); }

	ScopedFd(const ScopedFd&) = delete;
	ScopedFd& operator=(const ScopedFd&) = delete;

	ScopedFd(ScopedFd&& other) noexcept : fd_(other.release()) {}
	ScopedFd& operator=(ScopedFd&& other) noexcept {
		if (this != &other) {
			reset(other.release());
		}
		return *this;
	}

	// Close-on-exec open. Returns an invalid fd on failure; errno is preserved.
	static ScopedFd Open(const std::string& path, int flags, mode_t mode = 0644) {
		return ScopedFd(::open(path.c_str(), flags | O_CLOEXEC, mode));
	}

	// Close-on-exec pipe as {read end, write end}. Throws std::system_error.
	static std::pair<ScopedFd, ScopedFd> Pipe() {
		int fds[2];
		if (::pipe2(fds, O_CLOEXEC) != 0) {
			throw std::system_error(errno, std::generic_category(), "pipe2");
		}
		return {ScopedFd(fds[0]), ScopedFd(fds[1])};
	}

	int get() const { return fd_; }
	bool valid() const { return fd_ >= 0; }

	// Closes the held fd (if any) and takes ownership of new_fd.
	void reset(int new_fd = -1) {
		if (fd_ >= 0 && fd_ != new_fd) {
			::close(fd_);
		}
		fd_ = new_fd;
	}

	// Caller takes over closing.
	int release() { return std::exchange(fd_, -1); }

private:
	int fd_ = -1;
};

} // namespace Shardrun

#endif  // SHARDRUN_SRC_COMMON_SCOPED_FD_H_
