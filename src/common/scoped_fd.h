// Owned file descriptor for sampler log files; closed on scope exit.
#ifndef DYNAMICNEST_SRC_COMMON_SCOPED_FD_H_
#define DYNAMICNEST_SRC_COMMON_SCOPED_FD_H_

#include <fcntl.h>
#include <unistd.h>

#include <string>

namespace DynamicNest {

class ScopedFd {
public:
	ScopedFd() = default;
	explicit ScopedFd(int fd) : fd_(fd) {}

	// Truncating, close-on-exec write handle; invalid on failure (errno set).
	static ScopedFd OpenForWrite(const std::string& path) {
		return ScopedFd(::open(path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644));
	}

	~ScopedFd() { Reset(); }

	ScopedFd(const ScopedFd&) = delete;
	ScopedFd& operator=(const ScopedFd&) = delete;

	ScopedFd(ScopedFd&& other) noexcept : fd_(other.fd_) { other.fd_ = -1; }
	ScopedFd& operator=(ScopedFd&& other) noexcept {
		if (this != &other) {
			Reset();
			fd_ = other.fd_;
			other.fd_ = -1;
		}
		return *this;
	}

	// Points target_fd (e.g. STDOUT_FILENO) at this file. The duplicate
	// does not inherit close-on-exec.
	bool RedirectTo(int target_fd) const {
		return valid() && ::dup2(fd_, target_fd) == target_fd;
	}

	int get() const { return fd_; }
	bool valid() const { return fd_ >= 0; }

private:
	void Reset() {
		if (fd_ >= 0) {
			::close(fd_);
			fd_ = -1;
		}
	}

	int fd_ = -1;
};

} // namespace DynamicNest

#endif  // DYNAMICNEST_SRC_COMMON_SCOPED_FD_H_
