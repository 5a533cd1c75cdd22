// Owned file descriptor for the pipes and /dev/null handles of a child process.
// Closed on scope exit, including every early return of the fork/exec path.
#ifndef PRSYNC_SRC_COMMON_SCOPED_FD_H_
#define PRSYNC_SRC_COMMON_SCOPED_FD_H_

#include <fcntl.h>
#include <unistd.h>

namespace Prsync {

struct ScopedFd {
	int fd = -1;

	ScopedFd() = default;
	explicit ScopedFd(int f) : fd(f) {}

	~ScopedFd() { reset(); }

	ScopedFd(const ScopedFd&) = delete;
	ScopedFd& operator=(const ScopedFd&) = delete;

	ScopedFd(ScopedFd&& o) noexcept : fd(o.fd) { o.fd = -1; }
	ScopedFd& operator=(ScopedFd&& o) noexcept {
		if (this != &o) {
			reset();
			fd = o.fd;
			o.fd = -1;
		}
		return *this;
	}

	int get() const { return fd; }
	bool valid() const { return fd >= 0; }

	void reset() {
		if (fd >= 0) {
			::close(fd);
			fd = -1;
		}
	}

};

// pipe2(O_CLOEXEC) into two owned ends. Returns false with errno set on failure.
inline bool MakePipe(ScopedFd& read_end, ScopedFd& write_end) {
	int fds[2];
	if (::pipe2(fds, O_CLOEXEC) != 0) {
		return false;
	}
	read_end = ScopedFd(fds[0]);
	write_end = ScopedFd(fds[1]);
	return true;
}

} // namespace Prsync

#endif  // PRSYNC_SRC_COMMON_SCOPED_FD_H_
