// RAII owner for raw file descriptors (pipe ends, pidfd) until they are
// handed over to an asio descriptor or closed.
#ifndef CLIPBRIDGE_COMMON_SCOPED_FD_H_
#define CLIPBRIDGE_COMMON_SCOPED_FD_H_

#include <unistd.h>

namespace ClipBridge {

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
			reset(o.fd);
			o.fd = -1;
		}
		return *this;
	}

	int get() const { return fd; }
	bool valid() const { return fd >= 0; }

	// Close the current descriptor (if any) and take ownership of f.
	void reset(int f = -1) {
		if (fd >= 0 && fd != f) {
			::close(fd);
		}
		fd = f;
	}

	// Release ownership; caller must close.
	int release() {
		int f = fd;
		fd = -1;
		return f;
	}
};

/// Pipe as a pair of owned ends.
struct ScopedPipe {
	ScopedFd read_end;
	ScopedFd write_end;
};

} // namespace ClipBridge

#endif  // CLIPBRIDGE_COMMON_SCOPED_FD_H_
