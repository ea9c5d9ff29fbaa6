// RAII owner of a socket descriptor.
// Closes on scope exit; Shutdown() interrupts blocked readers without
// releasing the descriptor number while other threads may still use it.
#ifndef XTSIM_SRC_COMMON_SCOPED_FD_H_
#define XTSIM_SRC_COMMON_SCOPED_FD_H_

#include <sys/socket.h>
#include <unistd.h>

namespace XtSim {

class ScopedFd {
public:
	ScopedFd() = default;
	explicit ScopedFd(int fd) : fd_(fd) {}

	~ScopedFd() { Reset(); }

	ScopedFd(const ScopedFd&) = delete;
	ScopedFd& operator=(const ScopedFd&) = delete;

	ScopedFd(ScopedFd&& o) noexcept : fd_(o.fd_) { o.fd_ = -1; }
	ScopedFd& operator=(ScopedFd&& o) noexcept {
		if (this != &o) {
			Reset(o.fd_);
			o.fd_ = -1;
		}
		return *this;
	}

	int get() const { return fd_; }
	bool valid() const { return fd_ >= 0; }

	// Close the current descriptor and adopt fd.
	void Reset(int fd = -1) {
		if (fd_ >= 0) {
			::close(fd_);
		}
		fd_ = fd;
	}

	// Wake up any poll()/recv() on the descriptor; both directions end.
	void Shutdown() {
		if (fd_ >= 0) {
			::shutdown(fd_, SHUT_RDWR);
		}
	}

private:
	int fd_ = -1;
};

}  // namespace XtSim

#endif  // XTSIM_SRC_COMMON_SCOPED_FD_H_
