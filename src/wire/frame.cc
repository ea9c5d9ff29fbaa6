#include "frame.h"

#include <cerrno>
#include <cstring>

#include <poll.h>
#include <sys/socket.h>

#include <glog/logging.h>

namespace XtSim {
namespace wire {

std::string EncodeFrame(const std::string& body) {
	uint32_t len = static_cast<uint32_t>(body.size());
	std::string frame;
	frame.reserve(kFrameHeaderSize + body.size());
	frame.push_back(static_cast<char>((len >> 24) & 0xFF));
	frame.push_back(static_cast<char>((len >> 16) & 0xFF));
	frame.push_back(static_cast<char>((len >> 8) & 0xFF));
	frame.push_back(static_cast<char>(len & 0xFF));
	frame.append(body);
	return frame;
}

uint32_t DecodeFrameLength(const uint8_t header[kFrameHeaderSize]) {
	return (static_cast<uint32_t>(header[0]) << 24) |
		(static_cast<uint32_t>(header[1]) << 16) |
		(static_cast<uint32_t>(header[2]) << 8) |
		static_cast<uint32_t>(header[3]);
}

bool WriteFrame(int fd, const std::string& body) {
	// Prefix and body in one buffer so a frame never interleaves with another
	const std::string frame = EncodeFrame(body);
	size_t sent = 0;
	while (sent < frame.size()) {
		ssize_t n = send(fd, frame.data() + sent, frame.size() - sent, MSG_NOSIGNAL);
		if (n < 0) {
			if (errno == EINTR) {
				continue;
			}
			LOG(ERROR) << "send failed on fd=" << fd << " after " << sent << "/"
				<< frame.size() << " bytes: " << strerror(errno);
			return false;
		}
		sent += static_cast<size_t>(n);
	}
	VLOG(3) << "Wrote frame of " << body.size() << " bytes to fd=" << fd;
	return true;
}

void FrameReader::Reset() {
	header_filled_ = 0;
	body_.clear();
	body_filled_ = 0;
}

FrameReader::Status FrameReader::ReadFrame(int fd, int timeout_ms, std::string* frame) {
	while (true) {
		bool in_header = header_filled_ < kFrameHeaderSize;
		if (!in_header && body_filled_ == body_.size()) {
			frame->swap(body_);
			Reset();
			return Status::kFrame;
		}

		struct pollfd pfd;
		pfd.fd = fd;
		pfd.events = POLLIN;
		pfd.revents = 0;
		int ready = poll(&pfd, 1, timeout_ms);
		if (ready < 0) {
			if (errno == EINTR) {
				continue;
			}
			LOG(ERROR) << "poll failed on fd=" << fd << ": " << strerror(errno);
			return Status::kError;
		}
		if (ready == 0) {
			return Status::kTimeout;
		}

		// Readable, hung up or errored: recv reports which
		char* dst;
		size_t want;
		if (in_header) {
			dst = reinterpret_cast<char*>(header_) + header_filled_;
			want = kFrameHeaderSize - header_filled_;
		} else {
			dst = &body_[body_filled_];
			want = body_.size() - body_filled_;
		}

		ssize_t n = recv(fd, dst, want, 0);
		if (n == 0) {
			if (buffered() > 0) {
				LOG(WARNING) << "Peer closed fd=" << fd << " mid-frame with "
					<< buffered() << " bytes buffered";
			}
			Reset();
			return Status::kClosed;
		}
		if (n < 0) {
			if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK) {
				continue;
			}
			LOG(ERROR) << "recv failed on fd=" << fd << ": " << strerror(errno);
			Reset();
			return Status::kError;
		}

		if (in_header) {
			header_filled_ += static_cast<size_t>(n);
			if (header_filled_ == kFrameHeaderSize) {
				uint32_t len = DecodeFrameLength(header_);
				if (len > max_frame_bytes_) {
					LOG(ERROR) << "Frame length " << len << " exceeds limit "
						<< max_frame_bytes_ << " on fd=" << fd;
					Reset();
					return Status::kOversized;
				}
				body_.assign(len, '\0');
				body_filled_ = 0;
			}
		} else {
			body_filled_ += static_cast<size_t>(n);
		}
	}
}

const char* FrameStatusName(FrameReader::Status status) {
	switch (status) {
		case FrameReader::Status::kFrame:
			return "Frame";
		case FrameReader::Status::kTimeout:
			return "Timeout";
		case FrameReader::Status::kClosed:
			return "Closed";
		case FrameReader::Status::kError:
			return "Error";
		case FrameReader::Status::kOversized:
			return "Oversized";
	}
	return "Unknown";
}

}  // namespace wire
}  // namespace XtSim
