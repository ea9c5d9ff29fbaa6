#ifndef XTSIM_SRC_WIRE_FRAME_H_
#define XTSIM_SRC_WIRE_FRAME_H_

#include <cstddef>
#include <cstdint>
#include <string>

#include "common/config.h"

namespace XtSim {
namespace wire {

// Every frame is a 4-byte big-endian body length followed by the body.
static constexpr size_t kFrameHeaderSize = 4;

std::string EncodeFrame(const std::string& body);

uint32_t DecodeFrameLength(const uint8_t header[kFrameHeaderSize]);

/**
 * Writes a whole frame to fd, looping over partial writes and EINTR.
 * Uses MSG_NOSIGNAL so a closed peer surfaces as EPIPE, not SIGPIPE.
 * @return false on a socket error (logged)
 */
bool WriteFrame(int fd, const std::string& body);

/**
 * Incremental reader of length-prefixed frames from a stream socket.
 * Partial header or body bytes survive a timeout, so a caller may return to
 * check its stop flag between reads without losing stream position.
 */
class FrameReader {
	public:
		enum class Status {
			kFrame,      // *frame holds one complete body
			kTimeout,    // no bytes became readable within the timeout
			kClosed,     // orderly shutdown by the peer (zero-byte read)
			kError,      // socket error; errno is logged
			kOversized,  // declared length above the limit; stream cannot be resynced
		};

		explicit FrameReader(size_t max_frame_bytes = kDefaultMaxFrameBytes)
			: max_frame_bytes_(max_frame_bytes) {}

		Status ReadFrame(int fd, int timeout_ms, std::string* frame);

		// Bytes of the current frame received so far, header included.
		size_t buffered() const { return header_filled_ + body_filled_; }

	private:
		void Reset();

		size_t max_frame_bytes_;
		uint8_t header_[kFrameHeaderSize];
		size_t header_filled_ = 0;
		std::string body_;
		size_t body_filled_ = 0;
};

const char* FrameStatusName(FrameReader::Status status);

}  // namespace wire
}  // namespace XtSim

#endif  // XTSIM_SRC_WIRE_FRAME_H_
