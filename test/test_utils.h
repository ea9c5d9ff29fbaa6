#ifndef XTSIM_TEST_TEST_UTILS_H_
#define XTSIM_TEST_TEST_UTILS_H_

#include <atomic>
#include <chrono>
#include <functional>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include "absl/synchronization/mutex.h"

#include "../src/common/scoped_fd.h"
#include "../src/participant/participant.h"
#include "../src/wire/frame.h"
#include "../src/wire/message.h"

namespace XtSim {
namespace test_utils {

// Returns {participant end, coordinator end} of a connected stream pair.
std::pair<int, int> MakeSocketPair();

// Participant timings short enough for unit tests.
ParticipantOptions FastParticipantOptions(const std::string& client_id,
		const std::string& chain_id, VoteStrategy strategy);

// Polls pred every 10ms until it holds or timeout elapses.
bool WaitUntil(const std::function<bool()>& pred, std::chrono::milliseconds timeout);

/**
 * The coordinator end of one connection in a unit test.
 */
class TestPeer {
	public:
		explicit TestPeer(int fd) : fd_(fd) {}

		void Send(const Message& msg);
		void SendRaw(const std::string& bytes);

		// false on timeout, close or undecodable frame
		bool Receive(Message* msg, std::chrono::milliseconds timeout);

		int fd() const { return fd_.get(); }
		void Close() { fd_.Reset(); }

	private:
		ScopedFd fd_;
		wire::FrameReader reader_;
};

/**
 * Minimal stand-in for the shared publisher on a loopback port: records every
 * inbound message and rebroadcasts each XTRequest to all other connections.
 */
class FakeCoordinator {
	public:
		struct Received {
			size_t connection;
			Message msg;
		};

		FakeCoordinator();
		~FakeCoordinator();

		int port() const { return port_; }
		size_t NumConnections();

		// Sends msg on every connection except exclude.
		void Broadcast(const Message& msg, size_t exclude = static_cast<size_t>(-1));

		std::vector<Received> Messages();
		size_t CountOf(PayloadType type);
		bool WaitForCount(PayloadType type, size_t count, std::chrono::milliseconds timeout);

	private:
		void AcceptLoop();
		void ReadLoop(size_t connection, int fd);

		ScopedFd listen_fd_;
		int port_ = 0;
		std::atomic<bool> stop_{false};
		std::thread accept_thread_;

		absl::Mutex mutex_;
		std::vector<int> connections_ ABSL_GUARDED_BY(mutex_);
		std::vector<std::thread> readers_ ABSL_GUARDED_BY(mutex_);
		std::vector<Received> received_ ABSL_GUARDED_BY(mutex_);
};

}  // namespace test_utils
}  // namespace XtSim

#endif  // XTSIM_TEST_TEST_UTILS_H_
