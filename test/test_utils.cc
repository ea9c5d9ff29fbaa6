#include "test_utils.h"

#include <cerrno>
#include <cstring>
#include <stdexcept>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <glog/logging.h>

#include "../src/wire/codec.h"

namespace XtSim {
namespace test_utils {

namespace {

constexpr int kPollMs = 50;

}  // namespace

std::pair<int, int> MakeSocketPair() {
	int fds[2];
	if (socketpair(AF_UNIX, SOCK_STREAM, 0, fds) < 0) {
		throw std::runtime_error(std::string("socketpair: ") + strerror(errno));
	}
	return {fds[0], fds[1]};
}

ParticipantOptions FastParticipantOptions(const std::string& client_id,
		const std::string& chain_id, VoteStrategy strategy) {
	using std::chrono::milliseconds;
	ParticipantOptions options;
	options.client_id = client_id;
	options.chain_id = chain_id;
	options.strategy = strategy;
	options.vote_options.base_delay = {milliseconds(10), milliseconds(30)};
	options.vote_options.late_delay = {milliseconds(200), milliseconds(300)};
	options.vote_options.seed = 42;
	options.recv_timeout = milliseconds(50);
	options.connect_timeout = milliseconds(1000);
	options.block_delay = {milliseconds(10), milliseconds(20)};
	options.origin_delay = {milliseconds(10), milliseconds(20)};
	return options;
}

bool WaitUntil(const std::function<bool()>& pred, std::chrono::milliseconds timeout) {
	auto deadline = std::chrono::steady_clock::now() + timeout;
	while (!pred()) {
		if (std::chrono::steady_clock::now() >= deadline) {
			return false;
		}
		std::this_thread::sleep_for(std::chrono::milliseconds(10));
	}
	return true;
}

void TestPeer::Send(const Message& msg) {
	if (!wire::WriteFrame(fd_.get(), wire::EncodeMessage(msg))) {
		throw std::runtime_error("TestPeer::Send failed");
	}
}

void TestPeer::SendRaw(const std::string& bytes) {
	size_t sent = 0;
	while (sent < bytes.size()) {
		ssize_t n = send(fd_.get(), bytes.data() + sent, bytes.size() - sent, MSG_NOSIGNAL);
		if (n < 0) {
			throw std::runtime_error(std::string("TestPeer::SendRaw: ") + strerror(errno));
		}
		sent += static_cast<size_t>(n);
	}
}

bool TestPeer::Receive(Message* msg, std::chrono::milliseconds timeout) {
	std::string frame;
	auto status = reader_.ReadFrame(fd_.get(), static_cast<int>(timeout.count()), &frame);
	if (status != wire::FrameReader::Status::kFrame) {
		return false;
	}
	return wire::DecodeMessage(frame, msg) == wire::DecodeError::kOk;
}

FakeCoordinator::FakeCoordinator() {
	int fd = socket(AF_INET, SOCK_STREAM, 0);
	if (fd < 0) {
		throw std::runtime_error(std::string("socket: ") + strerror(errno));
	}
	listen_fd_.Reset(fd);

	int flag = 1;
	setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &flag, sizeof(flag));

	sockaddr_in addr;
	memset(&addr, 0, sizeof(addr));
	addr.sin_family = AF_INET;
	addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
	addr.sin_port = 0;
	if (bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0 || listen(fd, 16) < 0) {
		throw std::runtime_error(std::string("bind/listen: ") + strerror(errno));
	}
	socklen_t len = sizeof(addr);
	getsockname(fd, reinterpret_cast<sockaddr*>(&addr), &len);
	port_ = ntohs(addr.sin_port);

	accept_thread_ = std::thread(&FakeCoordinator::AcceptLoop, this);
}

FakeCoordinator::~FakeCoordinator() {
	stop_.store(true);
	accept_thread_.join();

	std::vector<std::thread> readers;
	{
		absl::MutexLock lock(&mutex_);
		readers.swap(readers_);
	}
	for (auto& t : readers) {
		t.join();
	}

	absl::MutexLock lock(&mutex_);
	for (int fd : connections_) {
		close(fd);
	}
}

void FakeCoordinator::AcceptLoop() {
	while (!stop_.load()) {
		struct pollfd pfd = {listen_fd_.get(), POLLIN, 0};
		if (poll(&pfd, 1, kPollMs) <= 0) {
			continue;
		}
		int fd = accept(listen_fd_.get(), nullptr, nullptr);
		if (fd < 0) {
			continue;
		}
		absl::MutexLock lock(&mutex_);
		size_t connection = connections_.size();
		connections_.push_back(fd);
		readers_.emplace_back(&FakeCoordinator::ReadLoop, this, connection, fd);
	}
}

void FakeCoordinator::ReadLoop(size_t connection, int fd) {
	wire::FrameReader reader;
	std::string frame;
	while (!stop_.load()) {
		auto status = reader.ReadFrame(fd, kPollMs, &frame);
		if (status == wire::FrameReader::Status::kTimeout) {
			continue;
		}
		if (status != wire::FrameReader::Status::kFrame) {
			return;
		}
		Message msg;
		if (wire::DecodeMessage(frame, &msg) != wire::DecodeError::kOk) {
			LOG(WARNING) << "FakeCoordinator: undecodable frame on connection " << connection;
			continue;
		}
		if (msg.type() == PayloadType::kXTRequest) {
			Broadcast(msg, connection);
		}
		absl::MutexLock lock(&mutex_);
		received_.push_back(Received{connection, std::move(msg)});
	}
}

size_t FakeCoordinator::NumConnections() {
	absl::MutexLock lock(&mutex_);
	return connections_.size();
}

void FakeCoordinator::Broadcast(const Message& msg, size_t exclude) {
	std::string body = wire::EncodeMessage(msg);
	absl::MutexLock lock(&mutex_);
	for (size_t i = 0; i < connections_.size(); ++i) {
		if (i != exclude && !wire::WriteFrame(connections_[i], body)) {
			LOG(WARNING) << "FakeCoordinator: broadcast to connection " << i << " failed";
		}
	}
}

std::vector<FakeCoordinator::Received> FakeCoordinator::Messages() {
	absl::MutexLock lock(&mutex_);
	return received_;
}

size_t FakeCoordinator::CountOf(PayloadType type) {
	absl::MutexLock lock(&mutex_);
	size_t n = 0;
	for (const auto& r : received_) {
		if (r.msg.type() == type) {
			++n;
		}
	}
	return n;
}

bool FakeCoordinator::WaitForCount(PayloadType type, size_t count, std::chrono::milliseconds timeout) {
	return WaitUntil([&]() { return CountOf(type) >= count; }, timeout);
}

}  // namespace test_utils
}  // namespace XtSim
