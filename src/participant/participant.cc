#include "participant.h"

#include <algorithm>
#include <iomanip>
#include <sstream>
#include <system_error>
#include <utility>

#include <glog/logging.h>
#include "absl/time/time.h"

#include "common/network_utils.h"
#include "wire/codec.h"
#include "wire/frame.h"

namespace XtSim {

const char* ParticipantStateName(ParticipantState state) {
	switch (state) {
		case ParticipantState::kIdle:
			return "Idle";
		case ParticipantState::kVoting:
			return "Voting";
		case ParticipantState::kCommitted:
			return "Committed";
		case ParticipantState::kAborted:
			return "Aborted";
	}
	return "Unknown";
}

std::vector<std::string> Participant::DefaultParticipatingChains() {
	return {
		std::string("\x12\x34", 2),  // Chain A
		std::string("\x13\x35", 2),  // Chain B
		std::string("\x14\x36", 2),  // Chain C
	};
}

Participant::Participant(ParticipantOptions options)
	: options_(std::move(options)),
	policy_(options_.strategy, options_.vote_options),
	rng_(options_.vote_options.seed != 0 ? options_.vote_options.seed + 1 : std::random_device{}()) {
	VLOG(1) << "[" << options_.client_id << "] strategy=" << VoteStrategyName(options_.strategy)
		<< " chain_id=" << HexString(options_.chain_id)
		<< " base_vote_delay=" << policy_.base_delay().count() << "ms";
}

Participant::~Participant() {
	Stop();
	{
		absl::MutexLock lock(&lifecycle_mutex_);
		closed_ = true;
	}
	sock_.Shutdown();

	if (receive_thread_.joinable()) {
		receive_thread_.join();
	}
	if (originate_thread_.joinable()) {
		originate_thread_.join();
	}

	std::vector<Task> tasks;
	{
		absl::MutexLock lock(&lifecycle_mutex_);
		tasks.swap(tasks_);
	}
	for (auto& task : tasks) {
		if (task.thread.joinable()) {
			task.thread.join();
		}
	}
}

bool Participant::Connect() {
	if (sock_.valid()) {
		LOG(WARNING) << "[" << options_.client_id << "] Already connected";
		return true;
	}

	int fd = ConnectWithTimeout(options_.host, options_.port,
			static_cast<int>(options_.connect_timeout.count()));
	if (fd < 0) {
		LOG(ERROR) << "[" << options_.client_id << "] Failed to connect to "
			<< options_.host << ":" << options_.port;
		return false;
	}
	sock_.Reset(fd);
	LOG(INFO) << "[" << options_.client_id << "] Connected to " << options_.host << ":" << options_.port;
	return true;
}

void Participant::Attach(int fd) {
	sock_.Reset(fd);
	VLOG(1) << "[" << options_.client_id << "] Attached to fd=" << fd;
}

void Participant::Start(bool originate, int tx_count) {
	if (!sock_.valid()) {
		LOG(ERROR) << "[" << options_.client_id << "] Start called without a connection";
		return;
	}
	if (receive_thread_.joinable()) {
		LOG(WARNING) << "[" << options_.client_id << "] Already started";
		return;
	}

	running_.store(true, std::memory_order_release);
	receive_thread_ = std::thread(&Participant::ReceiveLoop, this);

	if (originate && tx_count > 0) {
		LOG(INFO) << "[" << options_.client_id << "] Acting as initiator for "
			<< tx_count << " transaction(s)";
		originate_thread_ = std::thread(&Participant::OriginateLoop, this, tx_count);
	}
}

void Participant::Stop() {
	stop_requested_.store(true, std::memory_order_release);
	absl::MutexLock lock(&lifecycle_mutex_);
	stopping_ = true;
}

bool Participant::WaitForExit(std::chrono::milliseconds timeout) {
	if (!receive_thread_.joinable()) {
		return true;
	}
	bool exited;
	{
		absl::MutexLock lock(&lifecycle_mutex_);
		exited = lifecycle_mutex_.AwaitWithTimeout(absl::Condition(&loop_exited_),
				absl::FromChrono(timeout));
	}
	if (exited) {
		receive_thread_.join();
	}
	return exited;
}

void Participant::ForceClose() {
	LOG(WARNING) << "[" << options_.client_id << "] Force closing connection";
	{
		absl::MutexLock lock(&lifecycle_mutex_);
		closed_ = true;
	}
	sock_.Shutdown();
}

void Participant::MarkStopped() {
	running_.store(false, std::memory_order_release);
	{
		absl::MutexLock lock(&lifecycle_mutex_);
		loop_exited_ = true;
	}
	LOG(INFO) << "[" << options_.client_id << "] Disconnected";
}

void Participant::ReceiveLoop() {
	wire::FrameReader reader(options_.max_frame_bytes);
	const int timeout_ms = static_cast<int>(options_.recv_timeout.count());
	std::string frame;
	bool connected = true;

	while (connected && !stop_requested_.load(std::memory_order_acquire)) {
		wire::FrameReader::Status status = reader.ReadFrame(sock_.get(), timeout_ms, &frame);
		switch (status) {
			case wire::FrameReader::Status::kTimeout:
				break;
			case wire::FrameReader::Status::kFrame: {
				Message msg;
				wire::DecodeError err = wire::DecodeMessage(frame, &msg);
				if (err != wire::DecodeError::kOk) {
					stats_.decode_errors.fetch_add(1, std::memory_order_relaxed);
					LOG(WARNING) << "[" << options_.client_id << "] Discarding " << frame.size()
						<< "-byte frame: " << wire::DecodeErrorName(err);
					break;
				}
				HandleMessage(msg);
				break;
			}
			case wire::FrameReader::Status::kClosed:
				LOG(INFO) << "[" << options_.client_id << "] Coordinator closed the connection";
				connected = false;
				break;
			default:
				LOG(WARNING) << "[" << options_.client_id << "] Receive loop ending: "
					<< wire::FrameStatusName(status);
				connected = false;
				break;
		}
	}
	MarkStopped();
}

void Participant::HandleMessage(const Message& msg) {
	switch (msg.type()) {
		case PayloadType::kXTRequest:
			HandleXTRequest(msg);
			break;
		case PayloadType::kDecided:
			if (msg.sender_id != kCoordinatorSenderId) {
				LOG(WARNING) << "[" << options_.client_id << "] Decided from unexpected sender "
					<< msg.sender_id;
			}
			HandleDecided(std::get<Decided>(msg.payload));
			break;
		default:
			VLOG(1) << "[" << options_.client_id << "] Ignoring " << PayloadTypeName(msg.type())
				<< " from " << msg.sender_id;
			break;
	}
}

void Participant::HandleXTRequest(const Message& msg) {
	const XTRequest& req = std::get<XTRequest>(msg.payload);
	stats_.proposals_seen.fetch_add(1, std::memory_order_relaxed);
	LOG(INFO) << "[" << options_.client_id << "] Received XTRequest broadcast from "
		<< msg.sender_id << " (" << req.transactions.size() << " chain requests)";

	// The request carries no id; the coordinator numbers proposals from 1
	ScheduleVote(BeginTransaction());
}

void Participant::HandleDecided(const Decided& decided) {
	stats_.decisions_received.fetch_add(1, std::memory_order_relaxed);
	LOG(INFO) << "[" << options_.client_id << "] Received Decided: "
		<< (decided.decision ? "COMMIT" : "ABORT") << " for xt_id=" << decided.xt_id;

	{
		absl::MutexLock lock(&mutex_);
		auto it = transactions_.find(decided.xt_id);
		if (it == transactions_.end() || it->second.state != ParticipantState::kVoting) {
			VLOG(1) << "[" << options_.client_id << "] No pending vote for xt_id="
				<< decided.xt_id << ", ignoring decision";
			return;
		}
		if (!decided.decision) {
			transactions_.erase(it);
			state_.store(ParticipantState::kAborted, std::memory_order_relaxed);
			return;
		}
		it->second.state = ParticipantState::kCommitted;
		state_.store(ParticipantState::kCommitted, std::memory_order_relaxed);
	}
	ScheduleBlock(decided.xt_id);
}

uint32_t Participant::BeginTransaction() {
	absl::MutexLock lock(&mutex_);
	uint32_t xt_id = ++next_xt_id_;
	transactions_[xt_id] = TxRecord();
	state_.store(ParticipantState::kVoting, std::memory_order_relaxed);
	return xt_id;
}

void Participant::ScheduleVote(uint32_t xt_id) {
	VoteDecision decision;
	{
		absl::MutexLock lock(&mutex_);
		decision = policy_.Decide(xt_id);
	}
	VLOG(2) << "[" << options_.client_id << "] Vote for xt_id=" << xt_id << " in "
		<< decision.delay.count() << "ms";
	SpawnTask([this, xt_id, decision]() { SendVoteAfterDelay(xt_id, decision); });
}

void Participant::ScheduleBlock(uint32_t xt_id) {
	std::chrono::milliseconds delay = DrawDelay(options_.block_delay);
	SpawnTask([this, xt_id, delay]() { SendBlockAfterDelay(xt_id, delay); });
}

void Participant::SendVoteAfterDelay(uint32_t xt_id, VoteDecision decision) {
	if (!SleepUnlessClosed(decision.delay)) {
		VLOG(1) << "[" << options_.client_id << "] Abandoning vote for xt_id=" << xt_id;
		return;
	}

	Message msg = MakeVoteMessage(options_.client_id, options_.chain_id, xt_id, decision.commit);
	if (!SendMessage(msg)) {
		return;
	}
	stats_.votes_sent.fetch_add(1, std::memory_order_relaxed);
	LOG(INFO) << "[" << options_.client_id << "] Sent Vote: "
		<< (decision.commit ? "COMMIT" : "ABORT") << " for xt_id=" << xt_id;
}

void Participant::SendBlockAfterDelay(uint32_t xt_id, std::chrono::milliseconds delay) {
	if (!SleepUnlessClosed(delay)) {
		VLOG(1) << "[" << options_.client_id << "] Abandoning block for xt_id=" << xt_id;
		return;
	}

	std::vector<uint32_t> included{xt_id};
	Message msg = MakeBlockMessage(options_.client_id, options_.chain_id,
			MakeBlockData(included.size()), included);
	if (SendMessage(msg)) {
		stats_.blocks_sent.fetch_add(1, std::memory_order_relaxed);
		LOG(INFO) << "[" << options_.client_id << "] Sent Block with xt_id=" << xt_id;
	}

	absl::MutexLock lock(&mutex_);
	transactions_.erase(xt_id);
}

bool Participant::SendTransaction() {
	XTRequest req;
	std::vector<std::string> chains = DefaultParticipatingChains();
	for (size_t i = 0; i < chains.size(); ++i) {
		TransactionRequest tx_req;
		tx_req.chain_id = chains[i];
		// Placeholder payload, distinct per chain
		tx_req.transactions.push_back(std::string{0x01, 0x02, 0x03, 0x04,
				static_cast<char>(0x05 + i)});
		req.transactions.push_back(std::move(tx_req));
	}

	Message msg = MakeXTRequestMessage(options_.client_id, std::move(req));
	if (!SendMessage(msg)) {
		return false;
	}
	stats_.proposals_sent.fetch_add(1, std::memory_order_relaxed);
	LOG(INFO) << "[" << options_.client_id << "] Sent XTRequest over "
		<< chains.size() << " chains";

	// The coordinator does not echo a proposal to its sender, so vote on it here
	ScheduleVote(BeginTransaction());
	return true;
}

void Participant::OriginateLoop(int tx_count) {
	for (int i = 0; i < tx_count; ++i) {
		std::chrono::milliseconds delay = DrawDelay(options_.origin_delay);
		if (!SleepUnlessStopping(delay)) {
			VLOG(1) << "[" << options_.client_id << "] Originator stopping after "
				<< i << "/" << tx_count << " transactions";
			return;
		}
		if (!SendTransaction()) {
			return;
		}
	}
}

bool Participant::SleepUnlessClosed(std::chrono::milliseconds delay) {
	absl::MutexLock lock(&lifecycle_mutex_);
	return !lifecycle_mutex_.AwaitWithTimeout(absl::Condition(&closed_), absl::FromChrono(delay));
}

bool Participant::SleepUnlessStopping(std::chrono::milliseconds delay) {
	absl::MutexLock lock(&lifecycle_mutex_);
	return !lifecycle_mutex_.AwaitWithTimeout(
			absl::Condition(this, &Participant::StoppingOrClosed), absl::FromChrono(delay));
}

std::chrono::milliseconds Participant::DrawDelay(const DelayRange& range) {
	int64_t lo = range.min.count();
	int64_t hi = std::max(range.min.count(), range.max.count());
	std::uniform_int_distribution<int64_t> dist(lo, hi);
	absl::MutexLock lock(&mutex_);
	return std::chrono::milliseconds(dist(rng_));
}

std::string Participant::MakeBlockData(size_t included) const {
	double now = std::chrono::duration<double>(
			std::chrono::system_clock::now().time_since_epoch()).count();
	std::ostringstream oss;
	oss << "Block from " << options_.client_id << " at " << std::fixed << std::setprecision(2)
		<< now << " with " << included << " TXs";
	return oss.str();
}

bool Participant::SendMessage(const Message& msg) {
	if (!sock_.valid()) {
		LOG(ERROR) << "[" << options_.client_id << "] Cannot send "
			<< PayloadTypeName(msg.type()) << ": not connected";
		return false;
	}

	std::string body = wire::EncodeMessage(msg);
	bool ok;
	{
		absl::MutexLock lock(&send_mutex_);
		ok = wire::WriteFrame(sock_.get(), body);
	}
	if (!ok) {
		stats_.send_errors.fetch_add(1, std::memory_order_relaxed);
		LOG(ERROR) << "[" << options_.client_id << "] Failed to send "
			<< PayloadTypeName(msg.type()) << ", dropping connection";
		// The receive loop observes the shutdown and marks us stopped
		sock_.Shutdown();
		return false;
	}
	VLOG(2) << "[" << options_.client_id << "] Sent " << PayloadTypeName(msg.type())
		<< " (" << body.size() << " bytes)";
	return true;
}

void Participant::SpawnTask(std::function<void()> task) {
	absl::MutexLock lock(&lifecycle_mutex_);
	if (closed_) {
		VLOG(1) << "[" << options_.client_id << "] Not scheduling task after close";
		return;
	}

	// Reap senders that already finished
	for (auto it = tasks_.begin(); it != tasks_.end();) {
		if (it->done->load(std::memory_order_acquire)) {
			it->thread.join();
			it = tasks_.erase(it);
		} else {
			++it;
		}
	}

	auto done = std::make_shared<std::atomic<bool>>(false);
	try {
		std::thread t([task = std::move(task), done]() {
			task();
			done->store(true, std::memory_order_release);
		});
		tasks_.push_back(Task{std::move(t), done});
	} catch (const std::system_error& e) {
		LOG(ERROR) << "[" << options_.client_id << "] Failed to spawn sender thread: " << e.what();
	}
}

uint32_t Participant::last_xt_id() const {
	absl::MutexLock lock(&mutex_);
	return next_xt_id_;
}

size_t Participant::PendingCount() const {
	absl::MutexLock lock(&mutex_);
	return transactions_.size();
}

bool Participant::IsPending(uint32_t xt_id) const {
	absl::MutexLock lock(&mutex_);
	return transactions_.contains(xt_id);
}

}  // namespace XtSim
