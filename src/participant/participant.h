#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <random>
#include <string>
#include <thread>
#include <vector>

#include "absl/container/flat_hash_map.h"
#include "absl/synchronization/mutex.h"

#include "common/config.h"
#include "common/scoped_fd.h"
#include "participant/vote_policy.h"
#include "wire/message.h"

namespace XtSim {

enum class ParticipantState {
	kIdle,
	kVoting,
	kCommitted,
	kAborted,
};

const char* ParticipantStateName(ParticipantState state);

struct ParticipantOptions {
	std::string client_id;
	std::string chain_id;
	std::string host = kDefaultCoordinatorHost;
	int port = kDefaultCoordinatorPort;

	VoteStrategy strategy = VoteStrategy::kCommit;
	VotePolicyOptions vote_options;

	std::chrono::milliseconds recv_timeout{kDefaultRecvTimeoutMs};
	std::chrono::milliseconds connect_timeout{kDefaultConnectTimeoutMs};
	size_t max_frame_bytes = kDefaultMaxFrameBytes;
	DelayRange block_delay{std::chrono::milliseconds(kDefaultBlockDelayMinMs),
		std::chrono::milliseconds(kDefaultBlockDelayMaxMs)};
	DelayRange origin_delay{std::chrono::milliseconds(kDefaultOriginDelayMinMs),
		std::chrono::milliseconds(kDefaultOriginDelayMaxMs)};
};

/**
 * Counters reported in the harness summary
 */
struct ParticipantStats {
	std::atomic<uint64_t> proposals_seen{0};
	std::atomic<uint64_t> proposals_sent{0};
	std::atomic<uint64_t> votes_sent{0};
	std::atomic<uint64_t> decisions_received{0};
	std::atomic<uint64_t> blocks_sent{0};
	std::atomic<uint64_t> decode_errors{0};
	std::atomic<uint64_t> send_errors{0};
};

/**
 * One simulated chain sequencer taking part in the coordinator's 2PC.
 *
 * Threads: one receive loop, one originator (initiator only) and one short
 * lived sender per scheduled vote or block. All of them touch only this
 * participant's state; writes to the socket are serialized by send_mutex_.
 */
class Participant {
	public:
		explicit Participant(ParticipantOptions options);

		/**
		 * Stops, wakes sleeping delayed senders (their sends are abandoned)
		 * and joins every thread.
		 */
		~Participant();

		Participant(const Participant&) = delete;
		Participant& operator=(const Participant&) = delete;

		/**
		 * Connects to the coordinator. A participant connects exactly once.
		 * @return false if the connection could not be established (logged)
		 */
		bool Connect();

		/**
		 * Adopts an already connected stream socket instead of calling Connect().
		 */
		void Attach(int fd);

		/**
		 * Starts the receive loop and, for the initiator, the originator thread
		 * which sends tx_count proposals.
		 */
		void Start(bool originate = false, int tx_count = 0);

		/**
		 * Cooperative stop: the receive loop exits at its next poll timeout.
		 * Pending delayed sends still complete while the socket is open.
		 */
		void Stop();

		/**
		 * Waits up to timeout for the receive loop to exit.
		 * @return true if it exited
		 */
		bool WaitForExit(std::chrono::milliseconds timeout);

		/**
		 * Shuts the socket down so blocked reads and writes fail immediately.
		 * Sleeping delayed sends wake up and are abandoned.
		 */
		void ForceClose();

		bool IsRunning() const { return running_.load(std::memory_order_acquire); }

		/**
		 * Sends one XTRequest over the default chain set and schedules the
		 * participant's own vote on it.
		 * @return false if the send failed
		 */
		bool SendTransaction();

		/**
		 * Dispatches one decoded inbound message. Called by the receive loop.
		 */
		void HandleMessage(const Message& msg);

		const std::string& client_id() const { return options_.client_id; }
		const std::string& chain_id() const { return options_.chain_id; }
		VoteStrategy strategy() const { return options_.strategy; }

		// Advisory: reflects the most recent transition of any transaction.
		ParticipantState state() const { return state_.load(std::memory_order_relaxed); }

		// Last xt_id assigned locally; 0 before the first proposal.
		uint32_t last_xt_id() const;
		size_t PendingCount() const;
		bool IsPending(uint32_t xt_id) const;
		const ParticipantStats& stats() const { return stats_; }

		// Default chain set named by self-originated proposals
		static std::vector<std::string> DefaultParticipatingChains();

	private:
		struct TxRecord {
			ParticipantState state = ParticipantState::kVoting;
		};

		struct Task {
			std::thread thread;
			std::shared_ptr<std::atomic<bool>> done;
		};

		void ReceiveLoop();
		void OriginateLoop(int tx_count);

		void HandleXTRequest(const Message& msg);
		void HandleDecided(const Decided& decided);

		// Advances the local counter and records xt_id as Voting.
		uint32_t BeginTransaction();
		void ScheduleVote(uint32_t xt_id);
		void ScheduleBlock(uint32_t xt_id);
		void SendVoteAfterDelay(uint32_t xt_id, VoteDecision decision);
		void SendBlockAfterDelay(uint32_t xt_id, std::chrono::milliseconds delay);

		// Sleeps for delay; returns false if the participant is being torn down.
		bool SleepUnlessClosed(std::chrono::milliseconds delay);
		// Same, but also cut short by Stop().
		bool SleepUnlessStopping(std::chrono::milliseconds delay);
		bool StoppingOrClosed() const ABSL_EXCLUSIVE_LOCKS_REQUIRED(lifecycle_mutex_) {
			return stopping_ || closed_;
		}
		std::chrono::milliseconds DrawDelay(const DelayRange& range);
		std::string MakeBlockData(size_t included) const;

		bool SendMessage(const Message& msg);
		void SpawnTask(std::function<void()> task);
		void MarkStopped();

		ParticipantOptions options_;
		ScopedFd sock_;

		std::atomic<bool> running_{false};
		std::atomic<bool> stop_requested_{false};
		std::atomic<ParticipantState> state_{ParticipantState::kIdle};
		ParticipantStats stats_;

		std::thread receive_thread_;
		std::thread originate_thread_;

		// Guards the transaction map, the xt_id counter and the policy RNGs
		mutable absl::Mutex mutex_;
		absl::flat_hash_map<uint32_t, TxRecord> transactions_ ABSL_GUARDED_BY(mutex_);
		uint32_t next_xt_id_ ABSL_GUARDED_BY(mutex_) = 0;
		VotePolicy policy_ ABSL_GUARDED_BY(mutex_);
		std::mt19937_64 rng_ ABSL_GUARDED_BY(mutex_);

		// Serializes frames on the single connection
		absl::Mutex send_mutex_;

		// Delayed senders wait on closed_ so teardown can abandon them
		mutable absl::Mutex lifecycle_mutex_;
		bool stopping_ ABSL_GUARDED_BY(lifecycle_mutex_) = false;
		bool closed_ ABSL_GUARDED_BY(lifecycle_mutex_) = false;
		bool loop_exited_ ABSL_GUARDED_BY(lifecycle_mutex_) = false;
		std::vector<Task> tasks_ ABSL_GUARDED_BY(lifecycle_mutex_);
};

}  // namespace XtSim
