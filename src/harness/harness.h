#pragma once

#include <chrono>
#include <cstddef>
#include <memory>
#include <string>
#include <vector>

#include "absl/synchronization/mutex.h"

#include "common/configuration.h"
#include "participant/participant.h"

namespace XtSim {

struct HarnessOptions {
	int num_participants = kDefaultNumParticipants;
	std::string host = kDefaultCoordinatorHost;
	int port = kDefaultCoordinatorPort;

	VoteStrategy strategy = VoteStrategy::kCommit;
	// Entry i replaces strategy for participant i
	std::vector<VoteStrategy> strategy_overrides;

	bool send_tx = false;
	int tx_count = 1;

	std::chrono::milliseconds duration{kDefaultRunDurationSec * 1000};
	std::chrono::milliseconds stagger{kDefaultStaggerMs};
	std::chrono::milliseconds join_timeout{kDefaultJoinTimeoutMs};

	// Timing fields copied into every participant; identity and strategy are
	// filled in by the harness.
	ParticipantOptions participant;
};

/**
 * Builds harness options from the loaded configuration.
 * @throws std::invalid_argument on an unknown strategy name
 */
HarnessOptions HarnessOptionsFromConfig(const XtSimConfig& config);

/**
 * "sequencer-A" .. "sequencer-Z", then "sequencer-AA" .. "sequencer-ZZ",
 * "sequencer-AAA", ... Distinct for every index.
 */
std::string ParticipantClientId(size_t index);

/**
 * 0x1234, 0x1335, 0x1436 for the first three participants, then
 * {0x15 + i, 0x37 + i} (mod 256). Distinct for index < kMaxParticipants;
 * index 253 wraps onto 0x1234.
 */
std::string ParticipantChainId(size_t index);

/**
 * Runs an ensemble of simulated sequencers against one coordinator.
 */
class Harness {
	public:
		explicit Harness(HarnessOptions options);
		~Harness();

		Harness(const Harness&) = delete;
		Harness& operator=(const Harness&) = delete;

		/**
		 * Start(), wait for the configured duration, Shutdown().
		 * Returns early once RequestStop() is called or every participant stopped.
		 */
		void Run();

		/**
		 * Connects and starts participants one by one, pausing options.stagger
		 * between them. The first one originates when send_tx is set.
		 * @return number of participants that connected
		 */
		size_t Start();

		/**
		 * Signals stop to all participants, waits join_timeout for each receive
		 * loop and force-closes the ones still running, then logs a summary.
		 */
		void Shutdown();

		/**
		 * Ends Run() early. Safe to call from any thread.
		 */
		void RequestStop();

		size_t NumRunning() const;
		const std::vector<std::unique_ptr<Participant>>& participants() const { return participants_; }
		const HarnessOptions& options() const { return options_; }

	private:
		// Waits up to timeout; returns false if a stop was requested.
		bool WaitUnlessStopped(std::chrono::milliseconds timeout);
		void LogSummary() const;

		HarnessOptions options_;
		std::vector<std::unique_ptr<Participant>> participants_;
		bool shut_down_ = false;

		absl::Mutex mutex_;
		bool stop_requested_ ABSL_GUARDED_BY(mutex_) = false;
};

}  // namespace XtSim
