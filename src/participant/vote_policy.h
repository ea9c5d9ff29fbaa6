#pragma once

#include <chrono>
#include <cstdint>
#include <random>
#include <string>

#include "common/config.h"

namespace XtSim {

enum class VoteStrategy {
	kCommit,
	kAbort,
	kRandom,
	kDelay,  // always commits, but later than the coordinator's vote timeout
};

/**
 * Parses "commit", "abort", "random" or "delay" (case-insensitive)
 * @throws std::invalid_argument for any other name
 */
VoteStrategy ParseVoteStrategy(const std::string& value);

const char* VoteStrategyName(VoteStrategy strategy);

struct DelayRange {
	std::chrono::milliseconds min;
	std::chrono::milliseconds max;
};

struct VotePolicyOptions {
	DelayRange base_delay{std::chrono::milliseconds(kDefaultVoteDelayMinMs),
		std::chrono::milliseconds(kDefaultVoteDelayMaxMs)};
	DelayRange late_delay{std::chrono::milliseconds(kDefaultLateVoteMinMs),
		std::chrono::milliseconds(kDefaultLateVoteMaxMs)};
	// 0 seeds from std::random_device
	uint64_t seed = 0;
};

struct VoteDecision {
	bool commit;
	std::chrono::milliseconds delay;
};

/**
 * Decides how a participant votes on a proposal and how long it waits first.
 * The strategy is fixed at construction. Decide() never fails.
 * Not thread-safe; the owning participant serializes calls.
 */
class VotePolicy {
	public:
		explicit VotePolicy(VoteStrategy strategy, const VotePolicyOptions& options = VotePolicyOptions());

		VoteDecision Decide(uint32_t xt_id);

		VoteStrategy strategy() const { return strategy_; }

		// Delay drawn at construction, used by every strategy except kDelay.
		std::chrono::milliseconds base_delay() const { return base_delay_; }

	private:
		std::chrono::milliseconds Draw(const DelayRange& range);

		VoteStrategy strategy_;
		VotePolicyOptions options_;
		std::mt19937_64 rng_;
		std::chrono::milliseconds base_delay_;
};

}  // namespace XtSim
