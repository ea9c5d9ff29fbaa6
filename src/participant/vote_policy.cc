#include "vote_policy.h"

#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <unordered_map>

#include <glog/logging.h>

namespace XtSim {

VoteStrategy ParseVoteStrategy(const std::string& value) {
	static const std::unordered_map<std::string, VoteStrategy> strategyMap = {
		{"commit", VoteStrategy::kCommit},
		{"abort", VoteStrategy::kAbort},
		{"random", VoteStrategy::kRandom},
		{"delay", VoteStrategy::kDelay}
	};

	std::string lower(value);
	std::transform(lower.begin(), lower.end(), lower.begin(),
			[](unsigned char c) { return static_cast<char>(std::tolower(c)); });

	auto it = strategyMap.find(lower);
	if (it != strategyMap.end()) {
		return it->second;
	}

	LOG(ERROR) << "Invalid vote strategy: " << value;
	throw std::invalid_argument("Invalid vote strategy: " + value);
}

const char* VoteStrategyName(VoteStrategy strategy) {
	switch (strategy) {
		case VoteStrategy::kCommit:
			return "commit";
		case VoteStrategy::kAbort:
			return "abort";
		case VoteStrategy::kRandom:
			return "random";
		case VoteStrategy::kDelay:
			return "delay";
	}
	return "unknown";
}

VotePolicy::VotePolicy(VoteStrategy strategy, const VotePolicyOptions& options)
	: strategy_(strategy),
	options_(options),
	rng_(options.seed != 0 ? options.seed : std::random_device{}()) {
	base_delay_ = Draw(options_.base_delay);
}

std::chrono::milliseconds VotePolicy::Draw(const DelayRange& range) {
	int64_t lo = range.min.count();
	int64_t hi = std::max(range.min.count(), range.max.count());
	std::uniform_int_distribution<int64_t> dist(lo, hi);
	return std::chrono::milliseconds(dist(rng_));
}

VoteDecision VotePolicy::Decide(uint32_t xt_id) {
	switch (strategy_) {
		case VoteStrategy::kCommit:
			return {true, base_delay_};
		case VoteStrategy::kAbort:
			return {false, base_delay_};
		case VoteStrategy::kRandom: {
			std::bernoulli_distribution coin(0.5);
			return {coin(rng_), base_delay_};
		}
		case VoteStrategy::kDelay:
			return {true, Draw(options_.late_delay)};
	}
	LOG(WARNING) << "Unrecognised vote strategy " << static_cast<int>(strategy_)
		<< " for xt_id=" << xt_id << ", falling back to commit";
	return {true, base_delay_};
}

}  // namespace XtSim
