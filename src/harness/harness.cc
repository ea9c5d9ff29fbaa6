#include "harness.h"

#include <algorithm>
#include <utility>

#include <glog/logging.h>
#include "absl/time/time.h"

namespace XtSim {

namespace {

constexpr size_t kNumLetters = 26;
// Granularity at which Run() notices that every participant has stopped
constexpr std::chrono::milliseconds kLivenessCheckInterval{200};

}  // namespace

HarnessOptions HarnessOptionsFromConfig(const XtSimConfig& config) {
	HarnessOptions options;
	options.num_participants = config.harness.clients.get();
	options.host = config.coordinator.host.get();
	options.port = config.coordinator.port.get();

	options.strategy = ParseVoteStrategy(config.harness.vote_strategy.get());
	for (const auto& name : config.harness.strategies) {
		options.strategy_overrides.push_back(ParseVoteStrategy(name));
	}

	options.send_tx = config.harness.send_tx.get();
	options.tx_count = config.harness.tx_count.get();
	options.duration = std::chrono::seconds(config.harness.duration_sec.get());
	options.stagger = std::chrono::milliseconds(config.harness.stagger_ms.get());
	options.join_timeout = std::chrono::milliseconds(config.harness.join_timeout_ms.get());

	const auto& p = config.participant;
	ParticipantOptions& po = options.participant;
	po.host = options.host;
	po.port = options.port;
	po.recv_timeout = std::chrono::milliseconds(p.recv_timeout_ms.get());
	po.connect_timeout = std::chrono::milliseconds(p.connect_timeout_ms.get());
	po.max_frame_bytes = p.max_frame_bytes.get();
	po.vote_options.base_delay = {std::chrono::milliseconds(p.vote_delay_min_ms.get()),
		std::chrono::milliseconds(p.vote_delay_max_ms.get())};
	po.vote_options.late_delay = {std::chrono::milliseconds(p.late_vote_min_ms.get()),
		std::chrono::milliseconds(p.late_vote_max_ms.get())};
	po.block_delay = {std::chrono::milliseconds(p.block_delay_min_ms.get()),
		std::chrono::milliseconds(p.block_delay_max_ms.get())};
	po.origin_delay = {std::chrono::milliseconds(p.origin_delay_min_ms.get()),
		std::chrono::milliseconds(p.origin_delay_max_ms.get())};
	return options;
}

std::string ParticipantClientId(size_t index) {
	// Bijective base 26: A..Z, AA..ZZ, AAA..
	std::string suffix;
	size_t n = index + 1;
	while (n > 0) {
		--n;
		suffix.insert(suffix.begin(), static_cast<char>('A' + n % kNumLetters));
		n /= kNumLetters;
	}
	return "sequencer-" + suffix;
}

std::string ParticipantChainId(size_t index) {
	static const char* const kChainPool[] = {
		"\x12\x34",  // Chain A
		"\x13\x35",  // Chain B
		"\x14\x36",  // Chain C
	};
	constexpr size_t kPoolSize = sizeof(kChainPool) / sizeof(kChainPool[0]);
	if (index < kPoolSize) {
		return std::string(kChainPool[index], 2);
	}
	std::string chain_id;
	chain_id.push_back(static_cast<char>((0x15 + index) & 0xFF));
	chain_id.push_back(static_cast<char>((0x37 + index) & 0xFF));
	return chain_id;
}

Harness::Harness(HarnessOptions options) : options_(std::move(options)) {
	int n = std::max(options_.num_participants, 0);
	if (n > kMaxParticipants) {
		LOG(WARNING) << n << " participants requested; chain ids repeat beyond " << kMaxParticipants;
	}
	participants_.reserve(static_cast<size_t>(n));
	for (int i = 0; i < n; ++i) {
		ParticipantOptions po = options_.participant;
		po.client_id = ParticipantClientId(static_cast<size_t>(i));
		po.chain_id = ParticipantChainId(static_cast<size_t>(i));
		po.host = options_.host;
		po.port = options_.port;
		po.strategy = (static_cast<size_t>(i) < options_.strategy_overrides.size())
			? options_.strategy_overrides[i]
			: options_.strategy;
		// Distinct streams per participant when a test pins the seed
		if (po.vote_options.seed != 0) {
			po.vote_options.seed += static_cast<uint64_t>(i) * 7919;
		}
		participants_.push_back(std::make_unique<Participant>(std::move(po)));
	}
}

Harness::~Harness() {
	if (!shut_down_) {
		Shutdown();
	}
}

void Harness::Run() {
	LOG(INFO) << "Starting run with " << participants_.size() << " participants against "
		<< options_.host << ":" << options_.port << " for " << options_.duration.count() << "ms";

	if (Start() == 0) {
		LOG(ERROR) << "No participant could connect to the coordinator";
		Shutdown();
		return;
	}

	auto deadline = std::chrono::steady_clock::now() + options_.duration;
	while (true) {
		auto now = std::chrono::steady_clock::now();
		if (now >= deadline) {
			break;
		}
		auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
		if (!WaitUnlessStopped(std::min(remaining, kLivenessCheckInterval))) {
			LOG(INFO) << "Stop requested, ending run early";
			break;
		}
		if (NumRunning() == 0) {
			LOG(WARNING) << "Every participant has stopped, ending run early";
			break;
		}
	}

	Shutdown();
}

size_t Harness::Start() {
	size_t connected = 0;
	for (size_t i = 0; i < participants_.size(); ++i) {
		if (i > 0 && !WaitUnlessStopped(options_.stagger)) {
			LOG(INFO) << "Stop requested while starting participants";
			break;
		}

		Participant& p = *participants_[i];
		if (!p.Connect()) {
			// The rest of the ensemble still runs
			continue;
		}
		++connected;

		// Only the first participant originates
		bool originate = options_.send_tx && i == 0;
		p.Start(originate, options_.tx_count);
	}
	LOG(INFO) << connected << "/" << participants_.size() << " participants connected";
	return connected;
}

void Harness::Shutdown() {
	if (shut_down_) {
		return;
	}
	shut_down_ = true;

	for (auto& p : participants_) {
		p->Stop();
	}
	for (auto& p : participants_) {
		if (!p->WaitForExit(options_.join_timeout)) {
			LOG(WARNING) << "[" << p->client_id() << "] did not stop within "
				<< options_.join_timeout.count() << "ms";
			p->ForceClose();
		}
	}

	LogSummary();
	LOG(INFO) << "All clients finished";
}

void Harness::RequestStop() {
	absl::MutexLock lock(&mutex_);
	stop_requested_ = true;
}

bool Harness::WaitUnlessStopped(std::chrono::milliseconds timeout) {
	absl::MutexLock lock(&mutex_);
	return !mutex_.AwaitWithTimeout(absl::Condition(&stop_requested_), absl::FromChrono(timeout));
}

size_t Harness::NumRunning() const {
	return static_cast<size_t>(std::count_if(participants_.begin(), participants_.end(),
			[](const std::unique_ptr<Participant>& p) { return p->IsRunning(); }));
}

void Harness::LogSummary() const {
	for (const auto& p : participants_) {
		const ParticipantStats& s = p->stats();
		LOG(INFO) << "[" << p->client_id() << "] strategy=" << VoteStrategyName(p->strategy())
			<< " state=" << ParticipantStateName(p->state())
			<< " proposals_seen=" << s.proposals_seen.load()
			<< " proposals_sent=" << s.proposals_sent.load()
			<< " votes=" << s.votes_sent.load()
			<< " decisions=" << s.decisions_received.load()
			<< " blocks=" << s.blocks_sent.load()
			<< " pending=" << p->PendingCount()
			<< " decode_errors=" << s.decode_errors.load()
			<< " send_errors=" << s.send_errors.load();
	}
}

}  // namespace XtSim
