#pragma once

#include <cstddef>
#include <cstdint>

/// Coordinator endpoint defaults
const char* const kDefaultCoordinatorHost = "127.0.0.1";
const int kDefaultCoordinatorPort = 8080;

/// Harness defaults
const int kDefaultNumParticipants = 3;
/// Largest ensemble whose two-byte chain ids are all distinct
const int kMaxParticipants = 253;
const int kDefaultRunDurationSec = 30;
/// Pause between two participant connection attempts
const int64_t kDefaultStaggerMs = 500;
/// Bounded wait for a receive loop to exit after stop is signalled
const int64_t kDefaultJoinTimeoutMs = 2000;

/// Participant defaults
/// Poll timeout of a single socket read; bounds stop-flag latency.
const int64_t kDefaultRecvTimeoutMs = 1000;
const int64_t kDefaultConnectTimeoutMs = 5000;
const size_t kDefaultMaxFrameBytes = 16UL * 1024 * 1024;

/// Base vote delay, drawn once per participant.
const int64_t kDefaultVoteDelayMinMs = 500;
const int64_t kDefaultVoteDelayMaxMs = 2000;
/// Late vote delay for the delay strategy, drawn per vote.
/// Longer than the coordinator's vote collection timeout on purpose.
const int64_t kDefaultLateVoteMinMs = 3000;
const int64_t kDefaultLateVoteMaxMs = 6000;
/// Block creation time after a commit decision.
const int64_t kDefaultBlockDelayMinMs = 500;
const int64_t kDefaultBlockDelayMaxMs = 1500;
/// Pause before each self-originated proposal.
const int64_t kDefaultOriginDelayMinMs = 1000;
const int64_t kDefaultOriginDelayMaxMs = 3000;

/// Sender id the coordinator stamps on its own broadcasts
const char* const kCoordinatorSenderId = "shared-publisher";
