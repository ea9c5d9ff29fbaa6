#pragma once

#include <cstdint>
#include <string>
#include <variant>
#include <vector>

namespace XtSim {

// Byte sequences (chain ids, raw transactions, block data) are carried in
// std::string, as protobuf does for `bytes` fields.

struct TransactionRequest {
	std::string chain_id;
	std::vector<std::string> transactions;
};

/// Cross-chain proposal broadcast by the coordinator.
struct XTRequest {
	std::vector<TransactionRequest> transactions;
};

struct Vote {
	std::string sender_chain_id;
	uint32_t xt_id = 0;
	bool vote = false;
};

struct Decided {
	uint32_t xt_id = 0;
	bool decision = false;
};

/// Inclusion confirmation sent after a commit.
struct Block {
	std::string chain_id;
	std::string block_data;
	std::vector<uint32_t> included_xt_ids;
};

inline bool operator==(const TransactionRequest& a, const TransactionRequest& b) {
	return a.chain_id == b.chain_id && a.transactions == b.transactions;
}
inline bool operator==(const XTRequest& a, const XTRequest& b) {
	return a.transactions == b.transactions;
}
inline bool operator==(const Vote& a, const Vote& b) {
	return a.sender_chain_id == b.sender_chain_id && a.xt_id == b.xt_id && a.vote == b.vote;
}
inline bool operator==(const Decided& a, const Decided& b) {
	return a.xt_id == b.xt_id && a.decision == b.decision;
}
inline bool operator==(const Block& a, const Block& b) {
	return a.chain_id == b.chain_id && a.block_data == b.block_data &&
		a.included_xt_ids == b.included_xt_ids;
}

// Alternative order follows the payload field numbers (2..5).
using Payload = std::variant<std::monostate, XTRequest, Vote, Decided, Block>;

enum class PayloadType {
	kNone = 0,
	kXTRequest,
	kVote,
	kDecided,
	kBlock,
};

/**
 * Envelope of every frame on the wire.
 * A message with no payload field decodes to PayloadType::kNone.
 */
struct Message {
	std::string sender_id;
	Payload payload;

	PayloadType type() const { return static_cast<PayloadType>(payload.index()); }
};

inline bool operator==(const Message& a, const Message& b) {
	return a.sender_id == b.sender_id && a.payload == b.payload;
}
inline bool operator!=(const Message& a, const Message& b) {
	return !(a == b);
}

const char* PayloadTypeName(PayloadType type);

// Lowercase hex with 0x prefix, for logging chain ids.
std::string HexString(const std::string& bytes);

Message MakeXTRequestMessage(const std::string& sender_id, XTRequest request);
Message MakeVoteMessage(const std::string& sender_id, const std::string& chain_id,
		uint32_t xt_id, bool vote);
Message MakeDecidedMessage(const std::string& sender_id, uint32_t xt_id, bool decision);
Message MakeBlockMessage(const std::string& sender_id, const std::string& chain_id,
		std::string block_data, std::vector<uint32_t> included_xt_ids);

}  // namespace XtSim
